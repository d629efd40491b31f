#ifndef TABSCOUT_SEARCH_TYPES_HPP
#define TABSCOUT_SEARCH_TYPES_HPP

// Records produced by the people-search pipeline.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace search_types {

using json = nlohmann::json;

// One entry of a result page. Identity is profile_url, compared exactly.
struct Candidate {
    std::string name;
    std::string headline;
    std::string profile_url;
    double score = 0.0; // set by the pipeline
};

struct SearchResult {
    bool success = false;
    int candidates_found = 0;
    std::vector<Candidate> candidates; // first-seen order
    std::string error_detail;          // empty on success
    int pages_visited = 0;
};

json candidate_to_json(const Candidate &candidate);
json search_result_to_json(const SearchResult &result);

} // namespace search_types

#endif // TABSCOUT_SEARCH_TYPES_HPP

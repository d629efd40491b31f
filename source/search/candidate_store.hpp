#ifndef TABSCOUT_CANDIDATE_STORE_HPP
#define TABSCOUT_CANDIDATE_STORE_HPP

// Sink for the finished candidate list of a search.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "search/search_types.hpp"

namespace candidate_store {

using json = nlohmann::json;

struct StoreResult {
    bool success = false;
    std::string location; // where the records went, if the store has such a notion
    std::string error_detail;
};

class CandidateStore {
public:
    virtual ~CandidateStore() = default;

    // Called once per successful search. metadata describes the search (query, location, limits).
    virtual StoreResult store_candidates(const std::vector<search_types::Candidate> &candidates,
                                         const json &metadata) = 0;
};

// Writes one JSON document per search under a results directory.
class JsonFileCandidateStore : public CandidateStore {
public:
    explicit JsonFileCandidateStore(std::string results_directory);

    StoreResult store_candidates(const std::vector<search_types::Candidate> &candidates,
                                 const json &metadata) override;

private:
    std::string results_directory_;
};

// "Backend Engineer/SF" -> "Backend_Engineer_SF". Spaces, separators and other
// bytes unsafe in file names become '_'; at most 30 bytes, cut on a UTF-8 boundary.
std::string file_name_fragment(const std::string &query);

} // namespace candidate_store

#endif // TABSCOUT_CANDIDATE_STORE_HPP

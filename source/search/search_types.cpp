#include "search/search_types.hpp"

namespace search_types {

json candidate_to_json(const Candidate &candidate) {
    json entry;
    entry["name"] = candidate.name;
    entry["headline"] = candidate.headline;
    entry["profile_url"] = candidate.profile_url;
    entry["score"] = candidate.score;
    return entry;
}

json search_result_to_json(const SearchResult &result) {
    json output;
    output["success"] = result.success;
    output["candidates_found"] = result.candidates_found;
    output["pages_visited"] = result.pages_visited;
    output["candidates"] = json::array();
    for (const auto &candidate : result.candidates) {
        output["candidates"].push_back(candidate_to_json(candidate));
    }
    if (!result.error_detail.empty()) {
        output["error"] = result.error_detail;
    }
    return output;
}

} // namespace search_types

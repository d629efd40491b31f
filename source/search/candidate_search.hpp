#ifndef TABSCOUT_CANDIDATE_SEARCH_HPP
#define TABSCOUT_CANDIDATE_SEARCH_HPP

// Paginated people search: visit result pages in order, extract, score,
// deduplicate by profile URL and stop once enough candidates qualify.
//
// Failure boundary: a failure on page 1 (including the first connection to the
// browser, which happens on the first navigation) aborts the search with
// success=false. A failure on any later page is logged and that page
// contributes nothing.

#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"
#include "search/candidate_store.hpp"
#include "search/search_types.hpp"

namespace candidate_search {

constexpr const char *kDefaultSearchBaseUrl = "https://www.linkedin.com/search/results/people/";
constexpr const char *kDefaultResultsSelector = ".search-results-container li, .search-no-results";

struct SearchOptions {
    std::string query;
    std::string location;
    int page_limit = 3;
    double min_score = 3.0;
    int target_count = 10;

    // "F", "S" or "O" (1st, 2nd, 3rd+ degree); empty for no filter.
    std::string network_filter;
    std::string search_base_url = kDefaultSearchBaseUrl;
    std::string results_selector = kDefaultResultsSelector;
    int results_wait_timeout_milliseconds = 10000;

    // Scroll once after the results appear so lazily loaded cards render.
    bool scroll_for_lazy_loading = true;
    int lazy_load_settle_milliseconds = 1000;

    // Random pause between pages, drawn uniformly from [min, max].
    int min_page_delay_milliseconds = 0;
    int max_page_delay_milliseconds = 0;

    // Treat a page without any extracted record as the end of the results.
    bool stop_when_page_empty = false;
};

// <base>?keywords=<query [location]>[&network=["F"]][&page=N]; page 1 has no page parameter.
std::string build_search_url(const std::string &search_base_url, const std::string &query,
                             const std::string &location, int page_index, const std::string &network_filter);

// Appends candidates scoring at least min_score whose profile URL is new, in
// arrival order, until target_count is reached. Returns how many were added.
int accumulate_qualifying(const std::vector<search_types::Candidate> &page_candidates,
                          const std::string &query_lower, double min_score, int target_count,
                          std::vector<search_types::Candidate> &accumulated);

search_types::SearchResult smart_candidate_search(browser_driver::PageDriver &driver,
                                                  candidate_store::CandidateStore &store,
                                                  const SearchOptions &options);

} // namespace candidate_search

#endif // TABSCOUT_CANDIDATE_SEARCH_HPP

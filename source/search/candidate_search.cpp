#include "search/candidate_search.hpp"
#include "search/candidate_extraction.hpp"
#include "search/candidate_scoring.hpp"
#include "utils/debug_log.hpp"
#include "utils/url_encode.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <sstream>
#include <thread>

namespace candidate_search {

using json = nlohmann::json;

namespace {

const char kLazyLoadScrollScript[] = "window.scrollBy(0, 800);";

void sleep_milliseconds(int milliseconds) {
    if (milliseconds > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
    }
}

void pause_between_pages(const SearchOptions &options) {
    int low = std::max(0, options.min_page_delay_milliseconds);
    int high = std::max(low, options.max_page_delay_milliseconds);
    if (high == 0) {
        return;
    }
    static std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<int> distribution(low, high);
    sleep_milliseconds(distribution(generator));
}

std::string trim(const std::string &text) {
    const char *whitespace = " \t\r\n";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string format_score(double score) {
    std::ostringstream stream;
    stream.precision(1);
    stream << std::fixed << score;
    return stream.str();
}

// One page: navigate, wait, extract. Returns false when navigation failed.
bool visit_page(browser_driver::PageDriver &driver, const SearchOptions &options, const std::string &url,
                std::vector<search_types::Candidate> &out_candidates, std::string &out_error) {
    debug_log::log("Navigating to: " + url);
    browser_driver::NavigateResult navigate_result = driver.navigate(url);
    if (!navigate_result.success) {
        out_error = navigate_result.error_text.empty() ? "navigation failed" : navigate_result.error_text;
        return false;
    }

    if (!driver.wait_for_selector(options.results_selector,
                                  deadline::Deadline::after_milliseconds(options.results_wait_timeout_milliseconds))) {
        debug_log::log("Timeout waiting for search results; extracting anyway.");
    }

    if (options.scroll_for_lazy_loading) {
        browser_driver::EvaluateResult scroll_result = driver.evaluate_javascript(kLazyLoadScrollScript);
        if (scroll_result.kind == browser_driver::EvaluateValueKind::None && !scroll_result.description.empty()) {
            debug_log::log("Lazy-load scroll failed: " + scroll_result.description);
        }
        sleep_milliseconds(options.lazy_load_settle_milliseconds);
    }

    out_candidates = candidate_extraction::extract_candidates_from_page(driver);
    return true;
}

json search_metadata(const SearchOptions &options, int pages_visited) {
    json metadata;
    metadata["query"] = options.query;
    metadata["location"] = options.location;
    metadata["page_limit"] = options.page_limit;
    metadata["min_score"] = options.min_score;
    metadata["target_count"] = options.target_count;
    metadata["pages_visited"] = pages_visited;
    if (!options.network_filter.empty()) {
        metadata["network_filter"] = options.network_filter;
    }
    return metadata;
}

} // namespace

std::string build_search_url(const std::string &search_base_url, const std::string &query,
                             const std::string &location, int page_index, const std::string &network_filter) {
    std::string keywords = location.empty() ? query : trim(query + " " + location);
    std::string url = search_base_url + "?keywords=" + url_encode::encode_query_component(keywords);

    // The network filter must precede the page parameter.
    if (!network_filter.empty()) {
        url += "&network=[%22" + url_encode::encode_query_component(network_filter) + "%22]";
    }
    if (page_index > 1) {
        url += "&page=" + std::to_string(page_index);
    }
    return url;
}

int accumulate_qualifying(const std::vector<search_types::Candidate> &page_candidates,
                          const std::string &query_lower, double min_score, int target_count,
                          std::vector<search_types::Candidate> &accumulated) {
    int added = 0;
    for (const auto &candidate : page_candidates) {
        if (static_cast<int>(accumulated.size()) >= target_count) {
            break;
        }
        // Without a profile URL there is no identity to deduplicate on.
        if (candidate.profile_url.empty()) {
            continue;
        }
        bool already_seen = std::any_of(accumulated.begin(), accumulated.end(),
                                        [&candidate](const search_types::Candidate &kept) {
                                            return kept.profile_url == candidate.profile_url;
                                        });
        if (already_seen) {
            continue;
        }

        search_types::Candidate scored = candidate;
        scored.score = candidate_scoring::score(candidate_scoring::to_lower(candidate.headline), query_lower);
        if (scored.score < min_score) {
            debug_log::log("   skip " + candidate.name + " (score " + format_score(scored.score) + ")");
            continue;
        }
        debug_log::log("   keep " + candidate.name + " (score " + format_score(scored.score) + ")");
        accumulated.push_back(std::move(scored));
        added++;
    }
    return added;
}

search_types::SearchResult smart_candidate_search(browser_driver::PageDriver &driver,
                                                  candidate_store::CandidateStore &store,
                                                  const SearchOptions &options) {
    search_types::SearchResult result;

    if (trim(options.query).empty()) {
        result.error_detail = "query is required";
        return result;
    }
    if (options.page_limit < 1 || options.target_count < 1) {
        result.error_detail = "page_limit and target_count must be at least 1";
        return result;
    }

    debug_log::log("Searching: '" + options.query + "' in '" + options.location + "'");
    const std::string query_lower = candidate_scoring::to_lower(options.query);
    std::vector<search_types::Candidate> accumulated;

    for (int page_index = 1; page_index <= options.page_limit; page_index++) {
        if (static_cast<int>(accumulated.size()) >= options.target_count) {
            debug_log::log("Found " + std::to_string(options.target_count) + " candidates, stopping search.");
            break;
        }
        if (page_index > 1) {
            pause_between_pages(options);
        }

        result.pages_visited = page_index;
        debug_log::log("Searching page " + std::to_string(page_index) + "/" + std::to_string(options.page_limit));
        std::string url = build_search_url(options.search_base_url, options.query, options.location, page_index,
                                           options.network_filter);

        std::vector<search_types::Candidate> page_candidates;
        std::string page_error;
        bool page_ok = false;
        try {
            page_ok = visit_page(driver, options, url, page_candidates, page_error);
        } catch (const std::exception &error) {
            page_error = error.what();
        }

        if (!page_ok) {
            if (page_index == 1) {
                debug_log::warn("Search error on first page: " + page_error);
                result.success = false;
                result.candidates_found = 0;
                result.candidates.clear();
                result.error_detail = page_error;
                return result;
            }
            debug_log::warn("Page " + std::to_string(page_index) + " failed, skipping: " + page_error);
            continue;
        }

        if (page_candidates.empty()) {
            debug_log::log("No results on page " + std::to_string(page_index));
            if (options.stop_when_page_empty) {
                break;
            }
            continue;
        }

        int added = accumulate_qualifying(page_candidates, query_lower, options.min_score, options.target_count,
                                          accumulated);
        debug_log::log("Page " + std::to_string(page_index) + ": " + std::to_string(page_candidates.size()) +
                       " extracted, " + std::to_string(added) + " kept");
    }

    candidate_store::StoreResult store_result =
        store.store_candidates(accumulated, search_metadata(options, result.pages_visited));
    if (!store_result.success) {
        debug_log::warn("Storing candidates failed: " + store_result.error_detail);
    }

    result.success = true;
    result.candidates_found = static_cast<int>(accumulated.size());
    result.candidates = std::move(accumulated);
    debug_log::log("Search complete: " + std::to_string(result.candidates_found) + " candidates found");
    return result;
}

} // namespace candidate_search

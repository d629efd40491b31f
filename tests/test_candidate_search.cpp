// Tests for the paginated search pipeline: dedup, score filter, early
// termination and per-page failure isolation. Uses a scripted PageDriver and a
// recording store; no browser involved.

#include "search/candidate_extraction.hpp"
#include "search/candidate_search.hpp"

#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace test_candidate_search {

namespace {

const char kSearchBase[] = "https://search.test/people/";

json card(const std::string &name, const std::string &headline, const std::string &profile_url) {
    return {{"name", name}, {"headline", headline}, {"profileUrl", profile_url}};
}

// Serves one result list per page index; page 1 is the URL without "&page=".
class ScriptedResultPages : public browser_driver::PageDriver {
public:
    std::map<int, json> pages;
    std::set<int> failing_pages;   // navigate reports an error
    std::set<int> throwing_pages;  // navigate throws
    std::vector<std::string> navigated_urls;

    browser_driver::NavigateResult navigate(const std::string &url) override {
        navigated_urls.push_back(url);
        current_page_ = page_index_of(url);
        if (throwing_pages.count(current_page_) != 0) {
            throw std::runtime_error("renderer crashed");
        }
        browser_driver::NavigateResult result;
        if (failing_pages.count(current_page_) != 0) {
            result.error_text = "net::ERR_CONNECTION_RESET";
            return result;
        }
        result.success = true;
        return result;
    }

    bool wait_for_selector(const std::string &, const deadline::Deadline &,
                           const deadline::CancellationToken *) override {
        return pages.count(current_page_) != 0;
    }

    browser_driver::EvaluateResult evaluate_javascript(const std::string &script) override {
        browser_driver::EvaluateResult result;
        if (script != candidate_extraction::extraction_script()) {
            return result;
        }
        auto found = pages.find(current_page_);
        if (found != pages.end()) {
            result.kind = browser_driver::EvaluateValueKind::Structured;
            result.value = found->second;
        }
        return result;
    }

private:
    static int page_index_of(const std::string &url) {
        auto position = url.find("&page=");
        return position == std::string::npos ? 1 : std::stoi(url.substr(position + 6));
    }

    int current_page_ = 0;
};

class RecordingStore : public candidate_store::CandidateStore {
public:
    int call_count = 0;
    std::vector<search_types::Candidate> stored;
    json stored_metadata;
    bool fail = false;

    candidate_store::StoreResult store_candidates(const std::vector<search_types::Candidate> &candidates,
                                                  const json &metadata) override {
        call_count++;
        stored = candidates;
        stored_metadata = metadata;
        candidate_store::StoreResult result;
        if (fail) {
            result.error_detail = "disk full";
            return result;
        }
        result.success = true;
        result.location = "memory";
        return result;
    }
};

candidate_search::SearchOptions fast_options(int page_limit, int target_count) {
    candidate_search::SearchOptions options;
    options.query = "backend engineer";
    options.location = "Berlin";
    options.page_limit = page_limit;
    options.target_count = target_count;
    options.min_score = 3.0;
    options.search_base_url = kSearchBase;
    options.results_wait_timeout_milliseconds = 0;
    options.lazy_load_settle_milliseconds = 0;
    options.min_page_delay_milliseconds = 0;
    options.max_page_delay_milliseconds = 0;
    return options;
}

} // namespace

static bool report(bool success, const std::string &label, const std::string &failure_detail) {
    if (success) {
        std::cout << "  OK: " << label << std::endl;
    } else {
        std::cout << "  FAIL: " << label << ": " << failure_detail << std::endl;
    }
    return success;
}

static std::string summary(const search_types::SearchResult &result, const ScriptedResultPages &driver) {
    return "success=" + std::to_string(result.success) + " found=" + std::to_string(result.candidates_found) +
           " navigations=" + std::to_string(driver.navigated_urls.size()) + " error='" + result.error_detail + "'";
}

// Test: Two cards with the same profile URL count once.
static bool test_duplicate_urls_collapse() {
    ScriptedResultPages driver;
    driver.pages[1] = json::array({card("Ada", "Senior Backend Engineer", "https://x.test/in/ada"),
                                   card("Ada (again)", "Senior Backend Engineer", "https://x.test/in/ada"),
                                   card("Grace", "Backend Engineer", "https://x.test/in/grace")});
    RecordingStore store;
    auto result = candidate_search::smart_candidate_search(driver, store, fast_options(1, 10));
    bool success = result.success && result.candidates_found == 2 && result.candidates[0].name == "Ada" &&
                   result.candidates[1].name == "Grace";
    return report(success, "Duplicate profile URLs are kept once, first seen wins", summary(result, driver));
}

// Test: Every returned candidate meets min_score; the rest are filtered out.
static bool test_score_filter() {
    ScriptedResultPages driver;
    driver.pages[1] = json::array({card("Low", "Sales manager", "https://x.test/in/low"),
                                   card("High", "Senior Backend Engineer", "https://x.test/in/high"),
                                   card("Edge", "Lead Architect, Engineer", "https://x.test/in/edge")});
    RecordingStore store;
    auto options = fast_options(1, 10);
    auto result = candidate_search::smart_candidate_search(driver, store, options);

    bool all_above = true;
    for (const auto &candidate : result.candidates) {
        all_above &= candidate.score >= options.min_score;
    }
    bool success = result.success && result.candidates_found == 2 && all_above &&
                   result.candidates[0].name == "High" && result.candidates[0].score == 11.0;
    return report(success, "Candidates below min_score are dropped and scores are recorded", summary(result, driver));
}

// Test: Cards without a profile URL never qualify.
static bool test_missing_profile_url_skipped() {
    ScriptedResultPages driver;
    driver.pages[1] = json::array({card("Nameless link", "Senior Backend Engineer", ""),
                                   card("Linked", "Senior Backend Engineer", "https://x.test/in/linked")});
    RecordingStore store;
    auto result = candidate_search::smart_candidate_search(driver, store, fast_options(1, 10));
    bool success = result.success && result.candidates_found == 1 && result.candidates[0].name == "Linked";
    return report(success, "Candidates without profile URL are skipped", summary(result, driver));
}

// Test: Reaching target_count on page 1 stops before page 2.
static bool test_early_termination() {
    ScriptedResultPages driver;
    driver.pages[1] = json::array({card("A", "Senior Backend Engineer", "https://x.test/in/a"),
                                   card("B", "Senior Backend Engineer", "https://x.test/in/b"),
                                   card("C", "Senior Backend Engineer", "https://x.test/in/c")});
    driver.pages[2] = json::array({card("D", "Senior Backend Engineer", "https://x.test/in/d")});
    RecordingStore store;
    auto result = candidate_search::smart_candidate_search(driver, store, fast_options(3, 2));
    bool success = result.success && result.candidates_found == 2 && driver.navigated_urls.size() == 1 &&
                   result.pages_visited == 1;
    return report(success, "Search stops once target_count is reached", summary(result, driver));
}

// Test: Never more than page_limit navigations, URLs carry the page index.
static bool test_page_limit_bounds_navigation() {
    ScriptedResultPages driver;
    driver.pages[1] = json::array({card("A", "Senior Backend Engineer", "https://x.test/in/a")});
    driver.pages[2] = json::array({card("B", "Senior Backend Engineer", "https://x.test/in/b")});
    driver.pages[3] = json::array({card("C", "Senior Backend Engineer", "https://x.test/in/c")});
    driver.pages[4] = json::array({card("D", "Senior Backend Engineer", "https://x.test/in/d")});
    RecordingStore store;
    auto result = candidate_search::smart_candidate_search(driver, store, fast_options(3, 10));
    bool success = result.success && result.candidates_found == 3 && driver.navigated_urls.size() == 3 &&
                   driver.navigated_urls[0] == std::string(kSearchBase) + "?keywords=backend+engineer+Berlin" &&
                   driver.navigated_urls[2] == std::string(kSearchBase) + "?keywords=backend+engineer+Berlin&page=3";
    return report(success, "Navigation count is bounded by page_limit", summary(result, driver));
}

// Test: A navigation failure on page 1 aborts the search.
static bool test_first_page_failure_is_fatal() {
    ScriptedResultPages driver;
    driver.failing_pages.insert(1);
    driver.pages[2] = json::array({card("B", "Senior Backend Engineer", "https://x.test/in/b")});
    RecordingStore store;
    auto result = candidate_search::smart_candidate_search(driver, store, fast_options(3, 10));
    bool success = !result.success && result.candidates_found == 0 && result.candidates.empty() &&
                   result.error_detail == "net::ERR_CONNECTION_RESET" && store.call_count == 0 &&
                   driver.navigated_urls.size() == 1;
    return report(success, "First page failure yields success=false and no store call", summary(result, driver));
}

// Test: An exception on page 1 is reported the same way.
static bool test_first_page_exception_is_fatal() {
    ScriptedResultPages driver;
    driver.throwing_pages.insert(1);
    RecordingStore store;
    auto result = candidate_search::smart_candidate_search(driver, store, fast_options(2, 10));
    bool success = !result.success && result.candidates_found == 0 && result.error_detail == "renderer crashed" &&
                   store.call_count == 0;
    return report(success, "First page exception yields success=false", summary(result, driver));
}

// Test: Failures after page 1 only cost that page.
static bool test_later_page_failures_are_absorbed() {
    ScriptedResultPages driver;
    driver.pages[1] = json::array({card("A", "Senior Backend Engineer", "https://x.test/in/a")});
    driver.failing_pages.insert(2);
    driver.throwing_pages.insert(3);
    driver.pages[4] = json::array({card("D", "Senior Backend Engineer", "https://x.test/in/d")});
    RecordingStore store;
    auto result = candidate_search::smart_candidate_search(driver, store, fast_options(4, 10));
    bool success = result.success && result.candidates_found == 2 && result.candidates[0].name == "A" &&
                   result.candidates[1].name == "D" && driver.navigated_urls.size() == 4 && result.pages_visited == 4;
    return report(success, "Pages 2+ failing contribute nothing but do not abort", summary(result, driver));
}

// Test: Empty pages are skipped, or end the search when asked to.
static bool test_empty_page_handling() {
    ScriptedResultPages driver;
    driver.pages[2] = json::array({card("B", "Senior Backend Engineer", "https://x.test/in/b")});
    RecordingStore store;
    auto result = candidate_search::smart_candidate_search(driver, store, fast_options(2, 10));

    ScriptedResultPages stopping_driver;
    stopping_driver.pages[2] = driver.pages[2];
    RecordingStore stopping_store;
    auto options = fast_options(2, 10);
    options.stop_when_page_empty = true;
    auto stopped_result = candidate_search::smart_candidate_search(stopping_driver, stopping_store, options);

    bool success = result.success && result.candidates_found == 1 && stopped_result.success &&
                   stopped_result.candidates_found == 0 && stopping_driver.navigated_urls.size() == 1;
    return report(success, "Empty page is skipped by default and stops the search when configured",
                  summary(result, driver) + " / " + summary(stopped_result, stopping_driver));
}

// Test: The store gets the final list and metadata exactly once; its failure is not fatal.
static bool test_store_called_once() {
    ScriptedResultPages driver;
    driver.pages[1] = json::array({card("A", "Senior Backend Engineer", "https://x.test/in/a")});
    driver.pages[2] = json::array({card("B", "Senior Backend Engineer", "https://x.test/in/b")});
    RecordingStore store;
    store.fail = true;
    auto result = candidate_search::smart_candidate_search(driver, store, fast_options(2, 10));
    bool success = result.success && store.call_count == 1 && store.stored.size() == 2 &&
                   store.stored_metadata["query"] == "backend engineer" &&
                   store.stored_metadata["location"] == "Berlin" && store.stored_metadata["target_count"] == 10;
    return report(success, "Store receives results once and its failure keeps success", summary(result, driver));
}

// Test: Invalid options fail fast without navigating.
static bool test_invalid_options_rejected() {
    ScriptedResultPages driver;
    RecordingStore store;
    auto options = fast_options(0, 10);
    auto zero_pages = candidate_search::smart_candidate_search(driver, store, options);
    options = fast_options(1, 10);
    options.query = "   ";
    auto blank_query = candidate_search::smart_candidate_search(driver, store, options);
    bool success = !zero_pages.success && !blank_query.success && driver.navigated_urls.empty() &&
                   store.call_count == 0;
    return report(success, "Zero page_limit and blank query are rejected", summary(zero_pages, driver));
}

// Test: accumulate_qualifying respects the target across calls.
static bool test_accumulate_respects_target() {
    std::vector<search_types::Candidate> accumulated;
    std::vector<search_types::Candidate> page = {{"A", "Backend Engineer", "https://x.test/in/a", 0.0},
                                                 {"B", "Backend Engineer", "https://x.test/in/b", 0.0},
                                                 {"C", "Backend Engineer", "https://x.test/in/c", 0.0}};
    int first = candidate_search::accumulate_qualifying(page, "backend engineer", 3.0, 2, accumulated);
    int second = candidate_search::accumulate_qualifying(page, "backend engineer", 3.0, 2, accumulated);
    bool success = first == 2 && second == 0 && accumulated.size() == 2;
    return report(success, "accumulate_qualifying stops at target_count",
                  "first=" + std::to_string(first) + " second=" + std::to_string(second));
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_duplicate_urls_collapse();
    all_passed &= test_score_filter();
    all_passed &= test_missing_profile_url_skipped();
    all_passed &= test_early_termination();
    all_passed &= test_page_limit_bounds_navigation();
    all_passed &= test_first_page_failure_is_fatal();
    all_passed &= test_first_page_exception_is_fatal();
    all_passed &= test_later_page_failures_are_absorbed();
    all_passed &= test_empty_page_handling();
    all_passed &= test_store_called_once();
    all_passed &= test_invalid_options_rejected();
    all_passed &= test_accumulate_respects_target();
    return all_passed;
}

} // namespace test_candidate_search

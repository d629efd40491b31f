#ifndef TABSCOUT_CANDIDATE_EXTRACTION_HPP
#define TABSCOUT_CANDIDATE_EXTRACTION_HPP

// Extraction of candidate records from the currently loaded results page.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"
#include "search/search_types.hpp"

namespace candidate_extraction {

using json = nlohmann::json;

// Page script returning [{name, headline, profileUrl}] for the result list.
const std::string &extraction_script();

// Turns the script's by-value result into candidates. Anything but an array
// yields nothing; entries missing both name and profileUrl are dropped.
std::vector<search_types::Candidate> normalize_extraction(const browser_driver::EvaluateResult &evaluate_result);

// Runs extraction_script() on the page. Never throws; failures yield an empty list.
std::vector<search_types::Candidate> extract_candidates_from_page(browser_driver::PageDriver &driver);

} // namespace candidate_extraction

#endif // TABSCOUT_CANDIDATE_EXTRACTION_HPP

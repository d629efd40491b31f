#ifndef TABSCOUT_CANDIDATE_SCORING_HPP
#define TABSCOUT_CANDIDATE_SCORING_HPP

// Headline relevance heuristic. Pure; callers lowercase both inputs.

#include <string>

namespace candidate_scoring {

constexpr double kVerbatimQueryScore = 5.0;
constexpr double kQueryTokenScore = 2.0;
constexpr double kSeniorityMarkerScore = 1.0;
constexpr double kRoleTermScore = 1.0;

// Sum of: verbatim query match, each matching query token, each seniority
// marker (senior, staff, principal, lead) and each role term (engineer,
// architect, developer) found in the headline. Never negative.
double score(const std::string &headline_lower, const std::string &query_lower);

// ASCII lowercase.
std::string to_lower(const std::string &text);

} // namespace candidate_scoring

#endif // TABSCOUT_CANDIDATE_SCORING_HPP

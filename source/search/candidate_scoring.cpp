#include "search/candidate_scoring.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace candidate_scoring {

static const char *const kSeniorityMarkers[] = {"senior", "staff", "principal", "lead"};
static const char *const kRoleTerms[] = {"engineer", "architect", "developer"};

std::string to_lower(const std::string &text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

double score(const std::string &headline_lower, const std::string &query_lower) {
    double total = 0.0;

    if (!query_lower.empty() && headline_lower.find(query_lower) != std::string::npos) {
        total += kVerbatimQueryScore;
    }

    std::istringstream token_stream(query_lower);
    std::string token;
    while (token_stream >> token) {
        if (headline_lower.find(token) != std::string::npos) {
            total += kQueryTokenScore;
        }
    }

    for (const char *marker : kSeniorityMarkers) {
        if (headline_lower.find(marker) != std::string::npos) {
            total += kSeniorityMarkerScore;
        }
    }
    for (const char *term : kRoleTerms) {
        if (headline_lower.find(term) != std::string::npos) {
            total += kRoleTermScore;
        }
    }

    return total;
}

} // namespace candidate_scoring

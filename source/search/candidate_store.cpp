#include "search/candidate_store.hpp"
#include "utils/debug_log.hpp"

#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace candidate_store {

constexpr size_t kMaximumFragmentBytes = 30;

static std::string local_timestamp(const char *format) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_time{};
    localtime_r(&now, &local_time);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), format, &local_time);
    return buffer;
}

static bool is_path_hostile(unsigned char byte) {
    static const char kHostileCharacters[] = " /\\:*?\"<>|";
    return byte < 0x20 || byte == 0x7F || std::strchr(kHostileCharacters, static_cast<char>(byte)) != nullptr;
}

std::string file_name_fragment(const std::string &query) {
    std::string fragment;
    for (char character : query) {
        fragment.push_back(is_path_hostile(static_cast<unsigned char>(character)) ? '_' : character);
    }
    if (fragment.size() > kMaximumFragmentBytes) {
        // Never cut inside a UTF-8 sequence: back off while the first dropped byte is a continuation byte.
        size_t cut = kMaximumFragmentBytes;
        while (cut > 0 && (static_cast<unsigned char>(fragment[cut]) & 0xC0u) == 0x80u) {
            cut--;
        }
        fragment.resize(cut);
    }
    return fragment.empty() ? "search" : fragment;
}

JsonFileCandidateStore::JsonFileCandidateStore(std::string results_directory)
    : results_directory_(std::move(results_directory)) {}

StoreResult JsonFileCandidateStore::store_candidates(const std::vector<search_types::Candidate> &candidates,
                                                     const json &metadata) {
    StoreResult result;

    std::error_code directory_error;
    std::filesystem::create_directories(results_directory_, directory_error);
    if (directory_error) {
        result.error_detail = "Cannot create results directory " + results_directory_ + ": " + directory_error.message();
        return result;
    }

    std::string query = metadata.contains("query") && metadata["query"].is_string()
                            ? metadata["query"].get<std::string>()
                            : "";
    std::filesystem::path file_path = std::filesystem::path(results_directory_) /
        ("candidates_" + file_name_fragment(query) + "_" + local_timestamp("%Y%m%d_%H%M%S") + ".json");

    json document;
    document["search_metadata"] = metadata.is_object() ? metadata : json::object();
    document["search_metadata"]["timestamp"] = local_timestamp("%Y-%m-%dT%H:%M:%S");
    document["search_metadata"]["total_found"] = candidates.size();
    document["candidates"] = json::array();
    for (const auto &candidate : candidates) {
        document["candidates"].push_back(search_types::candidate_to_json(candidate));
    }

    std::ofstream output_file(file_path);
    if (!output_file.is_open()) {
        result.error_detail = "Cannot open " + file_path.string() + " for writing.";
        return result;
    }
    output_file << document.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    if (!output_file) {
        result.error_detail = "Failed to write " + file_path.string();
        return result;
    }

    debug_log::log("Stored " + std::to_string(candidates.size()) + " candidate(s) in " + file_path.string());
    result.success = true;
    result.location = file_path.string();
    return result;
}

} // namespace candidate_store

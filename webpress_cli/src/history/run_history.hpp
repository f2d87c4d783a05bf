//
// Created by Giuseppe Francione on 19/01/26.
//

#ifndef WEBPRESS_RUN_HISTORY_HPP
#define WEBPRESS_RUN_HISTORY_HPP

#include "../../../libwebpress/include/summary.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * @brief One recorded run: what was asked for and what came out.
 */
struct HistoryEntry {
    std::string timestamp;                      ///< UTC, ISO-8601
    std::vector<std::filesystem::path> folders;
    int quality = 0;
    std::string format;                         ///< "zip", "cbz" or "replace"
    bool skip_webp = false;
    bool cancelled = false;
    std::size_t converted = 0;
    std::size_t skipped_existing = 0;
    std::size_t errors = 0;
    std::uintmax_t bytes_original = 0;
    std::uintmax_t bytes_converted = 0;
    std::uintmax_t bytes_saved = 0;
    std::size_t archives = 0;
    double duration_seconds = 0.0;
};

void to_json(nlohmann::json& j, const HistoryEntry& entry);
/// @throws nlohmann::json::exception on missing or mistyped fields.
void from_json(const nlohmann::json& j, HistoryEntry& entry);

/**
 * @brief Best-effort store of the most recent runs.
 *
 * @details The file holds a JSON array of entries, oldest first. Read and
 * write failures are logged with the "history" tag and otherwise ignored.
 * A file that is not valid JSON reads as an empty history; malformed
 * entries inside a valid array are skipped.
 */
class RunHistory {
public:
    static constexpr std::size_t kMaxEntries = 20;

    explicit RunHistory(std::filesystem::path file);

    /**
     * @brief Per-user default location of the history file.
     */
    static std::filesystem::path default_path();

    /**
     * @brief Appends an entry, keeping only the kMaxEntries most recent.
     * @return false if the file could not be written.
     */
    bool append(const HistoryEntry& entry) const;

    /**
     * @brief Recorded entries, oldest first.
     */
    [[nodiscard]] std::vector<HistoryEntry> list() const;

    /**
     * @brief Removes the history file.
     * @return false if it exists and could not be removed.
     */
    bool clear() const;

    [[nodiscard]] const std::filesystem::path& path() const { return file_; }

    /**
     * @brief Builds an entry from a finished run.
     */
    static HistoryEntry make_entry(const std::vector<std::filesystem::path>& folders,
                                   int quality,
                                   const std::string& format,
                                   bool skip_webp,
                                   const webpress::RunSummary& summary);

private:
    std::filesystem::path file_;
};

#endif // WEBPRESS_RUN_HISTORY_HPP

//
// Created by Giuseppe Francione on 14/01/26.
//

/**
 * @file summary.hpp
 * @brief Fixed-shape statistics produced by a conversion run.
 */

#ifndef WEBPRESS_SUMMARY_HPP
#define WEBPRESS_SUMMARY_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace webpress {

/**
 * @brief Returns max(0, original - converted) without unsigned wrap-around.
 */
[[nodiscard]] constexpr std::uintmax_t saved_bytes(const std::uintmax_t original,
                                                   const std::uintmax_t converted) noexcept {
    return original > converted ? original - converted : 0;
}

/**
 * @brief Statistics for one processed folder.
 *
 * Sealed once, when the folder's processing ends (normally, on a
 * folder-scoped error, or on cancellation cleanup).
 */
struct FolderSummary {
    std::filesystem::path folder;                      ///< Source folder
    std::size_t converted = 0;                         ///< Images encoded successfully
    std::size_t skipped_existing = 0;                  ///< Already-WebP files left out of encoding
    std::vector<std::string> errors;                   ///< Ordered image and folder errors
    std::uintmax_t bytes_original = 0;                 ///< Sum of source sizes of converted images
    std::uintmax_t bytes_converted = 0;                ///< Sum of produced WebP sizes
    std::optional<std::uintmax_t> archive_size;        ///< Set when the archive size could be read
    std::optional<std::filesystem::path> archive_path; ///< Set when an archive was written
    double duration_seconds = 0.0;                     ///< Wall time spent on this folder

    [[nodiscard]] std::uintmax_t bytes_saved() const noexcept {
        return saved_bytes(bytes_original, bytes_converted);
    }
};

/**
 * @brief Aggregates over all sealed folder summaries of a run.
 */
struct RunTotals {
    std::size_t converted = 0;
    std::size_t skipped_existing = 0;
    std::size_t errors = 0;
    std::uintmax_t bytes_original = 0;
    std::uintmax_t bytes_converted = 0;
    std::uintmax_t bytes_saved = 0;
    std::size_t archives = 0;
};

/**
 * @brief Terminal result of a run, built exactly once.
 */
struct RunSummary {
    bool cancelled = false;
    double duration_seconds = 0.0;
    std::size_t total_images = 0;         ///< Total work units
    std::size_t processed_images = 0;     ///< Work units accounted so far
    std::size_t expected_conversions = 0; ///< Convertible images across all folders
    RunTotals totals;
    std::vector<FolderSummary> folders;
};

/**
 * @brief Sums folder statistics into run totals.
 *
 * bytes_saved is computed from the summed byte counts, so it is never
 * negative even if some folders grew.
 */
[[nodiscard]] RunTotals compute_totals(const std::vector<FolderSummary>& folders);

} // namespace webpress

#endif // WEBPRESS_SUMMARY_HPP

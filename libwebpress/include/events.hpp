//
// Created by Giuseppe Francione on 14/01/26.
//

#ifndef WEBPRESS_EVENTS_HPP
#define WEBPRESS_EVENTS_HPP

#include "summary.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace webpress {

/**
 * @brief Events published by the RunCoordinator.
 *
 * Plain data carriers for EventBus. Progress, status, summary and
 * finished are the outbound channel of a run; the folder and image
 * events give finer detail to front ends that want it.
 */

// --- run level ---

/**
 * @brief Overall progress. Values are non-decreasing within a run.
 */
struct ProgressEvent {
    int percent = 0; ///< 0..100
};

/**
 * @brief Free-form status line for the user.
 */
struct StatusEvent {
    std::string message;
};

/**
 * @brief Carries the terminal summary. Published exactly once per run.
 */
struct RunSummaryEvent {
    RunSummary summary;
};

/**
 * @brief Last event of every run, after RunSummaryEvent.
 */
struct RunFinishedEvent {
    bool cancelled = false;
};

// --- folder level ---

struct FolderStartEvent {
    std::filesystem::path folder;
    std::size_t convertible = 0; ///< Images that will be encoded
    std::size_t skipped = 0;     ///< Already-WebP images excluded from encoding
};

struct FolderCompleteEvent {
    FolderSummary summary;
};

// --- image level ---

struct ImageConvertCompleteEvent {
    std::filesystem::path source;
    std::uintmax_t original_size = 0;
    std::uintmax_t converted_size = 0;
    std::chrono::milliseconds duration{0};
};

struct ImageConvertErrorEvent {
    std::filesystem::path source;
    std::string error_message;
};

} // namespace webpress

#endif // WEBPRESS_EVENTS_HPP

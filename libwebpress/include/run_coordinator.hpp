//
// Created by Giuseppe Francione on 16/01/26.
//

/**
 * @file run_coordinator.hpp
 * @brief Defines the orchestrator of a conversion run.
 *
 * This file contains the RunConfig passed in once per run and the
 * RunCoordinator class, which walks the requested folders, encodes
 * their images and hands each folder to the chosen output strategy.
 */

#ifndef WEBPRESS_RUN_COORDINATOR_HPP
#define WEBPRESS_RUN_COORDINATOR_HPP

#include "cancellation_token.hpp"
#include "encoder.hpp"
#include "event_bus.hpp"
#include "folder_scanner.hpp"
#include "image_format.hpp"
#include "output_strategy.hpp"
#include "progress.hpp"
#include "summary.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace webpress {

/**
 * @brief Immutable configuration of one run.
 */
struct RunConfig {
    std::vector<std::filesystem::path> folders;     ///< Folders to convert, in order
    int quality = 80;                               ///< Clamped into [10, 100]
    ArchiveFormat archive_format = ArchiveFormat::Zip;
    bool replace_originals = false;                 ///< Takes precedence over archiving
    bool skip_existing_webp = false;                ///< Leave already-WebP files alone
    std::string encoder_program = "cwebp";          ///< Name on PATH or path to the executable
};

/**
 * @brief Drives one conversion run from encoder check to final summary.
 *
 * @details The run is strictly sequential: one folder, one image at a
 * time. Cancellation is polled before the first folder, before each
 * folder's output directory is prepared, before each image and before
 * the output strategy runs. An encoder invocation or an archive write
 * is never interrupted.
 *
 * Image and folder failures are recorded in the folder summaries and
 * never stop the run. The only early exit is an unavailable encoder.
 * Every run publishes exactly one RunSummaryEvent followed by one
 * RunFinishedEvent.
 */
class RunCoordinator {
public:
    /**
     * @param config Run configuration.
     * @param encoder Encoder used for every image.
     * @param bus EventBus used to publish progress and results.
     * @param token Stop request polled at the checkpoints.
     */
    RunCoordinator(RunConfig config, IEncoder& encoder, EventBus& bus, const CancellationToken& token);

    /**
     * @brief Executes the run on the calling thread.
     * @return The same summary carried by the published RunSummaryEvent.
     */
    RunSummary run();

private:
    /// Outcome of one folder's processing.
    enum class FolderResult { Done, Cancelled };

    FolderResult process_folder(const FolderBatch& batch, IOutputStrategy& strategy);

    void seal_folder(FolderSummary& folder, std::chrono::steady_clock::time_point started);
    void account_units(std::size_t units);
    void emit_progress(int percent);
    void status(const std::string& message);
    RunSummary finish(bool cancelled);

    [[nodiscard]] bool cancel_requested() const {
        return token_.is_requested();
    }

    RunConfig config_;
    IEncoder& encoder_;
    EventBus& event_bus_;
    const CancellationToken& token_;

    ProgressTracker progress_;
    std::chrono::steady_clock::time_point run_started_;
    std::size_t total_units_ = 0;
    std::size_t processed_units_ = 0;
    std::size_t expected_conversions_ = 0;
    std::vector<FolderSummary> folders_;
};

} // namespace webpress

#endif // WEBPRESS_RUN_COORDINATOR_HPP

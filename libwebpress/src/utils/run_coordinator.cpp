//
// Created by Giuseppe Francione on 16/01/26.
//

#include "../../include/run_coordinator.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include <algorithm>
#include <exception>
#include <utility>

namespace fs = std::filesystem;

namespace webpress {

namespace {

constexpr std::string_view kTag = "Coordinator";

double seconds_since(const std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string folder_label(const fs::path& folder) {
    return normalize_folder(folder).filename().string();
}

} // namespace

    RunCoordinator::RunCoordinator(RunConfig config,
                                   IEncoder& encoder,
                                   EventBus& bus,
                                   const CancellationToken& token)
        : config_(std::move(config)),
          encoder_(encoder),
          event_bus_(bus),
          token_(token) {
        config_.quality = clamp_quality(config_.quality);
    }

    RunSummary RunCoordinator::run() {
        run_started_ = std::chrono::steady_clock::now();
        progress_ = ProgressTracker{};
        total_units_ = 0;
        processed_units_ = 0;
        expected_conversions_ = 0;
        folders_.clear();

        if (!encoder_.is_available()) {
            const std::string msg = "Encoder '" + config_.encoder_program + "' not found. Install "
                                    + std::string(encoder_.get_name()) + " or put it on PATH.";
            Logger::log(LogLevel::Error, msg, kTag);
            status(msg);
            return finish(false);
        }

        const ScanResult scan = scan_folders(config_.folders, config_.skip_existing_webp);
        for (const auto& missing : scan.missing_folders) {
            status("Folder not found, skipping: " + missing.string());
        }

        const std::size_t total_files = scan.total_files();
        expected_conversions_ = scan.total_convertible();
        total_units_ = total_files > 0 ? total_files : expected_conversions_;

        Logger::log(LogLevel::Info, "Scanned " + std::to_string(scan.batches.size()) + " folder(s): "
                    + std::to_string(total_files) + " file(s), "
                    + std::to_string(expected_conversions_) + " to convert", kTag);

        if (expected_conversions_ == 0) {
            status("Nothing to convert.");
            emit_progress(100);
            return finish(false);
        }

        emit_progress(0);
        const auto strategy = make_output_strategy(config_.replace_originals, config_.archive_format);
        Logger::log(LogLevel::Debug, "Output strategy: " + std::string(strategy->get_name()), kTag);

        for (const auto& batch : scan.batches) {
            if (cancel_requested()) {
                return finish(true);
            }
            if (process_folder(batch, *strategy) == FolderResult::Cancelled) {
                return finish(true);
            }
        }

        emit_progress(100);
        return finish(false);
    }

    RunCoordinator::FolderResult RunCoordinator::process_folder(const FolderBatch& batch, IOutputStrategy& strategy) {
        const auto started = std::chrono::steady_clock::now();
        const std::string label = folder_label(batch.folder);
        const std::size_t units_before = processed_units_;

        FolderSummary summary;
        summary.folder = batch.folder;
        summary.skipped_existing = batch.skipped_webp.size();

        event_bus_.publish(FolderStartEvent{batch.folder, batch.convertible_images.size(), batch.skipped_webp.size()});
        status("Processing " + label + " (" + std::to_string(batch.convertible_images.size()) + " image(s))");

        const fs::path temp_dir = temp_dir_for(batch.folder);

        try {
            prepare_clean_dir(temp_dir);
        } catch (const std::exception& e) {
            const std::string msg = "Cannot prepare temporary directory for " + label + ": " + e.what();
            Logger::log(LogLevel::Error, msg, kTag);
            summary.errors.push_back(msg);
            account_units(units_before + batch.all_images.size() - processed_units_);
            seal_folder(summary, started);
            return FolderResult::Done;
        }

        if (batch.convertible_images.empty() && !config_.replace_originals) {
            status(label + ": nothing to convert, skipping");
            cleanup_temp_dir(temp_dir, kTag);
            seal_folder(summary, started);
            return FolderResult::Done;
        }

        try {
            std::vector<fs::path> converted_sources;
            converted_sources.reserve(batch.convertible_images.size());
            const std::vector<fs::path> output_names = assign_output_names(batch);

            for (std::size_t i = 0; i < batch.convertible_images.size(); ++i) {
                const fs::path& image = batch.convertible_images[i];
                if (cancel_requested()) {
                    Logger::log(LogLevel::Info, "Stop requested, discarding outputs of " + label, kTag);
                    cleanup_temp_dir(temp_dir, kTag);
                    seal_folder(summary, started);
                    return FolderResult::Cancelled;
                }

                EncodeRequest request;
                request.source = image;
                request.target = temp_dir / output_names[i];
                request.quality = config_.quality;
                request.source_format = MimeDetector::detect_image_format(image);
                Logger::log(LogLevel::Debug, "Encoding " + image.filename().string() + " ("
                            + image_format_to_string(request.source_format) + ")", kTag);

                const auto image_started = std::chrono::steady_clock::now();
                const ConversionOutcome outcome = invoke_encoder(encoder_, request);
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - image_started);

                if (outcome.success) {
                    ++summary.converted;
                    summary.bytes_original += outcome.original_size;
                    summary.bytes_converted += outcome.converted_size;
                    converted_sources.push_back(image);
                    event_bus_.publish(ImageConvertCompleteEvent{image, outcome.original_size, outcome.converted_size, elapsed});
                } else {
                    const std::string msg = outcome.error_message.value_or(image.filename().string() + ": conversion failed");
                    summary.errors.push_back(msg);
                    event_bus_.publish(ImageConvertErrorEvent{image, msg});
                }
                account_units(1);
            }

            if (cancel_requested()) {
                Logger::log(LogLevel::Info, "Stop requested before finalizing " + label, kTag);
                cleanup_temp_dir(temp_dir, kTag);
                seal_folder(summary, started);
                return FolderResult::Cancelled;
            }

            StrategyResult finalized = strategy.finalize(batch, temp_dir, converted_sources);
            for (auto& err : finalized.errors) {
                summary.errors.push_back(std::move(err));
            }
            summary.archive_path = std::move(finalized.archive_path);
            summary.archive_size = finalized.archive_size;

            account_units(batch.skipped_webp.size());
        } catch (const std::exception& e) {
            const std::string msg = "Unexpected error while processing " + label + ": " + e.what();
            Logger::log(LogLevel::Error, msg, kTag);
            summary.errors.push_back(msg);
            cleanup_temp_dir(temp_dir, kTag);
            const std::size_t folder_end = units_before + batch.all_images.size();
            if (processed_units_ < folder_end) {
                account_units(folder_end - processed_units_);
            }
        }

        seal_folder(summary, started);
        return FolderResult::Done;
    }

    void RunCoordinator::seal_folder(FolderSummary& folder, const std::chrono::steady_clock::time_point started) {
        folder.duration_seconds = seconds_since(started);
        Logger::log(LogLevel::Info, folder_label(folder.folder) + ": " + std::to_string(folder.converted) + " converted, "
                    + std::to_string(folder.errors.size()) + " error(s)", kTag);
        folders_.push_back(folder);
        event_bus_.publish(FolderCompleteEvent{folder});
    }

    void RunCoordinator::account_units(const std::size_t units) {
        if (units == 0) return;
        processed_units_ += units;
        if (const auto pct = progress_percent(static_cast<long long>(processed_units_),
                                              static_cast<long long>(total_units_))) {
            emit_progress(*pct);
        }
    }

    void RunCoordinator::emit_progress(const int percent) {
        if (const auto next = progress_.advance_to(percent)) {
            event_bus_.publish(ProgressEvent{*next});
        }
    }

    void RunCoordinator::status(const std::string& message) {
        event_bus_.publish(StatusEvent{message});
    }

    RunSummary RunCoordinator::finish(const bool cancelled) {
        RunSummary summary;
        summary.cancelled = cancelled;
        summary.duration_seconds = seconds_since(run_started_);
        summary.total_images = total_units_;
        summary.processed_images = processed_units_;
        summary.expected_conversions = expected_conversions_;
        summary.totals = compute_totals(folders_);
        summary.folders = folders_;

        if (cancelled) {
            Logger::log(LogLevel::Warning, "Run cancelled after " + std::to_string(folders_.size()) + " folder(s)", kTag);
            status("Cancelled.");
        } else {
            Logger::log(LogLevel::Info, "Run finished: " + std::to_string(summary.totals.converted) + " converted, "
                        + std::to_string(summary.totals.errors) + " error(s)", kTag);
        }

        event_bus_.publish(RunSummaryEvent{summary});
        event_bus_.publish(RunFinishedEvent{cancelled});
        return summary;
    }

} // namespace webpress

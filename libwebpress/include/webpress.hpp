//
// Created by Giuseppe Francione on 17/01/26.
//

/**
 * @file webpress.hpp
 * @brief Public API for the webpress library.
 */

#ifndef WEBPRESS_HPP
#define WEBPRESS_HPP

#include "image_format.hpp"
#include "summary.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace webpress {

/**
 * @brief Interface for receiving progress and status events during a run.
 *
 * Callbacks are invoked on the thread executing the run.
 */
struct ConverterObserver {
    virtual ~ConverterObserver() = default;

    virtual void onFolderStart(const std::filesystem::path& folder,
                               std::size_t convertible,
                               std::size_t skipped) {}

    virtual void onImageFinish(const std::filesystem::path& path,
                               uintmax_t size_before,
                               uintmax_t size_after) {}

    virtual void onImageError(const std::filesystem::path& path,
                              const std::string& error) {}

    virtual void onFolderFinish(const FolderSummary& summary) {}

    virtual void onProgress(int percent) {}

    virtual void onStatus(const std::string& message) {}

    virtual void onRunFinish(const RunSummary& summary) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface for the webpress library.
 *
 * @details Converts the images of whole folders to WebP with the cwebp
 * encoder, then either replaces the originals or packs the results into
 * one archive per folder. Uses PIMPL idiom to hide internal dependencies.
 */
class Converter {
public:
    Converter();
    ~Converter();

    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;
    Converter(Converter&&) noexcept;
    Converter& operator=(Converter&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Encoding quality, clamped to 10..100.
     * Default: 80. With PNG sources, 100 selects lossless encoding.
     */
    Converter& quality(int val);

    /**
     * @brief Archive written per folder when not replacing originals.
     * Default: ArchiveFormat::Zip.
     */
    Converter& archiveFormat(ArchiveFormat fmt);

    /**
     * @brief Replace originals in place instead of archiving.
     * Default: false.
     */
    Converter& replaceOriginals(bool val);

    /**
     * @brief Leave files that are already WebP out of encoding.
     * Default: false.
     */
    Converter& skipExisting(bool val);

    /**
     * @brief Encoder executable, as a name on PATH or a path.
     * Default: "cwebp".
     */
    Converter& encoder(const std::string& program);

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void setObserver(ConverterObserver* observer);

    // --- Execution ---

    /**
     * @brief Converts the given folders. Blocks until the run ends.
     * @throws std::runtime_error if a run is already in progress.
     */
    RunSummary run(const std::vector<std::filesystem::path>& folders);

    /**
     * @brief Starts a run on a background thread and returns immediately.
     * @throws std::runtime_error if a run is already in progress.
     */
    void start(const std::vector<std::filesystem::path>& folders);

    /**
     * @brief Waits for the run started by start().
     * @return Its summary, or an empty summary if nothing was started.
     */
    RunSummary wait();

    // --- Control ---

    /**
     * @brief Requests cancellation of the current run. Thread-safe.
     */
    void stop();

    [[nodiscard]] bool isRunning() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace webpress

#endif // WEBPRESS_HPP

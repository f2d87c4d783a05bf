//
// Created by Giuseppe Francione on 16/01/26.
//

/**
 * @file output_strategy.hpp
 * @brief What happens to a folder's encoded images once its image loop ends.
 */

#ifndef WEBPRESS_OUTPUT_STRATEGY_HPP
#define WEBPRESS_OUTPUT_STRATEGY_HPP

#include "folder_scanner.hpp"
#include "image_format.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace webpress {

/**
 * @brief Outcome of finalizing one folder.
 */
struct StrategyResult {
    std::vector<std::string> errors;                   ///< Appended to the folder's error list
    std::optional<std::filesystem::path> archive_path; ///< Archive written, if any
    std::optional<std::uintmax_t> archive_size;        ///< Archive size, if it could be read
};

/**
 * @brief Interface for the two mutually exclusive output modes.
 *
 * Exactly one strategy is chosen per run and runs once per folder, after
 * every convertible image of the folder went through the encoder.
 * Implementations always remove temp_dir before returning and never throw.
 */
class IOutputStrategy {
public:
    virtual ~IOutputStrategy() = default;

    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /**
     * @param batch Scan result of the folder.
     * @param temp_dir Directory holding the encoder output.
     * @param converted_sources Originals whose encoding succeeded, in scan order.
     */
    virtual StrategyResult finalize(const FolderBatch& batch,
                                    const std::filesystem::path& temp_dir,
                                    const std::vector<std::filesystem::path>& converted_sources) = 0;
};

/**
 * @brief Deletes converted originals and moves the WebP files in their place.
 */
class ReplaceStrategy final : public IOutputStrategy {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "replace"; }

    StrategyResult finalize(const FolderBatch& batch,
                            const std::filesystem::path& temp_dir,
                            const std::vector<std::filesystem::path>& converted_sources) override;
};

/**
 * @brief Packs the WebP files into `<parent>/<folder name>.zip|.cbz`.
 *
 * @details Entries are flat and in natural name order. Already-WebP files
 * excluded by skip mode are packed as well, so the archive holds the full
 * set. Sources are left untouched.
 */
class ArchiveStrategy final : public IOutputStrategy {
public:
    explicit ArchiveStrategy(ArchiveFormat format) : format_(format) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "archive"; }

    StrategyResult finalize(const FolderBatch& batch,
                            const std::filesystem::path& temp_dir,
                            const std::vector<std::filesystem::path>& converted_sources) override;

    /**
     * @brief Where the archive of a folder is written.
     */
    static std::filesystem::path archive_path_for(const std::filesystem::path& folder, ArchiveFormat format);

    /**
     * @brief Writes a deflate-compressed ZIP with the given flat entries.
     *
     * Entry names are the file names of the inputs, stored in the given
     * order. On failure the partially written file is removed.
     *
     * @throws std::runtime_error with the libarchive error text.
     */
    static void write_zip(const std::filesystem::path& out_path,
                          const std::vector<std::filesystem::path>& files);

private:
    ArchiveFormat format_;
};

/**
 * @brief Chooses the strategy for a run. Replace wins over archiving.
 */
std::unique_ptr<IOutputStrategy> make_output_strategy(bool replace_originals, ArchiveFormat format);

} // namespace webpress

#endif // WEBPRESS_OUTPUT_STRATEGY_HPP

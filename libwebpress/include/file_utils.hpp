//
// Created by Giuseppe Francione on 14/01/26.
//

#ifndef WEBPRESS_FILE_UTILS_HPP
#define WEBPRESS_FILE_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace webpress {

    ///< Name of the per-folder scratch directory receiving encoder output.
    inline constexpr std::string_view kTempDirName = ".webpress_tmp";

    /**
     * @brief Absolute, lexically normal form of a folder path.
     *
     * "." becomes the current directory and "dir/.." its parent, with no
     * trailing separator, so filename() and parent_path() name the folder
     * itself and the directory containing it.
     */
    std::filesystem::path normalize_folder(const std::filesystem::path& folder);

    /**
     * @brief Path of the temporary output directory dedicated to a folder.
     */
    std::filesystem::path temp_dir_for(const std::filesystem::path& folder);

    /**
     * @brief Creates an empty directory, wiping whatever a previous run left.
     *
     * @param dir Directory to (re)create.
     * @throws std::runtime_error if dir exists but is not a directory, if the
     * stale directory cannot be removed or the new one cannot be created.
     */
    void prepare_clean_dir(const std::filesystem::path& dir);

    /**
     * @brief Recursively removes a directory and logs any errors.
     * @param dir The path to the directory to be removed.
     * @param tag The logger tag.
     * @return true if the directory no longer exists.
     */
    bool cleanup_temp_dir(const std::filesystem::path& dir,
                          std::string_view tag = "file_utils");

    /**
     * @brief Size of a regular file, or std::nullopt if it cannot be read.
     */
    std::optional<std::uintmax_t> try_file_size(const std::filesystem::path& path);

    /**
     * @brief Size of a regular file, 0 if it cannot be read.
     */
    std::uintmax_t safe_file_size(const std::filesystem::path& path);

    /**
     * @brief Moves a file, replacing the destination if it exists.
     *
     * Falls back to copy + remove when a plain rename is not possible
     * (e.g. across devices).
     *
     * @param ec Receives the error of the last attempted operation.
     */
    void move_file(const std::filesystem::path& from,
                   const std::filesystem::path& to,
                   std::error_code& ec);

    /**
     * @brief Numeric-aware string comparison ("img2" < "img10").
     */
    bool natural_less(const std::string& a, const std::string& b);

} // namespace webpress

#endif // WEBPRESS_FILE_UTILS_HPP

//
// Created by Giuseppe Francione on 15/01/26.
//

/**
 * @file folder_scanner.hpp
 * @brief Enumerates the images of each requested folder.
 */

#ifndef WEBPRESS_FOLDER_SCANNER_HPP
#define WEBPRESS_FOLDER_SCANNER_HPP

#include <cstddef>
#include <filesystem>
#include <vector>

namespace webpress {

/**
 * @brief The images of one folder, as found at scan time.
 *
 * Built once per run and not modified while the folder is processed.
 * convertible_images and skipped_webp are disjoint; together they are
 * all_images.
 */
struct FolderBatch {
    std::filesystem::path folder;                    ///< Scanned folder
    std::vector<std::filesystem::path> all_images;   ///< Every supported file, in natural name order
    std::vector<std::filesystem::path> convertible_images; ///< Files to encode
    std::vector<std::filesystem::path> skipped_webp; ///< WebP files left alone (skip mode only)
};

/**
 * @brief Result of scanning all requested folders.
 */
struct ScanResult {
    std::vector<FolderBatch> batches;                ///< One per existing folder, in request order
    std::vector<std::filesystem::path> missing_folders; ///< Requested paths that are not readable folders

    [[nodiscard]] std::size_t total_files() const noexcept;
    [[nodiscard]] std::size_t total_convertible() const noexcept;
};

/**
 * @brief Scans a single folder (non-recursive).
 *
 * Regular files with a supported extension are collected in natural
 * file-name order. With skip_existing_webp, WebP files go to
 * skipped_webp instead of convertible_images.
 *
 * @throws std::filesystem::filesystem_error if the folder cannot be listed.
 */
FolderBatch scan_folder(const std::filesystem::path& folder, bool skip_existing_webp);

/**
 * @brief Chooses a distinct output file name for each convertible image.
 *
 * The result is parallel to batch.convertible_images. An image normally
 * becomes `<stem>.webp`. Names of WebP files already in the folder are
 * reserved first, so a WebP source keeps its own name and a skipped WebP
 * file is never overwritten. When two sources share a stem (`a.jpg` and
 * `a.png`) the later one gets its extension folded into the name
 * (`a_png.webp`), with a numeric suffix if that is taken too.
 * Comparison is case-insensitive.
 */
std::vector<std::filesystem::path> assign_output_names(const FolderBatch& batch);

/**
 * @brief Scans every requested folder.
 *
 * Folders that do not exist or cannot be listed are logged and reported
 * in ScanResult::missing_folders; they never abort the scan.
 */
ScanResult scan_folders(const std::vector<std::filesystem::path>& folders, bool skip_existing_webp);

} // namespace webpress

#endif // WEBPRESS_FOLDER_SCANNER_HPP

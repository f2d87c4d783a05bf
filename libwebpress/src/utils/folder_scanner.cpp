//
// Created by Giuseppe Francione on 15/01/26.
//

#include "../../include/folder_scanner.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_format.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <set>
#include <string>

namespace fs = std::filesystem;

namespace webpress {

static bool is_junk(const fs::path& p) {
    const auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    const auto lower = to_lower_copy(name);
    return lower == ".ds_store" || lower == "desktop.ini" || lower == "thumbs.db";
}

std::size_t ScanResult::total_files() const noexcept {
    std::size_t n = 0;
    for (const auto& b : batches) n += b.all_images.size();
    return n;
}

std::size_t ScanResult::total_convertible() const noexcept {
    std::size_t n = 0;
    for (const auto& b : batches) n += b.convertible_images.size();
    return n;
}

FolderBatch scan_folder(const fs::path& folder, const bool skip_existing_webp) {
    FolderBatch batch;
    batch.folder = folder;

    for (const auto& entry : fs::directory_iterator(folder)) {
        std::error_code ec;
        if (!entry.is_regular_file(ec) || ec) continue;
        const auto& p = entry.path();
        if (is_junk(p) || !is_supported_image(p)) continue;
        batch.all_images.push_back(p);
    }

    std::ranges::sort(batch.all_images, [](const fs::path& a, const fs::path& b) {
        return natural_less(a.filename().string(), b.filename().string());
    });

    for (const auto& p : batch.all_images) {
        if (skip_existing_webp && image_format_from_extension(p) == kTargetFormat) {
            batch.skipped_webp.push_back(p);
        } else {
            batch.convertible_images.push_back(p);
        }
    }
    return batch;
}

std::vector<fs::path> assign_output_names(const FolderBatch& batch) {
    std::set<std::string> taken;
    for (const auto& kept : batch.skipped_webp) {
        taken.insert(to_lower_copy(kept.filename().string()));
    }

    std::vector<fs::path> names(batch.convertible_images.size());
    // WebP sources claim their own name before anything else
    for (std::size_t i = 0; i < batch.convertible_images.size(); ++i) {
        const auto& src = batch.convertible_images[i];
        if (image_format_from_extension(src) != kTargetFormat) continue;
        const std::string own = src.stem().string() + ".webp";
        if (taken.insert(to_lower_copy(own)).second) {
            names[i] = own;
        }
    }

    for (std::size_t i = 0; i < batch.convertible_images.size(); ++i) {
        if (!names[i].empty()) continue;
        const auto& src = batch.convertible_images[i];
        const std::string stem = src.stem().string();
        std::string candidate = stem + ".webp";
        if (!taken.insert(to_lower_copy(candidate)).second) {
            std::string ext = to_lower_copy(src.extension().string());
            if (!ext.empty()) ext.erase(0, 1);
            const std::string base = stem + "_" + ext;
            candidate = base + ".webp";
            for (int n = 2; !taken.insert(to_lower_copy(candidate)).second; ++n) {
                candidate = base + "_" + std::to_string(n) + ".webp";
            }
            Logger::log(LogLevel::Info, src.filename().string() + " shares its name with another image, writing "
                        + candidate, "Scanner");
        }
        names[i] = candidate;
    }
    return names;
}

ScanResult scan_folders(const std::vector<fs::path>& folders, const bool skip_existing_webp) {
    ScanResult result;
    for (const auto& requested : folders) {
        const fs::path folder = normalize_folder(requested);
        std::error_code ec;
        if (!fs::is_directory(folder, ec)) {
            Logger::log(LogLevel::Warning, "Folder not found: " + requested.string(), "Scanner");
            result.missing_folders.push_back(requested);
            continue;
        }
        try {
            auto batch = scan_folder(folder, skip_existing_webp);
            Logger::log(LogLevel::Info,
                        folder.filename().string() + ": " + std::to_string(batch.convertible_images.size()) +
                        " to convert, " + std::to_string(batch.skipped_webp.size()) + " already WebP",
                        "Scanner");
            result.batches.push_back(std::move(batch));
        } catch (const fs::filesystem_error& e) {
            Logger::log(LogLevel::Warning, "Cannot list folder " + requested.string() + ": " + e.what(), "Scanner");
            result.missing_folders.push_back(requested);
        }
    }
    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.total_files()) + " files in " +
                std::to_string(result.batches.size()) + " folders",
                "Scanner");
    return result;
}

} // namespace webpress

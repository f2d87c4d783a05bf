//
// Created by Giuseppe Francione on 14/01/26.
//

/**
 * @file image_format.hpp
 * @brief Image and archive format enumerations and their conversions.
 *
 * Classifies the raster formats webpress scans for and the archive
 * formats it can write, with helpers to map between enums, MIME types,
 * extensions and strings.
 */

#ifndef WEBPRESS_IMAGE_FORMAT_HPP
#define WEBPRESS_IMAGE_FORMAT_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace webpress {

/**
 * @brief Raster formats known to the scanner.
 */
enum class ImageFormat {
    Webp,
    Jpeg,
    Png,
    Bmp,
    Tiff,
    Unknown
};

/**
 * @brief Archive formats produced by the archive strategy.
 *
 * Both are ZIP with deflate; Cbz only changes the extension so comic
 * readers pick the archive up.
 */
enum class ArchiveFormat {
    Zip,
    Cbz
};

///< The format every convertible image is encoded into.
inline constexpr ImageFormat kTargetFormat = ImageFormat::Webp;

///< Source format that, combined with quality 100, requests lossless encoding.
inline constexpr ImageFormat kLosslessTriggerFormat = ImageFormat::Png;

///< Extensions (lowercase, with dot) the scanner accepts.
inline constexpr std::array<std::string_view, 7> kSupportedExtensions = {
    ".webp", ".jpg", ".jpeg", ".png", ".bmp", ".tif", ".tiff"
};

///< Map linking MIME types reported by libmagic to image formats.
inline const std::unordered_map<std::string, ImageFormat> mime_to_image_format = {
    { "image/webp",    ImageFormat::Webp },
    { "image/jpeg",    ImageFormat::Jpeg },
    { "image/pjpeg",   ImageFormat::Jpeg },
    { "image/png",     ImageFormat::Png },
    { "image/bmp",     ImageFormat::Bmp },
    { "image/x-ms-bmp", ImageFormat::Bmp },
    { "image/tiff",    ImageFormat::Tiff },
};

inline std::string to_lower_copy(std::string s) {
    std::ranges::transform(s, s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief Classifies a path by its (case-insensitive) extension.
 * @return ImageFormat::Unknown for anything outside kSupportedExtensions.
 */
inline ImageFormat image_format_from_extension(const std::filesystem::path& path) {
    const std::string ext = to_lower_copy(path.extension().string());
    if (ext == ".webp") return ImageFormat::Webp;
    if (ext == ".jpg" || ext == ".jpeg") return ImageFormat::Jpeg;
    if (ext == ".png") return ImageFormat::Png;
    if (ext == ".bmp") return ImageFormat::Bmp;
    if (ext == ".tif" || ext == ".tiff") return ImageFormat::Tiff;
    return ImageFormat::Unknown;
}

inline bool is_supported_image(const std::filesystem::path& path) {
    const std::string ext = to_lower_copy(path.extension().string());
    return std::ranges::find(kSupportedExtensions, std::string_view(ext)) != kSupportedExtensions.end();
}

inline std::string image_format_to_string(const ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Webp: return "webp";
        case ImageFormat::Jpeg: return "jpeg";
        case ImageFormat::Png:  return "png";
        case ImageFormat::Bmp:  return "bmp";
        case ImageFormat::Tiff: return "tiff";
        default:                return "unknown";
    }
}

inline std::string archive_format_to_string(const ArchiveFormat fmt) {
    switch (fmt) {
        case ArchiveFormat::Zip: return "zip";
        case ArchiveFormat::Cbz: return "cbz";
    }
    return "zip";
}

/**
 * @brief Extension (with dot) used for archives of the given format.
 */
inline std::string archive_extension(const ArchiveFormat fmt) {
    return "." + archive_format_to_string(fmt);
}

/**
 * @brief Parses "zip" or "cbz" (case-insensitive).
 * @return std::nullopt for anything else.
 */
inline std::optional<ArchiveFormat> parse_archive_format(const std::string& str) {
    const std::string s = to_lower_copy(str);
    if (s == "zip") return ArchiveFormat::Zip;
    if (s == "cbz") return ArchiveFormat::Cbz;
    return std::nullopt;
}

} // namespace webpress

#endif // WEBPRESS_IMAGE_FORMAT_HPP

//
// Created by Giuseppe Francione on 14/01/26.
//
#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <filesystem>

std::string webpress::MimeDetector::detect(const std::filesystem::path& path)
{
#ifndef _WIN32
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        Logger::log(LogLevel::Debug, std::string("magic_load failed: ") + magic_error(magic), "libmagic");
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.string().c_str());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
#else
    switch (image_format_from_extension(path))
    {
        case ImageFormat::Webp: return "image/webp";
        case ImageFormat::Jpeg: return "image/jpeg";
        case ImageFormat::Png:  return "image/png";
        case ImageFormat::Bmp:  return "image/bmp";
        case ImageFormat::Tiff: return "image/tiff";
        default:                return "application/octet-stream";
    }
#endif
}

webpress::ImageFormat webpress::MimeDetector::detect_image_format(const std::filesystem::path& path)
{
    const std::string mime = detect(path);
    const auto it = mime_to_image_format.find(mime);
    if (it != mime_to_image_format.end())
    {
        return it->second;
    }
    if (!mime.empty())
    {
        Logger::log(LogLevel::Debug, "No image type for MIME '" + mime + "', using extension: " + path.filename().string(), "libmagic");
    }
    return image_format_from_extension(path);
}

//
// Created by Giuseppe Francione on 14/01/26.
//

#ifndef WEBPRESS_MIME_DETECTOR_HPP
#define WEBPRESS_MIME_DETECTOR_HPP

#include "image_format.hpp"
#include <filesystem>
#include <string>

namespace webpress {

    /**
     * @brief Content-based file type detection.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @param path The filesystem path to the file.
         * @return A MIME type string (e.g. "image/png"), or an empty string
         * when detection is not possible.
         *
         * @note On Linux/macOS this uses libmagic.
         * @note On Windows it falls back to the file extension.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Determines the actual image format of a file.
         *
         * Uses the detected MIME type first; when libmagic does not recognise
         * an image (empty, "application/octet-stream", text...) the file
         * extension decides.
         */
        static ImageFormat detect_image_format(const std::filesystem::path& path);
    };

} // namespace webpress
#endif //WEBPRESS_MIME_DETECTOR_HPP

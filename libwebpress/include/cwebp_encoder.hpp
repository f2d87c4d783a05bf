//
// Created by Giuseppe Francione on 15/01/26.
//

#ifndef WEBPRESS_CWEBP_ENCODER_HPP
#define WEBPRESS_CWEBP_ENCODER_HPP

#include "encoder.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace webpress {

    /**
     * @brief Encodes images by running the external cwebp tool.
     *
     * @details Quality maps to `-q N`. A PNG source at quality 100 is
     * encoded with `-lossless` instead, since a numeric quality would still
     * produce a lossy file.
     */
    class CwebpEncoder final : public IEncoder {
    public:
        /**
         * @param program Executable name looked up on PATH, or a path to it.
         */
        explicit CwebpEncoder(std::string program = "cwebp");

        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "cwebp";
        }

        /**
         * @brief Resolves the executable and remembers where it was found.
         */
        [[nodiscard]] bool is_available() override;

        /**
         * @brief Runs cwebp for one image and waits for it to exit.
         * @throws std::system_error if the process cannot be started.
         */
        ConversionOutcome encode(const EncodeRequest& request) override;

        /**
         * @brief Builds the cwebp argument list for a request.
         */
        static std::vector<std::string> build_arguments(const EncodeRequest& request);

        /**
         * @brief True when the request triggers lossless encoding.
         */
        static bool wants_lossless(const EncodeRequest& request) noexcept;

        [[nodiscard]] const std::optional<std::filesystem::path>& resolved_path() const noexcept {
            return resolved_;
        }

    private:
        std::string program_;
        std::optional<std::filesystem::path> resolved_;
    };

} // namespace webpress

#endif // WEBPRESS_CWEBP_ENCODER_HPP

//
// Created by Giuseppe Francione on 18/01/26.
//

#ifndef WEBPRESS_CLI_PARSER_HPP
#define WEBPRESS_CLI_PARSER_HPP

#include "../../../libwebpress/include/image_format.hpp"
#include "../../../libwebpress/include/run_coordinator.hpp"
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool replace = false;
    bool skip_webp = false;
    bool quiet = false;
    bool show_history = false;
    bool clear_history = false;
    bool no_history = false;

    int quality = 80;
    webpress::ArchiveFormat archive_format = webpress::ArchiveFormat::Zip;
    std::string encoder = "cwebp";
    std::string log_level = "ERROR";
    std::filesystem::path log_file = "webpress.log";
    std::filesystem::path report_path;

    std::vector<std::filesystem::path> folders;

    [[nodiscard]] bool history_only() const {
        return folders.empty() && (show_history || clear_history);
    }

    /**
     * @brief Run configuration for the library.
     */
    [[nodiscard]] webpress::RunConfig to_run_config() const;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // WEBPRESS_CLI_PARSER_HPP

//
// Created by Giuseppe Francione on 18/01/26.
//

#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <map>

webpress::RunConfig Settings::to_run_config() const {
    webpress::RunConfig cfg;
    cfg.folders = folders;
    cfg.quality = quality;
    cfg.archive_format = archive_format;
    cfg.replace_originals = replace;
    cfg.skip_existing_webp = skip_webp;
    cfg.encoder_program = encoder;
    return cfg;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Conversion ---
    app.add_option("-q,--quality", settings.quality,
                   "WebP quality (10-100). With PNG sources, 100 means lossless.")
                   ->default_val(80)
                   ->check(CLI::Range(webpress::kMinQuality, webpress::kMaxQuality));

    app.add_option("-f,--format", settings.archive_format,
                   "Archive format when not replacing: 'zip' (default) or 'cbz'.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, webpress::ArchiveFormat>{
                {"zip", webpress::ArchiveFormat::Zip},
                {"cbz", webpress::ArchiveFormat::Cbz}
            }, CLI::ignore_case));

    app.add_flag("-r,--replace", settings.replace,
                 "Replace original images in place instead of creating an archive.");

    app.add_flag("-s,--skip-webp", settings.skip_webp,
                 "Don't re-encode files that are already WebP.");

    app.add_option("--encoder", settings.encoder,
                   "cwebp executable name or path.")
                   ->default_val("cwebp");

    // --- Output and logging ---
    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Log file (default: webpress.log).")
                   ->default_val("webpress.log");

    app.add_flag("--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    // --- History ---
    app.add_flag("--history", settings.show_history,
                 "Show the most recent runs and exit if no folder is given.");

    app.add_flag("--clear-history", settings.clear_history,
                 "Delete the run history.");

    app.add_flag("--no-history", settings.no_history,
                 "Don't record this run in the history.");

    // --- Positional Arguments ---
    app.add_option("folders", settings.folders,
                   "One or more folders containing images.");

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.no_history && settings.clear_history) {
            throw CLI::ValidationError("--no-history and --clear-history cannot be used together.");
        }
    });
}

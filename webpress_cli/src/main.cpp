//
// Created by Giuseppe Francione on 18/01/26.
//

#include <algorithm>
#include <atomic>
#include <chrono>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <thread>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "history/run_history.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libwebpress/include/cancellation_token.hpp"
#include "../../libwebpress/include/cwebp_encoder.hpp"
#include "../../libwebpress/include/event_bus.hpp"
#include "../../libwebpress/include/events.hpp"
#include "../../libwebpress/include/logger.hpp"
#include "../../libwebpress/include/run_coordinator.hpp"

// simple progress bar printer
inline void print_progress_bar(const int percent, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const unsigned clamped = static_cast<unsigned>(std::clamp(percent, 0, 100));
    const unsigned pos = bar_width * clamped / 100u;

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && clamped < 100) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(3) << clamped << "%"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace webpress;
namespace fs = std::filesystem;

static CancellationToken g_token;
static std::atomic<bool> interrupted{false};

// handle ctrl+c or termination signals
extern "C" void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_token.request();
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

static void print_history(const std::vector<HistoryEntry>& entries) {
    if (entries.empty()) {
        std::cout << "No runs recorded." << std::endl;
        return;
    }
    for (const auto& e : entries) {
        std::cout << e.timestamp << "  q=" << e.quality << " " << e.format
                  << (e.skip_webp ? " skip-webp" : "")
                  << (e.cancelled ? " [cancelled]" : "")
                  << "  converted " << e.converted
                  << ", errors " << e.errors
                  << ", saved " << (e.bytes_saved / 1024) << " KB\n";
        for (const auto& folder : e.folders) {
            std::cout << "    " << folder.string() << "\n";
        }
    }
    std::cout << std::flush;
}

int main(int argc, char* argv[]) {

    CLI::App app{"webpress: batch WebP conversion of image folders."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // set file logger
    Logger::clear_sinks();
    auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
    if (!fileSink->is_open()) {
        std::cerr << YELLOW << "Cannot open log file " << settings.log_file.string() << RESET << std::endl;
    }
    Logger::add_sink(std::move(fileSink));

    if (!settings.quiet) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }

    init_utf8_locale();

    const RunHistory history(RunHistory::default_path());
    if (settings.clear_history) {
        if (history.clear()) {
            std::cout << "History cleared." << std::endl;
        }
    }
    if (settings.show_history) {
        print_history(history.list());
    }
    if (settings.history_only()) {
        return 0;
    }

    if (settings.folders.empty()) {
        Logger::log(LogLevel::Error, "No input folders.", "main");
        std::cerr << RED << "No input folders given. See --help." << RESET << std::endl;
        return 1;
    }

    const RunConfig config = settings.to_run_config();
    EventBus bus;
    CwebpEncoder encoder(config.encoder_program);
    const auto start_total = std::chrono::steady_clock::now();

    bus.subscribe<ProgressEvent>([&](const ProgressEvent& e) {
        if (!settings.quiet) {
            const double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - start_total).count();
            print_progress_bar(e.percent, elapsed);
        }
    });

    bus.subscribe<StatusEvent>([&](const StatusEvent& e) {
        if (!settings.quiet) {
            std::cerr << "\n" << CYAN << e.message << RESET << std::flush;
        }
    });

    bus.subscribe<ImageConvertErrorEvent>([&](const ImageConvertErrorEvent& e) {
        if (!settings.quiet) {
            std::cerr << "\n" << RED << "[FAIL] " << e.error_message << RESET << std::flush;
        }
    });

    bus.subscribe<FolderCompleteEvent>([&](const FolderCompleteEvent& e) {
        if (!settings.quiet) {
            const auto& f = e.summary;
            std::cerr << "\n" << (f.errors.empty() ? GREEN : YELLOW)
                      << "[DONE] " << f.folder.filename().string()
                      << " (" << f.converted << " converted, " << f.errors.size() << " error(s))"
                      << RESET << std::flush;
        }
    });

    RunSummary summary;
    {
        // one worker per run; the main thread only waits
        std::jthread worker([&]() {
            try {
                RunCoordinator coordinator(config, encoder, bus, g_token);
                summary = coordinator.run();
            } catch (const std::exception& e) {
                Logger::log(LogLevel::Error, std::string("Run failed: ") + e.what(), "main");
            }
        });
    }

    if (!settings.quiet) {
        std::cerr << std::endl;
    }

    if (!encoder.resolved_path()) {
        std::cerr << RED << "Encoder '" << config.encoder_program << "' not found." << RESET << std::endl;
        return 1;
    }

    if (!settings.quiet) {
        if (summary.cancelled) {
            std::cerr << CYAN << "[INTERRUPT] Stopped before completion." << RESET << std::endl;
        }
        print_console_report(summary);
    }

    // export CSV if requested
    if (!settings.report_path.empty()) {
        if (!export_csv_report(summary, settings.report_path)) {
            Logger::log(LogLevel::Error, "Cannot write report: " + settings.report_path.string(), "main");
        }
    }

    if (!settings.no_history) {
        const std::string mode = settings.replace ? "replace" : archive_format_to_string(settings.archive_format);
        history.append(RunHistory::make_entry(settings.folders, clamp_quality(settings.quality),
                                              mode, settings.skip_webp, summary));
    }

    if (interrupted.load() || summary.cancelled) {
        return 130; // standard exit code for SIGINT
    }
    return 0;
}

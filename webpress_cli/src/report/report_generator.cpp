//
// Created by Giuseppe Francione on 18/01/26.
//

#include "report_generator.hpp"
#include "../../../libwebpress/include/file_utils.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

#ifdef _WIN32

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_ERROR_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

double reduction_percent(const std::uintmax_t before, const std::uintmax_t after) {
    if (before == 0) return 0.0;
    return 100.0 * (1.0 - static_cast<double>(after) / static_cast<double>(before));
}

namespace {

std::string fixed2(const double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

std::string folder_name(const std::filesystem::path& folder) {
    return webpress::normalize_folder(folder).filename().string();
}

std::string join_errors(const std::vector<std::string>& errors) {
    std::string joined;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i) joined += "; ";
        joined += errors[i];
    }
    return joined;
}

std::string archive_cell(const webpress::FolderSummary& f) {
    if (!f.archive_path) return "-";
    std::string s = f.archive_path->filename().string();
    if (f.archive_size) s += " (" + std::to_string(*f.archive_size / 1024) + " KB)";
    return s;
}

} // namespace

void print_console_report(const webpress::RunSummary& summary, std::ostream& out) {
    const unsigned term_width = get_terminal_width();

    size_t max_conv = 11;
    size_t max_skip = 9;
    size_t max_before = 12;
    size_t max_after = 12;
    size_t max_delta = 10;
    size_t max_time = 9;
    size_t max_archive = 9;
    for (const auto& f : summary.folders) {
        max_before  = std::max(max_before, std::to_string(f.bytes_original / 1024).size() + 2);
        max_after   = std::max(max_after,  std::to_string(f.bytes_converted / 1024).size() + 2);
        max_time    = std::max(max_time,   fixed2(f.duration_seconds).size() + 2);
        max_archive = std::max(max_archive, archive_cell(f).size() + 2);
    }

    const size_t fixed_cols_width = max_conv + max_skip + max_before + max_after
                                    + max_delta + max_time + max_archive + 8;
    const size_t folder_col_width = term_width > fixed_cols_width + 10
                                        ? std::min<size_t>(term_width - fixed_cols_width, 40)
                                        : 12;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() < max_len ? s : s.substr(0, max_len - 4) + "... ";
    };

    out << "\n"
        << std::left << std::setw(static_cast<int>(folder_col_width)) << "Folder"
        << std::setw(static_cast<int>(max_conv))    << "Converted"
        << std::setw(static_cast<int>(max_skip))    << "Skipped"
        << std::setw(static_cast<int>(max_before))  << "Before(KB)"
        << std::setw(static_cast<int>(max_after))   << "After(KB)"
        << std::setw(static_cast<int>(max_delta))   << "Delta(%)"
        << std::setw(static_cast<int>(max_time))    << "Time(s)"
        << std::setw(static_cast<int>(max_archive)) << "Archive"
        << "Errors\n";

    for (const auto& f : summary.folders) {
        const std::string delta = f.converted ? fixed2(reduction_percent(f.bytes_original, f.bytes_converted)) + "%" : "-";
        out << std::left << std::setw(static_cast<int>(folder_col_width)) << truncate(folder_name(f.folder), folder_col_width)
            << std::setw(static_cast<int>(max_conv))    << f.converted
            << std::setw(static_cast<int>(max_skip))    << f.skipped_existing
            << std::setw(static_cast<int>(max_before))  << (f.bytes_original / 1024)
            << std::setw(static_cast<int>(max_after))   << (f.bytes_converted / 1024)
            << std::setw(static_cast<int>(max_delta))   << delta
            << std::setw(static_cast<int>(max_time))    << fixed2(f.duration_seconds)
            << std::setw(static_cast<int>(max_archive)) << archive_cell(f)
            << f.errors.size() << "\n";
        for (const auto& err : f.errors) {
            out << "    ! " << err << "\n";
        }
    }

    const auto& t = summary.totals;
    out << "\nConverted: " << t.converted << "/" << summary.expected_conversions
        << "  Skipped: " << t.skipped_existing
        << "  Errors: " << t.errors
        << "  Archives: " << t.archives << "\n";
    out << "Total saved space: " << (t.bytes_saved / 1024) << " KB\n";
    if (t.bytes_original > 0) {
        out << "Total reduction: " << fixed2(reduction_percent(t.bytes_original, t.bytes_converted)) << "%\n";
    }
    out << "Total time: " << fixed2(summary.duration_seconds) << " s"
        << (summary.cancelled ? " (cancelled)" : "") << "\n";
}

bool export_csv_report(const webpress::RunSummary& summary,
                       const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "Folder,Converted,Skipped,Before(KB),After(KB),Delta(%),Time(s),Archive,Archive size(KB),Errors\n";

    for (const auto& f : summary.folders) {
        out << csv_escape(f.folder.string()) << ","
            << f.converted << ","
            << f.skipped_existing << ","
            << (f.bytes_original / 1024) << ","
            << (f.bytes_converted / 1024) << ","
            << fixed2(reduction_percent(f.bytes_original, f.bytes_converted)) << ","
            << fixed2(f.duration_seconds) << ","
            << csv_escape(f.archive_path ? f.archive_path->string() : "") << ","
            << (f.archive_size ? std::to_string(*f.archive_size / 1024) : "") << ","
            << csv_escape(join_errors(f.errors)) << "\n";
    }

    const auto& t = summary.totals;
    out << "\n\nConverted,Skipped,Errors,Before(KB),After(KB),Saved(KB),Archives,Total time(s),Cancelled\n";
    out << t.converted << ","
        << t.skipped_existing << ","
        << t.errors << ","
        << (t.bytes_original / 1024) << ","
        << (t.bytes_converted / 1024) << ","
        << (t.bytes_saved / 1024) << ","
        << t.archives << ","
        << fixed2(summary.duration_seconds) << ","
        << (summary.cancelled ? "yes" : "no") << "\n";

    return static_cast<bool>(out);
}

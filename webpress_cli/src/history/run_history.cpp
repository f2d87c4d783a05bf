//
// Created by Giuseppe Francione on 19/01/26.
//

#include "run_history.hpp"
#include "../../../libwebpress/include/logger.hpp"
#include <cstdlib>
#include <ctime>
#include <exception>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTag = "history";

std::string utc_timestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace

RunHistory::RunHistory(fs::path file) : file_(std::move(file)) {}

fs::path RunHistory::default_path() {
#ifdef _WIN32
    if (const char* appdata = std::getenv("APPDATA")) {
        return fs::path(appdata) / "webpress" / "history.json";
    }
#else
    if (const char* home = std::getenv("HOME")) {
#ifdef __APPLE__
        return fs::path(home) / "Library" / "Application Support" / "webpress" / "history.json";
#else
        if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
            return fs::path(xdg) / "webpress" / "history.json";
        }
        return fs::path(home) / ".local" / "share" / "webpress" / "history.json";
#endif
    }
#endif
    return fs::path("webpress_history.json");
}

void to_json(nlohmann::json& j, const HistoryEntry& e) {
    std::vector<std::string> folders;
    folders.reserve(e.folders.size());
    for (const auto& folder : e.folders) folders.push_back(folder.string());

    j = nlohmann::json{
        {"timestamp", e.timestamp},
        {"folders", folders},
        {"quality", e.quality},
        {"format", e.format},
        {"skip_webp", e.skip_webp},
        {"cancelled", e.cancelled},
        {"converted", e.converted},
        {"skipped_existing", e.skipped_existing},
        {"errors", e.errors},
        {"bytes_original", e.bytes_original},
        {"bytes_converted", e.bytes_converted},
        {"bytes_saved", e.bytes_saved},
        {"archives", e.archives},
        {"duration_seconds", e.duration_seconds},
    };
}

void from_json(const nlohmann::json& j, HistoryEntry& e) {
    j.at("timestamp").get_to(e.timestamp);
    const auto folders = j.at("folders").get<std::vector<std::string>>();
    e.folders.assign(folders.begin(), folders.end());
    j.at("quality").get_to(e.quality);
    j.at("format").get_to(e.format);
    j.at("skip_webp").get_to(e.skip_webp);
    j.at("cancelled").get_to(e.cancelled);
    j.at("converted").get_to(e.converted);
    j.at("skipped_existing").get_to(e.skipped_existing);
    j.at("errors").get_to(e.errors);
    j.at("bytes_original").get_to(e.bytes_original);
    j.at("bytes_converted").get_to(e.bytes_converted);
    j.at("bytes_saved").get_to(e.bytes_saved);
    j.at("archives").get_to(e.archives);
    j.at("duration_seconds").get_to(e.duration_seconds);
}

HistoryEntry RunHistory::make_entry(const std::vector<fs::path>& folders,
                                    const int quality,
                                    const std::string& format,
                                    const bool skip_webp,
                                    const webpress::RunSummary& summary) {
    HistoryEntry e;
    e.timestamp = utc_timestamp();
    e.folders = folders;
    e.quality = quality;
    e.format = format;
    e.skip_webp = skip_webp;
    e.cancelled = summary.cancelled;
    e.converted = summary.totals.converted;
    e.skipped_existing = summary.totals.skipped_existing;
    e.errors = summary.totals.errors;
    e.bytes_original = summary.totals.bytes_original;
    e.bytes_converted = summary.totals.bytes_converted;
    e.bytes_saved = summary.totals.bytes_saved;
    e.archives = summary.totals.archives;
    e.duration_seconds = summary.duration_seconds;
    return e;
}

std::vector<HistoryEntry> RunHistory::list() const {
    std::vector<HistoryEntry> entries;
    std::error_code ec;
    if (!fs::exists(file_, ec)) return entries;

    nlohmann::json data;
    try {
        std::ifstream in(file_);
        if (!in) {
            Logger::log(LogLevel::Warning, "Cannot open history file " + file_.string(), kTag);
            return entries;
        }
        data = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::log(LogLevel::Warning, std::string("History file is not valid JSON, ignoring it: ") + e.what(), kTag);
        return entries;
    }

    if (!data.is_array()) {
        Logger::log(LogLevel::Warning, "History file does not hold a list of runs, ignoring it", kTag);
        return entries;
    }

    for (const auto& item : data) {
        try {
            entries.push_back(item.get<HistoryEntry>());
        } catch (const nlohmann::json::exception& e) {
            Logger::log(LogLevel::Debug, std::string("Skipping malformed history entry: ") + e.what(), kTag);
        }
    }
    return entries;
}

bool RunHistory::append(const HistoryEntry& entry) const {
    try {
        auto entries = list();
        entries.push_back(entry);
        if (entries.size() > kMaxEntries) {
            entries.erase(entries.begin(), entries.end() - static_cast<std::ptrdiff_t>(kMaxEntries));
        }

        std::error_code ec;
        if (file_.has_parent_path()) {
            fs::create_directories(file_.parent_path(), ec);
            if (ec) {
                Logger::log(LogLevel::Warning, "Cannot create history directory " + file_.parent_path().string() + " (" + ec.message() + ")", kTag);
                return false;
            }
        }

        const fs::path tmp = file_.string() + ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                Logger::log(LogLevel::Warning, "Cannot write history file " + tmp.string(), kTag);
                return false;
            }
            const nlohmann::json data = entries;
            out << data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
            if (!out) {
                Logger::log(LogLevel::Warning, "Write error on history file " + tmp.string(), kTag);
                return false;
            }
        }

        fs::rename(tmp, file_, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Cannot replace history file (" + ec.message() + ")", kTag);
            fs::remove(tmp, ec);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, std::string("Cannot update history: ") + e.what(), kTag);
        return false;
    }
}

bool RunHistory::clear() const {
    std::error_code ec;
    fs::remove(file_, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Cannot clear history (" + ec.message() + ")", kTag);
        return false;
    }
    return true;
}

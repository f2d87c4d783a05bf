//
// Created by Giuseppe Francione on 16/01/26.
//

#include "../../include/output_strategy.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <exception>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace webpress {

namespace {

constexpr std::string_view kTag = "ArchiveStrategy";

// owns an archive* opened for writing
class ZipWriter {
public:
    explicit ZipWriter(const fs::path& out_path) : a_(archive_write_new()) {
        if (!a_) throw std::runtime_error("archive_write_new failed");

        try {
            int r = archive_write_set_format_zip(a_);
            if (r == ARCHIVE_OK) {
                archive_write_set_format_option(a_, "zip", "compression", "deflate");
                archive_write_set_format_option(a_, "zip", "compression-level", "9");
            }
            check(r, "Setting format failed");

            r = archive_write_open_filename(a_, out_path.string().c_str());
            check(r, "archive_write_open_filename");
        } catch (...) {
            archive_write_free(a_);
            throw;
        }
    }

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    ~ZipWriter() {
        if (a_) {
            if (!closed_) archive_write_close(a_);
            archive_write_free(a_);
        }
    }

    void add_file(const fs::path& file) {
        std::error_code ec;
        const std::uintmax_t fsize = fs::file_size(file, ec);
        if (ec) throw std::runtime_error("Cannot stat " + file.filename().string() + ": " + ec.message());

        std::ifstream in(file, std::ios::binary);
        if (!in) throw std::runtime_error("Cannot open " + file.filename().string());

        archive_entry* entry = archive_entry_new();
        if (!entry) throw std::runtime_error("archive_entry_new failed");

        const std::string name = file.filename().string();
        archive_entry_set_pathname(entry, name.c_str());
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_entry_set_size(entry, static_cast<la_int64_t>(fsize));

        const int r = archive_write_header(a_, entry);
        archive_entry_free(entry);
        check(r, "archive_write_header for " + name);

        while (in) {
            in.read(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
            const std::streamsize got = in.gcount();
            if (got <= 0) break;
            if (archive_write_data(a_, buffer_.data(), static_cast<size_t>(got)) < 0) {
                throw std::runtime_error("archive_write_data for " + name + ": " + error_string());
            }
        }
        if (in.bad()) throw std::runtime_error("Read error on " + name);

        const int rf = archive_write_finish_entry(a_);
        check(rf, "archive_write_finish_entry for " + name);
    }

    void close() {
        closed_ = true;
        check(archive_write_close(a_), "archive_write_close");
    }

private:
    void check(const int r, const std::string& what) const {
        if (r == ARCHIVE_WARN) {
            Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_string(), kTag);
            return;
        }
        if (r != ARCHIVE_OK) {
            throw std::runtime_error(what + ": " + error_string());
        }
    }

    [[nodiscard]] std::string error_string() const {
        const char* s = archive_error_string(a_);
        return s ? s : "unknown libarchive error";
    }

    archive* a_;
    bool closed_ = false;
    std::vector<char> buffer_ = std::vector<char>(64 * 1024);
};

} // namespace

fs::path ArchiveStrategy::archive_path_for(const fs::path& folder, const ArchiveFormat format) {
    const fs::path clean = normalize_folder(folder);
    return clean.parent_path() / (clean.filename().string() + archive_extension(format));
}

void ArchiveStrategy::write_zip(const fs::path& out_path, const std::vector<fs::path>& files) {
    try {
        ZipWriter writer(out_path);
        for (const auto& f : files) {
            writer.add_file(f);
        }
        writer.close();
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(out_path, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Cannot remove partial archive " + out_path.string() + " (" + ec.message() + ")", kTag);
        }
        throw;
    }
}

StrategyResult ArchiveStrategy::finalize(const FolderBatch& batch,
                                         const fs::path& temp_dir,
                                         const std::vector<fs::path>& /*converted_sources*/) {
    StrategyResult result;
    const fs::path out_path = archive_path_for(batch.folder, format_);

    try {
        std::error_code ec;
        if (fs::exists(out_path, ec)) {
            fs::remove(out_path, ec);
            if (ec) {
                const std::string msg = "Cannot remove existing archive " + out_path.filename().string() + " (" + ec.message() + ")";
                Logger::log(LogLevel::Error, msg, kTag);
                result.errors.push_back(msg);
                cleanup_temp_dir(temp_dir, kTag);
                return result;
            }
            Logger::log(LogLevel::Debug, "Removed existing archive " + out_path.string(), kTag);
        }

        std::vector<fs::path> entries;
        std::set<std::string> names;
        for (fs::directory_iterator it(temp_dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_regular_file(type_ec)) {
                entries.push_back(it->path());
                names.insert(it->path().filename().string());
            }
        }
        if (ec) throw std::runtime_error("Cannot list temporary outputs: " + ec.message());

        for (const auto& kept : batch.skipped_webp) {
            // a freshly encoded file of the same name takes precedence
            if (!names.insert(kept.filename().string()).second) {
                Logger::log(LogLevel::Warning, "Duplicate entry name, keeping converted file: " + kept.filename().string(), kTag);
                continue;
            }
            entries.push_back(kept);
        }

        std::sort(entries.begin(), entries.end(), [](const fs::path& a, const fs::path& b) {
            return natural_less(a.filename().string(), b.filename().string());
        });

        write_zip(out_path, entries);
        result.archive_path = out_path;
        result.archive_size = try_file_size(out_path);
        if (!result.archive_size) {
            Logger::log(LogLevel::Debug, "Archive size unavailable: " + out_path.string(), kTag);
        }
        Logger::log(LogLevel::Info, "Created " + out_path.string() + " (" + std::to_string(entries.size()) + " entries)", kTag);
    } catch (const std::exception& e) {
        const std::string msg = "Cannot create archive " + out_path.filename().string() + ": " + e.what();
        Logger::log(LogLevel::Error, msg, kTag);
        result.errors.push_back(msg);
        result.archive_path.reset();
        result.archive_size.reset();
    }

    cleanup_temp_dir(temp_dir, kTag);
    return result;
}

} // namespace webpress

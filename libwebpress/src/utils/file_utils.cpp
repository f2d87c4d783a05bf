//
// Created by Giuseppe Francione on 14/01/26.
//

#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace webpress {

    std::filesystem::path normalize_folder(const std::filesystem::path& folder) {
        std::error_code ec;
        auto abs = std::filesystem::absolute(folder, ec);
        if (ec) abs = folder;
        auto clean = abs.lexically_normal();
        if (!clean.has_filename() && clean.has_relative_path()) clean = clean.parent_path();
        return clean;
    }

    std::filesystem::path temp_dir_for(const std::filesystem::path& folder) {
        return folder / std::string(kTempDirName);
    }

    void prepare_clean_dir(const std::filesystem::path& dir) {
        std::error_code ec;
        const auto st = std::filesystem::symlink_status(dir, ec);
        if (std::filesystem::exists(st) && !std::filesystem::is_directory(st)) {
            throw std::runtime_error(dir.string() + " exists and is not a directory");
        }
        if (std::filesystem::exists(st)) {
            Logger::log(LogLevel::Debug, "Removing stale temp dir: " + dir.string(), "file_utils");
            std::filesystem::remove_all(dir, ec);
            if (ec) {
                throw std::runtime_error("cannot clear temporary directory " + dir.string() + ": " + ec.message());
            }
        }
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw std::runtime_error("cannot create temporary directory " + dir.string() + ": " + ec.message());
        }
    }

    bool cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
            return false;
        }
        Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        return true;
    }

    std::optional<std::uintmax_t> try_file_size(const std::filesystem::path& path) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            return std::nullopt;
        }
        return size;
    }

    std::uintmax_t safe_file_size(const std::filesystem::path& path) {
        return try_file_size(path).value_or(0);
    }

    void move_file(const std::filesystem::path& from,
                   const std::filesystem::path& to,
                   std::error_code& ec) {
        ec.clear();
        std::filesystem::rename(from, to, ec);
        if (!ec) {
            return;
        }
        Logger::log(LogLevel::Debug, "Rename failed (" + ec.message() + "), falling back to copy: " + from.string(), "file_utils");
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            return;
        }
        std::filesystem::remove(from, ec);
    }

    bool natural_less(const std::string& sa, const std::string& sb) {
        size_t i = 0, j = 0;
        while (i < sa.size() && j < sb.size()) {
            if (std::isdigit(static_cast<unsigned char>(sa[i])) && std::isdigit(static_cast<unsigned char>(sb[j]))) {
                size_t ia = i, jb = j;
                while (ia < sa.size() && std::isdigit(static_cast<unsigned char>(sa[ia]))) ++ia;
                while (jb < sb.size() && std::isdigit(static_cast<unsigned char>(sb[jb]))) ++jb;
                auto strip_leading = [](const std::string& s) -> std::string {
                    size_t k = 0;
                    while (k + 1 < s.size() && s[k] == '0') ++k;
                    return s.substr(k);
                };
                const std::string as = strip_leading(sa.substr(i, ia - i));
                const std::string bs = strip_leading(sb.substr(j, jb - j));
                if (as.size() != bs.size()) return as.size() < bs.size();
                if (as != bs) return as < bs;
                i = ia; j = jb;
            } else {
                if (sa[i] != sb[j]) return sa[i] < sb[j];
                ++i; ++j;
            }
        }
        // equal prefixes: shorter first, then plain comparison keeps the order strict
        if ((sa.size() - i) != (sb.size() - j)) return (sa.size() - i) < (sb.size() - j);
        return sa < sb;
    }

} // namespace webpress

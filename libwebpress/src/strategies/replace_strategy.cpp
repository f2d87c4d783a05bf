//
// Created by Giuseppe Francione on 16/01/26.
//

#include "../../include/output_strategy.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <exception>

namespace fs = std::filesystem;

namespace webpress {

namespace {
constexpr std::string_view kTag = "ReplaceStrategy";
}

StrategyResult ReplaceStrategy::finalize(const FolderBatch& batch,
                                         const fs::path& temp_dir,
                                         const std::vector<fs::path>& converted_sources) {
    StrategyResult result;

    try {
        for (const auto& original : converted_sources) {
            std::error_code ec;
            // already gone is fine
            if (!fs::remove(original, ec) && ec) {
                const std::string msg = original.filename().string() + ": cannot delete original (" + ec.message() + ")";
                Logger::log(LogLevel::Error, msg, kTag);
                result.errors.push_back(msg);
            }
        }

        std::vector<fs::path> outputs;
        std::error_code ec;
        for (fs::directory_iterator it(temp_dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_regular_file(type_ec)) outputs.push_back(it->path());
        }
        if (ec) {
            const std::string msg = "Cannot list temporary outputs of " + batch.folder.filename().string() + " (" + ec.message() + ")";
            Logger::log(LogLevel::Error, msg, kTag);
            result.errors.push_back(msg);
        }
        std::sort(outputs.begin(), outputs.end(), [](const fs::path& a, const fs::path& b) {
            return natural_less(a.filename().string(), b.filename().string());
        });

        for (const auto& produced : outputs) {
            const fs::path dest = batch.folder / produced.filename();
            std::error_code move_ec;
            move_file(produced, dest, move_ec);
            if (move_ec) {
                const std::string msg = produced.filename().string() + ": cannot move into place (" + move_ec.message() + ")";
                Logger::log(LogLevel::Error, msg, kTag);
                result.errors.push_back(msg);
            } else {
                Logger::log(LogLevel::Debug, "Replaced with " + dest.string(), kTag);
            }
        }
    } catch (const std::exception& e) {
        const std::string msg = "Replace failed for " + batch.folder.filename().string() + ": " + e.what();
        Logger::log(LogLevel::Error, msg, kTag);
        result.errors.push_back(msg);
    }

    cleanup_temp_dir(temp_dir, kTag);
    return result;
}

std::unique_ptr<IOutputStrategy> make_output_strategy(const bool replace_originals, const ArchiveFormat format) {
    if (replace_originals) {
        return std::make_unique<ReplaceStrategy>();
    }
    return std::make_unique<ArchiveStrategy>(format);
}

} // namespace webpress

//
// Created by Giuseppe Francione on 14/01/26.
//

#include "../../include/summary.hpp"

namespace webpress {

RunTotals compute_totals(const std::vector<FolderSummary>& folders) {
    RunTotals totals;
    for (const auto& f : folders) {
        totals.converted += f.converted;
        totals.skipped_existing += f.skipped_existing;
        totals.errors += f.errors.size();
        totals.bytes_original += f.bytes_original;
        totals.bytes_converted += f.bytes_converted;
        if (f.archive_path) {
            ++totals.archives;
        }
    }
    totals.bytes_saved = saved_bytes(totals.bytes_original, totals.bytes_converted);
    return totals;
}

} // namespace webpress

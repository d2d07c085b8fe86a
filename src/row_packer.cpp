#include "peptigram/row_packer.hpp"

#include <cstdint>

namespace peptigram {

void validate_layout(const LayoutConfig& config) {
    if (config.max_rows < 1) {
        throw ConfigurationError("max_rows", config.max_rows, "must be >= 1");
    }
    if (config.min_gap < 0) {
        throw ConfigurationError("min_gap", config.min_gap, "must be >= 0");
    }
}

RowAssignment pack(const std::vector<Occurrence>& occurrences,
                   const LayoutConfig& config) {
    validate_layout(config);

    const size_t n_rows = static_cast<size_t>(config.max_rows);
    const int64_t gap = config.min_gap;

    RowAssignment result;
    result.rows.resize(n_rows);
    result.row_of.reserve(occurrences.size());

    // 0-based end of the last interval placed in each row; 0 = empty row
    std::vector<int64_t> row_end(n_rows, 0);

    for (const auto& occ : occurrences) {
        const int64_t start0 = static_cast<int64_t>(occ.start) - 1;
        const int64_t end0 = static_cast<int64_t>(occ.end) - 1;

        bool assigned = false;
        for (size_t r = 0; r < n_rows; ++r) {
            if (start0 > row_end[r] + gap) {
                result.rows[r].push_back(occ);
                result.row_of.push_back(static_cast<int>(r));
                row_end[r] = end0;
                assigned = true;
                break;
            }
        }
        if (assigned) continue;

        // Every row is busy here: overlap in the row that frees up first
        size_t best = 0;
        for (size_t r = 1; r < n_rows; ++r) {
            if (row_end[r] < row_end[best]) best = r;
        }
        result.rows[best].push_back(occ);
        result.row_of.push_back(static_cast<int>(best));
        if (end0 > row_end[best]) row_end[best] = end0;
        ++result.overflow_count;
    }

    return result;
}

}  // namespace peptigram

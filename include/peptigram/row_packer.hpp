#pragma once
// Greedy first-fit packing of occurrences into a fixed number of rows.
//
// An occurrence goes to the first row whose last interval ends more than
// min_gap residues before it. When no row qualifies it is forced into the
// row that frees up soonest, overlapping whatever is there. The row count
// never grows and no occurrence is dropped.

#include "peptigram/types.hpp"

#include <vector>

namespace peptigram {

// Throws ConfigurationError for max_rows < 1 or min_gap < 0.
void validate_layout(const LayoutConfig& config);

/**
 * Assign each occurrence to one of config.max_rows rows.
 * Occurrences are processed in the given order; pass the output of
 * aggregate() to get the intended packing.
 */
RowAssignment pack(const std::vector<Occurrence>& occurrences,
                   const LayoutConfig& config);

}  // namespace peptigram

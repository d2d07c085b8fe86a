#pragma once
// Approximate peptide search with a substitution-only mismatch budget.
//
// Every window of the protein with the peptide's length is compared position
// by position; windows whose Hamming distance is within the budget are
// reported. Insertions and deletions are not considered.

#include "peptigram/types.hpp"

#include <string>
#include <vector>

namespace peptigram {

/**
 * Number of positions at which two sequences differ.
 * Only the first min(a.size(), b.size()) positions are compared.
 */
int count_mismatches(const std::string& a, const std::string& b);

/**
 * Find every occurrence of `peptide` in `protein` with at most `budget`
 * substitutions.
 *
 * Results are ordered by ascending start. Overlapping windows are all kept.
 * A peptide longer than the protein (or an empty peptide) yields no
 * occurrences. Throws ConfigurationError if budget < 0.
 */
std::vector<Occurrence> find_occurrences(const std::string& peptide,
                                         const std::string& protein,
                                         int budget);

}  // namespace peptigram

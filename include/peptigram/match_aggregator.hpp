#pragma once

#include "peptigram/types.hpp"

#include <string>
#include <vector>

namespace peptigram {

// Ordering used for row packing: start ascending, then shorter span first.
// Equal keys keep their relative order (stable sort).
bool occurrence_before(const Occurrence& a, const Occurrence& b);

/**
 * Search every peptide against one protein and merge the hits.
 *
 * The merged list is sorted with occurrence_before(). Nothing is
 * deduplicated: two peptides covering the same span both appear.
 * Throws ConfigurationError if budget < 0, before any peptide is searched.
 */
std::vector<Occurrence> aggregate(const std::vector<std::string>& peptides,
                                  const std::string& protein,
                                  int budget);

}  // namespace peptigram

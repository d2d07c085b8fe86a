#pragma once
// Per-protein mapping pipeline: aggregate() followed by pack().

#include "peptigram/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace peptigram {

// Called after each protein with (index, total, layout)
using MappingProgressFn =
    std::function<void(size_t index, size_t total, const ProteinLayout& layout)>;

/**
 * Check all run parameters. Throws ConfigurationError naming the first
 * invalid one (budget, max_rows, min_gap).
 */
void validate_config(int budget, const LayoutConfig& layout);

// Map every peptide against one protein and pack the hits into rows.
ProteinLayout map_protein(const ProteinSequence& protein,
                          const std::vector<std::string>& peptides,
                          int budget,
                          const LayoutConfig& layout);

/**
 * Map a batch of proteins in input order.
 * Parameters are validated once before any protein is searched.
 */
std::vector<ProteinLayout> map_proteins(const std::vector<ProteinSequence>& proteins,
                                        const std::vector<std::string>& peptides,
                                        int budget,
                                        const LayoutConfig& layout,
                                        const MappingProgressFn& progress = nullptr);

}  // namespace peptigram

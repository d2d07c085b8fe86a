#pragma once
// Output of mapping results: per-occurrence TSV table and JSON run summary.

#include "peptigram/types.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace peptigram {

// Run parameters and input sizes reported in the summary
struct RunInfo {
    int budget = 0;
    LayoutConfig layout;
    size_t n_peptides = 0;
};

// Plot label of an occurrence: "PEPTIDE (1 mut) [12-20]"
std::string occurrence_label(const Occurrence& occ);

/**
 * One line per occurrence:
 *   protein, peptide, start, end, mismatches, matched, row, label
 * Proteins without occurrences produce no lines.
 */
void write_layout_tsv(std::ostream& out, const std::vector<ProteinLayout>& layouts);

// JSON summary of parameters, totals and per-protein row usage
void write_layout_json(std::ostream& out,
                       const std::vector<ProteinLayout>& layouts,
                       const RunInfo& run);

/**
 * Write the TSV table to a file; ".gz" paths are gzip-compressed.
 * Throws std::runtime_error if the file cannot be written.
 */
void write_layout_file(const std::string& path, const std::vector<ProteinLayout>& layouts);

// Write the JSON summary to a file. Throws std::runtime_error on failure.
void write_summary_file(const std::string& path,
                        const std::vector<ProteinLayout>& layouts,
                        const RunInfo& run);

}  // namespace peptigram

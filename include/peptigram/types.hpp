#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace peptigram {

// Basic sequence types
using Sequence = std::string;
using Position = uint32_t;

/**
 * Protein sequence as supplied by the input adapter.
 * Residues are expected to be uppercase amino-acid letters; the core only
 * compares characters and never validates the alphabet.
 */
struct ProteinSequence {
    std::string id;
    Sequence residues;
};

/**
 * One approximate match of a peptide inside a protein.
 * Positions are 1-based and inclusive: end = start + peptide.size() - 1.
 */
struct Occurrence {
    std::string peptide;
    Position start = 0;
    Position end = 0;
    int mismatches = 0;
    std::string matched_text;

    Position length() const { return end - start + 1; }
    bool is_exact() const { return mismatches == 0; }
};

// Row layout parameters
struct LayoutConfig {
    int max_rows = 2;   // number of display rows, must be >= 1
    int min_gap = 10;   // residues required between neighbours in one row
};

/**
 * Occurrences distributed over exactly max_rows rows.
 * Each row keeps its occurrences in the order they were assigned, which is
 * ascending start for input produced by aggregate().
 */
struct RowAssignment {
    std::vector<std::vector<Occurrence>> rows;
    std::vector<int> row_of;    // row chosen for each input occurrence, input order
    size_t overflow_count = 0;  // placements that ignored the gap rule

    size_t num_rows() const { return rows.size(); }

    size_t total() const {
        size_t n = 0;
        for (const auto& row : rows) n += row.size();
        return n;
    }

    size_t rows_used() const {
        size_t n = 0;
        for (const auto& row : rows) {
            if (!row.empty()) ++n;
        }
        return n;
    }
};

// Per-protein output of the mapping pipeline
struct ProteinLayout {
    std::string protein_id;
    size_t protein_length = 0;
    std::vector<Occurrence> occurrences;  // aggregated order
    RowAssignment assignment;
};

/**
 * Invalid run parameter (negative mismatch budget, non-positive row count,
 * negative gap). Raised before any matching or packing work starts.
 */
class ConfigurationError : public std::invalid_argument {
public:
    ConfigurationError(const std::string& parameter, long long value,
                       const std::string& requirement)
        : std::invalid_argument("Invalid " + parameter + " = " + std::to_string(value) +
                                " (" + requirement + ")"),
          parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

}  // namespace peptigram

#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>

namespace peptigram {

/**
 * Sequence record from a FASTA file
 */
struct SequenceRecord {
    std::string id;
    std::string description;
    std::string sequence;
};

/**
 * FASTA file reader
 *
 * Supports:
 * - Uncompressed and gzip-compressed files
 * - Multi-line sequences (whitespace and CR stripped)
 * - Iterator-based and callback-based processing
 */
class SequenceReader {
public:
    /**
     * Open a FASTA file
     * Throws std::runtime_error if the file cannot be opened
     */
    explicit SequenceReader(const std::string& filename);
    ~SequenceReader();

    /**
     * Read next sequence
     * Returns false when end of file is reached
     */
    bool read_next(SequenceRecord& record);

    /**
     * Process all sequences with a callback
     */
    void for_each(std::function<void(const SequenceRecord&)> callback);

    /**
     * Read all sequences into memory
     */
    std::vector<SequenceRecord> read_all();

    bool is_open() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Load proteins from FASTA as an id -> sequence mapping in file order.
 * A repeated id keeps its first position and takes the later sequence.
 */
std::vector<ProteinSequence> load_proteins(const std::string& fasta_file);

/**
 * Read peptides, one per line (plain or gzip).
 * Surrounding whitespace is stripped and blank lines are skipped.
 */
std::vector<std::string> read_peptides(const std::string& peptides_file);

/**
 * Sequence utilities
 */
class SequenceUtils {
public:
    // Strip leading and trailing whitespace
    static std::string trim(const std::string& s);

    // Remove all whitespace (including CR) from a sequence line
    static std::string strip_whitespace(const std::string& seq);
};

} // namespace peptigram

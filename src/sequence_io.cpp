#include "peptigram/sequence_io.hpp"
#include "peptigram/gz_reader_base.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <zlib.h>

namespace peptigram {

namespace {

bool has_gz_suffix(const std::string& filename) {
    return filename.size() > 3 &&
           filename.compare(filename.size() - 3, 3, ".gz") == 0;
}

// Line source over a plain file, a zlib stream or the rapidgzip backend
class LineSource {
public:
    bool open(const std::string& filename) {
        if (has_gz_suffix(filename) || is_gzip_file(filename)) {
            is_gzipped_ = true;

            // Parallel decompression when built with rapidgzip
            gz_reader_ = make_gz_reader(filename);
            if (gz_reader_) return true;

            // Fallback to zlib
            gz_file_ = gzopen(filename.c_str(), "rb");
            if (!gz_file_) return false;
            gzbuffer(gz_file_, GzLineReader::GZBUF_SIZE);
            return true;
        }

        file_.open(filename);
        return static_cast<bool>(file_);
    }

    // Read one line without the trailing newline
    bool getline(std::string& line) {
        if (!is_gzipped_) {
            return static_cast<bool>(std::getline(file_, line));
        }
        if (gz_reader_) {
            return gz_reader_->readline(line);
        }

        // gzgets splits lines longer than the buffer; keep reading until '\n'
        line.clear();
        bool got_any = false;
        while (gzgets(gz_file_, buffer_, sizeof(buffer_))) {
            got_any = true;
            size_t len = strlen(buffer_);
            if (len > 0 && buffer_[len - 1] == '\n') {
                line.append(buffer_, len - 1);
                return true;
            }
            line.append(buffer_, len);
        }
        return got_any;
    }

    bool is_open() const {
        if (is_gzipped_) return gz_reader_ != nullptr || gz_file_ != nullptr;
        return file_.is_open();
    }

    void close() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        gz_reader_.reset();
        if (file_.is_open()) file_.close();
    }

    ~LineSource() {
        close();
    }

private:
    std::ifstream file_;
    gzFile gz_file_ = nullptr;
    std::unique_ptr<GzLineReader> gz_reader_;
    bool is_gzipped_ = false;
    char buffer_[65536];
};

}  // namespace

// SequenceReader implementation
class SequenceReader::Impl {
public:
    LineSource source_;
    std::string lookahead_line_;  // Header of the next record
    bool has_lookahead_ = false;
};

SequenceReader::SequenceReader(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    if (!impl_->source_.open(filename)) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
}

SequenceReader::~SequenceReader() = default;

bool SequenceReader::read_next(SequenceRecord& record) {
    std::string line;

    if (impl_->has_lookahead_) {
        line = std::move(impl_->lookahead_line_);
        impl_->has_lookahead_ = false;
    } else {
        // Skip anything before the first header
        do {
            if (!impl_->source_.getline(line)) return false;
        } while (line.empty() || line[0] != '>');
    }

    // Header: id up to first whitespace, remainder is the description
    std::string header = SequenceUtils::trim(line.substr(1));
    auto ws = std::find_if(header.begin(), header.end(),
                           [](unsigned char c) { return std::isspace(c); });
    record.id.assign(header.begin(), ws);
    record.description = SequenceUtils::trim(std::string(ws, header.end()));

    // Sequence lines until next header or EOF
    record.sequence.clear();
    while (impl_->source_.getline(line)) {
        if (line.empty()) continue;
        if (line[0] == '>') {
            impl_->lookahead_line_ = std::move(line);
            impl_->has_lookahead_ = true;
            break;
        }
        record.sequence += SequenceUtils::strip_whitespace(line);
    }

    return true;
}

void SequenceReader::for_each(std::function<void(const SequenceRecord&)> callback) {
    SequenceRecord record;
    while (read_next(record)) {
        callback(record);
    }
}

std::vector<SequenceRecord> SequenceReader::read_all() {
    std::vector<SequenceRecord> records;
    SequenceRecord record;
    while (read_next(record)) {
        records.push_back(record);
    }
    return records;
}

bool SequenceReader::is_open() const {
    return impl_->source_.is_open();
}

std::vector<ProteinSequence> load_proteins(const std::string& fasta_file) {
    std::vector<ProteinSequence> proteins;
    std::unordered_map<std::string, size_t> index;

    SequenceReader reader(fasta_file);
    reader.for_each([&](const SequenceRecord& rec) {
        auto it = index.find(rec.id);
        if (it != index.end()) {
            proteins[it->second].residues = rec.sequence;
            return;
        }
        index.emplace(rec.id, proteins.size());
        proteins.push_back({rec.id, rec.sequence});
    });

    return proteins;
}

std::vector<std::string> read_peptides(const std::string& peptides_file) {
    LineSource source;
    if (!source.open(peptides_file)) {
        throw std::runtime_error("Failed to open file: " + peptides_file);
    }

    std::vector<std::string> peptides;
    std::string line;
    while (source.getline(line)) {
        std::string peptide = SequenceUtils::trim(line);
        if (!peptide.empty()) peptides.push_back(std::move(peptide));
    }
    return peptides;
}

std::string SequenceUtils::trim(const std::string& s) {
    size_t first = 0;
    size_t last = s.size();
    while (first < last && std::isspace(static_cast<unsigned char>(s[first]))) ++first;
    while (last > first && std::isspace(static_cast<unsigned char>(s[last - 1]))) --last;
    return s.substr(first, last - first);
}

std::string SequenceUtils::strip_whitespace(const std::string& seq) {
    // Fast-path: most sequence lines have nothing to strip
    bool needs_cleaning = false;
    for (char c : seq) {
        if (c <= ' ') {
            needs_cleaning = true;
            break;
        }
    }
    if (!needs_cleaning) {
        return seq;
    }

    std::string cleaned;
    cleaned.reserve(seq.length());
    for (char c : seq) {
        if (c <= ' ') continue;
        cleaned += c;
    }
    return cleaned;
}

} // namespace peptigram

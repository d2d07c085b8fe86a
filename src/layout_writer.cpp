#include "peptigram/layout_writer.hpp"

#include <cstdio>
#include <fstream>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <zlib.h>

namespace peptigram {

static std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string occurrence_label(const Occurrence& occ) {
    std::string label = occ.peptide;
    if (occ.mismatches > 0) {
        label += " (" + std::to_string(occ.mismatches) + " mut)";
    }
    label += " [" + std::to_string(occ.start) + "-" + std::to_string(occ.end) + "]";
    return label;
}

void write_layout_tsv(std::ostream& out, const std::vector<ProteinLayout>& layouts) {
    out << "protein\tpeptide\tstart\tend\tmismatches\tmatched\trow\tlabel\n";

    for (const auto& layout : layouts) {
        const auto& row_of = layout.assignment.row_of;
        for (size_t i = 0; i < layout.occurrences.size(); ++i) {
            const auto& occ = layout.occurrences[i];
            out << layout.protein_id
                << '\t' << occ.peptide
                << '\t' << occ.start
                << '\t' << occ.end
                << '\t' << occ.mismatches
                << '\t' << occ.matched_text
                << '\t' << (i < row_of.size() ? row_of[i] : -1)
                << '\t' << occurrence_label(occ)
                << '\n';
        }
    }
}

void write_layout_json(std::ostream& out,
                       const std::vector<ProteinLayout>& layouts,
                       const RunInfo& run) {
    uint64_t total = 0;
    uint64_t exact = 0;
    uint64_t overflow = 0;
    uint32_t with_matches = 0;

    for (const auto& layout : layouts) {
        total += layout.occurrences.size();
        overflow += layout.assignment.overflow_count;
        if (!layout.occurrences.empty()) ++with_matches;
        for (const auto& occ : layout.occurrences) {
            if (occ.is_exact()) ++exact;
        }
    }

    out << "{\n";
    out << "  \"parameters\": {\n";
    out << "    \"mutations\": " << run.budget << ",\n";
    out << "    \"max_rows\": " << run.layout.max_rows << ",\n";
    out << "    \"min_gap\": " << run.layout.min_gap << "\n";
    out << "  },\n";
    out << "  \"inputs\": {\n";
    out << "    \"proteins\": " << layouts.size() << ",\n";
    out << "    \"peptides\": " << run.n_peptides << "\n";
    out << "  },\n";
    out << "  \"occurrences\": {\n";
    out << "    \"total\": " << total << ",\n";
    out << "    \"exact\": " << exact << ",\n";
    out << "    \"with_mutations\": " << (total - exact) << ",\n";
    out << "    \"overflow\": " << overflow << ",\n";
    out << "    \"proteins_with_matches\": " << with_matches << "\n";
    out << "  },\n";
    out << "  \"proteins\": [";

    for (size_t i = 0; i < layouts.size(); ++i) {
        const auto& layout = layouts[i];
        out << (i == 0 ? "\n" : ",\n");
        out << "    {\"id\": \"" << json_escape(layout.protein_id) << "\""
            << ", \"length\": " << layout.protein_length
            << ", \"occurrences\": " << layout.occurrences.size()
            << ", \"rows_used\": " << layout.assignment.rows_used()
            << ", \"overflow\": " << layout.assignment.overflow_count
            << "}";
    }
    out << (layouts.empty() ? "]\n" : "\n  ]\n");
    out << "}\n";
}

void write_layout_file(const std::string& path, const std::vector<ProteinLayout>& layouts) {
    const bool want_gzip = path.size() > 3 &&
                           path.compare(path.size() - 3, 3, ".gz") == 0;

    if (!want_gzip) {
        std::ofstream out(path);
        if (!out) {
            throw std::runtime_error("Failed to open file: " + path);
        }
        write_layout_tsv(out, layouts);
        if (!out) {
            throw std::runtime_error("Failed to write file: " + path);
        }
        return;
    }

    std::ostringstream oss;
    write_layout_tsv(oss, layouts);
    const std::string output_str = oss.str();

    gzFile gz = gzopen(path.c_str(), "wb");
    if (!gz) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    const int written = output_str.empty()
        ? 0 : gzwrite(gz, output_str.data(), static_cast<unsigned>(output_str.size()));
    const int rc = gzclose(gz);
    if (static_cast<size_t>(written) != output_str.size() || rc != Z_OK) {
        throw std::runtime_error("Failed to write file: " + path);
    }
}

void write_summary_file(const std::string& path,
                        const std::vector<ProteinLayout>& layouts,
                        const RunInfo& run) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    write_layout_json(out, layouts, run);
    if (!out) {
        throw std::runtime_error("Failed to write file: " + path);
    }
}

}  // namespace peptigram

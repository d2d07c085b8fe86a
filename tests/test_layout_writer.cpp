// Unit tests for layout TSV and JSON summary output

#include "peptigram/layout_writer.hpp"
#include "peptigram/peptide_mapper.hpp"
#include <cassert>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <zlib.h>

using peptigram::LayoutConfig;
using peptigram::ProteinLayout;
using peptigram::ProteinSequence;

static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

static std::vector<ProteinLayout> sample_layouts() {
    std::vector<ProteinSequence> proteins = {
        {"P1", "MKVLATGAAAAAAAAAAAAAAKVLAT"},
        {"P2", "WWWWWWWW"},
    };
    return peptigram::map_proteins(proteins, {"KVL", "KVI"}, 1, LayoutConfig{});
}

void test_occurrence_label() {
    std::cout << "Testing occurrence label... ";
    peptigram::Occurrence occ;
    occ.peptide = "KVI";
    occ.start = 2;
    occ.end = 4;
    occ.mismatches = 1;
    assert(peptigram::occurrence_label(occ) == "KVI (1 mut) [2-4]");
    occ.mismatches = 0;
    assert(peptigram::occurrence_label(occ) == "KVI [2-4]");
    std::cout << "PASSED\n";
}

void test_write_tsv() {
    std::cout << "Testing TSV output... ";
    auto layouts = sample_layouts();
    std::ostringstream out;
    peptigram::write_layout_tsv(out, layouts);
    auto lines = split_lines(out.str());

    // header + KVL/KVI at 2 and at 22; P2 has no matches
    assert(lines.size() == 5);
    assert(lines[0] == "protein\tpeptide\tstart\tend\tmismatches\tmatched\trow\tlabel");
    assert(lines[1] == "P1\tKVL\t2\t4\t0\tKVL\t0\tKVL [2-4]");
    assert(lines[2] == "P1\tKVI\t2\t4\t1\tKVL\t1\tKVI (1 mut) [2-4]");
    assert(lines[3].rfind("P1\tKVL\t22\t24\t0\tKVL\t0\t", 0) == 0);
    assert(lines[4].rfind("P1\tKVI\t22\t24\t1\tKVL\t1\t", 0) == 0);
    std::cout << "PASSED\n";
}

void test_write_json() {
    std::cout << "Testing JSON summary... ";
    auto layouts = sample_layouts();
    peptigram::RunInfo run;
    run.budget = 1;
    run.n_peptides = 2;

    std::ostringstream out;
    peptigram::write_layout_json(out, layouts, run);
    const std::string json = out.str();
    assert(json.find("\"mutations\": 1") != std::string::npos);
    assert(json.find("\"max_rows\": 2") != std::string::npos);
    assert(json.find("\"min_gap\": 10") != std::string::npos);
    assert(json.find("\"proteins\": 2") != std::string::npos);
    assert(json.find("\"total\": 4") != std::string::npos);
    assert(json.find("\"exact\": 2") != std::string::npos);
    assert(json.find("\"with_mutations\": 2") != std::string::npos);
    assert(json.find("\"proteins_with_matches\": 1") != std::string::npos);
    assert(json.find("{\"id\": \"P2\", \"length\": 8, \"occurrences\": 0") != std::string::npos);
    std::cout << "PASSED\n";
}

void test_json_escapes_ids() {
    std::cout << "Testing JSON escaping... ";
    ProteinLayout layout;
    layout.protein_id = "odd\"id\\x";
    layout.assignment.rows.resize(2);
    std::ostringstream out;
    peptigram::write_layout_json(out, {layout}, peptigram::RunInfo{});
    assert(out.str().find("\"odd\\\"id\\\\x\"") != std::string::npos);
    std::cout << "PASSED\n";
}

void test_write_gzip_file(const std::string& tmpdir) {
    std::cout << "Testing gzip layout file... ";
    auto layouts = sample_layouts();
    const std::string path = tmpdir + "/layout.tsv.gz";
    peptigram::write_layout_file(path, layouts);

    gzFile gz = gzopen(path.c_str(), "rb");
    assert(gz != nullptr);
    std::string content;
    char buf[4096];
    int n;
    while ((n = gzread(gz, buf, sizeof(buf))) > 0) content.append(buf, n);
    gzclose(gz);

    std::ostringstream expected;
    peptigram::write_layout_tsv(expected, layouts);
    assert(content == expected.str());
    std::cout << "PASSED\n";
}

void test_unwritable_path() {
    std::cout << "Testing unwritable output... ";
    bool threw = false;
    try {
        peptigram::write_layout_file("/nonexistent_dir/peptigram/out.tsv", sample_layouts());
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("out.tsv") != std::string::npos;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

int main() {
    char tmp_template[] = "/tmp/peptigram_out_XXXXXX";
    char* tmp = mkdtemp(tmp_template);
    if (!tmp) {
        std::cerr << "Failed to create temp dir\n";
        return 2;
    }
    const std::string tmpdir = tmp;

    std::cout << "=== LayoutWriter Tests ===\n";
    test_occurrence_label();
    test_write_tsv();
    test_write_json();
    test_json_escapes_ids();
    test_write_gzip_file(tmpdir);
    test_unwritable_path();
    std::cout << "All tests passed.\n";

    std::string cleanup = "rm -rf '" + tmpdir + "'";
    if (std::system(cleanup.c_str()) != 0) {
        std::cerr << "Warning: could not remove " << tmpdir << "\n";
    }
    return 0;
}

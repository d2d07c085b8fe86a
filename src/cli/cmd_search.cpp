// peptigram search: raw matches of a single peptide
//
// Prints every window within the mismatch budget as TSV on stdout, without
// row packing. The target is either a FASTA file or one literal sequence.

#include "subcommand.hpp"
#include "peptigram/sequence_io.hpp"
#include "peptigram/sequence_matcher.hpp"
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace peptigram {
namespace cli {

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " --peptide SEQ (--fasta FILE | --protein SEQ) [options]\n\n"
              << "List every match of one peptide, allowing substitutions.\n\n"
              << "Required:\n"
              << "  --peptide SEQ          Peptide to search for\n"
              << "  --fasta FILE           Protein FASTA file (gzipped supported)\n"
              << "  --protein SEQ          Single protein sequence instead of --fasta\n\n"
              << "Options:\n"
              << "  --mutations N          Substitutions allowed (default: 0)\n"
              << "  -h, --help             Show this help\n\n"
              << "Output columns:\n"
              << "  protein, start, end, mismatches, matched\n";
}

int cmd_search(int argc, char* argv[]) {
    std::string peptide;
    std::string fasta_file;
    std::string protein_seq;
    int mutations = 0;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--peptide") == 0 && i + 1 < argc) {
            peptide = SequenceUtils::trim(argv[++i]);
        } else if (strcmp(argv[i], "--fasta") == 0 && i + 1 < argc) {
            fasta_file = argv[++i];
        } else if (strcmp(argv[i], "--protein") == 0 && i + 1 < argc) {
            protein_seq = SequenceUtils::strip_whitespace(argv[++i]);
        } else if (strcmp(argv[i], "--mutations") == 0 && i + 1 < argc) {
            try {
                mutations = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid integer for --mutations: " << argv[i] << "\n";
                return 1;
            }
            if (mutations < 0) {
                std::cerr << "Error: --mutations must be >= 0\n";
                return 1;
            }
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            std::cerr << "Run 'peptigram search --help' for usage.\n";
            return 1;
        } else {
            std::cerr << "Unexpected positional argument: " << argv[i] << "\n";
            std::cerr << "Run 'peptigram search --help' for usage.\n";
            return 1;
        }
    }

    if (peptide.empty() || (fasta_file.empty() == protein_seq.empty())) {
        std::cerr << "Error: --peptide and exactly one of --fasta or --protein are required.\n";
        std::cerr << "Run 'peptigram search --help' for usage.\n";
        return 1;
    }

    try {
        std::vector<ProteinSequence> proteins;
        if (!fasta_file.empty()) {
            proteins = load_proteins(fasta_file);
        } else {
            proteins.push_back({"query", protein_seq});
        }

        size_t n_hits = 0;
        std::cout << "protein\tstart\tend\tmismatches\tmatched\n";
        for (const auto& protein : proteins) {
            for (const auto& occ : find_occurrences(peptide, protein.residues, mutations)) {
                std::cout << protein.id << '\t' << occ.start << '\t' << occ.end
                          << '\t' << occ.mismatches << '\t' << occ.matched_text << '\n';
                ++n_hits;
            }
        }
        std::cout.flush();
        std::cerr << "Found " << n_hits << " matches in " << proteins.size()
                  << " proteins" << std::endl;
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

// Register subcommand
static struct SearchRegistrar {
    SearchRegistrar() {
        SubcommandRegistry::instance().register_command(
            "search",
            "List raw matches of a single peptide",
            cmd_search,
            2
        );
    }
} search_registrar;

}  // namespace cli
}  // namespace peptigram

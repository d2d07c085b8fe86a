#include "args.hpp"
#include "peptigram/version.h"
#include <iostream>
#include <string>

namespace peptigram {
namespace cli {

void print_version() {
    std::cout << "peptigram " << PEPTIGRAM_VERSION << "\n";
}

void print_usage(const char* program_name) {
    std::cout << "peptigram v" << PEPTIGRAM_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " --fasta <file> --peptides <file> [options]\n\n";
    std::cout << "Map peptides onto their source proteins and lay the matches out in rows.\n\n";
    std::cout << "Required:\n";
    std::cout << "  --fasta <file>           Protein sequences FASTA file (or .gz)\n";
    std::cout << "  --peptides <file>        Peptides text file, one per line (or .gz)\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --mutations <int>        Substitutions allowed per match (default: 0)\n";
    std::cout << "  --max-rows <int>         Number of display rows (default: 2)\n";
    std::cout << "  --min-gap <int>          Residues between peptides in one row (default: 10)\n";
    std::cout << "  -o, --output <file>      Output layout TSV (default: peptide_layout.tsv)\n";
    std::cout << "  --summary <file>         Output run summary (JSON format)\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -V, --version            Show version and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " --fasta proteins.fa --peptides peptides.txt\n";
    std::cout << "  " << program_name << " --fasta proteins.fa.gz --peptides peptides.txt"
              << " --mutations 1 -o layout.tsv.gz --summary run.json\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            try {
                size_t idx = 0;
                int parsed = std::stoi(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const std::invalid_argument&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            } catch (const std::out_of_range&) {
                throw ParseArgsExit(1, "Error: Integer out of range for " + flag + ": " + value);
            }
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "--fasta") {
            opts.fasta_file = require_value(arg);
        } else if (arg == "--peptides") {
            opts.peptides_file = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(arg);
        } else if (arg == "--summary") {
            opts.summary_file = require_value(arg);
        } else if (arg == "--mutations") {
            opts.mutations = parse_int(arg, require_value(arg));
            if (opts.mutations < 0) {
                throw ParseArgsExit(1, "Error: --mutations must be >= 0");
            }
        } else if (arg == "--max-rows") {
            opts.max_rows = parse_int(arg, require_value(arg));
            if (opts.max_rows < 1) {
                throw ParseArgsExit(1, "Error: --max-rows must be >= 1");
            }
        } else if (arg == "--min-gap") {
            opts.min_gap = parse_int(arg, require_value(arg));
            if (opts.min_gap < 0) {
                throw ParseArgsExit(1, "Error: --min-gap must be >= 0");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.fasta_file.empty()) {
        throw ParseArgsExit(1, "Error: No FASTA file specified (--fasta)");
    }
    if (opts.peptides_file.empty()) {
        throw ParseArgsExit(1, "Error: No peptides file specified (--peptides)");
    }

    return opts;
}

}  // namespace cli
}  // namespace peptigram

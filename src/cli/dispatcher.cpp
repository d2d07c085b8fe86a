// Main entry point for peptigram CLI with subcommand dispatch
//
// Usage:
//   peptigram map --fasta <proteins.fa> --peptides <peptides.txt>   Full layout
//   peptigram search --peptide <SEQ> --fasta <proteins.fa>          Raw matches

#include "subcommand.hpp"
#include "peptigram/version.h"
#include <iostream>
#include <cstring>

int main(int argc, char* argv[]) {
    auto& registry = peptigram::cli::SubcommandRegistry::instance();

    // Handle no arguments
    if (argc < 2) {
        registry.print_help(argv[0]);
        return 1;
    }

    const char* first_arg = argv[1];

    // Handle --help and --version at top level
    if (strcmp(first_arg, "--help") == 0 || strcmp(first_arg, "-h") == 0) {
        registry.print_help(argv[0]);
        return 0;
    }

    if (strcmp(first_arg, "--version") == 0 || strcmp(first_arg, "-V") == 0) {
        std::cout << "peptigram " << PEPTIGRAM_VERSION << "\n";
        return 0;
    }

    // Dispatch to subcommand
    return registry.run_command(first_arg, argc - 1, argv + 1);
}

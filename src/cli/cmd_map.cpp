// peptigram map: peptide distribution across proteins
//
// Reads proteins (FASTA) and peptides (one per line), finds every match of
// every peptide with up to --mutations substitutions, packs the matches of
// each protein into --max-rows display rows and writes the layout table.

#include "subcommand.hpp"
#include "args.hpp"
#include "peptigram/layout_writer.hpp"
#include "peptigram/log_utils.hpp"
#include "peptigram/peptide_mapper.hpp"
#include "peptigram/sequence_io.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace peptigram {
namespace cli {

static int run_map(const Options& opts) {
    log_utils::StepTimer total_timer("Total");

    LayoutConfig layout;
    layout.max_rows = opts.max_rows;
    layout.min_gap = opts.min_gap;
    validate_config(opts.mutations, layout);

    // Step 1: load inputs
    log_utils::StepTimer load_timer("Step 1");
    std::vector<ProteinSequence> proteins = load_proteins(opts.fasta_file);
    std::vector<std::string> peptides = read_peptides(opts.peptides_file);

    std::cerr << "Loaded " << proteins.size() << " proteins and "
              << peptides.size() << " peptides" << std::endl;
    std::cerr << "Searching with " << opts.mutations << " mutations allowed" << std::endl;
    if (opts.verbose) load_timer.report(std::cerr);

    // Step 2: search and pack each protein
    log_utils::StepTimer map_timer("Step 2");
    size_t total_matches = 0;
    auto progress = [&](size_t, size_t, const ProteinLayout& pl) {
        std::cerr << "Processing " << pl.protein_id << " (" << pl.protein_length << " aa)\n";
        std::cerr << "  Found " << pl.occurrences.size() << " peptide matches" << std::endl;
        if (opts.verbose && !pl.occurrences.empty()) {
            std::cerr << "  Rows used: " << pl.assignment.rows_used() << "/"
                      << pl.assignment.num_rows()
                      << ", overflow placements: " << pl.assignment.overflow_count << std::endl;
        }
        total_matches += pl.occurrences.size();
    };
    std::vector<ProteinLayout> layouts =
        map_proteins(proteins, peptides, opts.mutations, layout, progress);
    if (opts.verbose) map_timer.report(std::cerr);

    // Step 3: write output
    log_utils::StepTimer write_timer("Step 3");
    write_layout_file(opts.output_file, layouts);
    std::cerr << "Saved layout of " << total_matches << " matches to "
              << opts.output_file << std::endl;

    if (!opts.summary_file.empty()) {
        RunInfo run;
        run.budget = opts.mutations;
        run.layout = layout;
        run.n_peptides = peptides.size();
        write_summary_file(opts.summary_file, layouts, run);
        std::cerr << "Saved summary to " << opts.summary_file << std::endl;
    }
    if (opts.verbose) write_timer.report(std::cerr);

    std::cerr << "Done!" << std::endl;
    total_timer.report(std::cerr);
    return 0;
}

int cmd_map(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.exit_code() != 0) {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'peptigram map --help' for usage.\n";
        }
        return e.exit_code();
    }

    try {
        return run_map(opts);
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

// Register subcommand
static struct MapRegistrar {
    MapRegistrar() {
        SubcommandRegistry::instance().register_command(
            "map",
            "Map peptides to proteins and pack matches into rows",
            cmd_map,
            1
        );
    }
} map_registrar;

}  // namespace cli
}  // namespace peptigram

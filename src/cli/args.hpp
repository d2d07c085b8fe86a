#ifndef PEPTIGRAM_CLI_ARGS_HPP
#define PEPTIGRAM_CLI_ARGS_HPP

#include <stdexcept>
#include <string>

namespace peptigram {
namespace cli {

// Thrown by parse_args() instead of exiting.
// exit_code 0 for --help/--version, 1 for errors (message is the error text).
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int exit_code, const std::string& message = "")
        : std::runtime_error(message), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

// Options of the `map` subcommand
struct Options {
    std::string fasta_file;
    std::string peptides_file;
    std::string output_file = "peptide_layout.tsv";  // .gz for compressed output
    std::string summary_file;      // JSON summary, optional
    int mutations = 0;             // substitutions allowed per match
    int max_rows = 2;
    int min_gap = 10;              // residues between peptides sharing a row
    bool verbose = false;
};

// Print version string to stdout
void print_version();

// Print usage/help to stdout
void print_usage(const char* program_name);

// Parse command-line arguments into Options struct
// Throws ParseArgsExit(0) for --help/--version
// Throws ParseArgsExit(1, message) for errors (missing inputs, unknown options,
// out-of-range values)
Options parse_args(int argc, char* argv[]);

}  // namespace cli
}  // namespace peptigram

#endif  // PEPTIGRAM_CLI_ARGS_HPP

#ifndef PEPTIGRAM_CLI_SUBCOMMAND_HPP
#define PEPTIGRAM_CLI_SUBCOMMAND_HPP

#include <string>
#include <vector>
#include <functional>
#include <unordered_map>

namespace peptigram {
namespace cli {

// Subcommand handler function type
using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Registry of available subcommands
class SubcommandRegistry {
public:
    struct CommandEntry {
        std::string name;
        std::string description;
        int order;
    };

    static SubcommandRegistry& instance();

    // Re-registering a name replaces its handler but keeps its help entry
    void register_command(const std::string& name,
                         const std::string& description,
                         SubcommandFn fn,
                         int order = 99);

    int run_command(const std::string& name, int argc, char* argv[]) const;

    // Command table for top-level --help, sorted by `order`
    void print_help(const char* program_name) const;

private:
    SubcommandRegistry() = default;
    std::unordered_map<std::string, SubcommandFn> handlers_;
    std::vector<CommandEntry> command_list_;
};

// Subcommand entry points
int cmd_map(int argc, char* argv[]);
int cmd_search(int argc, char* argv[]);

}  // namespace cli
}  // namespace peptigram

#endif  // PEPTIGRAM_CLI_SUBCOMMAND_HPP

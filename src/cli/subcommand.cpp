#include "subcommand.hpp"
#include "peptigram/version.h"
#include <iostream>
#include <algorithm>
#include <utility>

namespace peptigram {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn,
                                          int order) {
    if (handlers_.find(name) == handlers_.end()) {
        command_list_.push_back({name, description, order});
    }
    handlers_[name] = std::move(fn);
}

int SubcommandRegistry::run_command(const std::string& name, int argc, char* argv[]) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        std::cerr << "Unknown command: " << name << "\n";
        std::cerr << "Run 'peptigram --help' for usage information.\n";
        return 1;
    }
    return it->second(argc, argv);
}

void SubcommandRegistry::print_help(const char* program_name) const {
    std::cout << "peptigram v" << PEPTIGRAM_VERSION << "\n";
    std::cout << "Peptide distribution across proteins\n\n";
    std::cout << "Usage: " << program_name << " <command> [options]\n\n";
    std::cout << "Commands:\n";

    // Sort by workflow order
    auto sorted = command_list_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const CommandEntry& a, const CommandEntry& b) {
                         return a.order < b.order;
                     });

    size_t max_len = 0;
    for (const auto& cmd : sorted) {
        max_len = std::max(max_len, cmd.name.length());
    }

    for (const auto& cmd : sorted) {
        std::cout << "  " << cmd.name
                  << std::string(max_len + 2 - cmd.name.length(), ' ')
                  << cmd.description << "\n";
    }

    std::cout << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace cli
}  // namespace peptigram

#include <iostream>
#include <optional>
#include <stdexcept>
#include <vector>
#include <string>
#include <libpluralizer/pluralizer_core.h>

#include "cli_args.h"
#include "rules_file.h"

// Forward declaration
void printHelp();

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    bool verbose = false;
    bool inclusive = false;
    std::string rulesPath;

    // --- Argument Parsing ---
    auto it = args.begin();
    while (it != args.end()) {
        if (*it == "--verbose") {
            verbose = true;
            it = args.erase(it);
        } else if (*it == "--inclusive") {
            inclusive = true;
            it = args.erase(it);
        } else if (*it == "--rules") {
            it = args.erase(it);
            if (it != args.end()) {
                rulesPath = *it;
                it = args.erase(it);
            } else {
                std::cerr << "Error: --rules requires a file path." << std::endl;
                return 1;
            }
        } else {
            ++it;
        }
    }

    if (args.empty()) {
        printHelp();
        return 0;
    }

    std::string commandWord = args[0];
    std::optional<Command> command = parseCommand(commandWord);
    if (!command) {
        std::cerr << "Unknown command: " << commandWord << std::endl;
        printHelp();
        return 1;
    }

    //  Command Handling
    if (*command == Command::Help) {
        printHelp();
        return 0;
    }
    if (*command == Command::Version) {
        std::cout << "libpluralizer version " << getPluralizerVersion() << std::endl;
        return 0;
    }

    Pluralizer& pluralizer = defaultPluralizer();
    if (!rulesPath.empty()) {
        try {
            RulesFile rules = readRulesFile(rulesPath);
            applyRulesFile(rules, pluralizer);
            if (verbose) {
                std::cerr << "Loaded " << rules.ruleCount() << " rules from " << rulesPath << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    if (*command == Command::Pluralize) {
        if (args.size() < 3) {
            std::cerr << "Usage: pluralizer-cli pluralize <word> <count> [--inclusive]" << std::endl;
            return 1;
        }
        std::optional<long> count = parseCount(args[2]);
        if (!count) {
            std::cerr << "Error: Invalid count '" << args[2] << "'." << std::endl;
            return 1;
        }
        std::cout << pluralizer.pluralize(args[1], *count, inclusive) << std::endl;
    }
    else {
        if (args.size() < 2) {
            std::cerr << "Usage: pluralizer-cli " << commandWord << " <word>..." << std::endl;
            return 1;
        }
        Direction direction = *command == Command::Plural ? Direction::Plural : Direction::Singular;
        for (size_t i = 1; i < args.size(); ++i) {
            std::cout << pluralizer.transform(args[i], direction) << std::endl;
        }
    }

    return 0;
}

void printHelp() {
    std::cout << "Pluralizer Command-Line Tool\n";
    std::cout << "Version: " << getPluralizerVersion() << "\n\n";
    std::cout << "Usage: pluralizer-cli [--rules <file>] <command> [arguments] [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  pluralize <word> <count>  Singular form for a count of 1, plural otherwise.\n";
    std::cout << "  plural <word>...          Prints the plural form of each word.\n";
    std::cout << "  singular <word>...        Prints the singular form of each word.\n";
    std::cout << "  version, --version        Display the library version.\n";
    std::cout << "  help                      Show this help message.\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --rules <file>              Load extra rules from a TOML file.\n";
    std::cout << "  --inclusive                 Prefix the pluralize result with the count.\n";
    std::cout << "  --verbose                   Report how many rules were loaded.\n";
}

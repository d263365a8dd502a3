#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "tomlpath/Cli.hpp"

using namespace tomlpath;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("tomlpath", "Read & mutate TOML documents via path expressions");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("f,file", "Path to TOML document", cxxopts::value<std::string>())
            ("s,separator", "Path separator (one character)", cxxopts::value<std::string>()->default_value("."))
            ("json", "Render get/dump output as JSON")
            ("i,in-place", "Write mutations back to FILE")
            ("v,verbose", "Trace path resolution to stderr")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: get PATH | type PATH | exists PATH | insert PATH VALUE | set PATH VALUE | delete PATH | dump\n";
            return 0;
        }

        if (!result.count("file")) {
            std::cerr << "Error: --file must be provided\n";
            return 1;
        }

        CliOptions opts;
        opts.file = result["file"].as<std::string>();
        opts.separator = parse_separator(result["separator"].as<std::string>());
        opts.json = result.count("json") > 0;
        opts.in_place = result.count("in-place") > 0;
        opts.verbose = result.count("verbose") > 0;

        return run_command(opts, result["command"].as<std::vector<std::string>>(),
                           std::cout, std::cerr);

    } catch (const UsageError& ue) {
        std::cerr << "Error: " << ue.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}

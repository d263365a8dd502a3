/**
 * @file Cli.hpp
 * @brief Command execution behind the tomlpath tool
 *
 * cli_main.cpp only parses options (cxxopts) and hands the result to
 * run_command(), which does the work against injected output streams:
 * results go to @p out, "Error: ..." / "Not found: ..." and the verbose
 * trace go to @p err.
 *
 * Exit codes:
 * - 0: success (`exists` printed true)
 * - 1: any error, a missing node for `get` / `type`, or `exists` false
 */

#ifndef TOMLPATH_CLI_HPP
#define TOMLPATH_CLI_HPP

#include "tomlpath/Tokenizer.hpp"

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace tomlpath {

/**
 * @brief Invalid command line usage (bad separator, wrong arity, unknown command)
 */
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Options shared by all commands
 */
struct CliOptions {
    std::string file;                       ///< TOML document to operate on
    char separator = kDefaultSeparator;     ///< Path separator
    bool json = false;                      ///< Render get/dump as JSON
    bool in_place = false;                  ///< Write mutations back to file
    bool verbose = false;                   ///< Trace to the error stream
};

/**
 * @brief Validate the --separator argument
 *
 * @return The single separator character
 * @throws UsageError unless @p text is exactly one character
 */
char parse_separator(const std::string& text);

/**
 * @brief Run one command
 *
 * @param opts Global options
 * @param command Command name followed by its arguments
 *        (e.g. {"set", "server.port", "8080"})
 * @param out Stream for results
 * @param err Stream for errors and the verbose trace
 * @return Process exit code
 *
 * Never throws for library, document or usage errors; they are reported
 * on @p err with exit code 1.
 */
int run_command(const CliOptions& opts, const std::vector<std::string>& command,
                std::ostream& out, std::ostream& err);

} // namespace tomlpath

#endif // TOMLPATH_CLI_HPP

/**
 * @file Cli.cpp
 * @brief Implementation of the tomlpath commands
 */

#include "tomlpath/Cli.hpp"
#include "tomlpath/Delete.hpp"
#include "tomlpath/Errors.hpp"
#include "tomlpath/Insert.hpp"
#include "tomlpath/Json.hpp"
#include "tomlpath/Loader.hpp"
#include "tomlpath/Parse.hpp"
#include "tomlpath/Read.hpp"
#include "tomlpath/Set.hpp"

#include <optional>
#include <utility>

namespace tomlpath {

namespace {

class Runner {
public:
    Runner(const CliOptions& opts, std::ostream& out, std::ostream& err)
        : opts_(opts), out_(out), err_(err) {}

    int run(const std::vector<std::string>& cmdv) {
        if (cmdv.empty()) {
            throw UsageError("missing command");
        }
        const std::string& cmd = cmdv[0];

        Value doc = load_toml_file(opts_.file);
        trace("loaded " + opts_.file);

        // GET / TYPE
        if (cmd == "get" || cmd == "type") {
            expect_args(cmdv, 2);
            const std::string& path = cmdv[1];
            trace_path(path);
            const Value* node = read_with_separator(doc, path, opts_.separator);
            if (node == nullptr) {
                err_ << "Not found: " << path << "\n";
                return 1;
            }
            trace(std::string("resolved ") + type_name(*node));
            if (cmd == "get") {
                out_ << render(*node) << "\n";
            } else {
                out_ << type_name(*node) << "\n";
            }
            return 0;
        }

        // EXISTS
        if (cmd == "exists") {
            expect_args(cmdv, 2);
            trace_path(cmdv[1]);
            bool ok = contains(doc, cmdv[1], opts_.separator);
            out_ << (ok ? "true" : "false") << "\n";
            return ok ? 0 : 1;
        }

        // INSERT / SET
        if (cmd == "insert" || cmd == "set") {
            expect_args(cmdv, 3);
            const std::string& path = cmdv[1];
            trace_path(path);
            Value parsed = parse_value(cmdv[2]);
            trace(std::string("value ") + type_name(parsed));
            std::optional<Value> previous = (cmd == "insert")
                ? insert_with_separator(doc, path, opts_.separator, std::move(parsed))
                : set_with_separator(doc, path, opts_.separator, std::move(parsed));
            if (previous) {
                trace(std::string("replaced ") + type_name(*previous));
            }
            finish_mutation(doc);
            return 0;
        }

        // DELETE
        if (cmd == "delete") {
            expect_args(cmdv, 2);
            trace_path(cmdv[1]);
            if (!remove_with_separator(doc, cmdv[1], opts_.separator)) {
                trace("nothing to delete");
            }
            finish_mutation(doc);
            return 0;
        }

        // DUMP
        if (cmd == "dump") {
            expect_args(cmdv, 1);
            if (opts_.json) {
                out_ << to_json(doc).dump(2) << "\n";
            } else {
                out_ << to_toml_string(doc);
            }
            return 0;
        }

        throw UsageError("unknown command '" + cmd + "'");
    }

private:
    void expect_args(const std::vector<std::string>& cmdv, size_t want) const {
        if (cmdv.size() != want) {
            throw UsageError("wrong number of arguments for command '" + cmdv[0] + "'");
        }
    }

    void trace(const std::string& msg) {
        if (opts_.verbose) {
            err_ << "[tomlpath] " << msg << "\n";
        }
    }

    void trace_path(const std::string& path) {
        if (opts_.verbose) {
            trace("path " + join_path(tokenize(path, opts_.separator), opts_.separator));
        }
    }

    std::string render(const Value& v) const {
        if (opts_.json) {
            return to_json(v).dump(2);
        }
        return to_toml_value_string(v);
    }

    // Mutations either go back to the file or to the output stream
    void finish_mutation(const Value& doc) {
        if (opts_.in_place) {
            save_toml_file(opts_.file, doc);
            trace("wrote " + opts_.file);
        } else {
            out_ << to_toml_string(doc);
        }
    }

    const CliOptions& opts_;
    std::ostream& out_;
    std::ostream& err_;
};

} // anonymous namespace

char parse_separator(const std::string& text) {
    if (text.size() != 1) {
        throw UsageError("--separator must be exactly one character, got '" + text + "'");
    }
    return text[0];
}

int run_command(const CliOptions& opts, const std::vector<std::string>& command,
                std::ostream& out, std::ostream& err) {
    try {
        return Runner(opts, out, err).run(command);
    } catch (const UsageError& ue) {
        err << "Error: " << ue.what() << "\n";
    } catch (const DocumentError& de) {
        err << "Error: " << de.what() << "\n";
    } catch (const PathError& pe) {
        err << "Error: " << pe.what() << "\n";
    }
    return 1;
}

} // namespace tomlpath

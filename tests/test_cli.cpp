/**
 * @file test_cli.cpp
 * @brief Unit tests for CLI functionality (GoogleTest)
 *
 * Tests covering CLI commands through run_command():
 * - get / type: Print a node, exit 1 with "Not found" when absent
 * - exists: Print true/false, exit 0/1
 * - insert / set / delete: Print or write back the mutated document
 * - dump: Print the whole document as TOML or JSON
 * - --separator validation and usage errors
 *
 * Note: These tests drive the command runner with string streams, not the
 * full CLI binary; option parsing itself is left to cxxopts.
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

#include "tomlpath/Cli.hpp"
#include "tomlpath/Loader.hpp"
#include "tomlpath/Read.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace tomlpath;

// ============================================================================
// Test Utilities
// ============================================================================

/**
 * @brief RAII wrapper for temporary files
 */
class TempFile {
public:
    explicit TempFile(const std::string& content)
        : path_(fs::temp_directory_path() /
                ("tomlpath_cli_" + std::to_string(std::rand()) + ".toml")) {
        std::ofstream f(path_);
        f << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

class CliTest : public ::testing::Test {
protected:
    TempFile file{
        "title = \"demo\"\n"
        "ports = [80, 443]\n"
        "[server]\n"
        "host = \"localhost\"\n"
        "port = 8080\n"
    };
    std::ostringstream out;
    std::ostringstream err;

    CliOptions options() const {
        CliOptions opts;
        opts.file = file.path();
        return opts;
    }

    int run(const std::vector<std::string>& command) {
        return run_command(options(), command, out, err);
    }

    int run(const CliOptions& opts, const std::vector<std::string>& command) {
        return run_command(opts, command, out, err);
    }
};

// ============================================================================
// --separator
// ============================================================================

TEST(CliSeparatorTest, SingleCharacter) {
    EXPECT_EQ(parse_separator("."), '.');
    EXPECT_EQ(parse_separator("/"), '/');
}

TEST(CliSeparatorTest, RejectsOtherLengths) {
    EXPECT_THROW(parse_separator(""), UsageError);
    EXPECT_THROW(parse_separator("::"), UsageError);
}

// ============================================================================
// get / type
// ============================================================================

TEST_F(CliTest, GetPrintsTomlValue) {
    EXPECT_EQ(run({"get", "server.port"}), 0);
    EXPECT_EQ(out.str(), "8080\n");
    EXPECT_TRUE(err.str().empty());
}

TEST_F(CliTest, GetAsJson) {
    CliOptions opts = options();
    opts.json = true;
    EXPECT_EQ(run(opts, {"get", "ports"}), 0);
    EXPECT_EQ(nlohmann::json::parse(out.str()), nlohmann::json({80, 443}));
}

TEST_F(CliTest, GetWithCustomSeparator) {
    CliOptions opts = options();
    opts.separator = '/';
    EXPECT_EQ(run(opts, {"get", "ports/[1]"}), 0);
    EXPECT_EQ(out.str(), "443\n");
}

TEST_F(CliTest, GetMissingExitsOne) {
    EXPECT_EQ(run({"get", "server.user"}), 1);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), "Not found: server.user\n");
}

TEST_F(CliTest, TypePrintsTag) {
    EXPECT_EQ(run({"type", "server"}), 0);
    EXPECT_EQ(out.str(), "Table\n");
}

TEST_F(CliTest, TypeMissingExitsOne) {
    EXPECT_EQ(run({"type", "nope"}), 1);
    EXPECT_EQ(err.str(), "Not found: nope\n");
}

// ============================================================================
// exists
// ============================================================================

TEST_F(CliTest, ExistsTrue) {
    EXPECT_EQ(run({"exists", "server.host"}), 0);
    EXPECT_EQ(out.str(), "true\n");
}

TEST_F(CliTest, ExistsFalseExitsOne) {
    EXPECT_EQ(run({"exists", "server.user"}), 1);
    EXPECT_EQ(out.str(), "false\n");
}

TEST_F(CliTest, StructuralErrorReported) {
    EXPECT_EQ(run({"exists", "title.x"}), 1);
    EXPECT_EQ(err.str().rfind("Error: ", 0), 0u);
}

// ============================================================================
// Mutations
// ============================================================================

TEST_F(CliTest, SetPrintsDocumentWithoutTouchingFile) {
    EXPECT_EQ(run({"set", "server.port", "9090"}), 0);
    EXPECT_EQ(read_int(parse_toml(out.str()), "server.port"), 9090);
    EXPECT_EQ(read_int(load_toml_file(file.path()), "server.port"), 8080);
}

TEST_F(CliTest, InsertInPlaceWritesFile) {
    CliOptions opts = options();
    opts.in_place = true;
    EXPECT_EQ(run(opts, {"insert", "client.retries", "3"}), 0);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(read_int(load_toml_file(file.path()), "client.retries"), 3);
}

TEST_F(CliTest, DeleteInPlace) {
    CliOptions opts = options();
    opts.in_place = true;
    EXPECT_EQ(run(opts, {"delete", "ports.[0]"}), 0);
    Value doc = load_toml_file(file.path());
    EXPECT_EQ(*read(doc, "ports"), Value(Array{443}));
}

TEST_F(CliTest, SetMissingParentFails) {
    EXPECT_EQ(run({"set", "client.retries", "3"}), 1);
    EXPECT_EQ(err.str().rfind("Error: ", 0), 0u);
}

// ============================================================================
// dump, usage and document errors
// ============================================================================

TEST_F(CliTest, DumpJson) {
    CliOptions opts = options();
    opts.json = true;
    EXPECT_EQ(run(opts, {"dump"}), 0);
    auto j = nlohmann::json::parse(out.str());
    EXPECT_EQ(j["server"]["port"], 8080);
}

TEST_F(CliTest, WrongArityFails) {
    EXPECT_EQ(run({"get"}), 1);
    EXPECT_EQ(run({"set", "a"}), 1);
    EXPECT_EQ(run({"dump", "extra"}), 1);
}

TEST_F(CliTest, UnknownCommandFails) {
    EXPECT_EQ(run({"search", "x"}), 1);
    EXPECT_NE(err.str().find("unknown command"), std::string::npos);
}

TEST_F(CliTest, MissingFileFails) {
    CliOptions opts = options();
    opts.file = "/nonexistent/tomlpath/doc.toml";
    EXPECT_EQ(run(opts, {"dump"}), 1);
    EXPECT_NE(err.str().find("not found"), std::string::npos);
}

TEST_F(CliTest, VerboseTracesPath) {
    CliOptions opts = options();
    opts.verbose = true;
    EXPECT_EQ(run(opts, {"get", "ports.[0]"}), 0);
    EXPECT_NE(err.str().find("path ports.[0]"), std::string::npos);
    EXPECT_NE(err.str().find("resolved Integer"), std::string::npos);
}

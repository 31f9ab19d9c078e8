// Integration tests for sigfix
// These tests run the full check-and-fix flow over real Ruby files

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "sigfix/Tool.h"
#include "sigfix/Writer.h"

namespace fs = std::filesystem;
using namespace sigfix;

// Helper to get path to test fixtures
static fs::path getFixturePath(const std::string& relative) {
    fs::path candidates[] = {
        fs::path(SIGFIX_FIXTURES_DIR) / relative,
        fs::path(__FILE__).parent_path() / "fixtures" / relative,
        fs::current_path() / "tests" / "fixtures" / relative,
    };

    for (const auto& path : candidates) {
        if (fs::exists(path)) {
            return path;
        }
    }

    // Return first candidate for error message
    return candidates[0];
}

// Helper to read file content
static std::string readFile(const fs::path& path) {
    std::ifstream ifs(path);
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

// Copy a fixture to a scratch directory so fixes never touch the original
class ScratchCopy {
public:
    explicit ScratchCopy(const std::string& fixture) {
        dir_ = fs::temp_directory_path() / ("sigfix_integration_" + std::to_string(counter_++));
        fs::create_directories(dir_);
        path_ = dir_ / fs::path(fixture).filename();
        fs::copy_file(getFixturePath(fixture), path_, fs::copy_options::overwrite_existing);
    }

    ~ScratchCopy() {
        fs::remove_all(dir_);
    }

    const fs::path& path() const { return path_; }

private:
    fs::path dir_;
    fs::path path_;
    static inline int counter_ = 0;
};

// =============================================================================
// Fix files in place
// =============================================================================

TEST_CASE("Integration - controller gets declaration and signatures", "[integration]") {
    REQUIRE(fs::exists(getFixturePath("users_controller.rb")));
    ScratchCopy copy("users_controller.rb");

    SigfixTool tool;
    auto result = tool.checkFile(copy.path());

    REQUIRE(result.success);
    CHECK(result.missing_signature_count == 5);
    CHECK(result.stray_lines_count == 0);
    CHECK(readFile(copy.path()) == readFile(getFixturePath("users_controller.expected.rb")));
}

TEST_CASE("Integration - concern with stray lines and singleton methods", "[integration]") {
    ScratchCopy copy("invoiceable.rb");

    SigfixTool tool;
    auto result = tool.checkFile(copy.path());

    REQUIRE(result.success);
    CHECK(result.missing_signature_count == 2);
    CHECK(result.stray_lines_count == 1);
    CHECK(readFile(copy.path()) == readFile(getFixturePath("invoiceable.expected.rb")));
}

TEST_CASE("Integration - files that need no changes", "[integration]") {
    SECTION("strictly typed") {
        ScratchCopy copy("strict.rb");
        std::string before = readFile(copy.path());

        SigfixTool tool;
        auto result = tool.checkFile(copy.path());

        CHECK(result.success);
        CHECK(result.offenses.empty());
        CHECK(readFile(copy.path()) == before);
    }

    SECTION("untyped with heredoc") {
        ScratchCopy copy("untyped.rb");
        std::string before = readFile(copy.path());

        SigfixTool tool;
        auto result = tool.checkFile(copy.path());

        CHECK(result.success);
        CHECK(result.offenses.empty());
        CHECK(readFile(copy.path()) == before);
        CHECK_FALSE(tool.diagnostics().hasErrors());
    }
}

TEST_CASE("Integration - dry run does not modify content", "[integration]") {
    ScratchCopy copy("users_controller.rb");
    std::string before = readFile(copy.path());

    SigfixTool tool;
    auto result = tool.checkFile(copy.path(), /*dry_run=*/true);

    CHECK(result.success);
    CHECK(result.hasChanges());
    CHECK(readFile(copy.path()) == before);
    CHECK(result.modified_content == readFile(getFixturePath("users_controller.expected.rb")));
}

TEST_CASE("Integration - diff of a fix", "[integration]") {
    ScratchCopy copy("invoiceable.rb");

    SigfixTool tool;
    auto result = tool.checkFile(copy.path(), /*dry_run=*/true);
    REQUIRE(result.hasChanges());

    SourceWriter writer(true);
    std::string diff = writer.generateDiff("invoiceable.rb", result.original_content,
                                           result.modified_content);

    CHECK(diff.starts_with("--- a/invoiceable.rb\n+++ b/invoiceable.rb\n"));
    CHECK(diff.find("+      sig { params(attrs: T.untyped).returns(T.untyped) }\n") != std::string::npos);
    CHECK(diff.find("-\n") != std::string::npos);
    CHECK(diff.find("+    sig { returns(T.untyped) }\n") != std::string::npos);
}

// =============================================================================
// Idempotency
// =============================================================================

TEST_CASE("Idempotency - fixing fixed files changes nothing", "[integration][idempotency]") {
    for (const char* fixture : {"users_controller.expected.rb", "invoiceable.expected.rb"}) {
        ScratchCopy copy(fixture);
        std::string before = readFile(copy.path());

        SigfixTool tool;
        auto result = tool.checkFile(copy.path());

        CHECK(result.success);
        CHECK(result.offenses.empty());
        CHECK(readFile(copy.path()) == before);
    }
}

TEST_CASE("Errors - nonexistent file fails gracefully", "[integration][errors]") {
    SigfixTool tool;
    auto result = tool.checkFile(getFixturePath("does_not_exist.rb"));

    CHECK_FALSE(result.success);
    CHECK(tool.diagnostics().hasErrors());
}

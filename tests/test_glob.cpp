// test_glob.cpp - Tests for glob expansion and matching
// Part of rustimport - on-demand native extension builds

#include "glob/glob.hpp"

#include <algorithm>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace rustimport::glob;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { \
        tests_run++; \
        std::cout << "  Testing: " << #name << "... "; \
        try { \
            test_##name(); \
            tests_passed++; \
            std::cout << "PASS\n"; \
        } catch (const std::exception& e) { \
            std::cout << "FAIL: " << e.what() << "\n"; \
        } \
    } while(0)

#define ASSERT(cond) \
    if (!(cond)) { \
        throw std::runtime_error("Assertion failed: " #cond); \
    }

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) { \
        throw std::runtime_error("Assertion failed: " #a " == " #b); \
    }

// =============================================================================
// Test Fixtures
// =============================================================================

class TestFixture {
public:
    fs::path test_dir;

    TestFixture() {
        test_dir = fs::temp_directory_path() / "rustimport_glob_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "src" / "util");
        fs::create_directories(test_dir / "data");
        fs::create_directories(test_dir / ".hidden");

        touch("a.rs");
        touch("b.txt");
        touch("src/lib.rs");
        touch("src/util/mod.rs");
        touch("data/1.json");
        touch("data/2.json");
        touch(".hidden/x.rs");
    }

    ~TestFixture() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void touch(const std::string& relative) {
        std::ofstream out(test_dir / relative);
        out << relative << "\n";
    }
};

static std::unique_ptr<TestFixture> fixture;

// Paths relative to the fixture root, sorted
static std::vector<std::string> names(const GlobResult& result) {
    std::vector<std::string> out;
    for (const auto& path : result.paths) {
        out.push_back(fs::path(path).lexically_relative(fixture->test_dir).generic_string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

// =============================================================================
// Expansion Tests
// =============================================================================

void test_single_component() {
    GlobResult result = expand_pattern(fixture->test_dir, "*.rs");
    ASSERT(result.ok());
    std::vector<std::string> expected = {"a.rs"};
    ASSERT(names(result) == expected);
}

void test_recursive_wildcard() {
    GlobResult result = expand_pattern(fixture->test_dir, "**/*.rs");
    ASSERT(result.ok());
    std::vector<std::string> expected = {"a.rs", "src/lib.rs", "src/util/mod.rs"};
    ASSERT(names(result) == expected);
}

void test_trailing_double_star() {
    GlobResult result = expand_pattern(fixture->test_dir, "src/**");
    ASSERT(result.ok());
    std::vector<std::string> expected = {"src/lib.rs", "src/util/mod.rs"};
    ASSERT(names(result) == expected);
}

void test_absolute_pattern() {
    std::string pattern = (fixture->test_dir / "data" / "*.json").string();
    GlobResult result = expand_pattern(fs::path(), pattern);
    ASSERT(result.ok());
    ASSERT_EQ(result.paths.size(), 2u);
    for (const auto& path : result.paths) {
        ASSERT(fs::path(path).is_absolute());
    }
}

void test_character_classes() {
    ASSERT_EQ(expand_pattern(fixture->test_dir, "data/?.json").paths.size(), 2u);
    ASSERT_EQ(expand_pattern(fixture->test_dir, "data/[12].json").paths.size(), 2u);

    std::vector<std::string> expected = {"data/2.json"};
    ASSERT(names(expand_pattern(fixture->test_dir, "data/[!1].json")) == expected);
}

void test_case_insensitive() {
    GlobOptions options;
    ASSERT(expand_pattern(fixture->test_dir, "*.RS", options).paths.empty());

    options.case_sensitive = false;
    ASSERT_EQ(expand_pattern(fixture->test_dir, "*.RS", options).paths.size(), 1u);
}

void test_hidden_entries() {
    GlobOptions options;
    GlobResult visible = expand_pattern(fixture->test_dir, "**/*.rs", options);
    for (const auto& name : names(visible)) {
        ASSERT(name.find(".hidden") == std::string::npos);
    }

    // Naming the hidden directory explicitly reaches into it
    ASSERT_EQ(expand_pattern(fixture->test_dir, ".hidden/*.rs", options).paths.size(), 1u);

    options.include_hidden = true;
    GlobResult all = expand_pattern(fixture->test_dir, "**/*.rs", options);
    ASSERT_EQ(all.paths.size(), 4u);
}

void test_directories_included() {
    GlobOptions options;
    options.files_only = false;
    std::vector<std::string> result = names(expand_pattern(fixture->test_dir, "*", options));
    ASSERT(std::find(result.begin(), result.end(), "src") != result.end());
    ASSERT(std::find(result.begin(), result.end(), "b.txt") != result.end());

    options.files_only = true;
    result = names(expand_pattern(fixture->test_dir, "*", options));
    ASSERT(std::find(result.begin(), result.end(), "src") == result.end());
}

void test_literal_missing_file() {
    GlobResult result = expand_pattern(fixture->test_dir, "src/missing.rs");
    ASSERT(result.ok());
    ASSERT(result.paths.empty());
}

void test_multiple_patterns_deduplicated() {
    GlobResult result = expand_patterns(fixture->test_dir, {"*.rs", "a.rs", "src/*.rs"});
    ASSERT(result.ok());
    std::vector<std::string> expected = {"a.rs", "src/lib.rs"};
    ASSERT(names(result) == expected);
    ASSERT(std::is_sorted(result.paths.begin(), result.paths.end()));
}

// =============================================================================
// Error Tests
// =============================================================================

void test_invalid_patterns() {
    ASSERT(!validate_pattern(""));
    ASSERT(!validate_pattern("src/[abc"));
    ASSERT(!validate_pattern("a**b"));
    ASSERT(validate_pattern("[]]x"));
    ASSERT(validate_pattern("src/**/*.rs"));

    GlobResult result = expand_pattern(fixture->test_dir, "src/[abc");
    ASSERT(!result.ok());
    ASSERT(result.error == GlobError::PATTERN_SYNTAX_ERROR);
    ASSERT(!result.error_message.empty());
}

void test_missing_base_dir() {
    GlobResult result = expand_pattern(fixture->test_dir / "nope", "*.rs");
    ASSERT(result.error == GlobError::INVALID_BASE_DIR);
    ASSERT_EQ(std::string(error_string(result.error)), "invalid base directory");
}

void test_depth_limit() {
    GlobOptions options;
    options.max_depth = 1;
    GlobResult result = expand_pattern(fixture->test_dir, "**/*.rs", options);
    ASSERT(result.error == GlobError::MAX_DEPTH_EXCEEDED);
}

// =============================================================================
// Matching Tests
// =============================================================================

void test_path_matches() {
    ASSERT(path_matches("src/util/mod.rs", "src/**/*.rs"));
    ASSERT(path_matches("src/lib.rs", "src/**/*.rs"));
    ASSERT(!path_matches("lib.rs", "src/*.rs"));
    ASSERT(!path_matches("/abs/src/lib.rs", "src/*.rs"));
    ASSERT(path_matches("/abs/src/lib.rs", "/abs/**/lib.rs"));
    ASSERT(path_matches("SRC/LIB.RS", "src/*.rs", false));
    ASSERT(!path_matches("SRC/LIB.RS", "src/*.rs", true));
}

void test_has_magic() {
    ASSERT(has_magic("*.rs"));
    ASSERT(has_magic("data/?.json"));
    ASSERT(has_magic("[ab].rs"));
    ASSERT(!has_magic("src/lib.rs"));
    ASSERT(!has_magic("/abs/path"));
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Glob Test Suite ===\n\n";

    fixture = std::make_unique<TestFixture>();

    std::cout << "Expansion Tests:\n";
    TEST(single_component);
    TEST(recursive_wildcard);
    TEST(trailing_double_star);
    TEST(absolute_pattern);
    TEST(character_classes);
    TEST(case_insensitive);
    TEST(hidden_entries);
    TEST(directories_included);
    TEST(literal_missing_file);
    TEST(multiple_patterns_deduplicated);

    std::cout << "\nError Tests:\n";
    TEST(invalid_patterns);
    TEST(missing_base_dir);
    TEST(depth_limit);

    std::cout << "\nMatching Tests:\n";
    TEST(path_matches);
    TEST(has_magic);

    fixture.reset();

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "/" << tests_run << "\n";

    return tests_passed == tests_run ? 0 : 1;
}

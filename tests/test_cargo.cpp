// test_cargo.cpp - Tests for CargoInvoker and the cargo message stream
// Part of rustimport - on-demand native extension builds

#include "core/cargo.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace rustimport;

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
    fs::path cargo;
    fs::path crate_dir;
    fs::path args_log;

    TestFixture() {
        test_dir = fs::temp_directory_path() / "rustimport_cargo_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        cargo = test_dir / "cargo";
        fs::copy_file(RUSTIMPORT_FAKE_CARGO, cargo);
        fs::permissions(cargo, fs::perms::owner_all, fs::perm_options::add);

        args_log = test_dir / "cargo_args.log";
        setenv("RUSTIMPORT_FAKE_CARGO_LOG", args_log.c_str(), 1);

        crate_dir = test_dir / "fib";
        reset_crate("pub fn fib() {}\n");
    }

    ~TestFixture() {
        unsetenv("RUSTIMPORT_FAKE_CARGO_LOG");
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void reset_crate(const std::string& lib_rs) {
        std::error_code ec;
        fs::remove_all(crate_dir, ec);
        fs::remove(args_log, ec);
        fs::create_directories(crate_dir / "src");
        write(crate_dir / "Cargo.toml", "[package]\nname = \"fib\"\n");
        write(crate_dir / "src" / "lib.rs", lib_rs);
    }

    Settings settings() const {
        Settings s;
        s.cargo_executable = cargo.string();
        s.cache_dir = test_dir / "cache";
        return s;
    }

    static void write(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    static std::string read(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
};

static std::unique_ptr<TestFixture> fixture;

// =============================================================================
// Toolchain Tests
// =============================================================================

void test_configured_executable() {
    CargoInvoker invoker(fixture->settings());
    ASSERT_EQ(invoker.executable(), fixture->cargo.string());
}

void test_missing_executable() {
    Settings settings = fixture->settings();
    settings.cargo_executable = (fixture->test_dir / "no-such-cargo").string();

    bool threw = false;
    try {
        CargoInvoker invoker(settings);
    } catch (const ToolchainNotFoundError& e) {
        threw = e.executable() == *settings.cargo_executable;
    }
    ASSERT(threw);

    settings.cargo_executable = "rustimport-no-such-cargo-on-path";
    threw = false;
    try {
        CargoInvoker invoker(settings);
    } catch (const ToolchainNotFoundError&) {
        threw = true;
    }
    ASSERT(threw);
}

void test_non_executable_rejected() {
    fs::path plain = fixture->test_dir / "plain-file";
    TestFixture::write(plain, "not a program\n");
    fs::permissions(plain, fs::perms::owner_read | fs::perms::owner_write);

    Settings settings = fixture->settings();
    settings.cargo_executable = plain.string();

    bool threw = false;
    try {
        CargoInvoker invoker(settings);
    } catch (const ToolchainNotFoundError&) {
        threw = true;
    }
    ASSERT(threw);
}

void test_find_executable_in_path() {
    auto sh = find_executable_in_path("sh");
    ASSERT(sh.has_value());
    ASSERT(fs::path(*sh).is_absolute());
    ASSERT(!find_executable_in_path("rustimport-no-such-tool").has_value());
}

void test_command_args() {
    CargoInvoker invoker(fixture->settings());

    auto args = invoker.build_command_args(false, false, {});
    std::vector<std::string> expected = {
        fixture->cargo.string(), "rustc", "--lib", "--message-format", "json"};
    ASSERT(args == expected);

    args = invoker.build_command_args(true, true, {"--", "-C", "link-arg=-undefined"});
    expected = {fixture->cargo.string(), "rustc", "--lib", "--message-format", "json",
                "--quiet", "--release", "--", "-C", "link-arg=-undefined"};
    ASSERT(args == expected);
}

// =============================================================================
// Message Stream Tests
// =============================================================================

void test_artifact_selected_by_manifest() {
    CargoMessageHandler handler("/w/fib", true);
    CargoInvoker::BuildResult result;

    handler.handle_line(
        "{\"reason\":\"compiler-artifact\",\"manifest_path\":\"/w/dep/Cargo.toml\","
        "\"filenames\":[\"/w/target/debug/libdep.rlib\"]}", result);
    ASSERT(!result.artifact_path.has_value());

    handler.handle_line(
        "{\"reason\":\"compiler-artifact\",\"manifest_path\":\"/w/fib/Cargo.toml\","
        "\"filenames\":[\"/w/target/debug/libfib.so\",\"/w/target/debug/libfib.d\"]}", result);
    ASSERT(result.artifact_path.has_value());
    ASSERT_EQ(*result.artifact_path, fs::path("/w/target/debug/libfib.so"));

    // A later artifact of another package does not replace it
    handler.handle_line(
        "{\"reason\":\"compiler-artifact\",\"manifest_path\":\"/w/other/Cargo.toml\","
        "\"filenames\":[\"/w/target/debug/libother.so\"]}", result);
    ASSERT_EQ(*result.artifact_path, fs::path("/w/target/debug/libfib.so"));
    ASSERT_EQ(result.compiler_messages.size(), 3u);
}

void test_diagnostics_collected() {
    CargoMessageHandler handler("/w/fib", true);
    CargoInvoker::BuildResult result;

    handler.handle_line(
        "{\"reason\":\"compiler-message\",\"message\":{\"level\":\"warning\","
        "\"rendered\":\"warning: unused variable\\n\"}}", result);
    handler.handle_line(
        "{\"reason\":\"compiler-message\",\"message\":{\"level\":\"error\","
        "\"rendered\":\"error[E0425]: cannot find value\\n\"}}", result);
    handler.handle_line("{\"reason\":\"build-finished\",\"success\":false}", result);

    ASSERT_EQ(result.error_output.size(), 2u);
    ASSERT_EQ(result.error_output[0], "warning: unused variable\n");
    ASSERT(result.error_output[1].find("E0425") != std::string::npos);
    ASSERT(!result.artifact_path.has_value());
}

void test_malformed_lines_ignored() {
    CargoMessageHandler handler("/w/fib", true);
    CargoInvoker::BuildResult result;

    handler.handle_line("", result);
    handler.handle_line("   \r", result);
    handler.handle_line("   Compiling fib v0.1.0 (/w/fib)", result);
    handler.handle_line("{\"reason\": \"compiler-artifact\"", result);

    ASSERT(result.compiler_messages.empty());
    ASSERT(result.error_output.empty());
    ASSERT(!result.artifact_path.has_value());
}

// =============================================================================
// Build Tests
// =============================================================================

void test_build_success() {
    fixture->reset_crate("pub fn fib() {}\n");
    CargoInvoker invoker(fixture->settings());
    fs::path destination = fixture->test_dir / "fib.so";
    fs::remove(destination);

    auto result = invoker.build(fixture->crate_dir, destination, false, true);

    ASSERT(result.success);
    ASSERT_EQ(result.exit_code, 0);
    ASSERT(result.artifact_path.has_value());
    ASSERT_EQ(*result.artifact_path,
              fs::canonical(fixture->crate_dir) / "target" / "debug" / "libfake.so");
    ASSERT(result.error_output.empty());
    ASSERT_EQ(TestFixture::read(destination), "fake-shared-object-debug");

    // The unrelated artifact and build-finished are still recorded
    ASSERT_EQ(result.compiler_messages.size(), 3u);
}

void test_build_release_and_extra_args() {
    fixture->reset_crate("pub fn fib() {}\n");
    CargoInvoker invoker(fixture->settings());
    fs::path destination = fixture->test_dir / "fib.so";

    auto result = invoker.build(fixture->crate_dir, destination, true, false,
                                {"--", "-C", "opt-level=1"});

    ASSERT(result.success);
    ASSERT_EQ(TestFixture::read(destination), "fake-shared-object-release");

    std::string logged = TestFixture::read(fixture->args_log);
    ASSERT(logged.find("rustc --lib --message-format json --release -- -C opt-level=1") !=
           std::string::npos);
    ASSERT(logged.find("--quiet") == std::string::npos);
}

void test_build_without_destination() {
    fixture->reset_crate("pub fn fib() {}\n");
    CargoInvoker invoker(fixture->settings());

    auto result = invoker.build(fixture->crate_dir, std::nullopt, false, true);
    ASSERT(result.success);
    ASSERT(result.artifact_path.has_value());
    ASSERT(fs::exists(*result.artifact_path));
}

void test_build_failure_quiet() {
    fixture->reset_crate("compile_error!(\"boom\");\n");
    CargoInvoker invoker(fixture->settings());
    fs::path destination = fixture->test_dir / "failed.so";
    fs::remove(destination);

    auto result = invoker.build(fixture->crate_dir, destination, false, true);

    ASSERT(!result.success);
    ASSERT_EQ(result.exit_code, 101);
    ASSERT_EQ(result.error_output.size(), 1u);
    ASSERT(result.error_output[0].find("fake compile failure") != std::string::npos);
    ASSERT(!result.artifact_path.has_value());
    ASSERT(!fs::exists(destination));
    ASSERT(TestFixture::read(fixture->args_log).find("--quiet") != std::string::npos);
}

void test_build_failure_streaming() {
    fixture->reset_crate("compile_error!(\"boom\");\n");
    CargoInvoker invoker(fixture->settings());

    // Diagnostics are echoed and still collected
    auto result = invoker.build(fixture->crate_dir, std::nullopt, false, false);
    ASSERT(!result.success);
    ASSERT_EQ(result.error_output.size(), 1u);
    ASSERT(result.stderr_output.empty());
}

// =============================================================================
// Artifact Copy Tests
// =============================================================================

void test_copy_artifact() {
    fs::path from = fixture->test_dir / "built.so";
    fs::path to = fixture->test_dir / "installed.so";
    TestFixture::write(from, "new contents");
    TestFixture::write(to, "old contents that are longer");
    fs::permissions(from, fs::perms::owner_all | fs::perms::group_read);

    auto stamp = fs::last_write_time(from) - std::chrono::hours(1);
    fs::last_write_time(from, stamp);

    copy_artifact(from, to);

    ASSERT_EQ(TestFixture::read(to), "new contents");
    ASSERT(fs::last_write_time(to) == stamp);
    ASSERT(fs::status(to).permissions() == fs::status(from).permissions());

    fs::path leftover = to;
    leftover += ".tmp";
    ASSERT(!fs::exists(leftover));
}

// =============================================================================
// Main
// =============================================================================

int main() {
    rustimport::log::set_level(rustimport::log::LogLevel::Critical);

    std::cout << "=== Cargo Test Suite ===\n\n";

    fixture = std::make_unique<TestFixture>();

    std::cout << "Toolchain Tests:\n";
    TEST(configured_executable);
    TEST(missing_executable);
    TEST(non_executable_rejected);
    TEST(find_executable_in_path);
    TEST(command_args);

    std::cout << "\nMessage Stream Tests:\n";
    TEST(artifact_selected_by_manifest);
    TEST(diagnostics_collected);
    TEST(malformed_lines_ignored);

    std::cout << "\nBuild Tests:\n";
    TEST(build_success);
    TEST(build_release_and_extra_args);
    TEST(build_without_destination);
    TEST(build_failure_quiet);
    TEST(build_failure_streaming);

    std::cout << "\nArtifact Copy Tests:\n";
    TEST(copy_artifact);

    fixture.reset();

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "/" << tests_run << "\n";

    return tests_passed == tests_run ? 0 : 1;
}

// test_orchestrator.cpp - Tests for BuildOrchestrator, scaffolding, settings and loading
// Part of rustimport - on-demand native extension builds

#include "config/toml_parser.hpp"
#include "core/build_orchestrator.hpp"
#include "core/errors.hpp"
#include "core/loader.hpp"
#include "core/log.hpp"
#include "core/scaffold.hpp"
#include "importable/crate_unit.hpp"
#include "importable/single_file_unit.hpp"
#include "preprocess/header.hpp"

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

    TestFixture() {
        test_dir = fs::temp_directory_path() / "rustimport_orchestrator_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        test_dir = fs::canonical(test_dir);

        cargo = test_dir / "bin" / "cargo";
        fs::create_directories(cargo.parent_path());
        fs::copy_file(RUSTIMPORT_FAKE_CARGO, cargo);
        fs::permissions(cargo, fs::perms::owner_all, fs::perm_options::add);
    }

    ~TestFixture() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    Settings settings() const {
        Settings s;
        s.cargo_executable = cargo.string();
        s.cache_dir = test_dir / "cache";
        s.extension_suffix = ".so";
        s.target_os = TargetOs::Linux;
        s.quiet_cargo = true;
        return s;
    }

    // A fresh directory under the fixture for one test
    fs::path tree(const std::string& name) {
        fs::path root = test_dir / name;
        fs::remove_all(root);
        fs::create_directories(root);
        return root;
    }

    static fs::path write(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
        return path;
    }

    static std::string read(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    static void make_crate(const fs::path& dir, bool marker) {
        std::string name = dir.filename().string();
        write(dir / "Cargo.toml", "[package]\nname = \"" + name + "\"\n");
        write(dir / "src" / "lib.rs", "pub fn " + name + "() {}\n");
        if (marker) {
            write(dir / OPT_IN_MARKER, "");
        }
    }
};

static std::unique_ptr<TestFixture> fixture;

// Mixed tree: two eligible units, two that lack opt-in, and entries that are
// never looked at
static fs::path make_mixed_tree(const std::string& name) {
    fs::path root = fixture->tree(name);
    TestFixture::write(root / "opted.rs", "// rustimport\npub fn opted() {}\n");
    TestFixture::write(root / "plain.rs", "pub fn plain() {}\n");
    TestFixture::make_crate(root / "crate_ok", true);
    TestFixture::make_crate(root / "crate_no", false);
    TestFixture::write(root / "target" / "ignored.rs", "// rustimport\n");
    TestFixture::write(root / ".hidden" / "hidden.rs", "// rustimport\n");
    return root;
}

// =============================================================================
// Batch Build Tests
// =============================================================================

void test_build_all_summary() {
    fs::path root = make_mixed_tree("mixed");
    BuildOrchestrator orchestrator(fixture->settings());

    BatchSummary summary = orchestrator.build_all(root);

    ASSERT(summary.success);
    ASSERT_EQ(summary.total_units, 4u);
    ASSERT_EQ(summary.built_units, 2u);
    ASSERT_EQ(summary.skipped_units, 2u);
    ASSERT_EQ(summary.failed_units, 0u);
    ASSERT_EQ(summary.skipped.size(), 2u);
    ASSERT(summary.errors.empty());

    ASSERT(fs::exists(root / "opted.so"));
    ASSERT(fs::exists(root / "crate_ok.so"));
    ASSERT(!fs::exists(root / "plain.so"));
    ASSERT(!fs::exists(root / "crate_no.so"));
    ASSERT(!fs::exists(root / "target" / "ignored.so"));
    ASSERT(!fs::exists(root / ".hidden" / "hidden.so"));
}

void test_build_all_up_to_date() {
    fs::path root = make_mixed_tree("rerun");
    BuildOrchestrator orchestrator(fixture->settings());

    orchestrator.build_all(root);
    BatchSummary second = orchestrator.build_all(root);

    ASSERT(second.success);
    ASSERT_EQ(second.built_units, 0u);
    ASSERT_EQ(second.up_to_date_units, 2u);
}

void test_force_rebuild() {
    fs::path root = make_mixed_tree("forced");
    Settings settings = fixture->settings();
    settings.force_rebuild = true;
    BuildOrchestrator orchestrator(settings);

    orchestrator.build_all(root);
    BatchSummary second = orchestrator.build_all(root);
    ASSERT_EQ(second.built_units, 2u);
    ASSERT_EQ(second.up_to_date_units, 0u);
}

void test_release_mode_never_builds() {
    fs::path root = make_mixed_tree("production");
    Settings settings = fixture->settings();
    settings.release_mode = true;
    settings.force_rebuild = true;
    BuildOrchestrator orchestrator(settings);

    BatchSummary summary = orchestrator.build_all(root);
    ASSERT(summary.success);
    ASSERT_EQ(summary.built_units, 0u);
    ASSERT_EQ(summary.up_to_date_units, 2u);
    ASSERT(!fs::exists(root / "opted.so"));
}

void test_first_failure_stops_batch() {
    fs::path root = fixture->tree("failing");
    TestFixture::write(root / "a_broken.rs", "// rustimport\ncompile_error!(\"x\");\n");
    TestFixture::write(root / "b_fine.rs", "// rustimport\npub fn fine() {}\n");
    BuildOrchestrator orchestrator(fixture->settings());

    BatchSummary summary = orchestrator.build_all(root);
    ASSERT(!summary.success);
    ASSERT_EQ(summary.failed_units, 1u);
    ASSERT_EQ(summary.built_units, 0u);
    ASSERT_EQ(summary.errors.size(), 1u);
    ASSERT(summary.errors[0].find("a_broken.rs") != std::string::npos);
    ASSERT(!fs::exists(root / "b_fine.so"));
}

void test_sources_inside_crate_root() {
    // Building from inside a crate treats its sources as part of the crate
    fs::path root = fixture->tree("inside");
    TestFixture::make_crate(root / "member", true);
    TestFixture::write(root / "member" / "src" / "extra.rs", "// rustimport\n");
    BuildOrchestrator orchestrator(fixture->settings());

    BatchSummary summary = orchestrator.build_all(root / "member" / "src");
    ASSERT_EQ(summary.total_units, 0u);
}

void test_build_path_file_without_opt_in() {
    fs::path root = fixture->tree("explicit");
    fs::path source = TestFixture::write(root / "plain.rs", "pub fn plain() {}\n");
    BuildOrchestrator orchestrator(fixture->settings());

    BatchSummary summary = orchestrator.build_path(source);
    ASSERT(summary.success);
    ASSERT_EQ(summary.built_units, 1u);
    ASSERT(fs::exists(root / "plain.so"));

    TestFixture::make_crate(root / "crate_no", false);
    summary = orchestrator.build_path(root / "crate_no" / "Cargo.toml");
    ASSERT_EQ(summary.built_units, 1u);
    ASSERT(fs::exists(root / "crate_no.so"));
}

void test_build_path_missing() {
    BuildOrchestrator orchestrator(fixture->settings());
    bool threw = false;
    try {
        orchestrator.build_path(fixture->test_dir / "does-not-exist");
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("could not be found") != std::string::npos;
    }
    ASSERT(threw);
}

void test_summary_merge() {
    BatchSummary a;
    a.total_units = 2;
    a.built_units = 1;
    a.skipped_units = 1;
    a.skipped = {"x.rs: no opt-in"};

    BatchSummary b;
    b.success = false;
    b.total_units = 1;
    b.failed_units = 1;
    b.errors = {"Failed to build y.rs"};

    a.merge(b);
    ASSERT(!a.success);
    ASSERT_EQ(a.total_units, 3u);
    ASSERT_EQ(a.failed_units, 1u);
    ASSERT_EQ(a.skipped.size(), 1u);
    ASSERT_EQ(a.errors.size(), 1u);
}

void test_progress_reported() {
    fs::path root = fixture->tree("progress");
    TestFixture::write(root / "one.rs", "// rustimport\n");
    TestFixture::write(root / "two.rs", "// rustimport\n");
    BuildOrchestrator orchestrator(fixture->settings());

    std::vector<BuildProgress> events;
    orchestrator.set_progress_callback([&events](const BuildProgress& p) { events.push_back(p); });
    orchestrator.build_all(root);

    ASSERT(!events.empty());
    ASSERT(events.front().phase == BuildPhase::DISCOVERING);
    ASSERT(events.back().phase == BuildPhase::COMPLETE);

    size_t compiling = 0;
    for (const auto& event : events) {
        if (event.phase == BuildPhase::COMPILING) {
            compiling++;
            ASSERT_EQ(event.total, 2u);
        }
    }
    ASSERT_EQ(compiling, 2u);
}

// =============================================================================
// Module Build Tests
// =============================================================================

void test_build_module_by_name() {
    fs::path root = fixture->tree("modules");
    TestFixture::write(root / "pkg" / "fastmath.rs", "// rustimport\npub fn f() {}\n");
    Settings settings = fixture->settings();
    settings.search_paths = {root};
    BuildOrchestrator orchestrator(settings);

    auto unit = orchestrator.build_module("pkg.fastmath");
    ASSERT(unit != nullptr);
    ASSERT(fs::exists(root / "pkg" / "fastmath.so"));
    ASSERT(orchestrator.ensure_built(*unit) == UnitOutcome::UP_TO_DATE);
    ASSERT_EQ(std::string(unit_outcome_name(UnitOutcome::UP_TO_DATE)), "up to date");

    bool threw = false;
    try {
        orchestrator.build_module("pkg.missing");
    } catch (const ImportNotFoundError&) {
        threw = true;
    }
    ASSERT(threw);
}

void test_import_module_loads_artifact() {
    fs::path root = fixture->tree("imports");
    TestFixture::write(root / "native.rs", "// rustimport\npub fn n() {}\n");
    Settings settings = fixture->settings();
    settings.search_paths = {root};
    BuildOrchestrator orchestrator(settings);

    // The fake toolchain produces no loadable object, so loading must fail
    // after a successful build
    bool threw = false;
    try {
        orchestrator.import_module("native");
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("Failed to load") != std::string::npos;
    }
    ASSERT(threw);
    ASSERT(fs::exists(root / "native.so"));
}

// =============================================================================
// Scaffold Tests
// =============================================================================

void test_extension_names() {
    ASSERT(is_valid_extension_name("fib"));
    ASSERT(is_valid_extension_name("fast_math2.rs"));
    ASSERT(!is_valid_extension_name("1fib"));
    ASSERT(!is_valid_extension_name("my-ext"));
    ASSERT(!is_valid_extension_name("dir/ext"));
    ASSERT(!is_valid_extension_name(""));
}

void test_new_single_file() {
    fs::path root = fixture->tree("scaffold_file");
    fs::path created = create_extension("hello.rs", root);

    ASSERT_EQ(created, root / "hello.rs");
    ASSERT(first_line_contains_sentinel(created));
    std::string text = TestFixture::read(created);
    ASSERT(text.find("Hello from hello") != std::string::npos);
    ASSERT(parse_header(text).template_name.value_or("") == "pyo3");

    FailureReasons reasons;
    ASSERT(SingleFileUnit::try_create(created, "", true, fixture->settings(), reasons) != nullptr);
}

void test_new_crate() {
    fs::path root = fixture->tree("scaffold_crate");
    fs::path created = create_extension("mycrate", root);

    ASSERT_EQ(created, root / "mycrate");
    ASSERT(fs::exists(created / OPT_IN_MARKER));
    ASSERT(fs::exists(created / "src" / "lib.rs"));

    config::Value manifest = config::parse_toml_file(created / "Cargo.toml");
    ASSERT_EQ(manifest.find("package")->get_string("name"), "mycrate");
    ASSERT_EQ(manifest.find("lib")->get_string("name"), "mycrate");

    // The scaffolded crate builds, with the module generated in scratch only
    FailureReasons reasons;
    auto unit = CrateUnit::try_create(created, "", true, fixture->settings(), reasons);
    ASSERT(unit != nullptr);
    unit->build(false);
    ASSERT(fs::exists(root / "mycrate.so"));

    std::string staged = TestFixture::read(unit->build_tempdir() / "mycrate" / "src" / "lib.rs");
    const std::string generated = "  m.add_function(wrap_pyfunction!(say_hello, m)?)?;\n  Ok(())\n";
    ASSERT(staged.find(generated) != std::string::npos);
    ASSERT(TestFixture::read(created / "src" / "lib.rs").find(generated) == std::string::npos);
}

void test_new_refuses_overwrite() {
    fs::path root = fixture->tree("scaffold_twice");
    create_extension("dup.rs", root);

    bool threw = false;
    try {
        create_extension("dup.rs", root);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT(threw);

    threw = false;
    try {
        create_extension("bad-name", root);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT(threw);
}

// =============================================================================
// Settings Tests
// =============================================================================

void test_bool_flags() {
    ASSERT(parse_bool_flag("1"));
    ASSERT(parse_bool_flag("TRUE"));
    ASSERT(parse_bool_flag("yes"));
    ASSERT(!parse_bool_flag("0"));
    ASSERT(!parse_bool_flag("off"));
    ASSERT(!parse_bool_flag(""));
}

void test_settings_from_environment() {
    setenv("RUSTIMPORT_CARGO_EXECUTABLE", "/opt/rust/bin/cargo", 1);
    setenv("RUSTIMPORT_CACHE_DIR", "/var/cache/ri", 1);
    setenv("RUSTIMPORT_RELEASE_BINARIES", "true", 1);
    setenv("RUSTIMPORT_FORCE_REBUILD", "0", 1);
    setenv("RUSTIMPORT_RELEASE_MODE", "yes", 1);
    setenv("RUSTIMPORT_CHECKSUM_HASHER", "sha256", 1);
    setenv("RUSTIMPORT_EXTENSION_SUFFIX", ".cpython-312-x86_64-linux-gnu.so", 1);
    setenv("RUSTIMPORT_PATH", "/a:/b::/c", 1);

    Settings settings = Settings::from_environment();

    unsetenv("RUSTIMPORT_CARGO_EXECUTABLE");
    unsetenv("RUSTIMPORT_CACHE_DIR");
    unsetenv("RUSTIMPORT_RELEASE_BINARIES");
    unsetenv("RUSTIMPORT_FORCE_REBUILD");
    unsetenv("RUSTIMPORT_RELEASE_MODE");
    unsetenv("RUSTIMPORT_CHECKSUM_HASHER");
    unsetenv("RUSTIMPORT_EXTENSION_SUFFIX");
    unsetenv("RUSTIMPORT_PATH");

    ASSERT_EQ(settings.cargo_executable.value_or(""), "/opt/rust/bin/cargo");
    ASSERT_EQ(settings.cache_dir, fs::path("/var/cache/ri"));
    ASSERT(settings.compile_release_binaries);
    ASSERT(!settings.force_rebuild);
    ASSERT(settings.release_mode);
    ASSERT(settings.checksum_hasher == HashAlgorithm::SHA256);
    ASSERT_EQ(settings.extension_suffix, ".cpython-312-x86_64-linux-gnu.so");
    ASSERT_EQ(settings.search_paths.size(), 3u);
    ASSERT_EQ(settings.search_paths[2], fs::path("/c"));
}

void test_settings_defaults() {
    Settings settings = Settings::from_environment();
    ASSERT(!settings.cargo_executable.has_value());
    ASSERT(settings.checksum_hasher == HashAlgorithm::SHA1);
    ASSERT_EQ(settings.cache_dir.filename(), fs::path("rustimport"));
    ASSERT_EQ(default_extension_suffix(TargetOs::MacOS), ".dylib");
    ASSERT_EQ(default_extension_suffix(TargetOs::Linux), ".so");
}

// =============================================================================
// Loader Tests
// =============================================================================

void test_load_system_library() {
    DynamicLibrary libc("libc.so.6");
    ASSERT(libc.symbol("strlen") != nullptr);
    ASSERT(libc.symbol("rustimport_no_such_symbol") == nullptr);

    using StrlenFn = size_t (*)(const char*);
    auto fn = libc.function<StrlenFn>("strlen");
    ASSERT_EQ(fn("abcd"), 4u);

    bool threw = false;
    try {
        libc.require_symbol("rustimport_no_such_symbol");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT(threw);
}

void test_load_missing_library() {
    bool threw = false;
    try {
        load_extension(fixture->test_dir / "absent.so", fixture->settings());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT(threw);
}

// =============================================================================
// Main
// =============================================================================

int main() {
    rustimport::log::set_level(rustimport::log::LogLevel::Critical);

    std::cout << "=== Orchestrator Test Suite ===\n\n";

    fixture = std::make_unique<TestFixture>();

    std::cout << "Batch Build Tests:\n";
    TEST(build_all_summary);
    TEST(build_all_up_to_date);
    TEST(force_rebuild);
    TEST(release_mode_never_builds);
    TEST(first_failure_stops_batch);
    TEST(sources_inside_crate_root);
    TEST(build_path_file_without_opt_in);
    TEST(build_path_missing);
    TEST(summary_merge);
    TEST(progress_reported);

    std::cout << "\nModule Build Tests:\n";
    TEST(build_module_by_name);
    TEST(import_module_loads_artifact);

    std::cout << "\nScaffold Tests:\n";
    TEST(extension_names);
    TEST(new_single_file);
    TEST(new_crate);
    TEST(new_refuses_overwrite);

    std::cout << "\nSettings Tests:\n";
    TEST(bool_flags);
    TEST(settings_from_environment);
    TEST(settings_defaults);

    std::cout << "\nLoader Tests:\n";
    TEST(load_system_library);
    TEST(load_missing_library);

    fixture.reset();

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "/" << tests_run << "\n";

    return tests_passed == tests_run ? 0 : 1;
}

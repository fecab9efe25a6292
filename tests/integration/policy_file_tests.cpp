#include <doctest/doctest.h>
#include <safepath/path_sanitizer.hpp>
#include <safepath/platform.hpp>
#include <safepath/policy.hpp>
#include <safepath/warnings.hpp>

#include <filesystem>
#include <fstream>
#include <random>

namespace fs = std::filesystem;

using namespace safepath;

namespace {

// Temporary directory holding policy files, removed on destruction
class TestPolicyDir {
public:
    TestPolicyDir() {
        std::random_device rd;
        root_ = fs::temp_directory_path() / ("safepath_integration_" + std::to_string(rd()));
        fs::create_directories(root_);
    }

    ~TestPolicyDir() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::string write(const std::string& name, const std::string& content) const {
        fs::path file = root_ / name;
        std::ofstream(file) << content;
        return file.string();
    }

    std::string path(const std::string& name) const { return (root_ / name).string(); }

private:
    fs::path root_;
};

} // namespace

TEST_CASE("read_file returns file contents and nullopt for missing files") {
    TestPolicyDir dir;
    auto file = dir.write("plain.txt", "hello\nworld\n");

    auto content = read_file(file);
    REQUIRE(content.has_value());
    CHECK(*content == "hello\nworld\n");

    CHECK_FALSE(read_file(dir.path("missing.txt")).has_value());
}

TEST_CASE("load_policy_config reads a policy from disk") {
    TestPolicyDir dir;
    auto file = dir.write("policy.json", R"({
  "$schema": "safepath.policy.v1",
  "fat_compatible": true,
  "trim_to_limit": false,
  "warnings": { "path_sanitized": "error" }
})");

    std::vector<std::string> problems;
    auto loaded = load_policy_config(file, &problems);
    REQUIRE(loaded.isOk());
    CHECK(problems.empty());
    CHECK(loaded.value().fat_compatible);
    CHECK_FALSE(loaded.value().trim_to_limit);
    CHECK(loaded.value().warnings.at("path_sanitized") == WarningAction::Error);
    CHECK(loaded.value().source_path == file);
}

TEST_CASE("load_policy_config fails with IO_ERROR for a missing file") {
    TestPolicyDir dir;
    auto loaded = load_policy_config(dir.path("nope.json"));
    REQUIRE(loaded.isErr());
    CHECK(loaded.error().code() == ErrorCode::IO_ERROR);
    CHECK(loaded.error().message().find("nope.json") != std::string::npos);
}

TEST_CASE("load_policy_config fails with POLICY_INVALID for a bad policy") {
    TestPolicyDir dir;
    auto file = dir.write("bad.json", R"({"fat_compatible": true})");

    auto loaded = load_policy_config(file);
    REQUIRE(loaded.isErr());
    CHECK(loaded.error().code() == ErrorCode::POLICY_INVALID);
    CHECK(loaded.error().message() == file + ": $schema missing");
}

TEST_CASE("load_policy_config forwards field problems") {
    TestPolicyDir dir;
    auto file = dir.write("partial.json", R"({
  "$schema": "safepath.policy.v1",
  "trim_to_limit": "sometimes"
})");

    std::vector<std::string> problems;
    auto loaded = load_policy_config(file, &problems);
    REQUIRE(loaded.isOk());
    REQUIRE(problems.size() == 1);
    CHECK(problems[0] == "invalid_configuration:invalid_trim_to_limit");

    // a null sink is allowed
    CHECK(load_policy_config(file).isOk());
}

TEST_CASE("file policy, environment and collector work together") {
    TestPolicyDir dir;
    auto file = dir.write("policy.json", R"({
  "$schema": "safepath.policy.v1",
  "warnings": { "path_sanitized": "ignore" }
})");

    auto loaded = load_policy_config(file);
    REQUIRE(loaded.isOk());
    PolicyConfig config = loaded.value();

    // environment beats the file
    auto problems = apply_env_overrides(config, {{"SAFEPATH_WARN", "error"}, {"SAFEPATH_TRIM", "1"}});
    CHECK(problems.empty());

    WarningCollector collector(config.warnings);
    auto policy = make_sanitization_policy(config, collector.sink(Warning::path_sanitized));

    auto clean = sanitize_path("photos/2024/beach.jpg", Hint::AssertedTrue, policy);
    REQUIRE(clean.isOk());
    CHECK_FALSE(collector.has_errors());

    auto dirty = sanitize_path("photos\\aux.jpg", Hint::AssertedTrue, policy);
    REQUIRE(dirty.isOk());
    CHECK(dirty.value().path == "photos/_aux_.jpg");
    CHECK(collector.has_errors());

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "error");
}

TEST_CASE("ignored warnings from a file policy stay silent") {
    TestPolicyDir dir;
    auto file = dir.write("quiet.json", R"({
  "$schema": "safepath.policy.v1",
  "warnings": { "path_sanitized": "ignore" }
})");

    auto loaded = load_policy_config(file);
    REQUIRE(loaded.isOk());

    WarningCollector collector(loaded.value().warnings);
    auto policy = make_sanitization_policy(loaded.value(), collector.sink(Warning::path_sanitized));

    REQUIRE(sanitize_path("a|b", Hint::Unknown, policy).isOk());
    CHECK(collector.get_warnings().empty());
    CHECK_FALSE(collector.has_effective_warnings());
}

TEST_CASE("resolve_policy_config layers file, environment and flags") {
    TestPolicyDir dir;
    auto file = dir.write("layered.json", R"({
  "$schema": "safepath.policy.v1",
  "fat_compatible": false,
  "trim_to_limit": true,
  "warnings": { "path_sanitized": "error" }
})");

    // file only
    auto from_file = resolve_policy_config(file, {}, {});
    REQUIRE(from_file.isOk());
    CHECK(from_file.value().config.source_path == file);
    CHECK(from_file.value().config.trim_to_limit);
    CHECK(from_file.value().config.warnings.at("path_sanitized") == WarningAction::Error);

    // environment beats the file
    auto with_env = resolve_policy_config(file, {{"SAFEPATH_TRIM", "0"}, {"SAFEPATH_WARN", "warn"}}, {});
    REQUIRE(with_env.isOk());
    CHECK_FALSE(with_env.value().config.trim_to_limit);
    CHECK(with_env.value().config.warnings.at("path_sanitized") == WarningAction::Warn);

    // flags beat both
    PolicyFlags flags;
    flags.trim_to_limit = true;
    flags.fat_compatible = true;
    auto with_flags = resolve_policy_config(file, {{"SAFEPATH_TRIM", "0"}}, flags);
    REQUIRE(with_flags.isOk());
    CHECK(with_flags.value().config.trim_to_limit);
    CHECK(with_flags.value().config.fat_compatible);
}

TEST_CASE("resolve_policy_config reads SAFEPATH_POLICY when no file is given") {
    TestPolicyDir dir;
    auto env_file = dir.write("env.json", R"({"$schema": "safepath.policy.v1", "fat_compatible": true})");
    auto arg_file = dir.write("arg.json", R"({"$schema": "safepath.policy.v1"})");

    auto from_env = resolve_policy_config("", {{"SAFEPATH_POLICY", env_file}}, {});
    REQUIRE(from_env.isOk());
    CHECK(from_env.value().config.source_path == env_file);
    CHECK(from_env.value().config.fat_compatible);

    // an explicit file wins over SAFEPATH_POLICY
    auto from_arg = resolve_policy_config(arg_file, {{"SAFEPATH_POLICY", env_file}}, {});
    REQUIRE(from_arg.isOk());
    CHECK(from_arg.value().config.source_path == arg_file);
    CHECK_FALSE(from_arg.value().config.fat_compatible);
}

TEST_CASE("resolve_policy_config reports file problems and failures") {
    TestPolicyDir dir;
    auto file = dir.write("typo.json", R"({"$schema": "safepath.policy.v1", "fat_compatible": "no"})");

    auto resolved = resolve_policy_config(file, {{"SAFEPATH_WARN", "loud"}}, {});
    REQUIRE(resolved.isOk());
    REQUIRE(resolved.value().problems.size() == 2);
    CHECK(resolved.value().problems[0] == "invalid_configuration:invalid_fat_compatible");
    CHECK(resolved.value().problems[1] == "invalid_configuration:SAFEPATH_WARN");

    auto missing = resolve_policy_config(dir.path("absent.json"), {}, {});
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::IO_ERROR);
}

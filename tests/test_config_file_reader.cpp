#include "catch2_custom.hpp"

#include "user/config_file_reader.hpp"

#include <junitgrader/grader_options.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <stdlib.h>

using junitgrader::ConfigFile;
using junitgrader::ConfigFileReader;
using junitgrader::GraderOptions;

namespace {

const auto config_path = RESOURCES_PATH / "config";

ConfigFile read_config(const std::string& name) {
    auto res = ConfigFileReader{config_path / name}.read();
    REQUIRE(res);
    return res.value();
}

} // namespace

TEST_CASE("Read an INI config file") {
    auto config = read_config("valid.ini");

    REQUIRE(config.has_section("junit4"));
    REQUIRE(config.has_section("other"));
    REQUIRE_FALSE(config.has_section("missing"));

    REQUIRE(config.get("junit4", "timeout") == "25");
    REQUIRE(config.get("junit4", "ignore_tests") == "SlowTest.java   FlakyTest.java");
    REQUIRE(config.get("other", "timeout") == "not read");
    REQUIRE_FALSE(config.get("junit4", "missing"));
    REQUIRE_FALSE(config.get("missing", "timeout"));
}

TEST_CASE("Windows line endings are accepted") {
    REQUIRE(read_config("crlf.ini").get("junit4", "timeout") == "7");
}

TEST_CASE("Malformed config files") {
    SECTION("Values outside of a section") {
        auto res = ConfigFileReader{config_path / "no_section.ini"}.read();
        REQUIRE_FALSE(res);
        REQUIRE(res.error() == "Value on line 1 of config file is not in any section");
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(ConfigFileReader{config_path / "missing.ini"}.read());
    }

    SECTION("Malformed lines") {
        TempDir tmp;
        const auto path = tmp.path() / "config.ini";

        {
            std::ofstream file{path};
            file << "[junit4\n";
        }
        REQUIRE_THAT(ConfigFileReader{path}.read().error(), Catch::Matchers::StartsWith("Malformed section header"));

        {
            std::ofstream file{path};
            file << "[junit4]\njust a line\n";
        }
        REQUIRE_THAT(ConfigFileReader{path}.read().error(), Catch::Matchers::StartsWith("Expected `key = value`"));
    }
}

TEST_CASE("Default config file location") {
    const char* old_xdg = std::getenv("XDG_CONFIG_HOME");
    const std::string saved_xdg = old_xdg != nullptr ? old_xdg : "";

    REQUIRE(::setenv("XDG_CONFIG_HOME", "/xdg", 1) == 0);
    REQUIRE(ConfigFileReader::default_path() == std::filesystem::path{"/xdg/junitgrader/config.ini"});

    REQUIRE(::setenv("XDG_CONFIG_HOME", "", 1) == 0);
    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        REQUIRE(ConfigFileReader::default_path() ==
                std::filesystem::path{home} / ".config" / "junitgrader" / "config.ini");
    }

    if (old_xdg != nullptr) {
        REQUIRE(::setenv("XDG_CONFIG_HOME", saved_xdg.c_str(), 1) == 0);
    } else {
        REQUIRE(::unsetenv("XDG_CONFIG_HOME") == 0);
    }
}

TEST_CASE("Apply the junit4 section to grader options") {
    GraderOptions options;
    REQUIRE(junitgrader::apply_config(read_config("valid.ini"), options));

    REQUIRE(options.hamcrest_path == std::filesystem::path{"/usr/share/java/hamcrest-core-1.3.jar"});
    REQUIRE(options.junit_path == std::filesystem::path{"/usr/share/java/junit-4.12.jar"});
    REQUIRE(options.reference_tests_dir == std::filesystem::path{"/srv/reference-tests"});
    REQUIRE(options.timeout == std::chrono::seconds{25});
    REQUIRE(options.ignore_tests == std::vector<std::string>{"SlowTest.java", "FlakyTest.java"});
    REQUIRE(options.disable_security);
}

TEST_CASE("Other sections are ignored") {
    GraderOptions options;
    REQUIRE(junitgrader::apply_config(read_config("other_section.ini"), options));

    REQUIRE(options.timeout == GraderOptions::DEFAULT_TIMEOUT);
    REQUIRE_FALSE(options.junit_path);
}

TEST_CASE("Invalid config values") {
    GraderOptions options;

    auto timeout_res = junitgrader::apply_config(read_config("bad_timeout.ini"), options);
    REQUIRE_FALSE(timeout_res);
    REQUIRE(timeout_res.error() == "config value timeout in section [junit4] must be an integer, but was: ten");

    auto bool_res = junitgrader::apply_config(read_config("bad_bool.ini"), options);
    REQUIRE_FALSE(bool_res);
    REQUIRE(bool_res.error() ==
            "config value disable_security in section [junit4] must be true or false, but was: yes");
}

#include <catch2/catch_test_macros.hpp>
#include <hellod/config/env_file.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>

using namespace hellod::config;
namespace fs = std::filesystem;

namespace {

    // scratch directory removed with its contents at scope exit
    struct temp_directory {
        fs::path path;

        temp_directory() {
            auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            path = fs::temp_directory_path() / ("hellod_env_file_" + std::to_string(stamp));
            fs::create_directories(path);
        }

        ~temp_directory() {
            std::error_code ec;
            fs::remove_all(path, ec);
        }

        void write(const fs::path& relative, const std::string& content) const {
            fs::create_directories((path / relative).parent_path());
            std::ofstream(path / relative) << content;
        }
    };

    env_file parse(const std::string& content) {
        std::istringstream input(content);
        return env_file::parse(input);
    }

    std::string value_of(const env_file& file, const std::string& key) {
        const char* value = file.get(key);
        REQUIRE(value != nullptr);
        return value;
    }

}

TEST_CASE("Env file parsing", "[config][env_file][unit]") {

    SECTION("Plain assignments") {
        auto file = parse("PORT=8080\nHOST=0.0.0.0\n");
        REQUIRE(file.size() == 2);
        REQUIRE(value_of(file, "PORT") == "8080");
        REQUIRE(value_of(file, "HOST") == "0.0.0.0");
        REQUIRE(file.get("DEBUG") == nullptr);
    }

    SECTION("Comments and blank lines are skipped") {
        auto file = parse("# server settings\n\n   \nPORT=8080 # local port\n  # indented comment\n");
        REQUIRE(file.size() == 1);
        REQUIRE(value_of(file, "PORT") == "8080");
    }

    SECTION("Export prefix and surrounding whitespace") {
        auto file = parse("export DEBUG = true\n  LOG_REQUESTS=  off  \n");
        REQUIRE(value_of(file, "DEBUG") == "true");
        REQUIRE(value_of(file, "LOG_REQUESTS") == "off");
    }

    SECTION("Matching quotes are removed") {
        auto file = parse("A=\"quoted # not a comment\"\nB='single'\nC=\"unbalanced'\n");
        REQUIRE(value_of(file, "A") == "quoted # not a comment");
        REQUIRE(value_of(file, "B") == "single");
        REQUIRE(value_of(file, "C") == "\"unbalanced'");
    }

    SECTION("Empty values are kept") {
        auto file = parse("HOST=\n");
        REQUIRE(value_of(file, "HOST").empty());
    }

    SECTION("Lines without a name or separator are ignored") {
        auto file = parse("just text\n=value\nPORT=1\n");
        REQUIRE(file.size() == 1);
        REQUIRE(value_of(file, "PORT") == "1");
    }

    SECTION("Later assignments win") {
        auto file = parse("PORT=1\nPORT=2\n");
        REQUIRE(value_of(file, "PORT") == "2");
    }

    SECTION("Windows line endings") {
        auto file = parse("PORT=8080\r\nHOST=example\r\n");
        REQUIRE(value_of(file, "PORT") == "8080");
        REQUIRE(value_of(file, "HOST") == "example");
    }
}

TEST_CASE("Env file lookup on disk", "[config][env_file][unit]") {
    temp_directory root;
    root.write(".env", "PORT=4000\n");

    SECTION("Missing file") {
        REQUIRE_FALSE(env_file::load(root.path / "missing.env").has_value());
    }

    SECTION("Load records the path") {
        auto file = env_file::load(root.path / ".env");
        REQUIRE(file.has_value());
        REQUIRE(file->get_path() == root.path / ".env");
        REQUIRE(value_of(*file, "PORT") == "4000");
    }

    SECTION("Found in the start directory") {
        auto file = env_file::find(root.path);
        REQUIRE(file.has_value());
        REQUIRE(value_of(*file, "PORT") == "4000");
    }

    SECTION("Found up to three parent directories away") {
        fs::create_directories(root.path / "a" / "b" / "c");
        auto file = env_file::find(root.path / "a" / "b" / "c");
        REQUIRE(file.has_value());
        REQUIRE(file->get_path() == root.path / ".env");
    }

    SECTION("Not searched further than three parents") {
        fs::create_directories(root.path / "a" / "b" / "c" / "d");
        REQUIRE_FALSE(env_file::find(root.path / "a" / "b" / "c" / "d").has_value());
    }

    SECTION("The nearest file wins") {
        root.write("a/.env", "PORT=5000\n");
        fs::create_directories(root.path / "a" / "b");
        auto file = env_file::find(root.path / "a" / "b");
        REQUIRE(file.has_value());
        REQUIRE(value_of(*file, "PORT") == "5000");
    }
}

TEST_CASE("Env file feeds the server config", "[config][env_file][unit]") {
    auto file = parse("PORT=4000\nHOST=0.0.0.0\nDEBUG=yes\n");

    std::map<std::string, std::string> process{{"PORT", "9000"}};
    env_lookup process_env = [&process](const char* name) -> const char* {
        auto it = process.find(name);
        return it == process.end() ? nullptr : it->second.c_str();
    };

    auto config = server_config::from_environment(file.overlay(process_env));

    // the process environment is never overridden
    REQUIRE(config.port == 9000);
    REQUIRE(config.host == "0.0.0.0");
    REQUIRE(config.debug);
    REQUIRE(config.log_requests);
}

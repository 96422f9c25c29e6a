#ifndef HELLOD_CONFIG_ENV_FILE_HPP
#define HELLOD_CONFIG_ENV_FILE_HPP

#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include "server_config.hpp"

namespace hellod::config {

/**
 * KEY=VALUE pairs read from a .env file. Blank lines and '#' comments are
 * skipped, an "export " prefix is accepted and matching single or double
 * quotes around a value are removed. Values from the process environment
 * always win over the file.
 */
class env_file {
public:
    static constexpr const char* FILE_NAME = ".env";
    static constexpr unsigned MAX_PARENT_DIRECTORIES = 3;

    // parse the stream, source names the input in warnings
    static env_file parse(std::istream& input, const std::string& source = FILE_NAME);

    // parse the file, empty optional when it cannot be opened
    static std::optional<env_file> load(const std::filesystem::path& path);

    // first .env in start or one of its nearest parent directories
    static std::optional<env_file> find(const std::filesystem::path& start,
                                        unsigned parents = MAX_PARENT_DIRECTORIES);

    // nullptr when the key is not in the file
    const char* get(const std::string& key) const;

    size_t size() const { return values_.size(); }

    const std::filesystem::path& get_path() const { return path_; }

    // lookup answering from base first and from this file second, this
    // env_file must outlive the returned lookup
    env_lookup overlay(env_lookup base) const;

private:
    std::map<std::string, std::string> values_;
    std::filesystem::path path_;
};

}

#endif

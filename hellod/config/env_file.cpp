#include "env_file.hpp"
#include "../util/logger.hpp"

#include <fstream>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace hellod::config {

    namespace {
        const std::string export_prefix = "export ";

        void strip_quotes(std::string& value) {
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
                value = value.substr(1, value.size() - 2);
                return;
            }
            // unquoted values may carry a trailing " # comment"
            auto comment = value.find(" #");
            if (comment != std::string::npos) {
                value.erase(comment);
                boost::algorithm::trim_right(value);
            }
        }
    }

    env_file env_file::parse(std::istream& input, const std::string& source) {
        env_file file;
        std::string line;
        unsigned line_number = 0;

        while (std::getline(input, line)) {
            ++line_number;
            boost::algorithm::trim(line);
            if (line.empty() || line.front() == '#') continue;

            if (boost::algorithm::starts_with(line, export_prefix)) {
                line.erase(0, export_prefix.size());
            }

            auto separator = line.find('=');
            if (separator == std::string::npos) {
                LOG_WARNING("{}:{}: ignoring line without '='", source, line_number);
                continue;
            }

            auto key = boost::algorithm::trim_copy(line.substr(0, separator));
            auto value = boost::algorithm::trim_copy(line.substr(separator + 1));
            if (key.empty()) {
                LOG_WARNING("{}:{}: ignoring line without a name", source, line_number);
                continue;
            }

            strip_quotes(value);
            // later definitions replace earlier ones
            file.values_[key] = value;
        }
        return file;
    }

    std::optional<env_file> env_file::load(const std::filesystem::path& path) {
        std::ifstream input(path);
        if (!input.is_open()) return std::nullopt;

        auto file = parse(input, path.string());
        file.path_ = path;
        return file;
    }

    std::optional<env_file> env_file::find(const std::filesystem::path& start, unsigned parents) {
        auto directory = start;
        for (unsigned level = 0; level <= parents; ++level) {
            auto candidate = directory / FILE_NAME;
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec)) {
                return load(candidate);
            }
            if (!directory.has_parent_path() || directory.parent_path() == directory) break;
            directory = directory.parent_path();
        }
        return std::nullopt;
    }

    const char* env_file::get(const std::string& key) const {
        auto it = values_.find(key);
        return it != values_.end() ? it->second.c_str() : nullptr;
    }

    env_lookup env_file::overlay(env_lookup base) const {
        return [this, base = std::move(base)](const char* name) -> const char* {
            if (const char* value = base(name)) return value;
            return get(name);
        };
    }

}

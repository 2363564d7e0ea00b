// src/core/env_loader.cpp

#include "shroud/core/env_loader.hpp"
#include <cstdlib>
#include <fstream>

namespace shroud {

Result<void> EnvLoader::load(const std::string& filepath, bool overwrite) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to open .env file: " + filepath,
                                "EnvLoader");
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        size_t delimiter_pos = line.find('=');
        if (delimiter_pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, delimiter_pos);
        std::string value = line.substr(delimiter_pos + 1);

        key.erase(key.find_last_not_of(" \t\r\n") + 1);
        key.erase(0, key.find_first_not_of(" \t"));
        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        if (key.empty()) {
            continue;
        }

        if (setenv(key.c_str(), value.c_str(), overwrite ? 1 : 0) != 0) {
            return make_error<void>(ErrorCode::UNKNOWN_ERROR, "Failed to set " + key,
                                    "EnvLoader");
        }
    }
    return Result<void>();
}

Result<std::string> EnvLoader::require(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return make_error<std::string>(ErrorCode::NOT_INITIALIZED,
                                       "Environment variable " + name + " is not set",
                                       "EnvLoader");
    }
    return std::string(value);
}

std::string EnvLoader::get(const std::string& name, const std::string& fallback) {
    const char* value = std::getenv(name.c_str());
    return value == nullptr ? fallback : std::string(value);
}

}  // namespace shroud

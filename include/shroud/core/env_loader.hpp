// include/shroud/core/env_loader.hpp
#pragma once

#include <string>
#include "shroud/core/error.hpp"

namespace shroud {

/**
 * @brief Reads KEY=VALUE files into the process environment and looks up secrets
 */
class EnvLoader {
public:
    /**
     * @brief Set every KEY=VALUE line of a .env file; lines starting with '#' are skipped
     * @param overwrite Replace variables that are already set
     */
    static Result<void> load(const std::string& filepath, bool overwrite = false);

    /**
     * @return NOT_INITIALIZED if the variable is unset or empty
     */
    static Result<std::string> require(const std::string& name);

    static std::string get(const std::string& name, const std::string& fallback = "");
};

}  // namespace shroud

#pragma once

#include <stdexcept>
#include <string>

namespace accessroute {

/// Invalid or unreadable configuration
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace accessroute

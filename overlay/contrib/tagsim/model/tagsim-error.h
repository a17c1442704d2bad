#pragma once

#include <stdexcept>
#include <string>

namespace tagsim {

// Raised while loading or preparing a scenario. The message names the
// offending field and value; nothing is simulated after one is thrown.
class ConfigError : public std::runtime_error
{
public:
  explicit ConfigError(const std::string& what)
    : std::runtime_error(what)
  {
  }
};

} // namespace tagsim

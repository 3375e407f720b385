#pragma once
#include <stdexcept>
#include <string>

namespace brownbot {

class Error : public std::runtime_error {
public:
  Error(const std::string& where, const std::string& message)
    : std::runtime_error("[" + where + "] " + message) {}
};

// Malformed or out-of-range configuration; the run never starts.
class ConfigError : public Error {
public:
  using Error::Error;
};

// Writing an artifact (GIF, frame image) failed; simulation results are unaffected.
class OutputError : public Error {
public:
  using Error::Error;
};

} // namespace brownbot

#pragma once

#include <stdexcept>
#include <string>

// Malformed or unusable configuration. Only the unrecoverable cases are thrown.
class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};

// The progress database exists but cannot be read as one.
class StoreCorruptionError : public std::runtime_error {
  public:
    explicit StoreCorruptionError(const std::string &msg) : std::runtime_error(msg) {}
};

// Unknown command, missing argument or unknown task id.
class InvalidCommandError : public std::runtime_error {
  public:
    explicit InvalidCommandError(const std::string &msg) : std::runtime_error(msg) {}
};

class DurationParseError : public std::runtime_error {
  public:
    explicit DurationParseError(const std::string &msg) : std::runtime_error(msg) {}
};

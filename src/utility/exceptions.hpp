#pragma once

#include <stdexcept>
#include <string>

namespace chromatone {

/**
 * Base exception class for all chromatone errors
 */
class ChromatoneException : public std::runtime_error {
  public:
    explicit ChromatoneException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Color input that cannot be decoded to three byte-range channels
 */
class InvalidColorFormat : public ChromatoneException {
  public:
    explicit InvalidColorFormat(const std::string &message)
        : ChromatoneException("Invalid color format: " + message) {}
};

/**
 * Classification requested on an empty sample list
 */
class EmptyInputError : public ChromatoneException {
  public:
    explicit EmptyInputError(const std::string &message)
        : ChromatoneException("Empty input: " + message) {}
};

/**
 * Undertone key outside of warm/cool/neutral
 */
class UnknownCategoryError : public ChromatoneException {
  public:
    explicit UnknownCategoryError(const std::string &message)
        : ChromatoneException("Unknown undertone category: " + message) {}
};

/**
 * Exception for I/O operations (file read/write, JSON parsing)
 */
class IOError : public ChromatoneException {
  public:
    explicit IOError(const std::string &message)
        : ChromatoneException("I/O error: " + message) {}
};

/**
 * Exception for configuration validation errors
 */
class ConfigError : public ChromatoneException {
  public:
    explicit ConfigError(const std::string &message)
        : ChromatoneException("Configuration error: " + message) {}
};

} // namespace chromatone

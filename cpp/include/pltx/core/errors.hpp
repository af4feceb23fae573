#pragma once

/**
 * @file errors.hpp
 * @brief Exception types raised by the PLTX core
 *
 * All errors derive from std::runtime_error. Each one is local to the
 * operation that raised it: an open attempt, a lookup, or one stream.
 */

#include <stdexcept>
#include <string>

namespace pltx {

/// Why a file could not be opened
enum class OpenErrorKind {
    NOT_FOUND,
    BAD_HEADER,
    BAD_INDEX,
    IO_ERROR
};

/// Why a chunk could not be decoded
enum class DecodeErrorKind {
    SIZE_MISMATCH,
    CORRUPT_STREAM,
    TRUNCATED,
    UNSUPPORTED_COMPRESSION
};

inline const char* to_string(OpenErrorKind kind) {
    switch (kind) {
        case OpenErrorKind::NOT_FOUND:  return "NotFound";
        case OpenErrorKind::BAD_HEADER: return "BadHeader";
        case OpenErrorKind::BAD_INDEX:  return "BadIndex";
        case OpenErrorKind::IO_ERROR:   return "IoError";
    }
    return "Unknown";
}

inline const char* to_string(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::SIZE_MISMATCH:           return "SizeMismatch";
        case DecodeErrorKind::CORRUPT_STREAM:          return "CorruptStream";
        case DecodeErrorKind::TRUNCATED:               return "Truncated";
        case DecodeErrorKind::UNSUPPORTED_COMPRESSION: return "UnsupportedCompression";
    }
    return "Unknown";
}

/**
 * @brief A file could not be opened (missing, bad header, bad index, I/O)
 */
class OpenError : public std::runtime_error {
public:
    OpenError(OpenErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message)
        , kind_(kind) {}

    OpenErrorKind kind() const { return kind_; }

private:
    OpenErrorKind kind_;
};

/**
 * @brief Unknown signal, public name or reader id
 */
class LookupError : public std::runtime_error {
public:
    explicit LookupError(const std::string& name)
        : std::runtime_error("Unknown signal: " + name), name_(name) {}

    LookupError(const std::string& what, const std::string& name)
        : std::runtime_error(what), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/**
 * @brief A chunk payload could not be turned into samples
 */
class DecodeError : public std::runtime_error {
public:
    DecodeError(DecodeErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message)
        , kind_(kind) {}

    DecodeErrorKind kind() const { return kind_; }

private:
    DecodeErrorKind kind_;
};

/**
 * @brief A physical read failed or fell outside the file
 */
class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& message)
        : std::runtime_error("I/O error: " + message) {}
};

} // namespace pltx

/**
 * @file errors.hpp
 * @brief Exception hierarchy shared by the grammar compiler and the client.
 *
 * Every failure mmbind reports is one of these types. Nothing below
 * Error is swallowed internally; the only local recovery offered is
 * Connection::reconnect().
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include "mmbind/core/export.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace mmbind {
namespace core {

/**
 * @brief Root of all mmbind errors.
 */
class MMBIND_CORE_API Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Call arguments do not match any candidate pattern.
 *
 * Raised client-side before anything is written to the socket.
 */
class MMBIND_CORE_API ValidationError : public Error {
public:
    ValidationError(const std::string& argument, const std::string& expected,
                    const std::string& detail)
        : Error("invalid argument '" + argument + "' (expected " + expected + "): " + detail)
        , argument_(argument)
        , expected_(expected)
    {}

    const std::string& argument() const { return argument_; }
    const std::string& expected() const { return expected_; }

private:
    std::string argument_;
    std::string expected_;
};

/**
 * @brief Transport failure: connect, write, read, timeout or peer close.
 */
class MMBIND_CORE_API ConnectionError : public Error {
public:
    explicit ConnectionError(const std::string& message) : Error(message) {}
};

/**
 * @brief The daemon reported a non-empty Error field for the active frame.
 */
class MMBIND_CORE_API CommandError : public Error {
public:
    CommandError(const std::string& command, const std::string& daemonError)
        : Error(daemonError)
        , command_(command)
    {}

    const std::string& command() const { return command_; }

private:
    std::string command_;
};

/**
 * @brief The caller broke the streaming-drain discipline.
 */
class MMBIND_CORE_API ProtocolUsageError : public Error {
public:
    explicit ProtocolUsageError(const std::string& message) : Error(message) {}
};

/**
 * @brief Malformed file listing, grammar document or response framing.
 */
class MMBIND_CORE_API ParseError : public Error {
public:
    explicit ParseError(const std::string& message) : Error(message) {}
};

/**
 * @brief The daemon grammar cannot be compiled. Fatal to generation.
 */
class MMBIND_CORE_API GrammarError : public Error {
public:
    explicit GrammarError(const std::string& message) : Error(message) {}
};

class MMBIND_CORE_API UnknownArgumentType : public GrammarError {
public:
    explicit UnknownArgumentType(uint32_t bitmask)
        : GrammarError("unknown argument type bitmask " + std::to_string(bitmask))
        , bitmask_(bitmask)
    {}

    uint32_t bitmask() const { return bitmask_; }

private:
    uint32_t bitmask_;
};

class MMBIND_CORE_API DuplicateCommand : public GrammarError {
public:
    explicit DuplicateCommand(const std::string& path)
        : GrammarError("duplicate command '" + path + "'")
        , path_(path)
    {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief A command word has no alphabetic characters to name it by.
 */
class MMBIND_CORE_API InvalidCommandName : public GrammarError {
public:
    InvalidCommandName(const std::string& prefix, const std::string& word)
        : GrammarError("command '" + prefix + "' has unusable word '" + word + "'")
    {}
};

}  // namespace core
}  // namespace mmbind

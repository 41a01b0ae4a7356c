/**
 * @file argument.hpp
 * @brief Values passed to bound commands.
 *
 * Every argument is rendered to one or more wire tokens before it leaves
 * the process: strings stay as they are, booleans become "true"/"false",
 * numbers their decimal form, and lists one token per element.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include "mmbind_client/export.hpp"

#include <charconv>
#include <initializer_list>
#include <map>
#include <string>
#include <type_traits>
#include <vector>

namespace mmbind {
namespace client {

/**
 * @class Argument
 * @brief A scalar or list argument, already coerced to text.
 */
class MMBIND_CLIENT_API Argument {
public:
    Argument(const char* value)
        : tokens_{std::string(value)}
    {}

    Argument(std::string value)
        : tokens_{std::move(value)}
    {}

    Argument(bool value)
        : tokens_{value ? "true" : "false"}
    {}

    template <typename T,
              typename = std::enable_if_t<std::is_arithmetic<T>::value &&
                                          !std::is_same<T, bool>::value &&
                                          !std::is_same<T, char>::value>>
    Argument(T value)
        : tokens_{numberText(value)}
    {}

    template <typename T>
    Argument(const std::vector<T>& values)
        : list_(true)
    {
        tokens_.reserve(values.size());
        for (const auto& value : values) {
            Argument element(value);
            tokens_.push_back(element.tokens_.front());
        }
    }

    /**
     * @brief A list argument built in place: Argument::list({"a", "b"}).
     */
    static Argument list(std::initializer_list<std::string> values) {
        return Argument(std::vector<std::string>(values));
    }

    bool isList() const { return list_; }

    /// Wire tokens: exactly one for a scalar, one per element for a list
    const std::vector<std::string>& tokens() const { return tokens_; }

    /// The scalar value; the first element of a list, "" for an empty one
    std::string text() const { return tokens_.empty() ? std::string() : tokens_.front(); }

private:
    /// Shortest decimal text that reads back as the same value
    template <typename T>
    static std::string numberText(T value) {
        char buffer[64];
        const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
        return std::string(buffer, result.ptr);
    }

    std::vector<std::string> tokens_;
    bool list_ = false;
};

/**
 * @brief Arguments of one call: positionals in order, keywords by slot name.
 */
struct CallArguments {
    std::vector<Argument> positional;
    std::map<std::string, Argument> keywords;
};

}  // namespace client
}  // namespace mmbind

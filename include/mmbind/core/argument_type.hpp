/**
 * @file argument_type.hpp
 * @brief Classification of daemon grammar argument bitmasks.
 *
 * The daemon describes each pattern item with a bitmask: bit 0 marks the
 * item optional, bits 1-5 name exactly one base kind.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include "mmbind/core/export.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mmbind {
namespace core {

constexpr uint32_t OPTIONAL_ITEM   = 1u << 0;
constexpr uint32_t LITERAL_ITEM    = 1u << 1;
constexpr uint32_t SUBCOMMAND_ITEM = 1u << 2;
constexpr uint32_t STRING_ITEM     = 1u << 3;
constexpr uint32_t CHOICE_ITEM     = 1u << 4;
constexpr uint32_t LIST_ITEM       = 1u << 5;

/**
 * @enum ArgumentKind
 * @brief Base kind of one argument slot. Declaration order is scan order.
 */
enum class ArgumentKind {
    LITERAL,
    SUBCOMMAND,
    STRING,
    CHOICE,
    LIST
};

/**
 * @brief Name used in diagnostics and generated code ("literal", "choice", ...).
 */
MMBIND_CORE_API const char* argumentKindName(ArgumentKind kind);

/**
 * @brief Classified, user-facing shape of one argument slot.
 */
struct ArgumentSpec {
    ArgumentKind kind = ArgumentKind::STRING;
    bool optional = false;

    bool operator==(const ArgumentSpec& other) const {
        return kind == other.kind && optional == other.optional;
    }
    bool operator!=(const ArgumentSpec& other) const { return !(*this == other); }
};

/**
 * @brief Map a bitmask to its base kind, ignoring the optional bit.
 * @throws UnknownArgumentType if no kind bit, several kind bits, or any
 *         bit outside the known set is present.
 */
MMBIND_CORE_API ArgumentKind classifyArgument(uint32_t bitmask);

/**
 * @brief classifyArgument() plus the optional flag.
 */
MMBIND_CORE_API ArgumentSpec classifyArgumentSpec(uint32_t bitmask);

/**
 * @brief One slot of a leaf command's candidate pattern.
 *
 * Carries what is needed to validate a value at call time: the literal
 * text a literal slot requires, the allowed values of a choice slot and
 * the keyword name a caller may use for it.
 */
struct ArgumentSlot {
    ArgumentSpec spec;
    std::string key;
    std::string text;
    std::vector<std::string> choices;

    /**
     * @brief Keyword name: the key, or the text when the grammar has no key.
     */
    const std::string& name() const { return key.empty() ? text : key; }
};

using CandidatePattern = std::vector<ArgumentSlot>;

}  // namespace core
}  // namespace mmbind

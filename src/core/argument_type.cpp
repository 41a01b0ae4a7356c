/**
 * @file argument_type.cpp
 * @brief Argument bitmask classification.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#include "mmbind/core/argument_type.hpp"
#include "mmbind/core/errors.hpp"

#include <array>
#include <utility>

namespace mmbind {
namespace core {

namespace {

constexpr std::array<std::pair<uint32_t, ArgumentKind>, 5> KIND_BITS = {{
    {LITERAL_ITEM,    ArgumentKind::LITERAL},
    {SUBCOMMAND_ITEM, ArgumentKind::SUBCOMMAND},
    {STRING_ITEM,     ArgumentKind::STRING},
    {CHOICE_ITEM,     ArgumentKind::CHOICE},
    {LIST_ITEM,       ArgumentKind::LIST},
}};

constexpr uint32_t KNOWN_BITS =
    OPTIONAL_ITEM | LITERAL_ITEM | SUBCOMMAND_ITEM | STRING_ITEM | CHOICE_ITEM | LIST_ITEM;

}  // namespace

const char* argumentKindName(ArgumentKind kind) {
    switch (kind) {
        case ArgumentKind::LITERAL:    return "literal";
        case ArgumentKind::SUBCOMMAND: return "subcommand";
        case ArgumentKind::STRING:     return "string";
        case ArgumentKind::CHOICE:     return "choice";
        case ArgumentKind::LIST:       return "list";
        default:                       return "unknown";
    }
}

ArgumentKind classifyArgument(uint32_t bitmask) {
    if ((bitmask & ~KNOWN_BITS) != 0) {
        throw UnknownArgumentType(bitmask);
    }

    const uint32_t kindBits = bitmask & ~OPTIONAL_ITEM;

    for (const auto& [bit, kind] : KIND_BITS) {
        if (kindBits & bit) {
            // Kinds are mutually exclusive; a second bit means a grammar we
            // do not understand.
            if (kindBits != bit) {
                throw UnknownArgumentType(bitmask);
            }
            return kind;
        }
    }

    throw UnknownArgumentType(bitmask);
}

ArgumentSpec classifyArgumentSpec(uint32_t bitmask) {
    ArgumentSpec spec;
    spec.kind = classifyArgument(bitmask);
    spec.optional = (bitmask & OPTIONAL_ITEM) != 0;
    return spec;
}

}  // namespace core
}  // namespace mmbind

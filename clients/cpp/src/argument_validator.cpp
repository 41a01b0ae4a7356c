/**
 * @file argument_validator.cpp
 * @brief Pattern matching of call arguments.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#include "mmbind_client/argument_validator.hpp"

#include <mmbind/core/errors.hpp>
#include <mmbind/utils/string_utils.hpp>

#include <algorithm>
#include <optional>

namespace mmbind {
namespace client {

namespace {

using core::ArgumentKind;
using core::ArgumentSlot;
using core::CandidatePattern;

/// Failures that say something about a value outrank missing or surplus ones
enum class FailureRank { SURPLUS = 0, MISSING = 1, VALUE = 2 };

struct MatchFailure {
    FailureRank rank;
    size_t depth;
    std::string argument;
    std::string expected;
    std::string detail;

    bool outranks(const MatchFailure& other) const {
        if (rank != other.rank) {
            return rank > other.rank;
        }
        return depth > other.depth;
    }
};

std::string displayName(const ArgumentSlot& slot, size_t index) {
    if (!slot.name().empty()) {
        return slot.name();
    }
    return "argument " + std::to_string(index + 1);
}

/**
 * @brief Backtracking matcher for one candidate pattern.
 */
class PatternMatcher {
public:
    PatternMatcher(const CandidatePattern& slots, const CallArguments& args)
        : slots_(slots)
        , args_(args)
    {}

    bool match(std::vector<std::string>& tokens) {
        for (const auto& [name, value] : args_.keywords) {
            const bool known = std::any_of(slots_.begin(), slots_.end(),
                [&name](const ArgumentSlot& slot) { return slot.name() == name; });
            if (!known) {
                fail({FailureRank::SURPLUS, 0, name, "nothing", "unknown keyword argument"});
                return false;
            }
        }
        return matchFrom(0, 0, tokens);
    }

    const std::optional<MatchFailure>& failure() const { return failure_; }

private:
    bool matchFrom(size_t index, size_t positional, std::vector<std::string>& tokens) {
        if (index == slots_.size()) {
            if (positional < args_.positional.size()) {
                fail({FailureRank::SURPLUS, index,
                      "argument " + std::to_string(positional + 1), "nothing",
                      "unexpected extra argument '" + args_.positional[positional].text() + "'"});
                return false;
            }
            return true;
        }

        const ArgumentSlot& slot = slots_[index];
        const size_t mark = tokens.size();

        auto keyword = args_.keywords.find(slot.name());
        if (keyword != args_.keywords.end()) {
            if (accept(slot, index, keyword->second, tokens) &&
                matchFrom(index + 1, positional, tokens)) {
                return true;
            }
            tokens.resize(mark);
            return false;
        }

        if (positional < args_.positional.size()) {
            if (accept(slot, index, args_.positional[positional], tokens) &&
                matchFrom(index + 1, positional + 1, tokens)) {
                return true;
            }
            tokens.resize(mark);
            return slot.spec.optional && matchFrom(index + 1, positional, tokens);
        }

        if (slot.spec.optional) {
            return matchFrom(index + 1, positional, tokens);
        }

        fail({FailureRank::MISSING, index, displayName(slot, index),
              core::argumentKindName(slot.spec.kind), "missing required argument"});
        return false;
    }

    bool accept(const ArgumentSlot& slot, size_t index, const Argument& value,
                std::vector<std::string>& tokens) {
        const std::string kind = core::argumentKindName(slot.spec.kind);

        auto reject = [&](const std::string& detail) {
            fail({FailureRank::VALUE, index, displayName(slot, index), kind, detail});
            return false;
        };

        switch (slot.spec.kind) {
            case ArgumentKind::LITERAL:
                if (value.isList()) {
                    return reject("expected a single value, got a list");
                }
                if (value.text() != slot.text) {
                    return reject("expected '" + slot.text + "', got '" + value.text() + "'");
                }
                tokens.push_back(value.text());
                return true;

            case ArgumentKind::STRING:
                if (value.isList()) {
                    return reject("expected a single value, got a list");
                }
                tokens.push_back(value.text());
                return true;

            case ArgumentKind::CHOICE:
                if (value.isList()) {
                    return reject("expected a single value, got a list");
                }
                if (std::find(slot.choices.begin(), slot.choices.end(), value.text()) ==
                    slot.choices.end()) {
                    return reject("'" + value.text() + "' is not one of: " +
                                  utils::join(slot.choices, ", "));
                }
                tokens.push_back(value.text());
                return true;

            case ArgumentKind::LIST:
                if (!value.isList()) {
                    return reject("expected a list, got '" + value.text() + "'");
                }
                if (value.tokens().empty() && !slot.spec.optional) {
                    return reject("expected at least one value");
                }
                tokens.insert(tokens.end(), value.tokens().begin(), value.tokens().end());
                return true;

            case ArgumentKind::SUBCOMMAND:
                if (value.tokens().empty()) {
                    return reject("expected a command");
                }
                tokens.insert(tokens.end(), value.tokens().begin(), value.tokens().end());
                return true;
        }
        return reject("unsupported argument kind");
    }

    void fail(MatchFailure failure) {
        if (!failure_ || failure.outranks(*failure_)) {
            failure_ = std::move(failure);
        }
    }

    const CandidatePattern& slots_;
    const CallArguments& args_;
    std::optional<MatchFailure> failure_;
};

}  // namespace

std::vector<std::string> ArgumentValidator::validate(
    const std::string& command,
    const std::vector<CandidatePattern>& candidates,
    const CallArguments& args) {

    if (candidates.empty()) {
        if (args.positional.empty() && args.keywords.empty()) {
            return {};
        }
        throw core::ValidationError("argument 1", "nothing",
                                    "'" + command + "' takes no arguments");
    }

    std::optional<MatchFailure> best;
    for (const auto& candidate : candidates) {
        std::vector<std::string> tokens;
        PatternMatcher matcher(candidate, args);
        if (matcher.match(tokens)) {
            return tokens;
        }
        const auto& failure = matcher.failure();
        if (failure && (!best || failure->outranks(*best))) {
            best = failure;
        }
    }

    if (!best) {
        throw core::ValidationError("arguments", "a matching pattern",
                                    "no pattern of '" + command + "' accepts them");
    }
    throw core::ValidationError(best->argument, best->expected,
                                best->detail + " for '" + command + "'");
}

}  // namespace client
}  // namespace mmbind

/**
 * @file command_descriptor.cpp
 * @brief Grammar dump decoding with jsoncpp.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#include "mmbind/core/command_descriptor.hpp"
#include "mmbind/core/errors.hpp"
#include "mmbind/utils/logger.hpp"

#include <json/json.h>

#include <iterator>
#include <memory>

namespace mmbind {
namespace core {

namespace {

std::string optionalString(const Json::Value& obj, const char* field) {
    const Json::Value& value = obj[field];
    if (value.isNull()) {
        return "";
    }
    if (!value.isString()) {
        throw ParseError(std::string("grammar field '") + field + "' is not a string");
    }
    return value.asString();
}

std::vector<std::string> stringArray(const Json::Value& obj, const char* field) {
    std::vector<std::string> result;
    const Json::Value& value = obj[field];
    if (value.isNull()) {
        return result;
    }
    if (!value.isArray()) {
        throw ParseError(std::string("grammar field '") + field + "' is not an array");
    }
    for (const auto& entry : value) {
        if (!entry.isString()) {
            throw ParseError(std::string("grammar field '") + field + "' holds a non-string");
        }
        result.push_back(entry.asString());
    }
    return result;
}

PatternItem decodeItem(const Json::Value& obj) {
    if (!obj.isObject() || !obj["type"].isUInt()) {
        throw ParseError("pattern item without a valid 'type'");
    }

    PatternItem item;
    item.type = static_cast<uint32_t>(obj["type"].asUInt());
    item.key = optionalString(obj, "key");
    item.text = optionalString(obj, "text");
    item.options = stringArray(obj, "options");
    return item;
}

CommandDescriptor decodeDescriptor(const Json::Value& obj) {
    if (!obj.isObject()) {
        throw ParseError("grammar entry is not an object");
    }
    if (!obj["shared_prefix"].isString()) {
        throw ParseError("grammar entry without 'shared_prefix'");
    }

    CommandDescriptor desc;
    desc.sharedPrefix = obj["shared_prefix"].asString();
    desc.helpShort = optionalString(obj, "help_short");
    desc.helpLong = optionalString(obj, "help_long");
    desc.patterns = stringArray(obj, "patterns");

    const Json::Value& parsed = obj["parsed_patterns"];
    if (!parsed.isArray()) {
        throw ParseError("command '" + desc.sharedPrefix + "' has no 'parsed_patterns'");
    }
    for (const auto& pattern : parsed) {
        if (!pattern.isArray()) {
            throw ParseError("command '" + desc.sharedPrefix + "' has a non-array pattern");
        }
        ArgumentPattern items;
        items.reserve(pattern.size());
        for (const auto& item : pattern) {
            items.push_back(decodeItem(item));
        }
        desc.parsedPatterns.push_back(std::move(items));
    }

    return desc;
}

}  // namespace

std::vector<CommandDescriptor> parseDescriptors(const std::string& document) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;

    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(document.data(), document.data() + document.size(), &root, &errors)) {
        throw ParseError("malformed grammar document: " + errors);
    }
    if (!root.isArray()) {
        throw ParseError("grammar document is not a JSON array");
    }

    std::vector<CommandDescriptor> descriptors;
    descriptors.reserve(root.size());
    for (const auto& entry : root) {
        descriptors.push_back(decodeDescriptor(entry));
    }

    LOG_DEBUG("CommandTree", "Decoded {} command descriptors", descriptors.size());
    return descriptors;
}

std::vector<CommandDescriptor> readDescriptors(std::istream& input) {
    std::string document((std::istreambuf_iterator<char>(input)),
                         std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw ParseError("failed to read grammar input");
    }
    return parseDescriptors(document);
}

}  // namespace core
}  // namespace mmbind

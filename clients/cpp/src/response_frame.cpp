/**
 * @file response_frame.cpp
 * @brief Response frame decoding.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#include "mmbind_client/response_frame.hpp"

#include <mmbind/core/errors.hpp>

namespace mmbind {
namespace client {

namespace {

std::string compactJson(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, value);
}

std::string stringField(const Json::Value& obj, const char* field) {
    const Json::Value& value = obj[field];
    if (value.isNull()) {
        return "";
    }
    if (!value.isString()) {
        throw core::ParseError(std::string("response field '") + field + "' is not a string");
    }
    return value.asString();
}

std::vector<std::string> stringRow(const Json::Value& row, const char* field) {
    std::vector<std::string> result;
    if (row.isNull()) {
        return result;
    }
    if (!row.isArray()) {
        throw core::ParseError(std::string("response field '") + field + "' is not an array");
    }
    result.reserve(row.size());
    for (const auto& cell : row) {
        if (cell.isString()) {
            result.push_back(cell.asString());
        } else if (cell.isNull()) {
            result.emplace_back();
        } else {
            result.push_back(compactJson(cell));
        }
    }
    return result;
}

}  // namespace

std::string ResponseFrame::responseText() const {
    if (response.isNull()) {
        return "";
    }
    if (response.isString()) {
        return response.asString();
    }
    return compactJson(response);
}

ResponseFrame ResponseFrame::fromJson(const Json::Value& value) {
    if (!value.isObject()) {
        throw core::ParseError("response frame is not a JSON object");
    }

    ResponseFrame frame;
    frame.host = stringField(value, "Host");
    frame.response = value["Response"];
    frame.error = stringField(value, "Error");
    frame.header = stringRow(value["Header"], "Header");

    const Json::Value& tabular = value["Tabular"];
    if (!tabular.isNull()) {
        if (!tabular.isArray()) {
            throw core::ParseError("response field 'Tabular' is not an array");
        }
        for (const auto& row : tabular) {
            frame.tabular.push_back(stringRow(row, "Tabular"));
        }
    }

    return frame;
}

}  // namespace client
}  // namespace mmbind

/**
 * @file response_frame.hpp
 * @brief One unit of daemon output.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include "mmbind_client/export.hpp"

#include <json/json.h>

#include <string>
#include <vector>

namespace mmbind {
namespace client {

/**
 * @brief A decoded response frame.
 *
 * Wire form:
 * @code
 * {"Host": "node1", "Response": "hello there", "Header": [...],
 *  "Tabular": [[...], ...], "Error": ""}
 * @endcode
 */
struct MMBIND_CLIENT_API ResponseFrame {
    std::string host;
    Json::Value response;   ///< Usually a string; structured for some commands
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> tabular;
    std::string error;

    bool hasError() const { return !error.empty(); }

    /**
     * @brief Response as text: the string itself, "" for null, compact
     *        JSON for structured values.
     */
    std::string responseText() const;

    /**
     * @brief Decode one frame object.
     * @throws core::ParseError if the object has the wrong shape.
     */
    static ResponseFrame fromJson(const Json::Value& value);
};

}  // namespace client
}  // namespace mmbind

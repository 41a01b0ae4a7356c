/**
 * @file command_handle.hpp
 * @brief Invocable daemon command bound to a connection.
 *
 * Generated bindings derive one class per invocable command from
 * CommandHandle; the dynamic Binding hands them out directly.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include "mmbind_client/argument.hpp"
#include "mmbind_client/connection.hpp"
#include "mmbind_client/export.hpp"
#include "mmbind_client/response_frame.hpp"

#include <mmbind/core/argument_type.hpp>

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace mmbind {
namespace client {

/**
 * @class CommandHandle
 * @brief Validates call arguments and forwards them to the connection.
 *
 * Usage:
 * @code
 * CommandHandle echo(conn, "echo", echoCandidates);
 * auto frame = echo("hello", "there");
 * auto info = vmInfo({{}, {{"summary", "summary"}}});   // keyword form
 * @endcode
 *
 * The handle borrows the connection and the candidate table.
 */
class MMBIND_CLIENT_API CommandHandle {
public:
    CommandHandle(Connection& connection,
                  std::string name,
                  const std::vector<core::CandidatePattern>& candidates)
        : connection_(&connection)
        , name_(std::move(name))
        , candidates_(&candidates)
    {}

    /// Command name sent on the wire
    const std::string& name() const { return name_; }

    const std::vector<core::CandidatePattern>& candidates() const { return *candidates_; }

    /**
     * @brief Validate and send; returns the first response frame.
     * @throws core::ValidationError before anything is sent if no
     *         candidate pattern accepts the arguments.
     */
    ResponseFrame operator()(const CallArguments& args) const;

    /**
     * @brief Positional form: handle("a", 1, true).
     */
    template <typename... Args,
              typename = std::enable_if_t<(std::is_constructible<Argument, Args&&>::value && ...)>>
    ResponseFrame operator()(Args&&... args) const {
        return (*this)(positional(std::forward<Args>(args)...));
    }

    /**
     * @brief Validate and send in streaming mode; frames are left queued
     *        for Connection::drainStream().
     */
    void stream(const CallArguments& args) const;

    template <typename... Args,
              typename = std::enable_if_t<(std::is_constructible<Argument, Args&&>::value && ...)>>
    void stream(Args&&... args) const {
        stream(positional(std::forward<Args>(args)...));
    }

    /**
     * @brief Wire tokens for @p args without sending anything.
     */
    std::vector<std::string> tokens(const CallArguments& args) const;

private:
    template <typename... Args>
    static CallArguments positional(Args&&... args) {
        CallArguments call;
        call.positional.reserve(sizeof...(Args));
        (call.positional.emplace_back(std::forward<Args>(args)), ...);
        return call;
    }

    Connection* connection_;
    std::string name_;
    const std::vector<core::CandidatePattern>* candidates_;
};

}  // namespace client
}  // namespace mmbind

/*
    Copyright (c) 2016 Tempest contributors as noted in the AUTHORS file.
    This file is part of Tempest.
    Tempest is free software; you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.
    Tempest is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Lesser General Public License for more details.
    You should have received a copy of the GNU Lesser General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/

#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <string>
#include <system_error>

#include <boost/optional/optional.hpp>

#include "tempest/framework/forwards.hpp"
#include "tempest/framework/payload.hpp"
#include "tempest/framework/state.hpp"

/// This module provides the failure taxonomy: the closed set of errors that are allowed to
/// terminate or interrupt a workflow or an activity execution.
///
/// All errors are immutable after construction. The cause of an error can only be given to its
/// constructor, so a cause chain is always built bottom-up and can never reference itself.

namespace tempest {

namespace framework {

namespace error {

/// Failure kinds. Each concrete failure error is identified by exactly one of them.
enum failure_errors {
    /// Application-level failure raised by the user code.
    application = 1,
    /// Cooperative cancellation of a workflow or an activity.
    cancelled,
    /// Externally forced termination.
    terminated,
    /// Workflow or activity timeout.
    timeout,
    /// Failure originated from the orchestration backend itself.
    server,
    /// Failure of a scheduled activity.
    activity,
    /// Failure of a child workflow execution.
    child_workflow,
    /// Workflow execution with the same id is already running.
    workflow_already_started,
    /// Wire failure with a failure info this version does not recognize.
    unknown
};

/// Conversion specific error codes.
enum converter_errors {
    /// Unable to encode failure attributes into the payload.
    attributes_encoding_failed = 1
};

/// Identifies the failure error category by returning an const lvalue reference to it.
const std::error_category& failure_category();

/// Identifies the conversion error category by returning an const lvalue reference to it.
const std::error_category& converter_category();

/*!
 * Constructs an `failure_errors` error code.
 *
 * This function is called by the constructor of std::error_code when given an `failure_errors`
 * argument.
 */
std::error_code make_error_code(failure_errors err);

/*!
 * Constructs an `failure_errors` error condition.
 *
 * This function is called by the constructor of std::error_condition when given an
 * `failure_errors` argument.
 */
std::error_condition make_error_condition(failure_errors err);

/// Constructs an `converter_errors` error code.
std::error_code make_error_code(converter_errors err);

} // namespace error

/*!
 * The error class represents the root of Framework's error hierarchy.
 *
 * Besides the error code it may hold a cause, i.e. whatever has triggered this error. The cause
 * can be an arbitrary exception, including the ones outside of this hierarchy.
 */
class error_t : public std::system_error {
    std::exception_ptr cause_;

public:
    error_t(const std::error_code& ec, const std::string& description,
            std::exception_ptr cause = std::exception_ptr());

    ~error_t() noexcept;

    /// Returns the cause of this error, which is null if there is no cause.
    const std::exception_ptr& cause() const noexcept;
};

/*!
 * The exception class, that is thrown by the Framework when it is unable to encode an error into
 * the wire failure.
 */
class conversion_error : public error_t {
public:
    conversion_error(error::converter_errors err, const std::string& reason);
};

/*!
 * Base class for errors that cause a workflow execution failure.
 *
 * Do not throw it directly, throw `application_error` instead.
 *
 * By default any other exception thrown from the workflow code causes the workflow task to be
 * retried rather than failing the workflow execution, see `failure_policy_t`.
 */
class failure_error : public error_t {
    std::string message_;
    std::string display_;
    wire_failure_ptr failure_;
    std::string stack_trace_;

    friend class failure_converter_t;

protected:
    failure_error(error::failure_errors kind,
                  std::string message,
                  std::string display,
                  std::exception_ptr cause);

public:
    ~failure_error() noexcept;

    /// Returns the display message, which may differ from the raw one.
    virtual
    const char*
    what() const noexcept;

    error::failure_errors
    kind() const noexcept;

    /// Returns the raw message without any decorations.
    const std::string&
    message() const noexcept;

    /// Returns the wire failure this error was decoded from, null if constructed by the user code.
    const wire_failure_ptr&
    failure() const noexcept;

    /// Returns the wire stack trace of the decoded failure, empty otherwise.
    const std::string&
    stack_trace() const noexcept;

private:
    /// Binds the decoded error to the wire failure it was received as. Called by the converter
    /// only, before the error is published.
    void
    attach(wire_failure_ptr failure, std::string stack_trace);
};

/*!
 * The exception class, that is thrown by workflow and activity code to signal an application
 * failure.
 *
 * This is the only failure error the user code is expected to throw. If the type is set, the
 * display message is formatted as "type: message".
 *
 * \note the non-retryable flag is just the value set upon creation. The actual retry decision is
 * made by the retry policy evaluator.
 */
class application_error : public failure_error {
    payloads_t details_;
    boost::optional<std::string> type_;
    bool non_retryable_;
    boost::optional<std::chrono::milliseconds> next_retry_delay_;

public:
    explicit
    application_error(std::string message,
                      payloads_t details = payloads_t(),
                      boost::optional<std::string> type = boost::none,
                      bool non_retryable = false,
                      boost::optional<std::chrono::milliseconds> next_retry_delay = boost::none,
                      std::exception_ptr cause = std::exception_ptr());

    ~application_error() noexcept;

    /// Returns user-defined details.
    const payloads_t&
    details() const noexcept;

    /// Returns the general error type.
    const boost::optional<std::string>&
    type() const noexcept;

    bool
    non_retryable() const noexcept;

    /// Returns the delay before the next activity retry attempt, if requested by the user code.
    const boost::optional<std::chrono::milliseconds>&
    next_retry_delay() const noexcept;
};

/// The exception class, that represents cooperative workflow or activity cancellation.
class cancelled_error : public failure_error {
    payloads_t details_;

public:
    explicit
    cancelled_error(std::string message = "Cancelled",
                    payloads_t details = payloads_t(),
                    std::exception_ptr cause = std::exception_ptr());

    ~cancelled_error() noexcept;

    const payloads_t&
    details() const noexcept;
};

/// The exception class, that represents externally forced termination.
class terminated_error : public failure_error {
    payloads_t details_;

public:
    explicit
    terminated_error(std::string message,
                     payloads_t details = payloads_t(),
                     std::exception_ptr cause = std::exception_ptr());

    ~terminated_error() noexcept;

    const payloads_t&
    details() const noexcept;
};

/*!
 * The exception class, that represents workflow or activity timeout.
 *
 * Last heartbeat details are meaningful only for the heartbeat timeout.
 */
class timeout_error : public failure_error {
    boost::optional<timeout_type> type_;
    payloads_t last_heartbeat_details_;

public:
    timeout_error(std::string message,
                  boost::optional<timeout_type> type,
                  payloads_t last_heartbeat_details = payloads_t(),
                  std::exception_ptr cause = std::exception_ptr());

    ~timeout_error() noexcept;

    const boost::optional<timeout_type>&
    type() const noexcept;

    const payloads_t&
    last_heartbeat_details() const noexcept;
};

/// The exception class, that represents a failure originated from the backend.
class server_error : public failure_error {
    bool non_retryable_;

public:
    explicit
    server_error(std::string message,
                 bool non_retryable = false,
                 std::exception_ptr cause = std::exception_ptr());

    ~server_error() noexcept;

    bool
    non_retryable() const noexcept;
};

/*!
 * The exception class, that wraps a failure occurred during an activity execution.
 *
 * Its cause is the underlying failure, usually an `application_error` or a `cancelled_error`.
 */
class activity_error : public failure_error {
    std::int64_t scheduled_event_id_;
    std::int64_t started_event_id_;
    std::string identity_;
    std::string activity_type_;
    std::string activity_id_;
    boost::optional<framework::retry_state> retry_state_;

public:
    activity_error(std::string message,
                   std::int64_t scheduled_event_id,
                   std::int64_t started_event_id,
                   std::string identity,
                   std::string activity_type,
                   std::string activity_id,
                   boost::optional<framework::retry_state> state,
                   std::exception_ptr cause = std::exception_ptr());

    ~activity_error() noexcept;

    std::int64_t
    scheduled_event_id() const noexcept;

    std::int64_t
    started_event_id() const noexcept;

    const std::string&
    identity() const noexcept;

    const std::string&
    activity_type() const noexcept;

    const std::string&
    activity_id() const noexcept;

    const boost::optional<framework::retry_state>&
    retry_state() const noexcept;
};

/*!
 * The exception class, that wraps a failure of a child workflow execution.
 *
 * Its cause is the underlying failure.
 */
class child_workflow_error : public failure_error {
    std::string ns_;
    std::string workflow_id_;
    std::string run_id_;
    std::string workflow_type_;
    std::int64_t initiated_event_id_;
    std::int64_t started_event_id_;
    boost::optional<framework::retry_state> retry_state_;

public:
    child_workflow_error(std::string message,
                         std::string ns,
                         std::string workflow_id,
                         std::string run_id,
                         std::string workflow_type,
                         std::int64_t initiated_event_id,
                         std::int64_t started_event_id,
                         boost::optional<framework::retry_state> state,
                         std::exception_ptr cause = std::exception_ptr());

    ~child_workflow_error() noexcept;

    /// Returns the namespace of the child workflow.
    const std::string&
    ns() const noexcept;

    const std::string&
    workflow_id() const noexcept;

    const std::string&
    run_id() const noexcept;

    const std::string&
    workflow_type() const noexcept;

    std::int64_t
    initiated_event_id() const noexcept;

    std::int64_t
    started_event_id() const noexcept;

    const boost::optional<framework::retry_state>&
    retry_state() const noexcept;
};

/*!
 * The exception class, that is thrown by a client or a workflow when a workflow execution has
 * already been started.
 *
 * The run id is set only if thrown by the client. It is not a part of the execution failure
 * propagation.
 */
class workflow_already_started_error : public failure_error {
    std::string workflow_id_;
    std::string workflow_type_;
    boost::optional<std::string> run_id_;

public:
    workflow_already_started_error(std::string workflow_id,
                                   std::string workflow_type,
                                   boost::optional<std::string> run_id = boost::none);

    ~workflow_already_started_error() noexcept;

    const std::string&
    workflow_id() const noexcept;

    const std::string&
    workflow_type() const noexcept;

    const boost::optional<std::string>&
    run_id() const noexcept;
};

/*!
 * The exception class, that is produced when decoding a wire failure with a failure info unknown
 * to this version.
 *
 * It carries nothing but the message, the cause and the raw wire failure attached by the
 * converter.
 */
class unknown_failure_error : public failure_error {
public:
    unknown_failure_error(std::string message, std::exception_ptr cause = std::exception_ptr());

    ~unknown_failure_error() noexcept;
};

} // namespace framework

} // namespace tempest

namespace std {

/// Extends the type trait std::is_error_code_enum to identify `failure_errors` error codes.
template<>
struct is_error_code_enum<tempest::framework::error::failure_errors> : public true_type {};

/// Extends the type trait std::is_error_code_enum to identify `converter_errors` error codes.
template<>
struct is_error_code_enum<tempest::framework::error::converter_errors> : public true_type {};

} // namespace std

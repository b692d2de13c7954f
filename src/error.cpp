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

#include "tempest/framework/error.hpp"

#include <cocaine/format.hpp>

#include "tempest/api/failure/v1/message.pb.h"

using namespace tempest::framework;

/// Fixed messages.
static const char MESSAGE_ALREADY_STARTED[] = "Workflow execution already started";

/// Extended description formatting patterns.
static const char ERROR_CONVERSION[] = "unable to convert the error: %s";

namespace {

struct failure_category_t : public std::error_category {
    const char*
    name() const noexcept {
        return "failure category";
    }

    std::string
    message(int err) const noexcept {
        switch (err) {
        case static_cast<int>(error::application):
            return "application failure";
        case static_cast<int>(error::cancelled):
            return "the execution has been cancelled";
        case static_cast<int>(error::terminated):
            return "the execution has been terminated";
        case static_cast<int>(error::timeout):
            return "the execution has timed out";
        case static_cast<int>(error::server):
            return "failure originated from the server";
        case static_cast<int>(error::activity):
            return "activity failure";
        case static_cast<int>(error::child_workflow):
            return "child workflow failure";
        case static_cast<int>(error::workflow_already_started):
            return "the workflow execution has already been started";
        default:
            return "unknown failure";
        }
    }
};

struct converter_category_t : public std::error_category {
    const char*
    name() const noexcept {
        return "converter category";
    }

    std::string
    message(int err) const noexcept {
        switch (err) {
        case static_cast<int>(error::attributes_encoding_failed):
            return "unable to encode failure attributes";
        default:
            return "unexpected conversion error";
        }
    }
};

std::string
display_message(const std::string& message, const boost::optional<std::string>& type) {
    if (type) {
        return cocaine::format("%s: %s", *type, message);
    }

    return message;
}

} // namespace

const std::error_category&
error::failure_category() {
    static failure_category_t category;
    return category;
}

const std::error_category&
error::converter_category() {
    static converter_category_t category;
    return category;
}

std::error_code
error::make_error_code(error::failure_errors err) {
    return std::error_code(static_cast<int>(err), error::failure_category());
}

std::error_condition
error::make_error_condition(error::failure_errors err) {
    return std::error_condition(static_cast<int>(err), error::failure_category());
}

std::error_code
error::make_error_code(error::converter_errors err) {
    return std::error_code(static_cast<int>(err), error::converter_category());
}

tempest::framework::error_t::error_t(const std::error_code& ec, const std::string& description, std::exception_ptr cause) :
    std::system_error(ec, description),
    cause_(std::move(cause))
{}

tempest::framework::error_t::~error_t() noexcept {}

const std::exception_ptr&
tempest::framework::error_t::cause() const noexcept {
    return cause_;
}

conversion_error::conversion_error(error::converter_errors err, const std::string& reason) :
    error_t(err, cocaine::format(ERROR_CONVERSION, reason))
{}

failure_error::failure_error(error::failure_errors kind,
                             std::string message,
                             std::string display,
                             std::exception_ptr cause) :
    error_t(error::make_error_code(kind), display, std::move(cause)),
    message_(std::move(message)),
    display_(std::move(display))
{}

failure_error::~failure_error() noexcept {}

const char*
failure_error::what() const noexcept {
    return display_.c_str();
}

error::failure_errors
failure_error::kind() const noexcept {
    return static_cast<error::failure_errors>(code().value());
}

const std::string&
failure_error::message() const noexcept {
    return message_;
}

const wire_failure_ptr&
failure_error::failure() const noexcept {
    return failure_;
}

const std::string&
failure_error::stack_trace() const noexcept {
    return stack_trace_;
}

void
failure_error::attach(wire_failure_ptr failure, std::string stack_trace) {
    failure_ = std::move(failure);
    stack_trace_ = std::move(stack_trace);
}

application_error::application_error(std::string message,
                                     payloads_t details,
                                     boost::optional<std::string> type,
                                     bool non_retryable,
                                     boost::optional<std::chrono::milliseconds> next_retry_delay,
                                     std::exception_ptr cause) :
    failure_error(error::application,
                  message,
                  display_message(message, type),
                  std::move(cause)),
    details_(std::move(details)),
    type_(std::move(type)),
    non_retryable_(non_retryable),
    next_retry_delay_(next_retry_delay)
{}

application_error::~application_error() noexcept {}

const payloads_t&
application_error::details() const noexcept {
    return details_;
}

const boost::optional<std::string>&
application_error::type() const noexcept {
    return type_;
}

bool
application_error::non_retryable() const noexcept {
    return non_retryable_;
}

const boost::optional<std::chrono::milliseconds>&
application_error::next_retry_delay() const noexcept {
    return next_retry_delay_;
}

cancelled_error::cancelled_error(std::string message,
                                 payloads_t details,
                                 std::exception_ptr cause) :
    failure_error(error::cancelled, message, message, std::move(cause)),
    details_(std::move(details))
{}

cancelled_error::~cancelled_error() noexcept {}

const payloads_t&
cancelled_error::details() const noexcept {
    return details_;
}

terminated_error::terminated_error(std::string message,
                                   payloads_t details,
                                   std::exception_ptr cause) :
    failure_error(error::terminated, message, message, std::move(cause)),
    details_(std::move(details))
{}

terminated_error::~terminated_error() noexcept {}

const payloads_t&
terminated_error::details() const noexcept {
    return details_;
}

timeout_error::timeout_error(std::string message,
                             boost::optional<timeout_type> type,
                             payloads_t last_heartbeat_details,
                             std::exception_ptr cause) :
    failure_error(error::timeout, message, message, std::move(cause)),
    type_(type),
    last_heartbeat_details_(std::move(last_heartbeat_details))
{}

timeout_error::~timeout_error() noexcept {}

const boost::optional<timeout_type>&
timeout_error::type() const noexcept {
    return type_;
}

const payloads_t&
timeout_error::last_heartbeat_details() const noexcept {
    return last_heartbeat_details_;
}

server_error::server_error(std::string message,
                           bool non_retryable,
                           std::exception_ptr cause) :
    failure_error(error::server, message, message, std::move(cause)),
    non_retryable_(non_retryable)
{}

server_error::~server_error() noexcept {}

bool
server_error::non_retryable() const noexcept {
    return non_retryable_;
}

activity_error::activity_error(std::string message,
                               std::int64_t scheduled_event_id,
                               std::int64_t started_event_id,
                               std::string identity,
                               std::string activity_type,
                               std::string activity_id,
                               boost::optional<framework::retry_state> state,
                               std::exception_ptr cause) :
    failure_error(error::activity, message, message, std::move(cause)),
    scheduled_event_id_(scheduled_event_id),
    started_event_id_(started_event_id),
    identity_(std::move(identity)),
    activity_type_(std::move(activity_type)),
    activity_id_(std::move(activity_id)),
    retry_state_(state)
{}

activity_error::~activity_error() noexcept {}

std::int64_t
activity_error::scheduled_event_id() const noexcept {
    return scheduled_event_id_;
}

std::int64_t
activity_error::started_event_id() const noexcept {
    return started_event_id_;
}

const std::string&
activity_error::identity() const noexcept {
    return identity_;
}

const std::string&
activity_error::activity_type() const noexcept {
    return activity_type_;
}

const std::string&
activity_error::activity_id() const noexcept {
    return activity_id_;
}

const boost::optional<retry_state>&
activity_error::retry_state() const noexcept {
    return retry_state_;
}

child_workflow_error::child_workflow_error(std::string message,
                                           std::string ns,
                                           std::string workflow_id,
                                           std::string run_id,
                                           std::string workflow_type,
                                           std::int64_t initiated_event_id,
                                           std::int64_t started_event_id,
                                           boost::optional<framework::retry_state> state,
                                           std::exception_ptr cause) :
    failure_error(error::child_workflow, message, message, std::move(cause)),
    ns_(std::move(ns)),
    workflow_id_(std::move(workflow_id)),
    run_id_(std::move(run_id)),
    workflow_type_(std::move(workflow_type)),
    initiated_event_id_(initiated_event_id),
    started_event_id_(started_event_id),
    retry_state_(state)
{}

child_workflow_error::~child_workflow_error() noexcept {}

const std::string&
child_workflow_error::ns() const noexcept {
    return ns_;
}

const std::string&
child_workflow_error::workflow_id() const noexcept {
    return workflow_id_;
}

const std::string&
child_workflow_error::run_id() const noexcept {
    return run_id_;
}

const std::string&
child_workflow_error::workflow_type() const noexcept {
    return workflow_type_;
}

std::int64_t
child_workflow_error::initiated_event_id() const noexcept {
    return initiated_event_id_;
}

std::int64_t
child_workflow_error::started_event_id() const noexcept {
    return started_event_id_;
}

const boost::optional<retry_state>&
child_workflow_error::retry_state() const noexcept {
    return retry_state_;
}

workflow_already_started_error::workflow_already_started_error(std::string workflow_id,
                                                               std::string workflow_type,
                                                               boost::optional<std::string> run_id) :
    failure_error(error::workflow_already_started,
                  MESSAGE_ALREADY_STARTED,
                  MESSAGE_ALREADY_STARTED,
                  std::exception_ptr()),
    workflow_id_(std::move(workflow_id)),
    workflow_type_(std::move(workflow_type)),
    run_id_(std::move(run_id))
{}

workflow_already_started_error::~workflow_already_started_error() noexcept {}

const std::string&
workflow_already_started_error::workflow_id() const noexcept {
    return workflow_id_;
}

const std::string&
workflow_already_started_error::workflow_type() const noexcept {
    return workflow_type_;
}

const boost::optional<std::string>&
workflow_already_started_error::run_id() const noexcept {
    return run_id_;
}

unknown_failure_error::unknown_failure_error(std::string message,
                                             std::exception_ptr cause) :
    failure_error(error::unknown, message, message, std::move(cause))
{}

unknown_failure_error::~unknown_failure_error() noexcept {}

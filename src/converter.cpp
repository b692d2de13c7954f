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

#include "tempest/framework/converter.hpp"

#include <typeinfo>

#include <boost/core/demangle.hpp>
#include <boost/thread/exceptions.hpp>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

#include "tempest/api/failure/v1/message.pb.h"

#include "tempest/framework/config.hpp"
#include "tempest/framework/error.hpp"
#include "tempest/framework/detail/log.hpp"

using namespace tempest::framework;

namespace common = tempest::api::common::v1;
namespace enums  = tempest::api::enums::v1;

/// Fixed messages.
static const char MESSAGE_ENCODED_FAILURE[]  = "Encoded failure";
static const char MESSAGE_UNKNOWN_ERROR[]    = "unknown error";

/// Application failure types for errors, that have no failure info of their own.
static const char TYPE_ALREADY_STARTED[]     = "WorkflowAlreadyStartedError";
static const char TYPE_UNKNOWN[]             = "UnknownError";

/// Encoded attributes payload format.
static const char ATTRIBUTES_ENCODING_KEY[]  = "encoding";
static const char ATTRIBUTES_ENCODING[]      = "json/plain";
static const char ATTRIBUTE_MESSAGE[]        = "message";
static const char ATTRIBUTE_STACK_TRACE[]    = "stack_trace";

namespace {

payloads_t
decode_payloads(const common::Payloads& source) {
    payloads_t result;
    result.reserve(source.payloads_size());

    for (const auto& payload : source.payloads()) {
        payload_t target;
        for (const auto& pair : payload.metadata()) {
            target.metadata[pair.first] = pair.second;
        }
        target.data = payload.data();

        result.push_back(std::move(target));
    }

    return result;
}

void
encode_payloads(const payloads_t& source, common::Payloads& target) {
    for (const auto& payload : source) {
        auto encoded = target.add_payloads();
        for (const auto& pair : payload.metadata) {
            (*encoded->mutable_metadata())[pair.first] = pair.second;
        }
        encoded->set_data(payload.data);
    }
}

boost::optional<std::string>
non_empty(const std::string& value) {
    if (value.empty()) {
        return boost::none;
    }

    return value;
}

/// Restores the message and the stack trace, moved into the encoded attributes by the remote side.
///
/// Attributes of an unexpected format are ignored and the given values are left as is.
void
restore_attributes(const common::Payload& payload, std::string& message, std::string& stack_trace) {
    const auto& metadata = payload.metadata();

    auto encoding = metadata.find(ATTRIBUTES_ENCODING_KEY);
    if (encoding == metadata.end() || encoding->second != ATTRIBUTES_ENCODING) {
        TF_DBG("ignoring encoded attributes of unsupported encoding");
        return;
    }

    google::protobuf::Struct attributes;
    if (!google::protobuf::util::JsonStringToMessage(payload.data(), &attributes).ok()) {
        TF_DBG("ignoring malformed encoded attributes");
        return;
    }

    const auto& fields = attributes.fields();

    auto text = fields.find(ATTRIBUTE_MESSAGE);
    if (text != fields.end() && text->second.kind_case() == google::protobuf::Value::kStringValue) {
        message = text->second.string_value();
    }

    auto trace = fields.find(ATTRIBUTE_STACK_TRACE);
    if (trace != fields.end() && trace->second.kind_case() == google::protobuf::Value::kStringValue) {
        stack_trace = trace->second.string_value();
    }
}

/// Fills the failure info of the given error, which has no wire failure attached.
void
encode_info(const failure_error& err, wire_failure_t& failure) {
    switch (err.kind()) {
    case error::application: {
        const auto& e = static_cast<const application_error&>(err);
        auto info = failure.mutable_application_failure_info();
        if (e.type()) {
            info->set_type(*e.type());
        }
        info->set_non_retryable(e.non_retryable());
        if (!e.details().empty()) {
            encode_payloads(e.details(), *info->mutable_details());
        }
        if (e.next_retry_delay()) {
            *info->mutable_next_retry_delay() =
                google::protobuf::util::TimeUtil::MillisecondsToDuration(e.next_retry_delay()->count());
        }
        break;
    }
    case error::cancelled: {
        const auto& e = static_cast<const cancelled_error&>(err);
        auto info = failure.mutable_canceled_failure_info();
        if (!e.details().empty()) {
            encode_payloads(e.details(), *info->mutable_details());
        }
        break;
    }
    case error::terminated: {
        const auto& e = static_cast<const terminated_error&>(err);
        auto info = failure.mutable_terminated_failure_info();
        if (!e.details().empty()) {
            encode_payloads(e.details(), *info->mutable_details());
        }
        break;
    }
    case error::timeout: {
        const auto& e = static_cast<const timeout_error&>(err);
        auto info = failure.mutable_timeout_failure_info();
        info->set_timeout_type(static_cast<enums::TimeoutType>(to_wire(e.type())));
        if (!e.last_heartbeat_details().empty()) {
            encode_payloads(e.last_heartbeat_details(), *info->mutable_last_heartbeat_details());
        }
        break;
    }
    case error::server: {
        const auto& e = static_cast<const server_error&>(err);
        failure.mutable_server_failure_info()->set_non_retryable(e.non_retryable());
        break;
    }
    case error::activity: {
        const auto& e = static_cast<const activity_error&>(err);
        auto info = failure.mutable_activity_failure_info();
        info->set_scheduled_event_id(e.scheduled_event_id());
        info->set_started_event_id(e.started_event_id());
        info->set_identity(e.identity());
        info->mutable_activity_type()->set_name(e.activity_type());
        info->set_activity_id(e.activity_id());
        info->set_retry_state(static_cast<enums::RetryState>(to_wire(e.retry_state())));
        break;
    }
    case error::child_workflow: {
        const auto& e = static_cast<const child_workflow_error&>(err);
        auto info = failure.mutable_child_workflow_execution_failure_info();
        info->set_namespace_(e.ns());
        info->mutable_workflow_execution()->set_workflow_id(e.workflow_id());
        info->mutable_workflow_execution()->set_run_id(e.run_id());
        info->mutable_workflow_type()->set_name(e.workflow_type());
        info->set_initiated_event_id(e.initiated_event_id());
        info->set_started_event_id(e.started_event_id());
        info->set_retry_state(static_cast<enums::RetryState>(to_wire(e.retry_state())));
        break;
    }
    case error::workflow_already_started:
        failure.mutable_application_failure_info()->set_type(TYPE_ALREADY_STARTED);
        break;
    case error::unknown:
        // Nothing but the message is known.
        break;
    }
}

} // namespace

converter_options_t::converter_options_t() :
    encode_common_attributes(false),
    max_cause_depth(64)
{}

failure_converter_t::failure_converter_t() {}

failure_converter_t::failure_converter_t(converter_options_t options) :
    options_(std::move(options))
{}

const converter_options_t&
failure_converter_t::options() const noexcept {
    return options_;
}

template<class E>
std::exception_ptr
failure_converter_t::attach(E err, const wire_failure_ptr& failure, const std::string& stack_trace) const {
    static_cast<failure_error&>(err).attach(failure, stack_trace);
    return std::make_exception_ptr(std::move(err));
}

std::exception_ptr
failure_converter_t::from_failure(const wire_failure_t& failure) const {
    return decode(failure, 0);
}

void
failure_converter_t::to_failure(const std::exception& err, wire_failure_t& failure) const {
    encode(err, failure, 0);
}

void
failure_converter_t::to_failure(const std::exception_ptr& err, wire_failure_t& failure) const {
    encode(err, failure, 0);
}

std::exception_ptr
failure_converter_t::decode(const wire_failure_t& source, std::size_t depth) const {
    // The failure is stored as received, so it can be replayed with the attributes still encoded.
    const wire_failure_ptr failure = std::make_shared<wire_failure_t>(source);

    std::string message = failure->message();
    std::string stack_trace = failure->stack_trace();
    if (failure->has_encoded_attributes()) {
        restore_attributes(failure->encoded_attributes(), message, stack_trace);
    }

    std::exception_ptr cause;
    if (failure->has_cause()) {
        if (depth < options_.max_cause_depth) {
            cause = decode(failure->cause(), depth + 1);
        } else {
            TF_WRN("dropping failure causes deeper than %llu links", TF_US(options_.max_cause_depth));
        }
    }

    switch (failure->failure_info_case()) {
    case wire_failure_t::kApplicationFailureInfo: {
        const auto& info = failure->application_failure_info();

        boost::optional<std::chrono::milliseconds> next_retry_delay;
        if (info.has_next_retry_delay()) {
            next_retry_delay = std::chrono::milliseconds(
                google::protobuf::util::TimeUtil::DurationToMilliseconds(info.next_retry_delay())
            );
        }

        return attach(application_error(
            message,
            decode_payloads(info.details()),
            non_empty(info.type()),
            info.non_retryable(),
            next_retry_delay,
            cause
        ), failure, stack_trace);
    }
    case wire_failure_t::kTimeoutFailureInfo: {
        const auto& info = failure->timeout_failure_info();
        return attach(timeout_error(
            message,
            timeout_type_from_wire(info.timeout_type()),
            decode_payloads(info.last_heartbeat_details()),
            cause
        ), failure, stack_trace);
    }
    case wire_failure_t::kCanceledFailureInfo:
        return attach(cancelled_error(
            message,
            decode_payloads(failure->canceled_failure_info().details()),
            cause
        ), failure, stack_trace);
    case wire_failure_t::kTerminatedFailureInfo:
        return attach(terminated_error(
            message,
            decode_payloads(failure->terminated_failure_info().details()),
            cause
        ), failure, stack_trace);
    case wire_failure_t::kServerFailureInfo:
        return attach(server_error(
            message,
            failure->server_failure_info().non_retryable(),
            cause
        ), failure, stack_trace);
    case wire_failure_t::kActivityFailureInfo: {
        const auto& info = failure->activity_failure_info();
        return attach(activity_error(
            message,
            info.scheduled_event_id(),
            info.started_event_id(),
            info.identity(),
            info.activity_type().name(),
            info.activity_id(),
            retry_state_from_wire(info.retry_state()),
            cause
        ), failure, stack_trace);
    }
    case wire_failure_t::kChildWorkflowExecutionFailureInfo: {
        const auto& info = failure->child_workflow_execution_failure_info();
        return attach(child_workflow_error(
            message,
            info.namespace_(),
            info.workflow_execution().workflow_id(),
            info.workflow_execution().run_id(),
            info.workflow_type().name(),
            info.initiated_event_id(),
            info.started_event_id(),
            retry_state_from_wire(info.retry_state()),
            cause
        ), failure, stack_trace);
    }
    default:
        TF_DBG("decoding failure with unrecognized info case %d", static_cast<int>(failure->failure_info_case()));
        return attach(unknown_failure_error(message, cause), failure, stack_trace);
    }
}

void
failure_converter_t::encode(const std::exception& err, wire_failure_t& failure, std::size_t depth) const {
    failure.Clear();

    if (const auto e = dynamic_cast<const failure_error*>(&err)) {
        if (e->failure()) {
            // Only decoded errors carry a failure, and their fields never change afterwards. The
            // failure is replayed as received, encoded attributes included.
            failure.CopyFrom(*e->failure());
            return;
        }

        failure.set_message(e->message());
        failure.set_source(TF_FAILURE_SOURCE);
        encode_info(*e, failure);
        encode_cause(e->cause(), failure, depth);
    } else {
        failure.set_message(err.what());
        failure.set_source(TF_FAILURE_SOURCE);
        failure.mutable_application_failure_info()->set_type(boost::core::demangle(typeid(err).name()));

        if (const auto nested = dynamic_cast<const std::nested_exception*>(&err)) {
            encode_cause(nested->nested_ptr(), failure, depth);
        }
    }

    if (options_.encode_common_attributes) {
        encode_attributes(failure);
    }
}

void
failure_converter_t::encode(const std::exception_ptr& err, wire_failure_t& failure, std::size_t depth) const {
    if (!err) {
        failure.Clear();
        return;
    }

    try {
        std::rethrow_exception(err);
    } catch (const boost::thread_interrupted&) {
        encode(cancelled_error(), failure, depth);
    } catch (const std::exception& e) {
        encode(e, failure, depth);
    } catch (...) {
        encode(application_error(MESSAGE_UNKNOWN_ERROR, payloads_t(), std::string(TYPE_UNKNOWN)), failure, depth);
    }
}

void
failure_converter_t::encode_cause(const std::exception_ptr& cause, wire_failure_t& failure, std::size_t depth) const {
    if (!cause) {
        return;
    }

    if (depth >= options_.max_cause_depth) {
        TF_WRN("dropping error causes deeper than %llu links", TF_US(options_.max_cause_depth));
        return;
    }

    encode(cause, *failure.mutable_cause(), depth + 1);
}

void
failure_converter_t::encode_attributes(wire_failure_t& failure) const {
    google::protobuf::Struct attributes;
    (*attributes.mutable_fields())[ATTRIBUTE_MESSAGE].set_string_value(failure.message());
    (*attributes.mutable_fields())[ATTRIBUTE_STACK_TRACE].set_string_value(failure.stack_trace());

    std::string json;
    const auto status = google::protobuf::util::MessageToJsonString(attributes, &json);
    if (!status.ok()) {
        throw conversion_error(error::attributes_encoding_failed, status.ToString());
    }

    auto payload = failure.mutable_encoded_attributes();
    payload->Clear();
    (*payload->mutable_metadata())[ATTRIBUTES_ENCODING_KEY] = ATTRIBUTES_ENCODING;
    payload->set_data(json);

    failure.set_message(MESSAGE_ENCODED_FAILURE);
    failure.set_stack_trace(std::string());
}

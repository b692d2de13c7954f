#include <stdexcept>
#include <string>

#include <boost/thread/exceptions.hpp>

#include <google/protobuf/util/message_differencer.h>

#include <gtest/gtest.h>

#include "tempest/api/failure/v1/message.pb.h"

#include <tempest/framework/cancellation.hpp>
#include <tempest/framework/converter.hpp>
#include <tempest/framework/error.hpp>

using namespace tempest::framework;

namespace common = tempest::api::common::v1;
namespace enums  = tempest::api::enums::v1;

using google::protobuf::util::MessageDifferencer;

namespace {

template<class E>
E
rethrow_as(const std::exception_ptr& err) {
    try {
        std::rethrow_exception(err);
    } catch (const E& e) {
        return e;
    }
}

std::size_t
chain_length(std::exception_ptr err) {
    std::size_t length = 0;
    while (err) {
        ++length;
        err = rethrow_as<failure_error>(err).cause();
    }

    return length;
}

std::size_t
chain_length(const wire_failure_t& failure) {
    std::size_t length = 1;
    const wire_failure_t* current = &failure;
    while (current->has_cause()) {
        ++length;
        current = &current->cause();
    }

    return length;
}

void
add_payload(common::Payloads& payloads, const std::string& data) {
    auto payload = payloads.add_payloads();
    (*payload->mutable_metadata())["encoding"] = "json/plain";
    payload->set_data(data);
}

wire_failure_t
make_cancelled_failure() {
    wire_failure_t failure;
    failure.set_message("Cancelled");
    failure.set_source("PySDK");
    add_payload(*failure.mutable_canceled_failure_info()->mutable_details(), "\"by user\"");
    return failure;
}

wire_failure_t
make_activity_failure(const wire_failure_t& cause) {
    wire_failure_t failure;
    failure.set_message("activity error");
    failure.set_stack_trace("at charge (charge.py:10)");
    *failure.mutable_cause() = cause;

    auto info = failure.mutable_activity_failure_info();
    info->set_scheduled_event_id(5);
    info->set_started_event_id(6);
    info->set_identity("worker@host");
    info->mutable_activity_type()->set_name("charge");
    info->set_activity_id("1");
    info->set_retry_state(enums::RETRY_STATE_CANCEL_REQUESTED);
    return failure;
}

} // namespace

TEST(failure_converter_t, DecodeApplicationFailure) {
    wire_failure_t failure;
    failure.set_message("out of stock");
    failure.set_stack_trace("trace");
    auto info = failure.mutable_application_failure_info();
    info->set_type("InventoryError");
    info->set_non_retryable(true);
    add_payload(*info->mutable_details(), "1");
    add_payload(*info->mutable_details(), "2");
    info->mutable_next_retry_delay()->set_seconds(2);
    info->mutable_next_retry_delay()->set_nanos(500000000);

    const failure_converter_t converter;
    const auto err = rethrow_as<application_error>(converter.from_failure(failure));

    EXPECT_EQ("out of stock", err.message());
    EXPECT_STREQ("InventoryError: out of stock", err.what());
    ASSERT_TRUE(err.type());
    EXPECT_EQ("InventoryError", *err.type());
    EXPECT_TRUE(err.non_retryable());
    ASSERT_EQ(2u, err.details().size());
    EXPECT_EQ("1", err.details()[0].data);
    EXPECT_EQ("json/plain", err.details()[1].metadata.at("encoding"));
    ASSERT_TRUE(err.next_retry_delay());
    EXPECT_EQ(2500, err.next_retry_delay()->count());
    EXPECT_EQ("trace", err.stack_trace());
    ASSERT_TRUE(err.failure());
    EXPECT_TRUE(MessageDifferencer::Equals(failure, *err.failure()));
    EXPECT_FALSE(err.cause());
}

TEST(failure_converter_t, DecodeApplicationFailureWithoutOptionals) {
    wire_failure_t failure;
    failure.set_message("failed");
    failure.mutable_application_failure_info();

    const auto err = rethrow_as<application_error>(failure_converter_t().from_failure(failure));

    EXPECT_STREQ("failed", err.what());
    EXPECT_FALSE(err.type());
    EXPECT_FALSE(err.next_retry_delay());
    EXPECT_TRUE(err.details().empty());
}

TEST(failure_converter_t, DecodeTimeoutFailure) {
    wire_failure_t failure;
    failure.set_message("activity heartbeat timeout");
    auto info = failure.mutable_timeout_failure_info();
    info->set_timeout_type(enums::TIMEOUT_TYPE_HEARTBEAT);
    add_payload(*info->mutable_last_heartbeat_details(), "{\"progress\":42}");

    const auto err = rethrow_as<timeout_error>(failure_converter_t().from_failure(failure));

    ASSERT_TRUE(err.type());
    EXPECT_EQ(timeout_type::heartbeat, *err.type());
    ASSERT_EQ(1u, err.last_heartbeat_details().size());
    EXPECT_EQ("{\"progress\":42}", err.last_heartbeat_details()[0].data);
}

TEST(failure_converter_t, DecodeTimeoutFailureUnspecifiedType) {
    wire_failure_t failure;
    failure.set_message("timeout");
    failure.mutable_timeout_failure_info();

    const auto err = rethrow_as<timeout_error>(failure_converter_t().from_failure(failure));

    EXPECT_FALSE(err.type());
}

TEST(failure_converter_t, DecodeTerminatedAndServerFailures) {
    wire_failure_t terminated;
    terminated.set_message("terminated by operator");
    add_payload(*terminated.mutable_terminated_failure_info()->mutable_details(), "reason");

    wire_failure_t server;
    server.set_message("internal");
    server.mutable_server_failure_info()->set_non_retryable(true);

    const failure_converter_t converter;

    const auto t = rethrow_as<terminated_error>(converter.from_failure(terminated));
    EXPECT_EQ("terminated by operator", t.message());
    ASSERT_EQ(1u, t.details().size());
    EXPECT_EQ("reason", t.details()[0].data);

    const auto s = rethrow_as<server_error>(converter.from_failure(server));
    EXPECT_EQ("internal", s.message());
    EXPECT_TRUE(s.non_retryable());
}

TEST(failure_converter_t, DecodeActivityFailureWithCancelledCause) {
    const auto failure = make_activity_failure(make_cancelled_failure());

    const auto ptr = failure_converter_t().from_failure(failure);
    const auto err = rethrow_as<activity_error>(ptr);

    EXPECT_EQ("activity error", err.message());
    EXPECT_EQ(5, err.scheduled_event_id());
    EXPECT_EQ(6, err.started_event_id());
    EXPECT_EQ("worker@host", err.identity());
    EXPECT_EQ("charge", err.activity_type());
    EXPECT_EQ("1", err.activity_id());
    ASSERT_TRUE(err.retry_state());
    EXPECT_EQ(retry_state::cancel_requested, *err.retry_state());
    EXPECT_EQ("at charge (charge.py:10)", err.stack_trace());

    const auto cause = rethrow_as<cancelled_error>(err.cause());
    EXPECT_EQ("Cancelled", cause.message());
    ASSERT_EQ(1u, cause.details().size());
    EXPECT_EQ("\"by user\"", cause.details()[0].data);

    EXPECT_TRUE(is_cancellation(ptr));
}

TEST(failure_converter_t, DecodeChildWorkflowFailureWithUnknownRetryState) {
    // Retry state code 42 is not known to this version.
    tempest::api::failure::v1::ChildWorkflowExecutionFailureInfo info;
    ASSERT_TRUE(info.ParseFromString(std::string("\x30\x2a", 2)));

    info.set_namespace_("default");
    info.mutable_workflow_execution()->set_workflow_id("wid");
    info.mutable_workflow_execution()->set_run_id("rid");
    info.mutable_workflow_type()->set_name("Payment");
    info.set_initiated_event_id(10);
    info.set_started_event_id(11);

    wire_failure_t failure;
    failure.set_message("child workflow error");
    *failure.mutable_child_workflow_execution_failure_info() = info;

    const auto err = rethrow_as<child_workflow_error>(failure_converter_t().from_failure(failure));

    EXPECT_EQ("default", err.ns());
    EXPECT_EQ("wid", err.workflow_id());
    EXPECT_EQ("rid", err.run_id());
    EXPECT_EQ("Payment", err.workflow_type());
    EXPECT_EQ(10, err.initiated_event_id());
    EXPECT_EQ(11, err.started_event_id());
    EXPECT_FALSE(err.retry_state());
}

TEST(failure_converter_t, DecodeUnrecognizedFailureInfo) {
    wire_failure_t failure;
    failure.set_message("workflow reset");
    add_payload(*failure.mutable_reset_workflow_failure_info()->mutable_last_heartbeat_details(), "x");

    std::exception_ptr ptr;
    EXPECT_NO_THROW(ptr = failure_converter_t().from_failure(failure));

    const auto err = rethrow_as<unknown_failure_error>(ptr);
    EXPECT_EQ(error::unknown, err.kind());
    EXPECT_EQ("workflow reset", err.message());
    EXPECT_FALSE(err.cause());
    ASSERT_TRUE(err.failure());
    EXPECT_TRUE(MessageDifferencer::Equals(failure, *err.failure()));
}

TEST(failure_converter_t, DecodeMissingFailureInfo) {
    wire_failure_t failure;
    failure.set_message("bare");
    *failure.mutable_cause() = make_cancelled_failure();

    const auto err = rethrow_as<unknown_failure_error>(failure_converter_t().from_failure(failure));

    EXPECT_EQ("bare", err.message());
    EXPECT_NO_THROW(rethrow_as<cancelled_error>(err.cause()));
}

TEST(failure_converter_t, RoundTripReplaysStoredFailure) {
    wire_failure_t application;
    application.set_message("card declined");
    application.set_source("GoSDK");
    add_payload(*application.mutable_application_failure_info()->mutable_details(), "{\"code\":51}");
    application.mutable_application_failure_info()->set_type("PaymentError");

    const auto activity = make_activity_failure(application);

    wire_failure_t child;
    child.set_message("child workflow error");
    *child.mutable_cause() = activity;
    auto info = child.mutable_child_workflow_execution_failure_info();
    info->set_namespace_("default");
    info->mutable_workflow_execution()->set_workflow_id("wid");
    info->set_retry_state(enums::RETRY_STATE_NON_RETRYABLE_FAILURE);

    const failure_converter_t converter;
    const auto err = converter.from_failure(child);

    EXPECT_EQ(3u, chain_length(err));

    wire_failure_t encoded;
    converter.to_failure(err, encoded);

    EXPECT_TRUE(MessageDifferencer::Equals(child, encoded));
    EXPECT_EQ(3u, chain_length(encoded));
}

TEST(failure_converter_t, RoundTripRewrappedCause) {
    // A workflow catches a decoded activity error and rethrows it wrapped into a new error.
    const failure_converter_t converter;
    const auto activity = make_activity_failure(make_cancelled_failure());
    const auto cause = converter.from_failure(activity);

    wire_failure_t encoded;
    converter.to_failure(application_error("payment failed", payloads_t(), std::string("PaymentError"), false, boost::none, cause), encoded);

    EXPECT_EQ("payment failed", encoded.message());
    EXPECT_EQ("PaymentError", encoded.application_failure_info().type());
    ASSERT_TRUE(encoded.has_cause());
    EXPECT_TRUE(MessageDifferencer::Equals(activity, encoded.cause()));
}

TEST(failure_converter_t, ErrorBuiltFromDecodedFieldsIsEncodedFromItsOwnFields) {
    wire_failure_t failure;
    failure.set_message("card declined");
    failure.set_source("GoSDK");
    failure.mutable_application_failure_info()->set_type("PaymentError");

    const failure_converter_t converter;
    const auto decoded = rethrow_as<application_error>(converter.from_failure(failure));
    ASSERT_TRUE(decoded.failure());

    const application_error err("retry later", decoded.details(), std::string("Throttled"), true);
    EXPECT_FALSE(err.failure());
    EXPECT_TRUE(err.stack_trace().empty());

    wire_failure_t encoded;
    converter.to_failure(err, encoded);

    EXPECT_EQ("retry later", encoded.message());
    EXPECT_EQ("CppSDK", encoded.source());
    EXPECT_EQ("Throttled", encoded.application_failure_info().type());
    EXPECT_TRUE(encoded.application_failure_info().non_retryable());
}

TEST(failure_converter_t, EncodeApplicationError) {
    payload_t payload;
    payload.metadata["encoding"] = "binary/plain";
    payload.data = "details";

    const application_error err("out of stock",
                                payloads_t(1, payload),
                                std::string("InventoryError"),
                                true,
                                std::chrono::milliseconds(1500),
                                std::make_exception_ptr(server_error("internal", true)));

    wire_failure_t failure;
    failure_converter_t().to_failure(err, failure);

    EXPECT_EQ("out of stock", failure.message());
    EXPECT_EQ("CppSDK", failure.source());
    EXPECT_TRUE(failure.stack_trace().empty());
    ASSERT_TRUE(failure.has_application_failure_info());

    const auto& info = failure.application_failure_info();
    EXPECT_EQ("InventoryError", info.type());
    EXPECT_TRUE(info.non_retryable());
    ASSERT_EQ(1, info.details().payloads_size());
    EXPECT_EQ("details", info.details().payloads(0).data());
    EXPECT_EQ("binary/plain", info.details().payloads(0).metadata().at("encoding"));
    EXPECT_EQ(1, info.next_retry_delay().seconds());
    EXPECT_EQ(500000000, info.next_retry_delay().nanos());

    ASSERT_TRUE(failure.has_cause());
    EXPECT_EQ("internal", failure.cause().message());
    EXPECT_TRUE(failure.cause().server_failure_info().non_retryable());
    EXPECT_FALSE(failure.cause().has_cause());
}

TEST(failure_converter_t, EncodeDecodeTimeoutError) {
    payload_t payload;
    payload.data = "progress";

    const timeout_error err("heartbeat timeout", timeout_type::heartbeat, payloads_t(1, payload));

    const failure_converter_t converter;

    wire_failure_t failure;
    converter.to_failure(err, failure);

    EXPECT_EQ(enums::TIMEOUT_TYPE_HEARTBEAT, failure.timeout_failure_info().timeout_type());

    const auto decoded = rethrow_as<timeout_error>(converter.from_failure(failure));
    EXPECT_EQ(err.message(), decoded.message());
    EXPECT_TRUE(err.type() == decoded.type());
    EXPECT_EQ(err.last_heartbeat_details(), decoded.last_heartbeat_details());
}

TEST(failure_converter_t, EncodeDecodeChildWorkflowError) {
    const child_workflow_error err("child workflow error", "default", "wid", "rid", "Payment", 10, 11,
                                   retry_state::timeout,
                                   std::make_exception_ptr(terminated_error("terminated")));

    const failure_converter_t converter;

    wire_failure_t failure;
    converter.to_failure(err, failure);

    const auto& info = failure.child_workflow_execution_failure_info();
    EXPECT_EQ("default", info.namespace_());
    EXPECT_EQ("wid", info.workflow_execution().workflow_id());
    EXPECT_EQ("rid", info.workflow_execution().run_id());
    EXPECT_EQ("Payment", info.workflow_type().name());
    EXPECT_EQ(enums::RETRY_STATE_TIMEOUT, info.retry_state());
    EXPECT_TRUE(failure.cause().has_terminated_failure_info());

    const auto decoded = rethrow_as<child_workflow_error>(converter.from_failure(failure));
    EXPECT_EQ(err.ns(), decoded.ns());
    EXPECT_EQ(err.workflow_id(), decoded.workflow_id());
    EXPECT_EQ(err.run_id(), decoded.run_id());
    EXPECT_EQ(err.workflow_type(), decoded.workflow_type());
    EXPECT_EQ(err.initiated_event_id(), decoded.initiated_event_id());
    EXPECT_EQ(err.started_event_id(), decoded.started_event_id());
    EXPECT_TRUE(err.retry_state() == decoded.retry_state());
    EXPECT_EQ("terminated", rethrow_as<terminated_error>(decoded.cause()).message());
}

TEST(failure_converter_t, EncodeWorkflowAlreadyStartedError) {
    wire_failure_t failure;
    failure_converter_t().to_failure(workflow_already_started_error("wid", "Payment", std::string("rid")), failure);

    EXPECT_EQ("Workflow execution already started", failure.message());
    EXPECT_EQ("WorkflowAlreadyStartedError", failure.application_failure_info().type());
}

TEST(failure_converter_t, EncodeForeignError) {
    wire_failure_t failure;
    failure_converter_t().to_failure(std::runtime_error("connection reset"), failure);

    EXPECT_EQ("connection reset", failure.message());
    EXPECT_EQ("std::runtime_error", failure.application_failure_info().type());
    EXPECT_FALSE(failure.has_cause());
}

TEST(failure_converter_t, EncodeNestedForeignError) {
    std::exception_ptr err;

    try {
        try {
            throw application_error("inner");
        } catch (const application_error&) {
            std::throw_with_nested(std::runtime_error("outer"));
        }
    } catch (const std::exception&) {
        err = std::current_exception();
    }

    wire_failure_t failure;
    failure_converter_t().to_failure(err, failure);

    EXPECT_EQ("outer", failure.message());
    EXPECT_TRUE(failure.has_application_failure_info());
    ASSERT_TRUE(failure.has_cause());
    EXPECT_EQ("inner", failure.cause().message());
}

TEST(failure_converter_t, EncodeHostCancellation) {
    const failure_converter_t converter;

    wire_failure_t failure;
    converter.to_failure(std::make_exception_ptr(boost::thread_interrupted()), failure);

    EXPECT_EQ("Cancelled", failure.message());
    EXPECT_TRUE(failure.has_canceled_failure_info());
    EXPECT_TRUE(is_cancellation(converter.from_failure(failure)));
}

TEST(failure_converter_t, EncodeNull) {
    wire_failure_t failure;
    failure.set_message("stale");

    failure_converter_t().to_failure(std::exception_ptr(), failure);

    EXPECT_TRUE(failure.message().empty());
    EXPECT_EQ(wire_failure_t::FAILURE_INFO_NOT_SET, failure.failure_info_case());
}

TEST(failure_converter_t, EncodeCommonAttributes) {
    converter_options_t options;
    options.encode_common_attributes = true;

    wire_failure_t failure;
    failure_converter_t(options).to_failure(application_error("secret", payloads_t(), std::string("Type")), failure);

    EXPECT_EQ("Encoded failure", failure.message());
    EXPECT_TRUE(failure.stack_trace().empty());
    ASSERT_TRUE(failure.has_encoded_attributes());
    EXPECT_EQ("json/plain", failure.encoded_attributes().metadata().at("encoding"));

    // Decoding always restores the attributes, whatever the options are.
    const auto err = rethrow_as<application_error>(failure_converter_t().from_failure(failure));
    EXPECT_EQ("secret", err.message());
    EXPECT_STREQ("Type: secret", err.what());
    ASSERT_TRUE(err.failure());
    EXPECT_TRUE(MessageDifferencer::Equals(failure, *err.failure()));
}

TEST(failure_converter_t, ReplayKeepsAttributesEncoded) {
    wire_failure_t failure;
    failure.set_message("Encoded failure");
    failure.mutable_application_failure_info()->set_type("PaymentError");
    (*failure.mutable_encoded_attributes()->mutable_metadata())["encoding"] = "json/plain";
    failure.mutable_encoded_attributes()->set_data(
        "{\"message\":\"outer secret\",\"stack_trace\":\"at pay (pay.py:3)\"}"
    );

    const failure_converter_t converter;
    const auto err = converter.from_failure(failure);

    const auto decoded = rethrow_as<application_error>(err);
    EXPECT_EQ("outer secret", decoded.message());
    EXPECT_EQ("at pay (pay.py:3)", decoded.stack_trace());

    wire_failure_t encoded;
    converter.to_failure(err, encoded);

    EXPECT_EQ("Encoded failure", encoded.message());
    EXPECT_TRUE(encoded.stack_trace().empty());
    EXPECT_TRUE(MessageDifferencer::Equals(failure, encoded));
}

TEST(failure_converter_t, ReplayDoesNotEncodeAttributesAgain) {
    converter_options_t options;
    options.encode_common_attributes = true;

    const failure_converter_t converter(options);

    wire_failure_t failure;
    failure.set_message("card declined");
    failure.set_stack_trace("at charge (charge.py:10)");
    failure.mutable_application_failure_info()->set_type("PaymentError");

    wire_failure_t encoded;
    converter.to_failure(converter.from_failure(failure), encoded);

    EXPECT_TRUE(MessageDifferencer::Equals(failure, encoded));
}

TEST(failure_converter_t, DecodeMalformedAttributesKeepsMessage) {
    wire_failure_t failure;
    failure.set_message("Encoded failure");
    failure.mutable_server_failure_info();
    (*failure.mutable_encoded_attributes()->mutable_metadata())["encoding"] = "json/plain";
    failure.mutable_encoded_attributes()->set_data("{not json");

    std::exception_ptr ptr;
    EXPECT_NO_THROW(ptr = failure_converter_t().from_failure(failure));

    EXPECT_EQ("Encoded failure", rethrow_as<server_error>(ptr).message());
}

TEST(failure_converter_t, CauseDepthIsLimited) {
    converter_options_t options;
    options.max_cause_depth = 2;

    const failure_converter_t converter(options);

    std::exception_ptr err = std::make_exception_ptr(cancelled_error());
    for (int i = 0; i < 4; ++i) {
        err = std::make_exception_ptr(activity_error("activity error", i, i, "", "charge", "1", boost::none, err));
    }

    wire_failure_t failure;
    converter.to_failure(err, failure);
    EXPECT_EQ(3u, chain_length(failure));

    wire_failure_t deep = make_cancelled_failure();
    for (int i = 0; i < 4; ++i) {
        deep = make_activity_failure(deep);
    }

    EXPECT_EQ(3u, chain_length(converter.from_failure(deep)));
    EXPECT_EQ(5u, chain_length(failure_converter_t().from_failure(deep)));
}

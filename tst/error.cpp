#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include <tempest/framework/error.hpp>

using namespace tempest::framework;

namespace {

payloads_t
make_details() {
    payload_t payload;
    payload.metadata["encoding"] = "binary/plain";
    payload.data = "42";
    return payloads_t(1, payload);
}

} // namespace

TEST(application_error, Constructor) {
    const application_error err("customer lives outside the service area");

    EXPECT_EQ("customer lives outside the service area", err.message());
    EXPECT_STREQ("customer lives outside the service area", err.what());
    EXPECT_EQ(error::application, err.kind());
    EXPECT_TRUE(err.details().empty());
    EXPECT_FALSE(err.type());
    EXPECT_FALSE(err.non_retryable());
    EXPECT_FALSE(err.next_retry_delay());
    EXPECT_FALSE(err.cause());
    EXPECT_FALSE(err.failure());
    EXPECT_TRUE(err.stack_trace().empty());
}

TEST(application_error, DisplayMessageWithType) {
    const std::pair<std::string, std::string> cases[] = {
        { "out of stock", "InventoryError" },
        { "", "EmptyMessage" },
        { "message: with colon", "Type" },
    };

    for (const auto& pair : cases) {
        const application_error err(pair.first, payloads_t(), pair.second);

        EXPECT_EQ(pair.second + ": " + pair.first, std::string(err.what()));
        EXPECT_EQ(pair.first, err.message());
        ASSERT_TRUE(err.type());
        EXPECT_EQ(pair.second, *err.type());
    }
}

TEST(application_error, Fields) {
    const application_error err("failed", make_details(), std::string("Type"), true, std::chrono::milliseconds(1500));

    ASSERT_EQ(1u, err.details().size());
    EXPECT_EQ("42", err.details()[0].data);
    EXPECT_TRUE(err.non_retryable());
    ASSERT_TRUE(err.next_retry_delay());
    EXPECT_EQ(std::chrono::milliseconds(1500), *err.next_retry_delay());
}

TEST(application_error, CatchAsFailureError) {
    try {
        throw application_error("failed", payloads_t(), std::string("Type"));
    } catch (const failure_error& err) {
        EXPECT_EQ("failed", err.message());
        EXPECT_STREQ("Type: failed", err.what());
        EXPECT_EQ(error::application, err.code());
    }
}

TEST(cancelled_error, DefaultMessage) {
    const cancelled_error err;

    EXPECT_EQ("Cancelled", err.message());
    EXPECT_STREQ("Cancelled", err.what());
    EXPECT_EQ(error::cancelled, err.kind());
    EXPECT_TRUE(err.details().empty());
}

TEST(cancelled_error, CustomMessage) {
    const cancelled_error err("x", make_details());

    EXPECT_EQ("x", err.message());
    EXPECT_EQ(1u, err.details().size());
}

TEST(terminated_error, Constructor) {
    const terminated_error err("terminated by operator", make_details());

    EXPECT_EQ("terminated by operator", err.message());
    EXPECT_EQ(error::terminated, err.kind());
    EXPECT_EQ(make_details(), err.details());
}

TEST(timeout_error, Constructor) {
    const timeout_error err("activity timeout", timeout_type::heartbeat, make_details());

    EXPECT_EQ("activity timeout", err.message());
    EXPECT_EQ(error::timeout, err.kind());
    ASSERT_TRUE(err.type());
    EXPECT_EQ(timeout_type::heartbeat, *err.type());
    EXPECT_EQ(make_details(), err.last_heartbeat_details());
}

TEST(timeout_error, WithoutType) {
    const timeout_error err("timeout", boost::none);

    EXPECT_FALSE(err.type());
    EXPECT_TRUE(err.last_heartbeat_details().empty());
}

TEST(server_error, Constructor) {
    EXPECT_FALSE(server_error("internal").non_retryable());
    EXPECT_TRUE(server_error("internal", true).non_retryable());
    EXPECT_EQ(error::server, server_error("internal").kind());
}

TEST(activity_error, Constructor) {
    const auto cause = std::make_exception_ptr(application_error("boom"));
    const activity_error err("activity error", 5, 6, "worker@host", "charge", "1", retry_state::non_retryable_failure, cause);

    EXPECT_EQ("activity error", err.message());
    EXPECT_EQ(error::activity, err.kind());
    EXPECT_EQ(5, err.scheduled_event_id());
    EXPECT_EQ(6, err.started_event_id());
    EXPECT_EQ("worker@host", err.identity());
    EXPECT_EQ("charge", err.activity_type());
    EXPECT_EQ("1", err.activity_id());
    ASSERT_TRUE(err.retry_state());
    EXPECT_EQ(retry_state::non_retryable_failure, *err.retry_state());
    EXPECT_EQ(cause, err.cause());
}

TEST(child_workflow_error, Constructor) {
    const child_workflow_error err("child workflow error", "default", "wid", "rid", "Payment", 10, 11, boost::none);

    EXPECT_EQ(error::child_workflow, err.kind());
    EXPECT_EQ("default", err.ns());
    EXPECT_EQ("wid", err.workflow_id());
    EXPECT_EQ("rid", err.run_id());
    EXPECT_EQ("Payment", err.workflow_type());
    EXPECT_EQ(10, err.initiated_event_id());
    EXPECT_EQ(11, err.started_event_id());
    EXPECT_FALSE(err.retry_state());
    EXPECT_FALSE(err.cause());
}

TEST(workflow_already_started_error, FromClient) {
    const workflow_already_started_error err("wid", "Payment", std::string("rid"));

    EXPECT_EQ("Workflow execution already started", err.message());
    EXPECT_EQ(error::workflow_already_started, err.kind());
    EXPECT_EQ("wid", err.workflow_id());
    EXPECT_EQ("Payment", err.workflow_type());
    ASSERT_TRUE(err.run_id());
    EXPECT_EQ("rid", *err.run_id());
}

TEST(workflow_already_started_error, FromWorkflow) {
    const workflow_already_started_error err("wid", "Payment");

    EXPECT_FALSE(err.run_id());
}

TEST(error_t, CauseChainIsKeptOnCopy) {
    const auto root = std::make_exception_ptr(cancelled_error());
    const activity_error err("activity error", 1, 2, "", "charge", "1", boost::none, root);
    const activity_error copy(err);

    EXPECT_EQ(root, copy.cause());
}

TEST(failure_category, Messages) {
    EXPECT_STREQ("failure category", error::failure_category().name());
    EXPECT_EQ("the execution has been cancelled", std::error_code(error::cancelled).message());
    EXPECT_EQ("unknown failure", error::failure_category().message(100500));
}

TEST(conversion_error, Constructor) {
    const conversion_error err(error::attributes_encoding_failed, "invalid UTF-8");

    EXPECT_EQ(error::attributes_encoding_failed, err.code());
    EXPECT_NE(std::string::npos, std::string(err.what()).find("invalid UTF-8"));
}

#include <stdexcept>

#include <boost/thread/exceptions.hpp>

#include <gtest/gtest.h>

#include <tempest/framework/cancellation.hpp>
#include <tempest/framework/error.hpp>

using namespace tempest::framework;

namespace {

activity_error
make_activity_error(std::exception_ptr cause) {
    return activity_error("activity error", 1, 2, "worker", "charge", "1", retry_state::cancel_requested, cause);
}

child_workflow_error
make_child_workflow_error(std::exception_ptr cause) {
    return child_workflow_error("child workflow error", "default", "wid", "rid", "Payment", 3, 4, boost::none, cause);
}

} // namespace

TEST(is_cancellation, CancelledError) {
    EXPECT_TRUE(is_cancellation(cancelled_error()));
    EXPECT_TRUE(is_cancellation(std::make_exception_ptr(cancelled_error("x"))));
}

TEST(is_cancellation, HostCancellation) {
    EXPECT_TRUE(is_cancellation(boost::thread_interrupted()));
    EXPECT_TRUE(is_cancellation(std::make_exception_ptr(boost::thread_interrupted())));
}

TEST(is_cancellation, ActivityErrorCausedByCancellation) {
    const auto err = make_activity_error(std::make_exception_ptr(cancelled_error()));

    EXPECT_TRUE(is_cancellation(err));
    EXPECT_TRUE(is_cancellation(std::make_exception_ptr(err)));
}

TEST(is_cancellation, ChildWorkflowErrorCausedByCancellation) {
    const auto err = make_child_workflow_error(std::make_exception_ptr(cancelled_error()));

    EXPECT_TRUE(is_cancellation(err));
}

TEST(is_cancellation, ApplicationError) {
    EXPECT_FALSE(is_cancellation(application_error("failed")));
}

TEST(is_cancellation, ActivityErrorCausedByApplicationError) {
    EXPECT_FALSE(is_cancellation(make_activity_error(std::make_exception_ptr(application_error("failed")))));
}

TEST(is_cancellation, ActivityErrorWithoutCause) {
    EXPECT_FALSE(is_cancellation(make_activity_error(std::exception_ptr())));
}

TEST(is_cancellation, OnlyDirectCauseIsInspected) {
    const auto inner = make_activity_error(std::make_exception_ptr(cancelled_error()));
    const auto outer = make_activity_error(std::make_exception_ptr(inner));

    EXPECT_TRUE(is_cancellation(inner));
    EXPECT_FALSE(is_cancellation(outer));
}

TEST(is_cancellation, ActivityErrorCausedByHostCancellation) {
    EXPECT_FALSE(is_cancellation(make_activity_error(std::make_exception_ptr(boost::thread_interrupted()))));
}

TEST(is_cancellation, CancelledErrorCauseOfOtherKinds) {
    const auto cause = std::make_exception_ptr(cancelled_error());

    EXPECT_FALSE(is_cancellation(application_error("failed", payloads_t(), boost::none, false, boost::none, cause)));
    EXPECT_FALSE(is_cancellation(timeout_error("timeout", timeout_type::heartbeat, payloads_t(), cause)));
}

TEST(is_cancellation, ForeignErrors) {
    EXPECT_FALSE(is_cancellation(std::runtime_error("cancelled")));
    EXPECT_FALSE(is_cancellation(std::make_exception_ptr(42)));
    EXPECT_FALSE(is_cancellation(std::exception_ptr()));
}

#include <stdexcept>
#include <system_error>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <tempest/framework/error.hpp>
#include <tempest/framework/policy.hpp>

using namespace tempest::framework;

using namespace testing;

TEST(failure_policy_t, FailureErrorsFailWorkflow) {
    const failure_policy_t policy;

    EXPECT_TRUE(policy.is_workflow_failure(application_error("failed")));
    EXPECT_TRUE(policy.is_workflow_failure(cancelled_error()));
    EXPECT_TRUE(policy.is_workflow_failure(std::make_exception_ptr(terminated_error("terminated"))));
}

TEST(failure_policy_t, OtherErrorsAreTransientByDefault) {
    const failure_policy_t policy;

    EXPECT_FALSE(policy.is_workflow_failure(std::runtime_error("transient")));
    EXPECT_FALSE(policy.is_workflow_failure(std::make_exception_ptr(std::logic_error("bug"))));
    EXPECT_FALSE(policy.is_workflow_failure(std::make_exception_ptr(42)));
    EXPECT_FALSE(policy.is_workflow_failure(std::exception_ptr()));
}

TEST(failure_policy_t, TreatType) {
    failure_policy_t policy;
    policy.treat<std::logic_error>();

    EXPECT_TRUE(policy.is_workflow_failure(std::logic_error("bug")));
    EXPECT_TRUE(policy.is_workflow_failure(std::invalid_argument("derived")));
    EXPECT_FALSE(policy.is_workflow_failure(std::runtime_error("transient")));
}

TEST(failure_policy_t, TreatAllErrors) {
    failure_policy_t policy;
    policy.treat<std::exception>();

    EXPECT_TRUE(policy.is_workflow_failure(std::runtime_error("any")));
    EXPECT_TRUE(policy.is_workflow_failure(std::make_exception_ptr(std::system_error(std::make_error_code(std::errc::io_error)))));
}

TEST(failure_policy_t, TreatPredicate) {
    MockFunction<bool(const std::exception&)> predicate;

    failure_policy_t policy;
    policy.treat(predicate.AsStdFunction());

    EXPECT_CALL(predicate, Call(_))
        .WillOnce(Return(false))
        .WillOnce(Return(true));

    EXPECT_FALSE(policy.is_workflow_failure(std::runtime_error("first")));
    EXPECT_TRUE(policy.is_workflow_failure(std::runtime_error("second")));
}

TEST(failure_policy_t, PredicateIsNotConsultedForFailureErrors) {
    MockFunction<bool(const std::exception&)> predicate;

    failure_policy_t policy;
    policy.treat(predicate.AsStdFunction());

    EXPECT_CALL(predicate, Call(_))
        .Times(0);

    EXPECT_TRUE(policy.is_workflow_failure(server_error("internal")));
}

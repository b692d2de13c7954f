#include <gtest/gtest.h>

#include <tempest/framework/state.hpp>

using namespace tempest::framework;

TEST(timeout_type, ProtocolCodes) {
    EXPECT_EQ(1, static_cast<int>(timeout_type::start_to_close));
    EXPECT_EQ(2, static_cast<int>(timeout_type::schedule_to_start));
    EXPECT_EQ(3, static_cast<int>(timeout_type::schedule_to_close));
    EXPECT_EQ(4, static_cast<int>(timeout_type::heartbeat));
}

TEST(retry_state, ProtocolCodes) {
    EXPECT_EQ(1, static_cast<int>(retry_state::in_progress));
    EXPECT_EQ(2, static_cast<int>(retry_state::non_retryable_failure));
    EXPECT_EQ(3, static_cast<int>(retry_state::timeout));
    EXPECT_EQ(4, static_cast<int>(retry_state::maximum_attempts_reached));
    EXPECT_EQ(5, static_cast<int>(retry_state::retry_policy_not_set));
    EXPECT_EQ(6, static_cast<int>(retry_state::internal_server_error));
    EXPECT_EQ(7, static_cast<int>(retry_state::cancel_requested));
}

TEST(timeout_type, FromWire) {
    EXPECT_EQ(timeout_type::start_to_close, *timeout_type_from_wire(1));
    EXPECT_EQ(timeout_type::heartbeat, *timeout_type_from_wire(4));
}

TEST(timeout_type, FromWireUnspecifiedOrUnknown) {
    EXPECT_FALSE(timeout_type_from_wire(0));
    EXPECT_FALSE(timeout_type_from_wire(5));
    EXPECT_FALSE(timeout_type_from_wire(-1));
}

TEST(retry_state, FromWire) {
    EXPECT_EQ(retry_state::in_progress, *retry_state_from_wire(1));
    EXPECT_EQ(retry_state::cancel_requested, *retry_state_from_wire(7));
    EXPECT_FALSE(retry_state_from_wire(0));
    EXPECT_FALSE(retry_state_from_wire(8));
}

TEST(retry_state, ToWire) {
    EXPECT_EQ(4, to_wire(boost::optional<retry_state>(retry_state::maximum_attempts_reached)));
    EXPECT_EQ(0, to_wire(boost::optional<retry_state>()));
}

TEST(timeout_type, ToWire) {
    EXPECT_EQ(2, to_wire(boost::optional<timeout_type>(timeout_type::schedule_to_start)));
    EXPECT_EQ(0, to_wire(boost::optional<timeout_type>()));
}

TEST(state, ToString) {
    EXPECT_EQ("HEARTBEAT", to_string(timeout_type::heartbeat));
    EXPECT_EQ("MAXIMUM_ATTEMPTS_REACHED", to_string(retry_state::maximum_attempts_reached));
}

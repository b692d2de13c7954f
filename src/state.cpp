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

#include "tempest/framework/state.hpp"

#include <array>

#include "tempest/api/enums/v1/workflow.pb.h"

using namespace tempest::framework;

namespace wire = tempest::api::enums::v1;

static_assert(static_cast<int>(timeout_type::start_to_close)    == wire::TIMEOUT_TYPE_START_TO_CLOSE,    "protocol mismatch");
static_assert(static_cast<int>(timeout_type::schedule_to_start) == wire::TIMEOUT_TYPE_SCHEDULE_TO_START, "protocol mismatch");
static_assert(static_cast<int>(timeout_type::schedule_to_close) == wire::TIMEOUT_TYPE_SCHEDULE_TO_CLOSE, "protocol mismatch");
static_assert(static_cast<int>(timeout_type::heartbeat)         == wire::TIMEOUT_TYPE_HEARTBEAT,         "protocol mismatch");

static_assert(static_cast<int>(retry_state::in_progress)              == wire::RETRY_STATE_IN_PROGRESS,              "protocol mismatch");
static_assert(static_cast<int>(retry_state::non_retryable_failure)    == wire::RETRY_STATE_NON_RETRYABLE_FAILURE,    "protocol mismatch");
static_assert(static_cast<int>(retry_state::timeout)                  == wire::RETRY_STATE_TIMEOUT,                  "protocol mismatch");
static_assert(static_cast<int>(retry_state::maximum_attempts_reached) == wire::RETRY_STATE_MAXIMUM_ATTEMPTS_REACHED, "protocol mismatch");
static_assert(static_cast<int>(retry_state::retry_policy_not_set)     == wire::RETRY_STATE_RETRY_POLICY_NOT_SET,     "protocol mismatch");
static_assert(static_cast<int>(retry_state::internal_server_error)    == wire::RETRY_STATE_INTERNAL_SERVER_ERROR,    "protocol mismatch");
static_assert(static_cast<int>(retry_state::cancel_requested)         == wire::RETRY_STATE_CANCEL_REQUESTED,         "protocol mismatch");

namespace {

template<typename T>
struct mapping_t {
    T value;
    int code;
    const char* name;
};

const std::array<mapping_t<timeout_type>, 4> timeout_types = {{
    { timeout_type::start_to_close,    wire::TIMEOUT_TYPE_START_TO_CLOSE,    "START_TO_CLOSE"    },
    { timeout_type::schedule_to_start, wire::TIMEOUT_TYPE_SCHEDULE_TO_START, "SCHEDULE_TO_START" },
    { timeout_type::schedule_to_close, wire::TIMEOUT_TYPE_SCHEDULE_TO_CLOSE, "SCHEDULE_TO_CLOSE" },
    { timeout_type::heartbeat,         wire::TIMEOUT_TYPE_HEARTBEAT,         "HEARTBEAT"         }
}};

const std::array<mapping_t<retry_state>, 7> retry_states = {{
    { retry_state::in_progress,              wire::RETRY_STATE_IN_PROGRESS,              "IN_PROGRESS"              },
    { retry_state::non_retryable_failure,    wire::RETRY_STATE_NON_RETRYABLE_FAILURE,    "NON_RETRYABLE_FAILURE"    },
    { retry_state::timeout,                  wire::RETRY_STATE_TIMEOUT,                  "TIMEOUT"                  },
    { retry_state::maximum_attempts_reached, wire::RETRY_STATE_MAXIMUM_ATTEMPTS_REACHED, "MAXIMUM_ATTEMPTS_REACHED" },
    { retry_state::retry_policy_not_set,     wire::RETRY_STATE_RETRY_POLICY_NOT_SET,     "RETRY_POLICY_NOT_SET"     },
    { retry_state::internal_server_error,    wire::RETRY_STATE_INTERNAL_SERVER_ERROR,    "INTERNAL_SERVER_ERROR"    },
    { retry_state::cancel_requested,         wire::RETRY_STATE_CANCEL_REQUESTED,         "CANCEL_REQUESTED"         }
}};

template<typename T, std::size_t N>
boost::optional<T>
from_code(const std::array<mapping_t<T>, N>& table, int code) noexcept {
    for (const auto& mapping : table) {
        if (mapping.code == code) {
            return mapping.value;
        }
    }

    return boost::none;
}

template<typename T, std::size_t N>
int
to_code(const std::array<mapping_t<T>, N>& table, const boost::optional<T>& value) noexcept {
    if (value) {
        for (const auto& mapping : table) {
            if (mapping.value == *value) {
                return mapping.code;
            }
        }
    }

    return 0;
}

template<typename T, std::size_t N>
std::string
name_of(const std::array<mapping_t<T>, N>& table, T value) {
    for (const auto& mapping : table) {
        if (mapping.value == value) {
            return mapping.name;
        }
    }

    return std::to_string(static_cast<int>(value));
}

} // namespace

boost::optional<timeout_type>
tempest::framework::timeout_type_from_wire(int code) noexcept {
    return from_code(timeout_types, code);
}

boost::optional<retry_state>
tempest::framework::retry_state_from_wire(int code) noexcept {
    return from_code(retry_states, code);
}

int
tempest::framework::to_wire(const boost::optional<timeout_type>& type) noexcept {
    return to_code(timeout_types, type);
}

int
tempest::framework::to_wire(const boost::optional<retry_state>& state) noexcept {
    return to_code(retry_states, state);
}

std::string
tempest::framework::to_string(timeout_type type) {
    return name_of(timeout_types, type);
}

std::string
tempest::framework::to_string(retry_state state) {
    return name_of(retry_states, state);
}

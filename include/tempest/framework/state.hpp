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

#include <string>

#include <boost/optional/optional.hpp>

/// This module provides failure classification enums, whose numeric codes mirror the wire protocol.
///
/// Each member is pinned to its protocol code explicitly, never by the declaration order.

namespace tempest {

namespace framework {

/// Type of timeout carried by a `timeout_error`.
enum class timeout_type {
    start_to_close    = 1,
    schedule_to_start = 2,
    schedule_to_close = 3,
    heartbeat         = 4
};

/// Backend-reported reason why a retryable operation stopped retrying.
enum class retry_state {
    in_progress              = 1,
    non_retryable_failure    = 2,
    timeout                  = 3,
    maximum_attempts_reached = 4,
    retry_policy_not_set     = 5,
    internal_server_error    = 6,
    cancel_requested         = 7
};

/*!
 * Maps the protocol timeout type code to the enum member.
 *
 * Returns none for the unspecified code and for codes introduced by newer protocol versions, so
 * older clients never fail on them.
 */
boost::optional<timeout_type>
timeout_type_from_wire(int code) noexcept;

/// Maps the protocol retry state code to the enum member, see `timeout_type_from_wire`.
boost::optional<retry_state>
retry_state_from_wire(int code) noexcept;

/// Returns the protocol code of the given timeout type or 0 (unspecified) if there is none.
int
to_wire(const boost::optional<timeout_type>& type) noexcept;

/// Returns the protocol code of the given retry state or 0 (unspecified) if there is none.
int
to_wire(const boost::optional<retry_state>& state) noexcept;

/// Returns the protocol name, e.g. "HEARTBEAT".
std::string
to_string(timeout_type type);

/// Returns the protocol name, e.g. "MAXIMUM_ATTEMPTS_REACHED".
std::string
to_string(retry_state state);

} // namespace framework

} // namespace tempest

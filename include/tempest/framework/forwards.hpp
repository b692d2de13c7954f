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

#include <memory>

namespace tempest {

namespace api {

namespace failure {

namespace v1 {

class Failure;

} // namespace v1

} // namespace failure

} // namespace api

namespace framework {

struct payload_t;

class error_t;
class failure_error;
class application_error;
class cancelled_error;
class terminated_error;
class timeout_error;
class server_error;
class activity_error;
class child_workflow_error;
class workflow_already_started_error;
class unknown_failure_error;

class failure_converter_t;
class failure_policy_t;

/// Wire-level failure representation.
typedef api::failure::v1::Failure wire_failure_t;

/// The original wire failure attached to decoded errors. Shared, never modified.
typedef std::shared_ptr<const wire_failure_t> wire_failure_ptr;

} // namespace framework

} // namespace tempest

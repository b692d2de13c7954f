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

#include <exception>
#include <functional>
#include <vector>

namespace tempest {

namespace framework {

/*!
 * Decides whether an error thrown from the workflow code permanently fails the workflow
 * execution.
 *
 * Every failure error fails the execution. Any other error is presumed transient by default: it
 * causes the current workflow task to be retried. Additional error types can be configured to be
 * treated as workflow failures.
 *
 * The policy should be fully configured before it is shared. After that it is safe to query it
 * concurrently.
 */
class failure_policy_t {
public:
    typedef std::function<bool(const std::exception&)> predicate_type;

private:
    std::vector<predicate_type> predicates_;

public:
    /// Registers an arbitrary predicate, matching errors that should fail the workflow execution.
    failure_policy_t&
    treat(predicate_type predicate);

    /// Registers an error type, whose instances (including derived ones) should fail the workflow
    /// execution.
    template<class E>
    failure_policy_t&
    treat() {
        return treat([](const std::exception& err) -> bool {
            return dynamic_cast<const E*>(&err) != nullptr;
        });
    }

    bool
    is_workflow_failure(const std::exception& err) const;

    /// Null pointers and exceptions not derived from `std::exception` are never workflow failures.
    bool
    is_workflow_failure(const std::exception_ptr& err) const;
};

} // namespace framework

} // namespace tempest

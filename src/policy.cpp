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

#include "tempest/framework/policy.hpp"

#include "tempest/framework/error.hpp"

using namespace tempest::framework;

failure_policy_t&
failure_policy_t::treat(predicate_type predicate) {
    predicates_.push_back(std::move(predicate));
    return *this;
}

bool
failure_policy_t::is_workflow_failure(const std::exception& err) const {
    if (dynamic_cast<const failure_error*>(&err)) {
        return true;
    }

    for (const auto& predicate : predicates_) {
        if (predicate(err)) {
            return true;
        }
    }

    return false;
}

bool
failure_policy_t::is_workflow_failure(const std::exception_ptr& err) const {
    if (!err) {
        return false;
    }

    try {
        std::rethrow_exception(err);
    } catch (const std::exception& e) {
        return is_workflow_failure(e);
    } catch (...) {
        // Foreign exceptions are presumed transient, the task will be retried.
        return false;
    }
}

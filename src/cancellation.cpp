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

#include "tempest/framework/cancellation.hpp"

#include "tempest/framework/error.hpp"

using namespace tempest::framework;

namespace {

bool
is_cancelled_error(const std::exception_ptr& err) noexcept {
    if (!err) {
        return false;
    }

    try {
        std::rethrow_exception(err);
    } catch (const cancelled_error&) {
        return true;
    } catch (...) {
        // Any other cause, whatever it is, does not make its wrapper a cancellation.
        return false;
    }
}

} // namespace

bool
tempest::framework::is_cancellation(const std::exception& err) noexcept {
    const failure_error* failure = dynamic_cast<const failure_error*>(&err);

    if (failure == nullptr) {
        return false;
    }

    switch (failure->kind()) {
    case error::cancelled:
        return true;
    case error::activity:
    case error::child_workflow:
        return is_cancelled_error(failure->cause());
    default:
        return false;
    }
}

bool
tempest::framework::is_cancellation(const boost::thread_interrupted&) noexcept {
    return true;
}

bool
tempest::framework::is_cancellation(const std::exception_ptr& err) noexcept {
    if (!err) {
        return false;
    }

    try {
        std::rethrow_exception(err);
    } catch (const boost::thread_interrupted& e) {
        return is_cancellation(e);
    } catch (const std::exception& e) {
        return is_cancellation(e);
    } catch (...) {
        return false;
    }
}

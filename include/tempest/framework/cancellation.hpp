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

#include <boost/thread/exceptions.hpp>

namespace tempest {

namespace framework {

/*!
 * Checks whether the given error is considered a cancellation.
 *
 * This is often used in a catch clause to check whether a cancel occurred inside of a workflow.
 * The error is a cancellation if it is:
 *  - the host runtime cancellation signal, i.e. `boost::thread_interrupted`;
 *  - a `cancelled_error`;
 *  - an `activity_error` or a `child_workflow_error` whose direct cause is a `cancelled_error`.
 *
 * \note only one level of the cause chain is inspected. An activity error caused by another
 * activity error, which in turn is caused by a cancelled error, is not a cancellation.
 */
bool
is_cancellation(const std::exception& err) noexcept;

/// Always true, the host runtime cancellation signal is a cancellation by definition.
bool
is_cancellation(const boost::thread_interrupted& err) noexcept;

/// Checks the captured error, see above. Null pointer is not a cancellation.
bool
is_cancellation(const std::exception_ptr& err) noexcept;

} // namespace framework

} // namespace tempest

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

#include <cstddef>
#include <exception>
#include <string>

#include "tempest/framework/forwards.hpp"

namespace tempest {

namespace framework {

struct converter_options_t {
    /// Move the message and the stack trace into the encoded attributes payload, so they are not
    /// visible to the backend in plain text.
    bool encode_common_attributes;

    /// Maximum number of cause links followed while encoding or decoding. Deeper links are
    /// dropped.
    std::size_t max_cause_depth;

    converter_options_t();
};

/*!
 * Converts errors to wire failures and back.
 *
 * Decoding selects the error class by the failure info case, decodes the cause first and attaches
 * the original wire failure to the result. Decoding never throws: an unrecognized failure info
 * results in `unknown_failure_error`.
 *
 * Encoding is the inverse mapping. An error that carries the wire failure it was decoded from is
 * encoded by copying that failure verbatim, encoded attributes included, regardless of the
 * options. Otherwise the failure is derived from its fields.
 */
class failure_converter_t {
    converter_options_t options_;

public:
    failure_converter_t();

    explicit
    failure_converter_t(converter_options_t options);

    const converter_options_t&
    options() const noexcept;

    /// Decodes the given wire failure into an error, which can be rethrown or inspected.
    std::exception_ptr
    from_failure(const wire_failure_t& failure) const;

    /*!
     * Encodes the given error into the wire failure.
     *
     * Errors outside of the taxonomy are encoded as application failures, whose type is the
     * demangled name of the error class. Their cause is taken from `std::nested_exception`.
     */
    void
    to_failure(const std::exception& err, wire_failure_t& failure) const;

    /// Encodes the captured error. The host cancellation signal is encoded as a cancellation.
    void
    to_failure(const std::exception_ptr& err, wire_failure_t& failure) const;

private:
    template<class E>
    std::exception_ptr
    attach(E err, const wire_failure_ptr& failure, const std::string& stack_trace) const;

    std::exception_ptr
    decode(const wire_failure_t& failure, std::size_t depth) const;

    void
    encode(const std::exception& err, wire_failure_t& failure, std::size_t depth) const;

    void
    encode(const std::exception_ptr& err, wire_failure_t& failure, std::size_t depth) const;

    void
    encode_cause(const std::exception_ptr& cause, wire_failure_t& failure, std::size_t depth) const;

    void
    encode_attributes(wire_failure_t& failure) const;
};

} // namespace framework

} // namespace tempest

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

#include <map>
#include <string>
#include <vector>

namespace tempest {

namespace framework {

/*!
 * An opaque encoded value attached to failures as details or heartbeat details.
 *
 * The framework neither interprets nor validates payloads, it only carries them between the user
 * code and the wire.
 */
struct payload_t {
    std::map<std::string, std::string> metadata;
    std::string data;
};

inline bool operator==(const payload_t& lhs, const payload_t& rhs) {
    return lhs.metadata == rhs.metadata && lhs.data == rhs.data;
}

inline bool operator!=(const payload_t& lhs, const payload_t& rhs) {
    return !(lhs == rhs);
}

typedef std::vector<payload_t> payloads_t;

} // namespace framework

} // namespace tempest

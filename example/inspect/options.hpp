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

namespace tempest {

namespace framework {

namespace inspect {

struct options_t {
    std::string input;
    bool text;
    bool encode_common_attributes;

    /// Parses command-line arguments to extract all required settings to be able to inspect the
    /// failure.
    ///
    /// Can internally terminate the program on invalid command-line arguments, providing an help
    /// message and returning a proper exit code.
    options_t(int argc, char** argv);
};

} // namespace inspect

} // namespace framework

} // namespace tempest

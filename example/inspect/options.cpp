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

#include "options.hpp"

#include <cstdlib>
#include <iostream>

#include <boost/program_options.hpp>

using namespace tempest::framework::inspect;

namespace {

void help(const char* program, const boost::program_options::options_description& description) {
    std::cerr << "Usage: " << program << " --input FILE [--text]" << std::endl << std::endl;
    std::cerr << description << std::endl;
}

} // namespace

options_t::options_t(int argc, char** argv) :
    text(false),
    encode_common_attributes(false)
{
    boost::program_options::options_description options("Configuration");
    options.add_options()
        ("input,i", boost::program_options::value<std::string>(), "path to the serialized failure")
        ("text,t", "the failure is in protobuf text format instead of binary")
        ("encode-common-attributes", "hide message and stack trace when re-encoding");

    boost::program_options::options_description general("General options");
    general.add(options);
    general.add_options()
        ("help,h",     "display this help and exit")
        ("version,v",  "output the Framework version information and exit");

    boost::program_options::variables_map vm;

    try {
        boost::program_options::command_line_parser parser(argc, argv);
        parser.options(general);

        boost::program_options::store(parser.run(), vm);
        boost::program_options::notify(vm);
    } catch (const boost::program_options::error& err) {
        std::cerr << "ERROR: " << err.what() << std::endl << std::endl;
        help(argv[0], general);
        std::exit(1);
    }

    if (vm.count("help")) {
        help(argv[0], general);
        std::exit(0);
    }

    if (vm.count("version")) {
        std::cerr << "0.1.0" << std::endl;
        std::exit(0);
    }

    if (vm.count("input") == 0) {
        std::cerr << "ERROR: the required 'input' option is not specified" << std::endl << std::endl;
        help(argv[0], general);
        std::exit(1);
    }

    input = vm["input"].as<std::string>();
    text = vm.count("text") > 0;
    encode_common_attributes = vm.count("encode-common-attributes") > 0;
}

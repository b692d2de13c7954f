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

#include "tempest/framework/detail/log.hpp"

#ifdef TF_USE_INTERNAL_LOGGING

#include <array>

#include <blackhole/formatter/string.hpp>
#include <blackhole/sink/stream.hpp>

namespace tempest {

namespace framework {

namespace detail {

void
map_severity(blackhole::aux::attachable_ostringstream& stream, const level_t& level) {
    typedef blackhole::aux::underlying_type<level_t>::type underlying_type;

    static std::array<const char*, 5> describe = {{ "D", "N", "I", "W", "E" }};

    const size_t value = static_cast<underlying_type>(level);

    if(value < describe.size()) {
        stream << describe[value];
    } else {
        stream << value;
    }
}

static logger_type create() {
    // Failures are converted on the hot path, so only warnings are visible by default.
    logger_type logger(level_t::warn);
    auto formatter = blackhole::aux::util::make_unique<
        blackhole::formatter::string_t
    >("[%(severity)s] [%(timestamp)s] [%(lwp)s]: %(message)s");

    blackhole::mapping::value_t mapper;
    mapper.add<blackhole::keyword::tag::timestamp_t>("%H:%M:%S.%f");
    mapper.add<blackhole::keyword::tag::severity_t<level_t>>(&map_severity);
    formatter->set_mapper(mapper);

    auto sink = blackhole::aux::util::make_unique<
        blackhole::sink::stream_t
    >(blackhole::sink::stream_t::output_t::stderr);

    auto frontend = blackhole::aux::util::make_unique<
        blackhole::frontend_t<
            blackhole::formatter::string_t,
            blackhole::sink::stream_t
        >
    >(std::move(formatter), std::move(sink));

    logger.add_frontend(std::move(frontend));
    return logger;
}

logger_type& logger() {
    static logger_type log = create();
    return log;
}

} // namespace detail

} // namespace framework

} // namespace tempest

#endif

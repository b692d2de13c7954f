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

#include "tempest/framework/config.hpp"

#ifdef TF_USE_INTERNAL_LOGGING

#define BLACKHOLE_HAS_ATTRIBUTE_LWP
#include <blackhole/logger.hpp>
#include <blackhole/macro.hpp>

namespace tempest {

namespace framework {

namespace detail {

enum level_t {
    debug,
    notice,
    info,
    warn,
    error
};

typedef blackhole::verbose_logger_t<level_t> logger_type;

logger_type& logger();

} // namespace detail

} // namespace framework

} // namespace tempest

/// Silently cast std::size_t to unsigned long long to suppress logger format warnings in
/// cross-platform manner.
#   define TF_US(sized) static_cast<unsigned long long>(sized)

#   define TF_LOG BH_LOG
#   define TF_DBG(...) TF_LOG(::tempest::framework::detail::logger(), ::tempest::framework::detail::debug, __VA_ARGS__)
#   define TF_WRN(...) TF_LOG(::tempest::framework::detail::logger(), ::tempest::framework::detail::warn, __VA_ARGS__)

#else
#   define TF_US(...)
#   define TF_LOG(...)
#   define TF_DBG(...)
#   define TF_WRN(...)
#endif

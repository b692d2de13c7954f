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

/// Use internal logging system (much verbose).
///
/// Controlled by the TEMPEST_INTERNAL_LOGGING build option.
#ifndef TF_DISABLE_INTERNAL_LOGGING
#define TF_USE_INTERNAL_LOGGING
#endif

/// Identifies this runtime in the `source` field of every encoded failure.
#define TF_FAILURE_SOURCE "CppSDK"

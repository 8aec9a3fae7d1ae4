//  SPDX-License-Identifier: GPL-3.0-or-later
//
//  Copyright (c) 2013-2023 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
//
//  This file is part of huelink.
//
//  huelink is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  huelink is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with huelink. If not, see <http://www.gnu.org/licenses/>.
//

#ifndef __huelink__common__
#define __huelink__common__

#include "huelink_config.hpp"

#include "p44utils_common.hpp"

/// huelink library version
#define HUELINK_VERSION "1.0.0"

/// hue API v1 path on the bridge
#define HUELINK_API_V1_PATH "api"

/// @name registration defaults
/// @note these are defaults of the command line tool, not protocol requirements
/// @{
#define HUELINK_DEFAULT_PAIRING_ATTEMPTS 30
#define HUELINK_DEFAULT_PAIRING_INTERVAL (5*Second)
/// @}

/// default timeout for a single API request
#define HUELINK_DEFAULT_REQUEST_TIMEOUT (10*Second)

/// minimal delay between two API requests
/// @note Philips says: no more than 10 API calls per second
#define HUELINK_DEFAULT_REQUEST_PACING (100*MilliSecond)


#endif /* defined(__huelink__common__) */

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

#ifndef __huelink__p44utils_config__
#define __huelink__p44utils_config__

// p44utils feature selection for huelink

#define ENABLE_NAMED_ERRORS 1
#define ENABLE_APPLICATION_SUPPORT 1
#define ENABLE_JSON_APPLICATION 1

// not needed in huelink
#define ENABLE_P44SCRIPT 0
#define ENABLE_EXPRESSIONS 0
#define ENABLE_P44LRGRAPHICS 0
#define ENABLE_UBUS 0
#define ENABLE_HTTP_SCRIPT_FUNCS 0
#define ENABLE_SOCKET_SCRIPT_FUNCS 0
#define ENABLE_JSON_SCRIPT_FUNCS 0

#endif /* defined(__huelink__p44utils_config__) */

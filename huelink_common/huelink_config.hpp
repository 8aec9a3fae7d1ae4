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

#ifndef __huelink__config__
#define __huelink__config__

// discovery via Philips/Signify cloud (N-UPnP)
#ifndef HUELINK_CLOUD_DISCOVERY
  #define HUELINK_CLOUD_DISCOVERY 1
#endif

// legacy local hue bridge discovery via SSDP (UPnP)
#ifndef HUELINK_SSDP_DISCOVERY
  #define HUELINK_SSDP_DISCOVERY 1
#endif

#if !HUELINK_CLOUD_DISCOVERY && !HUELINK_SSDP_DISCOVERY
  #error "at least one discovery method must be enabled"
#endif

#endif /* defined(__huelink__config__) */

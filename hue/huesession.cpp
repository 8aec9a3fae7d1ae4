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

// File scope debugging options
// - Set ALWAYS_DEBUG to 1 to enable DBGLOG output even in non-DEBUG builds of this file
#define ALWAYS_DEBUG 0
// - set FOCUSLOGLEVEL to non-zero log level (usually, 5,6, or 7==LOG_DEBUG) to get focus (extensive logging) for this file
//   Note: must be before including "logger.hpp" (or anything that includes "logger.hpp")
#define FOCUSLOGLEVEL 7

#include "huesession.hpp"

using namespace huelink;


#if ENABLE_NAMED_ERRORS
const char* HueSessionError::errorName() const
{
  switch(getErrorCode()) {
    case InvalidSession: return "InvalidSession";
    case NothingToSend: return "NothingToSend";
    case InvalidLight: return "InvalidLight";
  }
  return NULL;
}
#endif // ENABLE_NAMED_ERRORS


HueSession::HueSession(HueComm &aHueComm, const string &aBridgeAddress, const string &aUserName) :
  mHueComm(aHueComm),
  mBridgeAddress(aBridgeAddress),
  mUserName(aUserName)
{
}


HueSession::~HueSession()
{
}


ErrorPtr HueSession::newSession(HueComm &aHueComm, const string &aBridgeAddress, const string &aUserName, HueSessionPtr &aSession)
{
  aSession.reset();
  if (aBridgeAddress.empty()) {
    return Error::err<HueSessionError>(HueSessionError::InvalidSession, "no bridge address");
  }
  if (aUserName.empty()) {
    return Error::err<HueSessionError>(HueSessionError::InvalidSession, "no username, register first");
  }
  aSession = HueSessionPtr(new HueSession(aHueComm, aBridgeAddress, aUserName));
  return ErrorPtr();
}


bool HueSession::needsReRegistration(ErrorPtr aError)
{
  return Error::isError(aError, HueBridgeError::domain(), HueBridgeError::UnauthorizedUser);
}


string HueSession::userPath(const string &aSubPath) const
{
  return "/" + mUserName + aSubPath;
}


// MARK: - lights

void HueSession::listLights(HueLightsCB aCallback)
{
  OLOG(LOG_INFO, "querying lights of bridge %s", mBridgeAddress.c_str());
  mHueComm.apiQuery(mBridgeAddress, userPath("/lights"), boost::bind(&HueSession::lightsReceived, aCallback, _1, _2));
}


void HueSession::lightsReceived(HueLightsCB aCallback, JsonObjectPtr aResult, ErrorPtr aError)
{
  HueLightsVector lights;
  if (Error::isOK(aError) && aResult) {
    // { "1": { "state": {...}, "type": "Dimmable light", "name": "lux demoboard", ... }, "2": .... }
    aResult->resetKeyIteration();
    string lightID;
    JsonObjectPtr lightInfo;
    while (aResult->nextKeyValue(lightID, lightInfo)) {
      HueLightPtr light = HueLight::newFromLightInfo(lightID, lightInfo);
      if (light) lights.push_back(light);
    }
  }
  if (aCallback) aCallback(lights, aError);
}


void HueSession::getLight(const string &aLightID, HueLightCB aCallback)
{
  mHueComm.apiQuery(mBridgeAddress, userPath("/lights/"+aLightID), boost::bind(&HueSession::lightReceived, aLightID, aCallback, _1, _2));
}


void HueSession::lightReceived(const string aLightID, HueLightCB aCallback, JsonObjectPtr aResult, ErrorPtr aError)
{
  HueLightPtr light;
  if (Error::isOK(aError)) {
    light = HueLight::newFromLightInfo(aLightID, aResult);
    if (!light) {
      aError = Error::err<HueSessionError>(HueSessionError::InvalidLight, "no usable info for light %s", aLightID.c_str());
    }
  }
  if (aCallback) aCallback(light, aError);
}


void HueSession::setLightState(const string &aLightID, const HueLightStateChange &aChange, HueLightStateCB aCallback)
{
  if (aChange.isEmpty()) {
    if (aCallback) aCallback(HueAppliedFieldsVector(), Error::err<HueSessionError>(HueSessionError::NothingToSend, "no light state change to send"));
    return;
  }
  JsonObjectPtr newState = aChange.stateJSON();
  OLOG(LOG_INFO, "light %s: setting new state %s", aLightID.c_str(), newState->c_strValue());
  mHueComm.apiAction(mBridgeAddress, userPath("/lights/"+aLightID+"/state"), newState, boost::bind(&HueSession::lightStateSent, aCallback, _1, _2));
}


void HueSession::lightStateSent(HueLightStateCB aCallback, JsonObjectPtr aResult, ErrorPtr aError)
{
  HueAppliedFieldsVector applied;
  if (Error::isOK(aError)) {
    // [{"success":{"/lights/1/state/bri":200}},{"success":{"/lights/1/state/on":true}}]
    applied = HueComm::appliedFields(aResult);
  }
  if (aCallback) aCallback(applied, aError);
}

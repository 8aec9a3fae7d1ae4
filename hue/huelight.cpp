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

#include "huelight.hpp"

using namespace huelink;


// MARK: - HueLight

HueLight::HueLight(const string &aLightID) :
  mLightID(aLightID),
  mOn(undefined),
  mBri(-1),
  mHue(-1),
  mSat(-1),
  mCt(-1),
  mHasXY(false),
  mX(0),
  mY(0),
  mReachable(undefined),
  mKind(fullcolor)
{
}


HueLightPtr HueLight::newFromLightInfo(const string &aLightID, JsonObjectPtr aLightInfo)
{
  if (!aLightInfo || !aLightInfo->isType(json_type_object)) return HueLightPtr();
  HueLightPtr light = HueLightPtr(new HueLight(aLightID));
  light->parseLightInfo(aLightInfo);
  return light;
}


const char *HueLight::kindName(LightKind aKind)
{
  switch (aKind) {
    case onoff: return "on/off";
    case dimmable: return "dimmable";
    case colortemperature: return "color temperature";
    default: return "full color";
  }
}


void HueLight::parseLightInfo(JsonObjectPtr aLightInfo)
{
  // { "state": {...}, "type": "Dimmable light", "name": "lux demoboard", "modelid": "LWB004","uniqueid":"00:17:88:01:00:e5:a0:87-0b", "swversion": "66012040" }
  mLightInfo = aLightInfo;
  JsonObjectPtr o;
  if (aLightInfo->get("name", o)) mName = o->stringValue();
  if (aLightInfo->get("type", o)) mType = o->stringValue();
  if (aLightInfo->get("modelid", o)) mModelId = o->stringValue();
  if (aLightInfo->get("uniqueid", o)) mUniqueId = o->stringValue();
  if (aLightInfo->get("swversion", o)) mSwVersion = o->stringValue();
  if (aLightInfo->get("manufacturername", o)) mManufacturer = o->stringValue();
  // no "state" == all lights have color (very old bridges)
  mKind = fullcolor;
  JsonObjectPtr state = aLightInfo->get("state");
  if (state) {
    if (state->get("on", o)) mOn = o->boolValue() ? yes : no;
    if (state->get("reachable", o)) mReachable = o->boolValue() ? yes : no;
    if (state->get("bri", o)) mBri = o->int32Value();
    if (state->get("hue", o)) mHue = o->int32Value();
    if (state->get("sat", o)) mSat = o->int32Value();
    if (state->get("ct", o)) mCt = o->int32Value();
    if (state->get("xy", o) && o->arrayLength()>=2) {
      JsonObjectPtr e;
      mHasXY = true;
      e = o->arrayGet(0);
      if (e) mX = e->doubleValue();
      e = o->arrayGet(1);
      if (e) mY = e->doubleValue();
    }
    if (state->get("colormode", o)) mColorMode = o->stringValue();
    if (state->get("effect", o)) mEffect = o->stringValue();
    if (state->get("alert", o)) mAlert = o->stringValue();
    // classify
    if (mBri<0) {
      // not dimmable: must be on/off switch
      mKind = onoff;
    }
    else if (mColorMode.empty()) {
      mKind = dimmable; // lamp without colormode -> just brightness (hue lux)
    }
    else if (mHue<0) {
      mKind = colortemperature; // lamp with colormode, but without hue -> tunable white (hue ambiance)
    }
  }
}


string HueLight::stateDescription() const
{
  string s = mOn==yes ? "on" : (mOn==no ? "off" : "?");
  if (mBri>=0) string_format_append(s, ", bri=%d", mBri);
  if (mColorMode=="hs") {
    string_format_append(s, ", hue=%d, sat=%d", mHue, mSat);
  }
  else if (mColorMode=="xy" && mHasXY) {
    string_format_append(s, ", xy=%.4f/%.4f", mX, mY);
  }
  else if (mColorMode=="ct" && mCt>0) {
    string_format_append(s, ", ct=%d mired (%dK)", mCt, 1000000/mCt);
  }
  if (mReachable==no) s += ", unreachable";
  return s;
}


// MARK: - HueLightStateChange

HueLightStateChange::HueLightStateChange() :
  mHasBri(false),
  mBri(0),
  mHasHue(false),
  mHue(0),
  mHasSat(false),
  mSat(0),
  mHasCt(false),
  mCt(0),
  mHasXY(false),
  mX(0),
  mY(0),
  mHasTransitionTime(false),
  mTransitionTime(0),
  mOn(undefined)
{
}


bool HueLightStateChange::setCtKelvin(int aKelvin)
{
  if (aKelvin<=0) return false;
  setCt(1000000/aKelvin);
  return true;
}


bool HueLightStateChange::isEmpty() const
{
  return
    mOn==undefined &&
    !mHasBri && !mHasHue && !mHasSat && !mHasCt &&
    !mHasXY &&
    mAlert.empty() && mEffect.empty() &&
    !mHasTransitionTime;
}


JsonObjectPtr HueLightStateChange::stateJSON() const
{
  JsonObjectPtr newState = JsonObject::newObj();
  if (mOn!=undefined) newState->add("on", JsonObject::newBool(mOn==yes));
  if (mHasBri) newState->add("bri", JsonObject::newInt32(mBri));
  if (mHasHue) newState->add("hue", JsonObject::newInt32(mHue));
  if (mHasSat) newState->add("sat", JsonObject::newInt32(mSat));
  if (mHasCt) newState->add("ct", JsonObject::newInt32(mCt));
  if (mHasXY) {
    // x,y are always applied together
    JsonObjectPtr xyArr = JsonObject::newArray();
    xyArr->arrayAppend(JsonObject::newDouble(mX));
    xyArr->arrayAppend(JsonObject::newDouble(mY));
    newState->add("xy", xyArr);
  }
  if (!mAlert.empty()) newState->add("alert", JsonObject::newString(mAlert));
  if (!mEffect.empty()) newState->add("effect", JsonObject::newString(mEffect));
  if (mHasTransitionTime) newState->add("transitiontime", JsonObject::newInt32(mTransitionTime));
  return newState;
}

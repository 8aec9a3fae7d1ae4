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

#ifndef __huelink__huelight__
#define __huelink__huelight__

#include "huelink_common.hpp"

#include "jsonobject.hpp"

using namespace std;
using namespace p44;

namespace huelink {

  class HueLight;
  typedef boost::intrusive_ptr<HueLight> HueLightPtr;
  typedef vector<HueLightPtr> HueLightsVector;

  /// point-in-time snapshot of one light as reported by the bridge
  /// @note numeric state fields not reported by the bridge are -1, never 0
  class HueLight : public P44Obj
  {
  public:

    typedef enum {
      onoff, ///< just on/off, no brightness
      dimmable, ///< brightness only (hue lux)
      colortemperature, ///< brightness and color temperature (hue ambiance)
      fullcolor ///< brightness, hue/saturation, xy and usually ct
    } LightKind;

    string mLightID; ///< bridge-local id, such as "1"

    /// @name descriptive fields, empty when not reported
    /// @{
    string mName;
    string mType;
    string mModelId;
    string mUniqueId;
    string mSwVersion;
    string mManufacturer;
    /// @}

    /// @name state
    /// @{
    Tristate mOn;
    int mBri; ///< 1..254
    int mHue; ///< 0..65535
    int mSat; ///< 0..254
    int mCt; ///< color temperature in mired
    bool mHasXY;
    double mX;
    double mY;
    string mColorMode; ///< "hs", "xy", "ct"
    string mEffect;
    string mAlert;
    Tristate mReachable;
    /// @}

    LightKind mKind;

    JsonObjectPtr mLightInfo; ///< the unmodified JSON object the bridge delivered

    HueLight(const string &aLightID);

    /// create a light snapshot from the bridge's light info
    /// @param aLightID the bridge-local light id
    /// @param aLightInfo the light object as delivered by GET /lights or /lights/<id>
    /// @return new light, or NULL if aLightInfo is not a JSON object
    static HueLightPtr newFromLightInfo(const string &aLightID, JsonObjectPtr aLightInfo);

    /// @return light kind as text
    static const char *kindName(LightKind aKind);

    /// @return short one-line description of the light's state
    string stateDescription() const;

  private:

    void parseLightInfo(JsonObjectPtr aLightInfo);

  };


  /// a partial light state to be sent to the bridge
  /// @note only fields that are set are sent. Numeric values are sent as given, range
  ///   checking is left to the bridge.
  class HueLightStateChange
  {
    bool mHasBri;
    int mBri;
    bool mHasHue;
    int mHue;
    bool mHasSat;
    int mSat;
    bool mHasCt;
    int mCt;
    bool mHasXY;
    double mX;
    double mY;
    bool mHasTransitionTime;
    int mTransitionTime;

  public:

    Tristate mOn; ///< undefined = do not change
    string mAlert; ///< "none", "select", "lselect", empty = do not change
    string mEffect; ///< "none", "colorloop", empty = do not change

    HueLightStateChange();

    /// @param aBri brightness, 1..254 for the bridge to accept it
    void setBri(int aBri) { mBri = aBri; mHasBri = true; };
    /// @param aHue hue, 0..65535 for the bridge to accept it
    void setHue(int aHue) { mHue = aHue; mHasHue = true; };
    /// @param aSat saturation, 0..254 for the bridge to accept it
    void setSat(int aSat) { mSat = aSat; mHasSat = true; };
    /// @param aCt color temperature in mired
    void setCt(int aCt) { mCt = aCt; mHasCt = true; };
    /// @param aX CIE x
    /// @param aY CIE y
    void setXY(double aX, double aY) { mX = aX; mY = aY; mHasXY = true; };
    /// @param aTransitionTime transition time in 100mS units
    void setTransitionTime(int aTransitionTime) { mTransitionTime = aTransitionTime; mHasTransitionTime = true; };

    /// set color temperature from Kelvin
    /// @param aKelvin color temperature in Kelvin, must be >0
    /// @return false if aKelvin is not usable, nothing is set then
    bool setCtKelvin(int aKelvin);

    /// @return true if nothing is set
    bool isEmpty() const;

    /// @return JSON object with the set fields only
    JsonObjectPtr stateJSON() const;

  };

} // namespace huelink

#endif // __huelink__huelight__

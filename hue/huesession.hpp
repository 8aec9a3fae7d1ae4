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

#ifndef __huelink__huesession__
#define __huelink__huesession__

#include "huecomm.hpp"
#include "huelight.hpp"

using namespace std;
using namespace p44;

namespace huelink {

  class HueSessionError : public Error
  {
  public:
    // Errors
    enum {
      OK,
      InvalidSession, ///< bridge address or username missing
      NothingToSend, ///< light state change is empty
      InvalidLight, ///< light info in response is not usable
    };
    typedef int ErrorCodes;

    static const char *domain() { return "HueSession"; }
    virtual const char *getErrorDomain() const P44_OVERRIDE { return HueSessionError::domain(); };
    explicit HueSessionError(ErrorCodes aError) : Error(ErrorCode(aError)) {};
    #if ENABLE_NAMED_ERRORS
  protected:
    virtual const char* errorName() const P44_OVERRIDE;
    #endif // ENABLE_NAMED_ERRORS
  };


  /// will be called with the lights of a bridge
  typedef boost::function<void (const HueLightsVector &aLights, ErrorPtr aError)> HueLightsCB;

  /// will be called with a single light
  typedef boost::function<void (HueLightPtr aLight, ErrorPtr aError)> HueLightCB;

  /// will be called with the changes acknowledged by the bridge
  typedef boost::function<void (const HueAppliedFieldsVector &aApplied, ErrorPtr aError)> HueLightStateCB;


  class HueSession;
  typedef boost::intrusive_ptr<HueSession> HueSessionPtr;

  /// authenticated access to a bridge as a registered user
  /// @note a session is immutable, and can be shared
  class HueSession : public P44LoggingObj
  {
    typedef P44LoggingObj inherited;

    HueComm &mHueComm;
    const string mBridgeAddress;
    const string mUserName;

    HueSession(HueComm &aHueComm, const string &aBridgeAddress, const string &aUserName);

  public:

    virtual ~HueSession();

    /// create a session
    /// @param aHueComm the transport to use
    /// @param aBridgeAddress the bridge address, must not be empty
    /// @param aUserName the username as issued by the bridge at registration, must not be empty
    /// @param aSession will be set to the new session
    /// @return HueSessionError::InvalidSession if address or username is empty
    static ErrorPtr newSession(HueComm &aHueComm, const string &aBridgeAddress, const string &aUserName, HueSessionPtr &aSession);

    /// @return type (such as: device, element, vdc, trigger) of the context object
    virtual string contextType() const P44_OVERRIDE { return "hue session"; }

    /// @return the bridge address
    const string &bridgeAddress() const { return mBridgeAddress; }

    /// @return the username
    const string &userName() const { return mUserName; }

    /// get all lights of the bridge
    /// @param aCallback called with the lights, in the order the bridge reports them
    void listLights(HueLightsCB aCallback);

    /// get a single light
    /// @param aLightID the bridge-local light id
    /// @param aCallback called with the light
    void getLight(const string &aLightID, HueLightCB aCallback);

    /// change the state of a light
    /// @param aLightID the bridge-local light id
    /// @param aChange the changes to apply. Only fields that are set will be sent
    /// @param aCallback called with the changes acknowledged by the bridge, in order of the response
    void setLightState(const string &aLightID, const HueLightStateChange &aChange, HueLightStateCB aCallback);

    /// @param aError an error returned by a session operation
    /// @return true if the error indicates that the username is not (or no longer) valid
    static bool needsReRegistration(ErrorPtr aError);

  private:

    string userPath(const string &aSubPath) const;

    static void lightsReceived(HueLightsCB aCallback, JsonObjectPtr aResult, ErrorPtr aError);
    static void lightReceived(const string aLightID, HueLightCB aCallback, JsonObjectPtr aResult, ErrorPtr aError);
    static void lightStateSent(HueLightStateCB aCallback, JsonObjectPtr aResult, ErrorPtr aError);

  };

} // namespace huelink

#endif // __huelink__huesession__

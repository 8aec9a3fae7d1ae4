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

#ifndef __huelink__huediscovery__
#define __huelink__huediscovery__

#include "huecomm.hpp"

#if HUELINK_SSDP_DISCOVERY
#include "ssdpsearch.hpp"
#endif

using namespace std;
using namespace p44;

namespace huelink {

  class HueDiscoveryError : public Error
  {
  public:
    // Errors
    enum {
      OK,
      LookupFailed, ///< no discovery mechanism was usable, and no bridge was found
      Aborted, ///< discovery was restarted before it completed
    };
    typedef int ErrorCodes;

    static const char *domain() { return "HueDiscovery"; }
    virtual const char *getErrorDomain() const P44_OVERRIDE { return HueDiscoveryError::domain(); };
    explicit HueDiscoveryError(ErrorCodes aError) : Error(ErrorCode(aError)) {};
    #if ENABLE_NAMED_ERRORS
  protected:
    virtual const char* errorName() const P44_OVERRIDE;
    #endif // ENABLE_NAMED_ERRORS
  };


  typedef vector<string> BridgeAddressList;

  /// will be called when discovery is complete
  /// @param aAddresses distinct bridge addresses found, in order found. Can be empty without error.
  /// @param aError HueDiscoveryError::LookupFailed if discovery could not be performed at all,
  ///   HueDiscoveryError::Aborted if a new discovery was started before this one completed
  typedef boost::function<void (const BridgeAddressList &aAddresses, ErrorPtr aError)> HueDiscoveryCB;


  class HueDiscovery;
  typedef boost::intrusive_ptr<HueDiscovery> HueDiscoveryPtr;

  /// finds hue bridges in the local network
  class HueDiscovery : public P44LoggingObj
  {
    typedef P44LoggingObj inherited;

    HueComm &mHueComm;

    HueDiscoveryCB mCallback;
    HueDiscoveryPtr mKeepAlive;
    bool mRunning;
    int mRunSerial;

    BridgeAddressList mAddresses;
    ErrorPtr mLookupError; ///< last mechanism failure

    #if HUELINK_SSDP_DISCOVERY
    SsdpSearchPtr mBridgeDetector;
    MLTicket mSsdpWindowTicket;
    #endif

  public:

    /// @name settings
    /// @{
    bool mUseCloud; ///< use the hue cloud (N-UPnP) discovery service
    bool mUseSsdp; ///< use local SSDP search
    MLMicroSeconds mSsdpWindow; ///< how long to collect SSDP answers
    string mCloudURL; ///< the discovery service URL
    /// @}

    HueDiscovery(HueComm &aHueComm);
    virtual ~HueDiscovery();

    /// @return type (such as: device, element, vdc, trigger) of the context object
    virtual string contextType() const P44_OVERRIDE { return "hue discovery"; }

    /// discover bridges
    /// @param aCallback called once with the list of bridge addresses found
    /// @note a discovery still running is ended first, its callback gets HueDiscoveryError::Aborted
    void discoverBridges(HueDiscoveryCB aCallback);

    /// stop discovery in progress, delivering what was found so far
    void stop();

    /// @return true while a discovery is running
    bool isRunning() const { return mRunning; }

    /// add address to list unless already present
    /// @return true if added
    static bool addUnique(BridgeAddressList &aAddresses, const string &aAddress);

    /// parse the response of the cloud discovery service
    /// @param aResponse the response body
    /// @param aAddresses addresses found will be appended (unless already present)
    /// @return error if response is not a valid discovery service answer
    static ErrorPtr parseCloudResponse(const string &aResponse, BridgeAddressList &aAddresses);

    /// @param aLocationURL a location URL as received in a SSDP response
    /// @return the host part (without port) of the location URL
    static string hostFromLocation(const string &aLocationURL);

    /// evaluate a SSDP response
    /// @param aAddresses the bridge host will be appended here (unless already present)
    /// @param aServer the SERVER header of the response. Only hue bridges (IpBridge) are considered
    /// @param aLocationURL the LOCATION header of the response
    /// @return true if a new bridge address was added
    static bool addSsdpResponse(BridgeAddressList &aAddresses, const string &aServer, const string &aLocationURL);

    #if HUELINK_SSDP_DISCOVERY
    /// @param aError the error that ended a SSDP search
    /// @return true if the search could not be performed (socket level problem), false for
    ///   a regular end of the search such as a receive timeout
    static bool isSsdpFailure(ErrorPtr aError);
    #endif

  protected:

    #if HUELINK_SSDP_DISCOVERY
    /// start sending/receiving SSDP search requests, results go to ssdpResponse() and ssdpSearchEnded()
    virtual void startSsdpSearch();
    /// stop the SSDP search
    virtual void stopSsdpSearch();
    /// a device answered the SSDP search
    void ssdpResponse(const string &aServer, const string &aLocationURL);
    /// the SSDP search ended
    void ssdpSearchEnded(ErrorPtr aError);
    #endif

  private:

    void startCloud();
    void gotCloudResponse(const string &aResponse, ErrorPtr aError, int aRunSerial);
    void startSsdp();
    #if HUELINK_SSDP_DISCOVERY
    void ssdpResultHandler(SsdpSearchPtr aSsdpSearch, ErrorPtr aError);
    void ssdpWindowEnded();
    #endif
    void deferredDone(int aRunSerial);
    void discoveryDone(ErrorPtr aAbortError = ErrorPtr());

  };

} // namespace huelink

#endif // __huelink__huediscovery__

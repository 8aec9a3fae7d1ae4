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

#include "huediscovery.hpp"

using namespace huelink;

#define NUPNP_URL "https://discovery.meethue.com/"
#define DEFAULT_SSDP_WINDOW (5*Second)


#if ENABLE_NAMED_ERRORS
const char* HueDiscoveryError::errorName() const
{
  switch(getErrorCode()) {
    case LookupFailed: return "LookupFailed";
    case Aborted: return "Aborted";
  }
  return NULL;
}
#endif // ENABLE_NAMED_ERRORS


HueDiscovery::HueDiscovery(HueComm &aHueComm) :
  mHueComm(aHueComm),
  mRunning(false),
  mRunSerial(0),
  mUseCloud(HUELINK_CLOUD_DISCOVERY),
  mUseSsdp(false),
  mSsdpWindow(DEFAULT_SSDP_WINDOW),
  mCloudURL(NUPNP_URL)
{
}


HueDiscovery::~HueDiscovery()
{
}


bool HueDiscovery::addUnique(BridgeAddressList &aAddresses, const string &aAddress)
{
  if (aAddress.empty()) return false;
  for (BridgeAddressList::iterator pos = aAddresses.begin(); pos!=aAddresses.end(); ++pos) {
    if (*pos==aAddress) return false;
  }
  aAddresses.push_back(aAddress);
  return true;
}


ErrorPtr HueDiscovery::parseCloudResponse(const string &aResponse, BridgeAddressList &aAddresses)
{
  ErrorPtr err;
  JsonObjectPtr ans = JsonObject::objFromText(aResponse.c_str(), -1, &err);
  if (Error::notOK(err)) return err;
  if (!ans || !ans->isType(json_type_array)) {
    return TextError::err("discovery service response is not an array: %s", aResponse.c_str());
  }
  // response format is like:
  // [{"id":"001788fffe123456","internalipaddress":"192.168.12.34","port":443}, {...}, ...]
  for (int i=0; i<ans->arrayLength(); i++) {
    JsonObjectPtr br = ans->arrayGet(i);
    JsonObjectPtr o;
    if (br && br->get("internalipaddress", o)) {
      addUnique(aAddresses, o->stringValue());
    }
  }
  return ErrorPtr();
}


string HueDiscovery::hostFromLocation(const string &aLocationURL)
{
  // e.g. http://192.168.1.2:80/description.xml
  string proto, hostSpec, doc;
  splitURL(aLocationURL.c_str(), &proto, &hostSpec, &doc, NULL, NULL);
  string host;
  uint16_t port = 0;
  splitHost(hostSpec.c_str(), &host, &port);
  return host;
}


bool HueDiscovery::addSsdpResponse(BridgeAddressList &aAddresses, const string &aServer, const string &aLocationURL)
{
  // check device for possibility of being a hue bridge
  if (aServer.find("IpBridge")==string::npos) return false;
  return addUnique(aAddresses, hostFromLocation(aLocationURL));
}


#if HUELINK_SSDP_DISCOVERY
bool HueDiscovery::isSsdpFailure(ErrorPtr aError)
{
  if (Error::isOK(aError)) return false;
  return aError->isDomain(SocketCommError::domain()) || aError->isDomain(SysError::domain());
}
#endif


void HueDiscovery::discoverBridges(HueDiscoveryCB aCallback)
{
  HueDiscoveryPtr keepAlive(this); // previous callback might release us
  if (mRunning) {
    OLOG(LOG_INFO, "discovery restarted, aborting previous run");
    #if HUELINK_SSDP_DISCOVERY
    mSsdpWindowTicket.cancel();
    stopSsdpSearch();
    #endif
    discoveryDone(Error::err<HueDiscoveryError>(HueDiscoveryError::Aborted, "discovery restarted"));
  }
  mCallback = aCallback;
  mAddresses.clear();
  mLookupError.reset();
  mRunning = true;
  mRunSerial++;
  mKeepAlive = HueDiscoveryPtr(this);
  #if HUELINK_SSDP_DISCOVERY
  bool ssdpUsable = mUseSsdp;
  #else
  bool ssdpUsable = false;
  #endif
  if (!mUseCloud && !ssdpUsable) {
    mLookupError = TextError::err("no discovery mechanism enabled");
    MainLoop::currentMainLoop().executeNow(boost::bind(&HueDiscovery::deferredDone, HueDiscoveryPtr(this), mRunSerial));
    return;
  }
  if (mUseCloud) {
    startCloud();
  }
  else {
    startSsdp();
  }
}


void HueDiscovery::startCloud()
{
  OLOG(LOG_INFO, "querying discovery service at %s", mCloudURL.c_str());
  mHueComm.channel().request(mCloudURL, "GET", "", boost::bind(&HueDiscovery::gotCloudResponse, HueDiscoveryPtr(this), _1, _2, mRunSerial));
}


void HueDiscovery::gotCloudResponse(const string &aResponse, ErrorPtr aError, int aRunSerial)
{
  if (!mRunning || aRunSerial!=mRunSerial) return; // stopped or restarted in the meantime
  ErrorPtr err = aError;
  if (Error::isOK(err)) {
    size_t before = mAddresses.size();
    err = parseCloudResponse(aResponse, mAddresses);
    if (Error::isOK(err)) {
      OLOG(LOG_INFO, "hue cloud: %d bridge(s) found", (int)(mAddresses.size()-before));
    }
  }
  if (Error::notOK(err)) {
    OLOG(LOG_WARNING, "hue cloud discovery failed: %s", err->text());
    mLookupError = err;
  }
  startSsdp();
}


void HueDiscovery::startSsdp()
{
  #if HUELINK_SSDP_DISCOVERY
  if (mUseSsdp) {
    OLOG(LOG_INFO, "starting SSDP search for %lld mS", (long long)(mSsdpWindow/MilliSecond));
    mSsdpWindowTicket.executeOnce(boost::bind(&HueDiscovery::ssdpWindowEnded, this), mSsdpWindow);
    startSsdpSearch();
    return;
  }
  #endif
  discoveryDone();
}


#if HUELINK_SSDP_DISCOVERY

void HueDiscovery::startSsdpSearch()
{
  if (!mBridgeDetector) mBridgeDetector = SsdpSearchPtr(new SsdpSearch(MainLoop::currentMainLoop()));
  mBridgeDetector->startSearch(boost::bind(&HueDiscovery::ssdpResultHandler, this, _1, _2), NULL);
}


void HueDiscovery::stopSsdpSearch()
{
  if (mBridgeDetector) mBridgeDetector->stopSearch();
}


void HueDiscovery::ssdpResultHandler(SsdpSearchPtr aSsdpSearch, ErrorPtr aError)
{
  if (Error::isOK(aError)) {
    FOCUSOLOG("SSDP response from %s, uuid=%s", aSsdpSearch->locationURL.c_str(), aSsdpSearch->uuid.c_str());
    ssdpResponse(aSsdpSearch->server, aSsdpSearch->locationURL);
    return;
  }
  ssdpSearchEnded(aError);
}


void HueDiscovery::ssdpResponse(const string &aServer, const string &aLocationURL)
{
  if (!mRunning) return;
  if (addSsdpResponse(mAddresses, aServer, aLocationURL)) {
    OLOG(LOG_INFO, "SSDP: bridge device found at %s, server=%s", aLocationURL.c_str(), aServer.c_str());
  }
}


void HueDiscovery::ssdpSearchEnded(ErrorPtr aError)
{
  if (!mRunning) return;
  FOCUSOLOG("SSDP discovery ended, error = %s (usually: timeout)", Error::text(aError));
  if (isSsdpFailure(aError)) {
    OLOG(LOG_WARNING, "SSDP search failed: %s", aError->text());
    mLookupError = aError;
  }
  ssdpWindowEnded();
}


void HueDiscovery::ssdpWindowEnded()
{
  mSsdpWindowTicket.cancel();
  stopSsdpSearch();
  if (mRunning) discoveryDone();
}

#endif // HUELINK_SSDP_DISCOVERY


void HueDiscovery::stop()
{
  if (!mRunning) return;
  #if HUELINK_SSDP_DISCOVERY
  mSsdpWindowTicket.cancel();
  stopSsdpSearch();
  #endif
  discoveryDone();
}


void HueDiscovery::deferredDone(int aRunSerial)
{
  if (aRunSerial!=mRunSerial) return; // restarted in the meantime
  discoveryDone();
}


void HueDiscovery::discoveryDone(ErrorPtr aAbortError)
{
  if (!mRunning) return; // already reported
  mRunning = false;
  ErrorPtr err = aAbortError;
  if (Error::isOK(err) && mAddresses.empty() && mLookupError) {
    err = Error::err<HueDiscoveryError>(HueDiscoveryError::LookupFailed, "bridge lookup failed: %s", mLookupError->text());
  }
  OLOG(LOG_NOTICE, "discovery complete: %d bridge(s) found", (int)mAddresses.size());
  HueDiscoveryCB cb = mCallback;
  mCallback = NoOP;
  HueDiscoveryPtr keepAlive = mKeepAlive;
  mKeepAlive.reset();
  if (cb) cb(mAddresses, err);
}

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

#include "huepairing.hpp"

using namespace huelink;


#if ENABLE_NAMED_ERRORS
const char* HuePairingError::errorName() const
{
  switch(getErrorCode()) {
    case Denied: return "Denied";
    case Timeout: return "Timeout";
    case InvalidDeviceType: return "InvalidDeviceType";
    case Aborted: return "Aborted";
  }
  return NULL;
}
#endif // ENABLE_NAMED_ERRORS


HuePairing::HuePairing(HueComm &aHueComm) :
  mHueComm(aHueComm),
  mState(idle),
  mSequence(0),
  mMaxAttempts(HUELINK_DEFAULT_PAIRING_ATTEMPTS),
  mRetryInterval(HUELINK_DEFAULT_PAIRING_INTERVAL),
  mAttemptsDone(0),
  mPendingSeen(false)
{
  mDelayScheduler = boost::bind(&HuePairing::scheduleOnMainloop, this, _1, _2);
}


HuePairing::~HuePairing()
{
  mRetryTicket.cancel();
}


HuePairing::NextStep HuePairing::nextStep(int aAttemptsDone, int aMaxAttempts, AttemptOutcome aOutcome, bool aPendingSeen)
{
  switch (aOutcome) {
    case attemptSuccess: return Succeeded;
    case attemptDenied: return Deny;
    default: break;
  }
  // pending or transient: consumes budget
  if (aMaxAttempts<1) aMaxAttempts = 1;
  if (aAttemptsDone<aMaxAttempts) return Retry;
  if (aOutcome==attemptNetworkFailure && !aPendingSeen) {
    // never got an answer at all
    return GiveUpUnreachable;
  }
  return GiveUpTimeout;
}


HuePairing::AttemptOutcome HuePairing::classifyAttempt(JsonObjectPtr aResult, ErrorPtr aError, string &aUserName)
{
  aUserName.clear();
  if (Error::notOK(aError)) {
    if (Error::isError(aError, HueBridgeError::domain(), HueBridgeError::LinkButtonNotPressed)) return attemptPending;
    if (aError->isDomain(HueBridgeError::domain())) return attemptDenied;
    return attemptNetworkFailure;
  }
  // [{"success":{"username": "83b7780291a6ceffbe0bd049104df"}}]
  JsonObjectPtr s = HueComm::getSuccessItem(aResult);
  JsonObjectPtr u;
  if (s && s->get("username", u)) {
    aUserName = u->stringValue();
    if (!aUserName.empty()) return attemptSuccess;
  }
  // success without username: bridge accepted, but issued nothing
  return attemptDenied;
}


void HuePairing::registerUser(const string &aBridgeAddress, const string &aDeviceType, int aMaxAttempts, MLMicroSeconds aRetryInterval, HuePairingCB aCallback)
{
  if (mState!=idle) stop();
  if (aDeviceType.empty()) {
    if (aCallback) aCallback("", Error::err<HuePairingError>(HuePairingError::InvalidDeviceType, "device type must not be empty"));
    return;
  }
  mSequence++;
  mBridgeAddress = aBridgeAddress;
  mDeviceType = aDeviceType;
  mMaxAttempts = aMaxAttempts<1 ? 1 : aMaxAttempts;
  mRetryInterval = aRetryInterval;
  mAttemptsDone = 0;
  mPendingSeen = false;
  mLastNetworkError.reset();
  mCallback = aCallback;
  OLOG(LOG_NOTICE, "registering '%s' with bridge %s, max %d attempts", mDeviceType.c_str(), mBridgeAddress.c_str(), mMaxAttempts);
  sendAttempt(mSequence);
}


void HuePairing::sendAttempt(int aSequence)
{
  if (aSequence!=mSequence || mState==requesting) return; // outdated
  mState = requesting;
  JsonObjectPtr request = JsonObject::newObj();
  request->add("devicetype", JsonObject::newString(mDeviceType));
  FOCUSOLOG("attempt %d/%d to create user", mAttemptsDone+1, mMaxAttempts);
  mHueComm.apiRequest(HueApiOperation::POST, mBridgeAddress, "", request, boost::bind(&HuePairing::attemptResult, HuePairingPtr(this), aSequence, _1, _2));
}


void HuePairing::attemptResult(int aSequence, JsonObjectPtr aResult, ErrorPtr aError)
{
  if (aSequence!=mSequence || mState!=requesting) {
    FOCUSOLOG("discarding result of stopped registration");
    return;
  }
  mAttemptsDone++;
  string userName;
  AttemptOutcome outcome = classifyAttempt(aResult, aError, userName);
  NextStep step = nextStep(mAttemptsDone, mMaxAttempts, outcome, mPendingSeen);
  if (outcome==attemptPending) {
    mPendingSeen = true;
    OLOG(LOG_INFO, "link button not pressed (attempt %d/%d)", mAttemptsDone, mMaxAttempts);
    if (mProgressCB) mProgressCB(mAttemptsDone, mMaxAttempts);
  }
  else if (outcome==attemptNetworkFailure) {
    mLastNetworkError = aError;
    OLOG(LOG_WARNING, "cannot reach bridge (attempt %d/%d): %s", mAttemptsDone, mMaxAttempts, Error::text(aError));
  }
  switch (step) {
    case Succeeded:
      OLOG(LOG_NOTICE, "successfully registered as user %s", userName.c_str());
      pairingDone(userName, ErrorPtr());
      return;
    case Deny:
      pairingDone("", ErrorPtr(new HuePairingError(
        HuePairingError::Denied,
        string_format("bridge denied registration: %s", Error::isOK(aError) ? "no username issued" : aError->text()),
        Error::isOK(aError) ? TextError::err("success without username") : aError
      )));
      return;
    case GiveUpTimeout:
      pairingDone("", Error::err<HuePairingError>(HuePairingError::Timeout, "link button not pressed within %d attempts", mMaxAttempts));
      return;
    case GiveUpUnreachable:
      pairingDone("", mLastNetworkError);
      return;
    case Retry:
      break;
  }
  // wait and try again
  mState = waiting;
  mDelayScheduler(boost::bind(&HuePairing::sendAttempt, HuePairingPtr(this), aSequence), mRetryInterval);
}


void HuePairing::scheduleOnMainloop(SimpleCB aCallback, MLMicroSeconds aDelay)
{
  mRetryTicket.executeOnce(boost::bind(aCallback), aDelay);
}


void HuePairing::stop()
{
  if (mState==idle) return;
  OLOG(LOG_NOTICE, "registration aborted after %d attempts", mAttemptsDone);
  pairingDone("", Error::err<HuePairingError>(HuePairingError::Aborted, "registration aborted"));
}


void HuePairing::pairingDone(const string &aUserName, ErrorPtr aError)
{
  mState = idle;
  mSequence++; // invalidates all callbacks still underway
  mRetryTicket.cancel();
  HuePairingCB cb = mCallback;
  mCallback = NoOP;
  if (cb) cb(aUserName, aError);
}

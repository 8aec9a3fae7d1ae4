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

#ifndef __huelink__huepairing__
#define __huelink__huepairing__

#include "huecomm.hpp"

using namespace std;
using namespace p44;

namespace huelink {

  class HuePairingError : public Error
  {
    ErrorPtr mCause;

  public:
    // Errors
    enum {
      OK,
      Denied, ///< bridge refused registration (cause is the bridge's error)
      Timeout, ///< link button was not pressed within the allowed attempts
      InvalidDeviceType, ///< device type must not be empty
      Aborted, ///< registration was stopped
    };
    typedef int ErrorCodes;

    static const char *domain() { return "HuePairing"; }
    virtual const char *getErrorDomain() const P44_OVERRIDE { return HuePairingError::domain(); };
    explicit HuePairingError(ErrorCodes aError) : Error(ErrorCode(aError)) {};
    HuePairingError(ErrorCodes aError, const string &aMessage, ErrorPtr aCause) :
      Error(ErrorCode(aError), aMessage), mCause(aCause) {};

    /// @return the error that caused this error, if any
    ErrorPtr getCause() const { return mCause; };

    #if ENABLE_NAMED_ERRORS
  protected:
    virtual const char* errorName() const P44_OVERRIDE;
    #endif // ENABLE_NAMED_ERRORS
  };


  /// will be called when registration ends
  /// @param aUserName the username issued by the bridge (empty in case of error)
  /// @param aError error, if any
  typedef boost::function<void (const string &aUserName, ErrorPtr aError)> HuePairingCB;

  /// will be called for every attempt that found the link button not yet pressed
  /// @param aAttempt number of attempts done so far
  /// @param aMaxAttempts total number of attempts
  typedef boost::function<void (int aAttempt, int aMaxAttempts)> HuePairingProgressCB;

  /// schedule a callback to be called after a delay
  typedef boost::function<void (SimpleCB aCallback, MLMicroSeconds aDelay)> HueDelayScheduler;


  class HuePairing;
  typedef boost::intrusive_ptr<HuePairing> HuePairingPtr;

  /// registers a new user (application) with a bridge using the push-link procedure
  class HuePairing : public P44LoggingObj
  {
    typedef P44LoggingObj inherited;

  public:

    /// result of a single registration attempt
    typedef enum {
      attemptSuccess, ///< bridge issued a username
      attemptPending, ///< link button not pressed (yet)
      attemptDenied, ///< bridge refused with another error
      attemptNetworkFailure ///< no usable answer from the bridge
    } AttemptOutcome;

    /// what to do after an attempt
    typedef enum {
      Succeeded,
      Retry,
      Deny,
      GiveUpTimeout,
      GiveUpUnreachable
    } NextStep;

    typedef enum {
      idle,
      requesting,
      waiting
    } PairingState;

  private:

    HueComm &mHueComm;

    PairingState mState;
    int mSequence; ///< identifies the current registration sequence, callbacks of older sequences are ignored
    string mBridgeAddress;
    string mDeviceType;
    int mMaxAttempts;
    MLMicroSeconds mRetryInterval;
    int mAttemptsDone;
    bool mPendingSeen;
    ErrorPtr mLastNetworkError;
    HuePairingCB mCallback;
    MLTicket mRetryTicket;

  public:

    /// @name settings
    /// @{
    HuePairingProgressCB mProgressCB; ///< optional, called for each pending attempt
    HueDelayScheduler mDelayScheduler; ///< how to wait between attempts, defaults to a timer on the mainloop
    /// @}

    HuePairing(HueComm &aHueComm);
    virtual ~HuePairing();

    /// @return type (such as: device, element, vdc, trigger) of the context object
    virtual string contextType() const P44_OVERRIDE { return "hue pairing"; }

    /// register a new user with a bridge
    /// @param aBridgeAddress the bridge to register with
    /// @param aDeviceType the application/device identifier to register
    /// @param aMaxAttempts max number of registration attempts (values <1 are treated as 1)
    /// @param aRetryInterval interval between attempts
    /// @param aCallback called once with the username or an error
    /// @note a registration already running is aborted
    void registerUser(const string &aBridgeAddress, const string &aDeviceType, int aMaxAttempts, MLMicroSeconds aRetryInterval, HuePairingCB aCallback);

    /// stop a running registration. The callback is called with HuePairingError::Aborted
    void stop();

    /// @return current state
    PairingState state() const { return mState; }

    /// @return true if registration is in progress
    bool isRunning() const { return mState!=idle; }

    /// decide how to continue after an attempt
    /// @param aAttemptsDone number of attempts done so far, including the one just completed
    /// @param aMaxAttempts max number of attempts
    /// @param aOutcome the outcome of the attempt just completed
    /// @param aPendingSeen true if any earlier attempt found the link button not pressed
    static NextStep nextStep(int aAttemptsDone, int aMaxAttempts, AttemptOutcome aOutcome, bool aPendingSeen = false);

    /// classify the result of a registration request
    /// @param aResult the result as delivered by HueComm
    /// @param aError the error as delivered by HueComm
    /// @param aUserName set to the username in case of success
    static AttemptOutcome classifyAttempt(JsonObjectPtr aResult, ErrorPtr aError, string &aUserName);

  private:

    void sendAttempt(int aSequence);
    void attemptResult(int aSequence, JsonObjectPtr aResult, ErrorPtr aError);
    void scheduleOnMainloop(SimpleCB aCallback, MLMicroSeconds aDelay);
    void pairingDone(const string &aUserName, ErrorPtr aError);

  };

} // namespace huelink

#endif // __huelink__huepairing__

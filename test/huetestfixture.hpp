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

#ifndef __huelink__huetestfixture__
#define __huelink__huetestfixture__

#include <gtest/gtest.h>

#include "huecomm.hpp"

#include <list>

using namespace p44;
using namespace huelink;

namespace huelink_test {

  /// @return number of keys in a JSON object
  inline int keyCount(JsonObjectPtr aObj)
  {
    int n = 0;
    string key;
    JsonObjectPtr val;
    aObj->resetKeyIteration();
    while (aObj->nextKeyValue(key, val)) n++;
    return n;
  }


  class FakeHueChannel;
  typedef boost::intrusive_ptr<FakeHueChannel> FakeHueChannelPtr;

  /// HTTP channel answering with canned responses, without any network
  class FakeHueChannel : public HueHttpChannel
  {
  public:

    class Request
    {
    public:
      string mUrl;
      string mMethod;
      string mBody;

      /// @return the body parsed as JSON, NULL if none
      JsonObjectPtr bodyJSON() const { return JsonObject::objFromText(mBody.c_str()); }
    };

    class Answer
    {
    public:
      string mBody;
      ErrorPtr mError;
    };

    vector<Request> mRequests; ///< all requests issued, in order
    list<Answer> mAnswers; ///< answers for upcoming requests, in order
    bool mRepeatLast; ///< if set, the last answer is used for all further requests
    int mCancelCount;
    MLMicroSeconds mTimeout;
    bool mClosed; ///< if set, no more answers are delivered

    FakeHueChannel() : mRepeatLast(false), mCancelCount(0), mTimeout(Never), mClosed(false), mCancelledUpTo(0) {};

    /// queue a response body for the next request
    void respond(const string &aBody)
    {
      Answer a;
      a.mBody = aBody;
      mAnswers.push_back(a);
    }

    /// queue a failure for the next request
    void fail(ErrorPtr aError)
    {
      Answer a;
      a.mError = aError;
      mAnswers.push_back(a);
    }

    /// queue a connection failure for the next request
    void failConnection()
    {
      fail(TextError::err("connection refused"));
    }

    virtual void request(const string &aURL, const char *aMethod, const string &aBody, HttpCommCB aResultCB) P44_OVERRIDE
    {
      Request r;
      r.mUrl = aURL;
      r.mMethod = aMethod;
      r.mBody = aBody;
      mRequests.push_back(r);
      Answer a;
      if (mAnswers.empty()) {
        a.mError = TextError::err("no answer for %s %s", aMethod, aURL.c_str());
      }
      else {
        a = mAnswers.front();
        if (!mRepeatLast || mAnswers.size()>1) mAnswers.pop_front();
      }
      // answer asynchronously, like a real network would
      MainLoop::currentMainLoop().executeNow(boost::bind(&FakeHueChannel::deliver, FakeHueChannelPtr(this), mRequests.size(), aResultCB, a));
    }

    virtual void cancelRequest() P44_OVERRIDE
    {
      mCancelCount++;
      mCancelledUpTo = mRequests.size();
    }

    virtual void setTimeout(MLMicroSeconds aTimeout) P44_OVERRIDE
    {
      mTimeout = aTimeout;
    }

  private:

    size_t mCancelledUpTo; ///< requests up to this number will not be answered any more

    void deliver(size_t aRequestNo, HttpCommCB aResultCB, Answer aAnswer)
    {
      if (mClosed || aRequestNo<=mCancelledUpTo) return;
      aResultCB(aAnswer.mBody, aAnswer.mError);
    }

  };


  /// fixture providing a HueComm talking to a FakeHueChannel, and a way to run the mainloop
  class HueTestFixture : public ::testing::Test
  {
  protected:

    FakeHueChannelPtr mChannel;
    HueCommPtr mHueComm;
    MLTicket mWatchdog;
    bool mTimedOut;

    virtual void SetUp() P44_OVERRIDE
    {
      mChannel = FakeHueChannelPtr(new FakeHueChannel);
      mHueComm = HueCommPtr(new HueComm(mChannel));
      mHueComm->mRequestPacing = 0; // no need to be nice to a fake bridge
      mTimedOut = false;
    }

    virtual void TearDown() P44_OVERRIDE
    {
      mWatchdog.cancel();
      mChannel->mClosed = true; // answers still underway must not reach the destroyed HueComm
      mHueComm.reset();
      mChannel.reset();
    }

    /// run the mainloop until stopLoop() is called
    /// @param aTimeout max time to run
    /// @return false if the loop had to be stopped by timeout
    bool runLoop(MLMicroSeconds aTimeout = 5*Second)
    {
      mTimedOut = false;
      mWatchdog.executeOnce(boost::bind(&HueTestFixture::loopTimedOut, this), aTimeout);
      MainLoop::currentMainLoop().run();
      mWatchdog.cancel();
      return !mTimedOut;
    }

    /// stop the mainloop (from a callback)
    void stopLoop()
    {
      MainLoop::currentMainLoop().terminate(EXIT_SUCCESS);
    }

    /// delay scheduler that does not wait at all
    static void immediateDelay(SimpleCB aCallback, MLMicroSeconds aDelay)
    {
      MainLoop::currentMainLoop().executeNow(aCallback);
    }

  private:

    void loopTimedOut()
    {
      mTimedOut = true;
      stopLoop();
    }

  };

} // namespace huelink_test

#endif // __huelink__huetestfixture__

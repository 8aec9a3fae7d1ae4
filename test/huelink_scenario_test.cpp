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

#include "huetestfixture.hpp"

#include "huediscovery.hpp"
#include "huepairing.hpp"
#include "huesession.hpp"

using namespace huelink_test;


/// complete flow: find the bridge, register while the user presses the button, then use the lights
class HueLinkScenarioTest : public HueTestFixture
{
protected:
  HueDiscoveryPtr mDiscovery;
  HuePairingPtr mPairing;
  HueSessionPtr mSession;
  ErrorPtr mError;
  int mPendingReported;
  HueLightsVector mLights;
  HueAppliedFieldsVector mApplied;

  virtual void SetUp() P44_OVERRIDE
  {
    HueTestFixture::SetUp();
    mDiscovery = HueDiscoveryPtr(new HueDiscovery(*mHueComm));
    mPairing = HuePairingPtr(new HuePairing(*mHueComm));
    mPairing->mDelayScheduler = &HueTestFixture::immediateDelay;
    mPairing->mProgressCB = boost::bind(&HueLinkScenarioTest::pending, this);
    mPendingReported = 0;
  }

  virtual void TearDown() P44_OVERRIDE
  {
    mSession.reset();
    mPairing.reset();
    mDiscovery.reset();
    HueTestFixture::TearDown();
  }

  void pending()
  {
    mPendingReported++;
  }

  void discovered(const BridgeAddressList &aAddresses, ErrorPtr aError)
  {
    if (Error::notOK(aError) || aAddresses.empty()) {
      mError = aError ? aError : TextError::err("nothing found");
      stopLoop();
      return;
    }
    mPairing->registerUser(aAddresses[0], "huelink#scenario", 10, 5*Second, boost::bind(&HueLinkScenarioTest::registered, this, aAddresses[0], _1, _2));
  }

  void registered(const string aBridge, const string &aUserName, ErrorPtr aError)
  {
    if (Error::isOK(aError)) {
      aError = HueSession::newSession(*mHueComm, aBridge, aUserName, mSession);
    }
    if (Error::notOK(aError)) {
      mError = aError;
      stopLoop();
      return;
    }
    mSession->listLights(boost::bind(&HueLinkScenarioTest::gotLights, this, _1, _2));
  }

  void gotLights(const HueLightsVector &aLights, ErrorPtr aError)
  {
    mLights = aLights;
    if (Error::notOK(aError) || aLights.empty()) {
      mError = aError;
      stopLoop();
      return;
    }
    HueLightStateChange c;
    c.mOn = yes;
    c.setBri(200);
    mSession->setLightState(aLights[0]->mLightID, c, boost::bind(&HueLinkScenarioTest::stateSent, this, _1, _2));
  }

  void stateSent(const HueAppliedFieldsVector &aApplied, ErrorPtr aError)
  {
    mApplied = aApplied;
    mError = aError;
    stopLoop();
  }
};


TEST_F(HueLinkScenarioTest, DiscoverRegisterAndSwitchLight)
{
  // discovery service
  mChannel->respond("[{\"id\":\"001788fffe123456\",\"internalipaddress\":\"192.168.1.2\",\"port\":443}]");
  // registration: button pressed on the third attempt
  mChannel->respond("[{\"error\":{\"type\":101,\"address\":\"\",\"description\":\"link button not pressed\"}}]");
  mChannel->respond("[{\"error\":{\"type\":101,\"address\":\"\",\"description\":\"link button not pressed\"}}]");
  mChannel->respond("[{\"success\":{\"username\":\"abc\"}}]");
  // lights
  mChannel->respond("{\"1\":{\"name\":\"Desk\",\"state\":{\"on\":false,\"bri\":1,\"reachable\":true}}}");
  // light state
  mChannel->respond("[{\"success\":{\"/lights/1/state/on\":true}},{\"success\":{\"/lights/1/state/bri\":200}}]");
  mDiscovery->discoverBridges(boost::bind(&HueLinkScenarioTest::discovered, this, _1, _2));
  ASSERT_TRUE(runLoop());
  EXPECT_TRUE(Error::isOK(mError)) << Error::text(mError);
  EXPECT_EQ(2, mPendingReported);
  ASSERT_EQ(6u, mChannel->mRequests.size());
  EXPECT_EQ("https://discovery.meethue.com/", mChannel->mRequests[0].mUrl);
  EXPECT_EQ("http://192.168.1.2/api", mChannel->mRequests[3].mUrl);
  EXPECT_EQ("http://192.168.1.2/api/abc/lights", mChannel->mRequests[4].mUrl);
  EXPECT_EQ("http://192.168.1.2/api/abc/lights/1/state", mChannel->mRequests[5].mUrl);
  ASSERT_EQ(1u, mLights.size());
  EXPECT_EQ("Desk", mLights[0]->mName);
  ASSERT_EQ(2u, mApplied.size());
  EXPECT_EQ("on", mApplied[0].mParam);
  EXPECT_EQ("bri", mApplied[1].mParam);
}


TEST_F(HueLinkScenarioTest, ButtonNeverPressed)
{
  mChannel->respond("[{\"id\":\"001788fffe123456\",\"internalipaddress\":\"192.168.1.2\"}]");
  mChannel->respond("[{\"error\":{\"type\":101,\"address\":\"\",\"description\":\"link button not pressed\"}}]");
  mChannel->mRepeatLast = true;
  mDiscovery->discoverBridges(boost::bind(&HueLinkScenarioTest::discovered, this, _1, _2));
  ASSERT_TRUE(runLoop());
  EXPECT_TRUE(Error::isError(mError, HuePairingError::domain(), HuePairingError::Timeout));
  EXPECT_EQ(10, mPendingReported);
  EXPECT_EQ(11u, mChannel->mRequests.size());
  EXPECT_FALSE(mSession);
}

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

using namespace huelink_test;


// MARK: - response decoding

TEST(HueCommDecoding, ObjectIsSuccess)
{
  JsonObjectPtr result;
  ErrorPtr err = HueComm::decodeResponse("{\"1\":{\"name\":\"Desk\"}}", result);
  EXPECT_TRUE(Error::isOK(err));
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->get("1"));
}


TEST(HueCommDecoding, SuccessArrayReturnsWholeArray)
{
  JsonObjectPtr result;
  ErrorPtr err = HueComm::decodeResponse("[{\"success\":{\"username\":\"abc\"}}]", result);
  EXPECT_TRUE(Error::isOK(err));
  ASSERT_TRUE(result);
  EXPECT_EQ(1, result->arrayLength());
  JsonObjectPtr s = HueComm::getSuccessItem(result);
  ASSERT_TRUE(s);
  EXPECT_EQ("abc", s->get("username")->stringValue());
  EXPECT_FALSE(HueComm::getSuccessItem(result, 1));
}


TEST(HueCommDecoding, ErrorItemBecomesBridgeError)
{
  JsonObjectPtr result;
  ErrorPtr err = HueComm::decodeResponse(
    "[{\"error\":{\"type\":101,\"address\":\"/\",\"description\":\"link button not pressed\"}}]",
    result
  );
  ASSERT_TRUE(Error::notOK(err));
  EXPECT_FALSE(result);
  EXPECT_TRUE(err->isError(HueBridgeError::domain(), HueBridgeError::LinkButtonNotPressed));
  HueBridgeErrorPtr be = boost::dynamic_pointer_cast<HueBridgeError>(err);
  ASSERT_TRUE(be);
  EXPECT_EQ("/", be->getAddress());
  EXPECT_EQ("link button not pressed", be->getErrorMessage());
}


TEST(HueCommDecoding, FirstErrorWinsEvenAfterSuccess)
{
  JsonObjectPtr result;
  ErrorPtr err = HueComm::decodeResponse(
    "[{\"success\":{\"/lights/1/state/on\":true}},"
    "{\"error\":{\"type\":7,\"address\":\"/lights/1/state/bri\",\"description\":\"invalid value, 300, for parameter, bri\"}},"
    "{\"error\":{\"type\":6,\"address\":\"/lights/1/state/foo\",\"description\":\"parameter, foo, not available\"}}]",
    result
  );
  EXPECT_TRUE(Error::isError(err, HueBridgeError::domain(), HueBridgeError::InvalidValue));
}


TEST(HueCommDecoding, DocumentedErrorTypesKeepTheirCode)
{
  const int types[] = { 1, 3, 4, 7, 101, 201, 901, 42 };
  for (size_t i=0; i<sizeof(types)/sizeof(int); i++) {
    JsonObjectPtr result;
    ErrorPtr err = HueComm::decodeResponse(string_format("[{\"error\":{\"type\":%d,\"address\":\"/x\",\"description\":\"d\"}}]", types[i]), result);
    EXPECT_TRUE(Error::isError(err, HueBridgeError::domain(), types[i])) << "type " << types[i];
  }
}


TEST(HueCommDecoding, UntypedErrorItemIsStillAnError)
{
  const char *untyped[] = {
    "[{\"error\":{\"description\":\"x\"}}]",
    "[{\"error\":{\"type\":0,\"description\":\"x\"}}]",
    "[{\"error\":{\"type\":\"bad\",\"description\":\"x\"}}]",
  };
  for (size_t i=0; i<sizeof(untyped)/sizeof(const char *); i++) {
    JsonObjectPtr result;
    ErrorPtr err = HueComm::decodeResponse(untyped[i], result);
    ASSERT_TRUE(Error::notOK(err)) << "response: " << untyped[i];
    EXPECT_TRUE(err->isError(HueBridgeError::domain(), HueBridgeError::Unspecified)) << "response: " << untyped[i];
    EXPECT_EQ("x", err->getErrorMessage());
    EXPECT_FALSE(result);
  }
}


TEST(HueCommDecoding, MalformedResponsesAreInvalid)
{
  const char *bad[] = {
    "",
    "<html>not json</html>",
    "[]",
    "[{\"something\":1}]",
    "42",
  };
  for (size_t i=0; i<sizeof(bad)/sizeof(const char *); i++) {
    JsonObjectPtr result;
    ErrorPtr err = HueComm::decodeResponse(bad[i], result);
    EXPECT_TRUE(Error::isError(err, HueNetworkError::domain(), HueNetworkError::InvalidResponse)) << "response: " << bad[i];
    EXPECT_FALSE(result);
  }
}


TEST(HueCommDecoding, AppliedFieldsInResponseOrder)
{
  JsonObjectPtr result;
  ErrorPtr err = HueComm::decodeResponse(
    "[{\"success\":{\"/lights/1/state/bri\":200}},{\"success\":{\"/lights/1/state/on\":true}}]",
    result
  );
  ASSERT_TRUE(Error::isOK(err));
  HueAppliedFieldsVector fields = HueComm::appliedFields(result);
  ASSERT_EQ(2u, fields.size());
  EXPECT_EQ("bri", fields[0].mParam);
  EXPECT_EQ("/lights/1/state/bri", fields[0].mPath);
  EXPECT_EQ(200, fields[0].mValue->int32Value());
  EXPECT_EQ("on", fields[1].mParam);
  EXPECT_TRUE(fields[1].mValue->boolValue());
}


// MARK: - URLs

TEST(HueCommURL, BaseURLFromAddress)
{
  EXPECT_EQ("http://192.168.1.2/api", HueComm::apiBaseURL("192.168.1.2"));
  EXPECT_EQ("http://bridge.local:8080/api", HueComm::apiBaseURL("bridge.local:8080"));
  EXPECT_EQ("https://10.0.0.5/api", HueComm::apiBaseURL("https://10.0.0.5"));
  EXPECT_EQ("https://10.0.0.5/api", HueComm::apiBaseURL("https://10.0.0.5/"));
  EXPECT_EQ("http://10.0.0.5/api", HueComm::apiBaseURL("http://10.0.0.5/api"));
}


// MARK: - requests

class HueCommTest : public HueTestFixture
{
protected:
  JsonObjectPtr mResult;
  ErrorPtr mError;
  int mCalls;

  virtual void SetUp() P44_OVERRIDE
  {
    HueTestFixture::SetUp();
    mCalls = 0;
  }

  void apiResult(JsonObjectPtr aResult, ErrorPtr aError)
  {
    mCalls++;
    mResult = aResult;
    mError = aError;
    stopLoop();
  }
};


TEST_F(HueCommTest, QueryBuildsURLAndDeliversObject)
{
  mChannel->respond("{\"1\":{\"name\":\"Desk\"},\"2\":{\"name\":\"Hall\"}}");
  mHueComm->apiQuery("192.168.1.2", "/user1/lights", boost::bind(&HueCommTest::apiResult, this, _1, _2));
  ASSERT_TRUE(runLoop());
  EXPECT_EQ(1, mCalls);
  ASSERT_EQ(1u, mChannel->mRequests.size());
  EXPECT_EQ("http://192.168.1.2/api/user1/lights", mChannel->mRequests[0].mUrl);
  EXPECT_EQ("GET", mChannel->mRequests[0].mMethod);
  EXPECT_TRUE(mChannel->mRequests[0].mBody.empty());
  EXPECT_TRUE(Error::isOK(mError));
  ASSERT_TRUE(mResult);
  EXPECT_EQ("Hall", mResult->get("2")->get("name")->stringValue());
}


TEST_F(HueCommTest, UnauthorizedOnGetIsBridgeError)
{
  mChannel->respond("[{\"error\":{\"type\":1,\"address\":\"/lights\",\"description\":\"unauthorized user\"}}]");
  mHueComm->apiQuery("192.168.1.2", "/baduser/lights", boost::bind(&HueCommTest::apiResult, this, _1, _2));
  ASSERT_TRUE(runLoop());
  EXPECT_TRUE(Error::isError(mError, HueBridgeError::domain(), HueBridgeError::UnauthorizedUser));
  EXPECT_FALSE(mResult);
}


TEST_F(HueCommTest, PostSendsJSONBody)
{
  mChannel->respond("[{\"success\":{\"username\":\"newuser\"}}]");
  JsonObjectPtr req = JsonObject::newObj();
  req->add("devicetype", JsonObject::newString("huelink#test"));
  mHueComm->apiRequest(HueApiOperation::POST, "10.0.0.7", "", req, boost::bind(&HueCommTest::apiResult, this, _1, _2));
  ASSERT_TRUE(runLoop());
  ASSERT_EQ(1u, mChannel->mRequests.size());
  EXPECT_EQ("http://10.0.0.7/api", mChannel->mRequests[0].mUrl);
  EXPECT_EQ("POST", mChannel->mRequests[0].mMethod);
  JsonObjectPtr body = mChannel->mRequests[0].bodyJSON();
  ASSERT_TRUE(body);
  EXPECT_EQ("huelink#test", body->get("devicetype")->stringValue());
  EXPECT_TRUE(Error::isOK(mError));
}


TEST_F(HueCommTest, ConnectionFailureIsNetworkError)
{
  mChannel->failConnection();
  mHueComm->apiQuery("10.0.0.7", "/u/lights", boost::bind(&HueCommTest::apiResult, this, _1, _2));
  ASSERT_TRUE(runLoop());
  EXPECT_TRUE(Error::isError(mError, HueNetworkError::domain(), HueNetworkError::RequestFailed));
}


TEST_F(HueCommTest, HttpStatusIsNetworkError)
{
  mChannel->fail(Error::err<WebError>(404, "Not Found"));
  mHueComm->apiQuery("10.0.0.7", "/u/lights", boost::bind(&HueCommTest::apiResult, this, _1, _2));
  ASSERT_TRUE(runLoop());
  EXPECT_TRUE(Error::isError(mError, HueNetworkError::domain(), HueNetworkError::HttpStatus));
}


TEST_F(HueCommTest, NonJSONAnswerIsInvalidResponse)
{
  mChannel->respond("<html><body>hello</body></html>");
  mHueComm->apiQuery("10.0.0.7", "/u/lights", boost::bind(&HueCommTest::apiResult, this, _1, _2));
  ASSERT_TRUE(runLoop());
  EXPECT_TRUE(Error::isError(mError, HueNetworkError::domain(), HueNetworkError::InvalidResponse));
}


TEST_F(HueCommTest, RequestsAreSerializedInOrder)
{
  mChannel->respond("{\"n\":1}");
  mChannel->respond("{\"n\":2}");
  vector<int> seen;
  mHueComm->apiQuery("10.0.0.7", "/u/lights/1", [&](JsonObjectPtr aResult, ErrorPtr aError) {
    seen.push_back(aResult ? aResult->get("n")->int32Value() : -1);
  });
  mHueComm->apiQuery("10.0.0.7", "/u/lights/2", [&](JsonObjectPtr aResult, ErrorPtr aError) {
    seen.push_back(aResult ? aResult->get("n")->int32Value() : -1);
    stopLoop();
  });
  ASSERT_TRUE(runLoop());
  ASSERT_EQ(2u, seen.size());
  EXPECT_EQ(1, seen[0]);
  EXPECT_EQ(2, seen[1]);
  ASSERT_EQ(2u, mChannel->mRequests.size());
  EXPECT_EQ("http://10.0.0.7/api/u/lights/1", mChannel->mRequests[0].mUrl);
  EXPECT_EQ("http://10.0.0.7/api/u/lights/2", mChannel->mRequests[1].mUrl);
}


TEST(HueCommSettings, DefaultPacingIsTenRequestsPerSecond)
{
  HueComm comm(HueHttpChannelPtr(new FakeHueChannel));
  comm.isMemberVariable();
  EXPECT_EQ(100*MilliSecond, comm.mRequestPacing);
}


TEST_F(HueCommTest, RequestTimeoutIsPassedToChannel)
{
  mHueComm->setRequestTimeout(3*Second);
  EXPECT_EQ(3*Second, mChannel->mTimeout);
}

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

#include "huecomm.hpp"

using namespace huelink;


#if ENABLE_NAMED_ERRORS
const char* HueNetworkError::errorName() const
{
  switch(getErrorCode()) {
    case RequestFailed: return "RequestFailed";
    case HttpStatus: return "HttpStatus";
    case InvalidResponse: return "InvalidResponse";
  }
  return NULL;
}


const char* HueBridgeError::errorName() const
{
  switch(getErrorCode()) {
    case UnauthorizedUser: return "UnauthorizedUser";
    case InvalidJSON: return "InvalidJSON";
    case NotFound: return "NotFound";
    case InvalidMethod: return "InvalidMethod";
    case MissingParam: return "MissingParam";
    case InvalidParam: return "InvalidParam";
    case InvalidValue: return "InvalidValue";
    case ReadOnly: return "ReadOnly";
    case TooManyItems: return "TooManyItems";
    case CloudRequired: return "CloudRequired";
    case LinkButtonNotPressed: return "LinkButtonNotPressed";
    case DeviceIsOff: return "DeviceIsOff";
    case InternalError: return "InternalError";
    case Unspecified: return "Unspecified";
  }
  return NULL;
}
#endif // ENABLE_NAMED_ERRORS


// MARK: - HueWebChannel

HueWebChannel::HueWebChannel() :
  mHttpComm(MainLoop::currentMainLoop())
{
  mHttpComm.isMemberVariable();
  // bridges only have self-signed certificates
  mHttpComm.setServerCertVfyDir("");
  // do not wait too long for API responses, but long enough to tolerate some lag in slow bridge or wifi network
  mHttpComm.setTimeout(HUELINK_DEFAULT_REQUEST_TIMEOUT);
}


HueWebChannel::~HueWebChannel()
{
  mHttpComm.cancelRequest();
}


void HueWebChannel::request(const string &aURL, const char *aMethod, const string &aBody, HttpCommCB aResultCB)
{
  if (!mHttpComm.httpRequest(
    aURL.c_str(),
    aResultCB,
    aMethod,
    aBody.empty() ? NULL : aBody.c_str(),
    aBody.empty() ? NULL : "application/json"
  )) {
    // could not even start the request, report asynchronously like any other failure
    MainLoop::currentMainLoop().executeNow(boost::bind(aResultCB, string(""), TextError::err("cannot start %s request to %s", aMethod, aURL.c_str())));
  }
}


void HueWebChannel::cancelRequest()
{
  mHttpComm.cancelRequest();
}


void HueWebChannel::setTimeout(MLMicroSeconds aTimeout)
{
  mHttpComm.setTimeout(aTimeout);
}


// MARK: - HueApiOperation

HueApiOperation::HueApiOperation(HueComm &aHueComm, HttpMethods aMethod, const string &aUrl, JsonObjectPtr aData, HueApiResultCB aResultHandler) :
  mHueComm(aHueComm),
  mMethod(aMethod),
  mUrl(aUrl),
  mData(aData),
  mCompleted(false),
  mResultHandler(aResultHandler)
{
}


HueApiOperation::~HueApiOperation()
{
}


const char *HueApiOperation::methodName(HttpMethods aMethod)
{
  switch (aMethod) {
    case POST : return "POST";
    case PUT : return "PUT";
    case DELETE : return "DELETE";
    default : return "GET";
  }
}


bool HueApiOperation::initiate()
{
  // initiate the web request
  const char *methodStr = methodName(mMethod);
  if (mMethod==GET) mData.reset();
  SOLOG(mHueComm, LOG_INFO, "Sending API request (%s): %s: %s", methodStr, mUrl.c_str(), mData ? mData->c_strValue() : "<no data>");
  mHueComm.mChannel->request(mUrl, methodStr, mData ? mData->json_str() : "", boost::bind(&HueApiOperation::processAnswer, this, _1, _2));
  // executed
  return inherited::initiate();
}


void HueApiOperation::processAnswer(const string &aResponse, ErrorPtr aError)
{
  mData.reset();
  if (Error::isOK(aError)) {
    SOLOG(mHueComm, LOG_INFO, "Receiving API response: %s", aResponse.c_str());
    mError = HueComm::decodeResponse(aResponse, mData);
  }
  else {
    mError = HueComm::networkError(aError);
  }
  if (Error::notOK(mError)) {
    SOLOG(mHueComm, LOG_WARNING, "API error: %s", mError->text());
  }
  // done
  mCompleted = true;
  // have queue reprocessed
  mHueComm.processOperations();
}


bool HueApiOperation::hasCompleted()
{
  return mCompleted;
}


OperationPtr HueApiOperation::finalize()
{
  if (mResultHandler) {
    HueApiResultCB cb = mResultHandler;
    mResultHandler = NoOP; // call once only
    cb(mData, mError);
  }
  return inherited::finalize();
}


void HueApiOperation::abortOperation(ErrorPtr aError)
{
  if (!mAborted) {
    if (!mCompleted) {
      mHueComm.mChannel->cancelRequest();
    }
    if (mResultHandler && aError) {
      HueApiResultCB cb = mResultHandler;
      mResultHandler = NoOP; // call once only
      cb(JsonObjectPtr(), aError);
    }
  }
  inherited::abortOperation(aError);
}


// MARK: - HueComm

HueComm::HueComm(HueHttpChannelPtr aChannel) :
  inherited(MainLoop::currentMainLoop()),
  mChannel(aChannel),
  mRequestPacing(HUELINK_DEFAULT_REQUEST_PACING)
{
  if (!mChannel) {
    mChannel = HueHttpChannelPtr(new HueWebChannel());
  }
}


HueComm::~HueComm()
{
}


void HueComm::setRequestTimeout(MLMicroSeconds aTimeout)
{
  mChannel->setTimeout(aTimeout);
}


string HueComm::apiBaseURL(const string &aBridgeAddress)
{
  string url = aBridgeAddress;
  if (url.substr(0,7)=="http://" || url.substr(0,8)=="https://") {
    // already a URL, use as-is
    while (!url.empty() && url[url.size()-1]=='/') url.erase(url.size()-1);
    string apiSuffix = string("/")+HUELINK_API_V1_PATH;
    if (url.size()<apiSuffix.size() || url.substr(url.size()-apiSuffix.size())!=apiSuffix) {
      url += apiSuffix;
    }
    return url;
  }
  return string_format("http://%s/%s", aBridgeAddress.c_str(), HUELINK_API_V1_PATH);
}


void HueComm::apiQuery(const string &aBridgeAddress, const string &aPath, HueApiResultCB aResultHandler)
{
  apiRequest(HueApiOperation::GET, aBridgeAddress, aPath, JsonObjectPtr(), aResultHandler);
}


void HueComm::apiAction(const string &aBridgeAddress, const string &aPath, JsonObjectPtr aData, HueApiResultCB aResultHandler, HueApiOperation::HttpMethods aMethod)
{
  apiRequest(aMethod, aBridgeAddress, aPath, aData, aResultHandler);
}


void HueComm::apiRequest(HueApiOperation::HttpMethods aMethod, const string &aBridgeAddress, const string &aPath, JsonObjectPtr aData, HueApiResultCB aResultHandler)
{
  string url = apiBaseURL(aBridgeAddress) + aPath;
  HueApiOperationPtr op = HueApiOperationPtr(new HueApiOperation(*this, aMethod, url, aData, aResultHandler));
  // Philips says: no more than 10 API calls per second
  // A: You can send commands to the lights too fast. If you stay roughly around 10 commands per
  //    second to the /lights resource as maximum you should be fine.
  if (mRequestPacing>0) {
    op->setInitiationDelay(mRequestPacing, true); // do not start next command earlier than mRequestPacing after the previous one
  }
  queueOperation(op);
  // process operations
  processOperations();
}


ErrorPtr HueComm::decodeResponse(const string &aResponse, JsonObjectPtr &aResult)
{
  aResult.reset();
  ErrorPtr err;
  JsonObjectPtr ans = JsonObject::objFromText(aResponse.c_str(), -1, &err);
  if (Error::notOK(err) || !ans) {
    return Error::err<HueNetworkError>(HueNetworkError::InvalidResponse, "response is not JSON: %s", Error::text(err));
  }
  if (ans->isType(json_type_array)) {
    // Expected:
    //  [{"error":{"type":xxx,"address":"yyy","description":"zzz"}}]
    // or
    //  [{"success": { "xxx": "xxxxxxxx" }]
    // Note: bridge reports errors as array even on GET (e.g. unauthorized user), with HTTP status 200
    bool anySuccess = false;
    for (int i=0; i<ans->arrayLength(); i++) {
      JsonObjectPtr responseItem = ans->arrayGet(i);
      if (!responseItem || !responseItem->isType(json_type_object)) continue;
      JsonObjectPtr responseParams;
      if (responseItem->get("error", responseParams) && responseParams) {
        // first error found determines the result
        int type = HueBridgeError::OK;
        string address;
        string description = "bridge error";
        JsonObjectPtr o;
        if (responseParams->get("type", o)) type = o->int32Value();
        if (responseParams->get("address", o)) address = o->stringValue();
        if (responseParams->get("description", o)) description = o->stringValue();
        // an error item must never decode as OK
        if (type<=0) type = HueBridgeError::Unspecified;
        return ErrorPtr(new HueBridgeError(type, address, description));
      }
      if (responseItem->get("success", responseParams, false)) {
        anySuccess = true;
      }
    }
    if (!anySuccess) {
      return Error::err<HueNetworkError>(HueNetworkError::InvalidResponse, "response array has neither success nor error items");
    }
    // apparently successful, return entire response
    // Note: use getSuccessItem() or appliedFields() to get success details
    aResult = ans;
    return ErrorPtr();
  }
  if (ans->isType(json_type_object)) {
    // GET, just return entire data
    aResult = ans;
    return ErrorPtr();
  }
  return Error::err<HueNetworkError>(HueNetworkError::InvalidResponse, "unexpected response: %s", aResponse.c_str());
}


ErrorPtr HueComm::networkError(ErrorPtr aError)
{
  if (Error::isOK(aError)) return aError;
  if (aError->isDomain(HueNetworkError::domain())) return aError; // already classified
  if (aError->isDomain(WebError::domain())) {
    // non-2xx HTTP status, error code is the status
    return Error::err<HueNetworkError>(HueNetworkError::HttpStatus, "HTTP status %ld: %s", (long)aError->getErrorCode(), aError->text());
  }
  return Error::err<HueNetworkError>(HueNetworkError::RequestFailed, "request failed: %s", aError->text());
}


JsonObjectPtr HueComm::getSuccessItem(JsonObjectPtr aResult, int aIndex)
{
  if (aResult && aIndex<aResult->arrayLength()) {
    JsonObjectPtr responseItem = aResult->arrayGet(aIndex);
    JsonObjectPtr successItem;
    if (responseItem && responseItem->get("success", successItem, false)) {
      return successItem;
    }
  }
  return JsonObjectPtr();
}


HueAppliedFieldsVector HueComm::appliedFields(JsonObjectPtr aResult)
{
  HueAppliedFieldsVector fields;
  // [{"success":{"/lights/1/state/on":true}},{"success":{"/lights/1/state/bri":200}}]
  for (int i=0; aResult && i<aResult->arrayLength(); i++) {
    JsonObjectPtr s = getSuccessItem(aResult, i);
    if (!s || !s->isType(json_type_object)) continue;
    s->resetKeyIteration();
    string key;
    JsonObjectPtr val;
    while (s->nextKeyValue(key, val)) {
      HueAppliedField f;
      f.mPath = key;
      size_t p = key.rfind('/');
      f.mParam = p==string::npos ? key : key.substr(p+1);
      f.mValue = val;
      fields.push_back(f);
    }
  }
  return fields;
}

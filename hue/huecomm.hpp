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

#ifndef __huelink__huecomm__
#define __huelink__huecomm__

#include "huelink_common.hpp"

#include "httpcomm.hpp"
#include "jsonobject.hpp"
#include "operationqueue.hpp"

using namespace std;
using namespace p44;

namespace huelink {


  /// errors on the network level (no usable answer from the bridge at all)
  class HueNetworkError : public Error
  {
  public:
    // Errors
    enum {
      OK,
      RequestFailed, ///< connection refused, DNS failure, request timeout
      HttpStatus, ///< bridge answered with a non-2xx HTTP status
      InvalidResponse, ///< answer is not JSON, or not a valid hue API response envelope
    };
    typedef int ErrorCodes;

    static const char *domain() { return "HueNetwork"; }
    virtual const char *getErrorDomain() const P44_OVERRIDE { return HueNetworkError::domain(); };
    explicit HueNetworkError(ErrorCodes aError) : Error(ErrorCode(aError)) {};
    #if ENABLE_NAMED_ERRORS
  protected:
    virtual const char* errorName() const P44_OVERRIDE;
    #endif // ENABLE_NAMED_ERRORS
  };


  /// errors as reported by the bridge itself in an error item of the response array
  /// @note error code is the "type" field of the bridge's error item
  class HueBridgeError : public Error
  {
    string mAddress; ///< the resource path the bridge reported the error for

  public:
    // Errors (native bridge error types)
    enum {
      OK,
      UnauthorizedUser = 1, ///< invalid username, or no rights to modify the resource
      InvalidJSON = 2, ///< invalid JSON
      NotFound = 3, ///< resource does not exist (light...)
      InvalidMethod = 4, ///< method is invalid for the resource addressed
      MissingParam = 5, ///< missing parameters
      InvalidParam = 6, ///< invalid/unknown parameter (in PUT)
      InvalidValue = 7, ///< value wrong / out of range
      ReadOnly = 8, ///< trying to change read-only parameter
      TooManyItems = 11, ///< too many items in list
      CloudRequired = 12, ///< connection to cloud/portal is required for the operation
      LinkButtonNotPressed = 101, ///< link button not pressed (registration pending)
      DeviceIsOff = 201, ///< parameter cannot be modified while device is off
      InternalError = 901, ///< internal problem in the bridge (not with the command sent)
      Unspecified = 9999, ///< error item without a usable type
    };
    typedef int ErrorCodes;

    static const char *domain() { return "HueBridge"; }
    virtual const char *getErrorDomain() const P44_OVERRIDE { return HueBridgeError::domain(); };
    explicit HueBridgeError(ErrorCodes aError) : Error(ErrorCode(aError)) {};
    HueBridgeError(ErrorCodes aType, const string &aAddress, const string &aDescription) :
      Error(ErrorCode(aType), aDescription), mAddress(aAddress) {};

    /// @return resource address (path) as reported by the bridge, empty if none
    const string &getAddress() const { return mAddress; };

    #if ENABLE_NAMED_ERRORS
  protected:
    virtual const char* errorName() const P44_OVERRIDE;
    #endif // ENABLE_NAMED_ERRORS
  };
  typedef boost::intrusive_ptr<HueBridgeError> HueBridgeErrorPtr;


  /// abstract HTTP channel to talk to a bridge (or the discovery cloud)
  class HueHttpChannel : public P44Obj
  {
  public:

    /// issue a HTTP request
    /// @param aURL the complete URL
    /// @param aMethod the HTTP method ("GET", "POST", "PUT", "DELETE")
    /// @param aBody the request body (JSON text), empty for none
    /// @param aResultCB will be called exactly once with the response body or an error
    virtual void request(const string &aURL, const char *aMethod, const string &aBody, HttpCommCB aResultCB) = 0;

    /// cancel the request in progress, if any
    virtual void cancelRequest() = 0;

    /// @param aTimeout timeout for requests
    virtual void setTimeout(MLMicroSeconds aTimeout) = 0;

  };
  typedef boost::intrusive_ptr<HueHttpChannel> HueHttpChannelPtr;


  /// HTTP channel using the p44utils HttpComm web client
  class HueWebChannel : public HueHttpChannel
  {
    typedef HueHttpChannel inherited;

    HttpComm mHttpComm;

  public:

    HueWebChannel();
    virtual ~HueWebChannel();

    virtual void request(const string &aURL, const char *aMethod, const string &aBody, HttpCommCB aResultCB) P44_OVERRIDE;
    virtual void cancelRequest() P44_OVERRIDE;
    virtual void setTimeout(MLMicroSeconds aTimeout) P44_OVERRIDE;

  };


  class HueComm;

  /// will be called to deliver api result
  /// @param aResult the result in case of success.
  /// - for answers consisting of an array of success items (PUT, POST and DELETE), it is the entire array
  /// - for answers consisting of an object (GET), it is the entire answer object
  /// @param aError error in case of failure: a HueBridgeError when the bridge answered with an error item,
  ///   a HueNetworkError when there was no usable answer at all
  typedef boost::function<void (JsonObjectPtr aResult, ErrorPtr aError)> HueApiResultCB;


  class HueApiOperation : public Operation
  {
    typedef Operation inherited;

  public:

    typedef enum {
      GET,
      POST,
      PUT,
      DELETE
    } HttpMethods;

    HueApiOperation(HueComm &aHueComm, HttpMethods aMethod, const string &aUrl, JsonObjectPtr aData, HueApiResultCB aResultHandler);
    virtual ~HueApiOperation();

    virtual bool initiate() P44_OVERRIDE;
    virtual bool hasCompleted() P44_OVERRIDE;
    virtual OperationPtr finalize() P44_OVERRIDE;
    virtual void abortOperation(ErrorPtr aError) P44_OVERRIDE;

    /// @return HTTP method name
    static const char *methodName(HttpMethods aMethod);

  private:

    HueComm &mHueComm;
    HttpMethods mMethod;
    string mUrl;
    JsonObjectPtr mData;
    bool mCompleted;
    ErrorPtr mError;
    HueApiResultCB mResultHandler;

    void processAnswer(const string &aResponse, ErrorPtr aError);

  };
  typedef boost::intrusive_ptr<HueApiOperation> HueApiOperationPtr;


  /// one change acknowledged by the bridge in a success item
  class HueAppliedField
  {
  public:
    string mParam; ///< parameter name, such as "on" or "bri"
    string mPath; ///< full resource path as reported, such as "/lights/1/state/on"
    JsonObjectPtr mValue; ///< the value as reported by the bridge
  };
  typedef vector<HueAppliedField> HueAppliedFieldsVector;


  class HueComm : public OperationQueue
  {
    typedef OperationQueue inherited;
    friend class HueApiOperation;

    HueHttpChannelPtr mChannel;

  public:

    /// @param aChannel the HTTP channel to use. If not set, a HueWebChannel is created
    HueComm(HueHttpChannelPtr aChannel = HueHttpChannelPtr());
    virtual ~HueComm();

    /// @return type (such as: device, element, vdc, trigger) of the context object
    virtual string contextType() const P44_OVERRIDE { return "hue"; }

    /// @name settings
    /// @{

    MLMicroSeconds mRequestPacing; ///< minimal time between the start of two API requests, 0 for none

    /// @param aTimeout timeout for single API requests
    void setRequestTimeout(MLMicroSeconds aTimeout);

    /// @}

    /// @return the HTTP channel (for requests outside the hue API such as discovery)
    HueHttpChannel &channel() { return *mChannel; }

    /// @name executing API calls
    /// @{

    /// get the base URL of the V1 API for a bridge
    /// @param aBridgeAddress IP address or host name (optionally with port) of the bridge, or
    ///   a complete base URL starting with http:// or https://
    /// @return API base URL, without trailing slash
    static string apiBaseURL(const string &aBridgeAddress);

    /// Send a request to the bridge API
    /// @param aMethod the HTTP method to use
    /// @param aBridgeAddress the bridge to address (see apiBaseURL())
    /// @param aPath the path to append to the API base URL (including leading slash, empty for base URL itself)
    /// @param aData the data for the action to perform (JSON body of the request), NULL for none
    /// @param aResultHandler will be called with the decoded result
    void apiRequest(HueApiOperation::HttpMethods aMethod, const string &aBridgeAddress, const string &aPath, JsonObjectPtr aData, HueApiResultCB aResultHandler);

    /// Query information from the API
    /// @param aBridgeAddress the bridge to address (see apiBaseURL())
    /// @param aPath the path to append to the API base URL (including leading slash)
    /// @param aResultHandler will be called with the result
    void apiQuery(const string &aBridgeAddress, const string &aPath, HueApiResultCB aResultHandler);

    /// Send an action (a request with a body) to the API
    /// @param aBridgeAddress the bridge to address (see apiBaseURL())
    /// @param aPath the path to append to the API base URL (including leading slash)
    /// @param aData the data for the action to perform
    /// @param aResultHandler will be called with the result
    /// @param aMethod the HTTP method to use, defaults to PUT
    void apiAction(const string &aBridgeAddress, const string &aPath, JsonObjectPtr aData, HueApiResultCB aResultHandler, HueApiOperation::HttpMethods aMethod = HueApiOperation::PUT);

    /// @}

    /// @name response decoding
    /// @{

    /// decode a bridge response body into either a result or an error
    /// @param aResponse the response body as received from the bridge
    /// @param aResult will be set to the response JSON in case of success
    /// @return NULL if the response is a success, HueBridgeError for the first error item found in
    ///   the response, HueNetworkError::InvalidResponse for malformed responses
    static ErrorPtr decodeResponse(const string &aResponse, JsonObjectPtr &aResult);

    /// convert an error from the HTTP channel into a HueNetworkError
    /// @param aError error as returned by the HTTP channel
    /// @return HueNetworkError with the original error's text as message
    static ErrorPtr networkError(ErrorPtr aError);

    /// helper to get success from apiAction results
    /// @param aResult a result as delivered by apiRequest
    /// @param aIndex the index of the success item, defaults to 0
    /// @return contents of "success" item, if any.
    static JsonObjectPtr getSuccessItem(JsonObjectPtr aResult, int aIndex = 0);

    /// get all changes the bridge acknowledged in a response to a PUT request
    /// @param aResult a result as delivered by apiRequest
    /// @return list of acknowledged fields, in order of the response
    static HueAppliedFieldsVector appliedFields(JsonObjectPtr aResult);

    /// @}

  };
  typedef boost::intrusive_ptr<HueComm> HueCommPtr;

} // namespace huelink

#endif // __huelink__huecomm__

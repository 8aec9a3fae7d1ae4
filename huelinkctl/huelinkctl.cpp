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

#include "application.hpp"

#include "huediscovery.hpp"
#include "huepairing.hpp"
#include "huesession.hpp"

#include <unistd.h>

using namespace p44;
using namespace huelink;

#define DEFAULT_CONFIG_PATH "/.config/huelink/default.json"


/// main program for huelinkctl
class HueLinkCtl : public CmdLineApp
{
  typedef CmdLineApp inherited;

  HueCommPtr mHueComm;
  HueDiscoveryPtr mDiscovery;
  HuePairingPtr mPairing;
  HueSessionPtr mSession;

  string mBridge; ///< bridge address from command line or config
  string mUser; ///< username from command line or config

public:

  HueLinkCtl()
  {
  }

  virtual int main(int argc, char **argv)
  {
    const char *usageText =
      "huelinkctl " HUELINK_VERSION ", Philips hue bridge client\n"
      "Usage: %1$s [options] <command>\n"
      "Commands:\n"
      "  discover  : list the addresses of bridges found in the network\n"
      "  register  : register a new user with a bridge (needs --devicetype)\n"
      "  show      : list all lights, or details of a single light with --id\n"
      "  light     : change the state of the light given with --id\n";
    const CmdLineOptionDescriptor options[] = {
      { 'b', "bridge",     true,  "address;bridge IP address or host name (default: from config, or discovered)" },
      { 'u', "user",       true,  "username;username as issued by the bridge at registration" },
      { 0  , "config",     true,  "file;JSON config file with \"bridge\" and \"user\" (default: ~" DEFAULT_CONFIG_PATH ")" },
      { 0  , "ssdp",       false, "also search bridges in the local network using SSDP" },
      { 0  , "devicetype", true,  "type;application/device identifier to register" },
      { 0  , "attempts",   true,  "count;number of registration attempts (default: 30)" },
      { 0  , "interval",   true,  "seconds;interval between registration attempts (default: 5)" },
      { 'i', "id",         true,  "lightid;id of the light to show or change" },
      { 0  , "on",         false, "switch light on" },
      { 0  , "off",        false, "switch light off" },
      { 0  , "bri",        true,  "brightness;brightness 1..254" },
      { 0  , "hue",        true,  "hue;hue 0..65535" },
      { 0  , "sat",        true,  "saturation;saturation 0..254" },
      { 0  , "ct",         true,  "kelvin;color temperature in Kelvin" },
      { 0  , "alert",      true,  "alert;alert effect: none, select, lselect" },
      { 0  , "effect",     true,  "effect;dynamic effect: none, colorloop" },
      { 0  , "transition", true,  "ds;transition time in 1/10 seconds" },
      { 0  , "timeout",    true,  "seconds;timeout for single bridge requests (default: 10)" },
      CMDLINE_APPLICATION_STDOPTIONS,
      { 0, NULL } // list terminator
    };

    // parse the command line, exits when syntax errors occur
    setCommandDescriptors(usageText, options);
    parseCommandLine(argc, argv);

    if (numArguments()!=1) {
      // show usage
      showUsage();
      terminateApp(EXIT_FAILURE);
    }

    if (!isTerminated()) {
      // - set log level
      processStandardLogOptions(false);
      LOG(LOG_INFO, "huelinkctl " HUELINK_VERSION " starting");
    }
    // app now ready to run
    return run();
  }


  virtual void initialize()
  {
    ErrorPtr err = loadConfig();
    if (Error::notOK(err)) {
      reportAndExit(err);
      return;
    }
    mHueComm = HueCommPtr(new HueComm());
    int t;
    if (getIntOption("timeout", t)) {
      mHueComm->setRequestTimeout(t*Second);
    }
    string cmd = nonNullCStr(getArgument(0));
    if (cmd=="discover") {
      discover(boost::bind(&HueLinkCtl::printBridges, this, _1, _2));
    }
    else if (cmd=="register") {
      startRegistration();
    }
    else if (cmd=="show") {
      show();
    }
    else if (cmd=="light") {
      changeLight();
    }
    else {
      reportAndExit(TextError::err("unknown command '%s'", cmd.c_str()));
    }
  }


private:

  // MARK: - config

  ErrorPtr loadConfig()
  {
    string path;
    bool explicitPath = getStringOption("config", path);
    if (!explicitPath) {
      const char *home = getenv("HOME");
      if (home) path = string(home) + DEFAULT_CONFIG_PATH;
    }
    if (!path.empty()) {
      if (access(path.c_str(), F_OK)==0) {
        ErrorPtr err;
        JsonObjectPtr cfg = JsonObject::objFromFile(path.c_str(), &err);
        if (Error::notOK(err) || !cfg || !cfg->isType(json_type_object)) {
          return TextError::err("malformed config file '%s': %s", path.c_str(), Error::text(err));
        }
        JsonObjectPtr o;
        if (cfg->get("bridge", o)) mBridge = o->stringValue();
        if (cfg->get("user", o)) mUser = o->stringValue();
        LOG(LOG_INFO, "config loaded from '%s'", path.c_str());
      }
      else if (explicitPath) {
        return TextError::err("config file '%s' not found", path.c_str());
      }
    }
    // command line overrides config
    getStringOption("bridge", mBridge);
    getStringOption("user", mUser);
    return ErrorPtr();
  }


  // MARK: - error reporting

  void reportAndExit(ErrorPtr aError)
  {
    fprintf(stderr, "Error: %s\n", Error::text(aError));
    const char *hint = NULL;
    if (HueSession::needsReRegistration(aError)) {
      hint = "the username is not authorized on this bridge, run 'register' again";
    }
    else if (Error::isError(aError, HuePairingError::domain(), HuePairingError::Timeout)) {
      hint = "press the link button on the bridge, then run 'register' again";
    }
    else if (aError && aError->isDomain(HueNetworkError::domain())) {
      hint = "bridge unreachable, check the bridge address";
    }
    else if (aError && aError->isDomain(HueDiscoveryError::domain())) {
      hint = "bridge discovery failed, specify the bridge with --bridge";
    }
    if (hint) fprintf(stderr, "Hint: %s\n", hint);
    terminateApp(EXIT_FAILURE);
  }


  // MARK: - discover

  void discover(HueDiscoveryCB aCallback)
  {
    mDiscovery = HueDiscoveryPtr(new HueDiscovery(*mHueComm));
    mDiscovery->mUseSsdp = getOption("ssdp");
    mDiscovery->discoverBridges(aCallback);
  }


  void printBridges(const BridgeAddressList &aAddresses, ErrorPtr aError)
  {
    if (Error::notOK(aError)) {
      reportAndExit(aError);
      return;
    }
    if (aAddresses.empty()) {
      fprintf(stderr, "No bridges found\n");
    }
    for (BridgeAddressList::const_iterator pos = aAddresses.begin(); pos!=aAddresses.end(); ++pos) {
      printf("%s\n", pos->c_str());
    }
    terminateApp(EXIT_SUCCESS);
  }


  // MARK: - register

  void startRegistration()
  {
    if (mBridge.empty()) {
      fprintf(stderr, "No bridge specified, searching...\n");
      discover(boost::bind(&HueLinkCtl::bridgeForRegistration, this, _1, _2));
      return;
    }
    registerUser();
  }


  void bridgeForRegistration(const BridgeAddressList &aAddresses, ErrorPtr aError)
  {
    if (Error::notOK(aError)) {
      reportAndExit(aError);
      return;
    }
    if (aAddresses.empty()) {
      reportAndExit(TextError::err("no bridge found, specify the bridge with --bridge"));
      return;
    }
    mBridge = aAddresses[0];
    fprintf(stderr, "Using bridge at %s\n", mBridge.c_str());
    registerUser();
  }


  void registerUser()
  {
    string deviceType;
    getStringOption("devicetype", deviceType);
    int attempts = HUELINK_DEFAULT_PAIRING_ATTEMPTS;
    getIntOption("attempts", attempts);
    MLMicroSeconds interval = HUELINK_DEFAULT_PAIRING_INTERVAL;
    int secs;
    if (getIntOption("interval", secs)) interval = secs*Second;
    mPairing = HuePairingPtr(new HuePairing(*mHueComm));
    mPairing->mProgressCB = boost::bind(&HueLinkCtl::pairingProgress, this, _1, _2);
    mPairing->registerUser(mBridge, deviceType, attempts, interval, boost::bind(&HueLinkCtl::registered, this, _1, _2));
  }


  void pairingProgress(int aAttempt, int aMaxAttempts)
  {
    fprintf(stderr, "Press the link button on the bridge (attempt %d/%d)\n", aAttempt, aMaxAttempts);
  }


  void registered(const string &aUserName, ErrorPtr aError)
  {
    if (Error::notOK(aError)) {
      reportAndExit(aError);
      return;
    }
    printf("%s\n", aUserName.c_str());
    JsonObjectPtr cfg = JsonObject::newObj();
    cfg->add("bridge", JsonObject::newString(mBridge));
    cfg->add("user", JsonObject::newString(aUserName));
    fprintf(stderr, "Registered. To use this bridge by default, save the following to ~%s:\n%s\n", DEFAULT_CONFIG_PATH, cfg->c_strValue());
    terminateApp(EXIT_SUCCESS);
  }


  // MARK: - show and light

  bool openSession()
  {
    ErrorPtr err = HueSession::newSession(*mHueComm, mBridge, mUser, mSession);
    if (Error::notOK(err)) {
      reportAndExit(err);
      return false;
    }
    return true;
  }


  void show()
  {
    if (!openSession()) return;
    string lightID;
    if (getStringOption("id", lightID)) {
      mSession->getLight(lightID, boost::bind(&HueLinkCtl::printLight, this, _1, _2));
    }
    else {
      mSession->listLights(boost::bind(&HueLinkCtl::printLights, this, _1, _2));
    }
  }


  void printLights(const HueLightsVector &aLights, ErrorPtr aError)
  {
    if (Error::notOK(aError)) {
      reportAndExit(aError);
      return;
    }
    printf("%-4s %-28s %-18s %s\n", "ID", "Name", "Kind", "State");
    for (HueLightsVector::const_iterator pos = aLights.begin(); pos!=aLights.end(); ++pos) {
      HueLightPtr l = *pos;
      printf("%-4s %-28s %-18s %s\n", l->mLightID.c_str(), l->mName.c_str(), HueLight::kindName(l->mKind), l->stateDescription().c_str());
    }
    terminateApp(EXIT_SUCCESS);
  }


  void printLight(HueLightPtr aLight, ErrorPtr aError)
  {
    if (Error::notOK(aError)) {
      reportAndExit(aError);
      return;
    }
    printf("Light %s: %s\n", aLight->mLightID.c_str(), aLight->mName.c_str());
    printf("- type         : %s (%s)\n", aLight->mType.c_str(), HueLight::kindName(aLight->mKind));
    printf("- model        : %s %s\n", aLight->mManufacturer.c_str(), aLight->mModelId.c_str());
    printf("- unique id    : %s\n", aLight->mUniqueId.c_str());
    printf("- sw version   : %s\n", aLight->mSwVersion.c_str());
    printf("- state        : %s\n", aLight->stateDescription().c_str());
    if (!aLight->mEffect.empty()) printf("- effect       : %s\n", aLight->mEffect.c_str());
    if (!aLight->mAlert.empty()) printf("- alert        : %s\n", aLight->mAlert.c_str());
    terminateApp(EXIT_SUCCESS);
  }


  void changeLight()
  {
    string lightID;
    if (!getStringOption("id", lightID)) {
      reportAndExit(TextError::err("light command needs --id"));
      return;
    }
    if (getOption("on") && getOption("off")) {
      reportAndExit(TextError::err("--on and --off cannot be used together"));
      return;
    }
    if (!openSession()) return;
    HueLightStateChange change;
    if (getOption("on")) change.mOn = yes;
    if (getOption("off")) change.mOn = no;
    // values are passed as given, the bridge reports out-of-range values
    int v;
    if (getIntOption("bri", v)) change.setBri(v);
    if (getIntOption("hue", v)) change.setHue(v);
    if (getIntOption("sat", v)) change.setSat(v);
    if (getIntOption("ct", v) && !change.setCtKelvin(v)) {
      reportAndExit(TextError::err("--ct needs a positive Kelvin value"));
      return;
    }
    getStringOption("alert", change.mAlert);
    getStringOption("effect", change.mEffect);
    if (getIntOption("transition", v)) change.setTransitionTime(v);
    mSession->setLightState(lightID, change, boost::bind(&HueLinkCtl::lightChanged, this, _1, _2));
  }


  void lightChanged(const HueAppliedFieldsVector &aApplied, ErrorPtr aError)
  {
    if (Error::notOK(aError)) {
      reportAndExit(aError);
      return;
    }
    for (HueAppliedFieldsVector::const_iterator pos = aApplied.begin(); pos!=aApplied.end(); ++pos) {
      printf("%s = %s\n", pos->mParam.c_str(), JsonObject::text(pos->mValue));
    }
    terminateApp(EXIT_SUCCESS);
  }

};


int main(int argc, char **argv)
{
  // prevent debug output before application.main scans command line
  SETLOGLEVEL(LOG_EMERG);
  SETERRLEVEL(LOG_EMERG, false); // messages, if any, go to stderr
  // create app with current mainloop
  static HueLinkCtl application;
  // pass control
  return application.main(argc, argv);
}

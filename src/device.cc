#include "device.hh"
#include "exception.hh"
#include "logger.hh"
#include <exception>

using namespace brf;


/* ********************************************************************************************* *
 * Device
 * ********************************************************************************************* */
Device::Device(Driver *driver)
  : _driver(driver), _boardName()
{
  if (0 == _driver) {
    ConfigError err; err << "Can not create device: No driver given.";
    throw err;
  }
  try {
    _boardName = _driver->boardName();
  } catch (std::exception &) {
    // the destructor is not called for a device that was not constructed
    delete _driver;
    throw;
  }
}

Device::~Device() {
  delete _driver;
}

void
Device::checkBoard(const char *expected) const {
  if (_boardName != expected) {
    ConfigError err(STATUS_NODEV);
    err << "Board mismatch: Expected '" << expected << "' but driver is connected to '"
        << _boardName << "'.";
    throw err;
  }
  LogMessage msg(LOG_DEBUG);
  msg << "Using " << _boardName << ".";
  Logger::get().log(msg);
}


/* ********************************************************************************************* *
 * BladeRF1
 * ********************************************************************************************* */
BladeRF1::BladeRF1(Driver *driver)
  : Device(driver)
{
  checkBoard("bladerf1");
}

BladeRF1::~BladeRF1() {
  // pass...
}


/* ********************************************************************************************* *
 * BladeRF2
 * ********************************************************************************************* */
BladeRF2::BladeRF2(Driver *driver)
  : Device(driver)
{
  checkBoard("bladerf2");
}

BladeRF2::~BladeRF2() {
  // pass...
}


/* ********************************************************************************************* *
 * BladeRFAny
 * ********************************************************************************************* */
BladeRFAny::BladeRFAny(Driver *driver)
  : Device(driver)
{
  LogMessage msg(LOG_DEBUG);
  msg << "Using " << _boardName << " (any variant).";
  Logger::get().log(msg);
}

BladeRFAny::~BladeRFAny() {
  // pass...
}

bool
BladeRFAny::isBladeRF1() const {
  return "bladerf1" == _boardName;
}

bool
BladeRFAny::isBladeRF2() const {
  return "bladerf2" == _boardName;
}

#include "xb200.hh"
#include "exception.hh"
#include "logger.hh"
#include <utility>

using namespace brf;


static const char *
directionName(Direction dir) {
  return (DIRECTION_RX == dir) ? "RX" : "TX";
}


/* ********************************************************************************************* *
 * Xb200Pins
 * ********************************************************************************************* */
Xb200Pins::Xb200Pins(BladeRF1 &device)
  : j7_1(10, device), j7_2(11, device), j7_5(8, device), j7_6(9, device),
    j13_1(17, device), j13_2(18, device),
    j16_1(31, device), j16_2(32, device), j16_3(19, device), j16_4(20, device),
    j16_5(21, device), j16_6(24, device)
{
  // pass...
}

Xb200Pins::Xb200Pins(Xb200Pins &&other)
  : j7_1(std::move(other.j7_1)), j7_2(std::move(other.j7_2)),
    j7_5(std::move(other.j7_5)), j7_6(std::move(other.j7_6)),
    j13_1(std::move(other.j13_1)), j13_2(std::move(other.j13_2)),
    j16_1(std::move(other.j16_1)), j16_2(std::move(other.j16_2)),
    j16_3(std::move(other.j16_3)), j16_4(std::move(other.j16_4)),
    j16_5(std::move(other.j16_5)), j16_6(std::move(other.j16_6))
{
  // pass...
}


/* ********************************************************************************************* *
 * Xb200
 * ********************************************************************************************* */
Xb200::Xb200(BladeRF1 &device)
  : _device(device), _pinsTaken(false)
{
  int res = _device.driver().expansionAttach(XB_200);
  if (STATUS_OK != res) {
    ConfigError err(res);
    err << "Can not attach XB-200: " << _device.driver().statusString(res);
    throw err;
  }
  LogMessage msg(LOG_DEBUG, "XB-200 attached.");
  Logger::get().log(msg);
}

Xb200::~Xb200() {
  // pass...
}

void
Xb200::setFilterbank(Direction dir, Xb200Filter filter) {
  int res = _device.driver().xb200SetFilterbank(dir, filter);
  if (STATUS_OK != res) {
    DriverError err(res);
    err << "Can not set XB-200 " << directionName(dir) << " filter bank: "
        << _device.driver().statusString(res);
    throw err;
  }
}

Xb200Filter
Xb200::filterbank(Direction dir) const {
  Xb200Filter filter = XB200_AUTO_1DB;
  int res = _device.driver().xb200GetFilterbank(dir, filter);
  if (STATUS_OK != res) {
    DriverError err(res);
    err << "Can not get XB-200 " << directionName(dir) << " filter bank: "
        << _device.driver().statusString(res);
    throw err;
  }
  return filter;
}

void
Xb200::setPath(Direction dir, Xb200Path path) {
  int res = _device.driver().xb200SetPath(dir, path);
  if (STATUS_OK != res) {
    DriverError err(res);
    err << "Can not set XB-200 " << directionName(dir) << " path: "
        << _device.driver().statusString(res);
    throw err;
  }
}

Xb200Path
Xb200::path(Direction dir) const {
  Xb200Path path = XB200_BYPASS;
  int res = _device.driver().xb200GetPath(dir, path);
  if (STATUS_OK != res) {
    DriverError err(res);
    err << "Can not get XB-200 " << directionName(dir) << " path: "
        << _device.driver().statusString(res);
    throw err;
  }
  return path;
}

Xb200Pins
Xb200::takePins() {
  if (_pinsTaken) {
    RuntimeError err;
    err << "The XB-200 pins were already taken.";
    throw err;
  }
  _pinsTaken = true;
  return Xb200Pins(_device);
}

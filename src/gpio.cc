#include "gpio.hh"
#include "exception.hh"
#include "logger.hh"
#include <utility>

using namespace brf;


static void
checkPin(unsigned pin) {
  if ((pin < 1) || (pin > 32)) {
    ConfigError err(STATUS_RANGE);
    err << "Invalid expansion GPIO pin " << pin << ": Must be within 1 and 32.";
    throw err;
  }
}

uint32_t
brf::pinToBitmask(unsigned pin) {
  checkPin(pin);
  return uint32_t(1) << (pin-1);
}

PinState
brf::pinStateFromRegister(unsigned pin, uint32_t reg) {
  return (0 != (reg & pinToBitmask(pin))) ? PIN_HIGH : PIN_LOW;
}


/* ********************************************************************************************* *
 * GpioPinBase
 * ********************************************************************************************* */
GpioPinBase::GpioPinBase(unsigned pin, Device &device)
  : _pin(0), _device(&device)
{
  checkPin(pin);
  _pin = uint8_t(pin);
}

GpioPinBase::GpioPinBase(GpioPinBase &&other)
  : _pin(other._pin), _device(other._device)
{
  other._device = 0;
}

GpioPinBase::~GpioPinBase() {
  // pass...
}

Device &
GpioPinBase::device() const {
  if (0 == _device) {
    RuntimeError err;
    err << "Expansion GPIO pin " << int(_pin) << " was released.";
    throw err;
  }
  return *_device;
}

Device *
GpioPinBase::setDirection(bool output) {
  Device &dev = device();
  uint32_t mask = pinToBitmask(_pin);
  int res = dev.driver().gpioDirMaskedWrite(mask, output ? mask : 0);
  if (STATUS_OK != res) {
    DriverError err(res);
    err << "Can not set direction of expansion GPIO pin " << int(_pin) << ": "
        << dev.driver().statusString(res);
    throw err;
  }

  LogMessage msg(LOG_DEBUG);
  msg << "Expansion GPIO pin " << int(_pin) << " is " << (output ? "output" : "input") << ".";
  Logger::get().log(msg);

  _device = 0;
  return &dev;
}


/* ********************************************************************************************* *
 * GpioPin<Undirected>
 * ********************************************************************************************* */
GpioPin<Undirected>::GpioPin(unsigned pin, Device &device)
  : GpioPinBase(pin, device)
{
  // pass...
}

GpioPin<Undirected>::GpioPin(GpioPin &&other)
  : GpioPinBase(std::move(other))
{
  // pass...
}

GpioPin<Input>
GpioPin<Undirected>::asInput() && {
  uint8_t pin = _pin;
  return GpioPin<Input>(pin, setDirection(false));
}

GpioPin<Output>
GpioPin<Undirected>::asOutput() && {
  uint8_t pin = _pin;
  return GpioPin<Output>(pin, setDirection(true));
}


/* ********************************************************************************************* *
 * GpioPin<Input>
 * ********************************************************************************************* */
GpioPin<Input>::GpioPin(uint8_t pin, Device *device)
  : GpioPinBase(pin, *device)
{
  // pass...
}

GpioPin<Input>::GpioPin(GpioPin &&other)
  : GpioPinBase(std::move(other))
{
  // pass...
}

PinState
GpioPin<Input>::read() const {
  Device &dev = device();
  uint32_t value = 0;
  int res = dev.driver().gpioRead(value);
  if (STATUS_OK != res) {
    DriverError err(res);
    err << "Can not read expansion GPIO pin " << int(_pin) << ": "
        << dev.driver().statusString(res);
    throw err;
  }
  return pinStateFromRegister(_pin, value);
}


/* ********************************************************************************************* *
 * GpioPin<Output>
 * ********************************************************************************************* */
GpioPin<Output>::GpioPin(uint8_t pin, Device *device)
  : GpioPinBase(pin, *device)
{
  // pass...
}

GpioPin<Output>::GpioPin(GpioPin &&other)
  : GpioPinBase(std::move(other))
{
  // pass...
}

void
GpioPin<Output>::write(PinState state) {
  Device &dev = device();
  uint32_t mask = pinToBitmask(_pin);
  int res = dev.driver().gpioMaskedWrite(mask, (PIN_HIGH == state) ? mask : 0);
  if (STATUS_OK != res) {
    DriverError err(res);
    err << "Can not write expansion GPIO pin " << int(_pin) << ": "
        << dev.driver().statusString(res);
    throw err;
  }
}

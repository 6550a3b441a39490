#ifndef __BRF_GPIO_HH__
#define __BRF_GPIO_HH__

#include <stdint.h>
#include "device.hh"

/** Pin set of the unit tests. */
class MockPinSet;

namespace brf {

class Xb200Pins;

/** Logic level of a pin. */
typedef enum {
  PIN_LOW  = 0,
  PIN_HIGH = 1
} PinState;

/** Direction tag of a pin that was not configured yet. */
class Undirected { };
/** Direction tag of an input pin. */
class Input { };
/** Direction tag of an output pin. */
class Output { };

/** For a given pin number 1-32, returns the register mask with only the corresponding bit set.
 * Does the same as the @c BLADERF_XB_GPIO macro of libbladeRF.
 * @throws ConfigError if the pin number is not within 1 and 32. */
uint32_t pinToBitmask(unsigned pin);

/** Returns the state of the given pin (1-32) in the register value @c reg.
 * @throws ConfigError if the pin number is not within 1 and 32. */
PinState pinStateFromRegister(unsigned pin, uint32_t reg);


/** Common part of all expansion GPIO pins: the pin number and the device.
 *
 * Pins are move-only. Every register write is masked to the bit of the pin, hence pins of the
 * same device may be used from different threads. Concurrent use of the same pin is not
 * allowed. */
class GpioPinBase
{
protected:
  /** Hidden constructor.
   * @throws ConfigError if the pin number is not within 1 and 32. */
  GpioPinBase(unsigned pin, Device &device);
  /** Move constructor, the other pin is left released. */
  GpioPinBase(GpioPinBase &&other);

public:
  /** Destructor. */
  virtual ~GpioPinBase();

  /** Returns the pin number (1-32). */
  inline uint8_t pin() const { return _pin; }
  /** Returns the register bit mask of the pin. */
  inline uint32_t mask() const { return pinToBitmask(_pin); }
  /** Returns @c false if the pin was converted or moved away. */
  inline bool isValid() const { return 0 != _device; }

protected:
  /** Returns the device or throws a @c RuntimeError if the pin was released. */
  Device &device() const;
  /** Sets the direction bit of the pin and hands over the device. */
  Device *setDirection(bool output);

protected:
  /** The pin number. */
  uint8_t _pin;
  /** The device or 0 if released. */
  Device *_device;
};


/** Forward declaration of the expansion GPIO pin. The direction tag (@c Undirected, @c Input or
 * @c Output) selects the available operations. */
template <class Dir> class GpioPin;
template <> class GpioPin<Input>;
template <> class GpioPin<Output>;

/** An expansion GPIO pin with unknown direction. Convert it into an input or output pin.
 *
 * Undirected pins are handed out by the pin set of an expansion board (e.g. @c Xb200Pins),
 * hence there is at most one handle per pin. */
template <>
class GpioPin<Undirected>: public GpioPinBase
{
  friend class Xb200Pins;
  friend class ::MockPinSet;

protected:
  /** Hidden constructor.
   * @throws ConfigError if the pin number is not within 1 and 32. */
  GpioPin(unsigned pin, Device &device);

public:
  /** Move constructor. */
  GpioPin(GpioPin &&other);

  /** Configures the pin as an input.
   * @throws DriverError if the direction register can not be written. */
  GpioPin<Input> asInput() &&;
  /** Configures the pin as an output.
   * @throws DriverError if the direction register can not be written. */
  GpioPin<Output> asOutput() &&;
};

/** An expansion GPIO pin configured as input. */
template <>
class GpioPin<Input>: public GpioPinBase
{
  friend class GpioPin<Undirected>;

protected:
  /** Hidden constructor, use @c GpioPin<Undirected>::asInput. */
  GpioPin(uint8_t pin, Device *device);

public:
  /** Move constructor. */
  GpioPin(GpioPin &&other);

  /** Reads the state of the pin.
   * @throws DriverError if the value register can not be read. */
  PinState read() const;
  /** Returns @c true if the pin is high. */
  inline bool isHigh() const { return PIN_HIGH == read(); }
  /** Returns @c true if the pin is low. */
  inline bool isLow() const { return PIN_LOW == read(); }
};

/** An expansion GPIO pin configured as output. */
template <>
class GpioPin<Output>: public GpioPinBase
{
  friend class GpioPin<Undirected>;

protected:
  /** Hidden constructor, use @c GpioPin<Undirected>::asOutput. */
  GpioPin(uint8_t pin, Device *device);

public:
  /** Move constructor. */
  GpioPin(GpioPin &&other);

  /** Sets the state of the pin, leaves all other pins untouched.
   * @throws DriverError if the value register can not be written. */
  void write(PinState state);
  /** Drives the pin high. */
  inline void setHigh() { write(PIN_HIGH); }
  /** Drives the pin low. */
  inline void setLow() { write(PIN_LOW); }
};

/** An undirected pin. */
typedef GpioPin<Undirected> UndirectedPin;
/** An input pin. */
typedef GpioPin<Input> InputPin;
/** An output pin. */
typedef GpioPin<Output> OutputPin;

}

#endif // __BRF_GPIO_HH__

#ifndef __BRF_DEVICE_HH__
#define __BRF_DEVICE_HH__

#include <string>
#include "driver.hh"

namespace brf {

/** Base class of all device variants. A device owns the @c Driver instance performing the
 * actual hardware transactions.
 *
 * Devices are neither copyable nor movable, streams and pins keep pointers to them. Use a
 * @c std::shared_ptr to share a device between threads. */
class Device
{
protected:
  /** Hidden constructor. Takes the ownership of the driver. */
  Device(Driver *driver);

public:
  /** Destructor, closes the driver. */
  virtual ~Device();

  /** Returns the driver of the device. */
  inline Driver &driver() const { return *_driver; }
  /** Returns the board name as reported by the driver. */
  inline const std::string &boardName() const { return _boardName; }

protected:
  /** Checks if the board name reported by the driver matches @c expected, throws a
   * @c ConfigError otherwise. */
  void checkBoard(const char *expected) const;

protected:
  /** The driver instance. */
  Driver *_driver;
  /** The board name. */
  std::string _boardName;

private:
  /** Devices are not copyable. */
  Device(const Device &other);
  /** Devices are not copyable. */
  Device &operator=(const Device &other);
};


/** A bladeRF 1 (x40, x115). One channel per direction, expansion header for the XB-100,
 * XB-200 and XB-300 boards. */
class BladeRF1: public Device
{
public:
  /** Constructor. Takes the ownership of the driver, throws a @c ConfigError if the driver is
   * not connected to a bladeRF 1. */
  explicit BladeRF1(Driver *driver);
  /** Destructor. */
  virtual ~BladeRF1();
};


/** A bladeRF 2.0 micro (xA4, xA9). Two channels per direction. */
class BladeRF2: public Device
{
public:
  /** Constructor. Takes the ownership of the driver, throws a @c ConfigError if the driver is
   * not connected to a bladeRF 2.0 micro. */
  explicit BladeRF2(Driver *driver);
  /** Destructor. */
  virtual ~BladeRF2();
};


/** A bladeRF of unknown variant. Every layout is accepted at compile time, layouts not
 * supported by the actual hardware are rejected by the driver when the stream is configured. */
class BladeRFAny: public Device
{
public:
  /** Constructor. Takes the ownership of the driver. */
  explicit BladeRFAny(Driver *driver);
  /** Destructor. */
  virtual ~BladeRFAny();

  /** Returns @c true if the device is a bladeRF 1. */
  bool isBladeRF1() const;
  /** Returns @c true if the device is a bladeRF 2.0 micro. */
  bool isBladeRF2() const;
};

}

#endif // __BRF_DEVICE_HH__

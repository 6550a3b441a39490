#ifndef __BRF_XB200_HH__
#define __BRF_XB200_HH__

#include "gpio.hh"
#include "device.hh"

namespace brf {

/** The pins of the XB-200 expansion headers. The names follow the Nuand schematics, i.e.
 * @c j16_1 is pin 1 of header J16. All pins are undirected, move the pins you need out of the
 * set and convert them:
 * @code
 * brf::Xb200 board(dev);
 * brf::Xb200Pins pins = board.takePins();
 * brf::OutputPin led = std::move(pins.j16_1).asOutput();
 * led.setHigh();
 * @endcode */
class Xb200Pins
{
  friend class Xb200;

protected:
  /** Hidden constructor, use @c Xb200::takePins. */
  explicit Xb200Pins(BladeRF1 &device);

public:
  /** Move constructor. */
  Xb200Pins(Xb200Pins &&other);

public:
  GpioPin<Undirected> j7_1;
  GpioPin<Undirected> j7_2;
  GpioPin<Undirected> j7_5;
  GpioPin<Undirected> j7_6;
  GpioPin<Undirected> j13_1;
  GpioPin<Undirected> j13_2;
  GpioPin<Undirected> j16_1;
  GpioPin<Undirected> j16_2;
  GpioPin<Undirected> j16_3;
  GpioPin<Undirected> j16_4;
  GpioPin<Undirected> j16_5;
  GpioPin<Undirected> j16_6;
};


/** The XB-200 transverter board of the bladeRF 1. Constructing the instance attaches the
 * board. */
class Xb200
{
public:
  /** Constructor.
   * @throws ConfigError if the board can not be attached. */
  explicit Xb200(BladeRF1 &device);
  /** Destructor. */
  virtual ~Xb200();

  /** Selects the filter bank of the given direction. */
  void setFilterbank(Direction dir, Xb200Filter filter);
  /** Returns the filter bank of the given direction. */
  Xb200Filter filterbank(Direction dir) const;
  /** Selects the signal path of the given direction. */
  void setPath(Direction dir, Xb200Path path);
  /** Returns the signal path of the given direction. */
  Xb200Path path(Direction dir) const;

  /** Returns the header pins. The pins can be taken only once, otherwise two handles could
   * drive the same pin.
   * @throws RuntimeError if the pins were taken already. */
  Xb200Pins takePins();

protected:
  /** The device. */
  BladeRF1 &_device;
  /** If @c true, @c takePins was called. */
  bool _pinsTaken;

private:
  /** Not copyable. */
  Xb200(const Xb200 &other);
  /** Not copyable. */
  Xb200 &operator=(const Xb200 &other);
};

}

#endif // __BRF_XB200_HH__

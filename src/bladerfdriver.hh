#ifndef __BRF_BLADERFDRIVER_HH__
#define __BRF_BLADERFDRIVER_HH__

#include <libbladeRF.h>
#include "driver.hh"

namespace brf {

/** Implements the @c Driver interface using libbladeRF.
 *
 * libbladeRF serializes the control transfers internally and keeps the RX and TX sync
 * interfaces apart, hence one instance may be shared by a receiving and a transmitting
 * thread. */
class BladeRFDriver: public Driver
{
public:
  /** Constructor, takes the ownership of an already opened libbladeRF device handle. */
  explicit BladeRFDriver(struct bladerf *device);
  /** Destructor, closes the device. */
  virtual ~BladeRFDriver();

  /** Opens the device matching the given libbladeRF device identifier, i.e. "" for the first
   * device found or "*:serial=f12ce1037830a1b27f3ceeba1f521413" for a specific one.
   * @throws ConfigError if no matching device can be opened. */
  static BladeRFDriver *open(const std::string &identifier="");

  /** Returns the libbladeRF device handle. */
  inline struct bladerf *handle() const { return _device; }

  virtual std::string boardName();
  virtual std::string statusString(int status);

  virtual int configureStream(Direction dir, size_t num_channels, SampleFormat format,
                              const StreamConfig &config);
  virtual int syncRX(void *samples, size_t num_samples, unsigned int timeout_ms);
  virtual int syncTX(const void *samples, size_t num_samples, unsigned int timeout_ms);
  virtual int enableModule(Channel ch, bool enable);

  virtual int gpioRead(uint32_t &value);
  virtual int gpioMaskedWrite(uint32_t mask, uint32_t value);
  virtual int gpioDirRead(uint32_t &outputs);
  virtual int gpioDirMaskedWrite(uint32_t mask, uint32_t outputs);

  virtual int expansionAttach(ExpansionBoard board);
  virtual int xb200SetFilterbank(Direction dir, Xb200Filter filter);
  virtual int xb200GetFilterbank(Direction dir, Xb200Filter &filter);
  virtual int xb200SetPath(Direction dir, Xb200Path path);
  virtual int xb200GetPath(Direction dir, Xb200Path &path);

protected:
  /** The libbladeRF device. */
  struct bladerf *_device;
};

}

#endif // __BRF_BLADERFDRIVER_HH__

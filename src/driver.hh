#ifndef __BRF_DRIVER_HH__
#define __BRF_DRIVER_HH__

#include <stdint.h>
#include <cstddef>
#include <string>

namespace brf {

// Forward decl.
class StreamConfig;

/** Signal direction. */
typedef enum {
  DIRECTION_RX = 0, ///< Receive (inbound).
  DIRECTION_TX = 1  ///< Transmit (outbound).
} Direction;

/** Channel index within a direction. */
typedef enum {
  CHANNEL_0 = 0,
  CHANNEL_1 = 1
} ChannelIndex;

/** Physical channels. The values match the libbladeRF channel numbering
 * (@c BLADERF_CHANNEL_RX(n) and @c BLADERF_CHANNEL_TX(n)). */
typedef enum {
  CHANNEL_RX0 = 0,
  CHANNEL_TX0 = 1,
  CHANNEL_RX1 = 2,
  CHANNEL_TX1 = 3
} Channel;

/** Returns the physical channel for the given direction and index. */
inline Channel channel(Direction dir, ChannelIndex idx) {
  return Channel((int(idx) << 1) | int(dir));
}

/** Returns the human readable name of the given channel. */
const char *channelName(Channel ch);

/** Sample formats understood by the sync interface. */
typedef enum {
  FORMAT_SC16_Q11 = 0, ///< Interleaved 16bit I/Q, 12bit significant (Q11).
  FORMAT_SC8_Q7        ///< Interleaved 8bit I/Q (Q7).
} SampleFormat;

/** Expansion boards. The values match @c bladerf_xb. */
typedef enum {
  XB_NONE = 0,
  XB_100  = 1,
  XB_200  = 2,
  XB_300  = 3
} ExpansionBoard;

/** XB-200 filter banks. The values match @c bladerf_xb200_filter. */
typedef enum {
  XB200_50M      = 0, ///< 50-54 MHz (6 meter band).
  XB200_144M     = 1, ///< 144-148 MHz (2 meter band).
  XB200_222M     = 2, ///< 219-225 MHz (1.25 meter band).
  XB200_CUSTOM   = 3, ///< Custom filter path.
  XB200_AUTO_1DB = 4, ///< Automatic selection, 1dB points.
  XB200_AUTO_3DB = 5  ///< Automatic selection, 3dB points.
} Xb200Filter;

/** XB-200 signal paths. The values match @c bladerf_xb200_path. */
typedef enum {
  XB200_BYPASS = 0, ///< Bypass the XB-200 mixer.
  XB200_MIX    = 1  ///< Route through the XB-200 mixer.
} Xb200Path;

/** Status codes returned by the driver. The values match the libbladeRF error codes. */
typedef enum {
  STATUS_OK          = 0,
  STATUS_UNEXPECTED  = -1,
  STATUS_RANGE       = -2,
  STATUS_INVAL       = -3,
  STATUS_MEM         = -4,
  STATUS_IO          = -5,
  STATUS_TIMEOUT     = -6,
  STATUS_NODEV       = -7,
  STATUS_UNSUPPORTED = -8
} Status;


/** Interface to the component performing the actual register and USB transactions.
 *
 * All methods block until the operation is complete and return @c STATUS_OK on success or a
 * negative status code. Implementations must allow the RX and TX related calls to be issued
 * concurrently from different threads. */
class Driver
{
protected:
  /** Hidden constructor. */
  Driver();

public:
  /** Destructor. */
  virtual ~Driver();

  /** Returns the board name, i.e. "bladerf1" or "bladerf2". */
  virtual std::string boardName() = 0;
  /** Returns a human readable description of the status code. */
  virtual std::string statusString(int status);

  /** Configures the sync interface of the given direction with @c num_channels interleaved
   * channels and the given sample format. */
  virtual int configureStream(Direction dir, size_t num_channels, SampleFormat format,
                              const StreamConfig &config) = 0;
  /** Receives @c num_samples samples into @c samples. */
  virtual int syncRX(void *samples, size_t num_samples, unsigned int timeout_ms) = 0;
  /** Transmits @c num_samples samples from @c samples. */
  virtual int syncTX(const void *samples, size_t num_samples, unsigned int timeout_ms) = 0;
  /** Enables or disables the given channel. */
  virtual int enableModule(Channel ch, bool enable) = 0;

  /** Reads the expansion GPIO value register. */
  virtual int gpioRead(uint32_t &value) = 0;
  /** Writes the bits of @c value selected by @c mask into the expansion GPIO value register. */
  virtual int gpioMaskedWrite(uint32_t mask, uint32_t value) = 0;
  /** Reads the expansion GPIO direction register (set bit = output). */
  virtual int gpioDirRead(uint32_t &outputs) = 0;
  /** Writes the bits of @c outputs selected by @c mask into the direction register. */
  virtual int gpioDirMaskedWrite(uint32_t mask, uint32_t outputs) = 0;

  /** Attaches the given expansion board. */
  virtual int expansionAttach(ExpansionBoard board) = 0;
  /** Selects the XB-200 filter bank of the given direction. */
  virtual int xb200SetFilterbank(Direction dir, Xb200Filter filter) = 0;
  /** Reads the XB-200 filter bank of the given direction. */
  virtual int xb200GetFilterbank(Direction dir, Xb200Filter &filter) = 0;
  /** Selects the XB-200 signal path of the given direction. */
  virtual int xb200SetPath(Direction dir, Xb200Path path) = 0;
  /** Reads the XB-200 signal path of the given direction. */
  virtual int xb200GetPath(Direction dir, Xb200Path &path) = 0;

private:
  /** Drivers are not copyable. */
  Driver(const Driver &other);
  /** Drivers are not copyable. */
  Driver &operator=(const Driver &other);
};

}

#endif // __BRF_DRIVER_HH__

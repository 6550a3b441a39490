#ifndef __BRF_SYNCSTREAM_HH__
#define __BRF_SYNCSTREAM_HH__

#include <vector>
#include <utility>

#include "driver.hh"
#include "device.hh"
#include "deviceref.hh"
#include "layout.hh"
#include "streamconfig.hh"
#include "traits.hh"
#include "exception.hh"
#include "logger.hh"

namespace brf {

/** An active sync stream configuration of one direction on one device.
 *
 * The stream is a typed handle to the hardware configuration: The direction descriptor
 * @c Dir (@c Inbound or @c Outbound) selects the driver calls, @c Scalar the sample type
 * the hardware is configured for, @c Dev the device variant and @c Ref how the device is held
 * (@c Borrowed or @c Shared). As long as the stream exists, the hardware is configured for
 * exactly these parameters, hence samples of any other type can not be transferred.
 *
 * Constructing a stream (@c configure) configures the hardware, the channels are still
 * disabled. Use @c enable and @c disable to (re-) start or stop the transfer.
 * Destroying the stream disables both channels of the direction. To change the sample type or
 * layout, use @c reconfigure, which tears down the current stream before the new configuration
 * is written.
 *
 * Configuring a stream is a trusted operation: The caller must ensure that there is no other
 * stream of the same direction on the same device. A second configuration would change the
 * sample size of the first stream behind its back.
 *
 * @code
 * brf::BladeRF2 dev(brf::BladeRFDriver::open());
 * brf::RxSyncStream<std::complex<int16_t>, brf::BladeRF2> rx =
 *     brf::RxSyncStream<std::complex<int16_t>, brf::BladeRF2>::configure(
 *       dev, brf::StreamConfig(), brf::DualChannel());
 * rx.enable();
 * std::vector< std::complex<int16_t> > buffer(2*4096);
 * rx.read(buffer, 1000);
 * @endcode */
template <class Dir, class Scalar, class Dev, class Ref=Borrowed<Dev> >
class SyncStream
{
public:
  /** The layout type accepted by the device variant. */
  typedef typename DeviceTraits<Dev>::Layout Layout;
  /** The device reference type. */
  typedef Ref DeviceRef;
  /** The sample format traits. */
  typedef FormatTraits<Scalar> Format;
  /** Pointer to the samples being transferred, const for outbound streams. */
  typedef typename Dir::template Pointer<Scalar> SamplePointer;

  // Streams of other sample types are created by reconfigure
  template <class D2, class S2, class Dv2, class R2> friend class SyncStream;

public:
  /** Configures the hardware for a stream of this type.
   *
   * The caller must ensure that no other stream of the same direction exists on the device.
   * @throws ConfigError if the configuration is invalid or rejected by the driver. */
  static SyncStream configure(Ref device, const StreamConfig &config,
                              const Layout &layout=Layout())
  {
    return SyncStream(std::move(device), config, layout);
  }

  /** Move constructor, the other stream is left released. */
  SyncStream(SyncStream &&other)
    : _device(std::move(other._device)), _config(other._config), _layout(other._layout),
      _enabled(other._enabled)
  {
    // pass...
  }

  /** Move assignment. Tears down the stream held so far (if any) and takes over the other
   * stream. If both streams use the same device, the direction is already configured for the
   * other stream and is not torn down. Prefer @c reconfigure to replace a stream. */
  SyncStream &operator= (SyncStream &&other) {
    if (this == &other) { return *this; }
    if (_device.get() && (_device.get() != other._device.get())) { teardown(*_device.get()); }
    _device  = std::move(other._device);
    _config  = other._config;
    _layout  = other._layout;
    _enabled = other._enabled;
    return *this;
  }

  /** Destructor, disables both channels of the direction. Errors are logged and ignored. */
  ~SyncStream() {
    if (_device.get()) { teardown(*_device.get()); }
  }

  /** Returns @c false if the stream was moved away or reconfigured. */
  inline bool isValid() const { return 0 != _device.get(); }
  /** Returns the device. */
  inline Dev &device() const { return *checked(); }
  /** Returns the device reference. */
  inline const Ref &deviceRef() const { return _device; }
  /** Returns the stream configuration. */
  inline const StreamConfig &config() const { return _config; }
  /** Returns the channel layout. */
  inline const Layout &layout() const { return _layout; }
  /** Returns @c true if the channels were enabled by this stream. */
  inline bool isEnabled() const { return _enabled; }
  /** Returns the number of interleaved channels. */
  inline size_t numChannels() const { return numLayoutChannels(_layout); }

  /** Transfers exactly @c num_samples samples (blocking). For dual channel layouts the samples
   * of both channels are interleaved.
   * @throws TimeoutError if the transfer did not complete within @c timeout_ms.
   * @throws TransferError on any other failure. */
  void transfer(SamplePointer samples, size_t num_samples, unsigned int timeout_ms) const {
    Dev *dev = checked();
    int err = Dir::transfer(dev->driver(), samples, num_samples, timeout_ms);
    if (STATUS_OK == err) { return; }
    if (STATUS_TIMEOUT == err) {
      TimeoutError ex(err);
      ex << Dir::name() << " transfer of " << num_samples << " samples timed out after "
         << timeout_ms << "ms.";
      throw ex;
    }
    TransferError ex(err);
    ex << Dir::name() << " transfer of " << num_samples << " samples failed: "
       << dev->driver().statusString(err);
    throw ex;
  }

  /** Receives exactly @c num_samples samples into @c samples. Inbound streams only. */
  void read(Scalar *samples, size_t num_samples, unsigned int timeout_ms) const {
    static_assert(DIRECTION_RX == Dir::direction, "read() needs an inbound stream.");
    transfer(samples, num_samples, timeout_ms);
  }
  /** Fills the given buffer. Inbound streams only. */
  void read(std::vector<Scalar> &buffer, unsigned int timeout_ms) const {
    static_assert(DIRECTION_RX == Dir::direction, "read() needs an inbound stream.");
    transfer(buffer.data(), buffer.size(), timeout_ms);
  }

  /** Transmits exactly @c num_samples samples from @c samples. Outbound streams only. */
  void write(const Scalar *samples, size_t num_samples, unsigned int timeout_ms) const {
    static_assert(DIRECTION_TX == Dir::direction, "write() needs an outbound stream.");
    transfer(samples, num_samples, timeout_ms);
  }
  /** Transmits the given buffer. Outbound streams only. */
  void write(const std::vector<Scalar> &buffer, unsigned int timeout_ms) const {
    static_assert(DIRECTION_TX == Dir::direction, "write() needs an outbound stream.");
    transfer(buffer.data(), buffer.size(), timeout_ms);
  }

  /** Re-applies the stream configuration (disabling a channel drops it) and enables the
   * channel(s) of the layout, channel 0 first.
   * @throws ConfigError if the configuration is rejected.
   * @throws EnableError naming the failing channel. Channels enabled before remain enabled,
   *         call @c disable to get back into a clean state. */
  void enable() {
    Dev *dev = checked();
    apply(*dev);
    size_t n = numLayoutChannels(_layout);
    ChannelIndex first = firstLayoutChannel(_layout);
    for (size_t i=0; i<n; i++) {
      Channel ch = channel(Dir::direction, ChannelIndex(first+i));
      int err = dev->driver().enableModule(ch, true);
      if (STATUS_OK != err) {
        EnableError ex(ch, err);
        ex << "Can not enable channel " << channelName(ch) << ": "
           << dev->driver().statusString(err);
        throw ex;
      }
      _enabled = true;
    }
    LogMessage msg(LOG_DEBUG);
    msg << "Enabled " << Dir::name() << " stream (" << n << " channel(s)).";
    Logger::get().log(msg);
  }

  /** Disables the channel(s) of the layout, channel 0 first.
   * @throws DisableError naming the failing channel. */
  void disable() {
    Dev *dev = checked();
    size_t n = numLayoutChannels(_layout);
    ChannelIndex first = firstLayoutChannel(_layout);
    for (size_t i=0; i<n; i++) {
      Channel ch = channel(Dir::direction, ChannelIndex(first+i));
      int err = dev->driver().enableModule(ch, false);
      if (STATUS_OK != err) {
        DisableError ex(ch, err);
        ex << "Can not disable channel " << channelName(ch) << ": "
           << dev->driver().statusString(err);
        throw ex;
      }
    }
    _enabled = false;
    LogMessage msg(LOG_DEBUG);
    msg << "Disabled " << Dir::name() << " stream.";
    Logger::get().log(msg);
  }

  /** Tears this stream down and configures a stream of sample type @c NewScalar with the given
   * configuration and the current layout on the same device. Use it on an rvalue:
   * @code
   * brf::RxSyncStream<std::complex<int8_t>, brf::BladeRF1> rx8 =
   *   std::move(rx16).reconfigure< std::complex<int8_t> >(brf::StreamConfig());
   * @endcode */
  template <class NewScalar>
  SyncStream<Dir, NewScalar, Dev, Ref> reconfigure(const StreamConfig &config) && {
    Layout layout(_layout);
    return std::move(*this).template reconfigure<NewScalar>(config, layout);
  }

  /** Tears this stream down and configures a stream of sample type @c NewScalar with the given
   * configuration and layout on the same device. The teardown is complete before the new
   * configuration reaches the driver.
   * @throws ConfigError if the new configuration is rejected, the device is left with both
   *         channels of the direction disabled. */
  template <class NewScalar>
  SyncStream<Dir, NewScalar, Dev, Ref> reconfigure(const StreamConfig &config,
                                                   const Layout &layout) && {
    checked();
    Ref device(std::move(_device));
    _enabled = false;
    teardown(*device.get());
    LogMessage msg(LOG_DEBUG);
    msg << "Reconfigure " << Dir::name() << " stream.";
    Logger::get().log(msg);
    return SyncStream<Dir, NewScalar, Dev, Ref>(std::move(device), config, layout);
  }

protected:
  /** Hidden constructor, use @c configure. */
  SyncStream(Ref &&device, const StreamConfig &config, const Layout &layout)
    : _device(std::move(device)), _config(config), _layout(layout), _enabled(false)
  {
    Dev *dev = checked();
    if (! _config.isValid()) {
      ConfigError err(STATUS_INVAL);
      err << "Can not configure " << Dir::name() << " stream: Invalid configuration ("
          << _config << ").";
      throw err;
    }
    if ((firstLayoutChannel(_layout)+numLayoutChannels(_layout)) > DeviceTraits<Dev>::numChannels) {
      ConfigError err(STATUS_RANGE);
      err << "Can not configure " << Dir::name() << " stream: Channel "
          << firstLayoutChannel(_layout) << " not present on " << dev->boardName() << ".";
      throw err;
    }
    apply(*dev);
    LogMessage msg(LOG_DEBUG);
    msg << "Configured " << Dir::name() << " stream: " << numLayoutChannels(_layout)
        << " channel(s), " << _config << ".";
    Logger::get().log(msg);
  }

  /** Writes the sync configuration. */
  void apply(Dev &dev) const {
    int err = dev.driver().configureStream(
          Dir::direction, numLayoutChannels(_layout), Format::format, _config);
    if (STATUS_OK != err) {
      ConfigError ex(err);
      ex << "Can not configure " << Dir::name() << " stream: "
         << dev.driver().statusString(err);
      throw ex;
    }
  }

  /** Returns the device or throws a @c RuntimeError if the stream was released. */
  Dev *checked() const {
    Dev *dev = _device.get();
    if (0 == dev) {
      RuntimeError err;
      err << Dir::name() << " stream was released.";
      throw err;
    }
    return dev;
  }

  /** Disables both channels of the direction, even if not present on the device. Never
   * throws. */
  static void teardown(Dev &dev) {
    for (int i=0; i<2; i++) {
      Channel ch = channel(Dir::direction, ChannelIndex(i));
      try {
        int err = dev.driver().enableModule(ch, false);
        if (STATUS_OK != err) {
          LogMessage msg(LOG_DEBUG);
          msg << "Ignore failure to disable " << channelName(ch) << " on release: "
              << dev.driver().statusString(err);
          Logger::get().log(msg);
        }
      } catch (std::exception &) {
        // release continues with the next channel
      }
    }
  }

protected:
  /** The device. */
  Ref _device;
  /** The stream configuration. */
  StreamConfig _config;
  /** The channel layout. */
  Layout _layout;
  /** If @c true, the channels were enabled. */
  bool _enabled;
};

}

#endif // __BRF_SYNCSTREAM_HH__

#ifndef __BRF_TEST_MOCKDRIVER_HH__
#define __BRF_TEST_MOCKDRIVER_HH__

#include "driver.hh"
#include "gpio.hh"
#include <vector>
#include <map>
#include <string>
#include <pthread.h>

/** A driver simulating the bladeRF registers and sync interface in memory.
 *
 * Every call is recorded in the call log (e.g. "configure RX 2 SC16_Q11", "enable TX0",
 * "disable RX1", "rx 4096"), failures can be injected for calls starting with a given prefix.
 * Like the real hardware, disabling a channel drops the sync configuration of its direction, a
 * transfer on an unconfigured direction fails with @c STATUS_INVAL.
 *
 * A failure injected for "board name" makes @c boardName throw a @c DriverError.
 *
 * The mock is owned by the device, keep the raw pointer to inspect it. */
class MockDriver: public brf::Driver
{
public:
  /** Constructor.
   * @param board The board name reported, "bladerf1" or "bladerf2".
   * @param destroyed If given, set to @c true when the driver is destroyed. */
  MockDriver(const std::string &board="bladerf2", bool *destroyed=0);
  virtual ~MockDriver();

  /** Makes every call starting with @c prefix fail with @c status. */
  void fail(const std::string &prefix, int status);
  /** Removes all injected failures. */
  void clearFailures();

  /** Returns a copy of the call log. */
  std::vector<std::string> calls() const;
  /** Returns the position of the first call equal to @c call in the log, or -1. */
  int indexOf(const std::string &call) const;
  /** Returns the position of the last call equal to @c call in the log, or -1. */
  int lastIndexOf(const std::string &call) const;
  /** Returns the number of calls equal to @c call. */
  size_t count(const std::string &call) const;
  /** Clears the call log. */
  void clearCalls();

  bool isConfigured(brf::Direction dir) const;
  size_t configuredChannels(brf::Direction dir) const;
  brf::SampleFormat configuredFormat(brf::Direction dir) const;
  bool isEnabled(brf::Channel ch) const;
  /** Returns the total number of transmitted samples. */
  size_t transmitted() const;

  inline uint32_t gpioRegister() const { return _gpio; }
  inline void setGpioRegister(uint32_t value) { _gpio = value; }
  inline uint32_t gpioDirRegister() const { return _gpioDir; }
  inline void setGpioDirRegister(uint32_t value) { _gpioDir = value; }
  inline brf::ExpansionBoard attached() const { return _attached; }

  virtual std::string boardName();
  virtual std::string statusString(int status);
  virtual int configureStream(brf::Direction dir, size_t num_channels, brf::SampleFormat format,
                              const brf::StreamConfig &config);
  virtual int syncRX(void *samples, size_t num_samples, unsigned int timeout_ms);
  virtual int syncTX(const void *samples, size_t num_samples, unsigned int timeout_ms);
  virtual int enableModule(brf::Channel ch, bool enable);
  virtual int gpioRead(uint32_t &value);
  virtual int gpioMaskedWrite(uint32_t mask, uint32_t value);
  virtual int gpioDirRead(uint32_t &outputs);
  virtual int gpioDirMaskedWrite(uint32_t mask, uint32_t outputs);
  virtual int expansionAttach(brf::ExpansionBoard board);
  virtual int xb200SetFilterbank(brf::Direction dir, brf::Xb200Filter filter);
  virtual int xb200GetFilterbank(brf::Direction dir, brf::Xb200Filter &filter);
  virtual int xb200SetPath(brf::Direction dir, brf::Xb200Path path);
  virtual int xb200GetPath(brf::Direction dir, brf::Xb200Path &path);

protected:
  /** Records the call and returns the injected status (if any). Lock must be held. */
  int record(const std::string &call);
  /** Number of channels per direction of the simulated board. */
  size_t boardChannels() const;

protected:
  std::string _board;
  bool *_destroyed;
  mutable pthread_mutex_t _lock;
  std::vector<std::string> _calls;
  std::map<std::string, int> _failures;
  bool _configured[2];
  size_t _numChannels[2];
  brf::SampleFormat _format[2];
  bool _enabled[4];
  size_t _transmitted;
  uint32_t _gpio;
  uint32_t _gpioDir;
  brf::ExpansionBoard _attached;
  brf::Xb200Filter _filter[2];
  brf::Xb200Path _path[2];
};


/** Hands out the undirected pins 1-32 of a device, one handle per pin. */
class MockPinSet
{
public:
  /** Constructor. */
  explicit MockPinSet(brf::Device &device);

  /** Takes the given pin (1-32) out of the set. A pin taken before is returned released. */
  brf::UndirectedPin take(unsigned pin);

  /** Creates a single pin with the given number, which may be out of range. */
  static brf::UndirectedPin create(unsigned pin, brf::Device &device);

protected:
  std::vector<brf::UndirectedPin> _pins;
};

#endif // __BRF_TEST_MOCKDRIVER_HH__

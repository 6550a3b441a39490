#ifndef __BRF_STREAMCONFIG_HH__
#define __BRF_STREAMCONFIG_HH__

#include <cstddef>
#include <iostream>

namespace brf {

/** Configuration of the sync interface of one direction: the number of transfer buffers, the
 * buffer size in samples, the number of in-flight transfers and the timeout for each transfer.
 *
 * The configuration is a value object, a stream keeps a copy of the configuration it was
 * constructed with and reuses it whenever it gets re-enabled. */
class StreamConfig
{
public:
  /** Constructor, the defaults are reasonable values for most sample rates. */
  StreamConfig(size_t numBuffers=16, size_t bufferSize=8192, size_t numTransfers=8,
               unsigned int timeout=3500);
  /** Copy constructor. */
  StreamConfig(const StreamConfig &other);

  /** Assignment operator. */
  const StreamConfig &operator= (const StreamConfig &other);
  /** Comparison operator. */
  bool operator== (const StreamConfig &other) const;
  /** Comparison operator. */
  inline bool operator!= (const StreamConfig &other) const { return !(*this == other); }

  /** Returns the number of buffers. */
  inline size_t numBuffers() const { return _numBuffers; }
  /** Returns the size of each buffer in samples, must be a multiple of 1024. */
  inline size_t bufferSize() const { return _bufferSize; }
  /** Returns the number of active USB transfers, must be less than the number of buffers. */
  inline size_t numTransfers() const { return _numTransfers; }
  /** Returns the timeout of the transfers in ms. */
  inline unsigned int timeout() const { return _timeout; }

  /** Returns @c true if the configuration satisfies the constraints of the sync interface. */
  bool isValid() const;

protected:
  /** The number of buffers. */
  size_t _numBuffers;
  /** The buffer size in samples. */
  size_t _bufferSize;
  /** The number of in-flight transfers. */
  size_t _numTransfers;
  /** The transfer timeout in ms. */
  unsigned int _timeout;
};

/** Serialization of a stream configuration. */
std::ostream &operator<< (std::ostream &stream, const StreamConfig &config);

}

#endif // __BRF_STREAMCONFIG_HH__

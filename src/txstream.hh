#ifndef __BRF_TXSTREAM_HH__
#define __BRF_TXSTREAM_HH__

#include "syncstream.hh"

namespace brf {

/** Direction descriptor of transmit streams. */
class Outbound
{
public:
  /** The direction. */
  static const Direction direction = DIRECTION_TX;
  /** Samples are transmitted from a constant buffer. */
  template <class Scalar> using Pointer = const Scalar *;

  /** Returns the name of the direction. */
  static inline const char *name() { return "TX"; }
  /** Transmits the samples. */
  static inline int transfer(Driver &driver, const void *samples, size_t num_samples,
                             unsigned int timeout_ms) {
    return driver.syncTX(samples, num_samples, timeout_ms);
  }
};

/** A transmit stream on an exclusively borrowed device. */
template <class Scalar, class Dev>
using TxSyncStream = SyncStream<Outbound, Scalar, Dev, Borrowed<Dev> >;

/** A transmit stream on a reference counted device. */
template <class Scalar, class Dev>
using SharedTxSyncStream = SyncStream<Outbound, Scalar, Dev, Shared<Dev> >;

}

#endif // __BRF_TXSTREAM_HH__

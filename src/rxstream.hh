#ifndef __BRF_RXSTREAM_HH__
#define __BRF_RXSTREAM_HH__

#include "syncstream.hh"

namespace brf {

/** Direction descriptor of receive streams. */
class Inbound
{
public:
  /** The direction. */
  static const Direction direction = DIRECTION_RX;
  /** Samples are received into a mutable buffer. */
  template <class Scalar> using Pointer = Scalar *;

  /** Returns the name of the direction. */
  static inline const char *name() { return "RX"; }
  /** Receives the samples. */
  static inline int transfer(Driver &driver, void *samples, size_t num_samples,
                             unsigned int timeout_ms) {
    return driver.syncRX(samples, num_samples, timeout_ms);
  }
};

/** A receive stream on an exclusively borrowed device. */
template <class Scalar, class Dev>
using RxSyncStream = SyncStream<Inbound, Scalar, Dev, Borrowed<Dev> >;

/** A receive stream on a reference counted device. */
template <class Scalar, class Dev>
using SharedRxSyncStream = SyncStream<Inbound, Scalar, Dev, Shared<Dev> >;

}

#endif // __BRF_RXSTREAM_HH__

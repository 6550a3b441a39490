#ifndef __BRF_LAYOUT_HH__
#define __BRF_LAYOUT_HH__

#include "driver.hh"

namespace brf {

/** A single channel layout, only the selected channel of a direction is streamed. */
class SingleChannel
{
public:
  /** Constructor. */
  SingleChannel(ChannelIndex index=CHANNEL_0): _index(index) { }

  /** Returns the selected channel index. */
  inline ChannelIndex index() const { return _index; }
  /** Returns the physical channel in the given direction. */
  inline Channel channel(Direction dir) const { return brf::channel(dir, _index); }

  /** Comparison. */
  inline bool operator== (const SingleChannel &other) const { return _index == other._index; }

protected:
  /** The channel index. */
  ChannelIndex _index;
};


/** A dual channel (MIMO) layout, both channels of a direction are streamed with interleaved
 * samples. */
class DualChannel
{
public:
  /** Comparison. */
  inline bool operator== (const DualChannel &) const { return true; }
};


/** Either a @c SingleChannel or a @c DualChannel layout.
 *
 * Device variants supporting MIMO accept this type, hence both layouts implicitly. Single
 * channel variants only accept @c SingleChannel, a @c DualChannel does not convert into it. */
class ChannelLayout
{
public:
  /** Constructs a single channel layout. */
  ChannelLayout(const SingleChannel &single=SingleChannel())
    : _dual(false), _index(single.index()) { }
  /** Constructs a dual channel layout. */
  ChannelLayout(const DualChannel &)
    : _dual(true), _index(CHANNEL_0) { }

  /** Returns @c true for a dual channel layout. */
  inline bool isDual() const { return _dual; }
  /** Returns the channel index of a single channel layout. */
  inline ChannelIndex index() const { return _index; }
  /** Returns the number of streamed channels. */
  inline size_t numChannels() const { return _dual ? 2 : 1; }

  /** Comparison. */
  inline bool operator== (const ChannelLayout &other) const {
    return (_dual == other._dual) && (_dual || (_index == other._index));
  }

protected:
  /** If @c true, both channels are used. */
  bool _dual;
  /** The channel index if @c _dual is false. */
  ChannelIndex _index;
};

}

#endif // __BRF_LAYOUT_HH__

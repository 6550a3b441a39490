#ifndef __BRF_TRAITS_HH__
#define __BRF_TRAITS_HH__

#include <inttypes.h>
#include <complex>
#include "driver.hh"
#include "layout.hh"
#include "device.hh"

namespace brf {

/** Forward declaration of the sample format traits.
 * For each sample type supported by the sync interface, @c std::complex<int16_t> and
 * @c std::complex<int8_t>, the FormatTraits template provides the @c Scalar type (the template
 * argument type), its real type, the scale mapping the interval [-1,1] to the values of the
 * sample type and the @c SampleFormat the stream gets configured with. There is no definition
 * for any other type, hence streams of unsupported sample types do not compile. */
template <class Scalar> class FormatTraits;

/** Sample format traits for the 16bit I/Q format, 12 significant bits (Q11). */
template <>
class FormatTraits< std::complex<int16_t> > {
public:
  /** The scalar type. */
  typedef std::complex<int16_t> Scalar;
  /** The real scalar type. */
  typedef int16_t RScalar;
  /** The scaling factor from floating point to integer. */
  const static float scale;
  /** The format of the sync interface. */
  const static SampleFormat format = FORMAT_SC16_Q11;
};

/** Sample format traits for the 8bit I/Q format (Q7). */
template <>
class FormatTraits< std::complex<int8_t> > {
public:
  /** The scalar type. */
  typedef std::complex<int8_t> Scalar;
  /** The real scalar type. */
  typedef int8_t RScalar;
  /** The scaling factor from floating point to integer. */
  const static float scale;
  /** The format of the sync interface. */
  const static SampleFormat format = FORMAT_SC8_Q7;
};


/** Forward declaration of the device capability traits.
 * For each device variant, the DeviceTraits template provides the @c Layout type accepted when
 * a stream gets configured and the number of channels per direction. Single channel variants
 * use @c SingleChannel as the layout type, therefore passing a @c DualChannel layout to them
 * is a compile time error. */
template <class Dev> class DeviceTraits;

/** Capabilities of the bladeRF 1. */
template <>
class DeviceTraits<BladeRF1> {
public:
  /** The accepted channel layout. */
  typedef SingleChannel Layout;
  /** The number of channels per direction. */
  const static size_t numChannels = 1;
};

/** Capabilities of the bladeRF 2.0 micro. */
template <>
class DeviceTraits<BladeRF2> {
public:
  /** The accepted channel layout. */
  typedef ChannelLayout Layout;
  /** The number of channels per direction. */
  const static size_t numChannels = 2;
};

/** Capabilities of a bladeRF of unknown variant. The driver rejects layouts the actual
 * hardware does not support. */
template <>
class DeviceTraits<BladeRFAny> {
public:
  /** The accepted channel layout. */
  typedef ChannelLayout Layout;
  /** The number of channels per direction. */
  const static size_t numChannels = 2;
};


/** Returns the number of channels streamed by the given layout. */
inline size_t numLayoutChannels(const SingleChannel &) { return 1; }
/** Returns the number of channels streamed by the given layout. */
inline size_t numLayoutChannels(const ChannelLayout &layout) { return layout.numChannels(); }

/** Returns the index of the first channel streamed by the given layout. */
inline ChannelIndex firstLayoutChannel(const SingleChannel &layout) { return layout.index(); }
/** Returns the index of the first channel streamed by the given layout. */
inline ChannelIndex firstLayoutChannel(const ChannelLayout &layout) {
  return layout.isDual() ? CHANNEL_0 : layout.index();
}

}

#endif // __BRF_TRAITS_HH__

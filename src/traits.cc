#include "traits.hh"

using namespace brf;


const float FormatTraits< std::complex<int16_t> >::scale = 2048;
const float FormatTraits< std::complex<int8_t> >::scale = 128;

const SampleFormat FormatTraits< std::complex<int16_t> >::format;
const SampleFormat FormatTraits< std::complex<int8_t> >::format;

const size_t DeviceTraits<BladeRF1>::numChannels;
const size_t DeviceTraits<BladeRF2>::numChannels;
const size_t DeviceTraits<BladeRFAny>::numChannels;

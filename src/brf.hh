/** @mainpage A C++ control layer for the bladeRF software defined radio.
 *
 * libbrf wraps the stream and expansion GPIO interfaces of the bladeRF into typed handles. The
 * type of a handle reflects the state of the hardware resource it controls, hence operations
 * that are not valid in that state do not compile:
 *
 * - A @c brf::SyncStream exists only while the hardware is configured for it. Its sample type is
 *   a template argument, samples of any other type can not be transferred. A bladeRF 1 stream
 *   does not accept a dual channel layout.
 * - A @c brf::GpioPin is either undirected, an input or an output. Only input pins can be read,
 *   only output pins can be written.
 *
 * The hardware itself is accessed through a @c brf::Driver, the library provides
 * @c brf::BladeRFDriver using libbladeRF.
 *
 * \section intro A practical introduction
 * The following example receives samples from the first channel of a bladeRF 2.0 micro.
 * \code
 * #include <libbrf/brf.hh>
 *
 * int main(int argc, char *argv[]) {
 *   // Show debug messages
 *   brf::Logger::get().addHandler(new brf::StreamLogHandler(std::cerr, brf::LOG_DEBUG));
 *
 *   // Open the first device found
 *   brf::BladeRF2 dev(brf::BladeRFDriver::open());
 *
 *   // Configure the RX sync interface for 16bit I/Q samples on channel 0
 *   typedef brf::RxSyncStream<std::complex<int16_t>, brf::BladeRF2> Stream;
 *   Stream rx = Stream::configure(dev, brf::StreamConfig(), brf::SingleChannel(brf::CHANNEL_0));
 *   rx.enable();
 *
 *   // Receive some samples
 *   std::vector< std::complex<int16_t> > buffer(4096);
 *   rx.read(buffer, 1000);
 *
 *   // done, the stream gets disabled when it goes out of scope.
 *   return 0;
 * }
 * \endcode
 *
 * To switch to another sample type, the stream is reconfigured. This destroys the current stream
 * before the new configuration is written:
 * \code
 * typedef brf::RxSyncStream<std::complex<int8_t>, brf::BladeRF2> Stream8;
 * Stream8 rx8 = std::move(rx).reconfigure< std::complex<int8_t> >(brf::StreamConfig());
 * \endcode
 *
 * Receiving and transmitting at the same time requires one stream per direction, usually in
 * separate threads. In this case, share the device with a @c std::shared_ptr and use
 * @c brf::SharedRxSyncStream and @c brf::SharedTxSyncStream.
 *
 * The expansion GPIOs of an XB-200 are obtained from the board:
 * \code
 * brf::BladeRF1 dev(brf::BladeRFDriver::open());
 * brf::Xb200 xb200(dev);
 * brf::Xb200Pins pins = xb200.takePins();
 * brf::OutputPin out = std::move(pins.j16_1).asOutput();
 * brf::InputPin in = std::move(pins.j16_2).asInput();
 * out.write(in.read());
 * \endcode
 */

#ifndef __BRF_HH__
#define __BRF_HH__

#include "config.hh"
#include "exception.hh"
#include "logger.hh"
#include "options.hh"

#include "driver.hh"
#include "device.hh"
#include "deviceref.hh"
#include "layout.hh"
#include "streamconfig.hh"
#include "traits.hh"
#include "syncstream.hh"
#include "rxstream.hh"
#include "txstream.hh"
#include "gpio.hh"
#include "xb200.hh"

#ifdef BRF_WITH_BLADERF
#include "bladerfdriver.hh"
#endif

#endif // __BRF_HH__

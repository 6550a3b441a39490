#include "traitstest.hh"
#include "brf.hh"
#include <type_traits>
#include <utility>

using namespace brf;

typedef std::complex<int16_t> CI16;
typedef std::complex<int8_t> CI8;


/** Tells if @c Stream::configure accepts a layout of type @c L. */
template <class Stream, class L>
class AcceptsLayout
{
protected:
  template <class S>
  static char test(decltype(S::configure(std::declval<typename S::DeviceRef>(),
                                         std::declval<const StreamConfig &>(),
                                         std::declval<L>())) *);
  template <class S>
  static long test(...);

public:
  static const bool value = (sizeof(char) == sizeof(test<Stream>(0)));
};


// A dual channel layout must not compile for the bladeRF 1
static_assert(! std::is_convertible<DualChannel, DeviceTraits<BladeRF1>::Layout>::value,
              "DualChannel accepted by bladeRF 1");
static_assert(std::is_convertible<SingleChannel, DeviceTraits<BladeRF1>::Layout>::value,
              "SingleChannel rejected by bladeRF 1");
static_assert(std::is_convertible<DualChannel, DeviceTraits<BladeRF2>::Layout>::value,
              "DualChannel rejected by bladeRF 2");
static_assert(std::is_convertible<SingleChannel, DeviceTraits<BladeRF2>::Layout>::value,
              "SingleChannel rejected by bladeRF 2");

static_assert(! AcceptsLayout<RxSyncStream<CI16, BladeRF1>, DualChannel>::value,
              "RX stream on bladeRF 1 accepts DualChannel");
static_assert(! AcceptsLayout<TxSyncStream<CI8, BladeRF1>, DualChannel>::value,
              "TX stream on bladeRF 1 accepts DualChannel");
static_assert(! AcceptsLayout<SharedRxSyncStream<CI16, BladeRF1>, DualChannel>::value,
              "Shared RX stream on bladeRF 1 accepts DualChannel");
static_assert(AcceptsLayout<RxSyncStream<CI16, BladeRF1>, SingleChannel>::value,
              "RX stream on bladeRF 1 rejects SingleChannel");
static_assert(AcceptsLayout<RxSyncStream<CI16, BladeRF2>, DualChannel>::value,
              "RX stream on bladeRF 2 rejects DualChannel");
static_assert(AcceptsLayout<TxSyncStream<CI16, BladeRFAny>, DualChannel>::value,
              "TX stream on any bladeRF rejects DualChannel");

// Streams are handles, never copies
static_assert(! std::is_copy_constructible< RxSyncStream<CI16, BladeRF2> >::value,
              "Streams must not be copyable");
static_assert(std::is_move_constructible< RxSyncStream<CI16, BladeRF2> >::value,
              "Streams must be movable");
static_assert(! std::is_copy_constructible<OutputPin>::value, "Pins must not be copyable");

// Pins come from the pin set of an expansion board only
static_assert(! std::is_constructible<UndirectedPin, unsigned, Device &>::value,
              "Undirected pins can be created outside of a pin set");
static_assert(! std::is_constructible<Xb200Pins, BladeRF1 &>::value,
              "XB-200 pin set can be created without the board");
static_assert(! std::is_constructible<OutputPin, unsigned, Device *>::value,
              "Output pins can be created without conversion");


TraitsTest::~TraitsTest() { /* pass... */ }


void
TraitsTest::testLayoutCapability() {
  UT_ASSERT_FALSE((std::is_convertible<DualChannel, DeviceTraits<BladeRF1>::Layout>::value));
  UT_ASSERT((std::is_convertible<DualChannel, DeviceTraits<BladeRFAny>::Layout>::value));
  UT_ASSERT_FALSE((AcceptsLayout<TxSyncStream<CI16, BladeRF1>, DualChannel>::value));
  UT_ASSERT((AcceptsLayout<TxSyncStream<CI16, BladeRF2>, ChannelLayout>::value));
}


void
TraitsTest::testFormatTraits() {
  static_assert(FORMAT_SC16_Q11 == FormatTraits<CI16>::format, "Wrong format");
  static_assert(FORMAT_SC8_Q7 == FormatTraits<CI8>::format, "Wrong format");
  static_assert(std::is_same<FormatTraits<CI16>::RScalar, int16_t>::value, "Wrong real type");
  static_assert(std::is_same<FormatTraits<CI8>::RScalar, int8_t>::value, "Wrong real type");
  static_assert(2*sizeof(int16_t) == sizeof(CI16), "Samples must be packed I/Q pairs");
  static_assert(2*sizeof(int8_t) == sizeof(CI8), "Samples must be packed I/Q pairs");

  UT_ASSERT_NEAR(FormatTraits<CI16>::scale, 2048.f);
  UT_ASSERT_NEAR(FormatTraits<CI8>::scale, 128.f);
}


void
TraitsTest::testDeviceTraits() {
  UT_ASSERT_EQUAL(DeviceTraits<BladeRF1>::numChannels, size_t(1));
  UT_ASSERT_EQUAL(DeviceTraits<BladeRF2>::numChannels, size_t(2));
  UT_ASSERT_EQUAL(DeviceTraits<BladeRFAny>::numChannels, size_t(2));
  UT_ASSERT((std::is_same<DeviceTraits<BladeRF1>::Layout, SingleChannel>::value));
  UT_ASSERT((std::is_same<DeviceTraits<BladeRF2>::Layout, ChannelLayout>::value));
}


void
TraitsTest::testLayouts() {
  SingleChannel single(CHANNEL_1);
  UT_ASSERT_EQUAL(single.index(), CHANNEL_1);
  UT_ASSERT_EQUAL(single.channel(DIRECTION_RX), CHANNEL_RX1);
  UT_ASSERT_EQUAL(single.channel(DIRECTION_TX), CHANNEL_TX1);
  UT_ASSERT_EQUAL(numLayoutChannels(single), size_t(1));
  UT_ASSERT_EQUAL(firstLayoutChannel(single), CHANNEL_1);

  ChannelLayout defaults;
  UT_ASSERT_FALSE(defaults.isDual());
  UT_ASSERT_EQUAL(defaults.index(), CHANNEL_0);

  ChannelLayout from_single(single);
  UT_ASSERT_FALSE(from_single.isDual());
  UT_ASSERT_EQUAL(from_single.numChannels(), size_t(1));
  UT_ASSERT_EQUAL(firstLayoutChannel(from_single), CHANNEL_1);

  ChannelLayout dual((DualChannel()));
  UT_ASSERT(dual.isDual());
  UT_ASSERT_EQUAL(numLayoutChannels(dual), size_t(2));
  UT_ASSERT_EQUAL(firstLayoutChannel(dual), CHANNEL_0);

  UT_ASSERT(dual == ChannelLayout(DualChannel()));
  UT_ASSERT_FALSE(dual == from_single);
  UT_ASSERT_FALSE(from_single == defaults);
}


void
TraitsTest::testChannels() {
  UT_ASSERT_EQUAL(channel(DIRECTION_RX, CHANNEL_0), CHANNEL_RX0);
  UT_ASSERT_EQUAL(channel(DIRECTION_TX, CHANNEL_0), CHANNEL_TX0);
  UT_ASSERT_EQUAL(channel(DIRECTION_RX, CHANNEL_1), CHANNEL_RX1);
  UT_ASSERT_EQUAL(channel(DIRECTION_TX, CHANNEL_1), CHANNEL_TX1);
  UT_ASSERT(std::string("TX1") == channelName(CHANNEL_TX1));
}


void
TraitsTest::testStreamConfig() {
  StreamConfig defaults;
  UT_ASSERT(defaults.isValid());
  UT_ASSERT_EQUAL(defaults.numBuffers(), size_t(16));
  UT_ASSERT_EQUAL(defaults.bufferSize(), size_t(8192));
  UT_ASSERT_EQUAL(defaults.numTransfers(), size_t(8));
  UT_ASSERT_EQUAL(defaults.timeout(), 3500u);

  UT_ASSERT(StreamConfig(2, 1024, 1).isValid());
  UT_ASSERT_FALSE(StreamConfig(16, 0, 8).isValid());
  UT_ASSERT_FALSE(StreamConfig(16, 1000, 8).isValid());
  UT_ASSERT_FALSE(StreamConfig(0, 8192, 0).isValid());
  UT_ASSERT_FALSE(StreamConfig(16, 8192, 0).isValid());
  UT_ASSERT_FALSE(StreamConfig(16, 8192, 16).isValid());

  StreamConfig copy(defaults);
  UT_ASSERT(copy == defaults);
  copy = StreamConfig(32, 4096, 16, 100);
  UT_ASSERT(copy != defaults);
  UT_ASSERT_EQUAL(copy.timeout(), 100u);
}



UnitTest::TestSuite *
TraitsTest::suite() {
  UnitTest::TestSuite *suite = new UnitTest::TestSuite("Traits and layouts");

  suite->addTest(new UnitTest::TestCaller<TraitsTest>(
                   "layout capability", &TraitsTest::testLayoutCapability));
  suite->addTest(new UnitTest::TestCaller<TraitsTest>(
                   "format traits", &TraitsTest::testFormatTraits));
  suite->addTest(new UnitTest::TestCaller<TraitsTest>(
                   "device traits", &TraitsTest::testDeviceTraits));
  suite->addTest(new UnitTest::TestCaller<TraitsTest>(
                   "layouts", &TraitsTest::testLayouts));
  suite->addTest(new UnitTest::TestCaller<TraitsTest>(
                   "channels", &TraitsTest::testChannels));
  suite->addTest(new UnitTest::TestCaller<TraitsTest>(
                   "stream config", &TraitsTest::testStreamConfig));

  return suite;
}

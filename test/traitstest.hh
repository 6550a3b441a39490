#ifndef __BRF_TEST_TRAITSTEST_HH__
#define __BRF_TEST_TRAITSTEST_HH__

#include "unittest.hh"

class TraitsTest : public UnitTest::TestCase
{
public:
  virtual ~TraitsTest();

  void testLayoutCapability();
  void testFormatTraits();
  void testDeviceTraits();
  void testLayouts();
  void testChannels();
  void testStreamConfig();

public:
  static UnitTest::TestSuite *suite();
};

#endif // __BRF_TEST_TRAITSTEST_HH__

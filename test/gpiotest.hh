#ifndef __BRF_TEST_GPIOTEST_HH__
#define __BRF_TEST_GPIOTEST_HH__

#include "unittest.hh"

class GpioTest : public UnitTest::TestCase
{
public:
  virtual ~GpioTest();

  void testBitmask();
  void testPinRange();
  void testOutputWrite();
  void testInputRead();
  void testMaskedWrites();
  void testConversionConsumes();
  void testDirectionFailure();
  void testReadFailure();

public:
  static UnitTest::TestSuite *suite();
};

#endif // __BRF_TEST_GPIOTEST_HH__

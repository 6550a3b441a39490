#ifndef __BRF_TEST_XB200TEST_HH__
#define __BRF_TEST_XB200TEST_HH__

#include "unittest.hh"

class Xb200Test : public UnitTest::TestCase
{
public:
  virtual ~Xb200Test();

  void testBoardMismatch();
  void testBoardNameFailure();
  void testAnyVariant();
  void testAttach();
  void testAttachFailure();
  void testFilterbankAndPath();
  void testPins();
  void testPinsTakenOnce();

public:
  static UnitTest::TestSuite *suite();
};

#endif // __BRF_TEST_XB200TEST_HH__

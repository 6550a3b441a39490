#ifndef __BRF_TEST_STREAMTEST_HH__
#define __BRF_TEST_STREAMTEST_HH__

#include "unittest.hh"
#include "logger.hh"

class StreamTest : public UnitTest::TestCase
{
public:
  virtual ~StreamTest();

  virtual void setUp();
  virtual void tearDown();

  void testReceiveAfterDisable();
  void testConfigureWritesConfig();
  void testTransmit();
  void testSingleChannelSelection();
  void testReconfigureTearsDownFirst();
  void testReconfigureSwitchesChannel();
  void testReconfigureShared();
  void testReconfigureRejected();
  void testDualEnablePartialFailure();
  void testDualDisablePartialFailure();
  void testReleaseIgnoresErrors();
  void testReleaseSingleChannelBoard();
  void testSharedOwnership();
  void testConcurrentRxTx();
  void testMove();
  void testMoveAssignSameDevice();
  void testInvalidConfig();
  void testDriverRejectsConfig();
  void testTransferErrors();
  void testChannelOutOfRange();

public:
  static UnitTest::TestSuite *suite();

protected:
  brf::MemoryLogHandler *_log;
};

#endif // __BRF_TEST_STREAMTEST_HH__

#include "loggertest.hh"
#include "mockdriver.hh"
#include "brf.hh"
#include <stdexcept>
#include <pthread.h>

using namespace brf;

typedef RxSyncStream<std::complex<int16_t>, BladeRF2> Rx16;


/** Throws for the first @c failures messages. */
class FailingLogHandler: public LogHandler
{
public:
  FailingLogHandler(size_t failures)
    : LogHandler(), _failures(failures), _handled(0)
  {
    // pass...
  }

  virtual void handle(const LogMessage &msg) {
    _handled++;
    if (_failures > 0) {
      _failures--;
      throw std::runtime_error("log sink full");
    }
  }

  inline size_t handled() const { return _handled; }

protected:
  size_t _failures;
  size_t _handled;
};


LoggerTest::~LoggerTest() { /* pass... */ }

void
LoggerTest::setUp() {
  _handler = 0;
}

void
LoggerTest::tearDown() {
  if (_handler) {
    Logger::get().removeHandler(_handler);
    delete _handler;
    _handler = 0;
  }
}


void
LoggerTest::testHandlerThrows() {
  FailingLogHandler *handler = new FailingLogHandler(1);
  _handler = handler;
  Logger::get().addHandler(handler);

  LogMessage msg(LOG_INFO, "first");
  UT_ASSERT_THROW(Logger::get().log(msg), std::runtime_error);
  // the logger is still usable
  Logger::get().log(msg);
  UT_ASSERT_EQUAL(handler->handled(), size_t(2));

  MemoryLogHandler *memory = new MemoryLogHandler(LOG_DEBUG);
  Logger::get().addHandler(memory);
  LogMessage second(LOG_INFO, "second");
  Logger::get().log(second);
  Logger::get().removeHandler(memory);
  UT_ASSERT(memory->contains("second"));
  delete memory;
}


void
LoggerTest::testReleaseWithFailingHandler() {
  MockDriver *driver = new MockDriver("bladerf2");
  BladeRF2 dev(driver);
  FailingLogHandler *handler = new FailingLogHandler(100);
  _handler = handler;

  {
    Rx16 rx = Rx16::configure(dev, StreamConfig(), DualChannel());
    rx.enable();
    driver->fail("disable", STATUS_IO);
    Logger::get().addHandler(handler);
  }

  // both channels were released, the failing log calls were dropped
  UT_ASSERT_EQUAL(driver->count("disable RX0"), size_t(1));
  UT_ASSERT_EQUAL(driver->count("disable RX1"), size_t(1));
  UT_ASSERT_EQUAL(handler->handled(), size_t(2));
  driver->clearFailures();
}


static void *
logThread(void *arg) {
  for (int i=0; i<100; i++) {
    LogMessage msg(LOG_DEBUG, "worker");
    Logger::get().log(msg);
  }
  return 0;
}

void
LoggerTest::testConcurrentLogging() {
  MemoryLogHandler *memory = new MemoryLogHandler(LOG_DEBUG);
  _handler = memory;
  Logger::get().addHandler(memory);

  pthread_t threads[4];
  for (int i=0; i<4; i++) {
    UT_ASSERT_EQUAL(pthread_create(&threads[i], 0, logThread, 0), 0);
  }
  for (int i=0; i<4; i++) {
    pthread_join(threads[i], 0);
  }
  UT_ASSERT_EQUAL(memory->messages().size(), size_t(400));
}



UnitTest::TestSuite *
LoggerTest::suite() {
  UnitTest::TestSuite *suite = new UnitTest::TestSuite("Logger");

  suite->addTest(new UnitTest::TestCaller<LoggerTest>(
                   "throwing handler", &LoggerTest::testHandlerThrows));
  suite->addTest(new UnitTest::TestCaller<LoggerTest>(
                   "release with failing handler", &LoggerTest::testReleaseWithFailingHandler));
  suite->addTest(new UnitTest::TestCaller<LoggerTest>(
                   "concurrent logging", &LoggerTest::testConcurrentLogging));

  return suite;
}

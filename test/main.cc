#include "unittest.hh"
#include "traitstest.hh"
#include "streamtest.hh"
#include "gpiotest.hh"
#include "xb200test.hh"
#include "optionstest.hh"
#include "loggertest.hh"
#include <iostream>


int main(int argc, char *argv[]) {

  UnitTest::TestRunner runner(std::cout);

  runner.addSuite(TraitsTest::suite());
  runner.addSuite(StreamTest::suite());
  runner.addSuite(GpioTest::suite());
  runner.addSuite(Xb200Test::suite());
  runner.addSuite(OptionsTest::suite());
  runner.addSuite(LoggerTest::suite());

  size_t failed = runner();

  return (0 == failed) ? 0 : 1;
}

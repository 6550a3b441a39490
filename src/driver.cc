#include "driver.hh"
#include <sstream>

using namespace brf;


const char *
brf::channelName(Channel ch) {
  switch (ch) {
  case CHANNEL_RX0: return "RX0";
  case CHANNEL_TX0: return "TX0";
  case CHANNEL_RX1: return "RX1";
  case CHANNEL_TX1: return "TX1";
  }
  return "unknown";
}


/* ********************************************************************************************* *
 * Driver
 * ********************************************************************************************* */
Driver::Driver() {
  // pass...
}

Driver::~Driver() {
  // pass...
}

std::string
Driver::statusString(int status) {
  switch (status) {
  case STATUS_OK: return "Success";
  case STATUS_UNEXPECTED: return "An unexpected error occurred";
  case STATUS_RANGE: return "Provided parameter was out of the allowable range";
  case STATUS_INVAL: return "Invalid operation or parameter";
  case STATUS_MEM: return "A memory allocation error occurred";
  case STATUS_IO: return "File or device I/O failure";
  case STATUS_TIMEOUT: return "Operation timed out";
  case STATUS_NODEV: return "No devices available";
  case STATUS_UNSUPPORTED: return "Operation not supported";
  }
  std::stringstream str; str << "Unknown error code " << status;
  return str.str();
}

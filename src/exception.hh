#ifndef __BRF_EXCEPTION_HH__
#define __BRF_EXCEPTION_HH__

#include <exception>
#include <sstream>

#include "driver.hh"

namespace brf {

/** Base class of all bladeRF exceptions. The message is assembled using the stream operators,
 * the optional status code is the one returned by the @c Driver. */
class Error : public std::exception, public std::stringstream {
public:
  /** Constructor. */
  Error(int code=0): std::exception(), std::stringstream(), _code(code) { }
  /** Copy constructor. */
  Error(const Error &other)
    : std::exception(), std::stringstream(), _code(other._code) { this->str(other.str()); }
  /** Destructor. */
  virtual ~Error() throw() { }
  /** Implements the @c std::exception interface. */
  virtual const char *what() const throw() {
    _what = this->str(); return _what.c_str();
  }
  /** Returns the driver status code or 0 if the error did not originate from the driver. */
  inline int code() const { return _code; }

protected:
  /** The driver status. */
  int _code;
  /** Keeps the message returned by @c what alive. */
  mutable std::string _what;
};


/** The configuration error class. Thrown whenever a stream, pin or board can not be set up. */
class ConfigError : public Error {
public:
  /** Constructor. */
  ConfigError(int code=0): Error(code) {}
  /** Copy constructor. */
  ConfigError(const ConfigError &other): Error(other) {}
  /** Destructor. */
  virtual ~ConfigError() throw() { }
};


/** The runtime error class. */
class RuntimeError: public Error {
public:
  /** Constructor. */
  RuntimeError(): Error() {}
  /** Copy constructor. */
  RuntimeError(const RuntimeError &other): Error(other) {}
  /** Destructor. */
  virtual ~RuntimeError() throw() { }
};


/** A generic failure reported by the driver. */
class DriverError: public Error {
public:
  /** Constructor. */
  DriverError(int code): Error(code) {}
  /** Copy constructor. */
  DriverError(const DriverError &other): Error(other) {}
  /** Destructor. */
  virtual ~DriverError() throw() { }
};


/** A failed sample transfer. The caller may retry. */
class TransferError: public DriverError {
public:
  /** Constructor. */
  TransferError(int code): DriverError(code) {}
  /** Copy constructor. */
  TransferError(const TransferError &other): DriverError(other) {}
  /** Destructor. */
  virtual ~TransferError() throw() { }
};


/** A sample transfer that did not complete within the timeout. */
class TimeoutError: public TransferError {
public:
  /** Constructor. */
  TimeoutError(int code): TransferError(code) {}
  /** Copy constructor. */
  TimeoutError(const TimeoutError &other): TransferError(other) {}
  /** Destructor. */
  virtual ~TimeoutError() throw() { }
};


/** Enabling a channel failed. On dual channel layouts, channels enabled before @c channel
 * remain enabled. */
class EnableError: public DriverError {
public:
  /** Constructor. */
  EnableError(Channel channel, int code): DriverError(code), _channel(channel) {}
  /** Copy constructor. */
  EnableError(const EnableError &other): DriverError(other), _channel(other._channel) {}
  /** Destructor. */
  virtual ~EnableError() throw() { }
  /** The channel that failed. */
  inline Channel channel() const { return _channel; }

protected:
  /** The failing channel. */
  Channel _channel;
};


/** Disabling a channel failed. On dual channel layouts, channels disabled before @c channel
 * remain disabled. */
class DisableError: public DriverError {
public:
  /** Constructor. */
  DisableError(Channel channel, int code): DriverError(code), _channel(channel) {}
  /** Copy constructor. */
  DisableError(const DisableError &other): DriverError(other), _channel(other._channel) {}
  /** Destructor. */
  virtual ~DisableError() throw() { }
  /** The channel that failed. */
  inline Channel channel() const { return _channel; }

protected:
  /** The failing channel. */
  Channel _channel;
};

}
#endif // __BRF_EXCEPTION_HH__

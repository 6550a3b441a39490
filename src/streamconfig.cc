#include "streamconfig.hh"

using namespace brf;


/* ********************************************************************************************* *
 * Implementation of StreamConfig
 * ********************************************************************************************* */
StreamConfig::StreamConfig(size_t numBuffers, size_t bufferSize, size_t numTransfers,
                           unsigned int timeout)
  : _numBuffers(numBuffers), _bufferSize(bufferSize), _numTransfers(numTransfers),
    _timeout(timeout)
{
  // pass...
}

StreamConfig::StreamConfig(const StreamConfig &other)
  : _numBuffers(other._numBuffers), _bufferSize(other._bufferSize),
    _numTransfers(other._numTransfers), _timeout(other._timeout)
{
  // pass...
}

const StreamConfig &
StreamConfig::operator =(const StreamConfig &other) {
  _numBuffers   = other._numBuffers;
  _bufferSize   = other._bufferSize;
  _numTransfers = other._numTransfers;
  _timeout      = other._timeout;
  return *this;
}

bool
StreamConfig::operator ==(const StreamConfig &other) const {
  return (_numBuffers == other._numBuffers) && (_bufferSize == other._bufferSize) &&
      (_numTransfers == other._numTransfers) && (_timeout == other._timeout);
}

bool
StreamConfig::isValid() const {
  // The sync interface transfers whole USB packets of 1024 samples
  if ((0 == _bufferSize) || (0 != (_bufferSize % 1024))) { return false; }
  if (0 == _numBuffers) { return false; }
  // at least one buffer must be available to the user while the others are in flight
  if ((0 == _numTransfers) || (_numTransfers >= _numBuffers)) { return false; }
  return true;
}


std::ostream &
brf::operator<< (std::ostream &stream, const StreamConfig &config) {
  stream << "buffers=" << config.numBuffers() << ", buffer size=" << config.bufferSize()
         << ", transfers=" << config.numTransfers() << ", timeout=" << config.timeout() << "ms";
  return stream;
}

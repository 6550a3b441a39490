#include "logger.hh"

using namespace brf;


const char *
brf::logLevelName(LogLevel level) {
  switch (level) {
  case LOG_DEBUG: return "DEBUG";
  case LOG_INFO: return "INFO";
  case LOG_WARNING: return "WARN";
  case LOG_ERROR: return "ERROR";
  }
  return "";
}


/* ********************************************************************************************* *
 * LogMessage
 * ********************************************************************************************* */
LogMessage::LogMessage(LogLevel level, const std::string &msg)
  : std::stringstream(), _level(level)
{
  (*this) << msg;
}

LogMessage::LogMessage(const LogMessage &other)
  : std::stringstream(), _level(other._level)
{
  (*this) << other.message();
}

LogMessage::~LogMessage() {
  // pass...
}

LogLevel
LogMessage::level() const {
  return _level;
}


/* ********************************************************************************************* *
 * LogHandler
 * ********************************************************************************************* */
LogHandler::LogHandler() {
  // pass...
}

LogHandler::~LogHandler() {
  // pass...
}


/* ********************************************************************************************* *
 * StreamLogHandler
 * ********************************************************************************************* */
StreamLogHandler::StreamLogHandler(std::ostream &stream, LogLevel level)
  : LogHandler(), _stream(stream), _level(level)
{
  // pass...
}

StreamLogHandler::~StreamLogHandler() {
  // pass...
}

void
StreamLogHandler::handle(const LogMessage &msg) {
  if (msg.level() < _level) { return; }
  _stream << logLevelName(msg.level()) << ": " << msg.message() << std::endl;
}


/* ********************************************************************************************* *
 * MemoryLogHandler
 * ********************************************************************************************* */
MemoryLogHandler::MemoryLogHandler(LogLevel level)
  : LogHandler(), _level(level), _messages()
{
  // pass...
}

MemoryLogHandler::~MemoryLogHandler() {
  // pass...
}

void
MemoryLogHandler::handle(const LogMessage &msg) {
  if (msg.level() < _level) { return; }
  _messages.push_back(Entry(msg.level(), msg.message()));
}

bool
MemoryLogHandler::contains(const std::string &text) const {
  std::list<Entry>::const_iterator item = _messages.begin();
  for (; item != _messages.end(); item++) {
    if (std::string::npos != item->second.find(text)) { return true; }
  }
  return false;
}

void
MemoryLogHandler::clear() {
  _messages.clear();
}


/* ********************************************************************************************* *
 * Logger
 * ********************************************************************************************* */
/** Keeps the logger mutex locked within a scope. */
class LoggerLock
{
public:
  LoggerLock(pthread_mutex_t &lock): _lock(lock) { pthread_mutex_lock(&_lock); }
  ~LoggerLock() { pthread_mutex_unlock(&_lock); }

protected:
  pthread_mutex_t &_lock;
};

Logger *Logger::_instance = 0;
pthread_once_t Logger::_once = PTHREAD_ONCE_INIT;

Logger::Logger()
  : _handler()
{
  pthread_mutex_init(&_lock, 0);
}

Logger::~Logger() {
  std::list<LogHandler *>::iterator item = _handler.begin();
  for (; item != _handler.end(); item++) {
    delete (*item);
  }
  _handler.clear();
  pthread_mutex_destroy(&_lock);
}

void
Logger::createInstance() {
  _instance = new Logger();
}

Logger &
Logger::get() {
  pthread_once(&_once, &Logger::createInstance);
  return *_instance;
}

void
Logger::addHandler(LogHandler *handler) {
  LoggerLock lock(_lock);
  _handler.push_back(handler);
}

void
Logger::removeHandler(LogHandler *handler) {
  LoggerLock lock(_lock);
  _handler.remove(handler);
}

void
Logger::log(const LogMessage &message) {
  LoggerLock lock(_lock);
  std::list<LogHandler *>::iterator item = _handler.begin();
  for (; item != _handler.end(); item++) {
    (*item)->handle(message);
  }
}

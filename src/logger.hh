#ifndef __BRF_LOGGER_HH__
#define __BRF_LOGGER_HH__

#include <string>
#include <sstream>
#include <list>
#include <pthread.h>


namespace brf {

/** Specifies the possible log-level. */
typedef enum {
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARNING,
  LOG_ERROR
} LogLevel;

/** Returns the name of the log-level. */
const char *logLevelName(LogLevel level);


/** A log message. */
class LogMessage: public std::stringstream
{
public:
  /** Constructor.
   * @param level Specified the log-level of the message.
   * @param msg   An optional message. */
  LogMessage(LogLevel level, const std::string &msg="");
  /** Copy constructor. */
  LogMessage(const LogMessage &other);
  /** Destructor. */
  virtual ~LogMessage();

  /** Returns the level of the message. */
  LogLevel level() const;
  /** Returns the message. */
  inline std::string message() const { return this->str(); }

protected:
  /** The level of the message. */
  LogLevel _level;
};


/** Base class of all log message handlers. */
class LogHandler
{
protected:
  /** Hidden constructor. */
  LogHandler();

public:
  /** Destructor. */
  virtual ~LogHandler();
  /** Needs to be implemented by sub-classes to handle log messages. */
  virtual void handle(const LogMessage &msg) = 0;
};


/** Serializes log message into the specified stream. */
class StreamLogHandler: public LogHandler
{
public:
  /** Constructor.
   * @param stream Specifies the stream, the messages are serialized into.
   * @param level Specifies the minimum log level of the messages being serialized.
   */
  StreamLogHandler(std::ostream &stream, LogLevel level);
  /** Destructor. */
  virtual ~StreamLogHandler();
  /** Handles the message. */
  virtual void handle(const LogMessage &msg);

protected:
  /** The output stream. */
  std::ostream &_stream;
  /** The minimum log-level. */
  LogLevel _level;
};


/** Keeps the log messages in memory. */
class MemoryLogHandler: public LogHandler
{
public:
  /** A stored message. */
  typedef std::pair<LogLevel, std::string> Entry;

public:
  /** Constructor.
   * @param level Specifies the minimum log level of the messages being kept. */
  MemoryLogHandler(LogLevel level=LOG_DEBUG);
  /** Destructor. */
  virtual ~MemoryLogHandler();
  /** Stores the message. */
  virtual void handle(const LogMessage &msg);

  /** Returns the stored messages. */
  inline const std::list<Entry> &messages() const { return _messages; }
  /** Returns @c true if any stored message contains @c text. */
  bool contains(const std::string &text) const;
  /** Drops all stored messages. */
  void clear();

protected:
  /** The minimum log-level. */
  LogLevel _level;
  /** The stored messages. */
  std::list<Entry> _messages;
};


/** The logger class (singleton). Messages may be logged from any thread, the handlers are
 * called with the logger lock held. An exception thrown by a handler is passed to the caller
 * of @c log, the lock is released. */
class Logger
{
protected:
  /** Hidden constructor. Use @c get to obtain an instance. */
  Logger();

public:
  /** Destructor. */
  virtual ~Logger();

  /** Returns the singleton instance of the logger. */
  static Logger &get();

  /** Logs a message. */
  void log(const LogMessage &message);
  /** Adds a message handler. The ownership of the hander is transferred to the logger
   *  instance. */
  void addHandler(LogHandler *handler);
  /** Removes the given handler, the ownership is transferred back to the caller. */
  void removeHandler(LogHandler *handler);

protected:
  /** Creates the singleton instance, called once. */
  static void createInstance();

protected:
  /** The singleton instance. */
  static Logger *_instance;
  /** Guards the creation of the instance. */
  static pthread_once_t _once;
  /** All registered handlers. */
  std::list<LogHandler *> _handler;
  /** Serializes access to the handlers. */
  pthread_mutex_t _lock;
};

}

#endif // __BRF_LOGGER_HH__

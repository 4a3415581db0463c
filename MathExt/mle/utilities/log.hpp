/*
 Copyright (C) 2016 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file mle/utilities/log.hpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#pragma once

// accepted log levels, the mask is the bitwise or of the levels that are written
#define MLE_ALERT 1    // 00000001   1 = 2^0
#define MLE_CRITICAL 2 // 00000010   2 = 2^1
#define MLE_ERROR 4    // 00000100   4 = 2^2
#define MLE_WARNING 8  // 00001000   8 = 2^3
#define MLE_NOTICE 16  // 00010000  16 = 2^4
#define MLE_DEBUG 32   // 00100000  32 = 2^5
#define MLE_DATA 64    // 01000000  64 = 2^6

#include <map>
#include <queue>
#include <sstream>
#include <string>

#include <ql/patterns/singleton.hpp>
#include <ql/shared_ptr.hpp>

#include <boost/thread/lock_types.hpp>
#include <boost/thread/shared_mutex.hpp>

namespace MathExt {

//! The Base Custom Log Handler class
/*!
  This base log handler class can be used to define your own custom handler and then registered with the Log class.
  Once registered it will receive all log messages as soon as they occur via it's log() method
  \ingroup utilities
  \see Log
 */
class Logger {
public:
    //! Destructor
    virtual ~Logger() {}

    //! The Log call back function
    /*!
      This function will be called every time a log message is produced.
      \param level the log level
      \param log the actual log message
     */
    virtual void log(unsigned level, const std::string& log) = 0;

    //! Returns the Logger name
    const std::string& name() const { return name_; }

protected:
    //! Constructor
    /*!
      Implementations must provide a logger name
      \param name the logger name
     */
    Logger(const std::string& name) : name_(name) {}

private:
    std::string name_;
};

//! Stderr Logger
/*!
  This logger writes each log message out to stderr (std::cerr)
  \ingroup utilities
  \see Log
 */
class StderrLogger : public Logger {
public:
    //! the name "StderrLogger"
    static const std::string name;
    //! Constructor
    StderrLogger() : Logger(name) {}
    //! The log callback that writes to stderr
    virtual void log(unsigned, const std::string&) override;
};

//! BufferLogger
/*!
  This logger stores each log message in an internal buffer, it can then be probed for log messages at a later point.
  Log messages are always returned in a FIFO order.

  Typical usage to display log messages would be
  <pre>
      while (bLogger.hasNext()) {
          MsgBox("Log Message", bLogger.next());
      }
  </pre>
  \ingroup utilities
  \see Log
 */
class BufferLogger : public Logger {
public:
    //! the name "BufferLogger"
    static const std::string name;
    //! Constructor, messages with a level above minLevel are not buffered
    BufferLogger(unsigned minLevel = MLE_DATA) : Logger(name), minLevel_(minLevel) {}
    //! The log callback
    virtual void log(unsigned level, const std::string& log) override;

    //! Checks if Logger has new messages
    /*!
      \return True if this BufferLogger has any new log messages
     */
    bool hasNext();

    //! Retrieve new messages
    /*!
      Retrieve the next new message from the buffer, this will throw if the buffer is empty.
      \return The next message
     */
    std::string next();

private:
    std::queue<std::string> buffer_;
    unsigned minLevel_;
};

//! Global static Log class
/*!
  The Global Log class gets registered with individual loggers and receives application log messages.
  Once a message is received, it is immediately dispatched to each of the registered loggers, the order in which
  the loggers are called is not guaranteed.

  Logging is done by the calling thread and the LOG call blocks until all the loggers have returned.

  At start up, the Log class has no loggers and so will ignore any LOG() messages until it is configured.

  To configure the Log class to log to stderr, one can do:
  <pre>
  Log::instance().registerLogger(QuantLib::ext::make_shared<StderrLogger>());
  Log::instance().switchOn();
  </pre>

  \ingroup utilities
 */
class Log : public QuantLib::Singleton<Log, std::integral_constant<bool, true>> {

    friend class QuantLib::Singleton<Log, std::integral_constant<bool, true>>;

public:
    //! Add a new Logger.
    /*! Adding a new logger will fail if one with the same name is already registered. */
    void registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger);
    //! Check if logger exists
    bool hasLogger(const std::string& name) const;
    //! Retrieve a Logger.
    /*! Retrieve a Logger by its name, this will fail if no Logger with that name is registered. */
    QuantLib::ext::shared_ptr<Logger> logger(const std::string& name) const;
    //! Remove a Logger
    /*! Remove a logger by its name, this will fail if no Logger with that name is registered. */
    void removeLogger(const std::string& name);
    //! Remove all loggers
    void removeAllLoggers();

    //! macro utility function - do not use directly
    void header(unsigned m, const char* filename, int lineNo);
    //! macro utility function - do not use directly
    std::ostream& logStream() { return ls_; }
    //! macro utility function - do not use directly
    void log(unsigned m);

    //! mutex serialising the macro calls
    boost::shared_mutex& mutex() { return mutex_; }

    // Avoid a large number of warnings in VS by adding 0 !=
    bool filter(unsigned mask) {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return enabled_ && 0 != (mask & mask_);
    }
    unsigned mask() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return mask_;
    }
    void setMask(unsigned mask) {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        mask_ = mask;
    }

    bool enabled() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return enabled_;
    }
    void switchOn() {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        enabled_ = true;
    }
    void switchOff() {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        enabled_ = false;
    }

private:
    Log();

    std::map<std::string, QuantLib::ext::shared_ptr<Logger>> loggers_;
    bool enabled_;
    unsigned mask_;
    std::ostringstream ls_;

    mutable boost::shared_mutex mutex_;
};

//! Main Logging macro, do not use this directly, use on of the below 7 macros instead
#define MLOG(mask, text)                                                                                               \
    {                                                                                                                  \
        if (MathExt::Log::instance().filter(mask)) {                                                                   \
            std::ostringstream __mle_mlog_tmp_stringstream__;                                                          \
            __mle_mlog_tmp_stringstream__ << text;                                                                     \
            boost::unique_lock<boost::shared_mutex> lock(MathExt::Log::instance().mutex());                            \
            MathExt::Log::instance().header(mask, __FILE__, __LINE__);                                                 \
            MathExt::Log::instance().logStream() << __mle_mlog_tmp_stringstream__.str();                               \
            MathExt::Log::instance().log(mask);                                                                        \
        }                                                                                                              \
    }

//! Logging Macro (Level = Alert)
#define ALOG(text) MLOG(MLE_ALERT, text);
//! Logging Macro (Level = Critical)
#define CLOG(text) MLOG(MLE_CRITICAL, text);
//! Logging Macro (Level = Error)
#define ELOG(text) MLOG(MLE_ERROR, text);
//! Logging Macro (Level = Warning)
#define WLOG(text) MLOG(MLE_WARNING, text);
//! Logging Macro (Level = Notice)
#define LOG(text) MLOG(MLE_NOTICE, text);
//! Logging Macro (Level = Debug)
#define DLOG(text) MLOG(MLE_DEBUG, text);
//! Logging Macro (Level = Data)
#define TLOG(text) MLOG(MLE_DATA, text);

} // namespace MathExt

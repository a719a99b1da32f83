/*
 Copyright (C) 2025 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of CIE, a free-software/open-source library
 for transparent calculation of interest on insolvency claims

 CIE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to claim review and calculation standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file cied/utilities/log.hpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#pragma once

// accumulate 'filename' + 'line number' in a log message
#define CIE_ALERT 1    // 00000001   1 = 2^1-1
#define CIE_CRITICAL 2 // 00000010   2 = 2^2-1
#define CIE_ERROR 4    // 00000100   4
#define CIE_WARNING 8  // 00001000   8
#define CIE_NOTICE 16  // 00010000  16
#define CIE_DEBUG 32   // 00100000  32
#define CIE_DATA 64    // 01000000  64

#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <ql/patterns/singleton.hpp>
#include <ql/shared_ptr.hpp>

#include <boost/thread/shared_mutex.hpp>

namespace cie {
namespace data {

//! The Base Custom Log class
/*!
  This class is a base class for all logger implementations, loggers are registered with the Log
  singleton and receive every message that passes the Log mask.
  \ingroup utilities
  \see Log
 */
class Logger {
public:
    //! Destructor
    virtual ~Logger() {}

    //! The Log call back function
    /*!
      This function will be called by the Log class for each log message, the logger must
      handle the message itself
     */
    virtual void log(unsigned, const std::string&) = 0;

    //! Returns the Logger name
    const std::string& name() { return name_; }

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
    /*!
      This logger writes all logs to stderr.
      If alertOnly is set to true, it will only write alerts.
     */
    StderrLogger(bool alertOnly = false) : Logger(name), alertOnly_(alertOnly) {}
    //! Destructor
    virtual ~StderrLogger() {}
    //! The log callback that writes to stderr
    virtual void log(unsigned l, const std::string& s) override {
        if (!alertOnly_ || l == CIE_ALERT)
            std::cerr << s << std::endl;
    }

private:
    bool alertOnly_;
};

//! FileLogger
/*!
  This logger writes each log message out to the given file.
  The file is flushed, but not closed, after each log message.
  \ingroup utilities
  \see Log
 */
class FileLogger : public Logger {
public:
    //! the name "FileLogger"
    static const std::string name;
    //! Constructor
    /*!
      Construct a file logger using the given filename, this filename is passed to std::fostream::open()
      and this constructor will throw an exception if the file is not opened (e.g. if the filename is invalid)
      \param filename the log filename
     */
    FileLogger(const std::string& filename);
    //! Destructor
    virtual ~FileLogger();
    //! The log callback
    virtual void log(unsigned, const std::string&) override;

private:
    std::string filename_;
    std::fstream fout_;
};

//! BufferLogger
/*!
  This logger stores each log message in an internal buffer, it can then be probed for log messages at a later point.
  Log messages are always returned in FIFO order.

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
    //! Constructor
    BufferLogger(unsigned minLevel = CIE_DATA) : Logger(name), minLevel_(minLevel) {}
    //! The log callback
    virtual void log(unsigned, const std::string&) override;
    //! Checks if Logger has new messages
    /*!
      \return True if this BufferLogger has any new log messages
     */
    bool hasNext();
    //! Retrieve new messages
    /*!
      Retrieve the next new message from the buffer, this will throw if the buffer is empty.
      Messages are returned in FIFO order. Messages are deleted from the buffer once returned.
      \return The next message
     */
    std::string next();

private:
    std::vector<std::string> buffer_;
    unsigned minLevel_;
    std::size_t position_ = 0;
};

//! Global static Log class
/*!
  The Global Log class gets registered with individual loggers and receives application log messages.
  Once a message is received, it is immediately dispatched to each of the registered loggers, the order in which
  the loggers are called is not guaranteed.

  Logging is done by the calling thread and the LOG call blocks until all the loggers have returned.

  At start up, the Log class contains no loggers and so will ignore any log messages.

  The Log class is shared between concurrent calculations, so registering, removing and dispatching are guarded.
  \ingroup utilities
 */
class Log : public QuantLib::Singleton<Log, std::integral_constant<bool, true>> {

    friend class QuantLib::Singleton<Log, std::integral_constant<bool, true>>;

public:
    //! Add a new Logger.
    /*!
      Adds a new logger to the Log class, the logger will be stored by it's name in a map and will receive log
      messages from then on. A logger with the same name as one already registered replaces it.
     */
    void registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger);
    //! Check if logger exists
    bool hasLogger(const std::string& name) const;
    //! Retrieve a Logger.
    /*!
      Retrieve a Logger from the Log class, throws if the logger is not registered.
     */
    QuantLib::ext::shared_ptr<Logger>& logger(const std::string& name);
    //! Remove a Logger
    void removeLogger(const std::string& name);
    //! Remove all loggers
    void removeAllLoggers();

    //! macro utility function - do not use directly, not thread safe
    void header(unsigned m, const char* filename, int lineNo);
    //! macro utility function - do not use directly, not thread safe
    std::ostream& logStream() { return ls_; }
    //! macro utility function - do not use directly, not thread safe
    void log(unsigned m);

    //! mutex to acquire locks
    boost::shared_mutex& mutex() { return mutex_; }

    // Avoid a large number of warnings in VS by adding 0 !=
    bool filter(unsigned mask) {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return 0 != (mask & mask_);
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

/*!
  Main Logging macro, do not use this directly, use on of the below 6 macros instead
 */
#define MLOG(mask, text)                                                                                               \
    {                                                                                                                  \
        if (cie::data::Log::instance().enabled() && cie::data::Log::instance().filter(mask)) {                         \
            boost::unique_lock<boost::shared_mutex> lock(cie::data::Log::instance().mutex());                          \
            cie::data::Log::instance().header(mask, __FILE__, __LINE__);                                               \
            cie::data::Log::instance().logStream() << text;                                                            \
            cie::data::Log::instance().log(mask);                                                                      \
        }                                                                                                              \
    }

//! Logging Macro (Level = Alert)
#define ALOG(text) MLOG(CIE_ALERT, text);
//! Logging Macro (Level = Critical)
#define CLOG(text) MLOG(CIE_CRITICAL, text);
//! Logging Macro (Level = Error)
#define ELOG(text) MLOG(CIE_ERROR, text);
//! Logging Macro (Level = Warning)
#define WLOG(text) MLOG(CIE_WARNING, text);
//! Logging Macro (Level = Notice)
#define LOG(text) MLOG(CIE_NOTICE, text);
//! Logging Macro (Level = Debug)
#define DLOG(text) MLOG(CIE_DEBUG, text);
//! Logging Macro (Level = Data)
#define TLOG(text) MLOG(CIE_DATA, text);

//! Utility class for having structured Error messages
// This can be used directly in log messages, e.g.
// ALOG(StructuredMessage(StructuredMessage::Category::Error, StructuredMessage::Group::Request, "Missing term", ...));
// And in the log file you will get
//
// .... StructuredMessage { "category": "error", "group": "Request", "message": "Missing term", ... }
class StructuredMessage {
public:
    enum class Category { Error, Warning, Unknown };

    enum class Group { Request, RateTable, Calculation, Allocation, Report, Configuration, Unknown };

    StructuredMessage(const Category& category, const Group& group, const std::string& message,
                      const std::map<std::string, std::string>& subFields = std::map<std::string, std::string>());

    virtual ~StructuredMessage() {}

    static constexpr const char* name = "StructuredMessage";

    //! return a std::string for the log file
    std::string msg() const { return std::string(name) + std::string(" ") + json(); }

    //! write to the Log, errors at CIE_ERROR and warnings at CIE_WARNING
    void log() const;

    const Category& category() const { return category_; }
    const Group& group() const { return group_; }
    const std::string& message() const { return message_; }
    const std::map<std::string, std::string>& subFields() const { return subFields_; }

    //! return a JSON style std::string for the log file
    std::string json() const;

protected:
    Category category_;
    Group group_;
    std::string message_;
    std::map<std::string, std::string> subFields_;
};

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Category&);

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Group&);

std::ostream& operator<<(std::ostream& out, const StructuredMessage& sm);

} // namespace data
} // namespace cie

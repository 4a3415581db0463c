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

#include <mle/utilities/log.hpp>

#include <ql/errors.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <iomanip>
#include <iostream>

using namespace boost::posix_time;
using namespace std;

namespace MathExt {

const string StderrLogger::name = "StderrLogger";
const string BufferLogger::name = "BufferLogger";

void StderrLogger::log(unsigned, const string& msg) { std::cerr << msg << endl; }

void BufferLogger::log(unsigned level, const string& msg) {
    if (level <= minLevel_)
        buffer_.push(msg);
}

bool BufferLogger::hasNext() { return !buffer_.empty(); }

string BufferLogger::next() {
    QL_REQUIRE(!buffer_.empty(), "Log Buffer is empty");
    string msg = buffer_.front();
    buffer_.pop();
    return msg;
}

Log::Log() : loggers_(), enabled_(false), mask_(255), ls_() {
    ls_.setf(ios::fixed, ios::floatfield);
    ls_.setf(ios::showpoint);
}

void Log::registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    QL_REQUIRE(logger, "Log::registerLogger(): logger must not be null");
    QL_REQUIRE(loggers_.find(logger->name()) == loggers_.end(),
               "Logger with name " << logger->name() << " already registered");
    loggers_[logger->name()] = logger;
}

bool Log::hasLogger(const string& name) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return loggers_.find(name) != loggers_.end();
}

QuantLib::ext::shared_ptr<Logger> Log::logger(const string& name) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    QL_REQUIRE(it != loggers_.end(), "No logger found with name " << name);
    return it->second;
}

void Log::removeLogger(const string& name) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    QL_REQUIRE(it != loggers_.end(), "No logger found with name " << name);
    loggers_.erase(it);
}

void Log::removeAllLoggers() {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    loggers_.clear();
}

void Log::header(unsigned m, const char* filename, int lineNo) {
    // 1. Time stamp
    // Use boost::posix_time microsecond clock to get better precision (when available).
    // format is "2014-Apr-04 11:10:58.123456"
    ls_ << to_simple_string(microsec_clock::local_time());

    // 2. Level
    switch (m) {
    case MLE_ALERT:
        ls_ << " ALERT ";
        break;
    case MLE_CRITICAL:
        ls_ << " CRITICAL ";
        break;
    case MLE_ERROR:
        ls_ << " ERROR ";
        break;
    case MLE_WARNING:
        ls_ << " WARNING ";
        break;
    case MLE_NOTICE:
        ls_ << " NOTICE ";
        break;
    case MLE_DEBUG:
        ls_ << " DEBUG ";
        break;
    case MLE_DATA:
        ls_ << " DATA ";
        break;
    }

    // 3. source file, without the directory part
    string file(filename);
    string::size_type pos = file.find_last_of("/\\");
    if (pos != string::npos)
        file = file.substr(pos + 1);
    ls_ << "[" << file << ":" << lineNo << "] : ";
}

void Log::log(unsigned m) {
    string msg = ls_.str();
    for (auto& l : loggers_)
        l.second->log(m, msg);
    // clear the stream
    ls_.str(string());
    ls_.clear();
}

} // namespace MathExt

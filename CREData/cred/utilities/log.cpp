/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of CRE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 CRE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <cred/utilities/log.hpp>

#include <ql/errors.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>

using namespace boost::filesystem;
using std::string;

namespace cre {
namespace data {

const string StderrLogger::name = "StderrLogger";
const string FileLogger::name = "FileLogger";
const string BufferLogger::name = "BufferLogger";

FileLogger::FileLogger(const string& filename) : Logger(name), filename_(filename) {
    path p(filename_);
    if (p.has_parent_path() && !exists(p.parent_path()))
        create_directories(p.parent_path());
    fout_.open(filename.c_str(), std::ios_base::out);
    QL_REQUIRE(fout_.is_open(), "Error opening file " << filename);
    fout_.setf(std::ios::fixed, std::ios::floatfield);
    fout_.setf(std::ios::showpoint);
}

FileLogger::~FileLogger() {
    if (fout_.is_open())
        fout_.close();
}

void FileLogger::log(unsigned, const string& msg) {
    if (fout_.is_open())
        fout_ << msg << std::endl;
}

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
    ls_.setf(std::ios::fixed, std::ios::floatfield);
    ls_.setf(std::ios::showpoint);
}

void Log::registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    QL_REQUIRE(loggers_.find(logger->name()) == loggers_.end(),
               "Logger with name " << logger->name() << " already registered");
    loggers_[logger->name()] = logger;
}

bool Log::hasLogger(const string& name) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return loggers_.find(name) != loggers_.end();
}

QuantLib::ext::shared_ptr<Logger>& Log::logger(const string& name) {
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
    // 1. reset stringstream
    ls_.str(string());
    ls_.clear();

    // Write the time
    ls_ << boost::posix_time::to_simple_string(boost::posix_time::microsec_clock::local_time()) << " ";

    // Log level
    switch (m) {
    case CRE_ALERT:
        ls_ << "ALERT    ";
        break;
    case CRE_CRITICAL:
        ls_ << "CRITICAL ";
        break;
    case CRE_ERROR:
        ls_ << "ERROR    ";
        break;
    case CRE_WARNING:
        ls_ << "WARNING  ";
        break;
    case CRE_NOTICE:
        ls_ << "NOTICE   ";
        break;
    case CRE_DEBUG:
        ls_ << "DEBUG    ";
        break;
    case CRE_DATA:
        ls_ << "DATA     ";
        break;
    }

    // Filename & line no
    // format is " (file:line)"
    string filepath = path(filename).filename().string();
    string lineNoStr = std::to_string(lineNo);
    std::size_t len = filepath.size() + lineNoStr.size() + 3;
    ls_ << "(" << filepath << ':' << lineNoStr << ')';

    // Padding
    if (len < maxLen_)
        ls_ << string(maxLen_ - len, ' ');
    ls_ << " : ";
}

void Log::log(unsigned m) {
    string msg = ls_.str();
    for (auto& l : loggers_)
        l.second->log(m, msg);
}

StructuredMessage::StructuredMessage(const Category& category, const Group& group, const string& message,
                                     const std::map<string, string>& subFields)
    : category_(category), group_(group), message_(message), subFields_(subFields) {}

string StructuredMessage::json() const {
    std::ostringstream oss;
    oss << "{ \"category\":\"" << category_ << "\", \"group\":\"" << group_ << "\", \"message\":\""
        << jsonify(message_) << "\"";
    if (!subFields_.empty()) {
        oss << ", \"sub_fields\": [ ";
        bool first = true;
        for (const auto& kv : subFields_) {
            if (!first)
                oss << ", ";
            oss << "{ \"name\": \"" << kv.first << "\", \"value\": \"" << jsonify(kv.second) << "\" }";
            first = false;
        }
        oss << " ]";
    }
    oss << " }";
    return oss.str();
}

void StructuredMessage::log() const {
    if (category_ == Category::Error) {
        ALOG(StructuredMessage::name << " " << json());
    } else {
        WLOG(StructuredMessage::name << " " << json());
    }
}

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Category& category) {
    switch (category) {
    case StructuredMessage::Category::Error:
        return out << "Error";
    case StructuredMessage::Category::Warning:
        return out << "Warning";
    case StructuredMessage::Category::Unknown:
        return out << "UnknownType";
    default:
        QL_FAIL("Unknown StructuredMessage::Category");
    }
}

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Group& group) {
    switch (group) {
    case StructuredMessage::Group::Analytics:
        return out << "Analytics";
    case StructuredMessage::Group::Configuration:
        return out << "Configuration";
    case StructuredMessage::Group::MarketData:
        return out << "Market Data";
    case StructuredMessage::Group::Portfolio:
        return out << "Portfolio";
    case StructuredMessage::Group::Unknown:
        return out << "UnknownType";
    default:
        QL_FAIL("Unknown StructuredMessage::Group");
    }
}

string jsonify(const string& s) {
    string str;
    str.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '"':
            str += "\\\"";
            break;
        case '\\':
            str += "\\\\";
            break;
        case '\n':
            str += "\\n";
            break;
        case '\r':
            str += "\\r";
            break;
        case '\t':
            str += "\\t";
            break;
        default:
            str += c;
        }
    }
    return str;
}

} // namespace data
} // namespace cre

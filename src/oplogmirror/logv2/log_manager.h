/**
 *    Copyright (C) 2026-present MongoDB, Inc.
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the Server Side Public License, version 1,
 *    as published by MongoDB, Inc.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    Server Side Public License for more details.
 *
 *    You should have received a copy of the Server Side Public License
 *    along with this program. If not, see
 *    <http://www.mongodb.com/licensing/server-side-public-license>.
 *
 *    As a special exception, the copyright holders give permission to link the
 *    code of portions of this program with the OpenSSL library under certain
 *    conditions as described in each individual source file and distribute
 *    linked combinations including the program with the OpenSSL library. You
 *    must comply with the Server Side Public License in all respects for
 *    all of the code used other than as permitted herein. If you modify file(s)
 *    with this exception, you may extend this exception to your version of the
 *    file(s), but you are not obligated to do so. If you do not wish to do so,
 *    delete this exception statement from your version. If you delete this
 *    exception statement from all source files in the program, then also delete
 *    it in the license file.
 */

#pragma once

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/log/sinks/basic_sink_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/logger.hpp>
#include <boost/shared_ptr.hpp>

#include "oplogmirror/base/status.h"
#include "oplogmirror/base/string_data.h"
#include "oplogmirror/logv2/log_component.h"
#include "oplogmirror/logv2/log_severity.h"

namespace oplogmirror {
namespace logv2 {

/**
 * Sink backend that keeps formatted lines in memory, so tests can look at what was logged.
 */
class CaptureBackend
    : public boost::log::sinks::basic_formatted_sink_backend<char,
                                                              boost::log::sinks::synchronized_feeding> {
public:
    void consume(const boost::log::record_view& rec, const string_type& formattedMessage);

    std::vector<std::string> lines() const;

    void clear();

private:
    mutable std::mutex _mutex;
    std::vector<std::string> _lines;
};

/**
 * Container for the process's logging configuration: per-component minimum severities and the
 * boost::log sinks lines are written to.
 *
 * Every line goes to the console (std::clog) unless disabled, to the log file when one is
 * set up, and to the capture buffer while capturing.
 */
class LogManager {
public:
    static LogManager& global();

    LogManager();
    ~LogManager();

    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    /**
     * Returns true if a message of 'severity' for 'component' would be written. Components
     * without their own setting use the one of LogComponent::kDefault.
     */
    bool shouldLog(LogComponent component, LogSeverity severity) const;

    LogSeverity getMinimumLogSeverity(LogComponent component) const;

    void setMinimumLoggedSeverity(LogComponent component, LogSeverity severity);

    /**
     * Makes 'component' inherit the severity of LogComponent::kDefault again.
     */
    void clearMinimumLoggedSeverity(LogComponent component);

    /**
     * Sets the default component's severity from a verbosity level: 0 logs informational
     * messages, 1 to 5 add the matching debug levels.
     */
    void setVerbosity(int verbosity) {
        setMinimumLoggedSeverity(LogComponent::kDefault, LogSeverity::forVerbosity(verbosity));
    }

    /**
     * Appends log lines to the file at 'path', creating it when missing. Replaces any file sink
     * set up earlier.
     */
    Status setupFileSink(const std::string& path);

    void setConsoleEnabled(bool enabled);

    /**
     * Drops previously captured lines and captures from now on.
     */
    void startCapture();
    void stopCapture();

    /**
     * Lines captured since the last startCapture(). They stay available after stopCapture().
     */
    std::vector<std::string> capturedLines() const;

    /**
     * Pushes one fully formatted line through the boost::log core.
     */
    void write(const std::string& line);

private:
    using TextSink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
    using CaptureSink = boost::log::sinks::synchronous_sink<CaptureBackend>;

    static constexpr int kInherit = -100;

    std::array<std::atomic<int>, LogComponent::kNumLogComponents> _severities;

    boost::log::sources::logger_mt _logger;

    mutable std::mutex _sinkMutex;
    boost::shared_ptr<TextSink> _consoleSink;
    boost::shared_ptr<TextSink> _fileSink;
    boost::shared_ptr<CaptureSink> _captureSink;
    bool _capturing = false;
};

}  // namespace logv2
}  // namespace oplogmirror

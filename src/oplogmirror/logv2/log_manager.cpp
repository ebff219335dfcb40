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

#include "oplogmirror/logv2/log_manager.h"

#include <fstream>
#include <iostream>

#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/make_shared.hpp>

namespace oplogmirror {
namespace logv2 {

void CaptureBackend::consume(const boost::log::record_view&, const string_type& formattedMessage) {
    std::lock_guard<std::mutex> lk(_mutex);
    _lines.push_back(formattedMessage);
}

std::vector<std::string> CaptureBackend::lines() const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _lines;
}

void CaptureBackend::clear() {
    std::lock_guard<std::mutex> lk(_mutex);
    _lines.clear();
}

LogManager& LogManager::global() {
    static LogManager globalLogManager;
    return globalLogManager;
}

LogManager::LogManager() {
    for (auto& severity : _severities)
        severity.store(kInherit);
    _severities[LogComponent::kDefault].store(LogSeverity::Log().toInt());
    setConsoleEnabled(true);
}

LogManager::~LogManager() {
    auto core = boost::log::core::get();
    if (_consoleSink)
        core->remove_sink(_consoleSink);
    if (_fileSink) {
        core->remove_sink(_fileSink);
        _fileSink->flush();
    }
    if (_captureSink)
        core->remove_sink(_captureSink);
}

bool LogManager::shouldLog(LogComponent component, LogSeverity severity) const {
    return severity <= getMinimumLogSeverity(component);
}

LogSeverity LogManager::getMinimumLogSeverity(LogComponent component) const {
    int value = _severities[component].load();
    if (value == kInherit)
        value = _severities[LogComponent::kDefault].load();
    return LogSeverity::cast(value);
}

void LogManager::setMinimumLoggedSeverity(LogComponent component, LogSeverity severity) {
    _severities[component].store(severity.toInt());
}

void LogManager::clearMinimumLoggedSeverity(LogComponent component) {
    if (component == LogComponent::kDefault) {
        _severities[component].store(LogSeverity::Log().toInt());
        return;
    }
    _severities[component].store(kInherit);
}

Status LogManager::setupFileSink(const std::string& path) {
    auto stream = boost::make_shared<std::ofstream>(path, std::ios::out | std::ios::app);
    if (!stream->is_open())
        return Status(ErrorCodes::FileNotOpen, "Failed to open log file " + path);

    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(stream);
    backend->auto_flush(true);
    auto sink = boost::make_shared<TextSink>(backend);
    sink->set_formatter(boost::log::expressions::stream << boost::log::expressions::smessage);

    std::lock_guard<std::mutex> lk(_sinkMutex);
    auto core = boost::log::core::get();
    if (_fileSink)
        core->remove_sink(_fileSink);
    _fileSink = sink;
    core->add_sink(_fileSink);
    return Status::OK();
}

void LogManager::setConsoleEnabled(bool enabled) {
    std::lock_guard<std::mutex> lk(_sinkMutex);
    auto core = boost::log::core::get();
    if (!enabled) {
        if (_consoleSink) {
            core->remove_sink(_consoleSink);
            _consoleSink.reset();
        }
        return;
    }
    if (_consoleSink)
        return;

    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    backend->auto_flush(true);
    _consoleSink = boost::make_shared<TextSink>(backend);
    _consoleSink->set_formatter(boost::log::expressions::stream << boost::log::expressions::smessage);
    core->add_sink(_consoleSink);
}

void LogManager::startCapture() {
    std::lock_guard<std::mutex> lk(_sinkMutex);
    if (!_captureSink) {
        _captureSink = boost::make_shared<CaptureSink>();
        _captureSink->set_formatter(boost::log::expressions::stream << boost::log::expressions::smessage);
    }
    _captureSink->locked_backend()->clear();
    if (!_capturing) {
        boost::log::core::get()->add_sink(_captureSink);
        _capturing = true;
    }
}

void LogManager::stopCapture() {
    std::lock_guard<std::mutex> lk(_sinkMutex);
    if (!_capturing)
        return;
    // The sink leaves the core but keeps its lines until the next startCapture().
    boost::log::core::get()->remove_sink(_captureSink);
    _capturing = false;
}

std::vector<std::string> LogManager::capturedLines() const {
    std::lock_guard<std::mutex> lk(_sinkMutex);
    if (!_captureSink)
        return {};
    return _captureSink->locked_backend()->lines();
}

void LogManager::write(const std::string& line) {
    auto rec = _logger.open_record();
    if (rec) {
        boost::log::record_ostream strm(rec);
        strm << line;
        strm.flush();
        _logger.push_record(std::move(rec));
    }
}

}  // namespace logv2
}  // namespace oplogmirror

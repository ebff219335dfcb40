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

// Each translation unit that logs selects its component before including this header:
//
//   #define OPLOGMIRROR_LOGV2_DEFAULT_COMPONENT ::oplogmirror::logv2::LogComponent::kReplication
//   #include "oplogmirror/logv2/log.h"

#include "oplogmirror/logv2/log_attr.h"
#include "oplogmirror/logv2/log_component.h"
#include "oplogmirror/logv2/log_detail.h"
#include "oplogmirror/logv2/log_manager.h"
#include "oplogmirror/logv2/log_severity.h"

#ifndef OPLOGMIRROR_LOGV2_DEFAULT_COMPONENT
#define OPLOGMIRROR_LOGV2_DEFAULT_COMPONENT ::oplogmirror::logv2::LogComponent::kDefault
#endif

#define OPLOGMIRROR_LOGV2_IMPL(ID, SEVERITY, COMPONENT, MESSAGE, ...)                     \
    do {                                                                                  \
        const ::oplogmirror::logv2::LogSeverity logv2Severity_ = (SEVERITY);              \
        const ::oplogmirror::logv2::LogComponent logv2Component_ = (COMPONENT);           \
        if (::oplogmirror::logv2::LogManager::global().shouldLog(logv2Component_,         \
                                                                 logv2Severity_)) {       \
            ::oplogmirror::logv2::detail::doLog(                                          \
                ID, logv2Severity_, logv2Component_, MESSAGE __VA_OPT__(, ) __VA_ARGS__); \
        }                                                                                 \
    } while (false)

/**
 * Log with default severity and component.
 *
 * ID is a unique signed int32 in the same number space as other error codes.
 * MESSAGE is a string literal describing the event.
 * ATTRIBUTES are zero or more named attributes: "name"_attr = value.
 */
#define LOGV2(ID, MESSAGE, ...)                                           \
    OPLOGMIRROR_LOGV2_IMPL(ID,                                            \
                           ::oplogmirror::logv2::LogSeverity::Log(),      \
                           OPLOGMIRROR_LOGV2_DEFAULT_COMPONENT,           \
                           MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_WARNING(ID, MESSAGE, ...)                                   \
    OPLOGMIRROR_LOGV2_IMPL(ID,                                            \
                           ::oplogmirror::logv2::LogSeverity::Warning(),  \
                           OPLOGMIRROR_LOGV2_DEFAULT_COMPONENT,           \
                           MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_ERROR(ID, MESSAGE, ...)                                     \
    OPLOGMIRROR_LOGV2_IMPL(ID,                                            \
                           ::oplogmirror::logv2::LogSeverity::Error(),    \
                           OPLOGMIRROR_LOGV2_DEFAULT_COMPONENT,           \
                           MESSAGE __VA_OPT__(, ) __VA_ARGS__)

/**
 * Log with a debug level, 1 to 5. Attributes are only evaluated when the level is enabled.
 */
#define LOGV2_DEBUG(ID, DLEVEL, MESSAGE, ...)                             \
    OPLOGMIRROR_LOGV2_IMPL(ID,                                            \
                           ::oplogmirror::logv2::LogSeverity::Debug(DLEVEL), \
                           OPLOGMIRROR_LOGV2_DEFAULT_COMPONENT,           \
                           MESSAGE __VA_OPT__(, ) __VA_ARGS__)

/**
 * Log with an explicit component, overriding the translation unit's default.
 */
#define LOGV2_OPTIONS(ID, COMPONENT, MESSAGE, ...)                        \
    OPLOGMIRROR_LOGV2_IMPL(ID,                                            \
                           ::oplogmirror::logv2::LogSeverity::Log(),      \
                           COMPONENT,                                     \
                           MESSAGE __VA_OPT__(, ) __VA_ARGS__)

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

#include <chrono>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <boost/optional.hpp>

#include "oplogmirror/base/error_codes.h"
#include "oplogmirror/base/status.h"
#include "oplogmirror/base/string_data.h"
#include "oplogmirror/bson/bsonelement.h"
#include "oplogmirror/bson/bsonobj.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/bson/timestamp.h"
#include "oplogmirror/logv2/log_attr.h"
#include "oplogmirror/logv2/log_component.h"
#include "oplogmirror/logv2/log_severity.h"
#include "oplogmirror/util/time_support.h"

namespace oplogmirror {
namespace logv2 {
namespace detail {

template <typename T>
struct IsChronoDuration : std::false_type {};
template <typename Rep, typename Period>
struct IsChronoDuration<std::chrono::duration<Rep, Period>> : std::true_type {};

template <typename T>
struct IsOptional : std::false_type {};
template <typename T>
struct IsOptional<boost::optional<T>> : std::true_type {};

template <typename T>
struct IsVector : std::false_type {};
template <typename T, typename A>
struct IsVector<std::vector<T, A>> : std::true_type {};

template <typename Period>
constexpr const char* durationSuffix() {
    if constexpr (std::is_same_v<Period, std::nano>)
        return "Nanos";
    else if constexpr (std::is_same_v<Period, std::micro>)
        return "Micros";
    else if constexpr (std::is_same_v<Period, std::milli>)
        return "Millis";
    else if constexpr (std::is_same_v<Period, std::ratio<1>>)
        return "Secs";
    else if constexpr (std::is_same_v<Period, std::ratio<60>>)
        return "Mins";
    else
        return "Hours";
}

/**
 * Appends one attribute value under 'name'. Values keep their BSON type where they have one;
 * anything else is rendered through its toBSON(), toString() or stream operator.
 */
template <typename T>
void appendAttr(BSONObjBuilder& builder, StringData name, const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        builder.append(name, value);
    } else if constexpr (std::is_same_v<T, ErrorCodes::Error>) {
        builder.append(name, ErrorCodes::errorString(value));
    } else if constexpr (std::is_same_v<T, BSONType>) {
        builder.append(name, typeName(value));
    } else if constexpr (std::is_enum_v<T>) {
        builder.append(name, static_cast<long long>(value));
    } else if constexpr (std::is_integral_v<T>) {
        if constexpr (std::is_signed_v<T>) {
            if (value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max())
                builder.append(name, static_cast<int>(value));
            else
                builder.append(name, static_cast<long long>(value));
        } else {
            if (value <= static_cast<unsigned long long>(std::numeric_limits<int>::max()))
                builder.append(name, static_cast<int>(value));
            else if (value <= static_cast<unsigned long long>(std::numeric_limits<long long>::max()))
                builder.append(name, static_cast<long long>(value));
            else
                builder.append(name, static_cast<double>(value));
        }
    } else if constexpr (std::is_floating_point_v<T>) {
        builder.append(name, static_cast<double>(value));
    } else if constexpr (std::is_convertible_v<const T&, StringData>) {
        builder.append(name, StringData(value));
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        builder.append(name, StringData(std::string_view(value)));
    } else if constexpr (std::is_same_v<T, Status>) {
        BSONObjBuilder sub(builder.subobjStart(name));
        value.serialize(&sub);
    } else if constexpr (std::is_base_of_v<BSONObj, T>) {
        builder.append(name, static_cast<const BSONObj&>(value));
    } else if constexpr (std::is_same_v<T, BSONElement>) {
        if (value.eoo())
            builder.append(name, "<missing>"_sd);
        else
            builder.appendAs(value, name);
    } else if constexpr (std::is_same_v<T, Timestamp> || std::is_same_v<T, Date_t>) {
        builder.append(name, value);
    } else if constexpr (IsChronoDuration<T>::value) {
        builder.append(name + std::string(durationSuffix<typename T::period>()),
                       static_cast<long long>(value.count()));
    } else if constexpr (IsOptional<T>::value) {
        if (value)
            appendAttr(builder, name, *value);
        else
            builder.appendNull(name);
    } else if constexpr (IsVector<T>::value) {
        BSONObjBuilder arr(builder.subarrayStart(name));
        std::size_t i = 0;
        for (const auto& item : value)
            appendAttr(arr, std::to_string(i++), item);
    } else if constexpr (requires(const T& v) { v.toBSON(); }) {
        builder.append(name, value.toBSON());
    } else if constexpr (requires(const T& v) { v.toString(); }) {
        builder.append(name, value.toString());
    } else {
        std::ostringstream os;
        os << value;
        builder.append(name, os.str());
    }
}

/**
 * Formats and emits one log line. Severity filtering happened before the call.
 */
void doLogImpl(std::int32_t id,
               LogSeverity severity,
               LogComponent component,
               StringData message,
               const BSONObj& attrs);

template <typename... Args>
void doLog(std::int32_t id,
           LogSeverity severity,
           LogComponent component,
           StringData message,
           const NamedArg<Args>&... args) {
    BSONObjBuilder attrs;
    (appendAttr(attrs, args.name, args.value), ...);
    doLogImpl(id, severity, component, message, attrs.done());
}

}  // namespace detail
}  // namespace logv2
}  // namespace oplogmirror

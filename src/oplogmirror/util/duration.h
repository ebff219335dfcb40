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
#include <string>

namespace oplogmirror {

using Nanoseconds = std::chrono::nanoseconds;
using Microseconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;
using Minutes = std::chrono::minutes;
using Hours = std::chrono::hours;

/**
 * Renders a duration the way it appears in log lines and error messages, picking the coarsest
 * unit that does not lose information, e.g. "5s", "1500ms", "2min".
 */
template <typename Rep, typename Period>
std::string durationToString(std::chrono::duration<Rep, Period> d) {
    using namespace std::chrono;
    auto ms = duration_cast<Milliseconds>(d);
    if (ms.count() != 0 && ms.count() % 60000 == 0)
        return std::to_string(ms.count() / 60000) + "min";
    if (ms.count() != 0 && ms.count() % 1000 == 0)
        return std::to_string(ms.count() / 1000) + "s";
    return std::to_string(ms.count()) + "ms";
}

}  // namespace oplogmirror

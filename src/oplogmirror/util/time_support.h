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
#include <iosfwd>
#include <limits>
#include <string>

#include "oplogmirror/util/duration.h"

namespace oplogmirror {

/**
 * Representation of a point in time, with millisecond resolution and capable of representing
 * all times representable by the BSON Date type.
 */
class Date_t {
public:
    static constexpr Date_t max() {
        return fromMillisSinceEpoch(std::numeric_limits<long long>::max());
    }

    static constexpr Date_t min() {
        return Date_t();
    }

    /** Reads the system clock and returns a Date_t representing the present time. */
    static Date_t now();

    static constexpr Date_t fromMillisSinceEpoch(long long m) {
        Date_t result;
        result._millis = m;
        return result;
    }

    static Date_t fromDurationSinceEpoch(Milliseconds d) {
        return fromMillisSinceEpoch(d.count());
    }

    constexpr Date_t() = default;

    constexpr long long toMillisSinceEpoch() const {
        return _millis;
    }

    Milliseconds toDurationSinceEpoch() const {
        return Milliseconds(_millis);
    }

    /** Renders as ISO-8601 in UTC with millisecond precision, e.g. "2020-01-02T03:04:05.006Z". */
    std::string toString() const;

    template <typename Rep, typename Period>
    Date_t& operator+=(std::chrono::duration<Rep, Period> d) {
        _millis += std::chrono::duration_cast<Milliseconds>(d).count();
        return *this;
    }

    template <typename Rep, typename Period>
    Date_t& operator-=(std::chrono::duration<Rep, Period> d) {
        _millis -= std::chrono::duration_cast<Milliseconds>(d).count();
        return *this;
    }

    template <typename Rep, typename Period>
    Date_t operator+(std::chrono::duration<Rep, Period> d) const {
        Date_t result = *this;
        result += d;
        return result;
    }

    template <typename Rep, typename Period>
    Date_t operator-(std::chrono::duration<Rep, Period> d) const {
        Date_t result = *this;
        result -= d;
        return result;
    }

    Milliseconds operator-(Date_t other) const {
        return Milliseconds(_millis - other._millis);
    }

    friend constexpr auto operator<=>(Date_t, Date_t) = default;

private:
    long long _millis = 0;
};

std::ostream& operator<<(std::ostream& os, Date_t date);

}  // namespace oplogmirror

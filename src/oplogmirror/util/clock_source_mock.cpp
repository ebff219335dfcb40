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

#include "oplogmirror/util/clock_source_mock.h"

namespace oplogmirror {

Date_t ClockSourceMock::now() {
    std::lock_guard<std::mutex> lk(_mutex);
    return _now;
}

void ClockSourceMock::sleepFor(Milliseconds duration) {
    std::lock_guard<std::mutex> lk(_mutex);
    _sleeps.push_back(duration);
    if (duration > Milliseconds::zero())
        _now += duration;
}

void ClockSourceMock::advance(Milliseconds ms) {
    std::lock_guard<std::mutex> lk(_mutex);
    _now += ms;
}

void ClockSourceMock::reset(Date_t newNow) {
    std::lock_guard<std::mutex> lk(_mutex);
    _now = newNow;
}

std::vector<Milliseconds> ClockSourceMock::getSleeps() const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _sleeps;
}

}  // namespace oplogmirror

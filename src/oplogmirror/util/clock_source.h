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

#include "oplogmirror/util/duration.h"
#include "oplogmirror/util/time_support.h"

namespace oplogmirror {

/**
 * An interface for getting the current wall clock time and for blocking the calling thread for
 * a while. Code that measures elapsed time or backs off takes a ClockSource so tests can drive
 * it with ClockSourceMock instead of sleeping for real.
 */
class ClockSource {
public:
    virtual ~ClockSource() = default;

    /**
     * Returns the current wall clock time, as defined by this source.
     */
    virtual Date_t now() = 0;

    /**
     * Blocks the calling thread for the given duration, as measured by this source.
     */
    virtual void sleepFor(Milliseconds duration) = 0;
};

/**
 * ClockSource backed by the system clock.
 */
class SystemClockSource final : public ClockSource {
public:
    /**
     * Returns the process-wide instance. It holds no state, so sharing it is safe.
     */
    static SystemClockSource* get();

    Date_t now() override;
    void sleepFor(Milliseconds duration) override;
};

}  // namespace oplogmirror

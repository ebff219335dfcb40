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

namespace oplogmirror {

/**
 * Bounds of the retry loop of RetryableExecutor. A loop keeps going while it has made fewer
 * attempts than its lower bound OR less than 'retryDurationLowerBound' has elapsed, so both
 * floors must be exceeded before it gives up.
 */
struct RetryOptions {
    // Retries of a failed command before giving up.
    int commandRetriesLowerBound = 10;

    // Probes of the destination while recovering the session.
    int connectionRetriesLowerBound = 10;

    Milliseconds retryDurationLowerBound = Minutes(5);

    // Sleep before each probe of the destination.
    Milliseconds recoverSleepDuration = Seconds(5);
};

}  // namespace oplogmirror

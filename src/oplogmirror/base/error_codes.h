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

#include <cstdint>
#include <iosfwd>
#include <string>

#include "oplogmirror/base/string_data.h"

namespace oplogmirror {

/**
 * Table of error codes and their names.
 *
 * Codes below kClientCodeBase share their numeric values with the codes a mongod or mongos
 * server reports in command replies, so a code read off the wire can be cast straight to
 * ErrorCodes::Error. Codes at or above kClientCodeBase originate in this process and are never
 * sent by a server.
 */
class ErrorCodes {
public:
    // Explicitly 32-bits wide so that codes received from a server that are not named here are
    // still valid values.
    enum Error : std::int32_t {
        OK = 0,
        InternalError = 1,
        BadValue = 2,
        NoSuchKey = 4,
        HostUnreachable = 6,
        HostNotFound = 7,
        UnknownError = 8,
        FailedToParse = 9,
        Unauthorized = 13,
        TypeMismatch = 14,
        IllegalOperation = 20,
        NamespaceNotFound = 26,
        FileNotOpen = 38,
        FileStreamFailed = 39,
        CursorNotFound = 43,
        NamespaceExists = 48,
        CommandNotFound = 59,
        WriteConcernFailed = 64,
        CannotCreateIndex = 67,
        InvalidOptions = 72,
        NetworkTimeout = 89,
        ShutdownInProgress = 91,
        CappedPositionLost = 136,
        ExceededMemoryLimit = 146,
        CommandNotSupportedOnView = 166,
        QueryPlanKilled = 175,
        PrimarySteppedDown = 189,
        InvalidIndexSpecificationOption = 197,
        NoSuchTransaction = 251,
        SocketException = 9001,
        NotWritablePrimary = 10107,
        DuplicateKey = 11000,
        DuplicateKeyOnUpdate = 11001,
        InterruptedAtShutdown = 11600,
        Interrupted = 11601,
        InterruptedDueToReplStateChange = 11602,
        DuplicateKeyLegacy = 12582,
        CommandNotFoundLegacy = 13390,
        NotPrimaryNoSecondaryOk = 13435,
        NotPrimaryOrSecondary = 13436,
        BadHintLegacy = 17007,

        // Client-side codes.
        WriteConcernError = 1000001,
        BulkWriteError = 1000002,
        ConnectionClosed = 1000003,

        MaxError
    };

    static constexpr std::int32_t kClientCodeBase = 1000000;

    static std::string errorString(Error err);

    /**
     * Parses an Error from its "name". Returns UnknownError if "name" is unrecognized.
     */
    static Error fromString(StringData name);

    /**
     * Errors raised by the transport layer while talking to a server.
     */
    static bool isNetworkError(Error code);

    /**
     * Errors a server reports when it is not, or is no longer, the primary.
     */
    static bool isNotPrimaryError(Error code);

    static bool isShutdownError(Error code);

    static bool isInterruption(Error code);

    static bool isClientCode(Error code) {
        return code >= kClientCodeBase;
    }
};

std::ostream& operator<<(std::ostream& stream, ErrorCodes::Error code);

}  // namespace oplogmirror

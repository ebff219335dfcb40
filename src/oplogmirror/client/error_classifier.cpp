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

#include "oplogmirror/client/error_classifier.h"

#include "oplogmirror/rpc/get_status_from_command_result.h"
#include "oplogmirror/util/str.h"

namespace oplogmirror {
namespace {

bool isDuplicateKeyCode(int code) {
    return code == ErrorCodes::DuplicateKey || code == ErrorCodes::DuplicateKeyOnUpdate ||
        code == ErrorCodes::DuplicateKeyLegacy;
}

// Messages of transport failures that reach us without a network error code.
const StringData kNetworkErrorMessages[] = {
    "no reachable servers"_sd,
    "closed explicitly"_sd,
    "connection closed"_sd,
    "connection reset"_sd,
    "unexpected eof"_sd,
    "end of file"_sd,
};

bool hasCode(const Status& status, ErrorCodes::Error code) {
    return status.code() == code;
}

}  // namespace

int getErrorCode(const Status& status) {
    switch (status.code()) {
        case ErrorCodes::OK:
        case ErrorCodes::UnknownError:
            return 0;
        case ErrorCodes::BulkWriteError: {
            auto info = status.extraInfo<BulkWriteErrorInfo>();
            if (!info)
                return 0;
            if (!info->getWriteErrors().empty())
                return info->getWriteErrors().front().code;
            if (info->getWriteConcernError())
                return info->getWriteConcernError()->code;
            return 0;
        }
        case ErrorCodes::WriteConcernError: {
            auto info = status.extraInfo<WriteConcernErrorInfo>();
            if (!info || info->getDetail().code == ErrorCodes::UnknownError)
                return 0;
            return info->getDetail().code;
        }
        default:
            return status.code();
    }
}

bool isReconnectableError(const Status& status) {
    if (status.isOK())
        return false;

    // Failing to satisfy w:majority is always worth another attempt.
    if (status.code() == ErrorCodes::WriteConcernError)
        return true;

    switch (getErrorCode(status)) {
        case ErrorCodes::NotWritablePrimary:
        case ErrorCodes::NotPrimaryNoSecondaryOk:
        case ErrorCodes::NotPrimaryOrSecondary:
        case ErrorCodes::WriteConcernFailed:
        case ErrorCodes::HostUnreachable:
        case ErrorCodes::HostNotFound:
        case ErrorCodes::NetworkTimeout:
        case ErrorCodes::SocketException:
        case ErrorCodes::ShutdownInProgress:
        case ErrorCodes::PrimarySteppedDown:
        case ErrorCodes::InterruptedAtShutdown:
        case ErrorCodes::Interrupted:
        case ErrorCodes::InterruptedDueToReplStateChange:
        case ErrorCodes::CappedPositionLost:
            return true;
        case ErrorCodes::QueryPlanKilled:
            // Servers 3.6.0 to 3.6.3 report a step down during a query this way.
            return true;
        case 0:
            // Old servers answer "not master" without a code.
            if (str::contains(status.reason(), "not master"))
                return true;
            break;
        default:
            break;
    }

    return isNetworkError(status);
}

bool isNetworkError(const Status& status) {
    if (status.isOK())
        return false;
    if (ErrorCodes::isNetworkError(status.code()))
        return true;

    const std::string reason = str::toLower(status.reason());
    if (reason == "eof")
        return true;
    for (StringData message : kNetworkErrorMessages) {
        if (str::contains(reason, message))
            return true;
    }
    return false;
}

bool isConnectionError(const Status& status) {
    return isNetworkError(status) || ErrorCodes::isNotPrimaryError(status.code()) ||
        ErrorCodes::isShutdownError(status.code());
}

bool isDuplicateKeyError(const Status& status) {
    if (isDuplicateKeyCode(status.code()))
        return true;
    if (auto info = status.extraInfo<BulkWriteErrorInfo>()) {
        for (const auto& writeError : info->getWriteErrors()) {
            if (isDuplicateKeyCode(writeError.code))
                return true;
        }
    }
    return false;
}

bool isNamespaceNotFoundError(const Status& status) {
    return hasCode(status, ErrorCodes::NamespaceNotFound);
}

bool isNamespaceExistsError(const Status& status) {
    return hasCode(status, ErrorCodes::NamespaceExists);
}

bool isInvalidIndexSpecificationOptionError(const Status& status) {
    return hasCode(status, ErrorCodes::InvalidIndexSpecificationOption);
}

bool isCannotCreateIndexError(const Status& status) {
    return hasCode(status, ErrorCodes::CannotCreateIndex);
}

bool isCommandNotFoundError(const Status& status) {
    return hasCode(status, ErrorCodes::CommandNotFound) ||
        hasCode(status, ErrorCodes::CommandNotFoundLegacy) ||
        (!status.isOK() && str::contains(status.reason(), "no such cmd"));
}

bool isUnauthorizedError(const Status& status) {
    return hasCode(status, ErrorCodes::Unauthorized);
}

bool isCursorNotFoundError(const Status& status) {
    return getErrorCode(status) == ErrorCodes::CursorNotFound ||
        (!status.isOK() && str::contains(status.reason(), "cursor not found"));
}

bool isViewError(const Status& status) {
    return hasCode(status, ErrorCodes::CommandNotSupportedOnView);
}

bool isInvalidOptionsError(const Status& status) {
    return hasCode(status, ErrorCodes::InvalidOptions);
}

bool isBadHintError(const Status& status) {
    // 3.0 and older report code 17007, newer servers a BadValue mentioning the hint.
    return hasCode(status, ErrorCodes::BadHintLegacy) ||
        (hasCode(status, ErrorCodes::BadValue) && str::contains(status.reason(), "bad hint"));
}

}  // namespace oplogmirror

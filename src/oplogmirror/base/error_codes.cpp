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

#include "oplogmirror/base/error_codes.h"

#include <array>
#include <ostream>
#include <utility>

namespace oplogmirror {

namespace {

struct NamedCode {
    ErrorCodes::Error code;
    const char* name;
};

constexpr std::array kNamedCodes{
    NamedCode{ErrorCodes::OK, "OK"},
    NamedCode{ErrorCodes::InternalError, "InternalError"},
    NamedCode{ErrorCodes::BadValue, "BadValue"},
    NamedCode{ErrorCodes::NoSuchKey, "NoSuchKey"},
    NamedCode{ErrorCodes::HostUnreachable, "HostUnreachable"},
    NamedCode{ErrorCodes::HostNotFound, "HostNotFound"},
    NamedCode{ErrorCodes::UnknownError, "UnknownError"},
    NamedCode{ErrorCodes::FailedToParse, "FailedToParse"},
    NamedCode{ErrorCodes::Unauthorized, "Unauthorized"},
    NamedCode{ErrorCodes::TypeMismatch, "TypeMismatch"},
    NamedCode{ErrorCodes::IllegalOperation, "IllegalOperation"},
    NamedCode{ErrorCodes::NamespaceNotFound, "NamespaceNotFound"},
    NamedCode{ErrorCodes::FileNotOpen, "FileNotOpen"},
    NamedCode{ErrorCodes::FileStreamFailed, "FileStreamFailed"},
    NamedCode{ErrorCodes::CursorNotFound, "CursorNotFound"},
    NamedCode{ErrorCodes::NamespaceExists, "NamespaceExists"},
    NamedCode{ErrorCodes::CommandNotFound, "CommandNotFound"},
    NamedCode{ErrorCodes::WriteConcernFailed, "WriteConcernFailed"},
    NamedCode{ErrorCodes::CannotCreateIndex, "CannotCreateIndex"},
    NamedCode{ErrorCodes::InvalidOptions, "InvalidOptions"},
    NamedCode{ErrorCodes::NetworkTimeout, "NetworkTimeout"},
    NamedCode{ErrorCodes::ShutdownInProgress, "ShutdownInProgress"},
    NamedCode{ErrorCodes::CappedPositionLost, "CappedPositionLost"},
    NamedCode{ErrorCodes::ExceededMemoryLimit, "ExceededMemoryLimit"},
    NamedCode{ErrorCodes::CommandNotSupportedOnView, "CommandNotSupportedOnView"},
    NamedCode{ErrorCodes::QueryPlanKilled, "QueryPlanKilled"},
    NamedCode{ErrorCodes::PrimarySteppedDown, "PrimarySteppedDown"},
    NamedCode{ErrorCodes::InvalidIndexSpecificationOption, "InvalidIndexSpecificationOption"},
    NamedCode{ErrorCodes::NoSuchTransaction, "NoSuchTransaction"},
    NamedCode{ErrorCodes::SocketException, "SocketException"},
    NamedCode{ErrorCodes::NotWritablePrimary, "NotWritablePrimary"},
    NamedCode{ErrorCodes::DuplicateKey, "DuplicateKey"},
    NamedCode{ErrorCodes::DuplicateKeyOnUpdate, "DuplicateKeyOnUpdate"},
    NamedCode{ErrorCodes::InterruptedAtShutdown, "InterruptedAtShutdown"},
    NamedCode{ErrorCodes::Interrupted, "Interrupted"},
    NamedCode{ErrorCodes::InterruptedDueToReplStateChange, "InterruptedDueToReplStateChange"},
    NamedCode{ErrorCodes::DuplicateKeyLegacy, "DuplicateKeyLegacy"},
    NamedCode{ErrorCodes::CommandNotFoundLegacy, "CommandNotFoundLegacy"},
    NamedCode{ErrorCodes::NotPrimaryNoSecondaryOk, "NotPrimaryNoSecondaryOk"},
    NamedCode{ErrorCodes::NotPrimaryOrSecondary, "NotPrimaryOrSecondary"},
    NamedCode{ErrorCodes::BadHintLegacy, "BadHintLegacy"},
    NamedCode{ErrorCodes::WriteConcernError, "WriteConcernError"},
    NamedCode{ErrorCodes::BulkWriteError, "BulkWriteError"},
    NamedCode{ErrorCodes::ConnectionClosed, "ConnectionClosed"},
};

}  // namespace

std::string ErrorCodes::errorString(Error err) {
    for (const auto& named : kNamedCodes) {
        if (named.code == err)
            return named.name;
    }
    return "Location" + std::to_string(static_cast<std::int32_t>(err));
}

ErrorCodes::Error ErrorCodes::fromString(StringData name) {
    for (const auto& named : kNamedCodes) {
        if (name == named.name)
            return named.code;
    }
    return UnknownError;
}

bool ErrorCodes::isNetworkError(Error code) {
    switch (code) {
        case HostUnreachable:
        case HostNotFound:
        case NetworkTimeout:
        case SocketException:
        case ConnectionClosed:
            return true;
        default:
            return false;
    }
}

bool ErrorCodes::isNotPrimaryError(Error code) {
    switch (code) {
        case NotWritablePrimary:
        case NotPrimaryNoSecondaryOk:
        case NotPrimaryOrSecondary:
        case PrimarySteppedDown:
        case InterruptedDueToReplStateChange:
            return true;
        default:
            return false;
    }
}

bool ErrorCodes::isShutdownError(Error code) {
    return code == ShutdownInProgress || code == InterruptedAtShutdown;
}

bool ErrorCodes::isInterruption(Error code) {
    switch (code) {
        case Interrupted:
        case InterruptedAtShutdown:
        case InterruptedDueToReplStateChange:
            return true;
        default:
            return false;
    }
}

std::ostream& operator<<(std::ostream& stream, ErrorCodes::Error code) {
    return stream << ErrorCodes::errorString(code);
}

}  // namespace oplogmirror

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

#include <exception>
#include <string>
#include <utility>

#include "oplogmirror/base/error_codes.h"
#include "oplogmirror/base/status.h"
#include "oplogmirror/base/status_with.h"
#include "oplogmirror/base/string_data.h"

namespace oplogmirror {

/**
 * Most exceptions thrown by oplogmirror code derive from this. The exception carries a Status,
 * so that it can be turned back into one at the boundary where errors become values again.
 */
class DBException : public std::exception {
public:
    explicit DBException(Status status) : _status(std::move(status)) {}

    const char* what() const noexcept override {
        return reason().c_str();
    }

    ErrorCodes::Error code() const noexcept {
        return _status.code();
    }

    const std::string& reason() const noexcept {
        return _status.reason();
    }

    std::string codeString() const {
        return _status.codeString();
    }

    std::string toString() const {
        return _status.toString();
    }

    const Status& toStatus() const {
        return _status;
    }

    Status toStatus(StringData context) const {
        return _status.withContext(context);
    }

    /** Prepends context to the message carried by this exception. */
    void addContext(StringData context) {
        _status.addContext(context);
    }

private:
    Status _status;
};

class AssertionException : public DBException {
public:
    using DBException::DBException;
};

/**
 * Thrown by CommandRunner implementations when a command could not be delivered or its reply
 * could not be read.
 */
class NetworkException : public DBException {
public:
    using DBException::DBException;
};

[[noreturn]] void uassertedWithStatus(const Status& status);

[[noreturn]] inline void uasserted(ErrorCodes::Error code, StringData msg) {
    uassertedWithStatus(Status(code, msg));
}

[[noreturn]] void invariantFailed(const char* expr, const char* file, unsigned line) noexcept;

[[noreturn]] void invariantOKFailed(const char* expr,
                                    const Status& status,
                                    const char* file,
                                    unsigned line) noexcept;

/**
 * "user assert". If the expression is false, throws an AssertionException carrying the code and
 * message. Use for errors a caller can recover from.
 */
#define uassert(code, msg, expr)                                 \
    do {                                                         \
        if (!(expr)) {                                           \
            ::oplogmirror::uasserted(::oplogmirror::ErrorCodes::Error(code), (msg)); \
        }                                                        \
    } while (false)

inline void uassertStatusOK(const Status& status) {
    if (!status.isOK())
        uassertedWithStatus(status);
}

template <typename T>
T uassertStatusOK(StatusWith<T> sw) {
    uassertStatusOK(sw.getStatus());
    return std::move(sw.getValue());
}

/**
 * Checks an internal consistency condition. A failure is a programming error and terminates the
 * process after logging where it happened.
 */
#define invariant(expr)                                                    \
    do {                                                                   \
        if (!(expr)) {                                                     \
            ::oplogmirror::invariantFailed(#expr, __FILE__, __LINE__);     \
        }                                                                  \
    } while (false)

#define invariantStatusOK(expr)                                                       \
    do {                                                                              \
        const ::oplogmirror::Status _invStatus = (expr);                              \
        if (!_invStatus.isOK()) {                                                     \
            ::oplogmirror::invariantOKFailed(#expr, _invStatus, __FILE__, __LINE__);  \
        }                                                                             \
    } while (false)

/**
 * Converts the exception currently being handled into a Status. Call only from inside a catch
 * block; anything that is not a DBException or std::exception is rethrown.
 */
Status exceptionToStatus();

}  // namespace oplogmirror

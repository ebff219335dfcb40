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

#include <iosfwd>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/smart_ptr/intrusive_ptr.hpp>
#include <boost/smart_ptr/intrusive_ref_counter.hpp>

#include "oplogmirror/base/error_codes.h"
#include "oplogmirror/base/error_extra_info.h"
#include "oplogmirror/base/string_data.h"

namespace oplogmirror {

class BSONObjBuilder;

/**
 * Status represents an error state or the absence thereof.
 *
 * A Status uses the error codes from error_codes.h to determine an error's cause. It further
 * clarifies the error with a textual description, and code-specific extra info (a subclass of
 * ErrorExtraInfo).
 */
class [[nodiscard]] Status {
public:
    /** This is the best way to construct an OK status. */
    static Status OK() {
        return {};
    }

    /**
     * Builds an error Status given the error code and a textual description of the error.
     *
     * If code is ErrorCodes::OK, the reason is ignored. Prefer Status::OK() to make an OK
     * Status.
     *
     * For adding context to the reason string, use withContext/addContext rather than making a
     * new Status manually, as these functions apply a formatting convention.
     */
    Status(ErrorCodes::Error code, std::string reason) : Status{code, std::move(reason), nullptr} {}

    template <typename Reason,
              std::enable_if_t<std::is_constructible_v<std::string, Reason&&>, int> = 0>
    Status(ErrorCodes::Error code, Reason&& reason)
        : Status{code, std::string{std::forward<Reason>(reason)}} {}

    Status(ErrorCodes::Error code, StringData reason) : Status{code, reason.toString()} {}

    /**
     * Builds a Status with a subclass of ErrorExtraInfo.
     * The Status code is inferred from the static type of the `extra` parameter.
     */
    template <typename Extra, std::enable_if_t<std::is_base_of_v<ErrorExtraInfo, Extra>, int> = 0>
    Status(Extra&& extra, std::string reason)
        : Status{std::remove_reference_t<Extra>::code,
                 std::move(reason),
                 std::make_shared<const std::remove_reference_t<Extra>>(
                     std::forward<Extra>(extra))} {}

    /**
     * Returns a new Status with the same data as this, but with the reason string replaced with
     * newReason. No-op when called on an OK status.
     */
    Status withReason(std::string newReason) const {
        return isOK() ? OK() : Status(code(), std::move(newReason), extraInfo());
    }

    /** In-place version of `withContext`. Returns *this for chaining. */
    Status& addContext(StringData reasonPrefix);

    /**
     * Returns a new Status with the same code and extra info as this, but with the reason string
     * prefixed with reasonPrefix and our standard " :: caused by :: " separator.
     *
     * No-op when called on an OK status.
     */
    Status withContext(StringData reasonPrefix) const {
        return Status(*this).addContext(reasonPrefix);
    }

    bool isOK() const {
        return !_error;
    }

    ErrorCodes::Error code() const {
        return _error ? _error->code : ErrorCodes::OK;
    }

    std::string codeString() const {
        return ErrorCodes::errorString(code());
    }

    /** Returns the reason string or the empty string if isOK(). */
    const std::string& reason() const;

    /** Returns the generic ErrorExtraInfo if present. */
    std::shared_ptr<const ErrorExtraInfo> extraInfo() const {
        return isOK() ? nullptr : _error->extra;
    }

    /** Returns a specific subclass of ErrorExtraInfo if the error code matches that type. */
    template <typename T>
    std::shared_ptr<const T> extraInfo() const {
        static_assert(std::is_base_of_v<ErrorExtraInfo, T>);

        if (isOK() || code() != T::code || !_error->extra)
            return nullptr;
        return std::dynamic_pointer_cast<const T>(_error->extra);
    }

    std::string toString() const;

    /**
     * Serializes "code", "codeName" and "errmsg" in the format used by server command replies.
     * If present, the extraInfo() object is also serialized to the builder.
     */
    void serialize(BSONObjBuilder* builder) const;

    /**
     * Call this method to indicate that it is your intention to ignore a returned status.
     */
    void ignore() const noexcept {}

    /** Only compares codes. Ignores reason strings. */
    bool operator==(const Status& s) const {
        return code() == s.code();
    }

    bool operator!=(const Status& s) const {
        return !(*this == s);
    }

    /** Status and ErrorCodes::Error are symmetrically EqualityComparable. */
    bool operator==(ErrorCodes::Error err) const {
        return code() == err;
    }

    bool operator!=(ErrorCodes::Error err) const {
        return code() != err;
    }

    friend std::ostream& operator<<(std::ostream& os, const Status& status);

private:
    struct ErrorInfo : boost::intrusive_ref_counter<ErrorInfo, boost::thread_safe_counter> {
        ErrorInfo(ErrorCodes::Error code,
                  std::string reason,
                  std::shared_ptr<const ErrorExtraInfo> extra)
            : code{code}, reason{std::move(reason)}, extra{std::move(extra)} {}

        ErrorCodes::Error code;
        std::string reason;
        std::shared_ptr<const ErrorExtraInfo> extra;
    };

    Status() = default;

    // Private since it could result in a type mismatch between code and extraInfo.
    Status(ErrorCodes::Error code,
           std::string reason,
           std::shared_ptr<const ErrorExtraInfo> extra);

    boost::intrusive_ptr<const ErrorInfo> _error;
};

inline bool operator==(ErrorCodes::Error err, const Status& status) {
    return status == err;
}

inline bool operator!=(ErrorCodes::Error err, const Status& status) {
    return status != err;
}

/**
 * Returns the standard separator used when chaining an underlying error's reason behind a
 * higher level description.
 */
std::string causedBy(StringData reason);
std::string causedBy(const Status& status);

}  // namespace oplogmirror

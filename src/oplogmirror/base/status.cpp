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

#include "oplogmirror/base/status.h"

#include <ostream>

#include "oplogmirror/bson/bsonobjbuilder.h"

namespace oplogmirror {

Status::Status(ErrorCodes::Error code,
               std::string reason,
               std::shared_ptr<const ErrorExtraInfo> extra) {
    if (code != ErrorCodes::OK)
        _error = new ErrorInfo{code, std::move(reason), std::move(extra)};
}

const std::string& Status::reason() const {
    static const std::string kEmpty;
    return _error ? _error->reason : kEmpty;
}

Status& Status::addContext(StringData reasonPrefix) {
    if (!isOK())
        *this = Status(code(), reasonPrefix + causedBy(reason()), extraInfo());
    return *this;
}

std::string Status::toString() const {
    std::string out = codeString();
    if (!isOK()) {
        if (const auto& extra = extraInfo()) {
            BSONObjBuilder bob;
            extra->serialize(&bob);
            out += bob.obj().toString();
        }
        out += ": ";
        out += reason();
    }
    return out;
}

void Status::serialize(BSONObjBuilder* builder) const {
    builder->append("code", static_cast<int>(code()));
    builder->append("codeName", ErrorCodes::errorString(code()));
    if (!isOK()) {
        builder->append("errmsg", reason());
        if (const auto& ei = extraInfo())
            ei->serialize(builder);
    }
}

std::ostream& operator<<(std::ostream& os, const Status& status) {
    return os << status.codeString() << " " << status.reason();
}

std::string causedBy(StringData reason) {
    return " :: caused by :: " + reason;
}

std::string causedBy(const Status& status) {
    return causedBy(status.toString());
}

}  // namespace oplogmirror

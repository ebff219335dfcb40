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

#include "oplogmirror/db/write_concern_options.h"

#include <boost/lexical_cast/try_lexical_convert.hpp>

#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/util/str.h"

namespace oplogmirror {
namespace {

constexpr auto kWField = "w"_sd;
constexpr auto kJField = "j"_sd;
constexpr auto kWTimeoutField = "wtimeout"_sd;

Status negativeW(long long w) {
    return Status(ErrorCodes::BadValue,
                  str::stream() << "write concern w must not be negative, found " << w);
}

}  // namespace

StatusWith<WriteConcernOptions> WriteConcernOptions::parse(StringData w) {
    WriteConcernOptions options;
    if (w.empty() || w == kMajority)
        return options;

    long long numNodes;
    if (boost::conversion::try_lexical_convert(w.toString(), numNodes)) {
        if (numNodes < 0)
            return negativeW(numNodes);
        options._usesMode = false;
        options._wMode.clear();
        options._wNumNodes = static_cast<int>(numNodes);
        return options;
    }

    options._wMode = w.toString();
    return options;
}

StatusWith<WriteConcernOptions> WriteConcernOptions::parse(const BSONObj& obj) {
    WriteConcernOptions options;

    BSONElement w = obj[kWField];
    if (w.isNumber()) {
        if (w.numberLong() < 0)
            return negativeW(w.numberLong());
        options._usesMode = false;
        options._wMode.clear();
        options._wNumNodes = w.numberInt();
    } else if (w.type() == BSONType::string) {
        options._wMode = w.str();
    } else if (!w.eoo()) {
        return Status(ErrorCodes::TypeMismatch,
                      str::stream() << "write concern w must be a number or a string, found "
                                    << typeName(w.type()));
    }

    BSONElement j = obj[kJField];
    if (!j.eoo())
        options._journal = j.trueValue();

    BSONElement wTimeout = obj[kWTimeoutField];
    if (!wTimeout.eoo()) {
        if (!wTimeout.isNumber() || wTimeout.numberLong() < 0) {
            return Status(ErrorCodes::BadValue,
                          str::stream() << "write concern wtimeout must be a non-negative "
                                           "number of milliseconds, found "
                                        << wTimeout.toString(false));
        }
        options._wTimeout = Milliseconds(wTimeout.numberLong());
    }
    return options;
}

BSONObj WriteConcernOptions::toBSON() const {
    BSONObjBuilder bob;
    if (_usesMode)
        bob.append(kWField, _wMode);
    else
        bob.append(kWField, _wNumNodes);
    if (_journal)
        bob.append(kJField, true);
    if (_wTimeout > Milliseconds(0))
        bob.append(kWTimeoutField, static_cast<long long>(_wTimeout.count()));
    return bob.obj();
}

void WriteConcernOptions::appendTo(BSONObjBuilder* cmd) const {
    cmd->append(kWriteConcernField, toBSON());
}

BSONObj WriteConcernOptions::attachTo(const BSONObj& cmd) const {
    BSONObjBuilder bob;
    bob.appendElements(cmd.removeField(kWriteConcernField));
    appendTo(&bob);
    return bob.obj();
}

std::string WriteConcernOptions::toString() const {
    return toBSON().toString();
}

}  // namespace oplogmirror

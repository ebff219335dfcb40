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

#include "oplogmirror/db/repl/optime.h"

#include <ostream>

#include "oplogmirror/bson/bsonobjbuilder.h"

namespace oplogmirror {
namespace repl {

StatusWith<OpTime> OpTime::parseFromOplogEntry(const BSONObj& obj) {
    BSONElement tsElem = obj[kTimestampFieldName];
    if (tsElem.type() != BSONType::timestamp) {
        return {ErrorCodes::TypeMismatch,
                std::string("Expected field '") + kTimestampFieldName.toString() +
                    "' of OpTime to be a timestamp, got " + typeName(tsElem.type())};
    }

    long long term = kUninitializedTerm;
    BSONElement termElem = obj[kTermFieldName];
    if (!termElem.eoo()) {
        if (!termElem.isNumber()) {
            return {ErrorCodes::TypeMismatch,
                    std::string("Expected field '") + kTermFieldName.toString() +
                        "' of OpTime to be a number, got " + typeName(termElem.type())};
        }
        term = termElem.numberLong();
    }
    return OpTime(tsElem.timestamp(), term);
}

StatusWith<OpTime> OpTime::parse(const BSONElement& elem) {
    if (elem.type() != BSONType::object) {
        return {ErrorCodes::TypeMismatch,
                "Expected field '" + elem.fieldNameStringData().toString() +
                    "' to be an OpTime object, got " + typeName(elem.type())};
    }
    return parseFromOplogEntry(elem.embeddedObject());
}

void OpTime::append(BSONObjBuilder* builder, StringData subObjName) const {
    BSONObjBuilder opTimeBuilder(builder->subobjStart(subObjName));
    opTimeBuilder.append(kTimestampFieldName, _timestamp);
    opTimeBuilder.append(kTermFieldName, _term);
}

BSONObj OpTime::toBSON() const {
    BSONObjBuilder bldr;
    bldr.append(kTimestampFieldName, _timestamp);
    bldr.append(kTermFieldName, _term);
    return bldr.obj();
}

std::string OpTime::toString() const {
    return toBSON().toString();
}

std::ostream& operator<<(std::ostream& out, const OpTime& opTime) {
    return out << opTime.toString();
}

}  // namespace repl
}  // namespace oplogmirror

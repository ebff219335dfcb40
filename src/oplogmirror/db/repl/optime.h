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
#include <string>

#include "oplogmirror/base/status_with.h"
#include "oplogmirror/bson/bsonobj.h"
#include "oplogmirror/bson/timestamp.h"

namespace oplogmirror {

class BSONObjBuilder;

namespace repl {

/**
 * OpTime encompasses a Timestamp (which itself is composed of two 32-bit integers, which can
 * represent a time_t and a counter), and a 64-bit Term number. OpTime can be used to label
 * every op in an oplog with a unique identifier.
 *
 * Oplog entries of multi-entry transactions link to the entry written before them through an
 * OpTime held in their "prevOpTime" field. The first entry links to the null OpTime.
 */
class OpTime {
public:
    static constexpr auto kTimestampFieldName = "ts"_sd;
    static constexpr auto kTermFieldName = "t"_sd;

    // The term of an OpTime generated by an old protocol version.
    static constexpr long long kUninitializedTerm = -1;

    // The initial term after the first time upgrading from protocol version 0.
    static constexpr long long kInitialTerm = 0;

    OpTime() = default;
    OpTime(Timestamp ts, long long term) : _timestamp(ts), _term(term) {}

    /**
     * Parses an OpTime from an object of the form {ts: <Timestamp>, t: <NumberLong>}. The term
     * is optional and defaults to kUninitializedTerm.
     */
    static StatusWith<OpTime> parseFromOplogEntry(const BSONObj& obj);

    /**
     * Parses the OpTime held in 'elem', which must be an object as described above.
     */
    static StatusWith<OpTime> parse(const BSONElement& elem);

    void append(BSONObjBuilder* builder, StringData subObjName) const;
    BSONObj toBSON() const;

    Timestamp getTimestamp() const {
        return _timestamp;
    }

    long long getTerm() const {
        return _term;
    }

    /**
     * Returns true when the timestamp is null. A null OpTime means "no previous entry".
     */
    bool isNull() const {
        return _timestamp.isNull();
    }

    std::string toString() const;

    bool operator==(const OpTime& rhs) const {
        return _timestamp == rhs._timestamp && _term == rhs._term;
    }

    bool operator!=(const OpTime& rhs) const {
        return !(*this == rhs);
    }

    /**
     * Compares terms first, then timestamps, as replication does once every node speaks the
     * same protocol version.
     */
    bool operator<(const OpTime& rhs) const {
        if (_term != rhs._term)
            return _term < rhs._term;
        return _timestamp < rhs._timestamp;
    }

private:
    Timestamp _timestamp;
    long long _term = kInitialTerm;
};

std::ostream& operator<<(std::ostream& out, const OpTime& opTime);

}  // namespace repl
}  // namespace oplogmirror

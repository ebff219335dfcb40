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

#include <string>

#include "oplogmirror/base/status_with.h"
#include "oplogmirror/base/string_data.h"
#include "oplogmirror/bson/bsonobj.h"
#include "oplogmirror/util/duration.h"

namespace oplogmirror {

class BSONObjBuilder;

/**
 * The write concern attached to commands sent to the destination.
 *
 * "w" is either a number of nodes or a mode name ("majority" or a replica set tag). The
 * default is majority, the only write concern under which a retried command can rely on the
 * effects of an earlier attempt.
 */
class WriteConcernOptions {
public:
    static constexpr StringData kMajority = "majority"_sd;
    static constexpr StringData kWriteConcernField = "writeConcern"_sd;

    WriteConcernOptions() = default;

    static WriteConcernOptions majority() {
        return WriteConcernOptions();
    }

    /**
     * Parses the command line form: "majority", a number of nodes, or a tag name. The empty
     * string means majority. Negative numbers are rejected with BadValue.
     */
    static StatusWith<WriteConcernOptions> parse(StringData w);

    /**
     * Parses the document form {w: <number|string>, j: <bool>, wtimeout: <millis>}. A missing
     * "w" means majority.
     */
    static StatusWith<WriteConcernOptions> parse(const BSONObj& obj);

    /** True when "w" is a mode name rather than a number of nodes. */
    bool usesMode() const {
        return _usesMode;
    }

    bool isMajority() const {
        return _usesMode && _wMode == kMajority;
    }

    /** w:0 without journaling; the server does not answer such writes. */
    bool isUnacknowledged() const {
        return !_usesMode && _wNumNodes == 0 && !_journal;
    }

    int getWNumNodes() const {
        return _wNumNodes;
    }

    const std::string& getWMode() const {
        return _wMode;
    }

    bool getJournal() const {
        return _journal;
    }

    Milliseconds getTimeout() const {
        return _wTimeout;
    }

    void setJournal(bool journal) {
        _journal = journal;
    }

    void setTimeout(Milliseconds timeout) {
        _wTimeout = timeout;
    }

    BSONObj toBSON() const;

    /**
     * Appends this write concern as the "writeConcern" field of a command.
     */
    void appendTo(BSONObjBuilder* cmd) const;

    /**
     * Returns 'cmd' with this write concern appended, replacing one it already carried.
     */
    BSONObj attachTo(const BSONObj& cmd) const;

    std::string toString() const;

private:
    std::string _wMode{kMajority.toString()};
    int _wNumNodes = 0;
    bool _usesMode = true;
    bool _journal = false;
    Milliseconds _wTimeout{0};
};

}  // namespace oplogmirror

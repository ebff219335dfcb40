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

#include <initializer_list>
#include <string>
#include <vector>

#include "oplogmirror/base/status_with.h"
#include "oplogmirror/bson/bsonobj.h"

namespace oplogmirror {

class CommandRunner;

/**
 * The parts of a buildInfo reply that decide which commands a destination understands.
 */
class BuildInfo {
public:
    static constexpr int kDefaultMaxBsonObjectSize = 16 * 1024 * 1024;

    BuildInfo() = default;

    /**
     * Builds the info of a server running 'versionArray', e.g. {4, 2, 1}.
     */
    explicit BuildInfo(std::vector<int> versionArray);

    /**
     * Parses a buildInfo reply. "versionArray" is preferred; replies of servers that predate it
     * have the array assembled from the "version" string.
     */
    static StatusWith<BuildInfo> parse(const BSONObj& reply);

    /**
     * Runs buildInfo against 'runner'.
     */
    static StatusWith<BuildInfo> fetch(CommandRunner* runner);

    /**
     * Returns whether the server version is greater than or equal to the given version, e.g.
     * versionAtLeast({3, 6}). Components missing from the server version compare as older.
     */
    bool versionAtLeast(std::initializer_list<int> version) const;

    const std::string& getVersion() const {
        return _version;
    }

    const std::vector<int>& getVersionArray() const {
        return _versionArray;
    }

    const std::string& getGitVersion() const {
        return _gitVersion;
    }

    int getMaxBsonObjectSize() const {
        return _maxBsonObjectSize;
    }

    std::string toString() const;

private:
    std::string _version;
    std::vector<int> _versionArray;
    std::string _gitVersion;
    int _maxBsonObjectSize = kDefaultMaxBsonObjectSize;
};

}  // namespace oplogmirror

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

#include <boost/optional.hpp>

#include "oplogmirror/base/status_with.h"
#include "oplogmirror/bson/bsonobj.h"
#include "oplogmirror/util/uuid.h"

namespace oplogmirror {

/**
 * One entry of a listCollections reply.
 */
class CollectionInfo {
public:
    static constexpr auto kCollectionType = "collection"_sd;
    static constexpr auto kViewType = "view"_sd;

    /**
     * Parses {name: ..., type: ..., options: {...}, info: {uuid: ...}, idIndex: {...}}. Servers
     * older than 3.4 omit "type"; such entries are collections.
     */
    static StatusWith<CollectionInfo> parse(const BSONObj& obj);

    const std::string& getName() const {
        return _name;
    }

    const std::string& getType() const {
        return _type;
    }

    bool isView() const {
        return _type == kViewType;
    }

    const BSONObj& getOptions() const {
        return _options;
    }

    const BSONObj& getIdIndex() const {
        return _idIndex;
    }

    /** The collection UUID, reported by 3.6 and later. */
    const boost::optional<UUID>& getUUID() const {
        return _uuid;
    }

    BSONObj toBSON() const {
        return _raw;
    }

private:
    BSONObj _raw;
    std::string _name;
    std::string _type{kCollectionType.toString()};
    BSONObj _options;
    BSONObj _idIndex;
    boost::optional<UUID> _uuid;
};

}  // namespace oplogmirror

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

#include "oplogmirror/client/collection_info.h"

#include "oplogmirror/util/str.h"

namespace oplogmirror {

StatusWith<CollectionInfo> CollectionInfo::parse(const BSONObj& obj) {
    CollectionInfo info;
    info._raw = obj.getOwned();

    BSONElement name = info._raw["name"];
    if (name.type() != BSONType::string) {
        return Status(ErrorCodes::FailedToParse,
                      str::stream() << "listCollections entry has no name: " << obj.toString());
    }
    info._name = name.str();

    BSONElement type = info._raw["type"];
    if (type.type() == BSONType::string)
        info._type = type.str();

    info._options = info._raw.getObjectField("options");
    info._idIndex = info._raw.getObjectField("idIndex");

    BSONElement uuid = info._raw.getObjectField("info")["uuid"];
    if (!uuid.eoo()) {
        auto swUUID = UUID::parse(uuid);
        if (!swUUID.isOK())
            return swUUID.getStatus().withContext("bad uuid for collection " + info._name);
        info._uuid = swUUID.getValue();
    }
    return info;
}

}  // namespace oplogmirror

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

#include <cstddef>
#include <istream>
#include <vector>

#include <boost/optional.hpp>

#include "oplogmirror/base/status_with.h"
#include "oplogmirror/bson/bsonobj.h"

namespace oplogmirror {

/**
 * Reads the documents of a .bson dump, which holds BSON documents back to back with nothing
 * in between, as mongodump writes them.
 */
class BSONFileReader {
public:
    /**
     * 'in' must outlive the reader. With 'objcheck', every document is validated before it is
     * returned.
     */
    BSONFileReader(std::istream& in, bool objcheck);

    /**
     * Returns the next document, or none at the end of the input. A truncated or malformed
     * document fails with FailedToParse; reading stops there.
     */
    StatusWith<boost::optional<BSONObj>> next();

    long long getDocumentsRead() const {
        return _documentsRead;
    }

    long long getBytesRead() const {
        return _bytesRead;
    }

private:
    std::istream& _in;
    const bool _objcheck;

    std::vector<char> _buf;
    long long _documentsRead = 0;
    long long _bytesRead = 0;
};

}  // namespace oplogmirror

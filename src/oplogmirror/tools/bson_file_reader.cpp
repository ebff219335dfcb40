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

#include "oplogmirror/tools/bson_file_reader.h"

#include <algorithm>
#include <cstdint>

#include "oplogmirror/base/data_view.h"
#include "oplogmirror/bson/bson_validate.h"
#include "oplogmirror/bson/bsontypes.h"
#include "oplogmirror/util/str.h"

namespace oplogmirror {

BSONFileReader::BSONFileReader(std::istream& in, bool objcheck) : _in(in), _objcheck(objcheck) {}

StatusWith<boost::optional<BSONObj>> BSONFileReader::next() {
    char sizeBuf[4];
    _in.read(sizeBuf, sizeof(sizeBuf));
    const std::streamsize got = _in.gcount();
    if (got == 0 && _in.eof())
        return boost::optional<BSONObj>();
    if (got != sizeof(sizeBuf)) {
        return Status(ErrorCodes::FailedToParse,
                      str::stream() << "truncated document size at offset " << _bytesRead);
    }

    const std::int32_t size = ConstDataView(sizeBuf).readLE<std::int32_t>();
    if (size < 5 || size > BSONObjMaxInternalSize) {
        return Status(ErrorCodes::FailedToParse,
                      str::stream() << "invalid object size " << size << " at offset "
                                    << _bytesRead);
    }

    _buf.resize(size);
    std::copy(sizeBuf, sizeBuf + sizeof(sizeBuf), _buf.begin());
    _in.read(_buf.data() + sizeof(sizeBuf), size - sizeof(sizeBuf));
    if (_in.gcount() != static_cast<std::streamsize>(size - sizeof(sizeBuf))) {
        return Status(ErrorCodes::FailedToParse,
                      str::stream() << "truncated document of " << size << " bytes at offset "
                                    << _bytesRead);
    }

    if (_objcheck) {
        Status status = validateBSON(_buf.data(), _buf.size());
        if (!status.isOK()) {
            const std::string context = str::stream()
                << "invalid document number " << _documentsRead + 1 << " at offset "
                << _bytesRead;
            return status.withContext(context);
        }
    }

    _bytesRead += size;
    ++_documentsRead;
    return boost::optional<BSONObj>(BSONObj::copyOf(_buf.data(), size));
}

}  // namespace oplogmirror

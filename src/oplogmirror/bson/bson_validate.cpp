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

#include "oplogmirror/bson/bson_validate.h"

#include <cstdint>
#include <cstring>

#include <fmt/format.h>

#include "oplogmirror/base/data_view.h"
#include "oplogmirror/bson/bsontypes.h"

namespace oplogmirror {

namespace {

class ValidationState {
public:
    ValidationState(const char* buf, std::size_t maxLength) : _buf(buf), _maxLength(maxLength) {}

    Status validateObject(std::size_t offset, int depth);

private:
    Status _makeError(std::size_t offset, StringData msg) const {
        return Status(ErrorCodes::FailedToParse,
                      fmt::format("Invalid BSON at offset {}: {}", offset, msg.toStringView()));
    }

    Status _readInt32(std::size_t offset, std::size_t limit, std::int32_t* out) const {
        if (offset + sizeof(std::int32_t) > limit)
            return _makeError(offset, "length field past the end of the buffer");
        *out = ConstDataView(_buf).readLE<std::int32_t>(offset);
        return Status::OK();
    }

    Status _checkCString(std::size_t offset, std::size_t limit, std::size_t* len) const {
        const void* nul = offset < limit ? std::memchr(_buf + offset, '\0', limit - offset) : nullptr;
        if (!nul)
            return _makeError(offset, "unterminated string");
        *len = static_cast<const char*>(nul) - (_buf + offset);
        return Status::OK();
    }

    Status _checkString(std::size_t offset, std::size_t limit, std::size_t* size) const;

    Status _validateElementValue(BSONType type,
                                 std::size_t offset,
                                 std::size_t limit,
                                 int depth,
                                 std::size_t* valueSize);

    const char* _buf;
    std::size_t _maxLength;
};

Status ValidationState::_checkString(std::size_t offset,
                                     std::size_t limit,
                                     std::size_t* size) const {
    std::int32_t strSize = 0;
    if (auto status = _readInt32(offset, limit, &strSize); !status.isOK())
        return status;
    if (strSize < 1)
        return _makeError(offset, "string length must be at least 1");
    const std::size_t end = offset + 4 + static_cast<std::size_t>(strSize);
    if (end > limit)
        return _makeError(offset, "string past the end of its enclosing object");
    if (_buf[end - 1] != '\0')
        return _makeError(offset, "string is not null terminated");
    *size = 4 + static_cast<std::size_t>(strSize);
    return Status::OK();
}

Status ValidationState::_validateElementValue(BSONType type,
                                              std::size_t offset,
                                              std::size_t limit,
                                              int depth,
                                              std::size_t* valueSize) {
    auto fixed = [&](std::size_t n) -> Status {
        if (offset + n > limit)
            return _makeError(offset, "value past the end of its enclosing object");
        *valueSize = n;
        return Status::OK();
    };

    switch (type) {
        case BSONType::minKey:
        case BSONType::maxKey:
        case BSONType::undefined:
        case BSONType::null:
            *valueSize = 0;
            return Status::OK();
        case BSONType::boolean: {
            if (auto status = fixed(1); !status.isOK())
                return status;
            const char v = _buf[offset];
            if (v != 0 && v != 1)
                return _makeError(offset, "invalid boolean value");
            return Status::OK();
        }
        case BSONType::numberInt:
            return fixed(4);
        case BSONType::timestamp:
        case BSONType::date:
        case BSONType::numberDouble:
        case BSONType::numberLong:
            return fixed(8);
        case BSONType::oid:
            return fixed(12);
        case BSONType::numberDecimal:
            return fixed(16);
        case BSONType::string:
        case BSONType::code:
        case BSONType::symbol:
            return _checkString(offset, limit, valueSize);
        case BSONType::dbRef: {
            std::size_t strSize = 0;
            if (auto status = _checkString(offset, limit, &strSize); !status.isOK())
                return status;
            if (offset + strSize + 12 > limit)
                return _makeError(offset, "DBPointer past the end of its enclosing object");
            *valueSize = strSize + 12;
            return Status::OK();
        }
        case BSONType::object:
        case BSONType::array: {
            std::int32_t size = 0;
            if (auto status = _readInt32(offset, limit, &size); !status.isOK())
                return status;
            if (size < 5 || offset + static_cast<std::size_t>(size) > limit)
                return _makeError(offset, "embedded object size out of range");
            if (auto status = validateObject(offset, depth + 1); !status.isOK())
                return status;
            *valueSize = static_cast<std::size_t>(size);
            return Status::OK();
        }
        case BSONType::binData: {
            std::int32_t len = 0;
            if (auto status = _readInt32(offset, limit, &len); !status.isOK())
                return status;
            if (len < 0)
                return _makeError(offset, "negative binary data length");
            return fixed(4 + 1 + static_cast<std::size_t>(len));
        }
        case BSONType::regEx: {
            std::size_t patternLen = 0;
            if (auto status = _checkCString(offset, limit, &patternLen); !status.isOK())
                return status;
            std::size_t optionsLen = 0;
            if (auto status = _checkCString(offset + patternLen + 1, limit, &optionsLen);
                !status.isOK())
                return status;
            *valueSize = patternLen + 1 + optionsLen + 1;
            return Status::OK();
        }
        case BSONType::codeWScope: {
            std::int32_t total = 0;
            if (auto status = _readInt32(offset, limit, &total); !status.isOK())
                return status;
            if (total < 14 || offset + static_cast<std::size_t>(total) > limit)
                return _makeError(offset, "code with scope size out of range");
            const std::size_t scopeLimit = offset + static_cast<std::size_t>(total);
            std::size_t codeSize = 0;
            if (auto status = _checkString(offset + 4, scopeLimit, &codeSize); !status.isOK())
                return status;
            const std::size_t scopeOffset = offset + 4 + codeSize;
            std::int32_t scopeSize = 0;
            if (auto status = _readInt32(scopeOffset, scopeLimit, &scopeSize); !status.isOK())
                return status;
            if (scopeOffset + static_cast<std::size_t>(scopeSize) != scopeLimit)
                return _makeError(offset, "code with scope sizes disagree");
            if (auto status = validateObject(scopeOffset, depth + 1); !status.isOK())
                return status;
            *valueSize = static_cast<std::size_t>(total);
            return Status::OK();
        }
        case BSONType::eoo:
            break;
    }
    return _makeError(offset, "unexpected type");
}

Status ValidationState::validateObject(std::size_t offset, int depth) {
    if (depth > kMaxBSONDepth)
        return _makeError(offset, "nesting too deep");

    std::int32_t size = 0;
    if (auto status = _readInt32(offset, _maxLength, &size); !status.isOK())
        return status;
    if (size < 5 || offset + static_cast<std::size_t>(size) > _maxLength)
        return _makeError(offset, fmt::format("object size {} out of range", size));

    const std::size_t end = offset + static_cast<std::size_t>(size);
    if (_buf[end - 1] != '\0')
        return _makeError(end - 1, "object is not terminated by EOO");

    std::size_t pos = offset + 4;
    while (pos < end - 1) {
        const int rawType = static_cast<signed char>(_buf[pos]);
        if (!isValidBSONType(rawType) || rawType == static_cast<int>(BSONType::eoo))
            return _makeError(pos, fmt::format("invalid type {}", rawType));

        std::size_t nameLen = 0;
        if (auto status = _checkCString(pos + 1, end - 1, &nameLen); !status.isOK())
            return status;

        const std::size_t valueOffset = pos + 1 + nameLen + 1;
        std::size_t valueSize = 0;
        if (auto status = _validateElementValue(
                static_cast<BSONType>(rawType), valueOffset, end - 1, depth, &valueSize);
            !status.isOK())
            return status;
        pos = valueOffset + valueSize;
    }

    if (pos != end - 1)
        return _makeError(pos, "elements overrun the object");
    return Status::OK();
}

}  // namespace

Status validateBSON(const char* buf, std::size_t maxLength) {
    if (maxLength < 5)
        return Status(ErrorCodes::FailedToParse, "Invalid BSON: buffer too small");
    return ValidationState(buf, maxLength).validateObject(0, 0);
}

}  // namespace oplogmirror

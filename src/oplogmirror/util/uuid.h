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

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "oplogmirror/base/status_with.h"
#include "oplogmirror/base/string_data.h"
#include "oplogmirror/bson/bsonelement.h"

namespace oplogmirror {

class BSONObjBuilder;

/**
 * A UUID is a 128-bit unique identifier, per RFC 4122, v4. Collections carry one in the "ui"
 * field of their oplog entries, stored as binary data of subtype newUUID.
 */
class UUID {
public:
    static constexpr int kNumBytes = 16;

    using UUIDStorage = std::array<unsigned char, kNumBytes>;

    /**
     * Generates a new random v4 UUID.
     */
    static UUID gen();

    /**
     * Parses a UUID from its canonical string form, e.g.
     * "12345678-9abc-def0-1234-56789abcdef0". Fails with BadValue otherwise.
     */
    static StatusWith<UUID> parse(StringData s);

    /**
     * Parses a UUID from a BSON element of type binData, subtype newUUID.
     */
    static StatusWith<UUID> parse(const BSONElement& from);

    /**
     * Builds a UUID from raw bytes. 'bytes' must hold kNumBytes bytes.
     */
    static UUID fromCDR(const unsigned char* bytes);

    const UUIDStorage& data() const {
        return _uuid;
    }

    /**
     * Appends to 'builder' as binary data of subtype newUUID under 'name'.
     */
    void appendToBuilder(BSONObjBuilder* builder, StringData name) const;

    /**
     * Returns the canonical string form of the UUID.
     */
    std::string toString() const;

    bool operator==(const UUID& other) const {
        return _uuid == other._uuid;
    }

    bool operator!=(const UUID& other) const {
        return !(*this == other);
    }

    bool operator<(const UUID& other) const {
        return _uuid < other._uuid;
    }

private:
    UUID() = default;
    explicit UUID(const UUIDStorage& uuid) : _uuid(uuid) {}

    UUIDStorage _uuid{};
};

std::ostream& operator<<(std::ostream& s, const UUID& uuid);

}  // namespace oplogmirror

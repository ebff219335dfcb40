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

#include "oplogmirror/util/uuid.h"

#include <algorithm>
#include <mutex>
#include <ostream>
#include <stdexcept>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "oplogmirror/bson/bsonobjbuilder.h"

namespace oplogmirror {
namespace {

std::mutex uuidGenMutex;

UUID::UUIDStorage toStorage(const boost::uuids::uuid& u) {
    UUID::UUIDStorage out;
    std::copy(u.begin(), u.end(), out.begin());
    return out;
}

}  // namespace

UUID UUID::gen() {
    // boost's random_generator is not safe to share between threads without a lock.
    static boost::uuids::random_generator generator;
    std::lock_guard<std::mutex> lk(uuidGenMutex);
    return UUID(toStorage(generator()));
}

StatusWith<UUID> UUID::parse(StringData s) {
    // The string generator also accepts braces and a missing dash layout; insist on the
    // canonical 36 character form.
    if (s.size() != 36 || s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') {
        return {ErrorCodes::BadValue, "Invalid UUID string: " + s.toString()};
    }
    try {
        boost::uuids::string_generator parser;
        return UUID(toStorage(parser(s.rawData(), s.rawData() + s.size())));
    } catch (const std::runtime_error&) {
        return {ErrorCodes::BadValue, "Invalid UUID string: " + s.toString()};
    }
}

StatusWith<UUID> UUID::parse(const BSONElement& from) {
    if (from.type() != BSONType::binData || from.binDataType() != BinDataType::newUUID) {
        return {ErrorCodes::TypeMismatch,
                "Expected a UUID (binData subtype 4) for field '" +
                    from.fieldNameStringData().toString() + "'"};
    }
    int len = 0;
    const char* bytes = from.binData(len);
    if (len != kNumBytes) {
        return {ErrorCodes::BadValue,
                "UUID field '" + from.fieldNameStringData().toString() + "' has " +
                    std::to_string(len) + " bytes, expected 16"};
    }
    return fromCDR(reinterpret_cast<const unsigned char*>(bytes));
}

UUID UUID::fromCDR(const unsigned char* bytes) {
    UUIDStorage storage;
    std::copy(bytes, bytes + kNumBytes, storage.begin());
    return UUID(storage);
}

void UUID::appendToBuilder(BSONObjBuilder* builder, StringData name) const {
    builder->appendBinData(name, kNumBytes, BinDataType::newUUID, _uuid.data());
}

std::string UUID::toString() const {
    boost::uuids::uuid u;
    std::copy(_uuid.begin(), _uuid.end(), u.begin());
    return boost::uuids::to_string(u);
}

std::ostream& operator<<(std::ostream& s, const UUID& uuid) {
    return s << uuid.toString();
}

}  // namespace oplogmirror

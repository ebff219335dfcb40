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

#include "oplogmirror/bson/bsonobjbuilder.h"

#include <limits>

#include "oplogmirror/util/assert_util.h"

namespace oplogmirror {

BSONObjBuilder::BSONObjBuilder(int initsize)
    : _ownedBuf(std::make_unique<BufBuilder>(initsize)), _b(*_ownedBuf), _offset(0), _s(this) {
    // Leave room for the object's size, which done() fills in.
    _b.skip(sizeof(std::int32_t));
}

BSONObjBuilder::BSONObjBuilder(BufBuilder& baseBuilder)
    : _b(baseBuilder), _offset(baseBuilder.len()), _s(this) {
    _b.skip(sizeof(std::int32_t));
}

BSONObjBuilder::~BSONObjBuilder() {
    // If 'done' has not already been called, and we have a reference to an owning BufBuilder
    // but do not own it ourselves, then we must call _done to write in the length.
    if (!_doneCalled && !_ownedBuf)
        _done();
}

BSONObjBuilder& BSONObjBuilder::append(const BSONElement& e) {
    uassert(ErrorCodes::BadValue, "cannot append an EOO element to an object", !e.eoo());
    _b.appendBuf(e.rawdata(), e.size());
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendAs(const BSONElement& e, StringData fieldName) {
    uassert(ErrorCodes::BadValue, "cannot append an EOO element to an object", !e.eoo());
    _appendHeader(e.type(), fieldName);
    _b.appendBuf(e.value(), e.valuesize());
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendElements(const BSONObj& x) {
    if (!x.isEmpty())
        _b.appendBuf(x.objdata() + 4, x.objsize() - 5);  // skip over the size and the EOO
    return *this;
}

BSONObjBuilder& BSONObjBuilder::append(StringData fieldName, const BSONObj& subObj) {
    _appendHeader(BSONType::object, fieldName);
    _b.appendBuf(subObj.objdata(), subObj.objsize());
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendArray(StringData fieldName, const BSONObj& subObj) {
    _appendHeader(BSONType::array, fieldName);
    _b.appendBuf(subObj.objdata(), subObj.objsize());
    return *this;
}

BufBuilder& BSONObjBuilder::subobjStart(StringData fieldName) {
    _appendHeader(BSONType::object, fieldName);
    return _b;
}

BufBuilder& BSONObjBuilder::subarrayStart(StringData fieldName) {
    _appendHeader(BSONType::array, fieldName);
    return _b;
}

BSONObjBuilder& BSONObjBuilder::append(StringData fieldName, bool val) {
    _appendHeader(BSONType::boolean, fieldName);
    _b.appendNum(val);
    return *this;
}

BSONObjBuilder& BSONObjBuilder::append(StringData fieldName, int n) {
    _appendHeader(BSONType::numberInt, fieldName);
    _b.appendNum(static_cast<std::int32_t>(n));
    return *this;
}

BSONObjBuilder& BSONObjBuilder::append(StringData fieldName, long n) {
    return append(fieldName, static_cast<long long>(n));
}

BSONObjBuilder& BSONObjBuilder::append(StringData fieldName, long long n) {
    _appendHeader(BSONType::numberLong, fieldName);
    _b.appendNum(static_cast<std::int64_t>(n));
    return *this;
}

BSONObjBuilder& BSONObjBuilder::append(StringData fieldName, double n) {
    _appendHeader(BSONType::numberDouble, fieldName);
    _b.appendNum(n);
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendNumber(StringData fieldName, std::size_t n) {
    if (n <= static_cast<std::size_t>(std::numeric_limits<int>::max()))
        return append(fieldName, static_cast<int>(n));
    return append(fieldName, static_cast<long long>(n));
}

BSONObjBuilder& BSONObjBuilder::append(StringData fieldName, const char* str) {
    return append(fieldName, StringData(str));
}

BSONObjBuilder& BSONObjBuilder::append(StringData fieldName, const std::string& str) {
    return append(fieldName, StringData(str));
}

BSONObjBuilder& BSONObjBuilder::append(StringData fieldName, StringData str) {
    _appendHeader(BSONType::string, fieldName);
    _b.appendNum(static_cast<std::int32_t>(str.size() + 1));
    _b.appendStr(str);
    return *this;
}

BSONObjBuilder& BSONObjBuilder::append(StringData fieldName, Timestamp ts) {
    _appendHeader(BSONType::timestamp, fieldName);
    _b.appendNum(static_cast<std::uint64_t>(ts.asULL()));
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendDate(StringData fieldName, Date_t dt) {
    _appendHeader(BSONType::date, fieldName);
    _b.appendNum(static_cast<std::int64_t>(dt.toMillisSinceEpoch()));
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendNull(StringData fieldName) {
    _appendHeader(BSONType::null, fieldName);
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendUndefined(StringData fieldName) {
    _appendHeader(BSONType::undefined, fieldName);
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendMinKey(StringData fieldName) {
    _appendHeader(BSONType::minKey, fieldName);
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendMaxKey(StringData fieldName) {
    _appendHeader(BSONType::maxKey, fieldName);
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendBinData(StringData fieldName,
                                              int len,
                                              BinDataType type,
                                              const void* data) {
    _appendHeader(BSONType::binData, fieldName);
    _b.appendNum(static_cast<std::int32_t>(len));
    _b.appendUChar(static_cast<unsigned char>(type));
    _b.appendBuf(data, len);
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendOID(StringData fieldName, const unsigned char* oid) {
    _appendHeader(BSONType::oid, fieldName);
    _b.appendBuf(oid, 12);
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendRegex(StringData fieldName,
                                            StringData regex,
                                            StringData options) {
    _appendHeader(BSONType::regEx, fieldName);
    _b.appendStr(regex);
    _b.appendStr(options);
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendCode(StringData fieldName, StringData code) {
    _appendHeader(BSONType::code, fieldName);
    _b.appendNum(static_cast<std::int32_t>(code.size() + 1));
    _b.appendStr(code);
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendDecimal128(StringData fieldName,
                                                 std::uint64_t high,
                                                 std::uint64_t low) {
    _appendHeader(BSONType::numberDecimal, fieldName);
    _b.appendNum(low);
    _b.appendNum(high);
    return *this;
}

BSONObj BSONObjBuilder::obj() {
    uassert(ErrorCodes::IllegalOperation,
            "obj() called on a BSONObjBuilder that does not own its buffer",
            static_cast<bool>(_ownedBuf));
    _done();
    auto buffer = _ownedBuf->release();
    const char* start = buffer.get();
    return BSONObj(std::move(buffer), start);
}

BSONObj BSONObjBuilder::asTempObj() {
    BSONObj temp(_done());
    _b.setlen(_b.len() - 1);  // next append should overwrite the EOO
    _doneCalled = false;
    return temp;
}

char* BSONObjBuilder::_done() {
    if (_doneCalled)
        return _b.buf() + _offset;

    _doneCalled = true;
    _b.appendChar(static_cast<char>(BSONType::eoo));
    _b.writeNumAt(_offset, _b.len() - static_cast<std::int32_t>(_offset));
    return _b.buf() + _offset;
}

}  // namespace oplogmirror

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
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "oplogmirror/base/string_data.h"
#include "oplogmirror/bson/bsonelement.h"
#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobj.h"
#include "oplogmirror/bson/bsontypes.h"
#include "oplogmirror/bson/timestamp.h"
#include "oplogmirror/bson/util/builder.h"
#include "oplogmirror/util/time_support.h"

namespace oplogmirror {

class BSONObjBuilder;

/**
 * Holds the field name between "bob << name" and the value that follows it.
 */
class BSONObjBuilderValueStream {
public:
    explicit BSONObjBuilderValueStream(BSONObjBuilder* builder) : _builder(builder) {}

    BSONObjBuilderValueStream(const BSONObjBuilderValueStream&) = delete;
    BSONObjBuilderValueStream& operator=(const BSONObjBuilderValueStream&) = delete;

    void endField(StringData nextFieldName) {
        _fieldName = nextFieldName.toString();
        _haveFieldName = true;
    }

    template <typename T>
    BSONObjBuilder& operator<<(const T& value);

    BSONObjBuilder& operator<<(const BSONElement& e);

    bool haveFieldName() const {
        return _haveFieldName;
    }

private:
    BSONObjBuilder* _builder;
    std::string _fieldName;
    bool _haveFieldName = false;
};

/**
 * Utility for creating a BSONObj.
 *
 * A builder either owns its buffer, or writes a sub-object into the buffer of its parent:
 *
 *   BSONObjBuilder bob;
 *   bob.append("op", "c");
 *   {
 *       BSONObjBuilder o(bob.subobjStart("o"));
 *       o.append("applyOps", ops);
 *   }
 *   BSONObj entry = bob.obj();
 *
 * A sub-object builder finishes its object when it goes out of scope or when done() is called.
 */
class BSONObjBuilder {
public:
    /** @param initsize this is just a hint as to the final size of the object */
    explicit BSONObjBuilder(int initsize = 512);

    /**
     * Writes a sub-object into 'baseBuilder' at its current position. The caller already
     * appended the type byte and field name, as subobjStart() does.
     */
    explicit BSONObjBuilder(BufBuilder& baseBuilder);

    BSONObjBuilder(const BSONObjBuilder&) = delete;
    BSONObjBuilder& operator=(const BSONObjBuilder&) = delete;

    ~BSONObjBuilder();

    /** append element to the object we are building */
    BSONObjBuilder& append(const BSONElement& e);

    /** append an element but with a new name */
    BSONObjBuilder& appendAs(const BSONElement& e, StringData fieldName);

    /** add all the fields from the object specified to this object */
    BSONObjBuilder& appendElements(const BSONObj& x);

    /** append a sub-object */
    BSONObjBuilder& append(StringData fieldName, const BSONObj& subObj);

    /** append an array */
    BSONObjBuilder& append(StringData fieldName, const BSONArray& subArray) {
        return appendArray(fieldName, subArray);
    }

    BSONObjBuilder& appendArray(StringData fieldName, const BSONObj& subObj);

    /**
     * Add header for a new subobject and return the BufBuilder to write into. Finish the
     * subobject with a BSONObjBuilder constructed on the returned buffer.
     */
    BufBuilder& subobjStart(StringData fieldName);

    /** Same as subobjStart() for an array. */
    BufBuilder& subarrayStart(StringData fieldName);

    BSONObjBuilder& append(StringData fieldName, bool val);
    BSONObjBuilder& append(StringData fieldName, int n);
    BSONObjBuilder& append(StringData fieldName, long n);
    BSONObjBuilder& append(StringData fieldName, long long n);
    BSONObjBuilder& append(StringData fieldName, double n);

    /**
     * Appends a size or count: as an int when it fits, as a long otherwise.
     */
    BSONObjBuilder& appendNumber(StringData fieldName, std::size_t n);

    BSONObjBuilder& append(StringData fieldName, const char* str);
    BSONObjBuilder& append(StringData fieldName, const std::string& str);
    BSONObjBuilder& append(StringData fieldName, StringData str);

    BSONObjBuilder& append(StringData fieldName, Timestamp ts);
    BSONObjBuilder& append(StringData fieldName, Date_t dt) {
        return appendDate(fieldName, dt);
    }

    BSONObjBuilder& appendDate(StringData fieldName, Date_t dt);

    BSONObjBuilder& appendNull(StringData fieldName);
    BSONObjBuilder& appendUndefined(StringData fieldName);
    BSONObjBuilder& appendMinKey(StringData fieldName);
    BSONObjBuilder& appendMaxKey(StringData fieldName);

    BSONObjBuilder& append(StringData fieldName, const NullLabeler&) {
        return appendNull(fieldName);
    }
    BSONObjBuilder& append(StringData fieldName, const UndefinedLabeler&) {
        return appendUndefined(fieldName);
    }
    BSONObjBuilder& append(StringData fieldName, const MinKeyLabeler&) {
        return appendMinKey(fieldName);
    }
    BSONObjBuilder& append(StringData fieldName, const MaxKeyLabeler&) {
        return appendMaxKey(fieldName);
    }

    /**
     * Append a binary data element
     * @param fieldName name of the field
     * @param len length of the binary data in bytes
     * @param type the binData subtype
     * @param data the byte array
     */
    BSONObjBuilder& appendBinData(StringData fieldName,
                                  int len,
                                  BinDataType type,
                                  const void* data);

    /** Appends an ObjectId from its 12 raw bytes. */
    BSONObjBuilder& appendOID(StringData fieldName, const unsigned char* oid);

    BSONObjBuilder& appendRegex(StringData fieldName, StringData regex, StringData options = "");

    BSONObjBuilder& appendCode(StringData fieldName, StringData code);

    /**
     * Appends a numberDecimal from the two 64-bit halves of its IEEE 754-2008 BID encoding.
     */
    BSONObjBuilder& appendDecimal128(StringData fieldName,
                                     std::uint64_t high,
                                     std::uint64_t low);

    /** Appends the values of a vector as an array. */
    template <typename T>
    BSONObjBuilder& append(StringData fieldName, const std::vector<T>& vals);

    /**
     * The returned BSONObj will free the buffer when it is finished.
     * Only for builders that own their buffer; the builder can't be used afterwards.
     */
    BSONObj obj();

    /**
     * Fetch the object we have built. BSONObjBuilder still frees the object when the builder
     * goes out of scope -- very important to keep in mind. Use obj() if you would like the
     * BSONObj to last longer than the builder.
     */
    BSONObj done() {
        return BSONObj(_done());
    }

    /**
     * Peek at what is in the builder, but leave the builder ready for more appends. The returned
     * object is only valid until the next modification or destruction of the builder.
     */
    BSONObj asTempObj();

    /** Current length of the object being built, in bytes. */
    int len() const {
        return _b.len() - static_cast<int>(_offset);
    }

    BufBuilder& bb() {
        return _b;
    }

    bool isArray() const {
        return false;
    }

    /** Stream oriented way to add field names and values. */
    BSONObjBuilderValueStream& operator<<(StringData name) {
        _s.endField(name);
        return _s;
    }

    BSONObjBuilderValueStream& operator<<(const char* name) {
        return *this << StringData(name);
    }

    BSONObjBuilderValueStream& operator<<(const std::string& name) {
        return *this << StringData(name);
    }

    /** Stream an element as is, with its field name. */
    BSONObjBuilder& operator<<(const BSONElement& e) {
        return append(e);
    }

private:
    char* _done();

    void _appendHeader(BSONType type, StringData fieldName) {
        _b.appendChar(static_cast<char>(type));
        _b.appendStr(fieldName);
    }

    std::unique_ptr<BufBuilder> _ownedBuf;
    BufBuilder& _b;
    std::size_t _offset;
    BSONObjBuilderValueStream _s;
    bool _doneCalled = false;
};

/**
 * Builds an array, naming its elements "0", "1", ... in append order.
 */
class BSONArrayBuilder {
public:
    BSONArrayBuilder() = default;

    /** Writes the array into a parent's buffer, as returned by subarrayStart(). */
    explicit BSONArrayBuilder(BufBuilder& baseBuilder) : _b(baseBuilder) {}

    template <typename T>
    BSONArrayBuilder& append(const T& x) {
        _b.append(_nextIndex(), x);
        return *this;
    }

    BSONArrayBuilder& append(const BSONElement& e) {
        _b.appendAs(e, _nextIndex());
        return *this;
    }

    template <typename T>
    BSONArrayBuilder& operator<<(const T& x) {
        return append(x);
    }

    BufBuilder& subobjStart() {
        return _b.subobjStart(_nextIndex());
    }

    BufBuilder& subarrayStart() {
        return _b.subarrayStart(_nextIndex());
    }

    BSONArray arr() {
        return BSONArray(_b.obj());
    }

    BSONObj done() {
        return _b.done();
    }

    int arrSize() const {
        return static_cast<int>(_i);
    }

    int len() const {
        return _b.len();
    }

private:
    std::string _nextIndex() {
        return std::to_string(_i++);
    }

    std::size_t _i = 0;
    BSONObjBuilder _b;
};

template <typename T>
BSONObjBuilder& BSONObjBuilderValueStream::operator<<(const T& value) {
    _haveFieldName = false;
    return _builder->append(_fieldName, value);
}

inline BSONObjBuilder& BSONObjBuilderValueStream::operator<<(const BSONElement& e) {
    _haveFieldName = false;
    return _builder->appendAs(e, _fieldName);
}

template <typename T>
BSONObjBuilder& BSONObjBuilder::append(StringData fieldName, const std::vector<T>& vals) {
    BSONArrayBuilder arrBuilder(subarrayStart(fieldName));
    for (const auto& val : vals)
        arrBuilder.append(val);
    return *this;
}

}  // namespace oplogmirror

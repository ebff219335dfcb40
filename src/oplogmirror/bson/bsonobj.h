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
#include <cstring>
#include <iosfwd>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "oplogmirror/base/data_view.h"
#include "oplogmirror/base/string_data.h"
#include "oplogmirror/bson/bsonelement.h"
#include "oplogmirror/bson/bsontypes.h"

namespace oplogmirror {

/**
 * C++ representation of a "BSON" object -- that is, an extended JSON-style object in a binary
 * representation.
 *
 * Note that BSONObj's have a smart pointer capability built in -- so you can pass them around
 * by value. Copies of an owned BSONObj share its buffer.
 *
 * BSON object format:
 *
 * code
 * <unsigned totalSize> {<byte BSONType><cstring FieldName><Data>}* EOO
 *
 * totalSize includes itself.
 *
 * Data:
 * Bool:      <byte>
 * EOO:       nothing follows
 * Undefined: nothing follows
 * OID:       an OID object
 * NumberDouble: <double>
 * NumberInt: <int32>
 * String:    <unsigned32 strsizewithnull><cstring>
 * Date:      <8bytes>
 * Regex:     <cstring regex><cstring options>
 * Object:    a nested object, leading with its entire size, which terminates with EOO.
 * Array:     same as object
 * DBRef:     <strlen> <cstring ns> <oid>
 * BinData:   <int len> <byte subtype> <byte[len] data>
 * Code:      a function (not a closure): same format as String.
 * Symbol:    a language symbol (say a python symbol). same format as String.
 * Code With Scope: <total size><String><Object>
 */
class BSONObj {
public:
    class iterator;

    /** Construct an empty BSONObj -- that is, {}. */
    BSONObj() : _objdata(kEmptyObjectPrototype) {}

    /**
     * Constructs a BSONObj that views, without owning, a buffer that must outlive it.
     */
    explicit BSONObj(const char* bsonData) : _objdata(bsonData) {}

    /**
     * Constructs a BSONObj that shares ownership of the buffer holding it. 'bsonData' must point
     * into the buffer 'ownedBuffer' keeps alive.
     */
    BSONObj(std::shared_ptr<const char> ownedBuffer, const char* bsonData)
        : _objdata(bsonData), _ownedBuffer(std::move(ownedBuffer)) {}

    /**
     * Makes an owned copy of the document held in 'data', which holds at least 'size' bytes.
     * Used by readers that pull documents out of a stream.
     */
    static BSONObj copyOf(const char* data, int size);

    /**
     * A BSONObj can use a buffer it "owns" or one it does not.
     *
     * Owned: the BSONObj keeps the buffer alive by sharing ownership of it.
     * Unowned: the buffer belongs to someone else and must outlive the BSONObj.
     */
    bool isOwned() const {
        return static_cast<bool>(_ownedBuffer) || _objdata == kEmptyObjectPrototype;
    }

    /**
     * Returns an owned copy of this object. If this object is already owned, returns a copy
     * sharing the same buffer.
     */
    BSONObj getOwned() const;

    /** Returns a copy with its own buffer, regardless of whether this object is owned. */
    BSONObj copy() const;

    /** Pointer to the raw bytes of the object, starting with its total size. */
    const char* objdata() const {
        return _objdata;
    }

    /** Total size of the BSON object in bytes. */
    int objsize() const {
        return ConstDataView(objdata()).readLE<std::int32_t>();
    }

    /** A BSONObj is empty when it has no fields, i.e. it is {}. */
    bool isEmpty() const {
        return objsize() <= 5;
    }

    /** Number of fields in the object. O(n). */
    int nFields() const;

    /**
     * Get the field of the specified name. eoo() is true on the returned element if not found.
     */
    BSONElement getField(StringData name) const;

    BSONElement operator[](StringData field) const {
        return getField(field);
    }

    bool hasField(StringData name) const {
        return !getField(name).eoo();
    }

    /** The first element, or an eoo element for an empty object. */
    BSONElement firstElement() const {
        return BSONElement(objdata() + 4);
    }

    const char* firstElementFieldName() const {
        return firstElement().fieldName();
    }

    StringData firstElementFieldNameStringData() const {
        return firstElement().fieldNameStringData();
    }

    /** Returns the embedded object named 'name', or {} when absent or not an object. */
    BSONObj getObjectField(StringData name) const;

    /** Returns the string field named 'name', or "" when absent or not a string. */
    StringData getStringField(StringData name) const;

    /** Returns the numeric field named 'name' as an int, or 0 when absent or not numeric. */
    int getIntField(StringData name) const;

    /** Returns true when the field named 'name' is present and its trueValue() is true. */
    bool getBoolField(StringData name) const;

    /** Returns a copy of this object without the top level field named 'name'. */
    BSONObj removeField(StringData name) const;

    /** Returns a copy of this object with 'e' appended, or replacing the field of the same name. */
    BSONObj addField(const BSONElement& e) const;

    /** The field names at the top level of this object, in order. */
    std::vector<std::string> getFieldNames() const;

    /**
     * Relaxed extended JSON rendering of the object.
     */
    std::string jsonString() const;

    std::string toString() const {
        return jsonString();
    }

    /**
     * Byte-for-byte comparison: the objects hold the same fields, in the same order, with the
     * same values and types.
     */
    bool binaryEqual(const BSONObj& rhs) const {
        const int os = objsize();
        return os == rhs.objsize() && (os == 0 || std::memcmp(objdata(), rhs.objdata(), os) == 0);
    }

    /** Hash of the object's bytes, consistent with binaryEqual(). */
    std::size_t hash() const;

    /** Iteration over the elements of the object, in order. */
    iterator begin() const;
    iterator end() const;

    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = BSONElement;
        using pointer = const BSONElement*;
        using reference = const BSONElement&;

        iterator() = default;
        iterator(const char* start, const char* end) : _pos(start), _theEnd(end) {
            if (_pos != _theEnd)
                _cur = BSONElement(_pos);
        }

        reference operator*() const {
            return _cur;
        }

        pointer operator->() const {
            return &_cur;
        }

        iterator& operator++() {
            _pos += _cur.size();
            _cur = (_pos == _theEnd) ? BSONElement() : BSONElement(_pos);
            return *this;
        }

        iterator operator++(int) {
            iterator old = *this;
            ++*this;
            return old;
        }

        friend bool operator==(const iterator& lhs, const iterator& rhs) {
            return lhs._pos == rhs._pos;
        }

        friend bool operator!=(const iterator& lhs, const iterator& rhs) {
            return !(lhs == rhs);
        }

    private:
        const char* _pos = nullptr;
        const char* _theEnd = nullptr;
        BSONElement _cur;
    };

private:
    static const char kEmptyObjectPrototype[];

    const char* _objdata;
    std::shared_ptr<const char> _ownedBuffer;
};

/**
 * An empty subclass of BSONObj so appending it to a builder produces an array.
 */
struct BSONArray : BSONObj {
    BSONArray() = default;
    explicit BSONArray(const BSONObj& obj) : BSONObj(obj) {}
};

/**
 * Iterator in the style most of the code base uses:
 *
 *   BSONObjIterator i(obj);
 *   while (i.more()) {
 *       BSONElement e = i.next();
 *       ...
 *   }
 */
class BSONObjIterator {
public:
    explicit BSONObjIterator(const BSONObj& obj)
        : _pos(obj.objdata() + 4), _theEnd(obj.objdata() + obj.objsize() - 1) {}

    bool more() const {
        return _pos < _theEnd;
    }

    BSONElement next() {
        BSONElement e(_pos);
        _pos += e.size();
        return e;
    }

private:
    const char* _pos;
    const char* _theEnd;
};

std::ostream& operator<<(std::ostream& s, const BSONObj& o);

/**
 * Equality and hashing that treat objects as their bytes. Suitable for keying unordered
 * containers on documents such as logical session ids.
 */
struct SimpleBSONObjEqual {
    bool operator()(const BSONObj& lhs, const BSONObj& rhs) const {
        return lhs.binaryEqual(rhs);
    }
};

struct SimpleBSONObjHash {
    std::size_t operator()(const BSONObj& obj) const {
        return obj.hash();
    }
};

}  // namespace oplogmirror

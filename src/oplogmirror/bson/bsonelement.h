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

#include <cstdint>
#include <cstring>
#include <iosfwd>
#include <string>
#include <vector>

#include "oplogmirror/base/data_view.h"
#include "oplogmirror/base/string_data.h"
#include "oplogmirror/bson/bsontypes.h"
#include "oplogmirror/bson/timestamp.h"
#include "oplogmirror/util/time_support.h"

namespace oplogmirror {

/**
 * BSONElement represents an "element" in a BSONObj. So for the object { a : 3, b : "abc" },
 * 'a : 3' is the first element (key+value).
 *
 * The BSONElement object points into the BSONObj's data. Thus the BSONObj must stay in scope
 * for the life of the BSONElement.
 *
 * Internals:
 * <type><fieldName    ><value>
 * -------- size() ------------
 *       -fieldNameSize-
 *                      value()
 * type()
 */
class BSONElement {
public:
    /** Constructs an EOO element, the one returned for a missing field. */
    BSONElement();

    /**
     * Points at the element starting at 'd'. The caller guarantees the data is a well formed
     * element, e.g. because the enclosing object passed validateBSON().
     */
    explicit BSONElement(const char* d);

    /** Returns the type of the element. */
    BSONType type() const {
        return static_cast<BSONType>(static_cast<signed char>(*_data));
    }

    /**
     * Indicates if it is the end of the object. Missing fields also come back as eoo elements.
     */
    bool eoo() const {
        return type() == BSONType::eoo;
    }

    bool ok() const {
        return !eoo();
    }

    /** Size of the element, including its type byte and field name. */
    int size() const {
        return _totalSize;
    }

    const char* fieldName() const {
        if (eoo())
            return "";  // no fieldname for it.
        return _data + 1;
    }

    StringData fieldNameStringData() const {
        return StringData(fieldName(), eoo() ? 0 : _fieldNameSize - 1);
    }

    /** Raw data of the element's value (so be careful). */
    const char* value() const {
        return _data + _fieldNameSize + 1;
    }

    /** Size in bytes of the element's value (when applicable). */
    int valuesize() const {
        return _totalSize - _fieldNameSize - 1;
    }

    /** Raw data of the whole element, starting at the type byte. */
    const char* rawdata() const {
        return _data;
    }

    bool isBoolean() const {
        return type() == BSONType::boolean;
    }

    bool boolean() const {
        return *value() ? true : false;
    }

    /**
     * True if element is of a numeric type.
     */
    bool isNumber() const {
        return isNumericBSONType(type());
    }

    bool isNull() const {
        return type() == BSONType::null;
    }

    bool isABSONObj() const {
        return type() == BSONType::object || type() == BSONType::array;
    }

    /** Retrieve int value for the element safely. Zero returned if not a number. */
    int numberInt() const;

    /** Retrieve long value for the element safely. Zero returned if not a number. */
    long long numberLong() const;

    /**
     * Retrieve the numeric value of the element. If not of a numeric type, returns 0.
     * Decimal values are converted to the nearest double.
     */
    double numberDouble() const;

    double _numberDouble() const {
        return ConstDataView(value()).readLE<double>();
    }

    int _numberInt() const {
        return ConstDataView(value()).readLE<std::int32_t>();
    }

    long long _numberLong() const {
        return ConstDataView(value()).readLE<std::int64_t>();
    }

    /**
     * Returns true for a numberDecimal element whose value is a zero of any sign or exponent.
     */
    bool decimalIsZero() const;

    /**
     * Renders a numberDecimal element in the canonical string form, e.g. "1.50" or "0E-6176".
     */
    std::string decimalToString() const;

    /**
     * Returns the value of a string, code or symbol element, including embedded nulls.
     */
    StringData valueStringData() const {
        return StringData(value() + 4, valuestrsize() - 1);
    }

    /** Like valueStringData() but returns the empty string for non-string elements. */
    StringData valueStringDataSafe() const {
        return type() == BSONType::string ? valueStringData() : StringData();
    }

    std::string str() const {
        return type() == BSONType::string ? valueStringData().toString() : std::string();
    }

    /** Size of a string value, including its terminating null. */
    int valuestrsize() const {
        return ConstDataView(value()).readLE<std::int32_t>();
    }

    /**
     * Gets the embedded object of an object or array element. Returns an empty object for other
     * types.
     */
    BSONObj embeddedObject() const;

    /**
     * Same as embeddedObject() but throws a TypeMismatch AssertionException for anything that
     * is not an object or an array.
     */
    BSONObj Obj() const;

    /**
     * Returns the elements of an array element in order. Throws TypeMismatch for other types.
     */
    std::vector<BSONElement> Array() const;

    /** Checks the value is "true" the way a server reads flags: nonzero numbers and true. */
    bool trueValue() const;

    Timestamp timestamp() const {
        if (type() == BSONType::timestamp || type() == BSONType::date)
            return Timestamp(ConstDataView(value()).readLE<std::uint64_t>());
        return Timestamp();
    }

    Date_t date() const {
        return Date_t::fromMillisSinceEpoch(ConstDataView(value()).readLE<std::int64_t>());
    }

    /**
     * Binary data accessors. 'len' receives the payload length, not counting the subtype byte.
     */
    const char* binData(int& len) const {
        len = valuestrsize();
        return value() + 5;
    }

    BinDataType binDataType() const {
        return static_cast<BinDataType>(static_cast<unsigned char>(*(value() + 4)));
    }

    /** The 12 bytes of an ObjectId element. */
    const unsigned char* oidBytes() const {
        return reinterpret_cast<const unsigned char*>(value());
    }

    const char* regex() const {
        return value();
    }

    const char* regexFlags() const {
        const char* p = value();
        return p + std::strlen(p) + 1;
    }

    /** Returns a new document holding only this element. */
    BSONObj wrap() const;

    /** Returns a new document holding only this element, renamed to 'newName'. */
    BSONObj wrap(StringData newName) const;

    /**
     * Renders the element as relaxed extended JSON, with its field name when requested.
     */
    std::string jsonString(bool includeFieldNames = true) const;

    std::string toString(bool includeFieldName = true) const {
        return jsonString(includeFieldName);
    }

    /**
     * Byte-for-byte comparison of the two elements, including their field names.
     */
    bool binaryEqual(const BSONElement& rhs) const {
        return size() == rhs.size() && std::memcmp(_data, rhs._data, size()) == 0;
    }

    /** Same as binaryEqual but ignores the field names. */
    bool binaryEqualValues(const BSONElement& rhs) const;

private:
    const char* _data;
    int _fieldNameSize;  // internal size includes null terminator
    int _totalSize;
};

std::ostream& operator<<(std::ostream& s, const BSONElement& e);

}  // namespace oplogmirror

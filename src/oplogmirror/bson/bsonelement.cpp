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

#include "oplogmirror/bson/bsonelement.h"

#include <cmath>
#include <ostream>
#include <string>

#include <fmt/format.h>

#include "oplogmirror/bson/bsonobj.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/util/assert_util.h"
#include "oplogmirror/util/base64.h"

namespace oplogmirror {

namespace {

const char kEOOElement[] = {0};

// Dates in this range render as ISO-8601 strings in relaxed extended JSON.
const long long kMaxISODateMillis = 253402300799999LL;  // 9999-12-31T23:59:59.999Z

/**
 * The parts of a decimal128 value in its IEEE 754-2008 BID encoding.
 */
struct DecimalParts {
    bool negative = false;
    bool isNaN = false;
    bool isInfinity = false;
    unsigned __int128 coefficient = 0;
    int exponent = 0;
};

DecimalParts decodeDecimal(const char* value) {
    constexpr int kExponentBias = 6176;
    const std::uint64_t low = ConstDataView(value).readLE<std::uint64_t>();
    const std::uint64_t high = ConstDataView(value).readLE<std::uint64_t>(8);

    DecimalParts parts;
    parts.negative = (high >> 63) != 0;

    const auto combination = (high >> 58) & 0x1f;
    if (combination == 0x1f) {
        parts.isNaN = true;
        return parts;
    }
    if (combination == 0x1e) {
        parts.isInfinity = true;
        return parts;
    }

    if (((high >> 61) & 0x3) == 0x3) {
        // The implied leading bits put the coefficient past 10^34 - 1, which is non-canonical
        // and reads as zero.
        parts.exponent = static_cast<int>((high >> 47) & 0x3fff) - kExponentBias;
        parts.coefficient = 0;
        return parts;
    }

    parts.exponent = static_cast<int>((high >> 49) & 0x3fff) - kExponentBias;
    parts.coefficient = (static_cast<unsigned __int128>(high & 0x1ffffffffffffULL) << 64) | low;

    unsigned __int128 maxCoefficient = 1;
    for (int i = 0; i < 34; ++i)
        maxCoefficient *= 10;
    if (parts.coefficient >= maxCoefficient)
        parts.coefficient = 0;
    return parts;
}

std::string coefficientDigits(unsigned __int128 coefficient) {
    if (coefficient == 0)
        return "0";
    std::string digits;
    while (coefficient != 0) {
        digits.insert(digits.begin(), static_cast<char>('0' + static_cast<int>(coefficient % 10)));
        coefficient /= 10;
    }
    return digits;
}

void appendJSONString(std::string& out, StringData str) {
    out.push_back('"');
    for (char c : str) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
}

std::string formatDouble(double d) {
    if (std::isnan(d))
        return R"({"$numberDouble":"NaN"})";
    if (std::isinf(d))
        return d > 0 ? R"({"$numberDouble":"Infinity"})" : R"({"$numberDouble":"-Infinity"})";

    std::string out = fmt::format("{}", d);
    if (out.find_first_of(".e") == std::string::npos)
        out += ".0";
    return out;
}

std::string hexBytes(const unsigned char* bytes, int len) {
    std::string out;
    out.reserve(len * 2);
    for (int i = 0; i < len; ++i)
        out += fmt::format("{:02x}", bytes[i]);
    return out;
}

void appendValueJSON(std::string& out, const BSONElement& e);

void appendObjectJSON(std::string& out, const BSONObj& obj, bool isArray) {
    out.push_back(isArray ? '[' : '{');
    bool first = true;
    for (auto&& e : obj) {
        if (!first)
            out.push_back(',');
        first = false;
        if (!isArray) {
            appendJSONString(out, e.fieldNameStringData());
            out.push_back(':');
        }
        appendValueJSON(out, e);
    }
    out.push_back(isArray ? ']' : '}');
}

void appendValueJSON(std::string& out, const BSONElement& e) {
    switch (e.type()) {
        case BSONType::eoo:
            break;
        case BSONType::numberDouble:
            out += formatDouble(e._numberDouble());
            break;
        case BSONType::string:
            appendJSONString(out, e.valueStringData());
            break;
        case BSONType::object:
            appendObjectJSON(out, e.embeddedObject(), false);
            break;
        case BSONType::array:
            appendObjectJSON(out, e.embeddedObject(), true);
            break;
        case BSONType::binData: {
            int len = 0;
            const char* data = e.binData(len);
            out += fmt::format(R"({{"$binary":{{"base64":"{}","subType":"{:02x}"}}}})",
                               base64::encode(StringData(data, len)),
                               static_cast<unsigned>(e.binDataType()));
            break;
        }
        case BSONType::undefined:
            out += R"({"$undefined":true})";
            break;
        case BSONType::oid:
            out += fmt::format(R"({{"$oid":"{}"}})", hexBytes(e.oidBytes(), 12));
            break;
        case BSONType::boolean:
            out += e.boolean() ? "true" : "false";
            break;
        case BSONType::date: {
            const Date_t date = e.date();
            const long long millis = date.toMillisSinceEpoch();
            if (millis >= 0 && millis <= kMaxISODateMillis) {
                out += fmt::format(R"({{"$date":"{}"}})", date.toString());
            } else {
                out += fmt::format(R"({{"$date":{{"$numberLong":"{}"}}}})", millis);
            }
            break;
        }
        case BSONType::null:
            out += "null";
            break;
        case BSONType::regEx:
            out += R"({"$regularExpression":{"pattern":)";
            appendJSONString(out, e.regex());
            out += R"(,"options":)";
            appendJSONString(out, e.regexFlags());
            out += "}}";
            break;
        case BSONType::dbRef: {
            const StringData ns = e.valueStringData();
            const auto* oid = reinterpret_cast<const unsigned char*>(e.value() + 4 + ns.size() + 1);
            out += R"({"$dbPointer":{"$ref":)";
            appendJSONString(out, ns);
            out += fmt::format(R"(,"$id":{{"$oid":"{}"}}}}}})", hexBytes(oid, 12));
            break;
        }
        case BSONType::code:
            out += R"({"$code":)";
            appendJSONString(out, e.valueStringData());
            out.push_back('}');
            break;
        case BSONType::symbol:
            out += R"({"$symbol":)";
            appendJSONString(out, e.valueStringData());
            out.push_back('}');
            break;
        case BSONType::codeWScope: {
            const char* p = e.value() + 4;
            const int codeSize = ConstDataView(p).readLE<std::int32_t>();
            out += R"({"$code":)";
            appendJSONString(out, StringData(p + 4, codeSize - 1));
            out += R"(,"$scope":)";
            appendObjectJSON(out, BSONObj(p + 4 + codeSize), false);
            out.push_back('}');
            break;
        }
        case BSONType::numberInt:
            out += std::to_string(e._numberInt());
            break;
        case BSONType::timestamp: {
            const Timestamp ts = e.timestamp();
            out += fmt::format(
                R"({{"$timestamp":{{"t":{},"i":{}}}}})", ts.getSecs(), ts.getInc());
            break;
        }
        case BSONType::numberLong:
            out += std::to_string(e._numberLong());
            break;
        case BSONType::numberDecimal:
            out += fmt::format(R"({{"$numberDecimal":"{}"}})", e.decimalToString());
            break;
        case BSONType::minKey:
            out += R"({"$minKey":1})";
            break;
        case BSONType::maxKey:
            out += R"({"$maxKey":1})";
            break;
    }
}

}  // namespace

BSONElement::BSONElement() : _data(kEOOElement), _fieldNameSize(0), _totalSize(1) {}

BSONElement::BSONElement(const char* d) : _data(d) {
    if (eoo()) {
        _fieldNameSize = 0;
        _totalSize = 1;
        return;
    }

    _fieldNameSize = static_cast<int>(std::strlen(d + 1)) + 1;

    int x = 0;
    const char* v = value();
    switch (type()) {
        case BSONType::eoo:
        case BSONType::minKey:
        case BSONType::maxKey:
        case BSONType::undefined:
        case BSONType::null:
            break;
        case BSONType::boolean:
            x = 1;
            break;
        case BSONType::numberInt:
            x = 4;
            break;
        case BSONType::timestamp:
        case BSONType::date:
        case BSONType::numberDouble:
        case BSONType::numberLong:
            x = 8;
            break;
        case BSONType::oid:
            x = 12;
            break;
        case BSONType::numberDecimal:
            x = 16;
            break;
        case BSONType::symbol:
        case BSONType::code:
        case BSONType::string:
            x = valuestrsize() + 4;
            break;
        case BSONType::dbRef:
            x = valuestrsize() + 4 + 12;
            break;
        case BSONType::codeWScope:
        case BSONType::object:
        case BSONType::array:
            x = ConstDataView(v).readLE<std::int32_t>();
            break;
        case BSONType::binData:
            x = valuestrsize() + 4 + 1 /*subtype*/;
            break;
        case BSONType::regEx: {
            const char* p = v;
            size_t len1 = std::strlen(p);
            p = p + len1 + 1;
            size_t len2 = std::strlen(p);
            x = static_cast<int>(len1 + 1 + len2 + 1);
            break;
        }
    }
    _totalSize = x + _fieldNameSize + 1;  // BSONType
}

int BSONElement::numberInt() const {
    switch (type()) {
        case BSONType::numberDouble:
            return static_cast<int>(_numberDouble());
        case BSONType::numberInt:
            return _numberInt();
        case BSONType::numberLong:
            return static_cast<int>(_numberLong());
        case BSONType::numberDecimal:
            return static_cast<int>(numberDouble());
        default:
            return 0;
    }
}

long long BSONElement::numberLong() const {
    switch (type()) {
        case BSONType::numberDouble:
            return static_cast<long long>(_numberDouble());
        case BSONType::numberInt:
            return _numberInt();
        case BSONType::numberLong:
            return _numberLong();
        case BSONType::numberDecimal:
            return static_cast<long long>(numberDouble());
        default:
            return 0;
    }
}

double BSONElement::numberDouble() const {
    switch (type()) {
        case BSONType::numberDouble:
            return _numberDouble();
        case BSONType::numberInt:
            return _numberInt();
        case BSONType::numberLong:
            return static_cast<double>(_numberLong());
        case BSONType::numberDecimal: {
            const auto parts = decodeDecimal(value());
            if (parts.isNaN)
                return std::nan("");
            if (parts.isInfinity)
                return parts.negative ? -HUGE_VAL : HUGE_VAL;
            const long double magnitude =
                static_cast<long double>(parts.coefficient) * std::pow(10.0L, parts.exponent);
            return static_cast<double>(parts.negative ? -magnitude : magnitude);
        }
        default:
            return 0;
    }
}

bool BSONElement::decimalIsZero() const {
    if (type() != BSONType::numberDecimal)
        return false;
    const auto parts = decodeDecimal(value());
    return !parts.isNaN && !parts.isInfinity && parts.coefficient == 0;
}

std::string BSONElement::decimalToString() const {
    const auto parts = decodeDecimal(value());
    if (parts.isNaN)
        return "NaN";
    if (parts.isInfinity)
        return parts.negative ? "-Infinity" : "Infinity";

    const std::string digits = coefficientDigits(parts.coefficient);
    const int numDigits = static_cast<int>(digits.size());
    const int adjusted = parts.exponent + (numDigits - 1);

    std::string out = parts.negative ? "-" : "";
    if (parts.exponent <= 0 && adjusted >= -6) {
        if (parts.exponent == 0) {
            out += digits;
        } else if (numDigits > -parts.exponent) {
            const int pointPos = numDigits + parts.exponent;
            out += digits.substr(0, pointPos);
            out.push_back('.');
            out += digits.substr(pointPos);
        } else {
            out += "0.";
            out.append(-parts.exponent - numDigits, '0');
            out += digits;
        }
        return out;
    }

    out.push_back(digits[0]);
    if (numDigits > 1) {
        out.push_back('.');
        out += digits.substr(1);
    }
    out += fmt::format("E{}{}", adjusted >= 0 ? "+" : "", adjusted);
    return out;
}

BSONObj BSONElement::embeddedObject() const {
    if (!isABSONObj())
        return BSONObj();
    return BSONObj(value());
}

BSONObj BSONElement::Obj() const {
    uassert(ErrorCodes::TypeMismatch,
            fmt::format("field '{}' has type {}, expected object or array",
                        fieldNameStringData().toStringView(),
                        typeName(type())),
            isABSONObj());
    return BSONObj(value());
}

std::vector<BSONElement> BSONElement::Array() const {
    uassert(ErrorCodes::TypeMismatch,
            fmt::format("field '{}' has type {}, expected array",
                        fieldNameStringData().toStringView(),
                        typeName(type())),
            type() == BSONType::array);
    std::vector<BSONElement> out;
    for (auto&& e : embeddedObject())
        out.push_back(e);
    return out;
}

bool BSONElement::trueValue() const {
    switch (type()) {
        case BSONType::numberLong:
            return _numberLong() != 0;
        case BSONType::numberDouble:
            return _numberDouble() != 0;
        case BSONType::numberInt:
            return _numberInt() != 0;
        case BSONType::numberDecimal:
            return !decimalIsZero();
        case BSONType::boolean:
            return boolean();
        case BSONType::eoo:
        case BSONType::null:
        case BSONType::undefined:
            return false;
        default:
            return true;
    }
}

BSONObj BSONElement::wrap() const {
    BSONObjBuilder b(size() + 6);
    b.append(*this);
    return b.obj();
}

BSONObj BSONElement::wrap(StringData newName) const {
    BSONObjBuilder b(size() + 6 + static_cast<int>(newName.size()));
    b.appendAs(*this, newName);
    return b.obj();
}

std::string BSONElement::jsonString(bool includeFieldNames) const {
    std::string out;
    if (includeFieldNames) {
        appendJSONString(out, fieldNameStringData());
        out.push_back(':');
    }
    appendValueJSON(out, *this);
    return out;
}

bool BSONElement::binaryEqualValues(const BSONElement& rhs) const {
    if (type() != rhs.type() || valuesize() != rhs.valuesize())
        return false;
    return std::memcmp(value(), rhs.value(), valuesize()) == 0;
}

std::ostream& operator<<(std::ostream& s, const BSONElement& e) {
    return s << e.toString();
}

std::string BSONObj::jsonString() const {
    std::string out;
    appendObjectJSON(out, *this, false);
    return out;
}

}  // namespace oplogmirror

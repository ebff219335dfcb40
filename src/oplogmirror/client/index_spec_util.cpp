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

#define OPLOGMIRROR_LOGV2_DEFAULT_COMPONENT ::oplogmirror::logv2::LogComponent::kCommand

#include "oplogmirror/client/index_spec_util.h"

#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <boost/optional.hpp>

#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/logv2/log.h"

namespace oplogmirror {
namespace {

constexpr auto kBackgroundField = "background"_sd;
constexpr auto kIndexVersionField = "v"_sd;

bool isLegacyKeyValue(const BSONElement& value) {
    switch (value.type()) {
        case BSONType::numberInt:
        case BSONType::numberLong:
        case BSONType::numberDouble:
            return value.numberDouble() == 0;
        case BSONType::numberDecimal:
            return value.decimalToString() == "0";
        case BSONType::string:
            return value.valueStringData().empty();
        default:
            return true;
    }
}

boost::optional<double> numericKeyValue(const BSONElement& value) {
    if (value.isNumber())
        return value.numberDouble();
    if (value.type() == BSONType::string) {
        double parsed;
        if (boost::conversion::try_lexical_convert(value.str(), parsed))
            return parsed;
    }
    return boost::none;
}

}  // namespace

BSONObj fixOutgoingIndexSpec(const BSONObj& spec) {
    return appendV1IfMissing(spec.removeField(kBackgroundField));
}

BSONObj appendV1IfMissing(const BSONObj& spec) {
    if (spec.hasField(kIndexVersionField))
        return spec;
    BSONObjBuilder bob;
    bob.appendElements(spec);
    bob.append(kIndexVersionField, 1);
    return bob.obj();
}

BSONObj convertLegacyIndexKeys(const BSONObj& keyPattern, StringData ns) {
    bool converted = false;
    BSONObjBuilder bob;
    for (const auto& elem : keyPattern) {
        if (isLegacyKeyValue(elem)) {
            bob.append(elem.fieldNameStringData(), 1);
            converted = true;
        } else {
            bob.append(elem);
        }
    }
    if (!converted)
        return keyPattern;

    BSONObj result = bob.obj();
    LOGV2(8104001,
          "Converted legacy index key values",
          "original"_attr = keyPattern,
          "converted"_attr = result,
          "namespace"_attr = ns);
    return result;
}

bool isIndexKeysEqual(const BSONObj& lhs, const BSONObj& rhs) {
    auto lhsIt = lhs.begin();
    auto rhsIt = rhs.begin();
    for (; lhsIt != lhs.end() && rhsIt != rhs.end(); ++lhsIt, ++rhsIt) {
        if (lhsIt->fieldNameStringData() != rhsIt->fieldNameStringData())
            return false;

        auto lhsNumber = numericKeyValue(*lhsIt);
        auto rhsNumber = numericKeyValue(*rhsIt);
        if (lhsNumber && rhsNumber) {
            if (*lhsNumber != *rhsNumber)
                return false;
        } else if (!lhsIt->binaryEqualValues(*rhsIt)) {
            return false;
        }
    }
    return lhsIt == lhs.end() && rhsIt == rhs.end();
}

}  // namespace oplogmirror

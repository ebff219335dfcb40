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

#include "oplogmirror/client/index_spec_util.h"

#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/unittest/unittest.h"

namespace oplogmirror {
namespace {

// Decimal128 with a zero exponent has the biased exponent 6176 in the high bits.
constexpr std::uint64_t kDecimalExponentZero = 0x3040000000000000ULL;
constexpr std::uint64_t kDecimalExponentMinusTwo = 0x303C000000000000ULL;
constexpr std::uint64_t kDecimalNegative = 0x8000000000000000ULL;

TEST(IndexSpecUtilTest, FixOutgoingIndexSpecDropsBackgroundAndAddsVersion) {
    BSONObj spec = BSON("key" << BSON("a" << 1) << "name" << "a_1" << "background" << true);
    ASSERT_BSONOBJ_EQ(BSON("key" << BSON("a" << 1) << "name" << "a_1" << "v" << 1),
                      fixOutgoingIndexSpec(spec));
}

TEST(IndexSpecUtilTest, AppendV1IfMissingKeepsExistingVersion) {
    BSONObj spec = BSON("key" << BSON("a" << 1) << "name" << "a_1" << "v" << 2);
    ASSERT_BSONOBJ_EQ(spec, appendV1IfMissing(spec));
    ASSERT_BSONOBJ_EQ(BSON("name" << "a_1" << "v" << 1), appendV1IfMissing(BSON("name" << "a_1")));
}

TEST(IndexSpecUtilTest, ConvertLegacyIndexKeysNumbers) {
    BSONObj key = BSON("foo" << 0 << "int32field" << 2 << "int64field" << -3LL << "float64field"
                             << -1.0 << "float64field2" << -1.1 << "zeroDouble" << 0.0);
    ASSERT_BSONOBJ_EQ(BSON("foo" << 1 << "int32field" << 2 << "int64field" << -3LL
                                 << "float64field" << -1.0 << "float64field2" << -1.1
                                 << "zeroDouble" << 1),
                      convertLegacyIndexKeys(key, "test.coll"));
}

TEST(IndexSpecUtilTest, ConvertLegacyIndexKeysDecimals) {
    BSONObjBuilder bob;
    bob.appendDecimal128("key1", kDecimalExponentZero | kDecimalNegative, 1);
    bob.appendDecimal128("key2", kDecimalExponentZero, 0);
    bob.appendDecimal128("key3", kDecimalExponentZero, 1);
    bob.appendDecimal128("key4", kDecimalExponentMinusTwo, 0);
    BSONObj key = bob.obj();

    BSONObj converted = convertLegacyIndexKeys(key, "test.coll");
    ASSERT_EQUALS(4, converted.nFields());
    ASSERT_TRUE(converted["key1"].binaryEqual(key["key1"]));
    ASSERT_EQUALS(BSONType::numberInt, converted["key2"].type());
    ASSERT_EQUALS(1, converted["key2"].numberInt());
    ASSERT_TRUE(converted["key3"].binaryEqual(key["key3"]));
    ASSERT_TRUE(converted["key4"].binaryEqual(key["key4"]));
}

TEST(IndexSpecUtilTest, ConvertLegacyIndexKeysStrings) {
    BSONObj key = BSON("key1" << "" << "key2" << "1" << "key3" << "-1" << "key4" << "2dsphere");
    ASSERT_BSONOBJ_EQ(BSON("key1" << 1 << "key2" << "1" << "key3" << "-1" << "key4"
                                  << "2dsphere"),
                      convertLegacyIndexKeys(key, "test.coll"));
}

TEST(IndexSpecUtilTest, ConvertLegacyIndexKeysOtherTypes) {
    BSONObjBuilder bob;
    bob.append("key1", BSON("invalid" << 1));
    bob.appendBinData("key2", 0, BinDataGeneral, "");
    bob.append("key3", true);
    ASSERT_BSONOBJ_EQ(BSON("key1" << 1 << "key2" << 1 << "key3" << 1),
                      convertLegacyIndexKeys(bob.obj(), "test.coll"));
}

TEST(IndexSpecUtilTest, ConvertLegacyIndexKeysLeavesValidKeysAlone) {
    BSONObj key = BSON("a" << 1 << "b" << -1 << "c" << "text");
    ASSERT_BSONOBJ_EQ(key, convertLegacyIndexKeys(key, "test.coll"));
}

TEST(IndexSpecUtilTest, IsIndexKeysEqual) {
    ASSERT_TRUE(isIndexKeysEqual(BSON("a" << 1 << "b" << 1), BSON("a" << 1.0 << "b" << 1LL)));
    ASSERT_TRUE(isIndexKeysEqual(BSON("a" << "1" << "b" << "1"), BSON("a" << 1 << "b" << 1)));
    ASSERT_TRUE(isIndexKeysEqual(BSON("a" << -1.0 << "b" << "1.0"), BSON("a" << -1 << "b" << 1)));
    ASSERT_TRUE(isIndexKeysEqual(BSON("loc" << "2dsphere"), BSON("loc" << "2dsphere")));
    ASSERT_TRUE(isIndexKeysEqual(BSONObj(), BSONObj()));

    ASSERT_FALSE(isIndexKeysEqual(BSON("a" << -2.0), BSON("a" << -1)));
    ASSERT_FALSE(isIndexKeysEqual(BSON("a" << "1.1"), BSON("a" << 1)));
    ASSERT_FALSE(isIndexKeysEqual(BSON("b" << 1), BSON("a" << 1)));
    ASSERT_FALSE(isIndexKeysEqual(BSON("a" << 1 << "b" << 1), BSON("b" << 1 << "a" << 1)));
    ASSERT_FALSE(isIndexKeysEqual(BSON("a" << 1), BSON("a" << 1 << "b" << 1)));
    ASSERT_FALSE(isIndexKeysEqual(BSON("loc" << "2d"), BSON("loc" << "2dsphere")));
}

}  // namespace
}  // namespace oplogmirror

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

#include "oplogmirror/db/write_concern_options.h"

#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/unittest/unittest.h"

namespace oplogmirror {
namespace {

TEST(WriteConcernOptionsTest, DefaultIsMajority) {
    WriteConcernOptions wc;
    ASSERT_TRUE(wc.isMajority());
    ASSERT_FALSE(wc.isUnacknowledged());
    ASSERT_BSONOBJ_EQ(BSON("w" << "majority"), wc.toBSON());
}

TEST(WriteConcernOptionsTest, ParseString) {
    auto swWC = WriteConcernOptions::parse("majority"_sd);
    ASSERT_OK(swWC.getStatus());
    ASSERT_TRUE(swWC.getValue().isMajority());

    swWC = WriteConcernOptions::parse(""_sd);
    ASSERT_OK(swWC.getStatus());
    ASSERT_TRUE(swWC.getValue().isMajority());

    swWC = WriteConcernOptions::parse("34"_sd);
    ASSERT_OK(swWC.getStatus());
    ASSERT_FALSE(swWC.getValue().usesMode());
    ASSERT_EQUALS(34, swWC.getValue().getWNumNodes());

    swWC = WriteConcernOptions::parse("tagset"_sd);
    ASSERT_OK(swWC.getStatus());
    ASSERT_TRUE(swWC.getValue().usesMode());
    ASSERT_FALSE(swWC.getValue().isMajority());
    ASSERT_EQUALS("tagset", swWC.getValue().getWMode());
}

TEST(WriteConcernOptionsTest, ParseStringRejectsNegative) {
    ASSERT_EQUALS(ErrorCodes::BadValue, WriteConcernOptions::parse("-1"_sd).getStatus());
    ASSERT_EQUALS(ErrorCodes::BadValue, WriteConcernOptions::parse("-2"_sd).getStatus());
}

TEST(WriteConcernOptionsTest, ParseDocument) {
    auto swWC = WriteConcernOptions::parse(BSON("w" << 0));
    ASSERT_OK(swWC.getStatus());
    ASSERT_TRUE(swWC.getValue().isUnacknowledged());

    swWC = WriteConcernOptions::parse(BSON("w" << 0 << "j" << true));
    ASSERT_OK(swWC.getStatus());
    ASSERT_FALSE(swWC.getValue().isUnacknowledged());
    ASSERT_TRUE(swWC.getValue().getJournal());

    swWC = WriteConcernOptions::parse(BSON("w" << 3 << "wtimeout" << 43000));
    ASSERT_OK(swWC.getStatus());
    ASSERT_EQUALS(3, swWC.getValue().getWNumNodes());
    ASSERT_EQUALS(Milliseconds(43000), swWC.getValue().getTimeout());
    ASSERT_BSONOBJ_EQ(BSON("w" << 3 << "wtimeout" << 43000LL), swWC.getValue().toBSON());

    swWC = WriteConcernOptions::parse(BSONObj());
    ASSERT_OK(swWC.getStatus());
    ASSERT_TRUE(swWC.getValue().isMajority());
}

TEST(WriteConcernOptionsTest, ParseDocumentRejectsBadValues) {
    ASSERT_EQUALS(ErrorCodes::BadValue, WriteConcernOptions::parse(BSON("w" << -1)).getStatus());
    ASSERT_EQUALS(ErrorCodes::TypeMismatch,
                  WriteConcernOptions::parse(BSON("w" << true)).getStatus());
    ASSERT_EQUALS(ErrorCodes::BadValue,
                  WriteConcernOptions::parse(BSON("w" << 1 << "wtimeout" << -5)).getStatus());
}

TEST(WriteConcernOptionsTest, AttachToReplacesExistingWriteConcern) {
    BSONObj cmd = BSON("drop" << "coll" << "writeConcern" << BSON("w" << 1));
    ASSERT_BSONOBJ_EQ(BSON("drop" << "coll" << "writeConcern" << BSON("w" << "majority")),
                      WriteConcernOptions::majority().attachTo(cmd));
}

}  // namespace
}  // namespace oplogmirror

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

#include "oplogmirror/tools/bson_file_reader.h"

#include <sstream>
#include <string>

#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/unittest/unittest.h"

namespace oplogmirror {
namespace {

std::string concat(const std::vector<BSONObj>& docs) {
    std::string out;
    for (const auto& doc : docs)
        out.append(doc.objdata(), doc.objsize());
    return out;
}

TEST(BSONFileReaderTest, ReadsDocumentsBackToBack) {
    const std::vector<BSONObj> docs{BSON("a" << 1), BSON("b" << "two"), BSON("c" << BSON("d" << 3))};
    std::istringstream in(concat(docs));
    BSONFileReader reader(in, true);

    for (const auto& expected : docs) {
        auto swDoc = reader.next();
        ASSERT_OK(swDoc.getStatus());
        ASSERT_TRUE(swDoc.getValue());
        ASSERT_BSONOBJ_EQ(expected, *swDoc.getValue());
        ASSERT_TRUE(swDoc.getValue()->isOwned());
    }

    auto swEnd = reader.next();
    ASSERT_OK(swEnd.getStatus());
    ASSERT_FALSE(swEnd.getValue());
    ASSERT_EQUALS(3, reader.getDocumentsRead());
    ASSERT_EQUALS(static_cast<long long>(concat(docs).size()), reader.getBytesRead());
}

TEST(BSONFileReaderTest, EmptyInput) {
    std::istringstream in("");
    BSONFileReader reader(in, true);
    auto swDoc = reader.next();
    ASSERT_OK(swDoc.getStatus());
    ASSERT_FALSE(swDoc.getValue());
}

TEST(BSONFileReaderTest, TruncatedSize) {
    std::istringstream in(concat({BSON("a" << 1)}) + std::string("\x10\x00", 2));
    BSONFileReader reader(in, true);
    ASSERT_OK(reader.next().getStatus());
    Status status = reader.next().getStatus();
    ASSERT_EQUALS(ErrorCodes::FailedToParse, status.code());
    ASSERT_STRING_CONTAINS(status.reason(), "truncated document size");
}

TEST(BSONFileReaderTest, TruncatedDocument) {
    const std::string bytes = concat({BSON("a" << 1 << "b" << 2)});
    std::istringstream in(bytes.substr(0, bytes.size() - 3));
    BSONFileReader reader(in, true);
    Status status = reader.next().getStatus();
    ASSERT_EQUALS(ErrorCodes::FailedToParse, status.code());
    ASSERT_STRING_CONTAINS(status.reason(), "truncated document");
}

TEST(BSONFileReaderTest, InvalidSize) {
    std::istringstream in(std::string("\x02\x00\x00\x00", 4));
    BSONFileReader reader(in, true);
    Status status = reader.next().getStatus();
    ASSERT_EQUALS(ErrorCodes::FailedToParse, status.code());
    ASSERT_STRING_CONTAINS(status.reason(), "invalid object size 2");
}

TEST(BSONFileReaderTest, ObjcheckRejectsUnknownType) {
    std::string bytes = concat({BSON("a" << 1)});
    bytes[4] = '\x30';

    {
        std::istringstream in(bytes);
        BSONFileReader reader(in, true);
        Status status = reader.next().getStatus();
        ASSERT_EQUALS(ErrorCodes::FailedToParse, status.code());
        ASSERT_STRING_CONTAINS(status.reason(), "invalid document number 1");
    }
    {
        std::istringstream in(bytes);
        BSONFileReader reader(in, false);
        auto swDoc = reader.next();
        ASSERT_OK(swDoc.getStatus());
        ASSERT_EQUALS(static_cast<int>(bytes.size()), swDoc.getValue()->objsize());
    }
}

}  // namespace
}  // namespace oplogmirror

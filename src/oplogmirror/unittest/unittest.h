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

/**
 * Test helpers layered on GoogleTest: assertions that understand Status, StatusWith and
 * BSONObj, and access to the log lines a test produced.
 */

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "oplogmirror/base/status.h"
#include "oplogmirror/base/status_with.h"
#include "oplogmirror/base/string_data.h"
#include "oplogmirror/bson/bsonobj.h"

namespace oplogmirror {
namespace unittest {

using Test = ::testing::Test;

inline const Status& toStatus(const Status& s) {
    return s;
}

template <typename T>
const Status& toStatus(const StatusWith<T>& sw) {
    return sw.getStatus();
}

/**
 * Starts collecting every log line written from now on, dropping lines collected before.
 */
void startCapturingLogMessages();
void stopCapturingLogMessages();

std::vector<std::string> getCapturedTextFormatLogMessages();

/**
 * Returns the number of captured log lines that contain 'needle'.
 */
int countTextFormatLogLinesContaining(StringData needle);

}  // namespace unittest
}  // namespace oplogmirror

/**
 * Fails unless "EXPRESSION" is true.
 */
#define ASSERT(EXPRESSION) ASSERT_TRUE(EXPRESSION)

/**
 * Asserts that a Status or StatusWith is OK, printing the error otherwise.
 */
#define ASSERT_OK(EXPRESSION)                                                    \
    do {                                                                         \
        const ::oplogmirror::Status assertOkStatus_ =                            \
            ::oplogmirror::unittest::toStatus(EXPRESSION);                       \
        ASSERT_TRUE(assertOkStatus_.isOK())                                      \
            << "Expected " #EXPRESSION " to be OK but got " << assertOkStatus_.toString(); \
    } while (false)

#define ASSERT_NOT_OK(EXPRESSION) \
    ASSERT_FALSE(::oplogmirror::unittest::toStatus(EXPRESSION).isOK()) << #EXPRESSION " is OK"

#define ASSERT_EQUALS(a, b) ASSERT_EQ(a, b)
#define ASSERT_NOT_EQUALS(a, b) ASSERT_NE(a, b)
#define ASSERT_LESS_THAN(a, b) ASSERT_LT(a, b)
#define ASSERT_LTE(a, b) ASSERT_LE(a, b)
#define ASSERT_GREATER_THAN(a, b) ASSERT_GT(a, b)
#define ASSERT_GTE(a, b) ASSERT_GE(a, b)

/**
 * Compares two documents byte for byte and prints both as JSON on mismatch.
 */
#define ASSERT_BSONOBJ_EQ(a, b)                                                     \
    ASSERT_TRUE((a).binaryEqual(b)) << "Expected " << (a).jsonString() << " == " \
                                    << (b).jsonString()

#define ASSERT_BSONOBJ_NE(a, b) \
    ASSERT_FALSE((a).binaryEqual(b)) << "Expected " << (a).jsonString() << " != " << (b).jsonString()

#define ASSERT_STRING_CONTAINS(BIG_STRING, CONTAINS)                                  \
    ASSERT_NE(std::string(BIG_STRING).find(CONTAINS), std::string::npos)              \
        << "Expected to find '" << (CONTAINS) << "' in '" << (BIG_STRING) << "'"

/**
 * Behaves like ASSERT_THROWS, but also fails if the exception's code() is not CODE.
 */
#define ASSERT_THROWS_CODE(STATEMENT, EXCEPTION_TYPE, CODE)                      \
    do {                                                                         \
        bool threwExpected_ = false;                                             \
        try {                                                                    \
            STATEMENT;                                                           \
        } catch (const EXCEPTION_TYPE& ex) {                                     \
            threwExpected_ = true;                                               \
            ASSERT_EQ(ex.code(), (CODE)) << ex.toString();                       \
        }                                                                        \
        ASSERT_TRUE(threwExpected_) << "Expected " #STATEMENT " to throw";       \
    } while (false)

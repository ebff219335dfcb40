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

#include "oplogmirror/client/error_classifier.h"

#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/rpc/get_status_from_command_result.h"
#include "oplogmirror/unittest/unittest.h"

namespace oplogmirror {
namespace {

Status bulkWriteError(std::vector<int> codes, boost::optional<int> wcCode = boost::none) {
    std::vector<WriteErrorDetail> writeErrors;
    int index = 0;
    for (int code : codes)
        writeErrors.push_back({index++, ErrorCodes::Error(code), "write failed"});
    boost::optional<WriteConcernErrorDetail> wcError;
    if (wcCode)
        wcError = WriteConcernErrorDetail{ErrorCodes::Error(*wcCode), "", "wc failed"};
    return Status(BulkWriteErrorInfo(std::move(writeErrors), std::move(wcError)), "bulk failed");
}

Status writeConcernError(int code) {
    return Status(WriteConcernErrorInfo({ErrorCodes::Error(code), "", "wc failed"}), "wc failed");
}

TEST(ErrorClassifierTest, GetErrorCodeOfEachShape) {
    ASSERT_EQUALS(0, getErrorCode(Status::OK()));
    ASSERT_EQUALS(26, getErrorCode(Status(ErrorCodes::NamespaceNotFound, "ns not found")));
    ASSERT_EQUALS(11000, getErrorCode(bulkWriteError({11000, 2})));
    ASSERT_EQUALS(64, getErrorCode(bulkWriteError({}, 64)));
    ASSERT_EQUALS(0, getErrorCode(bulkWriteError({})));
    ASSERT_EQUALS(100, getErrorCode(writeConcernError(100)));
    ASSERT_EQUALS(0, getErrorCode(Status(ErrorCodes::UnknownError, "no code")));
}

TEST(ErrorClassifierTest, ReconnectableCodes) {
    for (int code : {10107, 13435, 13436, 64, 6, 7, 89, 9001, 91, 189, 11600, 11601, 11602, 136,
                     175}) {
        SCOPED_TRACE(code);
        ASSERT_TRUE(isReconnectableError(Status(ErrorCodes::Error(code), "transient")));
    }
}

TEST(ErrorClassifierTest, CommandErrorsAreNotReconnectable) {
    for (int code : {2, 13, 26, 48, 67, 197, 11000}) {
        SCOPED_TRACE(code);
        ASSERT_FALSE(isReconnectableError(Status(ErrorCodes::Error(code), "permanent")));
    }
    ASSERT_FALSE(isReconnectableError(Status::OK()));
}

TEST(ErrorClassifierTest, EveryWriteConcernErrorIsReconnectable) {
    ASSERT_TRUE(isReconnectableError(writeConcernError(100)));
    ASSERT_TRUE(isReconnectableError(writeConcernError(0)));
}

TEST(ErrorClassifierTest, BulkWriteErrorClassifiedByFirstWriteError) {
    ASSERT_TRUE(isReconnectableError(bulkWriteError({10107, 11000})));
    ASSERT_FALSE(isReconnectableError(bulkWriteError({11000, 10107})));
    ASSERT_TRUE(isReconnectableError(bulkWriteError({}, 64)));
}

TEST(ErrorClassifierTest, CodelessNotMasterIsReconnectable) {
    ASSERT_TRUE(isReconnectableError(Status(ErrorCodes::UnknownError, "not master")));
    ASSERT_TRUE(isReconnectableError(
        getStatusFromCommandResult(BSON("ok" << 0 << "errmsg" << "node is not master"))));
    ASSERT_FALSE(isReconnectableError(Status(ErrorCodes::UnknownError, "something else")));
}

TEST(ErrorClassifierTest, NetworkErrors) {
    ASSERT_TRUE(isNetworkError(Status(ErrorCodes::HostUnreachable, "no route")));
    ASSERT_TRUE(isNetworkError(Status(ErrorCodes::ConnectionClosed, "closed")));
    ASSERT_TRUE(isNetworkError(Status(ErrorCodes::InternalError, "no reachable servers")));
    ASSERT_TRUE(isNetworkError(Status(ErrorCodes::InternalError, "Closed explicitly")));
    ASSERT_TRUE(isNetworkError(Status(ErrorCodes::InternalError, "EOF")));
    ASSERT_TRUE(isNetworkError(Status(ErrorCodes::InternalError, "connection reset by peer")));
    ASSERT_FALSE(isNetworkError(Status(ErrorCodes::DuplicateKey, "dup")));
    ASSERT_FALSE(isNetworkError(Status::OK()));

    ASSERT_TRUE(isReconnectableError(Status(ErrorCodes::InternalError, "connection closed")));
}

TEST(ErrorClassifierTest, ConnectionErrors) {
    ASSERT_TRUE(isConnectionError(Status(ErrorCodes::SocketException, "reset")));
    ASSERT_TRUE(isConnectionError(Status(ErrorCodes::NotWritablePrimary, "not primary")));
    ASSERT_TRUE(isConnectionError(Status(ErrorCodes::ShutdownInProgress, "shutting down")));
    ASSERT_FALSE(isConnectionError(Status(ErrorCodes::Unauthorized, "no")));
}

TEST(ErrorClassifierTest, DuplicateKey) {
    for (int code : {11000, 11001, 12582}) {
        SCOPED_TRACE(code);
        ASSERT_TRUE(isDuplicateKeyError(Status(ErrorCodes::Error(code), "dup")));
        ASSERT_TRUE(isDuplicateKeyError(bulkWriteError({2, code})));
    }
    ASSERT_FALSE(isDuplicateKeyError(bulkWriteError({2, 3})));
    ASSERT_FALSE(isDuplicateKeyError(writeConcernError(11000)));
    ASSERT_FALSE(isDuplicateKeyError(Status::OK()));
}

TEST(ErrorClassifierTest, CommandErrorPredicates) {
    ASSERT_TRUE(isNamespaceNotFoundError(Status(ErrorCodes::NamespaceNotFound, "")));
    ASSERT_FALSE(isNamespaceNotFoundError(Status(ErrorCodes::NamespaceExists, "")));
    ASSERT_TRUE(isNamespaceExistsError(Status(ErrorCodes::NamespaceExists, "")));
    ASSERT_TRUE(isInvalidIndexSpecificationOptionError(
        Status(ErrorCodes::InvalidIndexSpecificationOption, "")));
    ASSERT_TRUE(isCannotCreateIndexError(Status(ErrorCodes::CannotCreateIndex, "")));
    ASSERT_TRUE(isUnauthorizedError(Status(ErrorCodes::Unauthorized, "")));
    ASSERT_TRUE(isViewError(Status(ErrorCodes::CommandNotSupportedOnView, "")));
    ASSERT_TRUE(isInvalidOptionsError(Status(ErrorCodes::InvalidOptions, "")));
}

TEST(ErrorClassifierTest, CommandNotFound) {
    ASSERT_TRUE(isCommandNotFoundError(Status(ErrorCodes::CommandNotFound, "")));
    ASSERT_TRUE(isCommandNotFoundError(Status(ErrorCodes::CommandNotFoundLegacy, "")));
    ASSERT_TRUE(isCommandNotFoundError(Status(ErrorCodes::UnknownError, "no such cmd: foo")));
    ASSERT_FALSE(isCommandNotFoundError(Status::OK()));
}

TEST(ErrorClassifierTest, CursorNotFound) {
    ASSERT_TRUE(isCursorNotFoundError(Status(ErrorCodes::CursorNotFound, "")));
    ASSERT_TRUE(isCursorNotFoundError(Status(ErrorCodes::UnknownError, "cursor not found")));
    ASSERT_FALSE(isCursorNotFoundError(Status(ErrorCodes::BadValue, "")));
}

TEST(ErrorClassifierTest, BadHint) {
    ASSERT_TRUE(isBadHintError(Status(ErrorCodes::BadHintLegacy, "planner returned error")));
    ASSERT_TRUE(
        isBadHintError(Status(ErrorCodes::BadValue, "planner returned error: bad hint")));
    ASSERT_FALSE(isBadHintError(Status(ErrorCodes::BadValue, "something else")));
}

}  // namespace
}  // namespace oplogmirror

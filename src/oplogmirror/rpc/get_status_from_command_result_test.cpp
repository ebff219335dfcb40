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

#include "oplogmirror/rpc/get_status_from_command_result.h"

#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/unittest/unittest.h"

namespace oplogmirror {
namespace {

TEST(GetStatusFromCommandResult, OkReply) {
    ASSERT_OK(getStatusFromCommandResult(BSON("ok" << 1)));
    ASSERT_OK(getStatusFromCommandResult(BSON("ok" << 1.0 << "n" << 3)));
    ASSERT_OK(getStatusFromCommandResult(BSON("ok" << true)));
}

TEST(GetStatusFromCommandResult, ErrorReplyKeepsCodeAndMessage) {
    Status status = getStatusFromCommandResult(
        BSON("ok" << 0 << "errmsg" << "ns not found" << "code" << 26 << "codeName"
                  << "NamespaceNotFound"));
    ASSERT_EQUALS(ErrorCodes::NamespaceNotFound, status.code());
    ASSERT_EQUALS("ns not found", status.reason());
}

TEST(GetStatusFromCommandResult, CodeUnknownToThisProcessIsKept) {
    Status status =
        getStatusFromCommandResult(BSON("ok" << 0 << "errmsg" << "odd" << "code" << 424242));
    ASSERT_EQUALS(424242, static_cast<int>(status.code()));
}

TEST(GetStatusFromCommandResult, ErrorReplyWithoutCodeIsUnknownError) {
    Status status = getStatusFromCommandResult(BSON("ok" << 0 << "errmsg" << "not master"));
    ASSERT_EQUALS(ErrorCodes::UnknownError, status.code());
    ASSERT_EQUALS("not master", status.reason());
}

TEST(GetStatusFromCommandResult, LegacyQueryFailure) {
    Status status = getStatusFromCommandResult(BSON("$err" << "bad hint" << "code" << 17007));
    ASSERT_EQUALS(ErrorCodes::BadHintLegacy, status.code());
}

TEST(GetStatusFromCommandResult, MissingOkFailsToParse) {
    ASSERT_EQUALS(ErrorCodes::FailedToParse, getStatusFromCommandResult(BSON("n" << 1)).code());
}

TEST(GetWriteConcernStatus, NoWriteConcernError) {
    ASSERT_OK(getWriteConcernStatusFromCommandResult(BSON("ok" << 1)));
}

TEST(GetWriteConcernStatus, WriteConcernErrorCarriesDetail) {
    Status status = getWriteConcernStatusFromCommandResult(
        BSON("ok" << 1 << "writeConcernError"
                  << BSON("code" << 64 << "codeName" << "WriteConcernFailed" << "errmsg"
                                 << "waiting for replication timed out")));
    ASSERT_EQUALS(ErrorCodes::WriteConcernError, status.code());
    auto info = status.extraInfo<WriteConcernErrorInfo>();
    ASSERT_TRUE(info);
    ASSERT_EQUALS(ErrorCodes::WriteConcernFailed, info->getDetail().code);
    ASSERT_EQUALS("WriteConcernFailed", info->getDetail().codeName);
    ASSERT_STRING_CONTAINS(status.reason(), "waiting for replication timed out");
    ASSERT_STRING_CONTAINS(status.reason(), "codeName: WriteConcernFailed");
}

TEST(GetStatusFromWriteCommandReply, SingleWriteErrorIsPlainStatus) {
    Status status = getStatusFromWriteCommandReply(
        BSON("ok" << 1 << "n" << 0 << "writeErrors"
                  << BSON_ARRAY(BSON("index" << 0 << "code" << 11000 << "errmsg"
                                             << "E11000 duplicate key error"))));
    ASSERT_EQUALS(ErrorCodes::DuplicateKey, status.code());
    ASSERT_FALSE(status.extraInfo());
}

TEST(GetStatusFromWriteCommandReply, SeveralWriteErrorsAreBulkWriteError) {
    Status status = getStatusFromWriteCommandReply(BSON(
        "ok" << 1 << "n" << 1 << "writeErrors"
             << BSON_ARRAY(BSON("index" << 1 << "code" << 11000 << "errmsg" << "dup")
                           << BSON("index" << 2 << "code" << 2 << "errmsg" << "bad"))));
    ASSERT_EQUALS(ErrorCodes::BulkWriteError, status.code());
    auto info = status.extraInfo<BulkWriteErrorInfo>();
    ASSERT_TRUE(info);
    ASSERT_EQUALS(2U, info->getWriteErrors().size());
    ASSERT_EQUALS(1, info->getWriteErrors()[0].index);
    ASSERT_EQUALS(ErrorCodes::BadValue, info->getWriteErrors()[1].code);
    ASSERT_FALSE(info->getWriteConcernError());
}

TEST(GetStatusFromWriteCommandReply, WriteErrorWithWriteConcernErrorIsBulkWriteError) {
    Status status = getStatusFromWriteCommandReply(
        BSON("ok" << 1 << "writeErrors"
                  << BSON_ARRAY(BSON("index" << 0 << "code" << 11000 << "errmsg" << "dup"))
                  << "writeConcernError" << BSON("code" << 64 << "errmsg" << "timed out")));
    ASSERT_EQUALS(ErrorCodes::BulkWriteError, status.code());
    auto info = status.extraInfo<BulkWriteErrorInfo>();
    ASSERT_TRUE(info);
    ASSERT_TRUE(info->getWriteConcernError());
    ASSERT_EQUALS(ErrorCodes::WriteConcernFailed, info->getWriteConcernError()->code);
}

TEST(GetStatusFromWriteCommandReply, OnlyWriteConcernError) {
    Status status = getStatusFromWriteCommandReply(
        BSON("ok" << 1 << "n" << 4 << "writeConcernError"
                  << BSON("code" << 100 << "errmsg" << "unsatisfiable")));
    ASSERT_EQUALS(ErrorCodes::WriteConcernError, status.code());
}

TEST(GetStatusFromWriteCommandReply, CommandErrorWins) {
    Status status = getStatusFromWriteCommandReply(
        BSON("ok" << 0 << "code" << 13 << "errmsg" << "not authorized"));
    ASSERT_EQUALS(ErrorCodes::Unauthorized, status.code());
}

TEST(GetStatusFromWriteCommandReply, SerializesExtraInfo) {
    Status status = getStatusFromWriteCommandReply(BSON(
        "ok" << 1 << "writeErrors"
             << BSON_ARRAY(BSON("index" << 0 << "code" << 11000 << "errmsg" << "dup")
                           << BSON("index" << 1 << "code" << 11000 << "errmsg" << "dup"))));
    BSONObjBuilder bob;
    status.serialize(&bob);
    BSONObj serialized = bob.obj();
    ASSERT_EQUALS("BulkWriteError", serialized.getStringField("codeName").toString());
    ASSERT_EQUALS(2, serialized.getField("writeErrors").Obj().nFields());
}

}  // namespace
}  // namespace oplogmirror

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

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "oplogmirror/base/error_extra_info.h"
#include "oplogmirror/base/status.h"
#include "oplogmirror/bson/bsonobj.h"

namespace oplogmirror {

class BSONObjBuilder;

/**
 * One entry of the "writeErrors" array of a write command reply.
 */
struct WriteErrorDetail {
    int index = 0;
    ErrorCodes::Error code = ErrorCodes::UnknownError;
    std::string errmsg;

    static WriteErrorDetail parse(const BSONObj& obj);
    BSONObj toBSON() const;
    Status toStatus() const;
};

/**
 * The "writeConcernError" sub-document of a command reply.
 */
struct WriteConcernErrorDetail {
    ErrorCodes::Error code = ErrorCodes::UnknownError;
    std::string codeName;
    std::string errmsg;

    static WriteConcernErrorDetail parse(const BSONObj& obj);
    BSONObj toBSON() const;
    std::string toString() const;
};

/**
 * Attached to ErrorCodes::WriteConcernError statuses: the command itself succeeded but its
 * write concern could not be satisfied.
 */
class WriteConcernErrorInfo final : public ErrorExtraInfo {
public:
    static constexpr auto code = ErrorCodes::WriteConcernError;

    explicit WriteConcernErrorInfo(WriteConcernErrorDetail detail) : _detail(std::move(detail)) {}

    void serialize(BSONObjBuilder* builder) const override;

    const WriteConcernErrorDetail& getDetail() const {
        return _detail;
    }

private:
    WriteConcernErrorDetail _detail;
};

/**
 * Attached to ErrorCodes::BulkWriteError statuses: several documents of one write command
 * failed, possibly along with the write concern.
 */
class BulkWriteErrorInfo final : public ErrorExtraInfo {
public:
    static constexpr auto code = ErrorCodes::BulkWriteError;

    BulkWriteErrorInfo(std::vector<WriteErrorDetail> writeErrors,
                       boost::optional<WriteConcernErrorDetail> writeConcernError)
        : _writeErrors(std::move(writeErrors)), _writeConcernError(std::move(writeConcernError)) {}

    void serialize(BSONObjBuilder* builder) const override;

    const std::vector<WriteErrorDetail>& getWriteErrors() const {
        return _writeErrors;
    }

    const boost::optional<WriteConcernErrorDetail>& getWriteConcernError() const {
        return _writeConcernError;
    }

private:
    std::vector<WriteErrorDetail> _writeErrors;
    boost::optional<WriteConcernErrorDetail> _writeConcernError;
};

/**
 * Returns the Status encoded in a command reply: OK when "ok" is true, otherwise the error
 * named by "code" and "errmsg". A failed reply without a code maps to UnknownError, the way
 * very old servers answer "not master".
 */
Status getStatusFromCommandResult(const BSONObj& result);

/**
 * Returns a WriteConcernError status carrying WriteConcernErrorInfo when 'result' holds a
 * "writeConcernError" field, OK otherwise.
 */
Status getWriteConcernStatusFromCommandResult(const BSONObj& result);

/**
 * Checks a write command (insert, update, delete) reply. The command status is checked first,
 * then "writeErrors" and "writeConcernError". A single write error with no write concern
 * error is returned as a plain status with that error's code; anything more becomes a
 * BulkWriteError status carrying BulkWriteErrorInfo.
 */
Status getStatusFromWriteCommandReply(const BSONObj& reply);

}  // namespace oplogmirror

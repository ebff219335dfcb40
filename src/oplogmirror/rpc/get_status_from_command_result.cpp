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

#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/util/str.h"

namespace oplogmirror {
namespace {

constexpr auto kCmdResponseOkField = "ok"_sd;
constexpr auto kCodeField = "code"_sd;
constexpr auto kCodeNameField = "codeName"_sd;
constexpr auto kErrmsgField = "errmsg"_sd;
constexpr auto kLegacyErrmsgField = "$err"_sd;
constexpr auto kIndexField = "index"_sd;
constexpr auto kWriteErrorsField = "writeErrors"_sd;
constexpr auto kWriteConcernErrorField = "writeConcernError"_sd;

std::string errmsgOf(const BSONObj& obj) {
    BSONElement errmsg = obj[kErrmsgField];
    if (errmsg.eoo())
        errmsg = obj[kLegacyErrmsgField];
    return errmsg.type() == BSONType::string ? errmsg.str() : std::string();
}

ErrorCodes::Error codeOf(const BSONObj& obj) {
    BSONElement code = obj[kCodeField];
    if (!code.isNumber() || code.numberInt() == 0)
        return ErrorCodes::UnknownError;
    return ErrorCodes::Error(code.numberInt());
}

}  // namespace

WriteErrorDetail WriteErrorDetail::parse(const BSONObj& obj) {
    WriteErrorDetail detail;
    detail.index = obj.getIntField(kIndexField);
    detail.code = codeOf(obj);
    detail.errmsg = errmsgOf(obj);
    return detail;
}

BSONObj WriteErrorDetail::toBSON() const {
    BSONObjBuilder bob;
    bob.append(kIndexField, index);
    bob.append(kCodeField, static_cast<int>(code));
    bob.append(kErrmsgField, errmsg);
    return bob.obj();
}

Status WriteErrorDetail::toStatus() const {
    return Status(code, errmsg);
}

WriteConcernErrorDetail WriteConcernErrorDetail::parse(const BSONObj& obj) {
    WriteConcernErrorDetail detail;
    detail.code = codeOf(obj);
    detail.codeName = obj.getStringField(kCodeNameField).toString();
    detail.errmsg = errmsgOf(obj);
    return detail;
}

BSONObj WriteConcernErrorDetail::toBSON() const {
    BSONObjBuilder bob;
    bob.append(kCodeField, static_cast<int>(code));
    if (!codeName.empty())
        bob.append(kCodeNameField, codeName);
    bob.append(kErrmsgField, errmsg);
    return bob.obj();
}

std::string WriteConcernErrorDetail::toString() const {
    str::stream ss;
    ss << "WriteConcernError: " << errmsg << ", code: " << static_cast<int>(code);
    if (!codeName.empty())
        ss << ", codeName: " << codeName;
    return ss;
}

void WriteConcernErrorInfo::serialize(BSONObjBuilder* builder) const {
    builder->append(kWriteConcernErrorField, _detail.toBSON());
}

void BulkWriteErrorInfo::serialize(BSONObjBuilder* builder) const {
    {
        BSONArrayBuilder errors(builder->subarrayStart(kWriteErrorsField));
        for (const auto& writeError : _writeErrors)
            errors.append(writeError.toBSON());
    }
    if (_writeConcernError)
        builder->append(kWriteConcernErrorField, _writeConcernError->toBSON());
}

Status getStatusFromCommandResult(const BSONObj& result) {
    BSONElement okElement = result[kCmdResponseOkField];
    if (okElement.eoo()) {
        // Legacy query failures only carry "$err".
        if (result.hasField(kLegacyErrmsgField))
            return Status(codeOf(result), errmsgOf(result));
        return Status(ErrorCodes::FailedToParse,
                      str::stream() << "Command reply has no 'ok' field: " << result.toString());
    }
    if (okElement.trueValue())
        return Status::OK();

    std::string errmsg = errmsgOf(result);
    if (errmsg.empty())
        errmsg = "command failed without an error message";
    return Status(codeOf(result), std::move(errmsg));
}

Status getWriteConcernStatusFromCommandResult(const BSONObj& result) {
    BSONElement wcErrorElem = result[kWriteConcernErrorField];
    if (wcErrorElem.eoo())
        return Status::OK();
    if (wcErrorElem.type() != BSONType::object) {
        return Status(ErrorCodes::TypeMismatch,
                      str::stream() << "Field '" << kWriteConcernErrorField
                                    << "' of the command reply must be an object, found "
                                    << typeName(wcErrorElem.type()));
    }
    auto detail = WriteConcernErrorDetail::parse(wcErrorElem.embeddedObject());
    std::string reason = detail.toString();
    return Status(WriteConcernErrorInfo(std::move(detail)), std::move(reason));
}

Status getStatusFromWriteCommandReply(const BSONObj& reply) {
    Status status = getStatusFromCommandResult(reply);
    if (!status.isOK())
        return status;

    std::vector<WriteErrorDetail> writeErrors;
    BSONElement writeErrorsElem = reply[kWriteErrorsField];
    if (!writeErrorsElem.eoo()) {
        if (writeErrorsElem.type() != BSONType::array) {
            return Status(ErrorCodes::TypeMismatch,
                          str::stream() << "Field '" << kWriteErrorsField
                                        << "' of the command reply must be an array, found "
                                        << typeName(writeErrorsElem.type()));
        }
        for (const auto& elem : writeErrorsElem.Obj()) {
            if (elem.type() == BSONType::object)
                writeErrors.push_back(WriteErrorDetail::parse(elem.embeddedObject()));
        }
    }

    boost::optional<WriteConcernErrorDetail> wcError;
    BSONElement wcErrorElem = reply[kWriteConcernErrorField];
    if (wcErrorElem.type() == BSONType::object)
        wcError = WriteConcernErrorDetail::parse(wcErrorElem.embeddedObject());

    if (writeErrors.empty()) {
        if (!wcError)
            return Status::OK();
        std::string reason = wcError->toString();
        return Status(WriteConcernErrorInfo(std::move(*wcError)), std::move(reason));
    }

    if (writeErrors.size() == 1 && !wcError)
        return writeErrors.front().toStatus();

    str::stream reason;
    reason << "Write command failed with " << writeErrors.size() << " write error(s)";
    reason << ", first: " << writeErrors.front().errmsg;
    if (wcError)
        reason << ", and " << wcError->toString();
    return Status(BulkWriteErrorInfo(std::move(writeErrors), std::move(wcError)), reason);
}

}  // namespace oplogmirror

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

#include "oplogmirror/db/repl/oplog_entry.h"

#include <map>

namespace oplogmirror {
namespace repl {
namespace {

const std::map<StringData, OplogEntry::CommandType> kCommandNames = {
    {"create"_sd, OplogEntry::CommandType::kCreate},
    {"renameCollection"_sd, OplogEntry::CommandType::kRenameCollection},
    {"drop"_sd, OplogEntry::CommandType::kDrop},
    {"collMod"_sd, OplogEntry::CommandType::kCollMod},
    {"applyOps"_sd, OplogEntry::CommandType::kApplyOps},
    {"dropDatabase"_sd, OplogEntry::CommandType::kDropDatabase},
    {"createIndexes"_sd, OplogEntry::CommandType::kCreateIndexes},
    {"dropIndexes"_sd, OplogEntry::CommandType::kDropIndexes},
    {"deleteIndexes"_sd, OplogEntry::CommandType::kDropIndexes},
    {"commitTransaction"_sd, OplogEntry::CommandType::kCommitTransaction},
    {"abortTransaction"_sd, OplogEntry::CommandType::kAbortTransaction},
};

Status typeMismatch(StringData fieldName, StringData expected, const BSONElement& elem) {
    return {ErrorCodes::TypeMismatch,
            "Oplog entry field '" + fieldName.toString() + "' must be " + expected.toString() +
                ", found " + typeName(elem.type())};
}

Status missingField(StringData fieldName) {
    return {ErrorCodes::FailedToParse,
            "Oplog entry is missing required field '" + fieldName.toString() + "'"};
}

StatusWith<boost::optional<long long>> parseOptionalLong(const BSONObj& raw,
                                                         StringData fieldName) {
    BSONElement elem = raw[fieldName];
    if (elem.eoo())
        return boost::optional<long long>();
    if (!elem.isNumber())
        return typeMismatch(fieldName, "a number", elem);
    return boost::optional<long long>(elem.numberLong());
}

}  // namespace

StatusWith<OpTypeEnum> parseOpType(StringData opType) {
    if (opType == "c"_sd)
        return OpTypeEnum::kCommand;
    if (opType == "i"_sd)
        return OpTypeEnum::kInsert;
    if (opType == "u"_sd)
        return OpTypeEnum::kUpdate;
    if (opType == "d"_sd)
        return OpTypeEnum::kDelete;
    if (opType == "n"_sd)
        return OpTypeEnum::kNoop;
    return {ErrorCodes::BadValue, "Unknown oplog entry op type '" + opType.toString() + "'"};
}

StringData opTypeToString(OpTypeEnum opType) {
    switch (opType) {
        case OpTypeEnum::kCommand:
            return "c"_sd;
        case OpTypeEnum::kInsert:
            return "i"_sd;
        case OpTypeEnum::kUpdate:
            return "u"_sd;
        case OpTypeEnum::kDelete:
            return "d"_sd;
        case OpTypeEnum::kNoop:
            return "n"_sd;
    }
    return "?"_sd;
}

StringData commandTypeToString(OplogEntry::CommandType commandType) {
    switch (commandType) {
        case OplogEntry::CommandType::kNotCommand:
            return "not a command"_sd;
        case OplogEntry::CommandType::kOther:
            return "other"_sd;
        default:
            break;
    }
    for (const auto& [name, type] : kCommandNames) {
        if (type == commandType)
            return name;
    }
    return "unknown"_sd;
}

StatusWith<OplogEntry> OplogEntry::parse(const BSONObj& rawInput) {
    OplogEntry entry;
    entry._raw = rawInput.getOwned();
    const BSONObj& raw = entry._raw;

    BSONElement tsElem = raw[kTimestampFieldName];
    if (tsElem.eoo())
        return missingField(kTimestampFieldName);
    if (tsElem.type() != BSONType::timestamp)
        return typeMismatch(kTimestampFieldName, "a timestamp", tsElem);
    entry._timestamp = tsElem.timestamp();

    BSONElement opElem = raw[kOpTypeFieldName];
    if (opElem.eoo())
        return missingField(kOpTypeFieldName);
    if (opElem.type() != BSONType::string)
        return typeMismatch(kOpTypeFieldName, "a string", opElem);
    auto swOpType = parseOpType(opElem.valueStringData());
    if (!swOpType.isOK())
        return swOpType.getStatus().withContext("Failed to parse oplog entry");
    entry._opType = swOpType.getValue();

    BSONElement nsElem = raw[kNssFieldName];
    if (nsElem.eoo())
        return missingField(kNssFieldName);
    if (nsElem.type() != BSONType::string)
        return typeMismatch(kNssFieldName, "a string", nsElem);
    entry._nss = NamespaceString(nsElem.valueStringData());

    BSONElement oElem = raw[kObjectFieldName];
    if (oElem.eoo())
        return missingField(kObjectFieldName);
    if (oElem.type() != BSONType::object)
        return typeMismatch(kObjectFieldName, "an object", oElem);
    entry._object = oElem.embeddedObject();

    BSONElement o2Elem = raw[kObject2FieldName];
    if (!o2Elem.eoo()) {
        if (o2Elem.type() != BSONType::object)
            return typeMismatch(kObject2FieldName, "an object", o2Elem);
        entry._object2 = o2Elem.embeddedObject();
    }

    auto swTerm = parseOptionalLong(raw, kTermFieldName);
    if (!swTerm.isOK())
        return swTerm.getStatus();
    entry._term = swTerm.getValue();

    auto swHash = parseOptionalLong(raw, kHashFieldName);
    if (!swHash.isOK())
        return swHash.getStatus();
    entry._hash = swHash.getValue();

    BSONElement vElem = raw[kVersionFieldName];
    if (!vElem.eoo()) {
        if (!vElem.isNumber())
            return typeMismatch(kVersionFieldName, "a number", vElem);
        entry._version = vElem.numberInt();
    }

    BSONElement uiElem = raw[kUuidFieldName];
    if (!uiElem.eoo()) {
        auto swUuid = UUID::parse(uiElem);
        if (!swUuid.isOK())
            return swUuid.getStatus().withContext("Failed to parse oplog entry");
        entry._uuid = swUuid.getValue();
    }

    BSONElement lsidElem = raw[kSessionIdFieldName];
    if (!lsidElem.eoo()) {
        if (lsidElem.type() != BSONType::object)
            return typeMismatch(kSessionIdFieldName, "an object", lsidElem);
        entry._sessionId = lsidElem.embeddedObject();
    }

    auto swTxnNumber = parseOptionalLong(raw, kTxnNumberFieldName);
    if (!swTxnNumber.isOK())
        return swTxnNumber.getStatus();
    entry._txnNumber = swTxnNumber.getValue();

    BSONElement stmtIdElem = raw[kStatementIdFieldName];
    if (!stmtIdElem.eoo()) {
        if (!stmtIdElem.isNumber())
            return typeMismatch(kStatementIdFieldName, "a number", stmtIdElem);
        entry._statementId = stmtIdElem.numberInt();
    }

    BSONElement prevOpTimeElem = raw[kPrevWriteOpTimeInTransactionFieldName];
    if (!prevOpTimeElem.eoo()) {
        auto swPrevOpTime = OpTime::parse(prevOpTimeElem);
        if (!swPrevOpTime.isOK())
            return swPrevOpTime.getStatus().withContext("Failed to parse oplog entry");
        entry._prevWriteOpTime = swPrevOpTime.getValue();
    }

    if (entry._opType == OpTypeEnum::kCommand) {
        if (entry._object.isEmpty()) {
            return {ErrorCodes::FailedToParse,
                    "Command oplog entry has an empty 'o' field: " + raw.toString()};
        }
        auto it = kCommandNames.find(entry._object.firstElementFieldNameStringData());
        entry._commandType = it == kCommandNames.end() ? CommandType::kOther : it->second;
    }

    return entry;
}

bool OplogEntry::isPartialTransaction() const {
    return _commandType == CommandType::kApplyOps && _object.getBoolField(kPartialTxnFieldName);
}

bool OplogEntry::shouldPrepare() const {
    return _commandType == CommandType::kApplyOps && _object.getBoolField(kPrepareFieldName);
}

}  // namespace repl
}  // namespace oplogmirror

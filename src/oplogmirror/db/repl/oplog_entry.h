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

#include <boost/optional.hpp>

#include "oplogmirror/base/status_with.h"
#include "oplogmirror/base/string_data.h"
#include "oplogmirror/bson/bsonobj.h"
#include "oplogmirror/bson/timestamp.h"
#include "oplogmirror/db/namespace_string.h"
#include "oplogmirror/db/repl/optime.h"
#include "oplogmirror/util/uuid.h"

namespace oplogmirror {
namespace repl {

/**
 * The "op" field of an oplog entry.
 */
enum class OpTypeEnum {
    kCommand,
    kInsert,
    kUpdate,
    kDelete,
    kNoop,
};

StatusWith<OpTypeEnum> parseOpType(StringData opType);
StringData opTypeToString(OpTypeEnum opType);

/**
 * A parsed oplog entry. The entry keeps the document it was parsed from, so the accessors are
 * cheap and the original bytes can be handed on to applyOps unchanged.
 *
 * Entry format, as written by MongoDB 3.6 through 4.4:
 *
 *   { ts: Timestamp, t: NumberLong, h: NumberLong, v: 2, op: "i"|"u"|"d"|"c"|"n",
 *     ns: "<db>.<coll>", ui: UUID, o: {...}, o2: {...},
 *     lsid: {id: UUID, ...}, txnNumber: NumberLong, stmtId: int,
 *     prevOpTime: {ts: Timestamp, t: NumberLong} }
 */
class OplogEntry {
public:
    static constexpr auto kTimestampFieldName = "ts"_sd;
    static constexpr auto kTermFieldName = "t"_sd;
    static constexpr auto kHashFieldName = "h"_sd;
    static constexpr auto kVersionFieldName = "v"_sd;
    static constexpr auto kOpTypeFieldName = "op"_sd;
    static constexpr auto kNssFieldName = "ns"_sd;
    static constexpr auto kUuidFieldName = "ui"_sd;
    static constexpr auto kObjectFieldName = "o"_sd;
    static constexpr auto kObject2FieldName = "o2"_sd;
    static constexpr auto kSessionIdFieldName = "lsid"_sd;
    static constexpr auto kTxnNumberFieldName = "txnNumber"_sd;
    static constexpr auto kStatementIdFieldName = "stmtId"_sd;
    static constexpr auto kPrevWriteOpTimeInTransactionFieldName = "prevOpTime"_sd;

    static constexpr auto kPartialTxnFieldName = "partialTxn"_sd;
    static constexpr auto kPrepareFieldName = "prepare"_sd;

    // The oplog format version written by every server this code replays from.
    static constexpr int kOplogVersion = 2;

    /**
     * Commands that can appear in the "o" field of a command entry. kOther covers commands the
     * replayer passes through untouched.
     */
    enum class CommandType {
        kNotCommand,
        kCreate,
        kRenameCollection,
        kDrop,
        kCollMod,
        kApplyOps,
        kDropDatabase,
        kCreateIndexes,
        kDropIndexes,
        kCommitTransaction,
        kAbortTransaction,
        kOther,
    };

    /**
     * Parses 'raw', keeping an owned copy of it. Fails with FailedToParse when a required field
     * is missing and with TypeMismatch when a field has the wrong type.
     */
    static StatusWith<OplogEntry> parse(const BSONObj& raw);

    const BSONObj& getRaw() const {
        return _raw;
    }

    BSONObj toBSON() const {
        return _raw;
    }

    Timestamp getTimestamp() const {
        return _timestamp;
    }

    const boost::optional<long long>& getTerm() const {
        return _term;
    }

    OpTime getOpTime() const {
        return OpTime(_timestamp, _term.value_or(OpTime::kUninitializedTerm));
    }

    const boost::optional<long long>& getHash() const {
        return _hash;
    }

    int getVersion() const {
        return _version;
    }

    OpTypeEnum getOpType() const {
        return _opType;
    }

    const NamespaceString& getNss() const {
        return _nss;
    }

    const boost::optional<UUID>& getUuid() const {
        return _uuid;
    }

    const BSONObj& getObject() const {
        return _object;
    }

    const boost::optional<BSONObj>& getObject2() const {
        return _object2;
    }

    const boost::optional<BSONObj>& getSessionId() const {
        return _sessionId;
    }

    const boost::optional<long long>& getTxnNumber() const {
        return _txnNumber;
    }

    const boost::optional<int>& getStatementId() const {
        return _statementId;
    }

    const boost::optional<OpTime>& getPrevWriteOpTimeInTransaction() const {
        return _prevWriteOpTime;
    }

    bool isCommand() const {
        return _opType == OpTypeEnum::kCommand;
    }

    bool isNoop() const {
        return _opType == OpTypeEnum::kNoop;
    }

    bool isCrudOpType() const {
        return _opType == OpTypeEnum::kInsert || _opType == OpTypeEnum::kUpdate ||
            _opType == OpTypeEnum::kDelete;
    }

    /**
     * The command held by a command entry, from the first field name of "o".
     */
    CommandType getCommandType() const {
        return _commandType;
    }

    /**
     * True for an applyOps entry that is not the last one of its transaction.
     */
    bool isPartialTransaction() const;

    /**
     * True for an applyOps entry that prepares its transaction.
     */
    bool shouldPrepare() const;

    std::string toString() const {
        return _raw.toString();
    }

private:
    OplogEntry() = default;

    BSONObj _raw;
    Timestamp _timestamp;
    boost::optional<long long> _term;
    boost::optional<long long> _hash;
    int _version = kOplogVersion;
    OpTypeEnum _opType = OpTypeEnum::kNoop;
    NamespaceString _nss;
    boost::optional<UUID> _uuid;
    BSONObj _object;
    boost::optional<BSONObj> _object2;
    boost::optional<BSONObj> _sessionId;
    boost::optional<long long> _txnNumber;
    boost::optional<int> _statementId;
    boost::optional<OpTime> _prevWriteOpTime;
    CommandType _commandType = CommandType::kNotCommand;
};

StringData commandTypeToString(OplogEntry::CommandType commandType);

}  // namespace repl
}  // namespace oplogmirror

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

#include <cstddef>
#include <string>

#include "oplogmirror/base/status_with.h"
#include "oplogmirror/base/string_data.h"
#include "oplogmirror/bson/bsonobj.h"
#include "oplogmirror/bson/timestamp.h"
#include "oplogmirror/db/repl/oplog_entry.h"
#include "oplogmirror/db/repl/optime.h"

namespace oplogmirror {

/**
 * Identifies a transaction: the logical session it ran in and its number within that session.
 * A default constructed TxnId (empty lsid, number 0) identifies no transaction.
 */
struct TxnId {
    TxnId() = default;
    TxnId(BSONObj lsid, long long txnNumber)
        : lsid(lsid.getOwned()), txnNumber(txnNumber) {}

    bool isEmpty() const {
        return lsid.isEmpty() && txnNumber == 0;
    }

    BSONObj toBSON() const;
    std::string toString() const;

    bool operator==(const TxnId& other) const {
        return txnNumber == other.txnNumber && lsid.binaryEqual(other.lsid);
    }

    bool operator!=(const TxnId& other) const {
        return !(*this == other);
    }

    struct Hash {
        std::size_t operator()(const TxnId& id) const;
    };

    BSONObj lsid;
    long long txnNumber = 0;
};

/**
 * The part an oplog entry plays in a transaction.
 *
 * Transactions of MongoDB 4.0 are written as a single applyOps entry. From 4.2 on a
 * transaction too large for one entry, or one that was prepared, spans several entries: one or
 * more applyOps entries flagged "partialTxn" or "prepare", chained to each other through
 * "prevOpTime", and closed by a final applyOps, commitTransaction or abortTransaction entry.
 */
enum class TxnRole {
    kNonTxn,         // Not part of a transaction.
    kSingle,         // The whole transaction, in one applyOps entry.
    kFirstOfMulti,   // First entry of a transaction spanning several entries.
    kContinuation,   // Neither first nor last.
    kFinalCommit,    // Last entry of a committed multi-entry transaction.
    kFinalAbort,     // Last entry of an aborted transaction, or its only one when unlinked.
};

StringData toString(TxnRole role);

/**
 * TxnMeta holds what the transaction buffer needs to know about one oplog entry. It is
 * computed once per entry and never changes.
 */
class TxnMeta {
public:
    /**
     * Classifies 'entry'. Fails with FailedToParse or TypeMismatch when the entry cannot be
     * decoded or its session metadata is ambiguous. Such failures are not retryable.
     */
    static StatusWith<TxnMeta> parse(const BSONObj& entry);
    static StatusWith<TxnMeta> parse(const repl::OplogEntry& entry);

    TxnMeta() = default;

    const TxnId& getId() const {
        return _id;
    }

    TxnRole getRole() const {
        return _role;
    }

    Timestamp getTimestamp() const {
        return _timestamp;
    }

    /** Link to the previous entry of the transaction. Null for first and non-chained entries. */
    const repl::OpTime& getPrevOpTime() const {
        return _prevOpTime;
    }

    bool isTxn() const {
        return _role != TxnRole::kNonTxn;
    }

    /** True when the transaction spans more than one oplog entry. */
    bool isMultiOp() const {
        return isTxn() && !(isFirst() && isFinal());
    }

    /** True for the entry that starts the transaction: a transaction entry with no back-link. */
    bool isFirst() const {
        return isTxn() && _prevOpTime.isNull();
    }

    /** True for the last entry of the transaction, whichever way it ended. */
    bool isFinal() const {
        return isCommit() || isAbort();
    }

    bool isCommit() const {
        return _role == TxnRole::kSingle || _role == TxnRole::kFinalCommit;
    }

    bool isAbort() const {
        return _role == TxnRole::kFinalAbort;
    }

    BSONObj toBSON() const;

private:
    TxnMeta(TxnId id, TxnRole role, Timestamp ts, repl::OpTime prevOpTime)
        : _id(std::move(id)), _role(role), _timestamp(ts), _prevOpTime(prevOpTime) {}

    TxnId _id;
    TxnRole _role = TxnRole::kNonTxn;
    Timestamp _timestamp;
    repl::OpTime _prevOpTime;
};

}  // namespace oplogmirror

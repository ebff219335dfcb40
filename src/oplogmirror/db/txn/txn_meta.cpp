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

#include "oplogmirror/db/txn/txn_meta.h"

#include <boost/container_hash/hash.hpp>

#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/util/str.h"

namespace oplogmirror {
namespace {

using CommandType = repl::OplogEntry::CommandType;

bool isTxnCommand(CommandType type) {
    return type == CommandType::kApplyOps || type == CommandType::kCommitTransaction ||
        type == CommandType::kAbortTransaction;
}

}  // namespace

BSONObj TxnId::toBSON() const {
    BSONObjBuilder bob;
    bob.append("lsid", lsid);
    bob.append("txnNumber", txnNumber);
    return bob.obj();
}

std::string TxnId::toString() const {
    return toBSON().toString();
}

std::size_t TxnId::Hash::operator()(const TxnId& id) const {
    std::size_t seed = id.lsid.hash();
    boost::hash_combine(seed, id.txnNumber);
    return seed;
}

StringData toString(TxnRole role) {
    switch (role) {
        case TxnRole::kNonTxn:
            return "nonTxn"_sd;
        case TxnRole::kSingle:
            return "single"_sd;
        case TxnRole::kFirstOfMulti:
            return "firstOfMulti"_sd;
        case TxnRole::kContinuation:
            return "continuation"_sd;
        case TxnRole::kFinalCommit:
            return "finalCommit"_sd;
        case TxnRole::kFinalAbort:
            return "finalAbort"_sd;
    }
    return "unknown"_sd;
}

StatusWith<TxnMeta> TxnMeta::parse(const BSONObj& entry) {
    auto swEntry = repl::OplogEntry::parse(entry);
    if (!swEntry.isOK())
        return swEntry.getStatus();
    return parse(swEntry.getValue());
}

StatusWith<TxnMeta> TxnMeta::parse(const repl::OplogEntry& entry) {
    TxnMeta nonTxn({}, TxnRole::kNonTxn, entry.getTimestamp(), {});

    // Retryable writes carry session metadata on CRUD entries, but only commands can be
    // transactions.
    if (!entry.isCommand() || !isTxnCommand(entry.getCommandType()))
        return nonTxn;

    const auto& lsid = entry.getSessionId();
    const auto& txnNumber = entry.getTxnNumber();
    const CommandType commandType = entry.getCommandType();

    // Before 4.0 applyOps was only ever a user command, with no session attached. Without a
    // session nothing ties an entry to a transaction, whatever command it holds.
    if (!lsid && !txnNumber)
        return nonTxn;
    if (!lsid || !txnNumber) {
        return {ErrorCodes::FailedToParse,
                str::stream() << "Oplog entry has " << (lsid ? "lsid" : "txnNumber")
                              << " without " << (lsid ? "txnNumber" : "lsid")
                              << ", cannot tell whether it is part of a transaction: "
                              << entry.toString()};
    }

    TxnId id(*lsid, *txnNumber);
    repl::OpTime prevOpTime = entry.getPrevWriteOpTimeInTransaction().value_or(repl::OpTime());
    const bool linked = !prevOpTime.isNull();

    TxnRole role;
    switch (commandType) {
        case CommandType::kApplyOps:
            if (entry.isPartialTransaction() || entry.shouldPrepare()) {
                role = linked ? TxnRole::kContinuation : TxnRole::kFirstOfMulti;
            } else {
                role = linked ? TxnRole::kFinalCommit : TxnRole::kSingle;
            }
            break;
        case CommandType::kCommitTransaction:
            role = linked ? TxnRole::kFinalCommit : TxnRole::kSingle;
            break;
        case CommandType::kAbortTransaction:
            // An unlinked abort both starts and ends its transaction.
            role = TxnRole::kFinalAbort;
            break;
        default:
            return nonTxn;
    }

    return TxnMeta(std::move(id), role, entry.getTimestamp(), prevOpTime);
}

BSONObj TxnMeta::toBSON() const {
    BSONObjBuilder bob;
    if (isTxn()) {
        bob.append("lsid", _id.lsid);
        bob.append("txnNumber", _id.txnNumber);
    }
    bob.append("role", toString(_role));
    bob.append("ts", _timestamp);
    if (!_prevOpTime.isNull())
        _prevOpTime.append(&bob, "prevOpTime");
    return bob.obj();
}

}  // namespace oplogmirror

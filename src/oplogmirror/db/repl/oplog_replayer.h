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
#include <vector>

#include <boost/optional.hpp>

#include "oplogmirror/base/status.h"
#include "oplogmirror/base/status_with.h"
#include "oplogmirror/bson/bsonobj.h"
#include "oplogmirror/bson/timestamp.h"
#include "oplogmirror/db/repl/oplog_entry.h"
#include "oplogmirror/db/txn/txn_meta.h"

namespace oplogmirror {

class RetryableExecutor;
class TxnBuffer;

namespace repl {

struct OplogReplayerOptions {
    // Sent with every applyOps batch.
    bool bypassDocumentValidation = true;

    // Limits of one applyOps batch. A single operation larger than maxBatchBytes is sent on its
    // own.
    std::size_t maxBatchOps = 5000;
    std::size_t maxBatchBytes = 16 * 1024 * 1024 - 16 * 1024;

    // No-op entries carry nothing to apply.
    bool skipNoops = true;
};

struct OplogReplayerStats {
    long long entriesSeen = 0;
    long long opsApplied = 0;
    long long commandsApplied = 0;
    long long noopsSkipped = 0;
    long long batchesApplied = 0;
    long long txnsCommitted = 0;
    long long txnsAborted = 0;
    long long txnOpsApplied = 0;

    BSONObj toBSON() const;
};

/**
 * Replays oplog entries against the destination, in the order the source wrote them.
 *
 * CRUD operations are collected into applyOps batches. A command is never batched: the pending
 * batch is applied first and the command runs on its own through the matching
 * RetryableExecutor operation, so it is retried safely. Transaction entries are buffered in the
 * TxnBuffer until their transaction commits, whereupon its operations are replayed like any
 * others, or aborts, whereupon they are dropped.
 *
 * Operations may sit in the pending batch after handleEntry() returns; flush() applies them.
 *
 * Not thread safe.
 */
class OplogReplayer {
public:
    OplogReplayer(RetryableExecutor* executor,
                  TxnBuffer* buffer,
                  OplogReplayerOptions options = OplogReplayerOptions());

    OplogReplayer(const OplogReplayer&) = delete;
    OplogReplayer& operator=(const OplogReplayer&) = delete;

    /**
     * Replays one raw oplog entry. Entries must arrive in oplog order.
     */
    Status handleEntry(const BSONObj& raw);

    /**
     * Applies the operations waiting in the current batch.
     */
    Status flush();

    const OplogReplayerStats& getStats() const {
        return _stats;
    }

    /** Timestamp of the newest entry whose effects reached the destination. */
    const boost::optional<Timestamp>& getLastAppliedTimestamp() const {
        return _lastAppliedTimestamp;
    }

    /**
     * Where to restart replay from without losing a transaction that is still buffered: the
     * first entry of the oldest such transaction, or else the last applied entry.
     */
    boost::optional<Timestamp> getResumeTimestamp() const;

    std::size_t pendingBatchSize() const {
        return _batch.size();
    }

private:
    Status _handleTxnEntry(const TxnMeta& meta, const OplogEntry& entry);

    /**
     * Replays one operation. 'entry' is its parsed form and 'op' the document handed to the
     * destination, which differ for the operations of a transaction.
     */
    Status _applyOp(const OplogEntry& entry, const BSONObj& op);

    Status _applyCommand(const OplogEntry& entry, const BSONObj& op);

    Status _applyLegacyIndexInsert(const OplogEntry& entry);

    Status _addToBatch(const BSONObj& op, Timestamp ts);

    RetryableExecutor* const _executor;
    TxnBuffer* const _buffer;
    const OplogReplayerOptions _options;

    std::vector<BSONObj> _batch;
    std::size_t _batchBytes = 0;
    Timestamp _batchLastTimestamp;

    boost::optional<Timestamp> _lastAppliedTimestamp;
    OplogReplayerStats _stats;
};

}  // namespace repl
}  // namespace oplogmirror

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

#define OPLOGMIRROR_LOGV2_DEFAULT_COMPONENT ::oplogmirror::logv2::LogComponent::kReplication

#include "oplogmirror/db/repl/oplog_replayer.h"

#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/client/apply_ops.h"
#include "oplogmirror/client/retryable_executor.h"
#include "oplogmirror/db/txn/txn_buffer.h"
#include "oplogmirror/logv2/log.h"
#include "oplogmirror/util/assert_util.h"
#include "oplogmirror/util/str.h"

namespace oplogmirror {
namespace repl {
namespace {

/**
 * The operations inside an applyOps entry have no timestamp of their own; they take the one of
 * the entry that carried them.
 */
StatusWith<OplogEntry> parseInnerOp(const BSONObj& innerOp, const OplogEntry& outer) {
    if (innerOp.hasField(OplogEntry::kTimestampFieldName))
        return OplogEntry::parse(innerOp);

    BSONObjBuilder bob;
    bob.append(OplogEntry::kTimestampFieldName, outer.getTimestamp());
    bob.appendElements(innerOp);
    return OplogEntry::parse(bob.obj());
}

StatusWith<NamespaceString> targetOfCommand(const OplogEntry& entry) {
    BSONElement first = entry.getObject().firstElement();
    if (first.type() != BSONType::string) {
        return Status(ErrorCodes::TypeMismatch,
                      str::stream() << "expected a collection name in '"
                                    << first.fieldNameStringData()
                                    << "' command entry: " << entry.toString());
    }
    return NamespaceString(entry.getNss().db(), first.valueStringData());
}

}  // namespace

BSONObj OplogReplayerStats::toBSON() const {
    BSONObjBuilder bob;
    bob.append("entriesSeen", entriesSeen);
    bob.append("opsApplied", opsApplied);
    bob.append("commandsApplied", commandsApplied);
    bob.append("noopsSkipped", noopsSkipped);
    bob.append("batchesApplied", batchesApplied);
    bob.append("txnsCommitted", txnsCommitted);
    bob.append("txnsAborted", txnsAborted);
    bob.append("txnOpsApplied", txnOpsApplied);
    return bob.obj();
}

OplogReplayer::OplogReplayer(RetryableExecutor* executor,
                             TxnBuffer* buffer,
                             OplogReplayerOptions options)
    : _executor(executor), _buffer(buffer), _options(options) {
    invariant(_executor);
    invariant(_buffer);
}

Status OplogReplayer::handleEntry(const BSONObj& raw) {
    auto swEntry = OplogEntry::parse(raw);
    if (!swEntry.isOK())
        return swEntry.getStatus();
    const OplogEntry& entry = swEntry.getValue();

    auto swMeta = TxnMeta::parse(entry);
    if (!swMeta.isOK())
        return swMeta.getStatus();

    ++_stats.entriesSeen;
    if (swMeta.getValue().isTxn())
        return _handleTxnEntry(swMeta.getValue(), entry);
    return _applyOp(entry, entry.getRaw());
}

Status OplogReplayer::_handleTxnEntry(const TxnMeta& meta, const OplogEntry& entry) {
    Status status = _buffer->addOp(meta, entry.getRaw());
    if (!status.isOK())
        return status;

    if (meta.isAbort()) {
        LOGV2_DEBUG(8103001, 1, "Dropping aborted transaction", "txnId"_attr = meta.getId());
        ++_stats.txnsAborted;
        return _buffer->purge(meta);
    }
    if (!meta.isCommit())
        return Status::OK();

    auto swStream = _buffer->getTxnStream(meta);
    if (!swStream.isOK())
        return swStream.getStatus();
    TxnOpStream& stream = swStream.getValue();

    Status applied = stream.forEach([&](const BSONObj& innerOp) {
        auto swInner = parseInnerOp(innerOp, entry);
        if (!swInner.isOK())
            return swInner.getStatus();
        ++_stats.txnOpsApplied;
        return _applyOp(swInner.getValue(), innerOp);
    });

    // The transaction is finished either way; what is buffered for it is of no further use.
    Status purged = _buffer->purge(meta);
    if (!applied.isOK())
        return applied.withContext("failed to replay transaction " + meta.getId().toString());
    if (!purged.isOK())
        return purged;

    ++_stats.txnsCommitted;
    LOGV2_DEBUG(8103002,
                1,
                "Replayed committed transaction",
                "txnId"_attr = meta.getId(),
                "numOps"_attr = stream.opsReturned(),
                "commitTimestamp"_attr = entry.getTimestamp());
    return Status::OK();
}

Status OplogReplayer::_applyOp(const OplogEntry& entry, const BSONObj& op) {
    if (entry.isNoop() && _options.skipNoops) {
        ++_stats.noopsSkipped;
        return Status::OK();
    }

    if (entry.isCommand() &&
        (entry.getCommandType() == OplogEntry::CommandType::kCommitTransaction ||
         entry.getCommandType() == OplogEntry::CommandType::kAbortTransaction)) {
        // Without a session there is no transaction for it to finish.
        LOGV2_WARNING(8103007,
                      "Skipping transaction command that belongs to no transaction",
                      "command"_attr = commandTypeToString(entry.getCommandType()),
                      "ts"_attr = entry.getTimestamp());
        return Status::OK();
    }

    if (entry.isCommand()) {
        Status status = flush();
        if (!status.isOK())
            return status;
        status = _applyCommand(entry, op);
        if (!status.isOK())
            return status;
        ++_stats.commandsApplied;
        _lastAppliedTimestamp = entry.getTimestamp();
        return status;
    }

    if (entry.getOpType() == OpTypeEnum::kInsert && entry.getNss().isSystemDotIndexes()) {
        Status status = flush();
        if (!status.isOK())
            return status;
        status = _applyLegacyIndexInsert(entry);
        if (!status.isOK())
            return status;
        _lastAppliedTimestamp = entry.getTimestamp();
        return status;
    }

    return _addToBatch(op, entry.getTimestamp());
}

Status OplogReplayer::_applyCommand(const OplogEntry& entry, const BSONObj& op) {
    const StringData dbName = entry.getNss().db();
    const BSONObj& o = entry.getObject();
    LOGV2_DEBUG(8103003,
                2,
                "Applying command",
                "command"_attr = commandTypeToString(entry.getCommandType()),
                "namespace"_attr = entry.getNss(),
                "o"_attr = o);

    switch (entry.getCommandType()) {
        case OplogEntry::CommandType::kCreate:
            return _executor->create(dbName, o);
        case OplogEntry::CommandType::kDrop: {
            auto swNss = targetOfCommand(entry);
            if (!swNss.isOK())
                return swNss.getStatus();
            return _executor->drop(swNss.getValue());
        }
        case OplogEntry::CommandType::kDropDatabase:
            return _executor->dropDatabase(dbName);
        case OplogEntry::CommandType::kRenameCollection:
            return _executor->renameCollection(o);
        case OplogEntry::CommandType::kCollMod:
            return _executor->collMod(dbName, o);
        case OplogEntry::CommandType::kCreateIndexes: {
            auto swNss = targetOfCommand(entry);
            if (!swNss.isOK())
                return swNss.getStatus();
            // The entry holds a single index spec next to the collection name.
            return _executor->createIndexesWithFallback(
                swNss.getValue(), {o.removeField("createIndexes")}, entry.getUuid());
        }
        default:
            // Everything else goes through applyOps, the way the source applied it.
            return _executor->applyOps(
                {op}, static_cast<std::size_t>(op.objsize()), _options.bypassDocumentValidation);
    }
}

Status OplogReplayer::_applyLegacyIndexInsert(const OplogEntry& entry) {
    // Before 4.2 an index build shows up as an insert of its spec into <db>.system.indexes.
    const BSONObj& spec = entry.getObject();
    const NamespaceString nss(spec.getStringField("ns"));
    if (!nss.isValid()) {
        return Status(ErrorCodes::FailedToParse,
                      str::stream() << "index spec inserted into " << entry.getNss().ns()
                                    << " has no valid 'ns': " << spec.toString());
    }
    LOGV2(8103004,
          "Building index from system.indexes insert",
          "namespace"_attr = nss,
          "spec"_attr = spec);
    return _executor->createIndexesWithFallback(nss, {spec.removeField("ns")}, boost::none);
}

Status OplogReplayer::_addToBatch(const BSONObj& op, Timestamp ts) {
    const auto bytes = static_cast<std::size_t>(op.objsize());
    if (!_batch.empty() &&
        (_batch.size() >= _options.maxBatchOps || _batchBytes + bytes > _options.maxBatchBytes)) {
        Status status = flush();
        if (!status.isOK())
            return status;
    }

    _batch.push_back(op.getOwned());
    _batchBytes += bytes;
    _batchLastTimestamp = ts;
    return Status::OK();
}

Status OplogReplayer::flush() {
    if (_batch.empty())
        return Status::OK();

    ApplyOpsResponse response;
    Status status =
        _executor->applyOps(_batch, _batchBytes, _options.bypassDocumentValidation, &response);
    if (!status.isOK()) {
        auto failedIndex = response.firstFailedIndex();
        if (failedIndex && *failedIndex < _batch.size()) {
            LOGV2_ERROR(8103005,
                        "Oplog operation failed to apply",
                        "op"_attr = _batch[*failedIndex],
                        "error"_attr = status);
        }
        const std::string context = str::stream()
            << "failed to apply a batch of " << _batch.size() << " oplog operations ending at "
            << _batchLastTimestamp.toString();
        return status.withContext(context);
    }

    LOGV2_DEBUG(8103006,
                2,
                "Applied batch of oplog operations",
                "numOps"_attr = _batch.size(),
                "bytes"_attr = _batchBytes,
                "lastTimestamp"_attr = _batchLastTimestamp);
    ++_stats.batchesApplied;
    _stats.opsApplied += static_cast<long long>(_batch.size());
    _lastAppliedTimestamp = _batchLastTimestamp;
    _batch.clear();
    _batchBytes = 0;
    return status;
}

boost::optional<Timestamp> OplogReplayer::getResumeTimestamp() const {
    if (auto oldest = _buffer->oldestActiveTxnTimestamp())
        return oldest;
    return _lastAppliedTimestamp;
}

}  // namespace repl
}  // namespace oplogmirror

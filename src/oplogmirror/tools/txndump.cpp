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

#define OPLOGMIRROR_LOGV2_DEFAULT_COMPONENT ::oplogmirror::logv2::LogComponent::kControl

#include "oplogmirror/tools/txndump.h"

#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/client/retryable_executor.h"
#include "oplogmirror/db/repl/oplog_replayer.h"
#include "oplogmirror/logv2/log.h"
#include "oplogmirror/tools/bson_file_reader.h"
#include "oplogmirror/tools/dry_run_command_runner.h"
#include "oplogmirror/util/assert_util.h"
#include "oplogmirror/util/str.h"

namespace oplogmirror {

Txndump::Txndump(TxndumpOptions options, std::ostream* out)
    : _options(std::move(options)), _out(out), _buffer(_options.buffer) {
    invariant(_out);
    if (_options.type == TxndumpOptions::OutputType::kApplyOps) {
        _runner = std::make_unique<DryRunCommandRunner>(_out);
        _executor = std::make_unique<RetryableExecutor>(_runner.get(),
                                                        BuildInfo(_options.destinationVersion),
                                                        RetryOptions(),
                                                        _options.writeConcern);
        _replayer =
            std::make_unique<repl::OplogReplayer>(_executor.get(), &_buffer, _options.replayer);
    }
}

Txndump::~Txndump() = default;

Status Txndump::run(std::istream& in) {
    BSONFileReader reader(in, _options.objcheck);
    while (true) {
        auto swEntry = reader.next();
        if (!swEntry.isOK())
            return swEntry.getStatus();
        if (!swEntry.getValue())
            break;

        Status status = _gotObject(*swEntry.getValue());
        if (!status.isOK()) {
            const std::string context = str::stream()
                << "oplog entry " << reader.getDocumentsRead() << " of " << _options.file;
            return status.withContext(context);
        }
    }

    if (_replayer) {
        Status status = _replayer->flush();
        if (!status.isOK())
            return status;
    }
    _out->flush();

    if (_buffer.size() > 0) {
        LOGV2_WARNING(8105001,
                      "Transactions still open at the end of the dump were left out",
                      "count"_attr = _buffer.size(),
                      "oldestTimestamp"_attr = _buffer.oldestActiveTxnTimestamp());
    }

    if (_replayer) {
        LOGV2(8105002,
              "Replayed oplog dump",
              "file"_attr = _options.file,
              "documents"_attr = reader.getDocumentsRead(),
              "bytes"_attr = reader.getBytesRead(),
              "commands"_attr = _runner->getCommandCount(),
              "stats"_attr = _replayer->getStats().toBSON());
    } else {
        LOGV2(8105003,
              "Dumped transactions",
              "file"_attr = _options.file,
              "documents"_attr = reader.getDocumentsRead(),
              "bytes"_attr = reader.getBytesRead(),
              "txnsWritten"_attr = _txnsWritten,
              "txnsAborted"_attr = _txnsAborted,
              "entriesSkipped"_attr = _entriesSkipped);
    }
    return Status::OK();
}

Status Txndump::_gotObject(const BSONObj& entry) {
    if (_replayer)
        return _replayer->handleEntry(entry);
    return _dumpTxnEntry(entry);
}

Status Txndump::_dumpTxnEntry(const BSONObj& entry) {
    auto swMeta = TxnMeta::parse(entry);
    if (!swMeta.isOK())
        return swMeta.getStatus();
    const TxnMeta& meta = swMeta.getValue();

    if (!meta.isTxn()) {
        ++_entriesSkipped;
        return Status::OK();
    }

    Status status = _buffer.addOp(meta, entry);
    if (!status.isOK())
        return status;

    if (meta.isAbort()) {
        LOGV2_DEBUG(8105004, 1, "Leaving out aborted transaction", "txnId"_attr = meta.getId());
        ++_txnsAborted;
        return _buffer.purge(meta);
    }
    if (!meta.isCommit())
        return Status::OK();

    auto swStream = _buffer.getTxnStream(meta);
    if (!swStream.isOK())
        return swStream.getStatus();

    BSONObjBuilder bob;
    bob.append("lsid", meta.getId().lsid);
    bob.append("txnNumber", meta.getId().txnNumber);
    bob.append("commitTimestamp", meta.getTimestamp());
    {
        BSONArrayBuilder ops(bob.subarrayStart("ops"));
        status = swStream.getValue().forEach([&](const BSONObj& op) {
            ops.append(op);
            return Status::OK();
        });
    }
    Status purged = _buffer.purge(meta);
    if (!status.isOK())
        return status;
    if (!purged.isOK())
        return purged;

    *_out << bob.obj().jsonString() << '\n';
    ++_txnsWritten;
    return Status::OK();
}

}  // namespace oplogmirror

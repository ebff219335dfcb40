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

#include <istream>
#include <memory>
#include <ostream>

#include "oplogmirror/base/status.h"
#include "oplogmirror/bson/bsonobj.h"
#include "oplogmirror/db/txn/txn_buffer.h"
#include "oplogmirror/tools/txndump_options.h"

namespace oplogmirror {

class DryRunCommandRunner;
class RetryableExecutor;

namespace repl {
class OplogReplayer;
}  // namespace repl

/**
 * Reads an oplog dump and writes what its transactions amount to, in the manner of bsondump.
 *
 * With OutputType::kJson every committed transaction becomes one line,
 * {lsid, txnNumber, commitTimestamp, ops: [...]}, with its operations in the order they were
 * applied; aborted transactions and entries outside transactions are left out. With
 * OutputType::kApplyOps the whole dump is replayed against a DryRunCommandRunner, which writes
 * each command the replay sends.
 */
class Txndump {
public:
    Txndump(TxndumpOptions options, std::ostream* out);
    ~Txndump();

    Txndump(const Txndump&) = delete;
    Txndump& operator=(const Txndump&) = delete;

    /**
     * Processes every document of 'in'. Stops at the first error.
     */
    Status run(std::istream& in);

    long long getTxnsWritten() const {
        return _txnsWritten;
    }

    long long getTxnsAborted() const {
        return _txnsAborted;
    }

    long long getEntriesSkipped() const {
        return _entriesSkipped;
    }

private:
    Status _gotObject(const BSONObj& entry);

    Status _dumpTxnEntry(const BSONObj& entry);

    const TxndumpOptions _options;
    std::ostream* const _out;

    TxnBuffer _buffer;

    // Replay only.
    std::unique_ptr<DryRunCommandRunner> _runner;
    std::unique_ptr<RetryableExecutor> _executor;
    std::unique_ptr<repl::OplogReplayer> _replayer;

    long long _txnsWritten = 0;
    long long _txnsAborted = 0;
    long long _entriesSkipped = 0;
};

}  // namespace oplogmirror

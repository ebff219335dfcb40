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

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <boost/optional.hpp>

#include "oplogmirror/base/status.h"
#include "oplogmirror/base/status_with.h"
#include "oplogmirror/bson/bsonobj.h"
#include "oplogmirror/bson/timestamp.h"
#include "oplogmirror/db/txn/txn_meta.h"

namespace oplogmirror {

struct TxnBufferOptions {
    // Upper bound on the total size of the entries buffered across all transactions. Zero
    // means unlimited.
    std::size_t maxBufferedBytes = 0;
};

namespace txn_buffer_detail {

/**
 * Everything buffered for one transaction. Owned jointly by the buffer's map and by any stream
 * reading it.
 */
struct TxnState {
    TxnState(TxnId id, Timestamp firstTs) : id(std::move(id)), firstTimestamp(firstTs) {}

    // (M)  Reads and writes guarded by 'mutex'.

    const TxnId id;
    const Timestamp firstTimestamp;

    std::mutex mutex;
    std::vector<BSONObj> entries;  // (M)
    bool finalized = false;        // (M)
    bool aborted = false;          // (M)
    std::size_t bytes = 0;         // (M)
};

}  // namespace txn_buffer_detail

/**
 * A lazy, single consumer stream over the operations of a committed transaction, in the order
 * they were applied on the source.
 *
 * Each call to next() returns one operation, boost::none once every operation was returned, or
 * an error if a buffered entry turns out to be malformed. Once the stream has ended or failed,
 * next() keeps returning the same outcome. Streams cannot be restarted.
 *
 * Destroying a stream that was not drained is a caller bug and is logged.
 */
class TxnOpStream {
public:
    explicit TxnOpStream(std::shared_ptr<txn_buffer_detail::TxnState> state);
    ~TxnOpStream();

    TxnOpStream(TxnOpStream&& other) noexcept;
    TxnOpStream& operator=(TxnOpStream&& other) noexcept;

    TxnOpStream(const TxnOpStream&) = delete;
    TxnOpStream& operator=(const TxnOpStream&) = delete;

    StatusWith<boost::optional<BSONObj>> next();

    /**
     * Drains the stream, calling 'fn' on every remaining operation. Stops at the first error,
     * from the stream or from 'fn', and returns it.
     */
    Status forEach(const std::function<Status(const BSONObj&)>& fn);

    /** True once next() has returned the end of the stream or an error. */
    bool isExhausted() const {
        return _finalStatus.has_value();
    }

    /** Number of operations returned so far. */
    std::size_t opsReturned() const {
        return _opsReturned;
    }

private:
    // Loads the inner operations of the next buffered entry, skipping entries without any.
    // Returns false when there are no entries left.
    StatusWith<bool> _advanceEntry();

    std::shared_ptr<txn_buffer_detail::TxnState> _state;

    std::size_t _entryIndex = 0;
    std::vector<BSONElement> _currentOps;
    std::size_t _opIndex = 0;

    std::size_t _opsReturned = 0;
    boost::optional<Status> _finalStatus;
};

/**
 * TxnBuffer accumulates the oplog entries of in-flight transactions until they commit or abort.
 *
 * A single producer feeds entries in the order it reads them from the oplog. Entries of
 * different transactions may interleave; those of one transaction must arrive in their oplog
 * order. Once the final entry of a committed transaction was added, getTxnStream() returns its
 * operations. purge() forgets the transaction, whether it committed or aborted.
 *
 * Every method is thread safe. Work on different transactions only contends on the short map
 * lookup.
 */
class TxnBuffer {
public:
    explicit TxnBuffer(TxnBufferOptions options = {});
    ~TxnBuffer();

    TxnBuffer(const TxnBuffer&) = delete;
    TxnBuffer& operator=(const TxnBuffer&) = delete;

    /**
     * Buffers an owned copy of 'op', whose classification is 'meta'.
     *
     * Fails with IllegalOperation when 'meta' is not part of a transaction, when its transaction
     * has already seen its final entry, or when a non-first entry arrives for a transaction
     * that was never started. Fails with ExceededMemoryLimit when buffering 'op' would exceed
     * TxnBufferOptions::maxBufferedBytes.
     */
    Status addOp(const TxnMeta& meta, const BSONObj& op);

    /**
     * Returns a stream over the operations of the committed transaction 'meta' belongs to.
     * Fails with NoSuchTransaction when nothing is buffered for it and with IllegalOperation
     * when it has not committed.
     */
    StatusWith<TxnOpStream> getTxnStream(const TxnMeta& meta);

    /**
     * Discards everything buffered for the transaction of 'meta'. A transaction with nothing
     * buffered is not an error. Streams already handed out stay readable.
     */
    Status purge(const TxnMeta& meta);

    /**
     * The timestamp of the first entry of the oldest transaction still buffered, or none when
     * the buffer is empty. Replaying from this point cannot lose any in-flight transaction.
     */
    boost::optional<Timestamp> oldestActiveTxnTimestamp() const;

    /** Number of transactions currently buffered. */
    std::size_t size() const;

    /** Total size of the entries currently buffered. */
    std::size_t bufferedBytes() const {
        return _bufferedBytes.load();
    }

    /** True when something is buffered for 'id'. */
    bool hasState(const TxnId& id) const;

private:
    using TxnState = txn_buffer_detail::TxnState;

    Status _reserveBytes(std::size_t bytes, const TxnId& id);

    const TxnBufferOptions _options;

    // (M)  Reads and writes guarded by _mutex.
    mutable std::mutex _mutex;
    std::unordered_map<TxnId, std::shared_ptr<TxnState>, TxnId::Hash> _txns;  // (M)

    std::atomic<std::size_t> _bufferedBytes{0};
};

}  // namespace oplogmirror

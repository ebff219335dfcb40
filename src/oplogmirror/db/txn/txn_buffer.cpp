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

#define OPLOGMIRROR_LOGV2_DEFAULT_COMPONENT ::oplogmirror::logv2::LogComponent::kTransaction

#include "oplogmirror/db/txn/txn_buffer.h"

#include <utility>

#include "oplogmirror/db/repl/oplog_entry.h"
#include "oplogmirror/logv2/log.h"
#include "oplogmirror/util/str.h"

namespace oplogmirror {

TxnOpStream::TxnOpStream(std::shared_ptr<txn_buffer_detail::TxnState> state)
    : _state(std::move(state)) {}

TxnOpStream::~TxnOpStream() {
    if (_state && !_finalStatus) {
        LOGV2_WARNING(8102001,
                      "Transaction operation stream destroyed before it was drained",
                      "txnId"_attr = _state->id,
                      "opsReturned"_attr = _opsReturned);
    }
}

TxnOpStream::TxnOpStream(TxnOpStream&& other) noexcept
    : _state(std::move(other._state)),
      _entryIndex(other._entryIndex),
      _currentOps(std::move(other._currentOps)),
      _opIndex(other._opIndex),
      _opsReturned(other._opsReturned),
      _finalStatus(std::move(other._finalStatus)) {}

TxnOpStream& TxnOpStream::operator=(TxnOpStream&& other) noexcept {
    if (this != &other) {
        _state = std::move(other._state);
        _entryIndex = other._entryIndex;
        _currentOps = std::move(other._currentOps);
        _opIndex = other._opIndex;
        _opsReturned = other._opsReturned;
        _finalStatus = std::move(other._finalStatus);
    }
    return *this;
}

StatusWith<bool> TxnOpStream::_advanceEntry() {
    // The entries of a finalized transaction never change, so they are read without the lock.
    while (_entryIndex < _state->entries.size()) {
        const BSONObj& entry = _state->entries[_entryIndex++];
        BSONObj o = entry.getObjectField(repl::OplogEntry::kObjectFieldName);
        BSONElement first = o.firstElement();

        if (first.fieldNameStringData() == "commitTransaction"_sd ||
            first.fieldNameStringData() == "abortTransaction"_sd) {
            continue;
        }
        if (first.fieldNameStringData() != "applyOps"_sd) {
            return Status(ErrorCodes::FailedToParse,
                          str::stream() << "Transaction entry " << _entryIndex - 1
                                        << " holds neither applyOps nor a commit or abort: "
                                        << entry.toString());
        }
        if (first.type() != BSONType::array) {
            return Status(ErrorCodes::TypeMismatch,
                          str::stream() << "applyOps field of transaction entry "
                                        << _entryIndex - 1 << " must be an array, found "
                                        << typeName(first.type()));
        }

        _currentOps.clear();
        for (const auto& op : first.Obj()) {
            if (op.type() != BSONType::object) {
                return Status(ErrorCodes::TypeMismatch,
                              str::stream() << "Operation " << op.fieldNameStringData()
                                            << " of transaction entry " << _entryIndex - 1
                                            << " must be an object, found "
                                            << typeName(op.type()));
            }
            _currentOps.push_back(op);
        }
        _opIndex = 0;
        if (!_currentOps.empty())
            return true;
    }
    return false;
}

StatusWith<boost::optional<BSONObj>> TxnOpStream::next() {
    if (_finalStatus) {
        if (!_finalStatus->isOK())
            return *_finalStatus;
        return boost::optional<BSONObj>();
    }
    if (!_state) {
        return Status(ErrorCodes::IllegalOperation, "Transaction operation stream was moved from");
    }

    while (_opIndex >= _currentOps.size()) {
        auto swMore = _advanceEntry();
        if (!swMore.isOK()) {
            _finalStatus = swMore.getStatus();
            LOGV2_ERROR(8102002,
                        "Failed to read operation of buffered transaction",
                        "txnId"_attr = _state->id,
                        "error"_attr = *_finalStatus);
            return *_finalStatus;
        }
        if (!swMore.getValue()) {
            _finalStatus = Status::OK();
            LOGV2_DEBUG(8102003,
                        2,
                        "Finished streaming transaction",
                        "txnId"_attr = _state->id,
                        "ops"_attr = _opsReturned);
            return boost::optional<BSONObj>();
        }
    }

    ++_opsReturned;
    return boost::optional<BSONObj>(_currentOps[_opIndex++].embeddedObject().getOwned());
}

Status TxnOpStream::forEach(const std::function<Status(const BSONObj&)>& fn) {
    while (true) {
        auto swOp = next();
        if (!swOp.isOK())
            return swOp.getStatus();
        if (!swOp.getValue())
            return Status::OK();

        Status status = fn(*swOp.getValue());
        if (!status.isOK()) {
            _finalStatus = status;
            return status;
        }
    }
}

TxnBuffer::TxnBuffer(TxnBufferOptions options) : _options(options) {}

TxnBuffer::~TxnBuffer() {
    std::lock_guard<std::mutex> lk(_mutex);
    if (!_txns.empty()) {
        LOGV2(8102004,
              "Discarding buffered transactions that never finished",
              "count"_attr = _txns.size(),
              "bytes"_attr = _bufferedBytes.load());
    }
}

Status TxnBuffer::_reserveBytes(std::size_t bytes, const TxnId& id) {
    std::size_t current = _bufferedBytes.load();
    while (true) {
        if (_options.maxBufferedBytes != 0 && current + bytes > _options.maxBufferedBytes) {
            return Status(ErrorCodes::ExceededMemoryLimit,
                          str::stream()
                              << "Buffering an entry of " << bytes << " bytes for transaction "
                              << id.toString() << " would exceed the limit of "
                              << _options.maxBufferedBytes << " bytes, " << current
                              << " bytes are already buffered");
        }
        if (_bufferedBytes.compare_exchange_weak(current, current + bytes))
            return Status::OK();
    }
}

Status TxnBuffer::addOp(const TxnMeta& meta, const BSONObj& op) {
    if (!meta.isTxn()) {
        return Status(ErrorCodes::IllegalOperation,
                      str::stream() << "Cannot buffer an entry that is not part of a transaction: "
                                    << op.toString());
    }

    std::shared_ptr<TxnState> state;
    {
        std::lock_guard<std::mutex> lk(_mutex);
        auto it = _txns.find(meta.getId());
        if (it == _txns.end()) {
            if (!meta.isFirst()) {
                return Status(ErrorCodes::IllegalOperation,
                              str::stream()
                                  << "Entry with role " << toString(meta.getRole())
                                  << " for transaction " << meta.getId().toString()
                                  << " arrived before the first entry of that transaction");
            }
            state = std::make_shared<TxnState>(meta.getId(), meta.getTimestamp());
            _txns.emplace(meta.getId(), state);
        } else {
            state = it->second;
        }
    }

    std::lock_guard<std::mutex> lk(state->mutex);
    if (state->finalized) {
        return Status(ErrorCodes::IllegalOperation,
                      str::stream() << "Transaction " << meta.getId().toString()
                                    << " already saw its final entry");
    }
    if (meta.isFirst() && !state->entries.empty()) {
        return Status(ErrorCodes::IllegalOperation,
                      str::stream() << "Transaction " << meta.getId().toString()
                                    << " was already started by an earlier entry");
    }

    const std::size_t bytes = static_cast<std::size_t>(op.objsize());
    Status reserved = _reserveBytes(bytes, meta.getId());
    if (!reserved.isOK())
        return reserved;

    state->entries.push_back(op.getOwned());
    state->bytes += bytes;
    if (meta.isFinal()) {
        state->finalized = true;
        state->aborted = meta.isAbort();
    }

    LOGV2_DEBUG(8102005,
                3,
                "Buffered transaction entry",
                "txnId"_attr = meta.getId(),
                "role"_attr = toString(meta.getRole()),
                "entries"_attr = state->entries.size(),
                "bytes"_attr = state->bytes);
    return Status::OK();
}

StatusWith<TxnOpStream> TxnBuffer::getTxnStream(const TxnMeta& meta) {
    if (!meta.isTxn()) {
        return Status(ErrorCodes::IllegalOperation,
                      "Cannot stream the operations of an entry that is not part of a "
                      "transaction");
    }

    std::shared_ptr<TxnState> state;
    {
        std::lock_guard<std::mutex> lk(_mutex);
        auto it = _txns.find(meta.getId());
        if (it == _txns.end()) {
            return Status(ErrorCodes::NoSuchTransaction,
                          str::stream() << "Nothing is buffered for transaction "
                                        << meta.getId().toString());
        }
        state = it->second;
    }

    {
        std::lock_guard<std::mutex> lk(state->mutex);
        if (!state->finalized) {
            return Status(ErrorCodes::IllegalOperation,
                          str::stream() << "Transaction " << meta.getId().toString()
                                        << " has not seen its final entry yet");
        }
        if (state->aborted) {
            return Status(ErrorCodes::IllegalOperation,
                          str::stream() << "Transaction " << meta.getId().toString()
                                        << " was aborted, it has no operations to apply");
        }
    }

    return TxnOpStream(std::move(state));
}

Status TxnBuffer::purge(const TxnMeta& meta) {
    if (!meta.isTxn()) {
        return Status(ErrorCodes::IllegalOperation,
                      "Cannot purge an entry that is not part of a transaction");
    }

    std::shared_ptr<TxnState> state;
    {
        std::lock_guard<std::mutex> lk(_mutex);
        auto it = _txns.find(meta.getId());
        if (it == _txns.end())
            return Status::OK();
        state = std::move(it->second);
        _txns.erase(it);
    }

    std::lock_guard<std::mutex> lk(state->mutex);
    _bufferedBytes.fetch_sub(state->bytes);
    LOGV2_DEBUG(8102006,
                2,
                "Purged buffered transaction",
                "txnId"_attr = meta.getId(),
                "entries"_attr = state->entries.size(),
                "aborted"_attr = state->aborted);
    return Status::OK();
}

boost::optional<Timestamp> TxnBuffer::oldestActiveTxnTimestamp() const {
    boost::optional<Timestamp> oldest;
    std::lock_guard<std::mutex> lk(_mutex);
    for (const auto& [id, state] : _txns) {
        if (!oldest || state->firstTimestamp < *oldest)
            oldest = state->firstTimestamp;
    }
    return oldest;
}

std::size_t TxnBuffer::size() const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _txns.size();
}

bool TxnBuffer::hasState(const TxnId& id) const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _txns.find(id) != _txns.end();
}

}  // namespace oplogmirror

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
#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>

#include "oplogmirror/base/data_view.h"
#include "oplogmirror/base/string_data.h"

namespace oplogmirror {

/**
 * The largest buffer a BufBuilder may grow to. Anything larger is a bug in the code building it.
 */
const int BufferMaxSize = 64 * 1024 * 1024;

/**
 * A growable byte buffer that serializes numbers in little endian order.
 *
 * Positions inside the buffer are handed out as offsets rather than pointers since any append
 * may move the storage.
 */
class BufBuilder {
public:
    explicit BufBuilder(std::size_t initsize = 512) {
        _buf.reserve(initsize);
    }

    BufBuilder(const BufBuilder&) = delete;
    BufBuilder& operator=(const BufBuilder&) = delete;

    void reset() {
        _buf.clear();
    }

    /**
     * Leaves room for 'n' bytes to be filled in later and returns the offset of the first one.
     */
    std::size_t skip(std::size_t n) {
        const auto offset = _buf.size();
        _grow(n);
        return offset;
    }

    /** Note the returned pointer is invalidated by any later append. */
    char* buf() {
        return _buf.data();
    }
    const char* buf() const {
        return _buf.data();
    }

    void appendChar(char j) {
        _buf.push_back(j);
    }

    void appendUChar(unsigned char j) {
        _buf.push_back(static_cast<char>(j));
    }

    void appendNum(bool j) {
        appendChar(j ? 1 : 0);
    }

    void appendNum(std::int32_t j) {
        DataView(_grow(sizeof(j))).writeLE(j);
    }

    void appendNum(std::int64_t j) {
        DataView(_grow(sizeof(j))).writeLE(j);
    }

    void appendNum(std::uint64_t j) {
        DataView(_grow(sizeof(j))).writeLE(j);
    }

    void appendNum(double j) {
        DataView(_grow(sizeof(j))).writeLE(j);
    }

    void appendBuf(const void* src, std::size_t len) {
        if (len)
            std::memcpy(_grow(len), src, len);
    }

    void appendStr(StringData str, bool includeEndingNull = true) {
        appendBuf(str.rawData(), str.size());
        if (includeEndingNull)
            appendChar('\0');
    }

    /** Overwrites a 32-bit value previously reserved with skip(). */
    void writeNumAt(std::size_t offset, std::int32_t j) {
        DataView(_buf.data()).writeLE(j, offset);
    }

    int len() const {
        return static_cast<int>(_buf.size());
    }

    void setlen(std::size_t newLen) {
        _buf.resize(newLen);
    }

    /**
     * Transfers the contents to a shared, immutable buffer and leaves this builder empty.
     */
    std::shared_ptr<const char> release();

private:
    char* _grow(std::size_t by);

    std::vector<char> _buf;
};

}  // namespace oplogmirror

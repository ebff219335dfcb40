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

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include <boost/endian/conversion.hpp>

namespace oplogmirror {

/**
 * Read-only view over unaligned memory holding little endian values, as in the BSON wire
 * format. The view does not own the memory.
 */
class ConstDataView {
public:
    using bytes_type = const char*;

    explicit ConstDataView(bytes_type bytes) : _bytes(bytes) {}

    bytes_type view(std::size_t offset = 0) const {
        return _bytes + offset;
    }

    template <typename T>
    T readLE(std::size_t offset = 0) const {
        static_assert(std::is_arithmetic_v<T>);
        if constexpr (std::is_floating_point_v<T>) {
            static_assert(sizeof(T) == sizeof(std::uint64_t));
            return std::bit_cast<T>(readLE<std::uint64_t>(offset));
        } else {
            T value;
            std::memcpy(&value, view(offset), sizeof(value));
            return boost::endian::little_to_native(value);
        }
    }

private:
    bytes_type _bytes;
};

/**
 * Writable counterpart of ConstDataView.
 */
class DataView : public ConstDataView {
public:
    using bytes_type = char*;

    explicit DataView(bytes_type bytes) : ConstDataView(bytes), _bytes(bytes) {}

    template <typename T>
    DataView& writeLE(T value, std::size_t offset = 0) {
        static_assert(std::is_arithmetic_v<T>);
        if constexpr (std::is_floating_point_v<T>) {
            static_assert(sizeof(T) == sizeof(std::uint64_t));
            return writeLE(std::bit_cast<std::uint64_t>(value), offset);
        } else {
            const T le = boost::endian::native_to_little(value);
            std::memcpy(_bytes + offset, &le, sizeof(le));
            return *this;
        }
    }

private:
    bytes_type _bytes;
};

}  // namespace oplogmirror

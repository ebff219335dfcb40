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

#include "oplogmirror/util/base64.h"

#include <array>
#include <cstdint>

namespace oplogmirror {
namespace base64 {

namespace {

constexpr StringData kEncodeTable =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/"_sd;

constexpr std::uint8_t kInvalid = 0xff;

constexpr std::array<std::uint8_t, 256> makeDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    for (auto& entry : table)
        entry = kInvalid;
    for (std::size_t i = 0; i < kEncodeTable.size(); ++i)
        table[static_cast<unsigned char>(kEncodeTable[i])] = static_cast<std::uint8_t>(i);
    return table;
}

constexpr auto kDecodeTable = makeDecodeTable();

}  // namespace

std::string encode(StringData in) {
    std::string out;
    out.reserve(((in.size() + 2) / 3) * 4);

    const auto* data = reinterpret_cast<const unsigned char*>(in.rawData());
    std::size_t i = 0;
    for (; i + 3 <= in.size(); i += 3) {
        std::uint32_t group = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out.push_back(kEncodeTable[(group >> 18) & 0x3f]);
        out.push_back(kEncodeTable[(group >> 12) & 0x3f]);
        out.push_back(kEncodeTable[(group >> 6) & 0x3f]);
        out.push_back(kEncodeTable[group & 0x3f]);
    }

    const std::size_t left = in.size() - i;
    if (left == 1) {
        std::uint32_t group = data[i] << 16;
        out.push_back(kEncodeTable[(group >> 18) & 0x3f]);
        out.push_back(kEncodeTable[(group >> 12) & 0x3f]);
        out.append("==");
    } else if (left == 2) {
        std::uint32_t group = (data[i] << 16) | (data[i + 1] << 8);
        out.push_back(kEncodeTable[(group >> 18) & 0x3f]);
        out.push_back(kEncodeTable[(group >> 12) & 0x3f]);
        out.push_back(kEncodeTable[(group >> 6) & 0x3f]);
        out.push_back('=');
    }
    return out;
}

StatusWith<std::string> decode(StringData in) {
    if (in.size() % 4 != 0)
        return Status(ErrorCodes::FailedToParse, "invalid base64: length not a multiple of 4");

    std::string out;
    out.reserve(in.size() / 4 * 3);
    for (std::size_t i = 0; i < in.size(); i += 4) {
        std::uint32_t group = 0;
        int padding = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            const char c = in[i + j];
            group <<= 6;
            if (c == '=' && i + 4 == in.size() && j >= 2) {
                ++padding;
                continue;
            }
            if (padding > 0)
                return Status(ErrorCodes::FailedToParse, "invalid base64: data after padding");
            const auto value = kDecodeTable[static_cast<unsigned char>(c)];
            if (value == kInvalid)
                return Status(ErrorCodes::FailedToParse, "invalid base64 character");
            group |= value;
        }
        out.push_back(static_cast<char>((group >> 16) & 0xff));
        if (padding < 2)
            out.push_back(static_cast<char>((group >> 8) & 0xff));
        if (padding < 1)
            out.push_back(static_cast<char>(group & 0xff));
    }
    return out;
}

}  // namespace base64
}  // namespace oplogmirror

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
#include <cstring>
#include <iosfwd>
#include <string>
#include <string_view>

namespace oplogmirror {

/**
 * A StringData object refers to an array of characters, stored elsewhere, that it does not own.
 * It may be constructed from std::string, std::string_view or a NUL-terminated C string and is
 * meant to be passed by value.
 *
 * The referenced data must outlive the StringData.
 */
class StringData {
public:
    static constexpr size_t npos = std::string_view::npos;

    constexpr StringData() = default;

    StringData(const char* c) : _sv(c ? std::string_view(c) : std::string_view()) {}

    constexpr StringData(const char* c, size_t len) : _sv(c, len) {}

    StringData(const std::string& s) : _sv(s) {}

    constexpr StringData(std::string_view sv) : _sv(sv) {}

    constexpr const char* rawData() const {
        return _sv.data();
    }

    constexpr size_t size() const {
        return _sv.size();
    }

    constexpr bool empty() const {
        return _sv.empty();
    }

    constexpr char operator[](size_t i) const {
        return _sv[i];
    }

    std::string toString() const {
        return std::string(_sv);
    }

    explicit operator std::string() const {
        return toString();
    }

    constexpr std::string_view toStringView() const {
        return _sv;
    }

    constexpr StringData substr(size_t pos, size_t n = npos) const {
        return StringData(_sv.substr(pos, n));
    }

    constexpr size_t find(char c, size_t fromPos = 0) const {
        return _sv.find(c, fromPos);
    }

    constexpr size_t find(StringData needle, size_t fromPos = 0) const {
        return _sv.find(needle._sv, fromPos);
    }

    constexpr bool startsWith(StringData prefix) const {
        return _sv.substr(0, prefix.size()) == prefix._sv;
    }

    constexpr bool endsWith(StringData suffix) const {
        return _sv.size() >= suffix.size() &&
            _sv.substr(_sv.size() - suffix.size()) == suffix._sv;
    }

    constexpr const char* begin() const {
        return _sv.data();
    }

    constexpr const char* end() const {
        return _sv.data() + _sv.size();
    }

    friend constexpr bool operator==(StringData lhs, StringData rhs) {
        return lhs._sv == rhs._sv;
    }

    friend constexpr bool operator!=(StringData lhs, StringData rhs) {
        return lhs._sv != rhs._sv;
    }

    friend constexpr bool operator<(StringData lhs, StringData rhs) {
        return lhs._sv < rhs._sv;
    }

private:
    std::string_view _sv;
};

std::ostream& operator<<(std::ostream& stream, StringData value);

inline std::string operator+(const std::string& lhs, StringData rhs) {
    std::string out = lhs;
    out.append(rhs.rawData(), rhs.size());
    return out;
}

inline std::string operator+(StringData lhs, const std::string& rhs) {
    std::string out = lhs.toString();
    out += rhs;
    return out;
}

inline namespace literals {

constexpr StringData operator""_sd(const char* c, std::size_t len) {
    return StringData(c, len);
}

}  // namespace literals

}  // namespace oplogmirror

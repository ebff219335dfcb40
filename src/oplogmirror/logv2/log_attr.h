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

namespace oplogmirror {
namespace logv2 {
namespace detail {

/**
 * Name/value pair of a log attribute. It refers to the value, so it may only live as long as
 * the logging statement that created it.
 */
template <typename T>
struct NamedArg {
    const char* name;
    const T& value;
};

struct UDLNamedArg {
    template <typename T>
    NamedArg<T> operator=(const T& value) const {
        return {name, value};
    }

    const char* name;
};

}  // namespace detail

inline namespace literals {

/**
 * Attribute names for LOGV2 statements: "host"_attr = host.
 */
constexpr detail::UDLNamedArg operator""_attr(const char* name, std::size_t) {
    return {name};
}

}  // namespace literals
}  // namespace logv2

// Allow "name"_attr anywhere in the project without a using-declaration.
using namespace logv2::literals;

}  // namespace oplogmirror

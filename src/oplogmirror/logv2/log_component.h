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

#include <iosfwd>

#include "oplogmirror/base/string_data.h"

namespace oplogmirror {
namespace logv2 {

/**
 * Log components.
 * Debug verbosity can be set per component; a component without its own setting inherits the
 * one of kDefault.
 */
class LogComponent {
public:
    enum Value {
        kDefault = 0,
        kControl,
        kNetwork,
        kReplication,
        kTransaction,
        kCommand,
        kNumLogComponents
    };

    constexpr LogComponent(Value value) : _value(value) {}

    constexpr operator Value() const {
        return _value;
    }

    /**
     * Returns the name used for the "c" field of log lines, e.g. "REPL".
     */
    StringData getNameForLog() const;

    /**
     * Returns the lower case name used to configure the component, e.g. "replication".
     */
    StringData getShortName() const;

    /**
     * Parses a name as returned by getShortName(). Returns kNumLogComponents when unknown.
     */
    static LogComponent parse(StringData shortName);

private:
    Value _value;
};

std::ostream& operator<<(std::ostream& os, LogComponent component);

}  // namespace logv2
}  // namespace oplogmirror

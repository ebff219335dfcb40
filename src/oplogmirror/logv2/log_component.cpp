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

#include "oplogmirror/logv2/log_component.h"

#include <ostream>

namespace oplogmirror {
namespace logv2 {

StringData LogComponent::getNameForLog() const {
    switch (_value) {
        case kDefault:
            return "-"_sd;
        case kControl:
            return "CONTROL"_sd;
        case kNetwork:
            return "NETWORK"_sd;
        case kReplication:
            return "REPL"_sd;
        case kTransaction:
            return "TXN"_sd;
        case kCommand:
            return "COMMAND"_sd;
        case kNumLogComponents:
            break;
    }
    return "INVALID"_sd;
}

StringData LogComponent::getShortName() const {
    switch (_value) {
        case kDefault:
            return "default"_sd;
        case kControl:
            return "control"_sd;
        case kNetwork:
            return "network"_sd;
        case kReplication:
            return "replication"_sd;
        case kTransaction:
            return "transaction"_sd;
        case kCommand:
            return "command"_sd;
        case kNumLogComponents:
            break;
    }
    return "invalid"_sd;
}

LogComponent LogComponent::parse(StringData shortName) {
    for (int i = 0; i < kNumLogComponents; ++i) {
        const LogComponent component(static_cast<Value>(i));
        if (component.getShortName() == shortName)
            return component;
    }
    return kNumLogComponents;
}

std::ostream& operator<<(std::ostream& os, LogComponent component) {
    return os << component.getNameForLog();
}

}  // namespace logv2
}  // namespace oplogmirror

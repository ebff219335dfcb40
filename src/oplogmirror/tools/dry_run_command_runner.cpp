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

#include "oplogmirror/tools/dry_run_command_runner.h"

#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/util/assert_util.h"

namespace oplogmirror {

DryRunCommandRunner::DryRunCommandRunner(std::ostream* out) : _out(out) {
    invariant(_out);
}

bool DryRunCommandRunner::runCommand(const std::string& dbName,
                                     const BSONObj& cmd,
                                     BSONObj* reply) {
    ++_commandCount;
    *_out << BSON("db" << dbName << "command" << cmd).jsonString() << '\n';

    const StringData cmdName = cmd.firstElementFieldNameStringData();
    BSONObjBuilder bob;
    bob.append("ok", 1.0);
    if (cmdName == "applyOps"_sd) {
        const auto ops = cmd["applyOps"].Array();
        bob.append("applied", static_cast<int>(ops.size()));
        BSONArrayBuilder results(bob.subarrayStart("results"));
        for (std::size_t i = 0; i < ops.size(); ++i)
            results.append(true);
    } else if (cmdName == "listCollections"_sd) {
        // Nothing exists on a destination that never applies anything.
        BSONObjBuilder cursor(bob.subobjStart("cursor"));
        cursor.append("id", 0LL);
        cursor.append("ns", dbName + ".$cmd.listCollections");
        cursor.append("firstBatch", BSONArray());
    } else if (cmdName == "isMaster"_sd) {
        bob.append("ismaster", true);
    }
    *reply = bob.obj();
    return true;
}

}  // namespace oplogmirror

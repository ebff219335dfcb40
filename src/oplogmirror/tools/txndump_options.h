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
#include <string>
#include <vector>

#include "oplogmirror/base/status_with.h"
#include "oplogmirror/db/repl/oplog_replayer.h"
#include "oplogmirror/db/txn/txn_buffer.h"
#include "oplogmirror/db/write_concern_options.h"

namespace oplogmirror {

struct TxndumpOptions {
    enum class OutputType {
        // One JSON line per committed transaction, holding its operations.
        kJson,
        // The commands a replay would send to the destination, one JSON line each.
        kApplyOps,
    };

    bool help = false;

    std::string file;
    OutputType type = OutputType::kJson;
    bool objcheck = true;

    int verbosity = 0;
    std::string logPath;

    // Version of the destination the replay pretends to talk to.
    std::vector<int> destinationVersion = {4, 4, 0};
    WriteConcernOptions writeConcern = WriteConcernOptions::majority();

    repl::OplogReplayerOptions replayer;
    TxnBufferOptions buffer;
};

/**
 * Parses the txndump command line, and the INI style file named by --config if any. Values
 * given on the command line take precedence over those in the file.
 *
 * Fails with BadValue on unknown or malformed options, with FileNotOpen when the config file
 * cannot be read.
 */
StatusWith<TxndumpOptions> parseTxndumpOptions(const std::vector<std::string>& args);

void printTxndumpHelp(std::ostream& out);

}  // namespace oplogmirror

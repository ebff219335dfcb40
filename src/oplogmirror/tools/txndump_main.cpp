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

#define OPLOGMIRROR_LOGV2_DEFAULT_COMPONENT ::oplogmirror::logv2::LogComponent::kControl

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "oplogmirror/logv2/log.h"
#include "oplogmirror/logv2/log_manager.h"
#include "oplogmirror/tools/txndump.h"
#include "oplogmirror/tools/txndump_options.h"

namespace oplogmirror {
namespace {

constexpr int kExitBadOptions = 2;

int txndumpMain(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto swOptions = parseTxndumpOptions(args);
    if (!swOptions.isOK()) {
        std::cerr << "ERROR: " << swOptions.getStatus().reason() << std::endl << std::endl;
        printTxndumpHelp(std::cerr);
        return kExitBadOptions;
    }
    const TxndumpOptions& options = swOptions.getValue();
    if (options.help) {
        printTxndumpHelp(std::cout);
        return EXIT_SUCCESS;
    }

    auto& logManager = logv2::LogManager::global();
    logManager.setVerbosity(options.verbosity);
    if (!options.logPath.empty()) {
        Status status = logManager.setupFileSink(options.logPath);
        if (!status.isOK()) {
            std::cerr << "ERROR: " << status.toString() << std::endl;
            return EXIT_FAILURE;
        }
    }

    std::ifstream in(options.file, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        LOGV2_ERROR(8105005, "Error opening file", "file"_attr = options.file);
        return EXIT_FAILURE;
    }

    Txndump txndump(options, &std::cout);
    Status status = txndump.run(in);
    if (!status.isOK()) {
        LOGV2_ERROR(8105006, "txndump failed", "error"_attr = status);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

}  // namespace
}  // namespace oplogmirror

int main(int argc, char** argv) {
    return ::oplogmirror::txndumpMain(argc, argv);
}

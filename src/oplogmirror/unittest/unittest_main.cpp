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

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>

#include "oplogmirror/logv2/log_manager.h"
#include "oplogmirror/unittest/unittest.h"

namespace po = boost::program_options;

int main(int argc, char** argv) {
    // GoogleTest removes the flags it recognizes; what is left is ours.
    ::testing::InitGoogleTest(&argc, argv);

    po::options_description options("Unit test options");
    options.add_options()("help,h", "show this usage information")(
        "verbose,v",
        po::value<std::string>()->implicit_value("v"),
        "log more verbosely, e.g. -vvv");

    // "-vvv" is read as --verbose=vvv rather than as -v with the value "vv".
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() > 1 && arg[0] == '-' && arg.find_first_not_of('v', 1) == std::string::npos)
            arg = "--verbose=" + arg.substr(1);
        args.push_back(std::move(arg));
    }

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(args).options(options).allow_unregistered().run(), vm);
        po::notify(vm);
    } catch (const po::error& ex) {
        std::cerr << ex.what() << std::endl << options << std::endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        std::cout << options << std::endl;
        return EXIT_SUCCESS;
    }

    std::string verbose;
    if (vm.count("verbose"))
        verbose = vm["verbose"].as<std::string>();
    if (verbose.find_first_not_of('v') != std::string::npos) {
        std::cerr << "The string for the --verbose option cannot contain characters other than 'v'"
                  << std::endl;
        return EXIT_FAILURE;
    }
    ::oplogmirror::logv2::LogManager::global().setVerbosity(static_cast<int>(verbose.length()));

    return RUN_ALL_TESTS();
}

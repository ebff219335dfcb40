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

#include "oplogmirror/tools/txndump_options.h"

#include <fstream>
#include <iostream>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include "oplogmirror/util/str.h"

namespace po = boost::program_options;

namespace oplogmirror {
namespace {

po::options_description makeGeneralOptions() {
    po::options_description options("General options");
    options.add_options()("help,h", "show this usage information")(
        "verbose,v",
        po::value<std::string>()->implicit_value("v"),
        "be more verbose (include multiple times for more verbosity, e.g. -vvvvv)")(
        "type",
        po::value<std::string>()->default_value("json"),
        "type of output: json (committed transactions) or applyOps (replay commands)")(
        "noobjcheck", po::bool_switch(), "do not validate documents read from the file")(
        "logPath", po::value<std::string>(), "append log lines to this file")(
        "config,f", po::value<std::string>(), "read options from this INI style file");
    return options;
}

po::options_description makeReplayOptions() {
    const TxndumpOptions defaults;
    po::options_description options("Replay options");
    options.add_options()("destinationVersion",
                          po::value<std::string>()->default_value("4.4.0"),
                          "server version the replay is shaped for")(
        "writeConcern",
        po::value<std::string>()->default_value("majority"),
        "write concern of replayed writes: majority, a number of nodes or a tag")(
        "maxBatchOps",
        po::value<std::size_t>()->default_value(defaults.replayer.maxBatchOps),
        "most operations in one applyOps batch")(
        "maxBatchBytes",
        po::value<std::size_t>()->default_value(defaults.replayer.maxBatchBytes),
        "most bytes in one applyOps batch")(
        "maxBufferedBytes",
        po::value<std::size_t>()->default_value(defaults.buffer.maxBufferedBytes),
        "most bytes of open transactions held in memory, 0 for no limit")(
        "applyNoops", po::bool_switch(), "replay no-op entries instead of skipping them")(
        "noBypassDocumentValidation",
        po::bool_switch(),
        "let the destination validate replayed documents");
    return options;
}

po::options_description makeHiddenOptions() {
    po::options_description options("Hidden options");
    options.add_options()("file", po::value<std::string>(), ".bson oplog dump to read");
    return options;
}

StatusWith<std::vector<int>> parseVersion(const std::string& version) {
    std::vector<std::string> parts;
    boost::algorithm::split(parts, version, boost::algorithm::is_any_of("."));

    std::vector<int> versionArray;
    for (const auto& part : parts) {
        int value;
        if (!boost::conversion::try_lexical_convert(part, value) || value < 0) {
            return Status(ErrorCodes::BadValue,
                          str::stream() << "invalid destinationVersion '" << version
                                        << "', expected a version such as 4.4.0");
        }
        versionArray.push_back(value);
    }
    return versionArray;
}

/**
 * Spells every verbosity flag as --verbose=<v's>, so that "-vvv" counts three and "-v" never
 * takes the .bson file that follows it as its value.
 */
std::vector<std::string> normalizeVerbosityArgs(const std::vector<std::string>& args) {
    std::vector<std::string> normalized;
    normalized.reserve(args.size());
    for (const auto& arg : args) {
        if (arg == "--verbose") {
            normalized.push_back("--verbose=v");
        } else if (arg.size() > 1 && arg[0] == '-' &&
                   arg.find_first_not_of('v', 1) == std::string::npos) {
            normalized.push_back("--verbose=" + arg.substr(1));
        } else {
            normalized.push_back(arg);
        }
    }
    return normalized;
}

}  // namespace

StatusWith<TxndumpOptions> parseTxndumpOptions(const std::vector<std::string>& args) {
    po::options_description all("All options");
    all.add(makeGeneralOptions()).add(makeReplayOptions()).add(makeHiddenOptions());
    po::positional_options_description positional;
    positional.add("file", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(normalizeVerbosityArgs(args))
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);

        if (vm.count("config")) {
            const std::string configPath = vm["config"].as<std::string>();
            std::ifstream config(configPath);
            if (!config.is_open()) {
                return Status(ErrorCodes::FileNotOpen,
                              str::stream() << "cannot open config file " << configPath);
            }
            // Stored second, so the command line wins.
            po::store(po::parse_config_file(config, all), vm);
        }
        po::notify(vm);
    } catch (const po::error& ex) {
        return Status(ErrorCodes::BadValue, ex.what());
    }

    TxndumpOptions options;
    if (vm.count("help")) {
        options.help = true;
        return options;
    }

    if (vm.count("verbose")) {
        const std::string verbose = vm["verbose"].as<std::string>();
        if (verbose.find_first_not_of('v') != std::string::npos) {
            return Status(ErrorCodes::BadValue,
                          "The string for the --verbose option cannot contain characters other "
                          "than 'v'");
        }
        options.verbosity = static_cast<int>(verbose.size());
    }

    if (!vm.count("file"))
        return Status(ErrorCodes::BadValue, "no .bson file given");
    options.file = vm["file"].as<std::string>();

    const std::string type = vm["type"].as<std::string>();
    if (type == "json") {
        options.type = TxndumpOptions::OutputType::kJson;
    } else if (type == "applyOps") {
        options.type = TxndumpOptions::OutputType::kApplyOps;
    } else {
        return Status(ErrorCodes::BadValue, "bad type: " + type);
    }

    options.objcheck = !vm["noobjcheck"].as<bool>();
    if (vm.count("logPath"))
        options.logPath = vm["logPath"].as<std::string>();

    auto swVersion = parseVersion(vm["destinationVersion"].as<std::string>());
    if (!swVersion.isOK())
        return swVersion.getStatus();
    options.destinationVersion = std::move(swVersion.getValue());

    auto swWriteConcern = WriteConcernOptions::parse(vm["writeConcern"].as<std::string>());
    if (!swWriteConcern.isOK())
        return swWriteConcern.getStatus().withContext("invalid writeConcern");
    options.writeConcern = swWriteConcern.getValue();

    options.replayer.maxBatchOps = vm["maxBatchOps"].as<std::size_t>();
    if (options.replayer.maxBatchOps == 0)
        return Status(ErrorCodes::BadValue, "maxBatchOps must be at least 1");
    options.replayer.maxBatchBytes = vm["maxBatchBytes"].as<std::size_t>();
    options.replayer.skipNoops = !vm["applyNoops"].as<bool>();
    options.replayer.bypassDocumentValidation = !vm["noBypassDocumentValidation"].as<bool>();
    options.buffer.maxBufferedBytes = vm["maxBufferedBytes"].as<std::size_t>();

    return options;
}

void printTxndumpHelp(std::ostream& out) {
    out << "usage: txndump [options] <oplog.bson>" << std::endl << std::endl;
    out << "Reconstructs the transactions of an oplog dump and prints them, or the commands "
           "replaying the dump would send."
        << std::endl
        << std::endl;
    out << makeGeneralOptions() << std::endl << makeReplayOptions() << std::endl;
}

}  // namespace oplogmirror

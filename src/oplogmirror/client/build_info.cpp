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

#include "oplogmirror/client/build_info.h"

#include <cctype>

#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/client/command_runner.h"
#include "oplogmirror/rpc/get_status_from_command_result.h"
#include "oplogmirror/util/assert_util.h"
#include "oplogmirror/util/str.h"

namespace oplogmirror {
namespace {

constexpr auto kVersionField = "version"_sd;
constexpr auto kVersionArrayField = "versionArray"_sd;
constexpr auto kGitVersionField = "gitVersion"_sd;
constexpr auto kMaxBsonObjectSizeField = "maxBsonObjectSize"_sd;

// "4.2.1-rc0" becomes {4, 2, 1}. Parsing stops at the first component that does not start with
// a digit.
std::vector<int> versionArrayFromString(StringData version) {
    std::vector<int> result;
    std::size_t pos = 0;
    while (pos < version.size() && std::isdigit(static_cast<unsigned char>(version[pos]))) {
        int component = 0;
        while (pos < version.size() && std::isdigit(static_cast<unsigned char>(version[pos]))) {
            component = component * 10 + (version[pos] - '0');
            ++pos;
        }
        result.push_back(component);
        if (pos >= version.size() || version[pos] != '.')
            break;
        ++pos;
    }
    return result;
}

}  // namespace

BuildInfo::BuildInfo(std::vector<int> versionArray) : _versionArray(std::move(versionArray)) {
    str::stream ss;
    for (std::size_t i = 0; i < _versionArray.size(); ++i)
        ss << (i ? "." : "") << _versionArray[i];
    _version = ss;
}

StatusWith<BuildInfo> BuildInfo::parse(const BSONObj& reply) {
    BuildInfo info;
    info._version = reply.getStringField(kVersionField).toString();
    info._gitVersion = reply.getStringField(kGitVersionField).toString();

    BSONElement maxSize = reply[kMaxBsonObjectSizeField];
    if (maxSize.isNumber() && maxSize.numberInt() > 0)
        info._maxBsonObjectSize = maxSize.numberInt();

    BSONElement versionArray = reply[kVersionArrayField];
    if (versionArray.type() == BSONType::array) {
        for (const auto& component : versionArray.Obj()) {
            if (!component.isNumber()) {
                return Status(ErrorCodes::TypeMismatch,
                              str::stream() << "buildInfo versionArray holds a "
                                            << typeName(component.type()) << ": "
                                            << versionArray.toString(false));
            }
            info._versionArray.push_back(component.numberInt());
        }
    } else if (!versionArray.eoo()) {
        return Status(ErrorCodes::TypeMismatch,
                      str::stream() << "buildInfo versionArray must be an array, found "
                                    << typeName(versionArray.type()));
    } else {
        info._versionArray = versionArrayFromString(info._version);
    }

    if (info._versionArray.empty()) {
        return Status(ErrorCodes::FailedToParse,
                      str::stream() << "buildInfo reply does not name a server version: "
                                    << reply.toString());
    }
    return info;
}

StatusWith<BuildInfo> BuildInfo::fetch(CommandRunner* runner) {
    BSONObj reply;
    try {
        runner->runCommand("admin", BSON("buildInfo" << 1), &reply);
    } catch (const DBException& ex) {
        return ex.toStatus("buildInfo failed");
    }
    Status status = getStatusFromCommandResult(reply);
    if (!status.isOK())
        return status.withContext("buildInfo failed");
    return parse(reply);
}

bool BuildInfo::versionAtLeast(std::initializer_list<int> version) const {
    std::size_t i = 0;
    for (int component : version) {
        if (i == _versionArray.size())
            return false;
        if (_versionArray[i] != component)
            return _versionArray[i] >= component;
        ++i;
    }
    return true;
}

std::string BuildInfo::toString() const {
    return str::stream() << "version: " << _version << ", gitVersion: " << _gitVersion;
}

}  // namespace oplogmirror

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

#include "oplogmirror/client/command_runner_mock.h"

#include "oplogmirror/rpc/get_status_from_command_result.h"
#include "oplogmirror/unittest/unittest.h"
#include "oplogmirror/util/assert_util.h"
#include "oplogmirror/util/str.h"

namespace oplogmirror {

namespace {
StatusWith<BSONObj> noHandlerSet(const CommandRunnerMock::Request& request) {
    ADD_FAILURE() << "runCommand not expected to be called. request: " << request.toString();
    return Status(ErrorCodes::InternalError, "response not set");
}
}  // namespace

std::string CommandRunnerMock::Request::toString() const {
    return str::stream() << "db: " << dbName << ", cmd: " << cmd.toString();
}

CommandRunnerMock::CommandRunnerMock() : _defaultHandler(noHandlerSet) {}

CommandRunnerMock::~CommandRunnerMock() = default;

bool CommandRunnerMock::runCommand(const std::string& dbName,
                                   const BSONObj& cmd,
                                   BSONObj* reply) {
    Request request{dbName, cmd.getOwned()};
    _requests.push_back(request);

    StatusWith<BSONObj> response = Status(ErrorCodes::InternalError, "response not set");
    if (!_expected.empty()) {
        Expectation next = std::move(_expected.front());
        _expected.pop_front();
        if (next.checker)
            next.checker(request);
        response = std::move(next.response);
    } else {
        response = _defaultHandler(request);
    }

    if (!response.isOK())
        throw NetworkException(response.getStatus());

    *reply = response.getValue().getOwned();
    return getStatusFromCommandResult(*reply).isOK();
}

void CommandRunnerMock::setNextExpectedCommand(Checker checkerFunc,
                                               StatusWith<BSONObj> returnThis) {
    _expected.push_back({std::move(checkerFunc), std::move(returnThis)});
}

void CommandRunnerMock::pushResponse(StatusWith<BSONObj> returnThis) {
    _expected.push_back({Checker(), std::move(returnThis)});
}

void CommandRunnerMock::setDefaultHandler(Handler handler) {
    _defaultHandler = std::move(handler);
}

std::vector<CommandRunnerMock::Request> CommandRunnerMock::getRequests(StringData name) const {
    std::vector<Request> matching;
    for (const auto& request : _requests) {
        if (request.commandName() == name)
            matching.push_back(request);
    }
    return matching;
}

}  // namespace oplogmirror

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

#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "oplogmirror/base/status_with.h"
#include "oplogmirror/client/command_runner.h"

namespace oplogmirror {

/**
 * Note: This is NOT thread-safe.
 *
 * Example usage:
 *
 * CommandRunnerMock runner;
 * runner.setNextExpectedCommand([](const CommandRunnerMock::Request& request) {
 *     ASSERT_EQUALS("admin", request.dbName);
 * },
 * BSON("ok" << 1));
 *
 * BSONObj reply;
 * runner.runCommand("config", BSON("ping" << 1), &reply);  // Assertion error!
 *
 * Expected commands are answered in the order they were queued. Once the queue is empty the
 * default handler, if any, answers. A queued error status is thrown as a NetworkException,
 * the way a live runner reports a lost connection.
 */
class CommandRunnerMock final : public CommandRunner {
public:
    struct Request {
        std::string dbName;
        BSONObj cmd;

        StringData commandName() const {
            return cmd.firstElementFieldNameStringData();
        }

        std::string toString() const;
    };

    using Checker = std::function<void(const Request& request)>;
    using Handler = std::function<StatusWith<BSONObj>(const Request& request)>;

    CommandRunnerMock();
    ~CommandRunnerMock() override;

    bool runCommand(const std::string& dbName, const BSONObj& cmd, BSONObj* reply) override;

    std::string getServerAddress() const override {
        return "mock:27017";
    }

    /**
     * Queues the checker to run and the response to return the next time runCommand is
     * called.
     */
    void setNextExpectedCommand(Checker checkerFunc, StatusWith<BSONObj> returnThis);

    /**
     * Queues a response without checking the request.
     */
    void pushResponse(StatusWith<BSONObj> returnThis);

    /**
     * Answers every command that finds the queue empty.
     */
    void setDefaultHandler(Handler handler);

    /**
     * Every request seen so far, in call order.
     */
    const std::vector<Request>& getRequests() const {
        return _requests;
    }

    /**
     * The requests seen so far whose command name is 'name'.
     */
    std::vector<Request> getRequests(StringData name) const;

    void clearRequests() {
        _requests.clear();
    }

    bool hasPendingResponses() const {
        return !_expected.empty();
    }

private:
    struct Expectation {
        Checker checker;
        StatusWith<BSONObj> response;
    };

    std::deque<Expectation> _expected;
    Handler _defaultHandler;
    std::vector<Request> _requests;
};

}  // namespace oplogmirror

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

#include "oplogmirror/tools/txndump.h"

#include <sstream>
#include <string>
#include <vector>

#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/db/txn/txn_test_util.h"
#include "oplogmirror/unittest/unittest.h"

namespace oplogmirror {
namespace {

using namespace txn_test;

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
    return lines;
}

int countOccurrences(const std::string& haystack, const std::string& needle) {
    int count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size()))
        ++count;
    return count;
}

std::string idField(int id) {
    return "\"_id\":" + std::to_string(id) + "}";
}

class TxndumpTest : public unittest::Test {
protected:
    TxndumpTest() {
        options.file = "oplog.bson";
    }

    Status run(const std::vector<BSONObj>& entries) {
        std::string bytes;
        for (const auto& entry : entries)
            bytes.append(entry.objdata(), entry.objsize());
        std::istringstream in(bytes);
        txndump = std::make_unique<Txndump>(options, &out);
        return txndump->run(in);
    }

    static std::vector<BSONObj> allEntries(const std::vector<TxnTestCase>& cases) {
        std::vector<BSONObj> entries;
        for (const auto& c : cases)
            entries.insert(entries.end(), c.ops.begin(), c.ops.end());
        return entries;
    }

    TxndumpOptions options;
    std::ostringstream out;
    std::unique_ptr<Txndump> txndump;
};

TEST_F(TxndumpTest, JsonWritesCommittedTransactionsInCommitOrder) {
    const auto cases = makeTxnTestCases();
    ASSERT_OK(run(allEntries(cases)));

    const auto lines = splitLines(out.str());
    std::vector<const TxnTestCase*> committed;
    for (const auto& c : cases) {
        if (c.commits)
            committed.push_back(&c);
    }
    ASSERT_EQUALS(committed.size(), lines.size());

    const std::vector<int> firstIds{20, 30, 40, 50, 70};
    for (std::size_t i = 0; i < lines.size(); ++i) {
        ASSERT_STRING_CONTAINS(lines[i], "\"lsid\":");
        ASSERT_STRING_CONTAINS(lines[i], "\"commitTimestamp\":{\"$timestamp\":");
        ASSERT_EQUALS(committed[i]->innerOpCount, countOccurrences(lines[i], "\"_id\":"));
        ASSERT_STRING_CONTAINS(lines[i], idField(firstIds[i]));
    }

    ASSERT_EQUALS(5, txndump->getTxnsWritten());
    ASSERT_EQUALS(2, txndump->getTxnsAborted());
    ASSERT_EQUALS(3, txndump->getEntriesSkipped());
}

TEST_F(TxndumpTest, JsonKeepsOperationOrderWithinATransaction) {
    const auto cases = makeTxnTestCases();
    ASSERT_OK(run(interleaveCases(cases, 7)));

    const std::string text = out.str();
    ASSERT_EQUALS(5U, splitLines(text).size());
    for (int id : {40, 41, 42, 43, 44})
        ASSERT_EQUALS(1, countOccurrences(text, idField(id)));
    ASSERT_LESS_THAN(text.find(idField(40)), text.find(idField(42)));
    ASSERT_LESS_THAN(text.find(idField(42)), text.find(idField(44)));
    ASSERT_LESS_THAN(text.find(idField(70)), text.find(idField(74)));
}

TEST_F(TxndumpTest, JsonLeavesOutAbortedAndNonTransactionOperations) {
    ASSERT_OK(run(allEntries(makeTxnTestCases())));

    const std::string text = out.str();
    for (int id : {1, 2, 10, 11, 60, 61, 80, 81, 84})
        ASSERT_EQUALS(0, countOccurrences(text, idField(id)));
}

TEST_F(TxndumpTest, ApplyOpsReplaysEverythingButAbortedTransactions) {
    options.type = TxndumpOptions::OutputType::kApplyOps;
    ASSERT_OK(run(interleaveCases(makeTxnTestCases(), 3)));

    const auto lines = splitLines(out.str());
    ASSERT_FALSE(lines.empty());
    for (const auto& line : lines)
        ASSERT_STRING_CONTAINS(line, "{\"db\":\"admin\",\"command\":{\"applyOps\":");

    const std::string text = out.str();
    for (int id : {1, 2, 10, 11, 20, 21, 30, 31, 32, 40, 41, 42, 43, 44, 50, 51, 70, 74})
        ASSERT_EQUALS(1, countOccurrences(text, idField(id)));
    for (int id : {60, 61, 80, 84})
        ASSERT_EQUALS(0, countOccurrences(text, idField(id)));
}

TEST_F(TxndumpTest, ApplyOpsBatchesUpToTheConfiguredSize) {
    options.type = TxndumpOptions::OutputType::kApplyOps;
    options.replayer.maxBatchOps = 2;

    std::vector<BSONObj> entries;
    for (int i = 0; i < 5; ++i)
        entries.push_back(makeInsertEntry(Timestamp(10 + i, 1), "test.coll", i + 100));
    ASSERT_OK(run(entries));

    const auto lines = splitLines(out.str());
    ASSERT_EQUALS(3U, lines.size());
    ASSERT_EQUALS(2, countOccurrences(lines[0], "\"_id\":"));
    ASSERT_EQUALS(2, countOccurrences(lines[1], "\"_id\":"));
    ASSERT_EQUALS(1, countOccurrences(lines[2], "\"_id\":"));
    ASSERT_STRING_CONTAINS(lines[0], "\"writeConcern\":{\"w\":\"majority\"");
}

TEST_F(TxndumpTest, WarnsAboutTransactionsOpenAtTheEnd) {
    const BSONObj lsid = makeLsid(0x90);
    const repl::OpTime nullOpTime(Timestamp(), repl::OpTime::kUninitializedTerm);
    const BSONObj first = makeApplyOpsEntry(
        Timestamp(500, 1), lsid, 9LL, nullOpTime, makeInnerInserts("test.coll", 90, 2), true);

    unittest::startCapturingLogMessages();
    Status status = run({first});
    unittest::stopCapturingLogMessages();

    ASSERT_OK(status);
    ASSERT_TRUE(out.str().empty());
    ASSERT_EQUALS(
        1, unittest::countTextFormatLogLinesContaining("Transactions still open at the end"));
}

TEST_F(TxndumpTest, MalformedEntryNamesItsPosition) {
    const BSONObj good = makeInsertEntry(Timestamp(10, 1), "test.coll", 1);
    Status status = run({good, BSON("foo" << 1)});
    ASSERT_NOT_OK(status);
    ASSERT_STRING_CONTAINS(status.reason(), "oplog entry 2 of oplog.bson");
}

TEST_F(TxndumpTest, TruncatedFileFails) {
    const BSONObj good = makeInsertEntry(Timestamp(10, 1), "test.coll", 1);
    std::string bytes(good.objdata(), good.objsize());
    bytes.append(good.objdata(), good.objsize() - 2);

    std::istringstream in(bytes);
    Txndump dump(options, &out);
    Status status = dump.run(in);
    ASSERT_EQUALS(ErrorCodes::FailedToParse, status.code());
    ASSERT_STRING_CONTAINS(status.reason(), "truncated document");
}

}  // namespace
}  // namespace oplogmirror

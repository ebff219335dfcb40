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

#include "oplogmirror/db/repl/oplog_replayer.h"

#include <algorithm>
#include <map>
#include <memory>

#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/client/command_runner_mock.h"
#include "oplogmirror/client/retryable_executor.h"
#include "oplogmirror/db/txn/txn_buffer.h"
#include "oplogmirror/db/txn/txn_test_util.h"
#include "oplogmirror/unittest/unittest.h"
#include "oplogmirror/util/clock_source_mock.h"

namespace oplogmirror {
namespace repl {
namespace {

using namespace txn_test;
using Request = CommandRunnerMock::Request;

constexpr auto kNs = "test.coll"_sd;

BSONObj makeCommandEntry(Timestamp ts, StringData ns, const BSONObj& o) {
    return BSON("ts" << ts << "t" << 1LL << "op" << "c" << "ns" << ns << "o" << o);
}

BSONObj makeNoopEntry(Timestamp ts) {
    return BSON("ts" << ts << "t" << 1LL << "op" << "n" << "ns" << "" << "o"
                     << BSON("msg" << "periodic noop"));
}

/**
 * The _ids of the documents inserted by 'ops', descending into nested applyOps commands.
 */
void collectInsertedIds(const std::vector<BSONElement>& ops, std::vector<int>* ids) {
    for (const auto& opElem : ops) {
        const BSONObj op = opElem.Obj();
        const StringData opType = op.getStringField("op");
        if (opType == "i"_sd) {
            ids->push_back(op.getObjectField("o")["_id"].numberInt());
        } else if (opType == "c"_sd && op.getObjectField("o").hasField("applyOps")) {
            collectInsertedIds(op.getObjectField("o")["applyOps"].Array(), ids);
        }
    }
}

class OplogReplayerTest : public unittest::Test {
protected:
    void SetUp() override {
        _runner.setDefaultHandler([](const Request&) -> StatusWith<BSONObj> {
            return BSON("ok" << 1);
        });
        reset(OplogReplayerOptions());
    }

    void reset(OplogReplayerOptions options) {
        _replayer.reset();
        _executor = std::make_unique<RetryableExecutor>(&_runner,
                                                        BuildInfo({4, 4, 0}),
                                                        RetryOptions(),
                                                        WriteConcernOptions::majority(),
                                                        &_clock);
        _buffer = std::make_unique<TxnBuffer>();
        _replayer = std::make_unique<OplogReplayer>(_executor.get(), _buffer.get(), options);
    }

    void handle(const std::vector<BSONObj>& entries) {
        for (const auto& entry : entries)
            ASSERT_OK(replayer().handleEntry(entry));
    }

    std::vector<int> insertedIds() const {
        std::vector<int> ids;
        for (const auto& request : _runner.getRequests("applyOps"))
            collectInsertedIds(request.cmd["applyOps"].Array(), &ids);
        return ids;
    }

    OplogReplayer& replayer() {
        return *_replayer;
    }

    CommandRunnerMock _runner;
    ClockSourceMock _clock;
    std::unique_ptr<RetryableExecutor> _executor;
    std::unique_ptr<TxnBuffer> _buffer;

private:
    std::unique_ptr<OplogReplayer> _replayer;
};

TEST_F(OplogReplayerTest, CrudEntriesAreBatched) {
    handle({makeInsertEntry(Timestamp(1, 1), kNs, 1),
            makeInsertEntry(Timestamp(2, 1), kNs, 2),
            makeInsertEntry(Timestamp(3, 1), kNs, 3)});
    ASSERT_TRUE(_runner.getRequests().empty());
    ASSERT_EQUALS(3U, replayer().pendingBatchSize());
    ASSERT_FALSE(replayer().getLastAppliedTimestamp());

    ASSERT_OK(replayer().flush());
    auto requests = _runner.getRequests("applyOps");
    ASSERT_EQUALS(1U, requests.size());
    auto ops = requests[0].cmd["applyOps"].Array();
    ASSERT_EQUALS(4U, ops.size());
    ASSERT_BSONOBJ_EQ(makeInsertEntry(Timestamp(2, 1), kNs, 2), ops[1].Obj());
    ASSERT_BSONOBJ_EQ(makeNonAtomicMarkerEntry(), ops[3].Obj());
    ASSERT_TRUE(requests[0].cmd.getBoolField("bypassDocumentValidation"));

    ASSERT_EQUALS(Timestamp(3, 1), *replayer().getLastAppliedTimestamp());
    ASSERT_EQUALS(3, replayer().getStats().opsApplied);
    ASSERT_EQUALS(1, replayer().getStats().batchesApplied);
    ASSERT_EQUALS(0U, replayer().pendingBatchSize());

    // Nothing left to send.
    ASSERT_OK(replayer().flush());
    ASSERT_EQUALS(1U, _runner.getRequests().size());
}

TEST_F(OplogReplayerTest, BatchOpLimit) {
    OplogReplayerOptions options;
    options.maxBatchOps = 2;
    options.bypassDocumentValidation = false;
    reset(options);

    handle({makeInsertEntry(Timestamp(1, 1), kNs, 1),
            makeInsertEntry(Timestamp(2, 1), kNs, 2),
            makeInsertEntry(Timestamp(3, 1), kNs, 3)});
    auto requests = _runner.getRequests("applyOps");
    ASSERT_EQUALS(1U, requests.size());
    ASSERT_EQUALS(3U, requests[0].cmd["applyOps"].Array().size());
    ASSERT_FALSE(requests[0].cmd.hasField("bypassDocumentValidation"));
    ASSERT_EQUALS(1U, replayer().pendingBatchSize());
    ASSERT_EQUALS(Timestamp(2, 1), *replayer().getLastAppliedTimestamp());
}

TEST_F(OplogReplayerTest, BatchByteLimit) {
    OplogReplayerOptions options;
    options.maxBatchBytes = 1;
    reset(options);

    handle({makeInsertEntry(Timestamp(1, 1), kNs, 1),
            makeInsertEntry(Timestamp(2, 1), kNs, 2),
            makeInsertEntry(Timestamp(3, 1), kNs, 3)});
    ASSERT_OK(replayer().flush());

    // Every operation is over the limit, so each one travels alone, without a marker.
    auto requests = _runner.getRequests("applyOps");
    ASSERT_EQUALS(3U, requests.size());
    for (const auto& request : requests)
        ASSERT_EQUALS(1U, request.cmd["applyOps"].Array().size());
}

TEST_F(OplogReplayerTest, NoopsAreSkipped) {
    handle({makeNoopEntry(Timestamp(1, 1))});
    ASSERT_OK(replayer().flush());
    ASSERT_TRUE(_runner.getRequests().empty());
    ASSERT_EQUALS(1, replayer().getStats().noopsSkipped);
}

TEST_F(OplogReplayerTest, NoopsAreAppliedWhenAsked) {
    OplogReplayerOptions options;
    options.skipNoops = false;
    reset(options);

    handle({makeNoopEntry(Timestamp(1, 1))});
    ASSERT_OK(replayer().flush());
    ASSERT_EQUALS(1U, _runner.getRequests("applyOps").size());
    ASSERT_EQUALS(0, replayer().getStats().noopsSkipped);
}

TEST_F(OplogReplayerTest, CommandFlushesPendingBatchFirst) {
    handle({makeInsertEntry(Timestamp(1, 1), kNs, 1),
            makeCommandEntry(Timestamp(2, 1), "test.$cmd", BSON("create" << "other"))});

    const auto& requests = _runner.getRequests();
    ASSERT_EQUALS(2U, requests.size());
    ASSERT_EQUALS("applyOps", requests[0].commandName());
    ASSERT_EQUALS("create", requests[1].commandName());
    ASSERT_EQUALS("test", requests[1].dbName);
    ASSERT_BSONOBJ_EQ(BSON("create" << "other" << "writeConcern" << BSON("w" << "majority")),
                      requests[1].cmd);
    ASSERT_EQUALS(1, replayer().getStats().commandsApplied);
    ASSERT_EQUALS(Timestamp(2, 1), *replayer().getLastAppliedTimestamp());
}

TEST_F(OplogReplayerTest, CommandsUseTheirExecutorOperations) {
    handle({makeCommandEntry(Timestamp(1, 1), "test.$cmd", BSON("drop" << "coll")),
            makeCommandEntry(Timestamp(2, 1), "test.$cmd", BSON("dropDatabase" << 1)),
            makeCommandEntry(Timestamp(3, 1),
                             "admin.$cmd",
                             BSON("renameCollection" << "test.a" << "to" << "test.b")),
            makeCommandEntry(Timestamp(4, 1),
                             "test.$cmd",
                             BSON("collMod" << "coll" << "validationLevel" << "off"))});

    const auto& requests = _runner.getRequests();
    ASSERT_EQUALS(4U, requests.size());
    ASSERT_BSONOBJ_EQ(BSON("drop" << "coll" << "writeConcern" << BSON("w" << "majority")),
                      requests[0].cmd);
    ASSERT_EQUALS("dropDatabase", requests[1].commandName());
    ASSERT_EQUALS("test", requests[1].dbName);
    ASSERT_EQUALS("renameCollection", requests[2].commandName());
    ASSERT_EQUALS("admin", requests[2].dbName);
    ASSERT_EQUALS("collMod", requests[3].commandName());
    ASSERT_TRUE(requests[3].cmd.hasField("writeConcern"));
}

TEST_F(OplogReplayerTest, DropWithoutCollectionNameFails) {
    Status status =
        replayer().handleEntry(makeCommandEntry(Timestamp(1, 1), "test.$cmd", BSON("drop" << 1)));
    ASSERT_EQUALS(ErrorCodes::TypeMismatch, status.code());
    ASSERT_TRUE(_runner.getRequests().empty());
}

TEST_F(OplogReplayerTest, CreateIndexesCommand) {
    const UUID uuid = UUID::gen();
    BSONObjBuilder bob;
    bob.append("ts", Timestamp(1, 1));
    bob.append("op", "c");
    bob.append("ns", "test.$cmd");
    uuid.appendToBuilder(&bob, "ui");
    bob.append("o",
               BSON("createIndexes" << "coll" << "v" << 2 << "key" << BSON("a" << 1) << "name"
                                    << "a_1"));
    handle({bob.obj()});

    auto requests = _runner.getRequests("createIndexes");
    ASSERT_EQUALS(1U, requests.size());
    ASSERT_EQUALS("coll", requests[0].cmd.getStringField("createIndexes"));
    auto indexes = requests[0].cmd["indexes"].Array();
    ASSERT_EQUALS(1U, indexes.size());
    ASSERT_BSONOBJ_EQ(BSON("v" << 2 << "key" << BSON("a" << 1) << "name" << "a_1"),
                      indexes[0].Obj());
}

TEST_F(OplogReplayerTest, LegacySystemIndexesInsertBuildsIndex) {
    handle({BSON("ts" << Timestamp(1, 1) << "op" << "i" << "ns" << "test.system.indexes" << "o"
                      << BSON("v" << 1 << "key" << BSON("b" << 1) << "name" << "b_1" << "ns"
                                  << "test.coll"))});

    auto requests = _runner.getRequests("createIndexes");
    ASSERT_EQUALS(1U, requests.size());
    ASSERT_EQUALS("test", requests[0].dbName);
    ASSERT_EQUALS("coll", requests[0].cmd.getStringField("createIndexes"));
    ASSERT_BSONOBJ_EQ(BSON("v" << 1 << "key" << BSON("b" << 1) << "name" << "b_1"),
                      requests[0].cmd["indexes"].Array()[0].Obj());
    ASSERT_TRUE(_runner.getRequests("applyOps").empty());
}

TEST_F(OplogReplayerTest, OtherCommandsGoThroughApplyOpsAlone) {
    const BSONObj entry =
        makeCommandEntry(Timestamp(1, 1), "test.$cmd", BSON("emptycapped" << "coll"));
    handle({entry});

    auto requests = _runner.getRequests("applyOps");
    ASSERT_EQUALS(1U, requests.size());
    auto ops = requests[0].cmd["applyOps"].Array();
    ASSERT_EQUALS(1U, ops.size());
    ASSERT_BSONOBJ_EQ(entry, ops[0].Obj());
}

TEST_F(OplogReplayerTest, MultiEntryTransactionIsAppliedOnCommit) {
    const BSONObj lsid = makeLsid(1);
    const Timestamp ts1(10, 1), ts2(11, 1), ts3(12, 1);
    handle({makeApplyOpsEntry(ts1, lsid, 1LL, OpTime(), makeInnerInserts(kNs, 1, 2), true),
            makeApplyOpsEntry(ts2, lsid, 1LL, OpTime(ts1, 1), makeInnerInserts(kNs, 3, 2), true)});
    ASSERT_EQUALS(0U, replayer().pendingBatchSize());
    ASSERT_EQUALS(1U, _buffer->size());
    ASSERT_EQUALS(ts1, *replayer().getResumeTimestamp());

    handle({makeCommitTransactionEntry(ts3, lsid, 1LL, OpTime(ts2, 1), ts2)});
    ASSERT_EQUALS(0U, _buffer->size());
    ASSERT_EQUALS(4U, replayer().pendingBatchSize());

    ASSERT_OK(replayer().flush());
    ASSERT_EQUALS((std::vector<int>{1, 2, 3, 4}), insertedIds());
    ASSERT_EQUALS(1, replayer().getStats().txnsCommitted);
    ASSERT_EQUALS(4, replayer().getStats().txnOpsApplied);
    ASSERT_EQUALS(ts3, *replayer().getLastAppliedTimestamp());
    ASSERT_EQUALS(ts3, *replayer().getResumeTimestamp());
}

TEST_F(OplogReplayerTest, AbortedTransactionIsDropped) {
    const BSONObj lsid = makeLsid(2);
    const Timestamp ts1(10, 1), ts2(11, 1);
    handle({makeApplyOpsEntry(ts1, lsid, 1LL, OpTime(), makeInnerInserts(kNs, 1, 2), false, true),
            makeAbortTransactionEntry(ts2, lsid, 1LL, OpTime(ts1, 1))});
    ASSERT_OK(replayer().flush());

    ASSERT_TRUE(_runner.getRequests().empty());
    ASSERT_EQUALS(0U, _buffer->size());
    ASSERT_EQUALS(1, replayer().getStats().txnsAborted);
    ASSERT_FALSE(replayer().getResumeTimestamp());
}

TEST_F(OplogReplayerTest, CommandInsideTransactionRunsOnItsOwn) {
    const BSONObj lsid = makeLsid(3);
    std::vector<BSONObj> innerOps{
        BSON("op" << "c" << "ns" << "test.$cmd" << "o" << BSON("create" << "fresh")),
        makeInnerInsert("test.fresh", 1)};
    handle({makeApplyOpsEntry(Timestamp(10, 1), lsid, 1LL, OpTime(), innerOps)});
    ASSERT_OK(replayer().flush());

    const auto& requests = _runner.getRequests();
    ASSERT_EQUALS(2U, requests.size());
    ASSERT_EQUALS("create", requests[0].commandName());
    ASSERT_EQUALS("applyOps", requests[1].commandName());
    ASSERT_EQUALS((std::vector<int>{1}), insertedIds());
}

TEST_F(OplogReplayerTest, InterleavedTransactionsAreEachReplayedInOrder) {
    const auto cases = makeTxnTestCases();
    for (unsigned seed = 0; seed < 10; ++seed) {
        _runner.clearRequests();
        reset(OplogReplayerOptions());
        handle(interleaveCases(cases, seed));
        ASSERT_OK(replayer().flush());
        ASSERT_EQUALS(0U, _buffer->size());

        std::vector<int> ids = insertedIds();
        std::map<int, std::vector<int>> byTransaction;
        for (int id : ids)
            byTransaction[id / 10].push_back(id);
        for (const auto& [group, groupIds] : byTransaction) {
            if (group == 0)
                continue;  // Two unrelated non-transaction inserts.
            ASSERT_TRUE(std::is_sorted(groupIds.begin(), groupIds.end()))
                << "seed " << seed << ", group " << group;
        }

        std::sort(ids.begin(), ids.end());
        ASSERT_EQUALS((std::vector<int>{1,  2,  10, 11, 20, 21, 30, 31, 32, 40, 41,
                                        42, 43, 44, 50, 51, 70, 71, 72, 73, 74}),
                      ids)
            << "seed " << seed;
    }
}

TEST_F(OplogReplayerTest, FailedBatchNamesTheOperation) {
    _runner.pushResponse(BSON("ok" << 0 << "code" << 11000 << "errmsg"
                                   << "E11000 duplicate key" << "applied" << 2 << "results"
                                   << BSON_ARRAY(true << false)));
    handle({makeInsertEntry(Timestamp(1, 1), kNs, 1), makeInsertEntry(Timestamp(2, 1), kNs, 2)});

    unittest::startCapturingLogMessages();
    Status status = replayer().flush();
    unittest::stopCapturingLogMessages();

    ASSERT_EQUALS(ErrorCodes::DuplicateKey, status.code());
    ASSERT_STRING_CONTAINS(status.reason(), "failed to apply a batch of 2 oplog operations");
    ASSERT_EQUALS(1, unittest::countTextFormatLogLinesContaining("Oplog operation failed to apply"));
    ASSERT_EQUALS(2U, replayer().pendingBatchSize());
    ASSERT_FALSE(replayer().getLastAppliedTimestamp());
}

TEST_F(OplogReplayerTest, MalformedEntriesAreRejected) {
    ASSERT_EQUALS(ErrorCodes::FailedToParse,
                  replayer().handleEntry(BSON("op" << "i" << "ns" << kNs << "o" << BSONObj())).code());

    // lsid without txnNumber.
    BSONObjBuilder ambiguous;
    ambiguous.append("ts", Timestamp(1, 1));
    ambiguous.append("op", "c");
    ambiguous.append("ns", "admin.$cmd");
    ambiguous.append("o", BSON("commitTransaction" << 1));
    ambiguous.append("lsid", makeLsid(4));
    ASSERT_EQUALS(ErrorCodes::FailedToParse, replayer().handleEntry(ambiguous.obj()).code());
    ASSERT_EQUALS(0, replayer().getStats().entriesSeen);
}

TEST_F(OplogReplayerTest, UnlinkedCommitAndAbortFinishTheirTransactions) {
    handle({makeInsertEntry(Timestamp(1, 1), kNs, 1),
            makeCommitTransactionEntry(
                Timestamp(2, 1), makeLsid(6), 1LL, boost::none, Timestamp(2, 1)),
            makeAbortTransactionEntry(Timestamp(3, 1), makeLsid(7), 1LL, OpTime())});
    ASSERT_OK(replayer().flush());

    ASSERT_EQUALS(3, replayer().getStats().entriesSeen);
    ASSERT_EQUALS(1, replayer().getStats().txnsCommitted);
    ASSERT_EQUALS(1, replayer().getStats().txnsAborted);
    ASSERT_EQUALS(0U, _buffer->size());
    ASSERT_EQUALS((std::vector<int>{1}), insertedIds());
}

TEST_F(OplogReplayerTest, TransactionCommandsWithoutSessionAreSkipped) {
    for (const BSONObj& o : {BSON("commitTransaction" << 1), BSON("abortTransaction" << 1)}) {
        BSONObjBuilder bob;
        bob.append("ts", Timestamp(4, 1));
        bob.append("op", "c");
        bob.append("ns", "admin.$cmd");
        bob.append("o", o);
        ASSERT_OK(replayer().handleEntry(bob.obj()));
    }
    ASSERT_OK(replayer().flush());

    ASSERT_TRUE(_runner.getRequests().empty());
    ASSERT_EQUALS(2, replayer().getStats().entriesSeen);
    ASSERT_EQUALS(0, replayer().getStats().commandsApplied);
    ASSERT_EQUALS(0U, _buffer->size());
}

TEST_F(OplogReplayerTest, CommitOfUnknownTransactionFails) {
    Status status = replayer().handleEntry(makeCommitTransactionEntry(
        Timestamp(2, 1), makeLsid(5), 1LL, OpTime(Timestamp(1, 1), 1), Timestamp(1, 1)));
    ASSERT_NOT_OK(status);
    ASSERT_TRUE(_runner.getRequests().empty());
}

}  // namespace
}  // namespace repl
}  // namespace oplogmirror

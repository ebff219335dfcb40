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

#include "oplogmirror/db/txn/txn_buffer.h"

#include <thread>

#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/db/txn/txn_test_util.h"
#include "oplogmirror/unittest/unittest.h"
#include "oplogmirror/util/assert_util.h"

namespace oplogmirror {
namespace {

using namespace txn_test;

class TxnBufferTest : public unittest::Test {
protected:
    void expectCases(const std::vector<TxnTestCase>& cases) {
        for (const auto& c : cases) {
            if (c.notTxn)
                continue;
            auto swMeta = TxnMeta::parse(c.ops[0]);
            ASSERT_OK(swMeta);
            expectedOpCounts[swMeta.getValue().getId()] = c.innerOpCount;
        }
    }

    /**
     * Feeds 'ops' to the buffer the way a replayer does: streams committed transactions,
     * checks the number of operations against the expectation and purges every finished
     * transaction.
     */
    void feed(const std::vector<BSONObj>& ops) {
        for (const auto& op : ops) {
            auto swMeta = TxnMeta::parse(op);
            ASSERT_OK(swMeta);
            const TxnMeta& meta = swMeta.getValue();
            if (!meta.isTxn())
                continue;

            ASSERT_OK(buffer.addOp(meta, op));

            if (meta.isAbort()) {
                ASSERT_OK(buffer.purge(meta));
                ASSERT_FALSE(buffer.hasState(meta.getId()));
                continue;
            }
            if (!meta.isCommit())
                continue;

            auto swStream = buffer.getTxnStream(meta);
            ASSERT_OK(swStream);
            int count = 0;
            ASSERT_OK(swStream.getValue().forEach([&](const BSONObj& innerOp) {
                EXPECT_TRUE(innerOp.hasField("op"));
                ++count;
                return Status::OK();
            }));
            ASSERT_TRUE(swStream.getValue().isExhausted());

            auto it = expectedOpCounts.find(meta.getId());
            ASSERT_TRUE(it != expectedOpCounts.end());
            ASSERT_EQUALS(it->second, count) << "for transaction " << meta.getId().toString();

            ASSERT_OK(buffer.purge(meta));
            ASSERT_FALSE(buffer.hasState(meta.getId()));
        }
    }

    TxnBuffer buffer;
    std::unordered_map<TxnId, int, TxnId::Hash> expectedOpCounts;
};

TEST_F(TxnBufferTest, EachCaseAlone) {
    const auto cases = makeTxnTestCases();
    expectCases(cases);
    for (const auto& c : cases) {
        SCOPED_TRACE(c.name);
        feed(c.ops);
    }
    ASSERT_EQUALS(0U, buffer.size());
    ASSERT_EQUALS(0U, buffer.bufferedBytes());
}

TEST_F(TxnBufferTest, InterleavedCasesReconstructIndependently) {
    const auto cases = makeTxnTestCases();
    expectCases(cases);
    for (unsigned seed : {1U, 7U, 42U, 2019U}) {
        SCOPED_TRACE(seed);
        feed(interleaveCases(cases, seed));
        ASSERT_EQUALS(0U, buffer.size());
    }
    ASSERT_EQUALS(0U, buffer.bufferedBytes());
}

TEST_F(TxnBufferTest, StreamYieldsOperationsInOplogOrder) {
    const auto cases = makeTxnTestCases();
    const TxnTestCase* large = nullptr;
    for (const auto& c : cases) {
        if (c.name == "large, prepared, committed")
            large = &c;
    }
    ASSERT_TRUE(large);

    TxnMeta last;
    for (const auto& op : large->ops) {
        auto swMeta = TxnMeta::parse(op);
        ASSERT_OK(swMeta);
        ASSERT_OK(buffer.addOp(swMeta.getValue(), op));
        last = swMeta.getValue();
    }

    auto swStream = buffer.getTxnStream(last);
    ASSERT_OK(swStream);
    TxnOpStream& stream = swStream.getValue();
    std::vector<int> ids;
    while (true) {
        auto swOp = stream.next();
        ASSERT_OK(swOp);
        if (!swOp.getValue())
            break;
        ids.push_back(swOp.getValue()->getObjectField("o").getIntField("_id"));
    }
    ASSERT_EQUALS((std::vector<int>{70, 71, 72, 73, 74}), ids);
    ASSERT_EQUALS(5U, stream.opsReturned());

    // The end of the stream is sticky.
    auto swAgain = stream.next();
    ASSERT_OK(swAgain);
    ASSERT_FALSE(swAgain.getValue());
    ASSERT_OK(buffer.purge(last));
}

TEST_F(TxnBufferTest, NonTransactionMetaIsRejected) {
    const BSONObj entry = makeInsertEntry(Timestamp(1, 1), "test.coll", 1);
    auto swMeta = TxnMeta::parse(entry);
    ASSERT_OK(swMeta);
    ASSERT_EQUALS(ErrorCodes::IllegalOperation, buffer.addOp(swMeta.getValue(), entry).code());
    ASSERT_EQUALS(ErrorCodes::IllegalOperation,
                  buffer.getTxnStream(swMeta.getValue()).getStatus().code());
    ASSERT_EQUALS(ErrorCodes::IllegalOperation, buffer.purge(swMeta.getValue()).code());
}

TEST_F(TxnBufferTest, ContinuationWithoutFirstEntryIsRejected) {
    const BSONObj lsid = makeLsid(0x90);
    const BSONObj second = makeApplyOpsEntry(Timestamp(2, 1),
                                             lsid,
                                             1LL,
                                             repl::OpTime(Timestamp(1, 1), 1),
                                             makeInnerInserts("test.coll", 0, 1),
                                             true);
    auto swMeta = TxnMeta::parse(second);
    ASSERT_OK(swMeta);
    ASSERT_EQUALS(ErrorCodes::IllegalOperation, buffer.addOp(swMeta.getValue(), second).code());
    ASSERT_EQUALS(0U, buffer.size());
}

TEST_F(TxnBufferTest, EntryAfterFinalIsRejected) {
    const BSONObj entry = makeApplyOpsEntry(
        Timestamp(3, 1), makeLsid(0x91), 1LL, boost::none, makeInnerInserts("test.coll", 0, 2));
    auto swMeta = TxnMeta::parse(entry);
    ASSERT_OK(swMeta);
    ASSERT_OK(buffer.addOp(swMeta.getValue(), entry));
    ASSERT_EQUALS(ErrorCodes::IllegalOperation, buffer.addOp(swMeta.getValue(), entry).code());

    auto swStream = buffer.getTxnStream(swMeta.getValue());
    ASSERT_OK(swStream);
    ASSERT_OK(swStream.getValue().forEach([](const BSONObj&) { return Status::OK(); }));
    ASSERT_OK(buffer.purge(swMeta.getValue()));
}

TEST_F(TxnBufferTest, StreamOfUnfinishedOrUnknownTransactionIsRejected) {
    const BSONObj lsid = makeLsid(0x92);
    const BSONObj first = makeApplyOpsEntry(Timestamp(4, 1),
                                            lsid,
                                            2LL,
                                            repl::OpTime(Timestamp(), -1),
                                            makeInnerInserts("test.coll", 0, 1),
                                            true);
    auto swMeta = TxnMeta::parse(first);
    ASSERT_OK(swMeta);
    ASSERT_EQUALS(ErrorCodes::NoSuchTransaction,
                  buffer.getTxnStream(swMeta.getValue()).getStatus().code());

    ASSERT_OK(buffer.addOp(swMeta.getValue(), first));
    ASSERT_EQUALS(ErrorCodes::IllegalOperation,
                  buffer.getTxnStream(swMeta.getValue()).getStatus().code());
    ASSERT_OK(buffer.purge(swMeta.getValue()));
}

TEST_F(TxnBufferTest, AbortedTransactionHasNoStream) {
    const auto cases = makeTxnTestCases();
    for (const auto& c : cases) {
        if (c.name != "small, prepared, aborted")
            continue;
        TxnMeta last;
        for (const auto& op : c.ops) {
            auto swMeta = TxnMeta::parse(op);
            ASSERT_OK(swMeta);
            ASSERT_OK(buffer.addOp(swMeta.getValue(), op));
            last = swMeta.getValue();
        }
        ASSERT_TRUE(last.isAbort());
        ASSERT_EQUALS(ErrorCodes::IllegalOperation, buffer.getTxnStream(last).getStatus().code());
        ASSERT_OK(buffer.purge(last));
    }
}

TEST_F(TxnBufferTest, UnlinkedAbortStartsAndEndsItsTransaction) {
    const BSONObj entry = makeAbortTransactionEntry(
        Timestamp(8, 1), makeLsid(0x95), 2LL, repl::OpTime(Timestamp(), -1));
    auto swMeta = TxnMeta::parse(entry);
    ASSERT_OK(swMeta);
    const TxnMeta& meta = swMeta.getValue();

    ASSERT_OK(buffer.addOp(meta, entry));
    ASSERT_TRUE(buffer.hasState(meta.getId()));
    ASSERT_EQUALS(ErrorCodes::IllegalOperation, buffer.getTxnStream(meta).getStatus().code());
    ASSERT_OK(buffer.purge(meta));
    ASSERT_EQUALS(0U, buffer.size());
}

TEST_F(TxnBufferTest, UnlinkedCommitYieldsNoOperations) {
    const BSONObj entry = makeCommitTransactionEntry(
        Timestamp(9, 1), makeLsid(0x96), 2LL, boost::none, Timestamp(9, 1));
    auto swMeta = TxnMeta::parse(entry);
    ASSERT_OK(swMeta);
    const TxnMeta& meta = swMeta.getValue();

    ASSERT_OK(buffer.addOp(meta, entry));
    auto swStream = buffer.getTxnStream(meta);
    ASSERT_OK(swStream);
    auto swOp = swStream.getValue().next();
    ASSERT_OK(swOp);
    ASSERT_FALSE(swOp.getValue());
    ASSERT_OK(buffer.purge(meta));
}

TEST_F(TxnBufferTest, PurgeIsIdempotent) {
    const BSONObj entry = makeApplyOpsEntry(Timestamp(5, 1),
                                            makeLsid(0x93),
                                            1LL,
                                            repl::OpTime(Timestamp(), -1),
                                            makeInnerInserts("test.coll", 0, 1),
                                            true);
    auto swMeta = TxnMeta::parse(entry);
    ASSERT_OK(swMeta);
    ASSERT_OK(buffer.addOp(swMeta.getValue(), entry));
    ASSERT_EQUALS(1U, buffer.size());
    ASSERT_EQUALS(static_cast<std::size_t>(entry.objsize()), buffer.bufferedBytes());

    ASSERT_OK(buffer.purge(swMeta.getValue()));
    ASSERT_FALSE(buffer.hasState(swMeta.getValue().getId()));
    ASSERT_OK(buffer.purge(swMeta.getValue()));
    ASSERT_EQUALS(0U, buffer.size());
    ASSERT_EQUALS(0U, buffer.bufferedBytes());
}

TEST_F(TxnBufferTest, StreamSurvivesPurge) {
    const BSONObj entry = makeApplyOpsEntry(
        Timestamp(6, 1), makeLsid(0x94), 1LL, boost::none, makeInnerInserts("test.coll", 0, 3));
    auto swMeta = TxnMeta::parse(entry);
    ASSERT_OK(swMeta);
    ASSERT_OK(buffer.addOp(swMeta.getValue(), entry));

    auto swStream = buffer.getTxnStream(swMeta.getValue());
    ASSERT_OK(swStream);
    ASSERT_OK(buffer.purge(swMeta.getValue()));

    int count = 0;
    ASSERT_OK(swStream.getValue().forEach([&](const BSONObj&) {
        ++count;
        return Status::OK();
    }));
    ASSERT_EQUALS(3, count);
}

TEST_F(TxnBufferTest, MalformedApplyOpsEndsStreamWithError) {
    BSONObjBuilder bob;
    bob.append("ts", Timestamp(8, 1));
    bob.append("op", "c");
    bob.append("ns", "admin.$cmd");
    bob.append("o", BSON("applyOps" << BSON_ARRAY(BSON("op" << "i") << 5)));
    bob.append("lsid", makeLsid(0x95));
    bob.append("txnNumber", 1LL);
    const BSONObj entry = bob.obj();

    auto swMeta = TxnMeta::parse(entry);
    ASSERT_OK(swMeta);
    ASSERT_OK(buffer.addOp(swMeta.getValue(), entry));

    auto swStream = buffer.getTxnStream(swMeta.getValue());
    ASSERT_OK(swStream);
    TxnOpStream& stream = swStream.getValue();

    auto swFirst = stream.next();
    ASSERT_EQUALS(ErrorCodes::TypeMismatch, swFirst.getStatus().code());
    auto swSecond = stream.next();
    ASSERT_EQUALS(ErrorCodes::TypeMismatch, swSecond.getStatus().code());
    ASSERT_TRUE(stream.isExhausted());
    ASSERT_OK(buffer.purge(swMeta.getValue()));
}

TEST_F(TxnBufferTest, ForEachStopsAtCallbackError) {
    const BSONObj entry = makeApplyOpsEntry(
        Timestamp(9, 1), makeLsid(0x96), 1LL, boost::none, makeInnerInserts("test.coll", 0, 4));
    auto swMeta = TxnMeta::parse(entry);
    ASSERT_OK(swMeta);
    ASSERT_OK(buffer.addOp(swMeta.getValue(), entry));

    auto swStream = buffer.getTxnStream(swMeta.getValue());
    ASSERT_OK(swStream);
    int calls = 0;
    Status status = swStream.getValue().forEach([&](const BSONObj&) {
        if (++calls == 2)
            return Status(ErrorCodes::DuplicateKey, "boom");
        return Status::OK();
    });
    ASSERT_EQUALS(ErrorCodes::DuplicateKey, status.code());
    ASSERT_EQUALS(2, calls);
    ASSERT_EQUALS(ErrorCodes::DuplicateKey, swStream.getValue().next().getStatus().code());
    ASSERT_OK(buffer.purge(swMeta.getValue()));
}

TEST_F(TxnBufferTest, AbandonedStreamIsLogged) {
    const BSONObj entry = makeApplyOpsEntry(
        Timestamp(10, 1), makeLsid(0x97), 1LL, boost::none, makeInnerInserts("test.coll", 0, 2));
    auto swMeta = TxnMeta::parse(entry);
    ASSERT_OK(swMeta);
    ASSERT_OK(buffer.addOp(swMeta.getValue(), entry));

    unittest::startCapturingLogMessages();
    {
        auto swStream = buffer.getTxnStream(swMeta.getValue());
        ASSERT_OK(swStream);
        ASSERT_OK(swStream.getValue().next());
    }
    unittest::stopCapturingLogMessages();
    ASSERT_EQUALS(1, unittest::countTextFormatLogLinesContaining("destroyed before it was drained"));
    ASSERT_OK(buffer.purge(swMeta.getValue()));
}

TEST(TxnBufferLimitTest, ExceedingMemoryLimitFails) {
    const BSONObj lsid = makeLsid(0xa0);
    const BSONObj first = makeApplyOpsEntry(Timestamp(1, 1),
                                            lsid,
                                            1LL,
                                            repl::OpTime(Timestamp(), -1),
                                            makeInnerInserts("test.coll", 0, 10),
                                            true);
    const BSONObj second = makeApplyOpsEntry(Timestamp(2, 1),
                                             lsid,
                                             1LL,
                                             repl::OpTime(Timestamp(1, 1), 1),
                                             makeInnerInserts("test.coll", 10, 10),
                                             true);

    TxnBuffer buffer(TxnBufferOptions{static_cast<std::size_t>(first.objsize()) + 10});
    auto swFirst = TxnMeta::parse(first);
    auto swSecond = TxnMeta::parse(second);
    ASSERT_OK(swFirst);
    ASSERT_OK(swSecond);

    ASSERT_OK(buffer.addOp(swFirst.getValue(), first));
    ASSERT_EQUALS(ErrorCodes::ExceededMemoryLimit,
                  buffer.addOp(swSecond.getValue(), second).code());
    ASSERT_EQUALS(static_cast<std::size_t>(first.objsize()), buffer.bufferedBytes());

    ASSERT_OK(buffer.purge(swFirst.getValue()));
    ASSERT_EQUALS(0U, buffer.bufferedBytes());
}

TEST(TxnBufferTimestampTest, OldestActiveTransaction) {
    TxnBuffer buffer;
    ASSERT_FALSE(buffer.oldestActiveTxnTimestamp());

    auto addFirst = [&](Timestamp ts, unsigned char session) {
        const BSONObj entry = makeApplyOpsEntry(ts,
                                                makeLsid(session),
                                                1LL,
                                                repl::OpTime(Timestamp(), -1),
                                                makeInnerInserts("test.coll", 0, 1),
                                                true);
        TxnMeta meta = uassertStatusOK(TxnMeta::parse(entry));
        uassertStatusOK(buffer.addOp(meta, entry));
        return meta;
    };

    TxnMeta later = addFirst(Timestamp(20, 1), 0xb0);
    TxnMeta earlier = addFirst(Timestamp(10, 3), 0xb1);
    ASSERT_EQUALS(Timestamp(10, 3), *buffer.oldestActiveTxnTimestamp());

    ASSERT_OK(buffer.purge(earlier));
    ASSERT_EQUALS(Timestamp(20, 1), *buffer.oldestActiveTxnTimestamp());
    ASSERT_OK(buffer.purge(later));
    ASSERT_FALSE(buffer.oldestActiveTxnTimestamp());
}

TEST(TxnBufferConcurrencyTest, TransactionsOnSeparateThreads) {
    TxnBuffer buffer;
    constexpr int kThreads = 8;
    constexpr int kEntriesPerTxn = 20;

    std::vector<std::thread> threads;
    std::vector<int> streamed(kThreads, 0);
    std::vector<Status> results(kThreads, Status::OK());
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            const BSONObj lsid = makeLsid(static_cast<unsigned char>(0xc0 + t));
            repl::OpTime prev(Timestamp(), -1);
            TxnMeta last;
            for (int i = 0; i < kEntriesPerTxn; ++i) {
                const Timestamp ts(1000 + i, t + 1);
                const bool isLast = i == kEntriesPerTxn - 1;
                const BSONObj entry = makeApplyOpsEntry(
                    ts, lsid, 1LL, prev, makeInnerInserts("test.coll", i * 2, 2), !isLast);
                auto swMeta = TxnMeta::parse(entry);
                if (!swMeta.isOK()) {
                    results[t] = swMeta.getStatus();
                    return;
                }
                Status added = buffer.addOp(swMeta.getValue(), entry);
                if (!added.isOK()) {
                    results[t] = added;
                    return;
                }
                prev = repl::OpTime(ts, 1);
                last = swMeta.getValue();
            }
            auto swStream = buffer.getTxnStream(last);
            if (!swStream.isOK()) {
                results[t] = swStream.getStatus();
                return;
            }
            results[t] = swStream.getValue().forEach([&](const BSONObj&) {
                ++streamed[t];
                return Status::OK();
            });
            if (results[t].isOK())
                results[t] = buffer.purge(last);
        });
    }
    for (auto& thread : threads)
        thread.join();

    for (int t = 0; t < kThreads; ++t) {
        ASSERT_OK(results[t]);
        ASSERT_EQUALS(kEntriesPerTxn * 2, streamed[t]);
    }
    ASSERT_EQUALS(0U, buffer.size());
}

}  // namespace
}  // namespace oplogmirror

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

#include "oplogmirror/db/txn/txn_meta.h"

#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/db/txn/txn_test_util.h"
#include "oplogmirror/unittest/unittest.h"

namespace oplogmirror {
namespace {

using namespace txn_test;

const TxnTestCase& findCase(const std::vector<TxnTestCase>& cases, StringData name) {
    for (const auto& c : cases) {
        if (c.name == name.toString())
            return c;
    }
    ADD_FAILURE() << "no test case named " << name;
    return cases.front();
}

TEST(TxnMetaTest, NonTransactionEntriesHaveNoIdentity) {
    const auto cases = makeTxnTestCases();
    for (const auto& c : cases) {
        if (!c.notTxn)
            continue;
        SCOPED_TRACE(c.name);
        ASSERT_EQUALS(1U, c.ops.size());

        auto swMeta = TxnMeta::parse(c.ops[0]);
        ASSERT_OK(swMeta);
        const TxnMeta& meta = swMeta.getValue();
        ASSERT_FALSE(meta.isTxn());
        ASSERT_FALSE(meta.isMultiOp());
        ASSERT_FALSE(meta.isCommit());
        ASSERT_FALSE(meta.isAbort());
        ASSERT_FALSE(meta.isFinal());
        ASSERT_TRUE(meta.getId().isEmpty());
        ASSERT_EQUALS(TxnRole::kNonTxn, meta.getRole());
    }
}

TEST(TxnMetaTest, TransactionEntriesClassifyByPosition) {
    struct Expected {
        const char* name;
        std::size_t entryCount;
        bool commits;
        bool aborts;
    };
    const Expected expectations[] = {
        {"small, unprepared", 1, true, false},
        {"small, unprepared, 4.0", 1, true, false},
        {"large, unprepared", 3, true, false},
        {"small, prepared, committed", 2, true, false},
        {"small, prepared, aborted", 2, false, true},
        {"large, prepared, committed", 4, true, false},
        {"large, prepared, aborted", 4, false, true},
    };

    const auto cases = makeTxnTestCases();
    for (const auto& expected : expectations) {
        SCOPED_TRACE(expected.name);
        const TxnTestCase& c = findCase(cases, expected.name);
        ASSERT_EQUALS(expected.entryCount, c.ops.size());

        const bool isMultiOp = expected.entryCount > 1;
        TxnId firstId;
        for (std::size_t i = 0; i < c.ops.size(); ++i) {
            auto swMeta = TxnMeta::parse(c.ops[i]);
            ASSERT_OK(swMeta);
            const TxnMeta& meta = swMeta.getValue();

            ASSERT_TRUE(meta.isTxn());
            ASSERT_FALSE(meta.getId().isEmpty());
            ASSERT_EQUALS(isMultiOp, meta.isMultiOp());
            ASSERT_EQUALS(i == 0, meta.isFirst());
            if (i == 0)
                firstId = meta.getId();
            else
                ASSERT_TRUE(firstId == meta.getId());

            if (i != c.ops.size() - 1) {
                ASSERT_FALSE(meta.isFinal());
                ASSERT_FALSE(meta.isCommit());
                ASSERT_FALSE(meta.isAbort());
            }
        }

        auto swLast = TxnMeta::parse(c.ops.back());
        ASSERT_OK(swLast);
        const TxnMeta& last = swLast.getValue();
        ASSERT_TRUE(last.isFinal());
        ASSERT_EQUALS(expected.commits, last.isCommit());
        ASSERT_EQUALS(expected.aborts, last.isAbort());
    }
}

TEST(TxnMetaTest, RolesOfLargePreparedTransaction) {
    const auto cases = makeTxnTestCases();
    const TxnTestCase& c = findCase(cases, "large, prepared, committed");
    const TxnRole expected[] = {TxnRole::kFirstOfMulti,
                                TxnRole::kContinuation,
                                TxnRole::kContinuation,
                                TxnRole::kFinalCommit};
    ASSERT_EQUALS(4U, c.ops.size());
    for (std::size_t i = 0; i < c.ops.size(); ++i) {
        auto swMeta = TxnMeta::parse(c.ops[i]);
        ASSERT_OK(swMeta);
        ASSERT_EQUALS(expected[i], swMeta.getValue().getRole())
            << "entry " << i << " classified as " << toString(swMeta.getValue().getRole());
    }
}

TEST(TxnMetaTest, SingleEntryTransactionIsFirstAndFinal) {
    const auto cases = makeTxnTestCases();
    auto swMeta = TxnMeta::parse(findCase(cases, "small, unprepared").ops[0]);
    ASSERT_OK(swMeta);
    const TxnMeta& meta = swMeta.getValue();
    ASSERT_EQUALS(TxnRole::kSingle, meta.getRole());
    ASSERT_TRUE(meta.isFirst());
    ASSERT_TRUE(meta.isFinal());
    ASSERT_TRUE(meta.isCommit());
    ASSERT_FALSE(meta.isMultiOp());
    ASSERT_TRUE(meta.getPrevOpTime().isNull());
}

TEST(TxnMetaTest, TimestampComesFromEntry) {
    const BSONObj entry = makeApplyOpsEntry(
        Timestamp(1234, 5), makeLsid(1), 9LL, boost::none, makeInnerInserts("a.b", 0, 1));
    auto swMeta = TxnMeta::parse(entry);
    ASSERT_OK(swMeta);
    ASSERT_EQUALS(Timestamp(1234, 5), swMeta.getValue().getTimestamp());
    ASSERT_EQUALS(9LL, swMeta.getValue().getId().txnNumber);
}

TEST(TxnMetaTest, LsidWithoutTxnNumberIsAmbiguous) {
    const BSONObj entry = makeApplyOpsEntry(
        Timestamp(1, 1), makeLsid(2), boost::none, boost::none, makeInnerInserts("a.b", 0, 1));
    auto swMeta = TxnMeta::parse(entry);
    ASSERT_EQUALS(ErrorCodes::FailedToParse, swMeta.getStatus().code());
}

TEST(TxnMetaTest, TxnNumberWithoutLsidIsAmbiguous) {
    const BSONObj entry = makeApplyOpsEntry(
        Timestamp(1, 1), BSONObj(), 3LL, boost::none, makeInnerInserts("a.b", 0, 1));
    auto swMeta = TxnMeta::parse(entry);
    ASSERT_EQUALS(ErrorCodes::FailedToParse, swMeta.getStatus().code());
}

TEST(TxnMetaTest, CommitWithoutSessionIsNotTransaction) {
    for (const BSONObj& o : {BSON("commitTransaction" << 1), BSON("abortTransaction" << 1)}) {
        SCOPED_TRACE(o.toString());
        BSONObjBuilder bob;
        bob.append("ts", Timestamp(6, 1));
        bob.append("op", "c");
        bob.append("ns", "admin.$cmd");
        bob.append("o", o);
        auto swMeta = TxnMeta::parse(bob.obj());
        ASSERT_OK(swMeta);
        ASSERT_FALSE(swMeta.getValue().isTxn());
        ASSERT_FALSE(swMeta.getValue().isCommit());
        ASSERT_FALSE(swMeta.getValue().isAbort());
        ASSERT_TRUE(swMeta.getValue().getId().isEmpty());
    }
}

TEST(TxnMetaTest, UnlinkedCommitIsSingle) {
    const BSONObj entry = makeCommitTransactionEntry(
        Timestamp(5, 1), makeLsid(3), 1, boost::none, Timestamp(4, 1));
    auto swMeta = TxnMeta::parse(entry);
    ASSERT_OK(swMeta);
    const TxnMeta& meta = swMeta.getValue();
    ASSERT_EQUALS(TxnRole::kSingle, meta.getRole());
    ASSERT_TRUE(meta.isFirst());
    ASSERT_TRUE(meta.isCommit());
    ASSERT_FALSE(meta.isMultiOp());
}

TEST(TxnMetaTest, UnlinkedAbortIsFirstAndFinal) {
    const BSONObj entry = makeAbortTransactionEntry(
        Timestamp(5, 1), makeLsid(3), 1, repl::OpTime(Timestamp(), -1));
    auto swMeta = TxnMeta::parse(entry);
    ASSERT_OK(swMeta);
    const TxnMeta& meta = swMeta.getValue();
    ASSERT_EQUALS(TxnRole::kFinalAbort, meta.getRole());
    ASSERT_TRUE(meta.isFirst());
    ASSERT_TRUE(meta.isAbort());
    ASSERT_FALSE(meta.isCommit());
    ASSERT_FALSE(meta.isMultiOp());
}

TEST(TxnMetaTest, LinkedAbortIsNotFirst) {
    const BSONObj entry = makeAbortTransactionEntry(
        Timestamp(5, 1), makeLsid(3), 1, repl::OpTime(Timestamp(4, 1), 1));
    auto swMeta = TxnMeta::parse(entry);
    ASSERT_OK(swMeta);
    ASSERT_FALSE(swMeta.getValue().isFirst());
    ASSERT_TRUE(swMeta.getValue().isMultiOp());
}

TEST(TxnMetaTest, OtherCommandWithSessionIsNotTransaction) {
    BSONObjBuilder bob;
    bob.append("ts", Timestamp(7, 1));
    bob.append("op", "c");
    bob.append("ns", "test.$cmd");
    bob.append("o", BSON("create" << "coll"));
    bob.append("lsid", makeLsid(4));
    bob.append("txnNumber", 2LL);
    auto swMeta = TxnMeta::parse(bob.obj());
    ASSERT_OK(swMeta);
    ASSERT_FALSE(swMeta.getValue().isTxn());
}

TEST(TxnMetaTest, MalformedEntryFailsToParse) {
    auto swMissingTs = TxnMeta::parse(BSON("op" << "c" << "ns" << "admin.$cmd" << "o"
                                                << BSON("applyOps" << BSONArray())));
    ASSERT_EQUALS(ErrorCodes::FailedToParse, swMissingTs.getStatus().code());

    auto swBadOp = TxnMeta::parse(BSON("ts" << Timestamp(1, 1) << "op" << 5 << "ns"
                                            << "admin.$cmd" << "o" << BSONObj()));
    ASSERT_EQUALS(ErrorCodes::TypeMismatch, swBadOp.getStatus().code());
}

TEST(TxnMetaTest, IdsOfDifferentSessionsDiffer) {
    const TxnId a(makeLsid(1), 1);
    const TxnId b(makeLsid(2), 1);
    const TxnId c(makeLsid(1), 2);
    const TxnId a2(makeLsid(1), 1);
    ASSERT_TRUE(a == a2);
    ASSERT_EQUALS(TxnId::Hash()(a), TxnId::Hash()(a2));
    ASSERT_TRUE(a != b);
    ASSERT_TRUE(a != c);
    ASSERT_TRUE(TxnId().isEmpty());
    ASSERT_FALSE(a.isEmpty());
}

}  // namespace
}  // namespace oplogmirror

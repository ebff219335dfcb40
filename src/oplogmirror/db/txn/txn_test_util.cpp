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

#include "oplogmirror/db/txn/txn_test_util.h"

#include <deque>
#include <random>

#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/util/uuid.h"

namespace oplogmirror {
namespace txn_test {
namespace {

constexpr auto kNs = "test.coll"_sd;
constexpr long long kTerm = 1;

UUID collectionUuid() {
    unsigned char bytes[UUID::kNumBytes];
    for (int i = 0; i < UUID::kNumBytes; ++i)
        bytes[i] = static_cast<unsigned char>(0xc0 + i);
    return UUID::fromCDR(bytes);
}

void appendCommonFields(BSONObjBuilder* bob, Timestamp ts, StringData op, StringData ns) {
    bob->append("ts", ts);
    bob->append("t", kTerm);
    bob->append("h", 0LL);
    bob->append("v", 2);
    bob->append("op", op);
    bob->append("ns", ns);
}

void appendSession(BSONObjBuilder* bob,
                   const BSONObj& lsid,
                   boost::optional<long long> txnNumber,
                   boost::optional<repl::OpTime> prevOpTime) {
    if (!lsid.isEmpty())
        bob->append("lsid", lsid);
    if (txnNumber)
        bob->append("txnNumber", *txnNumber);
    if (prevOpTime)
        prevOpTime->append(bob, "prevOpTime");
}

repl::OpTime nullOpTime() {
    return repl::OpTime(Timestamp(), repl::OpTime::kUninitializedTerm);
}

repl::OpTime opTimeAt(Timestamp ts) {
    return repl::OpTime(ts, kTerm);
}

}  // namespace

BSONObj makeLsid(unsigned char seed) {
    unsigned char bytes[UUID::kNumBytes];
    for (int i = 0; i < UUID::kNumBytes; ++i)
        bytes[i] = static_cast<unsigned char>(seed + i);
    BSONObjBuilder bob;
    UUID::fromCDR(bytes).appendToBuilder(&bob, "id");
    const char uid[32] = {};
    bob.appendBinData("uid", sizeof(uid), BinDataType::BinDataGeneral, uid);
    return bob.obj();
}

BSONObj makeInnerInsert(StringData ns, int id) {
    BSONObjBuilder bob;
    bob.append("op", "i");
    bob.append("ns", ns);
    collectionUuid().appendToBuilder(&bob, "ui");
    bob.append("o", BSON("_id" << id));
    return bob.obj();
}

std::vector<BSONObj> makeInnerInserts(StringData ns, int firstId, int count) {
    std::vector<BSONObj> ops;
    for (int i = 0; i < count; ++i)
        ops.push_back(makeInnerInsert(ns, firstId + i));
    return ops;
}

BSONObj makeApplyOpsEntry(Timestamp ts,
                          const BSONObj& lsid,
                          boost::optional<long long> txnNumber,
                          boost::optional<repl::OpTime> prevOpTime,
                          const std::vector<BSONObj>& innerOps,
                          bool partialTxn,
                          bool prepare) {
    BSONObjBuilder bob;
    appendCommonFields(&bob, ts, "c", "admin.$cmd");
    {
        BSONObjBuilder o(bob.subobjStart("o"));
        {
            BSONArrayBuilder ops(o.subarrayStart("applyOps"));
            for (const auto& op : innerOps)
                ops.append(op);
        }
        if (partialTxn)
            o.append("partialTxn", true);
        if (prepare)
            o.append("prepare", true);
    }
    appendSession(&bob, lsid, txnNumber, prevOpTime);
    return bob.obj();
}

BSONObj makeCommitTransactionEntry(Timestamp ts,
                                   const BSONObj& lsid,
                                   long long txnNumber,
                                   boost::optional<repl::OpTime> prevOpTime,
                                   Timestamp commitTimestamp) {
    BSONObjBuilder bob;
    appendCommonFields(&bob, ts, "c", "admin.$cmd");
    bob.append("o", BSON("commitTransaction" << 1 << "commitTimestamp" << commitTimestamp));
    appendSession(&bob, lsid, txnNumber, prevOpTime);
    return bob.obj();
}

BSONObj makeAbortTransactionEntry(Timestamp ts,
                                  const BSONObj& lsid,
                                  long long txnNumber,
                                  boost::optional<repl::OpTime> prevOpTime) {
    BSONObjBuilder bob;
    appendCommonFields(&bob, ts, "c", "admin.$cmd");
    bob.append("o", BSON("abortTransaction" << 1));
    appendSession(&bob, lsid, txnNumber, prevOpTime);
    return bob.obj();
}

BSONObj makeInsertEntry(Timestamp ts, StringData ns, int id, const BSONObj& lsid) {
    BSONObjBuilder bob;
    appendCommonFields(&bob, ts, "i", ns);
    collectionUuid().appendToBuilder(&bob, "ui");
    bob.append("o", BSON("_id" << id));
    if (!lsid.isEmpty()) {
        bob.append("lsid", lsid);
        bob.append("txnNumber", 7LL);
        bob.append("stmtId", 0);
        nullOpTime().append(&bob, "prevOpTime");
    }
    return bob.obj();
}

std::vector<TxnTestCase> makeTxnTestCases() {
    std::vector<TxnTestCase> cases;
    unsigned secs = 100;

    {
        TxnTestCase c{"not transaction"};
        c.ops.push_back(makeInsertEntry(Timestamp(secs++, 1), kNs, 1));
        c.notTxn = true;
        cases.push_back(c);
    }
    {
        TxnTestCase c{"retryable write"};
        c.ops.push_back(makeInsertEntry(Timestamp(secs++, 1), kNs, 2, makeLsid(0x10)));
        c.notTxn = true;
        cases.push_back(c);
    }
    {
        TxnTestCase c{"applyops not transaction"};
        c.ops.push_back(makeApplyOpsEntry(
            Timestamp(secs++, 1), BSONObj(), boost::none, boost::none, makeInnerInserts(kNs, 10, 2)));
        c.notTxn = true;
        cases.push_back(c);
    }
    {
        TxnTestCase c{"small, unprepared"};
        c.ops.push_back(makeApplyOpsEntry(Timestamp(secs++, 1),
                                          makeLsid(0x20),
                                          0LL,
                                          nullOpTime(),
                                          makeInnerInserts(kNs, 20, 2)));
        c.innerOpCount = 2;
        c.commits = true;
        cases.push_back(c);
    }
    {
        // 4.0 wrote no prevOpTime at all on single entry transactions.
        TxnTestCase c{"small, unprepared, 4.0"};
        c.ops.push_back(makeApplyOpsEntry(Timestamp(secs++, 1),
                                          makeLsid(0x30),
                                          1LL,
                                          boost::none,
                                          makeInnerInserts(kNs, 30, 3)));
        c.innerOpCount = 3;
        c.commits = true;
        cases.push_back(c);
    }
    {
        TxnTestCase c{"large, unprepared"};
        const BSONObj lsid = makeLsid(0x40);
        const Timestamp ts1(secs++, 1), ts2(secs++, 1), ts3(secs++, 1);
        c.ops.push_back(
            makeApplyOpsEntry(ts1, lsid, 2LL, nullOpTime(), makeInnerInserts(kNs, 40, 2), true));
        c.ops.push_back(
            makeApplyOpsEntry(ts2, lsid, 2LL, opTimeAt(ts1), makeInnerInserts(kNs, 42, 2), true));
        c.ops.push_back(
            makeApplyOpsEntry(ts3, lsid, 2LL, opTimeAt(ts2), makeInnerInserts(kNs, 44, 1)));
        c.innerOpCount = 5;
        c.commits = true;
        cases.push_back(c);
    }
    {
        TxnTestCase c{"small, prepared, committed"};
        const BSONObj lsid = makeLsid(0x50);
        const Timestamp ts1(secs++, 1), ts2(secs++, 1);
        c.ops.push_back(makeApplyOpsEntry(
            ts1, lsid, 3LL, nullOpTime(), makeInnerInserts(kNs, 50, 2), false, true));
        c.ops.push_back(makeCommitTransactionEntry(ts2, lsid, 3LL, opTimeAt(ts1), ts1));
        c.innerOpCount = 2;
        c.commits = true;
        cases.push_back(c);
    }
    {
        TxnTestCase c{"small, prepared, aborted"};
        const BSONObj lsid = makeLsid(0x60);
        const Timestamp ts1(secs++, 1), ts2(secs++, 1);
        c.ops.push_back(makeApplyOpsEntry(
            ts1, lsid, 4LL, nullOpTime(), makeInnerInserts(kNs, 60, 2), false, true));
        c.ops.push_back(makeAbortTransactionEntry(ts2, lsid, 4LL, opTimeAt(ts1)));
        c.aborts = true;
        cases.push_back(c);
    }
    for (bool commit : {true, false}) {
        TxnTestCase c{commit ? "large, prepared, committed" : "large, prepared, aborted"};
        const BSONObj lsid = makeLsid(commit ? 0x70 : 0x80);
        const long long txnNumber = commit ? 5 : 6;
        const int firstId = commit ? 70 : 80;
        const Timestamp ts1(secs++, 1), ts2(secs++, 1), ts3(secs++, 1), ts4(secs++, 1);
        c.ops.push_back(makeApplyOpsEntry(
            ts1, lsid, txnNumber, nullOpTime(), makeInnerInserts(kNs, firstId, 2), true));
        c.ops.push_back(makeApplyOpsEntry(
            ts2, lsid, txnNumber, opTimeAt(ts1), makeInnerInserts(kNs, firstId + 2, 2), true));
        c.ops.push_back(makeApplyOpsEntry(ts3,
                                          lsid,
                                          txnNumber,
                                          opTimeAt(ts2),
                                          makeInnerInserts(kNs, firstId + 4, 1),
                                          false,
                                          true));
        if (commit) {
            c.ops.push_back(makeCommitTransactionEntry(ts4, lsid, txnNumber, opTimeAt(ts3), ts3));
            c.innerOpCount = 5;
            c.commits = true;
        } else {
            c.ops.push_back(makeAbortTransactionEntry(ts4, lsid, txnNumber, opTimeAt(ts3)));
            c.aborts = true;
        }
        cases.push_back(c);
    }
    return cases;
}

std::vector<BSONObj> interleaveCases(const std::vector<TxnTestCase>& cases, unsigned seed) {
    std::vector<std::deque<BSONObj>> streams;
    for (const auto& c : cases)
        streams.emplace_back(c.ops.begin(), c.ops.end());

    std::mt19937 gen(seed);
    std::vector<BSONObj> out;
    while (!streams.empty()) {
        std::uniform_int_distribution<std::size_t> pick(0, streams.size() - 1);
        const std::size_t i = pick(gen);
        out.push_back(streams[i].front());
        streams[i].pop_front();
        if (streams[i].empty())
            streams.erase(streams.begin() + i);
    }
    return out;
}

}  // namespace txn_test
}  // namespace oplogmirror

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

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "oplogmirror/base/string_data.h"
#include "oplogmirror/bson/bsonobj.h"
#include "oplogmirror/bson/timestamp.h"
#include "oplogmirror/db/repl/optime.h"

namespace oplogmirror {
namespace txn_test {

/**
 * Oplog entries for one scenario, as the source writes them, in oplog order.
 */
struct TxnTestCase {
    std::string name;
    std::vector<BSONObj> ops;

    // Number of operations applied when the case commits. Zero for the others.
    int innerOpCount = 0;

    bool notTxn = false;
    bool commits = false;
    bool aborts = false;
};

/**
 * A logical session id whose "id" UUID is derived from 'seed', so different seeds give
 * different sessions.
 */
BSONObj makeLsid(unsigned char seed);

/** An insert of {_id: id} into 'ns', as it appears inside applyOps. */
BSONObj makeInnerInsert(StringData ns, int id);

/** 'count' inner inserts with consecutive _ids starting at 'firstId'. */
std::vector<BSONObj> makeInnerInserts(StringData ns, int firstId, int count);

/**
 * An applyOps command entry. The session metadata is only written when 'lsid' is non-empty,
 * and the prevOpTime link only when 'prevOpTime' is set.
 */
BSONObj makeApplyOpsEntry(Timestamp ts,
                          const BSONObj& lsid,
                          boost::optional<long long> txnNumber,
                          boost::optional<repl::OpTime> prevOpTime,
                          const std::vector<BSONObj>& innerOps,
                          bool partialTxn = false,
                          bool prepare = false);

BSONObj makeCommitTransactionEntry(Timestamp ts,
                                   const BSONObj& lsid,
                                   long long txnNumber,
                                   boost::optional<repl::OpTime> prevOpTime,
                                   Timestamp commitTimestamp);

BSONObj makeAbortTransactionEntry(Timestamp ts,
                                  const BSONObj& lsid,
                                  long long txnNumber,
                                  boost::optional<repl::OpTime> prevOpTime);

/** A plain insert entry, optionally written as a retryable write. */
BSONObj makeInsertEntry(Timestamp ts, StringData ns, int id, const BSONObj& lsid = BSONObj());

/**
 * The scenarios transaction handling is checked against: non-transaction entries, 4.0 and 4.2
 * style single entry transactions, and unprepared and prepared transactions spanning several
 * entries that either commit or abort. Every case uses its own session.
 */
std::vector<TxnTestCase> makeTxnTestCases();

/**
 * Merges the entries of 'cases' into one sequence, picking the next case at random with a
 * generator seeded by 'seed' while keeping each case's own entries in order.
 */
std::vector<BSONObj> interleaveCases(const std::vector<TxnTestCase>& cases, unsigned seed);

}  // namespace txn_test
}  // namespace oplogmirror

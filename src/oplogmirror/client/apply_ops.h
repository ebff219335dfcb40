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

#include <cstddef>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "oplogmirror/base/status_with.h"
#include "oplogmirror/bson/bsonobj.h"

namespace oplogmirror {

/**
 * The reply of an applyOps command. "results" holds one flag per applied operation, so after a
 * failure it tells which operation of the batch the server stopped at.
 */
struct ApplyOpsResponse {
    bool ok = false;
    std::string errmsg;
    int code = 0;
    int applied = 0;
    std::vector<bool> results;

    static ApplyOpsResponse parse(const BSONObj& reply);

    /**
     * Index of the first operation reported as not applied, if any.
     */
    boost::optional<std::size_t> firstFailedIndex() const;

    BSONObj toBSON() const;
    std::string toString() const;
};

/**
 * The no-op oplog entry sent to flush the destination: {op: "n", ns: "", o: {msg: ...}}.
 * An applyOps command cannot be empty, so this is what waiting for write concern applies.
 */
BSONObj makeNoopOplogEntry();

/**
 * A command entry wrapping a nested applyOps of the no-op entry. Appending it to a batch keeps
 * the server from applying the batch atomically, so one failing operation does not roll back
 * the rest and "results" stays meaningful.
 */
BSONObj makeNonAtomicMarkerEntry();

/**
 * Builds {applyOps: [...], bypassDocumentValidation: true} for 'entries'. Batches of more than
 * one entry get the non-atomic marker appended. Fails with BadValue for an empty batch.
 */
StatusWith<BSONObj> makeApplyOpsCommand(const std::vector<BSONObj>& entries,
                                        bool bypassDocumentValidation);

}  // namespace oplogmirror

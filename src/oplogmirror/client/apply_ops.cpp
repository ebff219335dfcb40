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

#include "oplogmirror/client/apply_ops.h"

#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/db/namespace_string.h"
#include "oplogmirror/db/repl/oplog_entry.h"
#include "oplogmirror/util/str.h"

namespace oplogmirror {
namespace {

constexpr auto kApplyOpsCommandName = "applyOps"_sd;
constexpr auto kBypassDocumentValidationField = "bypassDocumentValidation"_sd;
constexpr auto kOkField = "ok"_sd;
constexpr auto kErrmsgField = "errmsg"_sd;
constexpr auto kCodeField = "code"_sd;
constexpr auto kAppliedField = "applied"_sd;
constexpr auto kResultsField = "results"_sd;

constexpr auto kNoopMessage = "oplogmirror noop"_sd;
constexpr auto kNonAtomicMarkerNamespace = "noop.$cmd"_sd;

}  // namespace

ApplyOpsResponse ApplyOpsResponse::parse(const BSONObj& reply) {
    ApplyOpsResponse response;
    response.ok = reply[kOkField].trueValue();
    response.errmsg = reply.getStringField(kErrmsgField).toString();
    response.code = reply.getIntField(kCodeField);
    response.applied = reply.getIntField(kAppliedField);

    BSONElement results = reply[kResultsField];
    if (results.type() == BSONType::array) {
        for (const auto& result : results.Obj())
            response.results.push_back(result.trueValue());
    }
    return response;
}

boost::optional<std::size_t> ApplyOpsResponse::firstFailedIndex() const {
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (!results[i])
            return i;
    }
    return boost::none;
}

BSONObj ApplyOpsResponse::toBSON() const {
    BSONObjBuilder bob;
    bob.append(kOkField, ok ? 1 : 0);
    if (!errmsg.empty())
        bob.append(kErrmsgField, errmsg);
    if (code != 0)
        bob.append(kCodeField, code);
    bob.append(kAppliedField, applied);
    bob.append(kResultsField, results);
    return bob.obj();
}

std::string ApplyOpsResponse::toString() const {
    return toBSON().toString();
}

BSONObj makeNoopOplogEntry() {
    return BSON(repl::OplogEntry::kOpTypeFieldName
                << "n" << repl::OplogEntry::kNssFieldName << ""
                << repl::OplogEntry::kObjectFieldName << BSON("msg" << kNoopMessage));
}

BSONObj makeNonAtomicMarkerEntry() {
    return BSON(repl::OplogEntry::kOpTypeFieldName
                << "c" << repl::OplogEntry::kNssFieldName << kNonAtomicMarkerNamespace
                << repl::OplogEntry::kObjectFieldName
                << BSON(kApplyOpsCommandName << BSON_ARRAY(makeNoopOplogEntry())));
}

StatusWith<BSONObj> makeApplyOpsCommand(const std::vector<BSONObj>& entries,
                                        bool bypassDocumentValidation) {
    if (entries.empty())
        return Status(ErrorCodes::BadValue, "cannot send an empty applyOps");

    BSONObjBuilder cmd;
    {
        BSONArrayBuilder ops(cmd.subarrayStart(kApplyOpsCommandName));
        for (const auto& entry : entries)
            ops.append(entry);
        if (entries.size() > 1)
            ops.append(makeNonAtomicMarkerEntry());
    }
    if (bypassDocumentValidation)
        cmd.append(kBypassDocumentValidationField, true);
    return cmd.obj();
}

}  // namespace oplogmirror

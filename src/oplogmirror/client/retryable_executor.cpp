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

#define OPLOGMIRROR_LOGV2_DEFAULT_COMPONENT ::oplogmirror::logv2::LogComponent::kCommand

#include "oplogmirror/client/retryable_executor.h"

#include <algorithm>

#include "oplogmirror/bson/bsonmisc.h"
#include "oplogmirror/bson/bsonobjbuilder.h"
#include "oplogmirror/client/command_runner.h"
#include "oplogmirror/client/error_classifier.h"
#include "oplogmirror/client/index_spec_util.h"
#include "oplogmirror/db/repl/oplog_entry.h"
#include "oplogmirror/logv2/log.h"
#include "oplogmirror/rpc/get_status_from_command_result.h"
#include "oplogmirror/util/assert_util.h"
#include "oplogmirror/util/clock_source.h"
#include "oplogmirror/util/str.h"

namespace oplogmirror {
namespace {

constexpr auto kAdminDb = "admin"_sd;

// Limits of a single insert command.
constexpr std::size_t kMaxWriteBatchSize = 100000;

std::string gaveUpRetrying(int attempts, Milliseconds elapsed) {
    return str::stream() << "gave up retrying after " << attempts
                         << " failed attempts which took " << durationToString(elapsed);
}

std::string gaveUpReconnecting(int attempts, Milliseconds elapsed) {
    return str::stream() << "gave up reconnecting to the destination after " << attempts
                         << " failed attempts which took " << durationToString(elapsed);
}

}  // namespace

RetryableExecutor::RetryableExecutor(CommandRunner* runner,
                                     BuildInfo destinationInfo,
                                     RetryOptions options,
                                     WriteConcernOptions writeConcern,
                                     ClockSource* clockSource)
    : _runner(runner),
      _destinationInfo(std::move(destinationInfo)),
      _options(options),
      _writeConcern(std::move(writeConcern)),
      _clockSource(clockSource ? clockSource : SystemClockSource::get()) {
    invariant(_runner);
}

bool RetryableExecutor::_retryFloorsLeft(int attempts, int attemptsLowerBound, Date_t start) {
    return attempts < attemptsLowerBound ||
        _clockSource->now() - start < _options.retryDurationLowerBound;
}

Status RetryableExecutor::runRetryable(const Attempt& attempt) {
    Status status = attempt(false);
    if (status.isOK())
        return status;

    const Date_t start = _clockSource->now();
    int i = 0;
    for (; _retryFloorsLeft(i, _options.commandRetriesLowerBound, start); ++i) {
        if (!isReconnectableError(status)) {
            LOGV2(8104010, "Error on destination", "error"_attr = status);
            return status;
        }

        LOGV2(8104011,
              "Reconnecting to the destination after transient error",
              "error"_attr = status,
              "attempt"_attr = i + 1);
        Status recovered = recoverSession(start, true);
        if (!recovered.isOK())
            return recovered;

        status = attempt(true);
        if (status.isOK())
            return status;
    }
    return status.withContext(gaveUpRetrying(i + 1, _clockSource->now() - start));
}

Status RetryableExecutor::recoverSession(Date_t start, bool writeable) {
    // Probing with a majority write also flushes the destination, so a retry builds on a
    // majority commit of whatever the failed attempt managed to do.
    Status status = Status::OK();
    int i = 0;
    for (; _retryFloorsLeft(i, _options.connectionRetriesLowerBound, start); ++i) {
        _clockSource->sleepFor(_options.recoverSleepDuration);

        if (writeable) {
            status = waitForWriteConcernMajority();
        } else {
            BSONObj reply;
            status = _runCommand(kAdminDb, BSON("isMaster" << 1), &reply);
        }

        if (status.isOK()) {
            LOGV2_DEBUG(8104012, 1, "Reconnected to the destination", "attempts"_attr = i + 1);
            return status;
        }
        if (!isReconnectableError(status)) {
            LOGV2(8104013,
                  "Reconnection attempt failed with unrecoverable error",
                  "attempt"_attr = i + 1,
                  "error"_attr = status);
            break;
        }
        LOGV2(8104014, "Reconnection attempt failed", "attempt"_attr = i + 1, "error"_attr = status);
    }
    return status.withContext(gaveUpReconnecting(i, _clockSource->now() - start));
}

Status RetryableExecutor::_runCommand(StringData dbName, const BSONObj& cmd, BSONObj* reply) {
    bool ok;
    try {
        ok = _runner->runCommand(dbName.toString(), cmd, reply);
    } catch (const DBException& ex) {
        return ex.toStatus();
    }

    Status status = getStatusFromCommandResult(*reply);
    if (!ok && status.isOK()) {
        return Status(ErrorCodes::UnknownError,
                      str::stream() << cmd.firstElementFieldNameStringData()
                                    << " failed: " << reply->toString());
    }
    return status;
}

Status RetryableExecutor::runCommandWithLog(StringData dbName, const BSONObj& cmd, BSONObj* reply) {
    const StringData cmdName = cmd.firstElementFieldNameStringData();
    LOGV2_DEBUG(8104015, 1, "Running command", "command"_attr = cmdName, "db"_attr = dbName);

    const Date_t start = _clockSource->now();
    BSONObj localReply;
    Status status = _runCommand(dbName, cmd, &localReply);
    if (status.isOK())
        status = getWriteConcernStatusFromCommandResult(localReply);
    if (reply)
        *reply = localReply;

    const Milliseconds elapsed = _clockSource->now() - start;
    if (!status.isOK()) {
        LOGV2(8104016,
              "Command finished with error",
              "command"_attr = cmdName,
              "db"_attr = dbName,
              "duration"_attr = elapsed,
              "error"_attr = status);
        return status;
    }
    LOGV2_DEBUG(8104017,
                1,
                "Command finished",
                "command"_attr = cmdName,
                "db"_attr = dbName,
                "duration"_attr = elapsed);
    return status;
}

Status RetryableExecutor::_runInsert(const NamespaceString& nss,
                                     const std::vector<BSONObj>& docs,
                                     std::size_t begin,
                                     std::size_t end,
                                     bool bypassDocumentValidation) {
    // Leave room for the command fields around the documents.
    const auto maxBatchBytes = static_cast<std::size_t>(
        std::max(_destinationInfo.getMaxBsonObjectSize() - 16 * 1024, 16 * 1024));

    std::size_t batchBegin = begin;
    while (batchBegin < end) {
        std::size_t batchEnd = batchBegin;
        std::size_t batchBytes = 0;
        while (batchEnd < end && batchEnd - batchBegin < kMaxWriteBatchSize) {
            const std::size_t docBytes = docs[batchEnd].objsize();
            if (batchEnd > batchBegin && batchBytes + docBytes > maxBatchBytes)
                break;
            batchBytes += docBytes;
            ++batchEnd;
        }

        BSONObjBuilder cmd;
        cmd.append("insert", nss.coll());
        {
            BSONArrayBuilder documents(cmd.subarrayStart("documents"));
            for (std::size_t i = batchBegin; i < batchEnd; ++i)
                documents.append(docs[i]);
        }
        cmd.append("ordered", true);
        if (bypassDocumentValidation)
            cmd.append("bypassDocumentValidation", true);
        _writeConcern.appendTo(&cmd);

        BSONObj reply;
        Status status = _runCommand(nss.db(), cmd.obj(), &reply);
        if (status.isOK())
            status = getStatusFromWriteCommandReply(reply);
        if (!status.isOK())
            return status;

        batchBegin = batchEnd;
    }
    return Status::OK();
}

Status RetryableExecutor::insertMany(const NamespaceString& nss,
                                     const std::vector<BSONObj>& docs,
                                     bool bypassDocumentValidation) {
    std::size_t pos = 0;
    while (pos < docs.size()) {
        Status status = runRetryable([&](bool isRetry) {
            return _runInsert(nss, docs, pos, docs.size(), bypassDocumentValidation);
        });
        if (!isDuplicateKeyError(status))
            return status;

        // Some of the documents are already there. Insert one at a time until the first one
        // that is new, then bulk insert the rest.
        LOGV2_DEBUG(8104018,
                    1,
                    "Duplicate key error on insert, inserting documents one at a time",
                    "namespace"_attr = nss,
                    "position"_attr = pos,
                    "error"_attr = status);
        std::size_t i = pos;
        while (i < docs.size()) {
            Status single = runRetryable([&](bool isRetry) {
                return _runInsert(nss, docs, i, i + 1, bypassDocumentValidation);
            });
            ++i;
            if (single.isOK())
                break;
            if (!isDuplicateKeyError(single))
                return single;
        }
        pos = i;
    }
    return Status::OK();
}

Status RetryableExecutor::create(StringData dbName, const BSONObj& createCmd) {
    const BSONObj cmd = WriteConcernOptions::majority().attachTo(createCmd);
    return runRetryable([&](bool isRetry) {
        Status status = runCommandWithLog(dbName, cmd);
        // An earlier attempt may have created it.
        if (isRetry && isNamespaceExistsError(status))
            return Status::OK();
        return status;
    });
}

Status RetryableExecutor::renameCollection(const BSONObj& renameCmd) {
    const BSONObj cmd = WriteConcernOptions::majority().attachTo(renameCmd);
    return runRetryable([&](bool isRetry) {
        Status status = runCommandWithLog(kAdminDb, cmd);
        if (isRetry && isNamespaceNotFoundError(status))
            return Status::OK();
        return status;
    });
}

Status RetryableExecutor::renameAndDrop(const NamespaceString& nss) {
    const NamespaceString dropPending = nss.makeDropPendingNamespace();
    Status status = renameCollection(BSON("renameCollection" << nss.ns() << "to" << dropPending.ns()));
    if (!status.isOK())
        return status;
    return drop(dropPending);
}

Status RetryableExecutor::drop(const NamespaceString& nss) {
    if (nss.isSystemDotJavascript()) {
        // The server refuses to drop system.js collections directly.
        return renameAndDrop(nss);
    }

    const BSONObj cmd = WriteConcernOptions::majority().attachTo(BSON("drop" << nss.coll()));
    return runRetryable([&](bool isRetry) {
        Status status = runCommandWithLog(nss.db(), cmd);
        if (isRetry && isNamespaceNotFoundError(status))
            return Status::OK();
        return status;
    });
}

Status RetryableExecutor::dropDatabase(StringData dbName) {
    const BSONObj cmd = WriteConcernOptions::majority().attachTo(BSON("dropDatabase" << 1));
    return runRetryable([&](bool isRetry) { return runCommandWithLog(dbName, cmd); });
}

Status RetryableExecutor::collMod(StringData dbName, const BSONObj& collModCmd) {
    const bool supportsWriteConcern = _destinationInfo.versionAtLeast({3, 6, 0});
    const BSONObj cmd =
        supportsWriteConcern ? WriteConcernOptions::majority().attachTo(collModCmd) : collModCmd;
    return runRetryable([&](bool isRetry) {
        Status status = runCommandWithLog(dbName, cmd);
        if (!status.isOK() || supportsWriteConcern)
            return status;
        return waitForWriteConcernMajority();
    });
}

Status RetryableExecutor::createIndexes(const NamespaceString& nss,
                                        const std::vector<BSONObj>& indexes) {
    std::vector<BSONObj> fixedIndexes;
    fixedIndexes.reserve(indexes.size());
    for (const auto& index : indexes)
        fixedIndexes.push_back(fixOutgoingIndexSpec(index));

    // All indexes of a collection go in one command so the server builds them in one scan.
    BSONObjBuilder cmdBuilder;
    cmdBuilder.append("createIndexes", nss.coll());
    cmdBuilder.append("indexes", fixedIndexes);
    WriteConcernOptions::majority().appendTo(&cmdBuilder);
    const BSONObj cmd = cmdBuilder.obj();

    return runRetryable([&](bool isRetry) {
        LOGV2_DEBUG(8104019,
                    1,
                    "Running createIndexes",
                    "namespace"_attr = nss,
                    "indexes"_attr = fixedIndexes);
        const Date_t start = _clockSource->now();
        BSONObj reply;
        Status status = _runCommand(nss.db(), cmd, &reply);
        if (status.isOK())
            status = getWriteConcernStatusFromCommandResult(reply);
        if (!status.isOK()) {
            LOGV2(8104020,
                  "createIndexes finished with error",
                  "namespace"_attr = nss,
                  "duration"_attr = _clockSource->now() - start,
                  "error"_attr = status);
            return status;
        }
        LOGV2(8104021,
              "createIndexes finished",
              "namespace"_attr = nss,
              "duration"_attr = _clockSource->now() - start);

        // createIndexes takes a write concern only from 3.3.5 on. Before that, wait for the
        // builds on secondaries with a majority no-op.
        if (!_destinationInfo.versionAtLeast({3, 3, 5})) {
            LOGV2(8104022, "Waiting for index builds on a majority of nodes to complete");
            status = waitForWriteConcernMajority();
            if (!status.isOK()) {
                return status.withContext(
                    "error waiting for index builds on a majority of nodes to complete");
            }
        }
        return status;
    });
}

Status RetryableExecutor::applyOpsCreateIndex(const NamespaceString& nss,
                                              const BSONObj& index,
                                              const boost::optional<UUID>& uuid,
                                              ApplyOpsResponse* response) {
    const BSONObj fixedIndex = fixOutgoingIndexSpec(index);

    BSONObjBuilder entry;
    if (!uuid) {
        // The destination has no collection UUIDs; build through system.indexes.
        LOGV2(8104023,
              "Running system.indexes applyOps to create index",
              "namespace"_attr = nss,
              "index"_attr = fixedIndex);
        entry.append(repl::OplogEntry::kOpTypeFieldName, "i");
        entry.append(repl::OplogEntry::kNssFieldName,
                     NamespaceString(nss.db(), NamespaceString::kSystemIndexesCollection).ns());
        entry.append(repl::OplogEntry::kObjectFieldName, fixedIndex);
    } else {
        LOGV2(8104024,
              "Running createIndexes with applyOps to create index",
              "namespace"_attr = nss,
              "index"_attr = fixedIndex);
        entry.append(repl::OplogEntry::kOpTypeFieldName, "c");
        entry.append(repl::OplogEntry::kNssFieldName,
                     NamespaceString::makeCommandNamespace(nss.db()).ns());
        uuid->appendToBuilder(&entry, repl::OplogEntry::kUuidFieldName);
        {
            BSONObjBuilder o(entry.subobjStart(repl::OplogEntry::kObjectFieldName));
            o.append("createIndexes", nss.coll());
            o.appendElements(fixedIndex);
        }
    }

    const BSONObj createEntry = entry.obj();
    return applyOps({createEntry}, createEntry.objsize(), false, response);
}

Status RetryableExecutor::createIndexesWithFallback(const NamespaceString& nss,
                                                    const std::vector<BSONObj>& indexes,
                                                    const boost::optional<UUID>& uuid) {
    Status status = createIndexes(nss, indexes);
    if (status.isOK())
        return status;
    if (!isInvalidIndexSpecificationOptionError(status) && !isCannotCreateIndexError(status))
        return status;

    LOGV2(8104025,
          "createIndexes failed, retrying each index build individually",
          "namespace"_attr = nss,
          "error"_attr = status);
    for (const auto& index : indexes) {
        Status indexStatus = applyOpsCreateIndex(nss, index, uuid);
        if (!indexStatus.isOK())
            return indexStatus;
    }
    return Status::OK();
}

Status RetryableExecutor::_applyOpsBatch(const std::vector<BSONObj>& entries,
                                         bool bypassDocumentValidation,
                                         ApplyOpsResponse* response) {
    auto swCmd = makeApplyOpsCommand(entries, bypassDocumentValidation);
    if (!swCmd.isOK())
        return swCmd.getStatus();

    BSONObj reply;
    Status status =
        _runCommand(kAdminDb, WriteConcernOptions::majority().attachTo(swCmd.getValue()), &reply);
    if (status.isOK())
        status = getWriteConcernStatusFromCommandResult(reply);

    // The reply says more than the status: its "results" tell which operation failed.
    ApplyOpsResponse parsed = ApplyOpsResponse::parse(reply);
    if (response && (status.isOK() || !parsed.errmsg.empty()))
        *response = std::move(parsed);
    return status;
}

Status RetryableExecutor::applyOps(const std::vector<BSONObj>& entries,
                                   std::size_t bytes,
                                   bool bypassDocumentValidation,
                                   ApplyOpsResponse* response) {
    ApplyOpsResponse lastResponse;
    Status status = runRetryable([&](bool isRetry) {
        lastResponse = ApplyOpsResponse();
        const Date_t start = _clockSource->now();
        Status attemptStatus = _applyOpsBatch(entries, bypassDocumentValidation, &lastResponse);
        const Milliseconds elapsed = _clockSource->now() - start;

        if (attemptStatus.isOK()) {
            LOGV2_DEBUG(8104026,
                        1,
                        "applyOps succeeded",
                        "isRetry"_attr = isRetry,
                        "numOps"_attr = entries.size(),
                        "bytes"_attr = bytes,
                        "duration"_attr = elapsed);
        } else {
            LOGV2(8104027,
                  "applyOps failed",
                  "isRetry"_attr = isRetry,
                  "numOps"_attr = entries.size(),
                  "bytes"_attr = bytes,
                  "duration"_attr = elapsed,
                  "error"_attr = attemptStatus,
                  "response"_attr = lastResponse.errmsg.empty() ? BSONObj() : lastResponse.toBSON());
        }
        return attemptStatus;
    });

    if (response)
        *response = std::move(lastResponse);
    return status;
}

StatusWith<boost::optional<CollectionInfo>> RetryableExecutor::collectionInfo(
    const NamespaceString& nss) {
    boost::optional<CollectionInfo> info;
    const BSONObj cmd = BSON("listCollections" << 1 << "filter" << BSON("name" << nss.coll()));
    Status status = runRetryable([&](bool isRetry) {
        info = boost::none;
        BSONObj reply;
        Status attemptStatus = _runCommand(nss.db(), cmd, &reply);
        if (!attemptStatus.isOK())
            return attemptStatus;

        BSONElement firstBatch = reply.getObjectField("cursor")["firstBatch"];
        if (firstBatch.type() != BSONType::array) {
            return Status(ErrorCodes::FailedToParse,
                          str::stream() << "listCollections reply has no cursor.firstBatch: "
                                        << reply.toString());
        }
        for (const auto& entry : firstBatch.Obj()) {
            if (entry.type() != BSONType::object)
                continue;
            auto swInfo = CollectionInfo::parse(entry.embeddedObject());
            if (!swInfo.isOK())
                return swInfo.getStatus();
            info = std::move(swInfo.getValue());
            break;
        }
        return Status::OK();
    });
    if (!status.isOK())
        return status;
    return info;
}

Status RetryableExecutor::waitForWriteConcernMajority() {
    return _applyOpsBatch({makeNoopOplogEntry()}, true, nullptr);
}

}  // namespace oplogmirror

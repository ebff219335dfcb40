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
#include <functional>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "oplogmirror/base/status.h"
#include "oplogmirror/base/status_with.h"
#include "oplogmirror/bson/bsonobj.h"
#include "oplogmirror/client/apply_ops.h"
#include "oplogmirror/client/build_info.h"
#include "oplogmirror/client/collection_info.h"
#include "oplogmirror/client/retry_options.h"
#include "oplogmirror/db/namespace_string.h"
#include "oplogmirror/db/write_concern_options.h"
#include "oplogmirror/util/time_support.h"
#include "oplogmirror/util/uuid.h"

namespace oplogmirror {

class ClockSource;
class CommandRunner;

/**
 * Runs commands against the destination and retries them across failovers and transient
 * network failures.
 *
 * A failed attempt is classified with isReconnectableError(). Reconnectable failures recover
 * the session, which waits until a majority write succeeds on the destination, and then make
 * another attempt. The attempt is told it is a retry, because an earlier attempt may have
 * taken effect before its reply was lost: a create that finds the collection already there,
 * or a drop that finds it gone, counts as success only on a retry.
 *
 * All retry state is local to a call, so one executor may be used from several threads as long
 * as its CommandRunner allows that.
 */
class RetryableExecutor {
public:
    /**
     * One attempt of a retryable operation. 'isRetry' is false only on the first attempt.
     */
    using Attempt = std::function<Status(bool isRetry)>;

    RetryableExecutor(CommandRunner* runner,
                      BuildInfo destinationInfo,
                      RetryOptions options = RetryOptions(),
                      WriteConcernOptions writeConcern = WriteConcernOptions::majority(),
                      ClockSource* clockSource = nullptr);

    RetryableExecutor(const RetryableExecutor&) = delete;
    RetryableExecutor& operator=(const RetryableExecutor&) = delete;

    /**
     * Runs 'attempt' until it succeeds, fails with an error that is not reconnectable, or the
     * retry floors are exhausted. In the last case the last error is returned, code intact,
     * with the number of attempts and the time they took added as context.
     */
    Status runRetryable(const Attempt& attempt);

    /**
     * Waits for the destination to come back after a reconnectable failure. Each probe is
     * preceded by a sleep; writeable destinations are probed with a majority no-op applyOps,
     * others with isMaster. 'start' is when the owning retry loop started.
     */
    Status recoverSession(Date_t start, bool writeable);

    /**
     * Runs 'cmd' once, logging it and how long it took. Write concern errors in the reply are
     * returned as errors. 'reply', when given, receives the reply even on failure.
     */
    Status runCommandWithLog(StringData dbName, const BSONObj& cmd, BSONObj* reply = nullptr);

    /**
     * Ordered insert of 'docs'. After a duplicate key error the documents are inserted one at
     * a time until one is new, then batch insertion resumes after it, so a batch that partially
     * landed before a failover is completed without duplicates.
     */
    Status insertMany(const NamespaceString& nss,
                      const std::vector<BSONObj>& docs,
                      bool bypassDocumentValidation);

    /**
     * Runs a create command, e.g. {create: "coll", capped: true}, on 'dbName'.
     */
    Status create(StringData dbName, const BSONObj& createCmd);

    /**
     * Runs a renameCollection command on the admin database.
     */
    Status renameCollection(const BSONObj& renameCmd);

    /**
     * Drops 'nss'. system.js collections cannot be dropped directly and go through
     * renameAndDrop().
     */
    Status drop(const NamespaceString& nss);

    /**
     * Renames 'nss' to its drop pending name, then drops that.
     */
    Status renameAndDrop(const NamespaceString& nss);

    Status dropDatabase(StringData dbName);

    /**
     * Runs a collMod command. Destinations older than 3.6 do not take a write concern on
     * collMod and wait for a majority no-op instead.
     */
    Status collMod(StringData dbName, const BSONObj& collModCmd);

    /**
     * Builds 'indexes' on 'nss' with one createIndexes command, after fixOutgoingIndexSpec().
     */
    Status createIndexes(const NamespaceString& nss, const std::vector<BSONObj>& indexes);

    /**
     * Builds one index through applyOps: a createIndexes command entry when the collection has
     * a UUID, an insert into <db>.system.indexes otherwise.
     */
    Status applyOpsCreateIndex(const NamespaceString& nss,
                               const BSONObj& index,
                               const boost::optional<UUID>& uuid,
                               ApplyOpsResponse* response = nullptr);

    /**
     * createIndexes(), falling back to applyOpsCreateIndex() for each index when the
     * destination rejects the specs as invalid.
     */
    Status createIndexesWithFallback(const NamespaceString& nss,
                                     const std::vector<BSONObj>& indexes,
                                     const boost::optional<UUID>& uuid);

    /**
     * Applies a batch of oplog entries. 'bytes' is the size of the batch, for logging.
     * 'response' receives the applyOps reply, including after a failure, so the caller can
     * find the operation that failed.
     */
    Status applyOps(const std::vector<BSONObj>& entries,
                    std::size_t bytes,
                    bool bypassDocumentValidation,
                    ApplyOpsResponse* response = nullptr);

    /**
     * Runs listCollections for 'nss'. Returns none when the collection does not exist.
     */
    StatusWith<boost::optional<CollectionInfo>> collectionInfo(const NamespaceString& nss);

    /**
     * Applies a no-op with majority write concern, so every write that came before it is
     * majority committed once it returns.
     */
    Status waitForWriteConcernMajority();

    const BuildInfo& getDestinationInfo() const {
        return _destinationInfo;
    }

    const RetryOptions& getRetryOptions() const {
        return _options;
    }

private:
    /**
     * Runs 'cmd' and turns both exceptions and error replies into a Status. Does not check the
     * write concern.
     */
    Status _runCommand(StringData dbName, const BSONObj& cmd, BSONObj* reply);

    Status _runInsert(const NamespaceString& nss,
                      const std::vector<BSONObj>& docs,
                      std::size_t begin,
                      std::size_t end,
                      bool bypassDocumentValidation);

    Status _applyOpsBatch(const std::vector<BSONObj>& entries,
                          bool bypassDocumentValidation,
                          ApplyOpsResponse* response);

    bool _retryFloorsLeft(int attempts, int attemptsLowerBound, Date_t start);

    CommandRunner* const _runner;
    const BuildInfo _destinationInfo;
    const RetryOptions _options;
    const WriteConcernOptions _writeConcern;
    ClockSource* const _clockSource;
};

}  // namespace oplogmirror

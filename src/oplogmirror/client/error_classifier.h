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

#include "oplogmirror/base/status.h"

namespace oplogmirror {

/**
 * Error classification for statuses returned by commands run against a server.
 *
 * A command can fail in several shapes: a plain status carrying the server's error code, a
 * single write error (also a plain status), a BulkWriteError status whose BulkWriteErrorInfo
 * lists the write errors and an optional write concern error, a WriteConcernError status, or
 * an UnknownError status for replies that carried no code at all. The functions below look
 * through these shapes so callers only deal with what an error means.
 */

/**
 * Returns the server error code behind 'status': the code of a plain status, the first write
 * error of a bulk write error (or its write concern error when there are none), the inner code
 * of a write concern error. Returns 0 for OK and for errors without a code.
 */
int getErrorCode(const Status& status);

/**
 * True when the failed operation may succeed if run again after re-establishing contact with
 * the primary: every write concern error, errors a server returns while stepping down, shutting
 * down or losing its primary, network errors, and code-less "not master" replies.
 */
bool isReconnectableError(const Status& status);

/**
 * True for errors of the transport rather than of the command: unreachable or unknown hosts,
 * timeouts, socket errors and connections closed under the client.
 */
bool isNetworkError(const Status& status);

/**
 * True when the destination cannot currently take commands: network errors, and servers that
 * are not primary or are shutting down.
 */
bool isConnectionError(const Status& status);

/** DuplicateKey (11000, 11001 or 12582), either as the command error or in any write error. */
bool isDuplicateKeyError(const Status& status);

/** NamespaceNotFound (26). */
bool isNamespaceNotFoundError(const Status& status);

/** NamespaceExists (48). */
bool isNamespaceExistsError(const Status& status);

/** InvalidIndexSpecificationOption (197). */
bool isInvalidIndexSpecificationOptionError(const Status& status);

/** CannotCreateIndex (67). */
bool isCannotCreateIndexError(const Status& status);

/** CommandNotFound (59 or the legacy 13390), or a "no such cmd" message. */
bool isCommandNotFoundError(const Status& status);

/** Unauthorized (13). */
bool isUnauthorizedError(const Status& status);

/** CursorNotFound (43), or a "cursor not found" message. */
bool isCursorNotFoundError(const Status& status);

/** CommandNotSupportedOnView (166). */
bool isViewError(const Status& status);

/** InvalidOptions (72). */
bool isInvalidOptionsError(const Status& status);

/** A query hint naming an index that does not exist, as reported by old and new servers. */
bool isBadHintError(const Status& status);

}  // namespace oplogmirror

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

namespace oplogmirror {

/**
 * Use BSON macro to build a BSONObj from a stream
 *
 * e.g.,
 *   BSON("op" << "c" << "ns" << "admin.$cmd" << "txnNumber" << 2LL)
 *
 * For nested objects, use a nested BSON() call, and for arrays BSON_ARRAY():
 *   BSON("o" << BSON("applyOps" << BSON_ARRAY(op1 << op2)))
 */
#define BSON(x) ((::oplogmirror::BSONObjBuilder(64) << x).obj())

/**
 * Use BSON_ARRAY macro like BSON macro, but without keys
 *
 * BSONArray arr = BSON_ARRAY( "hello" << 1 << BSON( "foo" << BSON_ARRAY( "bar" << "baz" ) ) );
 */
#define BSON_ARRAY(x) ((::oplogmirror::BSONArrayBuilder() << x).arr())

/* Utility class to add a Null element to a BSON object:
   BSON("a" << BSONNULL) gives {a: null}
*/
struct NullLabeler {};
extern const NullLabeler BSONNULL;

struct UndefinedLabeler {};
extern const UndefinedLabeler BSONUndefined;

/* Utility classes to add the minimum and maximum key elements:
   BSON("a" << MINKEY) gives {a: {$minKey: 1}}
*/
struct MinKeyLabeler {};
extern const MinKeyLabeler MINKEY;

struct MaxKeyLabeler {};
extern const MaxKeyLabeler MAXKEY;

}  // namespace oplogmirror

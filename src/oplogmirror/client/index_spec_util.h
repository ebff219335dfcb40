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

#include "oplogmirror/base/string_data.h"
#include "oplogmirror/bson/bsonobj.h"

namespace oplogmirror {

/**
 * Prepares an index spec read from the source for a createIndexes command on the destination:
 * drops the "background" option and adds the index version when it is missing.
 */
BSONObj fixOutgoingIndexSpec(const BSONObj& spec);

/**
 * Oplog entries written before 3.4 do not carry the index version field "v". Returns 'spec'
 * with "v: 1" appended in that case, 'spec' itself otherwise.
 */
BSONObj appendV1IfMissing(const BSONObj& spec);

/**
 * Rewrites an index key pattern accepted before 3.4 into one that 3.4 and later accept. Older
 * servers read any value that is not a negative number or a string as 1, so zero, the empty
 * string and values of any other type all become 1. Other strings, e.g. "2dsphere", are left
 * alone. Decimal zeros other than exactly 0 (such as 0.00) are not converted.
 *
 * Conversions are logged together with 'ns'.
 */
BSONObj convertLegacyIndexKeys(const BSONObj& keyPattern, StringData ns);

/**
 * Compares two index key patterns. Field names and their order must match. Numbers and numeric
 * strings compare by value, so {a: 1} equals {a: 1.0} and {a: "1"}; anything else must be
 * identical.
 */
bool isIndexKeysEqual(const BSONObj& lhs, const BSONObj& rhs);

}  // namespace oplogmirror

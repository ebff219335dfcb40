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

#include <iosfwd>
#include <string>

#include "oplogmirror/base/string_data.h"

namespace oplogmirror {

/**
 * A full namespace, "<db>.<collection>". Command entries in the oplog use the pseudo
 * collection "$cmd", so "test.$cmd" is the namespace of a command run against "test".
 */
class NamespaceString {
public:
    static constexpr StringData kAdminDb = "admin"_sd;
    static constexpr StringData kCommandCollection = "$cmd"_sd;
    static constexpr StringData kSystemJsCollection = "system.js"_sd;
    static constexpr StringData kSystemIndexesCollection = "system.indexes"_sd;

    /** Prefix given to a collection renamed out of the way before it is dropped. */
    static constexpr StringData kDropPendingPrefix = "_oplogmirror_drop_pending_"_sd;

    NamespaceString() = default;

    /** Constructs from a full namespace string, e.g. "test.coll". */
    explicit NamespaceString(StringData ns);

    NamespaceString(StringData db, StringData coll);

    /** The command namespace "<db>.$cmd" of database 'db'. */
    static NamespaceString makeCommandNamespace(StringData db) {
        return NamespaceString(db, kCommandCollection);
    }

    StringData db() const {
        return _dotIndex == std::string::npos ? StringData(_ns)
                                              : StringData(_ns).substr(0, _dotIndex);
    }

    StringData coll() const {
        return _dotIndex == std::string::npos ? StringData()
                                              : StringData(_ns).substr(_dotIndex + 1);
    }

    const std::string& ns() const {
        return _ns;
    }

    const std::string& toString() const {
        return _ns;
    }

    bool isEmpty() const {
        return _ns.empty();
    }

    /** True for "<db>.$cmd". */
    bool isCommand() const {
        return coll() == kCommandCollection;
    }

    bool isSystemDotJavascript() const {
        return coll() == kSystemJsCollection;
    }

    bool isSystemDotIndexes() const {
        return coll() == kSystemIndexesCollection;
    }

    bool isSystem() const {
        return coll().startsWith("system.");
    }

    /** True when both the database and collection parts are non-empty. */
    bool isValid() const;

    /**
     * The namespace the collection is renamed to before it is dropped, in the same database.
     */
    NamespaceString makeDropPendingNamespace() const;

    bool operator==(const NamespaceString& other) const {
        return _ns == other._ns;
    }

    bool operator!=(const NamespaceString& other) const {
        return _ns != other._ns;
    }

    bool operator<(const NamespaceString& other) const {
        return _ns < other._ns;
    }

private:
    std::string _ns;
    size_t _dotIndex = std::string::npos;
};

std::ostream& operator<<(std::ostream& stream, const NamespaceString& nss);

}  // namespace oplogmirror

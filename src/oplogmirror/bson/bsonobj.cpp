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

#include "oplogmirror/bson/bsonobj.h"

#include <ostream>

#include <boost/container_hash/hash.hpp>

#include "oplogmirror/bson/bsonobjbuilder.h"

namespace oplogmirror {

const char BSONObj::kEmptyObjectPrototype[] = {5, 0, 0, 0, 0};

BSONObj BSONObj::copyOf(const char* data, int size) {
    BufBuilder b(size);
    b.appendBuf(data, size);
    auto buffer = b.release();
    const char* start = buffer.get();
    return BSONObj(std::move(buffer), start);
}

BSONObj BSONObj::getOwned() const {
    if (isOwned())
        return *this;
    return copy();
}

BSONObj BSONObj::copy() const {
    return copyOf(objdata(), objsize());
}

int BSONObj::nFields() const {
    int n = 0;
    BSONObjIterator i(*this);
    while (i.more()) {
        i.next();
        n++;
    }
    return n;
}

BSONElement BSONObj::getField(StringData name) const {
    BSONObjIterator i(*this);
    while (i.more()) {
        BSONElement e = i.next();
        if (name == e.fieldNameStringData())
            return e;
    }
    return BSONElement();
}

BSONObj BSONObj::getObjectField(StringData name) const {
    BSONElement e = getField(name);
    return e.type() == BSONType::object ? e.embeddedObject() : BSONObj();
}

StringData BSONObj::getStringField(StringData name) const {
    return getField(name).valueStringDataSafe();
}

int BSONObj::getIntField(StringData name) const {
    BSONElement e = getField(name);
    return e.isNumber() ? e.numberInt() : 0;
}

bool BSONObj::getBoolField(StringData name) const {
    return getField(name).trueValue();
}

BSONObj BSONObj::removeField(StringData name) const {
    BSONObjBuilder b(objsize());
    for (auto&& e : *this) {
        if (e.fieldNameStringData() != name)
            b.append(e);
    }
    return b.obj();
}

BSONObj BSONObj::addField(const BSONElement& field) const {
    const StringData name = field.fieldNameStringData();
    BSONObjBuilder b(objsize() + field.size());
    bool added = false;
    for (auto&& e : *this) {
        if (e.fieldNameStringData() == name) {
            if (!added)
                b.append(field);
            added = true;
        } else {
            b.append(e);
        }
    }
    if (!added)
        b.append(field);
    return b.obj();
}

std::vector<std::string> BSONObj::getFieldNames() const {
    std::vector<std::string> names;
    for (auto&& e : *this)
        names.push_back(e.fieldName());
    return names;
}

std::size_t BSONObj::hash() const {
    return boost::hash_range(objdata(), objdata() + objsize());
}

BSONObj::iterator BSONObj::begin() const {
    return iterator(objdata() + 4, objdata() + objsize() - 1);
}

BSONObj::iterator BSONObj::end() const {
    const char* theEnd = objdata() + objsize() - 1;
    return iterator(theEnd, theEnd);
}

std::ostream& operator<<(std::ostream& s, const BSONObj& o) {
    return s << o.jsonString();
}

}  // namespace oplogmirror

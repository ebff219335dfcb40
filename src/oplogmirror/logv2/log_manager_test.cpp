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

#define OPLOGMIRROR_LOGV2_DEFAULT_COMPONENT ::oplogmirror::logv2::LogComponent::kDefault

#include "oplogmirror/logv2/log_manager.h"

#include "oplogmirror/logv2/log.h"
#include "oplogmirror/unittest/unittest.h"

namespace oplogmirror {
namespace {

TEST(LogManagerTest, CapturedLinesOutliveStopCapture) {
    unittest::startCapturingLogMessages();
    LOGV2(8100901, "First captured line", "n"_attr = 1);
    unittest::stopCapturingLogMessages();

    LOGV2(8100902, "Logged after capture stopped");

    ASSERT_EQUALS(1, unittest::countTextFormatLogLinesContaining("First captured line"));
    ASSERT_EQUALS(0, unittest::countTextFormatLogLinesContaining("after capture stopped"));
}

TEST(LogManagerTest, StartCaptureDropsEarlierLines) {
    unittest::startCapturingLogMessages();
    LOGV2(8100903, "Line from the first capture");
    unittest::stopCapturingLogMessages();

    unittest::startCapturingLogMessages();
    LOGV2(8100904, "Line from the second capture");
    unittest::stopCapturingLogMessages();

    ASSERT_EQUALS(0, unittest::countTextFormatLogLinesContaining("first capture"));
    ASSERT_EQUALS(1, unittest::countTextFormatLogLinesContaining("second capture"));
}

TEST(LogManagerTest, CaptureFollowsComponentSeverity) {
    auto& manager = logv2::LogManager::global();
    const auto saved = manager.getMinimumLogSeverity(logv2::LogComponent::kDefault);

    manager.setVerbosity(0);
    unittest::startCapturingLogMessages();
    LOGV2_DEBUG(8100905, 2, "Debug line while quiet");
    manager.setVerbosity(2);
    LOGV2_DEBUG(8100906, 2, "Debug line while verbose");
    unittest::stopCapturingLogMessages();
    manager.setMinimumLoggedSeverity(logv2::LogComponent::kDefault, saved);

    ASSERT_EQUALS(0, unittest::countTextFormatLogLinesContaining("while quiet"));
    ASSERT_EQUALS(1, unittest::countTextFormatLogLinesContaining("while verbose"));
}

}  // namespace
}  // namespace oplogmirror

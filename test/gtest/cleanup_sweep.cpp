/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "mocks/fake_object_store.h"
#include "mocks/gmock_object_store.h"
#include "objup_sweep.h"

namespace gtest {
namespace cleanup_sweep {

using ::testing::_;
using ::testing::Return;
using Op = mocks::FakeObjectStore::Op;
using std::chrono::milliseconds;

class CleanupSweepTest : public ::testing::Test {
protected:
    std::string
    startUpload(const std::string &key, int64_t now_ms, uint32_t parts) {
        store_.setNowMs(now_ms);
        std::string upload_id;
        EXPECT_EQ(store_.initiateMultipartUpload(key, {}, upload_id), OBJUP_SUCCESS);
        const std::string body(100, 'x');
        for (uint32_t part = 1; part <= parts; ++part) {
            std::string etag;
            EXPECT_EQ(store_.uploadPart({key, upload_id}, part, body, etag), OBJUP_SUCCESS);
        }
        return upload_id;
    }

    mocks::FakeObjectStore store_;
};

TEST_F(CleanupSweepTest, AbortsStaleUploadsUnderPrefix) {
    startUpload("logs/old-1", 1000, 2);
    startUpload("logs/old-2", 2000, 1);
    startUpload("logs/fresh", 9000, 3);
    startUpload("other/old", 1000, 1);

    objupSweepReport report;
    ASSERT_EQ(objupSweepIncompleteUploads(store_, "logs/", milliseconds(5000), report, 10000),
              OBJUP_SUCCESS);

    ASSERT_EQ(report.aborted.size(), 2u);
    std::vector<std::string> keys;
    for (const auto &upload : report.aborted) {
        keys.push_back(upload.key);
    }
    EXPECT_THAT(keys, ::testing::UnorderedElementsAre("logs/old-1", "logs/old-2"));
    EXPECT_TRUE(report.failed.empty());
    EXPECT_EQ(report.skipped, 1u);
    EXPECT_EQ(report.partsDropped, 3u);
    EXPECT_EQ(report.bytesDropped, 300u);

    // The fresh upload and the one outside the prefix remain
    EXPECT_EQ(store_.getPendingUploads(), 2u);
}

TEST_F(CleanupSweepTest, ZeroAgeSweepsEverything) {
    startUpload("a", 500, 1);
    startUpload("b", 600, 0);

    objupSweepReport report;
    ASSERT_EQ(objupSweepIncompleteUploads(store_, "", milliseconds(0), report, 600),
              OBJUP_SUCCESS);
    EXPECT_EQ(report.aborted.size(), 2u);
    EXPECT_EQ(store_.getPendingUploads(), 0u);
}

TEST_F(CleanupSweepTest, FailedAbortReported) {
    startUpload("stuck", 1000, 4);
    store_.failNext(Op::ABORT, OBJUP_ERR_REMOTE_PERMANENT);

    objupSweepReport report;
    EXPECT_EQ(objupSweepIncompleteUploads(store_, "", milliseconds(10), report, 5000),
              OBJUP_ERR_ABORT_INCOMPLETE);
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].key, "stuck");
    EXPECT_TRUE(report.aborted.empty());
    // Parts of an upload that is still there are not counted as dropped
    EXPECT_EQ(report.partsDropped, 0u);
    EXPECT_EQ(store_.getPendingUploads(), 1u);
}

TEST_F(CleanupSweepTest, NegativeAgeRejected) {
    objupSweepReport report;
    EXPECT_EQ(objupSweepIncompleteUploads(store_, "", milliseconds(-1), report),
              OBJUP_ERR_INVALID_PARAM);
    EXPECT_EQ(store_.getCalls(Op::LIST_UPLOADS), 0u);
}

TEST(CleanupSweep, ListingFailure) {
    ::testing::StrictMock<mocks::GMockObjectStore> store;
    EXPECT_CALL(store, listMultipartUploads("prefix", _))
        .WillOnce(Return(OBJUP_ERR_REMOTE_TRANSIENT));

    objupSweepReport report;
    EXPECT_EQ(objupSweepIncompleteUploads(store, "prefix", milliseconds(1000), report),
              OBJUP_ERR_REMOTE_TRANSIENT);
    EXPECT_TRUE(report.aborted.empty());
}

} // namespace cleanup_sweep
} // namespace gtest

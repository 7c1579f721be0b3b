/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include "AsyncOperations/AsyncOperationManager.h"
#include "AsyncOperations/OperationBuilder.h"
#include "TestHelpers/ShelfTestHelpers.h"

using namespace Shelf::Core::Async;
using namespace std::chrono_literals;
using shelf::test_helpers::ControlledBackend;
using shelf::test_helpers::ScopedAsyncEnv;
using shelf::test_helpers::ScopedTempDir;
using shelf::test_helpers::writeFile;

TEST(OperationBuilder, CollectsOperationsInOrder) {
    OperationBuilder builder;
    builder.checkPathExists("/a")
        .getFileInfo("/b")
        .copy("/c", "/d")
        .movePath("/e", "/f")
        .add(Operation::getFileSize("/g"));

    ASSERT_EQ(builder.size(), 5u);
    EXPECT_EQ(builder.operations()[0].kind(), OperationKind::PathExists);
    EXPECT_EQ(builder.operations()[1].kind(), OperationKind::GetFileInfo);
    EXPECT_EQ(builder.operations()[2].kind(), OperationKind::Copy);
    EXPECT_EQ(builder.operations()[3].kind(), OperationKind::Move);
    EXPECT_EQ(builder.operations()[4].kind(), OperationKind::GetFileSize);
    EXPECT_FALSE(builder.timeout().has_value());

    builder.withTimeout(750ms);
    ASSERT_TRUE(builder.timeout().has_value());
    EXPECT_EQ(*builder.timeout(), 750ms);
}

TEST(OperationBuilder, BuildSingleRequiresExactlyOneOperation) {
    ScopedAsyncEnv env(1);
    OperationBuilder empty;
    EXPECT_THROW(empty.buildSingle(env.manager()), std::logic_error);

    OperationBuilder two;
    two.checkPathExists("/").checkPathExists("/");
    EXPECT_THROW(two.buildSingle(env.manager()), std::logic_error);

    OperationBuilder one;
    one.checkPathExists("/");
    EXPECT_EQ(one.buildSingle(env.manager()).wait(), OperationResult::success(true));
}

TEST(OperationBuilder, BuildBatchRunsEverythingAsOneTask) {
    ScopedTempDir tmp;
    writeFile(tmp.join("a.txt"), "hello");
    ScopedAsyncEnv env(2);

    OperationBuilder builder;
    builder.createDirectory(tmp.join("sub").string())
        .getFileSize(tmp.join("a.txt").string())
        .readDirectory(tmp.path().string());
    auto r = builder.buildBatch(env.manager()).wait();

    ASSERT_TRUE(r.isSuccess());
    const auto* items = r.asBatch();
    ASSERT_NE(items, nullptr);
    ASSERT_EQ(items->size(), 3u);
    EXPECT_TRUE((*items)[0].isSuccess());
    ASSERT_NE((*items)[1].asSize(), nullptr);
    EXPECT_EQ(*(*items)[1].asSize(), 5u);
    ASSERT_NE((*items)[2].asEntries(), nullptr);
    EXPECT_EQ((*items)[2].asEntries()->size(), 2u);

    OperationBuilder none;
    EXPECT_THROW(none.buildBatch(env.manager()), std::logic_error);
}

TEST(OperationBuilder, TimeoutAppliesToBuiltTask) {
    ScopedTempDir tmp;
    auto backend = std::make_shared<ControlledBackend>();
    backend->setDelay(400ms);
    ScopedAsyncEnv env(1, backend);

    OperationBuilder builder;
    builder.withTimeout(50ms).checkPathExists(tmp.path().string()).deletePath(tmp.join("x").string());
    EXPECT_TRUE(builder.buildBatch(env.manager()).wait().isTimeout());
}

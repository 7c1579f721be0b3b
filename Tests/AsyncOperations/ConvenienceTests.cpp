/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include "AsyncOperations/AsyncOperationManager.h"
#include "AsyncOperations/Convenience.h"
#include "TestHelpers/ShelfTestHelpers.h"

namespace Async = Shelf::Core::Async;
namespace IO = Shelf::Core::IO;
using namespace std::chrono_literals;
using shelf::test_helpers::ControlledBackend;
using shelf::test_helpers::ScopedAsyncEnv;
using shelf::test_helpers::ScopedTempDir;
using shelf::test_helpers::writeFile;
namespace fs = std::filesystem;

TEST(Convenience, BoolHelpersFollowTheDisk) {
    ScopedTempDir tmp;
    writeFile(tmp.join("a.txt"), "abc");
    ScopedAsyncEnv env(2);
    auto& mgr = env.manager();
    const auto file = tmp.join("a.txt").string();
    const auto dir = tmp.join("dir").string();

    EXPECT_TRUE(Async::pathExists(mgr, file));
    EXPECT_FALSE(Async::pathExists(mgr, tmp.join("missing").string()));
    EXPECT_TRUE(Async::isFile(mgr, file));
    EXPECT_FALSE(Async::isDirectory(mgr, file));

    EXPECT_TRUE(Async::createDirectory(mgr, dir));
    EXPECT_TRUE(Async::isDirectory(mgr, dir));
    EXPECT_TRUE(Async::copy(mgr, file, tmp.join("dir/b.txt").string()));
    EXPECT_TRUE(Async::movePath(mgr, tmp.join("dir/b.txt").string(), tmp.join("c.txt").string()));
    EXPECT_TRUE(fs::exists(tmp.join("c.txt")));
    EXPECT_FALSE(fs::exists(tmp.join("dir/b.txt")));
    EXPECT_TRUE(Async::deletePath(mgr, dir));
    EXPECT_FALSE(Async::deletePath(mgr, dir));
}

TEST(Convenience, ValueHelpersReturnValuesOrErrors) {
    ScopedTempDir tmp;
    writeFile(tmp.join("b.txt"), "1234567");
    writeFile(tmp.join("a.txt"), "1");
    ScopedAsyncEnv env(2);
    auto& mgr = env.manager();

    auto size = Async::getFileSize(mgr, tmp.join("b.txt").string());
    ASSERT_TRUE(size.ok());
    EXPECT_EQ(size.value(), 7u);

    auto info = Async::getFileInfo(mgr, tmp.join("b.txt").string());
    ASSERT_TRUE(info.ok());
    EXPECT_EQ(info.value().name, "b.txt");
    ASSERT_TRUE(info.value().extension.has_value());
    EXPECT_EQ(*info.value().extension, "txt");

    EXPECT_TRUE(Async::getModifiedTime(mgr, tmp.join("b.txt").string()).ok());

    auto names = Async::quickReadDir(mgr, tmp.path().string());
    ASSERT_TRUE(names.ok());
    EXPECT_EQ(names.value(), (std::vector<std::string>{"a.txt", "b.txt"}));

    auto missing = Async::getFileSize(mgr, tmp.join("nope").string());
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code, IO::FileError::FileNotFound);
}

TEST(Convenience, TimeoutSurfacesAsFailure) {
    ScopedTempDir tmp;
    auto backend = std::make_shared<ControlledBackend>();
    backend->setDelay(400ms);
    ScopedAsyncEnv env(1, backend);

    EXPECT_FALSE(Async::pathExists(env.manager(), tmp.path().string(), 30ms));

    auto size = Async::getFileSize(env.manager(), tmp.path().string(), 30ms);
    ASSERT_FALSE(size.ok());
    EXPECT_EQ(size.error().code, IO::FileError::Unknown);
    EXPECT_EQ(size.error().message, "Operation timed out");
}

TEST(Convenience, ToFileErrorMapsEachKind) {
    auto err = Async::toFileError(Async::OperationResult::error("denied", IO::FileError::AccessDenied));
    EXPECT_EQ(err.code, IO::FileError::AccessDenied);
    EXPECT_EQ(err.message, "denied");

    auto cancelled = Async::toFileError(Async::OperationResult::cancelled());
    EXPECT_EQ(cancelled.code, IO::FileError::Unknown);
    EXPECT_EQ(cancelled.message, "Operation was cancelled");
}

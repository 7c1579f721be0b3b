/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Shelf Core project.
 */

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

#include "ShelfCore.h"

using namespace Shelf::Core;
using namespace Shelf::Core::Async;
using namespace std::chrono_literals;

int main() {
    // Scratch area under the temp directory
    const auto root = std::filesystem::temp_directory_path() / "shelf_async_example";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);
    {
        std::ofstream(root / "report.pdf") << "not really a pdf";
    }

    AsyncOperationManager manager(AsyncOperationManager::Config::fromEnvironment());
    manager.start();

    // Single operation, polled like a UI frame loop would
    auto listing = manager.submit(Operation::readDirectory(root.string()), 2s);
    while (!listing.poll()) {
        std::this_thread::sleep_for(1ms);
    }
    auto entries = *listing.poll();
    if (const auto* list = entries.asEntries()) {
        for (const auto& info : *list) {
            SHELF_LOG_INFO(info.name + " (" + std::to_string(info.size) + " bytes)");
        }
    }

    // Batch: copy then inspect; items run in order on one worker
    OperationBuilder builder;
    builder.withTimeout(5s)
        .createDirectory((root / "archive").string())
        .copy((root / "report.pdf").string(), (root / "archive/report.pdf").string())
        .getFileSize((root / "archive/report.pdf").string())
        .deletePath((root / "missing.txt").string());
    auto batch = builder.buildBatch(manager).wait();
    SHELF_LOG_INFO("Batch: " + batch.toString());

    // Blocking helpers for one-off checks
    if (isDirectory(manager, (root / "archive").string())) {
        auto size = getFileSize(manager, (root / "archive/report.pdf").string());
        if (size) {
            SHELF_LOG_INFO("Archived copy is " + std::to_string(size.value()) + " bytes");
        } else {
            SHELF_LOG_ERROR("Size lookup failed: " + size.error().describe());
        }
    }

    // Cancellation of a queued delete
    auto del = manager.submit(Operation::deletePath(root.string()));
    auto outcome = del.cancel();
    SHELF_LOG_INFO(std::string("Cancel outcome: ") + toString(outcome) + ", result: " + del.wait().toString());

    manager.stop();
    std::filesystem::remove_all(root);
    return 0;
}

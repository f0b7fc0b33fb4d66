/*
 * bootq - Bootstrap queue inspection tool (bqstat)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "bootq/database.hpp"
#include "bootq/file_database.hpp"
#include "bootq/logger.hpp"
#include "bootq/missing_set.hpp"
#include "bootq/pending_counter.hpp"
#include "bootq/prefix_database.hpp"
#include "bootq/runnable_queue.hpp"
#include "bootq/scheduler.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

using namespace bootq;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "bootq Queue Inspection Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> [options]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory holding the bootstrap queue\n\n";
    std::cout << "Options:\n";
    std::cout << "  --runnable    List every runnable job ID in queue order\n";
    std::cout << "  --missing     List every missing job ID\n";
    std::cout << "  -h, --help    Show this help\n";
    std::cout << "  -v, --version Show version\n\n";
    std::cout << "The workspace is opened read-only: a committed batch left by a\n";
    std::cout << "crash is reported, not replayed.\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  BOOTQ_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./chaindata\n";
    std::cout << "  " << progName << " ./chaindata --runnable --missing\n";
}

int main(int argc, char* argv[]) {
    if (!std::getenv("BOOTQ_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);
    setThreadName("Main");

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace;
    bool listRunnable = false;
    bool listMissing = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        } else if (arg == "--runnable") {
            listRunnable = true;
        } else if (arg == "--missing") {
            listMissing = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        } else if (workspace.empty()) {
            workspace = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    if (workspace.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    if (!FileDatabase::isWorkspace(workspace)) {
        std::cerr << "Not a bootq workspace: " << workspace << std::endl;
        return 1;
    }

    try {
        FileDatabase db(workspace, FileDatabase::OpenMode::ReadOnly);
        PrefixDatabase runnableDb(layout::kRunnable, db);
        PrefixDatabase jobsDb(layout::kJobs, db);
        PrefixDatabase missingDb(layout::kMissingJobIds, db);
        PrefixDatabase pendingDb(layout::kPendingJobs, db);

        if (db.journalPending()) {
            std::cout << "Journal:        committed batch pending replay, counts may be stale\n";
        }

        // Pending count: the checkpoint when present, otherwise a scan that
        // is reported but not persisted.
        PendingCounter counter(pendingDb);
        CountResult pending = counter.load();
        if (pending) {
            std::cout << "Pending jobs:   " << pending.value << "\n";
        } else if (pending.error == ErrorCode::NotFound) {
            CountResult scanned = countEntries(jobsDb);
            if (!scanned) {
                std::cerr << "Failed to count jobs: " << scanned.message << std::endl;
                return 1;
            }
            std::cout << "Pending jobs:   " << scanned.value << " (scanned, no checkpoint)\n";
        } else {
            std::cerr << "Failed to read pending count: " << pending.message << std::endl;
            return 1;
        }

        RunnableQueue runnable(db, runnableDb);
        Result sequenced = runnable.initialize();
        if (!sequenced) {
            std::cerr << "Failed to read runnable queue: " << sequenced.message << std::endl;
            return 1;
        }

        IdListResult runnableIds = runnable.list();
        if (!runnableIds) {
            std::cerr << "Failed to read runnable queue: " << runnableIds.message << std::endl;
            return 1;
        }
        std::cout << "Runnable jobs:  " << runnableIds.ids.size() << "\n";
        std::cout << "Next sequence:  " << runnable.nextSequence() << "\n";
        if (!runnableIds.ids.empty()) {
            std::cout << "Runnable head:  " << runnableIds.ids.front().hex() << "\n";
        }

        MissingSet missing(db, missingDb);
        IdListResult missingIds = missing.ids();
        if (!missingIds) {
            std::cerr << "Failed to read missing IDs: " << missingIds.message << std::endl;
            return 1;
        }
        std::cout << "Missing IDs:    " << missingIds.ids.size() << "\n";

        if (listRunnable) {
            std::cout << "\nRunnable:\n";
            for (const auto& id : runnableIds.ids) {
                std::cout << "  " << id.hex() << "\n";
            }
        }

        if (listMissing) {
            std::cout << "\nMissing:\n";
            for (const auto& id : missingIds.ids) {
                std::cout << "  " << id.hex() << "\n";
            }
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

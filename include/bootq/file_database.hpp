/*
 * bootq - Bootstrap Job Scheduling
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "bootq/database.hpp"

namespace bootq {

// Directory-backed store. Workspace layout:
//   data/<hh>/  one file per key, named "k" + hex(key); <hh> is the hex of
//               the first key byte, so a prefix scan lists one shard only
//   writing/    staging area, published into data/ by rename
//   journal/    batch.tmp while a batch is encoded, batch.log once committed
//
// A batch is committed when batch.log exists. If applying a committed batch
// fails, every later write is refused with IoError until the workspace is
// reopened; opening replays the log. Reads in the meantime may see the batch
// partly applied.
class FileDatabase final : public Database {
public:
    enum class OpenMode : std::uint8_t {
        Create,    // create the workspace when missing
        Existing,  // the workspace must exist
        ReadOnly   // must exist; no journal replay, no writes
    };

    // Throws std::runtime_error when the workspace cannot be opened or a
    // committed journal cannot be replayed.
    explicit FileDatabase(const std::filesystem::path& workspace, OpenMode mode = OpenMode::Create);

    FileDatabase(const FileDatabase&) = delete;
    FileDatabase& operator=(const FileDatabase&) = delete;

    [[nodiscard]] HasResult has(const std::string& key) const noexcept override;
    [[nodiscard]] ReadResult get(const std::string& key) const noexcept override;
    [[nodiscard]] Result put(const std::string& key, const std::string& value) noexcept override;
    [[nodiscard]] Result del(const std::string& key) noexcept override;
    [[nodiscard]] IteratorPtr newIterator(const std::string& prefix = "") const override;
    [[nodiscard]] Result write(const WriteBatch& batch) noexcept override;

    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }
    [[nodiscard]] bool readOnly() const noexcept { return mode_ == OpenMode::ReadOnly; }
    // A committed batch is waiting to be replayed by the next open.
    [[nodiscard]] bool journalPending() const noexcept { return journalPending_; }

    // File holding `key`.
    [[nodiscard]] std::filesystem::path keyPath(const std::string& key) const;

    [[nodiscard]] static bool isWorkspace(const std::filesystem::path& dir) noexcept;

private:
    std::filesystem::path workspace_;
    std::filesystem::path dataPath_;
    std::filesystem::path writingPath_;
    std::filesystem::path journalPath_;
    OpenMode mode_;
    bool journalPending_ = false;

    [[nodiscard]] bool createWorkspace() noexcept;
    [[nodiscard]] bool recoverJournal() noexcept;

    [[nodiscard]] Result checkWritable() const noexcept;
    [[nodiscard]] bool writeFileAtomic(const std::string& key, const std::string& value) const noexcept;
    [[nodiscard]] Result putFile(const std::string& key, const std::string& value) noexcept;
    [[nodiscard]] Result removeFile(const std::string& key) noexcept;
    [[nodiscard]] Result apply(const std::vector<WriteBatch::Op>& ops) noexcept;

    [[nodiscard]] static std::string encodeJournal(const WriteBatch& batch);
    [[nodiscard]] static bool decodeJournal(const std::string& raw, std::vector<WriteBatch::Op>& ops);
};

// File naming helpers, exposed for tests.
[[nodiscard]] std::string keyToFileName(const std::string& key);
[[nodiscard]] bool fileNameToKey(const std::string& name, std::string& key) noexcept;
// Shard directory of `key` under data/; empty for the empty key.
[[nodiscard]] std::string keyShard(const std::string& key);

}

// MINTGUARD - LevelDB Wrapper
// Copyright (c) 2024 MINTGUARD Developers
// MIT License
//
// LevelDB implementation of the database interface, plus an in-memory
// implementation with the same semantics for tests.

#ifndef MINTGUARD_DB_LEVELDB_H
#define MINTGUARD_DB_LEVELDB_H

#include "mintguard/db/database.h"

#include <map>
#include <mutex>

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>

namespace mintguard {
namespace db {

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override;
    void Next() override { iter_->Next(); }

    Slice key() const override;
    Slice value() const override;
    Status status() const override;

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
public:
    /// Takes ownership of all three pointers
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path);
    ~LevelDBDatabase() override;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    std::string GetStats() const override;

    const std::filesystem::path& GetPath() const { return path_; }

    /// Map a LevelDB status onto ours
    static Status ConvertStatus(const leveldb::Status& s);

private:
    static leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts);
    static leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts);

    // Destruction order matters: the DB must close before the cache and
    // filter policy it references are freed
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<leveldb::DB> db_;
    std::filesystem::path path_;
};

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * std::map-backed database for tests. Iterators see live data, so the
 * database must not be written while an iterator is in use.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    size_t Size() const;
    void Clear();

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

/**
 * Iterator for MemoryDatabase.
 */
class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(const std::map<std::string, std::string>& data)
        : data_(data), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) ++iter_;
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    const std::map<std::string, std::string>& data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

} // namespace db
} // namespace mintguard

#endif // MINTGUARD_DB_LEVELDB_H

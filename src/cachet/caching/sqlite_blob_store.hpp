#ifndef CACHET_CACHING_SQLITE_BLOB_STORE_HPP
#define CACHET_CACHING_SQLITE_BLOB_STORE_HPP

#include <memory>

#include <cachet/caching/persistence.hpp>
#include <cachet/fs/types.hpp>

namespace cachet {

// A blob store kept in a single SQLite database file.

// The store will generate exceptions any time an operation fails. Since the
// persistence_adapter catches them, that's fine for the cache, but other
// users of the store need to be prepared for them.

// A store is internally protected by a mutex, so it can be used concurrently
// from multiple threads.

struct sqlite_blob_store_config
{
    // the directory that holds the database file - If this is omitted, the
    // user cache directory for cachet is used.
    optional<string> directory;

    string file_name = "entries.db";
};

bool
operator==(
    sqlite_blob_store_config const& a, sqlite_blob_store_config const& b);

struct sqlite_blob_store_info
{
    // the full path to the database file
    string path;

    // the number of blobs currently stored
    integer entry_count;

    // the total size of the stored blobs (in bytes)
    integer total_size;
};

// This exception indicates a failure in the operation of the store.
CACHET_DEFINE_EXCEPTION(blob_store_failure)
// This provides the path to the database file.
CACHET_DEFINE_ERROR_INFO(file_path, blob_store_path)
// This exception also provides internal_error_message_info.

struct sqlite_blob_store_impl;

struct sqlite_blob_store : blob_store
{
    // Open (or create) the store described by :config.
    // If the existing database file is incompatible or corrupt, it's
    // discarded and a fresh one is created.
    sqlite_blob_store(sqlite_blob_store_config const& config);

    ~sqlite_blob_store();

    std::vector<std::pair<string, string>>
    read_all() override;

    std::vector<string>
    list_keys() override;

    void
    write(string const& key, string const& blob) override;

    void
    remove(string const& key) override;

    // Look up the blob stored under :key (if any).
    optional<string>
    find(string const& key);

    // Get summary information about the store.
    sqlite_blob_store_info
    get_summary_info();

 private:
    std::unique_ptr<sqlite_blob_store_impl> impl_;
};

} // namespace cachet

#endif

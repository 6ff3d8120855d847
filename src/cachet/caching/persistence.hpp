#ifndef CACHET_CACHING_PERSISTENCE_HPP
#define CACHET_CACHING_PERSISTENCE_HPP

#include <memory>
#include <utility>

#include <cachet/caching/entry_store.hpp>

namespace cachet {

// A blob_store is durable key/value storage for opaque byte strings.
// Implementations report failures by throwing. They aren't expected to
// provide any transactional guarantees.
struct blob_store
{
    virtual ~blob_store()
    {
    }

    // Get every key/blob pair in the store.
    virtual std::vector<std::pair<string, string>>
    read_all() = 0;

    // Get every key in the store.
    virtual std::vector<string>
    list_keys() = 0;

    // Write :blob under :key, replacing whatever was there.
    virtual void
    write(string const& key, string const& blob) = 0;

    // Remove :key from the store. Removing a missing key is not an error.
    virtual void
    remove(string const& key) = 0;
};

// Encode a cache entry as a JSON document for storage.
string
encode_cache_entry(cache_entry const& entry);

// Decode an entry written by encode_cache_entry().
// Malformed input results in a parsing_error, missing_field or type_mismatch
// exception.
cache_entry
decode_cache_entry(string const& encoded);

// The persistence_adapter sits between the cache and a blob_store.
// Nothing it does ever fails as far as its caller is concerned: whenever the
// blob store throws, the error is logged and the operation is abandoned.
//
// An adapter without a blob store is disabled, and all of its operations are
// no-ops.
//
struct persistence_adapter : noncopyable
{
    persistence_adapter();

    explicit persistence_adapter(std::unique_ptr<blob_store> store);

    bool
    is_enabled() const
    {
        return store_ ? true : false;
    }

    // Load every entry that's still live at :now. Stale entries are dropped
    // from the store along the way. Entries that can't be decoded are
    // skipped.
    // The result is ordered from least to most recently accessed.
    std::vector<keyed_cache_entry>
    load_all(timestamp now);

    // Make the store hold exactly :entries.
    void
    save_all(std::vector<keyed_cache_entry> const& entries);

    void
    save(string const& key, cache_entry const& entry);

    void
    remove(string const& key);

    void
    remove_all();

 private:
    std::unique_ptr<blob_store> store_;
};

} // namespace cachet

#endif

#ifndef CACHET_CACHING_ENTRY_STORE_HPP
#define CACHET_CACHING_ENTRY_STORE_HPP

#include <unordered_map>

#include <cachet/caching/eviction.hpp>
#include <cachet/caching/policy.hpp>

namespace cachet {

struct cache_entry
{
    dynamic value;

    timestamp created_at;

    // The entry is stale once more than this much time has passed since
    // :created_at.
    std::chrono::milliseconds ttl{0};

    // how many times the entry has been written or read
    integer access_count = 0;

    timestamp last_accessed_at;

    // Every write to the store assigns a new revision number. This isn't
    // persisted. It only serves to tell whether an entry has been replaced.
    uint64_t revision = 0;
};

bool
operator==(cache_entry const& a, cache_entry const& b);
bool
operator!=(cache_entry const& a, cache_entry const& b);

// Is :entry stale at time :now?
bool
is_expired(cache_entry const& entry, timestamp now);

// A keyed entry, as returned by the enumeration functions.
struct keyed_cache_entry
{
    string key;
    cache_entry entry;
};

// An entry_store is the in-memory table of cache entries. It keeps an
// eviction_tracker in lockstep with the table, so every stored key is tracked
// in its namespace's recency list and vice versa.
//
// Stale entries may linger in the table until they're accessed or swept, but
// every read path treats them as absent.
//
// entry_store does no locking of its own.
//
struct entry_store : noncopyable
{
    // :policies must outlive the store.
    entry_store(namespace_policy_table const& policies);

    // Get the value associated with :key.
    // If the entry is stale, it's removed and none is returned.
    // A hit counts as an access and makes the key most recently used.
    optional<dynamic>
    get(string const& key, timestamp now);

    // Store :value under :key with the given TTL, replacing any existing
    // entry. If this pushes the key's namespace over capacity, the least
    // recently used keys in that namespace are evicted and returned.
    std::vector<string>
    put(string const& key,
        dynamic value,
        std::chrono::milliseconds ttl,
        timestamp now);

    // Put an exact copy of :entry back into the store under :key (with a new
    // revision number). Capacity is enforced just as in put().
    std::vector<string>
    restore(string const& key, cache_entry entry);

    // Get a copy of the live entry for :key without affecting its access
    // statistics or recency.
    optional<cache_entry>
    peek(string const& key, timestamp now) const;

    // Get the revision of the entry stored under :key, stale or not.
    optional<uint64_t>
    revision_of(string const& key) const;

    // Remove the entry for :key. Returns false if there wasn't one.
    bool
    remove(string const& key);

    // Remove all stale entries and return their keys.
    std::vector<string>
    sweep_expired(timestamp now);

    // Remove all entries whose keys fall within the namespace identified by
    // :prefix and return their keys.
    std::vector<string>
    remove_matching(string const& prefix);

    void
    clear();

    // Get copies of all live entries.
    std::vector<keyed_cache_entry>
    live_entries(timestamp now) const;

    // the number of entries in the store (including stale ones that haven't
    // been removed yet)
    size_t
    size() const
    {
        return entries_.size();
    }

    // the number of entries in the namespace :ns
    size_t
    namespace_size(string const& ns) const
    {
        return tracker_.count(ns);
    }

    // the keys in namespace :ns, from least to most recently used
    std::vector<string>
    recency_order(string const& ns) const
    {
        return tracker_.keys(ns);
    }

    namespace_policy_table const&
    policies() const
    {
        return policies_;
    }

 private:
    std::vector<string>
    insert(string const& key, cache_entry entry);

    namespace_policy_table const& policies_;
    std::unordered_map<string, cache_entry> entries_;
    eviction_tracker tracker_;
    uint64_t next_revision_ = 1;
};

} // namespace cachet

#endif

#include <cachet/caching/entry_store.hpp>

namespace cachet {

bool
operator==(cache_entry const& a, cache_entry const& b)
{
    return a.value == b.value && a.created_at == b.created_at
           && a.ttl == b.ttl && a.access_count == b.access_count
           && a.last_accessed_at == b.last_accessed_at;
}
bool
operator!=(cache_entry const& a, cache_entry const& b)
{
    return !(a == b);
}

bool
is_expired(cache_entry const& entry, timestamp now)
{
    return now - entry.created_at > entry.ttl;
}

entry_store::entry_store(namespace_policy_table const& policies)
    : policies_(policies)
{
}

optional<dynamic>
entry_store::get(string const& key, timestamp now)
{
    auto i = entries_.find(key);
    if (i == entries_.end())
        return none;
    auto& entry = i->second;
    if (is_expired(entry, now))
    {
        remove(key);
        return none;
    }
    ++entry.access_count;
    entry.last_accessed_at = now;
    tracker_.touch(policies_.namespace_of(key), key);
    return entry.value;
}

std::vector<string>
entry_store::insert(string const& key, cache_entry entry)
{
    entry.revision = next_revision_++;
    entries_[key] = std::move(entry);

    auto ns = policies_.namespace_of(key);
    tracker_.touch(ns, key);

    auto max_size = policies_.resolve(key).max_size;
    auto evicted = tracker_.evict_if_over_capacity(
        ns, max_size > 0 ? size_t(max_size) : 0);
    for (auto const& evicted_key : evicted)
        entries_.erase(evicted_key);
    return evicted;
}

std::vector<string>
entry_store::put(
    string const& key,
    dynamic value,
    std::chrono::milliseconds ttl,
    timestamp now)
{
    cache_entry entry;
    entry.value = std::move(value);
    entry.created_at = now;
    entry.ttl = ttl;
    entry.access_count = 1;
    entry.last_accessed_at = now;
    return insert(key, std::move(entry));
}

std::vector<string>
entry_store::restore(string const& key, cache_entry entry)
{
    return insert(key, std::move(entry));
}

optional<cache_entry>
entry_store::peek(string const& key, timestamp now) const
{
    auto i = entries_.find(key);
    if (i == entries_.end() || is_expired(i->second, now))
        return none;
    return i->second;
}

optional<uint64_t>
entry_store::revision_of(string const& key) const
{
    auto i = entries_.find(key);
    if (i == entries_.end())
        return none;
    return i->second.revision;
}

bool
entry_store::remove(string const& key)
{
    tracker_.remove(key);
    return entries_.erase(key) != 0;
}

std::vector<string>
entry_store::sweep_expired(timestamp now)
{
    std::vector<string> removed;
    for (auto const& [key, entry] : entries_)
    {
        if (is_expired(entry, now))
            removed.push_back(key);
    }
    for (auto const& key : removed)
        remove(key);
    return removed;
}

std::vector<string>
entry_store::remove_matching(string const& prefix)
{
    std::vector<string> removed;
    for (auto const& [key, entry] : entries_)
    {
        if (key_matches_prefix(key, prefix))
            removed.push_back(key);
    }
    for (auto const& key : removed)
        remove(key);
    return removed;
}

void
entry_store::clear()
{
    entries_.clear();
    tracker_.clear();
}

std::vector<keyed_cache_entry>
entry_store::live_entries(timestamp now) const
{
    std::vector<keyed_cache_entry> live;
    for (auto const& [key, entry] : entries_)
    {
        if (!is_expired(entry, now))
            live.push_back(keyed_cache_entry{key, entry});
    }
    return live;
}

} // namespace cachet

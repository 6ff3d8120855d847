#include <cachet/caching/persistence.hpp>

#include <algorithm>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include <cachet/core/logging.hpp>
#include <cachet/encodings/json.hpp>

namespace cachet {

string
encode_cache_entry(cache_entry const& entry)
{
    return value_to_canonical_json(dynamic(dynamic_map{
        {dynamic("value"), entry.value},
        {dynamic("created_at"),
         dynamic(to_epoch_milliseconds(entry.created_at))},
        {dynamic("ttl"), dynamic(integer(entry.ttl.count()))},
        {dynamic("access_count"), dynamic(entry.access_count)},
        {dynamic("last_accessed_at"),
         dynamic(to_epoch_milliseconds(entry.last_accessed_at))}}));
}

cache_entry
decode_cache_entry(string const& encoded)
{
    auto parsed = parse_json_value(encoded);
    auto const& record = cast<dynamic_map>(parsed);
    cache_entry entry;
    entry.value = get_field(record, "value");
    entry.created_at = from_epoch_milliseconds(
        cast<integer>(get_field(record, "created_at")));
    entry.ttl
        = std::chrono::milliseconds(cast<integer>(get_field(record, "ttl")));
    entry.access_count = cast<integer>(get_field(record, "access_count"));
    entry.last_accessed_at = from_epoch_milliseconds(
        cast<integer>(get_field(record, "last_accessed_at")));
    return entry;
}

persistence_adapter::persistence_adapter()
{
}

persistence_adapter::persistence_adapter(std::unique_ptr<blob_store> store)
    : store_(std::move(store))
{
    initialize_logging();
}

std::vector<keyed_cache_entry>
persistence_adapter::load_all(timestamp now)
{
    std::vector<keyed_cache_entry> loaded;
    if (!store_)
        return loaded;

    std::vector<std::pair<string, string>> blobs;
    try
    {
        blobs = store_->read_all();
    }
    catch (std::exception& e)
    {
        spdlog::get("cachet")->warn(
            "failed to load cache entries from storage: {}", e.what());
        return loaded;
    }

    std::vector<string> stale;
    for (auto const& [key, blob] : blobs)
    {
        try
        {
            auto entry = decode_cache_entry(blob);
            if (is_expired(entry, now))
                stale.push_back(key);
            else
                loaded.push_back(keyed_cache_entry{key, std::move(entry)});
        }
        catch (std::exception& e)
        {
            spdlog::get("cachet")->warn(
                "skipping unreadable cache entry {}: {}", key, e.what());
        }
    }

    for (auto const& key : stale)
        remove(key);

    std::stable_sort(
        loaded.begin(),
        loaded.end(),
        [](keyed_cache_entry const& a, keyed_cache_entry const& b) {
            return a.entry.last_accessed_at < b.entry.last_accessed_at;
        });

    return loaded;
}

void
persistence_adapter::save_all(std::vector<keyed_cache_entry> const& entries)
{
    if (!store_)
        return;

    std::unordered_set<string> saved_keys;
    for (auto const& [key, entry] : entries)
    {
        save(key, entry);
        saved_keys.insert(key);
    }

    // Drop anything that's in the store but no longer in the cache.
    try
    {
        for (auto const& key : store_->list_keys())
        {
            if (saved_keys.find(key) == saved_keys.end())
                store_->remove(key);
        }
    }
    catch (std::exception& e)
    {
        spdlog::get("cachet")->warn(
            "failed to prune persisted cache entries: {}", e.what());
    }
}

void
persistence_adapter::save(string const& key, cache_entry const& entry)
{
    if (!store_)
        return;
    try
    {
        store_->write(key, encode_cache_entry(entry));
    }
    catch (std::exception& e)
    {
        spdlog::get("cachet")->warn(
            "failed to persist cache entry {}: {}", key, e.what());
    }
}

void
persistence_adapter::remove(string const& key)
{
    if (!store_)
        return;
    try
    {
        store_->remove(key);
    }
    catch (std::exception& e)
    {
        spdlog::get("cachet")->warn(
            "failed to remove persisted cache entry {}: {}", key, e.what());
    }
}

void
persistence_adapter::remove_all()
{
    if (!store_)
        return;
    try
    {
        for (auto const& key : store_->list_keys())
            store_->remove(key);
    }
    catch (std::exception& e)
    {
        spdlog::get("cachet")->warn(
            "failed to clear persisted cache entries: {}", e.what());
    }
}

} // namespace cachet

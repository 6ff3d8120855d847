#include <cachet/caching/eviction.hpp>

namespace cachet {

void
eviction_tracker::touch(string const& ns, string const& key)
{
    auto existing = positions_.find(key);
    if (existing != positions_.end())
    {
        auto& from = lists_[existing->second.ns];
        if (existing->second.ns == ns)
        {
            from.splice(from.end(), from, existing->second.i);
            return;
        }
        // The key has moved to a different namespace (because the policy
        // table changed), so it has to switch lists.
        from.erase(existing->second.i);
        if (from.empty())
            lists_.erase(existing->second.ns);
        positions_.erase(existing);
    }
    auto& list = lists_[ns];
    auto i = list.insert(list.end(), key);
    positions_.emplace(key, position{ns, i});
}

bool
eviction_tracker::remove(string const& key)
{
    auto existing = positions_.find(key);
    if (existing == positions_.end())
        return false;
    auto list = lists_.find(existing->second.ns);
    list->second.erase(existing->second.i);
    if (list->second.empty())
        lists_.erase(list);
    positions_.erase(existing);
    return true;
}

void
eviction_tracker::clear()
{
    lists_.clear();
    positions_.clear();
}

std::vector<string>
eviction_tracker::evict_if_over_capacity(string const& ns, size_t max_size)
{
    std::vector<string> evicted;
    auto list = lists_.find(ns);
    if (list == lists_.end())
        return evicted;
    while (list->second.size() > max_size)
    {
        auto key = std::move(list->second.front());
        list->second.pop_front();
        positions_.erase(key);
        evicted.push_back(std::move(key));
    }
    if (list->second.empty())
        lists_.erase(list);
    return evicted;
}

size_t
eviction_tracker::count(string const& ns) const
{
    auto list = lists_.find(ns);
    return list != lists_.end() ? list->second.size() : 0;
}

std::vector<string>
eviction_tracker::keys(string const& ns) const
{
    auto list = lists_.find(ns);
    if (list == lists_.end())
        return {};
    return std::vector<string>(list->second.begin(), list->second.end());
}

} // namespace cachet

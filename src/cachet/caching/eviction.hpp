#ifndef CACHET_CACHING_EVICTION_HPP
#define CACHET_CACHING_EVICTION_HPP

#include <list>
#include <unordered_map>
#include <vector>

#include <cachet/core.h>

namespace cachet {

// An eviction_tracker keeps a recency ordering over keys, separately for each
// namespace. Each namespace's list runs from least recently used (front) to
// most recently used (back). A key appears in at most one list, at most once.
//
// Keys that are touched at the same instant keep the order in which they
// were touched, so eviction among them follows insertion order.
struct eviction_tracker
{
    // Move :key to the most-recently-used end of :ns's list, adding it if
    // it's not already tracked.
    void
    touch(string const& ns, string const& key);

    // Stop tracking :key. Returns false if it wasn't tracked.
    bool
    remove(string const& key);

    // Stop tracking everything.
    void
    clear();

    // Remove keys from the least-recently-used end of :ns's list until it
    // holds at most :max_size keys. The removed keys are returned in
    // eviction order.
    std::vector<string>
    evict_if_over_capacity(string const& ns, size_t max_size);

    // the number of keys tracked for :ns
    size_t
    count(string const& ns) const;

    // the total number of keys tracked
    size_t
    total_count() const
    {
        return positions_.size();
    }

    // the keys tracked for :ns, from least to most recently used
    std::vector<string>
    keys(string const& ns) const;

    bool
    is_tracked(string const& key) const
    {
        return positions_.find(key) != positions_.end();
    }

 private:
    typedef std::list<string> recency_list;

    struct position
    {
        string ns;
        recency_list::iterator i;
    };

    std::unordered_map<string, recency_list> lists_;
    std::unordered_map<string, position> positions_;
};

} // namespace cachet

#endif

#include <cachet/caching/policy.hpp>

#include <algorithm>
#include <set>

#include <boost/algorithm/string.hpp>

namespace cachet {

bool
operator==(namespace_policy const& a, namespace_policy const& b)
{
    return a.prefix == b.prefix && a.ttl == b.ttl && a.max_size == b.max_size
           && a.durable == b.durable && a.dependents == b.dependents;
}
bool
operator!=(namespace_policy const& a, namespace_policy const& b)
{
    return !(a == b);
}

namespace_policy
make_default_namespace_policy()
{
    namespace_policy policy;
    policy.ttl = std::chrono::minutes(5);
    policy.max_size = 100;
    policy.durable = false;
    return policy;
}

static namespace_policy
make_policy(
    string prefix,
    std::chrono::milliseconds ttl,
    integer max_size,
    bool durable,
    std::vector<string> dependents = {})
{
    namespace_policy policy;
    policy.prefix = std::move(prefix);
    policy.ttl = ttl;
    policy.max_size = max_size;
    policy.durable = durable;
    policy.dependents = std::move(dependents);
    return policy;
}

std::vector<namespace_policy>
make_builtin_namespace_policies()
{
    using std::chrono::hours;
    using std::chrono::minutes;
    return {
        make_policy("books", minutes(10), 50, true, {"books:list", "search"}),
        make_policy("books:list", minutes(10), 10, true),
        make_policy(
            "chapters", minutes(15), 200, true, {"chapters:list", "search"}),
        make_policy("chapters:list", minutes(15), 50, true),
        make_policy("dictionary", minutes(60), 1000, true, {"spell-check"}),
        make_policy("preferences", hours(24), 10, true),
        make_policy("search", minutes(2), 30, false),
        make_policy("spell-check", minutes(30), 500, false)};
}

static void
throw_misconfiguration(string const& prefix, string const& problem)
{
    CACHET_THROW(
        policy_misconfiguration() << namespace_prefix_info(prefix)
                                  << misconfiguration_info(problem));
}

static void
check_limits(namespace_policy const& policy)
{
    if (policy.ttl.count() < 0)
        throw_misconfiguration(policy.prefix, "negative TTL");
    if (policy.max_size < 0)
        throw_misconfiguration(policy.prefix, "negative maximum size");
}

void
validate_namespace_policies(
    std::vector<namespace_policy> const& policies,
    namespace_policy const& default_policy)
{
    check_limits(default_policy);
    if (!default_policy.dependents.empty())
    {
        throw_misconfiguration(
            default_policy.prefix, "the default policy can't have dependents");
    }

    std::set<string> prefixes;
    for (auto const& policy : policies)
    {
        if (policy.prefix.empty())
            throw_misconfiguration(policy.prefix, "empty prefix");
        // Every segment of a prefix must be nonempty, so 'a::b' and 'a:' are
        // both rejected.
        std::vector<string> segments;
        boost::split(
            segments, policy.prefix, [](char c) { return c == ':'; });
        if (std::ranges::any_of(
                segments, [](auto const& s) { return s.empty(); }))
        {
            throw_misconfiguration(policy.prefix, "empty prefix segment");
        }
        if (!prefixes.insert(policy.prefix).second)
            throw_misconfiguration(policy.prefix, "duplicate prefix");
        check_limits(policy);
        for (auto const& dependent : policy.dependents)
        {
            if (dependent.empty())
                throw_misconfiguration(policy.prefix, "empty dependent");
        }
    }
}

bool
key_matches_prefix(string const& key, string const& prefix)
{
    return key.size() > prefix.size()
           && key.compare(0, prefix.size(), prefix) == 0
           && key[prefix.size()] == ':';
}

namespace_policy_table::namespace_policy_table()
    : namespace_policy_table(make_builtin_namespace_policies())
{
}

namespace_policy_table::namespace_policy_table(
    std::vector<namespace_policy> policies, namespace_policy default_policy)
    : policies_(std::move(policies)), default_policy_(std::move(default_policy))
{
    validate_namespace_policies(policies_, default_policy_);
    std::stable_sort(
        policies_.begin(),
        policies_.end(),
        [](namespace_policy const& a, namespace_policy const& b) {
            return a.prefix.size() > b.prefix.size();
        });
}

namespace_policy const*
namespace_policy_table::find_policy(string const& key) const
{
    auto policy = std::ranges::find_if(policies_, [&](auto const& p) {
        return key_matches_prefix(key, p.prefix);
    });
    return policy != policies_.end() ? &*policy : nullptr;
}

namespace_policy const&
namespace_policy_table::resolve(string const& key) const
{
    auto const* policy = find_policy(key);
    return policy ? *policy : default_policy_;
}

string
namespace_policy_table::namespace_of(string const& key) const
{
    auto const* policy = find_policy(key);
    if (policy)
        return policy->prefix;
    auto separator = key.find(':');
    return separator != string::npos ? key.substr(0, separator) : string();
}

std::vector<string> const&
namespace_policy_table::dependents_of(string const& key) const
{
    return resolve(key).dependents;
}

} // namespace cachet

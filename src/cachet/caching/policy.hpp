#ifndef CACHET_CACHING_POLICY_HPP
#define CACHET_CACHING_POLICY_HPP

#include <vector>

#include <cachet/core.h>

namespace cachet {

// A namespace is a group of cache keys that share one expiry, capacity and
// durability policy. A key belongs to the namespace with the longest prefix
// that it matches, where a key matches :prefix if it starts with :prefix
// followed by ':'. (A key equal to a prefix isn't in that namespace.)
struct namespace_policy
{
    string prefix;

    // how long entries in this namespace live after they're written
    std::chrono::milliseconds ttl{0};

    // the maximum number of entries that the namespace may hold
    integer max_size = 0;

    // Should entries in this namespace survive process restarts?
    bool durable = false;

    // the prefixes of namespaces whose entries are invalidated whenever an
    // entry in this namespace is successfully mutated
    std::vector<string> dependents;
};

bool
operator==(namespace_policy const& a, namespace_policy const& b);
bool
operator!=(namespace_policy const& a, namespace_policy const& b);

// Get the policy that applies to keys that don't match any namespace:
// a five minute TTL, at most 100 entries per namespace, and no persistence.
namespace_policy
make_default_namespace_policy();

// Get the built-in namespace table.
std::vector<namespace_policy>
make_builtin_namespace_policies();

// Thrown when a set of policies is inconsistent.
// This is considered fatal. It's only thrown while setting things up.
CACHET_DEFINE_EXCEPTION(policy_misconfiguration)
CACHET_DEFINE_ERROR_INFO(string, namespace_prefix)
CACHET_DEFINE_ERROR_INFO(string, misconfiguration)

// Check that a set of policies is usable. If it isn't, this throws
// policy_misconfiguration.
void
validate_namespace_policies(
    std::vector<namespace_policy> const& policies,
    namespace_policy const& default_policy);

// Does :key fall within the namespace identified by :prefix?
bool
key_matches_prefix(string const& key, string const& prefix);

struct namespace_policy_table
{
    // Create a table holding the built-in policies.
    namespace_policy_table();

    // Create a table with the given policies. This validates them, so it
    // throws policy_misconfiguration if they're inconsistent.
    namespace_policy_table(
        std::vector<namespace_policy> policies,
        namespace_policy default_policy = make_default_namespace_policy());

    // Get the policy that applies to :key.
    namespace_policy const&
    resolve(string const& key) const;

    // Get the namespace that :key belongs to.
    // For keys that match a registered policy, this is the policy's prefix.
    // For other keys, it's the text before the first ':' (or the empty
    // string if there is no separator).
    string
    namespace_of(string const& key) const;

    // Get the prefixes of the namespaces that depend on :key's namespace.
    std::vector<string> const&
    dependents_of(string const& key) const;

    std::vector<namespace_policy> const&
    policies() const
    {
        return policies_;
    }

    namespace_policy const&
    default_policy() const
    {
        return default_policy_;
    }

 private:
    namespace_policy const*
    find_policy(string const& key) const;

    // sorted by descending prefix length, so the first match wins
    std::vector<namespace_policy> policies_;
    namespace_policy default_policy_;
};

} // namespace cachet

#endif

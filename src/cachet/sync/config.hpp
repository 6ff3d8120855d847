#ifndef CACHET_SYNC_CONFIG_HPP
#define CACHET_SYNC_CONFIG_HPP

#include <cachet/fs/types.hpp>
#include <cachet/sync/types.hpp>

namespace cachet {

// Read a namespace_policy from its dynamic form:
// { "prefix": ..., "ttl_ms": ..., "max_size": ..., "durable": ...,
//   "dependents": [...] }
// Only "prefix" is required. Omitted fields take the values of :defaults.
namespace_policy
read_namespace_policy(dynamic const& v, namespace_policy const& defaults);

// Read a sync_config from its dynamic form. All fields are optional.
// Type errors result in type_mismatch exceptions and inconsistent policies
// result in policy_misconfiguration.
sync_config
read_sync_config(dynamic const& v);

// Read a sync_config from a JSON file.
sync_config
read_sync_config_file(file_path const& path);

} // namespace cachet

#endif

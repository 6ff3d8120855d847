#include <cachet/sync/config.hpp>

#include <cachet/encodings/json.hpp>
#include <cachet/fs/file_io.hpp>

namespace cachet {

namespace {

std::chrono::milliseconds
read_milliseconds(dynamic const& v)
{
    return std::chrono::milliseconds(cast<integer>(v));
}

template<class Reader>
void
read_optional_field(
    dynamic_map const& record, string const& field, Reader&& reader)
{
    dynamic const* value;
    if (!get_field(&value, record, field))
        return;
    try
    {
        reader(*value);
    }
    catch (boost::exception& e)
    {
        add_dynamic_path_element(e, dynamic(field));
        throw;
    }
}

sqlite_blob_store_config
read_persistence_config(dynamic const& v)
{
    auto const& record = cast<dynamic_map>(v);
    sqlite_blob_store_config config;
    read_optional_field(record, "directory", [&](dynamic const& x) {
        config.directory = cast<string>(x);
    });
    read_optional_field(record, "file_name", [&](dynamic const& x) {
        config.file_name = cast<string>(x);
    });
    return config;
}

} // namespace

namespace_policy
read_namespace_policy(dynamic const& v, namespace_policy const& defaults)
{
    auto const& record = cast<dynamic_map>(v);
    namespace_policy policy = defaults;
    policy.prefix = cast<string>(get_field(record, "prefix"));
    read_optional_field(record, "ttl_ms", [&](dynamic const& x) {
        policy.ttl = read_milliseconds(x);
    });
    read_optional_field(record, "max_size", [&](dynamic const& x) {
        policy.max_size = cast<integer>(x);
    });
    read_optional_field(record, "durable", [&](dynamic const& x) {
        policy.durable = cast<bool>(x);
    });
    policy.dependents.clear();
    read_optional_field(record, "dependents", [&](dynamic const& x) {
        for (auto const& dependent : cast<dynamic_array>(x))
            policy.dependents.push_back(cast<string>(dependent));
    });
    return policy;
}

sync_config
read_sync_config(dynamic const& v)
{
    auto const& record = cast<dynamic_map>(v);
    sync_config config;

    read_optional_field(record, "default_policy", [&](dynamic const& x) {
        auto const& policy = cast<dynamic_map>(x);
        read_optional_field(policy, "ttl_ms", [&](dynamic const& y) {
            config.default_policy.ttl = read_milliseconds(y);
        });
        read_optional_field(policy, "max_size", [&](dynamic const& y) {
            config.default_policy.max_size = cast<integer>(y);
        });
        read_optional_field(policy, "durable", [&](dynamic const& y) {
            config.default_policy.durable = cast<bool>(y);
        });
    });

    read_optional_field(record, "namespaces", [&](dynamic const& x) {
        std::vector<namespace_policy> policies;
        integer index = 0;
        for (auto const& item : cast<dynamic_array>(x))
        {
            try
            {
                policies.push_back(
                    read_namespace_policy(item, config.default_policy));
            }
            catch (boost::exception& e)
            {
                add_dynamic_path_element(e, dynamic(index));
                throw;
            }
            ++index;
        }
        config.namespaces = std::move(policies);
    });

    read_optional_field(record, "default_timeout_ms", [&](dynamic const& x) {
        config.default_timeout = read_milliseconds(x);
    });
    read_optional_field(record, "speculative_ttl_ms", [&](dynamic const& x) {
        config.speculative_ttl = read_milliseconds(x);
    });
    read_optional_field(record, "sweep_interval_ms", [&](dynamic const& x) {
        config.sweep_interval = read_milliseconds(x);
    });
    read_optional_field(record, "snapshot_interval_ms", [&](dynamic const& x) {
        config.snapshot_interval = read_milliseconds(x);
    });
    read_optional_field(record, "top_key_count", [&](dynamic const& x) {
        config.top_key_count = cast<integer>(x);
    });
    read_optional_field(record, "persistence", [&](dynamic const& x) {
        config.persistence = read_persistence_config(x);
    });
    read_optional_field(record, "log_level", [&](dynamic const& x) {
        config.log_level = cast<string>(x);
    });
    read_optional_field(record, "log_file", [&](dynamic const& x) {
        config.log_file = cast<string>(x);
    });

    validate_namespace_policies(
        config.namespaces ? *config.namespaces
                          : make_builtin_namespace_policies(),
        config.default_policy);

    return config;
}

sync_config
read_sync_config_file(file_path const& path)
{
    return read_sync_config(parse_json_value(read_file_contents(path)));
}

} // namespace cachet

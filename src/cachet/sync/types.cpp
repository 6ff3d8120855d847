#include <cachet/sync/types.hpp>

namespace cachet {

bool
operator==(preload_summary const& a, preload_summary const& b)
{
    return a.loaded == b.loaded && a.skipped == b.skipped
           && a.failed == b.failed;
}
bool
operator!=(preload_summary const& a, preload_summary const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, preload_summary const& summary)
{
    s << "{ loaded: " << summary.loaded << ", skipped: " << summary.skipped
      << ", failed: " << summary.failed << " }";
    return s;
}

bool
operator==(key_access_count const& a, key_access_count const& b)
{
    return a.key == b.key && a.access_count == b.access_count;
}

dynamic
apply_patch(dynamic const& value, dynamic const& patch)
{
    if (value.type() != value_type::MAP || patch.type() != value_type::MAP)
        return patch;
    auto merged = cast<dynamic_map>(value);
    for (auto const& [field, field_value] : cast<dynamic_map>(patch))
        merged[field] = field_value;
    return dynamic(std::move(merged));
}

} // namespace cachet

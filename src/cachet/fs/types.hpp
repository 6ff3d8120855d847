#ifndef CACHET_FS_TYPES_HPP
#define CACHET_FS_TYPES_HPP

#include <filesystem>

#include <cachet/core/type_definitions.hpp>

namespace cachet {

// (Note that file_path is of course slightly incorrect because the path could
// refer to a directory, but it's a lot easier to read.)
typedef std::filesystem::path file_path;

} // namespace cachet

#endif

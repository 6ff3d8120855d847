#ifndef CACHET_FS_FILE_IO_HPP
#define CACHET_FS_FILE_IO_HPP

#include <fstream>

#include <cachet/core/exception.hpp>
#include <cachet/fs/types.hpp>

namespace cachet {

// Open a file into the given fstream. Throw an error if the open operation
// fails, and enable the exception bits on the fstream so that subsequent
// failures will throw exceptions.
void
open_file(std::ifstream& file, file_path const& path, std::ios::openmode mode);
void
open_file(std::ofstream& file, file_path const& path, std::ios::openmode mode);

// If the above fails, it throws the following exception.
CACHET_DEFINE_EXCEPTION(open_file_error)
CACHET_DEFINE_ERROR_INFO(file_path, file_path)
CACHET_DEFINE_ERROR_INFO(std::ios::openmode, open_mode)

// Get the contents of a file as a string.
string
read_file_contents(file_path const& path);

} // namespace cachet

#endif

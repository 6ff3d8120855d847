#ifndef CACHET_CORE_TESTING_HPP
#define CACHET_CORE_TESTING_HPP

#include <catch2/catch.hpp>

#include <boost/optional/optional_io.hpp>

#include <cachet/core/dynamic.hpp>
#include <cachet/fs/file_io.hpp>

namespace cachet {

// manual_clock is a clock that only moves when it's told to. It makes TTL
// behavior deterministic in tests.
struct manual_clock
{
    timestamp now = timestamp(std::chrono::hours(24 * 365 * 50));

    void
    advance(std::chrono::milliseconds amount)
    {
        now += amount;
    }

    // Get a clock_function that reads this clock.
    // Note that the returned function refers to this object, so it must not
    // outlive it.
    clock_function
    function()
    {
        return [this] { return now; };
    }
};

// Remove :dir (if it exists) along with everything in it and create it again
// as an empty directory.
inline void
reset_directory(file_path const& dir)
{
    if (exists(dir))
        remove_all(dir);
    create_directories(dir);
}

// Write a string to a file (overwriting anything that might have been in it).
inline void
dump_string_to_file(file_path const& path, string const& contents)
{
    std::ofstream output;
    open_file(
        output, path, std::ios::out | std::ios::trunc | std::ios::binary);
    output << contents;
}

} // namespace cachet

#endif

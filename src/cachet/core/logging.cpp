#include <cachet/core/logging.hpp>

#include <mutex>

#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace cachet {

void
initialize_logging(optional<file_path> const& log_file)
{
    static std::mutex the_mutex;
    std::scoped_lock<std::mutex> lock(the_mutex);

    if (spdlog::get("cachet"))
        return;

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>());
    if (log_file)
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file->string(), 262144, 2));
    }
    auto logger = std::make_shared<spdlog::logger>(
        "cachet", std::begin(sinks), std::end(sinks));
    spdlog::register_logger(logger);
}

void
set_log_level(string const& level)
{
    initialize_logging();
    spdlog::get("cachet")->set_level(spdlog::level::from_str(level));
}

} // namespace cachet

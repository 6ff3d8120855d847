#include <iostream>

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

#include <cachet/caching/sqlite_blob_store.hpp>
#include <cachet/core/logging.hpp>
#include <cachet/fs/app_dirs.hpp>
#include <cachet/sync/config.hpp>

using namespace cachet;

static void
list_entries(sqlite_blob_store& store, timestamp now)
{
    for (auto const& [key, blob] : store.read_all())
    {
        std::cout << key << " (" << blob.size() << " bytes)";
        try
        {
            auto entry = decode_cache_entry(blob);
            if (is_expired(entry, now))
                std::cout << " - stale";
            else
            {
                auto remaining = std::chrono::duration_cast<
                    std::chrono::milliseconds>(
                    entry.created_at + entry.ttl - now);
                std::cout << " - expires in " << remaining.count() << " ms";
            }
            std::cout << ", " << entry.access_count << " accesses";
        }
        catch (std::exception& e)
        {
            std::cout << " - unreadable: " << e.what();
        }
        std::cout << "\n";
    }
}

static size_t
purge_expired_entries(sqlite_blob_store& store, timestamp now)
{
    size_t purged = 0;
    for (auto const& [key, blob] : store.read_all())
    {
        bool stale;
        try
        {
            stale = is_expired(decode_cache_entry(blob), now);
        }
        catch (std::exception& e)
        {
            spdlog::get("cachet")->warn(
                "purging unreadable entry {}: {}", key, e.what());
            stale = true;
        }
        if (stale)
        {
            store.remove(key);
            ++purged;
        }
    }
    return purged;
}

static size_t
clear_entries(sqlite_blob_store& store)
{
    auto keys = store.list_keys();
    for (auto const& key : keys)
        store.remove(key);
    return keys.size();
}

int
main(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    // clang-format off
    desc.add_options()
        ("help", "show help message")
        ("config-file", po::value<string>(), "specify the configuration file to use")
        ("list", "list the persisted entries")
        ("purge-expired", "remove stale and unreadable entries")
        ("clear", "remove all persisted entries")
    ;
    // clang-format on

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
    po::notify(vm);

    if (vm.count("help"))
    {
        std::cout << desc;
        return 0;
    }

    initialize_logging();

    try
    {
        optional<file_path> config_path;
        if (vm.count("config-file"))
        {
            config_path = vm["config-file"].as<string>();
        }
        else
        {
            config_path = search_in_path(
                get_config_search_path("cachet"), "config.json");
        }

        sync_config config;
        if (config_path)
            config = read_sync_config_file(*config_path);
        if (config.log_level)
            set_log_level(*config.log_level);

        sqlite_blob_store store(
            config.persistence ? *config.persistence
                               : sqlite_blob_store_config());
        auto now = system_clock_now();

        if (vm.count("list"))
            list_entries(store, now);

        if (vm.count("purge-expired"))
        {
            auto purged = purge_expired_entries(store, now);
            spdlog::get("cachet")->info("purged {} entries", purged);
        }

        if (vm.count("clear"))
        {
            auto cleared = clear_entries(store);
            spdlog::get("cachet")->info("cleared {} entries", cleared);
        }

        auto info = store.get_summary_info();
        std::cout << info.path << ": " << info.entry_count << " entries, "
                  << info.total_size << " bytes\n";
    }
    catch (std::exception& e)
    {
        std::cerr << "cachet-inspect: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

#include <cachet/sync/core.hpp>

#include <fstream>
#include <functional>

#include <cppcoro/async_manual_reset_event.hpp>
#include <cppcoro/sync_wait.hpp>
#include <cppcoro/when_all.hpp>
#include <cppcoro/when_all_ready.hpp>

#include <cachet/caching/sqlite_blob_store.hpp>
#include <cachet/core/testing.hpp>
#include <cachet/remote/mock_service.hpp>

using namespace cachet;

using std::chrono::milliseconds;

namespace {

// "item" holds at most two entries for a second and is durable.
// Mutating an item invalidates "item:list".
sync_config
make_test_config()
{
    namespace_policy item;
    item.prefix = "item";
    item.ttl = milliseconds(1000);
    item.max_size = 2;
    item.durable = true;
    item.dependents = {"item:list"};

    namespace_policy item_list;
    item_list.prefix = "item:list";
    item_list.ttl = milliseconds(1000);
    item_list.max_size = 10;

    sync_config config;
    config.namespaces = std::vector<namespace_policy>{item, item_list};
    return config;
}

sync_config
make_persistent_test_config(string const& dir)
{
    auto config = make_test_config();
    sqlite_blob_store_config persistence;
    persistence.directory = dir;
    config.persistence = persistence;
    return config;
}

remote_operation
make_counting_loader(int& count, dynamic value)
{
    return [&count, value](milliseconds) -> cppcoro::task<dynamic> {
        ++count;
        co_return value;
    };
}

remote_operation
make_failing_operation(int& count)
{
    return [&count](milliseconds) -> cppcoro::task<dynamic> {
        ++count;
        CACHET_THROW(
            remote_call_failure() << remote_call_name_info("test_call"));
        co_return nil;
    };
}

cppcoro::task<>
release(cppcoro::async_manual_reset_event& event)
{
    event.set();
    co_return;
}

} // namespace

TEST_CASE("local cache access", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());
    REQUIRE(core.is_initialized());

    REQUIRE(core.get("item:1") == none);
    core.set("item:1", dynamic("A"));
    REQUIRE(core.get("item:1") == some(dynamic("A")));

    // Entries expire after their namespace's TTL.
    clock.advance(milliseconds(1001));
    REQUIRE(core.get("item:1") == none);

    // An explicit TTL overrides the namespace's.
    core.set("item:1", dynamic("A"), milliseconds(5000));
    clock.advance(milliseconds(2000));
    REQUIRE(core.get("item:1") == some(dynamic("A")));

    REQUIRE(core.remove("item:1"));
    REQUIRE(!core.remove("item:1"));
    REQUIRE(core.get("item:1") == none);

    // Keys outside all namespaces use the default policy (five minutes).
    core.set("misc", dynamic(integer(1)));
    clock.advance(milliseconds(299000));
    REQUIRE(core.get("misc") == some(dynamic(integer(1))));
    clock.advance(milliseconds(2000));
    REQUIRE(core.get("misc") == none);
}

TEST_CASE("LRU eviction", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    core.set("item:1", dynamic("A"));
    core.set("item:2", dynamic("B"));
    core.set("item:3", dynamic("C"));

    REQUIRE(core.get("item:1") == none);
    REQUIRE(core.get("item:2") == some(dynamic("B")));
    REQUIRE(core.get("item:3") == some(dynamic("C")));
    REQUIRE(core.get_stats().eviction_count == 1);

    // Reading item:2 makes item:3 the next to go.
    core.get("item:2");
    core.set("item:4", dynamic("D"));
    REQUIRE(core.get("item:3") == none);
    REQUIRE(core.get("item:2") == some(dynamic("B")));
}

TEST_CASE("invalidation", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    core.set("item:1", dynamic("A"));
    core.set("item:list:all", dynamic("all"));
    core.set("item:list:recent", dynamic("recent"));
    core.set("itemized", dynamic("other"));

    core.invalidate({"item:1", "nothing:here"});
    REQUIRE(core.get("item:1") == none);

    REQUIRE(core.invalidate_namespace("item:list") == 2);
    REQUIRE(core.get("item:list:all") == none);
    REQUIRE(core.get("item:list:recent") == none);
    INFO("Invalidation is by namespace prefix, not by string prefix.")
    REQUIRE(core.get("itemized") == some(dynamic("other")));

    core.clear();
    REQUIRE(core.get("itemized") == none);
    REQUIRE(core.get_stats().size == 0);
}

TEST_CASE("reading through the cache", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    int load_count = 0;
    auto loader = make_counting_loader(load_count, dynamic("loaded"));

    REQUIRE(cppcoro::sync_wait(core.read("item:1", loader)) == "loaded");
    REQUIRE(load_count == 1);
    REQUIRE(cppcoro::sync_wait(core.read("item:1", loader)) == "loaded");
    REQUIRE(load_count == 1);
    REQUIRE(core.get("item:1") == some(dynamic("loaded")));

    // Once the entry expires, it's loaded again.
    clock.advance(milliseconds(1001));
    REQUIRE(cppcoro::sync_wait(core.read("item:1", loader)) == "loaded");
    REQUIRE(load_count == 2);

    // skip_cache forces a load, and the result replaces the cached value.
    read_options fresh;
    fresh.skip_cache = true;
    auto reloader = make_counting_loader(load_count, dynamic("reloaded"));
    REQUIRE(
        cppcoro::sync_wait(core.read("item:1", reloader, fresh))
        == "reloaded");
    REQUIRE(load_count == 3);
    REQUIRE(core.get("item:1") == some(dynamic("reloaded")));

    // ttl_override controls how long the loaded value lives.
    read_options short_lived;
    short_lived.ttl_override = milliseconds(10);
    cppcoro::sync_wait(core.read("item:2", loader, short_lived));
    clock.advance(milliseconds(11));
    REQUIRE(core.get("item:2") == none);
}

TEST_CASE("read timeouts", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    auto config = make_test_config();
    config.default_timeout = milliseconds(2500);
    core.reset(config, nullptr, clock.function());

    std::vector<milliseconds> timeouts;
    auto loader = [&](milliseconds timeout) -> cppcoro::task<dynamic> {
        timeouts.push_back(timeout);
        co_return dynamic(true);
    };

    cppcoro::sync_wait(core.read("item:1", loader));
    read_options options;
    options.timeout = milliseconds(40);
    cppcoro::sync_wait(core.read("item:2", loader, options));

    REQUIRE(
        timeouts
        == std::vector<milliseconds>{milliseconds(2500), milliseconds(40)});

    // A timed out load is just a failure: nothing is stored.
    mock_remote_service service(
        {make_mock_timeout(remote_request{"get_item", dynamic(integer(3))})});
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(core.read(
            "item:3",
            make_remote_loader(
                service, remote_request{"get_item", dynamic(integer(3))}))),
        remote_call_timeout);
    REQUIRE(core.get("item:3") == none);
}

TEST_CASE("concurrent reads are coalesced", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    cppcoro::async_manual_reset_event event;
    int load_count = 0;
    auto loader = [&](milliseconds) -> cppcoro::task<dynamic> {
        ++load_count;
        co_await event;
        co_return dynamic("nine");
    };

    std::vector<cppcoro::task<dynamic>> reads;
    for (int i = 0; i != 5; ++i)
        reads.push_back(core.read("item:9", loader));

    auto [values, _] = cppcoro::sync_wait(cppcoro::when_all(
        cppcoro::when_all(std::move(reads)), release(event)));

    REQUIRE(load_count == 1);
    REQUIRE(values.size() == 5);
    for (auto const& value : values)
        REQUIRE(value == "nine");
    REQUIRE(core.get("item:9") == some(dynamic("nine")));
    REQUIRE(core.internals().coalescer.pending_count() == 0);
}

TEST_CASE("coalesced read failures", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    cppcoro::async_manual_reset_event event;
    int load_count = 0;
    auto loader = [&](milliseconds) -> cppcoro::task<dynamic> {
        ++load_count;
        co_await event;
        CACHET_THROW(
            remote_call_failure() << remote_call_name_info("get_item"));
        co_return nil;
    };

    auto [a, b, _] = cppcoro::sync_wait(cppcoro::when_all_ready(
        core.read("item:9", loader),
        core.read("item:9", loader),
        release(event)));

    REQUIRE(load_count == 1);
    REQUIRE_THROWS_AS(a.result(), remote_call_failure);
    REQUIRE_THROWS_AS(b.result(), remote_call_failure);
    REQUIRE(core.get("item:9") == none);

    // The failure isn't remembered, so the next read tries again.
    int retry_count = 0;
    REQUIRE(
        cppcoro::sync_wait(core.read(
            "item:9", make_counting_loader(retry_count, dynamic("ok"))))
        == "ok");
    REQUIRE(retry_count == 1);
}

TEST_CASE("successful mutation", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    core.set("item:1", dynamic{{"title", "old"}, {"pages", integer(10)}});
    core.set("item:list:all", dynamic("stale list"));
    core.set("other:1", dynamic("unrelated"));

    optional<dynamic> seen_during_mutation;
    auto mutation = [&](milliseconds) -> cppcoro::task<dynamic> {
        seen_during_mutation = core.get("item:1");
        co_return dynamic{
            {"title", "new"}, {"pages", integer(10)}, {"version", integer(2)}};
    };

    auto confirmed = cppcoro::sync_wait(
        core.mutate("item:1", dynamic{{"title", "new"}}, mutation));

    INFO("The patched value is visible while the mutation is in flight.")
    REQUIRE(
        seen_during_mutation
        == some(dynamic{{"title", "new"}, {"pages", integer(10)}}));

    INFO("The confirmed value replaces it.")
    REQUIRE(
        confirmed
        == dynamic{
            {"title", "new"}, {"pages", integer(10)}, {"version", integer(2)}});
    REQUIRE(core.get("item:1") == some(confirmed));

    INFO("Dependent namespaces are invalidated.")
    REQUIRE(core.get("item:list:all") == none);
    REQUIRE(core.get("other:1") == some(dynamic("unrelated")));

    INFO("The confirmed value gets the namespace TTL.")
    clock.advance(milliseconds(1000));
    REQUIRE(core.get("item:1") == some(confirmed));
}

TEST_CASE("failed mutation rollback", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    core.set("item:1", dynamic{{"title", "old"}});
    core.set("item:list:all", dynamic("list"));
    core.get("item:1");
    auto before = core.internals().store.peek("item:1", clock.now);
    REQUIRE(before);

    int attempt_count = 0;
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(core.mutate(
            "item:1",
            dynamic{{"title", "new"}},
            make_failing_operation(attempt_count))),
        remote_call_failure);

    // No retries.
    REQUIRE(attempt_count == 1);

    auto after = core.internals().store.peek("item:1", clock.now);
    REQUIRE(after);
    REQUIRE(*after == *before);
    REQUIRE(core.get("item:1") == some(dynamic{{"title", "old"}}));

    // Nothing is invalidated.
    REQUIRE(core.get("item:list:all") == some(dynamic("list")));
}

TEST_CASE("failed mutation of an uncached key", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    int attempt_count = 0;
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(core.mutate(
            "item:1",
            dynamic{{"title", "new"}},
            make_failing_operation(attempt_count))),
        remote_call_failure);
    REQUIRE(core.get("item:1") == none);

    // A successful mutation of an uncached key just stores the result.
    int count = 0;
    REQUIRE(
        cppcoro::sync_wait(core.mutate(
            "item:1",
            dynamic{{"title", "new"}},
            make_counting_loader(count, dynamic{{"title", "confirmed"}})))
        == dynamic{{"title", "confirmed"}});
    REQUIRE(core.get("item:1") == some(dynamic{{"title", "confirmed"}}));
}

TEST_CASE("rollback yields to newer writes", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    core.set("item:1", dynamic{{"title", "old"}});

    auto mutation = [&](milliseconds) -> cppcoro::task<dynamic> {
        // Someone else writes a fresh value before the mutation fails.
        core.set("item:1", dynamic{{"title", "fresh"}});
        CACHET_THROW(remote_call_failure());
        co_return nil;
    };

    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(
            core.mutate("item:1", dynamic{{"title", "new"}}, mutation)),
        remote_call_failure);
    REQUIRE(core.get("item:1") == some(dynamic{{"title", "fresh"}}));
}

TEST_CASE("speculative TTL", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    auto config = make_test_config();
    config.speculative_ttl = milliseconds(100);
    core.reset(config, nullptr, clock.function());

    core.set("item:1", dynamic("old"), milliseconds(10000));

    optional<dynamic> seen_later;
    auto mutation = [&](milliseconds) -> cppcoro::task<dynamic> {
        clock.advance(milliseconds(150));
        seen_later = core.get("item:1");
        co_return dynamic("confirmed");
    };
    cppcoro::sync_wait(core.mutate("item:1", dynamic("new"), mutation));

    REQUIRE(seen_later == none);
    REQUIRE(core.get("item:1") == some(dynamic("confirmed")));
}

TEST_CASE("rollback after the speculative value expires", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    auto config = make_test_config();
    config.speculative_ttl = milliseconds(100);
    core.reset(config, nullptr, clock.function());

    core.set("item:1", dynamic("old"), milliseconds(10000));

    optional<dynamic> seen_later;
    auto mutation = [&](milliseconds) -> cppcoro::task<dynamic> {
        clock.advance(milliseconds(150));
        seen_later = core.get("item:1");
        CACHET_THROW(remote_call_failure());
        co_return nil;
    };
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(core.mutate("item:1", dynamic("new"), mutation)),
        remote_call_failure);

    REQUIRE(seen_later == none);
    REQUIRE(core.get("item:1") == some(dynamic("old")));
}

TEST_CASE("rollback after the speculative value is evicted", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    core.set("item:1", dynamic("old"));

    auto mutation = [&](milliseconds) -> cppcoro::task<dynamic> {
        // "item" holds two entries, so this pushes out the speculative value.
        core.set("item:2", dynamic("B"));
        core.set("item:3", dynamic("C"));
        CACHET_THROW(remote_call_failure());
        co_return nil;
    };
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(core.mutate("item:1", dynamic("new"), mutation)),
        remote_call_failure);

    REQUIRE(core.get("item:1") == some(dynamic("old")));
}

TEST_CASE("removals during a failed mutation stick", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    auto fail_after = [&](std::function<void()> action) {
        return [action](milliseconds) -> cppcoro::task<dynamic> {
            action();
            CACHET_THROW(remote_call_failure());
            co_return nil;
        };
    };

    core.set("item:1", dynamic("old"));
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(core.mutate(
            "item:1",
            dynamic("new"),
            fail_after([&] { core.remove("item:1"); }))),
        remote_call_failure);
    REQUIRE(core.get("item:1") == none);

    core.set("item:1", dynamic("old"));
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(core.mutate(
            "item:1",
            dynamic("new"),
            fail_after([&] { core.invalidate({"item:1"}); }))),
        remote_call_failure);
    REQUIRE(core.get("item:1") == none);

    core.set("item:1", dynamic("old"));
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(core.mutate(
            "item:1",
            dynamic("new"),
            fail_after([&] { core.invalidate_namespace("item"); }))),
        remote_call_failure);
    REQUIRE(core.get("item:1") == none);

    core.set("item:1", dynamic("old"));
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(core.mutate(
            "item:1", dynamic("new"), fail_after([&] { core.clear(); }))),
        remote_call_failure);
    REQUIRE(core.get("item:1") == none);

    INFO("A removal counts even if the speculative value is already gone.")
    core.set("item:1", dynamic("old"));
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(core.mutate(
            "item:1",
            dynamic("new"),
            fail_after([&] {
                core.set("item:2", dynamic("B"));
                core.set("item:3", dynamic("C"));
                REQUIRE(!core.remove("item:1"));
            }))),
        remote_call_failure);
    REQUIRE(core.get("item:1") == none);

    INFO("Removals from before the mutation started don't count.")
    core.set("item:1", dynamic("old"));
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(core.mutate(
            "item:1", dynamic("new"), fail_after([] {}))),
        remote_call_failure);
    REQUIRE(core.get("item:1") == some(dynamic("old")));
    REQUIRE(core.internals().mutations.empty());
}

TEST_CASE("loads that overrun their timeout", "[sync][core]")
{
    cppcoro::async_manual_reset_event event;
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    int load_count = 0;
    auto loader = [&](milliseconds) -> cppcoro::task<dynamic> {
        ++load_count;
        co_await event;
        co_return dynamic("late");
    };

    read_options options;
    options.timeout = milliseconds(20);
    try
    {
        cppcoro::sync_wait(core.read("item:1", loader, options));
        FAIL("no exception thrown");
    }
    catch (remote_call_timeout& e)
    {
        REQUIRE(get_required_error_info<remote_call_timeout_ms_info>(e) == 20);
    }
    REQUIRE(load_count == 1);
    REQUIRE(core.get("item:1") == none);
    REQUIRE(core.internals().coalescer.pending_count() == 0);
    REQUIRE(core.internals().timeouts.abandoned_count() == 1);

    INFO("The next read starts a fresh load.")
    int retry_count = 0;
    REQUIRE(
        cppcoro::sync_wait(core.read(
            "item:1", make_counting_loader(retry_count, dynamic("fresh"))))
        == "fresh");
    REQUIRE(retry_count == 1);

    INFO("The abandoned load's result is discarded.")
    event.set();
    REQUIRE(core.get("item:1") == some(dynamic("fresh")));
}

TEST_CASE("mutations that overrun their timeout", "[sync][core]")
{
    cppcoro::async_manual_reset_event event;
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    core.set("item:1", dynamic("old"));

    auto mutation = [&](milliseconds) -> cppcoro::task<dynamic> {
        co_await event;
        co_return dynamic("late");
    };
    mutate_options options;
    options.timeout = milliseconds(20);
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(
            core.mutate("item:1", dynamic("new"), mutation, options)),
        remote_call_timeout);
    REQUIRE(core.get("item:1") == some(dynamic("old")));

    event.set();
    REQUIRE(core.get("item:1") == some(dynamic("old")));
}

namespace {

// a remote service that holds every call until :event is set
struct gated_remote_service : remote_service
{
    cppcoro::async_manual_reset_event event;
    int call_count = 0;

    cppcoro::task<dynamic>
    call(remote_request request, milliseconds) override
    {
        ++call_count;
        co_await event;
        co_return dynamic(request.name);
    }
};

cppcoro::task<>
release_service(gated_remote_service& service)
{
    service.event.set();
    co_return;
}

} // namespace

TEST_CASE("remote calls are coalesced", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    gated_remote_service service;
    auto [a, b, c, _] = cppcoro::sync_wait(cppcoro::when_all(
        core.call(
            service,
            remote_request{
                "search", dynamic{{"q", "dune"}, {"n", integer(5)}}}),
        core.call(
            service,
            remote_request{
                "search", dynamic{{"n", integer(5)}, {"q", "dune"}}}),
        core.call(service, remote_request{"search", dynamic{{"q", "emma"}}}),
        release_service(service)));

    INFO("Calls with the same signature share one remote call.")
    REQUIRE(service.call_count == 2);
    REQUIRE(a == "search");
    REQUIRE(b == "search");
    REQUIRE(c == "search");

    INFO("Results of calls aren't cached.")
    REQUIRE(core.get_stats().size == 0);
}

TEST_CASE("remote calls that overrun their timeout", "[sync][core]")
{
    gated_remote_service service;
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(core.call(
            service, remote_request{"search", nil}, milliseconds(20))),
        remote_call_timeout);
    REQUIRE(core.internals().coalescer.pending_count() == 0);

    service.event.set();
    REQUIRE(service.call_count == 1);
    REQUIRE(
        cppcoro::sync_wait(
            core.call(service, remote_request{"search", nil}))
        == "search");
    REQUIRE(service.call_count == 2);
}

TEST_CASE("using a core before it's reset", "[sync][core]")
{
    sync_core core;
    REQUIRE(!core.is_initialized());

    REQUIRE_THROWS_AS(core.get("item:1"), internal_check_failed);
    REQUIRE_THROWS_AS(core.set("item:1", dynamic("A")), internal_check_failed);
    REQUIRE_THROWS_AS(core.clear(), internal_check_failed);
    REQUIRE_THROWS_AS(core.get_stats(), internal_check_failed);

    int load_count = 0;
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(core.read(
            "item:1", make_counting_loader(load_count, dynamic("A")))),
        internal_check_failed);
    REQUIRE_THROWS_AS(
        cppcoro::sync_wait(core.preload({preload_task{
            "item:1", make_counting_loader(load_count, dynamic("A"))}})),
        internal_check_failed);
    REQUIRE(load_count == 0);
}

TEST_CASE("reading via a remote service", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    mock_remote_service service(
        {make_mock_response(
            remote_request{"get_item", dynamic{{"id", integer(1)}}},
            dynamic{{"title", "Dune"}})});
    auto loader = make_remote_loader(
        service, remote_request{"get_item", dynamic{{"id", integer(1)}}});

    REQUIRE(
        cppcoro::sync_wait(core.read("item:1", loader))
        == dynamic{{"title", "Dune"}});
    // The second read is served from the cache, so the script isn't
    // exhausted.
    REQUIRE(
        cppcoro::sync_wait(core.read("item:1", loader))
        == dynamic{{"title", "Dune"}});
    REQUIRE(service.is_complete());
    REQUIRE(service.call_count() == 1);
}

TEST_CASE("batch operations", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    core.batch_set(
        {batch_set_item{"a:1", dynamic(integer(1)), none},
         batch_set_item{"a:2", dynamic(integer(2)), some(milliseconds(10))}});
    clock.advance(milliseconds(20));

    auto results = core.batch_get({"a:1", "a:2", "a:3"});
    REQUIRE(results.size() == 3);
    REQUIRE(results[0].key == "a:1");
    REQUIRE(results[0].value == some(dynamic(integer(1))));
    REQUIRE(results[1].key == "a:2");
    REQUIRE(results[1].value == none);
    REQUIRE(results[2].key == "a:3");
    REQUIRE(results[2].value == none);

    auto stats = core.get_stats();
    REQUIRE(stats.hits == 1);
    REQUIRE(stats.misses == 2);
}

TEST_CASE("preloading", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    core.reset(make_test_config(), nullptr, clock.function());

    core.set("p:cached", dynamic("already here"));

    std::vector<string> start_order;
    auto make_loader = [&](string key, bool fail) -> remote_operation {
        return [&start_order, key, fail](
                   milliseconds) -> cppcoro::task<dynamic> {
            start_order.push_back(key);
            if (fail)
            {
                CACHET_THROW(
                    remote_call_failure() << remote_call_name_info(key));
            }
            co_return dynamic(key);
        };
    };

    auto summary = cppcoro::sync_wait(core.preload(
        {preload_task{"p:low", make_loader("p:low", false), 1},
         preload_task{"p:cached", make_loader("p:cached", false), 5},
         preload_task{"p:broken", make_loader("p:broken", true), 3},
         preload_task{"p:high", make_loader("p:high", false), 10},
         preload_task{"p:also_low", make_loader("p:also_low", false), 1}}));

    preload_summary expected;
    expected.loaded = 3;
    expected.skipped = 1;
    expected.failed = 1;
    REQUIRE(summary == expected);

    INFO("Loaders start in order of priority (and order given for ties).")
    REQUIRE(
        start_order
        == std::vector<string>{"p:high", "p:broken", "p:low", "p:also_low"});

    REQUIRE(core.get("p:high") == some(dynamic("p:high")));
    REQUIRE(core.get("p:low") == some(dynamic("p:low")));
    REQUIRE(core.get("p:broken") == none);
    REQUIRE(core.get("p:cached") == some(dynamic("already here")));
}

TEST_CASE("statistics", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    auto config = make_test_config();
    config.top_key_count = 2;
    core.reset(config, nullptr, clock.function());

    auto empty = core.get_stats();
    REQUIRE(empty.total_requests == 0);
    REQUIRE(empty.hit_rate == 0);
    REQUIRE(empty.miss_rate == 0);
    REQUIRE(empty.size == 0);
    REQUIRE(empty.memory_usage == 0);
    REQUIRE(empty.top_accessed_keys.empty());

    core.set("a", dynamic("x"));
    core.set("b", dynamic("y"));
    core.set("c", dynamic("z"));
    core.get("b");
    core.get("b");
    core.get("c");
    core.get("missing");

    auto stats = core.get_stats();
    REQUIRE(stats.hits == 3);
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.total_requests == 4);
    REQUIRE(stats.hit_rate == Approx(75));
    REQUIRE(stats.miss_rate == Approx(25));
    REQUIRE(stats.size == 3);
    REQUIRE(stats.eviction_count == 0);
    REQUIRE(stats.memory_usage > 0);
    REQUIRE(
        stats.top_accessed_keys
        == std::vector<key_access_count>{{"b", 3}, {"c", 2}});

    // Statistics are read-only.
    REQUIRE(core.get_stats().hits == 3);

    // Stale entries don't count toward the size.
    clock.advance(milliseconds(400000));
    REQUIRE(core.get_stats().size == 0);
    REQUIRE(core.get_stats().memory_usage == 0);
}

TEST_CASE("idle processing", "[sync][core]")
{
    manual_clock clock;
    sync_core core;
    auto config = make_test_config();
    config.sweep_interval = milliseconds(5000);
    core.reset(config, nullptr, clock.function());

    core.set("item:1", dynamic("A"));
    clock.advance(milliseconds(2000));

    // The stale entry lingers until the sweep is due.
    core.do_idle_processing();
    REQUIRE(core.internals().store.size() == 1);
    clock.advance(milliseconds(3000));
    core.do_idle_processing();
    REQUIRE(core.internals().store.size() == 0);

    core.set("item:2", dynamic("B"));
    clock.advance(milliseconds(1001));
    REQUIRE(core.sweep_expired() == 1);
    REQUIRE(core.sweep_expired() == 0);
}

TEST_CASE("persistence across restarts", "[sync][core]")
{
    auto dir = string("sync_core_persistence");
    reset_directory(dir);
    auto config = make_persistent_test_config(dir);

    manual_clock clock;
    {
        sync_core core;
        core.reset(config, nullptr, clock.function());
        core.set("item:1", dynamic{{"title", "Dune"}});
        core.set("item:list:all", dynamic("not durable"));
        core.set("misc", dynamic("not durable either"));
    }

    {
        sqlite_blob_store store(*config.persistence);
        REQUIRE(store.list_keys() == std::vector<string>{"item:1"});
    }

    {
        sync_core core;
        core.reset(config, nullptr, clock.function());
        REQUIRE(core.get("item:1") == some(dynamic{{"title", "Dune"}}));
        REQUIRE(core.get("item:list:all") == none);
        REQUIRE(core.get("misc") == none);

        // Removals reach the store too.
        core.remove("item:1");
        sqlite_blob_store store(*config.persistence);
        REQUIRE(store.list_keys().empty());
    }
}

TEST_CASE("stale entries aren't restored", "[sync][core]")
{
    auto dir = string("sync_core_persistence");
    reset_directory(dir);
    auto config = make_persistent_test_config(dir);

    manual_clock clock;
    {
        sync_core core;
        core.reset(config, nullptr, clock.function());
        core.set("item:1", dynamic("A"));
        core.set("item:2", dynamic("B"), milliseconds(60000));
    }

    clock.advance(milliseconds(5000));
    {
        sync_core core;
        core.reset(config, nullptr, clock.function());
        REQUIRE(core.get("item:1") == none);
        REQUIRE(core.get("item:2") == some(dynamic("B")));
    }

    sqlite_blob_store store(*config.persistence);
    REQUIRE(store.list_keys() == std::vector<string>{"item:2"});
}

TEST_CASE("speculative values aren't persisted", "[sync][core]")
{
    auto dir = string("sync_core_persistence");
    reset_directory(dir);
    auto config = make_persistent_test_config(dir);

    manual_clock clock;
    sync_core core;
    core.reset(config, nullptr, clock.function());
    core.set("item:1", dynamic("old"));

    optional<string> persisted_during_mutation;
    auto mutation = [&](milliseconds) -> cppcoro::task<dynamic> {
        sqlite_blob_store store(*config.persistence);
        persisted_during_mutation = store.find("item:1");
        CACHET_THROW(remote_call_failure());
        co_return nil;
    };
    REQUIRE_THROWS(cppcoro::sync_wait(
        core.mutate("item:1", dynamic("speculative"), mutation)));

    REQUIRE(persisted_during_mutation);
    REQUIRE(
        decode_cache_entry(*persisted_during_mutation).value
        == dynamic("old"));
}

TEST_CASE("clearing removes persisted entries", "[sync][core]")
{
    auto dir = string("sync_core_persistence");
    reset_directory(dir);
    auto config = make_persistent_test_config(dir);

    manual_clock clock;
    sync_core core;
    core.reset(config, nullptr, clock.function());
    core.set("item:1", dynamic("A"));
    core.clear();
    core.flush();

    sqlite_blob_store store(*config.persistence);
    REQUIRE(store.list_keys().empty());
}

TEST_CASE("evictions reach the blob store", "[sync][core]")
{
    auto dir = string("sync_core_persistence");
    reset_directory(dir);
    auto config = make_persistent_test_config(dir);

    manual_clock clock;
    sync_core core;
    core.reset(config, nullptr, clock.function());
    core.set("item:1", dynamic("A"));
    core.set("item:2", dynamic("B"));
    core.set("item:3", dynamic("C"));

    sqlite_blob_store store(*config.persistence);
    REQUIRE(store.list_keys() == std::vector<string>{"item:2", "item:3"});
}

TEST_CASE("periodic snapshots", "[sync][core]")
{
    auto dir = string("sync_core_persistence");
    reset_directory(dir);
    auto config = make_persistent_test_config(dir);
    config.snapshot_interval = milliseconds(100);

    manual_clock clock;
    sync_core core;
    core.reset(config, nullptr, clock.function());

    // Write something behind the core's back, so a snapshot can be
    // recognized by its removal.
    {
        sqlite_blob_store store(*config.persistence);
        store.write("item:bogus", "x");
    }

    core.do_idle_processing();
    {
        sqlite_blob_store store(*config.persistence);
        REQUIRE(store.find("item:bogus"));
    }

    clock.advance(milliseconds(100));
    core.do_idle_processing();
    {
        sqlite_blob_store store(*config.persistence);
        REQUIRE(!store.find("item:bogus"));
    }
}

TEST_CASE("unusable persistence", "[sync][core]")
{
    // A store that can't be opened just means running without persistence.
    auto dir = string("sync_core_unusable");
    reset_directory(dir);
    sync_config config = make_test_config();
    sqlite_blob_store_config persistence;
    persistence.directory = dir + "/entries_dir_that_is_a_file";
    {
        std::ofstream blocker(*persistence.directory);
        blocker << "x";
    }
    config.persistence = persistence;

    manual_clock clock;
    sync_core core;
    REQUIRE_NOTHROW(core.reset(config, nullptr, clock.function()));
    core.set("item:1", dynamic("A"));
    REQUIRE(core.get("item:1") == some(dynamic("A")));
}

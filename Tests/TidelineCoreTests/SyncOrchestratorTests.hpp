#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <iostream>

namespace sync_tests {

using namespace std::chrono_literals;
using namespace tideline_tests;
using tideline::operation_kind;
using tideline::sync_event_type;
using tideline::sync_status;

// ============================================================================
// test_debounced_auto_sync: queued writes go out once the debounce elapses
// ============================================================================

void test_debounced_auto_sync() {
    std::cout << "  test_debounced_auto_sync..." << std::flush;

    sync_fixture f;
    assert(f.orchestrator.status() == sync_status::idle);

    auto id = f.orchestrator.queue_operation("todos", operation_kind::create, {{"title", "milk"}});
    assert(id.has_value());
    assert(f.orchestrator.pending_operations_count() == 1);
    assert(f.orchestrator.has_scheduled_sync());
    assert(f.count(sync_event_type::operation_queued) == 1);
    assert(f.last(sync_event_type::operation_queued)->operation_id == id);
    assert(f.last(sync_event_type::operation_queued)->pending_count == 1);

    f.sched->advance(999ms);
    assert(f.remote.call_count() == 0);

    f.sched->advance(1ms);
    assert(f.remote.call_count() == 1);
    assert(f.remote.calls()[0].kind == operation_kind::create);
    assert(f.remote.calls()[0].payload["title"] == "milk");
    assert(f.orchestrator.pending_operations_count() == 0);
    assert(f.orchestrator.status() == sync_status::success);

    auto completed = f.last(sync_event_type::sync_completed);
    assert(completed != nullptr);
    assert(completed->success_count == 1);
    assert(completed->error_count == 0);
    assert(completed->pending_count == 0);
    assert(!f.orchestrator.has_retry_timer());

    // Status went idle -> syncing -> success
    assert((f.statuses == std::vector<sync_status>{sync_status::idle, sync_status::syncing, sync_status::success}));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_debounce_restarts: rapid writes are batched into one pass
// ============================================================================

void test_debounce_restarts() {
    std::cout << "  test_debounce_restarts..." << std::flush;

    sync_fixture f;
    f.orchestrator.queue_operation("todos", operation_kind::create, {{"n", 1}});
    f.sched->advance(500ms);
    f.orchestrator.queue_operation("todos", operation_kind::update, {{"n", 2}}, "r2");
    f.sched->advance(600ms);
    assert(f.remote.call_count() == 0);

    f.sched->advance(400ms);
    assert(f.remote.call_count() == 2);
    assert(f.remote.calls()[0].payload["n"] == 1);
    assert(f.remote.calls()[1].payload["n"] == 2);
    assert(f.remote.calls()[1].record_id == std::optional<std::string>("r2"));
    assert(f.count(sync_event_type::sync_completed) == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_offline_suppression: nothing is sent until connectivity returns
// ============================================================================

void test_offline_suppression() {
    std::cout << "  test_offline_suppression..." << std::flush;

    sync_fixture f({}, false);
    assert(f.orchestrator.status() == sync_status::offline);
    assert(!f.orchestrator.is_online());

    f.orchestrator.queue_operation("todos", operation_kind::create, {{"title", "a"}});
    assert(!f.orchestrator.has_scheduled_sync());
    f.sched->advance(10s);
    assert(f.remote.call_count() == 0);

    f.orchestrator.sync();
    assert(f.remote.call_count() == 0);
    assert(!f.orchestrator.is_syncing());

    // A forced pass runs regardless and ends in offline
    f.orchestrator.sync(true);
    f.sched->run_pending();
    assert(f.remote.call_count() == 1);
    assert(f.orchestrator.pending_operations_count() == 0);
    assert(f.orchestrator.status() == sync_status::offline);
    assert(f.last(sync_event_type::sync_completed)->success_count == 1);

    f.orchestrator.queue_operation("todos", operation_kind::create, {{"title", "b"}});
    f.set_online(true);
    assert(f.orchestrator.status() == sync_status::idle);
    assert(f.last(sync_event_type::connectivity_changed)->is_online);
    assert(f.orchestrator.has_scheduled_sync());

    f.sched->advance(1s);
    assert(f.remote.call_count() == 2);
    assert(f.orchestrator.status() == sync_status::success);

    f.set_online(false);
    assert(f.orchestrator.status() == sync_status::offline);
    assert(!f.last(sync_event_type::connectivity_changed)->is_online);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_retry_ceiling: transient failures are retried then dropped
// ============================================================================

void test_retry_ceiling() {
    std::cout << "  test_retry_ceiling..." << std::flush;

    sync_fixture f;
    f.remote.fail_always(transient_error());

    auto id = f.orchestrator.queue_operation("todos", operation_kind::create, {{"title", "doomed"}});
    f.sched->advance(1s);
    assert(f.remote.call_count() == 1);
    assert(f.orchestrator.pending_operations()[0].retry_count == 1);
    assert(f.orchestrator.status() == sync_status::error);
    assert(f.orchestrator.has_retry_timer());

    // Backoff is seeded by the average retry count: 2s * 2^1
    f.sched->advance(3999ms);
    assert(f.remote.call_count() == 1);
    f.sched->advance(1ms);
    assert(f.remote.call_count() == 2);
    assert(f.orchestrator.pending_operations()[0].retry_count == 2);

    // 2s * 2^2
    f.sched->advance(8s);
    assert(f.remote.call_count() == 3);
    assert(f.orchestrator.pending_operations_count() == 0);

    auto dropped = f.last(sync_event_type::operation_dropped);
    assert(dropped != nullptr);
    assert(dropped->operation_id == id);
    assert(dropped->reason == "max_retries");

    auto completed = f.last(sync_event_type::sync_completed);
    assert(completed->error_count == 1);
    assert(completed->success_count == 0);
    assert(f.count(sync_event_type::sync_completed) == 3);

    // Nothing left to retry
    f.sched->advance(60s);
    assert(f.remote.call_count() == 3);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_mixed_pass: failures do not stop the rest of the snapshot
// ============================================================================

void test_mixed_pass() {
    std::cout << "  test_mixed_pass..." << std::flush;

    sync_fixture f;
    f.remote.fail_next(1, transient_error());

    auto failing = f.orchestrator.queue_operation("todos", operation_kind::create, {{"n", 1}});
    f.orchestrator.queue_operation("todos", operation_kind::remove, nullptr, "r9");
    f.sched->advance(1s);

    assert(f.remote.call_count() == 2);
    assert(f.remote.calls()[1].kind == operation_kind::remove);
    assert(f.orchestrator.pending_operations_count() == 1);
    assert(f.orchestrator.pending_operations()[0].id == *failing);

    auto completed = f.last(sync_event_type::sync_completed);
    assert(completed->success_count == 1);
    assert(completed->error_count == 1);
    assert(completed->pending_count == 1);

    // Persisted once the pass ended
    auto stored = tideline::read_json(f.store, tideline::pending_operation_store::default_key);
    assert(stored->size() == 1);
    assert((*stored)[0]["retry_count"] == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_failure_classification: conflict / validation / auth handling
// ============================================================================

void test_failure_classification() {
    std::cout << "  test_failure_classification..." << std::flush;

    {
        sync_fixture f;
        f.remote.fail_next(1, conflict_error());
        f.orchestrator.queue_operation("todos", operation_kind::create, {{"id", "dup"}});
        f.sched->advance(1s);

        assert(f.orchestrator.pending_operations_count() == 0);
        auto dropped = f.last(sync_event_type::operation_dropped);
        assert(dropped != nullptr);
        assert(dropped->reason.rfind("conflict", 0) == 0);
        assert(f.orchestrator.status() == sync_status::error);
    }

    {
        sync_fixture f;
        f.remote.fail_next(1, std::make_exception_ptr(tideline::remote_error::from_status(422)));
        f.orchestrator.queue_operation("todos", operation_kind::update, {{"bad", true}}, "r1");
        f.sched->advance(1s);
        assert(f.orchestrator.pending_operations_count() == 0);
        assert(f.count(sync_event_type::operation_dropped) == 1);
    }

    {
        sync_fixture f;
        f.remote.fail_next(1, auth_error());
        auto id = f.orchestrator.queue_operation("todos", operation_kind::update, {{"done", true}}, "r1");
        f.sched->advance(1s);

        // Kept untouched, no automatic retry until re-authenticated
        assert(f.orchestrator.pending_operations_count() == 1);
        assert(f.orchestrator.pending_operations()[0].retry_count == 0);
        assert(f.count(sync_event_type::auth_required) == 1);
        assert(f.last(sync_event_type::auth_required)->operation_id == id);
        assert(f.last(sync_event_type::auth_required)->record_id == std::optional<std::string>("r1"));
        assert(!f.orchestrator.has_retry_timer());
        assert(f.orchestrator.status() == sync_status::error);

        f.orchestrator.sync();
        f.sched->run_pending();
        assert(f.remote.call_count() == 2);
        assert(f.orchestrator.pending_operations_count() == 0);
        assert(f.orchestrator.status() == sync_status::success);
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_single_flight: one pass at a time, new writes wait for the next
// ============================================================================

void test_single_flight() {
    std::cout << "  test_single_flight..." << std::flush;

    sync_fixture f;
    f.remote.set_deferred(true);

    f.orchestrator.queue_operation("todos", operation_kind::create, {{"n", 1}});
    f.orchestrator.queue_operation("todos", operation_kind::create, {{"n", 2}});
    f.sched->advance(1s);
    assert(f.orchestrator.is_syncing());
    assert(f.orchestrator.status() == sync_status::syncing);
    assert(f.remote.call_count() == 1);

    // Concurrent requests are no-ops while the pass is in flight
    f.orchestrator.sync();
    f.orchestrator.sync(true);
    assert(f.remote.call_count() == 1);

    // Enqueued during the pass: not part of this snapshot
    f.orchestrator.queue_operation("todos", operation_kind::create, {{"n", 3}});

    f.remote.complete_next();
    f.sched->run_pending();
    assert(f.remote.call_count() == 2);
    assert(f.remote.calls()[1].payload["n"] == 2);

    f.remote.complete_next();
    f.sched->run_pending();
    assert(!f.orchestrator.is_syncing());
    assert(f.remote.call_count() == 2);
    assert(f.orchestrator.pending_operations_count() == 1);
    assert(f.count(sync_event_type::sync_completed) == 1);
    assert(f.last(sync_event_type::sync_completed)->success_count == 2);

    // The third write goes out on the next pass
    f.sched->advance(1s);
    assert(f.remote.call_count() == 3);
    f.remote.complete_all();
    f.sched->run_pending();
    assert(f.orchestrator.pending_operations_count() == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_stop_abandons_pass: completions after stop() are ignored
// ============================================================================

void test_stop_abandons_pass() {
    std::cout << "  test_stop_abandons_pass..." << std::flush;

    sync_fixture f;
    f.remote.set_deferred(true);
    f.orchestrator.queue_operation("todos", operation_kind::create, {{"n", 1}});
    f.sched->advance(1s);
    assert(f.orchestrator.is_syncing());

    f.orchestrator.stop();
    assert(!f.orchestrator.is_started());
    assert(!f.orchestrator.is_syncing());
    assert(f.orchestrator.status() == sync_status::idle);
    assert(!f.orchestrator.has_periodic_timer());
    assert(!f.orchestrator.has_scheduled_sync());

    f.remote.complete_next();
    f.sched->run_pending();
    assert(f.orchestrator.pending_operations_count() == 1);
    assert(f.count(sync_event_type::sync_completed) == 0);

    assert(!f.orchestrator.queue_operation("todos", operation_kind::create, {}).has_value());

    // Restart resumes from the persisted queue
    f.remote.set_deferred(false);
    f.orchestrator.start();
    assert(f.orchestrator.pending_operations_count() == 1);
    assert(f.orchestrator.has_scheduled_sync());
    f.sched->advance(1s);
    assert(f.remote.call_count() == 2);
    assert(f.orchestrator.pending_operations_count() == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_queue_durability: a fresh orchestrator resumes persisted work
// ============================================================================

void test_queue_durability() {
    std::cout << "  test_queue_durability..." << std::flush;

    sync_fixture f({}, false);
    auto a = f.orchestrator.queue_operation("todos", operation_kind::create, {{"title", "a"}});
    auto b = f.orchestrator.queue_operation("todos", operation_kind::update, {{"title", "b"}}, "r1");
    f.orchestrator.stop();

    tideline::sync_orchestrator resumed(f.sched, f.remote, f.store, f.cache, f.monitor);
    resumed.start();
    auto ops = resumed.pending_operations();
    assert(ops.size() == 2);
    assert(ops[0].id == *a);
    assert(ops[1].id == *b);
    assert(ops[1].kind == operation_kind::update);
    assert(ops[1].record_id == std::optional<std::string>("r1"));
    assert(ops[0].queued_at == base_time());

    bool threw = false;
    try {
        resumed.queue_operation("todos", operation_kind::remove, {});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(resumed.pending_operations_count() == 2);

    // Write failures are logged; the queue keeps the operation in memory
    f.store.set_failing(true);
    assert(resumed.queue_operation("todos", operation_kind::create, {{"title", "c"}}).has_value());
    assert(resumed.pending_operations_count() == 3);
    f.store.set_failing(false);

    resumed.clear_pending_operations();
    assert(resumed.pending_operations_count() == 0);
    assert(tideline::read_json(f.store, tideline::pending_operation_store::default_key)->empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_remote_wins_conflict / test_local_retained_conflict
// ============================================================================

void test_remote_wins_conflict() {
    std::cout << "  test_remote_wins_conflict..." << std::flush;

    sync_fixture f;
    const auto t = f.sched->now();
    f.orchestrator.queue_operation("todos", operation_kind::update, {{"title", "local"}}, "r1");

    tideline::record row = {{"id", "r1"}, {"title", "remote"}, {"updated_at", tideline::format_timestamp(t + 5s)}};
    f.orchestrator.handle_realtime_change("todos", tideline::change_kind::update, row);

    assert(f.orchestrator.pending_operations_count() == 0);
    auto processed = f.last(sync_event_type::realtime_change_processed);
    assert(processed != nullptr);
    assert(processed->conflicts_resolved == 1);
    assert(processed->record_id == std::optional<std::string>("r1"));
    assert(processed->change == tideline::change_kind::update);

    // Discard is durable immediately
    assert(tideline::read_json(f.store, tideline::pending_operation_store::default_key)->empty());

    assert(f.cache.get("todos", "r1").value()["title"] == "remote");
    assert(f.orchestrator.last_sync_time("todos") == t);
    assert(!f.orchestrator.needs_sync("todos"));
    assert(f.orchestrator.needs_sync("other"));

    // The debounced pass finds nothing to send
    f.sched->advance(1s);
    assert(f.remote.call_count() == 0);

    std::cout << " OK" << std::endl;
}

void test_local_retained_conflict() {
    std::cout << "  test_local_retained_conflict..." << std::flush;

    sync_fixture f;
    const auto t = f.sched->now();
    auto id = f.orchestrator.queue_operation("todos", operation_kind::update, {{"title", "local"}}, "r1");

    tideline::record row = {{"id", "r1"}, {"title", "remote"}, {"updated_at", tideline::format_timestamp(t - 5s)}};
    f.orchestrator.handle_realtime_change("todos", tideline::change_kind::update, row);

    assert(f.orchestrator.pending_operations_count() == 1);
    assert(f.orchestrator.pending_operations()[0].id == *id);
    assert(f.last(sync_event_type::realtime_change_processed)->conflicts_resolved == 1);

    // The local write still goes out and overwrites the remote value
    f.sched->advance(1s);
    assert(f.remote.call_count() == 1);
    assert(f.remote.calls()[0].payload["title"] == "local");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_realtime_during_pass: newer remote rows discard the in-flight write
// and a write still waiting in the same pass
// ============================================================================

void test_realtime_during_pass() {
    std::cout << "  test_realtime_during_pass..." << std::flush;

    sync_fixture f;
    f.remote.set_deferred(true);
    const auto t = f.sched->now();
    f.orchestrator.queue_operation("todos", operation_kind::update, {{"title", "local a"}}, "r1");
    f.orchestrator.queue_operation("todos", operation_kind::update, {{"title", "local b"}}, "r2");

    f.sched->advance(1s);
    assert(f.orchestrator.is_syncing());
    assert(f.remote.call_count() == 1);
    assert(f.remote.calls()[0].record_id == std::optional<std::string>("r1"));

    f.orchestrator.handle_realtime_change("todos", tideline::change_kind::update,
        {{"id", "r1"}, {"title", "remote a"}, {"updated_at", tideline::format_timestamp(t + 5s)}});
    f.orchestrator.handle_realtime_change("todos", tideline::change_kind::update,
        {{"id", "r2"}, {"title", "remote b"}, {"updated_at", tideline::format_timestamp(t + 5s)}});

    assert(f.orchestrator.pending_operations_count() == 0);
    assert(f.count(sync_event_type::realtime_change_processed) == 2);
    assert(tideline::read_json(f.store, tideline::pending_operation_store::default_key)->empty());
    assert(f.orchestrator.is_syncing());

    // The in-flight call still completes; the discarded r2 write is never sent
    f.remote.complete_next();
    f.sched->run_pending();
    assert(!f.orchestrator.is_syncing());
    assert(f.remote.call_count() == 1);
    assert(f.remote.deferred_count() == 0);
    assert(f.orchestrator.status() == sync_status::success);
    auto completed = f.last(sync_event_type::sync_completed);
    assert(completed != nullptr);
    assert(completed->success_count == 1);
    assert(completed->error_count == 0);
    assert(f.count(sync_event_type::operation_dropped) == 0);

    assert(tideline::read_json(f.store, tideline::pending_operation_store::default_key)->empty());
    assert(f.cache.get("todos", "r1").value()["title"] == "remote a");
    assert(f.cache.get("todos", "r2").value()["title"] == "remote b");
    assert(!f.orchestrator.has_scheduled_sync());

    std::cout << " OK" << std::endl;
}

void test_conflict_window() {
    std::cout << "  test_conflict_window..." << std::flush;

    sync_fixture f({}, false);
    f.orchestrator.queue_operation("todos", operation_kind::update, {{"title", "local"}}, "r1");
    f.sched->advance(31s);

    tideline::record row = {{"id", "r1"}, {"updated_at", tideline::format_timestamp(f.sched->now())}};
    f.orchestrator.handle_realtime_change("todos", tideline::change_kind::update, row);
    assert(f.orchestrator.pending_operations_count() == 1);
    assert(f.last(sync_event_type::realtime_change_processed)->conflicts_resolved == 0);

    // Other records are never candidates
    f.orchestrator.handle_realtime_change("todos", tideline::change_kind::insert,
                                          {{"id", "r2"}, {"updated_at", tideline::format_timestamp(f.sched->now())}});
    assert(f.orchestrator.pending_operations_count() == 1);

    assert(!f.orchestrator.needs_sync("todos", 10s));
    f.sched->advance(11s);
    assert(f.orchestrator.needs_sync("todos", 10s));
    assert(!f.orchestrator.needs_sync("todos"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_cache_failure: a failing cache write is reported, not fatal
// ============================================================================

void test_cache_failure() {
    std::cout << "  test_cache_failure..." << std::flush;

    sync_fixture f;
    f.store.set_failing(true);
    f.orchestrator.handle_realtime_change("todos", tideline::change_kind::insert, {{"id", "a"}});
    f.store.set_failing(false);

    assert(f.count(sync_event_type::cache_update_failed) == 1);
    assert(f.last(sync_event_type::cache_update_failed)->record_id == std::optional<std::string>("a"));
    assert(f.count(sync_event_type::realtime_change_processed) == 1);
    assert(f.orchestrator.last_sync_time("todos").has_value());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_watch_table: pushed changes flow from a channel into the cache
// ============================================================================

void test_watch_table() {
    std::cout << "  test_watch_table..." << std::flush;

    sync_fixture f;
    f.orchestrator.watch_table("owned_todos", "todos", tideline::channel_filter::parse("owner=u1"));
    f.sched->run_pending();
    assert(f.subscriptions.is_connected("owned_todos"));
    assert(f.transport.channel("realtime_todos_owned_todos") != nullptr);

    f.transport.emit("todos", tideline::change_kind::insert, {{"id", "a"}, {"owner", "u1"}});
    f.transport.emit("todos", tideline::change_kind::insert, {{"id", "b"}, {"owner", "u2"}});
    f.sched->run_pending();
    assert(f.cache.all("todos").size() == 1);
    assert(f.cache.get("todos", "a").has_value());

    f.transport.emit("todos", tideline::change_kind::remove, {{"id", "a"}, {"owner", "u1"}});
    f.sched->run_pending();
    assert(f.cache.all("todos").empty());
    assert(f.count(sync_event_type::realtime_change_processed) == 2);

    // Regaining connectivity reopens every channel
    const auto opened = f.transport.open_count();
    f.set_online(false);
    f.set_online(true);
    assert(f.transport.open_count() == opened + 1);
    assert(f.subscriptions.is_connected("owned_todos"));

    f.orchestrator.stop();
    assert(!f.subscriptions.contains("owned_todos"));
    assert(f.transport.active_count() == 0);

    // Watching needs a subscription manager
    tideline::sync_orchestrator bare(f.sched, f.remote, f.store, f.cache, f.monitor);
    bool threw = false;
    try {
        bare.watch_table("x", "todos");
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_periodic_sync: the interval timer drains what debounce did not
// ============================================================================

void test_periodic_sync() {
    std::cout << "  test_periodic_sync..." << std::flush;

    tideline::sync_config config;
    config.sync_interval = 60s;
    sync_fixture f(config);
    assert(f.orchestrator.has_periodic_timer());

    // Auth failures leave the operation without a retry timer
    f.remote.fail_next(1, auth_error());
    f.orchestrator.queue_operation("todos", operation_kind::create, {{"n", 1}});
    f.sched->advance(1s);
    assert(f.orchestrator.pending_operations_count() == 1);
    assert(!f.orchestrator.has_retry_timer());

    f.sched->advance(59s);
    assert(f.remote.call_count() == 2);
    assert(f.orchestrator.pending_operations_count() == 0);
    assert(f.orchestrator.has_periodic_timer());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_status_and_health: observers and diagnostics
// ============================================================================

void test_status_and_health() {
    std::cout << "  test_status_and_health..." << std::flush;

    sync_fixture f;
    std::vector<sync_status> late;
    auto token = f.orchestrator.observe_status([&](sync_status s) { late.push_back(s); });
    assert(late == std::vector<sync_status>{sync_status::idle});

    f.orchestrator.queue_operation("todos", operation_kind::create, {{"n", 1}});
    auto health = f.orchestrator.health_status();
    assert(health["current_status"] == "idle");
    assert(health["pending_operations"] == 1);
    assert(health["has_scheduled_sync"] == true);
    assert(health["has_sync_timer"] == true);
    assert(health["is_online"] == true);
    assert(health["config"]["max_retries"] == 3);

    f.sched->advance(1s);
    auto completed = f.last(sync_event_type::sync_completed)->to_json();
    assert(completed["type"] == "sync_completed");
    assert(completed["success_count"] == 1);
    assert(completed["remaining_operations"] == 0);

    f.orchestrator.clear_pending_operations();
    assert(f.count(sync_event_type::pending_operations_cleared) == 1);

    std::cout << " OK" << std::endl;
}

void run_all() {
    test_debounced_auto_sync();
    test_debounce_restarts();
    test_offline_suppression();
    test_retry_ceiling();
    test_mixed_pass();
    test_failure_classification();
    test_single_flight();
    test_stop_abandons_pass();
    test_queue_durability();
    test_remote_wins_conflict();
    test_local_retained_conflict();
    test_realtime_during_pass();
    test_conflict_window();
    test_cache_failure();
    test_watch_table();
    test_periodic_sync();
    test_status_and_health();
}

} // namespace sync_tests

#include <catch2/catch.hpp>
#include "config.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "memory/fact_store.hpp"
#include "turn_ledger.hpp"
#include "fake_clock.hpp"
#include "temp_db.hpp"
#include <cmath>
#include <limits>
#include <thread>

using namespace lunacore;
using namespace std::chrono_literals;

static MemoryConfig memory_config(uint32_t cap, uint32_t ttl = 15) {
    MemoryConfig cfg;
    cfg.non_pinned_cap = cap;
    cfg.pinned_cache_ttl = ttl;
    return cfg;
}

static bool has_key(const std::vector<Memory>& rows, const std::string& key) {
    for (const auto& m : rows) {
        if (m.key == key) return true;
    }
    return false;
}

// ── Upsert ───────────────────────────────────────────────────

TEST_CASE("FactStore: upsert is idempotent per key and pinned flag", "[fact_store]") {
    TempDbFile file("fs_idem");
    Database db(file.path);
    FactStore store(db, memory_config(500));

    store.upsert("name", "Carlos", 1.0, true);
    store.upsert("name", "Carlos", 1.0, true);
    store.upsert("name", "Carl", 2.0, true);

    REQUIRE(store.count(true) == 1);
    auto pinned = store.get_pinned();
    REQUIRE(pinned.size() == 1);
    REQUIRE(pinned[0].value == "Carl");
    REQUIRE(pinned[0].score == 2.0);
}

TEST_CASE("FactStore: same key may exist pinned and non-pinned", "[fact_store]") {
    TempDbFile file("fs_coexist");
    Database db(file.path);
    FactStore store(db, memory_config(500));

    store.pin("city", "Lisbon");
    store.add_non_pinned("city", "Porto");

    REQUIRE(store.count() == 2);
    REQUIRE(store.count(true) == 1);
    REQUIRE(store.count(false) == 1);
    auto pinned = store.get_pinned();
    REQUIRE(pinned.size() == 1);
    REQUIRE(pinned[0].value == "Lisbon");
}

TEST_CASE("FactStore: session id is recorded", "[fact_store]") {
    TempDbFile file("fs_session");
    Database db(file.path);
    FactStore store(db, memory_config(500));

    store.add_non_pinned("mood", "happy", 1.0, "sess-1");
    auto all = store.get_all();
    REQUIRE(all.size() == 1);
    REQUIRE(all[0].source_session_id == "sess-1");
    REQUIRE_FALSE(all[0].pinned);
    REQUIRE(all[0].created_at > 0.0);
}

TEST_CASE("FactStore: malformed writes throw and write nothing", "[fact_store]") {
    TempDbFile file("fs_invalid");
    Database db(file.path);
    FactStore store(db, memory_config(500));

    REQUIRE_THROWS_AS(store.upsert("", "v", 1.0, true), InvalidInput);
    REQUIRE_THROWS_AS(store.upsert("   ", "v", 1.0, false), InvalidInput);
    REQUIRE_THROWS_AS(store.upsert("k", "", 1.0, true), InvalidInput);
    REQUIRE_THROWS_AS(store.upsert("k", "v", -1.0, true), InvalidInput);
    REQUIRE_THROWS_AS(store.upsert("k", "v", std::nan(""), true), InvalidInput);
    REQUIRE_THROWS_AS(store.upsert("k", "v", std::numeric_limits<double>::infinity(), true),
                      InvalidInput);
    REQUIRE_THROWS_AS(store.add_non_pinned("", "v"), InvalidInput);

    REQUIRE(store.count() == 0);
}

// ── Non-pinned cap ───────────────────────────────────────────

TEST_CASE("FactStore: cap evicts oldest non-pinned rows", "[fact_store]") {
    TempDbFile file("fs_cap");
    Database db(file.path);
    FactStore store(db, memory_config(3));

    REQUIRE(store.add_non_pinned("a", "1") == 0);
    REQUIRE(store.add_non_pinned("b", "2") == 0);
    REQUIRE(store.add_non_pinned("c", "3") == 0);
    REQUIRE(store.add_non_pinned("d", "4") == 1);

    REQUIRE(store.count(false) == 3);
    auto all = store.get_all();
    REQUIRE_FALSE(has_key(all, "a"));
    REQUIRE(has_key(all, "b"));
    REQUIRE(has_key(all, "d"));
}

TEST_CASE("FactStore: non-pinned upsert enforces the cap", "[fact_store]") {
    TempDbFile file("fs_cap_upsert");
    Database db(file.path);
    FactStore store(db, memory_config(3));

    uint32_t evicted = 0;
    for (int i = 0; i < 10; i++) {
        evicted += store.upsert("k" + std::to_string(i), "v", 1.0, false);
    }

    REQUIRE(store.count(false) == 3);
    REQUIRE(evicted == 7);
    auto all = store.get_all();
    REQUIRE(has_key(all, "k7"));
    REQUIRE(has_key(all, "k9"));
    REQUIRE_FALSE(has_key(all, "k0"));
}

TEST_CASE("FactStore: pinned upsert evicts nothing", "[fact_store]") {
    TempDbFile file("fs_cap_upsert_pinned");
    Database db(file.path);
    FactStore store(db, memory_config(1));

    for (int i = 0; i < 5; i++) {
        REQUIRE(store.upsert("p" + std::to_string(i), "v", 1.0, true) == 0);
    }
    REQUIRE(store.count(true) == 5);
}

TEST_CASE("FactStore: cap never evicts pinned rows", "[fact_store]") {
    TempDbFile file("fs_cap_pinned");
    Database db(file.path);
    FactStore store(db, memory_config(2));

    store.pin("name", "Carlos");
    store.pin("birthday", "10/13/1969");
    for (int i = 0; i < 10; i++) {
        store.add_non_pinned("note" + std::to_string(i), "x");
    }

    REQUIRE(store.count(true) == 2);
    REQUIRE(store.count(false) == 2);
    auto all = store.get_all();
    REQUIRE(has_key(all, "note8"));
    REQUIRE(has_key(all, "note9"));
}

TEST_CASE("FactStore: enforce_non_pinned_cap returns rows deleted", "[fact_store]") {
    TempDbFile file("fs_enforce");
    Database db(file.path);
    FactStore store(db, memory_config(100));

    for (int i = 0; i < 6; i++) {
        store.add_non_pinned("k" + std::to_string(i), "v");
    }
    store.pin("keep", "me");

    REQUIRE(store.enforce_non_pinned_cap(10) == 0);
    REQUIRE(store.enforce_non_pinned_cap(4) == 2);
    REQUIRE(store.count(false) == 4);
    REQUIRE(store.enforce_non_pinned_cap(0) == 4);
    REQUIRE(store.count(false) == 0);
    REQUIRE(store.count(true) == 1);
}

TEST_CASE("FactStore: re-upserting a key refreshes its age", "[fact_store]") {
    TempDbFile file("fs_refresh");
    Database db(file.path);
    FactStore store(db, memory_config(2));

    store.add_non_pinned("a", "1");
    store.add_non_pinned("b", "2");
    store.add_non_pinned("a", "1 again");
    store.add_non_pinned("c", "3");

    auto all = store.get_all();
    REQUIRE(all.size() == 2);
    REQUIRE(has_key(all, "a"));
    REQUIRE(has_key(all, "c"));
    REQUIRE_FALSE(has_key(all, "b"));
}

// ── Pinned reads and cache ───────────────────────────────────

TEST_CASE("FactStore: seeded pinned facts come back in insertion order", "[fact_store]") {
    TempDbFile file("fs_seed_order");
    Database db(file.path);
    FactStore store(db, memory_config(500));

    REQUIRE(store.upsert_pinned_batch({{"name", "Carlos"}, {"birthday", "10/13/1969"}}, 3.0) == 2);

    auto pinned = store.get_pinned(50);
    REQUIRE(pinned.size() == 2);
    REQUIRE(pinned[0].key == "name");
    REQUIRE(pinned[0].value == "Carlos");
    REQUIRE(pinned[1].key == "birthday");
    REQUIRE(pinned[1].value == "10/13/1969");
    REQUIRE(pinned[0].score == 3.0);
    REQUIRE(pinned[0].created_at < pinned[1].created_at);
}

TEST_CASE("FactStore: reseeding in a new order follows the new order", "[fact_store]") {
    TempDbFile file("fs_seed_reorder");
    Database db(file.path);
    FactStore store(db, memory_config(500));

    store.upsert_pinned_batch({{"name", "Carlos"}, {"birthday", "10/13/1969"}, {"city", "Lisbon"}}, 3.0);
    store.upsert_pinned_batch({{"city", "Lisbon"}, {"name", "Carlos"}, {"birthday", "10/13/1969"}}, 3.0);

    auto pinned = store.get_pinned();
    REQUIRE(pinned.size() == 3);
    REQUIRE(pinned[0].key == "city");
    REQUIRE(pinned[1].key == "name");
    REQUIRE(pinned[2].key == "birthday");
}

TEST_CASE("FactStore: batch validates every row before writing", "[fact_store]") {
    TempDbFile file("fs_batch_invalid");
    Database db(file.path);
    FactStore store(db, memory_config(500));

    REQUIRE_THROWS_AS(store.upsert_pinned_batch({{"ok", "fine"}, {"", "bad"}}, 1.0), InvalidInput);
    REQUIRE(store.count() == 0);
    REQUIRE(store.upsert_pinned_batch({}, 1.0) == 0);
}

TEST_CASE("FactStore: get_pinned honours limit", "[fact_store]") {
    TempDbFile file("fs_limit");
    Database db(file.path);
    FactStore store(db, memory_config(500));

    for (int i = 0; i < 5; i++) {
        store.pin("k" + std::to_string(i), "v");
    }
    REQUIRE(store.get_pinned(3).size() == 3);
    REQUIRE(store.get_pinned(3)[2].key == "k2");
    REQUIRE(store.get_pinned(0).empty());
    REQUIRE(store.get_pinned(50).size() == 5);
}

TEST_CASE("FactStore: writes through the store are visible immediately", "[fact_store]") {
    TempDbFile file("fs_cache_consistent");
    Database db(file.path);
    FakeClock clock;
    FactStore store(db, memory_config(500, 60), clock.fn());

    store.pin("name", "Carlos");
    REQUIRE(store.get_pinned().size() == 1);

    store.pin("city", "Lisbon");
    REQUIRE(store.get_pinned().size() == 2);

    store.pin("name", "Charles");
    REQUIRE(store.get_pinned()[0].value == "Charles");

    REQUIRE(store.unpin("city"));
    REQUIRE(store.get_pinned().size() == 1);

    store.forget("name");
    REQUIRE(store.get_pinned().empty());
}

TEST_CASE("FactStore: outside writes may be stale until ttl elapses", "[fact_store]") {
    TempDbFile file("fs_cache_stale");
    Database db(file.path);
    FakeClock clock;
    FactStore reader(db, memory_config(500, 15), clock.fn());
    FactStore writer(db, memory_config(500, 15));

    writer.pin("name", "Carlos");
    REQUIRE(reader.get_pinned().size() == 1);

    writer.pin("city", "Lisbon");
    clock.advance(10s);
    REQUIRE(reader.get_pinned().size() == 1);

    clock.advance(6s);
    REQUIRE(reader.get_pinned().size() == 2);
}

TEST_CASE("FactStore: zero ttl always reads through", "[fact_store]") {
    TempDbFile file("fs_cache_off");
    Database db(file.path);
    FactStore reader(db, memory_config(500, 0));
    FactStore writer(db, memory_config(500, 0));

    writer.pin("name", "Carlos");
    REQUIRE(reader.get_pinned().size() == 1);
    writer.pin("city", "Lisbon");
    REQUIRE(reader.get_pinned().size() == 2);
}

// ── Maintenance ──────────────────────────────────────────────

TEST_CASE("FactStore: unpin leaves non-pinned row alone", "[fact_store]") {
    TempDbFile file("fs_unpin");
    Database db(file.path);
    FactStore store(db, memory_config(500));

    store.pin("city", "Lisbon");
    store.add_non_pinned("city", "Porto");

    REQUIRE(store.unpin("city"));
    REQUIRE_FALSE(store.unpin("city"));
    REQUIRE(store.count(true) == 0);
    REQUIRE(store.count(false) == 1);
}

TEST_CASE("FactStore: forget removes both rows for a key", "[fact_store]") {
    TempDbFile file("fs_forget");
    Database db(file.path);
    FactStore store(db, memory_config(500));

    store.pin("city", "Lisbon");
    store.add_non_pinned("city", "Porto");
    store.add_non_pinned("other", "x");

    REQUIRE(store.forget("city") == 2);
    REQUIRE(store.forget("city") == 0);
    REQUIRE(store.count() == 1);
}

TEST_CASE("FactStore: get_all orders pinned first then by score", "[fact_store]") {
    TempDbFile file("fs_get_all");
    Database db(file.path);
    FactStore store(db, memory_config(500));

    store.add_non_pinned("low", "x", 0.5);
    store.add_non_pinned("high", "x", 5.0);
    store.pin("pinned", "x", 0.1);

    auto all = store.get_all();
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].key == "pinned");
    REQUIRE(all[1].key == "high");
    REQUIRE(all[2].key == "low");
    REQUIRE(store.get_all(2).size() == 2);
}

TEST_CASE("FactStore: delete_all clears memories, turns and sessions", "[fact_store]") {
    TempDbFile file("fs_delete_all");
    Database db(file.path);
    FactStore store(db, memory_config(500));
    TurnLedger ledger(db);

    store.pin("name", "Carlos");
    store.add_non_pinned("mood", "ok");
    ledger.start_session("s1");
    ledger.add_turn("s1", "user", "hello");
    REQUIRE(store.get_pinned().size() == 1);

    store.delete_all();

    REQUIRE(store.count() == 0);
    REQUIRE(store.get_pinned().empty());
    REQUIRE(ledger.get_session_turns("s1").empty());
    REQUIRE_FALSE(ledger.get_session("s1").has_value());
}

TEST_CASE("FactStore: storage failure surfaces as StorageError", "[fact_store]") {
    TempDbFile file("fs_storage_error");
    Database db(file.path);
    FactStore store(db, memory_config(500, 0));

    db.exec("DROP TABLE memories;");
    REQUIRE_THROWS_AS(store.pin("name", "Carlos"), StorageError);
    REQUIRE_THROWS_AS(store.get_pinned(), StorageError);
}

// ── Concurrency ──────────────────────────────────────────────

TEST_CASE("FactStore: concurrent writers respect the cap", "[fact_store]") {
    TempDbFile file("fs_threads");
    Database db(file.path);
    FactStore store(db, memory_config(20, 60));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < 25; i++) {
                store.add_non_pinned("t" + std::to_string(t) + "_" + std::to_string(i), "v");
                if (i % 5 == 0) store.pin("p" + std::to_string(t), std::to_string(i));
                store.get_pinned(10);
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(store.count(false) == 20);
    REQUIRE(store.count(true) == 4);
    REQUIRE(store.get_pinned().size() == 4);
}

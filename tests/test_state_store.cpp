// tests/test_state_store.cpp
//
// Both StateStore implementations against the same expectations, plus the
// JSON file layout and corruption handling of JsonFileStore.

#include <doctest/doctest.h>

#include "townlife/persist/StateStore.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace townlife;
using namespace townlife::persist;

namespace townlife_store_test {

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("townlife_store_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

WorldSnapshot SampleSnapshot()
{
    WorldSnapshot snap;
    CharacterSnapshot aki;
    aki.id = "aki";
    aki.needs.satiety = 42.5;
    aki.needs.bladder = 9.4;
    aki.money = 120;
    aki.jobId = "barista";
    aki.mapId = "cafe";
    aki.nodeId = "c2";
    aki.direction = Direction::Left;
    aki.actionCounter = 2;
    snap.characters.push_back(aki);

    CharacterSnapshot ren;
    ren.id = "ren";
    ren.mapId = "town";
    ren.nodeId = "t0";
    snap.characters.push_back(ren);

    snap.currentMapId = "cafe";
    snap.time = WorldTime{13, 5, 3};
    snap.serverStartMs = 1'704'067'200'000;
    snap.savedAtMs = 1'704'300'000'000;
    snap.tick = 777;
    return snap;
}

// Shared checks for any StateStore.
void ExerciseStore(StateStore& store)
{
    CHECK_FALSE(store.hasData());
    CHECK_FALSE(store.loadState().has_value());
    CHECK_FALSE(store.loadSchedule("aki", 1).has_value());
    CHECK(store.loadActionHistory("aki", 1).empty());

    REQUIRE(store.saveState(SampleSnapshot()));
    CHECK(store.hasData());

    const auto loaded = store.loadState();
    REQUIRE(loaded.has_value());
    CHECK(loaded->schemaVersion == 1);
    CHECK(loaded->currentMapId == "cafe");
    CHECK(loaded->time == WorldTime{13, 5, 3});
    CHECK(loaded->serverStartMs == 1'704'067'200'000);
    CHECK(loaded->tick == 777);
    REQUIRE(loaded->characters.size() == 2);

    const CharacterSnapshot& aki = loaded->characters[0];
    CHECK(aki.id == "aki");
    CHECK(aki.needs.satiety == doctest::Approx(42.5));
    CHECK(aki.needs.bladder == doctest::Approx(9.4));
    CHECK(aki.needs.mood == doctest::Approx(100.0));
    CHECK(aki.money == 120);
    CHECK(aki.jobId == std::optional<std::string>{"barista"});
    CHECK(aki.direction == Direction::Left);
    CHECK(aki.actionCounter == 2);
    CHECK_FALSE(loaded->characters[1].jobId.has_value());

    const DailySchedule schedule{"aki", 3, {{"07:00", "breakfast", "home", {}}, {"09:00", "work", {}, "early"}}};
    REQUIRE(store.saveSchedule(schedule));
    const auto day3 = store.loadSchedule("aki", 3);
    REQUIRE(day3.has_value());
    CHECK(day3->entries == schedule.entries);
    CHECK_FALSE(store.loadSchedule("aki", 4).has_value());

    REQUIRE(store.addActionHistory("aki", 3, ActionHistoryEntry{"07:00", "eat", "kitchen", 30, "breakfast"}));
    REQUIRE(store.addActionHistory("aki", 3, ActionHistoryEntry{"07:31", "idle", {}, {}, {}}));
    const auto history = store.loadActionHistory("aki", 3);
    REQUIRE(history.size() == 2);
    CHECK(history[0].target == std::optional<std::string>{"kitchen"});
    CHECK(history[0].durationMinutes == std::optional<int>{30});
    CHECK(history[1].actionId == "idle");
    CHECK_FALSE(history[1].reason.has_value());
    CHECK(store.loadActionHistory("ren", 3).empty());

    store.clear();
    CHECK_FALSE(store.hasData());
    CHECK_FALSE(store.loadSchedule("aki", 3).has_value());
    CHECK(store.loadActionHistory("aki", 3).empty());
}

} // namespace townlife_store_test

using namespace townlife_store_test;

TEST_CASE("MemoryStore keeps state, schedules and history")
{
    MemoryStore store;
    ExerciseStore(store);
}

TEST_CASE("JsonFileStore keeps state, schedules and history on disk")
{
    const fs::path dir = make_unique_temp_dir() / "store";
    JsonFileStore store(dir);
    ExerciseStore(store);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("JsonFileStore: one file per record, no temp files left behind")
{
    const fs::path dir = make_unique_temp_dir() / "layout";
    JsonFileStore store(dir);

    REQUIRE(store.saveState(SampleSnapshot()));
    REQUIRE(store.saveSchedule(DailySchedule{"odd/id", 2, {}}));
    REQUIRE(store.addActionHistory("aki", 2, ActionHistoryEntry{"10:00", "rest", {}, {}, {}}));

    CHECK(fs::exists(dir / "state.json"));
    CHECK(fs::exists(dir / "schedules" / "odd_id_day2.json"));
    CHECK(fs::exists(dir / "history" / "aki_day2.json"));
    CHECK_FALSE(fs::exists(dir / "state.json.tmp"));

    const auto doc = ReadJsonFile(dir / "state.json");
    REQUIRE(doc.has_value());
    CHECK((*doc)["schema_version"] == 1);
    CHECK((*doc)["characters"][0]["needs"]["bladder"].get<double>() == doctest::Approx(9.4));

    // Another store on the same directory sees the same data.
    JsonFileStore reopened(dir);
    CHECK(reopened.hasData());
    CHECK(reopened.loadSchedule("odd/id", 2).has_value());

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("JsonFileStore: corrupt files read as missing")
{
    const fs::path dir = make_unique_temp_dir() / "corrupt";
    JsonFileStore store(dir);
    REQUIRE(store.saveState(SampleSnapshot()));

    {
        std::ofstream ofs(dir / "state.json", std::ios::binary | std::ios::trunc);
        ofs << "{ \"characters\": [ ";
    }
    CHECK_FALSE(store.loadState().has_value());

    const auto raw = ReadJsonFile(dir / "state.json");
    REQUIRE_FALSE(raw.has_value());
    CHECK(raw.error().code == StoreError::Code::JsonParseError);

    const auto missing = ReadJsonFile(dir / "nope.json");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == StoreError::Code::IoOpenFail);

    // A history file that is not an array starts over.
    {
        fs::create_directories(dir / "history");
        std::ofstream ofs(dir / "history" / "aki_day1.json", std::ios::binary | std::ios::trunc);
        ofs << "{}";
    }
    CHECK(store.loadActionHistory("aki", 1).empty());
    REQUIRE(store.addActionHistory("aki", 1, ActionHistoryEntry{"08:00", "eat", {}, {}, {}}));
    CHECK(store.loadActionHistory("aki", 1).size() == 1);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

#include <catch2/catch_test_macros.hpp>

#include "storage/run_history.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("hf_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

} // namespace

TEST_CASE("RunHistory", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("OpenCreatesParentDirectories") {
        auto dir = std::filesystem::temp_directory_path() / ("hf_test_dir_" + std::to_string(getpid()));
        {
            RunHistory db;
            REQUIRE(db.open((dir / "nested" / "history.db").string()));
        }
        REQUIRE(std::filesystem::exists(dir / "nested" / "history.db"));
        std::filesystem::remove_all(dir);
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));

        RunRecord run{
            .kind = "run",
            .macro_path = "/tmp/login.json",
            .steps_total = 5,
            .steps_executed = 5,
            .degraded = 1,
            .failed_step = std::nullopt,
            .error = "",
            .duration = 3.25,
        };
        REQUIRE(db.insert(run));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        const auto& r = entries[0].record;
        REQUIRE(entries[0].id > 0);
        REQUIRE_FALSE(entries[0].timestamp.empty());
        REQUIRE(r.kind == "run");
        REQUIRE(r.macro_path == "/tmp/login.json");
        REQUIRE(r.steps_total == 5);
        REQUIRE(r.steps_executed == 5);
        REQUIRE(r.degraded == 1);
        REQUIRE_FALSE(r.failed_step.has_value());
        REQUIRE(r.error.empty());
        REQUIRE(r.duration == 3.25);
    }

    SECTION("FailedRunKeepsStepAndError") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));

        RunRecord run;
        run.kind = "run";
        run.macro_path = "m.json";
        run.steps_total = 4;
        run.steps_executed = 2;
        run.failed_step = 2;
        run.error = "unresolvable: all 1 targets failed";
        REQUIRE(db.insert(run));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].record.failed_step == 2);
        REQUIRE(entries[0].record.error == "unresolvable: all 1 targets failed");
    }

    SECTION("RecentOrdering") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));

        for (const char* path : {"first.json", "second.json", "third.json"}) {
            RunRecord run;
            run.kind = "record";
            run.macro_path = path;
            REQUIRE(db.insert(run));
        }

        auto entries = db.recent(2);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].record.macro_path == "third.json");
        REQUIRE(entries[1].record.macro_path == "second.json");
    }

    SECTION("EmptyDatabase") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.recent(10).empty());
    }

    SECTION("ClosedDatabaseRejectsInsert") {
        RunHistory db;
        RunRecord run;
        run.kind = "run";
        REQUIRE_FALSE(db.insert(run));
        REQUIRE(db.recent().empty());
    }
}

#include "bridge_fixture.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace cpanbridge;
using cpanbridge::test::BridgeFixture;
using cpanbridge::test::flag;
using cpanbridge::test::integer;
using cpanbridge::test::text;

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::string content;
    in >> content;
    return content;
}

}  // namespace

int main() {
    BridgeFixture bridge;
    const fs::path dir = fs::temp_directory_path() / ("cpanbridge_lock_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);

    Value make(Json::objectValue);
    make["max_wait"] = Value(1);
    make["delay"] = Value(1);
    make["hold"] = Value(60);
    const auto manager_result = bridge.result_of("lockfile", "make", make);
    const auto manager = text(manager_result, "manager_id");
    assert(manager.rfind("lockmgr_", 0) == 0);
    assert(integer(manager_result, "hold") == 60);

    const auto target = (dir / "data").string();
    Value request(Json::objectValue);
    request["manager_id"] = Value(manager);
    request["filename"] = Value(target);

    const auto locked = bridge.result_of("lockfile", "trylock", request);
    const auto lock_id = text(locked, "lock_id");
    assert(lock_id.rfind("lock_", 0) == 0);
    assert(text(locked, "lockfile") == target + ".lock");
    assert(fs::exists(target + ".lock"));
    assert(read_file(target + ".lock") == std::to_string(::getpid()));

    // Held locks are exclusive.
    const auto busy = bridge.call("lockfile", "trylock", request);
    assert(!busy.success);
    assert(busy.error_kind == ErrorKind::Execution);
    assert(busy.error.find("Lock file exists") != std::string::npos);

    const auto waited_from = std::chrono::steady_clock::now();
    const auto timed_out = bridge.call("lockfile", "lock", request);
    assert(timed_out.error_kind == ErrorKind::Execution);
    assert(std::chrono::steady_clock::now() - waited_from < std::chrono::seconds(5));

    Value release(Json::objectValue);
    release["lock_id"] = Value(lock_id);
    assert(flag(bridge.result_of("lockfile", "release", release), "released"));
    assert(!fs::exists(target + ".lock"));
    assert(bridge.call("lockfile", "release", release).error_kind == ErrorKind::Handle);

    const auto relocked = bridge.result_of("lockfile", "lock", request);
    assert(!text(relocked, "lock_id").empty());

    // Patterns substitute %F and environment variables.
    ::setenv("CPANBRIDGE_LOCK_DIR", dir.c_str(), 1);
    Value patterned = request;
    patterned["filename"] = "report";
    patterned["lockfile_pattern"] = "${CPANBRIDGE_LOCK_DIR}/nested/%F.lck";
    const auto custom = bridge.result_of("lockfile", "trylock", patterned);
    assert(text(custom, "lockfile") == (dir / "nested" / "report.lck").string());
    assert(fs::exists(dir / "nested" / "report.lck"));

    // A lock file older than the hold time is broken.
    const auto stale = dir / "stale";
    {
        std::ofstream out(stale.string() + ".lock");
        out << "1";
    }
    fs::last_write_time(stale.string() + ".lock", fs::file_time_type::clock::now() - std::chrono::hours(1));
    Value stale_request = request;
    stale_request["filename"] = Value(stale.string());
    const auto broken = bridge.result_of("lockfile", "trylock", stale_request);
    assert(!text(broken, "lock_id").empty());
    assert(read_file(stale.string() + ".lock") == std::to_string(::getpid()));

    // Cleaning up the manager releases its remaining locks and can be repeated.
    Value cleanup(Json::objectValue);
    cleanup["manager_id"] = Value(manager);
    const auto cleaned = bridge.result_of("lockfile", "cleanup_manager", cleanup);
    assert(flag(cleaned, "cleaned_up"));
    assert(integer(cleaned, "locks_released") == 3);
    assert(!fs::exists(target + ".lock"));
    assert(!fs::exists(dir / "nested" / "report.lck"));
    assert(!fs::exists(stale.string() + ".lock"));
    assert(bridge.pool.size() == 0);

    const auto again = bridge.result_of("lockfile", "cleanup_manager", cleanup);
    assert(flag(again, "cleaned_up"));
    assert(integer(again, "locks_released") == 0);

    Value negative(Json::objectValue);
    negative["delay"] = Value(-1);
    assert(bridge.call("lockfile", "make", negative).error_kind == ErrorKind::Validation);
    assert(bridge.call("lockfile", "trylock", request).error_kind == ErrorKind::Handle);

    fs::remove_all(dir);
    return 0;
}

/**
 * Unit tests for the chunked for_each
 */

#include <catch2/catch_test_macros.hpp>
#include <atomvec/util/parallel.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace atomvec;

TEST_CASE("for_each - serial visits every index in order", "[parallel]") {
    std::vector<size_t> seen;
    for_each(5, [&seen](size_t i) { seen.push_back(i); }, ExecPolicy::serial, 1);
    REQUIRE(seen == std::vector<size_t>{0, 1, 2, 3, 4});
}

TEST_CASE("for_each - threads visit every index once", "[parallel]") {
    constexpr size_t n = 10007;
    std::vector<std::atomic<int>> hits(n);
    for_each(n, [&hits](size_t i) { hits[i].fetch_add(1); }, ExecPolicy::threads, 4);

    size_t wrong = 0;
    for (const auto& hit : hits) {
        if (hit.load() != 1) ++wrong;
    }
    REQUIRE(wrong == 0);
}

TEST_CASE("for_each - more workers than items", "[parallel]") {
    std::vector<int> out(3, 0);
    for_each(3, [&out](size_t i) { out[i] = static_cast<int>(i) + 1; }, ExecPolicy::threads, 16);
    REQUIRE(out == std::vector<int>{1, 2, 3});

    for_each(0, [](size_t) { FAIL("no items to visit"); }, ExecPolicy::threads, 4);
}

TEST_CASE("for_each - worker exceptions reach the caller", "[parallel]") {
    auto failing = [](size_t i) {
        if (i == 4321) throw std::runtime_error("boom");
    };
    REQUIRE_THROWS_AS(for_each(10000, failing, ExecPolicy::threads, 4), std::runtime_error);
    REQUIRE_THROWS_AS(for_each(10000, failing, ExecPolicy::serial, 1), std::runtime_error);
}

TEST_CASE("for_each - configured policy honours the threshold", "[parallel][options]") {
    ScopedOptions scope;
    options().exec_policy = ExecPolicy::threads;
    options().parallel_threshold = 1000;
    options().max_threads = 4;

    const auto caller = std::this_thread::get_id();
    std::atomic<bool> off_thread{false};
    for_each(999, [&](size_t) {
        if (std::this_thread::get_id() != caller) off_thread = true;
    });
    REQUIRE_FALSE(off_thread.load());

    std::vector<int> out(5000, 0);
    for_each(out.size(), [&out](size_t i) { out[i] = 1; });
    REQUIRE(std::count(out.begin(), out.end(), 1) == 5000);
}

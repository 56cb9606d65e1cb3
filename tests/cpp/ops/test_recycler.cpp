/**
 * Unit tests for the recycling policy
 */

#include <catch2/catch_test_macros.hpp>
#include <atomvec/ops/recycler.h>
#include <atomvec/util/errors.h>

using namespace atomvec;

TEST_CASE("align - equal lengths are exact", "[recycler]") {
    auto alignment = align(3, 3);
    REQUIRE(alignment.length() == 3);
    REQUIRE(alignment.exact());
    REQUIRE(alignment.index_a(2) == 2);
    REQUIRE(alignment.index_b(2) == 2);
}

TEST_CASE("align - shorter operand is cycled", "[recycler]") {
    auto alignment = align(4, 2);
    REQUIRE(alignment.length() == 4);
    REQUIRE(alignment.exact());
    REQUIRE(alignment.index_b(0) == 0);
    REQUIRE(alignment.index_b(3) == 1);

    auto flipped = align(1, 5);
    REQUIRE(flipped.length() == 5);
    REQUIRE(flipped.index_a(4) == 0);
    REQUIRE(flipped.index_b(4) == 4);
}

TEST_CASE("align - non multiple carries a warning", "[recycler]") {
    auto alignment = align(3, 2);
    REQUIRE(alignment.length() == 3);
    REQUIRE_FALSE(alignment.exact());
    REQUIRE(alignment.warning()->kind == WarningKind::RecycleLength);
    REQUIRE(alignment.warning()->message.find("not a multiple") != std::string::npos);
}

TEST_CASE("align - zero lengths", "[recycler]") {
    auto empty = align(0, 0);
    REQUIRE(empty.length() == 0);
    REQUIRE(empty.exact());

    REQUIRE_THROWS_AS(align(0, 3), IncompatibleLengthError);
    REQUIRE_THROWS_AS(align(2, 0), IncompatibleLengthError);
}

TEST_CASE("align - n-ary", "[recycler]") {
    auto alignment = align(std::vector<size_t>{2, 6, 3});
    REQUIRE(alignment.length() == 6);
    REQUIRE(alignment.operand_count() == 3);
    REQUIRE(alignment.exact());
    REQUIRE(alignment.index(2, 4) == 1);

    REQUIRE_FALSE(align(std::vector<size_t>{4, 6}).exact());
    REQUIRE_THROWS_AS(align(std::vector<size_t>{1, 0, 2}), IncompatibleLengthError);
}

TEST_CASE("fit - source onto target slots", "[recycler]") {
    auto exact = fit(6, 3);
    REQUIRE(exact.length() == 6);
    REQUIRE(exact.exact());
    REQUIRE(exact.index_b(4) == 1);

    // A longer source is truncated
    auto truncated = fit(2, 5);
    REQUIRE(truncated.length() == 2);
    REQUIRE_FALSE(truncated.exact());
    REQUIRE(truncated.warning()->message.find("number of items to replace") != std::string::npos);

    REQUIRE(fit(0, 0).length() == 0);
    REQUIRE(fit(0, 4).exact());
    REQUIRE_THROWS_AS(fit(3, 0), IncompatibleLengthError);
}

TEST_CASE("Alignment - report forwards to the current handler", "[recycler][warnings]") {
    CollectingWarningHandler warnings;
    ScopedWarningHandler scope{warnings};

    align(4, 2).report();
    REQUIRE(warnings.empty());

    align(5, 2).report();
    REQUIRE(warnings.count(WarningKind::RecycleLength) == 1);
}

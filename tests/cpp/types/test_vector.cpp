/**
 * Unit tests for atomvec::Vector and the construction functions
 */

#include <catch2/catch_test_macros.hpp>
#include <atomvec/types/construction.h>
#include <atomvec/util/warnings.h>

#include <atomic>
#include <cmath>
#include <limits>
#include <thread>

using namespace atomvec;

// ============================================================================
// Storage and access
// ============================================================================

TEST_CASE("Vector - default is the untyped empty vector", "[vector]") {
    Vector v;
    REQUIRE(v.length() == 0);
    REQUIRE(v.empty());
    REQUIRE(v.kind() == ElementKind::Logical);
    REQUIRE_FALSE(v.has_names());
}

TEST_CASE("Vector - kind constructor fills with NA", "[vector]") {
    Vector v{ElementKind::Double, 3};
    REQUIRE(v.kind() == ElementKind::Double);
    REQUIRE(v.length() == 3);
    for (size_t i = 0; i < 3; ++i) {
        REQUIRE(v.is_na(i));
    }
    REQUIRE(Vector::na(ElementKind::Character).length() == 1);
}

TEST_CASE("Vector - typed access", "[vector]") {
    auto v = Vector::integer({1, std::nullopt, 3});
    REQUIRE(v.is<av_int>());
    REQUIRE(v.at<av_int>(0) == 1);
    REQUIRE_FALSE(v.at<av_int>(1).has_value());
    REQUIRE_THROWS_AS(v.at<av_int>(3), std::out_of_range);
    REQUIRE_THROWS_AS(v.data<av_float>(), InvalidOperandError);
}

TEST_CASE("Vector - set promotes the whole vector", "[vector]") {
    auto v = Vector::integer({1, 2});
    v.set<av_float>(1, 2.5);
    REQUIRE(v.kind() == ElementKind::Double);
    REQUIRE(v.at<av_float>(0) == 1.0);
    REQUIRE(v.at<av_float>(1) == 2.5);

    // A lower kind value is coerced to the vector's kind
    v.set<av_bool>(0, true);
    REQUIRE(v.at<av_float>(0) == 1.0);
    REQUIRE_THROWS_AS(v.set<av_int>(5, 1), std::out_of_range);
}

TEST_CASE("Vector - get returns a named length one vector", "[vector]") {
    Vector v{column_t<av_int>{10, 20}, name_list_t{"a", "b"}};
    auto element = v.get(1);
    REQUIRE(element == Vector(column_t<av_int>{20}, name_list_t{"b"}));
}

TEST_CASE("Vector - structural equality", "[vector]") {
    REQUIRE(Vector::numeric({1.0, std::nullopt}) == Vector::numeric({1.0, std::nullopt}));
    REQUIRE(Vector::numeric({std::nan("")}) == Vector::numeric({std::nan("")}));
    REQUIRE_FALSE(Vector::numeric({1.0}) == Vector::integer({1}));
    REQUIRE_FALSE(Vector::integer({1}) == Vector(column_t<av_int>{1}, name_list_t{"a"}));
}

TEST_CASE("Vector - to_string rendering", "[vector]") {
    REQUIRE(to_string(Vector::numeric({1.0, 2.5, std::nullopt})) == "<double>[1, 2.5, NA]");
    REQUIRE(Vector(column_t<av_int>{1, 2}, name_list_t{"a", "b"}).to_string() == "<integer>{a=1, b=2}");
    REQUIRE(fmt::format("{}", Vector::character({"x", std::nullopt})) == "<character>[\"x\", NA]");
    REQUIRE(fmt::format("{}", Vector::logical({true, false})) == "<logical>[TRUE, FALSE]");
}

TEST_CASE("Vector - copies are independent", "[vector]") {
    Vector original{column_t<av_int>{1, 2, 3}, name_list_t{"a", "b", "c"}};
    Vector copy{original};
    copy.set<av_int>(0, 99);
    copy.set_name(1, "z");

    REQUIRE(original.at<av_int>(0) == 1);
    REQUIRE(original.name(1) == "b");
    REQUIRE(original.find_name("b") == 1);
}

TEST_CASE("Vector - promote and coerced", "[vector]") {
    auto v = Vector::logical({true, std::nullopt});
    auto text = v.coerced(ElementKind::Character);
    REQUIRE(text == Vector::character({"TRUE", std::nullopt}));
    REQUIRE(v.kind() == ElementKind::Logical);

    REQUIRE_THROWS_AS(text.promote(ElementKind::Double), CoercionError);
    REQUIRE(as_kind(Vector::integer({3}), ElementKind::Double) == Vector::numeric({3.0}));
}

TEST_CASE("Vector - append to itself", "[vector]") {
    auto v = Vector::integer({1, 2});
    v.append(v);
    REQUIRE(v == Vector::integer({1, 2, 1, 2}));
}

// ============================================================================
// Names
// ============================================================================

TEST_CASE("Names - set_names pads and rejects long lists", "[vector][names]") {
    auto v = Vector::integer({1, 2, 3});
    v.set_names(name_list_t{"a"});
    REQUIRE(v.names() == name_list_t{"a", "", ""});

    REQUIRE_THROWS_AS(v.set_names(name_list_t{"a", "b", "c", "d"}), InvalidArgumentError);
    REQUIRE(v.names() == name_list_t{"a", "", ""});

    v.set_names(std::nullopt);
    REQUIRE_FALSE(v.has_names());
    REQUIRE(v.name(0).empty());
}

TEST_CASE("Names - free set_names returns an updated copy", "[vector][names]") {
    auto v = Vector::numeric({1.0, 2.0});
    auto named = set_names(v, name_list_t{"x", "y"});
    REQUIRE_FALSE(names(v).has_value());
    REQUIRE(names(named) == name_list_t{"x", "y"});
}

TEST_CASE("Names - lookup is first match and ignores empty names", "[vector][names]") {
    Vector v{column_t<av_int>{1, 2, 3, 4}, name_list_t{"", "x", "y", "x"}};
    REQUIRE(v.find_name("x") == 1);
    REQUIRE(v.find_name("y") == 2);
    REQUIRE_FALSE(v.find_name("").has_value());
    REQUIRE_FALSE(v.find_name("w").has_value());

    const auto& index = v.name_table()->index();
    REQUIRE(index.positions("x") == NamedIndex::PositionList{1, 3});
    REQUIRE(index.distinct_names() == 2);
}

TEST_CASE("Names - index is rebuilt after a rename", "[vector][names]") {
    Vector v{column_t<av_int>{1, 2}, name_list_t{"a", "b"}};
    REQUIRE(v.find_name("a") == 0);
    v.set_name(0, "c");
    REQUIRE_FALSE(v.find_name("a").has_value());
    REQUIRE(v.find_name("c") == 0);
}

TEST_CASE("Names - concurrent lookups", "[vector][names][concurrency]") {
    name_list_t labels;
    column_t<av_int> values;
    for (int i = 0; i < 1000; ++i) {
        labels.push_back(fmt::format("n{}", i));
        values.emplace_back(i);
    }
    const Vector v{std::move(values), std::move(labels)};

    std::vector<std::thread> readers;
    std::atomic<int> mismatches{0};
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&v, &mismatches] {
            for (int i = 0; i < 1000; ++i) {
                if (v.find_name(fmt::format("n{}", i)) != static_cast<size_t>(i)) ++mismatches;
            }
        });
    }
    for (auto& reader : readers) reader.join();
    REQUIRE(mismatches.load() == 0);
}

// ============================================================================
// combine
// ============================================================================

TEST_CASE("combine - result kind is the highest input kind", "[construction][combine]") {
    auto v = combine(1, "a");
    REQUIRE(v.kind() == ElementKind::Character);
    REQUIRE(v == Vector::character({"1", "a"}));

    REQUIRE(combine(true, 2).kind() == ElementKind::Integer);
    REQUIRE(combine(true, 2, 0.5) == Vector::numeric({1.0, 2.0, 0.5}));
    REQUIRE(combine(Vector::integer({1, 2}), 3.5, Vector::logical({false})) ==
            Vector::numeric({1.0, 2.0, 3.5, 0.0}));
}

TEST_CASE("combine - NA survives coercion", "[construction][combine]") {
    auto v = combine(Vector::integer({std::nullopt}), "b");
    REQUIRE(v == Vector::character({std::nullopt, "b"}));
}

TEST_CASE("combine - nothing is the untyped empty vector", "[construction][combine]") {
    auto v = combine(std::vector<Vector>{});
    REQUIRE(v.length() == 0);
    REQUIRE(v.kind() == ElementKind::Logical);
    REQUIRE(v == Vector{});
}

TEST_CASE("combine - names from any named input", "[construction][combine]") {
    Vector named{column_t<av_int>{1}, name_list_t{"a"}};
    auto v = combine(named, Vector::integer({2, 3}));
    REQUIRE(v.names() == name_list_t{"a", "", ""});

    auto w = combine(Vector::integer({0}), named);
    REQUIRE(w.names() == name_list_t{"", "a"});
}

// ============================================================================
// sequence
// ============================================================================

TEST_CASE("sequence - integral arguments give an integer vector", "[construction][sequence]") {
    REQUIRE(sequence(1, 5) == Vector::integer({1, 2, 3, 4, 5}));
    REQUIRE(sequence(3, 1) == Vector::integer({3, 2, 1}));
    REQUIRE(sequence(1, 10, 3) == Vector::integer({1, 4, 7, 10}));
    REQUIRE(sequence(1, 9, 3) == Vector::integer({1, 4, 7}));
}

TEST_CASE("sequence - fractional arguments give a double vector", "[construction][sequence]") {
    auto v = sequence(0, 1, 0.25);
    REQUIRE(v == Vector::numeric({0.0, 0.25, 0.5, 0.75, 1.0}));

    // 0.1 steps accumulate error, the end point is still included
    auto w = sequence(0, 0.3, 0.1);
    REQUIRE(w.kind() == ElementKind::Double);
    REQUIRE(w.length() == 4);
    REQUIRE(w.at<av_float>(3) == 0.3);
    for (size_t i = 0; i < w.length(); ++i) {
        REQUIRE(*w.at<av_float>(i) <= 0.3);
    }

    REQUIRE(sequence(1.5, 3.5).kind() == ElementKind::Double);
    REQUIRE(sequence(1, 2.5).kind() == ElementKind::Double);
}

TEST_CASE("sequence - fractional steps never pass the end point", "[construction][sequence]") {
    auto down = sequence(0.3, 0, -0.1);
    REQUIRE(down.length() == 4);
    REQUIRE(down.at<av_float>(3) == 0.0);
    for (size_t i = 0; i < down.length(); ++i) {
        REQUIRE(*down.at<av_float>(i) >= 0.0);
    }

    auto up = sequence(0.1, 0.7, 0.2);
    REQUIRE(up.length() == 4);
    REQUIRE(up.at<av_float>(3) == 0.7);
}

TEST_CASE("sequence - lengths beyond a column are rejected", "[construction][sequence][errors]") {
    REQUIRE_THROWS_AS(sequence(0, 1e300), InvalidArgumentError);
    REQUIRE_THROWS_AS(sequence(0, 1, 1e-300), InvalidArgumentError);
}

TEST_CASE("sequence - step validation", "[construction][sequence]") {
    REQUIRE_THROWS_AS(sequence(1, 10, 0), InvalidStepError);
    REQUIRE_THROWS_AS(sequence(1, 10, -1), InvalidStepError);
    REQUIRE_THROWS_AS(sequence(10, 1, 2), InvalidStepError);
    REQUIRE_THROWS_AS(sequence(1, std::nan("")), InvalidStepError);
    REQUIRE(sequence(5, 5, 0) == Vector::integer({5}));
    REQUIRE(sequence(5, 5) == Vector::integer({5}));
}

// ============================================================================
// repeat
// ============================================================================

TEST_CASE("repeat - whole input cycles", "[construction][repeat]") {
    REQUIRE(repeat(Vector::integer({1, 2}), 3) == Vector::integer({1, 2, 1, 2, 1, 2}));
    REQUIRE(repeat(Vector::integer({1, 2}), 0).length() == 0);
    REQUIRE(repeat(Vector::integer({1, 2}), 0).kind() == ElementKind::Integer);
    REQUIRE_THROWS_AS(repeat(Vector::integer({1}), -1), InvalidArgumentError);
    REQUIRE_THROWS_AS(repeat(Vector::integer({1, 2, 3}), std::numeric_limits<av_int>::max()), InvalidArgumentError);
    REQUIRE(repeat(Vector::integer({}), std::numeric_limits<av_int>::max()).length() == 0);
}

TEST_CASE("repeat - names are repeated", "[construction][repeat]") {
    Vector v{column_t<av_string>{"p", "q"}, name_list_t{"a", "b"}};
    REQUIRE(repeat(v, 2).names() == name_list_t{"a", "b", "a", "b"});
}

TEST_CASE("repeat_to_length - truncates without warning", "[construction][repeat]") {
    CollectingWarningHandler warnings;
    ScopedWarningHandler scope{warnings};

    REQUIRE(repeat_to_length(Vector::integer({1, 2, 3}), 5) == Vector::integer({1, 2, 3, 1, 2}));
    REQUIRE(repeat_to_length(Vector::integer({1, 2, 3}), 0).length() == 0);
    REQUIRE(warnings.empty());

    REQUIRE_THROWS_AS(repeat_to_length(Vector::integer({}), 2), IncompatibleLengthError);
}

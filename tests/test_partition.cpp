#include <catch2/catch.hpp>

#include <algorithm>
#include <vector>

#include "Chunker/Partition.hpp"
#include "errors/errors.hpp"

using partition::SizingDirective;

namespace
{
    void requireInvalid(std::uint64_t size, const SizingDirective &directive)
    {
        try
        {
            partition::plan(size, directive);
            FAIL("expected InvalidInput");
        }
        catch (const errors::AfsError &e)
        {
            REQUIRE(e.category() == errors::ErrorCategory::InvalidInput);
        }
    }
}

TEST_CASE("fixed count spreads the remainder over the first parts")
{
    auto p = partition::plan(100, SizingDirective::fixedCount(3));
    REQUIRE(p.lengths == std::vector<std::uint64_t>{34, 33, 33});
    REQUIRE(p.offset(0) == 0);
    REQUIRE(p.offset(1) == 34);
    REQUIRE(p.offset(2) == 67);
}

TEST_CASE("max part size picks the smallest count that fits")
{
    auto p = partition::plan(100, SizingDirective::maxPartSize(30));
    REQUIRE(p.lengths == std::vector<std::uint64_t>{25, 25, 25, 25});

    auto q = partition::plan(101, SizingDirective::maxPartSize(25));
    REQUIRE(q.count() == 5);
    REQUIRE(q.total() == 101);
    REQUIRE(*std::max_element(q.lengths.begin(), q.lengths.end()) <= 25);
}

TEST_CASE("default uses 24 parts or one per byte for small files")
{
    REQUIRE(partition::plan(1000, SizingDirective::defaults()).count() == 24);
    REQUIRE(partition::plan(10, SizingDirective::defaults()).count() == 10);
    REQUIRE(partition::plan(1000, SizingDirective::defaults(), 7).count() == 7);
}

TEST_CASE("one byte files")
{
    REQUIRE(partition::plan(1, SizingDirective::defaults()).lengths == std::vector<std::uint64_t>{1});
    REQUIRE(partition::plan(1, SizingDirective::fixedCount(1)).lengths == std::vector<std::uint64_t>{1});
    REQUIRE(partition::plan(1, SizingDirective::maxPartSize(1)).lengths == std::vector<std::uint64_t>{1});
    requireInvalid(1, SizingDirective::fixedCount(2));
}

TEST_CASE("plans always cover the whole file with near-equal parts")
{
    const std::vector<std::uint64_t> sizes{1, 2, 7, 23, 24, 25, 1000, 4194305};
    for (auto size : sizes)
    {
        for (std::int64_t n = 1; n <= 30 && static_cast<std::uint64_t>(n) <= size; ++n)
        {
            auto p = partition::plan(size, SizingDirective::fixedCount(n));
            REQUIRE(p.count() == static_cast<std::size_t>(n));
            REQUIRE(p.total() == size);
            auto minmax = std::minmax_element(p.lengths.begin(), p.lengths.end());
            REQUIRE(*minmax.first >= 1);
            REQUIRE(*minmax.second - *minmax.first <= 1);
            REQUIRE(std::is_sorted(p.lengths.rbegin(), p.lengths.rend()));
        }
    }
}

TEST_CASE("invalid directives are rejected")
{
    requireInvalid(0, SizingDirective::defaults());
    requireInvalid(100, SizingDirective::fixedCount(0));
    requireInvalid(100, SizingDirective::fixedCount(-3));
    requireInvalid(100, SizingDirective::fixedCount(101));
    requireInvalid(100, SizingDirective::maxPartSize(0));
    requireInvalid(100, SizingDirective::maxPartSize(-1));
}

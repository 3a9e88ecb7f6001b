#include "services/template_service.hpp"
#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <set>

using namespace tourney;
using namespace tourney::testing;

TEST_CASE("seed order for small sizes", "[seed_order]")
{
	CHECK(must(template_service::generate_seed_order(2)) == std::vector<int>{1, 2});
	CHECK(must(template_service::generate_seed_order(4)) == std::vector<int>{1, 4, 2, 3});
	CHECK(must(template_service::generate_seed_order(8)) == std::vector<int>{1, 8, 4, 5, 2, 7, 3, 6});
}

TEST_CASE("seed order for 16 places the top seeds in opposite halves", "[seed_order]")
{
	const std::vector<int> expected{1, 16, 8, 9, 4, 13, 5, 12, 2, 15, 7, 10, 3, 14, 6, 11};
	const auto order = must(template_service::generate_seed_order(16));
	CHECK(order == expected);

	// seed 1 in the top half, seed 2 in the bottom half
	const auto pos = [&](int seed) { return std::ranges::find(order, seed) - order.begin(); };
	CHECK(pos(1) < 8);
	CHECK(pos(2) >= 8);
}

TEST_CASE("seed order is a permutation whose pairs sum to size + 1", "[seed_order]")
{
	for (int size : {2, 4, 8, 16, 32, 64, 128}) {
		INFO("size " << size);
		const auto order = must(template_service::generate_seed_order(size));
		REQUIRE(order.size() == static_cast<std::size_t>(size));

		const std::set<int> seen(order.begin(), order.end());
		CHECK(seen.size() == order.size());
		CHECK(*seen.begin() == 1);
		CHECK(*seen.rbegin() == size);

		for (std::size_t i = 0; i + 1 < order.size(); i += 2) {
			CHECK(order[i] + order[i + 1] == size + 1);
		}
	}
}

TEST_CASE("seed order rejects sizes that are not powers of two", "[seed_order]")
{
	for (int size : {0, 1, 3, 6, 12, -4}) {
		INFO("size " << size);
		CHECK(error_of(template_service::generate_seed_order(size)) == type::errc::unsupported_size);
	}
}

#include "doctest.h"
#include "parallel/CommPattern.h"
#include "parallel/CountExchange.h"
#include "parallel/Payload.h"
#include "parallel/Router.h"

#include <mpi.h>

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace redist;

TEST_CASE("parallel") {
    SUBCASE("make_displs") {
        std::vector<std::size_t> counts({3, 1, 4, 2});
        std::vector<int> displs;
        make_displs(counts, displs);
        CHECK(displs == std::vector<int>({0, 3, 4, 8}));

        make_displs({}, displs);
        CHECK(displs.empty());
    }

    SUBCASE("mpi_count") {
        CHECK(mpi_count(0) == 0);
        CHECK(mpi_count(std::numeric_limits<int>::max()) == std::numeric_limits<int>::max());
        auto too_large = static_cast<std::size_t>(std::numeric_limits<int>::max()) + 1;
        CHECK_THROWS_AS(mpi_count(too_large), std::overflow_error);
        CHECK_THROWS_AS(mpi_counts({1, too_large}), std::overflow_error);
    }

    SUBCASE("nonzero_counts") {
        auto active = nonzero_counts({0, 5, 0, 0, 2, 7});
        REQUIRE(active.size() == 3);
        CHECK(active[0].rank == 1);
        CHECK(active[0].count == 5);
        CHECK(active[1].rank == 4);
        CHECK(active[1].count == 2);
        CHECK(active[2].rank == 5);
        CHECK(active[2].count == 7);

        CHECK(nonzero_counts({0, 0, 0}).empty());
    }

    SUBCASE("equal_division_counts") {
        CHECK(equal_division_counts(10, 4) == std::vector<std::size_t>({2, 2, 2, 2}));
        CHECK(equal_division_counts(3, 4) == std::vector<std::size_t>({0, 0, 0, 0}));
        CHECK(equal_division_counts(12, 3) == std::vector<std::size_t>({4, 4, 4}));
        CHECK_THROWS_AS(equal_division_counts(12, 0), std::invalid_argument);
    }
}

TEST_CASE("Payload") {
    std::vector<double> a({1.0, 2.0});
    std::vector<double> b({3.0});

    SUBCASE("per destination") {
        auto transfers = resolve_transfers<double>(
            {2, 0}, PerDestinationPayloads<double>(std::vector<std::vector<double>>{a, b}));
        REQUIRE(transfers.size() == 2);
        CHECK(transfers[0].dest == 2);
        CHECK(transfers[0].payload.size == 2);
        CHECK(transfers[1].dest == 0);
        CHECK(transfers[1].payload.size == 1);
    }

    SUBCASE("per destination keeps caller memory") {
        auto views = std::vector<BufferView<double>>{BufferView<double>(a), BufferView<double>(b)};
        auto transfers = resolve_transfers<double>({1, 3}, PerDestinationPayloads<double>(views));
        REQUIRE(transfers.size() == 2);
        CHECK(transfers[0].payload.data == a.data());
        CHECK(transfers[1].payload.data == b.data());
    }

    SUBCASE("broadcast") {
        auto transfers = resolve_transfers<double>({1, 3, 5}, BroadcastPayload<double>(a));
        REQUIRE(transfers.size() == 3);
        for (auto const& transfer : transfers) {
            CHECK(transfer.payload.data == a.data());
            CHECK(transfer.payload.size == a.size());
        }
        CHECK(transfers[2].dest == 5);
    }

    SUBCASE("mismatch") {
        CHECK_THROWS_AS(resolve_transfers<double>(
                            {1, 2, 3}, PerDestinationPayloads<double>(
                                           std::vector<std::vector<double>>{a, b})),
                        std::invalid_argument);
    }
}

TEST_CASE("Route pattern") {
    CHECK(parse_route_pattern("distribute") == RoutePattern::Distribute);
    CHECK(parse_route_pattern("Gather") == RoutePattern::Gather);
    CHECK(parse_route_pattern("SCATTER") == RoutePattern::Scatter);
    CHECK(parse_route_pattern("scatterv") == RoutePattern::Unknown);
    CHECK(parse_route_pattern("") == RoutePattern::Unknown);
    CHECK(to_string(RoutePattern::Gather) == "gather");

    CHECK(parse_remainder_policy("drop") == RemainderPolicy::Drop);
    CHECK(parse_remainder_policy("Warn") == RemainderPolicy::Warn);
    CHECK(parse_remainder_policy("error") == RemainderPolicy::Error);
    CHECK(parse_remainder_policy("truncate") == RemainderPolicy::Unknown);
}

TEST_CASE("CountExchange") {
    int procs;
    MPI_Comm_size(MPI_COMM_WORLD, &procs);

    auto counts = CountExchange(MPI_COMM_WORLD);
    CHECK(counts.procs() == procs);
    CHECK(counts.destination_count().size() == static_cast<std::size_t>(procs));
    CHECK(counts.source_count().size() == static_cast<std::size_t>(procs));

    SUBCASE("invalid destination") {
        CHECK_THROWS_AS(counts.set_destination(-1, 4), std::out_of_range);
        CHECK_THROWS_AS(counts.set_destination(procs, 4), std::out_of_range);
    }

    SUBCASE("later entry overwrites") {
        counts.set_destination(0, 4);
        counts.set_destination(0, 7);
        CHECK(counts.destination_count()[0] == 7);
        counts.clear();
        CHECK(counts.destination_count()[0] == 0);
    }
}

TEST_CASE("Router local misuse") {
    auto router = Router(MPI_COMM_WORLD, RemainderPolicy::Drop);
    std::vector<double> data({1.0, 2.0, 3.0});

    CHECK_THROWS_AS(router.set_remainder_policy(RemainderPolicy::Unknown), std::invalid_argument);
    CHECK(router.remainder_policy() == RemainderPolicy::Drop);

    CHECK_THROWS_AS(router.distribute({router.procs()}, BroadcastPayload<double>(data), 0),
                    std::out_of_range);
    CHECK_THROWS_AS(router.distribute({0}, BroadcastPayload<double>(data), -1),
                    std::invalid_argument);
    CHECK_THROWS_AS(router.distribute({0, 0},
                                      PerDestinationPayloads<double>(
                                          std::vector<std::vector<double>>{data}),
                                      0),
                    std::invalid_argument);
    CHECK_THROWS_AS(router.gather(data, router.procs()), std::out_of_range);
    CHECK_THROWS_AS(router.gather(data, -1), std::out_of_range);
    CHECK_THROWS_AS(router.scatter(data, std::vector<std::size_t>(router.procs() + 1, 0), 0),
                    std::invalid_argument);
    CHECK_THROWS_AS(router.scatter(data, std::nullopt, router.procs()), std::out_of_range);

    RouteArgs<double> args;
    args.destination = {0};
    CHECK_THROWS_AS(router.route("distribute", args), std::invalid_argument);
}

#include "common/CmdLine.h"
#include "config.h"
#include "parallel/MPIError.h"
#include "parallel/Profile.h"
#include "parallel/Router.h"
#include "util/Schema.h"
#include "util/SchemaHelper.h"

#include <argparse.hpp>
#include <mpi.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <numeric>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace redist;

struct Config {
    RoutePattern pattern;
    std::size_t elements;
    int repetitions;
    int root;
    int neighbours;
    bool broadcast;
    RemainderPolicy remainder;
    std::optional<std::vector<std::size_t>> counts;
    std::optional<std::string> output;
};

namespace {

struct Bench {
    Bench(Router& router, Config const& cfg) : router(router), cfg(cfg) {}

    std::vector<int> ring_destinations() const {
        std::vector<int> destinations;
        for (int k = 1; k <= cfg.neighbours; ++k) {
            destinations.push_back((router.rank() + k) % router.procs());
        }
        return destinations;
    }

    std::size_t ring_payload_size(int k) const {
        return cfg.broadcast ? cfg.elements : cfg.elements + k;
    }

    bool distribute(int tag, uint64_t& bytes) {
        int rank = router.rank();
        int procs = router.procs();
        auto destinations = ring_destinations();

        DistributeResult<double> result;
        if (cfg.broadcast) {
            auto data = std::vector<double>(ring_payload_size(0), static_cast<double>(rank));
            result = router.distribute(destinations, BroadcastPayload<double>(data), tag);
            bytes = data.size() * destinations.size() * sizeof(double);
        } else {
            auto data = std::vector<std::vector<double>>();
            bytes = 0;
            for (int k = 1; k <= cfg.neighbours; ++k) {
                data.emplace_back(ring_payload_size(k), static_cast<double>(rank));
                bytes += data.back().size() * sizeof(double);
            }
            result = router.distribute(destinations, PerDestinationPayloads<double>(data), tag);
        }

        std::vector<int> expected_sources;
        for (int s = 0; s < procs; ++s) {
            int k = (rank - s + procs) % procs;
            if (k == 0) {
                k = procs;
            }
            if (k <= cfg.neighbours) {
                expected_sources.push_back(s);
            }
        }
        if (result.sources != expected_sources) {
            return false;
        }
        for (std::size_t i = 0; i < result.sources.size(); ++i) {
            int s = result.sources[i];
            int k = (rank - s + procs) % procs;
            if (k == 0) {
                k = procs;
            }
            auto const& buffer = result.buffers[i];
            if (buffer.size() != ring_payload_size(k)) {
                return false;
            }
            for (auto value : buffer) {
                if (value != static_cast<double>(s)) {
                    return false;
                }
            }
        }
        return true;
    }

    bool gather(uint64_t& bytes) {
        int rank = router.rank();
        auto offset = static_cast<std::size_t>(rank) * cfg.elements +
                      static_cast<std::size_t>(rank) * (rank - 1) / 2;
        auto data = std::vector<double>(cfg.elements + rank);
        std::iota(data.begin(), data.end(), static_cast<double>(offset));
        bytes = data.size() * sizeof(double);

        auto result = router.gather(data, cfg.root);
        if (result.counts.size() != static_cast<std::size_t>(router.procs()) ||
            result.counts[rank] != data.size()) {
            return false;
        }
        if (rank == cfg.root) {
            if (!result.data) {
                return false;
            }
            for (std::size_t i = 0; i < result.data->size(); ++i) {
                if ((*result.data)[i] != static_cast<double>(i)) {
                    return false;
                }
            }
        } else if (result.data) {
            return false;
        }
        return true;
    }

    bool scatter(uint64_t& bytes) {
        int rank = router.rank();
        std::size_t length = cfg.elements;
        if (cfg.counts) {
            length = std::accumulate(cfg.counts->begin(), cfg.counts->end(),
                                     static_cast<std::size_t>(0));
        }
        auto data = std::vector<double>();
        if (rank == cfg.root) {
            data.resize(length);
            std::iota(data.begin(), data.end(), 0.0);
        }

        auto recvd = router.scatter(data, cfg.counts, cfg.root);
        bytes = recvd.size() * sizeof(double);

        auto counts = cfg.counts ? *cfg.counts
                                 : equal_division_counts(length, router.procs());
        auto offset = std::accumulate(counts.begin(), counts.begin() + rank,
                                      static_cast<std::size_t>(0));
        if (recvd.size() != counts[rank]) {
            return false;
        }
        for (std::size_t i = 0; i < recvd.size(); ++i) {
            if (recvd[i] != static_cast<double>(offset + i)) {
                return false;
            }
        }

        // round trip
        auto back = router.gather(recvd, cfg.root);
        if (rank == cfg.root) {
            auto scattered = std::accumulate(counts.begin(), counts.end(),
                                             static_cast<std::size_t>(0));
            if (!back.data || back.data->size() != scattered ||
                !std::equal(back.data->begin(), back.data->end(), data.begin())) {
                return false;
            }
        }
        return true;
    }

    Router& router;
    Config const& cfg;
};

bool all_ok(bool ok, MPI_Comm comm) {
    int local = ok ? 1 : 0;
    int global;
    REDIST_MPI_CHECK(MPI_Allreduce(&local, &global, 1, MPI_INT, MPI_MIN, comm));
    return global == 1;
}

int run(Config const& cfg) {
    int rank, procs;
    REDIST_MPI_CHECK(MPI_Comm_rank(MPI_COMM_WORLD, &rank));
    REDIST_MPI_CHECK(MPI_Comm_size(MPI_COMM_WORLD, &procs));

    if (cfg.root >= procs) {
        if (rank == 0) {
            std::cerr << "Root " << cfg.root << " does not exist with " << procs << " ranks."
                      << std::endl;
        }
        return -1;
    }
    if (cfg.neighbours > procs) {
        if (rank == 0) {
            std::cerr << "At most " << procs << " neighbours are distinct with " << procs
                      << " ranks." << std::endl;
        }
        return -1;
    }
    if (cfg.counts && cfg.counts->size() != static_cast<std::size_t>(procs)) {
        if (rank == 0) {
            std::cerr << "counts must have one entry per rank (" << procs << ")." << std::endl;
        }
        return -1;
    }

    auto router = Router(MPI_COMM_WORLD, cfg.remainder);
    auto bench = Bench(router, cfg);

    Profile profile;
    auto region = profile.add(std::string(to_string(cfg.pattern)));
    bool ok = true;
    for (int rep = 0; rep < cfg.repetitions && ok; ++rep) {
        uint64_t bytes = 0;
        profile.begin(region);
        switch (cfg.pattern) {
        case RoutePattern::Distribute:
            ok = bench.distribute(rep, bytes);
            break;
        case RoutePattern::Gather:
            ok = bench.gather(bytes);
            break;
        case RoutePattern::Scatter:
            ok = bench.scatter(bytes);
            break;
        default:
            ok = false;
            break;
        }
        profile.end(region, bytes);
        ok = all_ok(ok, MPI_COMM_WORLD);
        if (!ok && rank == 0) {
            std::cerr << to_string(cfg.pattern) << " is incorrect in repetition " << rep << "."
                      << std::endl;
        }
    }
    if (!ok) {
        return -1;
    }

    profile.print(std::cout, MPI_COMM_WORLD);
    if (cfg.output) {
        std::ofstream file;
        if (rank == 0) {
            file.open(*cfg.output);
        }
        profile.print(file, MPI_COMM_WORLD);
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);

    argparse::ArgumentParser program("redist-bench");
    program.add_argument("config").help("Configuration file (.toml)");

    TableSchema<Config> schema;
    schema.add_value("pattern", &Config::pattern)
        .converter([](std::string_view value) { return parse_route_pattern(value); })
        .validator([](RoutePattern const& p) { return p != RoutePattern::Unknown; })
        .help("distribute, gather, or scatter");
    schema.add_value("elements", &Config::elements)
        .default_value(1000)
        .help("Base number of elements per rank");
    schema.add_value("repetitions", &Config::repetitions)
        .default_value(10)
        .validator([](auto&& x) { return x >= 1; });
    schema.add_value("root", &Config::root)
        .default_value(0)
        .validator([](auto&& x) { return x >= 0; })
        .help("Root rank of gather and scatter");
    schema.add_value("neighbours", &Config::neighbours)
        .default_value(1)
        .validator([](auto&& x) { return x >= 1; })
        .help("Number of ring neighbours each rank sends to in distribute");
    schema.add_value("broadcast", &Config::broadcast)
        .default_value(false)
        .help("Send the same payload to all neighbours in distribute");
    schema.add_value("remainder", &Config::remainder)
        .converter([](std::string_view value) { return parse_remainder_policy(value); })
        .validator([](RemainderPolicy const& p) { return p != RemainderPolicy::Unknown; })
        .default_value(RemainderPolicy::Warn)
        .help("drop, warn, or error if scatter cannot divide the elements evenly");
    schema.add_array("counts", &Config::counts).help("Explicit scatter count table");
    schema.add_value("output", &Config::output)
        .validator(ParentPathExists())
        .help("File the profile table is written to");

    // every rank parses, only rank 0 reports
    std::ostringstream ignore;
    std::optional<Config> cfg = readFromConfigurationFileAndCmdLine(
        schema, program, argc, argv, rank == 0 ? static_cast<std::ostream&>(std::cout) : ignore);
    if (!cfg) {
        MPI_Finalize();
        return -1;
    }

    if (rank == 0) {
        std::cout << "redist version " << VersionString << std::endl << std::endl;
    }

    int result = -1;
    try {
        result = run(*cfg);
    } catch (std::exception const& e) {
        std::cerr << "Error on rank " << rank << ": " << e.what() << std::endl;
        MPI_Abort(MPI_COMM_WORLD, -1);
    }

    MPI_Finalize();

    return result;
}

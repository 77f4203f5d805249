#include "Router.h"
#include "util/SchemaHelper.h"

#include <numeric>
#include <string>

namespace redist {

RoutePattern parse_route_pattern(std::string_view name) {
    if (iEquals(name, "distribute")) {
        return RoutePattern::Distribute;
    } else if (iEquals(name, "gather")) {
        return RoutePattern::Gather;
    } else if (iEquals(name, "scatter")) {
        return RoutePattern::Scatter;
    }
    return RoutePattern::Unknown;
}

std::string_view to_string(RoutePattern pattern) {
    switch (pattern) {
    case RoutePattern::Distribute:
        return "distribute";
    case RoutePattern::Gather:
        return "gather";
    case RoutePattern::Scatter:
        return "scatter";
    default:
        break;
    }
    return "unknown";
}

RemainderPolicy parse_remainder_policy(std::string_view name) {
    if (iEquals(name, "drop")) {
        return RemainderPolicy::Drop;
    } else if (iEquals(name, "warn")) {
        return RemainderPolicy::Warn;
    } else if (iEquals(name, "error")) {
        return RemainderPolicy::Error;
    }
    return RemainderPolicy::Unknown;
}

unknown_route_pattern::unknown_route_pattern(std::string_view name)
    : std::invalid_argument("Route pattern '" + std::string(name) +
                            "' not recognized (expected distribute, gather, or scatter)") {}

Router::Router(MPI_Comm comm, RemainderPolicy remainder, std::ostream* log)
    : comm_(comm), log_(log), counts_(comm) {
    REDIST_MPI_CHECK(MPI_Comm_rank(comm_, &rank_));
    REDIST_MPI_CHECK(MPI_Comm_size(comm_, &procs_));
    set_remainder_policy(remainder);
}

void Router::set_remainder_policy(RemainderPolicy remainder) {
    if (remainder == RemainderPolicy::Unknown) {
        throw std::invalid_argument("Unknown remainder policy");
    }
    remainder_ = remainder;
}

void Router::check_tag(int tag) const {
    if (tag < 0) {
        throw std::invalid_argument("Message tag must be non-negative, got " +
                                    std::to_string(tag));
    }
}

std::vector<std::size_t>
Router::scatter_counts(std::size_t length, std::optional<std::vector<std::size_t>> const& sendcounts,
                       int root) const {
    if (root < 0 || root >= procs_) {
        throw std::out_of_range("Scatter root " + std::to_string(root) + " is not in [0, " +
                                std::to_string(procs_) + ")");
    }

    if (sendcounts) {
        if (sendcounts->size() != static_cast<std::size_t>(procs_)) {
            throw std::invalid_argument("Scatter count table has " +
                                        std::to_string(sendcounts->size()) + " entries but " +
                                        std::to_string(procs_) + " ranks take part");
        }
        if (rank_ == root) {
            auto total =
                std::accumulate(sendcounts->begin(), sendcounts->end(), static_cast<std::size_t>(0));
            if (total > length) {
                throw std::length_error("Scatter counts sum up to " + std::to_string(total) +
                                        " elements but root holds only " +
                                        std::to_string(length));
            }
        }
        return *sendcounts;
    }

    // only root knows the length
    std::size_t global_length = length;
    REDIST_MPI_CHECK(MPI_Bcast(&global_length, 1, mpi_type_t<std::size_t>(), root, comm_));

    auto counts = equal_division_counts(global_length, procs_);
    auto remainder = global_length % static_cast<std::size_t>(procs_);
    if (remainder != 0) {
        switch (remainder_) {
        case RemainderPolicy::Warn:
            if (rank_ == root && log_) {
                *log_ << "Warning: scatter of " << global_length << " elements over " << procs_
                      << " ranks drops the last " << remainder << " elements" << std::endl;
            }
            break;
        case RemainderPolicy::Error:
            throw std::length_error("Cannot divide " + std::to_string(global_length) +
                                    " elements evenly over " + std::to_string(procs_) + " ranks");
        default:
            break;
        }
    }
    return counts;
}

} // namespace redist

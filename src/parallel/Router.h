#ifndef ROUTER_20261019_H
#define ROUTER_20261019_H

#include "parallel/CommPattern.h"
#include "parallel/CountExchange.h"
#include "parallel/MPIError.h"
#include "parallel/MPITraits.h"
#include "parallel/Payload.h"

#include <mpi.h>

#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace redist {

enum class RoutePattern { Distribute, Gather, Scatter, Unknown };

RoutePattern parse_route_pattern(std::string_view name);
std::string_view to_string(RoutePattern pattern);

/**
 * @brief What to do with the trailing elements an equal-division scatter cannot assign
 */
enum class RemainderPolicy { Drop, Warn, Error, Unknown };

RemainderPolicy parse_remainder_policy(std::string_view name);

class unknown_route_pattern : public std::invalid_argument {
public:
    explicit unknown_route_pattern(std::string_view name);
};

template <typename T> struct DistributeResult {
    std::vector<int> sources;
    std::vector<std::vector<T>> buffers; ///< buffers[i] was received from sources[i]
};

template <typename T> struct GatherResult {
    std::optional<std::vector<T>> data; ///< Only present on the root
    std::vector<std::size_t> counts;    ///< Element count of every rank, present on all ranks
};

template <typename T>
using RouteResult = std::variant<DistributeResult<T>, GatherResult<T>, std::vector<T>>;

/**
 * @brief Arguments of Router::route; each pattern reads the members it needs
 *
 * distribute: destination, payload, tag, type
 * gather: data, root, type
 * scatter: data (root only), sendcounts, root, type
 */
template <typename T> struct RouteArgs {
    std::vector<int> destination;
    std::optional<Payload<T>> payload;
    int tag = 0;
    BufferView<T> data;
    std::optional<std::vector<std::size_t>> sendcounts;
    int root = 0;
    MPI_Datatype type = mpi_type_t<T>();
};

/**
 * @brief Moves flat buffers between the ranks of a communicator
 *
 * Every operation is collective over the communicator and blocks until all of its transfers
 * have completed. Buffers are never transmitted with shape information; receivers reshape.
 *
 * A Router owns the count tables of its irregular exchanges, therefore calls on one Router must
 * not overlap.
 */
class Router {
public:
    Router(MPI_Comm comm = MPI_COMM_WORLD, RemainderPolicy remainder = RemainderPolicy::Warn,
           std::ostream* log = &std::cerr);

    /**
     * @brief Runs the pattern named by pattern (distribute, gather, or scatter)
     *
     * @throws unknown_route_pattern before any communication if the name is not recognized
     */
    template <typename T>
    RouteResult<T> route(std::string_view pattern, RouteArgs<T> const& args) {
        switch (parse_route_pattern(pattern)) {
        case RoutePattern::Distribute:
            if (!args.payload) {
                throw std::invalid_argument("Pattern distribute requires a payload");
            }
            return distribute(args.destination, *args.payload, args.tag, args.type);
        case RoutePattern::Gather:
            return gather(args.data, args.root, args.type);
        case RoutePattern::Scatter:
            return scatter(args.data, args.sendcounts, args.root, args.type);
        default:
            break;
        }
        throw unknown_route_pattern(pattern);
    }

    /**
     * @brief Sends payloads to destinations and receives from every rank that sends here
     *
     * The receive side is discovered with an all-to-all of element counts. The exchange then runs
     * in three phases: all receives are posted, the sends are issued one after another (each
     * completes before the next starts), and finally all receives are awaited. Posting the
     * receives first guarantees progress when MPI cannot buffer the sends.
     *
     * @return Source ranks in ascending order and the buffers received from them
     */
    template <typename T>
    DistributeResult<T> distribute(std::vector<int> const& destinations,
                                   Payload<T> const& payload, int tag,
                                   MPI_Datatype const& type = mpi_type_t<T>()) {
        static_assert(!std::is_same_v<T, bool>, "std::vector<bool> has no contiguous storage");
        check_tag(tag);
        auto transfers = resolve_transfers(destinations, payload);

        counts_.clear();
        for (auto const& transfer : transfers) {
            mpi_count(transfer.payload.size); // throws before anything is sent
            counts_.set_destination(transfer.dest, transfer.payload.size);
        }
        auto const& sources = counts_.exchange();
        auto recvcounts = std::vector<int>(sources.size());
        for (std::size_t i = 0; i < sources.size(); ++i) {
            recvcounts[i] = mpi_count(sources[i].count);
        }

        DistributeResult<T> result;
        result.sources.reserve(sources.size());
        result.buffers.reserve(sources.size());
        auto requests = std::vector<MPI_Request>(sources.size(), MPI_REQUEST_NULL);
        for (std::size_t i = 0; i < sources.size(); ++i) {
            result.sources.push_back(sources[i].rank);
            auto& buffer = result.buffers.emplace_back(sources[i].count);
            REDIST_MPI_CHECK(MPI_Irecv(buffer.data(), recvcounts[i], type, sources[i].rank, tag,
                                       comm_, &requests[i]));
        }

        for (auto const& transfer : transfers) {
            // nobody posts a receive for an empty payload
            if (transfer.payload.size == 0) {
                continue;
            }
            MPI_Request request;
            REDIST_MPI_CHECK(MPI_Isend(transfer.payload.data, mpi_count(transfer.payload.size),
                                       type, transfer.dest, tag, comm_, &request));
            REDIST_MPI_CHECK(MPI_Wait(&request, MPI_STATUS_IGNORE));
        }

        REDIST_MPI_CHECK(MPI_Waitall(static_cast<int>(requests.size()), requests.data(),
                                     MPI_STATUSES_IGNORE));
        return result;
    }

    template <typename T>
    DistributeResult<T> distribute(std::vector<int> const& destinations,
                                   PerDestinationPayloads<T> const& payload, int tag,
                                   MPI_Datatype const& type = mpi_type_t<T>()) {
        return distribute(destinations, Payload<T>(payload), tag, type);
    }

    template <typename T>
    DistributeResult<T> distribute(std::vector<int> const& destinations,
                                   BroadcastPayload<T> const& payload, int tag,
                                   MPI_Datatype const& type = mpi_type_t<T>()) {
        return distribute(destinations, Payload<T>(payload), tag, type);
    }

    /**
     * @brief Concatenates the buffers of all ranks on root, in rank order
     */
    template <typename T>
    GatherResult<T> gather(BufferView<T> data, int root = 0,
                           MPI_Datatype const& type = mpi_type_t<T>()) {
        auto gatherv = GatherV(data.size, root, comm_);
        auto recvd = gatherv.exchange(data.data, type);
        return GatherResult<T>{std::move(recvd), gatherv.recvcounts()};
    }

    template <typename T>
    GatherResult<T> gather(std::vector<T> const& data, int root = 0,
                           MPI_Datatype const& type = mpi_type_t<T>()) {
        return gather(BufferView<T>(data), root, type);
    }

    /**
     * @brief Distributes slices of root's buffer to all ranks
     *
     * Without sendcounts, every rank receives data.size / procs elements of root's buffer; the
     * remainder is not scattered and is handled according to the remainder policy. Explicit
     * sendcounts must be identical on all ranks.
     *
     * @param data Only read on root
     */
    template <typename T>
    std::vector<T> scatter(BufferView<T> data,
                           std::optional<std::vector<std::size_t>> const& sendcounts = std::nullopt,
                           int root = 0, MPI_Datatype const& type = mpi_type_t<T>()) {
        auto scatterv = ScatterV(scatter_counts(data.size, sendcounts, root), root, comm_);
        return scatterv.exchange(scatterv.is_root() ? data.data : nullptr, type);
    }

    template <typename T>
    std::vector<T> scatter(std::vector<T> const& data,
                           std::optional<std::vector<std::size_t>> const& sendcounts = std::nullopt,
                           int root = 0, MPI_Datatype const& type = mpi_type_t<T>()) {
        return scatter(BufferView<T>(data), sendcounts, root, type);
    }

    CountExchange const& counts() const { return counts_; }
    MPI_Comm comm() const { return comm_; }
    int rank() const { return rank_; }
    int procs() const { return procs_; }

    RemainderPolicy remainder_policy() const { return remainder_; }
    void set_remainder_policy(RemainderPolicy remainder);

private:
    std::vector<std::size_t>
    scatter_counts(std::size_t length, std::optional<std::vector<std::size_t>> const& sendcounts,
                   int root) const;
    void check_tag(int tag) const;

    MPI_Comm comm_;
    int rank_;
    int procs_;
    RemainderPolicy remainder_;
    std::ostream* log_;
    CountExchange counts_;
};

} // namespace redist

#endif // ROUTER_20261019_H

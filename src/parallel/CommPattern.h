#ifndef COMMPATTERN_H
#define COMMPATTERN_H

#include "MPIError.h"
#include "MPITraits.h"

#include <mpi.h>

#include <cstddef>
#include <optional>
#include <vector>

namespace redist {

struct RankCount {
    int rank;
    std::size_t count;
};

/**
 * @brief Ranks with a nonzero entry in counts, ascending by rank
 */
std::vector<RankCount> nonzero_counts(std::vector<std::size_t> const& counts);

/**
 * @brief Converts an element count to the int MPI expects
 *
 * @throws std::overflow_error if count exceeds the range of int
 */
int mpi_count(std::size_t count);
std::vector<int> mpi_counts(std::vector<std::size_t> const& counts);

/**
 * @brief Prefix sums of counts in rank order
 *
 * @throws std::overflow_error if an offset exceeds the range of int
 */
void make_displs(std::vector<std::size_t> const& counts, std::vector<int>& displs);

/**
 * @brief Splits length elements evenly over procs ranks
 *
 * Every rank is assigned length / procs elements; the length % procs trailing elements are not
 * assigned to any rank.
 */
std::vector<std::size_t> equal_division_counts(std::size_t length, int procs);

class GatherV {
public:
    /**
     * @brief Collective; all-gathers the local send counts of every rank in comm
     *
     * @throws std::out_of_range if root is not a rank of comm (before communicating)
     */
    GatherV(std::size_t sendcount, int root = 0, MPI_Comm comm = MPI_COMM_WORLD);

    template <typename T>
    [[nodiscard]] std::optional<std::vector<T>>
    exchange(T const* data, MPI_Datatype const& type = mpi_type_t<T>()) const {
        if (!is_root()) {
            exchange(data, static_cast<T*>(nullptr), type);
            return std::nullopt;
        }
        std::vector<T> recvd(recvcount());
        exchange(data, recvd.data(), type);
        return std::make_optional(std::move(recvd));
    }

    template <typename T>
    void exchange(T const* data, T* recvd, MPI_Datatype const& type = mpi_type_t<T>()) const {
        REDIST_MPI_CHECK(MPI_Gatherv(data, sendcount_, type, recvd, mpi_recvcounts_.data(),
                                     displs_.data(), type, root_, comm_));
    }

    std::size_t recvcount() const;
    std::vector<std::size_t> const& recvcounts() const { return recvcounts_; }
    bool is_root() const { return rank_ == root_; }

private:
    int sendcount_;
    int root_;
    MPI_Comm comm_;
    int rank_;
    std::vector<std::size_t> recvcounts_;
    std::vector<int> mpi_recvcounts_;
    std::vector<int> displs_;
};

class ScatterV {
public:
    /**
     * @brief Local; sendcounts must be identical on every rank of comm
     *
     * @throws std::invalid_argument if sendcounts does not have one entry per rank
     * @throws std::out_of_range if root is not a rank of comm
     */
    ScatterV(std::vector<std::size_t> sendcounts, int root = 0, MPI_Comm comm = MPI_COMM_WORLD);

    template <typename T>
    [[nodiscard]] std::vector<T> exchange(T const* data,
                                          MPI_Datatype const& type = mpi_type_t<T>()) const {
        std::vector<T> recvd(recvcount());
        exchange(data, recvd.data(), type);
        return recvd;
    }

    template <typename T>
    void exchange(T const* data, T* recvd, MPI_Datatype const& type = mpi_type_t<T>()) const {
        REDIST_MPI_CHECK(MPI_Scatterv(data, mpi_sendcounts_.data(), displs_.data(), type, recvd,
                                      mpi_sendcounts_[rank_], type, root_, comm_));
    }

    std::size_t recvcount() const { return sendcounts_[rank_]; }
    std::size_t sendcount() const;
    std::vector<std::size_t> const& sendcounts() const { return sendcounts_; }
    bool is_root() const { return rank_ == root_; }

private:
    std::vector<std::size_t> sendcounts_;
    int root_;
    MPI_Comm comm_;
    int rank_;
    std::vector<int> mpi_sendcounts_;
    std::vector<int> displs_;
};

} // namespace redist

#endif // COMMPATTERN_H

#include "CommPattern.h"

#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace redist {

namespace {
void check_rank(int rank, int procs, char const* what) {
    if (rank < 0 || rank >= procs) {
        throw std::out_of_range(std::string(what) + " " + std::to_string(rank) +
                                " is not in [0, " + std::to_string(procs) + ")");
    }
}
} // namespace

std::vector<RankCount> nonzero_counts(std::vector<std::size_t> const& counts) {
    std::vector<RankCount> result;
    for (std::size_t p = 0; p < counts.size(); ++p) {
        if (counts[p] != 0) {
            result.push_back({static_cast<int>(p), counts[p]});
        }
    }
    return result;
}

int mpi_count(std::size_t count) {
    if (count > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::overflow_error("Element count " + std::to_string(count) +
                                  " exceeds the range of MPI counts");
    }
    return static_cast<int>(count);
}

std::vector<int> mpi_counts(std::vector<std::size_t> const& counts) {
    std::vector<int> result(counts.size());
    for (std::size_t p = 0; p < counts.size(); ++p) {
        result[p] = mpi_count(counts[p]);
    }
    return result;
}

void make_displs(std::vector<std::size_t> const& counts, std::vector<int>& displs) {
    displs.resize(counts.size());
    std::size_t offset = 0;
    for (std::size_t p = 0; p < counts.size(); ++p) {
        displs[p] = mpi_count(offset);
        offset += counts[p];
    }
}

std::vector<std::size_t> equal_division_counts(std::size_t length, int procs) {
    if (procs <= 0) {
        throw std::invalid_argument("Number of ranks must be positive");
    }
    return std::vector<std::size_t>(procs, length / static_cast<std::size_t>(procs));
}

GatherV::GatherV(std::size_t sendcount, int root, MPI_Comm comm) : root_(root), comm_(comm) {
    int procs;
    REDIST_MPI_CHECK(MPI_Comm_rank(comm_, &rank_));
    REDIST_MPI_CHECK(MPI_Comm_size(comm_, &procs));
    check_rank(root_, procs, "Gather root");

    recvcounts_.resize(procs);
    REDIST_MPI_CHECK(MPI_Allgather(&sendcount, 1, mpi_type_t<std::size_t>(), recvcounts_.data(),
                                   1, mpi_type_t<std::size_t>(), comm_));

    // identical on all ranks, so either all ranks throw or none
    mpi_recvcounts_ = mpi_counts(recvcounts_);
    make_displs(recvcounts_, displs_);
    sendcount_ = mpi_recvcounts_[rank_];
}

std::size_t GatherV::recvcount() const {
    return std::accumulate(recvcounts_.begin(), recvcounts_.end(), static_cast<std::size_t>(0));
}

ScatterV::ScatterV(std::vector<std::size_t> sendcounts, int root, MPI_Comm comm)
    : sendcounts_(std::move(sendcounts)), root_(root), comm_(comm) {
    int procs;
    REDIST_MPI_CHECK(MPI_Comm_rank(comm_, &rank_));
    REDIST_MPI_CHECK(MPI_Comm_size(comm_, &procs));
    if (sendcounts_.size() != static_cast<std::size_t>(procs)) {
        throw std::invalid_argument("Scatter count table has " +
                                    std::to_string(sendcounts_.size()) + " entries but " +
                                    std::to_string(procs) + " ranks take part");
    }
    check_rank(root_, procs, "Scatter root");

    mpi_sendcounts_ = mpi_counts(sendcounts_);
    make_displs(sendcounts_, displs_);
}

std::size_t ScatterV::sendcount() const {
    return std::accumulate(sendcounts_.begin(), sendcounts_.end(), static_cast<std::size_t>(0));
}

} // namespace redist

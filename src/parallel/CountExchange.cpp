#include "CountExchange.h"
#include "parallel/MPIError.h"
#include "parallel/MPITraits.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace redist {

CountExchange::CountExchange(MPI_Comm comm) : comm_(comm) {
    REDIST_MPI_CHECK(MPI_Comm_size(comm_, &procs_));
    destination_count_.resize(procs_, 0);
    source_count_.resize(procs_, 0);
}

void CountExchange::clear() { std::fill(destination_count_.begin(), destination_count_.end(), 0); }

void CountExchange::set_destination(int dest, std::size_t count) {
    if (dest < 0 || dest >= procs_) {
        throw std::out_of_range("Destination rank " + std::to_string(dest) + " is not in [0, " +
                                std::to_string(procs_) + ")");
    }
    destination_count_[dest] = count;
}

std::vector<RankCount> const& CountExchange::exchange() {
    std::fill(source_count_.begin(), source_count_.end(), 0);
    REDIST_MPI_CHECK(MPI_Alltoall(destination_count_.data(), 1, mpi_type_t<std::size_t>(),
                                  source_count_.data(), 1, mpi_type_t<std::size_t>(), comm_));
    sources_ = nonzero_counts(source_count_);
    return sources_;
}

} // namespace redist

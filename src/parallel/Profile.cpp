#include "Profile.h"
#include "parallel/MPIError.h"

#include <algorithm>
#include <iomanip>
#include <ios>
#include <iterator>
#include <utility>
#include <mpi.h>

namespace redist {

std::size_t Profile::add(std::string name) {
    regions_.emplace_back(std::move(name));
    starts_.emplace_back(0.0);
    times_.emplace_back(0.0);
    bytes_.emplace_back(0ull);
    calls_.emplace_back(0ull);
    return regions_.size() - 1;
}

std::size_t Profile::get(std::string_view name) const {
    auto first = regions_.cbegin();
    auto it = std::find(first, regions_.cend(), name);
    return std::distance(first, it);
}

void Profile::print(std::ostream& out, MPI_Comm comm) const {
    if (regions_.size() == 0) {
        return;
    }

    int rank;
    REDIST_MPI_CHECK(MPI_Comm_rank(comm, &rank));

    int w_1st_col =
        1 + std::max_element(regions_.begin(), regions_.end(), [](auto const& x, auto const& y) {
                return x.size() < y.size();
            })->size();
    constexpr int w = 13;

    if (rank == 0) {
        out << std::setw(w_1st_col) << "Region" << std::setw(w) << "calls" << std::setw(w)
            << "t_min" << std::setw(w) << "t_median" << std::setw(w) << "t_mean" << std::setw(w)
            << "t_max" << std::setw(w) << "GB/s" << std::endl;
    }

    auto old_flags = out.flags();
    auto old_precision = out.precision();
    for (std::size_t region = 0, num = size(); region < num; ++region) {
        auto s = summary(region, comm);
        uint64_t global_bytes;
        REDIST_MPI_CHECK(
            MPI_Reduce(&bytes_[region], &global_bytes, 1, MPI_UINT64_T, MPI_SUM, 0, comm));
        if (rank == 0) {
            double bandwidth = s.max > 0.0 ? global_bytes / s.max * 1e-9 : 0.0;
            out << std::setw(w_1st_col) << regions_[region] << std::setw(w) << calls_[region]
                << std::scientific << std::setprecision(4) << std::setw(w) << s.min
                << std::setw(w) << s.median << std::setw(w) << s.mean << std::setw(w) << s.max
                << std::setw(w) << bandwidth << std::endl;
            out.flags(old_flags);
            out.precision(old_precision);
        }
    }
}

} // namespace redist

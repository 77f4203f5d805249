#ifndef PROFILE_20210916_H
#define PROFILE_20210916_H

#include "parallel/Summary.h"

#include <mpi.h>

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace redist {

/**
 * @brief Accumulates wall time and moved bytes per named region
 */
class Profile {
public:
    std::size_t add(std::string name);
    std::size_t get(std::string_view name) const;
    inline std::string_view get(std::size_t region) const { return regions_[region]; }
    inline std::size_t size() const { return regions_.size(); }

    inline void begin(std::size_t region) { starts_[region] = MPI_Wtime(); }
    inline void end(std::size_t region, uint64_t bytes = 0) {
        times_[region] += MPI_Wtime() - starts_[region];
        bytes_[region] += bytes;
        ++calls_[region];
    }

    inline double time(std::size_t region) const { return times_[region]; }
    inline uint64_t bytes(std::size_t region) const { return bytes_[region]; }
    inline uint64_t calls(std::size_t region) const { return calls_[region]; }

    inline Summary summary(std::size_t region, MPI_Comm comm) const {
        return Summary(times_[region], comm);
    }

    /**
     * @brief Collective; rank 0 writes one row per region
     */
    void print(std::ostream& out, MPI_Comm comm) const;

private:
    std::vector<std::string> regions_;
    std::vector<double> starts_;
    std::vector<double> times_;
    std::vector<uint64_t> bytes_;
    std::vector<uint64_t> calls_;
};

} // namespace redist

#endif // PROFILE_20210916_H

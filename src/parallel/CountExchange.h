#ifndef COUNTEXCHANGE_20261019_H
#define COUNTEXCHANGE_20261019_H

#include "parallel/CommPattern.h"

#include <mpi.h>

#include <cstddef>
#include <vector>

namespace redist {

/**
 * @brief Scratch arena for discovering receive counts of an irregular exchange
 *
 * Holds the destination and source count tables (one entry per rank of comm). The tables are
 * reused between exchanges to avoid reallocation but carry no state from one exchange to the
 * next. Not safe for overlapping exchanges.
 *
 * Usage:
 * @code
 * counts.clear();
 * counts.set_destination(dest, n);
 * auto const& sources = counts.exchange(); // collective
 * @endcode
 */
class CountExchange {
public:
    CountExchange(MPI_Comm comm = MPI_COMM_WORLD);

    /**
     * @brief Zeros the destination count table
     */
    void clear();

    /**
     * @brief Records that count elements go to rank dest
     *
     * A later call for the same rank overwrites the earlier count.
     *
     * @throws std::out_of_range if dest is not a rank of the communicator
     */
    void set_destination(int dest, std::size_t count);

    /**
     * @brief Collective; all-to-all of the destination count table
     *
     * @return Ranks sending a nonzero number of elements to this rank, ascending by rank
     */
    std::vector<RankCount> const& exchange();

    std::vector<std::size_t> const& destination_count() const { return destination_count_; }
    std::vector<std::size_t> const& source_count() const { return source_count_; }
    std::vector<RankCount> const& sources() const { return sources_; }

    MPI_Comm comm() const { return comm_; }
    int procs() const { return procs_; }

private:
    MPI_Comm comm_;
    int procs_;
    std::vector<std::size_t> destination_count_;
    std::vector<std::size_t> source_count_;
    std::vector<RankCount> sources_;
};

} // namespace redist

#endif // COUNTEXCHANGE_20261019_H

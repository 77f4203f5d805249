#ifndef SUMMARY_20210916_H
#define SUMMARY_20210916_H

#include <mpi.h>

namespace redist {

/**
 * @brief Statistics of one value per rank; only valid on rank 0 of comm
 */
struct Summary {
    Summary(double value, MPI_Comm comm);

    double min = 0.0;
    double median = 0.0;
    double mean = 0.0;
    double max = 0.0;
    double sum = 0.0;
};

} // namespace redist

#endif // SUMMARY_20210916_H

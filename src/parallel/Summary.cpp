#include "Summary.h"
#include "parallel/CommPattern.h"

#include <algorithm>
#include <numeric>
#include <vector>

namespace redist {

Summary::Summary(double value, MPI_Comm comm) {
    auto gatherv = GatherV(1, 0, comm);
    auto values = gatherv.exchange(&value);
    if (!values || values->empty()) {
        return;
    }

    auto N = values->size();
    std::sort(values->begin(), values->end());

    min = values->front();
    if (N % 2 == 1) {
        median = (*values)[N / 2];
    } else {
        median = 0.5 * ((*values)[N / 2 - 1] + (*values)[N / 2]);
    }
    max = values->back();
    sum = std::accumulate(values->begin(), values->end(), 0.0);
    mean = sum / N;
}

} // namespace redist

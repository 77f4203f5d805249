#ifndef MPIERROR_20261019_H
#define MPIERROR_20261019_H

#include <mpi.h>

#include <stdexcept>
#include <string>

#define REDIST_MPI_CHECK(call)                                                                     \
    do {                                                                                           \
        int ierr_ = (call);                                                                        \
        if (ierr_ != MPI_SUCCESS) {                                                                \
            throw ::redist::mpi_error(#call, ierr_);                                               \
        }                                                                                          \
    } while (false)

namespace redist {

/**
 * @brief Raised when an MPI call returns an error code
 *
 * Only observable if the communicator's error handler is MPI_ERRORS_RETURN; with the default
 * handler MPI aborts before the code is returned.
 */
class mpi_error : public std::runtime_error {
public:
    mpi_error(char const* call, int ierr)
        : std::runtime_error(format(call, ierr)), ierr_(ierr) {}

    int err_code() const noexcept { return ierr_; }

private:
    static std::string format(char const* call, int ierr) {
        char msg[MPI_MAX_ERROR_STRING];
        int len = 0;
        if (MPI_Error_string(ierr, msg, &len) != MPI_SUCCESS) {
            len = 0;
        }
        return std::string(call) + " failed: " + std::string(msg, len);
    }

    int ierr_;
};

} // namespace redist

#endif // MPIERROR_20261019_H

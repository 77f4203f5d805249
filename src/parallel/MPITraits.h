#ifndef MPITRAITS_H
#define MPITRAITS_H

#include "MPIError.h"

#include <mpi.h>

#include <complex>

namespace redist {

template<typename T> struct mpi_type;
template<typename T> inline MPI_Datatype mpi_type_t() { return mpi_type<T>::type(); }

// character types
template<> struct mpi_type<char> { static MPI_Datatype type() { return MPI_CHAR; } };
template<> struct mpi_type<signed char> { static MPI_Datatype type() { return MPI_SIGNED_CHAR; } };
template<> struct mpi_type<unsigned char> { static MPI_Datatype type() { return MPI_UNSIGNED_CHAR; } };

// integer types
template<> struct mpi_type<short> { static MPI_Datatype type() { return MPI_SHORT; } };
template<> struct mpi_type<int> { static MPI_Datatype type() { return MPI_INT; } };
template<> struct mpi_type<long> { static MPI_Datatype type() { return MPI_LONG; } };
template<> struct mpi_type<long long> { static MPI_Datatype type() { return MPI_LONG_LONG; } };
template<> struct mpi_type<unsigned short> { static MPI_Datatype type() { return MPI_UNSIGNED_SHORT; } };
template<> struct mpi_type<unsigned> { static MPI_Datatype type() { return MPI_UNSIGNED; } };
template<> struct mpi_type<unsigned long> { static MPI_Datatype type() { return MPI_UNSIGNED_LONG; } };
template<> struct mpi_type<unsigned long long> { static MPI_Datatype type() { return MPI_UNSIGNED_LONG_LONG; } };

// floating point types
template<> struct mpi_type<float> { static MPI_Datatype type() { return MPI_FLOAT; } };
template<> struct mpi_type<double> { static MPI_Datatype type() { return MPI_DOUBLE; } };
template<> struct mpi_type<long double> { static MPI_Datatype type() { return MPI_LONG_DOUBLE; } };
template<> struct mpi_type<std::complex<float>> { static MPI_Datatype type() { return MPI_CXX_FLOAT_COMPLEX; } };
template<> struct mpi_type<std::complex<double>> { static MPI_Datatype type() { return MPI_CXX_DOUBLE_COMPLEX; } };

/**
 * @brief Contiguous block of count elements of T as one MPI element
 *
 * Allows fixed-size records (e.g. points of a 3D mesh) to travel as single elements.
 */
template<typename T>
class mpi_array_type {
public:
    mpi_array_type(int count) {
        REDIST_MPI_CHECK(MPI_Type_contiguous(count, mpi_type_t<T>(), &type));
        REDIST_MPI_CHECK(MPI_Type_commit(&type));
    }
    mpi_array_type(mpi_array_type const&) = delete;
    mpi_array_type& operator=(mpi_array_type const&) = delete;

    ~mpi_array_type() {
        MPI_Type_free(&type);
    }

    MPI_Datatype const& get() const { return type; }
private:
    MPI_Datatype type;
};

} // namespace redist

#endif // MPITRAITS_H

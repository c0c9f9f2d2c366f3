#ifndef o3skim_mpi_manager_h
#define o3skim_mpi_manager_h

/// @file

#include "o3skim_config.h"

/** A RAII class that initializes MPI on construction and finalizes it on
 * destruction. rank and size are relative to MPI_COMM_WORLD. Without MPI,
 * or when MPI initialization is disabled by setting O3SKIM_INITIALIZE_MPI
 * to 0, false or off, the rank is 0 and the size is 1. Only the main thread
 * makes MPI calls.
 */
class O3SKIM_EXPORT o3skim_mpi_manager
{
public:
    o3skim_mpi_manager() = delete;
    o3skim_mpi_manager(const o3skim_mpi_manager &) = delete;
    void operator=(const o3skim_mpi_manager &) = delete;

    o3skim_mpi_manager(int &argc, char **&argv);
    ~o3skim_mpi_manager();

    int get_comm_rank() const { return m_rank; }
    int get_comm_size() const { return m_size; }

    /** combine the exit status of every rank. the result is the largest
     * status found, so a failure on any rank is reported on all of them.
     */
    int reduce_status(int status) const;

private:
    int m_rank;
    int m_size;
    int m_initialized;
};

#endif

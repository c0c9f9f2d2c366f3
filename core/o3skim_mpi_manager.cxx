#include "o3skim_mpi_manager.h"
#include "o3skim_common.h"

#include <cstdlib>
#include <string>
#include <strings.h>

#if defined(O3SKIM_HAS_MPI)
#include <mpi.h>
#endif

namespace {

// some systems abort in MPI_Init on login nodes. setting
// O3SKIM_INITIALIZE_MPI=0 skips initialization there.
int initialize_requested()
{
    const char *val = getenv("O3SKIM_INITIALIZE_MPI");
    if (!val)
        return 1;

    return !((std::string(val) == "0") || !strcasecmp(val, "false") ||
        !strcasecmp(val, "off"));
}

}

// --------------------------------------------------------------------------
o3skim_mpi_manager::o3skim_mpi_manager(int &argc, char **&argv)
    : m_rank(0), m_size(1), m_initialized(0)
{
#if defined(O3SKIM_HAS_MPI)
    if (!initialize_requested())
    {
        O3SKIM_WARNING("O3SKIM_INITIALIZE_MPI is off, running on one rank")
        return;
    }

    int provided = 0;
    MPI_Init_thread(&argc, &argv, MPI_THREAD_FUNNELED, &provided);
    if (provided < MPI_THREAD_FUNNELED)
    {
        O3SKIM_FATAL_ERROR("This MPI does not support MPI_THREAD_FUNNELED")
    }

    MPI_Comm_rank(MPI_COMM_WORLD, &m_rank);
    MPI_Comm_size(MPI_COMM_WORLD, &m_size);
    m_initialized = 1;
#else
    (void)argc;
    (void)argv;
#endif
}

// --------------------------------------------------------------------------
o3skim_mpi_manager::~o3skim_mpi_manager()
{
#if defined(O3SKIM_HAS_MPI)
    if (m_initialized)
        MPI_Finalize();
#endif
}

// --------------------------------------------------------------------------
int o3skim_mpi_manager::reduce_status(int status) const
{
#if defined(O3SKIM_HAS_MPI)
    if (m_initialized && (m_size > 1))
    {
        int global = status;
        MPI_Allreduce(&status, &global, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD);
        return global;
    }
#endif
    return status;
}

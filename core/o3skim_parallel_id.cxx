#include "o3skim_parallel_id.h"

#include <ostream>
#include <sstream>
#include <thread>

#if defined(O3SKIM_HAS_MPI)
#include <mpi.h>
#endif

namespace {

int world_rank()
{
    int rank = 0;
#if defined(O3SKIM_HAS_MPI)
    int initialized = 0;
    int finalized = 0;
    MPI_Initialized(&initialized);
    MPI_Finalized(&finalized);
    if (initialized && !finalized)
        MPI_Comm_rank(MPI_COMM_WORLD, &rank);
#endif
    return rank;
}

}

// --------------------------------------------------------------------------
std::ostream &operator<<(std::ostream &os, const o3skim_parallel_id &)
{
    // format first so that concurrent writers don't interleave the tag
    std::ostringstream oss;
    oss << "[" << world_rank() << ":" << std::this_thread::get_id() << "]";
    return os << oss.str();
}

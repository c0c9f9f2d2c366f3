#ifndef o3skim_parallel_id_h
#define o3skim_parallel_id_h

/// @file

#include "o3skim_config.h"
#include <iosfwd>

/** Tags log messages with the MPI rank and the id of the calling thread.
 * Sources are distributed over ranks and models are loaded by a thread
 * pool, this tells the messages of concurrent loads apart.
 */
struct O3SKIM_EXPORT o3skim_parallel_id
{};

/// prints [rank:thread id]. the rank is in MPI_COMM_WORLD, 0 without MPI
O3SKIM_EXPORT
std::ostream &operator<<(std::ostream &os, const o3skim_parallel_id &id);

#endif

#ifndef o3skim_deadline_h
#define o3skim_deadline_h

/// @file

#include <chrono>

/// A point in time after which loading data is abandoned
using o3skim_deadline_t = std::chrono::steady_clock::time_point;

/** return a deadline the given number of seconds from now. zero or less
 * means there is no deadline.
 */
inline
o3skim_deadline_t o3skim_make_deadline(double seconds)
{
    if (seconds <= 0.0)
        return o3skim_deadline_t::max();

    return std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(seconds));
}

/// returns true if the deadline has passed
inline
bool o3skim_deadline_passed(const o3skim_deadline_t &deadline)
{
    return (deadline != o3skim_deadline_t::max()) &&
        (std::chrono::steady_clock::now() > deadline);
}

#endif

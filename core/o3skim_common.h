#ifndef o3skim_common_h
#define o3skim_common_h

/// @file

#include "o3skim_config.h"
#include "o3skim_parallel_id.h"

#include <iostream>
#include <sstream>
#include <unistd.h>
#include <cstdio>
#include <string>
#include <vector>
#include <array>

/** The call signature for the error handler. The error handler will be passed
 * a string describing the error.
 */
using p_o3skim_error_handler = void (*) (const char*);

/// global error handling hooks and the status codes returned by o3skim calls
namespace o3skim_error
{
/** Status codes. Calls return success (0) or one of these. Codes below
 * output_dir_error are contained at the model and variable build boundaries,
 * the others are surfaced to the caller.
 */
enum code
{
    success = 0,
    config_error = 1,
    coordinate_resolution_error = 2,
    unit_conversion_error = 3,
    model_load_error = 4,
    io_write_error = 5,
    output_dir_error = 6,
    not_found = 7
};

/// return a human readable name for the code
O3SKIM_EXPORT
const char *name(int code);

/// The handler invoked by O3SKIM_FATAL_ERROR, error_message_abort by default
extern p_o3skim_error_handler error_handler O3SKIM_EXPORT;

/// An error handler that sends msg to stderr and returns
O3SKIM_EXPORT
void error_message(const char *msg);

/** An error handler that flushes stdout and stderr streams, and sends msg to
 * the stderr before aborting. When MPI is in use MPI_Abort is invoked.
 */
O3SKIM_EXPORT
void error_message_abort(const char *msg);

/** install a handler, one of the above or a custom one with the signature
 * void handler(const char *msg). returns the handler that was replaced.
 */
O3SKIM_EXPORT
p_o3skim_error_handler set_error_handler(p_o3skim_error_handler handler);

};

/// @cond

// the operator<< overloads have to be namespace std in order for
// boost to find them. they are needed for mutitoken program options
namespace std
{
/// send a vector to a stream
template <typename T>
O3SKIM_EXPORT
std::ostream &operator<<(std::ostream &os, const std::vector<T> &vec)
{
    if (!vec.empty())
    {
        os << vec[0];
        size_t n = vec.size();
        for (size_t i = 1; i < n; ++i)
            os << ", " << vec[i];
    }
    return os;
}

/// send a vector of strings to a stream
O3SKIM_EXPORT
std::ostream &operator<<(std::ostream &os, const std::vector<std::string> &vec);
}

/** Return true if we are writing to a TTY. If we are not then we should not
 * use ansi color codes.
 */
O3SKIM_EXPORT int have_tty();


#define ANSI_RED "\033[1;31;40m"
#define ANSI_GREEN "\033[1;32;40m"
#define ANSI_YELLOW "\033[1;33;40m"
#define ANSI_WHITE "\033[1;37;40m"
#define ANSI_OFF "\033[0m"

#define BEGIN_HL(_color) (have_tty()?_color:"")
#define END_HL (have_tty()?ANSI_OFF:"")

/// @endcond


/** Send a message into the stream with an ANSI color coded message that
 * include MPI ranks and thread id.
 */
#define O3SKIM_MESSAGE(_strm, _head, _head_color, _msg)                   \
_strm                                                                     \
    << BEGIN_HL(_head_color) << _head << END_HL                           \
    << " " << o3skim_parallel_id() << " [" << __FILE__ << ":" << __LINE__ \
    << " " << O3SKIM_VERSION_DESCR << "]" << std::endl                    \
    << BEGIN_HL(_head_color) << _head << END_HL << " "                    \
    << BEGIN_HL(ANSI_WHITE) << "" _msg << END_HL << std::endl;

/** Constructs an the error message using O3SKIM_MESSAGE and invokes the
 * error handler.
 */
#define O3SKIM_FATAL_ERROR(_msg)                                          \
{                                                                         \
    std::ostringstream ess;                                               \
    O3SKIM_MESSAGE(ess, "ERROR:", ANSI_RED, _msg)                         \
    o3skim_error::error_handler(ess.str().c_str());                       \
}

/// Constructs an error message and sends it to the stderr stream
#define O3SKIM_ERROR(_msg) O3SKIM_MESSAGE(std::cerr, "ERROR:", ANSI_RED, _msg)

/// Constructs a warning message and sends it to the stderr stream
#define O3SKIM_WARNING(_msg) O3SKIM_MESSAGE(std::cerr, "WARNING:", ANSI_YELLOW, _msg)

/// Constructs a status message and sends it to the stderr stream
#define O3SKIM_STATUS(_msg) O3SKIM_MESSAGE(std::cerr, "STATUS:", ANSI_GREEN, _msg)

#endif

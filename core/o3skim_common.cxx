#include "o3skim_common.h"

#include <cstdlib>

#if defined(O3SKIM_HAS_MPI)
#include <mpi.h>
#endif

namespace std
{
// **************************************************************************
std::ostream &operator<<(std::ostream &os, const std::vector<std::string> &vec)
{
    if (!vec.empty())
    {
        os << "\"" << vec[0] << "\"";
        size_t n = vec.size();
        for (size_t i = 1; i < n; ++i)
            os << ", \"" << vec[i] << "\"";
    }
    return os;
}
}

// **************************************************************************
int have_tty()
{
    static int have = -1;
    if (have < 0)
        have = isatty(fileno(stderr));
    return have;
}


namespace o3skim_error
{
// **************************************************************************
const char *name(int code)
{
    switch (code)
    {
        case success: return "success";
        case config_error: return "ConfigError";
        case coordinate_resolution_error: return "CoordinateResolutionError";
        case unit_conversion_error: return "UnitConversionError";
        case model_load_error: return "ModelLoadError";
        case io_write_error: return "IOWriteError";
        case output_dir_error: return "OutputDirectoryError";
        case not_found: return "NotFound";
    }
    return "UnknownError";
}

// **************************************************************************
void error_message(const char *msg)
{
    std::cout.flush();
    std::cerr << std::endl << msg << std::endl;
}

// **************************************************************************
void error_message_abort(const char *msg)
{
    std::cout.flush();
    std::cerr << std::endl << msg << std::endl
        << "aborting ... " << std::endl;

#if defined(O3SKIM_HAS_MPI)
    int is_init = 0;
    MPI_Initialized(&is_init);
    if (is_init)
        MPI_Abort(MPI_COMM_WORLD, -1);
#endif
    abort();
}

// **************************************************************************
p_o3skim_error_handler set_error_handler(p_o3skim_error_handler handler)
{
    p_o3skim_error_handler prev = error_handler;
    error_handler = handler;
    return prev;
}

// global error handler instance
p_o3skim_error_handler error_handler = error_message_abort;
};

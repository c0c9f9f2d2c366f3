#ifndef o3skim_failure_h
#define o3skim_failure_h

/// @file

#include "o3skim_config.h"
#include "o3skim_common.h"
#include "o3skim_system_interface.h"

#include <exception>
#include <string>
#include <vector>

/// A record of an operation that failed inside a containment boundary.
struct O3SKIM_EXPORT o3skim_failure
{
    std::string what;     ///< the object that failed, eg a model name
    int code;             ///< one of the o3skim_error codes
    std::string message;  ///< the containment message and the error detail
};

using o3skim_failure_list = std::vector<o3skim_failure>;

/** Run an operation inside a failure containment boundary.
 *
 * The operation has the signature int op(ret_t &result) and returns one of
 * the o3skim_error codes. When it returns non-zero or throws a warning naming the message, the error code, the exception
 * text and the program stack is reported, the failure is appended to
 * failures and the fallback is returned. Otherwise the result is returned.
 */
template <typename ret_t, typename op_t>
ret_t o3skim_contain(const std::string &what, const std::string &message,
    const ret_t &fallback, op_t &&op, o3skim_failure_list &failures)
{
    ret_t result;
    int code = o3skim_error::success;
    std::string detail;
    try
    {
        code = op(result);
    }
    catch (const std::exception &e)
    {
        code = o3skim_error::model_load_error;
        detail = e.what();
    }
    catch (...)
    {
        code = o3skim_error::model_load_error;
        detail = "unknown exception";
    }

    if (code == o3skim_error::success)
        return result;

    O3SKIM_WARNING(<< message << " (" << what << "). "
        << o3skim_error::name(code)
        << (detail.empty() ? "" : ": ") << detail << std::endl
        << "Program Stack:" << std::endl
        << o3skim_system_interface::get_program_stack(1, 0))

    failures.push_back(o3skim_failure{what, code,
        detail.empty() ? message : message + ": " + detail});

    return fallback;
}

#endif

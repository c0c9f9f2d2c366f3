#ifndef o3skim_system_interface_h
#define o3skim_system_interface_h

/// @file

#include "o3skim_config.h"
#include <string>

/// Codes for interfacing with low level system API's
namespace o3skim_system_interface
{
/** when enabled a stack trace is printed in response to the fatal signals
 * SIGABRT, SIGSEGV, SIGTERM, SIGINT, SIGILL, SIGBUS and SIGFPE. disabling
 * restores the handlers that were installed before.
 */
O3SKIM_EXPORT void set_stack_trace_on_error(int enable = 1);

/** return the current call stack, one frame per line, with C++ symbols
 * demangled. frames before first_frame are skipped. file names are shown
 * without their directory unless whole_path is set.
 */
O3SKIM_EXPORT std::string get_program_stack(int first_frame, int whole_path);

/// the file name of the running executable
O3SKIM_EXPORT std::string get_program_name();
}

#endif

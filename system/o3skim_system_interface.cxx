#include "o3skim_system_interface.h"

#if (defined(__GNUC__) || defined(__PGI)) && !defined(_GNU_SOURCE)
# define _GNU_SOURCE
#endif

#include <string>
#include <iostream>
#include <sstream>

#include <unistd.h>
#include <signal.h>
#include <errno.h>
#include <execinfo.h>
#include <cxxabi.h>
#include <dlfcn.h>

#include <stdlib.h>
#include <string.h>

extern "C" { typedef void (*sig_action_t)(int,siginfo_t*,void*); }

namespace {

// the signals we report on
struct handled_signal
{
    int number;
    const char *name;
    int has_address;
};

const handled_signal handled_signals[] = {
    {SIGABRT, "SIGABRT", 0},
    {SIGSEGV, "SIGSEGV", 1},
    {SIGTERM, "SIGTERM", 0},
    {SIGINT, "SIGINT", 0},
    {SIGILL, "SIGILL", 1},
    {SIGBUS, "SIGBUS", 1},
    {SIGFPE, "SIGFPE", 1}};

constexpr int n_handled_signals =
    sizeof(handled_signals)/sizeof(handled_signal);

// the actions in place before ours were installed
struct sigaction original_actions[n_handled_signals];
int original_actions_valid = 0;

const char *safe(const char *str)
{
    return str ? str : "???";
}

// **************************************************************************
std::string strip_directory(const std::string &path, int whole_path)
{
    size_t at = std::string::npos;
    if (whole_path || ((at = path.rfind('/')) == std::string::npos))
        return path;

    return path.substr(at + 1);
}

// **************************************************************************
std::string demangle(const char *symbol)
{
    std::string result = safe(symbol);
    int status = 0;
    char *demangled = abi::__cxa_demangle(symbol, nullptr, nullptr, &status);
    if ((status == 0) && demangled)
        result = demangled;
    free(demangled);
    return result;
}

// ****************************************************************************
void stack_trace_signal_handler(int sig_no, siginfo_t *sig_info, void *)
{
    std::ostringstream oss;
    oss << std::endl
       << "=========================================================" << std::endl
       << o3skim_system_interface::get_program_name()
       << " process id " << getpid() << " caught ";

    int i = 0;
    while ((i < n_handled_signals) && (handled_signals[i].number != sig_no))
        ++i;

    if (i < n_handled_signals)
    {
        oss << handled_signals[i].name;
        if (handled_signals[i].has_address)
            oss << " at " << (sig_info->si_addr ? "" : "0x") << sig_info->si_addr;
    }
    else
    {
        oss << "signal " << sig_no;
    }

    oss << std::endl
        << "Program Stack:" << std::endl
        << o3skim_system_interface::get_program_stack(2, 0)
        << "=========================================================" << std::endl;

    std::cerr << oss.str() << std::endl;

    // put back the original handlers so abort is not caught again
    o3skim_system_interface::set_stack_trace_on_error(0);
    abort();
}

}

namespace o3skim_system_interface
{
// **************************************************************************
std::string get_program_stack(int first_frame, int whole_path)
{
    std::ostringstream oss;
    void *frames[256];
    int n_frames = backtrace(frames, 256);
    for (int i = first_frame; i < n_frames; ++i)
    {
        Dl_info info;
        if (dladdr(frames[i], &info) && info.dli_sname && info.dli_saddr)
        {
            oss << std::hex << frames[i] << std::dec << " : "
                << demangle(info.dli_sname) << " [("
                << strip_directory(safe(info.dli_fname), whole_path)
                << ")]" << std::endl;
        }
        else
        {
            char **symbol = backtrace_symbols(&frames[i], 1);
            oss << safe(symbol ? symbol[0] : nullptr) << std::endl;
            free(symbol);
        }
    }
    return oss.str();
}

// **************************************************************************
std::string get_program_name()
{
    char buf[1024] = {'\0'};
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0)
        return program_invocation_short_name;

    buf[n] = '\0';
    return strip_directory(buf, 0);
}

// **************************************************************************
void set_stack_trace_on_error(int enable)
{
    if (enable && !original_actions_valid)
    {
        struct sigaction sa;
        memset(&sa, 0, sizeof(sa));
        sa.sa_sigaction = (sig_action_t)stack_trace_signal_handler;
        sa.sa_flags = SA_SIGINFO | SA_RESETHAND;
#if defined(SA_RESTART)
        sa.sa_flags |= SA_RESTART;
#endif
        sigemptyset(&sa.sa_mask);

        for (int i = 0; i < n_handled_signals; ++i)
            sigaction(handled_signals[i].number, &sa, &original_actions[i]);

        original_actions_valid = 1;
    }
    else if (!enable && original_actions_valid)
    {
        for (int i = 0; i < n_handled_signals; ++i)
            sigaction(handled_signals[i].number, &original_actions[i], nullptr);

        original_actions_valid = 0;
    }
}

}

#ifndef o3skim_app_util_h
#define o3skim_app_util_h

/// @file

#include "o3skim_config.h"

#include <string>
#include <boost/program_options.hpp>

/// Codes shared by the command line application
namespace o3skim_app_util
{

/** parse the command line into opt_vals. --help, --advanced_help and
 * --full_help print the basic, advanced or all option definitions on rank 0
 * and 1 is returned, in that case required options are not checked. -1 is
 * returned if the command line could not be parsed, 0 otherwise.
 */
int process_command_line_help(int rank, int argc, char **argv,
    boost::program_options::options_description &basic_opt_defs,
    boost::program_options::options_description &advanced_opt_defs,
    boost::program_options::options_description &all_opt_defs,
    boost::program_options::variables_map &opt_vals);

/** make a relative path absolute by prefixing the current working
 * directory. return 0 if successful.
 */
int make_absolute(std::string &path);

}

#endif

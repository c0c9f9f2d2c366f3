#include "o3skim_app_util.h"

#include "o3skim_config.h"
#include "o3skim_common.h"
#include "o3skim_file_util.h"
#include "o3skim_system_interface.h"

#include <exception>
#include <iostream>

namespace po = boost::program_options;

namespace {

// --------------------------------------------------------------------------
void print_help(const po::options_description &opt_defs)
{
    std::cerr << std::endl
        << "o3skim version " << O3SKIM_VERSION_DESCR
        << " compiled on " << __DATE__ << " " << __TIME__ << std::endl
        << std::endl
        << "Application usage: " << o3skim_system_interface::get_program_name()
        << " --config <file> [options]" << std::endl
        << std::endl
        << "Reduces ozone model output to zonal means split by year or decade."
        << std::endl << std::endl
        << opt_defs << std::endl
        << std::endl;
}

}

namespace o3skim_app_util
{

// --------------------------------------------------------------------------
int process_command_line_help(int rank, int argc, char **argv,
    po::options_description &basic_opt_defs,
    po::options_description &advanced_opt_defs,
    po::options_description &all_opt_defs,
    po::variables_map &opt_vals)
{
    // no positionals, a typo must not be taken for one
    po::positional_options_description pos_opt_defs;

    try
    {
        po::store(po::command_line_parser(argc, argv)
                .style(po::command_line_style::unix_style ^
                       po::command_line_style::allow_short)
                .options(all_opt_defs)
                .positional(pos_opt_defs)
                .run(),
            opt_vals);
    }
    catch (std::exception &e)
    {
        O3SKIM_ERROR("Error parsing command line options. See --help "
            "for a list of supported options. " << e.what())
        return -1;
    }

    const po::options_description *help_defs = nullptr;
    if (opt_vals.count("help"))
        help_defs = &basic_opt_defs;
    else if (opt_vals.count("advanced_help"))
        help_defs = &advanced_opt_defs;
    else if (opt_vals.count("full_help"))
        help_defs = &all_opt_defs;

    if (help_defs)
    {
        if (rank == 0)
            print_help(*help_defs);
        return 1;
    }

    try
    {
        po::notify(opt_vals);
    }
    catch (std::exception &e)
    {
        O3SKIM_ERROR("Error in the command line options. See --help "
            "for a list of supported options. " << e.what())
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
int make_absolute(std::string &path)
{
    if (!path.empty() && (path[0] == PATH_SEP[0]))
        return 0;

    std::string cwd;
    if (o3skim_file_util::get_current_directory(cwd))
        return -1;

    path = o3skim_file_util::join(cwd, path.empty() ? "." : path);
    return 0;
}

}

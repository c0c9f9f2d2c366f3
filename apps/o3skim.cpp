#include "o3skim_config.h"
#include "o3skim_common.h"
#include "o3skim_app_util.h"
#include "o3skim_config_reader.h"
#include "o3skim_configuration.h"
#include "o3skim_file_util.h"
#include "o3skim_mpi_manager.h"
#include "o3skim_skim_engine.h"
#include "o3skim_source.h"
#include "o3skim_standardize.h"
#include "o3skim_system_interface.h"

#include <string>
#include <vector>
#include <iostream>
#include <boost/program_options.hpp>

using namespace std;

using boost::program_options::value;
using boost::program_options::options_description;
using boost::program_options::variables_map;

// --------------------------------------------------------------------------
int main(int argc, char **argv)
{
    o3skim_mpi_manager mpi_man(argc, argv);
    int rank = mpi_man.get_comm_rank();
    int n_ranks = mpi_man.get_comm_size();

    o3skim_system_interface::set_stack_trace_on_error();

    // initialize comand line options description set up some comon options to
    // simplify use for most comon scenarios
    int help_width = 100;
    options_description basic_opt_defs(
        "Basic usage:\n\n"
        "The following options are the most comonly used. Information\n"
        "on all available options can be displayed using --advanced_help\n\n"
        "Basic comand line options", help_width, help_width - 4
        );
    basic_opt_defs.add_options()
        ("config", value<std::string>()->required(), "\nA YAML file describing"
            " the sources to skim. Each source holds one or more models, each"
            " model the tco3_zm and/or vmro3_zm variables with their name, path"
            " expressions and coordinate names in the raw files.\n")

        ("output_dir", value<std::string>()->default_value("."), "\nThe directory"
            " the output is written to. A <source>_<model> directory is created"
            " in it for each model.\n")

        ("groupby", value<std::string>()->default_value("none"), "\nHow the"
            " output is split in time. One of none, year or decade.\n")

        ("verbose", value<int>()->default_value(0), "\nThe level of reporting"
            " from 0 to 2\n")

        ("help", "\ndisplays documentation for application specific command line options\n")
        ("advanced_help", "\ndisplays documentation for algorithm specific command line options\n")
        ("full_help", "\ndisplays both basic and advanced documentation together\n")
        ;

    options_description advanced_opt_defs(
        "Advanced usage:\n\n"
        "The following list contains the options controlling how the data\n"
        "is located and loaded.\n\n"
        "Advanced comand line options", help_width, help_width - 4
        );
    advanced_opt_defs.add_options()
        ("data_dir", value<std::string>()->default_value("."), "\nThe directory"
            " relative path expressions in the configuration are resolved in\n")

        ("n_threads", value<int>()->default_value(1), "\nThe number of threads"
            " used to load the models of a source. -1 uses one per core.\n")

        ("load_timeout", value<double>()->default_value(0.0), "\nThe number of"
            " seconds a model may take to load. 0 means no limit.\n")

        ("lat_mean", "\nAverage the variables over latitude. The lat"
            " coordinate is removed from the output.\n")

        ("year_mean", "\nAverage the variables over each calendar year. Each"
            " year is stamped on its first day.\n")
        ;

    // package basic and advanced options for display
    options_description all_opt_defs(help_width, help_width - 4);
    all_opt_defs.add(basic_opt_defs).add(advanced_opt_defs);

    // parse the command line
    int ierr = 0;
    variables_map opt_vals;
    if ((ierr = o3skim_app_util::process_command_line_help(
        rank, argc, argv, basic_opt_defs,
        advanced_opt_defs, all_opt_defs, opt_vals)))
    {
        if (ierr == 1)
            return 0;
        return o3skim_error::config_error;
    }

    std::string config_file = opt_vals["config"].as<string>();
    std::string output_dir = opt_vals["output_dir"].as<string>();
    std::string data_dir = opt_vals["data_dir"].as<string>();
    std::string groupby = opt_vals["groupby"].as<string>();
    int verbose = opt_vals["verbose"].as<int>();
    int n_threads = opt_vals["n_threads"].as<int>();
    double load_timeout = opt_vals["load_timeout"].as<double>();

    int reductions = 0;
    if (opt_vals.count("lat_mean"))
        reductions |= o3skim_standardize::lat_mean;
    if (opt_vals.count("year_mean"))
        reductions |= o3skim_standardize::year_mean;

    if ((groupby != "none") && (groupby != "year") && (groupby != "decade"))
    {
        if (rank == 0)
        {
            O3SKIM_ERROR("--groupby must be one of none, year or decade, not \""
                << groupby << "\"")
        }
        return o3skim_error::config_error;
    }

    if ((verbose < 0) || (verbose > 2))
    {
        if (rank == 0)
        {
            O3SKIM_ERROR("--verbose must be 0, 1 or 2")
        }
        return o3skim_error::config_error;
    }

    // the working directory changes while loading
    if (o3skim_app_util::make_absolute(config_file) ||
        o3skim_app_util::make_absolute(output_dir))
    {
        O3SKIM_ERROR("Failed to get the current working directory")
        return o3skim_error::output_dir_error;
    }

    // read the configuration
    o3skim_configuration config;
    p_o3skim_config_reader config_reader = o3skim_config_reader::New();
    config_reader->set_file_name(config_file);
    config_reader->set_verbose(verbose > 1);
    if (config_reader->read(config))
    {
        O3SKIM_ERROR("Failed to load the configuration \"" << config_file << "\"")
        return o3skim_error::config_error;
    }

    if (o3skim_file_util::make_directories(output_dir))
    {
        O3SKIM_ERROR("Failed to create the output directory \""
            << output_dir << "\"")
        return o3skim_error::output_dir_error;
    }

    // sources are distributed over the ranks round robin
    int status = o3skim_error::success;
    unsigned long n_written = 0;
    unsigned long n_failed = 0;
    unsigned long n_model_failures = 0;
    size_t n_sources = config.sources.size();
    for (size_t i = 0; i < n_sources; ++i)
    {
        if ((i % n_ranks) != static_cast<size_t>(rank))
            continue;

        const o3skim_source_spec &spec = config.sources[i];

        if (verbose)
        {
            O3SKIM_STATUS("Loading source " << spec.name)
        }

        p_o3skim_source source = o3skim_source::New();
        source->set_verbose(verbose);
        source->set_n_threads(n_threads);
        source->set_load_timeout(load_timeout);
        source->set_reductions(reductions);

        {
        o3skim_file_util::scoped_cd cd(data_dir);
        if (!cd.good())
        {
            O3SKIM_ERROR("Failed to enter the data directory \""
                << data_dir << "\"")
            status = o3skim_error::config_error;
            break;
        }

        if (source->load(spec))
        {
            O3SKIM_ERROR("Failed to load source " << spec.name)
            continue;
        }
        }

        n_model_failures += source->get_failures().size();

        o3skim_skim_report report;
        if ((ierr = source->skim(output_dir, groupby, report)))
        {
            O3SKIM_ERROR("Failed to skim source " << spec.name << ". "
                << o3skim_error::name(ierr))
            status = ierr;
        }

        n_written += report.written.size();
        n_failed += report.failed.size();

        size_t n_bad = report.failed.size();
        for (size_t j = 0; j < n_bad; ++j)
        {
            O3SKIM_WARNING("Failed to write \"" << report.failed[j] << "\"")
        }
    }

    if (verbose)
    {
        O3SKIM_STATUS("Wrote " << n_written << " files, " << n_failed
            << " failed to write and " << n_model_failures
            << " variables or models failed to load")
    }

    return mpi_man.reduce_status(status);
}

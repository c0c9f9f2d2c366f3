#include "o3skim_adapter.h"
#include "o3skim_cf_reader.h"
#include "o3skim_common.h"
#include "o3skim_file_util.h"
#include "o3skim_standardize.h"

// --------------------------------------------------------------------------
int o3skim_adapter::convert_units(o3skim_dataset &) const
{
    return o3skim_error::success;
}

// --------------------------------------------------------------------------
int o3skim_adapter::standardize(const o3skim_variable_spec &spec,
    const o3skim_deadline_t &deadline, int verbose,
    p_o3skim_dataset &result, int reductions) const
{
    const std::string var_name = this->get_variable_name();

    const std::vector<std::string> &axes = this->get_required_axes();
    size_t n_axes = axes.size();
    for (size_t i = 0; i < n_axes; ++i)
    {
        if (!spec.coordinates.count(axes[i]))
        {
            O3SKIM_ERROR(<< var_name << " requires the " << axes[i]
                << " coordinate")
            return o3skim_error::coordinate_resolution_error;
        }
    }

    // locate the files
    std::vector<std::string> files;
    if (o3skim_file_util::expand_paths(spec.paths, files))
    {
        O3SKIM_ERROR("Failed to locate the files of " << var_name)
        return o3skim_error::model_load_error;
    }

    if (verbose)
    {
        O3SKIM_STATUS("Reading " << var_name << " \"" << spec.name
            << "\" from " << files.size() << " files")
    }

    p_o3skim_cf_reader reader = o3skim_cf_reader::New();
    reader->set_file_names(files);
    reader->set_time_dimension(spec.coordinates.at("time"));
    reader->set_deadline(deadline);
    reader->set_verbose(verbose > 1);

    p_o3skim_dataset ds;
    int status = o3skim_error::success;
    if ((status = reader->read(ds)))
    {
        O3SKIM_ERROR("Failed to read " << var_name)
        return status;
    }

    if ((status = o3skim_standardize::filter_attributes(*ds))
        || (status = o3skim_standardize::rename(*ds, spec.name, var_name,
            spec.coordinates))
        || (status = this->convert_units(*ds))
        || (status = o3skim_standardize::mean_over_longitude(*ds, var_name))
        || (status = o3skim_standardize::drop_unrelated(*ds, var_name))
        || (status = o3skim_standardize::materialize(*ds, verbose))
        || (status = o3skim_standardize::complete_attributes(*ds, var_name,
            this->get_standard_name()))
        || ((reductions & o3skim_standardize::lat_mean) &&
            (status = o3skim_standardize::mean_over_latitude(*ds, var_name)))
        || ((reductions & o3skim_standardize::year_mean) &&
            (status = o3skim_standardize::mean_over_year(*ds, var_name))))
    {
        O3SKIM_ERROR("Failed to standardize " << var_name << " \""
            << spec.name << "\"")
        return status;
    }

    result = ds;
    return o3skim_error::success;
}

// --------------------------------------------------------------------------
const std::vector<std::string> &o3skim_tco3_adapter::get_required_axes() const
{
    static const std::vector<std::string> axes = {"time", "lat", "lon"};
    return axes;
}

// --------------------------------------------------------------------------
const std::vector<std::string> &o3skim_vmro3_adapter::get_required_axes() const
{
    static const std::vector<std::string> axes = {"time", "lat", "lon", "plev"};
    return axes;
}

// --------------------------------------------------------------------------
int o3skim_vmro3_adapter::convert_units(o3skim_dataset &ds) const
{
    return o3skim_standardize::convert_to_ppmv(ds, this->get_variable_name());
}

// --------------------------------------------------------------------------
p_o3skim_adapter o3skim_adapter_factory::New(const std::string &var)
{
    if (var == "tco3_zm")
        return std::make_shared<o3skim_tco3_adapter>();
    else if (var == "vmro3_zm")
        return std::make_shared<o3skim_vmro3_adapter>();

    O3SKIM_ERROR("There is no adapter for \"" << var << "\"")
    return nullptr;
}

#include "o3skim_standardize.h"
#include "o3skim_calendar_util.h"
#include "o3skim_common.h"

#include <algorithm>

namespace
{
// append a method to the cell_methods attribute
void append_cell_method(o3skim_metadata &atts, const std::string &method)
{
    std::string cell_methods;
    if ((atts.get("cell_methods", cell_methods) == 0) && !cell_methods.empty())
        cell_methods += " " + method;
    else
        cell_methods = method;
    atts.set("cell_methods", cell_methods);
}

// average the variable over the named axis and remove the axis and every
// coordinate defined on it
int mean_over_axis(o3skim_dataset &ds, const std::string &var_name,
    const std::string &axis)
{
    p_o3skim_array var = ds.get_variable(var_name);
    if (!var)
    {
        O3SKIM_ERROR("The variable \"" << var_name << "\" was not found")
        return o3skim_error::coordinate_resolution_error;
    }

    if (!var->has_dim(axis))
    {
        O3SKIM_ERROR("\"" << var_name << "\" is not defined on " << axis)
        return o3skim_error::coordinate_resolution_error;
    }

    p_o3skim_array mean;
    if (var->mean(axis, mean))
    {
        O3SKIM_ERROR("Failed to average \"" << var_name << "\" over " << axis)
        return o3skim_error::model_load_error;
    }

    append_cell_method(mean->get_attributes(), axis + ": mean");

    ds.set_variable(var_name, mean);

    // the axis and its bounds
    std::vector<std::string> coords = ds.get_coordinate_names();
    size_t n_coords = coords.size();
    for (size_t i = 0; i < n_coords; ++i)
    {
        if ((coords[i] == axis) || ds.get_coordinate(coords[i])->has_dim(axis))
            ds.remove_coordinate(coords[i]);
    }

    return o3skim_error::success;
}
}

namespace o3skim_standardize
{

// **************************************************************************
const std::vector<std::string> &get_attribute_whitelist()
{
    static const std::vector<std::string> whitelist =
        {"standard_name", "long_name", "units", "cell_methods", "bounds"};
    return whitelist;
}

// **************************************************************************
int filter_attributes(o3skim_metadata &atts)
{
    const std::vector<std::string> &whitelist = get_attribute_whitelist();

    std::vector<std::string> names;
    atts.get_names(names);

    size_t n_names = names.size();
    for (size_t i = 0; i < n_names; ++i)
    {
        if (std::find(whitelist.begin(), whitelist.end(), names[i]) == whitelist.end())
            atts.remove(names[i]);
    }

    return o3skim_error::success;
}

// **************************************************************************
int filter_attributes(o3skim_dataset &ds)
{
    filter_attributes(ds.get_attributes());

    std::vector<std::string> names = ds.get_coordinate_names();
    std::vector<std::string> var_names = ds.get_variable_names();
    names.insert(names.end(), var_names.begin(), var_names.end());

    size_t n_names = names.size();
    for (size_t i = 0; i < n_names; ++i)
        filter_attributes(ds.get_array(names[i])->get_attributes());

    return o3skim_error::success;
}

// **************************************************************************
int rename(o3skim_dataset &ds, const std::string &raw_name,
    const std::string &var_name,
    const std::map<std::string, std::string> &coordinates)
{
    if (!ds.has_variable(raw_name))
    {
        O3SKIM_ERROR("The variable \"" << raw_name << "\" was not found")
        return o3skim_error::coordinate_resolution_error;
    }

    if ((raw_name != var_name) && ds.rename(raw_name, var_name))
    {
        O3SKIM_ERROR("Failed to rename the variable \"" << raw_name
            << "\" to \"" << var_name << "\"")
        return o3skim_error::coordinate_resolution_error;
    }

    auto it = coordinates.begin();
    auto end = coordinates.end();
    for (; it != end; ++it)
    {
        const std::string &axis = it->first;
        const std::string &raw_axis = it->second;

        if (raw_axis == axis)
        {
            if (!ds.has_coordinate(axis) && !ds.has_dimension(axis))
            {
                O3SKIM_ERROR("The " << axis << " coordinate \"" << raw_axis
                    << "\" was not found")
                return o3skim_error::coordinate_resolution_error;
            }
            continue;
        }

        if (ds.rename(raw_axis, axis))
        {
            O3SKIM_ERROR("Failed to resolve the " << axis << " coordinate \""
                << raw_axis << "\"")
            return o3skim_error::coordinate_resolution_error;
        }
    }

    return o3skim_error::success;
}

// **************************************************************************
int get_ppmv_factor(const std::string &units, double &factor)
{
    static const std::map<std::string, double> factors =
        {{"mole mole-1", 1.0e6}, {"mol mol-1", 1.0e6}, {"mol/mol", 1.0e6},
        {"mole/mole", 1.0e6}, {"1", 1.0e6},
        {"ppmv", 1.0}, {"ppm", 1.0},
        {"ppbv", 1.0e-3}, {"ppb", 1.0e-3},
        {"pptv", 1.0e-6}, {"ppt", 1.0e-6}};

    auto it = factors.find(units);
    if (it == factors.end())
        return o3skim_error::unit_conversion_error;

    factor = it->second;
    return o3skim_error::success;
}

// **************************************************************************
int convert_to_ppmv(o3skim_dataset &ds, const std::string &var_name)
{
    p_o3skim_array var = ds.get_variable(var_name);
    if (!var)
    {
        O3SKIM_ERROR("The variable \"" << var_name << "\" was not found")
        return o3skim_error::coordinate_resolution_error;
    }

    std::string units;
    if (var->get_attributes().get("units", units))
    {
        O3SKIM_ERROR("\"" << var_name << "\" has no units")
        return o3skim_error::unit_conversion_error;
    }

    double factor = 1.0;
    if (get_ppmv_factor(units, factor))
    {
        O3SKIM_ERROR("Can't convert \"" << var_name << "\" from \""
            << units << "\" to ppmv")
        return o3skim_error::unit_conversion_error;
    }

    if (var->load())
    {
        O3SKIM_ERROR("Failed to load \"" << var_name << "\"")
        return o3skim_error::model_load_error;
    }

    if (factor != 1.0)
        var->scale(factor);

    var->set_type(o3skim_array::float32);
    var->get_attributes().set("units", std::string("ppmv"));

    return o3skim_error::success;
}

// **************************************************************************
int mean_over_longitude(o3skim_dataset &ds, const std::string &var_name)
{
    return mean_over_axis(ds, var_name, "lon");
}

// **************************************************************************
int mean_over_latitude(o3skim_dataset &ds, const std::string &var_name)
{
    return mean_over_axis(ds, var_name, "lat");
}

// **************************************************************************
int mean_over_year(o3skim_dataset &ds, const std::string &var_name)
{
    p_o3skim_array var = ds.get_variable(var_name);
    if (!var)
    {
        O3SKIM_ERROR("The variable \"" << var_name << "\" was not found")
        return o3skim_error::coordinate_resolution_error;
    }

    p_o3skim_array time = ds.get_coordinate("time");
    if (!time || !var->has_dim("time"))
    {
        O3SKIM_ERROR("\"" << var_name << "\" is not defined on time")
        return o3skim_error::coordinate_resolution_error;
    }

    if (time->load())
    {
        O3SKIM_ERROR("Failed to load the time coordinate")
        return o3skim_error::model_load_error;
    }

    std::string units;
    std::string calendar;
    time->get_encoding().get("units", units);
    time->get_encoding().get("calendar", calendar);

    // the time steps of each calendar year
    o3skim_calendar_util::p_partition_iterator it =
        o3skim_calendar_util::partition_iterator_factory::New("year");

    if (!it || it->initialize(time->get_values(), units, calendar))
    {
        O3SKIM_ERROR("Failed to group the time steps of \"" << var_name
            << "\" by year")
        return o3skim_error::model_load_error;
    }

    std::vector<std::vector<unsigned long>> groups;
    std::vector<double> t;
    std::vector<double> t_bnds;
    while (*it)
    {
        o3skim_calendar_util::partition part;
        double t0 = 0.0;
        double t1 = 0.0;
        if (it->get_next_partition(part) ||
            o3skim_calendar_util::coordinate(part.start, 1, 1, 0, 0, 0.0,
                units, calendar, t0) ||
            o3skim_calendar_util::coordinate(part.end, 1, 1, 0, 0, 0.0,
                units, calendar, t1))
        {
            O3SKIM_ERROR("Failed to group the time steps of \"" << var_name
                << "\" by year")
            return o3skim_error::model_load_error;
        }

        groups.push_back(part.indices);
        t.push_back(t0);
        t_bnds.push_back(t0);
        t_bnds.push_back(t1);
    }

    unsigned long n_years = groups.size();

    // each year is stamped on its first day
    p_o3skim_array year_time = o3skim_array::New({"time"}, {n_years}, t);
    year_time->get_attributes() = time->get_attributes();
    year_time->get_encoding() = time->get_encoding();
    year_time->set_type(time->get_type());

    std::string bounds_name;
    time->get_attributes().get("bounds", bounds_name);

    std::vector<std::string> names = ds.get_coordinate_names();
    std::vector<std::string> var_names = ds.get_variable_names();
    names.insert(names.end(), var_names.begin(), var_names.end());

    size_t n_names = names.size();
    for (size_t i = 0; i < n_names; ++i)
    {
        p_o3skim_array arr = ds.get_array(names[i]);
        if ((names[i] == "time") || !arr->has_dim("time"))
            continue;

        p_o3skim_array reduced;
        if (!bounds_name.empty() && (names[i] == bounds_name))
        {
            // the bounds span the whole year
            if ((arr->get_dims().size() != 2) || (arr->get_shape()[1] != 2))
            {
                O3SKIM_ERROR("The time bounds \"" << bounds_name
                    << "\" must have shape (time, 2)")
                return o3skim_error::coordinate_resolution_error;
            }

            reduced = o3skim_array::New(arr->get_dims(), {n_years, 2}, t_bnds);
            reduced->get_attributes() = arr->get_attributes();
            reduced->get_encoding() = arr->get_encoding();
            reduced->set_type(arr->get_type());
        }
        else if (arr->group_mean("time", groups, reduced))
        {
            O3SKIM_ERROR("Failed to average \"" << names[i] << "\" by year")
            return o3skim_error::model_load_error;
        }

        if (ds.get_coordinate(names[i]))
            ds.set_coordinate(names[i], reduced);
        else
            ds.set_variable(names[i], reduced);
    }

    ds.set_coordinate("time", year_time);

    append_cell_method(ds.get_variable(var_name)->get_attributes(), "time: mean");

    return o3skim_error::success;
}

// **************************************************************************
int drop_unrelated(o3skim_dataset &ds, const std::string &var_name)
{
    const_p_o3skim_array var = ds.get_variable(var_name);
    if (!var)
    {
        O3SKIM_ERROR("The variable \"" << var_name << "\" was not found")
        return o3skim_error::coordinate_resolution_error;
    }

    std::vector<std::string> vars = ds.get_variable_names();
    size_t n_vars = vars.size();
    for (size_t i = 0; i < n_vars; ++i)
    {
        if (vars[i] != var_name)
            ds.remove_variable(vars[i]);
    }

    const std::vector<std::string> &dims = var->get_dims();

    std::vector<std::string> coords = ds.get_coordinate_names();
    size_t n_coords = coords.size();
    for (size_t i = 0; i < n_coords; ++i)
    {
        const_p_o3skim_array coord = ds.get_coordinate(coords[i]);

        bool shared = false;
        size_t n_dims = dims.size();
        for (size_t j = 0; !shared && (j < n_dims); ++j)
            shared = coord->has_dim(dims[j]);

        if (!shared)
            ds.remove_coordinate(coords[i]);
    }

    return o3skim_error::success;
}

// **************************************************************************
int materialize(o3skim_dataset &ds, int verbose)
{
    unsigned long n_clamped = 0;
    unsigned long n_bounds_clamped = 0;
    return materialize(ds, verbose, n_clamped, n_bounds_clamped);
}

// **************************************************************************
int materialize(o3skim_dataset &ds, int verbose, unsigned long &n_clamped,
    unsigned long &n_bounds_clamped)
{
    n_clamped = 0;
    n_bounds_clamped = 0;

    p_o3skim_array time = ds.get_coordinate("time");
    if (!time)
    {
        O3SKIM_ERROR("The time coordinate was not found")
        return o3skim_error::coordinate_resolution_error;
    }

    if (time->load())
    {
        O3SKIM_ERROR("Failed to load the time coordinate")
        return o3skim_error::model_load_error;
    }

    p_o3skim_array bounds;
    std::string bounds_name;
    if (time->get_attributes().get("bounds", bounds_name) == 0)
    {
        bounds = ds.get_array(bounds_name);
        if (!bounds)
        {
            O3SKIM_WARNING("The time bounds \"" << bounds_name
                << "\" were not found")
        }
        else if (bounds->load())
        {
            O3SKIM_ERROR("Failed to load the time bounds \"" << bounds_name << "\"")
            return o3skim_error::model_load_error;
        }
    }

    std::string units;
    std::string calendar;
    o3skim_metadata &encoding = time->get_encoding();
    if (encoding.get("units", units))
    {
        O3SKIM_ERROR("The time coordinate has no units of the form"
            " \"<units> since <date>\"")
        return o3skim_error::model_load_error;
    }
    encoding.get("calendar", calendar);

    if (!o3skim_calendar_util::is_standard_calendar(calendar))
    {
        if (o3skim_calendar_util::convert_to_standard(time->get_values(),
            units, calendar, n_clamped) || (bounds &&
            o3skim_calendar_util::convert_to_standard(bounds->get_values(),
            units, calendar, n_bounds_clamped)))
        {
            O3SKIM_ERROR("Failed to convert time from the \"" << calendar
                << "\" calendar")
            return o3skim_error::model_load_error;
        }

        O3SKIM_WARNING("Time was converted from the \"" << calendar
            << "\" calendar to proleptic_gregorian. " << n_clamped
            << " dates and " << n_bounds_clamped << " bounds that don't exist"
            " in it were moved to the last day of their month")

        encoding.set("calendar", std::string("proleptic_gregorian"));
    }

    if (bounds)
        bounds->get_encoding() = encoding;

    // everything else
    std::vector<std::string> names = ds.get_coordinate_names();
    std::vector<std::string> var_names = ds.get_variable_names();
    names.insert(names.end(), var_names.begin(), var_names.end());

    size_t n_names = names.size();
    for (size_t i = 0; i < n_names; ++i)
    {
        if (ds.get_array(names[i])->load())
        {
            O3SKIM_ERROR("Failed to load \"" << names[i] << "\"")
            return o3skim_error::model_load_error;
        }
    }

    if (verbose > 1)
    {
        O3SKIM_STATUS("Loaded " << n_names << " arrays with "
            << time->size() << " time steps")
    }

    return o3skim_error::success;
}

// **************************************************************************
int complete_attributes(o3skim_dataset &ds, const std::string &var_name,
    const std::string &standard_name)
{
    struct canonical_attribute
    {
        const char *coord;
        const char *name;
        const char *value;
    };

    static const canonical_attribute canonical[] = {
        {"lat", "standard_name", "latitude"},
        {"lat", "long_name", "latitude"},
        {"lat", "units", "degrees_north"},
        {"plev", "standard_name", "air_pressure"},
        {"plev", "long_name", "pressure"},
        {"time", "standard_name", "time"},
        {"time", "long_name", "time"}};

    for (const canonical_attribute &ca : canonical)
    {
        p_o3skim_array coord = ds.get_coordinate(ca.coord);
        if (coord && !coord->get_attributes().has(ca.name))
            coord->get_attributes().set(ca.name, std::string(ca.value));
    }

    p_o3skim_array var = ds.get_variable(var_name);
    if (!var)
    {
        O3SKIM_ERROR("The variable \"" << var_name << "\" was not found")
        return o3skim_error::coordinate_resolution_error;
    }

    var->get_attributes().set("standard_name", standard_name);

    return o3skim_error::success;
}

}

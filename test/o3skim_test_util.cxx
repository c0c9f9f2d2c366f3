#include "o3skim_test_util.h"
#include "o3skim_calendar_util.h"
#include "o3skim_cf_reader.h"
#include "o3skim_common.h"
#include "o3skim_file_util.h"
#include "o3skim_netcdf_util.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <mutex>

namespace o3skim_test_util
{

// --------------------------------------------------------------------------
synthetic_variable::synthetic_variable() : name("toz"), units("DU"),
    time_name("time"), lat_name("lat"), lon_name("lon"), plev_name("plev"),
    lon({-180.0, 0.0, 180.0}), lat({-90.0, 0.0, 90.0}), plev(),
    first_year(2000), calendar("standard"),
    time_units("days since 2000-01-01 00:00:00"), scale(1.0),
    nc_type(NC_DOUBLE)
{}

// --------------------------------------------------------------------------
double value(const synthetic_variable &var, long t, long k, long j, long i)
{
    return var.scale*(300.0 + t + 0.1*j + 0.01*k + i);
}

// --------------------------------------------------------------------------
double zonal_mean(const synthetic_variable &var, long t, long k, long j)
{
    return var.scale*(301.0 + t + 0.1*j + 0.01*k);
}

// --------------------------------------------------------------------------
bool equal(double a, double b, double tol)
{
    double diff = std::fabs(a - b);
    double mag = std::max(std::fabs(a), std::fabs(b));
    return (diff <= tol) || (diff <= tol*mag);
}

// --------------------------------------------------------------------------
int make_test_directory(const std::string &dir)
{
    if (o3skim_file_util::file_exists(dir.c_str()))
    {
        std::string cmd = "rm -rf \"" + dir + "\"";
        if (system(cmd.c_str()))
        {
            O3SKIM_ERROR("Failed to remove \"" << dir << "\"")
            return -1;
        }
    }

    return o3skim_file_util::make_directories(dir);
}

// --------------------------------------------------------------------------
int write_variable(const std::string &file_name,
    const synthetic_variable &var, long first_step, long n_steps)
{
    // time and its bounds
    std::vector<double> t(n_steps);
    std::vector<double> t_bnds(2*n_steps);
    for (long i = 0; i < n_steps; ++i)
    {
        int year = var.first_year + first_step + i;
        if (o3skim_calendar_util::coordinate(year, 7, 1, 0, 0, 0.0,
            var.time_units, var.calendar, t[i]) ||
            o3skim_calendar_util::coordinate(year, 1, 1, 0, 0, 0.0,
            var.time_units, var.calendar, t_bnds[2*i]) ||
            o3skim_calendar_util::coordinate(year + 1, 1, 1, 0, 0, 0.0,
            var.time_units, var.calendar, t_bnds[2*i+1]))
        {
            O3SKIM_ERROR("Failed to compute the time axis")
            return -1;
        }
    }

    std::vector<double> lon_bnds;
    for (double x : var.lon)
    {
        lon_bnds.push_back(x - 90.0);
        lon_bnds.push_back(x + 90.0);
    }

    bool have_plev = !var.plev.empty();
    size_t n_lon = var.lon.size();
    size_t n_lat = var.lat.size();
    size_t n_plev = have_plev ? var.plev.size() : 1;

    std::vector<double> values;
    for (long i = 0; i < n_steps; ++i)
        for (size_t k = 0; k < n_plev; ++k)
            for (size_t j = 0; j < n_lat; ++j)
                for (size_t q = 0; q < n_lon; ++q)
                    values.push_back(value(var, first_step + i, k, j, q));

    o3skim_netcdf_util::netcdf_handle fh;
    if (fh.create(file_name, NC_CLOBBER|NC_NETCDF4))
        return -1;

    int ierr = 0;
    {
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
    int file_id = fh.get();

    int time_dim = 0, bnds_dim = 0, lon_dim = 0, lat_dim = 0, plev_dim = 0;
    if ((ierr = nc_def_dim(file_id, var.time_name.c_str(), NC_UNLIMITED, &time_dim))
        || (ierr = nc_def_dim(file_id, "bnds", 2, &bnds_dim))
        || (ierr = nc_def_dim(file_id, var.lon_name.c_str(), n_lon, &lon_dim))
        || (ierr = nc_def_dim(file_id, var.lat_name.c_str(), n_lat, &lat_dim))
        || (have_plev && (ierr = nc_def_dim(file_id, var.plev_name.c_str(),
            n_plev, &plev_dim))))
    {
        O3SKIM_ERROR("Failed to define the dimensions. " << nc_strerror(ierr))
        return -1;
    }

    std::string time_bnds_name = var.time_name + "_bnds";
    std::string lon_bnds_name = var.lon_name + "_bnds";

    int time_id = 0, time_bnds_id = 0, lon_id = 0, lon_bnds_id = 0;
    int lat_id = 0, plev_id = 0, var_id = 0;

    int time_bnds_dims[] = {time_dim, bnds_dim};
    int lon_bnds_dims[] = {lon_dim, bnds_dim};

    std::vector<int> var_dims = {time_dim};
    if (have_plev)
        var_dims.push_back(plev_dim);
    var_dims.push_back(lat_dim);
    var_dims.push_back(lon_dim);

    if ((ierr = nc_def_var(file_id, var.time_name.c_str(), NC_DOUBLE, 1, &time_dim, &time_id))
        || (ierr = nc_def_var(file_id, time_bnds_name.c_str(), NC_DOUBLE, 2, time_bnds_dims, &time_bnds_id))
        || (ierr = nc_def_var(file_id, var.lon_name.c_str(), NC_DOUBLE, 1, &lon_dim, &lon_id))
        || (ierr = nc_def_var(file_id, lon_bnds_name.c_str(), NC_DOUBLE, 2, lon_bnds_dims, &lon_bnds_id))
        || (ierr = nc_def_var(file_id, var.lat_name.c_str(), NC_DOUBLE, 1, &lat_dim, &lat_id))
        || (have_plev && (ierr = nc_def_var(file_id, var.plev_name.c_str(), NC_DOUBLE, 1, &plev_dim, &plev_id)))
        || (ierr = nc_def_var(file_id, var.name.c_str(), var.nc_type, var_dims.size(), var_dims.data(), &var_id)))
    {
        O3SKIM_ERROR("Failed to define the variables. " << nc_strerror(ierr))
        return -1;
    }

    // attributes, some of which standardization removes
    struct text_att { int id; const char *name; std::string value; };
    std::vector<text_att> atts = {
        {NC_GLOBAL, "title", "synthetic ozone"},
        {NC_GLOBAL, "history", "written by o3skim_test_util"},
        {time_id, "units", var.time_units},
        {time_id, "calendar", var.calendar},
        {time_id, "bounds", time_bnds_name},
        {time_id, "axis", "T"},
        {lon_id, "units", "degrees_east"},
        {lon_id, "bounds", lon_bnds_name},
        {lat_id, "units", "degrees_north"},
        {lat_id, "axis", "Y"},
        {var_id, "units", var.units},
        {var_id, "long_name", "ozone"},
        {var_id, "cell_methods", "time: mean"},
        {var_id, "comment", "not kept"}};

    if (have_plev)
    {
        atts.push_back({plev_id, "units", "Pa"});
        atts.push_back({plev_id, "positive", "down"});
    }

    for (const text_att &att : atts)
    {
        if ((ierr = nc_put_att_text(file_id, att.id, att.name,
            att.value.size(), att.value.c_str())))
        {
            O3SKIM_ERROR("Failed to write the attribute " << att.name
                << ". " << nc_strerror(ierr))
            return -1;
        }
    }

    size_t start[4] = {0, 0, 0, 0};
    size_t count[4] = {size_t(n_steps), 0, 0, 0};
    size_t bnds_count[2] = {size_t(n_steps), 2};
    size_t k = 1;
    if (have_plev)
        count[k++] = n_plev;
    count[k++] = n_lat;
    count[k++] = n_lon;

    if ((ierr = nc_enddef(file_id))
        || (ierr = nc_put_vara_double(file_id, time_id, start, count, t.data()))
        || (ierr = nc_put_vara_double(file_id, time_bnds_id, start, bnds_count, t_bnds.data()))
        || (ierr = nc_put_var_double(file_id, lon_id, var.lon.data()))
        || (ierr = nc_put_var_double(file_id, lon_bnds_id, lon_bnds.data()))
        || (ierr = nc_put_var_double(file_id, lat_id, var.lat.data()))
        || (have_plev && (ierr = nc_put_var_double(file_id, plev_id, var.plev.data())))
        || (ierr = nc_put_vara_double(file_id, var_id, start, count, values.data())))
    {
        O3SKIM_ERROR("Failed to write \"" << file_name << "\". " << nc_strerror(ierr))
        return -1;
    }
    }

    return fh.close();
}

// --------------------------------------------------------------------------
int read_file(const std::string &file_name, p_o3skim_dataset &ds)
{
    p_o3skim_cf_reader reader = o3skim_cf_reader::New();
    reader->set_file_name(file_name);
    reader->set_time_dimension("time");

    if (reader->read(ds))
    {
        O3SKIM_ERROR("Failed to read \"" << file_name << "\"")
        return -1;
    }

    std::vector<std::string> names = ds->get_coordinate_names();
    std::vector<std::string> var_names = ds->get_variable_names();
    names.insert(names.end(), var_names.begin(), var_names.end());
    for (const std::string &name : names)
    {
        if (ds->get_array(name)->load())
        {
            O3SKIM_ERROR("Failed to load \"" << name << "\"")
            return -1;
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
synthetic_variable tco3_variable()
{
    synthetic_variable var;
    var.name = "toz";
    var.units = "DU";
    var.lat_name = "latitude";
    var.lon_name = "longitude";
    return var;
}

// --------------------------------------------------------------------------
synthetic_variable vmro3_variable()
{
    synthetic_variable var;
    var.name = "vmro3";
    var.units = "mol mol-1";
    var.plev = {1.0, 10.0, 100.0, 1000.0};
    var.scale = 1.0e-6;
    var.nc_type = NC_FLOAT;
    var.calendar = "noleap";
    return var;
}

// --------------------------------------------------------------------------
int write_model(const std::string &dir)
{
    if (o3skim_file_util::make_directories(dir))
        return -1;

    synthetic_variable tco3 = tco3_variable();
    synthetic_variable vmro3 = vmro3_variable();

    if (write_variable(dir + "/toz_2000-2009.nc", tco3, 0, 10) ||
        write_variable(dir + "/toz_2010-2024.nc", tco3, 10, 15) ||
        write_variable(dir + "/vmro3.nc", vmro3, 0, 25))
    {
        O3SKIM_ERROR("Failed to write the model in "" << dir << """)
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
std::string model_config(const std::string &model, const std::string &dir,
    bool with_tco3, bool with_vmro3)
{
    std::string cfg = "  " + model + ":\n"
        "    metadata:\n"
        "      model: " + model + "\n";

    if (with_tco3)
    {
        cfg += "    tco3_zm:\n"
            "      name: toz\n"
            "      paths: " + dir + "/toz_*.nc\n"
            "      coordinates: {time: time, lat: latitude, lon: longitude}\n"
            "      metadata: {note: total column}\n";
    }

    if (with_vmro3)
    {
        cfg += "    vmro3_zm:\n"
            "      name: vmro3\n"
            "      paths: [" + dir + "/vmro3.nc]\n"
            "      coordinates: {time: time, plev: plev, lat: lat, lon: lon}\n";
    }

    return cfg;
}

}

#include "o3skim_adapter.h"
#include "o3skim_calendar_util.h"
#include "o3skim_common.h"
#include "o3skim_config_reader.h"
#include "o3skim_configuration.h"
#include "o3skim_source.h"
#include "o3skim_standardize.h"
#include "o3skim_system_interface.h"
#include "o3skim_test_util.h"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using o3skim_test_util::synthetic_variable;

namespace {

// check that the values are on the first of january of the given years
int check_new_year(const std::vector<double> &t, const std::string &units,
    const std::vector<int> &years)
{
    if (t.size() != years.size())
    {
        O3SKIM_ERROR("found " << t.size() << " times, expected " << years.size())
        return -1;
    }

    size_t n = t.size();
    for (size_t i = 0; i < n; ++i)
    {
        int y = 0, m = 0, d = 0, hh = 0, mm = 0;
        double ss = 0.0;
        if (o3skim_calendar_util::date(t[i], units, "standard",
            y, m, d, hh, mm, ss) || (y != years[i]) || (m != 1) || (d != 1))
        {
            O3SKIM_ERROR("time " << i << " is on " << y << "-" << m << "-" << d
                << " expected " << years[i] << "-1-1")
            return -1;
        }
    }

    return 0;
}

// monthly records over two years averaged by year
int check_monthly()
{
    std::string units = "days since 2000-01-01 00:00:00";
    std::string calendar = "standard";

    int years[] = {2000, 2000, 2000, 2001, 2001};
    int months[] = {1, 2, 3, 6, 7};
    std::vector<double> t(5);
    std::vector<double> t_bnds(10);
    for (int i = 0; i < 5; ++i)
    {
        if (o3skim_calendar_util::coordinate(years[i], months[i], 15, 0, 0, 0.0,
                units, calendar, t[i]) ||
            o3skim_calendar_util::coordinate(years[i], months[i], 1, 0, 0, 0.0,
                units, calendar, t_bnds[2*i]) ||
            o3skim_calendar_util::coordinate(years[i], months[i] + 1, 1, 0, 0,
                0.0, units, calendar, t_bnds[2*i + 1]))
        {
            O3SKIM_ERROR("failed to make the time values")
            return -1;
        }
    }

    p_o3skim_array time = o3skim_array::New({"time"}, {5}, t);
    time->get_attributes().set("bounds", std::string("time_bnds"));
    time->get_encoding().set("units", units);
    time->get_encoding().set("calendar", calendar);

    double nan = std::numeric_limits<double>::quiet_NaN();

    // (time, lat) with a missing value in the first year
    p_o3skim_array vmro3 = o3skim_array::New({"time", "lat"}, {5, 2},
        {1.0, 10.0, 2.0, 20.0, nan, 30.0, 4.0, 40.0, 6.0, 60.0});
    vmro3->get_attributes().set("cell_methods", std::string("lon: mean"));
    vmro3->set_type(o3skim_array::float32);

    p_o3skim_dataset ds = o3skim_dataset::New();
    ds->set_coordinate("time", time);
    ds->set_coordinate("time_bnds",
        o3skim_array::New({"time", "bnds"}, {5, 2}, t_bnds));
    ds->set_coordinate("lat", o3skim_array::New({"lat"}, {2}, {-45.0, 45.0}));
    ds->set_variable("vmro3_zm", vmro3);

    if (o3skim_standardize::mean_over_year(*ds, "vmro3_zm"))
    {
        O3SKIM_ERROR("the yearly mean failed")
        return -1;
    }

    const_p_o3skim_array result = ds->get_variable("vmro3_zm");
    std::vector<double> expected = {1.5, 20.0, 5.0, 50.0};
    if ((result->get_shape() != std::vector<unsigned long>({2, 2})) ||
        (result->get_values() != expected) ||
        (result->get_type() != o3skim_array::float32))
    {
        O3SKIM_ERROR("the yearly means are wrong")
        return -1;
    }

    std::string cell_methods;
    result->get_attributes().get("cell_methods", cell_methods);
    if (cell_methods != "lon: mean time: mean")
    {
        O3SKIM_ERROR("cell_methods is \"" << cell_methods << "\"")
        return -1;
    }

    // the bounds span the year
    const_p_o3skim_array bnds = ds->get_coordinate("time_bnds");
    if (check_new_year(ds->get_coordinate("time")->get_values(), units,
            {2000, 2001}) ||
        (bnds->get_shape() != std::vector<unsigned long>({2, 2})) ||
        check_new_year(bnds->get_values(), units, {2000, 2001, 2001, 2002}))
        return -1;

    std::string bnds_units;
    ds->get_coordinate("time")->get_encoding().get("units", bnds_units);
    if ((bnds_units != units) ||
        (ds->get_coordinate("lat")->get_values() != std::vector<double>({-45.0, 45.0})))
    {
        O3SKIM_ERROR("the coordinates were changed")
        return -1;
    }

    // no time axis
    ds = o3skim_dataset::New();
    ds->set_variable("vmro3_zm", o3skim_array::New({"lat"}, {2}, {1.0, 2.0}));
    if ((o3skim_standardize::mean_over_year(*ds, "vmro3_zm") !=
        o3skim_error::coordinate_resolution_error) ||
        (o3skim_standardize::mean_over_latitude(*ds, "tco3_zm") !=
        o3skim_error::coordinate_resolution_error))
    {
        O3SKIM_ERROR("a missing axis was not detected")
        return -1;
    }

    return 0;
}

}

int main(int argc, char **argv)
{
    o3skim_system_interface::set_stack_trace_on_error();

    std::string dir = argc > 1 ? argv[1] : "test_optional_reductions";
    if (o3skim_test_util::make_test_directory(dir))
        return -1;

    if (check_monthly())
        return -1;

    // annual records, averaged over latitude and year
    synthetic_variable raw;
    if (o3skim_test_util::write_variable(dir + "/toz.nc", raw, 0, 25))
        return -1;

    o3skim_variable_spec spec;
    spec.name = "toz";
    spec.paths = {dir + "/toz.nc"};
    spec.coordinates = {{"time", "time"}, {"lat", "lat"}, {"lon", "lon"}};

    p_o3skim_adapter adapter = o3skim_adapter_factory::New("tco3_zm");
    p_o3skim_dataset ds;
    if (!adapter || adapter->standardize(spec, o3skim_make_deadline(0.0), 0, ds,
        o3skim_standardize::lat_mean | o3skim_standardize::year_mean))
    {
        O3SKIM_ERROR("standardization failed")
        return -1;
    }

    const_p_o3skim_array tco3 = ds->get_variable("tco3_zm");
    if (!tco3 || (tco3->get_dims() != std::vector<std::string>({"time"})) ||
        ds->get_coordinate("lat"))
    {
        O3SKIM_ERROR("tco3_zm is still defined on lat")
        return -1;
    }

    long n_lat = raw.lat.size();
    for (long t = 0; t < 25; ++t)
    {
        double expected = 0.0;
        for (long j = 0; j < n_lat; ++j)
            expected += o3skim_test_util::zonal_mean(raw, t, 0, j);
        expected /= n_lat;

        double v = tco3->get_values()[t];
        if (!o3skim_test_util::equal(v, expected, 1.0e-12))
        {
            O3SKIM_ERROR("tco3_zm(" << t << ") = " << v << " expected " << expected)
            return -1;
        }
    }

    std::string cell_methods;
    tco3->get_attributes().get("cell_methods", cell_methods);
    if (cell_methods != "time: mean lon: mean lat: mean time: mean")
    {
        O3SKIM_ERROR("cell_methods is \"" << cell_methods << "\"")
        return -1;
    }

    std::vector<int> years(25);
    std::vector<int> bnd_years(50);
    for (int t = 0; t < 25; ++t)
    {
        years[t] = 2000 + t;
        bnd_years[2*t] = 2000 + t;
        bnd_years[2*t + 1] = 2001 + t;
    }

    if (check_new_year(ds->get_coordinate("time")->get_values(),
            raw.time_units, years) ||
        check_new_year(ds->get_coordinate("time_bnds")->get_values(),
            raw.time_units, bnd_years))
        return -1;

    // the reductions reach every model of a source
    std::string data_dir = dir + "/data";
    if (o3skim_test_util::write_model(data_dir))
        return -1;

    std::string doc = "src:\n" + o3skim_test_util::model_config("model", data_dir);

    o3skim_configuration config;
    p_o3skim_config_reader reader = o3skim_config_reader::New();
    if (reader->parse(doc, config))
        return -1;

    p_o3skim_source source = o3skim_source::New();
    source->set_reductions(o3skim_standardize::lat_mean);
    const_p_o3skim_model model;
    if (source->load(config.sources[0]) || !source->get_failures().empty() ||
        source->get_model("model", model))
    {
        O3SKIM_ERROR("the source failed to load")
        return -1;
    }

    if ((model->get_variable("tco3_zm")->data->get_variable("tco3_zm")->get_dims()
            != std::vector<std::string>({"time"})) ||
        (model->get_variable("vmro3_zm")->data->get_variable("vmro3_zm")->get_dims()
            != std::vector<std::string>({"time", "plev"})))
    {
        O3SKIM_ERROR("the source did not average over latitude")
        return -1;
    }

    return 0;
}

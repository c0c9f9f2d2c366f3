#include "o3skim_calendar_util.h"
#include "o3skim_common.h"
#include "o3skim_dataset.h"
#include "o3skim_standardize.h"
#include "o3skim_system_interface.h"

#include <string>
#include <vector>

int main(int, char **)
{
    o3skim_system_interface::set_stack_trace_on_error();

    std::string units = "days since 2000-01-01 00:00:00";
    std::string calendar = "360_day";

    // two monthly records in february and march 2001. the february upper
    // bound is the 30th which the proleptic gregorian calendar lacks
    int months[] = {2, 3};
    std::vector<double> t(2);
    std::vector<double> t_bnds(4);
    for (int i = 0; i < 2; ++i)
    {
        if (o3skim_calendar_util::coordinate(2001, months[i], 15, 0, 0, 0.0,
                units, calendar, t[i]) ||
            o3skim_calendar_util::coordinate(2001, months[i], 1, 0, 0, 0.0,
                units, calendar, t_bnds[2*i]) ||
            o3skim_calendar_util::coordinate(2001, months[i], 30, 0, 0, 0.0,
                units, calendar, t_bnds[2*i + 1]))
        {
            O3SKIM_ERROR("failed to make the time values")
            return -1;
        }
    }

    p_o3skim_array time = o3skim_array::New({"time"}, {2}, t);
    time->get_attributes().set("bounds", std::string("time_bnds"));
    time->get_encoding().set("units", units);
    time->get_encoding().set("calendar", calendar);

    p_o3skim_array time_bnds = o3skim_array::New({"time", "nv"}, {2, 2}, t_bnds);

    p_o3skim_dataset ds = o3skim_dataset::New();
    ds->set_coordinate("time", time);
    ds->set_variable("time_bnds", time_bnds);
    ds->set_variable("tco3_zm", o3skim_array::New({"time"}, {2}, {300.0, 310.0}));

    unsigned long n_clamped = 0;
    unsigned long n_bounds_clamped = 0;
    if (o3skim_standardize::materialize(*ds, 0, n_clamped, n_bounds_clamped))
    {
        O3SKIM_ERROR("materialize failed")
        return -1;
    }

    // only the february upper bound was moved
    if ((n_clamped != 0) || (n_bounds_clamped != 1))
    {
        O3SKIM_ERROR("clamped " << n_clamped << " dates and " << n_bounds_clamped
            << " bounds, expected 0 and 1")
        return -1;
    }

    std::string bnds_calendar;
    ds->get_array("time_bnds")->get_encoding().get("calendar", bnds_calendar);
    if (bnds_calendar != "proleptic_gregorian")
    {
        O3SKIM_ERROR("the bounds are in the " << bnds_calendar << " calendar")
        return -1;
    }

    int expected_day[] = {1, 28, 1, 30};
    const std::vector<double> &bnds = ds->get_array("time_bnds")->get_values();
    for (int i = 0; i < 4; ++i)
    {
        int y = 0, m = 0, d = 0, hh = 0, mm = 0;
        double ss = 0.0;
        if (o3skim_calendar_util::date(bnds[i], units, "proleptic_gregorian",
            y, m, d, hh, mm, ss) || (y != 2001) || (m != months[i/2]) ||
            (d != expected_day[i]))
        {
            O3SKIM_ERROR("bound " << i << " is on " << y << "-" << m << "-" << d)
            return -1;
        }
    }

    // a dataset in a standard calendar is left alone
    time->get_encoding().set("calendar", std::string("proleptic_gregorian"));
    if (o3skim_standardize::materialize(*ds, 0, n_clamped, n_bounds_clamped) ||
        (n_clamped != 0) || (n_bounds_clamped != 0))
    {
        O3SKIM_ERROR("a standard calendar was converted")
        return -1;
    }

    return 0;
}

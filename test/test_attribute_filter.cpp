#include "o3skim_common.h"
#include "o3skim_dataset.h"
#include "o3skim_metadata.h"
#include "o3skim_standardize.h"

#include <string>
#include <vector>

int main(int, char **)
{
    p_o3skim_dataset ds = o3skim_dataset::New();
    ds->get_attributes().set("title", std::string("raw"));
    ds->get_attributes().set("long_name", std::string("kept"));

    p_o3skim_array time = o3skim_array::New({"time"}, {2}, {0.0, 365.0});
    time->get_attributes().set("axis", std::string("T"));
    time->get_attributes().set("bounds", std::string("time_bnds"));
    time->get_encoding().set("units", std::string("days since 2000-01-01"));
    time->get_encoding().set("calendar", std::string("noleap"));
    ds->set_coordinate("time", time);

    p_o3skim_array toz = o3skim_array::New({"time"}, {2}, {1.0, 2.0});
    toz->get_attributes().set("units", std::string("DU"));
    toz->get_attributes().set("standard_name", std::string("toz"));
    toz->get_attributes().set("cell_methods", std::string("time: mean"));
    toz->get_attributes().set("missing_value", 1.0e20);
    toz->get_attributes().set("coordinates", std::string("lat lon"));
    ds->set_variable("toz", toz);

    if (o3skim_standardize::filter_attributes(*ds))
    {
        O3SKIM_ERROR("filter failed")
        return -1;
    }

    std::vector<std::string> names;
    ds->get_attributes().get_names(names);
    if ((names.size() != 1) || (names[0] != "long_name"))
    {
        O3SKIM_ERROR("global attributes are wrong " << ds->get_attributes())
        return -1;
    }

    if (time->get_attributes().has("axis") || !time->get_attributes().has("bounds"))
    {
        O3SKIM_ERROR("time attributes are wrong " << time->get_attributes())
        return -1;
    }

    // the encoding is not an attribute and is kept
    std::string calendar;
    if (time->get_encoding().get("calendar", calendar) || (calendar != "noleap"))
    {
        O3SKIM_ERROR("the time encoding was modified " << time->get_encoding())
        return -1;
    }

    if ((toz->get_attributes().size() != 3) ||
        toz->get_attributes().has("missing_value") ||
        toz->get_attributes().has("coordinates"))
    {
        O3SKIM_ERROR("variable attributes are wrong " << toz->get_attributes())
        return -1;
    }

    // filtering again changes nothing
    o3skim_metadata global = ds->get_attributes();
    o3skim_metadata time_atts = time->get_attributes();
    o3skim_metadata toz_atts = toz->get_attributes();

    o3skim_standardize::filter_attributes(*ds);

    if ((global != ds->get_attributes()) ||
        (time_atts != time->get_attributes()) ||
        (toz_atts != toz->get_attributes()))
    {
        O3SKIM_ERROR("the filter is not idempotent")
        return -1;
    }

    return 0;
}

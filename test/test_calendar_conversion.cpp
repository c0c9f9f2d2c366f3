#include "o3skim_calendar_util.h"
#include "o3skim_common.h"

#include <string>
#include <vector>

using namespace o3skim_calendar_util;

namespace {

// decode t and compare to the expected date
int check_date(double t, const std::string &units, const std::string &cal,
    int y, int m, int d)
{
    int year = 0, month = 0, day = 0, hour = 0, minute = 0;
    double second = 0.0;
    if (date(t, units, cal, year, month, day, hour, minute, second))
    {
        O3SKIM_ERROR("failed to decode " << t << " " << units)
        return -1;
    }

    if ((year != y) || (month != m) || (day != d))
    {
        O3SKIM_ERROR(<< t << " \"" << units << "\" in the " << cal
            << " calendar decoded to " << year << "-" << month << "-"
            << day << " expected " << y << "-" << m << "-" << d)
        return -1;
    }

    return 0;
}

}

int main(int, char **)
{
    std::string units = "days since 2000-01-01 00:00:00";

    // basic decoding
    if (check_date(0.0, units, "standard", 2000, 1, 1) ||
        check_date(59.0, units, "standard", 2000, 2, 29) ||
        check_date(365.0, units, "noleap", 2001, 1, 1) ||
        check_date(30.0, units, "360_day", 2000, 2, 1) ||
        check_date(-1.0, units, "gregorian", 1999, 12, 31) ||
        check_date(36.0, "hours since 2000-01-01T12:00", "standard", 2000, 1, 3) ||
        check_date(31.0, "d since 2000-1-1", "all_leap", 2000, 2, 1))
        return -1;

    // the round trip through the day number of each calendar
    const char *calendars[] = {"standard", "noleap", "all_leap", "360_day", "julian"};
    for (const char *cal : calendars)
    {
        double t = 0.0;
        if (coordinate(2010, 7, 1, 0, 0, 0.0, units, cal, t) ||
            check_date(t, units, cal, 2010, 7, 1))
        {
            O3SKIM_ERROR("round trip failed in the " << cal << " calendar")
            return -1;
        }
    }

    // 360_day to proleptic gregorian. 2001-02-29 and 2001-02-30 don't exist
    std::vector<double> t;
    for (int d = 27; d <= 30; ++d)
    {
        double ti = 0.0;
        coordinate(2001, 2, d, 0, 0, 0.0, units, "360_day", ti);
        t.push_back(ti);
    }

    unsigned long n_clamped = 0;
    if (convert_to_standard(t, units, "360_day", n_clamped))
    {
        O3SKIM_ERROR("conversion from 360_day failed")
        return -1;
    }

    if (n_clamped != 2)
    {
        O3SKIM_ERROR("expected 2 clamped dates, got " << n_clamped)
        return -1;
    }

    if (check_date(t[0], units, "proleptic_gregorian", 2001, 2, 27) ||
        check_date(t[1], units, "proleptic_gregorian", 2001, 2, 28) ||
        check_date(t[2], units, "proleptic_gregorian", 2001, 2, 28) ||
        check_date(t[3], units, "proleptic_gregorian", 2001, 2, 28))
        return -1;

    // noleap dates all exist in the gregorian calendar
    std::vector<double> t2 = {0.0, 59.0, 365.0 + 59.0};
    if (convert_to_standard(t2, units, "noleap", n_clamped) || (n_clamped != 0) ||
        check_date(t2[1], units, "standard", 2000, 3, 1) ||
        check_date(t2[2], units, "standard", 2001, 3, 1))
    {
        O3SKIM_ERROR("conversion from noleap failed")
        return -1;
    }

    // standard calendars are left alone
    std::vector<double> t3 = {1.5, 2.5};
    if (convert_to_standard(t3, units, "gregorian", n_clamped) ||
        (t3[0] != 1.5) || (t3[1] != 2.5))
    {
        O3SKIM_ERROR("a standard calendar was converted")
        return -1;
    }

    // unknown calendars and units are errors
    std::vector<double> t4 = {0.0};
    time_units tu;
    if (!convert_to_standard(t4, units, "lunar", n_clamped) ||
        !parse_units("fortnights since 2000-01-01", tu) ||
        !parse_units("days", tu))
    {
        O3SKIM_ERROR("invalid calendars or units were accepted")
        return -1;
    }

    return 0;
}

#include "o3skim_calendar_util.h"
#include "o3skim_common.h"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <string>

namespace
{
// floored division and modulus, correct for negative numerators
long floor_div(long a, long b)
{
    long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0)))
        --q;
    return q;
}

long floor_mod(long a, long b)
{
    return a - b*floor_div(a, b);
}

// days before the start of each month
const long noleap_cum_days[] =
    {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334, 365};

const long all_leap_cum_days[] =
    {0, 31, 60, 91, 121, 152, 182, 213, 244, 274, 305, 335, 366};

const int noleap_month_days[] =
    {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

enum {cal_invalid, cal_standard, cal_noleap, cal_all_leap, cal_360_day,
    cal_julian};

// **************************************************************************
int calendar_id(const std::string &calendar)
{
    if (calendar.empty() || (calendar == "standard") ||
        (calendar == "gregorian") || (calendar == "proleptic_gregorian"))
        return cal_standard;

    if ((calendar == "noleap") || (calendar == "365_day"))
        return cal_noleap;

    if ((calendar == "all_leap") || (calendar == "366_day"))
        return cal_all_leap;

    if (calendar == "360_day")
        return cal_360_day;

    if (calendar == "julian")
        return cal_julian;

    return cal_invalid;
}

// **************************************************************************
long month_from_cum_days(const long *cum_days, long doy)
{
    long m = 1;
    while ((m < 12) && (doy >= cum_days[m]))
        ++m;
    return m;
}

// **************************************************************************
bool is_gregorian_leap_year(long y)
{
    return ((y % 4 == 0) && (y % 100 != 0)) || (y % 400 == 0);
}
}

namespace o3skim_calendar_util
{

// **************************************************************************
long gregorian_number(long y, long m, long d)
{
    m = (m + 9) % 12;
    y = y - m/10;
    return 365*y + y/4 - y/100 + y/400 + (m*306 + 5)/10 + (d - 1);
}

// **************************************************************************
void date_from_gregorian_number(long g, long &y, long &m, long &d)
{
    y = (10000*g + 14780)/3652425;
    long ddd = g - (365*y + y/4 - y/100 + y/400);
    if (ddd < 0)
    {
        y = y - 1;
        ddd = g - (365*y + y/4 - y/100 + y/400);
    }

    long mi = (100*ddd + 52)/3060;

    m = (mi + 2)%12 + 1;
    y = y + (mi + 2)/12;
    d = ddd - (mi*306 + 5)/10 + 1;
}

// **************************************************************************
bool valid_gregorian_date(long y, long m, long d)
{
    if ((m < 1) || (m > 12) || (d < 1))
        return false;

    long g = gregorian_number(y,m,d);

    long yy, mm, dd;
    date_from_gregorian_number(g, yy, mm, dd);

    if ((y != yy) || (m != mm) || (d != dd))
        return false;

    return true;
}

// **************************************************************************
int valid_calendar(const std::string &calendar)
{
    return calendar_id(calendar) != cal_invalid;
}

// **************************************************************************
int is_standard_calendar(const std::string &calendar)
{
    return calendar_id(calendar) == cal_standard;
}

// **************************************************************************
int days_in_month(const std::string &calendar, long y, long m, int &n_days)
{
    if ((m < 1) || (m > 12))
    {
        O3SKIM_ERROR("Invalid month " << m)
        return -1;
    }

    switch (calendar_id(calendar))
    {
        case cal_standard:
            n_days = noleap_month_days[m-1] +
                (((m == 2) && is_gregorian_leap_year(y)) ? 1 : 0);
            return 0;

        case cal_julian:
            n_days = noleap_month_days[m-1] +
                (((m == 2) && (floor_mod(y, 4) == 0)) ? 1 : 0);
            return 0;

        case cal_noleap:
            n_days = noleap_month_days[m-1];
            return 0;

        case cal_all_leap:
            n_days = noleap_month_days[m-1] + ((m == 2) ? 1 : 0);
            return 0;

        case cal_360_day:
            n_days = 30;
            return 0;
    }

    O3SKIM_ERROR("Unsupported calendar \"" << calendar << "\"")
    return -1;
}

// **************************************************************************
int day_number(const std::string &calendar, long y, long m, long d, long &n)
{
    if ((m < 1) || (m > 12))
    {
        O3SKIM_ERROR("Invalid month " << m)
        return -1;
    }

    switch (calendar_id(calendar))
    {
        case cal_standard:
            n = gregorian_number(y, m, d);
            return 0;

        case cal_noleap:
            n = 365*y + noleap_cum_days[m-1] + d - 1;
            return 0;

        case cal_all_leap:
            n = 366*y + all_leap_cum_days[m-1] + d - 1;
            return 0;

        case cal_360_day:
            n = 360*y + 30*(m - 1) + d - 1;
            return 0;

        case cal_julian:
        {
            // julian day number
            long a = (14 - m)/12;
            long yy = y + 4800 - a;
            long mm = m + 12*a - 3;
            n = d + (153*mm + 2)/5 + 365*yy + floor_div(yy, 4) - 32083;
            return 0;
        }
    }

    O3SKIM_ERROR("Unsupported calendar \"" << calendar << "\"")
    return -1;
}

// **************************************************************************
int date_from_day_number(const std::string &calendar, long n,
    long &y, long &m, long &d)
{
    switch (calendar_id(calendar))
    {
        case cal_standard:
            date_from_gregorian_number(n, y, m, d);
            return 0;

        case cal_noleap:
        {
            y = floor_div(n, 365);
            long doy = n - 365*y;
            m = month_from_cum_days(noleap_cum_days, doy);
            d = doy - noleap_cum_days[m-1] + 1;
            return 0;
        }

        case cal_all_leap:
        {
            y = floor_div(n, 366);
            long doy = n - 366*y;
            m = month_from_cum_days(all_leap_cum_days, doy);
            d = doy - all_leap_cum_days[m-1] + 1;
            return 0;
        }

        case cal_360_day:
        {
            y = floor_div(n, 360);
            long doy = n - 360*y;
            m = doy/30 + 1;
            d = doy%30 + 1;
            return 0;
        }

        case cal_julian:
        {
            long c = n + 32082;
            long d4 = floor_div(4*c + 3, 1461);
            long e = c - floor_div(1461*d4, 4);
            long m5 = (5*e + 2)/153;
            d = e - (153*m5 + 2)/5 + 1;
            m = m5 + 3 - 12*(m5/10);
            y = d4 - 4800 + m5/10;
            return 0;
        }
    }

    O3SKIM_ERROR("Unsupported calendar \"" << calendar << "\"")
    return -1;
}

// **************************************************************************
int parse_units(const std::string &units, time_units &tu)
{
    size_t at = units.find(" since ");
    if (at == std::string::npos)
    {
        O3SKIM_ERROR("Invalid time units \"" << units
            << "\". Expected \"<units> since <date>\"")
        return -1;
    }

    std::string unit = units.substr(0, at);
    size_t first = unit.find_first_not_of(' ');
    unit = first == std::string::npos ? std::string() : unit.substr(first);

    if ((unit == "seconds") || (unit == "second") || (unit == "secs") ||
        (unit == "sec") || (unit == "s"))
    {
        tu.seconds_per_unit = 1.0;
    }
    else if ((unit == "minutes") || (unit == "minute") ||
        (unit == "mins") || (unit == "min"))
    {
        tu.seconds_per_unit = 60.0;
    }
    else if ((unit == "hours") || (unit == "hour") || (unit == "hrs") ||
        (unit == "hr") || (unit == "h"))
    {
        tu.seconds_per_unit = 3600.0;
    }
    else if ((unit == "days") || (unit == "day") || (unit == "d"))
    {
        tu.seconds_per_unit = 86400.0;
    }
    else
    {
        O3SKIM_ERROR("Unsupported time unit \"" << unit << "\" in \""
            << units << "\"")
        return -1;
    }

    std::string origin = units.substr(at + 7);

    tu.hour = 0;
    tu.minute = 0;
    tu.second = 0.0;

    int n_chars = 0;
    if (sscanf(origin.c_str(), " %ld-%ld-%ld%n",
        &tu.year, &tu.month, &tu.day, &n_chars) != 3)
    {
        O3SKIM_ERROR("Invalid reference date in time units \""
            << units << "\"")
        return -1;
    }

    // an optional time of day, separated by a space or a T. any time zone
    // suffix is ignored
    const char *ptime = origin.c_str() + n_chars;
    if ((*ptime == ' ') || (*ptime == 'T'))
    {
        ++ptime;
        int hh = 0, mm = 0;
        double ss = 0.0;
        int n_fields = sscanf(ptime, "%d:%d:%lf", &hh, &mm, &ss);
        if (n_fields >= 2)
        {
            tu.hour = hh;
            tu.minute = mm;
            tu.second = n_fields == 3 ? ss : 0.0;
        }
        else if (n_fields == 1)
        {
            tu.hour = hh;
        }
    }

    if ((tu.month < 1) || (tu.month > 12) || (tu.day < 1) || (tu.day > 31))
    {
        O3SKIM_ERROR("Invalid reference date in time units \""
            << units << "\"")
        return -1;
    }

    return 0;
}

// **************************************************************************
int date(double t, const std::string &units, const std::string &calendar,
    int &year, int &month, int &day, int &hour, int &minute, double &second)
{
    time_units tu;
    if (parse_units(units, tu))
        return -1;

    long n0 = 0;
    if (day_number(calendar, tu.year, tu.month, tu.day, n0))
        return -1;

    // seconds since the start of the reference day, rounded to microseconds
    // to hide the error of the floating point arithmetic
    double s = t*tu.seconds_per_unit +
        3600.0*tu.hour + 60.0*tu.minute + tu.second;
    s = std::round(s*1.0e6)/1.0e6;

    double n_days = std::floor(s/86400.0);
    double s_day = s - 86400.0*n_days;
    if (s_day >= 86400.0)
    {
        n_days += 1.0;
        s_day -= 86400.0;
    }

    long y = 0, m = 0, d = 0;
    if (date_from_day_number(calendar, n0 + static_cast<long>(n_days), y, m, d))
        return -1;

    year = y;
    month = m;
    day = d;
    hour = static_cast<int>(s_day/3600.0);
    minute = static_cast<int>((s_day - 3600.0*hour)/60.0);
    second = s_day - 3600.0*hour - 60.0*minute;

    return 0;
}

// **************************************************************************
int coordinate(int year, int month, int day, int hour, int minute,
    double second, const std::string &units, const std::string &calendar,
    double &t)
{
    time_units tu;
    if (parse_units(units, tu))
        return -1;

    long n0 = 0;
    long n = 0;
    if (day_number(calendar, tu.year, tu.month, tu.day, n0) ||
        day_number(calendar, year, month, day, n))
        return -1;

    double s = 86400.0*(n - n0) + 3600.0*(hour - tu.hour)
        + 60.0*(minute - tu.minute) + (second - tu.second);

    t = s/tu.seconds_per_unit;

    return 0;
}

// **************************************************************************
int convert_to_standard(std::vector<double> &t, const std::string &units,
    const std::string &calendar, unsigned long &n_clamped)
{
    n_clamped = 0;

    if (!valid_calendar(calendar))
    {
        O3SKIM_ERROR("Unsupported calendar \"" << calendar << "\"")
        return -1;
    }

    if (is_standard_calendar(calendar))
        return 0;

    size_t n = t.size();
    for (size_t i = 0; i < n; ++i)
    {
        int year = 0, month = 0, day = 0, hour = 0, minute = 0;
        double second = 0.0;
        if (date(t[i], units, calendar, year, month, day,
            hour, minute, second))
        {
            O3SKIM_ERROR("Failed to decode time " << i << " = " << t[i]
                << " \"" << units << "\" in the " << calendar << " calendar")
            return -1;
        }

        int n_days = 0;
        days_in_month("proleptic_gregorian", year, month, n_days);
        if (day > n_days)
        {
            day = n_days;
            ++n_clamped;
        }

        if (coordinate(year, month, day, hour, minute, second,
            units, "proleptic_gregorian", t[i]))
        {
            O3SKIM_ERROR("Failed to encode the date " << year << "-"
                << month << "-" << day << " in \"" << units << "\"")
            return -1;
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
bool all_iterator::is_valid() const
{
    return this->valid;
}

// --------------------------------------------------------------------------
int all_iterator::initialize(const std::vector<double> &t,
    const std::string &units, const std::string &calendar)
{
    (void)units;
    (void)calendar;

    if (t.empty())
    {
        O3SKIM_ERROR("The array of time values can't be empty")
        return -1;
    }

    this->n_steps = t.size();
    this->valid = true;

    return 0;
}

// --------------------------------------------------------------------------
int all_iterator::get_next_partition(partition &part)
{
    if (!this->is_valid())
        return -1;

    part.label.clear();
    part.start = 0;
    part.end = 0;
    part.indices.resize(this->n_steps);
    for (unsigned long i = 0; i < this->n_steps; ++i)
        part.indices[i] = i;

    this->valid = false;

    return 0;
}

// --------------------------------------------------------------------------
bool year_iterator::is_valid() const
{
    if (!this->valid)
        return false;

    return this->current != this->groups.end();
}

// --------------------------------------------------------------------------
int year_iterator::initialize(const std::vector<double> &t,
    const std::string &units, const std::string &calendar)
{
    this->groups.clear();
    this->valid = false;

    if (t.empty())
    {
        O3SKIM_ERROR("The array of time values can't be empty")
        return -1;
    }

    unsigned long n = t.size();
    for (unsigned long i = 0; i < n; ++i)
    {
        int year = 0, month = 0, day = 0, hour = 0, minute = 0;
        double second = 0.0;
        if (date(t[i], units, calendar, year, month, day,
            hour, minute, second))
        {
            O3SKIM_ERROR("Failed to convert the time value " << t[i]
                << " \"" << units << "\" in the \"" << calendar << "\"")
            return -1;
        }

        this->groups[this->get_group_start(year)].push_back(i);
    }

    this->current = this->groups.begin();
    this->valid = true;

    return 0;
}

// --------------------------------------------------------------------------
int year_iterator::get_next_partition(partition &part)
{
    if (!this->is_valid())
        return -1;

    part.start = this->current->first;
    part.end = part.start + this->get_group_length();
    part.label = std::to_string(part.start) + "-" + std::to_string(part.end);
    part.indices = this->current->second;

    // move to the next group
    ++this->current;

    // if we're at the  end of the sequence mark the iterator invalid
    if (!this->is_valid())
        this->valid = false;

    return 0;
}

// --------------------------------------------------------------------------
long decade_iterator::get_group_start(long year) const
{
    return year - floor_mod(year, 10);
}

// --------------------------------------------------------------------------
p_partition_iterator partition_iterator_factory::New(const std::string &groupby)
{
    if (groupby == "none")
    {
        return std::make_shared<all_iterator>();
    }
    else if (groupby == "year")
    {
        return std::make_shared<year_iterator>();
    }
    else if (groupby == "decade")
    {
        return std::make_shared<decade_iterator>();
    }

    O3SKIM_ERROR("Failed to construct a \""
        << groupby << "\" partition iterator")
    return nullptr;
}


}

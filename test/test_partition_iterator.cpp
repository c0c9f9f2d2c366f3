#include "o3skim_calendar_util.h"
#include "o3skim_common.h"

#include <set>
#include <string>
#include <vector>

using namespace o3skim_calendar_util;

namespace {

// annual records on the first of July
std::vector<double> annual_time(int first_year, int n_years,
    const std::string &units, const std::string &calendar)
{
    std::vector<double> t(n_years);
    for (int i = 0; i < n_years; ++i)
        coordinate(first_year + i, 7, 1, 0, 0, 0.0, units, calendar, t[i]);
    return t;
}

// partition and check the labels. every step must be in exactly one
// partition, in increasing order
int check(const std::string &groupby, const std::vector<double> &t,
    const std::string &units, const std::string &calendar,
    const std::vector<std::string> &labels,
    const std::vector<unsigned long> &sizes)
{
    p_partition_iterator it = partition_iterator_factory::New(groupby);
    if (!it || it->initialize(t, units, calendar))
    {
        O3SKIM_ERROR("Failed to initialize the \"" << groupby << "\" iterator")
        return -1;
    }

    std::set<unsigned long> seen;
    size_t n = 0;
    partition part;
    while (*it)
    {
        if (it->get_next_partition(part))
        {
            O3SKIM_ERROR("get_next_partition failed")
            return -1;
        }

        if ((n >= labels.size()) || (part.label != labels[n]) ||
            (part.indices.size() != sizes[n]))
        {
            O3SKIM_ERROR(<< groupby << " partition " << n << " is \""
                << part.label << "\" with " << part.indices.size()
                << " steps")
            return -1;
        }

        for (unsigned long i : part.indices)
        {
            if (!seen.insert(i).second)
            {
                O3SKIM_ERROR("step " << i << " is in more than one partition")
                return -1;
            }
        }

        ++n;
    }

    if ((n != labels.size()) || (seen.size() != t.size()))
    {
        O3SKIM_ERROR(<< groupby << " produced " << n << " partitions covering "
            << seen.size() << " of " << t.size() << " steps")
        return -1;
    }

    return 0;
}

}

int main(int, char **)
{
    std::string units = "days since 2000-01-01 00:00:00";
    std::vector<double> t = annual_time(2000, 25, units, "standard");

    // none
    if (check("none", t, units, "standard", {""}, {25}))
        return -1;

    // year
    std::vector<std::string> year_labels;
    for (int y = 2000; y < 2025; ++y)
        year_labels.push_back(std::to_string(y) + "-" + std::to_string(y + 1));

    if (check("year", t, units, "standard", year_labels,
        std::vector<unsigned long>(25, 1)))
        return -1;

    // decade
    if (check("decade", t, units, "standard",
        {"2000-2010", "2010-2020", "2020-2030"}, {10, 10, 5}))
        return -1;

    // decades start on multiples of ten, also before the reference date
    std::vector<double> t2 = annual_time(1995, 10, units, "360_day");
    if (check("decade", t2, units, "360_day", {"1990-2000", "2000-2010"}, {5, 5}))
        return -1;

    // several records per year
    std::vector<double> t3;
    for (int y = 2001; y < 2003; ++y)
    {
        for (int m = 1; m <= 12; ++m)
        {
            double ti = 0.0;
            coordinate(y, m, 15, 0, 0, 0.0, units, "noleap", ti);
            t3.push_back(ti);
        }
    }
    if (check("year", t3, units, "noleap", {"2001-2002", "2002-2003"}, {12, 12}))
        return -1;

    // unknown groupings
    if (partition_iterator_factory::New("month") ||
        partition_iterator_factory::New(""))
    {
        O3SKIM_ERROR("an unknown grouping was accepted")
        return -1;
    }

    return 0;
}

#ifndef o3skim_calendar_util_h
#define o3skim_calendar_util_h

/// @file

#include "o3skim_config.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

/// Codes dealing with calendaring
namespace o3skim_calendar_util
{

/** @name Gregorian calendar
 * functions for date computations in gregorian calendar.  to use convert the
 * origin to a gergorian_number do the calculation and convert the number back
 * into a date useing date_from_gregorian_number. for details about the math
 * and an explanation of the errors see
 * http://alcor.concordia.ca/~gpkatch/gdate-algorithm.html
 */
///@{
/** return a date number for the given date that can be used in computations.
 * input:
 *
 * > y : 4 digit year
 * > m : 2 digit month
 * > d : 2 digit day
 *
 */
O3SKIM_EXPORT
long gregorian_number(long y, long m, long d);

/** input:
 *
 * > g : date number computed from gregorian_number
 *
 * returns:
 *
 * > y : 4 digit year
 * > m : 2 digit month
 * > d : 2 digit day
 *
 */
O3SKIM_EXPORT
void date_from_gregorian_number(long g, long &y, long &m, long &d);

/// true if the date exists in the proleptic gregorian calendar
O3SKIM_EXPORT
bool valid_gregorian_date(long y, long m, long d);
///@}

/** @name CF calendars
 * Date arithmetic in the calendars of the CF conventions. The names
 * standard, gregorian and proleptic_gregorian (and the empty string) all
 * select the proleptic gregorian calendar. noleap/365_day, all_leap/366_day,
 * 360_day and julian are also supported.
 */
///@{
/// returns non-zero if the calendar is one of the supported calendars
O3SKIM_EXPORT
int valid_calendar(const std::string &calendar);

/// returns non-zero if the calendar is the proleptic gregorian calendar
O3SKIM_EXPORT
int is_standard_calendar(const std::string &calendar);

/// get the number of days in the month. return 0 if successful
O3SKIM_EXPORT
int days_in_month(const std::string &calendar, long y, long m, int &n_days);

/** convert a date to a day number in the named calendar. the day numbers of
 * consecutive days differ by one. return 0 if successful
 */
O3SKIM_EXPORT
int day_number(const std::string &calendar, long y, long m, long d, long &n);

/// the inverse of day_number. return 0 if successful
O3SKIM_EXPORT
int date_from_day_number(const std::string &calendar, long n,
    long &y, long &m, long &d);
///@}

/// The parsed form of a CF time units string, "<unit> since <date> [time]"
struct O3SKIM_EXPORT time_units
{
    double seconds_per_unit;
    long year;
    long month;
    long day;
    int hour;
    int minute;
    double second;
};

/// parse a CF time units string. return 0 if successful
O3SKIM_EXPORT
int parse_units(const std::string &units, time_units &tu);

/** convert a time value to a date in the named calendar.
 * return 0 if successful.
 */
O3SKIM_EXPORT
int date(double t, const std::string &units, const std::string &calendar,
    int &year, int &month, int &day, int &hour, int &minute, double &second);

/** convert a date in the named calendar to a time value in the given units.
 * return 0 if successful.
 */
O3SKIM_EXPORT
int coordinate(int year, int month, int day, int hour, int minute,
    double second, const std::string &units, const std::string &calendar,
    double &t);

/** convert time values from the named calendar to the proleptic gregorian
 * calendar, keeping the units. dates that do not exist in the proleptic
 * gregorian calendar are moved to the last day of their month and counted
 * in n_clamped. return 0 if successful.
 */
O3SKIM_EXPORT
int convert_to_standard(std::vector<double> &t, const std::string &units,
    const std::string &calendar, unsigned long &n_clamped);


/// A group of time steps written together
struct O3SKIM_EXPORT partition
{
    partition() : start(0), end(0) {}

    std::string label;                  ///< eg 2000-2010. empty for all steps
    long start;                         ///< the first year of the group
    long end;                           ///< one past the last year
    std::vector<unsigned long> indices; ///< the time steps in the group
};

/// An iterator over the groups of time steps of a time axis
class O3SKIM_EXPORT partition_iterator
{
public:
    partition_iterator() : valid(false) {}
    virtual ~partition_iterator() {}

    /** Initialize the iterator.
     * @param[in] t  An array of time values
     * @param[in] units A string units of the time values
     * @param[in] calendar A string name of the calendar system
     * @returns 0 if successfully initialized
     */
    virtual int initialize(const std::vector<double> &t,
        const std::string &units, const std::string &calendar) = 0;

    /// return true if there are more partitions in the sequence
    virtual bool is_valid() const = 0;

    /** Get the next partition in the series.
     * @returns 0 if successful
     */
    virtual int get_next_partition(partition &part) = 0;

    /// @returns true if there are more partitions in the series
    operator bool() const
    {
        return this->is_valid();
    }

protected:
    bool valid;
};

/// A single partition holding every time step
class O3SKIM_EXPORT all_iterator : public partition_iterator
{
public:
    all_iterator() : n_steps(0) {}

    bool is_valid() const override;

    int initialize(const std::vector<double> &t,
        const std::string &units, const std::string &calendar) override;

    int get_next_partition(partition &part) override;

protected:
    unsigned long n_steps;
};

/// One partition per distinct calendar year, in increasing order
class O3SKIM_EXPORT year_iterator : public partition_iterator
{
public:
    bool is_valid() const override;

    int initialize(const std::vector<double> &t,
        const std::string &units, const std::string &calendar) override;

    int get_next_partition(partition &part) override;

protected:
    /// the first year of the group the year belongs to
    virtual long get_group_start(long year) const { return year; }

    /// the number of years in a group
    virtual long get_group_length() const { return 1; }

protected:
    std::map<long, std::vector<unsigned long>> groups;
    std::map<long, std::vector<unsigned long>>::iterator current;
};

/** One partition per distinct decade in increasing order. Decades start on
 * years that are multiples of ten.
 */
class O3SKIM_EXPORT decade_iterator : public year_iterator
{
protected:
    long get_group_start(long year) const override;
    long get_group_length() const override { return 10; }
};

using p_partition_iterator = std::shared_ptr<partition_iterator>;

/// A factory for partition_iterator
class O3SKIM_EXPORT partition_iterator_factory
{
public:
    /** Allocate and return an instance of the named iterator
     * @param[in] groupby Name of the desired grouping. One of none, year or
     *                    decade
     * @returns an instance of partition_iterator or nullptr
     */
    static p_partition_iterator New(const std::string &groupby);
};

}

#endif

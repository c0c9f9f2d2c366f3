#ifndef o3skim_standardize_h
#define o3skim_standardize_h

/// @file

#include "o3skim_config.h"
#include "o3skim_dataset.h"
#include "o3skim_metadata.h"

#include <map>
#include <string>
#include <vector>

/** The steps that turn a raw dataset into a standardized single variable
 * dataset. Each returns one of the o3skim_error codes.
 */
namespace o3skim_standardize
{
/// the attributes kept by filter_attributes
O3SKIM_EXPORT
const std::vector<std::string> &get_attribute_whitelist();

/// remove every attribute not on the whitelist
O3SKIM_EXPORT
int filter_attributes(o3skim_metadata &atts);

/** remove every global, variable and coordinate attribute not on the
 * whitelist. array encodings are not touched.
 */
O3SKIM_EXPORT
int filter_attributes(o3skim_dataset &ds);

/** rename the raw variable to its canonical name and each raw coordinate
 * named in coordinates (canonical axis to raw name) to the canonical axis
 * name. dimensions are renamed too. a name that can't be resolved is a
 * coordinate_resolution_error.
 */
O3SKIM_EXPORT
int rename(o3skim_dataset &ds, const std::string &raw_name,
    const std::string &var_name,
    const std::map<std::string, std::string> &coordinates);

/** get the factor that converts values in the given units to ppmv. returns
 * unit_conversion_error if the units are not known.
 */
O3SKIM_EXPORT
int get_ppmv_factor(const std::string &units, double &factor);

/** convert the named variable to ppmv. the variable is loaded, stored as
 * single precision and its units attribute becomes ppmv.
 */
O3SKIM_EXPORT
int convert_to_ppmv(o3skim_dataset &ds, const std::string &var_name);

/** replace the variable by its mean over the longitude dimension, ignoring
 * NaN. the longitude coordinate and every coordinate defined on it are
 * removed and "lon: mean" is added to cell_methods.
 */
O3SKIM_EXPORT
int mean_over_longitude(o3skim_dataset &ds, const std::string &var_name);

/// the optional reductions applied after standardization
enum {lat_mean = 1, year_mean = 2};

/** replace the variable by its mean over the latitude dimension, ignoring
 * NaN. lat and the coordinates defined on it are removed.
 */
O3SKIM_EXPORT
int mean_over_latitude(o3skim_dataset &ds, const std::string &var_name);

/** replace the variable, and the other arrays defined on time, by their
 * means over each calendar year, ignoring NaN. time becomes the first day
 * of each year and its bounds, when it has them, span the year. "time: mean"
 * is added to cell_methods. time must be loaded and have units.
 */
O3SKIM_EXPORT
int mean_over_year(o3skim_dataset &ds, const std::string &var_name);

/** remove the other data variables and every coordinate sharing no
 * dimension with the named variable.
 */
O3SKIM_EXPORT
int drop_unrelated(o3skim_dataset &ds, const std::string &var_name);

/** load the time coordinate, and the variable named by its bounds attribute
 * when there is one, then the rest of the arrays. time in a calendar other
 * than the proleptic gregorian is converted to it, keeping the units. the
 * conversion is reported with a warning.
 */
O3SKIM_EXPORT
int materialize(o3skim_dataset &ds, int verbose);

/// as above, also returning the number of dates and bounds that were clamped
O3SKIM_EXPORT
int materialize(o3skim_dataset &ds, int verbose, unsigned long &n_clamped,
    unsigned long &n_bounds_clamped);

/** add the canonical lat, plev and time attributes that are missing and set
 * the standard_name of the variable.
 */
O3SKIM_EXPORT
int complete_attributes(o3skim_dataset &ds, const std::string &var_name,
    const std::string &standard_name);
}

#endif

#ifndef o3skim_cf_reader_h
#define o3skim_cf_reader_h

/// @file

#include "o3skim_config.h"
#include "o3skim_dataset.h"
#include "o3skim_deadline.h"
#include "o3skim_property.h"
#include "o3skim_shared_object.h"

#include <string>
#include <vector>

O3SKIM_SHARED_OBJECT_FORWARD_DECL(o3skim_cf_reader)

/// A reader for multi-file datasets stored in NetCDF CF format.
/**
 * The files are concatenated along the time dimension in the order they
 * are given. Variables not defined on the time dimension are taken from the
 * first file. Every file must define the time varying variables of the
 * first file with the same dimensions, and with the same lengths apart from
 * the time dimension.
 *
 * Metadata, coordinates and the global attributes of the first file are
 * read eagerly. The values of every variable are lazy, they are read when
 * the array is loaded.
 *
 * A variable is a coordinate when it is one dimensional and named after its
 * dimension, or when another variable names it in a bounds or coordinates
 * attribute. The others are data variables.
 *
 * ### decoding
 *
 * The CF packing and missing value attributes scale_factor, add_offset,
 * _FillValue and missing_value are moved into the array encoding and applied
 * on load, missing values become NaN. The units and calendar of variables
 * whose units are of the form "<units> since <date>" are moved into the
 * encoding as well.
 *
 * ### deadline
 *
 * When a deadline is set it is checked before each file is opened, both
 * while reading metadata and while loading values.
 */
class O3SKIM_EXPORT o3skim_cf_reader
{
public:
    static p_o3skim_cf_reader New()
    { return p_o3skim_cf_reader(new o3skim_cf_reader); }

    ~o3skim_cf_reader() = default;

    o3skim_cf_reader(const o3skim_cf_reader &) = delete;
    void operator=(const o3skim_cf_reader &) = delete;

    /** @name file_name
     * Set the list of files to read, in the order they are concatenated.
     */
    ///@{
    O3SKIM_VECTOR_PROPERTY(std::string, file_name)
    ///@}

    /** @name time_dimension
     * Set the name of the dimension the files are concatenated along.
     */
    ///@{
    O3SKIM_PROPERTY(std::string, time_dimension)
    ///@}

    /** @name deadline
     * Set the point in time after which reading is abandoned.
     */
    ///@{
    O3SKIM_PROPERTY(o3skim_deadline_t, deadline)
    ///@}

    /** @name verbose
     * Set to a non-zero value to report the files as they are read.
     */
    ///@{
    O3SKIM_PROPERTY(int, verbose)
    ///@}

    /** read the metadata and construct the dataset with lazy arrays.
     * returns one of the o3skim_error codes. coordinate_resolution_error
     * is returned when more than one file is given and the time dimension is
     * not found, model_load_error for all other failures.
     */
    int read(p_o3skim_dataset &dataset);

protected:
    o3skim_cf_reader();

private:
    std::vector<std::string> file_names;
    std::string time_dimension;
    o3skim_deadline_t deadline;
    int verbose;
};

#endif

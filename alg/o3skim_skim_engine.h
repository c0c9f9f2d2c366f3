#ifndef o3skim_skim_engine_h
#define o3skim_skim_engine_h

/// @file

#include "o3skim_config.h"
#include "o3skim_metadata.h"
#include "o3skim_model.h"
#include "o3skim_property.h"
#include "o3skim_shared_object.h"

#include <string>
#include <vector>

O3SKIM_SHARED_OBJECT_FORWARD_DECL(o3skim_skim_engine)

/// The files written and the files that failed during a skim
struct O3SKIM_EXPORT o3skim_skim_report
{
    std::vector<std::string> written;
    std::vector<std::string> failed;
};

/// Partitions the variables of a model in time and writes them.
/**
 * For each variable present in the model the time axis is decoded and split
 * into partitions: a single one (none), one per calendar year (year) or
 * one per decade starting on a multiple of ten (decade). Each partition is
 * written to its own NetCDF file in the output directory:
 *
 *  | groupby | file name |
 *  | ----    | ----      |
 *  | none    | \<var\>.nc |
 *  | year    | \<var\>_\<year\>-\<year+1\>.nc |
 *  | decade  | \<var\>_\<decade\>-\<decade+10\>.nc |
 *
 * A partition that fails to write is reported and the others are written.
 * When the metadata, merged with the metadata of each variable placed under
 * its name, is not empty it is written to metadata.yaml.
 */
class O3SKIM_EXPORT o3skim_skim_engine
{
public:
    static p_o3skim_skim_engine New()
    { return p_o3skim_skim_engine(new o3skim_skim_engine); }

    ~o3skim_skim_engine() = default;

    o3skim_skim_engine(const o3skim_skim_engine &) = delete;
    void operator=(const o3skim_skim_engine &) = delete;

    /** @name verbose
     * Set to a non-zero value to report the partitions as they are written.
     */
    ///@{
    O3SKIM_PROPERTY(int, verbose)
    ///@}

    /** write the model to output_dir, which must exist. groupby is one of
     * none, year or decade. the files written and those that failed are
     * appended to report. returns success when everything was written,
     * config_error for an unknown groupby, and io_write_error or
     * model_load_error when some files could not be written.
     */
    int skim(const const_p_o3skim_model &model, const std::string &groupby,
        const std::string &output_dir, const o3skim_metadata &metadata,
        o3skim_skim_report &report);

    /// get the name of the file holding a partition of a variable
    static std::string get_file_name(const std::string &var,
        const std::string &label);

protected:
    o3skim_skim_engine() : verbose(0) {}

    // partition one variable and write it
    int skim(const std::string &var_name, const o3skim_variable &var,
        const std::string &groupby, const std::string &output_dir,
        o3skim_skim_report &report);

private:
    int verbose;
};

#endif

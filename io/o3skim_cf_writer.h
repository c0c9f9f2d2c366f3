#ifndef o3skim_cf_writer_h
#define o3skim_cf_writer_h

/// @file

#include "o3skim_config.h"
#include "o3skim_dataset.h"
#include "o3skim_property.h"
#include "o3skim_shared_object.h"

#include <string>

O3SKIM_SHARED_OBJECT_FORWARD_DECL(o3skim_cf_writer)

/// Writes datasets in NetCDF CF format using create then append semantics.
/**
 * A missing file is first created empty, then the dataset is appended to it.
 * Dimensions already present in the file must have the same length and
 * variables already present must have the same dimensions, in which case
 * their values and attributes are overwritten. This makes writing the same
 * data twice produce the same file contents.
 *
 * Arrays are written with their attributes. The units and calendar held in
 * the encoding of an array are written as attributes too. The storage type
 * of new variables is float or double following the array.
 */
class O3SKIM_EXPORT o3skim_cf_writer
{
public:
    static p_o3skim_cf_writer New()
    { return p_o3skim_cf_writer(new o3skim_cf_writer); }

    ~o3skim_cf_writer() = default;

    o3skim_cf_writer(const o3skim_cf_writer &) = delete;
    void operator=(const o3skim_cf_writer &) = delete;

    /** @name file_name
     * Set the path of the file to write.
     */
    ///@{
    O3SKIM_PROPERTY(std::string, file_name)
    ///@}

    /** @name verbose
     * Set to a non-zero value to report the files as they are written.
     */
    ///@{
    O3SKIM_PROPERTY(int, verbose)
    ///@}

    /** create an empty NetCDF-4 file. an existing file is replaced.
     * returns one of the o3skim_error codes.
     */
    int create_empty();

    /** append the arrays and global attributes of the dataset to an existing
     * file. every array must be loaded. returns one of the o3skim_error
     * codes.
     */
    int append(const const_p_o3skim_dataset &dataset);

    /** create the file if it does not exist and append the dataset.
     * returns one of the o3skim_error codes.
     */
    int write(const const_p_o3skim_dataset &dataset);

protected:
    o3skim_cf_writer() : file_name(), verbose(0) {}

    // define or check the dimensions, define or check the variable and
    // write its attributes. the file must be in define mode
    int define_array(int file_id, const std::string &name,
        const const_p_o3skim_array &array, int &var_id);

private:
    std::string file_name;
    int verbose;
};

#endif

#ifndef o3skim_netcdf_util_h
#define o3skim_netcdf_util_h

/// @file

#include "o3skim_config.h"
#include "o3skim_metadata.h"

#include <mutex>
#include <string>
#include <vector>

#include <netcdf.h>

/// macro to help with netcdf data types
#define NC_DISPATCH(tc_, ...)                                     \
    switch (tc_)                                                  \
    {                                                             \
    NC_DISPATCH_CASE(NC_BYTE, signed char, __VA_ARGS__)           \
    NC_DISPATCH_CASE(NC_UBYTE, unsigned char, __VA_ARGS__)        \
    NC_DISPATCH_CASE(NC_SHORT, short int, __VA_ARGS__)            \
    NC_DISPATCH_CASE(NC_USHORT, unsigned short int, __VA_ARGS__)  \
    NC_DISPATCH_CASE(NC_INT, int, __VA_ARGS__)                    \
    NC_DISPATCH_CASE(NC_UINT, unsigned int, __VA_ARGS__)          \
    NC_DISPATCH_CASE(NC_INT64, long long, __VA_ARGS__)            \
    NC_DISPATCH_CASE(NC_UINT64, unsigned long long, __VA_ARGS__)  \
    NC_DISPATCH_CASE(NC_FLOAT, float, __VA_ARGS__)                \
    NC_DISPATCH_CASE(NC_DOUBLE, double, __VA_ARGS__)              \
    default:                                                      \
        O3SKIM_ERROR("netcdf type code " << tc_                   \
            << " is not supported")                               \
    }

/// macro that executes code when the type code is matched.
#define NC_DISPATCH_CASE(cc_, tt_, ...)                           \
    case cc_:                                                     \
    {                                                             \
        using NC_NT = tt_;                                        \
        __VA_ARGS__                                               \
        break;                                                    \
    }

/// Codes dealing with NetCDF I/O calls
namespace o3skim_netcdf_util
{

/** To deal with fortran fixed length strings which are not properly nulll
 * terminated.
 */
void crtrim(char *s, long n);

/** NetCDF 3 is not threadsafe. The HDF5 C-API can be compiled to be
 * threadsafe, but it is usually not. NetCDF uses HDF5-HL API to access HDF5,
 * but HDF5-HL API is not threadsafe without the --enable-unsupported flag. For
 * all those reasons it's best for the time being to protect all NetCDF I/O.
 */
O3SKIM_EXPORT
std::mutex &get_netcdf_mutex();

/// A RAII class for managing NETCDF files. The file is kept open while the object exists.
class O3SKIM_EXPORT netcdf_handle
{
public:
    netcdf_handle() : m_handle(0)
    {}

    /** Initialize with a handle returned from nc_open/nc_create etc. */
    netcdf_handle(int h) : m_handle(h)
    {}

    /** Close the file during destruction. */
    ~netcdf_handle()
    { this->close(); }

    /**
     * This is a move only class, and should
     * only be initialized with an valid handle.
     */
    netcdf_handle(const netcdf_handle &) = delete;
    void operator=(const netcdf_handle &) = delete;

    /** Move construction takes ownership from the other object. */
    netcdf_handle(netcdf_handle &&other)
    {
        m_handle = other.m_handle;
        other.m_handle = 0;
    }

    /** Move assignment takes ownership from the other object. */
    void operator=(netcdf_handle &&other)
    {
        this->close();
        m_handle = other.m_handle;
        other.m_handle = 0;
    }

    /** Open the file. Returns 0 on success. */
    int open(const std::string &file_path, int mode);

    /**
     * Create the file. The version of the library and the name of the
     * program are recorded in the global attributes. Returns 0 on success.
     */
    int create(const std::string &file_path, int mode);

    /** Close the file. */
    int close();

    /** Returns a reference to the handle. */
    int &get()
    { return m_handle; }

    /** Test if the handle is valid. */
    operator bool() const
    { return m_handle > 0; }

private:
    int m_handle;
};

/**
 * Read the specified variable attribute by id. Its value is stored in the
 * metadata object. Text attributes are stored as strings, numeric attributes
 * holding one value as scalars and those holding more as sequences. return
 * is non-zero if an error occurred.
 */
O3SKIM_EXPORT
int read_attribute(netcdf_handle &fh, int var_id,
    int att_id, o3skim_metadata &atts);

/**
 * Read all of the attributes of a variable, or the global attributes when
 * var_id is NC_GLOBAL. return is non-zero if an error occurred.
 */
O3SKIM_EXPORT
int read_attributes(netcdf_handle &fh, int var_id, o3skim_metadata &atts);

/**
 * Write the attributes in atts to the variable identified by var_id. Strings
 * are written as text, integers as NC_INT64, booleans as NC_BYTE and
 * floating point as NC_DOUBLE. Sequences of numbers are written as arrays.
 * Nested mappings can't be represented and are skipped. Returns zero of
 * successful.
 */
O3SKIM_EXPORT
int write_attributes(netcdf_handle &fh, int var_id,
    const o3skim_metadata &atts);

/// as above, for a file that is open but not owned by a netcdf_handle
O3SKIM_EXPORT
int write_attributes(int file_id, int var_id, const o3skim_metadata &atts);

/**
 * Read a hyperslab of a variable converting to double. Returns zero if
 * successful.
 */
O3SKIM_EXPORT
int read_variable(netcdf_handle &fh, int var_id,
    const std::vector<size_t> &start, const std::vector<size_t> &count,
    std::vector<double> &values);

}
#endif

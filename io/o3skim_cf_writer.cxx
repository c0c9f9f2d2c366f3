#include "o3skim_cf_writer.h"
#include "o3skim_common.h"
#include "o3skim_file_util.h"
#include "o3skim_netcdf_util.h"

#include <mutex>
#include <utility>
#include <vector>

// --------------------------------------------------------------------------
int o3skim_cf_writer::create_empty()
{
    o3skim_netcdf_util::netcdf_handle fh;
    if (fh.create(this->file_name, NC_CLOBBER|NC_NETCDF4))
    {
        O3SKIM_ERROR("Failed to create \"" << this->file_name << "\"")
        return o3skim_error::io_write_error;
    }

    if (fh.close())
        return o3skim_error::io_write_error;

    return o3skim_error::success;
}

// --------------------------------------------------------------------------
int o3skim_cf_writer::define_array(int file_id, const std::string &name,
    const const_p_o3skim_array &array, int &var_id)
{
    int ierr = 0;
    const std::vector<std::string> &dims = array->get_dims();
    const std::vector<unsigned long> &shape = array->get_shape();
    int n_dims = dims.size();

    std::vector<int> dim_ids(n_dims);
    {
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
    for (int i = 0; i < n_dims; ++i)
    {
        if (nc_inq_dimid(file_id, dims[i].c_str(), &dim_ids[i]) == NC_NOERR)
        {
            // the dimension exists, it must have the same length
            size_t dim_len = 0;
            if ((ierr = nc_inq_dimlen(file_id, dim_ids[i], &dim_len)) != NC_NOERR)
            {
                O3SKIM_ERROR("Failed to get the length of dimension \""
                    << dims[i] << "\". " << nc_strerror(ierr))
                return o3skim_error::io_write_error;
            }

            if (dim_len != shape[i])
            {
                O3SKIM_ERROR("Dimension \"" << dims[i] << "\" has length "
                    << dim_len << " in \"" << this->file_name << "\" but "
                    << name << " needs " << shape[i])
                return o3skim_error::io_write_error;
            }
        }
        else if ((ierr = nc_def_dim(file_id, dims[i].c_str(), shape[i],
            &dim_ids[i])) != NC_NOERR)
        {
            O3SKIM_ERROR("Failed to define dimension \"" << dims[i] << "\". "
                << nc_strerror(ierr))
            return o3skim_error::io_write_error;
        }
    }

    if (nc_inq_varid(file_id, name.c_str(), &var_id) == NC_NOERR)
    {
        // the variable exists, it must have the same dimensions
        int var_n_dims = 0;
        int var_dim_ids[NC_MAX_VAR_DIMS] = {0};
        if (((ierr = nc_inq_varndims(file_id, var_id, &var_n_dims)) != NC_NOERR)
            || ((ierr = nc_inq_vardimid(file_id, var_id, var_dim_ids)) != NC_NOERR))
        {
            O3SKIM_ERROR("Failed to query variable \"" << name << "\". "
                << nc_strerror(ierr))
            return o3skim_error::io_write_error;
        }

        bool same = var_n_dims == n_dims;
        for (int i = 0; same && (i < n_dims); ++i)
            same = var_dim_ids[i] == dim_ids[i];

        if (!same)
        {
            O3SKIM_ERROR("Variable \"" << name << "\" exists in \""
                << this->file_name << "\" with different dimensions")
            return o3skim_error::io_write_error;
        }
    }
    else
    {
        nc_type var_type =
            array->get_type() == o3skim_array::float32 ? NC_FLOAT : NC_DOUBLE;

        if ((ierr = nc_def_var(file_id, name.c_str(), var_type, n_dims,
            dim_ids.data(), &var_id)) != NC_NOERR)
        {
            O3SKIM_ERROR("Failed to define variable \"" << name << "\". "
                << nc_strerror(ierr))
            return o3skim_error::io_write_error;
        }
    }
    }

    // the attributes and the time encoding
    o3skim_metadata atts(array->get_attributes());

    const o3skim_metadata &encoding = array->get_encoding();
    std::string units;
    std::string calendar;
    if (encoding.get("units", units) == 0)
        atts.set("units", units);
    if (encoding.get("calendar", calendar) == 0)
        atts.set("calendar", calendar);

    if (o3skim_netcdf_util::write_attributes(file_id, var_id, atts))
    {
        O3SKIM_ERROR("Failed to write the attributes of \"" << name << "\"")
        return o3skim_error::io_write_error;
    }

    return o3skim_error::success;
}

// --------------------------------------------------------------------------
int o3skim_cf_writer::append(const const_p_o3skim_dataset &dataset)
{
    if (this->verbose)
    {
        O3SKIM_STATUS("Writing \"" << this->file_name << "\"")
    }

    o3skim_netcdf_util::netcdf_handle fh;
    if (fh.open(this->file_name, NC_WRITE))
        return o3skim_error::io_write_error;

    int ierr = 0;
    {
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
    if (((ierr = nc_redef(fh.get())) != NC_NOERR) && (ierr != NC_EINDEFINE))
    {
        O3SKIM_ERROR("Failed to enter define mode on \"" << this->file_name
            << "\". " << nc_strerror(ierr))
        return o3skim_error::io_write_error;
    }
    }

    if (o3skim_netcdf_util::write_attributes(fh, NC_GLOBAL,
        dataset->get_attributes()))
    {
        O3SKIM_ERROR("Failed to write the global attributes to \""
            << this->file_name << "\"")
        return o3skim_error::io_write_error;
    }

    // define everything
    std::vector<std::pair<int, const_p_o3skim_array>> arrays;
    const o3skim_dataset::array_map_t *maps[] =
        {&dataset->get_coordinates(), &dataset->get_variables()};
    for (int i = 0; i < 2; ++i)
    {
        auto it = maps[i]->begin();
        auto end = maps[i]->end();
        for (; it != end; ++it)
        {
            if (!it->second->is_loaded())
            {
                O3SKIM_ERROR("Array \"" << it->first << "\" is not loaded")
                return o3skim_error::io_write_error;
            }

            int var_id = 0;
            int status = this->define_array(fh.get(), it->first,
                it->second, var_id);
            if (status)
                return status;

            arrays.emplace_back(var_id, it->second);
        }
    }

    {
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
    if (((ierr = nc_enddef(fh.get())) != NC_NOERR) && (ierr != NC_ENOTINDEFINE))
    {
        O3SKIM_ERROR("Failed to leave define mode on \"" << this->file_name
            << "\". " << nc_strerror(ierr))
        return o3skim_error::io_write_error;
    }

    // write the values
    size_t n_arrays = arrays.size();
    for (size_t i = 0; i < n_arrays; ++i)
    {
        int var_id = arrays[i].first;
        const std::vector<double> &values = arrays[i].second->get_values();
        if ((ierr = nc_put_var_double(fh.get(), var_id, values.data())) != NC_NOERR)
        {
            O3SKIM_ERROR("Failed to write variable " << var_id << " to \""
                << this->file_name << "\". " << nc_strerror(ierr))
            return o3skim_error::io_write_error;
        }
    }
    }

    if (fh.close())
        return o3skim_error::io_write_error;

    return o3skim_error::success;
}

// --------------------------------------------------------------------------
int o3skim_cf_writer::write(const const_p_o3skim_dataset &dataset)
{
    if (!o3skim_file_util::file_exists(this->file_name.c_str()))
    {
        int status = this->create_empty();
        if (status)
            return status;
    }

    return this->append(dataset);
}

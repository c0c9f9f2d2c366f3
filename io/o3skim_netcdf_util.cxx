#include "o3skim_netcdf_util.h"
#include "o3skim_common.h"
#include "o3skim_system_interface.h"

#include <cstring>
#include <cstdlib>
#include <vector>

static std::mutex g_netcdf_mutex;

namespace o3skim_netcdf_util
{

// **************************************************************************
void crtrim(char *s, long n)
{
    if (!s || (n == 0)) return;
    char c = s[--n];
    while ((n > 0) && ((c == ' ') || (c == '\n') ||
        (c == '\t') || (c == '\r') || (c == '\0')))
    {
        s[n] = '\0';
        c = s[--n];
    }
}

// **************************************************************************
std::mutex &get_netcdf_mutex()
{
    return g_netcdf_mutex;
}

// --------------------------------------------------------------------------
int netcdf_handle::open(const std::string &file_path, int mode)
{
    if (m_handle)
    {
        O3SKIM_ERROR("Handle in use, close before re-opening")
        return -1;
    }

    int ierr = 0;
#if !defined(HDF5_THREAD_SAFE)
     std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
    if ((ierr = nc_open(file_path.c_str(), mode, &m_handle)) != NC_NOERR)
    {
        m_handle = 0;
        O3SKIM_ERROR("Failed to open \"" << file_path << "\". " << nc_strerror(ierr))
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
int netcdf_handle::create(const std::string &file_path, int mode)
{
    if (m_handle)
    {
        O3SKIM_ERROR("Handle in use, close before re-opening")
        return -1;
    }

    int ierr = 0;
#if !defined(HDF5_THREAD_SAFE)
     std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
    if ((ierr = nc_create(file_path.c_str(), mode, &m_handle)) != NC_NOERR)
    {
        m_handle = 0;
        O3SKIM_ERROR("Failed to create \"" << file_path << "\". " << nc_strerror(ierr))
        return -1;
    }

    // add some global metadata for provenance
    if ((ierr = nc_put_att_text(m_handle, NC_GLOBAL, "O3SKIM_VERSION_DESCR",
        strlen(O3SKIM_VERSION_DESCR), O3SKIM_VERSION_DESCR)))
    {
        O3SKIM_ERROR("Failed to set version attribute." << nc_strerror(ierr))
        return -1;
    }

    std::string app_name = o3skim_system_interface::get_program_name();

    if (!app_name.empty() && (ierr = nc_put_att_text(m_handle, NC_GLOBAL,
        "APP_NAME", app_name.size(), app_name.c_str())))
    {
        O3SKIM_ERROR("Failed to set app name attribute." << nc_strerror(ierr))
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
int netcdf_handle::close()
{
    if (m_handle)
    {
#if !defined(HDF5_THREAD_SAFE)
        std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
        int ierr = nc_close(m_handle);
        m_handle = 0;
        if (ierr != NC_NOERR)
        {
            O3SKIM_ERROR("Failed to close file. " << nc_strerror(ierr))
            return -1;
        }
    }
    return 0;
}

// **************************************************************************
int read_attribute(netcdf_handle &fh, int var_id, int att_id,
    o3skim_metadata &atts)
{
    int ierr = 0;
    char att_name[NC_MAX_NAME + 1] = {'\0'};
    nc_type att_type = 0;
    size_t att_len = 0;
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
    if (((ierr = nc_inq_attname(fh.get(), var_id, att_id, att_name)) != NC_NOERR)
        || ((ierr = nc_inq_att(fh.get(), var_id, att_name, &att_type, &att_len)) != NC_NOERR))
    {
        O3SKIM_ERROR("Failed to query the " << att_id << "th attribute of variable "
            << var_id << std::endl << nc_strerror(ierr))
        return -1;
    }

    if (att_type == NC_CHAR)
    {
        std::vector<char> tmp(att_len + 1, '\0');
        if ((ierr = nc_get_att_text(fh.get(), var_id, att_name, tmp.data())) != NC_NOERR)
        {
            O3SKIM_ERROR("Failed get text from the " << att_id << "th attribute \""
                << att_name << "\" of variable " << var_id << std::endl
                << nc_strerror(ierr))
            return -1;
        }
        o3skim_netcdf_util::crtrim(tmp.data(), att_len);
        atts.set(att_name, std::string(tmp.data()));
        return 0;
    }
    else if (att_type == NC_STRING)
    {
        std::vector<char*> strs(att_len, nullptr);
        if ((ierr = nc_get_att_string(fh.get(), var_id, att_name, strs.data())) != NC_NOERR)
        {
            O3SKIM_ERROR("Failed get string from the " << att_id << "th attribute \""
                << att_name << "\" of variable " << var_id << std::endl
                << nc_strerror(ierr))
            return -1;
        }
        atts.set(att_name, std::string(att_len && strs[0] ? strs[0] : ""));
        nc_free_string(att_len, strs.data());
        return 0;
    }
    else
    {
        NC_DISPATCH(att_type,
            std::vector<NC_NT> tmp(att_len);
            if ((ierr = nc_get_att(fh.get(), var_id, att_name, tmp.data())) != NC_NOERR)
            {
                O3SKIM_ERROR("Failed get the " << att_id << "th attribute \""
                    << att_name << "\" of variable " << var_id << std::endl
                    << nc_strerror(ierr))
                return -1;
            }

            if (att_len == 1)
            {
                atts.set(att_name, tmp[0]);
            }
            else
            {
                o3skim_metadata seq;
                for (size_t i = 0; i < att_len; ++i)
                    seq.append(o3skim_metadata::New(tmp[i]));
                atts.set(att_name, std::move(seq));
            }

            return 0;
            )
    }

    O3SKIM_ERROR("Failed to read the " << att_id << "th attribute of variable "
        << var_id << ". Unhandled case")
    return -1;
}

// **************************************************************************
int read_attributes(netcdf_handle &fh, int var_id, o3skim_metadata &atts)
{
    int ierr = 0;
    int n_atts = 0;
    {
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
    if ((ierr = nc_inq_varnatts(fh.get(), var_id, &n_atts)) != NC_NOERR)
    {
        O3SKIM_ERROR("Failed to get the number of attributes of variable "
            << var_id << std::endl << nc_strerror(ierr))
        return -1;
    }
    }

    for (int i = 0; i < n_atts; ++i)
    {
        if (o3skim_netcdf_util::read_attribute(fh, var_id, i, atts))
        {
            O3SKIM_ERROR("Failed to read the " << i << "th attribute of variable "
                << var_id)
            return -1;
        }
    }

    return 0;
}

// **************************************************************************
int write_attributes(int file_id, int var_id,
    const o3skim_metadata &atts)
{
    int ierr = 0;
    auto it = atts.begin();
    auto end = atts.end();
    for (; it != end; ++it)
    {
        const std::string &att_name = it->first;
        const o3skim_metadata &att = it->second;

#if !defined(HDF5_THREAD_SAFE)
        std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
        if (att.is_scalar())
        {
            const o3skim_metadata::scalar_t &val = att.get_scalar();
            if (const std::string *pval = std::get_if<std::string>(&val))
            {
                ierr = nc_put_att_text(file_id, var_id, att_name.c_str(),
                    pval->size(), pval->c_str());
            }
            else if (const long long *pval = std::get_if<long long>(&val))
            {
                ierr = nc_put_att_longlong(file_id, var_id, att_name.c_str(),
                    NC_INT64, 1, pval);
            }
            else if (const bool *pval = std::get_if<bool>(&val))
            {
                signed char bval = *pval ? 1 : 0;
                ierr = nc_put_att_schar(file_id, var_id, att_name.c_str(),
                    NC_BYTE, 1, &bval);
            }
            else if (const double *pval = std::get_if<double>(&val))
            {
                ierr = nc_put_att_double(file_id, var_id, att_name.c_str(),
                    NC_DOUBLE, 1, pval);
            }
        }
        else if (att.is_sequence())
        {
            const std::vector<o3skim_metadata> &seq = att.get_sequence();
            std::vector<double> vals;
            size_t n_vals = seq.size();
            for (size_t i = 0; i < n_vals; ++i)
            {
                double val = 0.0;
                if (seq[i].get_value(val))
                {
                    O3SKIM_WARNING("Attribute \"" << att_name
                        << "\" holds non-numeric values and is skipped")
                    vals.clear();
                    break;
                }
                vals.push_back(val);
            }
            if (vals.empty())
                continue;

            ierr = nc_put_att_double(file_id, var_id, att_name.c_str(),
                NC_DOUBLE, vals.size(), vals.data());
        }
        else
        {
            O3SKIM_WARNING("Attribute \"" << att_name
                << "\" is a nested mapping and is skipped")
            continue;
        }

        if (ierr != NC_NOERR)
        {
            O3SKIM_ERROR("failed to put attribute \"" << att_name << "\" "
                << nc_strerror(ierr))
            return -1;
        }
    }

    return 0;
}

// **************************************************************************
int write_attributes(netcdf_handle &fh, int var_id,
    const o3skim_metadata &atts)
{
    return write_attributes(fh.get(), var_id, atts);
}

// **************************************************************************
int read_variable(netcdf_handle &fh, int var_id,
    const std::vector<size_t> &start, const std::vector<size_t> &count,
    std::vector<double> &values)
{
    size_t n = 1;
    size_t n_dims = count.size();
    for (size_t i = 0; i < n_dims; ++i)
        n *= count[i];

    values.resize(n);

    int ierr = 0;
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
    if ((ierr = nc_get_vara_double(fh.get(), var_id, start.data(),
        count.data(), values.data())) != NC_NOERR)
    {
        O3SKIM_ERROR("Failed to read variable " << var_id << ". "
            << nc_strerror(ierr))
        return -1;
    }

    return 0;
}

}

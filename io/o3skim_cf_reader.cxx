#include "o3skim_cf_reader.h"
#include "o3skim_common.h"
#include "o3skim_netcdf_util.h"

#include <cmath>
#include <limits>
#include <mutex>
#include <set>

namespace
{
// the shape and attributes of a variable in the first file
struct variable_info
{
    std::string name;
    int type;
    std::vector<std::string> dims;
    std::vector<size_t> shape;
    int time_axis;
    o3skim_metadata attributes;
};

// CF decoding applied as values are loaded
struct decoding
{
    decoding() : scale(1.0), offset(0.0), have_fill(false), fill(0.0),
        have_missing(false), missing(0.0) {}

    double scale;
    double offset;
    bool have_fill;
    double fill;
    bool have_missing;
    double missing;
};

// **************************************************************************
int read_variable_info(o3skim_netcdf_util::netcdf_handle &fh,
    const std::string &file_name, int var_id, variable_info &info)
{
    int ierr = 0;
    char var_name[NC_MAX_NAME + 1] = {'\0'};
    nc_type var_type = 0;
    int n_dims = 0;
    int dim_ids[NC_MAX_VAR_DIMS] = {0};
    {
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
    if ((ierr = nc_inq_var(fh.get(), var_id, var_name, &var_type,
        &n_dims, dim_ids, nullptr)) != NC_NOERR)
    {
        O3SKIM_ERROR("Failed to query the " << var_id << "th variable of \""
            << file_name << "\". " << nc_strerror(ierr))
        return -1;
    }

    info.name = var_name;
    info.type = var_type;
    info.time_axis = -1;
    info.dims.resize(n_dims);
    info.shape.resize(n_dims);

    for (int i = 0; i < n_dims; ++i)
    {
        char dim_name[NC_MAX_NAME + 1] = {'\0'};
        size_t dim_len = 0;
        if ((ierr = nc_inq_dim(fh.get(), dim_ids[i], dim_name, &dim_len)) != NC_NOERR)
        {
            O3SKIM_ERROR("Failed to query the " << i << "th dimension of \""
                << var_name << "\" in \"" << file_name << "\". "
                << nc_strerror(ierr))
            return -1;
        }
        info.dims[i] = dim_name;
        info.shape[i] = dim_len;
    }
    }

    if (o3skim_netcdf_util::read_attributes(fh, var_id, info.attributes))
    {
        O3SKIM_ERROR("Failed to read the attributes of \"" << var_name
            << "\" in \"" << file_name << "\"")
        return -1;
    }

    return 0;
}

// **************************************************************************
int get_time_steps(o3skim_netcdf_util::netcdf_handle &fh,
    const std::string &file_name, const std::string &dim_name, size_t &n_steps)
{
    int ierr = 0;
    int dim_id = 0;
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
    if (((ierr = nc_inq_dimid(fh.get(), dim_name.c_str(), &dim_id)) != NC_NOERR)
        || ((ierr = nc_inq_dimlen(fh.get(), dim_id, &n_steps)) != NC_NOERR))
    {
        O3SKIM_ERROR("Failed to get the length of dimension \"" << dim_name
            << "\" in \"" << file_name << "\". " << nc_strerror(ierr))
        return -1;
    }
    return 0;
}

// **************************************************************************
int check_variable(o3skim_netcdf_util::netcdf_handle &fh,
    const std::string &file_name, const variable_info &info, int &var_id)
{
    int ierr = 0;
    int n_dims = 0;
    int dim_ids[NC_MAX_VAR_DIMS] = {0};
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
    if (((ierr = nc_inq_varid(fh.get(), info.name.c_str(), &var_id)) != NC_NOERR)
        || ((ierr = nc_inq_varndims(fh.get(), var_id, &n_dims)) != NC_NOERR)
        || ((ierr = nc_inq_vardimid(fh.get(), var_id, dim_ids)) != NC_NOERR))
    {
        O3SKIM_ERROR("Failed to query variable \"" << info.name << "\" in \""
            << file_name << "\". " << nc_strerror(ierr))
        return -1;
    }

    if (n_dims != static_cast<int>(info.dims.size()))
    {
        O3SKIM_ERROR("Variable \"" << info.name << "\" has " << n_dims
            << " dimensions in \"" << file_name << "\" but "
            << info.dims.size() << " in the first file")
        return -1;
    }

    for (int i = 0; i < n_dims; ++i)
    {
        char dim_name[NC_MAX_NAME + 1] = {'\0'};
        size_t dim_len = 0;
        if ((ierr = nc_inq_dim(fh.get(), dim_ids[i], dim_name, &dim_len)) != NC_NOERR)
        {
            O3SKIM_ERROR("Failed to query the " << i << "th dimension of \""
                << info.name << "\" in \"" << file_name << "\". "
                << nc_strerror(ierr))
            return -1;
        }

        if ((info.dims[i] != dim_name) ||
            ((i != info.time_axis) && (info.shape[i] != dim_len)))
        {
            O3SKIM_ERROR("The dimensions of variable \"" << info.name
                << "\" in \"" << file_name << "\" differ from the first file")
            return -1;
        }
    }

    return 0;
}

// **************************************************************************
void move_to_encoding(o3skim_metadata &atts, const std::string &name,
    o3skim_metadata &encoding)
{
    o3skim_metadata val;
    if (atts.get(name, val) == 0)
    {
        encoding.set(name, val);
        atts.remove(name);
    }
}

// **************************************************************************
decoding get_decoding(o3skim_metadata &atts, o3skim_metadata &encoding)
{
    decoding dec;

    if (atts.get("scale_factor", dec.scale) == 0)
        move_to_encoding(atts, "scale_factor", encoding);

    if (atts.get("add_offset", dec.offset) == 0)
        move_to_encoding(atts, "add_offset", encoding);

    if (atts.get("_FillValue", dec.fill) == 0)
    {
        dec.have_fill = true;
        move_to_encoding(atts, "_FillValue", encoding);
    }

    if (atts.get("missing_value", dec.missing) == 0)
    {
        dec.have_missing = true;
        move_to_encoding(atts, "missing_value", encoding);
    }

    // time encoding
    std::string units;
    if ((atts.get("units", units) == 0) &&
        (units.find(" since ") != std::string::npos))
    {
        move_to_encoding(atts, "units", encoding);
        if (atts.has("calendar"))
            move_to_encoding(atts, "calendar", encoding);
        else
            encoding.set("calendar", std::string("standard"));
    }

    return dec;
}

// **************************************************************************
void apply_decoding(const decoding &dec, std::vector<double> &values)
{
    double nan = std::numeric_limits<double>::quiet_NaN();
    size_t n = values.size();
    for (size_t i = 0; i < n; ++i)
    {
        double val = values[i];
        if ((dec.have_fill && (val == dec.fill)) ||
            (dec.have_missing && (val == dec.missing)))
            values[i] = nan;
        else
            values[i] = val*dec.scale + dec.offset;
    }
}

// **************************************************************************
void add_referenced_names(const o3skim_metadata &atts,
    std::set<std::string> &names)
{
    const char *keys[] = {"bounds", "coordinates"};
    for (int i = 0; i < 2; ++i)
    {
        std::string refs;
        if (atts.get(keys[i], refs))
            continue;

        size_t at = 0;
        while (at < refs.size())
        {
            size_t first = refs.find_first_not_of(' ', at);
            if (first == std::string::npos)
                break;
            size_t last = refs.find(' ', first);
            names.insert(refs.substr(first, last == std::string::npos ?
                std::string::npos : last - first));
            at = last;
        }
    }
}

// Reads the values of a variable from the files, interleaving the time
// steps of each file into place.
class lazy_load
{
public:
    lazy_load(const std::vector<std::string> &files,
        const std::vector<size_t> &n_steps, const variable_info &info,
        const decoding &dec, const o3skim_deadline_t &deadline) :
        m_files(files), m_n_steps(n_steps), m_name(info.name),
        m_shape(info.shape), m_time_axis(info.time_axis), m_decoding(dec),
        m_deadline(deadline)
    {}

    int operator()(std::vector<double> &values) const;

private:
    std::vector<std::string> m_files;
    std::vector<size_t> m_n_steps;
    std::string m_name;
    std::vector<size_t> m_shape;
    int m_time_axis;
    decoding m_decoding;
    o3skim_deadline_t m_deadline;
};

// --------------------------------------------------------------------------
int lazy_load::operator()(std::vector<double> &values) const
{
    size_t n_dims = m_shape.size();

    size_t n_total = 1;
    for (size_t i = 0; i < n_dims; ++i)
        n_total *= m_shape[i];

    values.resize(n_total);

    // without a time axis the values come from the first file
    size_t n_files = m_time_axis < 0 ? 1 : m_files.size();

    size_t n_outer = 1;
    size_t n_inner = 1;
    size_t n_time = 1;
    if (m_time_axis >= 0)
    {
        for (int i = 0; i < m_time_axis; ++i)
            n_outer *= m_shape[i];
        for (size_t i = m_time_axis + 1; i < n_dims; ++i)
            n_inner *= m_shape[i];
        n_time = m_shape[m_time_axis];
    }

    size_t offset = 0;
    for (size_t f = 0; f < n_files; ++f)
    {
        if (o3skim_deadline_passed(m_deadline))
        {
            O3SKIM_ERROR("The load deadline passed before reading \""
                << m_name << "\" from \"" << m_files[f] << "\"")
            return -1;
        }

        o3skim_netcdf_util::netcdf_handle fh;
        if (fh.open(m_files[f], NC_NOWRITE))
            return -1;

        int ierr = 0;
        int var_id = 0;
        {
#if !defined(HDF5_THREAD_SAFE)
        std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
        if ((ierr = nc_inq_varid(fh.get(), m_name.c_str(), &var_id)) != NC_NOERR)
        {
            O3SKIM_ERROR("Failed to find \"" << m_name << "\" in \""
                << m_files[f] << "\". " << nc_strerror(ierr))
            return -1;
        }
        }

        std::vector<size_t> start(n_dims, 0);
        std::vector<size_t> count(m_shape);
        if (m_time_axis >= 0)
            count[m_time_axis] = m_n_steps[f];

        std::vector<double> slab;
        if (o3skim_netcdf_util::read_variable(fh, var_id, start, count, slab))
        {
            O3SKIM_ERROR("Failed to read \"" << m_name << "\" from \""
                << m_files[f] << "\"")
            return -1;
        }

        if (m_time_axis < 0)
        {
            values.swap(slab);
            break;
        }

        size_t n_steps = m_n_steps[f];
        for (size_t i = 0; i < n_outer; ++i)
        {
            for (size_t j = 0; j < n_steps; ++j)
            {
                const double *src = slab.data() + (i*n_steps + j)*n_inner;
                double *dest = values.data() + (i*n_time + offset + j)*n_inner;
                for (size_t k = 0; k < n_inner; ++k)
                    dest[k] = src[k];
            }
        }

        offset += n_steps;
    }

    apply_decoding(m_decoding, values);

    return 0;
}
}

// --------------------------------------------------------------------------
o3skim_cf_reader::o3skim_cf_reader() :
    file_names(), time_dimension(), deadline(o3skim_deadline_t::max()),
    verbose(0)
{}

// --------------------------------------------------------------------------
int o3skim_cf_reader::read(p_o3skim_dataset &dataset)
{
    if (this->file_names.empty())
    {
        O3SKIM_ERROR("No files to read")
        return o3skim_error::model_load_error;
    }

    size_t n_files = this->file_names.size();
    const std::string &first_file = this->file_names[0];

    if (o3skim_deadline_passed(this->deadline))
    {
        O3SKIM_ERROR("The load deadline passed before opening \""
            << first_file << "\"")
        return o3skim_error::model_load_error;
    }

    if (this->verbose)
    {
        O3SKIM_STATUS("Reading " << n_files << " files starting with \""
            << first_file << "\"")
    }

    // read the metadata of the first file
    dataset = o3skim_dataset::New();
    std::vector<variable_info> vars;
    int has_time_dim = 0;
    {
    o3skim_netcdf_util::netcdf_handle fh;
    if (fh.open(first_file, NC_NOWRITE))
        return o3skim_error::model_load_error;

    if (o3skim_netcdf_util::read_attributes(fh, NC_GLOBAL,
        dataset->get_attributes()))
    {
        O3SKIM_ERROR("Failed to read the global attributes of \""
            << first_file << "\"")
        return o3skim_error::model_load_error;
    }

    int ierr = 0;
    int n_vars = 0;
    {
#if !defined(HDF5_THREAD_SAFE)
    std::lock_guard<std::mutex> lock(o3skim_netcdf_util::get_netcdf_mutex());
#endif
    if ((ierr = nc_inq_nvars(fh.get(), &n_vars)) != NC_NOERR)
    {
        O3SKIM_ERROR("Failed to get the number of variables in \""
            << first_file << "\". " << nc_strerror(ierr))
        return o3skim_error::model_load_error;
    }

    int dim_id = 0;
    has_time_dim = !this->time_dimension.empty() && (nc_inq_dimid(fh.get(),
        this->time_dimension.c_str(), &dim_id) == NC_NOERR);
    }

    vars.resize(n_vars);
    for (int i = 0; i < n_vars; ++i)
    {
        if (read_variable_info(fh, first_file, i, vars[i]))
            return o3skim_error::model_load_error;

        if (has_time_dim)
        {
            size_t n_dims = vars[i].dims.size();
            for (size_t j = 0; j < n_dims; ++j)
            {
                if (vars[i].dims[j] == this->time_dimension)
                    vars[i].time_axis = j;
            }
        }
    }
    }

    if ((n_files > 1) && !has_time_dim)
    {
        O3SKIM_ERROR("Can't concatenate " << n_files << " files. The time "
            "dimension \"" << this->time_dimension << "\" was not found in \""
            << first_file << "\"")
        return o3skim_error::coordinate_resolution_error;
    }

    // the number of time steps in each file
    std::vector<size_t> n_steps(n_files, 0);
    if (has_time_dim)
    {
        for (size_t f = 0; f < n_files; ++f)
        {
            const std::string &file_name = this->file_names[f];

            if (o3skim_deadline_passed(this->deadline))
            {
                O3SKIM_ERROR("The load deadline passed before opening \""
                    << file_name << "\"")
                return o3skim_error::model_load_error;
            }

            if (this->verbose > 1)
            {
                O3SKIM_STATUS("Scanning \"" << file_name << "\"")
            }

            o3skim_netcdf_util::netcdf_handle fh;
            if (fh.open(file_name, NC_NOWRITE) ||
                get_time_steps(fh, file_name, this->time_dimension, n_steps[f]))
                return o3skim_error::model_load_error;

            // subsequent files must provide the time varying variables
            size_t n_vars = vars.size();
            for (size_t i = 0; f && (i < n_vars); ++i)
            {
                int var_id = 0;
                if ((vars[i].time_axis >= 0) &&
                    check_variable(fh, file_name, vars[i], var_id))
                    return o3skim_error::model_load_error;
            }
        }
    }

    // names referenced by bounds and coordinates attributes are coordinates
    std::set<std::string> referenced;
    size_t n_vars = vars.size();
    for (size_t i = 0; i < n_vars; ++i)
        add_referenced_names(vars[i].attributes, referenced);

    // construct the lazy arrays
    for (size_t i = 0; i < n_vars; ++i)
    {
        variable_info &info = vars[i];

        std::vector<unsigned long> shape(info.shape.begin(), info.shape.end());
        if (info.time_axis >= 0)
        {
            size_t n_total = 0;
            for (size_t f = 0; f < n_files; ++f)
                n_total += n_steps[f];
            shape[info.time_axis] = n_total;
            info.shape[info.time_axis] = n_total;
        }

        o3skim_metadata encoding;
        decoding dec = get_decoding(info.attributes, encoding);

        p_o3skim_array arr = o3skim_array::New(info.dims, shape,
            lazy_load(this->file_names, n_steps, info, dec, this->deadline));

        arr->set_type(info.type == NC_FLOAT ?
            o3skim_array::float32 : o3skim_array::float64);
        arr->get_attributes() = info.attributes;
        arr->get_encoding() = encoding;

        bool is_coordinate = ((info.dims.size() == 1) &&
            (info.dims[0] == info.name)) || referenced.count(info.name);

        if (is_coordinate)
            dataset->set_coordinate(info.name, arr);
        else
            dataset->set_variable(info.name, arr);
    }

    return o3skim_error::success;
}

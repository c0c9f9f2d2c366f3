#include "o3skim_array.h"
#include "o3skim_common.h"

#include <cmath>
#include <limits>

// --------------------------------------------------------------------------
p_o3skim_array o3skim_array::New()
{
    return p_o3skim_array(new o3skim_array);
}

// --------------------------------------------------------------------------
p_o3skim_array o3skim_array::New(const std::vector<std::string> &dims,
    const std::vector<unsigned long> &shape,
    const std::vector<double> &values)
{
    p_o3skim_array arr(new o3skim_array);
    arr->m_dims = dims;
    arr->m_shape = shape;
    arr->m_values = values;
    return arr;
}

// --------------------------------------------------------------------------
p_o3skim_array o3skim_array::New(const std::vector<std::string> &dims,
    const std::vector<unsigned long> &shape, const loader_t &loader)
{
    p_o3skim_array arr(new o3skim_array);
    arr->m_dims = dims;
    arr->m_shape = shape;
    arr->m_loader = loader;
    return arr;
}

// --------------------------------------------------------------------------
void o3skim_array::set_type(int type)
{
    m_type = type;
    this->round_to_type();
}

// --------------------------------------------------------------------------
void o3skim_array::round_to_type()
{
    if ((m_type != float32) || !this->is_loaded())
        return;

    size_t n = m_values.size();
    for (size_t i = 0; i < n; ++i)
        m_values[i] = static_cast<float>(m_values[i]);
}

// --------------------------------------------------------------------------
unsigned long o3skim_array::size() const
{
    unsigned long n = 1;
    size_t n_dims = m_shape.size();
    for (size_t i = 0; i < n_dims; ++i)
        n *= m_shape[i];
    return n;
}

// --------------------------------------------------------------------------
int o3skim_array::get_axis(const std::string &dim) const
{
    size_t n_dims = m_dims.size();
    for (size_t i = 0; i < n_dims; ++i)
    {
        if (m_dims[i] == dim)
            return i;
    }
    return -1;
}

// --------------------------------------------------------------------------
int o3skim_array::rename_dim(const std::string &old_name,
    const std::string &new_name)
{
    int axis = this->get_axis(old_name);
    if (axis < 0)
        return -1;

    m_dims[axis] = new_name;
    return 0;
}

// --------------------------------------------------------------------------
int o3skim_array::load()
{
    if (!m_loader)
        return 0;

    std::vector<double> values;
    if (m_loader(values))
        return -1;

    if (values.size() != this->size())
    {
        O3SKIM_ERROR("The loader produced " << values.size()
            << " values but " << this->size() << " were expected")
        return -1;
    }

    m_values.swap(values);
    m_loader = nullptr;

    this->round_to_type();

    return 0;
}

// --------------------------------------------------------------------------
void o3skim_array::get_strides(int axis, unsigned long &n_outer,
    unsigned long &n_axis, unsigned long &n_inner) const
{
    n_outer = 1;
    for (int i = 0; i < axis; ++i)
        n_outer *= m_shape[i];

    n_axis = m_shape[axis];

    n_inner = 1;
    int n_dims = m_shape.size();
    for (int i = axis + 1; i < n_dims; ++i)
        n_inner *= m_shape[i];
}

// --------------------------------------------------------------------------
int o3skim_array::mean(const std::string &dim, p_o3skim_array &result)
{
    int axis = this->get_axis(dim);
    if (axis < 0)
    {
        O3SKIM_ERROR("No dimension named \"" << dim << "\"")
        return -1;
    }

    std::vector<std::vector<unsigned long>> groups(1);
    groups[0].resize(m_shape[axis]);
    for (unsigned long j = 0; j < m_shape[axis]; ++j)
        groups[0][j] = j;

    if (this->group_mean(dim, groups, result))
        return -1;

    result->m_dims.erase(result->m_dims.begin() + axis);
    result->m_shape.erase(result->m_shape.begin() + axis);

    return 0;
}

// --------------------------------------------------------------------------
int o3skim_array::group_mean(const std::string &dim,
    const std::vector<std::vector<unsigned long>> &groups,
    p_o3skim_array &result)
{
    int axis = this->get_axis(dim);
    if (axis < 0)
    {
        O3SKIM_ERROR("No dimension named \"" << dim << "\"")
        return -1;
    }

    if (this->load())
    {
        O3SKIM_ERROR("Failed to load the values")
        return -1;
    }

    unsigned long n_outer = 0, n_axis = 0, n_inner = 0;
    this->get_strides(axis, n_outer, n_axis, n_inner);

    unsigned long n_groups = groups.size();
    std::vector<double> values(n_outer*n_groups*n_inner);
    for (unsigned long i = 0; i < n_outer; ++i)
    {
        for (unsigned long g = 0; g < n_groups; ++g)
        {
            const std::vector<unsigned long> &ids = groups[g];
            unsigned long n_ids = ids.size();
            for (unsigned long k = 0; k < n_inner; ++k)
            {
                double sum = 0.0;
                unsigned long n_valid = 0;
                for (unsigned long j = 0; j < n_ids; ++j)
                {
                    if (ids[j] >= n_axis)
                    {
                        O3SKIM_ERROR("Index " << ids[j] << " is out of bounds"
                            " for \"" << dim << "\" with length " << n_axis)
                        return -1;
                    }

                    double val = m_values[(i*n_axis + ids[j])*n_inner + k];
                    if (!std::isnan(val))
                    {
                        sum += val;
                        ++n_valid;
                    }
                }
                values[(i*n_groups + g)*n_inner + k] = n_valid ? sum/n_valid :
                    std::numeric_limits<double>::quiet_NaN();
            }
        }
    }

    std::vector<unsigned long> shape(m_shape);
    shape[axis] = n_groups;

    result = o3skim_array::New(m_dims, shape, values);
    result->m_attributes = m_attributes;
    result->m_encoding = m_encoding;
    result->set_type(m_type);

    return 0;
}

// --------------------------------------------------------------------------
int o3skim_array::take(const std::string &dim,
    const std::vector<unsigned long> &ids, p_o3skim_array &result) const
{
    int axis = this->get_axis(dim);
    if (axis < 0)
    {
        O3SKIM_ERROR("No dimension named \"" << dim << "\"")
        return -1;
    }

    if (!this->is_loaded())
    {
        O3SKIM_ERROR("Can't select from an array that is not loaded")
        return -1;
    }

    unsigned long n_outer = 0, n_axis = 0, n_inner = 0;
    this->get_strides(axis, n_outer, n_axis, n_inner);

    unsigned long n_ids = ids.size();
    std::vector<double> values(n_outer*n_ids*n_inner);
    for (unsigned long i = 0; i < n_outer; ++i)
    {
        for (unsigned long j = 0; j < n_ids; ++j)
        {
            unsigned long jj = ids[j];
            if (jj >= n_axis)
            {
                O3SKIM_ERROR("Index " << jj << " is out of bounds for \""
                    << dim << "\" with length " << n_axis)
                return -1;
            }

            const double *src = m_values.data() + (i*n_axis + jj)*n_inner;
            double *dest = values.data() + (i*n_ids + j)*n_inner;
            for (unsigned long k = 0; k < n_inner; ++k)
                dest[k] = src[k];
        }
    }

    std::vector<unsigned long> shape(m_shape);
    shape[axis] = n_ids;

    result = o3skim_array::New(m_dims, shape, values);
    result->m_type = m_type;
    result->m_attributes = m_attributes;
    result->m_encoding = m_encoding;

    return 0;
}

// --------------------------------------------------------------------------
int o3skim_array::scale(double factor)
{
    if (!this->is_loaded())
    {
        O3SKIM_ERROR("Can't scale an array that is not loaded")
        return -1;
    }

    size_t n = m_values.size();
    for (size_t i = 0; i < n; ++i)
        m_values[i] *= factor;

    this->round_to_type();

    return 0;
}

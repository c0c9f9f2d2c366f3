#include "o3skim_dataset.h"
#include "o3skim_common.h"

namespace
{
// **************************************************************************
p_o3skim_array find(o3skim_dataset::array_map_t &arrays,
    const std::string &name)
{
    auto it = arrays.find(name);
    if (it == arrays.end())
        return nullptr;
    return it->second;
}

// **************************************************************************
std::vector<std::string> names(const o3skim_dataset::array_map_t &arrays)
{
    std::vector<std::string> names;
    auto it = arrays.begin();
    auto end = arrays.end();
    for (; it != end; ++it)
        names.push_back(it->first);
    return names;
}

// **************************************************************************
int rename_entry(o3skim_dataset::array_map_t &arrays,
    const std::string &old_name, const std::string &new_name)
{
    auto it = arrays.find(old_name);
    if (it == arrays.end())
        return -1;

    p_o3skim_array arr = it->second;
    arrays.erase(it);
    arrays[new_name] = arr;
    return 0;
}
}

// --------------------------------------------------------------------------
p_o3skim_array o3skim_dataset::get_coordinate(const std::string &name)
{
    return find(m_coordinates, name);
}

// --------------------------------------------------------------------------
const_p_o3skim_array o3skim_dataset::get_coordinate(
    const std::string &name) const
{
    return find(const_cast<array_map_t&>(m_coordinates), name);
}

// --------------------------------------------------------------------------
int o3skim_dataset::remove_coordinate(const std::string &name)
{
    return m_coordinates.erase(name) ? 0 : -1;
}

// --------------------------------------------------------------------------
std::vector<std::string> o3skim_dataset::get_coordinate_names() const
{
    return names(m_coordinates);
}

// --------------------------------------------------------------------------
p_o3skim_array o3skim_dataset::get_variable(const std::string &name)
{
    return find(m_variables, name);
}

// --------------------------------------------------------------------------
const_p_o3skim_array o3skim_dataset::get_variable(
    const std::string &name) const
{
    return find(const_cast<array_map_t&>(m_variables), name);
}

// --------------------------------------------------------------------------
int o3skim_dataset::remove_variable(const std::string &name)
{
    return m_variables.erase(name) ? 0 : -1;
}

// --------------------------------------------------------------------------
std::vector<std::string> o3skim_dataset::get_variable_names() const
{
    return names(m_variables);
}

// --------------------------------------------------------------------------
p_o3skim_array o3skim_dataset::get_array(const std::string &name)
{
    p_o3skim_array arr = find(m_variables, name);
    if (!arr)
        arr = find(m_coordinates, name);
    return arr;
}

// --------------------------------------------------------------------------
const_p_o3skim_array o3skim_dataset::get_array(const std::string &name) const
{
    return const_cast<o3skim_dataset*>(this)->get_array(name);
}

// --------------------------------------------------------------------------
int o3skim_dataset::has_dimension(const std::string &dim) const
{
    unsigned long n = 0;
    return this->get_dimension_size(dim, n) == 0;
}

// --------------------------------------------------------------------------
int o3skim_dataset::get_dimension_size(const std::string &dim,
    unsigned long &n) const
{
    const array_map_t *maps[] = {&m_variables, &m_coordinates};
    for (int i = 0; i < 2; ++i)
    {
        auto it = maps[i]->begin();
        auto end = maps[i]->end();
        for (; it != end; ++it)
        {
            int axis = it->second->get_axis(dim);
            if (axis >= 0)
            {
                n = it->second->get_shape()[axis];
                return 0;
            }
        }
    }
    return -1;
}

// --------------------------------------------------------------------------
int o3skim_dataset::rename(const std::string &old_name,
    const std::string &new_name)
{
    if (old_name == new_name)
        return (this->get_array(old_name) || this->has_dimension(old_name)) ? 0 : -1;

    int found = 0;

    if (m_variables.count(old_name))
    {
        if (this->get_array(new_name))
        {
            O3SKIM_ERROR("Can't rename \"" << old_name << "\" to \""
                << new_name << "\". An array named \"" << new_name
                << "\" exists")
            return -1;
        }
        rename_entry(m_variables, old_name, new_name);
        found = 1;
    }
    else if (m_coordinates.count(old_name))
    {
        if (this->get_array(new_name))
        {
            O3SKIM_ERROR("Can't rename \"" << old_name << "\" to \""
                << new_name << "\". An array named \"" << new_name
                << "\" exists")
            return -1;
        }
        rename_entry(m_coordinates, old_name, new_name);
        found = 1;
    }

    // rename the dimension on every array defined on it
    array_map_t *maps[] = {&m_variables, &m_coordinates};
    for (int i = 0; i < 2; ++i)
    {
        auto it = maps[i]->begin();
        auto end = maps[i]->end();
        for (; it != end; ++it)
        {
            if (it->second->rename_dim(old_name, new_name) == 0)
                found = 1;
        }
    }

    return found ? 0 : -1;
}

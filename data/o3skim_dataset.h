#ifndef o3skim_dataset_h
#define o3skim_dataset_h

/// @file

#include "o3skim_config.h"
#include "o3skim_array.h"
#include "o3skim_metadata.h"
#include "o3skim_shared_object.h"

#include <map>
#include <string>
#include <vector>

O3SKIM_SHARED_OBJECT_FORWARD_DECL(o3skim_dataset)

/// A collection of named coordinate and data arrays sharing dimensions.
/**
 * Coordinates and data variables are kept in separate name spaces in the
 * way the CF conventions distinguish them. Global attributes are held in a
 * metadata object.
 */
class O3SKIM_EXPORT o3skim_dataset
{
public:
    using array_map_t = std::map<std::string, p_o3skim_array>;

    static p_o3skim_dataset New()
    { return p_o3skim_dataset(new o3skim_dataset); }

    ~o3skim_dataset() = default;

    o3skim_dataset(const o3skim_dataset &) = delete;
    void operator=(const o3skim_dataset &) = delete;

    /// access the global attributes
    o3skim_metadata &get_attributes() { return m_attributes; }
    const o3skim_metadata &get_attributes() const { return m_attributes; }

    /// @name coordinates
    ///@{
    void set_coordinate(const std::string &name, const p_o3skim_array &arr)
    { m_coordinates[name] = arr; }

    p_o3skim_array get_coordinate(const std::string &name);
    const_p_o3skim_array get_coordinate(const std::string &name) const;

    int has_coordinate(const std::string &name) const
    { return m_coordinates.count(name); }

    int remove_coordinate(const std::string &name);

    std::vector<std::string> get_coordinate_names() const;

    const array_map_t &get_coordinates() const { return m_coordinates; }
    ///@}

    /// @name data variables
    ///@{
    void set_variable(const std::string &name, const p_o3skim_array &arr)
    { m_variables[name] = arr; }

    p_o3skim_array get_variable(const std::string &name);
    const_p_o3skim_array get_variable(const std::string &name) const;

    int has_variable(const std::string &name) const
    { return m_variables.count(name); }

    int remove_variable(const std::string &name);

    std::vector<std::string> get_variable_names() const;

    const array_map_t &get_variables() const { return m_variables; }
    ///@}

    /// get a variable or a coordinate by name, or nullptr
    p_o3skim_array get_array(const std::string &name);
    const_p_o3skim_array get_array(const std::string &name) const;

    /// returns non-zero if any array has the named dimension
    int has_dimension(const std::string &dim) const;

    /** get the length of the named dimension.
     * return 0 if the dimension was found.
     */
    int get_dimension_size(const std::string &dim, unsigned long &n) const;

    /** rename a data variable, a coordinate and a dimension. every array
     * defined on the dimension is updated. return 0 if the name was found
     * in any of the three name spaces, and -1 if it was not. renaming onto
     * an existing array of a different name is an error.
     */
    int rename(const std::string &old_name, const std::string &new_name);

protected:
    o3skim_dataset() = default;

private:
    o3skim_metadata m_attributes;
    array_map_t m_coordinates;
    array_map_t m_variables;
};

#endif

#ifndef o3skim_array_h
#define o3skim_array_h

/// @file

#include "o3skim_config.h"
#include "o3skim_metadata.h"
#include "o3skim_shared_object.h"

#include <functional>
#include <string>
#include <vector>

O3SKIM_SHARED_OBJECT_FORWARD_DECL(o3skim_array)

/// A labeled n-dimensional array of numbers.
/**
 * Each axis has a dimension name. Values are held as double in row major
 * order, the type the values are stored as on disk is tracked separately.
 * The array carries its CF attributes and an encoding (units and calendar
 * of a time axis) that is kept apart from the attributes.
 *
 * The values may be lazy. A lazy array holds a loader that produces the
 * values on the first call to ::load. Operations that read values require
 * a loaded array.
 */
class O3SKIM_EXPORT o3skim_array
{
public:
    /// the on disk storage types
    enum {float64 = 0, float32 = 1};

    /// a function producing the values of a lazy array
    using loader_t = std::function<int(std::vector<double> &)>;

    /// construct an empty array
    static p_o3skim_array New();

    /// construct an array holding the given values
    static p_o3skim_array New(const std::vector<std::string> &dims,
        const std::vector<unsigned long> &shape,
        const std::vector<double> &values);

    /// construct a lazy array
    static p_o3skim_array New(const std::vector<std::string> &dims,
        const std::vector<unsigned long> &shape, const loader_t &loader);

    ~o3skim_array() = default;

    o3skim_array(const o3skim_array &) = delete;
    void operator=(const o3skim_array &) = delete;

    /// get the dimension names
    const std::vector<std::string> &get_dims() const { return m_dims; }

    /// get the shape
    const std::vector<unsigned long> &get_shape() const { return m_shape; }

    /// get the number of dimensions
    unsigned int get_rank() const { return m_dims.size(); }

    /// get the number of values
    unsigned long size() const;

    /// get the axis of the named dimension or -1 if it is not found
    int get_axis(const std::string &dim) const;

    /// returns non-zero if the array has the named dimension
    int has_dim(const std::string &dim) const
    { return this->get_axis(dim) >= 0; }

    /// rename a dimension. return 0 if the dimension was found
    int rename_dim(const std::string &old_name, const std::string &new_name);

    /// produce the values of a lazy array. return 0 if successful
    int load();

    /// returns true if the values are present
    bool is_loaded() const { return !m_loader; }

    /// access the values. the array must be loaded
    std::vector<double> &get_values() { return m_values; }
    const std::vector<double> &get_values() const { return m_values; }

    /** set/get the storage type. the values of a float32 array are kept
     * rounded to single precision, so they equal what is stored on disk.
     */
    void set_type(int type);
    int get_type() const { return m_type; }

    /// access the CF attributes
    o3skim_metadata &get_attributes() { return m_attributes; }
    const o3skim_metadata &get_attributes() const { return m_attributes; }

    /// access the encoding. holds units and calendar of time axes
    o3skim_metadata &get_encoding() { return m_encoding; }
    const o3skim_metadata &get_encoding() const { return m_encoding; }

    /** compute the mean along the named dimension ignoring NaN, the result
     * has one fewer dimension. where every value is NaN the mean is NaN.
     * loads the array when needed. return 0 if successful.
     */
    int mean(const std::string &dim, p_o3skim_array &result);

    /** compute the mean of each group of indices along the named dimension
     * ignoring NaN. the dimension of the result has one entry per group.
     * loads the array when needed. return 0 if successful.
     */
    int group_mean(const std::string &dim,
        const std::vector<std::vector<unsigned long>> &groups,
        p_o3skim_array &result);

    /** select the given indices along the named dimension. the array must be
     * loaded. return 0 if successful.
     */
    int take(const std::string &dim, const std::vector<unsigned long> &ids,
        p_o3skim_array &result) const;

    /// multiply every value by the factor. the array must be loaded.
    int scale(double factor);

protected:
    o3skim_array() : m_type(float64) {}

    // split the shape around the axis into the product of the leading
    // dimensions, the axis length, and the product of the trailing ones
    void get_strides(int axis, unsigned long &n_outer,
        unsigned long &n_axis, unsigned long &n_inner) const;

    // round the values of a float32 array to single precision
    void round_to_type();

private:
    std::vector<std::string> m_dims;
    std::vector<unsigned long> m_shape;
    std::vector<double> m_values;
    loader_t m_loader;
    int m_type;
    o3skim_metadata m_attributes;
    o3skim_metadata m_encoding;
};

#endif

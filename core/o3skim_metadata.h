#ifndef o3skim_metadata_h
#define o3skim_metadata_h

/// @file

#include "o3skim_config.h"

#include <iosfwd>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

/// A generic container for nested meta data in the form of name=value pairs.
/**
 * A node is one of a mapping of names to nodes, a scalar (integer, floating
 * point, boolean or string) or a sequence of nodes. A default constructed
 * node is an empty mapping. The set/get API follows the usual convention of
 * returning 0 when successful.
 *
 * Mappings are merged recursively with ::merge, values from the more
 * specific operand take precedence at leaf conflicts.
 */
class O3SKIM_EXPORT o3skim_metadata
{
public:
    /// the types a scalar node may hold
    using scalar_t = std::variant<long long, double, bool, std::string>;

    /// the kinds of node
    enum {mapping = 0, scalar = 1, sequence = 2};

    o3skim_metadata() : m_kind(mapping) {}
    ~o3skim_metadata() = default;

    o3skim_metadata(const o3skim_metadata &other) = default;
    o3skim_metadata &operator=(const o3skim_metadata &other) = default;

    o3skim_metadata(o3skim_metadata &&other) noexcept = default;
    o3skim_metadata &operator=(o3skim_metadata &&other) noexcept = default;

    /// construct a scalar node
    static o3skim_metadata New(const scalar_t &val);

    /// construct a sequence node
    static o3skim_metadata New(const std::vector<o3skim_metadata> &vals);

    /// construct a scalar node from a C++ value
    template <typename T>
    static o3skim_metadata New(const T &val)
    { return o3skim_metadata::New(o3skim_metadata::to_scalar(val)); }

    /// get the kind of node
    int get_kind() const { return m_kind; }

    bool is_mapping() const { return m_kind == mapping; }
    bool is_scalar() const { return m_kind == scalar; }
    bool is_sequence() const { return m_kind == sequence; }

    /// access the value of a scalar node
    const scalar_t &get_scalar() const { return m_value; }

    /** convert the value of a scalar node. numeric values convert between
     * numeric types, strings only to strings. return 0 if successful.
     */
    template <typename T>
    int get_value(T &val) const;

    /// access the elements of a sequence node
    const std::vector<o3skim_metadata> &get_sequence() const
    { return m_sequence; }

    /// append to a sequence node. an empty mapping becomes a sequence.
    int append(const o3skim_metadata &val);

    /// get the number of name value pairs, or the length of a sequence
    unsigned int size() const;

    /// insert or replace the named node
    int set(const std::string &name, const o3skim_metadata &val);
    int set(const std::string &name, o3skim_metadata &&val);

    /// insert or replace the named scalar
    template <typename T>
    int set(const std::string &name, const T &val)
    { return this->set(name, o3skim_metadata::New(val)); }

    /// get a copy of the named node. return 0 if successful
    int get(const std::string &name, o3skim_metadata &val) const;

    /// get the value of the named scalar. return 0 if successful
    template <typename T>
    int get(const std::string &name, T &val) const;

    /// get a pointer to the named node, or nullptr if it doesn't exist
    const o3skim_metadata *find(const std::string &name) const;
    o3skim_metadata *find(const std::string &name);

    /// get the names of all name, value pairs. returns 0 if there are any.
    int get_names(std::vector<std::string> &names) const;

    /// returns true if there is a property with the given name
    int has(const std::string &name) const noexcept;

    /// remove. return 0 if successful
    int remove(const std::string &name) noexcept;

    /// remove all
    void clear();

    /// return true if empty
    int empty() const noexcept;

    /// return true if not empty
    explicit operator bool() const noexcept
    { return !empty(); }

    /** merge the other node into this one. when both are mappings the merge
     * recurses into names present in both where both values are mappings,
     * otherwise the value from other replaces the value here.
     */
    void merge(const o3skim_metadata &other);

    /// iterate over the name, value pairs of a mapping
    using const_iterator =
        std::map<std::string, o3skim_metadata>::const_iterator;

    const_iterator begin() const { return m_props.begin(); }
    const_iterator end() const { return m_props.end(); }

    /// serialize to ASCII
    int to_stream(std::ostream &os) const;

    /// convert a C++ value into a scalar
    template <typename T>
    static scalar_t to_scalar(const T &val);

private:
    int m_kind;
    scalar_t m_value;
    std::vector<o3skim_metadata> m_sequence;
    std::map<std::string, o3skim_metadata> m_props;

    friend bool operator==(const o3skim_metadata &,
        const o3skim_metadata &) noexcept;
};

// compare meta data objects. two objects are considered equal if they are
// of the same kind and all of the values are equal
O3SKIM_EXPORT
bool operator==(const o3skim_metadata &lhs, const o3skim_metadata &rhs) noexcept;

inline
bool operator!=(const o3skim_metadata &lhs, const o3skim_metadata &rhs) noexcept
{ return !(lhs == rhs); }

/// send the metadata to a stream in human readable form
O3SKIM_EXPORT
std::ostream &operator<<(std::ostream &os, const o3skim_metadata &md);

// --------------------------------------------------------------------------
template <typename T>
o3skim_metadata::scalar_t o3skim_metadata::to_scalar(const T &val)
{
    if constexpr (std::is_same<T, bool>::value)
        return scalar_t(val);
    else if constexpr (std::is_integral<T>::value)
        return scalar_t(static_cast<long long>(val));
    else if constexpr (std::is_floating_point<T>::value)
        return scalar_t(static_cast<double>(val));
    else
        return scalar_t(std::string(val));
}

// --------------------------------------------------------------------------
template <typename T>
int o3skim_metadata::get_value(T &val) const
{
    if (m_kind != scalar)
        return -1;

    if constexpr (std::is_same<T, std::string>::value)
    {
        const std::string *pval = std::get_if<std::string>(&m_value);
        if (!pval)
            return -1;
        val = *pval;
        return 0;
    }
    else
    {
        static_assert(std::is_arithmetic<T>::value,
            "scalar values convert to string or arithmetic types");

        if (const long long *pval = std::get_if<long long>(&m_value))
            val = static_cast<T>(*pval);
        else if (const double *pval = std::get_if<double>(&m_value))
            val = static_cast<T>(*pval);
        else if (const bool *pval = std::get_if<bool>(&m_value))
            val = static_cast<T>(*pval);
        else
            return -1;

        return 0;
    }
}

// --------------------------------------------------------------------------
template <typename T>
int o3skim_metadata::get(const std::string &name, T &val) const
{
    const o3skim_metadata *node = this->find(name);
    if (!node)
        return -1;

    return node->get_value(val);
}

#endif

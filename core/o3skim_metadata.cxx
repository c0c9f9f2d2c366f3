#include "o3skim_metadata.h"
#include "o3skim_common.h"

#include <utility>
#include <ostream>

// --------------------------------------------------------------------------
o3skim_metadata o3skim_metadata::New(const scalar_t &val)
{
    o3skim_metadata md;
    md.m_kind = scalar;
    md.m_value = val;
    return md;
}

// --------------------------------------------------------------------------
o3skim_metadata o3skim_metadata::New(const std::vector<o3skim_metadata> &vals)
{
    o3skim_metadata md;
    md.m_kind = sequence;
    md.m_sequence = vals;
    return md;
}

// --------------------------------------------------------------------------
int o3skim_metadata::append(const o3skim_metadata &val)
{
    if ((m_kind == mapping) && m_props.empty())
        m_kind = sequence;

    if (m_kind != sequence)
    {
        O3SKIM_ERROR("append to a node that is not a sequence")
        return -1;
    }

    m_sequence.push_back(val);
    return 0;
}

// --------------------------------------------------------------------------
unsigned int o3skim_metadata::size() const
{
    if (m_kind == sequence)
        return m_sequence.size();

    if (m_kind == scalar)
        return 1;

    return m_props.size();
}

// --------------------------------------------------------------------------
int o3skim_metadata::set(const std::string &name, const o3skim_metadata &val)
{
    if (m_kind != mapping)
    {
        O3SKIM_ERROR("Failed to set \"" << name
            << "\". The node is not a mapping")
        return -1;
    }

    m_props[name] = val;
    return 0;
}

// --------------------------------------------------------------------------
int o3skim_metadata::set(const std::string &name, o3skim_metadata &&val)
{
    if (m_kind != mapping)
    {
        O3SKIM_ERROR("Failed to set \"" << name
            << "\". The node is not a mapping")
        return -1;
    }

    m_props[name] = std::move(val);
    return 0;
}

// --------------------------------------------------------------------------
int o3skim_metadata::get(const std::string &name, o3skim_metadata &val) const
{
    const o3skim_metadata *node = this->find(name);
    if (!node)
        return -1;

    val = *node;
    return 0;
}

// --------------------------------------------------------------------------
const o3skim_metadata *o3skim_metadata::find(const std::string &name) const
{
    if (m_kind != mapping)
        return nullptr;

    auto it = m_props.find(name);
    if (it == m_props.end())
        return nullptr;

    return &it->second;
}

// --------------------------------------------------------------------------
o3skim_metadata *o3skim_metadata::find(const std::string &name)
{
    if (m_kind != mapping)
        return nullptr;

    auto it = m_props.find(name);
    if (it == m_props.end())
        return nullptr;

    return &it->second;
}

// --------------------------------------------------------------------------
int o3skim_metadata::get_names(std::vector<std::string> &names) const
{
    auto it = m_props.begin();
    auto end = m_props.end();
    for (; it != end; ++it)
        names.push_back(it->first);

    return names.empty() ? -1 : 0;
}

// --------------------------------------------------------------------------
int o3skim_metadata::has(const std::string &name) const noexcept
{
    return m_props.count(name) ? 1 : 0;
}

// --------------------------------------------------------------------------
int o3skim_metadata::remove(const std::string &name) noexcept
{
    auto it = m_props.find(name);
    if (it == m_props.end())
        return -1;

    m_props.erase(it);
    return 0;
}

// --------------------------------------------------------------------------
void o3skim_metadata::clear()
{
    m_kind = mapping;
    m_value = scalar_t();
    m_sequence.clear();
    m_props.clear();
}

// --------------------------------------------------------------------------
int o3skim_metadata::empty() const noexcept
{
    if (m_kind == scalar)
        return 0;

    if (m_kind == sequence)
        return m_sequence.empty();

    return m_props.empty();
}

// --------------------------------------------------------------------------
void o3skim_metadata::merge(const o3skim_metadata &other)
{
    if ((m_kind != mapping) || (other.m_kind != mapping))
    {
        *this = other;
        return;
    }

    auto it = other.m_props.begin();
    auto end = other.m_props.end();
    for (; it != end; ++it)
    {
        auto mine = m_props.find(it->first);
        if ((mine != m_props.end()) && mine->second.is_mapping()
            && it->second.is_mapping())
        {
            mine->second.merge(it->second);
        }
        else
        {
            m_props[it->first] = it->second;
        }
    }
}

// --------------------------------------------------------------------------
int o3skim_metadata::to_stream(std::ostream &os) const
{
    if (m_kind == scalar)
    {
        if (const std::string *pval = std::get_if<std::string>(&m_value))
            os << "\"" << *pval << "\"";
        else if (const bool *pval = std::get_if<bool>(&m_value))
            os << (*pval ? "true" : "false");
        else if (const long long *pval = std::get_if<long long>(&m_value))
            os << *pval;
        else if (const double *pval = std::get_if<double>(&m_value))
            os << *pval;
    }
    else if (m_kind == sequence)
    {
        os << "[";
        size_t n = m_sequence.size();
        for (size_t i = 0; i < n; ++i)
        {
            if (i)
                os << ", ";
            m_sequence[i].to_stream(os);
        }
        os << "]";
    }
    else
    {
        os << "{";
        auto it = m_props.begin();
        auto end = m_props.end();
        for (; it != end; ++it)
        {
            if (it != m_props.begin())
                os << ", ";
            os << it->first << ": ";
            it->second.to_stream(os);
        }
        os << "}";
    }
    return 0;
}

// --------------------------------------------------------------------------
bool operator==(const o3skim_metadata &lhs, const o3skim_metadata &rhs) noexcept
{
    if (lhs.m_kind != rhs.m_kind)
        return false;

    if (lhs.m_kind == o3skim_metadata::scalar)
        return lhs.m_value == rhs.m_value;

    if (lhs.m_kind == o3skim_metadata::sequence)
        return lhs.m_sequence == rhs.m_sequence;

    return lhs.m_props == rhs.m_props;
}

// --------------------------------------------------------------------------
std::ostream &operator<<(std::ostream &os, const o3skim_metadata &md)
{
    md.to_stream(os);
    return os;
}

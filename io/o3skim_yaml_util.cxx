#include "o3skim_yaml_util.h"
#include "o3skim_common.h"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace
{
// format a double so that it reads back as the same double. whole numbers
// keep a decimal point so they are not read back as integers
std::string format_double(double val)
{
    if (std::isnan(val))
        return ".nan";

    if (std::isinf(val))
        return val < 0.0 ? "-.inf" : ".inf";

    std::string text;
    for (int prec = 15; prec <= std::numeric_limits<double>::max_digits10; ++prec)
    {
        std::ostringstream oss;
        oss << std::setprecision(prec) << val;
        text = oss.str();
        if (std::strtod(text.c_str(), nullptr) == val)
            break;
    }

    if (text.find_first_of(".eE") == std::string::npos)
        text += ".0";

    return text;
}
}

namespace o3skim_yaml_util
{

// **************************************************************************
int get_string(const YAML::Node &node, std::string &str)
{
    if (!node.IsScalar())
        return -1;

    str = node.Scalar();
    return 0;
}

// **************************************************************************
int from_yaml(const YAML::Node &node, o3skim_metadata &md)
{
    switch (node.Type())
    {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            md = o3skim_metadata();
            return 0;

        case YAML::NodeType::Scalar:
        {
            // quoted scalars carry the non-specific tag "!"
            if (node.Tag() == "!")
            {
                md = o3skim_metadata::New(node.Scalar());
                return 0;
            }

            long long ival = 0;
            bool bval = false;
            double dval = 0.0;
            if (YAML::convert<long long>::decode(node, ival))
                md = o3skim_metadata::New(ival);
            else if (YAML::convert<bool>::decode(node, bval))
                md = o3skim_metadata::New(bval);
            else if (YAML::convert<double>::decode(node, dval))
                md = o3skim_metadata::New(dval);
            else
                md = o3skim_metadata::New(node.Scalar());
            return 0;
        }

        case YAML::NodeType::Sequence:
        {
            std::vector<o3skim_metadata> seq;
            for (const YAML::Node &item : node)
            {
                o3skim_metadata tmp;
                if (from_yaml(item, tmp))
                    return -1;
                seq.push_back(std::move(tmp));
            }
            md = o3skim_metadata::New(seq);
            return 0;
        }

        case YAML::NodeType::Map:
        {
            md = o3skim_metadata();
            for (const auto &item : node)
            {
                std::string key;
                if (get_string(item.first, key))
                {
                    O3SKIM_ERROR("Mapping keys must be scalars (line "
                        << item.first.Mark().line + 1 << ")")
                    return -1;
                }

                o3skim_metadata tmp;
                if (from_yaml(item.second, tmp))
                    return -1;

                md.set(key, std::move(tmp));
            }
            return 0;
        }
    }

    O3SKIM_ERROR("Unexpected YAML node type " << node.Type())
    return -1;
}

// **************************************************************************
int to_yaml(const o3skim_metadata &md, YAML::Emitter &out)
{
    if (md.is_scalar())
    {
        const o3skim_metadata::scalar_t &val = md.get_scalar();
        if (const std::string *pval = std::get_if<std::string>(&val))
        {
            // quote strings that would read back as another type
            YAML::Node plain(*pval);
            long long ival = 0;
            bool bval = false;
            double dval = 0.0;
            if (pval->empty() || (*pval == "~") || (*pval == "null") ||
                YAML::convert<long long>::decode(plain, ival) ||
                YAML::convert<bool>::decode(plain, bval) ||
                YAML::convert<double>::decode(plain, dval))
                out << YAML::DoubleQuoted << *pval;
            else
                out << *pval;
        }
        else if (const long long *pval = std::get_if<long long>(&val))
            out << *pval;
        else if (const bool *pval = std::get_if<bool>(&val))
            out << *pval;
        else if (const double *pval = std::get_if<double>(&val))
            out << format_double(*pval);
    }
    else if (md.is_sequence())
    {
        out << YAML::BeginSeq;
        for (const o3skim_metadata &item : md.get_sequence())
        {
            if (to_yaml(item, out))
                return -1;
        }
        out << YAML::EndSeq;
    }
    else
    {
        out << YAML::BeginMap;
        auto it = md.begin();
        auto end = md.end();
        for (; it != end; ++it)
        {
            out << YAML::Key << it->first << YAML::Value;
            if (to_yaml(it->second, out))
                return -1;
        }
        out << YAML::EndMap;
    }

    if (!out.good())
    {
        O3SKIM_ERROR("Failed to emit YAML. " << out.GetLastError())
        return -1;
    }

    return 0;
}

// **************************************************************************
int read_string(const std::string &doc, o3skim_metadata &md)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(doc);
    }
    catch (const YAML::Exception &e)
    {
        O3SKIM_ERROR("Failed to parse YAML. " << e.what())
        return -1;
    }

    return from_yaml(root, md);
}

// **************************************************************************
int write_stream(std::ostream &os, const o3skim_metadata &md)
{
    YAML::Emitter out;
    if (to_yaml(md, out))
        return -1;

    os << out.c_str() << std::endl;
    return 0;
}

// **************************************************************************
int read_metadata(const std::string &file_name, o3skim_metadata &md)
{
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(file_name);
    }
    catch (const YAML::Exception &e)
    {
        O3SKIM_ERROR("Failed to read \"" << file_name << "\". " << e.what())
        return -1;
    }

    return from_yaml(root, md);
}

// **************************************************************************
int write_metadata(const std::string &file_name, const o3skim_metadata &md)
{
    std::ofstream ofs(file_name);
    if (!ofs.good())
    {
        O3SKIM_ERROR("Failed to open \"" << file_name << "\" for writing")
        return -1;
    }

    if (write_stream(ofs, md))
    {
        O3SKIM_ERROR("Failed to write \"" << file_name << "\"")
        return -1;
    }

    ofs.close();
    if (ofs.fail())
    {
        O3SKIM_ERROR("Failed to write \"" << file_name << "\"")
        return -1;
    }

    return 0;
}

}

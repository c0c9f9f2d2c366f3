#include "o3skim_config_reader.h"
#include "o3skim_common.h"
#include "o3skim_yaml_util.h"

#include <yaml-cpp/yaml.h>

#include <set>

namespace {

// the canonical axes each variable must map
const std::set<std::string> &required_coordinates(const std::string &var)
{
    static const std::set<std::string> tco3 = {"time", "lat", "lon"};
    static const std::set<std::string> vmro3 = {"time", "lat", "lon", "plev"};
    return var == "vmro3_zm" ? vmro3 : tco3;
}

// --------------------------------------------------------------------------
int parse_metadata(const YAML::Node &node, const std::string &where,
    o3skim_metadata &md)
{
    if (!(node.IsMap() || node.IsNull()))
    {
        O3SKIM_ERROR(<< where << ": metadata must be a mapping")
        return -1;
    }

    if (o3skim_yaml_util::from_yaml(node, md))
    {
        O3SKIM_ERROR(<< where << ": failed to convert metadata")
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
int parse_variable(const YAML::Node &node, const std::string &var,
    const std::string &where, o3skim_variable_spec &spec)
{
    if (!node.IsMap())
    {
        O3SKIM_ERROR(<< where << ": the variable must be a mapping")
        return -1;
    }

    bool have_name = false;
    bool have_paths = false;
    bool have_coords = false;

    for (const auto &item : node)
    {
        std::string key;
        if (o3skim_yaml_util::get_string(item.first, key))
        {
            O3SKIM_ERROR(<< where << ": keys must be strings")
            return -1;
        }

        const YAML::Node &val = item.second;
        if (key == "name")
        {
            if (o3skim_yaml_util::get_string(val, spec.name) || spec.name.empty())
            {
                O3SKIM_ERROR(<< where << ": name must be a non-empty string")
                return -1;
            }
            have_name = true;
        }
        else if (key == "paths")
        {
            std::string path;
            if (val.IsSequence())
            {
                for (const YAML::Node &p : val)
                {
                    if (o3skim_yaml_util::get_string(p, path))
                    {
                        O3SKIM_ERROR(<< where << ": paths must be strings")
                        return -1;
                    }
                    spec.paths.push_back(path);
                }
            }
            else if (o3skim_yaml_util::get_string(val, path) == 0)
            {
                spec.paths.push_back(path);
            }

            if (spec.paths.empty())
            {
                O3SKIM_ERROR(<< where << ": paths must be a string or a"
                    " non-empty list of strings")
                return -1;
            }
            have_paths = true;
        }
        else if (key == "coordinates")
        {
            if (!val.IsMap())
            {
                O3SKIM_ERROR(<< where << ": coordinates must be a mapping")
                return -1;
            }

            for (const auto &coord : val)
            {
                std::string axis;
                std::string raw_name;
                if (o3skim_yaml_util::get_string(coord.first, axis)
                    || o3skim_yaml_util::get_string(coord.second, raw_name))
                {
                    O3SKIM_ERROR(<< where << ": coordinates must map strings"
                        " to strings")
                    return -1;
                }

                if ((axis != "time") && (axis != "lat") && (axis != "lon")
                    && (axis != "plev"))
                {
                    O3SKIM_ERROR(<< where << ": \"" << axis << "\" is not one"
                        " of the coordinates time, lat, lon or plev")
                    return -1;
                }

                spec.coordinates[axis] = raw_name;
            }
            have_coords = true;
        }
        else if (key == "metadata")
        {
            if (parse_metadata(val, where, spec.metadata))
                return -1;
        }
        else
        {
            O3SKIM_ERROR(<< where << ": unknown key \"" << key << "\"")
            return -1;
        }
    }

    if (!have_name || !have_paths || !have_coords)
    {
        O3SKIM_ERROR(<< where << ": name, paths and coordinates are required")
        return -1;
    }

    for (const std::string &axis : required_coordinates(var))
    {
        if (!spec.coordinates.count(axis))
        {
            O3SKIM_ERROR(<< where << ": the " << axis
                << " coordinate is required")
            return -1;
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
int parse_model(const YAML::Node &node, const std::string &where,
    o3skim_model_spec &spec)
{
    if (!node.IsMap())
    {
        O3SKIM_ERROR(<< where << ": the model must be a mapping")
        return -1;
    }

    for (const auto &item : node)
    {
        std::string key;
        if (o3skim_yaml_util::get_string(item.first, key))
        {
            O3SKIM_ERROR(<< where << ": keys must be strings")
            return -1;
        }

        if (key == "metadata")
        {
            if (parse_metadata(item.second, where, spec.metadata))
                return -1;
        }
        else if (key == "tco3_zm")
        {
            o3skim_variable_spec var;
            if (parse_variable(item.second, key, where + "/" + key, var))
                return -1;
            spec.tco3_zm = std::move(var);
        }
        else if (key == "vmro3_zm")
        {
            o3skim_variable_spec var;
            if (parse_variable(item.second, key, where + "/" + key, var))
                return -1;
            spec.vmro3_zm = std::move(var);
        }
        else
        {
            O3SKIM_ERROR(<< where << ": unknown variable \"" << key << "\"")
            return -1;
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
int parse_source(const YAML::Node &node, const std::string &name,
    o3skim_source_spec &spec)
{
    if (!node.IsMap())
    {
        O3SKIM_ERROR(<< name << ": the source must be a mapping")
        return -1;
    }

    spec.name = name;

    for (const auto &item : node)
    {
        std::string key;
        if (o3skim_yaml_util::get_string(item.first, key))
        {
            O3SKIM_ERROR(<< name << ": keys must be strings")
            return -1;
        }

        if (key == "metadata")
        {
            if (parse_metadata(item.second, name, spec.metadata))
                return -1;
        }
        else
        {
            o3skim_model_spec model;
            if (parse_model(item.second, name + "/" + key, model))
                return -1;
            spec.models.emplace_back(key, std::move(model));
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
int parse_configuration(const YAML::Node &root, int verbose,
    o3skim_configuration &config)
{
    config.sources.clear();

    if (root.IsNull())
    {
        O3SKIM_WARNING("The configuration is empty")
        return o3skim_error::success;
    }

    if (!root.IsMap())
    {
        O3SKIM_ERROR("The configuration must be a mapping of sources")
        return o3skim_error::config_error;
    }

    for (const auto &item : root)
    {
        std::string name;
        if (o3skim_yaml_util::get_string(item.first, name))
        {
            O3SKIM_ERROR("Source names must be strings")
            return o3skim_error::config_error;
        }

        o3skim_source_spec source;
        if (parse_source(item.second, name, source))
            return o3skim_error::config_error;

        if (verbose)
        {
            O3SKIM_STATUS("Found source " << name << " with "
                << source.models.size() << " models")
        }

        config.sources.push_back(std::move(source));
    }

    return o3skim_error::success;
}

}

// --------------------------------------------------------------------------
int o3skim_config_reader::read(o3skim_configuration &config)
{
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(this->file_name);
    }
    catch (const YAML::Exception &e)
    {
        O3SKIM_ERROR("Failed to read the configuration \"" << this->file_name
            << "\". " << e.what())
        return o3skim_error::config_error;
    }

    if (this->verbose)
    {
        O3SKIM_STATUS("Read the configuration \"" << this->file_name << "\"")
    }

    return parse_configuration(root, this->verbose, config);
}

// --------------------------------------------------------------------------
int o3skim_config_reader::parse(const std::string &doc,
    o3skim_configuration &config)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(doc);
    }
    catch (const YAML::Exception &e)
    {
        O3SKIM_ERROR("Failed to parse the configuration. " << e.what())
        return o3skim_error::config_error;
    }

    return parse_configuration(root, this->verbose, config);
}

#ifndef o3skim_configuration_h
#define o3skim_configuration_h

/// @file

#include "o3skim_config.h"
#include "o3skim_metadata.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/** Describes how to find and interpret one raw variable. paths are path
 * expressions (globs) applied in order, coordinates maps the canonical axis
 * names time, lat, lon and plev to the names used in the raw files.
 */
struct O3SKIM_EXPORT o3skim_variable_spec
{
    std::string name;
    std::vector<std::string> paths;
    std::map<std::string, std::string> coordinates;
    o3skim_metadata metadata;
};

/// The raw variables provided by one model. Either or both may be absent.
struct O3SKIM_EXPORT o3skim_model_spec
{
    std::optional<o3skim_variable_spec> tco3_zm;
    std::optional<o3skim_variable_spec> vmro3_zm;
    o3skim_metadata metadata;
};

/// An ordered list of model name, model spec pairs
using o3skim_model_spec_list =
    std::vector<std::pair<std::string, o3skim_model_spec>>;

/// A named data provider and the models it contributes
struct O3SKIM_EXPORT o3skim_source_spec
{
    std::string name;
    o3skim_metadata metadata;
    o3skim_model_spec_list models;
};

/// The validated contents of a configuration file, in file order
struct O3SKIM_EXPORT o3skim_configuration
{
    std::vector<o3skim_source_spec> sources;
};

#endif

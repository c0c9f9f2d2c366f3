#ifndef o3skim_config_reader_h
#define o3skim_config_reader_h

/// @file

#include "o3skim_config.h"
#include "o3skim_configuration.h"
#include "o3skim_property.h"
#include "o3skim_shared_object.h"

#include <string>

O3SKIM_SHARED_OBJECT_FORWARD_DECL(o3skim_config_reader)

/// Reads and validates the YAML configuration.
/**
 * The document is a mapping of source names to source mappings. A source
 * mapping holds an optional metadata mapping and one mapping per model. A
 * model mapping holds an optional metadata mapping and optional tco3_zm and
 * vmro3_zm variable mappings:
 *
 * ```yaml
 * CCMI-1:
 *   metadata: {institution: ...}
 *   CHASER:
 *     tco3_zm:
 *       name: toz
 *       paths: CCMI-1/CHASER/toz_*.nc
 *       coordinates: {time: time, lat: lat, lon: lon}
 *       metadata: {comment: ...}
 * ```
 *
 * paths is a path expression or a list of them. tco3_zm requires the time,
 * lat and lon coordinates, vmro3_zm requires plev in addition. Any other
 * shape is rejected with config_error, naming the offending entry.
 */
class O3SKIM_EXPORT o3skim_config_reader
{
public:
    static p_o3skim_config_reader New()
    { return p_o3skim_config_reader(new o3skim_config_reader); }

    ~o3skim_config_reader() = default;

    o3skim_config_reader(const o3skim_config_reader &) = delete;
    void operator=(const o3skim_config_reader &) = delete;

    /** @name file_name
     * Set the path of the configuration file.
     */
    ///@{
    O3SKIM_PROPERTY(std::string, file_name)
    ///@}

    /** @name verbose
     * Set to a non-zero value to report the sources and models found.
     */
    ///@{
    O3SKIM_PROPERTY(int, verbose)
    ///@}

    /** read and validate the configuration file. returns success or
     * config_error.
     */
    int read(o3skim_configuration &config);

    /** validate a configuration held in a string. returns success or
     * config_error.
     */
    int parse(const std::string &doc, o3skim_configuration &config);

protected:
    o3skim_config_reader() : file_name(), verbose(0) {}

private:
    std::string file_name;
    int verbose;
};

#endif

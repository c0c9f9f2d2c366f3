#ifndef o3skim_adapter_h
#define o3skim_adapter_h

/// @file

#include "o3skim_config.h"
#include "o3skim_configuration.h"
#include "o3skim_dataset.h"
#include "o3skim_deadline.h"

#include <memory>
#include <string>
#include <vector>

class o3skim_adapter;
using p_o3skim_adapter = std::shared_ptr<o3skim_adapter>;

/// Turns a raw variable into its standardized form.
/**
 * The raw files are read, attributes not on the whitelist are removed, the
 * variable and its coordinates get their canonical names, the variable is
 * averaged over longitude and everything unrelated to it is dropped. Time is
 * loaded and converted to the proleptic gregorian calendar. Subclasses name
 * the canonical variable and may convert its units.
 */
class O3SKIM_EXPORT o3skim_adapter
{
public:
    virtual ~o3skim_adapter() {}

    /// the canonical name of the variable produced
    virtual const char *get_variable_name() const = 0;

    /// the CF standard name of the variable produced
    virtual const char *get_standard_name() const = 0;

    /// the canonical axes that must be configured
    virtual const std::vector<std::string> &get_required_axes() const = 0;

    /** read and standardize the variable described by spec. reductions is
     * a combination of o3skim_standardize::lat_mean and
     * o3skim_standardize::year_mean applied after the standard form is
     * reached. returns one of the o3skim_error codes.
     */
    int standardize(const o3skim_variable_spec &spec,
        const o3skim_deadline_t &deadline, int verbose,
        p_o3skim_dataset &result, int reductions = 0) const;

protected:
    /// called after renaming. the default does nothing
    virtual int convert_units(o3skim_dataset &ds) const;
};

/// Total column ozone, zonal mean
class O3SKIM_EXPORT o3skim_tco3_adapter : public o3skim_adapter
{
public:
    const char *get_variable_name() const override { return "tco3_zm"; }

    const char *get_standard_name() const override
    { return "atmosphere_mole_content_of_ozone"; }

    const std::vector<std::string> &get_required_axes() const override;
};

/// Ozone volume mixing ratio, zonal mean. values are converted to ppmv
class O3SKIM_EXPORT o3skim_vmro3_adapter : public o3skim_adapter
{
public:
    const char *get_variable_name() const override { return "vmro3_zm"; }

    const char *get_standard_name() const override
    { return "mole_fraction_of_ozone_in_air"; }

    const std::vector<std::string> &get_required_axes() const override;

protected:
    int convert_units(o3skim_dataset &ds) const override;
};

/// A factory for adapters
class O3SKIM_EXPORT o3skim_adapter_factory
{
public:
    /** Allocate and return the adapter for the named canonical variable.
     * @param[in] var tco3_zm or vmro3_zm
     * @returns an instance of o3skim_adapter or nullptr
     */
    static p_o3skim_adapter New(const std::string &var);
};

#endif

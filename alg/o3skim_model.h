#ifndef o3skim_model_h
#define o3skim_model_h

/// @file

#include "o3skim_config.h"
#include "o3skim_configuration.h"
#include "o3skim_dataset.h"
#include "o3skim_failure.h"
#include "o3skim_metadata.h"
#include "o3skim_shared_object.h"

#include <optional>
#include <string>

O3SKIM_SHARED_OBJECT_FORWARD_DECL(o3skim_model)

/** A standardized variable. data holds the variable and its coordinates,
 * metadata the block supplied for it in the configuration.
 */
struct O3SKIM_EXPORT o3skim_variable
{
    p_o3skim_dataset data;
    o3skim_metadata metadata;
};

/// The standardized variables of one experiment.
/**
 * Either variable may be absent, a model holding none is valid. Longitude
 * is never a dimension of a standardized variable.
 */
class O3SKIM_EXPORT o3skim_model
{
public:
    static p_o3skim_model New()
    { return p_o3skim_model(new o3skim_model); }

    /** build a model from its configuration. each variable is standardized
     * inside its own containment boundary, one failing does not prevent the
     * other from loading. the failures are appended to failures. the load
     * timeout in seconds applies to the whole model, 0 means no limit.
     * reductions selects the optional reductions, see
     * o3skim_adapter::standardize. returns success, the model may hold no
     * variables.
     */
    static int build(const std::string &name, const o3skim_model_spec &spec,
        double load_timeout, int verbose, p_o3skim_model &model,
        o3skim_failure_list &failures, int reductions = 0);

    ~o3skim_model() = default;

    o3skim_model(const o3skim_model &) = delete;
    void operator=(const o3skim_model &) = delete;

    /// @name variables
    ///@{
    const std::optional<o3skim_variable> &get_tco3_zm() const
    { return m_tco3_zm; }

    void set_tco3_zm(const o3skim_variable &var) { m_tco3_zm = var; }

    const std::optional<o3skim_variable> &get_vmro3_zm() const
    { return m_vmro3_zm; }

    void set_vmro3_zm(const o3skim_variable &var) { m_vmro3_zm = var; }

    /// get a variable by its canonical name, nullptr if absent
    const o3skim_variable *get_variable(const std::string &name) const;

    /// get the number of variables present
    unsigned int get_number_of_variables() const;
    ///@}

    /// access the model level metadata
    o3skim_metadata &get_metadata() { return m_metadata; }
    const o3skim_metadata &get_metadata() const { return m_metadata; }

protected:
    o3skim_model() = default;

private:
    std::optional<o3skim_variable> m_tco3_zm;
    std::optional<o3skim_variable> m_vmro3_zm;
    o3skim_metadata m_metadata;
};

#endif

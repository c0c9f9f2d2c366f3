#include "o3skim_model.h"
#include "o3skim_adapter.h"
#include "o3skim_common.h"

namespace {

// standardize one variable. the result is empty on failure
std::optional<o3skim_variable> build_variable(const std::string &model_name,
    const std::string &var_name, const o3skim_variable_spec &spec,
    const o3skim_deadline_t &deadline, int reductions, int verbose,
    o3skim_failure_list &failures)
{
    return o3skim_contain(model_name + "/" + var_name,
        "Failed to load " + var_name, std::optional<o3skim_variable>(),
        [&](std::optional<o3skim_variable> &result) -> int
        {
            p_o3skim_adapter adapter = o3skim_adapter_factory::New(var_name);
            if (!adapter)
                return o3skim_error::model_load_error;

            o3skim_variable var;
            int status = adapter->standardize(spec, deadline, verbose,
                var.data, reductions);
            if (status)
                return status;

            var.metadata = spec.metadata;
            result = std::move(var);
            return o3skim_error::success;
        },
        failures);
}

}

// --------------------------------------------------------------------------
int o3skim_model::build(const std::string &name, const o3skim_model_spec &spec,
    double load_timeout, int verbose, p_o3skim_model &model,
    o3skim_failure_list &failures, int reductions)
{
    o3skim_deadline_t deadline = o3skim_make_deadline(load_timeout);

    model = o3skim_model::New();
    model->m_metadata = spec.metadata;

    if (spec.tco3_zm)
    {
        model->m_tco3_zm = build_variable(name, "tco3_zm", *spec.tco3_zm,
            deadline, reductions, verbose, failures);
    }

    if (spec.vmro3_zm)
    {
        model->m_vmro3_zm = build_variable(name, "vmro3_zm", *spec.vmro3_zm,
            deadline, reductions, verbose, failures);
    }

    if (verbose)
    {
        O3SKIM_STATUS("Model " << name << " loaded "
            << model->get_number_of_variables() << " variables")
    }

    return o3skim_error::success;
}

// --------------------------------------------------------------------------
const o3skim_variable *o3skim_model::get_variable(const std::string &name) const
{
    if ((name == "tco3_zm") && m_tco3_zm)
        return &*m_tco3_zm;
    else if ((name == "vmro3_zm") && m_vmro3_zm)
        return &*m_vmro3_zm;
    return nullptr;
}

// --------------------------------------------------------------------------
unsigned int o3skim_model::get_number_of_variables() const
{
    return (m_tco3_zm ? 1 : 0) + (m_vmro3_zm ? 1 : 0);
}

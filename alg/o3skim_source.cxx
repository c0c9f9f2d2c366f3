#include "o3skim_source.h"
#include "o3skim_common.h"
#include "o3skim_file_util.h"
#include "o3skim_thread_pool.h"

#include <algorithm>
#include <functional>
#include <future>

namespace {

// the outcome of building one model
struct model_result
{
    p_o3skim_model model;
    o3skim_failure_list failures;
};

using model_task_t = std::packaged_task<model_result()>;
using model_thread_pool_t = o3skim_thread_pool<model_task_t, model_result>;

// --------------------------------------------------------------------------
model_result load_model(const std::string &source_name,
    const std::string &model_name, const o3skim_model_spec &spec,
    double load_timeout, int reductions, int verbose)
{
    model_result res;
    std::string what = source_name + "/" + model_name;

    res.model = o3skim_contain(what, "Error when loading model",
        p_o3skim_model(), [&](p_o3skim_model &model) -> int
        {
            int status = o3skim_model::build(model_name, spec,
                load_timeout, verbose, model, res.failures, reductions);
            if (status)
                return status;

            if (model->get_number_of_variables() == 0)
            {
                O3SKIM_ERROR("None of the variables of " << what << " loaded")
                return o3skim_error::model_load_error;
            }

            return o3skim_error::success;
        },
        res.failures);

    return res;
}

}

// --------------------------------------------------------------------------
int o3skim_source::load(const o3skim_source_spec &spec)
{
    m_name = spec.name;
    m_metadata = spec.metadata;
    m_models.clear();
    m_failures.clear();

    size_t n_models = spec.models.size();

    std::vector<model_result> results;
    results.reserve(n_models);

    if ((this->n_threads != 1) && (n_models > 1))
    {
        int n_threads = this->n_threads;
        if (n_threads > 0)
            n_threads = std::min<size_t>(n_threads, n_models);

        model_thread_pool_t pool(n_threads, this->verbose > 1);

        for (size_t i = 0; i < n_models; ++i)
        {
            model_task_t task(std::bind(load_model, std::cref(m_name),
                std::cref(spec.models[i].first), std::cref(spec.models[i].second),
                this->load_timeout, this->reductions, this->verbose));

            pool.push_task(task);
        }

        pool.wait_all(results);
    }
    else
    {
        for (size_t i = 0; i < n_models; ++i)
        {
            results.push_back(load_model(m_name, spec.models[i].first,
                spec.models[i].second, this->load_timeout, this->reductions,
                this->verbose));
        }
    }

    for (size_t i = 0; i < n_models; ++i)
    {
        m_failures.insert(m_failures.end(), results[i].failures.begin(),
            results[i].failures.end());

        if (results[i].model)
            m_models.emplace_back(spec.models[i].first, results[i].model);
    }

    if (this->verbose)
    {
        O3SKIM_STATUS("Source " << m_name << " loaded " << m_models.size()
            << " of " << n_models << " models")
    }

    return o3skim_error::success;
}

// --------------------------------------------------------------------------
std::vector<std::string> o3skim_source::get_models() const
{
    std::vector<std::string> names;
    size_t n_models = m_models.size();
    for (size_t i = 0; i < n_models; ++i)
        names.push_back(m_models[i].first);
    return names;
}

// --------------------------------------------------------------------------
int o3skim_source::get_model(const std::string &name,
    const_p_o3skim_model &model) const
{
    auto it = std::find_if(m_models.begin(), m_models.end(),
        [&name](const std::pair<std::string, p_o3skim_model> &elem)
        { return elem.first == name; });

    if (it == m_models.end())
        return o3skim_error::not_found;

    model = it->second;
    return o3skim_error::success;
}

// --------------------------------------------------------------------------
int o3skim_source::skim(const std::string &output_root,
    const std::string &groupby, o3skim_skim_report &report) const
{
    int status = o3skim_error::success;

    size_t n_models = m_models.size();
    for (size_t i = 0; i < n_models; ++i)
    {
        const std::string &model_name = m_models[i].first;

        std::string output_dir = o3skim_file_util::join(output_root,
            m_name + "_" + model_name);

        if (o3skim_file_util::make_directories(output_dir))
        {
            O3SKIM_ERROR("Failed to create the output directory \""
                << output_dir << "\"")
            status = o3skim_error::output_dir_error;
            continue;
        }

        if (this->verbose)
        {
            O3SKIM_STATUS("Skimming data from \"" << output_dir << "\"")
        }

        o3skim_metadata md(m_metadata);
        md.merge(m_models[i].second->get_metadata());

        p_o3skim_skim_engine engine = o3skim_skim_engine::New();
        engine->set_verbose(this->verbose > 1);

        int ierr = engine->skim(m_models[i].second, groupby, output_dir,
            md, report);

        if (ierr == o3skim_error::config_error)
            return ierr;

        if (ierr)
        {
            O3SKIM_WARNING("Some files of " << m_name << "/" << model_name
                << " were not written. " << o3skim_error::name(ierr))
        }
    }

    return status;
}

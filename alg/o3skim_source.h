#ifndef o3skim_source_h
#define o3skim_source_h

/// @file

#include "o3skim_config.h"
#include "o3skim_configuration.h"
#include "o3skim_failure.h"
#include "o3skim_metadata.h"
#include "o3skim_model.h"
#include "o3skim_property.h"
#include "o3skim_shared_object.h"
#include "o3skim_skim_engine.h"

#include <string>
#include <utility>
#include <vector>

O3SKIM_SHARED_OBJECT_FORWARD_DECL(o3skim_source)

/// A named data provider and the models loaded from it.
/**
 * Each model is built inside a containment boundary. A model that fails, or
 * loads none of its variables, is reported, recorded in the failure list and
 * left out. The others are kept in configuration order. When more than one
 * thread is requested the models are built on a thread pool, the result is
 * the same as building them one after the other.
 */
class O3SKIM_EXPORT o3skim_source
{
public:
    static p_o3skim_source New()
    { return p_o3skim_source(new o3skim_source); }

    ~o3skim_source() = default;

    o3skim_source(const o3skim_source &) = delete;
    void operator=(const o3skim_source &) = delete;

    /** @name verbose
     * Set the verbosity level. 1 reports progress, 2 reports the details.
     */
    ///@{
    O3SKIM_PROPERTY(int, verbose)
    ///@}

    /** @name n_threads
     * Set the number of threads used to build the models. 1 builds them on
     * the calling thread, -1 uses one thread per core.
     */
    ///@{
    O3SKIM_PROPERTY(int, n_threads)
    ///@}

    /** @name load_timeout
     * Set the number of seconds each model may take to load. 0 means no
     * limit.
     */
    ///@{
    O3SKIM_PROPERTY(double, load_timeout)
    ///@}

    /** @name reductions
     * Set the optional reductions applied to every variable. A combination
     * of o3skim_standardize::lat_mean and o3skim_standardize::year_mean, 0
     * applies none.
     */
    ///@{
    O3SKIM_PROPERTY(int, reductions)
    ///@}

    /** build the models described by spec. model failures are contained,
     * the return is success.
     */
    int load(const o3skim_source_spec &spec);

    /// get the name of the source
    const std::string &get_name() const { return m_name; }

    /// get the source metadata
    const o3skim_metadata &get_metadata() const { return m_metadata; }

    /// get the names of the loaded models in configuration order
    std::vector<std::string> get_models() const;

    /** get the named model. returns not_found if the model was not loaded,
     * either because it was never configured or because it failed.
     */
    int get_model(const std::string &name, const_p_o3skim_model &model) const;

    /// get the failures recorded while loading
    const o3skim_failure_list &get_failures() const { return m_failures; }

    /** write every model into \<output_root\>/\<source\>_\<model\>. the
     * directories are created as needed. the metadata of each model is the
     * source metadata merged with the model metadata. returns
     * output_dir_error if a directory can't be created, config_error if
     * groupby is not known and success otherwise. files that could not be
     * written are reported in report.
     */
    int skim(const std::string &output_root, const std::string &groupby,
        o3skim_skim_report &report) const;

protected:
    o3skim_source() : verbose(0), n_threads(1), load_timeout(0.0),
        reductions(0) {}

private:
    int verbose;
    int n_threads;
    double load_timeout;
    int reductions;

    std::string m_name;
    o3skim_metadata m_metadata;
    std::vector<std::pair<std::string, p_o3skim_model>> m_models;
    o3skim_failure_list m_failures;
};

#endif

#include "o3skim_common.h"
#include "o3skim_config_reader.h"
#include "o3skim_configuration.h"
#include "o3skim_model.h"
#include "o3skim_source.h"
#include "o3skim_system_interface.h"
#include "o3skim_test_util.h"

#include <algorithm>
#include <string>
#include <vector>

namespace {

// returns true if a failure was recorded for the named object
bool has_failure(const o3skim_failure_list &failures, const std::string &what)
{
    return std::any_of(failures.begin(), failures.end(),
        [&](const o3skim_failure &f) { return f.what == what; });
}

}

int main(int argc, char **argv)
{
    o3skim_system_interface::set_stack_trace_on_error();

    std::string dir = argc > 1 ? argv[1] : "test_failure_isolation";
    std::string data_dir = dir + "/data";

    if (o3skim_test_util::make_test_directory(dir) ||
        o3skim_test_util::write_model(data_dir))
        return -1;

    std::string doc = "SRC:\n" +
        o3skim_test_util::model_config("partial", data_dir) +
        o3skim_test_util::model_config("broken", data_dir, true, false) +
        o3skim_test_util::model_config("good", data_dir);

    o3skim_configuration config;
    p_o3skim_config_reader reader = o3skim_config_reader::New();
    if (reader->parse(doc, config) || (config.sources[0].models.size() != 3))
        return -1;

    o3skim_source_spec &spec = config.sources[0];

    // partial: tco3 files are missing, vmro3 is fine
    spec.models[0].second.tco3_zm->paths = {data_dir + "/missing_*.nc"};

    // broken: tco3 names a variable that is not in the files
    spec.models[1].second.tco3_zm->name = "o3";

    p_o3skim_source source = o3skim_source::New();
    source->set_verbose(1);
    if (source->load(spec))
        return -1;

    if (source->get_models() != std::vector<std::string>({"partial", "good"}))
    {
        O3SKIM_ERROR("loaded " << source->get_models())
        return -1;
    }

    const o3skim_failure_list &failures = source->get_failures();
    if (!has_failure(failures, "partial/tco3_zm") ||
        !has_failure(failures, "broken/tco3_zm") ||
        !has_failure(failures, "SRC/broken") ||
        has_failure(failures, "partial/vmro3_zm") ||
        has_failure(failures, "SRC/partial") ||
        has_failure(failures, "good/tco3_zm") ||
        has_failure(failures, "good/vmro3_zm"))
    {
        O3SKIM_ERROR("unexpected failures")
        for (const o3skim_failure &f : failures)
            O3SKIM_ERROR(<< f.what << " " << o3skim_error::name(f.code)
                << " " << f.message)
        return -1;
    }

    const_p_o3skim_model model;
    if ((source->get_model("broken", model) != o3skim_error::not_found) ||
        (source->get_model("missing", model) != o3skim_error::not_found))
    {
        O3SKIM_ERROR("a model that did not load was found")
        return -1;
    }

    if (source->get_model("partial", model) || model->get_tco3_zm() ||
        !model->get_vmro3_zm() || (model->get_number_of_variables() != 1))
    {
        O3SKIM_ERROR("partial should hold vmro3_zm only")
        return -1;
    }

    if (source->get_model("good", model) ||
        (model->get_number_of_variables() != 2))
    {
        O3SKIM_ERROR("good should hold both variables")
        return -1;
    }

    // a model with no variables is built but holds nothing
    o3skim_model_spec empty;
    p_o3skim_model built;
    o3skim_failure_list build_failures;
    if (o3skim_model::build("empty", empty, 0.0, 0, built, build_failures) ||
        !built || (built->get_number_of_variables() != 0) ||
        !build_failures.empty())
    {
        O3SKIM_ERROR("building an empty model failed")
        return -1;
    }

    // the load timeout applies
    o3skim_source_spec slow;
    slow.name = "SLOW";
    slow.models.push_back(spec.models[2]);

    p_o3skim_source timed = o3skim_source::New();
    timed->set_load_timeout(1.0e-9);
    if (timed->load(slow) || !timed->get_models().empty() ||
        !has_failure(timed->get_failures(), "SLOW/good"))
    {
        O3SKIM_ERROR("the load timeout was not applied")
        return -1;
    }

    return 0;
}

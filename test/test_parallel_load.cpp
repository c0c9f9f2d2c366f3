#include "o3skim_common.h"
#include "o3skim_config_reader.h"
#include "o3skim_configuration.h"
#include "o3skim_source.h"
#include "o3skim_system_interface.h"
#include "o3skim_test_util.h"

#include <string>
#include <vector>

namespace {

// returns 0 if the two datasets hold the same values
int compare(const const_p_o3skim_dataset &a, const const_p_o3skim_dataset &b)
{
    std::vector<std::string> names = a->get_coordinate_names();
    std::vector<std::string> vars = a->get_variable_names();
    names.insert(names.end(), vars.begin(), vars.end());

    for (const std::string &name : names)
    {
        const_p_o3skim_array aa = a->get_array(name);
        const_p_o3skim_array ba = b->get_array(name);
        if (!ba || (aa->get_shape() != ba->get_shape()) ||
            (aa->get_values() != ba->get_values()) ||
            (aa->get_attributes() != ba->get_attributes()))
        {
            O3SKIM_ERROR("\"" << name << "\" differs")
            return -1;
        }
    }

    return 0;
}

}

int main(int argc, char **argv)
{
    o3skim_system_interface::set_stack_trace_on_error();

    std::string dir = argc > 1 ? argv[1] : "test_parallel_load";
    std::string data_dir = dir + "/data";

    if (o3skim_test_util::make_test_directory(dir) ||
        o3skim_test_util::write_model(data_dir))
        return -1;

    std::string doc = "SRC:\n";
    std::vector<std::string> names = {"m0", "m1", "m2", "m3", "m4", "m5"};
    for (size_t i = 0; i < names.size(); ++i)
        doc += o3skim_test_util::model_config(names[i], data_dir, true, i % 3 != 1);

    o3skim_configuration config;
    p_o3skim_config_reader reader = o3skim_config_reader::New();
    if (reader->parse(doc, config))
        return -1;

    p_o3skim_source serial = o3skim_source::New();
    if (serial->load(config.sources[0]))
        return -1;

    p_o3skim_source threaded = o3skim_source::New();
    threaded->set_n_threads(4);
    if (threaded->load(config.sources[0]))
        return -1;

    // models are kept in configuration order
    if ((serial->get_models() != names) || (threaded->get_models() != names) ||
        !threaded->get_failures().empty())
    {
        O3SKIM_ERROR("serial loaded " << serial->get_models()
            << " threaded loaded " << threaded->get_models())
        return -1;
    }

    for (const std::string &name : names)
    {
        const_p_o3skim_model sm;
        const_p_o3skim_model tm;
        if (serial->get_model(name, sm) || threaded->get_model(name, tm) ||
            (sm->get_number_of_variables() != tm->get_number_of_variables()) ||
            (sm->get_metadata() != tm->get_metadata()))
        {
            O3SKIM_ERROR("model " << name << " differs")
            return -1;
        }

        const char *vars[] = {"tco3_zm", "vmro3_zm"};
        for (const char *var : vars)
        {
            const o3skim_variable *sv = sm->get_variable(var);
            const o3skim_variable *tv = tm->get_variable(var);
            if ((!sv != !tv) || (sv && compare(sv->data, tv->data)))
            {
                O3SKIM_ERROR(<< name << "/" << var << " differs")
                return -1;
            }
        }
    }

    return 0;
}

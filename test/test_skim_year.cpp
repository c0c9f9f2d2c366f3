#include "o3skim_common.h"
#include "o3skim_config_reader.h"
#include "o3skim_configuration.h"
#include "o3skim_file_util.h"
#include "o3skim_skim_engine.h"
#include "o3skim_source.h"
#include "o3skim_system_interface.h"
#include "o3skim_test_util.h"

#include <string>
#include <vector>

int main(int argc, char **argv)
{
    o3skim_system_interface::set_stack_trace_on_error();

    std::string dir = argc > 1 ? argv[1] : "test_skim_year";
    std::string data_dir = dir + "/data";
    std::string out_dir = dir + "/output";

    if (o3skim_test_util::make_test_directory(dir) ||
        o3skim_test_util::write_model(data_dir))
        return -1;

    // tco3 only, no metadata anywhere but the model
    std::string doc = "SRC:\n" +
        o3skim_test_util::model_config("model", data_dir, true, false);

    o3skim_configuration config;
    p_o3skim_config_reader reader = o3skim_config_reader::New();
    if (reader->parse(doc, config))
        return -1;

    p_o3skim_source source = o3skim_source::New();
    if (source->load(config.sources[0]) || !source->get_failures().empty())
        return -1;

    o3skim_skim_report report;
    if (source->skim(out_dir, "year", report) || !report.failed.empty())
    {
        O3SKIM_ERROR("skim failed")
        return -1;
    }

    std::string model_dir = out_dir + "/SRC_model";
    std::vector<std::string> files;
    if (o3skim_file_util::expand_paths({model_dir + "/tco3_zm_*.nc"}, files) ||
        (files.size() != 25) || (report.written.size() != 26))
    {
        O3SKIM_ERROR("skim wrote " << files)
        return -1;
    }

    const_p_o3skim_model model;
    if (source->get_model("model", model))
        return -1;

    const_p_o3skim_dataset mem = model->get_tco3_zm()->data;
    const std::vector<double> &t_mem = mem->get_coordinate("time")->get_values();
    const std::vector<double> &v_mem = mem->get_variable("tco3_zm")->get_values();

    // one record per year, together they hold every step in order
    unsigned long n_lat = 0;
    mem->get_dimension_size("lat", n_lat);

    for (long y = 0; y < 25; ++y)
    {
        std::string file_name = model_dir + "/" +
            o3skim_skim_engine::get_file_name("tco3_zm",
                std::to_string(2000 + y) + "-" + std::to_string(2001 + y));

        p_o3skim_dataset ds;
        if (o3skim_test_util::read_file(file_name, ds))
            return -1;

        const std::vector<double> &t = ds->get_coordinate("time")->get_values();
        const std::vector<double> &v = ds->get_variable("tco3_zm")->get_values();
        if ((t.size() != 1) || (v.size() != n_lat) ||
            !o3skim_test_util::equal(t[0], t_mem[y]))
        {
            O3SKIM_ERROR("\"" << file_name << "\" holds " << t.size() << " steps")
            return -1;
        }

        for (unsigned long j = 0; j < n_lat; ++j)
        {
            if (!o3skim_test_util::equal(v[j], v_mem[y*n_lat + j]))
            {
                O3SKIM_ERROR("\"" << file_name << "\" tco3_zm[" << j << "] = "
                    << v[j] << " expected " << v_mem[y*n_lat + j])
                return -1;
            }
        }
    }

    return 0;
}

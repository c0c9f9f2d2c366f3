#include "o3skim_skim_engine.h"
#include "o3skim_calendar_util.h"
#include "o3skim_cf_writer.h"
#include "o3skim_common.h"
#include "o3skim_file_util.h"
#include "o3skim_yaml_util.h"

// --------------------------------------------------------------------------
std::string o3skim_skim_engine::get_file_name(const std::string &var,
    const std::string &label)
{
    if (label.empty())
        return var + ".nc";

    return var + "_" + label + ".nc";
}

// --------------------------------------------------------------------------
int o3skim_skim_engine::skim(const std::string &var_name,
    const o3skim_variable &var, const std::string &groupby,
    const std::string &output_dir, o3skim_skim_report &report)
{
    const_p_o3skim_dataset ds = var.data;

    const_p_o3skim_array time;
    if (!ds || !(time = ds->get_coordinate("time")))
    {
        O3SKIM_ERROR(<< var_name << " has no time coordinate")
        report.failed.push_back(var_name);
        return o3skim_error::model_load_error;
    }

    if (!time->is_loaded())
    {
        O3SKIM_ERROR("The time coordinate of " << var_name
            << " must be loaded before it is partitioned")
        report.failed.push_back(var_name);
        return o3skim_error::model_load_error;
    }

    std::string units;
    std::string calendar;
    time->get_encoding().get("units", units);
    time->get_encoding().get("calendar", calendar);

    o3skim_calendar_util::p_partition_iterator it =
        o3skim_calendar_util::partition_iterator_factory::New(groupby);

    if (!it)
        return o3skim_error::config_error;

    if (it->initialize(time->get_values(), units, calendar))
    {
        O3SKIM_ERROR("Failed to partition the time axis of " << var_name)
        report.failed.push_back(var_name);
        return o3skim_error::model_load_error;
    }

    int status = o3skim_error::success;
    o3skim_calendar_util::partition part;
    while (*it)
    {
        if (it->get_next_partition(part))
        {
            O3SKIM_ERROR("Failed to get the next partition of " << var_name)
            report.failed.push_back(var_name);
            return o3skim_error::model_load_error;
        }

        std::string file_name = o3skim_file_util::join(output_dir,
            o3skim_skim_engine::get_file_name(var_name, part.label));

        // select the time steps of the partition
        p_o3skim_dataset slice = o3skim_dataset::New();
        slice->get_attributes() = ds->get_attributes();

        int ierr = 0;
        const o3skim_dataset::array_map_t *maps[] =
            {&ds->get_coordinates(), &ds->get_variables()};
        for (int i = 0; !ierr && (i < 2); ++i)
        {
            auto ait = maps[i]->begin();
            auto aend = maps[i]->end();
            for (; !ierr && (ait != aend); ++ait)
            {
                p_o3skim_array arr = ait->second;
                if (arr->has_dim("time"))
                {
                    p_o3skim_array steps;
                    if ((ierr = arr->take("time", part.indices, steps)))
                        break;
                    arr = steps;
                }

                if (i == 0)
                    slice->set_coordinate(ait->first, arr);
                else
                    slice->set_variable(ait->first, arr);
            }
        }

        p_o3skim_cf_writer writer = o3skim_cf_writer::New();
        writer->set_file_name(file_name);
        writer->set_verbose(this->verbose);

        if (ierr || writer->write(slice))
        {
            O3SKIM_ERROR("Failed to write \"" << file_name << "\"")
            report.failed.push_back(file_name);
            status = o3skim_error::io_write_error;
            continue;
        }

        report.written.push_back(file_name);
    }

    return status;
}

// --------------------------------------------------------------------------
int o3skim_skim_engine::skim(const const_p_o3skim_model &model,
    const std::string &groupby, const std::string &output_dir,
    const o3skim_metadata &metadata, o3skim_skim_report &report)
{
    if (!o3skim_calendar_util::partition_iterator_factory::New(groupby))
    {
        O3SKIM_ERROR("groupby must be one of none, year or decade, not \""
            << groupby << "\"")
        return o3skim_error::config_error;
    }

    o3skim_metadata md(metadata);

    int status = o3skim_error::success;
    const char *var_names[] = {"tco3_zm", "vmro3_zm"};
    for (const char *var_name : var_names)
    {
        const o3skim_variable *var = model->get_variable(var_name);
        if (!var)
            continue;

        if (this->verbose)
        {
            O3SKIM_STATUS("Skimming " << var_name << " by " << groupby
                << " into \"" << output_dir << "\"")
        }

        int ierr = this->skim(var_name, *var, groupby, output_dir, report);
        if (ierr)
            status = ierr;

        if (var->metadata)
        {
            o3skim_metadata var_md;
            var_md.set(var_name, var->metadata);
            md.merge(var_md);
        }
    }

    if (md)
    {
        std::string file_name =
            o3skim_file_util::join(output_dir, "metadata.yaml");

        if (o3skim_yaml_util::write_metadata(file_name, md))
        {
            report.failed.push_back(file_name);
            return o3skim_error::io_write_error;
        }

        report.written.push_back(file_name);
    }

    return status;
}

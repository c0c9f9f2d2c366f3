#include "o3skim_cf_writer.h"
#include "o3skim_common.h"
#include "o3skim_config_reader.h"
#include "o3skim_configuration.h"
#include "o3skim_netcdf_util.h"
#include "o3skim_source.h"
#include "o3skim_system_interface.h"
#include "o3skim_test_util.h"

#include <netcdf.h>

#include <string>
#include <vector>

namespace {

// compare an array read back from a file to the array that was written.
// the values held in memory are the values stored so they must match exactly
int compare(const std::string &name, const const_p_o3skim_array &written,
    const const_p_o3skim_array &read)
{
    if (!read || (read->get_dims() != written->get_dims()) ||
        (read->get_shape() != written->get_shape()))
    {
        O3SKIM_ERROR(<< name << " was not read back with the same shape")
        return -1;
    }

    const std::vector<double> &a = written->get_values();
    const std::vector<double> &b = read->get_values();
    size_t n = a.size();
    for (size_t i = 0; i < n; ++i)
    {
        if (a[i] != b[i])
        {
            O3SKIM_ERROR(<< name << "[" << i << "] = " << b[i]
                << " expected " << a[i])
            return -1;
        }
    }

    if (read->get_attributes() != written->get_attributes())
    {
        O3SKIM_ERROR(<< name << " attributes " << read->get_attributes()
            << " expected " << written->get_attributes())
        return -1;
    }

    if (read->get_type() != written->get_type())
    {
        O3SKIM_ERROR(<< name << " was stored with the wrong type")
        return -1;
    }

    return 0;
}

// skim and compare the files to the model
int skim_and_compare(const const_p_o3skim_source &source,
    const std::string &out_dir)
{
    o3skim_skim_report report;
    if (source->skim(out_dir, "none", report) || !report.failed.empty() ||
        (report.written.size() != 3))
    {
        O3SKIM_ERROR("skim failed")
        return -1;
    }

    const_p_o3skim_model model;
    if (source->get_model("model", model))
        return -1;

    const char *vars[] = {"tco3_zm", "vmro3_zm"};
    for (const char *var_name : vars)
    {
        p_o3skim_dataset ds;
        std::string file_name = out_dir + "/src_model/" + var_name + ".nc";
        if (o3skim_test_util::read_file(file_name, ds))
            return -1;

        const_p_o3skim_dataset mem = model->get_variable(var_name)->data;

        std::vector<std::string> names = mem->get_coordinate_names();
        names.push_back(var_name);
        for (const std::string &name : names)
        {
            if (compare(name, mem->get_array(name), ds->get_array(name)))
                return -1;
        }

        if (ds->get_coordinate("time")->get_encoding() !=
            mem->get_coordinate("time")->get_encoding())
        {
            O3SKIM_ERROR("the time encoding of " << var_name << " is "
                << ds->get_coordinate("time")->get_encoding())
            return -1;
        }
    }

    return 0;
}

}

int main(int argc, char **argv)
{
    o3skim_system_interface::set_stack_trace_on_error();

    std::string dir = argc > 1 ? argv[1] : "test_skim_roundtrip";
    std::string data_dir = dir + "/data";
    std::string out_dir = dir + "/output";

    if (o3skim_test_util::make_test_directory(dir) ||
        o3skim_test_util::write_model(data_dir))
        return -1;

    std::string doc = "src:\n" + o3skim_test_util::model_config("model", data_dir);

    o3skim_configuration config;
    p_o3skim_config_reader reader = o3skim_config_reader::New();
    if (reader->parse(doc, config))
        return -1;

    p_o3skim_source source = o3skim_source::New();
    if (source->load(config.sources[0]))
        return -1;

    // writing a second time overwrites with the same content
    if (skim_and_compare(source, out_dir) || skim_and_compare(source, out_dir))
        return -1;

    // appending data of a different shape fails
    std::string file_name = out_dir + "/src_model/tco3_zm.nc";

    p_o3skim_dataset bad = o3skim_dataset::New();
    bad->set_coordinate("lat", o3skim_array::New({"lat"}, {2}, {-45.0, 45.0}));

    p_o3skim_cf_writer writer = o3skim_cf_writer::New();
    writer->set_file_name(file_name);
    if (writer->write(bad) != o3skim_error::io_write_error)
    {
        O3SKIM_ERROR("a dimension length mismatch was not detected")
        return -1;
    }

    // a variable with other dimensions fails
    bad = o3skim_dataset::New();
    bad->set_variable("tco3_zm", o3skim_array::New({"lat"}, {3}, {1.0, 2.0, 3.0}));
    if (writer->write(bad) != o3skim_error::io_write_error)
    {
        O3SKIM_ERROR("a dimension mismatch was not detected")
        return -1;
    }

    // attributes written through a borrowed file id leave the file open
    o3skim_netcdf_util::netcdf_handle fh;
    if (fh.create(dir + "/attributes.nc", NC_CLOBBER|NC_NETCDF4))
        return -1;

    o3skim_metadata atts;
    atts.set("units", std::string("DU"));
    atts.set("scale_factor", 2.0);

    o3skim_metadata more;
    more.set("comment", std::string("written through the handle"));

    int file_id = fh.get();
    o3skim_metadata read;
    std::string units, comment;
    double scale_factor = 0.0;
    if (o3skim_netcdf_util::write_attributes(file_id, NC_GLOBAL, atts) ||
        !fh || (fh.get() != file_id) ||
        o3skim_netcdf_util::write_attributes(fh, NC_GLOBAL, more) ||
        o3skim_netcdf_util::read_attributes(fh, NC_GLOBAL, read) ||
        read.get("units", units) || (units != "DU") ||
        read.get("scale_factor", scale_factor) || (scale_factor != 2.0) ||
        read.get("comment", comment) || (comment != "written through the handle"))
    {
        O3SKIM_ERROR("attributes written through the file id were lost " << read)
        return -1;
    }

    if (fh.close())
    {
        O3SKIM_ERROR("the file was closed by the attribute writer")
        return -1;
    }

    return 0;
}

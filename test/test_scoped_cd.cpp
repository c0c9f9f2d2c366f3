#include "o3skim_common.h"
#include "o3skim_file_util.h"

#include <stdexcept>
#include <string>

namespace {

// throw from inside the directory
void throw_inside(const std::string &dir)
{
    o3skim_file_util::scoped_cd cd(dir);
    throw std::runtime_error("leaving " + dir);
}

}

int main(int argc, char **argv)
{
    std::string dir = argc > 1 ? argv[1] : "test_scoped_cd_dir";

    std::string start;
    if (o3skim_file_util::get_current_directory(start) ||
        o3skim_file_util::make_directories(dir + PATH_SEP "nested"))
    {
        O3SKIM_ERROR("failed to set up the test")
        return -1;
    }

    // normal exit
    {
        o3skim_file_util::scoped_cd cd(dir);
        std::string inside;
        if (!cd.good() || o3skim_file_util::get_current_directory(inside) ||
            (inside == start) || !o3skim_file_util::file_exists("nested"))
        {
            O3SKIM_ERROR("failed to enter \"" << dir << "\"")
            return -1;
        }

        // nesting restores the enclosing directory
        {
            o3skim_file_util::scoped_cd cd2("nested");
            if (!cd2.good())
            {
                O3SKIM_ERROR("failed to enter the nested directory")
                return -1;
            }
        }

        std::string after;
        o3skim_file_util::get_current_directory(after);
        if (after != inside)
        {
            O3SKIM_ERROR("the nested scope restored \"" << after
                << "\" not \"" << inside << "\"")
            return -1;
        }
    }

    std::string cwd;
    o3skim_file_util::get_current_directory(cwd);
    if (cwd != start)
    {
        O3SKIM_ERROR("the directory was not restored after a normal exit")
        return -1;
    }

    // exceptional exit
    try
    {
        throw_inside(dir);
    }
    catch (const std::runtime_error &e)
    {
        o3skim_file_util::get_current_directory(cwd);
        if (cwd != start)
        {
            O3SKIM_ERROR("the directory was not restored after " << e.what())
            return -1;
        }
    }

    // a missing directory is not entered
    {
        o3skim_file_util::scoped_cd cd(dir + PATH_SEP "does_not_exist");
        o3skim_file_util::get_current_directory(cwd);
        if (cd.good() || (cwd != start))
        {
            O3SKIM_ERROR("a missing directory was entered")
            return -1;
        }
    }

    return 0;
}

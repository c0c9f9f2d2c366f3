#include "o3skim_file_util.h"
#include "o3skim_common.h"

#include <cerrno>
#include <cstring>
#include <glob.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace o3skim_file_util
{

// ***************************************************************************
int file_exists(const char *path)
{
    struct stat s;
    int i_err = stat(path, &s);
    if (i_err == 0)
        return 1;
    return 0;
}

// ***************************************************************************
std::string join(const std::string &head, const std::string &tail)
{
    if (head.empty() || (!tail.empty() && (tail[0] == PATH_SEP[0])))
        return tail;

    if (head.back() == PATH_SEP[0])
        return head + tail;

    return head + PATH_SEP + tail;
}

// ***************************************************************************
int make_directories(const std::string &path)
{
    if (path.empty())
        return 0;

    std::string partial;
    size_t at = 0;
    while (at != std::string::npos)
    {
        at = path.find(PATH_SEP, at + 1);
        partial = path.substr(0, at);

        if (partial.empty() || file_exists(partial.c_str()))
            continue;

        if (mkdir(partial.c_str(), S_IRWXU|S_IXGRP|S_IRGRP|S_IXOTH|S_IROTH)
            && (errno != EEXIST))
        {
            const char *estr = strerror(errno);
            O3SKIM_ERROR("Failed to create the directory \"" << partial
                << "\". " << estr)
            return -1;
        }
    }

    struct stat s;
    if (stat(path.c_str(), &s) || !S_ISDIR(s.st_mode))
    {
        O3SKIM_ERROR("\"" << path << "\" is not a directory")
        return -1;
    }

    return 0;
}

// ***************************************************************************
int get_current_directory(std::string &path)
{
    std::vector<char> buf(4096, '\0');
    if (!getcwd(buf.data(), buf.size()))
    {
        const char *estr = strerror(errno);
        O3SKIM_ERROR("Failed to get the current working directory. " << estr)
        return -1;
    }
    path = buf.data();
    return 0;
}

// ***************************************************************************
int expand_paths(const std::vector<std::string> &expressions,
    std::vector<std::string> &files)
{
    size_t n_exprs = expressions.size();
    for (size_t i = 0; i < n_exprs; ++i)
    {
        glob_t matches;
        memset(&matches, 0, sizeof(glob_t));

        // glob sorts the matches unless GLOB_NOSORT is passed
        int ierr = glob(expressions[i].c_str(), 0, nullptr, &matches);
        if (ierr)
        {
            globfree(&matches);
            if (ierr == GLOB_NOMATCH)
            {
                O3SKIM_ERROR("No files match \"" << expressions[i] << "\"")
            }
            else
            {
                O3SKIM_ERROR("Failed to expand \"" << expressions[i]
                    << "\". glob error " << ierr)
            }
            return -1;
        }

        for (size_t j = 0; j < matches.gl_pathc; ++j)
            files.push_back(matches.gl_pathv[j]);

        globfree(&matches);
    }

    return 0;
}

// --------------------------------------------------------------------------
scoped_cd::scoped_cd(const std::string &dir) : m_previous(), m_entered(false)
{
    if (get_current_directory(m_previous))
        return;

    if (chdir(dir.c_str()))
    {
        const char *estr = strerror(errno);
        O3SKIM_ERROR("Failed to enter the directory \"" << dir << "\". " << estr)
        return;
    }

    m_entered = true;
}

// --------------------------------------------------------------------------
scoped_cd::~scoped_cd()
{
    if (m_entered && chdir(m_previous.c_str()))
    {
        const char *estr = strerror(errno);
        O3SKIM_ERROR("Failed to return to the directory \"" << m_previous
            << "\". " << estr)
    }
}

}

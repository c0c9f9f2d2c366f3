#ifndef o3skim_file_util_h
#define o3skim_file_util_h

/// @file

#include "o3skim_config.h"

#include <string>
#include <vector>

#define PATH_SEP "/"

/// Codes for dealing with files and directories
namespace o3skim_file_util
{
/// return 0 if the file does not exist
O3SKIM_EXPORT
int file_exists(const char *path);

/// join two paths with a PATH_SEP. absolute tails are returned unmodified
O3SKIM_EXPORT
std::string join(const std::string &head, const std::string &tail);

/** create the directory and any missing parents. succeeds when the directory
 * already exists. return 0 if successful.
 */
O3SKIM_EXPORT
int make_directories(const std::string &path);

/// get the current working directory. return 0 if successful.
O3SKIM_EXPORT
int get_current_directory(std::string &path);

/** expand the path expressions in order. each expression is a glob pattern
 * whose matches are appended in sorted order. the matches of different
 * expressions are not reordered or merged. an expression matching nothing
 * is an error. return 0 if successful.
 */
O3SKIM_EXPORT
int expand_paths(const std::vector<std::string> &expressions,
    std::vector<std::string> &files);

/// A RAII class that changes the working directory and restores it on exit.
/**
 * The process wide working directory is changed so the object must not be
 * used while other threads resolve relative paths.
 */
class O3SKIM_EXPORT scoped_cd
{
public:
    /// enter the directory. use ::good to check for success
    explicit scoped_cd(const std::string &dir);

    /// restore the previous working directory
    ~scoped_cd();

    scoped_cd(const scoped_cd &) = delete;
    void operator=(const scoped_cd &) = delete;

    /// returns true if the directory was entered
    bool good() const { return m_entered; }

private:
    std::string m_previous;
    bool m_entered;
};
}

#endif

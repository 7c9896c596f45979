/** \file   FileUtil.cc
 *  \brief  Implementation of file related utility classes and functions.
 *
 *  \copyright 2015-2024 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "FileUtil.h"
#include <exception>
#include <fstream>
#include <iterator>
#include <list>
#include <stdexcept>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>
#include "util.h"


namespace FileUtil {


AutoTempDirectory::AutoTempDirectory(const std::string &path_prefix, const bool cleanup_if_exception_is_active,
                                     const bool remove_when_out_of_scope)
    : cleanup_if_exception_is_active_(cleanup_if_exception_is_active), remove_when_out_of_scope_(remove_when_out_of_scope) {
    std::string path_template(path_prefix + "XXXXXX");
    const char * const path(::mkdtemp(const_cast<char *>(path_template.c_str())));
    if (path == nullptr)
        LOG_ERROR("mkdtemp(3) for path prefix \"" + path_prefix + "\" failed!");
    char resolved_path[PATH_MAX];
    if (unlikely(::realpath(path, resolved_path) == nullptr))
        LOG_ERROR("realpath(3) for path \"" + std::string(path) + "\" failed!");
    path_ = resolved_path;
}


AutoTempDirectory::~AutoTempDirectory() {
    if (not IsDirectory(path_))
        LOG_ERROR("\"" + path_ + "\" doesn't exist anymore!");

    if (remove_when_out_of_scope_ and ((not std::uncaught_exceptions() or cleanup_if_exception_is_active_) and not RemoveDirectory(path_)))
        LOG_ERROR("can't remove \"" + path_ + "\"!");
}


namespace {


// Leaves errno untouched on failure.
bool Stat(struct stat * const stat_buf, const std::string &path) {
    const int old_errno(errno);
    if (::stat(path.c_str(), stat_buf) != 0) {
        errno = old_errno;
        return false;
    }

    return true;
}


void MakeCanonicalPathList(const char * const path, std::list<std::string> * const canonical_path_list) {
    canonical_path_list->clear();

    const char *cp(path);
    if (*cp == '/') {
        canonical_path_list->push_back("/");
        ++cp;
    }

    while (*cp != '\0') {
        std::string directory;
        while (*cp != '\0' and *cp != '/')
            directory += *cp++;
        if (*cp == '/')
            ++cp;

        if (directory.empty() or directory == ".")
            continue;

        if (directory == ".." and not canonical_path_list->empty() and canonical_path_list->back() != "..") {
            if (canonical_path_list->size() != 1 or canonical_path_list->front() != "/")
                canonical_path_list->pop_back();
        } else
            canonical_path_list->push_back(directory);
    }
}


void CloseDirWhilePreservingErrno(DIR * const dir_handle) {
    const int old_errno(errno);
    ::closedir(dir_handle);
    errno = old_errno;
}


} // unnamed namespace


bool GetLastModificationTimestamp(const std::string &path, timespec * const mtim) {
    struct stat stat_buf;
    if (::stat(path.c_str(), &stat_buf) == -1)
        return false;
    *mtim = stat_buf.st_mtim;
    return true;
}


bool WriteString(const std::string &path, const std::string &data) {
    std::ofstream output(path, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (output.fail())
        return false;

    output.write(data.data(), data.size());
    return not output.bad();
}


bool ReadString(const std::string &path, std::string * const data) {
    std::ifstream input(path, std::ios_base::in | std::ios_base::binary);
    if (input.fail())
        return false;

    data->assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    return not input.bad();
}


bool IsReadableFile(const std::string &path) {
    struct stat stat_buf;
    if (not Stat(&stat_buf, path) or not S_ISREG(stat_buf.st_mode))
        return false;

    return ::access(path.c_str(), R_OK) == 0;
}


bool IsDirectory(const std::string &dir_name) {
    struct stat stat_buf;
    if (not Stat(&stat_buf, dir_name))
        return false;

    return S_ISDIR(stat_buf.st_mode);
}


std::string GetCurrentWorkingDirectory() {
    char buf[PATH_MAX];
    const char * const current_working_dir(::getcwd(buf, sizeof buf));
    if (unlikely(current_working_dir == nullptr))
        throw std::runtime_error("in FileUtil::GetCurrentWorkingDirectory: getcwd(3) failed (" + std::string(::strerror(errno)) + ")!");
    return current_working_dir;
}


std::string CanonisePath(const std::string &path) {
    std::list<std::string> canonical_path_list;
    MakeCanonicalPathList(path.c_str(), &canonical_path_list);

    std::string canonised_path;
    for (const auto &path_component : canonical_path_list) {
        if (not canonised_path.empty() and canonised_path != "/")
            canonised_path += '/';
        canonised_path += path_component;
    }

    return canonised_path;
}


std::string MakeAbsolutePath(const std::string &reference_path, const std::string &relative_path) {
    if (not relative_path.empty() and relative_path[0] == '/')
        return CanonisePath(relative_path);
    if (reference_path.empty())
        return CanonisePath(relative_path);

    const std::string reference_dirname(reference_path.back() == '/' ? reference_path : GetDirname(reference_path));
    if (reference_dirname.empty())
        return CanonisePath(relative_path);
    return CanonisePath(reference_dirname + "/" + relative_path);
}


std::string GetDirname(const std::string &path) {
    if (unlikely(path.empty()))
        return "";

    const auto last_slash_pos(path.rfind('/'));
    if (last_slash_pos == std::string::npos)
        return "";
    return path.substr(0, last_slash_pos);
}


bool RemoveDirectory(const std::string &dir_name) {
    errno = 0;
    DIR *dir_handle(::opendir(dir_name.c_str()));
    if (unlikely(dir_handle == nullptr))
        return false;

    struct dirent *entry;
    while ((entry = ::readdir(dir_handle)) != nullptr) {
        if (std::strcmp(entry->d_name, ".") == 0 or std::strcmp(entry->d_name, "..") == 0)
            continue;

        const std::string path(dir_name + "/" + std::string(entry->d_name));

        if (entry->d_type == DT_DIR) {
            if (unlikely(not RemoveDirectory(path))) {
                CloseDirWhilePreservingErrno(dir_handle);
                return false;
            }
        } else
            ::unlink(path.c_str());

        if (unlikely(errno != 0)) {
            CloseDirWhilePreservingErrno(dir_handle);
            return false;
        }
    }
    if (unlikely(errno != 0)) { // readdir(2) failed!
        CloseDirWhilePreservingErrno(dir_handle);
        return false;
    }

    if (unlikely(::rmdir(dir_name.c_str()) != 0)) {
        CloseDirWhilePreservingErrno(dir_handle);
        return false;
    }

    return likely(::closedir(dir_handle) == 0);
}


} // namespace FileUtil

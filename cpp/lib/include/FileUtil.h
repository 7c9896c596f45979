/** \file   FileUtil.h
 *  \brief  File-related utility functions.
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
#pragma once


#include <string>
#include <ctime>


namespace FileUtil {


/** \class AutoTempDirectory
 *  \brief Creates a temp directory and removes it when going out of scope.
 */
class AutoTempDirectory {
    std::string path_;
    bool cleanup_if_exception_is_active_;
    bool remove_when_out_of_scope_;

public:
    explicit AutoTempDirectory(const std::string &path_prefix = "/tmp/ATD", const bool cleanup_if_exception_is_active = true,
                               const bool remove_when_out_of_scope = true);
    AutoTempDirectory(const AutoTempDirectory &rhs) = delete;
    ~AutoTempDirectory();

    const std::string &getDirectoryPath() const { return path_; }
};


bool GetLastModificationTimestamp(const std::string &path, timespec * const mtim);

bool WriteString(const std::string &path, const std::string &data);
bool ReadString(const std::string &path, std::string * const data);


/** \return True if "path" exists and is a readable regular file. */
bool IsReadableFile(const std::string &path);


bool IsDirectory(const std::string &dir_name);


std::string GetCurrentWorkingDirectory();


/** \brief Removes "." and ".." components as well as duplicate slashes from "path". */
std::string CanonisePath(const std::string &path);


/** \brief Resolves "relative_path" against the directory part of "reference_path".
 *  \note  If "relative_path" is absolute it is only canonised.
 */
std::string MakeAbsolutePath(const std::string &reference_path, const std::string &relative_path);


inline std::string MakeAbsolutePath(const std::string &relative_path) {
    return MakeAbsolutePath(GetCurrentWorkingDirectory() + "/", relative_path);
}


std::string GetDirname(const std::string &path);


/** \brief Recursively deletes "dir_name".
 *  \return True if we succeeded, else false.
 */
bool RemoveDirectory(const std::string &dir_name);


} // namespace FileUtil

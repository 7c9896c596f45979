/** \file   IniFile.h
 *  \brief  Declaration of class IniFile, a reader for configuration files in the .ini format.
 *
 *  \copyright 2002-2024 Universitätsbibliothek Tübingen.  All rights reserved.
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


#include <algorithm>
#include <stack>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Read a configuration file in our .ini format.
 *
 *  This class allows access to the contents of an ini file.  It is initialised with the name of the file, and the
 *  settings stored in the file can then be accessed through the get* methods.  Double-quoted string constants
 *  can use C-style backslash escapes like \\n.  If you want to embed a hash mark in an unquoted value you must precede it
 *  with a single backslash.  A line of the form 'include "other.conf"' reads another file relative to the current one.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_, comment_;

    public:
        Entry(const std::string &name, const std::string &value, const std::string &comment)
            : name_(name), value_(value), comment_(comment) { }
    };

public:
    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;

    public:
        enum DupeInsertionBehaviour { OVERWRITE_EXISTING_VALUE, ABORT_ON_DUPLICATE_NAME };
        typedef std::vector<Entry>::const_iterator const_iterator;

    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }

        inline bool operator==(const std::string &section_name) const { return section_name == section_name_; }

        inline const std::string &getSectionName() const { return section_name_; }

        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }

        void insert(const std::string &variable_name, const std::string &value, const std::string &comment = "",
                    const DupeInsertionBehaviour dupe_insertion_behaviour = ABORT_ON_DUPLICATE_NAME);

        /** \brief   Retrieves a string value from a configuration file.
         *  \note    Calls LOG_ERROR if the variable is not defined.
         */
        std::string getString(const std::string &variable_name) const;
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \brief   Retrieves a boolean value from a configuration file.
         *  \note    Valid values are "true", "yes", "on", "false", "no" and "off", ignoring case.
         */
        bool getBool(const std::string &variable_name, const bool default_value) const;

        std::vector<std::string> getEntryNames() const;

    private:
        inline const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }
    };

    typedef std::vector<Section>::const_iterator const_iterator;

private:
    struct IncludeFileInfo {
        std::string filename_;
        unsigned current_lineno_;

    public:
        explicit IncludeFileInfo(const std::string &filename): filename_(filename), current_lineno_(0) { }
    };

    std::string ini_file_name_;
    std::vector<Section> sections_;
    std::stack<IncludeFileInfo> include_file_infos_;

public:
    /** \brief  Constructs an IniFile.
     *  \param  ini_file_name  The name of the file to process.
     *  \throws std::runtime_error if the file can't be read or contains syntax errors.
     */
    explicit IniFile(const std::string &ini_file_name);

    inline const_iterator begin() const { return sections_.cbegin(); }
    inline const_iterator end() const { return sections_.cend(); }

    /** \return An iterator referencing the section or end() if the section does not exist. */
    inline const_iterator getSection(const std::string &section_name) const {
        return std::find(sections_.cbegin(), sections_.cend(), section_name);
    }

    bool sectionIsDefined(const std::string &section_name) const { return getSection(section_name) != end(); }


    std::string getString(const std::string &section_name, const std::string &variable_name) const;
    std::string getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const;
    bool getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const;

    std::vector<std::string> getSectionEntryNames(const std::string &section_name) const;

private:
    inline unsigned &getCurrentLineNo() { return include_file_infos_.top().current_lineno_; }
    inline const std::string &getCurrentFile() const { return include_file_infos_.top().filename_; }

    void processSectionHeader(const std::string &line);
    void processInclude(const std::string &line);
    void processSectionEntry(const std::string &line, const std::string &comment);
    void processFile(const std::string &filename);
};

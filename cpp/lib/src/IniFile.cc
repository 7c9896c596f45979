/** \file   IniFile.cc
 *  \brief  Implementation of class IniFile.
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
#include "IniFile.h"
#include <fstream>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include "FileUtil.h"
#include "StringUtil.h"
#include "util.h"


void IniFile::Section::insert(const std::string &variable_name, const std::string &value, const std::string &comment,
                              const DupeInsertionBehaviour dupe_insertion_behaviour)
{
    const auto existing_entry(std::find_if(entries_.begin(), entries_.end(),
                                           [&variable_name](const Entry &entry) { return entry.name_ == variable_name; }));
    if (existing_entry == entries_.end()) {
        entries_.emplace_back(variable_name, value, comment);
        return;
    }

    if (dupe_insertion_behaviour == ABORT_ON_DUPLICATE_NAME)
        throw std::runtime_error("in IniFile::Section::insert: attempting to insert a duplicate variable name: \"" + variable_name
                                 + "\" in section \"" + section_name_ + "\"!");
    existing_entry->value_ = value;
    existing_entry->comment_ = comment;
}


std::string IniFile::Section::getString(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        LOG_ERROR("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return existing_entry->value_;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        return default_value;

    return existing_entry->value_;
}


bool IniFile::Section::getBool(const std::string &variable_name, const bool default_value) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        return default_value;

    bool retval;
    if (not StringUtil::ToBool(existing_entry->value_, &retval))
        LOG_ERROR("invalid boolean value in section \"" + section_name_ + "\", entry \"" + variable_name + "\" (bad value is \""
                  + existing_entry->value_ + "\")!");

    return retval;
}


std::vector<std::string> IniFile::Section::getEntryNames() const {
    std::vector<std::string> entry_names;

    for (const auto &entry : entries_) {
        if (not entry.name_.empty())
            entry_names.emplace_back(entry.name_);
    }

    return entry_names;
}


IniFile::IniFile(const std::string &ini_file_name): ini_file_name_(FileUtil::MakeAbsolutePath(ini_file_name)) {
    processFile(ini_file_name_);
}


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throw std::runtime_error("in IniFile::processSectionHeader: garbled section header on line " + std::to_string(getCurrentLineNo())
                                 + " in file \"" + getCurrentFile() + "\"!");

    std::string section_name(line.substr(1, line.length() - 2));
    StringUtil::Trim(" \t", &section_name);
    if (section_name.empty())
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name on line " + std::to_string(getCurrentLineNo())
                                 + " in file \"" + getCurrentFile() + "\"!");

    if (sectionIsDefined(section_name))
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + section_name + "\" on line "
                                 + std::to_string(getCurrentLineNo()) + " in file \"" + getCurrentFile() + "\"!");
    sections_.emplace_back(section_name);
}


void IniFile::processInclude(const std::string &line) {
    if (unlikely(line.find('=') != std::string::npos))
        throw std::runtime_error("in IniFile::processInclude: unexpected '=' on line " + std::to_string(getCurrentLineNo()) + " in file \""
                                 + getCurrentFile() + "\"!");

    std::string include_filename(line.substr(__builtin_strlen("include")));
    StringUtil::Trim(" \t", &include_filename);
    if (not include_filename.empty() and include_filename[0] == '"') {
        if (include_filename.length() < 3 or include_filename[include_filename.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processInclude: garbled include file name on line " + std::to_string(getCurrentLineNo())
                                     + " in file \"" + getCurrentFile() + "\"!");
        include_filename = include_filename.substr(1, include_filename.length() - 2);
    }

    processFile(FileUtil::MakeAbsolutePath(getCurrentFile(), include_filename));
}


namespace {


// IsValidVariableName -- only allow names that start with a letter followed by letters, digits,
// hyphens, underscores and periods.
//
bool IsValidVariableName(const std::string &possible_variable_name) {
    if (unlikely(possible_variable_name.empty()))
        return false;

    auto ch(possible_variable_name.cbegin());
    if (not StringUtil::IsAsciiLetter(*ch))
        return false;

    for (++ch; ch != possible_variable_name.cend(); ++ch) {
        if (not StringUtil::IsAlphanumeric(*ch) and *ch != '-' and *ch != '_' and *ch != '.')
            return false;
    }

    return true;
}


// Handles the escapes \n, \t, \\, \" and \#.
std::string CStyleUnescape(const std::string &escaped) {
    std::string unescaped;
    for (auto ch(escaped.cbegin()); ch != escaped.cend(); ++ch) {
        if (*ch != '\\') {
            unescaped += *ch;
            continue;
        }

        if (++ch == escaped.cend())
            throw std::runtime_error("trailing backslash");
        switch (*ch) {
        case 'n':
            unescaped += '\n';
            break;
        case 't':
            unescaped += '\t';
            break;
        case '\\':
        case '"':
        case '#':
            unescaped += *ch;
            break;
        default:
            throw std::runtime_error("unknown escape \\" + std::string(1, *ch));
        }
    }

    return unescaped;
}


std::string StripComment(std::string * const line, std::string * const comment) {
    comment->clear();

    bool inside_string_literal(false);
    for (auto character(line->begin()); character != line->end(); ++character) {
        if (*character == '"')
            inside_string_literal = not inside_string_literal;
        else if (*character == '#') {
            if (character != line->begin() and *(character - 1) == '\\')
                continue; // skip escaped hash characters
            if (inside_string_literal)
                continue;

            size_t comment_start_pos(character - line->begin());
            while (comment_start_pos > 0 and (*line)[comment_start_pos - 1] == ' ')
                --comment_start_pos;
            *comment = line->substr(comment_start_pos);
            line->resize(comment_start_pos);
            return *line;
        }
    }

    return *line;
}


} // unnamed namespace


void IniFile::processSectionEntry(const std::string &line, const std::string &comment) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos) { // Not a normal "variable = value" type line.
        const std::string trimmed_line(StringUtil::TrimWhite(line));
        if (unlikely(not IsValidVariableName(trimmed_line)))
            throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + trimmed_line + "\" on line "
                                     + std::to_string(getCurrentLineNo()) + " in file \"" + getCurrentFile() + "\"!");

        sections_.back().insert(trimmed_line, "true");
        return;
    }

    std::string variable_name(line.substr(0, equal_sign));
    StringUtil::Trim(" \t", &variable_name);
    if (not IsValidVariableName(variable_name))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\" on line "
                                 + std::to_string(getCurrentLineNo()) + " in file \"" + getCurrentFile() + "\"!");

    std::string value(line.substr(equal_sign + 1));
    StringUtil::Trim(" \t", &value);
    if (value.empty())
        throw std::runtime_error("in IniFile::processSectionEntry: missing variable value on line " + std::to_string(getCurrentLineNo())
                                 + " in file \"" + getCurrentFile() + "\"!");

    if (value[0] == '"') { // double-quoted string
        if (value.length() == 1 or value[value.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value on line "
                                     + std::to_string(getCurrentLineNo()) + " in file \"" + getCurrentFile() + "\"!");

        try {
            value = CStyleUnescape(value.substr(1, value.length() - 2));
        } catch (const std::runtime_error &x) {
            throw std::runtime_error("in IniFile::processSectionEntry: bad escape on line " + std::to_string(getCurrentLineNo())
                                     + " in file \"" + getCurrentFile() + "\"! (" + std::string(x.what()) + ")");
        }
    } else
        StringUtil::ReplaceString("\\#", "#", &value);

    sections_.back().insert(variable_name, value, comment);
}


void IniFile::processFile(const std::string &filename) {
    std::ifstream ini_file(filename.c_str());
    if (ini_file.fail())
        throw std::runtime_error("in IniFile::processFile: can't open \"" + filename + "\"! (" + std::string(::strerror(errno)) + ")");

    include_file_infos_.push(IncludeFileInfo(filename));

    std::string buf;
    while (std::getline(ini_file, buf)) {
        ++getCurrentLineNo();

        // Join lines that end in a backslash with their successors:
        std::string line(StringUtil::Trim(" \t", &buf));
        while (not line.empty() and line[line.length() - 1] == '\\' and std::getline(ini_file, buf)) {
            ++getCurrentLineNo();
            line.resize(line.length() - 1);
            line += StringUtil::Trim(" \t", &buf);
        }

        std::string comment;
        StripComment(&line, &comment);
        StringUtil::Trim(" \t", &line);
        if (line.empty())
            continue;

        if (line[0] == '[') // should be a section header!
            processSectionHeader(line);
        else if (line.length() > 7 and line.substr(0, 7) == "include" and (line[7] == ' ' or line[7] == '\t'))
            processInclude(line);
        else { // should be a new setting!
            if (sections_.empty())
                sections_.emplace_back("");
            processSectionEntry(line, comment);
        }
    }

    include_file_infos_.pop();
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name) const {
    const auto section(getSection(section_name));
    if (section == end())
        LOG_ERROR("no such section: \"" + section_name + "\"! (variable: \"" + variable_name + "\")");

    return section->getString(variable_name);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name,
                               const std::string &default_value) const
{
    const auto section(getSection(section_name));
    if (section == end())
        return default_value;

    return section->getString(variable_name, default_value);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const {
    const auto section(getSection(section_name));
    if (section == end())
        return default_value;

    return section->getBool(variable_name, default_value);
}


std::vector<std::string> IniFile::getSectionEntryNames(const std::string &section_name) const {
    const auto section(getSection(section_name));
    if (section == end())
        return std::vector<std::string>();

    return section->getEntryNames();
}

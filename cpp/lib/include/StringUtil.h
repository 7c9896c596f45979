/** \file   StringUtil.h
 *  \brief  String utility functions.
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


#include <string>
#include <cstring>
#include <strings.h>


namespace StringUtil {


/** The default set of characters that are considered to be whitespace by the functions in this namespace. */
extern const std::string WHITE_SPACE;


inline bool IsWhitespace(const char ch) {
    return ch == ' ' or ch == '\t' or ch == '\n' or ch == '\r' or ch == '\v' or ch == '\f';
}


inline bool IsAsciiLetter(const char ch) {
    return (ch >= 'a' and ch <= 'z') or (ch >= 'A' and ch <= 'Z');
}


inline bool IsDigit(const char ch) {
    return ch >= '0' and ch <= '9';
}


inline bool IsAlphanumeric(const char ch) {
    return IsAsciiLetter(ch) or IsDigit(ch);
}


/** \brief  Removes all characters in "trim_set" from the end of "*s".
 *  \return The trimmed string.
 */
std::string RightTrim(const std::string &trim_set, std::string * const s);


/** \brief  Removes all characters in "trim_set" from the beginning of "*s".
 *  \return The trimmed string.
 */
std::string LeftTrim(const std::string &trim_set, std::string * const s);


/** \brief  Removes all characters in "trim_set" from both ends of "*s".
 *  \return The trimmed string.
 */
std::string Trim(const std::string &trim_set, std::string * const s);


inline std::string TrimWhite(std::string * const s) {
    return Trim(WHITE_SPACE, s);
}


inline std::string TrimWhite(const std::string &s) {
    std::string temp_s(s);
    return TrimWhite(&temp_s);
}


/** \brief  Converts "true", "yes", "on", "false", "no" and "off" (case-insensitive) to a bool.
 *  \return False if "value" was not recognised, else true.
 */
bool ToBool(const std::string &value, bool * const b);


/** \brief  Converts a decimal string to a long, accepting a leading sign.
 *  \return False if "s" is not a valid number in the range of a long, else true.
 */
bool ToNumber(const std::string &s, long * const n);


/** \brief  Converts a string to a double.
 *  \return False if "s" is not a valid floating point number, else true.
 */
bool ToDouble(const std::string &s, double * const n);


/** \brief  Splits "source" around "delimiter".
 *  \param  container                  Will hold the components, in order.
 *  \param  suppress_empty_components  If true, empty components will not be added to "container".
 *  \return The number of components that were added to "container".
 */
template<typename InsertableContainer> unsigned Split(const std::string &source, const char delimiter,
                                                      InsertableContainer * const container,
                                                      const bool suppress_empty_components = true)
{
    container->clear();
    if (source.empty())
        return 0;

    unsigned count(0);
    std::string::size_type start(0);
    for (;;) {
        const std::string::size_type next_delimiter(source.find(delimiter, start));
        const std::string component(source.substr(start, next_delimiter == std::string::npos ? std::string::npos
                                                                                             : next_delimiter - start));
        if (not component.empty() or not suppress_empty_components) {
            container->insert(container->end(), component);
            ++count;
        }

        if (next_delimiter == std::string::npos)
            return count;
        start = next_delimiter + 1;
    }
}


/** \brief  Joins the elements of "source" with "separator" between consecutive elements. */
template<typename StringContainer> std::string Join(const StringContainer &source, const std::string &separator) {
    std::string result;
    for (auto element(source.cbegin()); element != source.cend(); ++element) {
        if (element != source.cbegin())
            result += separator;
        result += *element;
    }

    return result;
}


inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false) {
    return prefix.empty()
           or (s.length() >= prefix.length()
               and (ignore_case ? (::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)
                                : (std::strncmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)));
}


inline bool EndsWith(const std::string &s, const std::string &suffix, const bool ignore_case = false) {
    if (suffix.empty())
        return true;
    if (s.length() < suffix.length())
        return false;

    return ignore_case ? (::strcasecmp(s.c_str() + s.length() - suffix.length(), suffix.c_str()) == 0)
                       : (std::strcmp(s.c_str() + s.length() - suffix.length(), suffix.c_str()) == 0);
}


/** \brief Replaces all occurrences of "old_text" in "*s" with "new_text".
 *  \return The number of replacements.
 */
unsigned ReplaceString(const std::string &old_text, const std::string &new_text, std::string * const s);


} // namespace StringUtil

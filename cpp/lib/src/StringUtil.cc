/** \file   StringUtil.cc
 *  \brief  Implementation of string utility functions.
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
#include "StringUtil.h"
#include <cerrno>
#include <cstdlib>
#include "util.h"


namespace StringUtil {


const std::string WHITE_SPACE(" \t\n\v\r\f");


std::string RightTrim(const std::string &trim_set, std::string * const s) {
    const std::string::size_type last_kept(s->find_last_not_of(trim_set));
    if (last_kept == std::string::npos)
        s->clear();
    else
        s->erase(last_kept + 1);

    return *s;
}


std::string LeftTrim(const std::string &trim_set, std::string * const s) {
    const std::string::size_type first_kept(s->find_first_not_of(trim_set));
    if (first_kept == std::string::npos)
        s->clear();
    else
        s->erase(0, first_kept);

    return *s;
}


std::string Trim(const std::string &trim_set, std::string * const s) {
    RightTrim(trim_set, s);
    return LeftTrim(trim_set, s);
}


bool ToBool(const std::string &value, bool * const b) {
    if (::strcasecmp(value.c_str(), "true") == 0 or ::strcasecmp(value.c_str(), "yes") == 0
        or ::strcasecmp(value.c_str(), "on") == 0)
    {
        *b = true;
        return true;
    }

    if (::strcasecmp(value.c_str(), "false") == 0 or ::strcasecmp(value.c_str(), "off") == 0
        or ::strcasecmp(value.c_str(), "no") == 0)
    {
        *b = false;
        return true;
    }

    return false;
}


bool ToNumber(const std::string &s, long * const n) {
    if (unlikely(s.empty()))
        return false;

    errno = 0;
    char *endptr;
    *n = std::strtol(s.c_str(), &endptr, 10);
    if (unlikely(errno != 0 or *endptr != '\0')) {
        errno = 0;
        return false;
    }

    return true;
}


bool ToDouble(const std::string &s, double * const n) {
    if (unlikely(s.empty()))
        return false;

    errno = 0;
    char *endptr;
    *n = std::strtod(s.c_str(), &endptr);
    if (unlikely(errno != 0 or *endptr != '\0')) {
        errno = 0;
        return false;
    }

    return true;
}


unsigned ReplaceString(const std::string &old_text, const std::string &new_text, std::string * const s) {
    if (unlikely(old_text.empty()))
        return 0;

    unsigned replacement_count(0);
    std::string::size_type start(0);
    for (;;) {
        const std::string::size_type match(s->find(old_text, start));
        if (match == std::string::npos)
            return replacement_count;

        s->replace(match, old_text.length(), new_text);
        start = match + new_text.length();
        ++replacement_count;
    }
}


} // namespace StringUtil

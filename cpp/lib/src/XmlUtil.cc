/** \file   XmlUtil.cc
 *  \brief  Implementation of XML-related utility functions.
 *
 *  \copyright 2017-2024 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "XmlUtil.h"


namespace XmlUtil {


namespace {


std::string Escape(const std::string &s, const bool escape_double_quotes) {
    std::string escaped_string;
    escaped_string.reserve(s.size());

    for (const auto ch : s) {
        if (ch == '<')
            escaped_string += "&lt;";
        else if (ch == '>')
            escaped_string += "&gt;";
        else if (ch == '&')
            escaped_string += "&amp;";
        else if (ch == '"' and escape_double_quotes)
            escaped_string += "&quot;";
        else
            escaped_string += ch;
    }

    return escaped_string;
}


} // unnamed namespace


std::string XmlEscape(const std::string &text) {
    return Escape(text, /* escape_double_quotes = */ false);
}


std::string XmlAttributeEscape(const std::string &value) {
    return Escape(value, /* escape_double_quotes = */ true);
}


} // namespace XmlUtil

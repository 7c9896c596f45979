/** \file   XmlUtil.h
 *  \brief  XML-related utility functions.
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
#ifndef XML_UTIL_H
#define XML_UTIL_H


#include <string>


namespace XmlUtil {


/** \brief Escapes '&', '<' and '>' so that "text" can be used as character data. */
std::string XmlEscape(const std::string &text);


/** \brief Like XmlEscape() but also escapes double quotes so that the result can be used in a double-quoted attribute value. */
std::string XmlAttributeEscape(const std::string &value);


} // namespace XmlUtil


#endif // ifndef XML_UTIL_H

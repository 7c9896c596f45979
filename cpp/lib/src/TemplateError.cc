/** \file   TemplateError.cc
 *  \brief  Implementation of the exception classes of the markup template engine.
 *
 *  \copyright 2024 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "TemplateError.h"
#include "StringUtil.h"


namespace Markup {


void ExpressionError::setPositionIfUnset(const Position &position) {
    if (has_position_)
        return;

    position_ = position;
    has_position_ = true;
}


TemplateLocatedError::TemplateLocatedError(const std::string &message, const std::string &filename, const unsigned line,
                                           const unsigned column)
    : TemplateError(message + " (" + (filename.empty() ? "<string>" : filename) + ", line " + std::to_string(line) + ")"),
      message_(message), filename_(filename), line_(line), column_(column)
{
}


TemplateNotFound::TemplateNotFound(const std::string &name, const std::vector<std::string> &search_path)
    : TemplateError("Template \"" + name + "\" not found in search path [" + StringUtil::Join(search_path, ", ") + "]"), name_(name),
      search_path_(search_path)
{
}


} // namespace Markup

/** \file   MarkupSerializer.h
 *  \brief  Renders event streams as XML text.
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
#pragma once


#include <string>
#include <vector>
#include "MarkupEvent.h"


namespace Markup {


/** \class  XmlSerializer
 *  \brief  Writes the events of fully expanded streams to a string.
 *
 *  Namespace declarations are written as "xmlns" attributes of the next start tag, elements without content are
 *  written as empty-element tags and text and attribute values are escaped.
 */
class XmlSerializer {
    std::string *output_string_;
    std::vector<std::pair<std::string, std::string>> pending_namespace_declarations_; // (prefix, URI)

public:
    explicit XmlSerializer(std::string * const output_string): output_string_(output_string) { }

    /** \brief Appends the serialisation of all remaining events of "stream" to the output string.
     *  \throws TemplateError if the stream contains unexpanded EXPR or SUB events or attributes with expressions.
     */
    void write(EventStream * const stream);

    static std::string ToString(EventStream * const stream);

private:
    void writeStartTag(const Event &start_event, const bool is_empty_element);
    void writeDoctype(const Event &doctype_event);
};


} // namespace Markup

/** \file   MarkupSerializer.cc
 *  \brief  Implementation of the XML serializer.
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
#include "MarkupSerializer.h"
#include "TemplateError.h"
#include "XmlUtil.h"
#include "util.h"


namespace Markup {


void XmlSerializer::write(EventStream * const stream) {
    Event event, lookahead_event;
    bool have_lookahead_event(false);
    for (;;) {
        if (have_lookahead_event) {
            event = lookahead_event;
            have_lookahead_event = false;
        } else if (not stream->getNext(&event))
            return;

        switch (event.getKind()) {
        case Event::START: {
            have_lookahead_event = stream->getNext(&lookahead_event);
            const bool is_empty_element(have_lookahead_event and lookahead_event.getKind() == Event::END);
            writeStartTag(event, is_empty_element);
            if (is_empty_element)
                have_lookahead_event = false;
            break;
        }
        case Event::END:
            *output_string_ += "</" + event.getName().getQualifiedName() + ">";
            break;
        case Event::TEXT:
            *output_string_ += XmlUtil::XmlEscape(event.getText());
            break;
        case Event::START_NS:
            pending_namespace_declarations_.emplace_back(event.getPrefix(), event.getNamespaceURI());
            break;
        case Event::END_NS:
            break;
        case Event::COMMENT:
            *output_string_ += "<!--" + event.getText() + "-->";
            break;
        case Event::PI:
            *output_string_ += "<?" + event.getTarget();
            if (not event.getData().empty())
                *output_string_ += " " + event.getData();
            *output_string_ += "?>";
            break;
        case Event::DOCTYPE:
            writeDoctype(event);
            break;
        default:
            throw TemplateError("in Markup::XmlSerializer::write: can't serialise a " + Event::KindToString(event.getKind())
                                + " event at " + event.getPosition().toString() + "!");
        }
    }
}


std::string XmlSerializer::ToString(EventStream * const stream) {
    std::string output;
    XmlSerializer serializer(&output);
    serializer.write(stream);
    return output;
}


void XmlSerializer::writeStartTag(const Event &start_event, const bool is_empty_element) {
    *output_string_ += "<" + start_event.getName().getQualifiedName();

    for (const auto &prefix_and_uri : pending_namespace_declarations_) {
        *output_string_ += prefix_and_uri.first.empty() ? " xmlns" : " xmlns:" + prefix_and_uri.first;
        *output_string_ += "=\"" + XmlUtil::XmlAttributeEscape(prefix_and_uri.second) + "\"";
    }
    pending_namespace_declarations_.clear();

    for (const auto &attribute : start_event.getAttributes()) {
        if (unlikely(not attribute.isLiteral()))
            throw TemplateError("in Markup::XmlSerializer::writeStartTag: unevaluated expression in attribute \""
                                + attribute.name_.getQualifiedName() + "\" at " + start_event.getPosition().toString() + "!");
        *output_string_ += " " + attribute.name_.getQualifiedName() + "=\"" + XmlUtil::XmlAttributeEscape(attribute.getText())
                           + "\"";
    }

    *output_string_ += is_empty_element ? "/>" : ">";
}


void XmlSerializer::writeDoctype(const Event &doctype_event) {
    *output_string_ += "<!DOCTYPE " + doctype_event.getDoctypeName();
    if (not doctype_event.getPublicId().empty()) {
        *output_string_ += " PUBLIC \"" + doctype_event.getPublicId() + "\"";
        if (not doctype_event.getSystemId().empty())
            *output_string_ += " \"" + doctype_event.getSystemId() + "\"";
    } else if (not doctype_event.getSystemId().empty())
        *output_string_ += " SYSTEM \"" + doctype_event.getSystemId() + "\"";
    *output_string_ += ">";
}


} // namespace Markup

/** \file   MarkupEvent.cc
 *  \brief  Implementation of markup events and the basic event streams.
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
#include "MarkupEvent.h"
#include <algorithm>
#include <stdexcept>
#include "util.h"


namespace Markup {


std::string Position::toString() const {
    return "line " + std::to_string(line_) + ", column " + std::to_string(column_);
}


std::string QName::getQualifiedName() const {
    return prefix_.empty() ? local_name_ : prefix_ + ":" + local_name_;
}


bool Attributes::Attribute::isLiteral() const {
    return std::none_of(value_.cbegin(), value_.cend(), [](const Fragment &fragment) { return fragment.isExpression(); });
}


std::string Attributes::Attribute::getText() const {
    std::string text;
    for (const auto &fragment : value_) {
        if (not fragment.isExpression())
            text += fragment.getText();
    }

    return text;
}


Attributes::const_iterator Attributes::find(const std::string &name) const {
    return std::find_if(attributes_.cbegin(), attributes_.cend(),
                        [&name](const Attribute &attribute) { return attribute.name_.getQualifiedName() == name; });
}


std::string Attributes::getText(const std::string &name) const {
    const auto attribute(find(name));
    return attribute == end() ? "" : attribute->getText();
}


void Attributes::set(const QName &name, const std::vector<Fragment> &value) {
    for (auto &attribute : attributes_) {
        if (attribute.name_ == name) {
            attribute.value_ = value;
            return;
        }
    }

    attributes_.emplace_back(name, value);
}


bool Attributes::remove(const std::string &name) {
    const auto attribute(std::find_if(attributes_.begin(), attributes_.end(),
                                      [&name](const Attribute &candidate) { return candidate.name_.getQualifiedName() == name; }));
    if (attribute == attributes_.end())
        return false;

    attributes_.erase(attribute);
    return true;
}


Event Event::MakeStart(const QName &name, const Attributes &attributes, const Position &position) {
    Event event(START, position);
    event.name_ = name;
    event.attributes_ = attributes;
    return event;
}


Event Event::MakeEnd(const QName &name, const Position &position) {
    Event event(END, position);
    event.name_ = name;
    return event;
}


Event Event::MakeText(const std::string &text, const Position &position) {
    Event event(TEXT, position);
    event.text_ = text;
    return event;
}


Event Event::MakeStartNamespace(const std::string &prefix, const std::string &namespace_uri, const Position &position) {
    Event event(START_NS, position);
    event.text_ = prefix;
    event.aux_ = namespace_uri;
    return event;
}


Event Event::MakeEndNamespace(const std::string &prefix, const Position &position) {
    Event event(END_NS, position);
    event.text_ = prefix;
    return event;
}


Event Event::MakeComment(const std::string &text, const Position &position) {
    Event event(COMMENT, position);
    event.text_ = text;
    return event;
}


Event Event::MakeProcessingInstruction(const std::string &target, const std::string &data, const Position &position) {
    Event event(PI, position);
    event.name_ = QName(target);
    event.text_ = data;
    return event;
}


Event Event::MakeDoctype(const std::string &name, const std::string &public_id, const std::string &system_id,
                         const Position &position)
{
    Event event(DOCTYPE, position);
    event.name_ = QName(name);
    event.text_ = public_id;
    event.aux_ = system_id;
    return event;
}


Event Event::MakeExpression(const std::shared_ptr<const Expression> &expression, const Position &position) {
    if (unlikely(expression == nullptr))
        throw std::invalid_argument("in Markup::Event::MakeExpression: expression must not be null!");

    Event event(EXPR, position);
    event.expression_ = expression;
    return event;
}


Event Event::MakeSub(const std::shared_ptr<const SubProgram> &sub_program, const Position &position) {
    if (unlikely(sub_program == nullptr))
        throw std::invalid_argument("in Markup::Event::MakeSub: sub program must not be null!");

    Event event(SUB, position);
    event.sub_program_ = sub_program;
    return event;
}


std::string Event::KindToString(const Kind kind) {
    switch (kind) {
    case UNINITIALISED:
        return "UNINITIALISED";
    case START:
        return "START";
    case END:
        return "END";
    case TEXT:
        return "TEXT";
    case START_NS:
        return "START_NS";
    case END_NS:
        return "END_NS";
    case COMMENT:
        return "COMMENT";
    case PI:
        return "PI";
    case DOCTYPE:
        return "DOCTYPE";
    case EXPR:
        return "EXPR";
    case SUB:
        return "SUB";
    }

    throw std::runtime_error("in Markup::Event::KindToString: unknown kind " + std::to_string(kind) + "!");
}


bool EventSequenceStream::getNext(Event * const event) {
    if (next_index_ >= events_->size())
        return false;

    *event = (*events_)[next_index_++];
    return true;
}


EventSequence DrainStream(EventStream * const stream) {
    std::shared_ptr<std::vector<Event>> events(std::make_shared<std::vector<Event>>());
    Event event;
    while (stream->getNext(&event))
        events->emplace_back(event);

    return events;
}


} // namespace Markup

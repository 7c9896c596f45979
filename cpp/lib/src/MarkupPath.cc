/** \file   MarkupPath.cc
 *  \brief  Implementation of the restricted path language.
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
#include "MarkupPath.h"
#include <map>
#include <set>
#include "StringUtil.h"
#include "util.h"


namespace Markup {


bool MarkupPath::Step::matchesElement(const Event &start_event) const {
    if (start_event.getKind() != Event::START)
        return false;

    switch (test_) {
    case ELEMENT:
        if (name_.find(':') != std::string::npos) {
            if (start_event.getName().getQualifiedName() != name_)
                return false;
        } else if (start_event.getName().getLocalName() != name_)
            return false;
        break;
    case ANY_ELEMENT:
    case SELF:
        break;
    default:
        return false;
    }

    if (predicate_attribute_.empty())
        return true;

    const Attributes &attributes(start_event.getAttributes());
    const auto attribute(attributes.find(predicate_attribute_));
    if (attribute == attributes.end())
        return false;
    return not predicate_has_value_ or attribute->getText() == predicate_value_;
}


namespace {


inline bool IsNameChar(const char ch) {
    return StringUtil::IsAlphanumeric(ch) or ch == '_' or ch == '-' or ch == ':' or ch == '.';
}


std::string ExtractName(const std::string &source, size_t * const pos) {
    const size_t start(*pos);
    while (*pos < source.size() and IsNameChar(source[*pos]))
        ++*pos;
    return source.substr(start, *pos - start);
}


[[noreturn]] void ThrowPathError(const std::string &message, const std::string &source, const size_t pos) {
    throw MarkupPath::Error("in Markup::MarkupPath: " + message + " at offset " + std::to_string(pos) + " in \"" + source
                            + "\"!");
}


// Splits on "|" outside of predicates and quoted strings.
std::vector<std::string> SplitAlternatives(const std::string &source) {
    std::vector<std::string> alternatives;
    std::string current;
    char quote('\0');
    unsigned bracket_depth(0);
    for (const char ch : source) {
        if (quote != '\0') {
            if (ch == quote)
                quote = '\0';
        } else if (ch == '\'' or ch == '"')
            quote = ch;
        else if (ch == '[')
            ++bracket_depth;
        else if (ch == ']' and bracket_depth > 0)
            --bracket_depth;
        else if (ch == '|' and bracket_depth == 0) {
            alternatives.emplace_back(current);
            current.clear();
            continue;
        }
        current += ch;
    }
    alternatives.emplace_back(current);

    return alternatives;
}


} // unnamed namespace


MarkupPath::MarkupPath(const std::string &source): source_(source) {
    for (const auto &alternative_source : SplitAlternatives(source))
        parseAlternative(StringUtil::TrimWhite(alternative_source));
}


void MarkupPath::parseAlternative(const std::string &alternative_source) {
    if (unlikely(alternative_source.empty()))
        ThrowPathError("empty path", source_, 0);

    Alternative alternative;
    alternative.absolute_ = false;

    size_t pos(0);
    Step::Axis axis(Step::CHILD);
    if (StringUtil::StartsWith(alternative_source, "//")) {
        axis = Step::DESCENDANT;
        pos = 2;
    } else if (alternative_source[0] == '/') {
        alternative.absolute_ = true;
        pos = 1;
    }

    for (;;) {
        Step step;
        step.axis_ = axis;

        if (pos >= alternative_source.size())
            ThrowPathError("missing step", alternative_source, pos);
        if (alternative_source[pos] == '@') {
            ++pos;
            if (pos < alternative_source.size() and alternative_source[pos] == '*') {
                ++pos;
                step.test_ = Step::ANY_ATTRIBUTE;
            } else {
                step.test_ = Step::ATTRIBUTE;
                step.name_ = ExtractName(alternative_source, &pos);
                if (unlikely(step.name_.empty()))
                    ThrowPathError("missing attribute name", alternative_source, pos);
            }
        } else if (alternative_source[pos] == '*') {
            ++pos;
            step.test_ = Step::ANY_ELEMENT;
        } else if (alternative_source[pos] == '.'
                   and (pos + 1 == alternative_source.size() or not IsNameChar(alternative_source[pos + 1])))
        {
            ++pos;
            step.test_ = Step::SELF;
        } else {
            step.name_ = ExtractName(alternative_source, &pos);
            if (unlikely(step.name_.empty()))
                ThrowPathError("unexpected character '" + std::string(1, alternative_source[pos]) + "'", alternative_source, pos);
            if (step.name_ == "text" and alternative_source.compare(pos, 2, "()") == 0) {
                pos += 2;
                step.test_ = Step::TEXT;
                step.name_.clear();
            } else
                step.test_ = Step::ELEMENT;
        }

        if (pos < alternative_source.size() and alternative_source[pos] == '[') {
            if (unlikely(step.isAttributeStep() or step.test_ == Step::TEXT))
                ThrowPathError("predicates are only allowed on element steps", alternative_source, pos);
            ++pos;
            if (unlikely(pos >= alternative_source.size() or alternative_source[pos] != '@'))
                ThrowPathError("expected '@' in predicate", alternative_source, pos);
            ++pos;
            step.predicate_attribute_ = ExtractName(alternative_source, &pos);
            if (unlikely(step.predicate_attribute_.empty()))
                ThrowPathError("missing attribute name in predicate", alternative_source, pos);
            if (pos < alternative_source.size() and alternative_source[pos] == '=') {
                ++pos;
                const char quote(pos < alternative_source.size() ? alternative_source[pos] : '\0');
                if (unlikely(quote != '\'' and quote != '"'))
                    ThrowPathError("expected a quoted value in predicate", alternative_source, pos);
                const size_t closing_quote_pos(alternative_source.find(quote, pos + 1));
                if (unlikely(closing_quote_pos == std::string::npos))
                    ThrowPathError("unterminated string", alternative_source, pos);
                step.predicate_has_value_ = true;
                step.predicate_value_ = alternative_source.substr(pos + 1, closing_quote_pos - pos - 1);
                pos = closing_quote_pos + 1;
            }
            if (unlikely(pos >= alternative_source.size() or alternative_source[pos] != ']'))
                ThrowPathError("expected ']'", alternative_source, pos);
            ++pos;
        }

        alternative.steps_.emplace_back(step);
        if (pos == alternative_source.size())
            break;

        if (unlikely(step.isAttributeStep()))
            ThrowPathError("attribute steps must come last", alternative_source, pos);
        if (alternative_source.compare(pos, 2, "//") == 0) {
            axis = Step::DESCENDANT;
            pos += 2;
        } else if (alternative_source[pos] == '/') {
            axis = Step::CHILD;
            ++pos;
        } else
            ThrowPathError("expected '/'", alternative_source, pos);
    }

    alternatives_.emplace_back(alternative);
}


bool MarkupPath::matches(const std::vector<Event> &element_stack) const {
    if (element_stack.empty())
        return false;

    for (const auto &alternative : alternatives_) {
        if (matchesFrom(alternative, alternative.steps_.size() - 1, element_stack, element_stack.size() - 1))
            return true;
    }

    return false;
}


bool MarkupPath::matchesFrom(const Alternative &alternative, const size_t step_index, const std::vector<Event> &element_stack,
                             const size_t stack_index) const
{
    const Step &step(alternative.steps_[step_index]);
    if (not step.matchesElement(element_stack[stack_index]))
        return false;

    if (step_index == 0)
        return not alternative.absolute_ or stack_index == 0;

    if (step.axis_ == Step::CHILD)
        return stack_index > 0 and matchesFrom(alternative, step_index - 1, element_stack, stack_index - 1);

    for (size_t ancestor_index(stack_index); ancestor_index > 0; --ancestor_index) {
        if (matchesFrom(alternative, step_index - 1, element_stack, ancestor_index - 1))
            return true;
    }
    return false;
}


EventSequence MarkupPath::select(const EventSequence &events) const {
    const std::vector<Event> &event_list(*events);

    // For each START event the index of the matching END event, for all other events the event's own index.
    std::vector<size_t> end_indices(event_list.size());
    std::vector<size_t> open_elements;
    for (size_t i(0); i < event_list.size(); ++i) {
        end_indices[i] = i;
        if (event_list[i].getKind() == Event::START)
            open_elements.emplace_back(i);
        else if (event_list[i].getKind() == Event::END and not open_elements.empty()) {
            end_indices[open_elements.back()] = i;
            open_elements.pop_back();
        }
    }
    for (const size_t unclosed_index : open_elements)
        end_indices[unclosed_index] = event_list.size() - 1;

    std::set<size_t> top_level_elements;
    for (size_t i(0); i < event_list.size(); i = end_indices[i] + 1) {
        if (event_list[i].getKind() == Event::START)
            top_level_elements.emplace(i);
    }

    // Keyed by (event index, attribute ordinal) so that results come out in document order.  Whole nodes use ordinal 0,
    // attributes count from 1.
    std::map<std::pair<size_t, size_t>, std::vector<Event>> results;

    for (const auto &alternative : alternatives_) {
        std::set<size_t> context_nodes(top_level_elements);
        bool selected_attributes(false);
        for (const auto &step : alternative.steps_) {
            if (step.isAttributeStep()) {
                for (const size_t context_node : context_nodes) {
                    const Event &start_event(event_list[context_node]);
                    if (start_event.getKind() != Event::START)
                        continue;
                    size_t attribute_ordinal(0);
                    for (const auto &attribute : start_event.getAttributes()) {
                        ++attribute_ordinal;
                        if (step.test_ == Step::ANY_ATTRIBUTE or attribute.name_.getQualifiedName() == step.name_)
                            results[std::make_pair(context_node, attribute_ordinal)] =
                                std::vector<Event>{ Event::MakeText(attribute.getText(), start_event.getPosition()) };
                    }
                }
                selected_attributes = true;
                break;
            }

            std::set<size_t> next_context_nodes;
            for (const size_t context_node : context_nodes) {
                if (step.test_ == Step::SELF) {
                    if (step.matchesElement(event_list[context_node]))
                        next_context_nodes.emplace(context_node);
                    continue;
                }

                const size_t end_index(end_indices[context_node]);
                for (size_t i(context_node + 1); i < end_index;
                     i = (step.axis_ == Step::CHILD ? end_indices[i] + 1 : i + 1))
                {
                    if (step.test_ == Step::TEXT ? event_list[i].getKind() == Event::TEXT : step.matchesElement(event_list[i]))
                        next_context_nodes.emplace(i);
                }
            }
            context_nodes.swap(next_context_nodes);
        }

        if (selected_attributes)
            continue;
        for (const size_t node : context_nodes) {
            results[std::make_pair(node, size_t(0))] =
                std::vector<Event>(event_list.cbegin() + node, event_list.cbegin() + end_indices[node] + 1);
        }
    }

    auto selected_events(std::make_shared<std::vector<Event>>());
    for (const auto &key_and_events : results)
        selected_events->insert(selected_events->end(), key_and_events.second.cbegin(), key_and_events.second.cend());

    return selected_events;
}


} // namespace Markup

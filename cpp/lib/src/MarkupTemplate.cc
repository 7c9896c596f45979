/** \file   MarkupTemplate.cc
 *  \brief  Template compilation and the directive-expanding transform.
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
#include "MarkupTemplate.h"
#include <algorithm>
#include <map>
#include <set>
#include "Expression.h"
#include "MarkupParser.h"
#include "MarkupSerializer.h"
#include "StringUtil.h"
#include "TemplateError.h"
#include "util.h"


namespace Markup {


const std::string Template::NAMESPACE("http://purl.org/kid/ns#");


Template::Template(const std::string &source, const std::string &filename): filename_(filename) {
    pre_filters_.emplace_back(std::make_shared<EvalFilter>());
    post_filters_.emplace_back(std::make_shared<WhitespaceFilter>());
    parse(source);
}


namespace {


// \return The position of the "}" that closes the brace opened right before "start_pos" or std::string::npos.
size_t FindClosingBrace(const std::string &text, const size_t start_pos) {
    unsigned depth(1);
    char quote('\0');
    for (size_t pos(start_pos); pos < text.size(); ++pos) {
        const char ch(text[pos]);
        if (quote != '\0') {
            if (ch == '\\')
                ++pos;
            else if (ch == quote)
                quote = '\0';
        } else if (ch == '\'' or ch == '"')
            quote = ch;
        else if (ch == '{')
            ++depth;
        else if (ch == '}' and --depth == 0)
            return pos;
    }

    return std::string::npos;
}


inline bool IsIdentifierStart(const char ch) {
    return StringUtil::IsAsciiLetter(ch) or ch == '_';
}


inline bool IsIdentifierChar(const char ch) {
    return StringUtil::IsAlphanumeric(ch) or ch == '_';
}


class FragmentCollector {
    std::vector<Fragment> fragments_;
    std::string literal_text_;

public:
    inline void addText(const std::string &text) { literal_text_ += text; }
    inline void addText(const char ch) { literal_text_ += ch; }

    void addExpression(const std::string &expression_source) {
        flushText();
        fragments_.emplace_back(std::make_shared<const Expression>(expression_source));
    }

    std::vector<Fragment> finish() {
        flushText();
        return fragments_;
    }

private:
    void flushText() {
        if (not literal_text_.empty()) {
            fragments_.emplace_back(literal_text_);
            literal_text_.clear();
        }
    }
};


// Scans text that contains no braced interpolations for "$name.name" interpolations and "$$" escapes.
void InterpolateShortForm(const std::string &text, FragmentCollector * const collector) {
    size_t pos(0);
    while (pos < text.size()) {
        if (text[pos] != '$') {
            collector->addText(text[pos++]);
            continue;
        }

        if (pos + 1 < text.size() and text[pos + 1] == '$') {
            collector->addText('$');
            pos += 2;
            continue;
        }

        if (pos + 1 == text.size() or not IsIdentifierStart(text[pos + 1])) {
            collector->addText('$');
            ++pos;
            continue;
        }

        const size_t start_pos(pos + 1);
        size_t end_pos(start_pos);
        for (;;) {
            while (end_pos < text.size() and IsIdentifierChar(text[end_pos]))
                ++end_pos;
            if (end_pos + 1 < text.size() and text[end_pos] == '.' and IsIdentifierStart(text[end_pos + 1]))
                ++end_pos;
            else
                break;
        }
        collector->addExpression(text.substr(start_pos, end_pos - start_pos));
        pos = end_pos;
    }
}


} // unnamed namespace


std::vector<Fragment> Template::Interpolate(const std::string &text) {
    FragmentCollector collector;
    std::string residue; // Text between braced interpolations.
    size_t pos(0);
    while (pos < text.size()) {
        if (text[pos] != '$' or pos + 1 == text.size()) {
            residue += text[pos++];
            continue;
        }

        if (text[pos + 1] == '$') { // Leave the escape to InterpolateShortForm().
            residue += "$$";
            pos += 2;
            continue;
        }

        if (text[pos + 1] == '{') {
            const size_t closing_brace_pos(FindClosingBrace(text, pos + 2));
            if (closing_brace_pos != std::string::npos) {
                const std::string expression_source(StringUtil::TrimWhite(text.substr(pos + 2, closing_brace_pos - pos - 2)));
                if (not expression_source.empty()) {
                    InterpolateShortForm(residue, &collector);
                    residue.clear();
                    collector.addExpression(expression_source);
                    pos = closing_brace_pos + 1;
                    continue;
                }
            }
        }

        residue += text[pos++];
    }
    InterpolateShortForm(residue, &collector);

    return collector.finish();
}


void Template::parse(const std::string &source) {
    EventSequence markup_events;
    try {
        markup_events = MarkupParser(filename_).parse(source);
    } catch (const MarkupParser::Error &x) {
        throw TemplateSyntaxError(x.what(), filename_, x.getLine(), x.getColumn());
    }

    struct PendingDirectives {
        std::vector<Directive> directives_;
        size_t offset_; // Where the START event of the element carrying the directives is in "output".
    };
    std::map<unsigned, PendingDirectives> depths_to_pending_directives;
    std::multiset<std::string> directive_prefixes;
    std::vector<Event> output;
    unsigned depth(0);

    for (const auto &event : *markup_events) {
        switch (event.getKind()) {
        case Event::START_NS:
            if (event.getNamespaceURI() == NAMESPACE)
                directive_prefixes.emplace(event.getPrefix());
            else
                output.emplace_back(event);
            break;
        case Event::END_NS: {
            const auto directive_prefix(directive_prefixes.find(event.getPrefix()));
            if (directive_prefix != directive_prefixes.end())
                directive_prefixes.erase(directive_prefix);
            else
                output.emplace_back(event);
            break;
        }
        case Event::START: {
            std::vector<Directive> directives;
            Attributes attributes;
            for (const auto &attribute : event.getAttributes()) {
                if (attribute.name_.getNamespaceURI() != NAMESPACE) {
                    attributes.set(attribute.name_, Interpolate(attribute.getText()));
                    continue;
                }

                DirectiveRegistry::Factory factory;
                if (unlikely(not DirectiveRegistry::Lookup(attribute.name_.getLocalName(), &factory)))
                    throw BadDirectiveError(attribute.name_.getLocalName(), filename_, event.getPosition().line_);
                directives.emplace_back(factory(attribute.getText(), filename_, event.getPosition(), &filters_));
            }

            if (not directives.empty()) {
                std::stable_sort(directives.begin(), directives.end(), [](const Directive &lhs, const Directive &rhs) {
                    return lhs.getPriority() < rhs.getPriority();
                });
                depths_to_pending_directives.emplace(depth, PendingDirectives{ directives, output.size() });
            }
            output.emplace_back(Event::MakeStart(event.getName(), attributes, event.getPosition()));
            ++depth;
            break;
        }
        case Event::END: {
            --depth;
            output.emplace_back(event);

            const auto pending_directives(depths_to_pending_directives.find(depth));
            if (pending_directives == depths_to_pending_directives.end())
                break;

            const auto sub_events_start(output.begin() + pending_directives->second.offset_);
            const std::shared_ptr<const std::vector<Event>> sub_events(std::make_shared<const std::vector<Event>>(sub_events_start,
                                                                                                                   output.end()));
            const Position sub_position(sub_events->front().getPosition());
            output.erase(sub_events_start, output.end());
            output.emplace_back(Event::MakeSub(std::make_shared<const SubProgram>(pending_directives->second.directives_, sub_events),
                                               sub_position));
            depths_to_pending_directives.erase(pending_directives);
            break;
        }
        case Event::TEXT:
            for (const auto &fragment : Interpolate(event.getText())) {
                if (fragment.isExpression())
                    output.emplace_back(Event::MakeExpression(fragment.getExpression(), event.getPosition()));
                else
                    output.emplace_back(Event::MakeText(fragment.getText(), event.getPosition()));
            }
            break;
        default:
            output.emplace_back(event);
        }
    }

    events_ = std::make_shared<const std::vector<Event>>(output);
    LOG_DEBUG("compiled \"" + filename_ + "\" into " + std::to_string(events_->size()) + " top-level event(s) and "
              + std::to_string(filters_.size()) + " match filter(s)");
}


std::unique_ptr<EventStream> Template::applyFilters(std::unique_ptr<EventStream> stream, Context * const context) const {
    for (const auto &filter : pre_filters_)
        stream = filter->apply(std::move(stream), context);
    for (const auto &filter : filters_)
        stream = filter->apply(std::move(stream), context);
    return stream;
}


namespace {


/** Expands SUB events by applying their directives in reverse priority order and filtering the results.  Nested SUB
    events are handled iteratively with a stack of streams. */
class TransformStream final : public EventStream {
    const Template &template_;
    Context *context_;
    std::vector<std::unique_ptr<EventStream>> streams_; // We always pull from the last one.
    Position last_position_;

public:
    TransformStream(const Template &tmpl, Context * const context, std::unique_ptr<EventStream> stream)
        : template_(tmpl), context_(context)
    {
        streams_.emplace_back(std::move(stream));
    }

    bool getNext(Event * const event) override;

private:
    bool expandNext(Event * const event);
};


bool TransformStream::getNext(Event * const event) {
    try {
        return expandNext(event);
    } catch (const ExpressionSyntaxError &x) {
        const Position position(x.hasPosition() ? x.getPosition() : last_position_);
        throw TemplateSyntaxError(x.what(), template_.getFilename(), position.line_, position.column_ + x.getOffset());
    } catch (const EvaluationError &x) {
        const Position position(x.hasPosition() ? x.getPosition() : last_position_);
        throw TemplateEvaluationError(x.what(), template_.getFilename(), position.line_, position.column_);
    }
}


bool TransformStream::expandNext(Event * const event) {
    while (not streams_.empty()) {
        if (not streams_.back()->getNext(event)) {
            streams_.pop_back();
            continue;
        }

        last_position_ = event->getPosition();
        if (event->getKind() != Event::SUB)
            return true;

        const std::shared_ptr<const SubProgram> sub_program(event->getSubProgram());
        std::unique_ptr<EventStream> stream(MakeStream(sub_program->events_));
        for (auto directive(sub_program->directives_.crbegin()); directive != sub_program->directives_.crend(); ++directive)
            stream = directive->apply(std::move(stream), context_);
        streams_.emplace_back(template_.applyFilters(std::move(stream), context_));
    }

    return false;
}


} // unnamed namespace


std::unique_ptr<EventStream> Template::generate(Context * const context) const {
    std::unique_ptr<EventStream> stream(new TransformStream(*this, context, applyFilters(MakeStream(events_), context)));
    for (const auto &filter : post_filters_)
        stream = filter->apply(std::move(stream), context);
    return stream;
}


std::string Template::render(Context * const context) const {
    const std::unique_ptr<EventStream> stream(generate(context));
    return XmlSerializer::ToString(stream.get());
}


} // namespace Markup

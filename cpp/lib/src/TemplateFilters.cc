/** \file   TemplateFilters.cc
 *  \brief  Implementation of the template stream filters.
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
#include "TemplateFilters.h"
#include <set>
#include "MarkupTemplate.h"
#include "StringUtil.h"
#include "TemplateError.h"
#include "TemplateLoader.h"
#include "util.h"


namespace Markup {


namespace {


class EvalStream final : public EventStream {
    Context *context_;
    std::vector<std::shared_ptr<EventStream>> streams_; // We always pull from the last one.

public:
    EvalStream(Context * const context, std::unique_ptr<EventStream> upstream): context_(context) {
        streams_.emplace_back(std::move(upstream));
    }

    bool getNext(Event * const event) override;

private:
    Event evaluateAttributes(const Event &start_event) const;
};


bool EvalStream::getNext(Event * const event) {
    while (not streams_.empty()) {
        if (not streams_.back()->getNext(event)) {
            streams_.pop_back();
            continue;
        }

        try {
            if (event->getKind() == Event::START) {
                *event = evaluateAttributes(*event);
                return true;
            }
            if (event->getKind() != Event::EXPR)
                return true;

            const Value result(event->getExpression()->evaluate(*context_));
            if (result.isNull())
                continue;
            if (result.getType() == Value::STREAM) {
                streams_.emplace_back(result.getStream());
                continue;
            }
            *event = Event::MakeText(result.toString(), event->getPosition());
            return true;
        } catch (ExpressionError &x) {
            x.setPositionIfUnset(event->getPosition());
            throw;
        }
    }

    return false;
}


Event EvalStream::evaluateAttributes(const Event &start_event) const {
    bool all_literal(true);
    for (const auto &attribute : start_event.getAttributes()) {
        if (not attribute.isLiteral()) {
            all_literal = false;
            break;
        }
    }
    if (all_literal)
        return start_event;

    Attributes evaluated_attributes;
    for (const auto &attribute : start_event.getAttributes()) {
        if (attribute.isLiteral()) {
            evaluated_attributes.set(attribute.name_, attribute.value_);
            continue;
        }

        std::string value;
        bool keep(false);
        for (const auto &fragment : attribute.value_) {
            if (not fragment.isExpression()) {
                value += fragment.getText();
                keep = true;
                continue;
            }

            const Value result(fragment.getExpression()->evaluate(*context_));
            if (not result.isNull()) {
                value += result.toString();
                keep = true;
            }
        }
        if (keep)
            evaluated_attributes.set(attribute.name_, value);
    }

    return Event::MakeStart(start_event.getName(), evaluated_attributes, start_event.getPosition());
}


// The "select" function bound while a match template is expanded.
class SelectFunction final : public Callable {
    EventSequence matched_events_;

public:
    explicit SelectFunction(const EventSequence &matched_events): matched_events_(matched_events) { }

    std::string getName() const override { return "select"; }
    Value call(const std::vector<Value> &positional_args, const std::map<std::string, Value> &keyword_args) const override;
};


Value SelectFunction::call(const std::vector<Value> &positional_args, const std::map<std::string, Value> &/*keyword_args*/) const {
    if (unlikely(positional_args.size() != 1 or positional_args[0].getType() != Value::STRING))
        throw EvaluationError("in Markup::SelectFunction::call: select() takes exactly one string argument!");

    try {
        const MarkupPath path(positional_args[0].getString());
        return Value(std::shared_ptr<EventStream>(MakeStream(path.select(matched_events_))));
    } catch (const MarkupPath::Error &x) {
        throw EvaluationError(x.what());
    }
}


class MatchStream final : public EventStream {
    const MarkupPath path_;
    std::shared_ptr<const CapturedBody> body_;
    std::unique_ptr<EventStream> upstream_;
    std::vector<Event> element_stack_; // START events of the currently open elements.

public:
    MatchStream(const MarkupPath &path, const std::shared_ptr<const CapturedBody> &body, std::unique_ptr<EventStream> upstream)
        : path_(path), body_(body), upstream_(std::move(upstream)) { }

    bool getNext(Event * const event) override;

private:
    Event collectMatch(const Event &start_event);
};


bool MatchStream::getNext(Event * const event) {
    if (not upstream_->getNext(event))
        return false;

    if (event->getKind() == Event::START) {
        element_stack_.emplace_back(*event);
        if (path_.matches(element_stack_)) {
            element_stack_.pop_back();
            *event = collectMatch(*event);
        }
    } else if (event->getKind() == Event::END and not element_stack_.empty())
        element_stack_.pop_back();

    return true;
}


Event MatchStream::collectMatch(const Event &start_event) {
    auto matched_events(std::make_shared<std::vector<Event>>());
    matched_events->emplace_back(start_event);

    unsigned depth(1);
    Event event;
    while (depth > 0 and upstream_->getNext(&event)) {
        if (event.getKind() == Event::START)
            ++depth;
        else if (event.getKind() == Event::END)
            --depth;
        matched_events->emplace_back(event);
    }

    const EventSequence matched_sequence(matched_events);
    const std::shared_ptr<const CapturedBody> body(body_);
    const Directive expansion(Directive::MakeCustom(
        "match", Directive::CUSTOM, "",
        [body, matched_sequence](std::unique_ptr<EventStream> /*stream*/, Context * const context,
                                 const std::shared_ptr<const Expression> &/*expression*/) {
            const Context::Frame frame{ { "select", Value(std::shared_ptr<const Callable>(new SelectFunction(matched_sequence))) } };
            return MakeScopedReplayStream(context, frame, body->getEvents());
        }));

    return Event::MakeSub(std::make_shared<const SubProgram>(std::vector<Directive>{ expansion },
                                                             std::make_shared<const std::vector<Event>>()),
                          start_event.getPosition());
}


class IncludeStream final : public EventStream {
    std::weak_ptr<TemplateLoader *> loader_;
    const std::string including_filename_;
    Context *context_;
    std::unique_ptr<EventStream> upstream_;
    std::set<std::string> xinclude_prefixes_;
    std::shared_ptr<const Template> included_template_;
    std::unique_ptr<EventStream> included_stream_;
    std::string indentation_;

public:
    IncludeStream(const std::weak_ptr<TemplateLoader *> &loader, const std::string &including_filename, Context * const context,
                  std::unique_ptr<EventStream> upstream)
        : loader_(loader), including_filename_(including_filename), context_(context), upstream_(std::move(upstream)) { }

    bool getNext(Event * const event) override;

private:
    void processInclude(const Event &include_event);
};


bool IncludeStream::getNext(Event * const event) {
    for (;;) {
        if (included_stream_ != nullptr) {
            if (included_stream_->getNext(event)) {
                if (event->getKind() == Event::TEXT and not indentation_.empty()) {
                    std::string text(event->getText());
                    StringUtil::ReplaceString("\n", "\n" + indentation_, &text);
                    *event = Event::MakeText(text, event->getPosition());
                }
                return true;
            }
            included_stream_.reset();
        }

        if (not upstream_->getNext(event))
            return false;

        switch (event->getKind()) {
        case Event::START_NS:
            if (event->getNamespaceURI() != IncludeFilter::NAMESPACE)
                return true;
            xinclude_prefixes_.emplace(event->getPrefix());
            break;
        case Event::END_NS:
            if (xinclude_prefixes_.erase(event->getPrefix()) == 0)
                return true;
            break;
        case Event::START:
            if (event->getName() != QName(IncludeFilter::NAMESPACE, "", "include"))
                return true;
            processInclude(*event);
            break;
        default:
            return true;
        }
    }
}


void IncludeStream::processInclude(const Event &include_event) {
    const QName fallback_name(IncludeFilter::NAMESPACE, "", "fallback");

    // Consume the rest of the include element, keeping the contents of a fallback child element.
    auto fallback_events(std::make_shared<std::vector<Event>>());
    bool has_fallback(false), in_fallback(false);
    unsigned depth(1);
    Event event;
    while (depth > 0 and upstream_->getNext(&event)) {
        if (event.getKind() == Event::START) {
            ++depth;
            if (depth == 2 and not in_fallback and event.getName() == fallback_name) {
                has_fallback = in_fallback = true;
                continue;
            }
        } else if (event.getKind() == Event::END) {
            --depth;
            if (depth == 1 and in_fallback) {
                in_fallback = false;
                continue;
            }
        }
        if (in_fallback)
            fallback_events->emplace_back(event);
    }

    const Attributes &attributes(include_event.getAttributes());
    if (unlikely(not attributes.has("href")))
        throw TemplateError("in Markup::IncludeStream::processInclude: include without an \"href\" attribute ("
                            + including_filename_ + ", line " + std::to_string(include_event.getPosition().line_) + ")!");
    const std::string href(attributes.getText("href"));

    const std::shared_ptr<TemplateLoader *> loader(loader_.lock());
    if (unlikely(loader == nullptr))
        throw TemplateError("in Markup::IncludeStream::processInclude: can't include \"" + href + "\" from " + including_filename_
                            + ", the template loader no longer exists!");

    try {
        included_template_ = (*loader)->load(href, including_filename_);
    } catch (const TemplateNotFound &x) {
        if (not has_fallback)
            throw;
        LOG_WARNING(std::string(x.what()) + ", using the fallback content instead");
        indentation_.clear();
        included_stream_ = MakeStream(fallback_events);
        return;
    }

    indentation_ = std::string(include_event.getPosition().column_, ' ');
    included_stream_ = included_template_->generate(context_);

    // Match templates defined in the included template also apply to the remainder of the including template.
    for (const auto &filter : included_template_->getFilters())
        upstream_ = filter->apply(std::move(upstream_), context_);
}


// Removes spaces and tabs at the ends of lines and collapses runs of newlines into a single newline.
std::string NormaliseWhitespace(const std::string &text) {
    std::string normalised_text;
    normalised_text.reserve(text.size());
    for (const char ch : text) {
        if (ch == '\n') {
            while (not normalised_text.empty() and (normalised_text.back() == ' ' or normalised_text.back() == '\t'))
                normalised_text.pop_back();
            if (not normalised_text.empty() and normalised_text.back() == '\n')
                continue;
        }
        normalised_text += ch;
    }

    return normalised_text;
}


class WhitespaceStream final : public EventStream {
    std::unique_ptr<EventStream> upstream_;
    bool have_pending_event_;
    Event pending_event_;

public:
    explicit WhitespaceStream(std::unique_ptr<EventStream> upstream): upstream_(std::move(upstream)), have_pending_event_(false) { }

    bool getNext(Event * const event) override;
};


bool WhitespaceStream::getNext(Event * const event) {
    if (have_pending_event_) {
        *event = pending_event_;
        have_pending_event_ = false;
        return true;
    }

    std::string text;
    bool have_text(false);
    Position text_position;
    Event next_event;
    while (upstream_->getNext(&next_event)) {
        if (next_event.getKind() == Event::TEXT) {
            if (not have_text) {
                text_position = next_event.getPosition();
                have_text = true;
            }
            text += next_event.getText();
            continue;
        }

        if (not have_text) {
            *event = next_event;
            return true;
        }

        pending_event_ = next_event;
        have_pending_event_ = true;
        break;
    }

    if (not have_text)
        return false;
    *event = Event::MakeText(NormaliseWhitespace(text), text_position);
    return true;
}


} // unnamed namespace


std::unique_ptr<EventStream> EvalFilter::apply(std::unique_ptr<EventStream> stream, Context * const context) const {
    return std::unique_ptr<EventStream>(new EvalStream(context, std::move(stream)));
}


std::unique_ptr<EventStream> MatchFilter::apply(std::unique_ptr<EventStream> stream, Context * const /*context*/) const {
    return std::unique_ptr<EventStream>(new MatchStream(path_, body_, std::move(stream)));
}


const std::string IncludeFilter::NAMESPACE("http://www.w3.org/2001/XInclude");


std::unique_ptr<EventStream> IncludeFilter::apply(std::unique_ptr<EventStream> stream, Context * const context) const {
    return std::unique_ptr<EventStream>(new IncludeStream(loader_, including_filename_, context, std::move(stream)));
}


std::unique_ptr<EventStream> WhitespaceFilter::apply(std::unique_ptr<EventStream> stream, Context * const /*context*/) const {
    return std::unique_ptr<EventStream>(new WhitespaceStream(std::move(stream)));
}


} // namespace Markup

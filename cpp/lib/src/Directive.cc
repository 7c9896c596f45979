/** \file   Directive.cc
 *  \brief  Implementation of the built-in template directives and the directive registry.
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
#include "Directive.h"
#include <map>
#include "MarkupPath.h"
#include "StringUtil.h"
#include "TemplateError.h"
#include "TemplateFilters.h"
#include "util.h"


namespace Markup {


void CapturedBody::captureOnce(EventStream * const stream) {
    std::call_once(capture_once_, [this, stream]() {
        events_ = DrainStream(stream);
        captured_.store(true, std::memory_order_release);
    });
}


EventSequence CapturedBody::getEvents() const {
    if (not captured_.load(std::memory_order_acquire))
        return std::make_shared<const std::vector<Event>>();
    return events_;
}


namespace {


class ScopedReplayStream final : public EventStream {
    Context *context_;
    Context::Frame frame_;
    EventSequence events_;
    size_t next_index_;
    bool done_;
    std::unique_ptr<ScopedFrame> scoped_frame_;

public:
    ScopedReplayStream(Context * const context, const Context::Frame &frame, const EventSequence &events)
        : context_(context), frame_(frame), events_(events), next_index_(0), done_(false) { }

    bool getNext(Event * const event) override;
};


bool ScopedReplayStream::getNext(Event * const event) {
    if (done_)
        return false;

    if (scoped_frame_ == nullptr)
        scoped_frame_.reset(new ScopedFrame(context_, frame_));

    if (next_index_ < events_->size()) {
        *event = (*events_)[next_index_++];
        return true;
    }

    scoped_frame_.reset();
    done_ = true;
    return false;
}


// Replays its buffered input once per item of the iterable, each time with the loop targets bound in a fresh frame.
class ForStream final : public EventStream {
    Context *context_;
    const std::vector<std::string> targets_;
    std::shared_ptr<const Expression> expression_;
    std::unique_ptr<EventStream> upstream_;
    bool started_;
    EventSequence body_;
    Value::List items_;
    size_t next_item_index_, next_event_index_;
    std::unique_ptr<ScopedFrame> scoped_frame_;

public:
    ForStream(Context * const context, const std::vector<std::string> &targets, const std::shared_ptr<const Expression> &expression,
              std::unique_ptr<EventStream> upstream)
        : context_(context), targets_(targets), expression_(expression), upstream_(std::move(upstream)), started_(false),
          next_item_index_(0), next_event_index_(0) { }

    bool getNext(Event * const event) override;

private:
    Context::Frame makeFrame(const Value &item) const;
};


bool ForStream::getNext(Event * const event) {
    if (not started_) {
        started_ = true;
        const Value iterable(expression_->evaluate(*context_));
        if (iterable.isNull())
            return false;
        items_ = iterable.getIterationItems();
        body_ = DrainStream(upstream_.get());
    }

    for (;;) {
        if (scoped_frame_ != nullptr) {
            if (next_event_index_ < body_->size()) {
                *event = (*body_)[next_event_index_++];
                return true;
            }
            scoped_frame_.reset(); // Must pop before the next iteration pushes.
        }

        if (next_item_index_ >= items_.size())
            return false;
        scoped_frame_.reset(new ScopedFrame(context_, makeFrame(items_[next_item_index_++])));
        next_event_index_ = 0;
    }
}


Context::Frame ForStream::makeFrame(const Value &item) const {
    Context::Frame frame;
    if (targets_.size() == 1) {
        frame[targets_.front()] = item;
        return frame;
    }

    if (unlikely(item.getType() != Value::LIST or item.getList().size() < targets_.size()))
        throw EvaluationError("in Markup::ForStream::makeFrame: can't unpack " + item.toRepresentation() + " into "
                              + std::to_string(targets_.size()) + " loop variables!");
    for (size_t i(0); i < targets_.size(); ++i)
        frame[targets_[i]] = item.getList()[i];

    return frame;
}


Event MergeAttributes(const Event &start_event, const Value &new_attributes) {
    Value::List names_and_values;
    if (new_attributes.getType() == Value::MAP) {
        for (const auto &name_and_value : new_attributes.getMap())
            names_and_values.emplace_back(Value::List{ Value(name_and_value.first), name_and_value.second });
    } else if (new_attributes.getType() == Value::LIST)
        names_and_values = new_attributes.getList();
    else
        throw EvaluationError("in Markup::MergeAttributes: expected a dict or a list of pairs but found a value of type "
                              + Value::TypeToString(new_attributes.getType()) + "!");

    Attributes attributes(start_event.getAttributes());
    for (const auto &name_and_value : names_and_values) {
        if (unlikely(name_and_value.getType() != Value::LIST or name_and_value.getList().size() != 2
                     or name_and_value.getList()[0].getType() != Value::STRING))
            throw EvaluationError("in Markup::MergeAttributes: expected a (name, value) pair but found "
                                  + name_and_value.toRepresentation() + "!");

        const std::string &name(name_and_value.getList()[0].getString());
        const Value &value(name_and_value.getList()[1]);
        if (value.isNull())
            attributes.remove(name);
        else
            attributes.set(QName(name), StringUtil::TrimWhite(value.toString()));
    }

    return Event::MakeStart(start_event.getName(), attributes, start_event.getPosition());
}


class AttrsStream final : public EventStream {
    Context *context_;
    std::shared_ptr<const Expression> expression_;
    std::unique_ptr<EventStream> upstream_;
    bool started_;

public:
    AttrsStream(Context * const context, const std::shared_ptr<const Expression> &expression, std::unique_ptr<EventStream> upstream)
        : context_(context), expression_(expression), upstream_(std::move(upstream)), started_(false) { }

    bool getNext(Event * const event) override;
};


bool AttrsStream::getNext(Event * const event) {
    if (started_)
        return upstream_->getNext(event);

    started_ = true;
    if (not upstream_->getNext(event))
        return false;
    if (event->getKind() == Event::START) {
        const Value new_attributes(expression_->evaluate(*context_));
        if (new_attributes.isTrue())
            *event = MergeAttributes(*event, new_attributes);
    }

    return true;
}


// Emits the START event, then a single EXPR event in place of the element's content, then the last event, i.e. the END event.
class ContentStream final : public EventStream {
    enum State { INITIAL, EXPRESSION, LAST_EVENT, DONE };

    std::shared_ptr<const Expression> expression_;
    std::unique_ptr<EventStream> upstream_;
    State state_;
    Position position_;

public:
    ContentStream(const std::shared_ptr<const Expression> &expression, std::unique_ptr<EventStream> upstream)
        : expression_(expression), upstream_(std::move(upstream)), state_(INITIAL) { }

    bool getNext(Event * const event) override;
};


bool ContentStream::getNext(Event * const event) {
    if (state_ == INITIAL) {
        Event first_event;
        if (not upstream_->getNext(&first_event)) {
            state_ = DONE;
            return false;
        }
        position_ = first_event.getPosition();
        state_ = EXPRESSION;
        if (first_event.getKind() == Event::START) {
            *event = first_event;
            return true;
        }
    }

    if (state_ == EXPRESSION) {
        *event = Event::MakeExpression(expression_, position_);
        state_ = LAST_EVENT;
        return true;
    }

    if (state_ == LAST_EVENT) {
        state_ = DONE;
        bool have_last_event(false);
        Event next_event;
        while (upstream_->getNext(&next_event)) {
            *event = next_event;
            have_last_event = true;
        }
        return have_last_event;
    }

    return false;
}


class ReplaceStream final : public EventStream {
    std::shared_ptr<const Expression> expression_;
    std::unique_ptr<EventStream> upstream_;
    bool done_;

public:
    ReplaceStream(const std::shared_ptr<const Expression> &expression, std::unique_ptr<EventStream> upstream)
        : expression_(expression), upstream_(std::move(upstream)), done_(false) { }

    bool getNext(Event * const event) override {
        if (done_)
            return false;
        done_ = true;

        Event first_event;
        if (not upstream_->getNext(&first_event))
            return false;
        *event = Event::MakeExpression(expression_, first_event.getPosition());
        return true;
    }
};


// Drops the first and the last event if the expression is true or absent.
class StripStream final : public EventStream {
    Context *context_;
    std::shared_ptr<const Expression> expression_;
    std::unique_ptr<EventStream> upstream_;
    bool started_, strip_, done_;
    Event previous_event_;

public:
    StripStream(Context * const context, const std::shared_ptr<const Expression> &expression, std::unique_ptr<EventStream> upstream)
        : context_(context), expression_(expression), upstream_(std::move(upstream)), started_(false), strip_(false), done_(false) { }

    bool getNext(Event * const event) override;
};


bool StripStream::getNext(Event * const event) {
    if (not started_) {
        started_ = true;
        strip_ = expression_ == nullptr or expression_->evaluate(*context_).isTrue();
        if (strip_) {
            Event start_event;
            if (not upstream_->getNext(&start_event) or not upstream_->getNext(&previous_event_))
                done_ = true;
        }
    }

    if (not strip_)
        return upstream_->getNext(event);
    if (done_)
        return false;

    Event next_event;
    if (not upstream_->getNext(&next_event)) {
        done_ = true;
        return false;
    }
    *event = previous_event_;
    previous_event_ = next_event;
    return true;
}


} // unnamed namespace


std::unique_ptr<EventStream> MakeScopedReplayStream(Context * const context, const Context::Frame &frame,
                                                    const EventSequence &events)
{
    return std::unique_ptr<EventStream>(new ScopedReplayStream(context, frame, events));
}


Value TemplateFunction::call(const std::vector<Value> &positional_args, const std::map<std::string, Value> &keyword_args) const {
    Context::Frame frame;
    for (size_t i(0); i < signature_->parameters_.size(); ++i) {
        const FunctionSignature::Parameter &parameter(signature_->parameters_[i]);
        if (i < positional_args.size()) {
            frame[parameter.name_] = positional_args[i];
            continue;
        }

        const auto name_and_value(keyword_args.find(parameter.name_));
        if (name_and_value != keyword_args.cend())
            frame[parameter.name_] = name_and_value->second;
        else if (parameter.default_ != nullptr)
            frame[parameter.name_] = parameter.default_->evaluate(*context_);
        else
            frame[parameter.name_] = Value::None();
    }

    return Value(std::shared_ptr<EventStream>(MakeScopedReplayStream(context_, frame, body_->getEvents())));
}


std::unique_ptr<EventStream> Directive::apply(std::unique_ptr<EventStream> stream, Context * const context) const {
    switch (type_) {
    case DEF:
        body_->captureOnce(stream.get());
        context->set(signature_->name_, Value(std::shared_ptr<const Callable>(new TemplateFunction(context, signature_, body_))));
        return MakeEmptyStream();
    case MATCH:
        body_->captureOnce(stream.get());
        return MakeEmptyStream();
    case FOR:
        return std::unique_ptr<EventStream>(new ForStream(context, targets_, expression_, std::move(stream)));
    case IF:
        if (expression_->evaluate(*context).isTrue())
            return stream;
        return MakeEmptyStream();
    case REPLACE:
        return std::unique_ptr<EventStream>(new ReplaceStream(expression_, std::move(stream)));
    case CONTENT:
        return std::unique_ptr<EventStream>(new ContentStream(expression_, std::move(stream)));
    case ATTRS:
        return std::unique_ptr<EventStream>(new AttrsStream(context, expression_, std::move(stream)));
    case STRIP:
        return std::unique_ptr<EventStream>(new StripStream(context, expression_, std::move(stream)));
    case CUSTOM:
        return custom_implementation_(std::move(stream), context, expression_);
    }

    throw ImplementationError("in Markup::Directive::apply: unknown directive type " + std::to_string(type_) + "!");
}


std::shared_ptr<const Expression> Directive::CompileRequiredExpression(const std::string &directive_name, const std::string &value,
                                                                       const std::string &filename, const Position &position)
{
    const std::string expression_source(StringUtil::TrimWhite(value));
    if (unlikely(expression_source.empty()))
        throw TemplateSyntaxError("The \"" + directive_name + "\" directive requires an expression", filename, position.line_,
                                  position.column_);
    return std::make_shared<const Expression>(expression_source);
}


Directive Directive::MakeDef(const std::string &value, const std::string &filename, const Position &position) {
    Directive directive(DEF, "def", DEF);
    try {
        directive.signature_ = std::make_shared<const FunctionSignature>(ParseFunctionSignature(value));
    } catch (const ExpressionSyntaxError &x) {
        throw TemplateSyntaxError(x.what(), filename, position.line_, position.column_ + x.getOffset());
    }
    directive.body_ = std::make_shared<CapturedBody>();

    return directive;
}


Directive Directive::MakeMatch(const std::string &value, const std::string &filename, const Position &position,
                               FilterList * const runtime_filters)
{
    Directive directive(MATCH, "match", MATCH);
    directive.body_ = std::make_shared<CapturedBody>();
    try {
        runtime_filters->emplace_back(std::make_shared<MatchFilter>(MarkupPath(value), directive.body_));
    } catch (const MarkupPath::Error &x) {
        throw TemplateSyntaxError(x.what(), filename, position.line_, position.column_);
    }
    LOG_DEBUG("registered a match template for \"" + value + "\" in " + filename);

    return directive;
}


Directive Directive::MakeFor(const std::string &value, const std::string &filename, const Position &position) {
    const size_t in_pos(value.find(" in "));
    if (unlikely(in_pos == std::string::npos))
        throw TemplateSyntaxError("\"for\" directive must be of the form \"targets in expression\", found \"" + value + "\"",
                                  filename, position.line_, position.column_);

    Directive directive(FOR, "for", FOR);
    std::vector<std::string> targets;
    StringUtil::Split(value.substr(0, in_pos), ',', &targets, /* suppress_empty = */ false);
    for (auto &target : targets) {
        StringUtil::TrimWhite(&target);
        if (unlikely(target.empty()))
            throw TemplateSyntaxError("empty loop variable in \"for\" directive \"" + value + "\"", filename, position.line_,
                                      position.column_);
        directive.targets_.emplace_back(target);
    }
    directive.expression_ = CompileRequiredExpression("for", value.substr(in_pos + 4), filename, position);

    return directive;
}


Directive Directive::MakeIf(const std::string &value, const std::string &filename, const Position &position) {
    Directive directive(IF, "if", IF);
    directive.expression_ = CompileRequiredExpression("if", value, filename, position);
    return directive;
}


Directive Directive::MakeReplace(const std::string &value, const std::string &filename, const Position &position) {
    Directive directive(REPLACE, "replace", REPLACE);
    directive.expression_ = CompileRequiredExpression("replace", value, filename, position);
    return directive;
}


Directive Directive::MakeContent(const std::string &value, const std::string &filename, const Position &position) {
    Directive directive(CONTENT, "content", CONTENT);
    directive.expression_ = CompileRequiredExpression("content", value, filename, position);
    return directive;
}


Directive Directive::MakeAttrs(const std::string &value, const std::string &filename, const Position &position) {
    Directive directive(ATTRS, "attrs", ATTRS);
    directive.expression_ = CompileRequiredExpression("attrs", value, filename, position);
    return directive;
}


// An empty value means "always strip".
Directive Directive::MakeStrip(const std::string &value, const std::string &/*filename*/, const Position &/*position*/) {
    Directive directive(STRIP, "strip", STRIP);
    const std::string expression_source(StringUtil::TrimWhite(value));
    if (not expression_source.empty())
        directive.expression_ = std::make_shared<const Expression>(expression_source);
    return directive;
}


Directive Directive::MakeCustom(const std::string &name, const unsigned priority, const std::string &value,
                                const CustomImplementation &implementation)
{
    Directive directive(CUSTOM, name, priority);
    const std::string expression_source(StringUtil::TrimWhite(value));
    if (not expression_source.empty())
        directive.expression_ = std::make_shared<const Expression>(expression_source);
    directive.custom_implementation_ = implementation;
    return directive;
}


namespace {


std::mutex custom_directives_mutex;
std::map<std::string, DirectiveRegistry::Factory> custom_directives;


const std::map<std::string, DirectiveRegistry::Factory> &GetBuiltinDirectives() {
    static const std::map<std::string, DirectiveRegistry::Factory> builtin_directives{
        { "def",
          [](const std::string &value, const std::string &filename, const Position &position, FilterList * const) {
              return Directive::MakeDef(value, filename, position);
          } },
        { "match",
          [](const std::string &value, const std::string &filename, const Position &position, FilterList * const runtime_filters) {
              return Directive::MakeMatch(value, filename, position, runtime_filters);
          } },
        { "for",
          [](const std::string &value, const std::string &filename, const Position &position, FilterList * const) {
              return Directive::MakeFor(value, filename, position);
          } },
        { "if",
          [](const std::string &value, const std::string &filename, const Position &position, FilterList * const) {
              return Directive::MakeIf(value, filename, position);
          } },
        { "replace",
          [](const std::string &value, const std::string &filename, const Position &position, FilterList * const) {
              return Directive::MakeReplace(value, filename, position);
          } },
        { "content",
          [](const std::string &value, const std::string &filename, const Position &position, FilterList * const) {
              return Directive::MakeContent(value, filename, position);
          } },
        { "attrs",
          [](const std::string &value, const std::string &filename, const Position &position, FilterList * const) {
              return Directive::MakeAttrs(value, filename, position);
          } },
        { "strip",
          [](const std::string &value, const std::string &filename, const Position &position, FilterList * const) {
              return Directive::MakeStrip(value, filename, position);
          } },
    };

    return builtin_directives;
}


} // unnamed namespace


bool DirectiveRegistry::Lookup(const std::string &name, Factory * const factory) {
    const auto &builtin_directives(GetBuiltinDirectives());
    const auto name_and_factory(builtin_directives.find(name));
    if (name_and_factory != builtin_directives.cend()) {
        *factory = name_and_factory->second;
        return true;
    }

    std::lock_guard<std::mutex> lock(custom_directives_mutex);
    const auto custom_name_and_factory(custom_directives.find(name));
    if (custom_name_and_factory == custom_directives.cend())
        return false;
    *factory = custom_name_and_factory->second;
    return true;
}


void DirectiveRegistry::Register(const std::string &name, const Directive::CustomImplementation &implementation) {
    if (unlikely(GetBuiltinDirectives().find(name) != GetBuiltinDirectives().cend()))
        throw std::invalid_argument("in Markup::DirectiveRegistry::Register: \"" + name + "\" is a built-in directive!");

    std::lock_guard<std::mutex> lock(custom_directives_mutex);
    if (unlikely(custom_directives.find(name) != custom_directives.cend()))
        throw std::invalid_argument("in Markup::DirectiveRegistry::Register: \"" + name + "\" has already been registered!");

    const unsigned priority(Directive::CUSTOM + static_cast<unsigned>(custom_directives.size()));
    custom_directives[name] = [name, priority, implementation](const std::string &value, const std::string &, const Position &,
                                                               FilterList * const) {
        return Directive::MakeCustom(name, priority, value, implementation);
    };
    LOG_DEBUG("registered the custom directive \"" + name + "\"");
}


} // namespace Markup

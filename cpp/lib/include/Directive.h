/** \file   Directive.h
 *  \brief  Template directives, i.e. the transforms attached to elements via attributes in the directive namespace.
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


#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "Context.h"
#include "Expression.h"
#include "MarkupEvent.h"


namespace Markup {


class Filter;
typedef std::vector<std::shared_ptr<const Filter>> FilterList;


/** \brief An event sequence that is captured exactly once, the first time a function-definition or structural-match
 *         directive is applied, and shared by all later applications.
 */
class CapturedBody {
    std::once_flag capture_once_;
    std::atomic<bool> captured_;
    EventSequence events_;

public:
    CapturedBody(): captured_(false) { }
    CapturedBody(const CapturedBody &rhs) = delete;
    CapturedBody &operator=(const CapturedBody &rhs) = delete;

    /** \brief Drains "stream" unless a body has already been captured, in which case "stream" is left untouched. */
    void captureOnce(EventStream * const stream);

    /** \return The captured events or an empty sequence if nothing has been captured yet. */
    EventSequence getEvents() const;
};


/** \brief A directive as attached to a SUB event.
 *
 *  Directives are immutable values created at parse time.  Only the function-definition and structural-match kinds carry
 *  mutable state, their shared CapturedBody.
 */
class Directive {
public:
    // In canonical priority order, highest first.  At runtime the directives of an element are applied in reverse order,
    // so that STRIP wraps the element's events first and DEF wraps last.
    enum Type { DEF, MATCH, FOR, IF, REPLACE, CONTENT, ATTRS, STRIP, CUSTOM };

    typedef std::function<std::unique_ptr<EventStream>(std::unique_ptr<EventStream> stream, Context * const context,
                                                       const std::shared_ptr<const Expression> &expression)>
        CustomImplementation;

private:
    Type type_;
    std::string name_;
    unsigned priority_;
    std::shared_ptr<const Expression> expression_;
    std::vector<std::string> targets_;                   // FOR only.
    std::shared_ptr<const FunctionSignature> signature_; // DEF only.
    std::shared_ptr<CapturedBody> body_;                 // DEF and MATCH only.
    CustomImplementation custom_implementation_;         // CUSTOM only.

    Directive(const Type type, const std::string &name, const unsigned priority): type_(type), name_(name), priority_(priority) { }

public:
    inline Type getType() const { return type_; }

    /** \return The local name of the directive attribute, e.g. "for". */
    inline const std::string &getName() const { return name_; }

    /** \return The sort key, lower values have a higher priority. */
    inline unsigned getPriority() const { return priority_; }

    /** \return The compiled value expression, may be null. */
    inline const std::shared_ptr<const Expression> &getExpression() const { return expression_; }

    /** \brief Transforms "stream", which starts with the START event of the element carrying this directive.
     *  \note  IF, DEF and MATCH evaluate or capture immediately, all other kinds evaluate when the returned stream is
     *         first pulled from.
     */
    std::unique_ptr<EventStream> apply(std::unique_ptr<EventStream> stream, Context * const context) const;

    static Directive MakeDef(const std::string &value, const std::string &filename, const Position &position);
    static Directive MakeMatch(const std::string &value, const std::string &filename, const Position &position,
                               FilterList * const runtime_filters);
    static Directive MakeFor(const std::string &value, const std::string &filename, const Position &position);
    static Directive MakeIf(const std::string &value, const std::string &filename, const Position &position);
    static Directive MakeReplace(const std::string &value, const std::string &filename, const Position &position);
    static Directive MakeContent(const std::string &value, const std::string &filename, const Position &position);
    static Directive MakeAttrs(const std::string &value, const std::string &filename, const Position &position);
    static Directive MakeStrip(const std::string &value, const std::string &filename, const Position &position);
    static Directive MakeCustom(const std::string &name, const unsigned priority, const std::string &value,
                                const CustomImplementation &implementation);

private:
    static std::shared_ptr<const Expression> CompileRequiredExpression(const std::string &directive_name, const std::string &value,
                                                                       const std::string &filename, const Position &position);
};


/** \brief The payload of a SUB event. */
struct SubProgram {
    std::vector<Directive> directives_; // In canonical priority order.
    EventSequence events_;

public:
    SubProgram(const std::vector<Directive> &directives, const EventSequence &events): directives_(directives), events_(events) { }
};


/** \brief Maps directive attribute names to directive factories.
 *
 *  The eight built-in directives are always known.  Additional directives can be registered by name, they are applied
 *  after all built-in ones, in registration order.
 */
class DirectiveRegistry {
public:
    typedef std::function<Directive(const std::string &value, const std::string &filename, const Position &position,
                                    FilterList * const runtime_filters)>
        Factory;

    /** \return False if there is no directive named "name", else true in which case "*factory" has been set. */
    static bool Lookup(const std::string &name, Factory * const factory);

    /** \throws std::invalid_argument if a directive named "name" already exists. */
    static void Register(const std::string &name, const Directive::CustomImplementation &implementation);
};


/** \brief The callable that a function-definition directive binds in the context. */
class TemplateFunction final : public Callable {
    Context *context_;
    std::shared_ptr<const FunctionSignature> signature_;
    std::shared_ptr<const CapturedBody> body_;

public:
    TemplateFunction(Context * const context, const std::shared_ptr<const FunctionSignature> &signature,
                     const std::shared_ptr<const CapturedBody> &body)
        : context_(context), signature_(signature), body_(body) { }

    std::string getName() const override { return signature_->name_; }

    /** \return A STREAM value that pushes a frame with the bound arguments when first pulled from, replays the function
     *          body and pops the frame again.
     *  \note   Positional arguments are bound first, then keyword arguments, then defaults.  Unbound parameters are None
     *          and surplus arguments are ignored.
     */
    Value call(const std::vector<Value> &positional_args, const std::map<std::string, Value> &keyword_args) const override;
};


/** \brief Replays "events" with "frame" pushed onto "context", popping it again at the end or on destruction. */
std::unique_ptr<EventStream> MakeScopedReplayStream(Context * const context, const Context::Frame &frame,
                                                    const EventSequence &events);


} // namespace Markup

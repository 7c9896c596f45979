/** \file   TemplateFilters.h
 *  \brief  The stream filters that templates apply before, during and after directive expansion.
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


#include <memory>
#include <string>
#include "Context.h"
#include "Directive.h"
#include "MarkupEvent.h"
#include "MarkupPath.h"


namespace Markup {


class TemplateLoader;


/** \brief A lazy stream transform.  Filters are stateless, all per-evaluation state lives in the returned stream. */
class Filter {
public:
    virtual ~Filter() = default;

    virtual std::unique_ptr<EventStream> apply(std::unique_ptr<EventStream> stream, Context * const context) const = 0;
};


/** \brief Evaluates EXPR events and expressions in attribute values.
 *
 *  An EXPR event that evaluates to None or an undefined value produces nothing, one that evaluates to a stream, e.g. the
 *  result of calling a template function, is replaced by the evaluated events of that stream, anything else becomes a
 *  TEXT event.  An attribute whose value consists only of expressions that all evaluate to None or an undefined value is
 *  removed.
 */
class EvalFilter final : public Filter {
public:
    std::unique_ptr<EventStream> apply(std::unique_ptr<EventStream> stream, Context * const context) const override;
};


/** \brief Replaces each element subtree matching a path with a SUB event that expands the body of a structural-match
 *         directive, with "select" bound to a function that evaluates paths against the matched subtree.
 */
class MatchFilter final : public Filter {
    MarkupPath path_;
    std::shared_ptr<const CapturedBody> body_;

public:
    MatchFilter(const MarkupPath &path, const std::shared_ptr<const CapturedBody> &body): path_(path), body_(body) { }

    std::unique_ptr<EventStream> apply(std::unique_ptr<EventStream> stream, Context * const context) const override;
};


/** \brief Expands XInclude "include" elements by splicing in the output of the referenced template. */
class IncludeFilter final : public Filter {
    std::weak_ptr<TemplateLoader *> loader_;
    std::string including_filename_;

public:
    static const std::string NAMESPACE;

public:
    IncludeFilter(const std::weak_ptr<TemplateLoader *> &loader, const std::string &including_filename)
        : loader_(loader), including_filename_(including_filename) { }

    std::unique_ptr<EventStream> apply(std::unique_ptr<EventStream> stream, Context * const context) const override;
};


/** \brief Merges adjacent TEXT events, removes spaces and tabs at the ends of lines and collapses runs of newlines. */
class WhitespaceFilter final : public Filter {
public:
    std::unique_ptr<EventStream> apply(std::unique_ptr<EventStream> stream, Context * const context) const override;
};


} // namespace Markup

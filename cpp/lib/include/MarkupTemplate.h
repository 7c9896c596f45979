/** \file   MarkupTemplate.h
 *  \brief  Compiled markup templates with embedded directives and expressions.
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
#include <vector>
#include "Context.h"
#include "Directive.h"
#include "MarkupEvent.h"
#include "TemplateFilters.h"


namespace Markup {


/** \class Template
 *  \brief A markup document compiled into an event sequence in which the elements carrying directive attributes have been
 *         collapsed into SUB events and interpolated text has been split into TEXT and EXPR events.
 *
 *  Example:
 *  \code
 *      const Markup::Template tmpl("<ul xmlns:py=\"http://purl.org/kid/ns#\"><li py:for=\"item in items\">${item}</li></ul>");
 *      Markup::Context context;
 *      context.set("items", Markup::Value(Markup::Value::List{ 1, 2, 3 }));
 *      std::cout << tmpl.render(&context);
 *  \endcode
 *
 *  \note A Template is immutable once constructed, except that a loader appends its include filter, and may be shared by
 *        concurrent generations using different Context instances.  The Template must outlive the streams it generates.
 */
class Template {
public:
    static const std::string NAMESPACE; // The directive namespace.

private:
    std::string filename_;
    EventSequence events_;
    FilterList pre_filters_;
    FilterList filters_; // Runtime filters, e.g. those registered by structural-match directives.
    FilterList post_filters_;

public:
    /** \throws TemplateSyntaxError (or BadDirectiveError) if "source" is malformed or contains an unknown directive. */
    explicit Template(const std::string &source, const std::string &filename = "<string>");
    Template(const Template &rhs) = delete;
    Template &operator=(const Template &rhs) = delete;

    inline const std::string &getFilename() const { return filename_; }
    inline const EventSequence &getEvents() const { return events_; }

    inline const FilterList &getPreFilters() const { return pre_filters_; }
    inline const FilterList &getFilters() const { return filters_; }
    inline const FilterList &getPostFilters() const { return post_filters_; }
    inline void addPreFilter(const std::shared_ptr<const Filter> &filter) { pre_filters_.emplace_back(filter); }
    inline void addFilter(const std::shared_ptr<const Filter> &filter) { filters_.emplace_back(filter); }
    inline void addPostFilter(const std::shared_ptr<const Filter> &filter) { post_filters_.emplace_back(filter); }

    /** \brief Wraps "stream" with the pre-filters followed by the runtime filters. */
    std::unique_ptr<EventStream> applyFilters(std::unique_ptr<EventStream> stream, Context * const context) const;

    /** \brief Lazily expands the template against "context".
     *  \note  Evaluation errors are raised as TemplateEvaluationError, and expression syntax errors as TemplateSyntaxError,
     *         from the getNext() call of the returned stream that triggered them.
     */
    std::unique_ptr<EventStream> generate(Context * const context) const;

    /** \brief Generates and serialises the template as XML. */
    std::string render(Context * const context) const;

    /** \brief Splits "text" into literal fragments and the expressions of "${...}" and "$name.name" interpolations.
     *  \note  "$$" is a literal dollar sign.  The expressions are compiled when they are first evaluated.
     */
    static std::vector<Fragment> Interpolate(const std::string &text);

private:
    void parse(const std::string &source);
};


} // namespace Markup

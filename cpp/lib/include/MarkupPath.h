/** \file   MarkupPath.h
 *  \brief  A restricted XPath-like language for matching and selecting parts of event streams.
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


#include <stdexcept>
#include <string>
#include <vector>
#include "MarkupEvent.h"


namespace Markup {


/** \class MarkupPath
 *  \brief A path such as "div/greeting", "//p[@class='note']", "body/p|text()" or "@name".
 *
 *  Steps are separated by "/" (child) or "//" (descendant).  A step is a tag name, "*", ".", "text()", "@name" or "@*",
 *  element steps may be followed by a single predicate "[@attrib]" or "[@attrib='value']".  Alternatives are separated
 *  by "|".
 */
class MarkupPath {
public:
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string &message): std::runtime_error(message) { }
    };

    struct Step {
        enum Axis { CHILD, DESCENDANT };
        enum Test { ELEMENT, ANY_ELEMENT, SELF, TEXT, ATTRIBUTE, ANY_ATTRIBUTE };

        Axis axis_; // How this step relates to the previous one.
        Test test_;
        std::string name_; // ELEMENT and ATTRIBUTE only.
        std::string predicate_attribute_;
        bool predicate_has_value_;
        std::string predicate_value_;

    public:
        Step(): axis_(CHILD), test_(ANY_ELEMENT), predicate_has_value_(false) { }

        bool isAttributeStep() const { return test_ == ATTRIBUTE or test_ == ANY_ATTRIBUTE; }

        /** \return True if "start_event" passes the element test and the predicate. */
        bool matchesElement(const Event &start_event) const;
    };

private:
    struct Alternative {
        bool absolute_; // Started with a single "/".
        std::vector<Step> steps_;
    };

    std::string source_;
    std::vector<Alternative> alternatives_;

public:
    /** \throws MarkupPath::Error if "source" is malformed. */
    explicit MarkupPath(const std::string &source);

    inline const std::string &getSource() const { return source_; }

    /** \brief Tests whether the element whose START event is the last entry of "element_stack" matches, where the other
     *         entries are the START events of its ancestors, outermost first.
     */
    bool matches(const std::vector<Event> &element_stack) const;

    /** \brief Evaluates the path relative to the top-level elements of "events".
     *  \return The events of the selected subtrees in document order.  Selected attributes are returned as TEXT events.
     */
    EventSequence select(const EventSequence &events) const;

private:
    bool matchesFrom(const Alternative &alternative, const size_t step_index, const std::vector<Event> &element_stack,
                     const size_t stack_index) const;
    void parseAlternative(const std::string &alternative_source);
};


} // namespace Markup

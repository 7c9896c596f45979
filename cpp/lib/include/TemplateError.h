/** \file   TemplateError.h
 *  \brief  The exception classes of the markup template engine.
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


/** \brief Programming errors inside the engine, e.g. an unbalanced context stack. */
class ImplementationError : public std::logic_error {
public:
    explicit ImplementationError(const std::string &message): std::logic_error(message) { }
};


/** \brief Base class for the errors of the expression language. */
class ExpressionError : public std::runtime_error {
    bool has_position_;
    Position position_;

public:
    explicit ExpressionError(const std::string &message): std::runtime_error(message), has_position_(false) { }

    inline bool hasPosition() const { return has_position_; }
    inline const Position &getPosition() const { return position_; }

    /** \brief Records the position of the event whose evaluation failed unless a position has already been recorded. */
    void setPositionIfUnset(const Position &position);
};


/** \brief Malformed expression syntax, "offset" is the character offset into the expression source. */
class ExpressionSyntaxError : public ExpressionError {
    unsigned offset_;

public:
    ExpressionSyntaxError(const std::string &message, const unsigned offset): ExpressionError(message), offset_(offset) { }

    inline unsigned getOffset() const { return offset_; }
};


/** \brief An error that occurred while an expression was being evaluated. */
class EvaluationError : public ExpressionError {
public:
    explicit EvaluationError(const std::string &message): ExpressionError(message) { }
};


class TemplateError : public std::runtime_error {
public:
    explicit TemplateError(const std::string &message): std::runtime_error(message) { }
};


/** \brief An error that can be attributed to a location in a template source. */
class TemplateLocatedError : public TemplateError {
    std::string message_, filename_;
    unsigned line_, column_;

public:
    TemplateLocatedError(const std::string &message, const std::string &filename, const unsigned line, const unsigned column);

    inline const std::string &getMessage() const { return message_; }
    inline const std::string &getFilename() const { return filename_; }
    inline unsigned getLine() const { return line_; }
    inline unsigned getColumn() const { return column_; }
};


/** \brief Unknown or malformed directives, malformed markup and malformed expressions. */
class TemplateSyntaxError : public TemplateLocatedError {
public:
    TemplateSyntaxError(const std::string &message, const std::string &filename, const unsigned line, const unsigned column = 0)
        : TemplateLocatedError(message, filename, line, column) { }
};


class BadDirectiveError : public TemplateSyntaxError {
    std::string directive_name_;

public:
    BadDirectiveError(const std::string &directive_name, const std::string &filename, const unsigned line)
        : TemplateSyntaxError("Bad directive \"" + directive_name + "\"", filename, line), directive_name_(directive_name) { }

    inline const std::string &getDirectiveName() const { return directive_name_; }
};


/** \brief A runtime expression failure, rewrapped with the position of the event that was being processed. */
class TemplateEvaluationError : public TemplateLocatedError {
public:
    TemplateEvaluationError(const std::string &message, const std::string &filename, const unsigned line, const unsigned column)
        : TemplateLocatedError(message, filename, line, column) { }
};


class TemplateNotFound : public TemplateError {
    std::string name_;
    std::vector<std::string> search_path_;

public:
    TemplateNotFound(const std::string &name, const std::vector<std::string> &search_path);

    inline const std::string &getName() const { return name_; }
    inline const std::vector<std::string> &getSearchPath() const { return search_path_; }
};


} // namespace Markup

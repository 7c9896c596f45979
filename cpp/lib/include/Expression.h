/** \file   Expression.h
 *  \brief  The small Python-like expression language embedded in markup templates.
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
#include <mutex>
#include <string>
#include <vector>
#include "Context.h"
#include "Value.h"


namespace Markup {


class ExpressionNode;


/** \class Expression
 *  \brief A compiled expression.
 *
 *  Supported are the constants None, True and False, integer, float and quoted string literals, list, tuple and dict
 *  displays, names, attribute access, subscripts, calls with positional and keyword arguments, the unary operators -, +
 *  and not, the binary operators * / % + -, the comparisons == != < <= > >= in, not in, is and is not, the boolean
 *  operators and and or and conditional expressions ("a if c else b").
 *
 *  Names that are not defined in the context evaluate to an undefined value unless they refer to one of the built-in
 *  functions len(), str(), range() and defined().
 *
 *  \note The source is compiled on first use, at most once, even if several threads evaluate the same expression
 *        concurrently.  A syntax error is reported as an ExpressionSyntaxError by each evaluate() call.
 */
class Expression {
    std::string source_;
    mutable std::once_flag compile_once_;
    mutable std::shared_ptr<const ExpressionNode> root_;

public:
    explicit Expression(const std::string &source): source_(source) { }
    Expression(const Expression &rhs) = delete;
    Expression &operator=(const Expression &rhs) = delete;

    inline const std::string &getSource() const { return source_; }

    /** \throws ExpressionSyntaxError if the source is malformed. */
    void compile() const;

    /** \throws ExpressionSyntaxError or EvaluationError. */
    Value evaluate(const Context &context) const;

    /** \return "default_value" if the expression evaluates to an undefined value. */
    Value evaluate(const Context &context, const Value &default_value) const;
};


/** \brief A function signature as used by the function-definition directive, e.g. "greeting(name, punct='!')". */
struct FunctionSignature {
    struct Parameter {
        std::string name_;
        std::shared_ptr<const Expression> default_; // Null if the parameter has no default.

    public:
        explicit Parameter(const std::string &name, const std::shared_ptr<const Expression> &default_value = nullptr)
            : name_(name), default_(default_value) { }
    };

    std::string name_;
    std::vector<Parameter> parameters_;
};


/** \brief Parses "name", "name()" or "name(p1, p2=default, ...)".
 *  \note  Default values are kept as expressions and evaluated each time a call omits the corresponding argument.
 *  \throws ExpressionSyntaxError if "signature" is malformed.
 */
FunctionSignature ParseFunctionSignature(const std::string &signature);


} // namespace Markup

/** \file   Value.h
 *  \brief  The tagged value type of the template expression language.
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


#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "MarkupEvent.h"


namespace Markup {


class Value;


/** \brief Anything that can be called from an expression, e.g. a function defined in a template. */
class Callable {
public:
    virtual ~Callable() = default;

    virtual std::string getName() const = 0;
    virtual Value call(const std::vector<Value> &positional_args, const std::map<std::string, Value> &keyword_args) const = 0;
};


/** \brief A value as seen by expressions and stored in a Context.
 *
 *  Lists, maps and callables are shared between copies and never modified after construction.  A STREAM value wraps a
 *  single-pass event stream, e.g. the result of calling a template function, and can only be consumed once.
 */
class Value {
public:
    enum Type { UNDEFINED, NONE, BOOLEAN, INTEGER, DOUBLE, STRING, LIST, MAP, CALLABLE, STREAM };
    typedef std::vector<Value> List;
    typedef std::map<std::string, Value> Map;

private:
    Type type_;
    bool boolean_;
    long integer_;
    double double_;
    std::string string_;
    std::shared_ptr<const List> list_;
    std::shared_ptr<const Map> map_;
    std::shared_ptr<const Callable> callable_;
    std::shared_ptr<EventStream> stream_;

    explicit Value(const Type type): type_(type), boolean_(false), integer_(0), double_(0.0) { }

public:
    /** Constructs the undefined value that lookups of unknown names produce. */
    Value(): Value(UNDEFINED) { }
    Value(const bool boolean): Value(BOOLEAN) { boolean_ = boolean; }
    Value(const int integer): Value(INTEGER) { integer_ = integer; }
    Value(const long integer): Value(INTEGER) { integer_ = integer; }
    Value(const double d): Value(DOUBLE) { double_ = d; }
    Value(const char * const s): Value(STRING) { string_ = s; }
    Value(const std::string &s): Value(STRING) { string_ = s; }
    Value(const List &list);
    Value(const Map &map);
    Value(const std::shared_ptr<const Callable> &callable);
    Value(const std::shared_ptr<EventStream> &stream);

    static Value None() { return Value(NONE); }

    inline Type getType() const { return type_; }
    inline bool isUndefined() const { return type_ == UNDEFINED; }
    inline bool isNone() const { return type_ == NONE; }

    /** \return True for None and undefined values. */
    inline bool isNull() const { return type_ == UNDEFINED or type_ == NONE; }

    /** \brief Truthiness as in Python: undefined, None, false, 0, 0.0, "" and empty lists and maps are false. */
    bool isTrue() const;

    // The following accessors throw an EvaluationError if the value has a different type:
    bool getBoolean() const;
    long getInteger() const;
    double getNumber() const; // Accepts INTEGER and DOUBLE.
    const std::string &getString() const;
    const List &getList() const;
    const Map &getMap() const;
    const std::shared_ptr<const Callable> &getCallable() const;
    const std::shared_ptr<EventStream> &getStream() const;

    /** \brief Converts to a string as Python's str() would. */
    std::string toString() const;

    /** \brief Like toString() but strings are quoted. */
    std::string toRepresentation() const;

    /** \brief "value.name": map entries are accessible as attributes, undefined values yield undefined values. */
    Value getAttribute(const std::string &name) const;

    /** \brief "value[key]": list and string indexing with negative indices counting from the end, and map lookups. */
    Value getItem(const Value &key) const;

    Value call(const std::vector<Value> &positional_args, const std::map<std::string, Value> &keyword_args) const;

    /** \brief The items a loop over this value produces: list elements, map keys or the characters of a string. */
    List getIterationItems() const;

    /** \brief Implements "item in container". */
    bool contains(const Value &item) const;

    bool operator==(const Value &rhs) const;
    inline bool operator!=(const Value &rhs) const { return not operator==(rhs); }

    /** \return A negative number, zero or a positive number if "lhs" is less than, equal to or greater than "rhs".
     *  \throws EvaluationError if the values are not comparable.
     */
    static int Compare(const Value &lhs, const Value &rhs);

    static std::string TypeToString(const Type type);
};


/** \brief Wraps a host function so that it can be called from template expressions. */
class NativeFunction final : public Callable {
public:
    typedef std::function<Value(const std::vector<Value> &, const std::map<std::string, Value> &)> Implementation;

private:
    std::string name_;
    Implementation implementation_;

public:
    NativeFunction(const std::string &name, const Implementation &implementation): name_(name), implementation_(implementation) { }

    std::string getName() const override { return name_; }
    Value call(const std::vector<Value> &positional_args, const std::map<std::string, Value> &keyword_args) const override {
        return implementation_(positional_args, keyword_args);
    }
};


inline Value MakeFunction(const std::string &name, const NativeFunction::Implementation &implementation) {
    return Value(std::shared_ptr<const Callable>(new NativeFunction(name, implementation)));
}


} // namespace Markup

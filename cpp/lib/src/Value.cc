/** \file   Value.cc
 *  \brief  Implementation of the tagged value type of the template expression language.
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
#include "Value.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include "TemplateError.h"
#include "util.h"


namespace Markup {


Value::Value(const List &list): Value(LIST) {
    list_ = std::make_shared<const List>(list);
}


Value::Value(const Map &map): Value(MAP) {
    map_ = std::make_shared<const Map>(map);
}


Value::Value(const std::shared_ptr<const Callable> &callable): Value(CALLABLE) {
    if (unlikely(callable == nullptr))
        throw std::invalid_argument("in Markup::Value::Value: callable must not be null!");
    callable_ = callable;
}


Value::Value(const std::shared_ptr<EventStream> &stream): Value(STREAM) {
    if (unlikely(stream == nullptr))
        throw std::invalid_argument("in Markup::Value::Value: stream must not be null!");
    stream_ = stream;
}


bool Value::isTrue() const {
    switch (type_) {
    case UNDEFINED:
    case NONE:
        return false;
    case BOOLEAN:
        return boolean_;
    case INTEGER:
        return integer_ != 0;
    case DOUBLE:
        return double_ != 0.0;
    case STRING:
        return not string_.empty();
    case LIST:
        return not list_->empty();
    case MAP:
        return not map_->empty();
    case CALLABLE:
    case STREAM:
        return true;
    }

    return false;
}


namespace {


[[noreturn]] void ThrowTypeMismatch(const std::string &function_name, const Value::Type expected_type, const Value::Type actual_type) {
    throw EvaluationError("in Markup::Value::" + function_name + ": expected a value of type " + Value::TypeToString(expected_type)
                          + " but found one of type " + Value::TypeToString(actual_type) + "!");
}


std::string DoubleToString(const double d) {
    if (std::isnan(d))
        return "nan";
    if (std::isinf(d))
        return d > 0.0 ? "inf" : "-inf";

    char buffer[32];
    std::snprintf(buffer, sizeof buffer, "%.12g", d);
    std::string result(buffer);
    if (result.find_first_of(".e") == std::string::npos)
        result += ".0";
    return result;
}


std::string QuoteString(const std::string &s) {
    const char quote(s.find('\'') != std::string::npos and s.find('"') == std::string::npos ? '"' : '\'');
    std::string quoted(1, quote);
    for (const char ch : s) {
        if (ch == quote or ch == '\\')
            quoted += '\\';
        if (ch == '\n')
            quoted += "\\n";
        else
            quoted += ch;
    }
    quoted += quote;

    return quoted;
}


} // unnamed namespace


bool Value::getBoolean() const {
    if (unlikely(type_ != BOOLEAN))
        ThrowTypeMismatch("getBoolean", BOOLEAN, type_);
    return boolean_;
}


long Value::getInteger() const {
    if (unlikely(type_ != INTEGER))
        ThrowTypeMismatch("getInteger", INTEGER, type_);
    return integer_;
}


double Value::getNumber() const {
    if (type_ == INTEGER)
        return static_cast<double>(integer_);
    if (unlikely(type_ != DOUBLE))
        ThrowTypeMismatch("getNumber", DOUBLE, type_);
    return double_;
}


const std::string &Value::getString() const {
    if (unlikely(type_ != STRING))
        ThrowTypeMismatch("getString", STRING, type_);
    return string_;
}


const Value::List &Value::getList() const {
    if (unlikely(type_ != LIST))
        ThrowTypeMismatch("getList", LIST, type_);
    return *list_;
}


const Value::Map &Value::getMap() const {
    if (unlikely(type_ != MAP))
        ThrowTypeMismatch("getMap", MAP, type_);
    return *map_;
}


const std::shared_ptr<const Callable> &Value::getCallable() const {
    if (unlikely(type_ != CALLABLE))
        ThrowTypeMismatch("getCallable", CALLABLE, type_);
    return callable_;
}


const std::shared_ptr<EventStream> &Value::getStream() const {
    if (unlikely(type_ != STREAM))
        ThrowTypeMismatch("getStream", STREAM, type_);
    return stream_;
}


std::string Value::toString() const {
    switch (type_) {
    case UNDEFINED:
        return "";
    case NONE:
        return "None";
    case BOOLEAN:
        return boolean_ ? "True" : "False";
    case INTEGER:
        return std::to_string(integer_);
    case DOUBLE:
        return DoubleToString(double_);
    case STRING:
        return string_;
    case LIST: {
        std::string result("[");
        for (auto element(list_->cbegin()); element != list_->cend(); ++element) {
            if (element != list_->cbegin())
                result += ", ";
            result += element->toRepresentation();
        }
        return result + "]";
    }
    case MAP: {
        std::string result("{");
        for (auto key_and_value(map_->cbegin()); key_and_value != map_->cend(); ++key_and_value) {
            if (key_and_value != map_->cbegin())
                result += ", ";
            result += QuoteString(key_and_value->first) + ": " + key_and_value->second.toRepresentation();
        }
        return result + "}";
    }
    case CALLABLE:
        return "<function " + callable_->getName() + ">";
    case STREAM:
        return "<stream>";
    }

    return "";
}


std::string Value::toRepresentation() const {
    return type_ == STRING ? QuoteString(string_) : toString();
}


Value Value::getAttribute(const std::string &name) const {
    if (type_ == UNDEFINED)
        return Value();
    if (type_ == MAP) {
        const auto key_and_value(map_->find(name));
        return key_and_value == map_->cend() ? Value() : key_and_value->second;
    }

    throw EvaluationError("in Markup::Value::getAttribute: a value of type " + TypeToString(type_) + " has no attribute \"" + name
                          + "\"!");
}


Value Value::getItem(const Value &key) const {
    switch (type_) {
    case UNDEFINED:
        return Value();
    case MAP: {
        if (unlikely(key.type_ != STRING))
            throw EvaluationError("in Markup::Value::getItem: map keys must be strings, found " + TypeToString(key.type_) + "!");
        const auto key_and_value(map_->find(key.string_));
        return key_and_value == map_->cend() ? Value() : key_and_value->second;
    }
    case LIST:
    case STRING: {
        if (unlikely(key.type_ != INTEGER))
            throw EvaluationError("in Markup::Value::getItem: indices must be integers, found " + TypeToString(key.type_) + "!");
        const long size(type_ == LIST ? static_cast<long>(list_->size()) : static_cast<long>(string_.size()));
        const long index(key.integer_ < 0 ? size + key.integer_ : key.integer_);
        if (unlikely(index < 0 or index >= size))
            throw EvaluationError("in Markup::Value::getItem: index " + std::to_string(key.integer_) + " out of range!");
        return type_ == LIST ? (*list_)[index] : Value(std::string(1, string_[index]));
    }
    default:
        throw EvaluationError("in Markup::Value::getItem: a value of type " + TypeToString(type_) + " can't be indexed!");
    }
}


Value Value::call(const std::vector<Value> &positional_args, const std::map<std::string, Value> &keyword_args) const {
    if (unlikely(type_ != CALLABLE))
        throw EvaluationError("in Markup::Value::call: a value of type " + TypeToString(type_) + " is not callable!");

    return callable_->call(positional_args, keyword_args);
}


Value::List Value::getIterationItems() const {
    switch (type_) {
    case LIST:
        return *list_;
    case MAP: {
        List keys;
        for (const auto &key_and_value : *map_)
            keys.emplace_back(key_and_value.first);
        return keys;
    }
    case STRING: {
        List characters;
        for (const char ch : string_)
            characters.emplace_back(std::string(1, ch));
        return characters;
    }
    default:
        throw EvaluationError("in Markup::Value::getIterationItems: a value of type " + TypeToString(type_) + " is not iterable!");
    }
}


bool Value::contains(const Value &item) const {
    switch (type_) {
    case LIST:
        for (const auto &element : *list_) {
            if (element == item)
                return true;
        }
        return false;
    case MAP:
        return item.type_ == STRING and map_->find(item.string_) != map_->cend();
    case STRING:
        if (unlikely(item.type_ != STRING))
            throw EvaluationError("in Markup::Value::contains: the left operand of \"in\" must be a string!");
        return string_.find(item.string_) != std::string::npos;
    default:
        throw EvaluationError("in Markup::Value::contains: a value of type " + TypeToString(type_) + " is not a container!");
    }
}


bool Value::operator==(const Value &rhs) const {
    if ((type_ == INTEGER or type_ == DOUBLE) and (rhs.type_ == INTEGER or rhs.type_ == DOUBLE)) {
        if (type_ == INTEGER and rhs.type_ == INTEGER)
            return integer_ == rhs.integer_;
        return getNumber() == rhs.getNumber();
    }

    if (type_ != rhs.type_)
        return false;

    switch (type_) {
    case UNDEFINED:
    case NONE:
        return true;
    case BOOLEAN:
        return boolean_ == rhs.boolean_;
    case STRING:
        return string_ == rhs.string_;
    case LIST:
        return *list_ == *rhs.list_;
    case MAP:
        return *map_ == *rhs.map_;
    case CALLABLE:
        return callable_ == rhs.callable_;
    case STREAM:
        return stream_ == rhs.stream_;
    default:
        return false;
    }
}


int Value::Compare(const Value &lhs, const Value &rhs) {
    if ((lhs.type_ == INTEGER or lhs.type_ == DOUBLE or lhs.type_ == BOOLEAN)
        and (rhs.type_ == INTEGER or rhs.type_ == DOUBLE or rhs.type_ == BOOLEAN))
    {
        const double lhs_number(lhs.type_ == BOOLEAN ? (lhs.boolean_ ? 1.0 : 0.0) : lhs.getNumber());
        const double rhs_number(rhs.type_ == BOOLEAN ? (rhs.boolean_ ? 1.0 : 0.0) : rhs.getNumber());
        return lhs_number < rhs_number ? -1 : (lhs_number > rhs_number ? 1 : 0);
    }

    if (lhs.type_ == STRING and rhs.type_ == STRING)
        return lhs.string_.compare(rhs.string_);

    if (lhs.type_ == LIST and rhs.type_ == LIST) {
        const size_t common_size(std::min(lhs.list_->size(), rhs.list_->size()));
        for (size_t i(0); i < common_size; ++i) {
            const int result(Compare((*lhs.list_)[i], (*rhs.list_)[i]));
            if (result != 0)
                return result;
        }
        return lhs.list_->size() < rhs.list_->size() ? -1 : (lhs.list_->size() > rhs.list_->size() ? 1 : 0);
    }

    throw EvaluationError("in Markup::Value::Compare: can't compare a value of type " + TypeToString(lhs.type_)
                          + " with one of type " + TypeToString(rhs.type_) + "!");
}


std::string Value::TypeToString(const Type type) {
    switch (type) {
    case UNDEFINED:
        return "undefined";
    case NONE:
        return "None";
    case BOOLEAN:
        return "bool";
    case INTEGER:
        return "int";
    case DOUBLE:
        return "float";
    case STRING:
        return "str";
    case LIST:
        return "list";
    case MAP:
        return "dict";
    case CALLABLE:
        return "function";
    case STREAM:
        return "stream";
    }

    return "unknown";
}


} // namespace Markup

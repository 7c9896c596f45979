/** \file   Expression.cc
 *  \brief  Scanner, parser and evaluator of the template expression language.
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
#include "Expression.h"
#include <algorithm>
#include <cmath>
#include <map>
#include "StringUtil.h"
#include "TemplateError.h"
#include "util.h"


namespace Markup {


namespace {


class ExpressionScanner {
public:
    enum TokenType {
        END_OF_INPUT, NAME, INTEGER_CONSTANT, FLOAT_CONSTANT, STRING_CONSTANT, OPEN_PAREN, CLOSE_PAREN, OPEN_BRACKET,
        CLOSE_BRACKET, OPEN_BRACE, CLOSE_BRACE, COMMA, COLON, DOT, PLUS, MINUS, STAR, SLASH, PERCENT, ASSIGN, EQUALS,
        NOT_EQUALS, LESS, LESS_EQUAL, GREATER, GREATER_EQUAL, AND, OR, NOT, IN, IS, IF, ELSE, NONE, TRUE, FALSE
    };

    struct Token {
        TokenType type_;
        std::string text_; // Names and the decoded contents of string constants.
        unsigned offset_, length_;

    public:
        Token(const TokenType type, const std::string &text, const unsigned offset, const unsigned length)
            : type_(type), text_(text), offset_(offset), length_(length) { }
    };

private:
    const std::string &input_;
    size_t offset_;

public:
    explicit ExpressionScanner(const std::string &input): input_(input), offset_(0) { }

    /** \return All tokens, the last one always being END_OF_INPUT. */
    std::vector<Token> tokenize();

    static std::string TokenTypeToString(const TokenType token);

private:
    Token getToken();
    void skipWhitespace();
    Token extractName();
    Token extractNumber();
    Token extractStringConstant(const char quote);
    static TokenType MapStringToKeywordToken(const std::string &keyword_candidate);
};


std::vector<ExpressionScanner::Token> ExpressionScanner::tokenize() {
    std::vector<Token> tokens;
    do
        tokens.emplace_back(getToken());
    while (tokens.back().type_ != END_OF_INPUT);

    return tokens;
}


void ExpressionScanner::skipWhitespace() {
    while (offset_ < input_.size() and StringUtil::IsWhitespace(input_[offset_]))
        ++offset_;
}


ExpressionScanner::Token ExpressionScanner::getToken() {
    skipWhitespace();
    if (offset_ == input_.size())
        return Token(END_OF_INPUT, "", static_cast<unsigned>(offset_), 0);

    const unsigned start(static_cast<unsigned>(offset_));
    const char ch(input_[offset_]);
    if (StringUtil::IsAsciiLetter(ch) or ch == '_')
        return extractName();
    if (StringUtil::IsDigit(ch))
        return extractNumber();
    if (ch == '\'' or ch == '"')
        return extractStringConstant(ch);

    const char next_ch(offset_ + 1 < input_.size() ? input_[offset_ + 1] : '\0');
    if (next_ch == '=' and (ch == '=' or ch == '!' or ch == '<' or ch == '>')) {
        offset_ += 2;
        switch (ch) {
        case '=':
            return Token(EQUALS, "", start, 2);
        case '!':
            return Token(NOT_EQUALS, "", start, 2);
        case '<':
            return Token(LESS_EQUAL, "", start, 2);
        default:
            return Token(GREATER_EQUAL, "", start, 2);
        }
    }

    ++offset_;
    switch (ch) {
    case '(':
        return Token(OPEN_PAREN, "", start, 1);
    case ')':
        return Token(CLOSE_PAREN, "", start, 1);
    case '[':
        return Token(OPEN_BRACKET, "", start, 1);
    case ']':
        return Token(CLOSE_BRACKET, "", start, 1);
    case '{':
        return Token(OPEN_BRACE, "", start, 1);
    case '}':
        return Token(CLOSE_BRACE, "", start, 1);
    case ',':
        return Token(COMMA, "", start, 1);
    case ':':
        return Token(COLON, "", start, 1);
    case '.':
        return Token(DOT, "", start, 1);
    case '+':
        return Token(PLUS, "", start, 1);
    case '-':
        return Token(MINUS, "", start, 1);
    case '*':
        return Token(STAR, "", start, 1);
    case '/':
        return Token(SLASH, "", start, 1);
    case '%':
        return Token(PERCENT, "", start, 1);
    case '=':
        return Token(ASSIGN, "", start, 1);
    case '<':
        return Token(LESS, "", start, 1);
    case '>':
        return Token(GREATER, "", start, 1);
    }

    throw ExpressionSyntaxError("in Markup::ExpressionScanner::getToken: unexpected character '" + std::string(1, ch)
                                    + "' at offset " + std::to_string(start) + " in \"" + input_ + "\"!",
                                start);
}


ExpressionScanner::Token ExpressionScanner::extractName() {
    const size_t start(offset_);
    while (offset_ < input_.size() and (StringUtil::IsAlphanumeric(input_[offset_]) or input_[offset_] == '_'))
        ++offset_;

    const std::string name(input_.substr(start, offset_ - start));
    return Token(MapStringToKeywordToken(name), name, static_cast<unsigned>(start), static_cast<unsigned>(offset_ - start));
}


ExpressionScanner::Token ExpressionScanner::extractNumber() {
    const size_t start(offset_);
    bool is_float(false);
    while (offset_ < input_.size() and StringUtil::IsDigit(input_[offset_]))
        ++offset_;
    if (offset_ + 1 < input_.size() and input_[offset_] == '.' and StringUtil::IsDigit(input_[offset_ + 1])) {
        is_float = true;
        ++offset_;
        while (offset_ < input_.size() and StringUtil::IsDigit(input_[offset_]))
            ++offset_;
    }
    if (offset_ < input_.size() and (input_[offset_] == 'e' or input_[offset_] == 'E')) {
        size_t exponent_start(offset_ + 1);
        if (exponent_start < input_.size() and (input_[exponent_start] == '+' or input_[exponent_start] == '-'))
            ++exponent_start;
        if (exponent_start < input_.size() and StringUtil::IsDigit(input_[exponent_start])) {
            is_float = true;
            offset_ = exponent_start;
            while (offset_ < input_.size() and StringUtil::IsDigit(input_[offset_]))
                ++offset_;
        }
    }

    return Token(is_float ? FLOAT_CONSTANT : INTEGER_CONSTANT, input_.substr(start, offset_ - start),
                 static_cast<unsigned>(start), static_cast<unsigned>(offset_ - start));
}


ExpressionScanner::Token ExpressionScanner::extractStringConstant(const char quote) {
    const size_t start(offset_);
    ++offset_; // Skip the opening quote.

    std::string string_constant;
    for (;;) {
        if (unlikely(offset_ >= input_.size()))
            throw ExpressionSyntaxError("in Markup::ExpressionScanner::extractStringConstant: unterminated string constant "
                                        "starting at offset " + std::to_string(start) + " in \"" + input_ + "\"!",
                                        static_cast<unsigned>(start));
        const char ch(input_[offset_++]);
        if (ch == quote)
            break;
        if (ch != '\\') {
            string_constant += ch;
            continue;
        }

        if (unlikely(offset_ >= input_.size()))
            continue; // Reported as an unterminated constant above.
        const char escaped_ch(input_[offset_++]);
        switch (escaped_ch) {
        case 'n':
            string_constant += '\n';
            break;
        case 't':
            string_constant += '\t';
            break;
        case 'r':
            string_constant += '\r';
            break;
        case '\\':
        case '\'':
        case '"':
            string_constant += escaped_ch;
            break;
        default:
            string_constant += '\\';
            string_constant += escaped_ch;
        }
    }

    return Token(STRING_CONSTANT, string_constant, static_cast<unsigned>(start), static_cast<unsigned>(offset_ - start));
}


ExpressionScanner::TokenType ExpressionScanner::MapStringToKeywordToken(const std::string &keyword_candidate) {
    static const std::map<std::string, TokenType> keywords_to_tokens_map{
        { "and", AND }, { "or", OR },     { "not", NOT },   { "in", IN },     { "is", IS },
        { "if", IF },   { "else", ELSE }, { "None", NONE }, { "True", TRUE }, { "False", FALSE },
    };

    const auto key_and_value(keywords_to_tokens_map.find(keyword_candidate));
    return key_and_value == keywords_to_tokens_map.cend() ? NAME : key_and_value->second;
}


std::string ExpressionScanner::TokenTypeToString(const TokenType token) {
    switch (token) {
    case END_OF_INPUT:
        return "end of input";
    case NAME:
        return "name";
    case INTEGER_CONSTANT:
    case FLOAT_CONSTANT:
        return "number";
    case STRING_CONSTANT:
        return "string";
    case OPEN_PAREN:
        return "'('";
    case CLOSE_PAREN:
        return "')'";
    case OPEN_BRACKET:
        return "'['";
    case CLOSE_BRACKET:
        return "']'";
    case OPEN_BRACE:
        return "'{'";
    case CLOSE_BRACE:
        return "'}'";
    case COMMA:
        return "','";
    case COLON:
        return "':'";
    case DOT:
        return "'.'";
    case PLUS:
        return "'+'";
    case MINUS:
        return "'-'";
    case STAR:
        return "'*'";
    case SLASH:
        return "'/'";
    case PERCENT:
        return "'%'";
    case ASSIGN:
        return "'='";
    case EQUALS:
        return "'=='";
    case NOT_EQUALS:
        return "'!='";
    case LESS:
        return "'<'";
    case LESS_EQUAL:
        return "'<='";
    case GREATER:
        return "'>'";
    case GREATER_EQUAL:
        return "'>='";
    case AND:
        return "and";
    case OR:
        return "or";
    case NOT:
        return "not";
    case IN:
        return "in";
    case IS:
        return "is";
    case IF:
        return "if";
    case ELSE:
        return "else";
    case NONE:
        return "None";
    case TRUE:
        return "True";
    case FALSE:
        return "False";
    }

    return "unknown token";
}


} // unnamed namespace


class ExpressionNode {
public:
    virtual ~ExpressionNode() = default;

    virtual Value evaluate(const Context &context) const = 0;
};


namespace {


typedef std::shared_ptr<const ExpressionNode> NodePtr;


class ConstantNode final : public ExpressionNode {
    Value value_;

public:
    explicit ConstantNode(const Value &value): value_(value) { }

    Value evaluate(const Context &/*context*/) const override { return value_; }
};


Value Len(const std::vector<Value> &args, const std::map<std::string, Value> &/*kwargs*/) {
    if (unlikely(args.size() != 1))
        throw EvaluationError("in Markup::Len: len() takes exactly one argument!");

    switch (args[0].getType()) {
    case Value::STRING:
        return Value(static_cast<long>(args[0].getString().size()));
    case Value::LIST:
        return Value(static_cast<long>(args[0].getList().size()));
    case Value::MAP:
        return Value(static_cast<long>(args[0].getMap().size()));
    default:
        throw EvaluationError("in Markup::Len: a value of type " + Value::TypeToString(args[0].getType()) + " has no length!");
    }
}


Value Str(const std::vector<Value> &args, const std::map<std::string, Value> &/*kwargs*/) {
    if (args.empty())
        return Value("");
    if (unlikely(args.size() != 1))
        throw EvaluationError("in Markup::Str: str() takes at most one argument!");
    return Value(args[0].toString());
}


Value Range(const std::vector<Value> &args, const std::map<std::string, Value> &/*kwargs*/) {
    if (unlikely(args.empty() or args.size() > 3))
        throw EvaluationError("in Markup::Range: range() takes one to three arguments!");

    long start(0), stop, step(1);
    if (args.size() == 1)
        stop = args[0].getInteger();
    else {
        start = args[0].getInteger();
        stop = args[1].getInteger();
        if (args.size() == 3)
            step = args[2].getInteger();
    }
    if (unlikely(step == 0))
        throw EvaluationError("in Markup::Range: the step argument of range() must not be zero!");

    Value::List numbers;
    for (long i(start); step > 0 ? i < stop : i > stop; i += step)
        numbers.emplace_back(i);
    return Value(numbers);
}


/** \return The built-in function named "name" or an undefined value. */
Value GetBuiltin(const std::string &name, const Context &context) {
    static const std::map<std::string, Value> builtins{
        { "len", MakeFunction("len", Len) },
        { "str", MakeFunction("str", Str) },
        { "range", MakeFunction("range", Range) },
    };

    const auto name_and_function(builtins.find(name));
    if (name_and_function != builtins.cend())
        return name_and_function->second;

    if (name == "defined") {
        const Context * const context_ptr(&context);
        return MakeFunction("defined", [context_ptr](const std::vector<Value> &args, const std::map<std::string, Value> &) {
            if (unlikely(args.size() != 1 or args[0].getType() != Value::STRING))
                throw EvaluationError("in Markup::Defined: defined() takes exactly one string argument!");
            return Value(context_ptr->isDefined(args[0].getString()));
        });
    }

    return Value();
}


class NameNode final : public ExpressionNode {
    std::string name_;

public:
    explicit NameNode(const std::string &name): name_(name) { }

    inline const std::string &getName() const { return name_; }
    Value evaluate(const Context &context) const override {
        const Value value(context.get(name_));
        return value.isUndefined() ? GetBuiltin(name_, context) : value;
    }
};


class AttributeNode final : public ExpressionNode {
    NodePtr object_;
    std::string attribute_name_;

public:
    AttributeNode(const NodePtr &object, const std::string &attribute_name): object_(object), attribute_name_(attribute_name) { }

    Value evaluate(const Context &context) const override { return object_->evaluate(context).getAttribute(attribute_name_); }
};


class ItemNode final : public ExpressionNode {
    NodePtr object_, key_;

public:
    ItemNode(const NodePtr &object, const NodePtr &key): object_(object), key_(key) { }

    Value evaluate(const Context &context) const override {
        const Value object(object_->evaluate(context));
        return object.getItem(key_->evaluate(context));
    }
};


class CallNode final : public ExpressionNode {
    NodePtr function_;
    std::vector<NodePtr> positional_args_;
    std::vector<std::pair<std::string, NodePtr>> keyword_args_;

public:
    CallNode(const NodePtr &function, const std::vector<NodePtr> &positional_args,
             const std::vector<std::pair<std::string, NodePtr>> &keyword_args)
        : function_(function), positional_args_(positional_args), keyword_args_(keyword_args) { }

    Value evaluate(const Context &context) const override;
};


Value CallNode::evaluate(const Context &context) const {
    const Value function(function_->evaluate(context));
    if (unlikely(function.isUndefined())) {
        const NameNode * const name_node(dynamic_cast<const NameNode *>(function_.get()));
        if (name_node != nullptr)
            throw EvaluationError("in Markup::CallNode::evaluate: \"" + name_node->getName() + "\" is not defined!");
    }

    std::vector<Value> positional_args;
    for (const auto &arg : positional_args_)
        positional_args.emplace_back(arg->evaluate(context));
    std::map<std::string, Value> keyword_args;
    for (const auto &name_and_arg : keyword_args_)
        keyword_args[name_and_arg.first] = name_and_arg.second->evaluate(context);

    return function.call(positional_args, keyword_args);
}


class ListNode final : public ExpressionNode {
    std::vector<NodePtr> elements_;

public:
    explicit ListNode(const std::vector<NodePtr> &elements): elements_(elements) { }

    Value evaluate(const Context &context) const override {
        Value::List list;
        for (const auto &element : elements_)
            list.emplace_back(element->evaluate(context));
        return Value(list);
    }
};


class DictNode final : public ExpressionNode {
    std::vector<std::pair<NodePtr, NodePtr>> keys_and_values_;

public:
    explicit DictNode(const std::vector<std::pair<NodePtr, NodePtr>> &keys_and_values): keys_and_values_(keys_and_values) { }

    Value evaluate(const Context &context) const override;
};


Value DictNode::evaluate(const Context &context) const {
    Value::Map map;
    for (const auto &key_and_value : keys_and_values_) {
        const Value key(key_and_value.first->evaluate(context));
        if (unlikely(key.getType() != Value::STRING))
            throw EvaluationError("in Markup::DictNode::evaluate: dict keys must be strings, found "
                                  + Value::TypeToString(key.getType()) + "!");
        map[key.getString()] = key_and_value.second->evaluate(context);
    }

    return Value(map);
}


class UnaryNode final : public ExpressionNode {
public:
    enum Operator { NEGATE, IDENTITY, NOT };

private:
    Operator operator_;
    NodePtr operand_;

public:
    UnaryNode(const Operator op, const NodePtr &operand): operator_(op), operand_(operand) { }

    Value evaluate(const Context &context) const override;
};


Value UnaryNode::evaluate(const Context &context) const {
    const Value operand(operand_->evaluate(context));
    if (operator_ == NOT)
        return Value(not operand.isTrue());

    if (operand.getType() == Value::INTEGER) {
        if (operator_ != NEGATE)
            return operand;
        long negation;
        if (unlikely(__builtin_sub_overflow(0L, operand.getInteger(), &negation)))
            throw EvaluationError("in Markup::UnaryNode::evaluate: integer overflow in unary -!");
        return Value(negation);
    }
    if (operand.getType() == Value::DOUBLE)
        return operator_ == NEGATE ? Value(-operand.getNumber()) : operand;

    throw EvaluationError("in Markup::UnaryNode::evaluate: bad operand type for unary "
                          + std::string(operator_ == NEGATE ? "-" : "+") + ": " + Value::TypeToString(operand.getType())
                          + "!");
}


class BinaryNode final : public ExpressionNode {
public:
    enum Operator {
        ADD, SUBTRACT, MULTIPLY, DIVIDE, MODULO, EQUALS, NOT_EQUALS, LESS, LESS_EQUAL, GREATER, GREATER_EQUAL, IN, NOT_IN, IS,
        IS_NOT
    };

private:
    Operator operator_;
    NodePtr lhs_, rhs_;

public:
    BinaryNode(const Operator op, const NodePtr &lhs, const NodePtr &rhs): operator_(op), lhs_(lhs), rhs_(rhs) { }

    Value evaluate(const Context &context) const override;

private:
    Value evaluateArithmetic(const Value &lhs, const Value &rhs) const;
    Value evaluateIntegerArithmetic(const long lhs, const long rhs) const;
    static std::string OperatorToString(const Operator op);
};


inline bool IsNumeric(const Value &value) {
    return value.getType() == Value::INTEGER or value.getType() == Value::DOUBLE;
}


Value BinaryNode::evaluate(const Context &context) const {
    const Value lhs(lhs_->evaluate(context));
    const Value rhs(rhs_->evaluate(context));

    switch (operator_) {
    case EQUALS:
        return Value(lhs == rhs);
    case NOT_EQUALS:
        return Value(lhs != rhs);
    case LESS:
        return Value(Value::Compare(lhs, rhs) < 0);
    case LESS_EQUAL:
        return Value(Value::Compare(lhs, rhs) <= 0);
    case GREATER:
        return Value(Value::Compare(lhs, rhs) > 0);
    case GREATER_EQUAL:
        return Value(Value::Compare(lhs, rhs) >= 0);
    case IN:
        return Value(rhs.contains(lhs));
    case NOT_IN:
        return Value(not rhs.contains(lhs));
    case IS:
    case IS_NOT: {
        const bool identical(lhs.isNull() or rhs.isNull() ? lhs.getType() == rhs.getType() : lhs == rhs);
        return Value(operator_ == IS ? identical : not identical);
    }
    default:
        return evaluateArithmetic(lhs, rhs);
    }
}


Value BinaryNode::evaluateIntegerArithmetic(const long lhs, const long rhs) const {
    long result;
    bool overflow;
    switch (operator_) {
    case ADD:
        overflow = __builtin_add_overflow(lhs, rhs, &result);
        break;
    case SUBTRACT:
        overflow = __builtin_sub_overflow(lhs, rhs, &result);
        break;
    case MULTIPLY:
        overflow = __builtin_mul_overflow(lhs, rhs, &result);
        break;
    default:
        throw ImplementationError("in Markup::BinaryNode::evaluateIntegerArithmetic: unexpected operator "
                                  + OperatorToString(operator_) + "!");
    }

    if (unlikely(overflow))
        throw EvaluationError("in Markup::BinaryNode::evaluateIntegerArithmetic: integer overflow in " + std::to_string(lhs) + " "
                              + OperatorToString(operator_) + " " + std::to_string(rhs) + "!");
    return Value(result);
}


Value BinaryNode::evaluateArithmetic(const Value &lhs, const Value &rhs) const {
    if (IsNumeric(lhs) and IsNumeric(rhs)) {
        const bool integral(lhs.getType() == Value::INTEGER and rhs.getType() == Value::INTEGER);
        switch (operator_) {
        case ADD:
            return integral ? evaluateIntegerArithmetic(lhs.getInteger(), rhs.getInteger())
                            : Value(lhs.getNumber() + rhs.getNumber());
        case SUBTRACT:
            return integral ? evaluateIntegerArithmetic(lhs.getInteger(), rhs.getInteger())
                            : Value(lhs.getNumber() - rhs.getNumber());
        case MULTIPLY:
            return integral ? evaluateIntegerArithmetic(lhs.getInteger(), rhs.getInteger())
                            : Value(lhs.getNumber() * rhs.getNumber());
        case DIVIDE:
            if (unlikely(rhs.getNumber() == 0.0))
                throw EvaluationError("in Markup::BinaryNode::evaluateArithmetic: division by zero!");
            return Value(lhs.getNumber() / rhs.getNumber());
        case MODULO: {
            if (unlikely(rhs.getNumber() == 0.0))
                throw EvaluationError("in Markup::BinaryNode::evaluateArithmetic: modulo by zero!");
            if (integral) {
                if (rhs.getInteger() == -1) // LONG_MIN % -1 traps on x86.
                    return Value(0L);
                long remainder(lhs.getInteger() % rhs.getInteger());
                if (remainder != 0 and ((remainder < 0) != (rhs.getInteger() < 0)))
                    remainder += rhs.getInteger();
                return Value(remainder);
            }
            double remainder(std::fmod(lhs.getNumber(), rhs.getNumber()));
            if (remainder != 0.0 and ((remainder < 0.0) != (rhs.getNumber() < 0.0)))
                remainder += rhs.getNumber();
            return Value(remainder);
        }
        default:
            break;
        }
    }

    if (operator_ == ADD) {
        if (lhs.getType() == Value::STRING and rhs.getType() == Value::STRING)
            return Value(lhs.getString() + rhs.getString());
        if (lhs.getType() == Value::LIST and rhs.getType() == Value::LIST) {
            Value::List concatenation(lhs.getList());
            concatenation.insert(concatenation.end(), rhs.getList().cbegin(), rhs.getList().cend());
            return Value(concatenation);
        }
    } else if (operator_ == MULTIPLY and lhs.getType() == Value::STRING and rhs.getType() == Value::INTEGER) {
        std::string repetition;
        for (long i(0); i < rhs.getInteger(); ++i)
            repetition += lhs.getString();
        return Value(repetition);
    }

    throw EvaluationError("in Markup::BinaryNode::evaluateArithmetic: unsupported operand types for "
                          + OperatorToString(operator_) + ": " + Value::TypeToString(lhs.getType()) + " and "
                          + Value::TypeToString(rhs.getType()) + "!");
}


std::string BinaryNode::OperatorToString(const Operator op) {
    switch (op) {
    case ADD:
        return "+";
    case SUBTRACT:
        return "-";
    case MULTIPLY:
        return "*";
    case DIVIDE:
        return "/";
    case MODULO:
        return "%";
    default:
        return "comparison";
    }
}


class AndNode final : public ExpressionNode {
    NodePtr lhs_, rhs_;

public:
    AndNode(const NodePtr &lhs, const NodePtr &rhs): lhs_(lhs), rhs_(rhs) { }

    Value evaluate(const Context &context) const override {
        const Value lhs(lhs_->evaluate(context));
        return lhs.isTrue() ? rhs_->evaluate(context) : lhs;
    }
};


class OrNode final : public ExpressionNode {
    NodePtr lhs_, rhs_;

public:
    OrNode(const NodePtr &lhs, const NodePtr &rhs): lhs_(lhs), rhs_(rhs) { }

    Value evaluate(const Context &context) const override {
        const Value lhs(lhs_->evaluate(context));
        return lhs.isTrue() ? lhs : rhs_->evaluate(context);
    }
};


class ConditionalNode final : public ExpressionNode {
    NodePtr condition_, true_value_, false_value_;

public:
    ConditionalNode(const NodePtr &condition, const NodePtr &true_value, const NodePtr &false_value)
        : condition_(condition), true_value_(true_value), false_value_(false_value) { }

    Value evaluate(const Context &context) const override {
        return condition_->evaluate(context).isTrue() ? true_value_->evaluate(context) : false_value_->evaluate(context);
    }
};


/** \brief A recursive-descent parser, one member function per precedence level, lowest first. */
class ExpressionParser {
    typedef ExpressionScanner::Token Token;
    typedef ExpressionScanner::TokenType TokenType;

    const std::string &source_;
    std::vector<Token> tokens_;
    size_t next_token_;

public:
    explicit ExpressionParser(const std::string &source)
        : source_(source), tokens_(ExpressionScanner(source).tokenize()), next_token_(0) { }

    /** \brief Parses the entire source as a single expression. */
    NodePtr parseExpression();

    /** \brief Parses a function signature. */
    FunctionSignature parseSignature();

private:
    inline const Token &peek(const size_t lookahead = 0) const {
        return tokens_[std::min(next_token_ + lookahead, tokens_.size() - 1)];
    }
    inline const Token &advance() {
        const Token &token(peek());
        if (token.type_ != ExpressionScanner::END_OF_INPUT)
            ++next_token_;
        return token;
    }
    bool accept(const TokenType type);
    const Token &expect(const TokenType type);
    [[noreturn]] void throwUnexpected(const Token &token) const;

    NodePtr parseConditional();
    NodePtr parseOr();
    NodePtr parseAnd();
    NodePtr parseNot();
    NodePtr parseComparison();
    NodePtr parseAdditive();
    NodePtr parseMultiplicative();
    NodePtr parseUnary();
    NodePtr parsePostfix();
    NodePtr parseAtom();
    NodePtr parseParenthesised();
    NodePtr parseCallArguments(const NodePtr &function);
};


bool ExpressionParser::accept(const TokenType type) {
    if (peek().type_ != type)
        return false;
    advance();
    return true;
}


const ExpressionParser::Token &ExpressionParser::expect(const TokenType type) {
    if (unlikely(peek().type_ != type))
        throw ExpressionSyntaxError("in Markup::ExpressionParser::expect: expected " + ExpressionScanner::TokenTypeToString(type)
                                        + " but found " + ExpressionScanner::TokenTypeToString(peek().type_) + " at offset "
                                        + std::to_string(peek().offset_) + " in \"" + source_ + "\"!",
                                    peek().offset_);
    return advance();
}


void ExpressionParser::throwUnexpected(const Token &token) const {
    throw ExpressionSyntaxError("in Markup::ExpressionParser: unexpected " + ExpressionScanner::TokenTypeToString(token.type_)
                                    + " at offset " + std::to_string(token.offset_) + " in \"" + source_ + "\"!",
                                token.offset_);
}


NodePtr ExpressionParser::parseExpression() {
    if (unlikely(peek().type_ == ExpressionScanner::END_OF_INPUT))
        throw ExpressionSyntaxError("in Markup::ExpressionParser::parseExpression: empty expression!", 0);

    const NodePtr root(parseConditional());
    if (unlikely(peek().type_ != ExpressionScanner::END_OF_INPUT))
        throwUnexpected(peek());
    return root;
}


NodePtr ExpressionParser::parseConditional() {
    const NodePtr value(parseOr());
    if (not accept(ExpressionScanner::IF))
        return value;

    const NodePtr condition(parseOr());
    expect(ExpressionScanner::ELSE);
    return std::make_shared<ConditionalNode>(condition, value, parseConditional());
}


NodePtr ExpressionParser::parseOr() {
    NodePtr lhs(parseAnd());
    while (accept(ExpressionScanner::OR))
        lhs = std::make_shared<OrNode>(lhs, parseAnd());
    return lhs;
}


NodePtr ExpressionParser::parseAnd() {
    NodePtr lhs(parseNot());
    while (accept(ExpressionScanner::AND))
        lhs = std::make_shared<AndNode>(lhs, parseNot());
    return lhs;
}


NodePtr ExpressionParser::parseNot() {
    if (accept(ExpressionScanner::NOT))
        return std::make_shared<UnaryNode>(UnaryNode::NOT, parseNot());
    return parseComparison();
}


NodePtr ExpressionParser::parseComparison() {
    NodePtr lhs(parseAdditive());
    for (;;) {
        BinaryNode::Operator op;
        switch (peek().type_) {
        case ExpressionScanner::EQUALS:
            op = BinaryNode::EQUALS;
            break;
        case ExpressionScanner::NOT_EQUALS:
            op = BinaryNode::NOT_EQUALS;
            break;
        case ExpressionScanner::LESS:
            op = BinaryNode::LESS;
            break;
        case ExpressionScanner::LESS_EQUAL:
            op = BinaryNode::LESS_EQUAL;
            break;
        case ExpressionScanner::GREATER:
            op = BinaryNode::GREATER;
            break;
        case ExpressionScanner::GREATER_EQUAL:
            op = BinaryNode::GREATER_EQUAL;
            break;
        case ExpressionScanner::IN:
            op = BinaryNode::IN;
            break;
        case ExpressionScanner::IS:
            op = peek(1).type_ == ExpressionScanner::NOT ? BinaryNode::IS_NOT : BinaryNode::IS;
            break;
        case ExpressionScanner::NOT:
            if (peek(1).type_ != ExpressionScanner::IN)
                return lhs;
            op = BinaryNode::NOT_IN;
            break;
        default:
            return lhs;
        }

        advance();
        if (op == BinaryNode::IS_NOT or op == BinaryNode::NOT_IN)
            advance();
        lhs = std::make_shared<BinaryNode>(op, lhs, parseAdditive());
    }
}


NodePtr ExpressionParser::parseAdditive() {
    NodePtr lhs(parseMultiplicative());
    for (;;) {
        if (accept(ExpressionScanner::PLUS))
            lhs = std::make_shared<BinaryNode>(BinaryNode::ADD, lhs, parseMultiplicative());
        else if (accept(ExpressionScanner::MINUS))
            lhs = std::make_shared<BinaryNode>(BinaryNode::SUBTRACT, lhs, parseMultiplicative());
        else
            return lhs;
    }
}


NodePtr ExpressionParser::parseMultiplicative() {
    NodePtr lhs(parseUnary());
    for (;;) {
        if (accept(ExpressionScanner::STAR))
            lhs = std::make_shared<BinaryNode>(BinaryNode::MULTIPLY, lhs, parseUnary());
        else if (accept(ExpressionScanner::SLASH))
            lhs = std::make_shared<BinaryNode>(BinaryNode::DIVIDE, lhs, parseUnary());
        else if (accept(ExpressionScanner::PERCENT))
            lhs = std::make_shared<BinaryNode>(BinaryNode::MODULO, lhs, parseUnary());
        else
            return lhs;
    }
}


NodePtr ExpressionParser::parseUnary() {
    if (accept(ExpressionScanner::MINUS))
        return std::make_shared<UnaryNode>(UnaryNode::NEGATE, parseUnary());
    if (accept(ExpressionScanner::PLUS))
        return std::make_shared<UnaryNode>(UnaryNode::IDENTITY, parseUnary());
    return parsePostfix();
}


NodePtr ExpressionParser::parsePostfix() {
    NodePtr node(parseAtom());
    for (;;) {
        if (accept(ExpressionScanner::DOT))
            node = std::make_shared<AttributeNode>(node, expect(ExpressionScanner::NAME).text_);
        else if (accept(ExpressionScanner::OPEN_BRACKET)) {
            const NodePtr key(parseConditional());
            expect(ExpressionScanner::CLOSE_BRACKET);
            node = std::make_shared<ItemNode>(node, key);
        } else if (accept(ExpressionScanner::OPEN_PAREN))
            node = parseCallArguments(node);
        else
            return node;
    }
}


NodePtr ExpressionParser::parseCallArguments(const NodePtr &function) {
    std::vector<NodePtr> positional_args;
    std::vector<std::pair<std::string, NodePtr>> keyword_args;
    while (not accept(ExpressionScanner::CLOSE_PAREN)) {
        if (peek().type_ == ExpressionScanner::NAME and peek(1).type_ == ExpressionScanner::ASSIGN) {
            const std::string name(advance().text_);
            advance();
            keyword_args.emplace_back(name, parseConditional());
        } else {
            if (unlikely(not keyword_args.empty()))
                throw ExpressionSyntaxError("in Markup::ExpressionParser::parseCallArguments: positional argument follows "
                                            "keyword argument at offset " + std::to_string(peek().offset_) + " in \""
                                            + source_ + "\"!",
                                            peek().offset_);
            positional_args.emplace_back(parseConditional());
        }

        if (not accept(ExpressionScanner::COMMA)) {
            expect(ExpressionScanner::CLOSE_PAREN);
            break;
        }
    }

    return std::make_shared<CallNode>(function, positional_args, keyword_args);
}


NodePtr ExpressionParser::parseAtom() {
    const Token &token(advance());
    switch (token.type_) {
    case ExpressionScanner::NAME:
        return std::make_shared<NameNode>(token.text_);
    case ExpressionScanner::NONE:
        return std::make_shared<ConstantNode>(Value::None());
    case ExpressionScanner::TRUE:
        return std::make_shared<ConstantNode>(Value(true));
    case ExpressionScanner::FALSE:
        return std::make_shared<ConstantNode>(Value(false));
    case ExpressionScanner::STRING_CONSTANT: {
        // Adjacent string constants are concatenated.
        std::string text(token.text_);
        while (peek().type_ == ExpressionScanner::STRING_CONSTANT)
            text += advance().text_;
        return std::make_shared<ConstantNode>(Value(text));
    }
    case ExpressionScanner::INTEGER_CONSTANT: {
        long number;
        if (unlikely(not StringUtil::ToNumber(token.text_, &number)))
            throw ExpressionSyntaxError("in Markup::ExpressionParser::parseAtom: integer constant \"" + token.text_
                                            + "\" out of range!",
                                        token.offset_);
        return std::make_shared<ConstantNode>(Value(number));
    }
    case ExpressionScanner::FLOAT_CONSTANT: {
        double number;
        if (unlikely(not StringUtil::ToDouble(token.text_, &number)))
            throw ExpressionSyntaxError("in Markup::ExpressionParser::parseAtom: bad float constant \"" + token.text_ + "\"!",
                                        token.offset_);
        return std::make_shared<ConstantNode>(Value(number));
    }
    case ExpressionScanner::OPEN_PAREN:
        return parseParenthesised();
    case ExpressionScanner::OPEN_BRACKET: {
        std::vector<NodePtr> elements;
        while (not accept(ExpressionScanner::CLOSE_BRACKET)) {
            elements.emplace_back(parseConditional());
            if (not accept(ExpressionScanner::COMMA)) {
                expect(ExpressionScanner::CLOSE_BRACKET);
                break;
            }
        }
        return std::make_shared<ListNode>(elements);
    }
    case ExpressionScanner::OPEN_BRACE: {
        std::vector<std::pair<NodePtr, NodePtr>> keys_and_values;
        while (not accept(ExpressionScanner::CLOSE_BRACE)) {
            const NodePtr key(parseConditional());
            expect(ExpressionScanner::COLON);
            keys_and_values.emplace_back(key, parseConditional());
            if (not accept(ExpressionScanner::COMMA)) {
                expect(ExpressionScanner::CLOSE_BRACE);
                break;
            }
        }
        return std::make_shared<DictNode>(keys_and_values);
    }
    default:
        throwUnexpected(token);
    }
}


// Called after the opening parenthesis has been consumed.  "(x)" is a parenthesised expression, "()", "(x,)" and "(x, y)"
// are tuples, which we represent as lists.
NodePtr ExpressionParser::parseParenthesised() {
    if (accept(ExpressionScanner::CLOSE_PAREN))
        return std::make_shared<ListNode>(std::vector<NodePtr>{});

    const NodePtr first(parseConditional());
    if (accept(ExpressionScanner::CLOSE_PAREN))
        return first;

    expect(ExpressionScanner::COMMA);
    std::vector<NodePtr> elements{ first };
    while (not accept(ExpressionScanner::CLOSE_PAREN)) {
        elements.emplace_back(parseConditional());
        if (not accept(ExpressionScanner::COMMA)) {
            expect(ExpressionScanner::CLOSE_PAREN);
            break;
        }
    }

    return std::make_shared<ListNode>(elements);
}


FunctionSignature ExpressionParser::parseSignature() {
    FunctionSignature signature;
    signature.name_ = expect(ExpressionScanner::NAME).text_;
    if (accept(ExpressionScanner::END_OF_INPUT))
        return signature;

    expect(ExpressionScanner::OPEN_PAREN);
    while (not accept(ExpressionScanner::CLOSE_PAREN)) {
        const std::string parameter_name(expect(ExpressionScanner::NAME).text_);
        if (accept(ExpressionScanner::ASSIGN)) {
            // We re-parse the default's source text so that it becomes an independent Expression.
            const unsigned start_offset(peek().offset_);
            parseConditional();
            const Token &last_token(tokens_[next_token_ - 1]);
            const std::string default_source(source_.substr(start_offset, last_token.offset_ + last_token.length_ - start_offset));
            signature.parameters_.emplace_back(parameter_name, std::make_shared<const Expression>(default_source));
        } else {
            if (unlikely(not signature.parameters_.empty() and signature.parameters_.back().default_ != nullptr))
                throw ExpressionSyntaxError("in Markup::ExpressionParser::parseSignature: non-default parameter \""
                                                + parameter_name + "\" follows a default parameter in \"" + source_ + "\"!",
                                            peek().offset_);
            signature.parameters_.emplace_back(parameter_name);
        }

        if (not accept(ExpressionScanner::COMMA)) {
            expect(ExpressionScanner::CLOSE_PAREN);
            break;
        }
    }
    expect(ExpressionScanner::END_OF_INPUT);

    return signature;
}


} // unnamed namespace


void Expression::compile() const {
    std::call_once(compile_once_, [this]() { root_ = ExpressionParser(source_).parseExpression(); });
}


Value Expression::evaluate(const Context &context) const {
    compile();
    return root_->evaluate(context);
}


Value Expression::evaluate(const Context &context, const Value &default_value) const {
    const Value value(evaluate(context));
    return value.isUndefined() ? default_value : value;
}


FunctionSignature ParseFunctionSignature(const std::string &signature) {
    const std::string trimmed_signature(StringUtil::TrimWhite(signature));
    return ExpressionParser(trimmed_signature).parseSignature();
}


} // namespace Markup

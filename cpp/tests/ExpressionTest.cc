/** \file   ExpressionTest.cc
 *  \brief  Test cases for the expression language and its values.
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
#define BOOST_TEST_MODULE Expression
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include "Context.h"
#include "Expression.h"
#include "TemplateError.h"


namespace {


Markup::Value Evaluate(const std::string &source, const Markup::Context &context = Markup::Context()) {
    return Markup::Expression(source).evaluate(context);
}


std::string EvaluateToString(const std::string &source, const Markup::Context &context = Markup::Context()) {
    return Evaluate(source, context).toString();
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(Constants) {
    BOOST_CHECK(Evaluate("None").isNone());
    BOOST_CHECK_EQUAL(Evaluate("True").getBoolean(), true);
    BOOST_CHECK_EQUAL(Evaluate("False").getBoolean(), false);
    BOOST_CHECK_EQUAL(Evaluate("42").getInteger(), 42);
    BOOST_CHECK_EQUAL(EvaluateToString("2.5"), "2.5");
    BOOST_CHECK_EQUAL(Evaluate("'single'").getString(), "single");
    BOOST_CHECK_EQUAL(Evaluate("\"dou\" 'ble'").getString(), "double");
}


BOOST_AUTO_TEST_CASE(Arithmetic) {
    BOOST_CHECK_EQUAL(Evaluate("1 + 2 * 3").getInteger(), 7);
    BOOST_CHECK_EQUAL(Evaluate("(1 + 2) * 3").getInteger(), 9);
    BOOST_CHECK_EQUAL(Evaluate("-7 % 3").getInteger(), 2);
    BOOST_CHECK_EQUAL(Evaluate("7 % -3").getInteger(), -2);
    BOOST_CHECK_EQUAL(EvaluateToString("7 / 2"), "3.5");
    BOOST_CHECK_EQUAL(Evaluate("'ab' + 'cd'").getString(), "abcd");
    BOOST_CHECK_EQUAL(Evaluate("'ab' * 3").getString(), "ababab");
    BOOST_CHECK_EQUAL(EvaluateToString("[1, 2] + [3]"), "[1, 2, 3]");
    BOOST_CHECK_THROW(Evaluate("1 / 0"), Markup::EvaluationError);
    BOOST_CHECK_THROW(Evaluate("'a' - 1"), Markup::EvaluationError);
}


BOOST_AUTO_TEST_CASE(IntegerOverflow) {
    BOOST_CHECK_THROW(Evaluate("9223372036854775807 + 1"), Markup::EvaluationError);
    BOOST_CHECK_THROW(Evaluate("-9223372036854775807 - 2"), Markup::EvaluationError);
    BOOST_CHECK_THROW(Evaluate("4294967296 * 4294967296"), Markup::EvaluationError);
    BOOST_CHECK_THROW(Evaluate("-(-9223372036854775807 - 1)"), Markup::EvaluationError);
    BOOST_CHECK_EQUAL(Evaluate("9223372036854775806 + 1").getInteger(), 9223372036854775807L);

    BOOST_CHECK_EQUAL(Evaluate("(-9223372036854775807 - 1) % -1").getInteger(), 0);
    BOOST_CHECK_EQUAL(Evaluate("7 % -1").getInteger(), 0);
    BOOST_CHECK_EQUAL(Evaluate("(-9223372036854775807 - 1) / -1").getNumber(), 9223372036854775808.0);
}


BOOST_AUTO_TEST_CASE(ComparisonsAndBooleans) {
    BOOST_CHECK(Evaluate("1 < 2 and 2 <= 2").isTrue());
    BOOST_CHECK(Evaluate("1 == 1.0").isTrue());
    BOOST_CHECK(Evaluate("'b' > 'a'").isTrue());
    BOOST_CHECK(Evaluate("2 in [1, 2, 3]").isTrue());
    BOOST_CHECK(Evaluate("'x' not in 'abc'").isTrue());
    BOOST_CHECK(Evaluate("None is None").isTrue());
    BOOST_CHECK(Evaluate("1 is not None").isTrue());
    BOOST_CHECK(Evaluate("not ''").isTrue());
    BOOST_CHECK_EQUAL(Evaluate("0 or 'fallback'").getString(), "fallback");
    BOOST_CHECK_EQUAL(Evaluate("'' and 1").getString(), "");
    BOOST_CHECK_EQUAL(Evaluate("'yes' if 1 > 0 else 'no'").getString(), "yes");
    BOOST_CHECK_EQUAL(Evaluate("'yes' if [] else 'no'").getString(), "no");
}


BOOST_AUTO_TEST_CASE(NamesAttributesAndItems) {
    Markup::Context context;
    context.set("user", Markup::Value(Markup::Value::Map{ { "name", Markup::Value("Dude") }, { "tags", Markup::Value(Markup::Value::List{ "a", "b" }) } }));

    BOOST_CHECK_EQUAL(EvaluateToString("user.name", context), "Dude");
    BOOST_CHECK_EQUAL(EvaluateToString("user['name']", context), "Dude");
    BOOST_CHECK_EQUAL(EvaluateToString("user.tags[-1]", context), "b");
    BOOST_CHECK(Evaluate("user.missing", context).isUndefined());
    BOOST_CHECK(Evaluate("nobody.name", context).isUndefined());
    BOOST_CHECK_THROW(Evaluate("user.tags[5]", context), Markup::EvaluationError);
}


BOOST_AUTO_TEST_CASE(Displays) {
    BOOST_CHECK_EQUAL(EvaluateToString("[1, 'two', None]"), "[1, 'two', None]");
    BOOST_CHECK_EQUAL(EvaluateToString("(1, 2)"), "[1, 2]");
    BOOST_CHECK_EQUAL(EvaluateToString("{'class': 'collapse'}"), "{'class': 'collapse'}");
    BOOST_CHECK_EQUAL(Evaluate("{'a': 1}.a").getInteger(), 1);
}


BOOST_AUTO_TEST_CASE(Builtins) {
    Markup::Context context;
    context.set("items", Markup::Value(Markup::Value::List{ 1, 2, 3 }));

    BOOST_CHECK_EQUAL(Evaluate("len(items)", context).getInteger(), 3);
    BOOST_CHECK_EQUAL(Evaluate("len('abcd')").getInteger(), 4);
    BOOST_CHECK_EQUAL(Evaluate("str(42)").getString(), "42");
    BOOST_CHECK_EQUAL(EvaluateToString("range(3)"), "[0, 1, 2]");
    BOOST_CHECK_EQUAL(EvaluateToString("range(5, 0, -2)"), "[5, 3, 1]");
    BOOST_CHECK(Evaluate("defined('items')", context).isTrue());
    BOOST_CHECK(not Evaluate("defined('nothing')", context).isTrue());

    // Context bindings shadow the built-in functions.
    context.set("len", Markup::Value("shadowed"));
    BOOST_CHECK_EQUAL(Evaluate("len", context).getString(), "shadowed");
}


BOOST_AUTO_TEST_CASE(NativeFunctions) {
    Markup::Context context;
    context.set("greet", Markup::MakeFunction("greet", [](const std::vector<Markup::Value> &args,
                                                           const std::map<std::string, Markup::Value> &kwargs) {
        const auto punctuation(kwargs.find("punct"));
        return Markup::Value("Hello " + args.at(0).toString() + (punctuation == kwargs.cend() ? "" : punctuation->second.toString()));
    }));

    BOOST_CHECK_EQUAL(Evaluate("greet('you')", context).getString(), "Hello you");
    BOOST_CHECK_EQUAL(Evaluate("greet('you', punct='!')", context).getString(), "Hello you!");
    BOOST_CHECK_THROW(Evaluate("nothing()", context), Markup::EvaluationError);
}


BOOST_AUTO_TEST_CASE(DefaultValues) {
    const Markup::Context context;
    const Markup::Expression expression("missing");
    BOOST_CHECK(expression.evaluate(context).isUndefined());
    BOOST_CHECK_EQUAL(expression.evaluate(context, Markup::Value("default")).getString(), "default");
}


BOOST_AUTO_TEST_CASE(SyntaxErrors) {
    BOOST_CHECK_THROW(Evaluate(""), Markup::ExpressionSyntaxError);
    BOOST_CHECK_THROW(Evaluate("'unterminated"), Markup::ExpressionSyntaxError);
    BOOST_CHECK_THROW(Evaluate("f(a=1, 2)"), Markup::ExpressionSyntaxError);

    try {
        Evaluate("1 + ");
        BOOST_FAIL("expected an ExpressionSyntaxError");
    } catch (const Markup::ExpressionSyntaxError &x) {
        BOOST_CHECK_EQUAL(x.getOffset(), 4u);
    }

    // The compilation is attempted again by each evaluation.
    const Markup::Expression expression("1 +* 2");
    BOOST_CHECK_THROW(expression.evaluate(Markup::Context()), Markup::ExpressionSyntaxError);
    BOOST_CHECK_THROW(expression.evaluate(Markup::Context()), Markup::ExpressionSyntaxError);
}


BOOST_AUTO_TEST_CASE(FunctionSignatures) {
    const Markup::FunctionSignature signature(Markup::ParseFunctionSignature("echo(greeting, name='world')"));
    BOOST_CHECK_EQUAL(signature.name_, "echo");
    BOOST_REQUIRE_EQUAL(signature.parameters_.size(), 2u);
    BOOST_CHECK_EQUAL(signature.parameters_[0].name_, "greeting");
    BOOST_CHECK(signature.parameters_[0].default_ == nullptr);
    BOOST_CHECK_EQUAL(signature.parameters_[1].name_, "name");
    BOOST_REQUIRE(signature.parameters_[1].default_ != nullptr);
    BOOST_CHECK_EQUAL(signature.parameters_[1].default_->evaluate(Markup::Context()).getString(), "world");

    const Markup::FunctionSignature bare_signature(Markup::ParseFunctionSignature("footer"));
    BOOST_CHECK_EQUAL(bare_signature.name_, "footer");
    BOOST_CHECK(bare_signature.parameters_.empty());

    BOOST_CHECK_THROW(Markup::ParseFunctionSignature("f(a=1, b)"), Markup::ExpressionSyntaxError);
    BOOST_CHECK_THROW(Markup::ParseFunctionSignature("(a)"), Markup::ExpressionSyntaxError);
}

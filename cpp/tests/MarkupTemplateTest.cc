/** \file   MarkupTemplateTest.cc
 *  \brief  Test cases for template compilation, the directives and rendering.
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
#define BOOST_TEST_MODULE MarkupTemplate
#define BOOST_TEST_DYN_LINK

#include <stdexcept>
#include <boost/test/unit_test.hpp>
#include "Context.h"
#include "Directive.h"
#include "MarkupTemplate.h"
#include "TemplateError.h"


namespace {


std::string Render(const std::string &source, const Markup::Context::Frame &variables = Markup::Context::Frame()) {
    const Markup::Template markup_template(source);
    Markup::Context context(variables);
    return markup_template.render(&context);
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(InterpolationFragments) {
    const auto fragments(Markup::Template::Interpolate("Hello ${name}, you owe $$${amount + 1}!"));
    BOOST_REQUIRE_EQUAL(fragments.size(), 5u);
    BOOST_CHECK_EQUAL(fragments[0].getText(), "Hello ");
    BOOST_REQUIRE(fragments[1].isExpression());
    BOOST_CHECK_EQUAL(fragments[1].getExpression()->getSource(), "name");
    BOOST_CHECK_EQUAL(fragments[2].getText(), ", you owe $");
    BOOST_REQUIRE(fragments[3].isExpression());
    BOOST_CHECK_EQUAL(fragments[3].getExpression()->getSource(), "amount + 1");
    BOOST_CHECK_EQUAL(fragments[4].getText(), "!");

    const auto short_form_fragments(Markup::Template::Interpolate("by $user.name."));
    BOOST_REQUIRE_EQUAL(short_form_fragments.size(), 3u);
    BOOST_CHECK_EQUAL(short_form_fragments[1].getExpression()->getSource(), "user.name");
    BOOST_CHECK_EQUAL(short_form_fragments[2].getText(), ".");

    const auto nested_fragments(Markup::Template::Interpolate("${ {'a': '}'}['a'] }"));
    BOOST_REQUIRE_EQUAL(nested_fragments.size(), 1u);
    BOOST_CHECK_EQUAL(nested_fragments[0].getExpression()->getSource(), "{'a': '}'}['a']");

    for (const std::string literal_text : { "${unterminated", "${}", "costs $ 5", "trailing $" }) {
        const auto literal_fragments(Markup::Template::Interpolate(literal_text));
        BOOST_REQUIRE_EQUAL(literal_fragments.size(), 1u);
        BOOST_CHECK(not literal_fragments[0].isExpression());
        BOOST_CHECK_EQUAL(literal_fragments[0].getText(), literal_text);
    }

    BOOST_CHECK(Markup::Template::Interpolate("").empty());
}


BOOST_AUTO_TEST_CASE(TemplatesWithoutDirectivesRenderUnchanged) {
    const std::string source("<html lang=\"en\">\n"
                             "  <body class=\"main\">\n"
                             "    <!-- greeting -->\n"
                             "    <p>Hello <em>World</em> &amp; friends<br/></p>\n"
                             "  </body>\n"
                             "</html>");
    BOOST_CHECK_EQUAL(Render(source), source);
}


BOOST_AUTO_TEST_CASE(TextAndAttributeInterpolation) {
    BOOST_CHECK_EQUAL(Render("<p>Hello, $name! You have ${count * 2} new <b>$what</b>.</p>",
                             { { "name", Markup::Value("Dude") }, { "count", Markup::Value(2) }, { "what", Markup::Value("messages") } }),
                      "<p>Hello, Dude! You have 4 new <b>messages</b>.</p>");
    BOOST_CHECK_EQUAL(Render("<p>${missing}${None}</p>"), "<p/>");
    BOOST_CHECK_EQUAL(Render("<p>${markup}</p>", { { "markup", Markup::Value("<b>") } }), "<p>&lt;b&gt;</p>");
    BOOST_CHECK_EQUAL(Render("<p>${'&amp;' + '&lt;'}</p>"), "<p>&amp;&lt;</p>");

    BOOST_CHECK_EQUAL(Render("<a href=\"/user/${name}\" title=\"$title\" class=\"\">x</a>", { { "name", Markup::Value("dude") } }),
                      "<a href=\"/user/dude\" class=\"\">x</a>");
    BOOST_CHECK_EQUAL(Render("<a title=\"${title}!\">x</a>"), "<a title=\"!\">x</a>");
}


BOOST_AUTO_TEST_CASE(DefDirective) {
    BOOST_CHECK_EQUAL(Render("<div xmlns:py=\"http://purl.org/kid/ns#\">\n"
                             "  <p py:def=\"echo(greeting, name='world')\" class=\"message\">\n"
                             "    ${greeting}, ${name}!\n"
                             "  </p>\n"
                             "  ${echo('hi', name='you')}\n"
                             "</div>",
                             { { "bar", Markup::Value("Bye") } }),
                      "<div>\n"
                      "  <p class=\"message\">\n"
                      "    hi, you!\n"
                      "  </p>\n"
                      "</div>");

    BOOST_CHECK_EQUAL(Render("<div xmlns:py=\"http://purl.org/kid/ns#\">\n"
                             "  <p py:def=\"echo(greeting, name='world')\" class=\"message\">\n"
                             "    ${greeting}, ${name}!\n"
                             "  </p>\n"
                             "  <div py:replace=\"echo('hello')\"></div>\n"
                             "</div>",
                             { { "bar", Markup::Value("Bye") } }),
                      "<div>\n"
                      "  <p class=\"message\">\n"
                      "    hello, world!\n"
                      "  </p>\n"
                      "</div>");
}


BOOST_AUTO_TEST_CASE(DefCalledRepeatedly) {
    const Markup::Template markup_template("<div xmlns:py=\"http://purl.org/kid/ns#\">\n"
                                           "  <b py:def=\"greet(name, punct='!')\">${name}${punct}</b>\n"
                                           "  ${greet('a')} ${greet('b', '?')} ${greet(punct='.')}\n"
                                           "</div>");
    Markup::Context context;
    BOOST_CHECK_EQUAL(markup_template.render(&context), "<div>\n  <b>a!</b> <b>b?</b> <b>.</b>\n</div>");

    // Rendering the same template again yields the same output and leaves only the base frame behind.
    BOOST_CHECK_EQUAL(markup_template.render(&context), "<div>\n  <b>a!</b> <b>b?</b> <b>.</b>\n</div>");
    BOOST_CHECK_EQUAL(context.getDepth(), 1u);
}


BOOST_AUTO_TEST_CASE(ForDirective) {
    const Markup::Template markup_template("<ul xmlns:py=\"http://purl.org/kid/ns#\">\n"
                                           "  <li py:for=\"item in items\">${item}</li>\n"
                                           "</ul>");

    Markup::Context context(Markup::Context::Frame{ { "items", Markup::Value(Markup::Value::List{ 1, 2, 3 }) } });
    BOOST_CHECK_EQUAL(markup_template.render(&context), "<ul>\n  <li>1</li><li>2</li><li>3</li>\n</ul>");
    BOOST_CHECK_EQUAL(context.getDepth(), 1u);
    BOOST_CHECK(not context.isDefined("item"));

    Markup::Context empty_context(Markup::Context::Frame{ { "items", Markup::Value(Markup::Value::List()) } });
    BOOST_CHECK_EQUAL(markup_template.render(&empty_context), "<ul>\n</ul>");
    BOOST_CHECK_EQUAL(empty_context.getDepth(), 1u);

    Markup::Context undefined_context;
    BOOST_CHECK_EQUAL(markup_template.render(&undefined_context), "<ul>\n</ul>");
}


BOOST_AUTO_TEST_CASE(ForDirectiveWithSeveralTargets) {
    BOOST_CHECK_EQUAL(Render("<dl xmlns:py=\"http://purl.org/kid/ns#\"><dt py:for=\"key, value in pairs\">$key=$value</dt></dl>",
                             { { "pairs", Markup::Value(Markup::Value::List{ Markup::Value::List{ "a", 1 },
                                                                             Markup::Value::List{ "b", 2 } }) } }),
                      "<dl><dt>a=1</dt><dt>b=2</dt></dl>");
}


BOOST_AUTO_TEST_CASE(AbandonedLoopRestoresTheContext) {
    const Markup::Template markup_template("<ul xmlns:py=\"http://purl.org/kid/ns#\">\n"
                                           "  <li py:for=\"item in items\">${item}</li>\n"
                                           "</ul>");
    Markup::Context context(Markup::Context::Frame{ { "items", Markup::Value(Markup::Value::List{ 1, 2, 3 }) } });

    std::unique_ptr<Markup::EventStream> stream(markup_template.generate(&context));
    Markup::Event event;
    bool found_item(false);
    while (stream->getNext(&event)) {
        if (event.getKind() == Markup::Event::START and event.getName().getLocalName() == "li") {
            found_item = true;
            break;
        }
    }
    BOOST_REQUIRE(found_item);
    BOOST_CHECK_EQUAL(context.getDepth(), 2u);

    stream.reset();
    BOOST_CHECK_EQUAL(context.getDepth(), 1u);
}


BOOST_AUTO_TEST_CASE(IfDirective) {
    const std::string source("<div xmlns:py=\"http://purl.org/kid/ns#\">\n"
                             "  <b py:if=\"foo\">${bar}</b>\n"
                             "</div>");
    BOOST_CHECK_EQUAL(Render(source, { { "foo", Markup::Value(true) }, { "bar", Markup::Value("Hello") } }),
                      "<div>\n  <b>Hello</b>\n</div>");
    BOOST_CHECK_EQUAL(Render(source, { { "foo", Markup::Value(false) }, { "bar", Markup::Value("Hello") } }), "<div>\n</div>");
    BOOST_CHECK_EQUAL(Render(source), "<div>\n</div>");
}


BOOST_AUTO_TEST_CASE(ConditionIsEvaluatedOutsideTheLoop) {
    const std::string source("<ul xmlns:py=\"http://purl.org/kid/ns#\"><li py:for=\"x in xs\" py:if=\"x\">$x</li></ul>");
    const Markup::Value items(Markup::Value::List{ 0, 1, 2 });

    // The loop variable does not exist yet when the condition is tested.
    BOOST_CHECK_EQUAL(Render(source, { { "xs", items } }), "<ul/>");
    BOOST_CHECK_EQUAL(Render(source, { { "xs", items }, { "x", Markup::Value(false) } }), "<ul/>");
    BOOST_CHECK_EQUAL(Render(source, { { "xs", items }, { "x", Markup::Value(true) } }), "<ul><li>0</li><li>1</li><li>2</li></ul>");
}


BOOST_AUTO_TEST_CASE(MatchDirective) {
    BOOST_CHECK_EQUAL(Render("<div xmlns:py=\"http://purl.org/kid/ns#\">\n"
                             "  <span py:match=\"div/greeting\">\n"
                             "    Hello ${select('@name')}\n"
                             "  </span>\n"
                             "  <greeting name=\"Dude\" />\n"
                             "</div>"),
                      "<div>\n"
                      "  <span>\n"
                      "    Hello Dude\n"
                      "  </span>\n"
                      "</div>");
}


BOOST_AUTO_TEST_CASE(MatchDirectiveSelectingChildren) {
    BOOST_CHECK_EQUAL(Render("<html xmlns:py=\"http://purl.org/kid/ns#\">\n"
                             "  <div py:match=\"section\" class=\"box\">${select('*')}</div>\n"
                             "  <section><h1>Title</h1>ignored</section>\n"
                             "  <section><h1>Other</h1></section>\n"
                             "</html>"),
                      "<html>\n"
                      "  <div class=\"box\"><h1>Title</h1></div>\n"
                      "  <div class=\"box\"><h1>Other</h1></div>\n"
                      "</html>");
}


BOOST_AUTO_TEST_CASE(FirstMatchTemplateWins) {
    BOOST_CHECK_EQUAL(Render("<div xmlns:py=\"http://purl.org/kid/ns#\">"
                             "<span py:match=\"greeting\">1:${select('@name')}</span>"
                             "<span py:match=\"greeting\">2:${select('@name')}</span>"
                             "<greeting name=\"x\"/>"
                             "</div>"),
                      "<div><span>1:x</span></div>");
}


BOOST_AUTO_TEST_CASE(ElementsBeforeTheMatchTemplateLoseTheirContent) {
    BOOST_CHECK_EQUAL(Render("<div xmlns:py=\"http://purl.org/kid/ns#\">"
                             "<greeting name=\"early\"/>"
                             "<span py:match=\"greeting\">${select('@name')}</span>"
                             "<greeting name=\"late\"/>"
                             "</div>"),
                      "<div><span>late</span></div>");
}


BOOST_AUTO_TEST_CASE(DirectiveExpressionsCompileOnFirstUse) {
    const Markup::Template markup_template("<p xmlns:py=\"http://purl.org/kid/ns#\" py:if=\"1 +\">x</p>");
    Markup::Context context;
    BOOST_CHECK_THROW(markup_template.render(&context), Markup::TemplateSyntaxError);
}


BOOST_AUTO_TEST_CASE(AttrsDirective) {
    const std::string source("<ul xmlns:py=\"http://purl.org/kid/ns#\">\n"
                             "  <li py:attrs=\"foo\">Bar</li>\n"
                             "</ul>");
    BOOST_CHECK_EQUAL(Render(source, { { "foo", Markup::Value(Markup::Value::Map{ { "class", Markup::Value("collapse") } }) } }),
                      "<ul>\n  <li class=\"collapse\">Bar</li>\n</ul>");
    BOOST_CHECK_EQUAL(Render(source, { { "foo", Markup::Value::None() } }), "<ul>\n  <li>Bar</li>\n</ul>");

    BOOST_CHECK_EQUAL(Render("<p xmlns:py=\"http://purl.org/kid/ns#\" class=\"x\" py:attrs=\"{'class': None, 'id': 'p1'}\">t</p>"),
                      "<p id=\"p1\">t</p>");
    BOOST_CHECK_EQUAL(Render("<p xmlns:py=\"http://purl.org/kid/ns#\" class=\"x\" py:attrs=\"{}\">t</p>"), "<p class=\"x\">t</p>");
    BOOST_CHECK_EQUAL(Render("<p xmlns:py=\"http://purl.org/kid/ns#\" class=\"x\" py:attrs=\"[('title', ' padded ')]\">t</p>"),
                      "<p class=\"x\" title=\"padded\">t</p>");
    BOOST_CHECK_THROW(Render("<p xmlns:py=\"http://purl.org/kid/ns#\" py:attrs=\"'class'\">t</p>"), Markup::TemplateEvaluationError);
}


BOOST_AUTO_TEST_CASE(ContentDirective) {
    BOOST_CHECK_EQUAL(Render("<ul xmlns:py=\"http://purl.org/kid/ns#\">\n"
                             "  <li py:content=\"bar\">Hello</li>\n"
                             "</ul>",
                             { { "bar", Markup::Value("Bye") } }),
                      "<ul>\n  <li>Bye</li>\n</ul>");
}


BOOST_AUTO_TEST_CASE(ReplaceDirective) {
    BOOST_CHECK_EQUAL(Render("<div xmlns:py=\"http://purl.org/kid/ns#\">\n"
                             "  <span py:replace=\"bar\">Hello</span>\n"
                             "</div>",
                             { { "bar", Markup::Value("Bye") } }),
                      "<div>\n  Bye\n</div>");

    // Equivalent to content combined with strip.
    BOOST_CHECK_EQUAL(Render("<div xmlns:py=\"http://purl.org/kid/ns#\">\n"
                             "  <span py:content=\"bar\" py:strip=\"\">Hello</span>\n"
                             "</div>",
                             { { "bar", Markup::Value("Bye") } }),
                      "<div>\n  Bye\n</div>");
}


BOOST_AUTO_TEST_CASE(StripDirective) {
    BOOST_CHECK_EQUAL(Render("<div xmlns:py=\"http://purl.org/kid/ns#\">\n"
                             "  <div py:strip=\"True\"><b>foo</b></div>\n"
                             "</div>"),
                      "<div>\n  <b>foo</b>\n</div>");
    BOOST_CHECK_EQUAL(Render("<div xmlns:py=\"http://purl.org/kid/ns#\">\n"
                             "  <div py:strip=\"False\"><b>foo</b></div>\n"
                             "</div>"),
                      "<div>\n  <div><b>foo</b></div>\n</div>");
    BOOST_CHECK_EQUAL(Render("<div xmlns:py=\"http://purl.org/kid/ns#\">\n"
                             "  <div py:strip=\"\"><b>foo</b></div>\n"
                             "</div>"),
                      "<div>\n  <b>foo</b>\n</div>");
    BOOST_CHECK_EQUAL(Render("<div xmlns:py=\"http://purl.org/kid/ns#\">\n"
                             "  <div py:def=\"echo(what)\" py:strip=\"\">\n"
                             "    <b>${what}</b>\n"
                             "  </div>\n"
                             "  ${echo('foo')}\n"
                             "</div>"),
                      "<div>\n    <b>foo</b>\n</div>");
}


BOOST_AUTO_TEST_CASE(ForeignNamespacesAreKept) {
    BOOST_CHECK_EQUAL(Render("<html xmlns=\"http://www.w3.org/1999/xhtml\" xmlns:py=\"http://purl.org/kid/ns#\">"
                             "<p py:if=\"True\">x</p></html>"),
                      "<html xmlns=\"http://www.w3.org/1999/xhtml\"><p>x</p></html>");
}


BOOST_AUTO_TEST_CASE(CompilationErrors) {
    try {
        const Markup::Template markup_template("<div xmlns:py=\"http://purl.org/kid/ns#\">\n"
                                               "  <p py:frobnicate=\"x\"/>\n"
                                               "</div>",
                                               "bad.xml");
        BOOST_FAIL("expected a BadDirectiveError");
    } catch (const Markup::BadDirectiveError &x) {
        BOOST_CHECK_EQUAL(x.getDirectiveName(), "frobnicate");
        BOOST_CHECK_EQUAL(x.getFilename(), "bad.xml");
        BOOST_CHECK_EQUAL(x.getLine(), 2u);
    }

    BOOST_CHECK_THROW(Markup::Template("<div>"), Markup::TemplateSyntaxError);
    BOOST_CHECK_THROW(Markup::Template("<ul xmlns:py=\"http://purl.org/kid/ns#\"><li py:for=\"items\">x</li></ul>"),
                      Markup::TemplateSyntaxError);
    BOOST_CHECK_THROW(Markup::Template("<p xmlns:py=\"http://purl.org/kid/ns#\" py:if=\" \">x</p>"), Markup::TemplateSyntaxError);
    BOOST_CHECK_THROW(Markup::Template("<p xmlns:py=\"http://purl.org/kid/ns#\" py:match=\"a[\">x</p>"), Markup::TemplateSyntaxError);
    BOOST_CHECK_THROW(Markup::Template("<p xmlns:py=\"http://purl.org/kid/ns#\" py:def=\"(x)\">x</p>"), Markup::TemplateSyntaxError);
}


BOOST_AUTO_TEST_CASE(RenderingErrors) {
    try {
        Render("<p>\n${1 / 0}</p>");
        BOOST_FAIL("expected a TemplateEvaluationError");
    } catch (const Markup::TemplateEvaluationError &x) {
        BOOST_CHECK_EQUAL(x.getFilename(), "<string>");
        BOOST_CHECK(x.getLine() > 0);
    }

    // Interpolated expressions are compiled lazily, so their syntax errors surface while rendering.
    const Markup::Template markup_template("<p>${1 +}</p>");
    Markup::Context context;
    BOOST_CHECK_THROW(markup_template.render(&context), Markup::TemplateSyntaxError);

    BOOST_CHECK_THROW(Render("<p xmlns:py=\"http://purl.org/kid/ns#\" py:if=\"undefined_function()\">x</p>"),
                      Markup::TemplateEvaluationError);
}


namespace {


std::unique_ptr<Markup::EventStream> ApplyUnless(std::unique_ptr<Markup::EventStream> stream, Markup::Context * const context,
                                                 const std::shared_ptr<const Markup::Expression> &expression)
{
    if (expression != nullptr and expression->evaluate(*context).isTrue())
        return Markup::MakeEmptyStream();
    return stream;
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(CustomDirectives) {
    Markup::DirectiveRegistry::Register("unless", ApplyUnless);
    BOOST_CHECK_THROW(Markup::DirectiveRegistry::Register("unless", ApplyUnless), std::invalid_argument);
    BOOST_CHECK_THROW(Markup::DirectiveRegistry::Register("if", ApplyUnless), std::invalid_argument);

    const std::string source("<div xmlns:py=\"http://purl.org/kid/ns#\"><p py:unless=\"hidden\">shown</p></div>");
    BOOST_CHECK_EQUAL(Render(source, { { "hidden", Markup::Value(true) } }), "<div/>");
    BOOST_CHECK_EQUAL(Render(source, { { "hidden", Markup::Value(false) } }), "<div><p>shown</p></div>");
}

/** \file   TemplateFiltersTest.cc
 *  \brief  Test cases for the event stream filters.
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
#define BOOST_TEST_MODULE TemplateFilters
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include "MarkupParser.h"
#include "TemplateError.h"
#include "TemplateFilters.h"


namespace {


Markup::EventSequence MakeSequence(const std::vector<Markup::Event> &events) {
    return std::make_shared<const std::vector<Markup::Event>>(events);
}


Markup::EventSequence Filter(const Markup::Filter &filter, const std::vector<Markup::Event> &events,
                             Markup::Context * const context)
{
    const std::unique_ptr<Markup::EventStream> stream(filter.apply(Markup::MakeStream(MakeSequence(events)), context));
    return Markup::DrainStream(stream.get());
}


const Markup::Position POSITION(1, 0);


} // unnamed namespace


BOOST_AUTO_TEST_CASE(WhitespaceIsNormalised) {
    Markup::Context context;
    const auto events(Filter(Markup::WhitespaceFilter(),
                             { Markup::Event::MakeText("a  \n", Markup::Position(1, 0)), Markup::Event::MakeText("\n\n b", Markup::Position(2, 0)),
                               Markup::Event::MakeStart(Markup::QName("p"), Markup::Attributes(), Markup::Position(4, 2)),
                               Markup::Event::MakeText("x \t\n\t", Markup::Position(4, 5)),
                               Markup::Event::MakeEnd(Markup::QName("p"), Markup::Position(5, 1)) },
                             &context));
    BOOST_REQUIRE_EQUAL(events->size(), 4u);
    BOOST_CHECK_EQUAL((*events)[0].getText(), "a\n b");
    BOOST_CHECK_EQUAL((*events)[0].getPosition().line_, 1u);
    BOOST_CHECK_EQUAL((*events)[1].getKind(), Markup::Event::START);
    BOOST_CHECK_EQUAL((*events)[2].getText(), "x\n\t");
    BOOST_CHECK_EQUAL((*events)[3].getKind(), Markup::Event::END);
}


BOOST_AUTO_TEST_CASE(ExpressionsAreEvaluated) {
    Markup::Context context(Markup::Context::Frame{ { "name", Markup::Value("Dude") }, { "nothing", Markup::Value::None() } });
    const auto events(Filter(Markup::EvalFilter(),
                             { Markup::Event::MakeText("Hello ", POSITION),
                               Markup::Event::MakeExpression(std::make_shared<const Markup::Expression>("name"), POSITION),
                               Markup::Event::MakeExpression(std::make_shared<const Markup::Expression>("nothing"), POSITION),
                               Markup::Event::MakeExpression(std::make_shared<const Markup::Expression>("undefined"), POSITION),
                               Markup::Event::MakeExpression(std::make_shared<const Markup::Expression>("6 * 7"), POSITION) },
                             &context));
    BOOST_REQUIRE_EQUAL(events->size(), 3u);
    BOOST_CHECK_EQUAL((*events)[1].getKind(), Markup::Event::TEXT);
    BOOST_CHECK_EQUAL((*events)[1].getText(), "Dude");
    BOOST_CHECK_EQUAL((*events)[2].getText(), "42");
}


BOOST_AUTO_TEST_CASE(StreamResultsAreSpliced) {
    const Markup::EventSequence fragment(Markup::MarkupParser().parse("<b>bold</b>"));
    Markup::Context context(Markup::Context::Frame{
        { "fragment", Markup::Value(std::shared_ptr<Markup::EventStream>(Markup::MakeStream(fragment))) } });
    const auto events(Filter(Markup::EvalFilter(),
                             { Markup::Event::MakeText("[", POSITION),
                               Markup::Event::MakeExpression(std::make_shared<const Markup::Expression>("fragment"), POSITION),
                               Markup::Event::MakeText("]", POSITION) },
                             &context));
    BOOST_REQUIRE_EQUAL(events->size(), 5u);
    BOOST_CHECK_EQUAL((*events)[1].getKind(), Markup::Event::START);
    BOOST_CHECK_EQUAL((*events)[2].getText(), "bold");
    BOOST_CHECK_EQUAL((*events)[3].getKind(), Markup::Event::END);
    BOOST_CHECK_EQUAL((*events)[4].getText(), "]");
}


BOOST_AUTO_TEST_CASE(AttributeExpressions) {
    Markup::Context context(Markup::Context::Frame{ { "id", Markup::Value(7) } });

    Markup::Attributes attributes;
    attributes.set(Markup::QName("dropped"),
                   std::vector<Markup::Fragment>{ Markup::Fragment(std::make_shared<const Markup::Expression>("missing")) });
    attributes.set(Markup::QName("partial"),
                   std::vector<Markup::Fragment>{ Markup::Fragment("x"),
                                                  Markup::Fragment(std::make_shared<const Markup::Expression>("missing")) });
    attributes.set(Markup::QName("id"), std::vector<Markup::Fragment>{ Markup::Fragment("item-"),
                                                                       Markup::Fragment(std::make_shared<const Markup::Expression>("id")) });
    attributes.set(Markup::QName("literal"), "unchanged");

    const auto events(Filter(Markup::EvalFilter(), { Markup::Event::MakeStart(Markup::QName("li"), attributes, POSITION) }, &context));
    BOOST_REQUIRE_EQUAL(events->size(), 1u);
    const Markup::Attributes &evaluated_attributes((*events)[0].getAttributes());
    BOOST_CHECK(not evaluated_attributes.has("dropped"));
    BOOST_CHECK_EQUAL(evaluated_attributes.getText("partial"), "x");
    BOOST_CHECK_EQUAL(evaluated_attributes.getText("id"), "item-7");
    BOOST_CHECK_EQUAL(evaluated_attributes.getText("literal"), "unchanged");
    for (const auto &attribute : evaluated_attributes)
        BOOST_CHECK(attribute.isLiteral());
}


BOOST_AUTO_TEST_CASE(EvaluationErrorsCarryTheEventPosition) {
    Markup::Context context;
    try {
        Filter(Markup::EvalFilter(),
               { Markup::Event::MakeExpression(std::make_shared<const Markup::Expression>("1 / 0"), Markup::Position(3, 4)) }, &context);
        BOOST_FAIL("expected an EvaluationError");
    } catch (const Markup::EvaluationError &x) {
        BOOST_REQUIRE(x.hasPosition());
        BOOST_CHECK_EQUAL(x.getPosition().line_, 3u);
        BOOST_CHECK_EQUAL(x.getPosition().column_, 4u);
    }
}


BOOST_AUTO_TEST_CASE(MatchedSubtreesBecomeSubEvents) {
    const auto body(std::make_shared<Markup::CapturedBody>());
    const Markup::MatchFilter match_filter(Markup::MarkupPath("a/b"), body);
    Markup::Context context;

    const Markup::EventSequence input(Markup::MarkupParser().parse("<a><b>x<b>y</b></b><c/></a>"));
    const auto events(Filter(match_filter, *input, &context));
    BOOST_REQUIRE_EQUAL(events->size(), 5u);
    BOOST_CHECK_EQUAL((*events)[0].getName().getLocalName(), "a");
    BOOST_CHECK_EQUAL((*events)[1].getKind(), Markup::Event::SUB);
    BOOST_CHECK((*events)[1].getPosition() == (*input)[1].getPosition());
    BOOST_CHECK_EQUAL((*events)[2].getName().getLocalName(), "c");
    BOOST_CHECK_EQUAL((*events)[4].getKind(), Markup::Event::END);
}

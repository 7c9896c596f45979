/** \file   MarkupParserTest.cc
 *  \brief  Test cases for the SAX2 based markup parser.
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
#define BOOST_TEST_MODULE MarkupParser
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include "MarkupParser.h"


namespace {


std::vector<Markup::Event::Kind> GetKinds(const Markup::EventSequence &events) {
    std::vector<Markup::Event::Kind> kinds;
    for (const auto &event : *events)
        kinds.emplace_back(event.getKind());
    return kinds;
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(ElementsAttributesAndText) {
    const auto events(Markup::MarkupParser("test.xml").parse("<p class=\"note\" id='x'>Hello <b>World</b></p>"));
    const std::vector<Markup::Event::Kind> expected_kinds{ Markup::Event::START, Markup::Event::TEXT, Markup::Event::START,
                                                           Markup::Event::TEXT,  Markup::Event::END,  Markup::Event::END };
    const std::vector<Markup::Event::Kind> kinds(GetKinds(events));
    BOOST_CHECK_EQUAL_COLLECTIONS(kinds.cbegin(), kinds.cend(), expected_kinds.cbegin(), expected_kinds.cend());

    const Markup::Event &start_event((*events)[0]);
    BOOST_CHECK_EQUAL(start_event.getName().getLocalName(), "p");
    BOOST_REQUIRE_EQUAL(start_event.getAttributes().size(), 2u);
    BOOST_CHECK_EQUAL(start_event.getAttributes().begin()->name_.getLocalName(), "class");
    BOOST_CHECK_EQUAL(start_event.getAttributes().getText("class"), "note");
    BOOST_CHECK_EQUAL(start_event.getAttributes().getText("id"), "x");
    BOOST_CHECK_EQUAL((*events)[1].getText(), "Hello ");
    BOOST_CHECK_EQUAL((*events)[3].getText(), "World");
    BOOST_CHECK_EQUAL((*events)[5].getName().getLocalName(), "p");
}


BOOST_AUTO_TEST_CASE(EntitiesAndCdataAreMergedIntoText) {
    const auto events(Markup::MarkupParser().parse("<p>a &amp; b<![CDATA[ <c> ]]>d</p>"));
    BOOST_REQUIRE_EQUAL(events->size(), 3u);
    BOOST_CHECK_EQUAL((*events)[1].getKind(), Markup::Event::TEXT);
    BOOST_CHECK_EQUAL((*events)[1].getText(), "a & b <c> d");
}


BOOST_AUTO_TEST_CASE(NamespaceEventsSurroundTheDeclaringElement) {
    const auto events(Markup::MarkupParser().parse("<x:root xmlns:x=\"urn:x\" xmlns=\"urn:default\"><child/></x:root>"));
    const std::vector<Markup::Event::Kind> expected_kinds{ Markup::Event::START_NS, Markup::Event::START_NS, Markup::Event::START,
                                                           Markup::Event::START,    Markup::Event::END,      Markup::Event::END,
                                                           Markup::Event::END_NS,   Markup::Event::END_NS };
    const std::vector<Markup::Event::Kind> kinds(GetKinds(events));
    BOOST_CHECK_EQUAL_COLLECTIONS(kinds.cbegin(), kinds.cend(), expected_kinds.cbegin(), expected_kinds.cend());

    BOOST_CHECK_EQUAL((*events)[0].getPrefix(), "x");
    BOOST_CHECK_EQUAL((*events)[0].getNamespaceURI(), "urn:x");
    BOOST_CHECK_EQUAL((*events)[1].getPrefix(), "");
    BOOST_CHECK_EQUAL((*events)[1].getNamespaceURI(), "urn:default");

    const Markup::QName &root_name((*events)[2].getName());
    BOOST_CHECK_EQUAL(root_name.getNamespaceURI(), "urn:x");
    BOOST_CHECK_EQUAL(root_name.getPrefix(), "x");
    BOOST_CHECK_EQUAL(root_name.getQualifiedName(), "x:root");
    BOOST_CHECK_EQUAL((*events)[3].getName().getNamespaceURI(), "urn:default");
}


BOOST_AUTO_TEST_CASE(CommentsProcessingInstructionsAndDoctypes) {
    const auto events(Markup::MarkupParser().parse(
        "<?xml version=\"1.0\"?>\n"
        "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Strict//EN\" \"http://www.w3.org/TR/xhtml1/DTD/xhtml1-strict.dtd\">\n"
        "<html><!-- note --><?php echo 1; ?></html>"));
    BOOST_REQUIRE_EQUAL(events->size(), 5u);

    const Markup::Event &doctype_event((*events)[0]);
    BOOST_CHECK_EQUAL(doctype_event.getKind(), Markup::Event::DOCTYPE);
    BOOST_CHECK_EQUAL(doctype_event.getDoctypeName(), "html");
    BOOST_CHECK_EQUAL(doctype_event.getPublicId(), "-//W3C//DTD XHTML 1.0 Strict//EN");
    BOOST_CHECK_EQUAL(doctype_event.getSystemId(), "http://www.w3.org/TR/xhtml1/DTD/xhtml1-strict.dtd");

    BOOST_CHECK_EQUAL((*events)[2].getKind(), Markup::Event::COMMENT);
    BOOST_CHECK_EQUAL((*events)[2].getText(), " note ");
    BOOST_CHECK_EQUAL((*events)[3].getKind(), Markup::Event::PI);
    BOOST_CHECK_EQUAL((*events)[3].getTarget(), "php");
    BOOST_CHECK_EQUAL((*events)[3].getData(), "echo 1; ");
}


BOOST_AUTO_TEST_CASE(LineNumbers) {
    const auto events(Markup::MarkupParser().parse("<div>\n  <p>text</p>\n\n  <br/>\n</div>"));
    for (const auto &event : *events) {
        if (event.getKind() == Markup::Event::START and event.getName().getLocalName() == "div")
            BOOST_CHECK_EQUAL(event.getPosition().line_, 1u);
        else if (event.getKind() == Markup::Event::START and event.getName().getLocalName() == "p")
            BOOST_CHECK_EQUAL(event.getPosition().line_, 2u);
        else if (event.getKind() == Markup::Event::START and event.getName().getLocalName() == "br")
            BOOST_CHECK_EQUAL(event.getPosition().line_, 4u);
    }
}


BOOST_AUTO_TEST_CASE(MalformedMarkup) {
    BOOST_CHECK_THROW(Markup::MarkupParser().parse("<p>unclosed"), Markup::MarkupParser::Error);
    BOOST_CHECK_THROW(Markup::MarkupParser().parse("<p></q>"), Markup::MarkupParser::Error);
    BOOST_CHECK_THROW(Markup::MarkupParser().parse(""), Markup::MarkupParser::Error);

    try {
        Markup::MarkupParser("broken.xml").parse("<div>\n<p>\n</div>");
        BOOST_FAIL("expected a MarkupParser::Error");
    } catch (const Markup::MarkupParser::Error &x) {
        BOOST_CHECK_EQUAL(x.getLine(), 3u);
    }
}

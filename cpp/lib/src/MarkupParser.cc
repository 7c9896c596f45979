/** \file   MarkupParser.cc
 *  \brief  Implementation of the libxml2 based markup parser.
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
#include "MarkupParser.h"
#include <cstdarg>
#include <cstring>
#include <climits>
#include <libxml/SAX2.h>
#include "StringUtil.h"
#include "util.h"


namespace Markup {


namespace {


inline std::string ToString(const xmlChar * const s) {
    return s == nullptr ? std::string() : std::string(reinterpret_cast<const char *>(s));
}


} // unnamed namespace


EventSequence MarkupParser::parse(const std::string &source) {
    if (unlikely(source.size() > INT_MAX))
        throw Error("in Markup::MarkupParser::parse: input too large!", 0, 0);

    events_.clear();
    pending_text_.clear();
    declared_prefixes_.clear();
    last_position_ = Position(1, 0);
    error_occurred_ = false;
    error_message_.clear();

    xmlSAXHandler sax_handler;
    initSaxHandler(&sax_handler);

    // The handler is copied into the parser context, "this" becomes the user data passed to all callbacks.
    parser_context_ = ::xmlCreatePushParserCtxt(&sax_handler, this, nullptr, 0,
                                                filename_.empty() ? nullptr : filename_.c_str());
    if (unlikely(parser_context_ == nullptr))
        throw Error("in Markup::MarkupParser::parse: failed to create a parser context!", 0, 0);
    ::xmlCtxtUseOptions(parser_context_, XML_PARSE_NOENT | XML_PARSE_NONET);

    ::xmlParseChunk(parser_context_, source.data(), static_cast<int>(source.size()), /* terminate = */ 1);
    const bool well_formed(parser_context_->wellFormed != 0);
    ::xmlFreeParserCtxt(parser_context_);
    parser_context_ = nullptr;

    if (unlikely(error_occurred_ or not well_formed)) {
        if (error_message_.empty())
            error_message_ = "not well-formed";
        throw Error(error_message_, error_position_.line_, error_position_.column_);
    }

    flushText();
    auto events(std::make_shared<std::vector<Event>>());
    events->swap(events_);
    return events;
}


void MarkupParser::initSaxHandler(xmlSAXHandler * const sax_handler) {
    // Set all function pointers to nullptr:
    std::memset(sax_handler, '\0', sizeof *sax_handler);

    // Required for libxml2 to call the namespace-aware SAX2 element handlers:
    sax_handler->initialized = XML_SAX2_MAGIC;

    sax_handler->startElementNs = MarkupParser::StartElementHandler;
    sax_handler->endElementNs = MarkupParser::EndElementHandler;
    sax_handler->characters = MarkupParser::CharactersHandler;
    sax_handler->cdataBlock = MarkupParser::CharactersHandler;
    sax_handler->ignorableWhitespace = MarkupParser::CharactersHandler;
    sax_handler->comment = MarkupParser::CommentHandler;
    sax_handler->processingInstruction = MarkupParser::ProcessingInstructionHandler;
    sax_handler->internalSubset = MarkupParser::InternalSubsetHandler;
    sax_handler->error = MarkupParser::ErrorHandler;
    sax_handler->fatalError = MarkupParser::ErrorHandler;
}


Position MarkupParser::getCurrentPosition() const {
    const int line(::xmlSAX2GetLineNumber(parser_context_));
    const int column(::xmlSAX2GetColumnNumber(parser_context_));
    return Position(line > 0 ? static_cast<unsigned>(line) : 1u, column > 0 ? static_cast<unsigned>(column - 1) : 0u);
}


Position MarkupParser::startEvent() {
    const Position start_position(last_position_);
    last_position_ = getCurrentPosition();
    return start_position;
}


void MarkupParser::flushText() {
    if (pending_text_.empty())
        return;

    events_.emplace_back(Event::MakeText(pending_text_, pending_text_position_));
    pending_text_.clear();
}


void MarkupParser::recordError(const std::string &message) {
    if (error_occurred_)
        return;

    error_occurred_ = true;
    error_message_ = message;
    StringUtil::TrimWhite(&error_message_);
    error_position_ = getCurrentPosition();
}


void MarkupParser::StartElementHandler(void *user_data, const xmlChar *local_name, const xmlChar *prefix, const xmlChar *uri,
                                       int namespace_count, const xmlChar **namespaces, int attribute_count,
                                       int /*defaulted_count*/, const xmlChar **attributes)
{
    MarkupParser * const parser(reinterpret_cast<MarkupParser *>(user_data));
    parser->flushText();
    const Position position(parser->startEvent());

    parser->declared_prefixes_.emplace_back();
    for (int i(0); i < namespace_count; ++i) {
        const std::string namespace_prefix(ToString(namespaces[2 * i]));
        parser->events_.emplace_back(Event::MakeStartNamespace(namespace_prefix, ToString(namespaces[2 * i + 1]), position));
        parser->declared_prefixes_.back().emplace_back(namespace_prefix);
    }

    // Each attribute is described by 5 pointers: local name, prefix, URI, value start and value end.
    Attributes event_attributes;
    for (int i(0); i < attribute_count; ++i) {
        const xmlChar ** const attribute(attributes + 5 * i);
        const std::string value(reinterpret_cast<const char *>(attribute[3]), reinterpret_cast<const char *>(attribute[4]));
        event_attributes.set(QName(ToString(attribute[2]), ToString(attribute[1]), ToString(attribute[0])), value);
    }

    parser->events_.emplace_back(Event::MakeStart(QName(ToString(uri), ToString(prefix), ToString(local_name)), event_attributes,
                                                  position));
}


void MarkupParser::EndElementHandler(void *user_data, const xmlChar *local_name, const xmlChar *prefix, const xmlChar *uri) {
    MarkupParser * const parser(reinterpret_cast<MarkupParser *>(user_data));
    parser->flushText();
    const Position position(parser->startEvent());

    parser->events_.emplace_back(Event::MakeEnd(QName(ToString(uri), ToString(prefix), ToString(local_name)), position));

    if (unlikely(parser->declared_prefixes_.empty()))
        return;
    const std::vector<std::string> &declared_prefixes(parser->declared_prefixes_.back());
    for (auto declared_prefix(declared_prefixes.crbegin()); declared_prefix != declared_prefixes.crend(); ++declared_prefix)
        parser->events_.emplace_back(Event::MakeEndNamespace(*declared_prefix, position));
    parser->declared_prefixes_.pop_back();
}


void MarkupParser::CharactersHandler(void *user_data, const xmlChar *chars, int len) {
    MarkupParser * const parser(reinterpret_cast<MarkupParser *>(user_data));
    const Position position(parser->startEvent());
    if (parser->pending_text_.empty())
        parser->pending_text_position_ = position;
    parser->pending_text_.append(reinterpret_cast<const char *>(chars), static_cast<size_t>(len));
}


void MarkupParser::CommentHandler(void *user_data, const xmlChar *text) {
    MarkupParser * const parser(reinterpret_cast<MarkupParser *>(user_data));
    parser->flushText();
    parser->events_.emplace_back(Event::MakeComment(ToString(text), parser->startEvent()));
}


void MarkupParser::ProcessingInstructionHandler(void *user_data, const xmlChar *target, const xmlChar *data) {
    MarkupParser * const parser(reinterpret_cast<MarkupParser *>(user_data));
    parser->flushText();
    parser->events_.emplace_back(Event::MakeProcessingInstruction(ToString(target), ToString(data), parser->startEvent()));
}


void MarkupParser::InternalSubsetHandler(void *user_data, const xmlChar *name, const xmlChar *public_id,
                                         const xmlChar *system_id)
{
    MarkupParser * const parser(reinterpret_cast<MarkupParser *>(user_data));
    parser->flushText();
    parser->events_.emplace_back(Event::MakeDoctype(ToString(name), ToString(public_id), ToString(system_id),
                                                    parser->startEvent()));
}


// Called from C code so we must not throw.  We remember the first message and report it once libxml2 returns.
void MarkupParser::ErrorHandler(void *user_data, const char *fmt, ...) {
    char error[1024];
    va_list args;
    va_start(args, fmt);
    ::vsnprintf(error, sizeof(error), fmt, args);
    va_end(args);

    MarkupParser * const parser(reinterpret_cast<MarkupParser *>(user_data));
    parser->recordError(error);
}


} // namespace Markup

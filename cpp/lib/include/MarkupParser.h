/** \file   MarkupParser.h
 *  \brief  Turns XML source text into a sequence of position-tagged markup events.
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
#include <libxml/parser.h>
#include "MarkupEvent.h"


namespace Markup {


/** \class  MarkupParser
 *  \brief  A SAX2 based XML parser producing START, END, TEXT, START_NS, END_NS, COMMENT, PI and DOCTYPE events.
 *
 *  Each event carries the line (1-based) and column (0-based) of the source position at which it starts.  Adjacent
 *  character data and CDATA sections are merged into a single TEXT event.  START_NS events precede the START event of
 *  the element that declares the namespaces and END_NS events follow its END event.
 */
class MarkupParser {
public:
    class Error : public std::runtime_error {
        unsigned line_, column_;

    public:
        Error(const std::string &message, const unsigned line, const unsigned column)
            : std::runtime_error(message), line_(line), column_(column) { }

        inline unsigned getLine() const { return line_; }
        inline unsigned getColumn() const { return column_; }
    };

private:
    const std::string filename_;
    xmlParserCtxtPtr parser_context_;
    std::vector<Event> events_;
    Position last_position_; // Where the previous SAX callback left off.
    std::string pending_text_;
    Position pending_text_position_;
    std::vector<std::vector<std::string>> declared_prefixes_; // One entry per open element.
    bool error_occurred_;
    std::string error_message_;
    Position error_position_;

public:
    explicit MarkupParser(const std::string &filename = ""): filename_(filename), parser_context_(nullptr), error_occurred_(false) { }
    MarkupParser(const MarkupParser &rhs) = delete;
    MarkupParser &operator=(const MarkupParser &rhs) = delete;

    /** \throws MarkupParser::Error if "source" is not well-formed. */
    EventSequence parse(const std::string &source);

private:
    void initSaxHandler(xmlSAXHandler * const sax_handler);
    Position getCurrentPosition() const;

    /** \return The position at which the event currently being reported starts, and advances the recorded position. */
    Position startEvent();
    void flushText();
    void recordError(const std::string &message);

    static void StartElementHandler(void *user_data, const xmlChar *local_name, const xmlChar *prefix, const xmlChar *uri,
                                    int namespace_count, const xmlChar **namespaces, int attribute_count, int defaulted_count,
                                    const xmlChar **attributes);
    static void EndElementHandler(void *user_data, const xmlChar *local_name, const xmlChar *prefix, const xmlChar *uri);
    static void CharactersHandler(void *user_data, const xmlChar *chars, int len);
    static void CommentHandler(void *user_data, const xmlChar *text);
    static void ProcessingInstructionHandler(void *user_data, const xmlChar *target, const xmlChar *data);
    static void InternalSubsetHandler(void *user_data, const xmlChar *name, const xmlChar *public_id, const xmlChar *system_id);
    static void ErrorHandler(void *user_data, const char *fmt, ...);
};


} // namespace Markup

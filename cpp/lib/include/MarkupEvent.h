/** \file   MarkupEvent.h
 *  \brief  Markup events, attribute collections and the pull-based event stream interface.
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
#include <string>
#include <vector>


namespace Markup {


class Expression;
struct SubProgram;


struct Position {
    unsigned line_;
    unsigned column_;

public:
    Position(): line_(0), column_(0) { }
    Position(const unsigned line, const unsigned column): line_(line), column_(column) { }

    inline bool operator==(const Position &rhs) const { return line_ == rhs.line_ and column_ == rhs.column_; }
    std::string toString() const;
};


/** \brief A namespace-qualified name.  Two names are equal if their namespace URIs and local names are equal, the prefix
 *         only matters for serialisation.
 */
class QName {
    std::string namespace_uri_, prefix_, local_name_;

public:
    QName() = default;
    explicit QName(const std::string &local_name): local_name_(local_name) { }
    QName(const std::string &namespace_uri, const std::string &prefix, const std::string &local_name)
        : namespace_uri_(namespace_uri), prefix_(prefix), local_name_(local_name) { }

    inline const std::string &getNamespaceURI() const { return namespace_uri_; }
    inline const std::string &getPrefix() const { return prefix_; }
    inline const std::string &getLocalName() const { return local_name_; }

    /** \return "prefix:local_name" or "local_name" if there is no prefix. */
    std::string getQualifiedName() const;

    inline bool operator==(const QName &rhs) const {
        return namespace_uri_ == rhs.namespace_uri_ and local_name_ == rhs.local_name_;
    }
    inline bool operator!=(const QName &rhs) const { return not operator==(rhs); }
};


/** \brief A piece of an attribute value, either literal text or an expression that will be evaluated when the
 *         template gets generated.
 */
class Fragment {
    std::string text_;
    std::shared_ptr<const Expression> expression_;

public:
    explicit Fragment(const std::string &text): text_(text) { }
    explicit Fragment(const std::shared_ptr<const Expression> &expression): expression_(expression) { }

    inline bool isExpression() const { return expression_ != nullptr; }
    inline const std::string &getText() const { return text_; }
    inline const std::shared_ptr<const Expression> &getExpression() const { return expression_; }
};


/** \brief The attributes of a start tag in source order. */
class Attributes {
public:
    struct Attribute {
        QName name_;
        std::vector<Fragment> value_;

    public:
        Attribute(const QName &name, const std::vector<Fragment> &value): name_(name), value_(value) { }

        /** \return True if the value contains no expression fragments. */
        bool isLiteral() const;

        /** \return The concatenation of all literal fragments. */
        std::string getText() const;
    };
    typedef std::vector<Attribute>::const_iterator const_iterator;

private:
    std::vector<Attribute> attributes_;

public:
    inline const_iterator begin() const { return attributes_.cbegin(); }
    inline const_iterator end() const { return attributes_.cend(); }
    inline size_t size() const { return attributes_.size(); }
    inline bool empty() const { return attributes_.empty(); }

    /** \return end() if there is no attribute with the qualified name "name". */
    const_iterator find(const std::string &name) const;

    inline bool has(const std::string &name) const { return find(name) != end(); }

    /** \return The literal text of the attribute named "name" or the empty string if there is no such attribute. */
    std::string getText(const std::string &name) const;

    /** \brief Replaces the value of an existing attribute in place or appends a new attribute. */
    void set(const QName &name, const std::vector<Fragment> &value);
    inline void set(const QName &name, const std::string &value) { set(name, std::vector<Fragment>{ Fragment(value) }); }

    /** \return True if the attribute existed, else false. */
    bool remove(const std::string &name);
};


/** \brief An immutable event with a kind-specific payload and the source position it originated from.
 *
 *  Payload by kind:
 *    START      name and attributes
 *    END        name
 *    TEXT       text
 *    START_NS   prefix and namespace URI
 *    END_NS     prefix
 *    COMMENT    text
 *    PI         target and data
 *    DOCTYPE    name, public ID and system ID
 *    EXPR       a compiled expression
 *    SUB        directives and the nested events they apply to
 */
class Event {
public:
    enum Kind { UNINITIALISED, START, END, TEXT, START_NS, END_NS, COMMENT, PI, DOCTYPE, EXPR, SUB };

private:
    Kind kind_;
    Position position_;
    QName name_;
    Attributes attributes_;
    std::string text_, aux_;
    std::shared_ptr<const Expression> expression_;
    std::shared_ptr<const SubProgram> sub_program_;

    Event(const Kind kind, const Position &position): kind_(kind), position_(position) { }

public:
    Event(): kind_(UNINITIALISED) { }

    static Event MakeStart(const QName &name, const Attributes &attributes, const Position &position);
    static Event MakeEnd(const QName &name, const Position &position);
    static Event MakeText(const std::string &text, const Position &position);
    static Event MakeStartNamespace(const std::string &prefix, const std::string &namespace_uri, const Position &position);
    static Event MakeEndNamespace(const std::string &prefix, const Position &position);
    static Event MakeComment(const std::string &text, const Position &position);
    static Event MakeProcessingInstruction(const std::string &target, const std::string &data, const Position &position);
    static Event MakeDoctype(const std::string &name, const std::string &public_id, const std::string &system_id,
                             const Position &position);
    static Event MakeExpression(const std::shared_ptr<const Expression> &expression, const Position &position);
    static Event MakeSub(const std::shared_ptr<const SubProgram> &sub_program, const Position &position);

    inline Kind getKind() const { return kind_; }
    inline const Position &getPosition() const { return position_; }

    /** Only valid for START and END events. */
    inline const QName &getName() const { return name_; }

    /** Only valid for START events. */
    inline const Attributes &getAttributes() const { return attributes_; }

    /** Only valid for TEXT and COMMENT events. */
    inline const std::string &getText() const { return text_; }

    /** Only valid for START_NS and END_NS events. */
    inline const std::string &getPrefix() const { return text_; }
    inline const std::string &getNamespaceURI() const { return aux_; }

    /** Only valid for PI events. */
    inline const std::string &getTarget() const { return name_.getLocalName(); }
    inline const std::string &getData() const { return text_; }

    /** Only valid for DOCTYPE events. */
    inline const std::string &getDoctypeName() const { return name_.getLocalName(); }
    inline const std::string &getPublicId() const { return text_; }
    inline const std::string &getSystemId() const { return aux_; }

    /** Only valid for EXPR events. */
    inline const std::shared_ptr<const Expression> &getExpression() const { return expression_; }

    /** Only valid for SUB events. */
    inline const std::shared_ptr<const SubProgram> &getSubProgram() const { return sub_program_; }

    static std::string KindToString(const Kind kind);
};


typedef std::shared_ptr<const std::vector<Event>> EventSequence;


/** \brief The pull interface all streams, filters and directive adapters implement. */
class EventStream {
public:
    virtual ~EventStream() = default;

    /** \return False at the end of the stream, else true in which case "*event" has been set. */
    virtual bool getNext(Event * const event) = 0;
};


/** \brief Replays a buffered event sequence. */
class EventSequenceStream final : public EventStream {
    EventSequence events_;
    size_t next_index_;

public:
    explicit EventSequenceStream(const EventSequence &events): events_(events), next_index_(0) { }

    bool getNext(Event * const event) override;
};


class EmptyStream final : public EventStream {
public:
    bool getNext(Event * const /*event*/) override { return false; }
};


inline std::unique_ptr<EventStream> MakeStream(const EventSequence &events) {
    return std::unique_ptr<EventStream>(new EventSequenceStream(events));
}


inline std::unique_ptr<EventStream> MakeEmptyStream() {
    return std::unique_ptr<EventStream>(new EmptyStream());
}


/** \brief Pulls all remaining events from "stream" into a new sequence. */
EventSequence DrainStream(EventStream * const stream);


} // namespace Markup

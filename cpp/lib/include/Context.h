/** \file   Context.h
 *  \brief  The scoped variable stack templates are evaluated against.
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


#include <string>
#include <unordered_map>
#include <vector>
#include "Value.h"


namespace Markup {


/** \class Context
 *  \brief A stack of frames mapping names to values.
 *  \note  A Context is mutable per-evaluation state and must outlive all streams generated against it.
 */
class Context {
public:
    typedef std::unordered_map<std::string, Value> Frame;

private:
    std::vector<Frame> frames_; // back() is the top-most frame.

public:
    Context(): frames_(1) { }
    explicit Context(const Frame &base_frame): frames_{ base_frame } { }
    Context(const Context &rhs) = delete;
    Context &operator=(const Context &rhs) = delete;

    /** \return The value bound in the top-most frame that defines "name" or an undefined value. */
    Value get(const std::string &name) const;

    inline bool isDefined(const std::string &name) const { return not get(name).isUndefined(); }

    /** \brief Binds "name" in the top-most frame. */
    inline void set(const std::string &name, const Value &value) { frames_.back()[name] = value; }

    inline void push(const Frame &frame) { frames_.emplace_back(frame); }

    /** \throws ImplementationError if only the base frame is left. */
    void pop();

    inline size_t getDepth() const { return frames_.size(); }
};


/** \class ScopedFrame
 *  \brief Pushes a frame on construction and pops it, together with anything that was pushed on top of it and not popped,
 *         when it is released or destroyed.
 *  \note  This keeps the context balanced if a consumer abandons a partially consumed stream.
 */
class ScopedFrame {
    Context *context_;
    size_t depth_; // The depth of "*context_" right after our push, 0 once released.

public:
    ScopedFrame(Context * const context, const Context::Frame &frame);
    ScopedFrame(const ScopedFrame &rhs) = delete;
    ScopedFrame &operator=(const ScopedFrame &rhs) = delete;
    ~ScopedFrame() { release(); }

    void release();
};


} // namespace Markup

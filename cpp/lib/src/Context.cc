/** \file   Context.cc
 *  \brief  Implementation of the scoped variable stack.
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
#include "Context.h"
#include "TemplateError.h"
#include "util.h"


namespace Markup {


Value Context::get(const std::string &name) const {
    for (auto frame(frames_.crbegin()); frame != frames_.crend(); ++frame) {
        const auto name_and_value(frame->find(name));
        if (name_and_value != frame->cend())
            return name_and_value->second;
    }

    return Value();
}


void Context::pop() {
    if (unlikely(frames_.size() <= 1))
        throw ImplementationError("in Markup::Context::pop: attempt to pop the base frame!");
    frames_.pop_back();
}


ScopedFrame::ScopedFrame(Context * const context, const Context::Frame &frame): context_(context) {
    context_->push(frame);
    depth_ = context_->getDepth();
}


void ScopedFrame::release() {
    if (depth_ == 0)
        return;

    while (context_->getDepth() >= depth_)
        context_->pop();
    depth_ = 0;
}


} // namespace Markup

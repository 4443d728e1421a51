/*
 *  This file is part of fluent-store.
 *
 *  Copyright (C) 2021 Benjamin Winger
 *
 *  fluent-store is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  fluent-store is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with fluent-store.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "fluentstore/ast.hpp"
#include "fluentstore/errors.hpp"
#include <sstream>

namespace fluentstore {
namespace ast {

Placeable::Placeable(Expression &&expression) {
    this->expression.push_back(std::move(expression));
}

SelectExpression::SelectExpression(Expression &&selector, std::vector<Variant> &&variants)
    : variants(std::move(variants)) {
    this->selector.push_back(std::move(selector));
}

std::string Comment::getValue() const {
    std::stringstream ss;
    for (size_t i = 0; i < this->value.size(); i++) {
        if (i > 0)
            ss << "\n";
        ss << this->value[i];
    }
    return ss.str();
}

std::string Junk::getMessage() const { return describeError(this->code, this->arguments); }

} // namespace ast
} // namespace fluentstore

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

#include "fluentstore/parser.hpp"
#include "fluentstore/ptree.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <iostream>

namespace pt = boost::property_tree;

int main(int argc, char **argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <filename.ftl>" << std::endl;
        return 2;
    }

    try {
        std::vector<fluentstore::ast::Entry> ftl = fluentstore::parseFile(argv[1]);
        pt::write_json(std::cout, fluentstore::getResourceTree(ftl));
    } catch (const fluentstore::FluentError &error) {
        std::cerr << argv[1] << ": " << error.what() << std::endl;
        return 1;
    }
    return 0;
}

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

#include "fluentstore/errors.hpp"
#include "fluentstore/store.hpp"
#include <cstring>
#include <iostream>

/*
 * Rewrites fluent resources in canonical form.
 *
 * By default the result is printed. With -i, each file is rewritten in place.
 */
int main(int argc, char **argv) {
    bool inPlace = false;
    std::vector<std::string> files;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-i") == 0)
            inPlace = true;
        else
            files.push_back(argv[i]);
    }

    if (files.empty()) {
        std::cerr << "usage: " << argv[0] << " [-i] <filename.ftl>..." << std::endl;
        return 2;
    }

    int status = 0;
    for (const std::string &filename : files) {
        try {
            fluentstore::FluentFile file = fluentstore::FluentFile::fromFile(filename);
            if (inPlace)
                file.save(filename);
            else
                std::cout << file.serialize();
        } catch (const fluentstore::FluentError &error) {
            std::cerr << filename << ": " << error.what() << std::endl;
            status = 1;
        }
    }
    return status;
}

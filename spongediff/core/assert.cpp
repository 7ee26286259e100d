// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <spongediff/core/assert.h>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

extern char const *__progname; // NOLINT(bugprone-reserved-identifier)

extern "C" void spongediff_assertion_failed(
    char const *const expr, char const *const function, char const *const file,
    long const line, char const *const msg)
{
    char buffer[4096];
    int written = 0;
    if (expr != nullptr) {
        written = snprintf(
            buffer,
            sizeof(buffer),
            "%s: %s:%ld: %s: Assertion '%s' failed.%s%s\n",
            __progname,
            file,
            line,
            function,
            expr,
            msg != nullptr ? " " : "",
            msg != nullptr ? msg : "");
    }
    else {
        written = snprintf(
            buffer,
            sizeof(buffer),
            "%s: %s:%ld: %s: Aborted: %s\n",
            __progname,
            file,
            line,
            function,
            msg != nullptr ? msg : "");
    }
    if (written > 0) {
        size_t const len = (size_t)written < sizeof(buffer)
                               ? (size_t)written
                               : sizeof(buffer) - 1;
        if (write(STDERR_FILENO, buffer, len) == -1) {
            // Suppress warning
        }
    }
    abort();
}

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

#pragma once

#include <tandem/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

[[noreturn]] void tandem_assertion_failed(
    char const *expr, char const *function, char const *file, long line);

#ifdef __cplusplus
}
#endif

#define TANDEM_ASSERT(expr)                                                    \
    if (TANDEM_LIKELY(expr)) {                                                 \
    }                                                                          \
    else {                                                                     \
        tandem_assertion_failed(                                               \
            #expr, __PRETTY_FUNCTION__, __FILE__, __LINE__);                   \
    }

#define TANDEM_ABORT(msg)                                                      \
    tandem_assertion_failed(msg, __PRETTY_FUNCTION__, __FILE__, __LINE__);

//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "gofreeze/Frontend/SourceLocation.h"

#include <sstream>

namespace gofreeze
{

std::string SourceLocation::str() const
{
    std::ostringstream out;
    out << file;
    if (line > 0)
    {
        out << ':' << line;
        if (column > 0)
        {
            out << ':' << column;
        }
    }
    if (!valuePath.empty())
    {
        out << " (" << valuePath << ')';
    }
    return out.str();
}

}  // namespace gofreeze

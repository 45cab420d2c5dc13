#pragma once

#include <string_view>
#include <vector>

#include "protocol/messages.h"

namespace slotbox {

/**
 * Conservative textual scan for forbidden constructs.
 *
 * Matches inside strings and comments too, so it over-reports. Only used to
 * name what an unparseable snippet appears to contain; the AST walk decides
 * for code that parses.
 */
std::vector<Violation> ScanForbiddenPatterns(std::string_view code);

}  // namespace slotbox

#pragma once

#include <string>
#include <string_view>

namespace slotbox {

/**
 * Fold an identifier to its visual ASCII skeleton.
 *
 * Cyrillic and Greek look-alikes, fullwidth forms and mathematical
 * alphanumerics map to the ASCII letter they imitate; invisible format
 * characters (zero-width joiners, soft hyphen, BOM) are dropped. Code points
 * without a look-alike are kept as-is, so the result is only pure ASCII when
 * the input is a disguise of an ASCII name.
 */
std::string FoldConfusables(std::string_view utf8);

}  // namespace slotbox

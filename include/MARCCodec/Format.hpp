#pragma once
// Format.hpp – Line-oriented mnemonic rendering of records for diagnostics.
//
//   =LDR  00082nam\a2200049\a\4500
//   =001  123456
//   =245  14$aNineteen Eighty-Four
//
// Blank indicators, and blanks inside control fields, are shown as '\'.

#include "Types.hpp"

#include <string>
#include <vector>

namespace marc {

[[nodiscard]] std::string toMnemonic(const Record& rec);

// Records separated by one blank line.
[[nodiscard]] std::string toMnemonic(const std::vector<Record>& records);

} // namespace marc

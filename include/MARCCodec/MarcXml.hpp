#pragma once
// MarcXml.hpp – MARCXML (MARC21 slim schema) conversion for record lists.

#include "Types.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace marc {

inline constexpr const char* MARCXML_NAMESPACE = "http://www.loc.gov/MARC21/slim";

// Thrown when a MARCXML document cannot be turned into records.
class MarcXmlError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Serialize records as one <collection> document.
// Throws MarcXmlError when a leader, tag or value holds a NUL byte.
[[nodiscard]] std::string toMarcXml(const std::vector<Record>& records);

// Parse a <collection> or single <record> document, namespace prefix optional.
// Throws MarcXmlError on any parse or validation failure, including a
// <controlfield> whose tag denotes a data field or the reverse.
[[nodiscard]] std::vector<Record> parseMarcXml(std::string_view xml_text);

} // namespace marc

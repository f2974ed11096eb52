#pragma once
// Options.hpp – Codec configuration and its XML loader.

#include <stdexcept>
#include <string>
#include <string_view>

namespace marc {

// ─── Non-structural leader bytes used when synthesizing a leader ──────────────
// Positions 0-4 (record length), 12-16 (base address), 10-11 ("22") and
// 20-23 ("4500") are always written by the encoder itself.
struct LeaderTemplate {
    char record_status{'n'};       // 05
    char type_of_record{'a'};      // 06
    char bibliographic_level{'m'}; // 07
    char type_of_control{' '};     // 08
    char character_coding{'a'};    // 09  'a' = UCS/Unicode
    char encoding_level{' '};      // 17
    char cataloging_form{'a'};     // 18
    char multipart_level{' '};     // 19

    // Pick the template bytes out of an existing leader.  A leader shorter
    // than 24 bytes yields `fallback`.
    [[nodiscard]] static LeaderTemplate fromLeader(std::string_view leader,
                                                   const LeaderTemplate& fallback);

    // Full 24-byte leader for the given record length and base address.
    // Both values must already fit in 5 digits.
    [[nodiscard]] std::string render(unsigned total_length, unsigned base_address) const;
};

struct Options {
    LeaderTemplate leader;

    // Reject records whose leader byte 9 is not 'a'.  Off: UTF-8 is assumed.
    bool check_encoding{false};

    // Reject records whose last byte is not the record terminator.
    bool require_record_terminator{false};
};

// Thrown when the options XML is malformed or holds an invalid value.
class OptionsLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Parse a <CodecOptions> document held in memory.
// Throws OptionsLoadError on any parse or validation failure.
Options loadOptions(std::string_view xml_text);

} // namespace marc

#pragma once
// Types.hpp – Wire constants, record model and error types for the MARC codec.
// All ISO 2709 / MARC21 data flows through these structures.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace marc {

// ─── Wire-format constants ────────────────────────────────────────────────────
inline constexpr uint8_t SUBFIELD_DELIMITER = 0x1F;
inline constexpr uint8_t FIELD_TERMINATOR   = 0x1E;
inline constexpr uint8_t RECORD_TERMINATOR  = 0x1D;

inline constexpr size_t LEADER_LENGTH          = 24;
inline constexpr size_t DIRECTORY_ENTRY_LENGTH = 12;
inline constexpr size_t TAG_LENGTH             = 3;

// Fixed digit widths inside the leader and each directory entry
inline constexpr size_t RECORD_LENGTH_DIGITS = 5;  // leader [0,5)
inline constexpr size_t BASE_ADDRESS_OFFSET  = 12; // leader [12,17)
inline constexpr size_t BASE_ADDRESS_DIGITS  = 5;
inline constexpr size_t FIELD_LENGTH_DIGITS  = 4;  // entry [3,7)
inline constexpr size_t FIELD_START_DIGITS   = 5;  // entry [7,12)

// Leader + directory terminator + record terminator, no fields.
inline constexpr size_t MIN_RECORD_LENGTH = LEADER_LENGTH + 2;

// ─── Error taxonomy ───────────────────────────────────────────────────────────
enum class ErrorKind {
    MalformedLeader,    // Non-numeric or impossible length / base address
    TruncatedRecord,    // Declared extent exceeds the bytes available
    DirectoryOverflow,  // No field terminator within the directory span
    MalformedDirectory, // Non-digit entry widths, or a field outside the data
    FieldWidthOverflow, // Encode-time: value does not fit its digit width
    InvalidField,       // Encode-time: bad tag, or a control byte in content
    EncodingMismatch,   // Leader byte 9 is not 'a' (strict mode only)
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

// Thrown by decodeRecord() and by every encode entry point.
class CodecError : public std::runtime_error {
public:
    CodecError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// ─── One coded unit inside a data field ───────────────────────────────────────
struct Subfield {
    char        code{'\0'};
    std::string data;
};

// ─── One field of a record ────────────────────────────────────────────────────
// Control fields (tag value < 10) carry only `text`.  Data fields carry two
// indicators and an ordered subfield list; `text` stays empty.
struct Field {
    std::string tag;                 // Always 3 bytes on the wire, e.g. "245"
    std::string text;                // Control fields only
    char        ind1{' '};           // Data fields only
    char        ind2{' '};
    std::vector<Subfield> subfields; // Data fields only, wire order

    [[nodiscard]] bool isControl() const noexcept;

    // First subfield with the given code, or nullptr.
    [[nodiscard]] const std::string* firstSubfield(char code) const noexcept;
    [[nodiscard]] bool hasSubfield(char code) const noexcept;
    [[nodiscard]] std::vector<std::string> subfieldValues(char code) const;
};

// Numeric value of the tag's leading digits, after any leading blanks
// (" 01" → 1); nullopt when it has none ("LOC").
[[nodiscard]] std::optional<unsigned> tagValue(std::string_view tag) noexcept;

// A tag denotes a control field when its numeric value is below 10.
[[nodiscard]] bool isControlTag(std::string_view tag) noexcept;

// ─── A decoded (or to-be-encoded) record ──────────────────────────────────────
struct Record {
    std::string        leader; // 24 bytes as read; may be empty before encode
    std::vector<Field> fields; // Wire order; tags may repeat

    [[nodiscard]] const Field* findField(std::string_view tag) const noexcept;
    [[nodiscard]] std::vector<const Field*> fieldsWithTag(std::string_view tag) const;
    [[nodiscard]] std::vector<std::string> subfieldValues(std::string_view tag, char code) const;

    // Text of the 001 control field, empty when absent.
    [[nodiscard]] std::string controlNumber() const;

    // Leader positions 5, 6, 7 and 9; '\0' when the leader is too short.
    [[nodiscard]] char recordStatus() const noexcept;
    [[nodiscard]] char typeOfRecord() const noexcept;
    [[nodiscard]] char bibliographicLevel() const noexcept;
    [[nodiscard]] char characterCoding() const noexcept;
};

// First record whose 001 equals control_number, or nullptr.
[[nodiscard]] const Record* findRecord(const std::vector<Record>& records,
                                       std::string_view control_number) noexcept;

// ─── Result of scanning a multi-record stream ─────────────────────────────────
struct DecodedStream {
    std::vector<Record>      records;           // Complete records, stream order
    size_t                   bytes_consumed{0}; // Extent of `records` in the input
    bool                     valid{true};       // false when the scan stopped early
    std::optional<ErrorKind> stop_reason;
    std::string              error;
};

} // namespace marc

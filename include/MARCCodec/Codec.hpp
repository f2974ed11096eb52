#pragma once
// Codec.hpp – Public ISO 2709 / MARC21 encode / decode API.
//
// Usage example:
//   Codec codec;
//
//   // Decode a raw export holding one or more records:
//   std::vector<Record> records = codec.decode({raw_bytes.data(), raw_bytes.size()});
//
//   // Access fields:
//   const Field* title = records[0].findField("245");
//   const std::string* main_title = title ? title->firstSubfield('a') : nullptr;
//
//   // Build a record:
//   auto bytes = codec.buildRecord({
//       {.tag = "001", .text = "123456"},
//       {.tag = "245", .ind1 = '1', .ind2 = '4', .subfields = {{'a', "Nineteen Eighty-Four"}}},
//   });

#include "Options.hpp"
#include "Types.hpp"

#include <span>
#include <vector>

namespace marc {

class Codec {
public:
    Codec() = default;
    explicit Codec(Options opts) : opts_(std::move(opts)) {}

    [[nodiscard]] const Options& options() const noexcept { return opts_; }

    // ── Decode ───────────────────────────────────────────────────────────────
    // Decode every complete record in a concatenated stream.  Trailing
    // corruption stops the scan; the records before it are returned.
    [[nodiscard]] std::vector<Record> decode(std::span<const uint8_t> buf) const;

    // Same scan as decode(), also reporting where and why it stopped.
    // Never throws for malformed input.
    [[nodiscard]] DecodedStream decodeStream(std::span<const uint8_t> buf) const;

    // Decode exactly one record occupying the whole of `buf`.
    // Throws CodecError when the record is structurally invalid.
    [[nodiscard]] Record decodeRecord(std::span<const uint8_t> buf) const;

    // ── Encode ───────────────────────────────────────────────────────────────
    // Content bytes of one field, including its field terminator.
    // Throws CodecError(InvalidField) for a bad tag or a control byte in content.
    [[nodiscard]] std::vector<uint8_t> buildField(const Field& field) const;

    // One complete record (leader, directory, data, record terminator).
    // The leader is synthesized from options().leader or the given template.
    // Throws CodecError(FieldWidthOverflow) when a length or offset does not
    // fit its fixed digit width.
    [[nodiscard]] std::vector<uint8_t> buildRecord(const std::vector<Field>& fields) const;
    [[nodiscard]] std::vector<uint8_t> buildRecord(const std::vector<Field>& fields,
                                                   const LeaderTemplate& tmpl) const;

    // Re-encode a record, keeping the template bytes of its own leader.
    [[nodiscard]] std::vector<uint8_t> encodeRecord(const Record& rec) const;

    // Concatenated multi-record stream.
    [[nodiscard]] std::vector<uint8_t> encode(const std::vector<Record>& records) const;

private:
    Options opts_;

    // Field-level decode of one payload (terminator already stripped)
    [[nodiscard]] Field decodeField(std::string tag, std::span<const uint8_t> payload) const;
};

} // namespace marc

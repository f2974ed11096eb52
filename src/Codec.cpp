// Codec.cpp – ISO 2709 / MARC21 decode/encode engine.
//
// Wire-format reminder (offsets relative to the start of one record):
//   Leader     [0,24)        [0,5)=record length  [12,17)=base address
//   Directory  [24,base-1)   n × (tag 3B | length 4B | start 5B), then 0x1E
//   Data       [base,end-1)  field payloads, each ending in 0x1E
//   Terminator end-1         0x1D
//
// Data field payload = ind1 ind2 (0x1F code data)* 0x1E
// All structural integers are fixed-width ASCII digits.

#include "MARCCodec/Codec.hpp"
#include "MARCCodec/ByteStream.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace marc {

namespace {

bool isStructuralByte(uint8_t b) noexcept {
    return b == SUBFIELD_DELIMITER || b == FIELD_TERMINATOR || b == RECORD_TERMINATOR;
}

bool isStructuralChar(char c) noexcept {
    return isStructuralByte(static_cast<uint8_t>(c));
}

bool containsStructural(std::string_view s) noexcept {
    for (char c : s)
        if (isStructuralChar(c)) return true;
    return false;
}

std::string_view asText(std::span<const uint8_t> bytes) noexcept {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
//  Field-level decode
// ─────────────────────────────────────────────────────────────────────────────

Field Codec::decodeField(std::string tag, std::span<const uint8_t> payload) const {
    Field f;
    f.tag = std::move(tag);

    if (f.isControl()) {
        f.text = std::string(asText(payload));
        return f;
    }

    // Indicators; a payload too short to hold them leaves them blank.
    if (payload.size() > 0) f.ind1 = static_cast<char>(payload[0]);
    if (payload.size() > 1) f.ind2 = static_cast<char>(payload[1]);
    if (payload.size() <= 2) return f;

    // Split the remainder on the subfield delimiter.  The leading chunk is
    // what precedes the first delimiter: empty in a well-formed field, and
    // never a subfield.
    std::string_view rest = asText(payload.subspan(2));
    size_t pos   = rest.find(static_cast<char>(SUBFIELD_DELIMITER));
    if (pos == std::string_view::npos) pos = rest.size();
    if (pos > 0)
        spdlog::debug("marc: field {} has {} byte(s) before its first subfield; skipped",
                      f.tag, pos);

    while (pos < rest.size()) {
        const size_t begin = pos + 1;
        size_t end = rest.find(static_cast<char>(SUBFIELD_DELIMITER), begin);
        if (end == std::string_view::npos) end = rest.size();

        std::string_view chunk = rest.substr(begin, end - begin);
        if (chunk.empty()) {
            spdlog::debug("marc: field {} has an empty subfield; skipped", f.tag);
        } else {
            f.subfields.push_back({chunk.front(), std::string(chunk.substr(1))});
        }
        pos = end;
    }

    return f;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Record-level decode
// ─────────────────────────────────────────────────────────────────────────────

Record Codec::decodeRecord(std::span<const uint8_t> buf) const {
    if (buf.size() < LEADER_LENGTH)
        throw CodecError(ErrorKind::TruncatedRecord,
                         "record of " + std::to_string(buf.size()) +
                         " bytes is shorter than its leader");

    ByteReader br(buf);
    Record rec;
    rec.leader = br.readString(LEADER_LENGTH);

    // ── Step 1: Leader checks ───────────────────────────────────────────────
    br.seek(BASE_ADDRESS_OFFSET);
    const auto base = br.readDigits(BASE_ADDRESS_DIGITS);
    if (!base)
        throw CodecError(ErrorKind::MalformedLeader,
                         "base address '" + rec.leader.substr(BASE_ADDRESS_OFFSET, BASE_ADDRESS_DIGITS) +
                         "' is not numeric");

    const size_t base_address = *base;
    if (base_address < MIN_RECORD_LENGTH - 1 || base_address > buf.size() - 1)
        throw CodecError(ErrorKind::MalformedLeader,
                         "base address " + std::to_string(base_address) +
                         " outside record of " + std::to_string(buf.size()) + " bytes");

    if (opts_.check_encoding && rec.characterCoding() != 'a')
        throw CodecError(ErrorKind::EncodingMismatch,
                         std::string("leader character coding '") + rec.characterCoding() +
                         "' is not 'a' (UTF-8)");

    const bool terminated = buf.back() == RECORD_TERMINATOR;
    if (opts_.require_record_terminator && !terminated)
        throw CodecError(ErrorKind::TruncatedRecord, "record does not end with a record terminator");

    // Fields may not reach into the record terminator.
    const size_t data_end = terminated ? buf.size() - 1 : buf.size();

    // ── Step 2: Directory scan, up to the first field terminator ────────────
    const size_t dir_end = base_address - 1; // where the terminator belongs
    br.seek(LEADER_LENGTH);

    for (;;) {
        if (br.position() > dir_end)
            throw CodecError(ErrorKind::DirectoryOverflow,
                             "no directory terminator before base address " +
                             std::to_string(base_address));
        if (br.peekByte() == FIELD_TERMINATOR) break;
        if (br.position() + DIRECTORY_ENTRY_LENGTH > dir_end)
            throw CodecError(ErrorKind::DirectoryOverflow,
                             "directory entry at offset " + std::to_string(br.position()) +
                             " runs past base address " + std::to_string(base_address));

        const size_t entry_at = br.position();
        std::string tag    = br.readString(TAG_LENGTH);
        const auto  length = br.readDigits(FIELD_LENGTH_DIGITS);
        const auto  start  = br.readDigits(FIELD_START_DIGITS);
        if (!length || !start)
            throw CodecError(ErrorKind::MalformedDirectory,
                             "directory entry at offset " + std::to_string(entry_at) +
                             " (tag " + tag + ") has non-numeric length or start");

        const size_t field_begin = base_address + *start;
        const size_t field_end   = field_begin + *length;
        if (field_end > data_end)
            throw CodecError(ErrorKind::MalformedDirectory,
                             "field " + tag + " [" + std::to_string(field_begin) + "," +
                             std::to_string(field_end) + ") exceeds data region ending at " +
                             std::to_string(data_end));

        // ── Step 3: Slice the field, drop its terminator, classify ──────────
        auto raw = buf.subspan(field_begin, *length);
        if (!raw.empty() && raw.back() == FIELD_TERMINATOR)
            raw = raw.first(raw.size() - 1);

        rec.fields.push_back(decodeField(std::move(tag), raw));
    }

    return rec;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Public decode
// ─────────────────────────────────────────────────────────────────────────────

DecodedStream Codec::decodeStream(std::span<const uint8_t> buf) const {
    DecodedStream out;
    size_t pos = 0;

    auto stop = [&](ErrorKind kind, std::string why) {
        out.valid       = false;
        out.stop_reason = kind;
        out.error       = std::move(why);
        spdlog::warn("marc: stream scan stopped at offset {} after {} record(s): {}",
                     pos, out.records.size(), out.error);
    };

    while (pos < buf.size()) {
        ByteReader br(buf.subspan(pos));

        if (!br.canRead(RECORD_LENGTH_DIGITS)) {
            stop(ErrorKind::TruncatedRecord,
                 std::to_string(br.bytesAvailable()) + " trailing byte(s) cannot hold a record length");
            break;
        }

        const auto length = br.readDigits(RECORD_LENGTH_DIGITS);
        if (!length || *length < MIN_RECORD_LENGTH) {
            stop(ErrorKind::MalformedLeader,
                 "invalid record length '" +
                 std::string(asText(buf.subspan(pos, RECORD_LENGTH_DIGITS))) + "'");
            break;
        }

        if (*length > br.size()) {
            stop(ErrorKind::TruncatedRecord,
                 "record declares " + std::to_string(*length) + " bytes but only " +
                 std::to_string(br.size()) + " remain");
            break;
        }

        try {
            out.records.push_back(decodeRecord(buf.subspan(pos, *length)));
        } catch (const CodecError& ex) {
            stop(ex.kind(), std::string("record decode error: ") + ex.what());
            break;
        }

        pos += *length;
        out.bytes_consumed = pos;
    }

    return out;
}

std::vector<Record> Codec::decode(std::span<const uint8_t> buf) const {
    return decodeStream(buf).records;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Field-level encode
// ─────────────────────────────────────────────────────────────────────────────

std::vector<uint8_t> Codec::buildField(const Field& field) const {
    if (field.tag.size() != TAG_LENGTH || containsStructural(field.tag))
        throw CodecError(ErrorKind::InvalidField,
                         "buildField: tag '" + field.tag + "' is not 3 plain bytes");

    ByteWriter bw;

    if (field.isControl()) {
        if (containsStructural(field.text))
            throw CodecError(ErrorKind::InvalidField,
                             "buildField: control field " + field.tag + " text holds a delimiter byte");
        bw.writeString(field.text);
        bw.writeByte(FIELD_TERMINATOR);
        return bw.take();
    }

    if (isStructuralChar(field.ind1) || isStructuralChar(field.ind2))
        throw CodecError(ErrorKind::InvalidField,
                         "buildField: field " + field.tag + " indicator is a delimiter byte");

    bw.writeByte(static_cast<uint8_t>(field.ind1));
    bw.writeByte(static_cast<uint8_t>(field.ind2));

    for (const auto& sf : field.subfields) {
        if (sf.code == '\0' || isStructuralChar(sf.code) || containsStructural(sf.data))
            throw CodecError(ErrorKind::InvalidField,
                             "buildField: field " + field.tag + " has an invalid subfield");
        bw.writeByte(SUBFIELD_DELIMITER);
        bw.writeByte(static_cast<uint8_t>(sf.code));
        bw.writeString(sf.data);
    }

    bw.writeByte(FIELD_TERMINATOR);
    return bw.take();
}

// ─────────────────────────────────────────────────────────────────────────────
//  Record-level encode
// ─────────────────────────────────────────────────────────────────────────────

std::vector<uint8_t> Codec::buildRecord(const std::vector<Field>& fields) const {
    return buildRecord(fields, opts_.leader);
}

std::vector<uint8_t> Codec::buildRecord(const std::vector<Field>& fields,
                                        const LeaderTemplate& tmpl) const {
    // ── Directory and data block in one pass ─────────────────────────────────
    ByteWriter directory;
    ByteWriter data;
    uint64_t   offset = 0; // relative to the base address

    for (const auto& field : fields) {
        const auto content = buildField(field);

        directory.writeString(field.tag);
        directory.writeDigits(content.size(), FIELD_LENGTH_DIGITS,
                              "field " + field.tag + " length");
        directory.writeDigits(offset, FIELD_START_DIGITS,
                              "field " + field.tag + " start");

        data.writeBytes(content);
        offset += content.size();
    }
    directory.writeByte(FIELD_TERMINATOR);

    const uint64_t base_address = LEADER_LENGTH + directory.bytesWritten();
    const uint64_t total_length = base_address + data.bytesWritten() + 1;

    // ── Leader ───────────────────────────────────────────────────────────────
    // Validate both widths before rendering; render() assumes they fit.
    ByteWriter widths;
    widths.writeDigits(base_address, BASE_ADDRESS_DIGITS, "base address");
    widths.writeDigits(total_length, RECORD_LENGTH_DIGITS, "record length");

    const std::string leader = tmpl.render(static_cast<unsigned>(total_length),
                                           static_cast<unsigned>(base_address));

    // ── Concatenate leader + directory + data + terminator ───────────────────
    ByteWriter out;
    out.writeString(leader);
    out.writeBytes(directory.buffer());
    out.writeBytes(data.buffer());
    out.writeByte(RECORD_TERMINATOR);
    return out.take();
}

std::vector<uint8_t> Codec::encodeRecord(const Record& rec) const {
    return buildRecord(rec.fields, LeaderTemplate::fromLeader(rec.leader, opts_.leader));
}

// ─────────────────────────────────────────────────────────────────────────────
//  Public encode
// ─────────────────────────────────────────────────────────────────────────────

std::vector<uint8_t> Codec::encode(const std::vector<Record>& records) const {
    std::vector<uint8_t> stream;
    for (const auto& rec : records) {
        auto rb = encodeRecord(rec);
        stream.insert(stream.end(), rb.begin(), rb.end());
    }
    return stream;
}

} // namespace marc

// Options.cpp – Leader template rendering and the <CodecOptions> XML loader.
// Uses pugixml for the options document.

#include "MARCCodec/Options.hpp"
#include "MARCCodec/ByteStream.hpp"
#include "MARCCodec/Types.hpp"

#include <pugixml.hpp>

#include <cstring>
#include <string>

namespace marc {

// ─────────────────────────────────────────────────────────────────────────────
//  LeaderTemplate
// ─────────────────────────────────────────────────────────────────────────────

LeaderTemplate LeaderTemplate::fromLeader(std::string_view leader,
                                          const LeaderTemplate& fallback) {
    if (leader.size() < LEADER_LENGTH) return fallback;

    LeaderTemplate t;
    t.record_status       = leader[5];
    t.type_of_record      = leader[6];
    t.bibliographic_level = leader[7];
    t.type_of_control     = leader[8];
    t.character_coding    = leader[9];
    t.encoding_level      = leader[17];
    t.cataloging_form     = leader[18];
    t.multipart_level     = leader[19];
    return t;
}

std::string LeaderTemplate::render(unsigned total_length, unsigned base_address) const {
    ByteWriter bw;
    bw.writeDigits(total_length, RECORD_LENGTH_DIGITS, "record length"); // 00-04
    bw.writeByte(static_cast<uint8_t>(record_status));                   // 05
    bw.writeByte(static_cast<uint8_t>(type_of_record));                  // 06
    bw.writeByte(static_cast<uint8_t>(bibliographic_level));             // 07
    bw.writeByte(static_cast<uint8_t>(type_of_control));                 // 08
    bw.writeByte(static_cast<uint8_t>(character_coding));                // 09
    bw.writeString("22");                                                // 10-11
    bw.writeDigits(base_address, BASE_ADDRESS_DIGITS, "base address");   // 12-16
    bw.writeByte(static_cast<uint8_t>(encoding_level));                  // 17
    bw.writeByte(static_cast<uint8_t>(cataloging_form));                 // 18
    bw.writeByte(static_cast<uint8_t>(multipart_level));                 // 19
    bw.writeString("4500");                                              // 20-23

    const auto& b = bw.buffer();
    return {reinterpret_cast<const char*>(b.data()), b.size()};
}

// ─── Small parsing helpers ────────────────────────────────────────────────────

static bool parseBool(pugi::xml_attribute attr, bool dflt) {
    if (!attr) return dflt;
    const char* s = attr.as_string();
    if (std::strcmp(s, "true")  == 0 || std::strcmp(s, "1") == 0) return true;
    if (std::strcmp(s, "false") == 0 || std::strcmp(s, "0") == 0) return false;
    throw OptionsLoadError(std::string("Attribute '") + attr.name() +
                           "': expected true/false, got '" + s + "'");
}

static char parseLeaderByte(pugi::xml_node node, const char* name, char dflt) {
    auto attr = node.attribute(name);
    if (!attr) return dflt;
    const char* s = attr.as_string();
    if (std::strlen(s) != 1)
        throw OptionsLoadError(std::string("<Leader ") + name +
                               "> must be exactly one character, got '" + s + "'");
    const auto b = static_cast<uint8_t>(s[0]);
    if (b == SUBFIELD_DELIMITER || b == FIELD_TERMINATOR || b == RECORD_TERMINATOR)
        throw OptionsLoadError(std::string("<Leader ") + name + "> is a delimiter byte");
    return s[0];
}

// ─── Parse a <Leader> block ───────────────────────────────────────────────────

static void parseLeader(pugi::xml_node node, LeaderTemplate& t) {
    t.record_status       = parseLeaderByte(node, "status",         t.record_status);
    t.type_of_record      = parseLeaderByte(node, "type",           t.type_of_record);
    t.bibliographic_level = parseLeaderByte(node, "level",          t.bibliographic_level);
    t.type_of_control     = parseLeaderByte(node, "control",        t.type_of_control);
    t.character_coding    = parseLeaderByte(node, "coding",         t.character_coding);
    t.encoding_level      = parseLeaderByte(node, "encodingLevel",  t.encoding_level);
    t.cataloging_form     = parseLeaderByte(node, "catalogingForm", t.cataloging_form);
    t.multipart_level     = parseLeaderByte(node, "multipart",      t.multipart_level);
}

// ─── Public entry point ───────────────────────────────────────────────────────

Options loadOptions(std::string_view xml_text) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml_text.data(), xml_text.size());
    if (!result)
        throw OptionsLoadError(std::string("Failed to parse options XML: ") +
                               result.description());

    pugi::xml_node root = doc.child("CodecOptions");
    if (!root)
        throw OptionsLoadError("XML root element must be <CodecOptions>");

    Options opts;
    opts.check_encoding            = parseBool(root.attribute("checkEncoding"), opts.check_encoding);
    opts.require_record_terminator = parseBool(root.attribute("requireRecordTerminator"),
                                               opts.require_record_terminator);

    if (auto leader = root.child("Leader"))
        parseLeader(leader, opts.leader);

    return opts;
}

} // namespace marc

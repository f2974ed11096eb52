// test_encode.cpp – Encoder tests: exact bytes, leader synthesis, width limits.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_encode

#include "MARCCodec/Codec.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace marc;

// ─── Utility ─────────────────────────────────────────────────────────────────

static void hexdump(const std::vector<uint8_t>& v, const std::string& label) {
    std::cout << label << " [" << v.size() << "B]: ";
    for (uint8_t b : v)
        std::cout << std::hex << std::setw(2) << std::setfill('0') << (int)b << ' ';
    std::cout << std::dec << '\n';
}

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

static const std::string SD = "\x1F";
static const std::string FT = "\x1E";
static const std::string RT = "\x1D";

static std::string asString(const std::vector<uint8_t>& v) {
    return {v.begin(), v.end()};
}

static Field controlField(const std::string& tag, const std::string& text) {
    Field f;
    f.tag  = tag;
    f.text = text;
    return f;
}

static Field dataField(const std::string& tag, char ind1, char ind2,
                       std::vector<Subfield> subfields) {
    Field f;
    f.tag       = tag;
    f.ind1      = ind1;
    f.ind2      = ind2;
    f.subfields = std::move(subfields);
    return f;
}

// Run fn and return the CodecError kind it raised, or nullopt.
template <typename Fn>
static std::optional<ErrorKind> errorOf(Fn&& fn) {
    try {
        fn();
    } catch (const CodecError& ex) {
        std::cout << "     caught " << toString(ex.kind()) << ": " << ex.what() << '\n';
        return ex.kind();
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: Field content bytes
// ─────────────────────────────────────────────────────────────────────────────
static void testBuildField(const Codec& codec) {
    std::cout << "\n=== Test: buildField ===\n";

    auto title = codec.buildField(dataField("245", '1', '4', {{'a', "Nineteen Eighty-Four"}}));
    hexdump(title, "245");
    CHECK(asString(title) == "14" + SD + "aNineteen Eighty-Four" + FT, "245 content bytes");
    CHECK(title.size() == 25, "245 content is 25 bytes incl. terminator");

    auto subject = codec.buildField(dataField("650", ' ', '0',
                                              {{'a', "Totalitarianism"}, {'x', "Fiction"}}));
    CHECK(asString(subject) == " 0" + SD + "aTotalitarianism" + SD + "xFiction" + FT,
          "650 subfields in written order");

    auto control = codec.buildField(controlField("001", "123456"));
    CHECK(asString(control) == "123456" + FT, "001 raw text + terminator");

    // Indicators and subfields are ignored for control fields
    Field odd = controlField("003", "OCoLC");
    odd.ind1 = '9';
    odd.subfields.push_back({'a', "ignored"});
    CHECK(asString(codec.buildField(odd)) == "OCoLC" + FT, "control field ignores subfields");

    auto bare = codec.buildField(dataField("999", ' ', ' ', {}));
    CHECK(asString(bare) == "  " + FT, "data field without subfields");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: Whole record bytes
//
//  001 "123456" + 245 14 $a Nineteen Eighty-Four
//    directory = 001 0007 00000 | 245 0025 00007 | 0x1E   → 25 bytes
//    base      = 24 + 25 = 49
//    total     = 49 + 7 + 25 + 1 = 82
// ─────────────────────────────────────────────────────────────────────────────
static void testBuildRecord(const Codec& codec) {
    std::cout << "\n=== Test: buildRecord ===\n";

    auto bytes = codec.buildRecord({
        controlField("001", "123456"),
        dataField("245", '1', '4', {{'a', "Nineteen Eighty-Four"}}),
    });
    hexdump(bytes, "record");

    const std::string expected =
        "00082nam a2200049 a 4500"
        "001000700000"
        "245002500007" + FT +
        "123456" + FT +
        "14" + SD + "aNineteen Eighty-Four" + FT +
        RT;
    CHECK(asString(bytes) == expected, "record bytes exact");
    CHECK(bytes.size() == 82,          "record length 82");
    CHECK(bytes.back() == RECORD_TERMINATOR, "ends with record terminator");

    // Single data field
    auto single = asString(codec.buildRecord({dataField("245", '1', '4', {{'a', "Nineteen Eighty-Four"}})}));
    CHECK(single.substr(0, 24) == "00063nam a2200037 a 4500", "single-field leader");
    CHECK(single.substr(24, 13) == "245002500000" + FT,      "single-field directory");

    // Running offsets across three fields
    auto three = asString(codec.buildRecord({
        controlField("001", "789012"),                                // 7 bytes
        dataField("100", '1', ' ', {{'a', "Austen, Jane"}}),          // 2+1+1+12+1 = 17
        dataField("245", '1', '0', {{'a', "Pride and Prejudice"}}),   // 2+1+1+19+1 = 24
    }));
    CHECK(three.substr(24, 37) == "001000700000" "100001700007" "245002400024" + FT,
          "directory offsets accumulate");
    CHECK(three.substr(12, 5) == "00061",                    "base = 24 + 3*12 + 1");
    CHECK(three.substr(0, 5) == "00110",                     "total = 61 + 48 + 1");

    // No fields at all
    auto empty = asString(codec.buildRecord({}));
    CHECK(empty == "00026nam a2200025 a 4500" + FT + RT, "empty record is 26 bytes");

    // Repeated tags keep their order
    auto rep = asString(codec.buildRecord({
        dataField("650", ' ', '0', {{'a', "B"}}),
        dataField("650", ' ', '0', {{'a', "A"}}),
    }));
    CHECK(rep.substr(24, 24) == "650000600000" "650000600006", "repeated tags in given order");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: Fixed-width overflow is a hard error
// ─────────────────────────────────────────────────────────────────────────────
static void testWidthOverflow(const Codec& codec) {
    std::cout << "\n=== Test: Width overflow ===\n";

    // 2 indicators + delimiter + code + data + terminator
    auto sized = [](size_t content_len) {
        return dataField("500", ' ', ' ', {{'a', std::string(content_len - 5, 'x')}});
    };

    auto ok = errorOf([&] { (void)codec.buildRecord({sized(9999)}); });
    CHECK(!ok.has_value(), "9999-byte field fits");

    auto big = errorOf([&] { (void)codec.buildRecord({sized(10000)}); });
    CHECK(big == ErrorKind::FieldWidthOverflow, "10000-byte field → FieldWidthOverflow");

    auto ctl = errorOf([&] { (void)codec.buildRecord({controlField("008", std::string(9999, ' '))}); });
    CHECK(ctl == ErrorKind::FieldWidthOverflow, "10000-byte control field → FieldWidthOverflow");

    // Eleven maximal fields: starts stay below 100000 but the record does not
    std::vector<Field> eleven(11, sized(9999));
    auto rec_len = errorOf([&] { (void)codec.buildRecord(eleven); });
    CHECK(rec_len == ErrorKind::FieldWidthOverflow, "record length ≥ 100000 → FieldWidthOverflow");

    // Twelfth field starts at 109989
    std::vector<Field> twelve(12, sized(9999));
    auto start = errorOf([&] { (void)codec.buildRecord(twelve); });
    CHECK(start == ErrorKind::FieldWidthOverflow, "start offset ≥ 100000 → FieldWidthOverflow");

    // Largest record that still fits: base 145 + data 99853 + terminator
    std::vector<Field> nine(9, sized(9999));
    nine.push_back(sized(9862));
    std::vector<uint8_t> out;
    auto max_ok = errorOf([&] { out = codec.buildRecord(nine); });
    CHECK(!max_ok.has_value() && out.size() == 99999, "99999-byte record fits exactly");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: Invalid field content
// ─────────────────────────────────────────────────────────────────────────────
static void testInvalidFields(const Codec& codec) {
    std::cout << "\n=== Test: Invalid field content ===\n";

    auto kind = [&](const Field& f) {
        return errorOf([&] { (void)codec.buildField(f); });
    };

    CHECK(kind(dataField("24", '1', '0', {{'a', "x"}})) == ErrorKind::InvalidField,   "2-byte tag");
    CHECK(kind(dataField("2450", '1', '0', {{'a', "x"}})) == ErrorKind::InvalidField, "4-byte tag");
    CHECK(kind(dataField("24" + FT, '1', '0', {})) == ErrorKind::InvalidField,         "terminator in tag");
    CHECK(kind(dataField("245", '\x1F', '0', {})) == ErrorKind::InvalidField,          "delimiter as indicator");
    CHECK(kind(dataField("245", '1', '0', {{'\x1F', "x"}})) == ErrorKind::InvalidField, "delimiter as code");
    CHECK(kind(dataField("245", '1', '0', {{'\0', "x"}})) == ErrorKind::InvalidField,   "NUL code");
    CHECK(kind(dataField("245", '1', '0', {{'a', "x" + SD + "b"}})) == ErrorKind::InvalidField,
          "delimiter inside data");
    CHECK(kind(controlField("001", "12" + RT)) == ErrorKind::InvalidField,             "record terminator in text");

    auto via_record = errorOf([&] {
        (void)codec.buildRecord({controlField("001", "ok"), dataField("245", '1', '0', {{'a', "a" + FT}})});
    });
    CHECK(via_record == ErrorKind::InvalidField, "buildRecord propagates InvalidField");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: Leader templates
// ─────────────────────────────────────────────────────────────────────────────
static void testLeaderTemplates() {
    std::cout << "\n=== Test: Leader templates ===\n";

    LeaderTemplate t;
    CHECK(t.render(82, 49) == "00082nam a2200049 a 4500", "default template");

    LeaderTemplate score;
    score.record_status       = 'c';
    score.type_of_record      = 'c';
    score.bibliographic_level = 'm';
    score.encoding_level      = '7';
    score.cataloging_form     = 'i';
    CHECK(score.render(1234, 61) == "01234ccm a22000617i 4500", "custom template");

    auto back = LeaderTemplate::fromLeader("01234ccm a22000617i 4500", t);
    CHECK(back.record_status == 'c' && back.encoding_level == '7' && back.cataloging_form == 'i',
          "fromLeader picks template bytes");
    auto fallback = LeaderTemplate::fromLeader("short", score);
    CHECK(fallback.record_status == 'c', "fromLeader falls back for short leaders");

    Options opts;
    opts.leader.type_of_record = 'g';
    Codec codec(opts);
    auto bytes = codec.buildRecord({controlField("001", "v1")});
    CHECK(std::string(bytes.begin(), bytes.begin() + 24) == "00041nga a2200037 a 4500",
          "Options::leader drives buildRecord");

    // encodeRecord keeps the record's own template bytes, recomputes lengths
    Record rec;
    rec.leader = "99999cjm a2299999 i 4500";
    rec.fields.push_back(dataField("245", '1', '4', {{'a', "Nineteen Eighty-Four"}}));
    auto enc = codec.encodeRecord(rec);
    CHECK(std::string(enc.begin(), enc.begin() + 24) == "00063cjm a2200037 i 4500",
          "encodeRecord rewrites lengths only");

    Record no_leader;
    no_leader.fields = rec.fields;
    auto enc2 = codec.encodeRecord(no_leader);
    CHECK(std::string(enc2.begin(), enc2.begin() + 24) == "00063nga a2200037 a 4500",
          "encodeRecord without leader uses Options::leader");

    auto stream = codec.encode({rec, no_leader});
    std::vector<uint8_t> joined = enc;
    joined.insert(joined.end(), enc2.begin(), enc2.end());
    CHECK(stream == joined, "encode() concatenates records");
    CHECK(codec.encode({}).empty(), "encode() of nothing is empty");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    Codec codec;

    testBuildField(codec);
    testBuildRecord(codec);
    testWidthOverflow(codec);
    testInvalidFields(codec);
    testLeaderTemplates();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}

// Record.cpp – Read-only queries over decoded records.

#include "MARCCodec/Types.hpp"

namespace marc {

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::MalformedLeader:    return "MalformedLeader";
    case ErrorKind::TruncatedRecord:    return "TruncatedRecord";
    case ErrorKind::DirectoryOverflow:  return "DirectoryOverflow";
    case ErrorKind::MalformedDirectory: return "MalformedDirectory";
    case ErrorKind::FieldWidthOverflow: return "FieldWidthOverflow";
    case ErrorKind::InvalidField:       return "InvalidField";
    case ErrorKind::EncodingMismatch:   return "EncodingMismatch";
    }
    return "Unknown";
}

// ─── Tag classification ───────────────────────────────────────────────────────

std::optional<unsigned> tagValue(std::string_view tag) noexcept {
    size_t i = 0;
    while (i < tag.size() && (tag[i] == ' ' || tag[i] == '\t')) ++i;

    unsigned v      = 0;
    bool     digits = false;
    for (char c : tag.substr(i)) {
        if (c < '0' || c > '9') break;
        v      = v * 10u + static_cast<unsigned>(c - '0');
        digits = true;
    }
    if (!digits) return std::nullopt;
    return v;
}

bool isControlTag(std::string_view tag) noexcept {
    const auto v = tagValue(tag);
    return v.has_value() && *v < 10;
}

// ─── Field ────────────────────────────────────────────────────────────────────

bool Field::isControl() const noexcept { return isControlTag(tag); }

const std::string* Field::firstSubfield(char code) const noexcept {
    for (const auto& sf : subfields)
        if (sf.code == code) return &sf.data;
    return nullptr;
}

bool Field::hasSubfield(char code) const noexcept {
    return firstSubfield(code) != nullptr;
}

std::vector<std::string> Field::subfieldValues(char code) const {
    std::vector<std::string> values;
    for (const auto& sf : subfields)
        if (sf.code == code) values.push_back(sf.data);
    return values;
}

// ─── Record ───────────────────────────────────────────────────────────────────

const Field* Record::findField(std::string_view tag) const noexcept {
    for (const auto& f : fields)
        if (f.tag == tag) return &f;
    return nullptr;
}

std::vector<const Field*> Record::fieldsWithTag(std::string_view tag) const {
    std::vector<const Field*> out;
    for (const auto& f : fields)
        if (f.tag == tag) out.push_back(&f);
    return out;
}

std::vector<std::string> Record::subfieldValues(std::string_view tag, char code) const {
    std::vector<std::string> values;
    for (const auto& f : fields) {
        if (f.tag != tag) continue;
        for (const auto& sf : f.subfields)
            if (sf.code == code) values.push_back(sf.data);
    }
    return values;
}

std::string Record::controlNumber() const {
    const Field* f = findField("001");
    return f ? f->text : std::string{};
}

static char leaderAt(const std::string& leader, size_t pos) noexcept {
    return pos < leader.size() && leader.size() >= LEADER_LENGTH ? leader[pos] : '\0';
}

char Record::recordStatus()       const noexcept { return leaderAt(leader, 5); }
char Record::typeOfRecord()       const noexcept { return leaderAt(leader, 6); }
char Record::bibliographicLevel() const noexcept { return leaderAt(leader, 7); }
char Record::characterCoding()    const noexcept { return leaderAt(leader, 9); }

const Record* findRecord(const std::vector<Record>& records,
                         std::string_view control_number) noexcept {
    for (const auto& rec : records) {
        const Field* f = rec.findField("001");
        if (f && f->text == control_number) return &rec;
    }
    return nullptr;
}

} // namespace marc

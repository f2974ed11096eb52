// Format.cpp – Mnemonic rendering of records.

#include "MARCCodec/Format.hpp"

#include <sstream>

namespace marc {

static std::string blanksAsBackslash(const std::string& s) {
    std::string out = s;
    for (char& c : out)
        if (c == ' ') c = '\\';
    return out;
}

std::string toMnemonic(const Record& rec) {
    std::ostringstream oss;
    oss << "=LDR  " << blanksAsBackslash(rec.leader) << '\n';

    for (const auto& f : rec.fields) {
        oss << '=' << f.tag << "  ";
        if (f.isControl()) {
            oss << blanksAsBackslash(f.text) << '\n';
            continue;
        }
        oss << (f.ind1 == ' ' ? '\\' : f.ind1)
            << (f.ind2 == ' ' ? '\\' : f.ind2);
        for (const auto& sf : f.subfields)
            oss << '$' << sf.code << sf.data;
        oss << '\n';
    }
    return oss.str();
}

std::string toMnemonic(const std::vector<Record>& records) {
    std::string out;
    for (size_t i = 0; i < records.size(); ++i) {
        if (i > 0) out += '\n';
        out += toMnemonic(records[i]);
    }
    return out;
}

} // namespace marc

// MarcXml.cpp – MARCXML reader and writer.
// Uses pugixml for both directions.

#include "MARCCodec/MarcXml.hpp"
#include "MARCCodec/Options.hpp"

#include <pugixml.hpp>

#include <cstring>
#include <sstream>
#include <string>

namespace marc {

// ─── Small parsing helpers ────────────────────────────────────────────────────

// Element name without any "prefix:" part.
static const char* localName(pugi::xml_node node) {
    const char* name  = node.name();
    const char* colon = std::strrchr(name, ':');
    return colon ? colon + 1 : name;
}

static bool isElement(pugi::xml_node node, const char* name) {
    return node.type() == pugi::node_element && std::strcmp(localName(node), name) == 0;
}

static std::string requireTag(pugi::xml_node node) {
    auto attr = node.attribute("tag");
    if (!attr)
        throw MarcXmlError(std::string("<") + localName(node) + "> missing 'tag' attribute");
    std::string tag = attr.as_string();
    if (tag.size() != TAG_LENGTH)
        throw MarcXmlError("<" + std::string(localName(node)) + " tag=\"" + tag +
                           "\"> must be 3 characters");
    return tag;
}

// The element kind must agree with the kind the tag denotes.
static void requireKind(const std::string& tag, bool control_element) {
    if (isControlTag(tag) != control_element)
        throw MarcXmlError("tag " + tag + " denotes a " +
                           (control_element ? "data" : "control") +
                           " field but appears in <" +
                           (control_element ? "controlfield" : "datafield") + ">");
}

// XML text cannot carry a NUL byte.
static const char* xmlText(const std::string& s, const std::string& where) {
    if (s.find('\0') != std::string::npos)
        throw MarcXmlError(where + " holds a NUL byte");
    return s.c_str();
}

static char parseIndicator(pugi::xml_node node, const char* name) {
    const char* s = node.attribute(name).as_string(" ");
    if (std::strlen(s) > 1)
        throw MarcXmlError(std::string("<datafield ") + name + "=\"" + s +
                           "\"> must be one character");
    return *s == '\0' ? ' ' : s[0];
}

// ─── Parse one <record> node ──────────────────────────────────────────────────

static Record parseRecordNode(pugi::xml_node node) {
    Record rec;

    for (auto child : node.children()) {
        if (isElement(child, "leader")) {
            rec.leader = child.text().as_string();
        } else if (isElement(child, "controlfield")) {
            Field f;
            f.tag  = requireTag(child);
            requireKind(f.tag, true);
            f.text = child.text().as_string();
            rec.fields.push_back(std::move(f));
        } else if (isElement(child, "datafield")) {
            Field f;
            f.tag  = requireTag(child);
            requireKind(f.tag, false);
            f.ind1 = parseIndicator(child, "ind1");
            f.ind2 = parseIndicator(child, "ind2");
            for (auto sub : child.children()) {
                if (!isElement(sub, "subfield")) continue;
                const char* code = sub.attribute("code").as_string("");
                if (std::strlen(code) != 1)
                    throw MarcXmlError("<subfield code=\"" + std::string(code) +
                                       "\"> in field " + f.tag + " must be one character");
                f.subfields.push_back({code[0], sub.text().as_string()});
            }
            rec.fields.push_back(std::move(f));
        }
    }

    // MARCXML leaders carry no meaningful lengths; synthesize one if absent.
    if (rec.leader.empty())
        rec.leader = LeaderTemplate{}.render(0, 0);

    return rec;
}

// ─── Public entry points ──────────────────────────────────────────────────────

std::vector<Record> parseMarcXml(std::string_view xml_text) {
    pugi::xml_document doc;
    // Blank-only control fields and subfields are content, not formatting.
    pugi::xml_parse_result result = doc.load_buffer(xml_text.data(), xml_text.size(),
                                                    pugi::parse_default | pugi::parse_ws_pcdata_single);
    if (!result)
        throw MarcXmlError(std::string("Failed to parse MARCXML: ") + result.description());

    pugi::xml_node root = doc.document_element();
    std::vector<Record> records;

    if (isElement(root, "record")) {
        records.push_back(parseRecordNode(root));
    } else if (isElement(root, "collection")) {
        for (auto child : root.children())
            if (isElement(child, "record"))
                records.push_back(parseRecordNode(child));
    } else {
        throw MarcXmlError(std::string("MARCXML root element must be <collection> or <record>, got <") +
                           root.name() + ">");
    }

    return records;
}

std::string toMarcXml(const std::vector<Record>& records) {
    pugi::xml_document doc;
    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version")  = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto collection = doc.append_child("collection");
    collection.append_attribute("xmlns") = MARCXML_NAMESPACE;

    for (const auto& rec : records) {
        auto r = collection.append_child("record");
        r.append_child("leader").text().set(xmlText(rec.leader, "leader"));

        for (const auto& f : rec.fields) {
            if (f.isControl()) {
                auto cf = r.append_child("controlfield");
                cf.append_attribute("tag") = xmlText(f.tag, "tag");
                cf.text().set(xmlText(f.text, "field " + f.tag));
                continue;
            }

            auto df = r.append_child("datafield");
            df.append_attribute("tag")  = xmlText(f.tag, "tag");
            df.append_attribute("ind1") = std::string(1, f.ind1).c_str();
            df.append_attribute("ind2") = std::string(1, f.ind2).c_str();
            for (const auto& sf : f.subfields) {
                auto s = df.append_child("subfield");
                s.append_attribute("code") = std::string(1, sf.code).c_str();
                s.text().set(xmlText(sf.data, "field " + f.tag + " $" + sf.code));
            }
        }
    }

    std::ostringstream oss;
    doc.save(oss, "  ", pugi::format_default, pugi::encoding_utf8);
    return oss.str();
}

} // namespace marc

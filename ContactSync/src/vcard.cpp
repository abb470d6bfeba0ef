#include "contactsync/vcard.hpp"
#include "contactsync/contact_utils.hpp"

#include <algorithm>
#include <sstream>

/**
 This VCard parser / serializer does the bare minimum - it does not understand the various
 property value schemas. It breaks the card into properties (group, name, parameters, value),
 allows those to be mutated, and puts it back together. Structured values such as N and ADR
 are left as semicolon-joined strings for callers to split.
 */

static size_t findUnquoted(const std::string & str, char c, size_t start = 0) {
    bool quoted = false;
    for (size_t i = start; i < str.size(); i++) {
        if (str[i] == '"') {
            quoted = !quoted;
        } else if (str[i] == c && !quoted) {
            return i;
        }
    }
    return std::string::npos;
}

// N, ADR and ORG keep "\\" and "\;" escaped in memory so splitComponents can
// tell a literal backslash or semicolon from a component separator.
static bool structuredValue(const std::string & name) {
    return name == "N" || name == "ADR" || name == "ORG";
}

static std::string unescapeValue(const std::string & raw, bool structured) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); i++) {
        if (raw[i] == '\\' && i + 1 < raw.size()) {
            char next = raw[i + 1];
            if (next == 'n' || next == 'N') {
                out += '\n';
                i++;
                continue;
            }
            if (next == ',' || (!structured && (next == '\\' || next == ';'))) {
                out += next;
                i++;
                continue;
            }
            if (next == '\\' || next == ';') {
                out += raw[i];
                out += next;
                i++;
                continue;
            }
        }
        out += raw[i];
    }
    return out;
}

static std::string escapeValue(const std::string & value, bool structured) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        if (c == '\\') {
            out += structured ? "\\" : "\\\\";
        } else if (c == '\r') {
            if (i + 1 < value.size() && value[i + 1] == '\n') {
                continue;
            }
            out += "\\n";
        } else if (c == '\n') {
            out += "\\n";
        } else {
            out += c;
        }
    }
    return out;
}

// RFC 6868 caret encoding. Line breaks inside a parameter would split the content line.
static std::string quoteParameter(const std::string & value) {
    std::string encoded;
    for (size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        if (c == '^') {
            encoded += "^^";
        } else if (c == '"') {
            encoded += "^'";
        } else if (c == '\r') {
            if (i + 1 < value.size() && value[i + 1] == '\n') {
                continue;
            }
            encoded += "^n";
        } else if (c == '\n') {
            encoded += "^n";
        } else {
            encoded += c;
        }
    }
    if (encoded.find_first_of(";:,") == std::string::npos) {
        return encoded;
    }
    return "\"" + encoded + "\"";
}

static std::string unquoteParameter(std::string value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    std::string decoded;
    for (size_t i = 0; i < value.size(); i++) {
        if (value[i] == '^' && i + 1 < value.size()) {
            char next = value[i + 1];
            if (next == 'n' || next == 'N') {
                decoded += '\n';
                i++;
                continue;
            }
            if (next == '^') {
                decoded += '^';
                i++;
                continue;
            }
            if (next == '\'') {
                decoded += '"';
                i++;
                continue;
            }
        }
        decoded += value[i];
    }
    return decoded;
}

VCardProperty::VCardProperty(std::string name, std::string value, std::string type):
    _name(ContactUtils::toUpperCase(name)), _value(value)
{
    if (type != "") {
        _params.push_back({"TYPE", type});
    }
}

VCardProperty::VCardProperty(std::string line)
{
    size_t colon = findUnquoted(line, ':');
    if (colon == std::string::npos) {
        _name = ContactUtils::toUpperCase(line);
        _malformed = true;
        return;
    }

    std::string head = line.substr(0, colon);

    size_t start = 0;
    size_t semicolon = findUnquoted(head, ';');
    std::string name = head.substr(0, semicolon);

    // item1.TEL;type=pref:+18472749609
    size_t dot = name.find('.');
    if (dot != std::string::npos) {
        _group = name.substr(0, dot);
        name = name.substr(dot + 1);
    }
    _name = ContactUtils::toUpperCase(name);
    _value = unescapeValue(line.substr(colon + 1), structuredValue(_name));

    while (semicolon != std::string::npos) {
        start = semicolon + 1;
        semicolon = findUnquoted(head, ';', start);
        std::string param = head.substr(start, semicolon == std::string::npos ? std::string::npos : semicolon - start);
        if (param == "") {
            continue;
        }
        size_t eq = param.find('=');
        if (eq == std::string::npos) {
            // vCard 2.1 style bare parameter, eg: TEL;CELL:
            _params.push_back({"TYPE", param});
            continue;
        }
        std::string key = ContactUtils::toUpperCase(param.substr(0, eq));
        _params.push_back({key, unquoteParameter(param.substr(eq + 1))});
    }
}

std::string VCardProperty::getName() {
    return _name;
}

std::string VCardProperty::getGroup() {
    return _group;
}

std::string VCardProperty::getValue() {
    return _value;
}

void VCardProperty::setValue(std::string value) {
    _value = value;
}

std::string VCardProperty::getParameter(std::string name) {
    name = ContactUtils::toUpperCase(name);
    std::string result;
    for (auto & param : _params) {
        if (param.first == name) {
            result = result == "" ? param.second : result + "," + param.second;
        }
    }
    return result;
}

void VCardProperty::setParameter(std::string name, std::string value) {
    name = ContactUtils::toUpperCase(name);
    _params.erase(std::remove_if(_params.begin(), _params.end(), [&](const std::pair<std::string, std::string> & p) {
        return p.first == name;
    }), _params.end());
    if (value != "") {
        _params.push_back({name, value});
    }
}

std::string VCardProperty::getType() {
    return getParameter("TYPE");
}

bool VCardProperty::malformed() {
    return _malformed;
}

std::string VCardProperty::serialize() {
    std::string line = _group == "" ? _name : _group + "." + _name;
    for (auto & param : _params) {
        line += ";" + param.first + "=" + quoteParameter(param.second);
    }
    return line + ":" + escapeValue(_value, structuredValue(_name));
}

std::vector<std::string> VCardProperty::splitComponents(const std::string & value, size_t max) {
    std::vector<std::string> components;
    std::string current;
    for (size_t i = 0; i < value.size(); i++) {
        if (value[i] == '\\' && i + 1 < value.size() && (value[i + 1] == ';' || value[i + 1] == '\\')) {
            current += value[i + 1];
            i++;
        } else if (value[i] == ';' && (max == 0 || components.size() + 1 < max)) {
            components.push_back(current);
            current = "";
        } else {
            current += value[i];
        }
    }
    components.push_back(current);
    return components;
}

std::string VCardProperty::joinComponents(const std::vector<std::string> & components) {
    std::string joined;
    for (size_t i = 0; i < components.size(); i++) {
        if (i > 0) {
            joined += ";";
        }
        for (char c : components[i]) {
            if (c == ';') {
                joined += "\\;";
            } else if (c == '\\') {
                joined += "\\\\";
            } else {
                joined += c;
            }
        }
    }
    return joined;
}

VCard::VCard() :
    _sawBegin(true), _sawEnd(true)
{
}

VCard::VCard(std::string vcf) {
    // A VCard is mostly one-property per line but lines can be "run-on", in which case
    // the continuation starts with whitespace. To accomodate these we accumulate the
    // current line in "unparsed" and parse it once we see the next line is not a run-on.
    std::string unparsed = "";
    auto flush = [&]() {
        if (unparsed == "") {
            return;
        }
        auto prop = std::make_shared<VCardProperty>(unparsed);
        unparsed = "";
        if (prop->getName() == "BEGIN") {
            _sawBegin = true;
        } else if (prop->getName() == "END") {
            _sawEnd = true;
        } else if (prop->malformed()) {
            _malformed = true;
        } else if (_sawBegin && !_sawEnd) {
            _properties.push_back(prop);
        }
    };

    size_t start = 0;
    while (start <= vcf.size()) {
        size_t split = vcf.find('\n', start);
        std::string line = vcf.substr(start, split == std::string::npos ? std::string::npos : split - start);

        // We split based on "\n" but the official format calls for "\r\n"
        if (line.size() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size()) {
            if (line[0] == ' ' || line[0] == '\t') {
                unparsed += line.substr(1);
            } else {
                flush();
                unparsed = line;
            }
        }
        if (split == std::string::npos) {
            break;
        }
        start = split + 1;
    }
    flush();
}

bool VCard::incomplete() {
    return !_sawBegin || !_sawEnd || _malformed;
}

std::vector<std::shared_ptr<VCardProperty>> VCard::properties() {
    return _properties;
}

std::vector<std::shared_ptr<VCardProperty>> VCard::propertiesWithName(std::string name) {
    name = ContactUtils::toUpperCase(name);
    std::vector<std::shared_ptr<VCardProperty>> results {};
    for (auto prop : _properties) {
        if (prop->getName() == name) {
            results.push_back(prop);
        }
    }
    return results;
}

std::shared_ptr<VCardProperty> VCard::firstPropertyWithName(std::string name) {
    name = ContactUtils::toUpperCase(name);
    for (auto prop : _properties) {
        if (prop->getName() == name) {
            return prop;
        }
    }
    return nullptr;
}

std::vector<std::shared_ptr<VCardProperty>> VCard::getExtendedProperties() {
    std::vector<std::shared_ptr<VCardProperty>> results {};
    for (auto prop : _properties) {
        if (prop->getName().substr(0, 2) == "X-") {
            results.push_back(prop);
        }
    }
    return results;
}

std::string VCard::getValue(std::string name) {
    auto prop = firstPropertyWithName(name);
    return prop ? prop->getValue() : "";
}

void VCard::setValue(std::string name, std::string value, std::string type) {
    removePropertiesWithName(name);
    addProperty(name, value, type);
}

std::shared_ptr<VCardProperty> VCard::addProperty(std::string name, std::string value, std::string type) {
    auto prop = std::make_shared<VCardProperty>(name, value, type);
    _properties.push_back(prop);
    return prop;
}

void VCard::addProperty(std::shared_ptr<VCardProperty> prop) {
    _properties.push_back(prop);
}

void VCard::removePropertiesWithName(std::string name) {
    name = ContactUtils::toUpperCase(name);
    _properties.erase(std::remove_if(_properties.begin(), _properties.end(), [&](const std::shared_ptr<VCardProperty> & p) {
        return p->getName() == name;
    }), _properties.end());
}

std::string VCard::serialize() {
    std::stringstream str;
    str << "BEGIN:VCARD\r\n";
    for (auto prop : _properties) {
        if (prop->getValue() == "") {
            // ignore properties that were never filled
            continue;
        }
        str << prop->serialize();
        str << "\r\n";
    }
    str << "END:VCARD\r\n";
    return str.str();
}

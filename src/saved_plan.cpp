#include "planfix/saved_plan.hpp"

#include <spdlog/fmt/fmt.h>

#include <cctype>
#include <cstdlib>
#include <locale>
#include <sstream>
#include <stdexcept>

// Minimal JSON reading and writing (flat objects of strings and numbers)
namespace {
size_t skip_ws(const std::string& json, size_t pos) {
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) pos++;
    return pos;
}

// Position just after the ':' following "key", or npos.
size_t find_value(const std::string& json, const std::string& key) {
    std::string quoted = "\"" + key + "\"";
    auto pos = json.find(quoted);
    while (pos != std::string::npos) {
        auto colon = skip_ws(json, pos + quoted.size());
        if (colon < json.size() && json[colon] == ':') return skip_ws(json, colon + 1);
        pos = json.find(quoted, pos + 1);
    }
    return std::string::npos;
}

void append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Four hex digits after "\u" at pos.
unsigned long read_hex4(const std::string& json, size_t pos, const std::string& key) {
    if (pos + 4 > json.size()) throw std::runtime_error("Bad escape in field '" + key + "'");
    for (size_t i = pos; i < pos + 4; i++) {
        if (!std::isxdigit(static_cast<unsigned char>(json[i]))) {
            throw std::runtime_error("Bad escape in field '" + key + "'");
        }
    }
    return std::strtoul(json.substr(pos, 4).c_str(), nullptr, 16);
}

std::string extract_string(const std::string& json, const std::string& key) {
    auto pos = find_value(json, key);
    if (pos == std::string::npos || pos >= json.size() || json[pos] != '"') {
        throw std::runtime_error("Missing string field '" + key + "'");
    }

    std::string out;
    for (pos++; pos < json.size(); pos++) {
        char ch = json[pos];
        if (ch == '"') return out;
        if (ch != '\\') {
            out += ch;
            continue;
        }
        if (++pos >= json.size()) break;
        switch (json[pos]) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'u': {
                unsigned long cp = read_hex4(json, pos + 1, key);
                pos += 4;
                if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    throw std::runtime_error("Unpaired surrogate in field '" + key + "'");
                }
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (json.compare(pos + 1, 2, "\\u") != 0) {
                        throw std::runtime_error("Unpaired surrogate in field '" + key + "'");
                    }
                    unsigned long low = read_hex4(json, pos + 3, key);
                    if (low < 0xDC00 || low > 0xDFFF) {
                        throw std::runtime_error("Unpaired surrogate in field '" + key + "'");
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    pos += 6;
                }
                append_utf8(out, cp);
                break;
            }
            default: out += json[pos]; break;
        }
    }
    throw std::runtime_error("Unterminated string in field '" + key + "'");
}

bool try_extract_double(const std::string& json, const std::string& key, double& out) {
    auto pos = find_value(json, key);
    if (pos == std::string::npos || json.compare(pos, 4, "null") == 0) return false;

    // Classic locale: the writer always emits '.' as decimal point
    auto end = json.find_first_of(",}] \t\r\n", pos);
    std::istringstream in(json.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
    in.imbue(std::locale::classic());
    in >> out;
    if (in.fail() || in.peek() != std::char_traits<char>::eof()) {
        throw std::runtime_error("Field '" + key + "' is not a number");
    }
    return true;
}

double extract_double(const std::string& json, const std::string& key) {
    double value = 0.0;
    if (!try_extract_double(json, key, value)) {
        throw std::runtime_error("Missing numeric field '" + key + "'");
    }
    return value;
}

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char ch : s) {
        switch (ch) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(ch));
                } else {
                    out += ch;
                }
        }
    }
    return out + "\"";
}

// Top-level {...} spans of a JSON array.
std::vector<std::string> split_objects(const std::string& json) {
    auto pos = skip_ws(json, 0);
    if (pos >= json.size() || json[pos] != '[') {
        throw std::runtime_error("Expected a JSON array of saved plans");
    }

    std::vector<std::string> objects;
    int depth = 0;
    bool in_string = false;
    size_t start = 0;
    for (pos++; pos < json.size(); pos++) {
        char ch = json[pos];
        if (in_string) {
            if (ch == '\\') pos++;
            else if (ch == '"') in_string = false;
            continue;
        }
        if (ch == '"') {
            in_string = true;
        } else if (ch == '{') {
            if (depth++ == 0) start = pos;
        } else if (ch == '}') {
            if (--depth < 0) break;
            if (depth == 0) objects.push_back(json.substr(start, pos - start + 1));
        } else if (ch == ']' && depth == 0) {
            return objects;
        }
    }
    throw std::runtime_error("Unbalanced JSON array of saved plans");
}
}

namespace planfix {

std::string to_json(const SavedPlan& plan) {
    std::string out = "{";
    out += "\"id\":" + quote(plan.id);
    out += ",\"name\":" + quote(plan.name);
    out += ",\"filePath\":" + quote(plan.file_path);
    for (size_t i = 0; i < plan.calibration.size(); i++) {
        const ControlPoint& cp = plan.calibration[i];
        out += fmt::format(",\"gps{0}_x\":{1},\"gps{0}_y\":{2},\"pdf{0}_x\":{3},\"pdf{0}_y\":{4}",
                           i + 1, cp.geo.lat, cp.geo.lon, cp.pixel.x, cp.pixel.y);
    }
    out += ",\"lastOpened\":" + quote(plan.last_opened);
    return out + "}";
}

std::string to_json(const std::vector<SavedPlan>& plans) {
    std::string out = "[";
    for (size_t i = 0; i < plans.size(); i++) {
        if (i > 0) out += ",";
        out += to_json(plans[i]);
    }
    return out + "]";
}

SavedPlan saved_plan_from_json(const std::string& json) {
    SavedPlan plan;
    plan.id = extract_string(json, "id");
    plan.name = extract_string(json, "name");
    plan.file_path = extract_string(json, "filePath");

    for (size_t i = 0; i < plan.calibration.size(); i++) {
        std::string n = std::to_string(i + 1);
        ControlPoint& cp = plan.calibration[i];
        if (i < 2) {
            cp.geo.lat = extract_double(json, "gps" + n + "_x");
            cp.geo.lon = extract_double(json, "gps" + n + "_y");
            cp.pixel.x = extract_double(json, "pdf" + n + "_x");
            cp.pixel.y = extract_double(json, "pdf" + n + "_y");
        } else {
            cp = ControlPoint{{0.0, 0.0}, {0.0, 0.0}};
            try_extract_double(json, "gps" + n + "_x", cp.geo.lat);
            try_extract_double(json, "gps" + n + "_y", cp.geo.lon);
            try_extract_double(json, "pdf" + n + "_x", cp.pixel.x);
            try_extract_double(json, "pdf" + n + "_y", cp.pixel.y);
        }
    }

    plan.last_opened = extract_string(json, "lastOpened");
    return plan;
}

std::vector<SavedPlan> saved_plans_from_json(const std::string& json) {
    std::vector<SavedPlan> plans;
    for (const auto& object : split_objects(json)) {
        plans.push_back(saved_plan_from_json(object));
    }
    return plans;
}

} // namespace planfix

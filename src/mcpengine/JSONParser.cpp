//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: JSONValue members, recursive-descent JSON parser/serializer and JSON-RPC envelope conversions
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <sstream>
#include <stdexcept>
#include <iomanip>

#include "logging/Logger.h"
#include "mcpengine/JSONRPCTypes.h"
#include "mcpengine/errors/Errors.h"

namespace mcpengine {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) noexcept = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) noexcept = default;
JSONValue::~JSONValue() = default;

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

const JSONValue* JSONValue::find(const std::string& key) const {
    if (!std::holds_alternative<Object>(value)) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

bool operator==(const JSONValue& lhs, const JSONValue& rhs) {
    if (lhs.value.index() != rhs.value.index()) {
        return false;
    }
    return std::visit([&rhs](const auto& l) -> bool {
        using T = std::decay_t<decltype(l)>;
        const auto& r = std::get<T>(rhs.value);
        if constexpr (std::is_same_v<T, JSONValue::Array>) {
            if (l.size() != r.size()) return false;
            for (size_t i = 0; i < l.size(); ++i) {
                const JSONValue nullValue;
                const JSONValue& a = l[i] ? *l[i] : nullValue;
                const JSONValue& b = r[i] ? *r[i] : nullValue;
                if (!(a == b)) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            if (l.size() != r.size()) return false;
            for (const auto& [key, val] : l) {
                auto it = r.find(key);
                if (it == r.end()) return false;
                const JSONValue nullValue;
                const JSONValue& a = val ? *val : nullValue;
                const JSONValue& b = it->second ? *it->second : nullValue;
                if (!(a == b)) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return true;
        } else {
            return l == r;
        }
    }, lhs.value);
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0};
    static constexpr unsigned int kMaxDepth = 256;

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw errors::McpException(JSONRPCErrorCodes::ParseError,
                                   std::format("{} at offset {}", what, i));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) fail("Invalid number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t frac = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == frac) fail("Invalid fraction");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t exp = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == exp) fail("Invalid exponent");
        }
        const std::string num = s.substr(start, i - start);
        try {
            if (!isFloat) {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            }
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            if (isFloat) fail("Number out of range");
        }
        // Integers beyond int64 degrade to double
        try {
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            fail("Number out of range");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue out;
        char c = s[i];
        if (c == '"') {
            out = JSONValue(parseString());
        } else if (c == '{') {
            out = parseObject();
        } else if (c == '[') {
            out = parseArray();
        } else if (s.compare(i, 4, "true") == 0) {
            i += 4; out = JSONValue(true);
        } else if (s.compare(i, 5, "false") == 0) {
            i += 5; out = JSONValue(false);
        } else if (s.compare(i, 4, "null") == 0) {
            i += 4; out = JSONValue(nullptr);
        } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            out = parseNumber();
        } else {
            fail(std::format("Unexpected character '{}'", c));
        }
        --depth;
        return out;
    }
};

void writeEscaped(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void writeValue(std::ostringstream& oss, const JSONValue& value, int indent, int level) {
    auto newline = [&](int lvl) {
        if (indent < 0) return;
        oss << '\n' << std::string(static_cast<size_t>(indent * lvl), ' ');
    };
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                oss << "null";
                return;
            }
            std::string num = std::format("{}", v);
            // Keep the value a double on re-parse
            if (num.find_first_of(".eE") == std::string::npos) num += ".0";
            oss << num;
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            if (v.empty()) { oss << "[]"; return; }
            oss << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                newline(level + 1);
                writeValue(oss, v[i] ? *v[i] : JSONValue{}, indent, level + 1);
            }
            newline(level);
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            if (v.empty()) { oss << "{}"; return; }
            std::vector<const std::string*> keys;
            keys.reserve(v.size());
            for (const auto& kv : v) keys.push_back(&kv.first);
            std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });
            oss << '{';
            bool first = true;
            for (const std::string* key : keys) {
                if (!first) oss << ',';
                first = false;
                newline(level + 1);
                writeEscaped(oss, *key);
                oss << (indent < 0 ? ":" : ": ");
                const auto& child = v.at(*key);
                writeValue(oss, child ? *child : JSONValue{}, indent, level + 1);
            }
            newline(level);
            oss << '}';
        }
    }, value.get());
}

void writeId(JSONValue::Object& obj, const JSONRPCId& id) {
    std::visit([&obj](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            obj["id"] = std::make_shared<JSONValue>(nullptr);
        } else {
            obj["id"] = std::make_shared<JSONValue>(v);
        }
    }, id);
}

bool readId(const JSONValue& msg, JSONRPCId& id) {
    const JSONValue* idVal = msg.find("id");
    if (idVal == nullptr) return false;
    if (std::holds_alternative<int64_t>(idVal->value)) {
        id = std::get<int64_t>(idVal->value);
    } else if (std::holds_alternative<std::string>(idVal->value)) {
        id = std::get<std::string>(idVal->value);
    } else if (idVal->isNull()) {
        id = nullptr;
    } else {
        return false;
    }
    return true;
}
} // namespace

std::string SerializeJSON(const JSONValue& value, int indent) {
    FUNC_SCOPE();
    std::ostringstream oss;
    writeValue(oss, value, indent, 0);
    return oss.str();
}

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON value");
    }
    return v;
}

std::string IdToString(const JSONRPCId& id) {
    std::string idStr;
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) { idStr = v; }
        else if constexpr (std::is_same_v<T, int64_t>) { idStr = std::to_string(v); }
        else { idStr = "null"; }
    }, id);
    return idStr;
}

//----------------------------------------------------------------------------------------------------------
// Envelopes
//----------------------------------------------------------------------------------------------------------
std::string JSONRPCMessage::Serialize() const {
    return SerializeJSON(ToJSON());
}

bool JSONRPCMessage::Deserialize(const std::string& json) {
    try {
        return FromJSON(ParseJSON(json));
    } catch (const errors::McpException& e) {
        LOG_ERROR("Failed to deserialize JSON-RPC message: {}", e.what());
        return false;
    }
}

JSONValue JSONRPCRequest::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    writeId(obj, id);
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue{std::move(obj)};
}

bool JSONRPCRequest::FromJSON(const JSONValue& value) {
    const JSONValue* m = value.find("method");
    if (m == nullptr || !m->isString()) return false;
    if (!readId(value, id)) return false;
    method = std::get<std::string>(m->value);
    params.reset();
    if (const JSONValue* p = value.find("params")) {
        params = *p;
    }
    return true;
}

JSONValue JSONRPCResponse::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    writeId(obj, id);
    if (error.has_value()) {
        obj["error"] = std::make_shared<JSONValue>(error.value());
    } else {
        obj["result"] = std::make_shared<JSONValue>(result.has_value() ? result.value() : JSONValue{JSONValue::Object{}});
    }
    return JSONValue{std::move(obj)};
}

bool JSONRPCResponse::FromJSON(const JSONValue& value) {
    if (!readId(value, id)) return false;
    result.reset();
    error.reset();
    if (const JSONValue* e = value.find("error")) {
        error = *e;
        return true;
    }
    if (const JSONValue* r = value.find("result")) {
        result = *r;
    }
    return true;
}

JSONValue JSONRPCNotification::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue{std::move(obj)};
}

bool JSONRPCNotification::FromJSON(const JSONValue& value) {
    const JSONValue* m = value.find("method");
    if (m == nullptr || !m->isString()) return false;
    if (value.find("id") != nullptr) return false;
    method = std::get<std::string>(m->value);
    params.reset();
    if (const JSONValue* p = value.find("params")) {
        params = *p;
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------
// Error helpers
//----------------------------------------------------------------------------------------------------------
JSONValue CreateErrorObject(int code, const std::string& message, const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue{std::move(errorObj)};
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                                     const std::optional<JSONValue>& data) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace mcpengine

#include "core/payload.h"
#include "utils/serialize.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace substrate {
namespace core {

Payload::Payload(std::initializer_list<std::pair<const std::string, std::string>> fields)
    : fields_(fields) {}

Payload& Payload::set(const std::string& key, const std::string& value) {
    fields_[key] = value;
    return *this;
}

Payload& Payload::set(const std::string& key, const char* value) {
    fields_[key] = value ? value : "";
    return *this;
}

Payload& Payload::setUint(const std::string& key, uint64_t value) {
    fields_[key] = std::to_string(value);
    return *this;
}

Payload& Payload::merge(const Payload& other, const std::string& prefix) {
    for (const auto& [key, value] : other.fields_) {
        fields_[prefix + key] = value;
    }
    return *this;
}

bool Payload::has(const std::string& key) const {
    return fields_.find(key) != fields_.end();
}

std::string Payload::get(const std::string& key, const std::string& def) const {
    auto it = fields_.find(key);
    return it != fields_.end() ? it->second : def;
}

uint64_t Payload::getUint(const std::string& key, uint64_t def) const {
    auto it = fields_.find(key);
    if (it == fields_.end() || it->second.empty()) return def;
    try {
        size_t used = 0;
        unsigned long long v = std::stoull(it->second, &used);
        if (used != it->second.size()) return def;
        return static_cast<uint64_t>(v);
    } catch (const std::exception&) {
        return def;
    }
}

std::vector<uint8_t> Payload::encode() const {
    utils::ByteBuffer buf;
    buf.writeVarInt(fields_.size());
    for (const auto& [key, value] : fields_) {
        buf.writeString(key);
        buf.writeString(value);
    }
    return buf.data();
}

bool Payload::decode(const std::vector<uint8_t>& data, Payload& out) {
    utils::ByteBuffer buf(data);
    std::map<std::string, std::string> fields;
    try {
        uint64_t count = buf.readVarInt();
        std::string prev;
        for (uint64_t i = 0; i < count; i++) {
            std::string key = buf.readString();
            std::string value = buf.readString();
            if (i > 0 && key <= prev) return false;
            prev = key;
            fields.emplace(std::move(key), std::move(value));
        }
    } catch (const std::out_of_range&) {
        return false;
    }
    if (!buf.atEnd()) return false;
    out.fields_ = std::move(fields);
    return true;
}

crypto::Hash256 Payload::digest() const {
    return crypto::sha256(encode());
}

std::string Payload::toJson() const {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto& [key, value] : fields_) {
        obj[key] = value;
    }
    return obj.dump();
}

}
}

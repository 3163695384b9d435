#pragma once

#include "crypto/crypto.h"
#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <initializer_list>

namespace substrate {
namespace core {

// Structured key/value record carried by a ledger entry. Keys are kept
// sorted so the encoding (and therefore the digest) is canonical.
class Payload {
public:
    Payload() = default;
    Payload(std::initializer_list<std::pair<const std::string, std::string>> fields);

    Payload& set(const std::string& key, const std::string& value);
    Payload& set(const std::string& key, const char* value);
    Payload& setUint(const std::string& key, uint64_t value);
    Payload& merge(const Payload& other, const std::string& prefix = "");

    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    uint64_t getUint(const std::string& key, uint64_t def = 0) const;

    const std::map<std::string, std::string>& fields() const { return fields_; }
    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    std::vector<uint8_t> encode() const;
    static bool decode(const std::vector<uint8_t>& data, Payload& out);
    crypto::Hash256 digest() const;
    std::string toJson() const;

    bool operator==(const Payload& other) const { return fields_ == other.fields_; }
    bool operator!=(const Payload& other) const { return fields_ != other.fields_; }

private:
    std::map<std::string, std::string> fields_;
};

}
}

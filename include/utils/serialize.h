#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace substrate {
namespace utils {

// Big-endian byte buffer used for every canonical encoding in the kernel.
// Reads past the end throw std::out_of_range.
class ByteBuffer {
public:
    ByteBuffer();
    explicit ByteBuffer(const std::vector<uint8_t>& data);

    void writeUint8(uint8_t value);
    void writeUint32(uint32_t value);
    void writeUint64(uint64_t value);
    void writeVarInt(uint64_t value);
    void writeString(const std::string& value);
    void writeBytes(const std::vector<uint8_t>& value);
    void writeFixedBytes(const uint8_t* data, size_t length);

    uint8_t readUint8();
    uint32_t readUint32();
    uint64_t readUint64();
    uint64_t readVarInt();
    std::string readString();
    std::vector<uint8_t> readBytes();
    void readFixedBytes(uint8_t* out, size_t length);

    const std::vector<uint8_t>& data() const { return data_; }
    size_t size() const { return data_.size(); }
    size_t remaining() const { return data_.size() - readPos_; }
    bool atEnd() const { return readPos_ >= data_.size(); }

private:
    void checkRead(size_t bytes) const;

    std::vector<uint8_t> data_;
    size_t readPos_;
};

}
}

#include "utils/serialize.h"
#include <stdexcept>
#include <algorithm>

namespace substrate {
namespace utils {

ByteBuffer::ByteBuffer() : readPos_(0) {}

ByteBuffer::ByteBuffer(const std::vector<uint8_t>& data) : data_(data), readPos_(0) {}

void ByteBuffer::checkRead(size_t bytes) const {
    if (readPos_ > data_.size() || bytes > data_.size() - readPos_) {
        throw std::out_of_range("ByteBuffer: read past end");
    }
}

void ByteBuffer::writeUint8(uint8_t value) {
    data_.push_back(value);
}

void ByteBuffer::writeUint32(uint32_t value) {
    for (int i = 3; i >= 0; i--) {
        data_.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

void ByteBuffer::writeUint64(uint64_t value) {
    for (int i = 7; i >= 0; i--) {
        data_.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

void ByteBuffer::writeVarInt(uint64_t value) {
    while (value >= 0x80) {
        data_.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    data_.push_back(static_cast<uint8_t>(value));
}

void ByteBuffer::writeString(const std::string& value) {
    writeVarInt(value.size());
    data_.insert(data_.end(), value.begin(), value.end());
}

void ByteBuffer::writeBytes(const std::vector<uint8_t>& value) {
    writeVarInt(value.size());
    data_.insert(data_.end(), value.begin(), value.end());
}

void ByteBuffer::writeFixedBytes(const uint8_t* data, size_t length) {
    data_.insert(data_.end(), data, data + length);
}

uint8_t ByteBuffer::readUint8() {
    checkRead(1);
    return data_[readPos_++];
}

uint32_t ByteBuffer::readUint32() {
    checkRead(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; i++) {
        value = (value << 8) | data_[readPos_ + i];
    }
    readPos_ += 4;
    return value;
}

uint64_t ByteBuffer::readUint64() {
    checkRead(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; i++) {
        value = (value << 8) | data_[readPos_ + i];
    }
    readPos_ += 8;
    return value;
}

uint64_t ByteBuffer::readVarInt() {
    uint64_t value = 0;
    int shift = 0;
    while (true) {
        if (shift > 63) throw std::out_of_range("ByteBuffer: varint overflow");
        uint8_t b = readUint8();
        value |= static_cast<uint64_t>(b & 0x7F) << shift;
        if ((b & 0x80) == 0) break;
        shift += 7;
    }
    return value;
}

std::string ByteBuffer::readString() {
    uint64_t len = readVarInt();
    checkRead(len);
    std::string value(data_.begin() + readPos_, data_.begin() + readPos_ + len);
    readPos_ += len;
    return value;
}

std::vector<uint8_t> ByteBuffer::readBytes() {
    uint64_t len = readVarInt();
    checkRead(len);
    std::vector<uint8_t> value(data_.begin() + readPos_, data_.begin() + readPos_ + len);
    readPos_ += len;
    return value;
}

void ByteBuffer::readFixedBytes(uint8_t* out, size_t length) {
    checkRead(length);
    std::copy(data_.begin() + readPos_, data_.begin() + readPos_ + length, out);
    readPos_ += length;
}

}
}

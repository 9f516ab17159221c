#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace nftmart::ledger {

    /// Little-endian field packing for signed messages. Strings carry a u32 length prefix
    /// so adjacent fields can never run into each other.
    class BinarySerializer {
      public:
        static void writeUint16(std::vector<uint8_t> &buffer, uint16_t value) {
            buffer.push_back(static_cast<uint8_t>(value & 0xFF));
            buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        }

        static void writeUint32(std::vector<uint8_t> &buffer, uint32_t value) {
            for (int i = 0; i < 4; ++i)
                buffer.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
        }

        static void writeString(std::vector<uint8_t> &buffer, const std::string &str) {
            writeUint32(buffer, static_cast<uint32_t>(str.length()));
            buffer.insert(buffer.end(), str.begin(), str.end());
        }

        static uint16_t readUint16(const std::vector<uint8_t> &buffer, size_t &offset) {
            require(buffer, offset, 2, "uint16");
            uint16_t value = static_cast<uint16_t>(buffer[offset] | (buffer[offset + 1] << 8));
            offset += 2;
            return value;
        }

        static uint32_t readUint32(const std::vector<uint8_t> &buffer, size_t &offset) {
            require(buffer, offset, 4, "uint32");
            uint32_t value = 0;
            for (int i = 0; i < 4; ++i)
                value |= static_cast<uint32_t>(buffer[offset + i]) << (8 * i);
            offset += 4;
            return value;
        }

        static std::string readString(const std::vector<uint8_t> &buffer, size_t &offset) {
            uint32_t length = readUint32(buffer, offset);
            require(buffer, offset, length, "string");
            std::string result(reinterpret_cast<const char *>(buffer.data() + offset), length);
            offset += length;
            return result;
        }

      private:
        static void require(const std::vector<uint8_t> &buffer, size_t offset, size_t length, const char *what) {
            if (offset + length > buffer.size()) {
                throw std::runtime_error(std::string("Buffer underflow reading ") + what);
            }
        }
    };

} // namespace nftmart::ledger

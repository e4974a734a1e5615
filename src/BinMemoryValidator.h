/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file BinMemoryValidator.h
 * @brief Bounds-checked, endian-aware reads over a binary file image
 *
 * The Mach-O and PE decoders read raw header bytes directly from the loaded
 * file. Every read goes through BinMemoryValidator so a truncated or hostile
 * file produces a MemoryAccessError instead of an out-of-bounds access.
 *
 * Key Features:
 * - Range validation with overflow-checked arithmetic
 * - Little- and big-endian integer reads independent of host byte order
 * - Bounded C-string and fixed-width name reads
 * - ULEB128/SLEB128 decoding for Mach-O dyld info streams
 */

#ifndef BIN_MEMORY_VALIDATOR_H
#define BIN_MEMORY_VALIDATOR_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <optional>
#include <string>
#include "BinExceptions.h"

namespace BinReaderUtils {

/**
 * @brief Constants for safe memory operations
 */
namespace MemoryConstants {
constexpr size_t MAX_STRING_LENGTH = 4096;         // Maximum C-string length
constexpr size_t MAX_LOAD_COMMANDS = 65536;        // Maximum Mach-O load commands
constexpr size_t MAX_FAT_ARCHES = 64;              // Maximum slices in a fat file
constexpr size_t MAX_PE_SECTIONS = 96;             // Loader limit for COFF sections
constexpr size_t MAX_TABLE_ENTRIES = 1048576;      // Upper bound for symbol/import tables
constexpr unsigned MAX_LEB128_BITS = 64;           // Width of decoded LEB128 values
}  // namespace MemoryConstants

/**
 * @brief Safe arithmetic operations with overflow checking
 */
class SafeArithmetic {
public:
    /**
     * @brief Safe addition with overflow checking
     * @throws MemoryAccessError if overflow would occur
     */
    static uint64_t safeAdd(uint64_t a, uint64_t b, const std::string& context = "") {
        if (a > std::numeric_limits<uint64_t>::max() - b) {
            throw BinReaderExceptions::MemoryAccessError("Integer overflow in " + context + " (" +
                                                         std::to_string(a) + " + " +
                                                         std::to_string(b) + ")");
        }
        return a + b;
    }

    /**
     * @brief Safe multiplication with overflow checking
     * @throws MemoryAccessError if overflow would occur
     */
    static uint64_t safeMultiply(uint64_t a, uint64_t b, const std::string& context = "") {
        if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
            throw BinReaderExceptions::MemoryAccessError("Integer overflow in " + context + " (" +
                                                         std::to_string(a) + " * " +
                                                         std::to_string(b) + ")");
        }
        return a * b;
    }
};

/**
 * @brief Memory bounds validator for raw header decoding
 */
class BinMemoryValidator {
private:
    const uint8_t* data_;
    size_t size_;
    std::string filename_;
    bool little_endian_;

public:
    /**
     * @brief Construct validator for memory buffer
     * @param data Pointer to memory buffer
     * @param size Size of memory buffer
     * @param filename Filename for error reporting
     * @param little_endian Byte order used by readU16/readU32/readU64
     */
    BinMemoryValidator(const uint8_t* data,
                       size_t size,
                       const std::string& filename,
                       bool little_endian = true)
        : data_(data), size_(size), filename_(filename), little_endian_(little_endian) {
        if (data_ == nullptr || size_ == 0) {
            throw BinReaderExceptions::BinaryFileError(
                BinReaderExceptions::BinaryFileError::ErrorType::FileTooSmall,
                "Empty file",
                filename_);
        }
    }

    void setLittleEndian(bool little_endian) { little_endian_ = little_endian; }

    /**
     * @brief Check whether a range lies inside the buffer without throwing
     */
    bool inBounds(uint64_t offset, uint64_t length) const noexcept {
        return offset <= size_ && length <= size_ - offset;
    }

    /**
     * @brief Validate that a memory range is within bounds
     * @throws MemoryAccessError if range is out of bounds
     */
    void validateRange(uint64_t offset, uint64_t length, const std::string& context = "") const {
        if (offset > size_) {
            throw BinReaderExceptions::MemoryAccessError(
                "Offset beyond end of file: " + context + " (offset: " + std::to_string(offset) +
                    ", file size: " + std::to_string(size_) + ")",
                static_cast<size_t>(offset));
        }
        uint64_t end_offset = SafeArithmetic::safeAdd(offset, length, context);
        if (end_offset > size_) {
            throw BinReaderExceptions::MemoryAccessError(
                "Range exceeds file bounds: " + context + " (offset: " + std::to_string(offset) +
                    ", length: " + std::to_string(length) +
                    ", file size: " + std::to_string(size_) + ")",
                static_cast<size_t>(offset));
        }
    }

    uint8_t readU8(uint64_t offset, const std::string& context = "") const {
        validateRange(offset, 1, context);
        return data_[offset];
    }

    uint16_t readU16(uint64_t offset, const std::string& context = "") const {
        return static_cast<uint16_t>(readUnsigned(offset, 2, context));
    }

    uint32_t readU32(uint64_t offset, const std::string& context = "") const {
        return static_cast<uint32_t>(readUnsigned(offset, 4, context));
    }

    uint64_t readU64(uint64_t offset, const std::string& context = "") const {
        return readUnsigned(offset, 8, context);
    }

    /**
     * @brief Read a 32- or 64-bit word depending on the image class
     */
    uint64_t readWord(uint64_t offset, bool is_64, const std::string& context = "") const {
        return is_64 ? readU64(offset, context) : readU32(offset, context);
    }

    /**
     * @brief Safe read of a NUL-terminated string
     * @throws MemoryAccessError if unterminated within bounds or longer than max_length
     */
    std::string readString(uint64_t offset,
                           size_t max_length = MemoryConstants::MAX_STRING_LENGTH,
                           const std::string& context = "") const {
        validateRange(offset, 1, context);

        size_t length = 0;
        size_t max_search_length = std::min<uint64_t>(max_length, size_ - offset);
        while (length < max_search_length && data_[offset + length] != '\0') {
            length++;
        }

        if (length >= max_length) {
            throw BinReaderExceptions::MemoryAccessError(
                "String too long at offset " + std::to_string(offset) +
                    " (max: " + std::to_string(max_length) + ")",
                static_cast<size_t>(offset));
        }
        validateRange(offset, length + 1, context);  // +1 for null terminator

        return std::string(reinterpret_cast<const char*>(&data_[offset]), length);
    }

    /**
     * @brief Read a fixed-width, NUL-padded name field (segment and section names)
     * @return The name, or std::nullopt if it contains non-printable bytes
     */
    std::optional<std::string> readFixedName(uint64_t offset,
                                             size_t width,
                                             const std::string& context = "") const {
        validateRange(offset, width, context);
        const char* begin = reinterpret_cast<const char*>(&data_[offset]);
        size_t length = strnlen(begin, width);
        for (size_t i = 0; i < length; ++i) {
            auto c = static_cast<unsigned char>(begin[i]);
            if (c < 32 || c > 126) {  // Non-printable ASCII
                return std::nullopt;
            }
        }
        return std::string(begin, length);
    }

    /**
     * @brief Decode an unsigned LEB128 value and advance the cursor
     * @param cursor Current position, updated past the value
     * @param end Exclusive end of the stream
     */
    uint64_t readUleb128(uint64_t& cursor, uint64_t end, const std::string& context = "") const {
        uint64_t result = 0;
        unsigned shift = 0;
        while (true) {
            if (cursor >= end) {
                throw BinReaderExceptions::MemoryAccessError("Truncated ULEB128 in " + context,
                                                             static_cast<size_t>(cursor));
            }
            uint8_t byte = readU8(cursor++, context);
            if (shift >= MemoryConstants::MAX_LEB128_BITS) {
                throw BinReaderExceptions::MemoryAccessError("ULEB128 too large in " + context,
                                                             static_cast<size_t>(cursor));
            }
            result |= static_cast<uint64_t>(byte & 0x7f) << shift;
            shift += 7;
            if ((byte & 0x80) == 0) {
                return result;
            }
        }
    }

    /**
     * @brief Decode a signed LEB128 value and advance the cursor
     */
    int64_t readSleb128(uint64_t& cursor, uint64_t end, const std::string& context = "") const {
        uint64_t result = 0;
        unsigned shift = 0;
        uint8_t byte = 0;
        do {
            if (cursor >= end) {
                throw BinReaderExceptions::MemoryAccessError("Truncated SLEB128 in " + context,
                                                             static_cast<size_t>(cursor));
            }
            byte = readU8(cursor++, context);
            if (shift >= MemoryConstants::MAX_LEB128_BITS) {
                throw BinReaderExceptions::MemoryAccessError("SLEB128 too large in " + context,
                                                             static_cast<size_t>(cursor));
            }
            result |= static_cast<uint64_t>(byte & 0x7f) << shift;
            shift += 7;
        } while (byte & 0x80);

        if (shift < 64 && (byte & 0x40)) {
            result |= ~uint64_t{0} << shift;  // sign extend
        }
        return static_cast<int64_t>(result);
    }

    size_t getSize() const { return size_; }
    const uint8_t* getData() const { return data_; }

private:
    uint64_t readUnsigned(uint64_t offset, size_t width, const std::string& context) const {
        validateRange(offset, width, context);
        const uint8_t* bytes = &data_[offset];
        uint64_t value = 0;
        for (size_t i = 0; i < width; ++i) {
            size_t shift_index = little_endian_ ? i : width - 1 - i;
            value |= static_cast<uint64_t>(bytes[i]) << (8 * shift_index);
        }
        return value;
    }
};

}  // namespace BinReaderUtils

#endif  // BIN_MEMORY_VALIDATOR_H

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

/**
 * @file BinarySerializer.hpp
 * @brief Record codec for on-disk character files
 *
 * A record is a fixed signature, a format version and then a flat run of
 * fields. Integers are packed little-endian regardless of the host, so a
 * file written on one machine loads on another. Strings carry a 32-bit
 * length; string lists carry a 32-bit count followed by the strings.
 *
 * Writers and readers never throw on bad data: every call returns false
 * once the stream is short or a bound is exceeded, and stays false.
 */

#include "core/Logger.hpp"
#include <array>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace AnchorMud {
namespace BinarySerial {

constexpr uint32_t MAX_STRING_BYTES = 64 * 1024;
constexpr uint32_t MAX_LIST_ENTRIES = 4096;
constexpr size_t SIGNATURE_BYTES = 8;

using Signature = std::array<char, SIGNATURE_BYTES>;

class RecordWriter {
public:
    explicit RecordWriter(std::ostream& out) : m_out(out) {}

    bool writeHeader(const Signature& signature, uint32_t version) {
        m_out.write(signature.data(), static_cast<std::streamsize>(signature.size()));
        return writeU32(version);
    }

    bool writeU32(uint32_t value) {
        char bytes[4];
        for (int i = 0; i < 4; ++i) {
            bytes[i] = static_cast<char>((value >> (8 * i)) & 0xFF);
        }
        m_out.write(bytes, 4);
        return ok();
    }

    bool writeI32(int32_t value) { return writeU32(static_cast<uint32_t>(value)); }

    bool writeString(const std::string& text) {
        if (text.size() > MAX_STRING_BYTES) {
            PERSIST_ERROR("Refusing to write a " + std::to_string(text.size()) + " byte string");
            m_failed = true;
            return false;
        }
        if (!writeU32(static_cast<uint32_t>(text.size()))) {
            return false;
        }
        m_out.write(text.data(), static_cast<std::streamsize>(text.size()));
        return ok();
    }

    bool writeStringList(const std::vector<std::string>& list) {
        if (list.size() > MAX_LIST_ENTRIES) {
            m_failed = true;
            return false;
        }
        if (!writeU32(static_cast<uint32_t>(list.size()))) {
            return false;
        }
        for (const auto& entry : list) {
            if (!writeString(entry)) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] bool ok() const { return !m_failed && m_out.good(); }

private:
    std::ostream& m_out;
    bool m_failed{false};
};

class RecordReader {
public:
    explicit RecordReader(std::istream& in) : m_in(in) {}

    /**
     * @return false on a foreign signature or a version other than `version`
     */
    bool readHeader(const Signature& signature, uint32_t version) {
        Signature found{};
        m_in.read(found.data(), static_cast<std::streamsize>(found.size()));
        if (!ok() || found != signature) {
            PERSIST_ERROR("Not a character record (bad signature)");
            m_failed = true;
            return false;
        }
        uint32_t stored = 0;
        if (!readU32(stored)) {
            return false;
        }
        if (stored != version) {
            PERSIST_ERROR("Unsupported record version " + std::to_string(stored));
            m_failed = true;
            return false;
        }
        return true;
    }

    bool readU32(uint32_t& value) {
        unsigned char bytes[4]{};
        m_in.read(reinterpret_cast<char*>(bytes), 4);
        if (!ok() || m_in.gcount() != 4) {
            m_failed = true;
            return false;
        }
        value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<uint32_t>(bytes[i]) << (8 * i);
        }
        return true;
    }

    bool readI32(int32_t& value) {
        uint32_t raw = 0;
        if (!readU32(raw)) {
            return false;
        }
        value = static_cast<int32_t>(raw);
        return true;
    }

    bool readString(std::string& text) {
        uint32_t length = 0;
        if (!readU32(length)) {
            return false;
        }
        if (length > MAX_STRING_BYTES) {
            PERSIST_ERROR("String length too large: " + std::to_string(length) + " bytes");
            m_failed = true;
            return false;
        }
        text.assign(length, '\0');
        if (length > 0) {
            m_in.read(text.data(), static_cast<std::streamsize>(length));
            if (!ok() || m_in.gcount() != static_cast<std::streamsize>(length)) {
                m_failed = true;
                return false;
            }
        }
        return true;
    }

    bool readStringList(std::vector<std::string>& list) {
        uint32_t count = 0;
        if (!readU32(count)) {
            return false;
        }
        if (count > MAX_LIST_ENTRIES) {
            PERSIST_ERROR("List too long: " + std::to_string(count) + " entries");
            m_failed = true;
            return false;
        }
        list.clear();
        list.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            std::string entry;
            if (!readString(entry)) {
                return false;
            }
            list.push_back(std::move(entry));
        }
        return true;
    }

    /// True when every byte has been consumed
    [[nodiscard]] bool atEnd() { return m_in.peek() == std::char_traits<char>::eof(); }

    [[nodiscard]] bool ok() const { return !m_failed && m_in.good(); }

private:
    std::istream& m_in;
    bool m_failed{false};
};

} // namespace BinarySerial
} // namespace AnchorMud

#endif // BINARY_SERIALIZER_HPP

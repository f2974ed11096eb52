#pragma once
// ByteStream.hpp – Byte-level I/O with fixed-width ASCII numbers for ISO 2709.
//
// ISO 2709 wire format rules:
//   • Every structural integer (record length, base address, field length,
//     field start) is a run of ASCII digits of fixed width, zero-padded.
//   • Those runs are read from raw bytes, never from decoded text, so that
//     multi-byte UTF-8 elsewhere in the record cannot shift their offsets.
//   • Widths are hard limits: a value that needs more digits is an error,
//     never silently truncated.

#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace marc {

// Parse a run of ASCII digits.  Returns nullopt if the run is empty or holds
// anything other than '0'..'9' (no sign, no blanks, no locale).
[[nodiscard]] inline std::optional<uint32_t>
parseDigits(std::span<const uint8_t> digits) noexcept {
    if (digits.empty() || digits.size() > 9) return std::nullopt;
    uint32_t v = 0;
    for (uint8_t c : digits) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10u + static_cast<uint32_t>(c - '0');
    }
    return v;
}

// ─────────────────────────────────────────────────────────────────────────────
//  ByteReader
// ─────────────────────────────────────────────────────────────────────────────
// Reads sequentially from a read-only byte span.
//
// Example – reading a directory entry "245002500007":
//   readString(3) → "245"   readDigits(4) → 25   readDigits(5) → 7
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> buf) noexcept
        : buf_(buf), pos_(0) {}

    // ── Position queries ─────────────────────────────────────────────────────

    [[nodiscard]] size_t position()       const noexcept { return pos_; }
    [[nodiscard]] size_t size()           const noexcept { return buf_.size(); }
    [[nodiscard]] size_t bytesAvailable() const noexcept { return buf_.size() - pos_; }
    [[nodiscard]] bool   atEnd()          const noexcept { return pos_ >= buf_.size(); }
    [[nodiscard]] bool canRead(size_t n)  const noexcept { return bytesAvailable() >= n; }

    // Jump to an absolute offset (may equal size()).
    void seek(size_t pos) {
        if (pos > buf_.size())
            throw std::out_of_range("ByteReader::seek – past end of buffer");
        pos_ = pos;
    }

    // ── Fundamental read operations ──────────────────────────────────────────

    [[nodiscard]] uint8_t peekByte() const {
        if (atEnd())
            throw std::out_of_range("ByteReader::peekByte – out of bounds");
        return buf_[pos_];
    }

    // Read a fixed-width ASCII number.  nullopt (position still advanced) if
    // any of the `width` bytes is not a digit.
    [[nodiscard]] std::optional<uint32_t> readDigits(size_t width) {
        return parseDigits(readSpan(width));
    }

    // Read n bytes verbatim into a string (no decoding).
    [[nodiscard]] std::string readString(size_t n) {
        auto s = readSpan(n);
        return {reinterpret_cast<const char*>(s.data()), s.size()};
    }

    // Return a view of the next n bytes; advances this reader.
    [[nodiscard]] std::span<const uint8_t> readSpan(size_t n) {
        boundsCheck(n);
        auto s = buf_.subspan(pos_, n);
        pos_ += n;
        return s;
    }

private:
    std::span<const uint8_t> buf_;
    size_t pos_{0};

    void boundsCheck(size_t n) const {
        if (!canRead(n))
            throw std::out_of_range("ByteReader: read past end of buffer");
    }
};

// ─────────────────────────────────────────────────────────────────────────────
//  ByteWriter
// ─────────────────────────────────────────────────────────────────────────────
// Appends bytes into an internal buffer that grows as needed.
class ByteWriter {
public:
    ByteWriter() = default;

    void writeByte(uint8_t b) { buf_.push_back(b); }

    void writeBytes(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    void writeString(std::string_view s) {
        for (char c : s) buf_.push_back(static_cast<uint8_t>(c));
    }

    // Write value as exactly `width` zero-padded ASCII digits.
    // Throws CodecError(FieldWidthOverflow) if it needs more digits.
    void writeDigits(uint64_t value, size_t width, std::string_view what) {
        uint64_t limit = 1;
        for (size_t i = 0; i < width; ++i) limit *= 10u;
        if (value >= limit)
            throw CodecError(ErrorKind::FieldWidthOverflow,
                             std::string(what) + " " + std::to_string(value) +
                             " does not fit in " + std::to_string(width) + " digits");

        const size_t start = buf_.size();
        buf_.resize(start + width, '0');
        for (size_t i = width; i > 0 && value > 0; --i) {
            buf_[start + i - 1] = static_cast<uint8_t>('0' + value % 10u);
            value /= 10u;
        }
    }

    [[nodiscard]] const std::vector<uint8_t>& buffer()  const noexcept { return buf_; }
    [[nodiscard]] std::vector<uint8_t>        take()          noexcept { return std::move(buf_); }
    [[nodiscard]] size_t bytesWritten()        const noexcept { return buf_.size(); }

private:
    std::vector<uint8_t> buf_;
};

} // namespace marc

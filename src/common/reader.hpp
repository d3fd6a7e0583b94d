// src/common/reader.hpp
// Bounds-checked cursor over a byte range: big-endian reads + MIDI VLQ.
// The cursor does not own the bytes; the caller keeps the buffer alive.
// Every failure is a common::Error(MalformedMidi) naming the absolute file
// offset, so a user can find the damage with a hex editor.

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/error.hpp"

struct Bytes {
  const std::uint8_t *data = nullptr;
  std::size_t size = 0; // bytes in this window
  std::size_t base = 0; // absolute offset of data[0] in the file
  std::size_t off = 0;  // current read position, relative to data

  explicit Bytes(const std::vector<std::uint8_t> &src)
      : data(src.data()), size(src.size()) {}

  Bytes(const std::uint8_t *p, std::size_t n, std::size_t baseOffset)
      : data(p), size(n), base(baseOffset) {}

  [[nodiscard]] bool done() const { return off >= size; }
  [[nodiscard]] std::size_t remaining() const { return size - off; }
  [[nodiscard]] std::size_t file_offset() const { return base + off; }

  [[nodiscard]] std::uint8_t u8() {
    need(1, "u8");
    return data[off++];
  }

  [[nodiscard]] std::uint16_t be16() {
    need(2, "be16");
    std::uint16_t hi = data[off], lo = data[off + 1];
    off += 2;
    return static_cast<std::uint16_t>((hi << 8) | lo);
  }

  [[nodiscard]] std::uint32_t be32() {
    need(4, "be32");
    std::uint32_t b0 = data[off], b1 = data[off + 1], b2 = data[off + 2],
                  b3 = data[off + 3];
    off += 4;
    return (b0 << 24) | (b1 << 16) | (b2 << 8) | b3;
  }

  void skip(std::size_t n) {
    need(n, "skipped bytes");
    off += n;
  }

  // Carve the next n bytes out as their own window and advance past them.
  [[nodiscard]] Bytes take(std::size_t n) {
    need(n, "chunk");
    Bytes sub(data + off, n, base + off);
    off += n;
    return sub;
  }

private:
  void need(std::size_t n, const char *what) const {
    if (n > size - off) {
      throw common::Error(common::ErrorKind::MalformedMidi,
                          std::string("EOF while reading ") + what +
                              " at offset " + std::to_string(base + off));
    }
  }
};

// Read a MIDI VLQ (Variable Length Quantity). At most 4 bytes (SMF 1.0).
inline std::uint32_t read_vlq(Bytes &r) {
  const std::size_t at = r.file_offset();
  std::uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    std::uint8_t b = r.u8();
    v = (v << 7) | (b & 0x7F);
    if ((b & 0x80) == 0)
      return v; // high bit 0 => last byte
  }
  throw common::Error(common::ErrorKind::MalformedMidi,
                      "Variable-length quantity longer than 4 bytes at offset " +
                          std::to_string(at));
}

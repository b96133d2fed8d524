#pragma once
// emx/io/result_codec.h
//
// Binary result protocol written by the characterization harness.
//
// Format (big-endian throughout):
//   header : i32 width_a, i32 width_b          (must be equal)
//   body   : depends on the characterization kind
//     exhaustive : i64 error[2^w * 2^w]          row-major, row = operand A
//     random2d   : { i64 result, i32 count, i64 sample[count] }*
//     random3d   : { i64 a, i64 b, i64 error }*  (24-byte records)
//
// Decoding never produces a partial result: any protocol violation fails the
// whole buffer with MalformedHeader or SizeMismatch.
//
// The Encode* functions are the exact inverse and produce files the harness
// itself would have written.

#include "emx/core/error.h"
#include "emx/core/types.h"
#include "emx/model/characterization.h"

#include <string>
#include <vector>

namespace emx {
namespace io {

using Bytes = std::vector<u8>;

inline constexpr usize kHeaderBytes = 8;
inline constexpr usize kRandom3DRecordBytes = 24;

struct DecodedResult {
  i32 bit_width = 0;
  ResultData data;
};

namespace detail {

inline u32 LoadBE32(const u8* p) noexcept {
  return (static_cast<u32>(p[0]) << 24) | (static_cast<u32>(p[1]) << 16) |
         (static_cast<u32>(p[2]) << 8) | static_cast<u32>(p[3]);
}

inline u64 LoadBE64(const u8* p) noexcept {
  return (static_cast<u64>(LoadBE32(p)) << 32) | static_cast<u64>(LoadBE32(p + 4));
}

inline void StoreBE32(Bytes* out, u32 v) {
  out->push_back(static_cast<u8>(v >> 24));
  out->push_back(static_cast<u8>(v >> 16));
  out->push_back(static_cast<u8>(v >> 8));
  out->push_back(static_cast<u8>(v));
}

inline void StoreBE64(Bytes* out, u64 v) {
  StoreBE32(out, static_cast<u32>(v >> 32));
  StoreBE32(out, static_cast<u32>(v));
}

}  // namespace detail

// Decode the header only (both widths). Fails MalformedHeader on a short
// buffer, on unequal widths, or on a non-positive width.
bool DecodeHeader(const Bytes& bytes, i32* width, Error* err = nullptr);

bool DecodeExhaustive(const Bytes& bytes, DecodedResult* out, Error* err = nullptr);
bool DecodeRandom2D(const Bytes& bytes, DecodedResult* out, Error* err = nullptr);
bool DecodeRandom3D(const Bytes& bytes, DecodedResult* out, Error* err = nullptr);

// Dispatch on the kind reported by the harness metadata line.
bool Decode(const Bytes& bytes, CharacterizationKind kind, DecodedResult* out, Error* err = nullptr);

// Read a whole result file and decode it. A missing or unreadable file fails
// with ResultFileUnavailable.
bool ReadResultFile(const std::string& path,
                    CharacterizationKind kind,
                    DecodedResult* out,
                    Error* err = nullptr);

Bytes EncodeExhaustive(i32 width, const std::vector<i64>& cells);
Bytes EncodeRandom2D(i32 width, const Random2DErrors& data);
Bytes EncodeRandom3D(i32 width, const Random3DErrors& data);

// Write encoded bytes, creating parent directories as needed.
bool WriteResultFile(const std::string& path, const Bytes& bytes, Error* err = nullptr);

}  // namespace io
}  // namespace emx

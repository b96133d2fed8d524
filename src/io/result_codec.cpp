// src/io/result_codec.cpp
//
// Big-endian decoder/encoder for harness result files.

#include "emx/io/result_codec.h"

#include "emx/core/logging.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <utility>

namespace emx {
namespace io {

namespace {

// Largest width whose exhaustive grid (2^(2w) entries) can be indexed here.
constexpr i32 kMaxExhaustiveWidth = 30;

std::string SizeMessage(std::string_view what, usize got, usize want) {
  std::ostringstream oss;
  oss << what << ": payload has " << got << " bytes, expected " << want;
  return oss.str();
}

}  // namespace

bool DecodeHeader(const Bytes& bytes, i32* width, Error* err) {
  if (bytes.size() < kHeaderBytes) {
    SetErr(err, ErrorCode::MalformedHeader,
           "result file is " + std::to_string(bytes.size()) + " bytes, shorter than the 8-byte header");
    return false;
  }
  const i32 wa = static_cast<i32>(detail::LoadBE32(bytes.data()));
  const i32 wb = static_cast<i32>(detail::LoadBE32(bytes.data() + 4));
  if (wa != wb) {
    SetErr(err, ErrorCode::MalformedHeader,
           "operands must have the same bit width, got " + std::to_string(wa) + " and " +
               std::to_string(wb));
    return false;
  }
  if (wa <= 0 || wa > 64) {
    SetErr(err, ErrorCode::MalformedHeader, "operand bit width out of range: " + std::to_string(wa));
    return false;
  }
  if (width) *width = wa;
  return true;
}

bool DecodeExhaustive(const Bytes& bytes, DecodedResult* out, Error* err) {
  if (!out) return false;
  i32 width = 0;
  if (!DecodeHeader(bytes, &width, err)) return false;

  const usize payload = bytes.size() - kHeaderBytes;
  if (width > kMaxExhaustiveWidth) {
    SetErr(err, ErrorCode::SizeMismatch,
           "exhaustive characterization of width " + std::to_string(width) +
               " cannot match a payload of " + std::to_string(payload) + " bytes");
    return false;
  }
  const usize side = static_cast<usize>(1) << width;
  const usize want = side * side * 8;
  if (payload != want) {
    SetErr(err, ErrorCode::SizeMismatch,
           SizeMessage("error grid dimensionality must match operand bit width", payload, want));
    return false;
  }

  ExhaustiveErrors grid;
  grid.width = width;
  grid.cells.resize(side * side);
  const u8* p = bytes.data() + kHeaderBytes;
  for (usize i = 0; i < grid.cells.size(); ++i, p += 8) {
    grid.cells[i] = static_cast<i64>(detail::LoadBE64(p));
  }

  out->bit_width = width;
  out->data = std::move(grid);
  return true;
}

bool DecodeRandom2D(const Bytes& bytes, DecodedResult* out, Error* err) {
  if (!out) return false;
  i32 width = 0;
  if (!DecodeHeader(bytes, &width, err)) return false;

  Random2DErrors data;
  usize pos = kHeaderBytes;
  while (pos < bytes.size()) {
    // Group header: 8-byte key plus 4-byte count.
    if (bytes.size() - pos < 12) {
      SetErr(err, ErrorCode::SizeMismatch,
             "truncated random2d group header at byte offset " + std::to_string(pos));
      return false;
    }
    const i64 key = static_cast<i64>(detail::LoadBE64(bytes.data() + pos));
    const i32 count = static_cast<i32>(detail::LoadBE32(bytes.data() + pos + 8));
    pos += 12;
    if (count < 0) {
      SetErr(err, ErrorCode::SizeMismatch,
             "negative sample count " + std::to_string(count) + " for result " + std::to_string(key));
      return false;
    }
    const usize group_bytes = static_cast<usize>(count) * 8;
    if (bytes.size() - pos < group_bytes) {
      SetErr(err, ErrorCode::SizeMismatch,
             SizeMessage("truncated random2d sample group for result " + std::to_string(key),
                         bytes.size() - pos, group_bytes));
      return false;
    }

    std::vector<i64> samples;
    samples.reserve(static_cast<usize>(count));
    for (i32 i = 0; i < count; ++i, pos += 8) {
      samples.push_back(static_cast<i64>(detail::LoadBE64(bytes.data() + pos)));
    }
    data.samples[key] = std::move(samples);
  }

  out->bit_width = width;
  out->data = std::move(data);
  return true;
}

bool DecodeRandom3D(const Bytes& bytes, DecodedResult* out, Error* err) {
  if (!out) return false;
  i32 width = 0;
  if (!DecodeHeader(bytes, &width, err)) return false;

  const usize payload = bytes.size() - kHeaderBytes;
  if (payload % kRandom3DRecordBytes != 0) {
    SetErr(err, ErrorCode::SizeMismatch,
           "random3d payload of " + std::to_string(payload) +
               " bytes is not a whole number of 24-byte records");
    return false;
  }

  Random3DErrors data;
  for (usize pos = kHeaderBytes; pos < bytes.size(); pos += kRandom3DRecordBytes) {
    const u8* p = bytes.data() + pos;
    const i64 a = static_cast<i64>(detail::LoadBE64(p));
    const i64 b = static_cast<i64>(detail::LoadBE64(p + 8));
    data.errors[{a, b}] = static_cast<i64>(detail::LoadBE64(p + 16));
  }

  out->bit_width = width;
  out->data = std::move(data);
  return true;
}

bool Decode(const Bytes& bytes, CharacterizationKind kind, DecodedResult* out, Error* err) {
  switch (kind) {
    case CharacterizationKind::Exhaustive: return DecodeExhaustive(bytes, out, err);
    case CharacterizationKind::Random2D: return DecodeRandom2D(bytes, out, err);
    case CharacterizationKind::Random3D: return DecodeRandom3D(bytes, out, err);
    case CharacterizationKind::Unknown: break;
  }
  SetErr(err, ErrorCode::MalformedMetadata, "cannot decode a result of unknown characterization kind");
  return false;
}

bool ReadResultFile(const std::string& path,
                    CharacterizationKind kind,
                    DecodedResult* out,
                    Error* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    SetErr(err, ErrorCode::ResultFileUnavailable, "cannot open result file: " + path);
    return false;
  }
  Bytes bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    SetErr(err, ErrorCode::ResultFileUnavailable, "read failed for result file: " + path);
    return false;
  }
  EMX_LOG_DEBUG("Read", bytes.size(), "bytes from", path);

  if (!Decode(bytes, kind, out, err)) {
    if (err) err->message += " (" + path + ")";
    return false;
  }
  return true;
}

Bytes EncodeExhaustive(i32 width, const std::vector<i64>& cells) {
  Bytes out;
  out.reserve(kHeaderBytes + cells.size() * 8);
  detail::StoreBE32(&out, static_cast<u32>(width));
  detail::StoreBE32(&out, static_cast<u32>(width));
  for (i64 v : cells) detail::StoreBE64(&out, static_cast<u64>(v));
  return out;
}

Bytes EncodeRandom2D(i32 width, const Random2DErrors& data) {
  Bytes out;
  detail::StoreBE32(&out, static_cast<u32>(width));
  detail::StoreBE32(&out, static_cast<u32>(width));
  for (const auto& kv : data.samples) {
    detail::StoreBE64(&out, static_cast<u64>(kv.first));
    detail::StoreBE32(&out, static_cast<u32>(kv.second.size()));
    for (i64 s : kv.second) detail::StoreBE64(&out, static_cast<u64>(s));
  }
  return out;
}

Bytes EncodeRandom3D(i32 width, const Random3DErrors& data) {
  Bytes out;
  out.reserve(kHeaderBytes + data.errors.size() * kRandom3DRecordBytes);
  detail::StoreBE32(&out, static_cast<u32>(width));
  detail::StoreBE32(&out, static_cast<u32>(width));
  for (const auto& kv : data.errors) {
    detail::StoreBE64(&out, static_cast<u64>(kv.first.first));
    detail::StoreBE64(&out, static_cast<u64>(kv.first.second));
    detail::StoreBE64(&out, static_cast<u64>(kv.second));
  }
  return out;
}

bool WriteResultFile(const std::string& path, const Bytes& bytes, Error* err) {
  namespace fs = std::filesystem;
  std::error_code ec;
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      SetErr(err, ErrorCode::ResultFileUnavailable,
             "failed to create directory " + parent.string() + " (" + ec.message() + ")");
      return false;
    }
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    SetErr(err, ErrorCode::ResultFileUnavailable, "cannot open result file for writing: " + path);
    return false;
  }
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    SetErr(err, ErrorCode::ResultFileUnavailable, "write failed for result file: " + path);
    return false;
  }
  return true;
}

}  // namespace io
}  // namespace emx

#pragma once
// emx/core/types.h
//
// Core, dependency-light types shared across the project: fixed-width integer
// aliases, the characterization/module selectors reported by the harness, and
// their string conversions.

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace emx {

// --------------------------
// Fixed-width integer aliases
// --------------------------
using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using usize = std::size_t;

// --------------------------
// Harness-reported selectors
// --------------------------
enum class CharacterizationKind : u8 {
  Exhaustive = 0,
  Random2D = 1,
  Random3D = 2,
  Unknown = 255,
};

enum class ModuleKind : u8 {
  Adder = 0,
  Multiplier = 1,
  Unknown = 255,
};

inline constexpr std::string_view ToString(CharacterizationKind k) noexcept {
  switch (k) {
    case CharacterizationKind::Exhaustive: return "exhaustive";
    case CharacterizationKind::Random2D: return "random2d";
    case CharacterizationKind::Random3D: return "random3d";
    case CharacterizationKind::Unknown: return "unknown";
  }
  return "unknown";
}

inline constexpr std::string_view ToString(ModuleKind m) noexcept {
  switch (m) {
    case ModuleKind::Adder: return "adder";
    case ModuleKind::Multiplier: return "multiplier";
    case ModuleKind::Unknown: return "unknown";
  }
  return "unknown";
}

namespace detail {
inline constexpr char LowerAscii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}
inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (usize i = 0; i < a.size(); ++i) {
    if (LowerAscii(a[i]) != LowerAscii(b[i])) return false;
  }
  return true;
}
}  // namespace detail

inline bool ParseCharacterizationKind(std::string_view s, CharacterizationKind* out) noexcept {
  if (!out) return false;
  if (detail::EqualsIgnoreCase(s, "exhaustive")) { *out = CharacterizationKind::Exhaustive; return true; }
  if (detail::EqualsIgnoreCase(s, "random2d")) { *out = CharacterizationKind::Random2D; return true; }
  if (detail::EqualsIgnoreCase(s, "random3d")) { *out = CharacterizationKind::Random3D; return true; }
  *out = CharacterizationKind::Unknown;
  return false;
}

inline bool ParseModuleKind(std::string_view s, ModuleKind* out) noexcept {
  if (!out) return false;
  if (detail::EqualsIgnoreCase(s, "adder")) { *out = ModuleKind::Adder; return true; }
  if (detail::EqualsIgnoreCase(s, "multiplier")) { *out = ModuleKind::Multiplier; return true; }
  *out = ModuleKind::Unknown;
  return false;
}

inline std::ostream& operator<<(std::ostream& os, CharacterizationKind k) {
  os << ToString(k);
  return os;
}
inline std::ostream& operator<<(std::ostream& os, ModuleKind m) {
  os << ToString(m);
  return os;
}

}  // namespace emx

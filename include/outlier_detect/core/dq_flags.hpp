#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace outlier_detect::dq {

// Data quality bit values (JWST pixel convention)
constexpr uint32_t GOOD = 0u;
constexpr uint32_t DO_NOT_USE = 1u << 0;
constexpr uint32_t SATURATED = 1u << 1;
constexpr uint32_t JUMP_DET = 1u << 2;
constexpr uint32_t DROPOUT = 1u << 3;
constexpr uint32_t OUTLIER = 1u << 4;
constexpr uint32_t PERSISTENCE = 1u << 5;
constexpr uint32_t AD_FLOOR = 1u << 6;
constexpr uint32_t CHARGELOSS = 1u << 7;
constexpr uint32_t UNRELIABLE_ERROR = 1u << 8;
constexpr uint32_t NON_SCIENCE = 1u << 9;
constexpr uint32_t DEAD = 1u << 10;
constexpr uint32_t HOT = 1u << 11;
constexpr uint32_t WARM = 1u << 12;
constexpr uint32_t LOW_QE = 1u << 13;
constexpr uint32_t NO_FLAT_FIELD = 1u << 18;
constexpr uint32_t NO_GAIN_VALUE = 1u << 19;
constexpr uint32_t REFERENCE_PIXEL = 1u << 31;

// Look up a single mnemonic (case-insensitive). Returns nullopt if unknown.
std::optional<uint32_t> flag_from_mnemonic(const std::string& name);

// Interpret a bit-flag specification:
//   ""/"None"             -> nullopt (no pixel is considered bad)
//   "0", "513"            -> integer value
//   "DO_NOT_USE,SATURATED" or "DO_NOT_USE+SATURATED" -> OR of mnemonics
//   "~..."                -> bitwise inverse of the above
// Throws ValidationError on unknown mnemonics or malformed input.
std::optional<uint32_t> interpret_bit_flags(const std::string& flags);

// 1 where (dq & ~good_bits) == 0, 0 elsewhere. All ones when good_bits is nullopt.
Matrix2Df build_good_mask(const DQMatrix& dq, const std::optional<uint32_t>& good_bits);

} // namespace outlier_detect::dq

#pragma once
#include <cstdint>

namespace cbor
{

enum class MajorType : uint8_t
{
    Unsigned = 0,
    Negative = 1,
    ByteString = 2,
    TextString = 3,
    Array = 4,
    Map = 5,
    Tag = 6,
    SimpleOrFloat = 7,
};

// Additional information values
constexpr uint8_t ai_one_byte = 24;
constexpr uint8_t ai_two_bytes = 25;
constexpr uint8_t ai_four_bytes = 26;
constexpr uint8_t ai_eight_bytes = 27;
constexpr uint8_t ai_indefinite = 31;

constexpr uint8_t simple_false = 20;
constexpr uint8_t simple_true = 21;
constexpr uint8_t simple_null = 22;
constexpr uint8_t simple_undefined = 23;

constexpr uint8_t break_byte = 0xFF;

constexpr MajorType major_of(uint8_t initial) { return static_cast<MajorType>(initial >> 5); }
constexpr uint8_t info_of(uint8_t initial) { return initial & 0x1F; }
constexpr uint8_t make_initial(MajorType major, uint8_t info)
{
    return static_cast<uint8_t>((static_cast<uint8_t>(major) << 5) | info);
}

} // namespace cbor

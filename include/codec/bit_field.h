#pragma once

#include <cstdint>
#include <type_traits>

namespace ctlwire {

/**
 * Named sub-field of an unsigned backing integer.
 *
 * get():  (backing >> Shift) & mask
 * set():  (backing & ~(mask << Shift)) | ((value & mask) << Shift)
 *
 * A set() only touches the bits inside its own mask, so any number of views
 * over the same backing word can be written in any order.
 *
 * Example:
 *   using Qr = BitField<uint16_t, 15, 1>;
 *   uint16_t op = 0x0100;
 *   Qr::assign(op, 1);   // op == 0x8100
 */
template <typename T, unsigned Shift, unsigned Width>
struct BitField {
    static_assert(std::is_unsigned<T>::value, "BitField backing type must be unsigned");
    static_assert(Width > 0 && Shift + Width <= sizeof(T) * 8, "BitField out of range");

    using value_type = T;

    static constexpr unsigned kShift = Shift;
    static constexpr unsigned kWidth = Width;
    static constexpr T kMask = static_cast<T>((1ULL << Width) - 1);
    static constexpr T kInPlaceMask = static_cast<T>(static_cast<T>(kMask) << Shift);

    static constexpr T get(T backing) {
        return static_cast<T>((backing >> Shift) & kMask);
    }

    static constexpr T set(T backing, T value) {
        return static_cast<T>((backing & static_cast<T>(~kInPlaceMask)) |
                              static_cast<T>((value & kMask) << Shift));
    }

    static void assign(T& backing, T value) {
        backing = set(backing, value);
    }
};

/**
 * Single-bit convenience wrapper exposing bool accessors
 */
template <typename T, unsigned Bit>
struct BitFlag {
    using Field = BitField<T, Bit, 1>;

    static constexpr bool get(T backing) { return Field::get(backing) != 0; }

    static constexpr T set(T backing, bool on) {
        return Field::set(backing, static_cast<T>(on ? 1 : 0));
    }

    static void assign(T& backing, bool on) { backing = set(backing, on); }
};

}  // namespace ctlwire

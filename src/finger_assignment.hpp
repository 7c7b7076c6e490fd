#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

enum class Finger : std::uint8_t { Pinky, Ring, Middle, Index, Thumb };

enum class MatrixHalf : std::uint8_t { Left, Right };

inline const char* to_string(Finger finger) {
    switch (finger) {
        case Finger::Pinky:
            return "pinky";
        case Finger::Ring:
            return "ring";
        case Finger::Middle:
            return "middle";
        case Finger::Index:
            return "index";
        case Finger::Thumb:
            return "thumb";
    }
    return "none";
}

inline const char* to_string(MatrixHalf half) {
    return half == MatrixHalf::Left ? "left" : "right";
}

// Finger digits used by the finger_assignments grid: 0=pinky .. 4=thumb
inline bool finger_from_digit(int digit, Finger& out) {
    if (digit < 0 || digit > static_cast<int>(Finger::Thumb)) return false;
    out = static_cast<Finger>(digit);
    return true;
}

struct FingerAssignment {
    Finger finger;
    MatrixHalf half;

    bool operator==(const FingerAssignment& other) const {
        return finger == other.finger && half == other.half;
    }

    bool operator!=(const FingerAssignment& other) const {
        return !(*this == other);
    }

    // Reads left to right across both hands:
    // left pinky .. left thumb, right thumb .. right pinky
    bool operator<(const FingerAssignment& other) const {
        if (half != other.half) return half < other.half;
        if (half == MatrixHalf::Left) return finger < other.finger;
        return other.finger < finger;
    }
};

struct FingerAssignmentHash {
    std::size_t operator()(const FingerAssignment& fa) const {
        std::size_t h = 0;

        auto hash_combine = [](std::size_t& seed, std::size_t value) {
            seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        };

        hash_combine(h, std::hash<int>{}(static_cast<int>(fa.finger)));
        hash_combine(h, std::hash<int>{}(static_cast<int>(fa.half)));
        return h;
    }
};

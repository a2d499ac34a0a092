/**
 * @file MrzFormat.hpp
 * @brief Fixed offsets and constants of the TD3 and TD1 machine-readable zones.
 */

#pragma once

#include <array>
#include <cstddef>

namespace docverify::domain::mrz {

/**
 * @struct FieldSpan
 * @brief [offset, offset + length) inside one MRZ line.
 */
struct FieldSpan {
    std::size_t offset;
    std::size_t length;
};

/**
 * @class MrzFormat
 * @brief ICAO 9303 layout tables. Offsets are format constants, never inferred.
 */
class MrzFormat {
public:
    static constexpr char Filler = '<';

    /** @brief Weight cycle applied to character positions of a checked substring. */
    static constexpr std::array<int, 3> CheckDigitWeights = {7, 3, 1};

    /** @brief Two-digit years above this pivot belong to the 1900s. */
    static constexpr int CenturyPivot = 50;

    struct Td3 {
        static constexpr std::size_t LineCount = 2;
        static constexpr std::size_t LineLength = 44;
        // Line 1
        static constexpr FieldSpan DocumentType = {0, 2};
        static constexpr FieldSpan IssuingCountry = {2, 3};
        static constexpr FieldSpan Name = {5, 39};
        // Line 2
        static constexpr FieldSpan DocumentNumber = {0, 9};
        static constexpr std::size_t DocumentNumberCheck = 9;
        static constexpr FieldSpan Nationality = {10, 3};
        static constexpr FieldSpan DateOfBirth = {13, 6};
        static constexpr std::size_t DateOfBirthCheck = 19;
        static constexpr std::size_t Sex = 20;
        static constexpr FieldSpan ExpiryDate = {21, 6};
        static constexpr std::size_t ExpiryDateCheck = 27;
        static constexpr FieldSpan PersonalNumber = {28, 14};
        static constexpr std::size_t PersonalNumberCheck = 42;
        static constexpr std::size_t CompositeCheck = 43;
        /** @brief Pieces of line 2 concatenated for the composite check digit. */
        static constexpr std::array<FieldSpan, 3> CompositeParts = {{{0, 10}, {13, 7}, {21, 22}}};
    };

    struct Td1 {
        static constexpr std::size_t LineCount = 3;
        static constexpr std::size_t LineLength = 30;
        // Line 1
        static constexpr FieldSpan DocumentType = {0, 2};
        static constexpr FieldSpan IssuingCountry = {2, 3};
        static constexpr FieldSpan DocumentNumber = {5, 9};
        static constexpr std::size_t DocumentNumberCheck = 14;
        // Line 2
        static constexpr FieldSpan DateOfBirth = {0, 6};
        static constexpr std::size_t DateOfBirthCheck = 6;
        static constexpr std::size_t Sex = 7;
        static constexpr FieldSpan ExpiryDate = {8, 6};
        static constexpr std::size_t ExpiryDateCheck = 14;
        static constexpr FieldSpan Nationality = {15, 3};
        // Line 3
        static constexpr FieldSpan Name = {0, 30};
    };
};

} // namespace docverify::domain::mrz

/**
 * @file MrzCodec.hpp
 * @brief Detection, layout dispatch, slicing and check digit verification of MRZ text.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "domain/MrzRecord.hpp"
#include "domain/mrz/MrzCandidateLines.hpp"

namespace docverify::domain::mrz {

/**
 * @class MrzCodec
 * @brief Stateless codec for TD3 (2x44) and TD1 (3x30) machine-readable zones.
 *
 * Structural and check digit problems never throw: they are appended to
 * MrzRecord::errors and the best-effort decode is still returned.
 */
class MrzCodec {
public:
    /** @brief Error recorded when the candidate count is neither 2 nor 3. */
    static constexpr const char* InvalidLineCountError = "Invalid MRZ format - expected 2 or 3 lines";

    /**
     * @brief Finds MRZ candidate lines in raw OCR text.
     * @param text Raw text; must outlive the returned view.
     */
    static MrzCandidateLines DetectLines(std::string_view text);

    /**
     * @brief Decodes candidate lines. The layout is chosen by line count only.
     * @param lines Exactly 2 lines selects TD3, exactly 3 selects TD1.
     * @return Record with valid == errors.empty(). Any other count yields a record
     *         with no decoded fields and InvalidLineCountError.
     */
    static MrzRecord Parse(const std::vector<std::string>& lines);

    /** @brief DetectLines followed by Parse. */
    static MrzRecord ParseAndValidate(const std::string& rawText);

    /**
     * @brief ICAO 9303 check digit: weighted (7,3,1) sum of character values, modulo 10.
     */
    static int ComputeCheckDigit(std::string_view data);

    /** @brief '0'-'9' -> 0-9, 'A'-'Z' -> 10-35, anything else (filler) -> 0. */
    static int CharacterValue(char c);

    /**
     * @brief Expands YYMMDD to YYYY-MM-DD (YY > 50 -> 19YY, else 20YY).
     *
     * Month and day are copied as-is; calendar validity is checked downstream.
     * @return Empty string if the input is not 6 characters or YY is not numeric.
     */
    static std::string ExpandDate(std::string_view yymmdd);

private:
    static void DecodeTd3(const std::vector<std::string>& lines, MrzRecord& record);
    static void DecodeTd1(const std::vector<std::string>& lines, MrzRecord& record);
};

} // namespace docverify::domain::mrz

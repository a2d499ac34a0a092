/**
 * @file MrzCandidateLines.hpp
 * @brief Lazy view over the lines of OCR text that look like MRZ lines.
 */

#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docverify::domain::mrz {

/**
 * @class MrzCandidateLines
 * @brief Finite, restartable sequence of normalized MRZ candidate lines in source order.
 *
 * Lines are scanned on demand while iterating. The view does not own the text: the
 * string it was built from must outlive it and every iterator.
 */
class MrzCandidateLines {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        Iterator() = default;
        explicit Iterator(std::string_view text);

        reference operator*() const { return m_current; }
        pointer operator->() const { return &m_current; }

        Iterator& operator++();
        Iterator operator++(int);

        bool operator==(const Iterator& other) const;
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        void advance();

        std::string_view m_text;
        std::size_t m_next = 0;
        std::string m_current;
        bool m_atEnd = true;
    };

    explicit MrzCandidateLines(std::string_view text) : m_text(text) {}

    Iterator begin() const { return Iterator(m_text); }
    Iterator end() const { return Iterator(); }

    /** @brief Materializes the sequence. */
    std::vector<std::string> ToVector() const;

    /**
     * @brief Strips all whitespace and upper-cases one source line.
     * @return The normalized line if it is exactly 44 or 30 characters of [A-Z0-9<].
     */
    static std::optional<std::string> Normalize(std::string_view line);

private:
    std::string_view m_text;
};

} // namespace docverify::domain::mrz

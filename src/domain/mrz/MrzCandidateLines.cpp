#include "domain/mrz/MrzCandidateLines.hpp"
#include "domain/mrz/MrzFormat.hpp"

#include <algorithm>
#include <cctype>

namespace docverify::domain::mrz {

MrzCandidateLines::Iterator::Iterator(std::string_view text)
    : m_text(text), m_atEnd(false) {
    advance();
}

MrzCandidateLines::Iterator& MrzCandidateLines::Iterator::operator++() {
    advance();
    return *this;
}

MrzCandidateLines::Iterator MrzCandidateLines::Iterator::operator++(int) {
    Iterator previous = *this;
    advance();
    return previous;
}

bool MrzCandidateLines::Iterator::operator==(const Iterator& other) const {
    if (m_atEnd || other.m_atEnd) return m_atEnd == other.m_atEnd;
    return m_text.data() == other.m_text.data() && m_next == other.m_next;
}

void MrzCandidateLines::Iterator::advance() {
    while (!m_atEnd && m_next <= m_text.size()) {
        const std::size_t newline = m_text.find('\n', m_next);
        const std::size_t stop = (newline == std::string_view::npos) ? m_text.size() : newline;
        std::string_view line = m_text.substr(m_next, stop - m_next);
        m_next = stop + 1;

        if (auto candidate = Normalize(line)) {
            m_current = std::move(*candidate);
            return;
        }
    }
    m_atEnd = true;
    m_current.clear();
}

std::vector<std::string> MrzCandidateLines::ToVector() const {
    return std::vector<std::string>(begin(), end());
}

std::optional<std::string> MrzCandidateLines::Normalize(std::string_view line) {
    std::string clean;
    clean.reserve(line.size());
    for (unsigned char c : line) {
        if (std::isspace(c)) continue;
        clean.push_back(static_cast<char>(std::toupper(c)));
    }

    if (clean.size() != MrzFormat::Td3::LineLength && clean.size() != MrzFormat::Td1::LineLength) {
        return std::nullopt;
    }
    const bool allowed = std::all_of(clean.begin(), clean.end(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == MrzFormat::Filler;
    });
    if (!allowed) return std::nullopt;
    return clean;
}

} // namespace docverify::domain::mrz

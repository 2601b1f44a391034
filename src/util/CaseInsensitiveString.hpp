#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "util/Expected.hpp"

namespace batchfs {

/**
 * @brief Immutable string with case-insensitive queries
 *
 * Keeps the original text and a lower-cased copy computed once at
 * construction. Every query folds its right-hand operand at call time and
 * runs against the cached lower-cased form, so plain text can be compared
 * directly without normalizing it first.
 *
 * Folding is per byte through std::tolower in the current C locale; it is
 * not Unicode aware.
 *
 * Usage:
 *   CaseInsensitiveString ext("JPG");
 *   ext.equalsFold("jpg");          // true
 *   ext.startsWithFold("j");        // true
 *
 *   std::unordered_set<CaseInsensitiveString,
 *                      CaseInsensitiveString::Hash,
 *                      CaseInsensitiveString::Equal> exts;
 */
class CaseInsensitiveString {
public:
    static constexpr std::size_t npos = std::string::npos;

    CaseInsensitiveString() = default;
    explicit CaseInsensitiveString(std::string text);
    explicit CaseInsensitiveString(const char* text);

    /// Lower-case a string the same way the constructor does
    static std::string foldCase(std::string_view text);

    /// Original text as given at construction
    const std::string& str() const { return original; }

    /// Cached lower-cased text
    const std::string& lower() const { return folded; }

    std::size_t size() const { return original.size(); }
    bool empty() const { return original.empty(); }

    /// Indexing returns the original character at pos (unchecked, like std::string)
    char operator[](std::size_t pos) const { return original[pos]; }

    // Comparisons
    bool equalsFold(std::string_view other) const;
    bool equalsFold(const CaseInsensitiveString& other) const;
    bool notEqualsFold(std::string_view other) const { return !equalsFold(other); }

    /**
     * @brief Three-way comparison on the folded forms
     * @return Negative, zero or positive, like std::string::compare
     */
    int compareFold(std::string_view other) const;
    int compareFold(const CaseInsensitiveString& other) const;

    bool lessFold(std::string_view other) const { return compareFold(other) < 0; }
    bool lessEqualFold(std::string_view other) const { return compareFold(other) <= 0; }
    bool greaterFold(std::string_view other) const { return compareFold(other) > 0; }
    bool greaterEqualFold(std::string_view other) const { return compareFold(other) >= 0; }

    /// Hash of the folded form; equal for all case variants
    std::size_t hash() const;

    // Substring queries. The range forms look only at [start, end), with end
    // clamped to size(); a match must lie entirely inside the range.
    bool containsFold(std::string_view sub) const;

    /**
     * @brief Count non-overlapping occurrences of sub in [start, end)
     *
     * An empty sub matches at every position, including the end of the
     * range, so the result is min(end, size()) - start + 1 when the range
     * is valid, and 0 when start lies past it.
     */
    std::size_t countFold(std::string_view sub, std::size_t start = 0, std::size_t end = npos) const;

    /// Leftmost occurrence inside [start, end), or npos
    std::size_t findFold(std::string_view sub, std::size_t start = 0, std::size_t end = npos) const;

    /// Rightmost occurrence beginning at or before pos, or npos
    std::size_t rfindFold(std::string_view sub, std::size_t pos = npos) const;

    /// Like findFold but reports a miss as ErrorCode::NotFound
    Expected<std::size_t> indexFold(std::string_view sub, std::size_t start = 0, std::size_t end = npos) const;

    /// Like rfindFold but reports a miss as ErrorCode::NotFound
    Expected<std::size_t> rindexFold(std::string_view sub, std::size_t pos = npos) const;

    /// True when the range [start, end) begins with prefix
    bool startsWithFold(std::string_view prefix, std::size_t start = 0, std::size_t end = npos) const;
    /// True when the range [start, end) ends with suffix
    bool endsWithFold(std::string_view suffix, std::size_t start = 0, std::size_t end = npos) const;

    struct Hash {
        std::size_t operator()(const CaseInsensitiveString& s) const { return s.hash(); }
    };

    struct Equal {
        bool operator()(const CaseInsensitiveString& a, const CaseInsensitiveString& b) const {
            return a.equalsFold(b);
        }
    };

    struct Less {
        bool operator()(const CaseInsensitiveString& a, const CaseInsensitiveString& b) const {
            return a.compareFold(b) < 0;
        }
    };

private:
    std::string original;
    std::string folded;
};

}

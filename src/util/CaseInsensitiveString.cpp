#include "util/CaseInsensitiveString.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <utility>

namespace batchfs {

CaseInsensitiveString::CaseInsensitiveString(std::string text)
    : original(std::move(text)), folded(foldCase(original)) {}

CaseInsensitiveString::CaseInsensitiveString(const char* text)
    : CaseInsensitiveString(std::string(text ? text : "")) {}

std::string CaseInsensitiveString::foldCase(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool CaseInsensitiveString::equalsFold(std::string_view other) const {
    return folded == foldCase(other);
}

bool CaseInsensitiveString::equalsFold(const CaseInsensitiveString& other) const {
    return folded == other.folded;
}

int CaseInsensitiveString::compareFold(std::string_view other) const {
    return folded.compare(foldCase(other));
}

int CaseInsensitiveString::compareFold(const CaseInsensitiveString& other) const {
    return folded.compare(other.folded);
}

std::size_t CaseInsensitiveString::hash() const {
    return std::hash<std::string>{}(folded);
}

bool CaseInsensitiveString::containsFold(std::string_view sub) const {
    return folded.find(foldCase(sub)) != npos;
}

std::size_t CaseInsensitiveString::countFold(std::string_view sub, std::size_t start, std::size_t end) const {
    std::size_t stop = std::min(end, folded.size());
    if (start > stop) return 0;
    if (sub.empty()) return stop - start + 1;

    std::string needle = foldCase(sub);
    std::string_view range = std::string_view(folded).substr(0, stop);
    std::size_t n = 0;
    std::size_t pos = range.find(needle, start);
    while (pos != npos) {
        ++n;
        pos = range.find(needle, pos + needle.size());
    }
    return n;
}

std::size_t CaseInsensitiveString::findFold(std::string_view sub, std::size_t start, std::size_t end) const {
    std::size_t stop = std::min(end, folded.size());
    if (start > stop) return npos;
    return std::string_view(folded).substr(0, stop).find(foldCase(sub), start);
}

std::size_t CaseInsensitiveString::rfindFold(std::string_view sub, std::size_t pos) const {
    return folded.rfind(foldCase(sub), pos);
}

Expected<std::size_t> CaseInsensitiveString::indexFold(std::string_view sub, std::size_t start, std::size_t end) const {
    std::size_t pos = findFold(sub, start, end);
    if (pos == npos) return Error{ErrorCode::NotFound, "substring not found"};
    return pos;
}

Expected<std::size_t> CaseInsensitiveString::rindexFold(std::string_view sub, std::size_t pos) const {
    std::size_t found = rfindFold(sub, pos);
    if (found == npos) return Error{ErrorCode::NotFound, "substring not found"};
    return found;
}

bool CaseInsensitiveString::startsWithFold(std::string_view prefix, std::size_t start, std::size_t end) const {
    std::size_t stop = std::min(end, folded.size());
    if (start > stop || stop - start < prefix.size()) return false;
    return folded.compare(start, prefix.size(), foldCase(prefix)) == 0;
}

bool CaseInsensitiveString::endsWithFold(std::string_view suffix, std::size_t start, std::size_t end) const {
    std::size_t stop = std::min(end, folded.size());
    if (start > stop || stop - start < suffix.size()) return false;
    return folded.compare(stop - suffix.size(), suffix.size(), foldCase(suffix)) == 0;
}

}

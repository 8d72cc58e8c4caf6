#include <mvsearch/search/text_similarity.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

namespace mvsearch::search {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trimmed(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
        ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return std::string(s.substr(start, end - start));
}

double affixBonus(size_t common, size_t minLength) {
    return common > 3 ? (static_cast<double>(common) / static_cast<double>(minLength)) * 0.1 : 0.0;
}

} // namespace

std::set<std::string> wordSet(std::string_view text) {
    std::set<std::string> words;
    std::istringstream in(toLower(text));
    std::string word;
    while (in >> word) {
        words.insert(word);
    }
    return words;
}

double jaccardSimilarity(std::string_view a, std::string_view b) {
    const auto wa = wordSet(a);
    const auto wb = wordSet(b);
    if (wa.empty() && wb.empty())
        return 1.0;
    if (wa.empty() || wb.empty())
        return 0.0;

    size_t intersection = 0;
    for (const auto& w : wa) {
        if (wb.count(w))
            ++intersection;
    }
    const size_t unionSize = wa.size() + wb.size() - intersection;
    return static_cast<double>(intersection) / static_cast<double>(unionSize);
}

double stringSimilarity(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty())
        return a == b ? 1.0 : 0.0;
    if (a == b)
        return 1.0;

    const std::string n1 = trimmed(toLower(a));
    const std::string n2 = trimmed(toLower(b));
    const double jaccard = jaccardSimilarity(n1, n2);

    const size_t minLength = std::min(n1.size(), n2.size());
    if (minLength == 0)
        return jaccard;

    size_t prefix = 0;
    while (prefix < minLength && n1[prefix] == n2[prefix])
        ++prefix;
    size_t suffix = 0;
    while (suffix < minLength && n1[n1.size() - 1 - suffix] == n2[n2.size() - 1 - suffix])
        ++suffix;

    return std::min(jaccard + affixBonus(prefix, minLength) + affixBonus(suffix, minLength), 1.0);
}

size_t levenshteinDistance(std::string_view s1, std::string_view s2) {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    std::vector<size_t> prevRow(n + 1);
    std::vector<size_t> currRow(n + 1);
    for (size_t j = 0; j <= n; ++j) {
        prevRow[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        currRow[0] = i;
        for (size_t j = 1; j <= n; ++j) {
            size_t cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
            currRow[j] = std::min({
                prevRow[j] + 1,       // deletion
                currRow[j - 1] + 1,   // insertion
                prevRow[j - 1] + cost // substitution
            });
        }
        std::swap(prevRow, currRow);
    }

    return prevRow[n];
}

double normalizedLevenshtein(std::string_view s1, std::string_view s2) {
    const size_t longest = std::max(s1.size(), s2.size());
    if (longest == 0)
        return 1.0;
    return 1.0 - static_cast<double>(levenshteinDistance(s1, s2)) / static_cast<double>(longest);
}

std::string stripVersionSuffix(std::string_view name) {
    static const std::regex kVersionSuffix(R"(\s*v?\d+(\.\d+)*(\s*[\-\+]?\w*)?$)",
                                           std::regex::icase);
    return trimmed(std::regex_replace(std::string(name), kVersionSuffix, ""));
}

std::string normalizeName(std::string_view name) {
    std::string cleaned;
    cleaned.reserve(name.size());
    bool pendingSpace = false;
    for (unsigned char c : toLower(name)) {
        if (std::isspace(c)) {
            pendingSpace = !cleaned.empty();
            continue;
        }
        // Keep word characters plus '.' so version numbers survive until they are stripped
        if (!std::isalnum(c) && c != '_' && c != '.')
            continue;
        if (pendingSpace) {
            cleaned.push_back(' ');
            pendingSpace = false;
        }
        cleaned.push_back(static_cast<char>(c));
    }
    std::string stripped = stripVersionSuffix(cleaned);
    // Any dots left over are not part of a version token
    stripped.erase(std::remove(stripped.begin(), stripped.end(), '.'), stripped.end());
    return trimmed(stripped);
}

} // namespace mvsearch::search

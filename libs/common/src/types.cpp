#include "humanize/common/types.hpp"
#include <algorithm>

namespace humanize {

String to_upper(StringView str) {
    String result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](char c) { return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c; });
    return result;
}

String to_lower(StringView str) {
    String result(str);
    std::transform(result.begin(), result.end(), result.begin(), ascii_to_lower);
    return result;
}

String trim(StringView str) {
    return String(trim_view(str));
}

std::vector<String> split(StringView str, char delimiter) {
    std::vector<String> result;
    Size start = 0, end = 0;
    while ((end = str.find(delimiter, start)) != StringView::npos) {
        result.emplace_back(str.substr(start, end - start));
        start = end + 1;
    }
    result.emplace_back(str.substr(start));
    return result;
}

String join(const std::vector<String>& strings, StringView delimiter) {
    if (strings.empty()) return "";
    String result = strings[0];
    for (Size i = 1; i < strings.size(); ++i) {
        result += delimiter;
        result += strings[i];
    }
    return result;
}

String pad_left(StringView str, Size width, char pad) {
    if (str.size() >= width) return String(str);
    return String(width - str.size(), pad) + String(str);
}

} // namespace humanize

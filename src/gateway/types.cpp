#include "gateway/types.h"

#include <algorithm>
#include <cctype>

namespace sagegate {

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

HttpMethod parse_http_method(const std::string& method) {
    std::string upper = method;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "GET") return HttpMethod::Get;
    if (upper == "POST") return HttpMethod::Post;
    if (upper == "OPTIONS") return HttpMethod::Options;
    return HttpMethod::Other;
}

}  // namespace sagegate

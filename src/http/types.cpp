#include <countrydir/http/types.h>

namespace countrydir::http {
namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string PercentDecode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size()) {
            int hi = HexValue(s[i + 1]);
            int lo = HexValue(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string_view Request::Query(std::string_view key) const {
    auto it = query.find(std::string(key));
    if (it == query.end()) {
        return {};
    }
    return it->second;
}

std::string_view Request::Param(std::string_view key) const {
    auto it = params.find(std::string(key));
    if (it == params.end()) {
        return {};
    }
    return it->second;
}

void Request::SetTarget(std::string_view target) {
    query.clear();

    auto q = target.find('?');
    path = std::string(q == std::string_view::npos ? target : target.substr(0, q));
    if (q == std::string_view::npos || q + 1 >= target.size()) {
        return;
    }

    std::string_view s = target.substr(q + 1);
    while (!s.empty()) {
        auto amp = s.find('&');
        auto part = (amp == std::string_view::npos) ? s : s.substr(0, amp);
        auto eq = part.find('=');
        // First occurrence of a key wins.
        if (eq != std::string_view::npos) {
            query.emplace(PercentDecode(part.substr(0, eq)), PercentDecode(part.substr(eq + 1)));
        } else if (!part.empty()) {
            query.emplace(PercentDecode(part), "");
        }
        if (amp == std::string_view::npos) {
            break;
        }
        s.remove_prefix(amp + 1);
    }
}

void Response::SetJson(std::string json) {
    content_type = "application/json; charset=utf-8";
    body = std::move(json);
}

void Response::SetText(unsigned code, std::string text) {
    status = code;
    content_type = "text/plain; charset=utf-8";
    body = std::move(text);
}

} // namespace countrydir::http

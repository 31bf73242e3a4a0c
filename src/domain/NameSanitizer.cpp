#include "domain/NameSanitizer.hpp"

namespace modlink::domain {

namespace {

bool IsNameChar(char ch) {
    return (ch >= 'a' && ch <= 'z') ||
           (ch >= 'A' && ch <= 'Z') ||
           (ch >= '0' && ch <= '9') ||
           ch == '_';
}

} // namespace

std::string NameSanitizer::Sanitize(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char ch : raw) {
        char mapped = IsNameChar(ch) ? ch : '_';
        if (mapped == '_' && !out.empty() && out.back() == '_') {
            continue;
        }
        out.push_back(mapped);
    }
    return out;
}

bool NameSanitizer::IsUsableLinkName(const std::string& name) {
    return name.find_first_not_of('_') != std::string::npos;
}

} // namespace modlink::domain

#include "core/module.hpp"
#include <cctype>
#include <stdexcept>
#include <fmt/format.h>

InputShape InputShape::parse(const std::string& s){
    if (s=="single_row") return single_row();
    const std::string prefix = "window:";
    if (s.compare(0, prefix.size(), prefix)==0){
        const std::string n = s.substr(prefix.size());
        std::size_t pos = 0;
        long long v = 0;
        // csak számjeggyel kezdődhet, előjel nem
        if (!n.empty() && std::isdigit(static_cast<unsigned char>(n[0]))){
            try {
                v = std::stoll(n, &pos);
            } catch (const std::exception&) {
                pos = 0;
            }
        }
        if (pos==n.size() && !n.empty() && v>0) return window(static_cast<std::size_t>(v));
    }
    throw std::invalid_argument(fmt::format("invalid input shape '{}', expected single_row or window:N", s));
}

std::string InputShape::str() const {
    return kind==InputKind::SingleRow ? std::string("single_row") : fmt::format("window:{}", rows);
}

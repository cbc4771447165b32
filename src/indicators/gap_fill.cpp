#include "indicators/gap_fill.hpp"
#include <algorithm>

namespace ind {

std::size_t fill_forward(Series& v){
    std::size_t n=0;
    OptDouble last;
    for (auto& x : v){
        if (x) { last = x; continue; }
        if (last) { x = last; ++n; }
    }
    return n;
}

std::size_t fill_backward(Series& v){
    std::size_t n=0;
    OptDouble next;
    for (auto it=v.rbegin(); it!=v.rend(); ++it){
        if (*it) { next = *it; continue; }
        if (next) { *it = next; ++n; }
    }
    return n;
}

std::size_t interpolate_linear(Series& v){
    std::size_t n=0;
    std::size_t prev = v.size();   // utolsó ismert index
    for (std::size_t i=0;i<v.size();++i){
        if (!v[i]) continue;
        if (prev!=v.size() && i-prev>1){
            const double a=*v[prev], b=*v[i];
            const double span = static_cast<double>(i-prev);
            for (std::size_t k=prev+1;k<i;++k){
                v[k] = a + (b-a) * static_cast<double>(k-prev) / span;
                ++n;
            }
        }
        prev = i;
    }
    return n;
}

bool all_null(const Series& v){
    return std::none_of(v.begin(), v.end(), [](const OptDouble& x){ return x.has_value(); });
}

Series align_to_calendar(const std::vector<Date>& calendar,
                         const std::map<Date, double>& values){
    Series out(calendar.size());
    for (std::size_t i=0;i<calendar.size();++i){
        auto it = values.find(calendar[i]);
        if (it!=values.end()) out[i] = it->second;
    }
    if (all_null(out)) return out;
    fill_forward(out);
    interpolate_linear(out);
    fill_backward(out);
    return out;
}

} // namespace ind

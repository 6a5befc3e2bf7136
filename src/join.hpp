#pragma once

#include <string>
#include <sstream>

namespace util
{

    template <typename It>
    std::string join(const char* joint, It begin, const It& end) {
        std::stringstream ss;
        if (begin == end)
            return ss.str();
        ss << *begin;
        ++begin;
        for (; begin != end; ++begin)
            ss << joint << *begin;
        return ss.str();
    }

    template <typename Range>
    std::string join(const char* joint, const Range& range) {
        return join(joint, range.begin(), range.end());
    }

    template <typename Range>
    std::string join(const Range& range) {
        return join(", ", range.begin(), range.end());
    }

}

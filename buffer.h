#pragma once

#include <cstddef>
#include <vector>

namespace hidden {
    template <typename base_t>
    using buf_1d = std::vector<base_t>;
    template <typename base_t>
    using buf_2d = std::vector<buf_1d<base_t>>;
};

//! simple 2d array
//! one slot per footprint column
template <typename base_t>
class buffer2d {
private:
    hidden::buf_2d<base_t> _buf;

public:
    buffer2d() = default;
    buffer2d(size_t x, size_t y, const base_t &val = base_t())
        : _buf(x, hidden::buf_1d<base_t>(y, val))
    {}

    hidden::buf_1d<base_t> &operator[](size_t i) {
        return _buf[i];
    }
    const hidden::buf_1d<base_t> &operator[](size_t i) const {
        return _buf[i];
    }
};

#pragma once

#include <cstdint>

namespace transport {

// Issues MBAP transaction ids: post-increment, wrapping modulo 2^16.
// Not synchronized; the owner mutates it only while holding its exchange lock.
class TransactionCounter {
public:
    explicit TransactionCounter(std::uint16_t first = 0) noexcept : next_(first) {}

    std::uint16_t next() noexcept { return next_++; }
    std::uint16_t peek() const noexcept { return next_; }

private:
    std::uint16_t next_;
};

} // namespace transport

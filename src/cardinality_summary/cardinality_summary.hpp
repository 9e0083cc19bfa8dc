#pragma once

#include <cstdint>
#include <string_view>

#include "hash/element_hash.hpp"

class CardinalitySummary
{
public:
    virtual ~CardinalitySummary() = default;

    virtual void update(std::string_view item) = 0;

    // Number of distinct items seen so far
    virtual double estimate() const = 0;

    template <typename T> void update_element(const T &item) { update(element_to_bytes(item)); }

protected:
    CardinalitySummary() = default;
};

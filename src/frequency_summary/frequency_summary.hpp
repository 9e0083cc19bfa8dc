#pragma once

#include <cstdint>
#include <string_view>

#include "hash/element_hash.hpp"

class FrequencySummary
{
public:
    virtual ~FrequencySummary() = default;

    virtual void update(std::string_view item) = 0;

    virtual double estimate(std::string_view item) const = 0;

    template <typename T> void update_element(const T &item) { update(element_to_bytes(item)); }

    template <typename T> double estimate_element(const T &item) const { return estimate(element_to_bytes(item)); }

protected:
    FrequencySummary() = default;
};

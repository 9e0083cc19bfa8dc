#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "cardinality_summary.hpp"
#include "cardinality_summary_config.hpp"
#include "hash/element_hash.hpp"

class HyperLogLog : public CardinalitySummary {
  public:
    static constexpr uint32_t HASH_BITS = 64;
    static constexpr uint64_t MAX_REGISTERS = 1ULL << 32;

    // Bias correction thresholds from Flajolet et al. 2007
    static constexpr double SMALL_RANGE_FACTOR = 2.5;
    static constexpr double TWO_POW_32 = 4294967296.0;
    static constexpr double LARGE_RANGE_THRESHOLD = TWO_POW_32 / 30.0;

    explicit HyperLogLog(const HyperLogLogConfig &config, ElementHasher hasher = default_element_hasher()) : m_config(config), m_hasher(std::move(hasher)) {
        _initialize_from_config();
    }

    void update(std::string_view item) override {
        uint64_t hash_val = m_hasher(item);
        uint64_t index = hash_val & (m_num_registers - 1);
        uint8_t rank = _rank(hash_val >> m_address_bits);
        if (rank > m_registers[index]) m_registers[index] = rank;
    }

    double estimate() const override { return estimate(m_config.bias_correction); }

    double estimate(bool use_bias_correction) const {
        double sum = 0.0;
        for (uint8_t reg : m_registers) sum += std::ldexp(1.0, -static_cast<int>(reg));
        if (sum == 0.0) return 0.0;

        double m = static_cast<double>(m_num_registers);
        double raw_estimate = m_alpha * m * m * (1.0 / sum);
        if (!use_bias_correction) return raw_estimate;

        // Small range: linear counting while empty registers remain
        if (raw_estimate <= SMALL_RANGE_FACTOR * m) {
            uint64_t zeros = count_zero_registers();
            if (zeros > 0) return m * std::log(m / static_cast<double>(zeros));
            return raw_estimate;
        }

        if (raw_estimate <= LARGE_RANGE_THRESHOLD) return raw_estimate;

        // Large range: hash space saturation
        double ratio = raw_estimate / TWO_POW_32;
        if (ratio < 1.0) return -TWO_POW_32 * std::log(1.0 - ratio);
        return raw_estimate;
    }

    uint64_t count_zero_registers() const { return static_cast<uint64_t>(std::count(m_registers.begin(), m_registers.end(), static_cast<uint8_t>(0))); }

    uint64_t get_num_registers() const { return m_num_registers; }
    uint32_t get_address_bits() const { return m_address_bits; }
    double get_alpha() const { return m_alpha; }
    const std::vector<uint8_t> &get_registers() const { return m_registers; }

    // Largest possible rank for this register count
    uint8_t get_max_rank() const { return static_cast<uint8_t>(HASH_BITS - m_address_bits + 1); }

    uint64_t get_max_memory_usage() const { return m_num_registers * sizeof(uint8_t); }

    static double alpha_for(uint64_t num_registers) {
        double m = static_cast<double>(num_registers);
        if (num_registers >= 128) return 0.7213 / (1.0 + 1.079 / m);
        if (num_registers >= 64) return 0.709;
        if (num_registers >= 32) return 0.697;
        if (num_registers >= 16) return 0.673;
        return 0.7213 / (1.0 + 1.079 / m);
    }

    static uint64_t calculate_max_registers(uint64_t total_memory_bytes) {
        if (total_memory_bytes == 0) return 0;
        uint64_t registers = 1;
        while (registers * 2 <= total_memory_bytes / sizeof(uint8_t) && registers * 2 <= MAX_REGISTERS) registers *= 2;
        return registers;
    }

    // Standard error of HLL is about 1.04 / sqrt(m)
    static uint64_t calculate_registers_for_error(double relative_error) {
        if (!(relative_error > 0.0)) throw std::invalid_argument("HyperLogLog relative error must be positive.");
        uint64_t registers = 1;
        while (1.04 / std::sqrt(static_cast<double>(registers)) > relative_error) {
            if (registers >= MAX_REGISTERS) throw std::invalid_argument("HyperLogLog relative error is too small.");
            registers *= 2;
        }
        return registers;
    }

  private:
    void _initialize_from_config() {
        if (m_config.calculate_from == "REGISTERS") {
            m_num_registers = m_config.num_registers;
        } else if (m_config.calculate_from == "ERROR") {
            m_num_registers = calculate_registers_for_error(m_config.relative_error);
        } else {
            throw std::invalid_argument("Invalid 'calculate_from' value in HyperLogLogConfig.");
        }

        if (m_num_registers == 0) throw std::invalid_argument("HyperLogLog needs at least one register.");
        if ((m_num_registers & (m_num_registers - 1)) != 0) throw std::invalid_argument("HyperLogLog register count must be a power of two.");
        if (m_num_registers > MAX_REGISTERS) throw std::invalid_argument("HyperLogLog register count exceeds 2^32.");

        m_address_bits = 0;
        while ((1ULL << m_address_bits) < m_num_registers) ++m_address_bits;

        m_alpha = alpha_for(m_num_registers);
        m_registers.assign(m_num_registers, 0);
    }

    // Position of the first set bit of the (64 - p)-bit field w, counted from its top
    uint8_t _rank(uint64_t w) const {
        uint32_t width = HASH_BITS - m_address_bits;
        if (w == 0) return static_cast<uint8_t>(width + 1);
        return static_cast<uint8_t>(__builtin_clzll(w) - m_address_bits + 1);
    }

    HyperLogLogConfig m_config;
    ElementHasher m_hasher;
    uint64_t m_num_registers;
    uint32_t m_address_bits;
    double m_alpha;
    std::vector<uint8_t> m_registers;
};

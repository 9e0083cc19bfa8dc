#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "frequency_summary.hpp"
#include "frequency_summary_config.hpp"
#include "hash/element_hash.hpp"

// Spectral Bloom Filter (Cohen & Matias, SIGMOD 2003) with the Minimum Selection estimator.
// All k hash functions share one counting array of m buckets.
class SpectralBloomFilter : public FrequencySummary {
  public:
    explicit SpectralBloomFilter(const SpectralBloomConfig &config, SeededElementHasher hasher = default_seeded_element_hasher())
        : m_config(config), m_hasher(std::move(hasher)) {
        _initialize_from_config();
    }

    void update(std::string_view item) override {
        for (uint32_t i = 0; i < m_num_hashes; ++i) { m_counters[_bucket(item, i)]++; }
        m_inserted_count++;
    }

    // Uses the configured correction mode and the number of updates seen by this filter
    double estimate(std::string_view item) const override {
        if (m_config.apply_correction) return estimate(item, true, m_inserted_count);
        return estimate(item, false, std::nullopt);
    }

    double estimate(std::string_view item, bool apply_correction, std::optional<uint64_t> inserted_count) const {
        uint64_t min_count = std::numeric_limits<uint64_t>::max();
        for (uint32_t i = 0; i < m_num_hashes; ++i) { min_count = std::min(min_count, m_counters[_bucket(item, i)]); }
        if (!apply_correction) return static_cast<double>(min_count);

        if (!inserted_count) throw std::invalid_argument("Corrected SBF estimate requires the total number of inserted items.");
        double corrected = static_cast<double>(min_count) - expected_bias(*inserted_count);
        return std::max(0.0, corrected);
    }

    // Expected collision inflation of a counter after n insertions: (1 - e^(-kn/m))^k
    double expected_bias(uint64_t inserted_count) const {
        if (m_num_buckets == 0 || inserted_count == 0) return 0.0;
        double k = static_cast<double>(m_num_hashes);
        double fill = 1.0 - std::exp(-k * static_cast<double>(inserted_count) / static_cast<double>(m_num_buckets));
        return std::pow(fill, k);
    }

    uint32_t get_num_hashes() const { return m_num_hashes; }
    uint32_t get_num_buckets() const { return m_num_buckets; }
    uint64_t get_inserted_count() const { return m_inserted_count; }
    const std::vector<uint64_t> &get_counters() const { return m_counters; }

    uint64_t get_max_memory_usage() const { return static_cast<uint64_t>(m_num_buckets) * sizeof(uint64_t); }

    static uint32_t calculate_max_buckets(uint64_t total_memory_bytes) {
        uint64_t max_counters = total_memory_bytes / sizeof(uint64_t);
        return static_cast<uint32_t>(std::min<uint64_t>(max_counters, std::numeric_limits<uint32_t>::max()));
    }

  private:
    void _initialize_from_config() {
        if (m_config.calculate_from == "EPSILON_DELTA") {
            if (!(m_config.epsilon > 0.0f && m_config.epsilon < 1.0f)) throw std::invalid_argument("SBF epsilon must be in (0, 1).");
            if (!(m_config.delta > 0.0f && m_config.delta < 1.0f)) throw std::invalid_argument("SBF delta must be in (0, 1).");
            double width = std::ceil(M_E / m_config.epsilon);
            if (width > static_cast<double>(std::numeric_limits<uint32_t>::max())) throw std::invalid_argument("SBF epsilon is too small.");
            m_num_buckets = static_cast<uint32_t>(width);
            m_num_hashes = static_cast<uint32_t>(std::ceil(std::log(1.0 / m_config.delta)));
        } else if (m_config.calculate_from == "WIDTH_DEPTH") {
            m_num_buckets = m_config.num_buckets;
            m_num_hashes = m_config.num_hashes;
        } else {
            throw std::invalid_argument("Invalid 'calculate_from' value in SpectralBloomConfig.");
        }

        if (m_num_hashes == 0) throw std::invalid_argument("SBF needs at least one hash function.");
        if (m_num_buckets == 0) throw std::invalid_argument("SBF needs at least one bucket.");

        m_counters.assign(m_num_buckets, 0);
        m_inserted_count = 0;
    }

    uint64_t _bucket(std::string_view item, uint32_t hash_index) const { return m_hasher(item, hash_index) % m_num_buckets; }

    SpectralBloomConfig m_config;
    SeededElementHasher m_hasher;
    uint32_t m_num_hashes;
    uint32_t m_num_buckets;
    uint64_t m_inserted_count;
    std::vector<uint64_t> m_counters;
};

#include <doctest/doctest.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "frequency_summary/spectral_bloom_filter.hpp"

namespace {

SpectralBloomConfig shape(uint32_t num_hashes, uint32_t num_buckets, bool apply_correction = false) {
    return SpectralBloomConfig{num_hashes, num_buckets, 0.0f, 0.0f, apply_correction, "WIDTH_DEPTH"};
}

// Skewed stream over a few hundred IPs
std::vector<std::string> visitor_stream(int length, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::geometric_distribution<int> visitor(0.02);
    std::vector<std::string> stream;
    stream.reserve(length);
    for (int i = 0; i < length; ++i) stream.push_back("10.0.0." + std::to_string(visitor(rng)));
    return stream;
}

std::map<std::string, uint64_t> count(const std::vector<std::string> &stream) {
    std::map<std::string, uint64_t> freqs;
    for (const auto &item : stream) freqs[item]++;
    return freqs;
}

}   // namespace

TEST_CASE("fresh filter reports zero for any element") {
    SpectralBloomFilter sbf(shape(10, 1000));
    CHECK(sbf.estimate("192.168.1.1") == 0.0);
    CHECK(sbf.estimate("192.168.1.1", true, 0) == 0.0);
    CHECK(sbf.get_inserted_count() == 0);
}

TEST_CASE("one element inserted five times reads back exactly five") {
    // Probe i of any element lands in bucket 31 * i + length
    SpectralBloomFilter sbf(shape(3, 100), [](std::string_view item, uint32_t i) { return static_cast<uint64_t>(i) * 31 + item.size(); });
    for (int i = 0; i < 5; ++i) sbf.update("x");

    CHECK(sbf.estimate("x", false, std::nullopt) == 5.0);
    const auto &counters = sbf.get_counters();
    CHECK(counters[1] == 5);
    CHECK(counters[32] == 5);
    CHECK(counters[63] == 5);
    CHECK(std::accumulate(counters.begin(), counters.end(), 0ULL) == 15);
}

TEST_CASE("repeated element with the default hash family") {
    SpectralBloomFilter sbf(shape(3, 100));
    for (int i = 0; i < 5; ++i) sbf.update("192.168.1.1");
    CHECK(sbf.estimate("192.168.1.1") >= 5.0);
}

TEST_CASE("uncorrected estimate never undercounts") {
    auto stream = visitor_stream(20000, 11);
    auto truth = count(stream);

    // Few buckets so collisions are frequent
    SpectralBloomFilter sbf(shape(3, 64));
    for (const auto &item : stream) sbf.update(item);

    for (const auto &[item, freq] : truth) CHECK(sbf.estimate(item, false, std::nullopt) >= static_cast<double>(freq));
}

TEST_CASE("every insert adds k to the counter total") {
    SpectralBloomFilter sbf(shape(7, 50));
    auto stream = visitor_stream(1000, 3);
    for (const auto &item : stream) sbf.update(item);

    const auto &counters = sbf.get_counters();
    CHECK(std::accumulate(counters.begin(), counters.end(), 0ULL) == 7ULL * stream.size());
    CHECK(sbf.get_inserted_count() == stream.size());
}

TEST_CASE("counters never decrease") {
    SpectralBloomFilter sbf(shape(4, 200));
    std::vector<uint64_t> previous = sbf.get_counters();
    auto stream = visitor_stream(2000, 5);
    for (size_t i = 0; i < stream.size(); ++i) {
        sbf.update(stream[i]);
        if (i % 100 != 0) continue;
        const auto &current = sbf.get_counters();
        for (size_t j = 0; j < current.size(); ++j) CHECK(current[j] >= previous[j]);
        previous = current;
    }
}

TEST_CASE("insertion order does not change the counters") {
    auto stream = visitor_stream(5000, 17);
    auto shuffled = stream;
    std::mt19937_64 rng(99);
    std::shuffle(shuffled.begin(), shuffled.end(), rng);

    SpectralBloomFilter a(shape(5, 300));
    SpectralBloomFilter b(shape(5, 300));
    for (const auto &item : stream) a.update(item);
    for (const auto &item : shuffled) b.update(item);

    CHECK(a.get_counters() == b.get_counters());
}

TEST_CASE("expected bias matches the closed form") {
    SpectralBloomFilter sbf(shape(10, 10000));
    double expected = std::pow(1.0 - std::exp(-10.0 * 50000.0 / 10000.0), 10.0);
    CHECK(sbf.expected_bias(50000) == doctest::Approx(expected));
    CHECK(sbf.expected_bias(50000) == doctest::Approx(1.0));
    CHECK(sbf.expected_bias(0) == 0.0);

    SpectralBloomFilter small(shape(3, 1000));
    CHECK(small.expected_bias(100) == doctest::Approx(std::pow(1.0 - std::exp(-0.3), 3.0)));
}

TEST_CASE("corrected estimate subtracts the global bias and stays non-negative") {
    auto stream = visitor_stream(10000, 23);
    auto truth = count(stream);

    SpectralBloomFilter sbf(shape(10, 100));
    for (const auto &item : stream) sbf.update(item);
    uint64_t n = sbf.get_inserted_count();
    double bias = sbf.expected_bias(n);

    for (const auto &[item, freq] : truth) {
        double raw = sbf.estimate(item, false, std::nullopt);
        double corrected = sbf.estimate(item, true, n);
        CHECK(corrected >= 0.0);
        CHECK(corrected == doctest::Approx(std::max(0.0, raw - bias)));
    }

    // A lone small count is clamped at zero
    SpectralBloomFilter lone(shape(2, 2), [](std::string_view, uint32_t i) { return static_cast<uint64_t>(i); });
    lone.update("a");
    CHECK(lone.estimate("a", true, 1000000) == 0.0);
}

TEST_CASE("corrected query without the insertion count is rejected") {
    SpectralBloomFilter sbf(shape(3, 100));
    sbf.update("x");
    CHECK_THROWS_AS(sbf.estimate("x", true, std::nullopt), std::invalid_argument);
}

TEST_CASE("configured correction uses the filter's own insertion count") {
    SpectralBloomFilter sbf(shape(3, 50, true));
    auto stream = visitor_stream(500, 31);
    for (const auto &item : stream) sbf.update(item);

    CHECK(sbf.estimate("10.0.0.1") == sbf.estimate("10.0.0.1", true, sbf.get_inserted_count()));
}

TEST_CASE("integers and their decimal text are the same element") {
    SpectralBloomFilter sbf(shape(4, 500));
    sbf.update_element(8080);
    sbf.update("8080");
    CHECK(sbf.estimate_element(8080) >= 2.0);
    CHECK(sbf.estimate_element(8080) == sbf.estimate("8080"));
}

TEST_CASE("sizing from error bounds") {
    SpectralBloomFilter sbf(SpectralBloomConfig{0, 0, 0.01f, 0.01f, false, "EPSILON_DELTA"});
    CHECK(sbf.get_num_buckets() == 272);
    CHECK(sbf.get_num_hashes() == 5);
}

TEST_CASE("invalid configurations are rejected") {
    CHECK_THROWS_AS(SpectralBloomFilter(shape(0, 100)), std::invalid_argument);
    CHECK_THROWS_AS(SpectralBloomFilter(shape(3, 0)), std::invalid_argument);
    CHECK_THROWS_AS(SpectralBloomFilter(SpectralBloomConfig{3, 100, 0.0f, 0.1f, false, "EPSILON_DELTA"}), std::invalid_argument);
    CHECK_THROWS_AS(SpectralBloomFilter(SpectralBloomConfig{3, 100, 0.1f, 1.0f, false, "EPSILON_DELTA"}), std::invalid_argument);
    CHECK_THROWS_AS(SpectralBloomFilter(SpectralBloomConfig{3, 100, 0.1f, 0.1f, false, "BOGUS"}), std::invalid_argument);
    // e / 5e-10 buckets does not fit the 32-bit width
    CHECK_THROWS_AS(SpectralBloomFilter(SpectralBloomConfig{0, 0, 5e-10f, 0.01f, false, "EPSILON_DELTA"}), std::invalid_argument);
    CHECK_THROWS_AS(SpectralBloomFilter(SpectralBloomConfig{0, 0, 1e-10f, 0.01f, false, "EPSILON_DELTA"}), std::invalid_argument);
}

TEST_CASE("memory footprint and budget") {
    SpectralBloomFilter sbf(shape(3, 1000));
    CHECK(sbf.get_max_memory_usage() == 8000);
    CHECK(SpectralBloomFilter::calculate_max_buckets(800) == 100);
    CHECK(SpectralBloomFilter::calculate_max_buckets(7) == 0);
}

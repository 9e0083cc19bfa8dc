#pragma once

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

// Sketch Headers
#include "cardinality_summary/hyperloglog.hpp"
#include "frequency_summary/spectral_bloom_filter.hpp"

// Timer class to measure execution time
class Timer {
  public:
    void start() { m_start = std::chrono::high_resolution_clock::now(); }
    double stop_s() const {
        auto end = std::chrono::high_resolution_clock::now();
        return std::chrono::duration<double>(end - m_start).count();
    }

  private:
    std::chrono::time_point<std::chrono::high_resolution_clock> m_start;
};

// Data generation functions
std::vector<std::string> generate_visitor_data(uint64_t size, uint64_t seed);
std::vector<std::string> generate_zipf_data(uint64_t size, uint64_t diversity, double a, uint64_t seed);

// Dataset files hold one element per line
std::vector<std::string> read_dataset(const std::string &path, uint64_t max_items);
bool write_dataset(const std::string &path, const std::vector<std::string> &data);

// Frequency analysis functions
std::map<std::string, uint64_t> get_true_freqs(const std::vector<std::string> &data);
std::vector<std::string> get_top_k_items(const std::map<std::string, uint64_t> &freqs, int k);
double average_frequency(const std::map<std::string, uint64_t> &freqs);

double throughput_mops(uint64_t items, double duration_s);

// Accuracy calculation functions
template <typename SketchType> double calculate_are_all_items(const SketchType &sketch, const std::map<std::string, uint64_t> &true_freqs) {
    if (true_freqs.empty()) return 0.0;
    double total_rel_error = 0.0;
    for (const auto &[item, true_freq] : true_freqs) {
        double est_freq = sketch.estimate(item);
        if (true_freq > 0) { total_rel_error += std::abs(est_freq - true_freq) / true_freq; }
    }
    return total_rel_error / true_freqs.size();
}

template <typename SketchType> double calculate_aae_all_items(const SketchType &sketch, const std::map<std::string, uint64_t> &true_freqs) {
    if (true_freqs.empty()) return 0.0;
    double total_abs_error = 0.0;
    for (const auto &[item, true_freq] : true_freqs) {
        double est_freq = sketch.estimate(item);
        total_abs_error += std::abs(est_freq - true_freq);
    }
    return total_abs_error / true_freqs.size();
}

// Mean of the sketch estimates over every distinct item
template <typename SketchType> double average_estimated_frequency(const SketchType &sketch, const std::map<std::string, uint64_t> &true_freqs) {
    if (true_freqs.empty()) return 0.0;
    double total = 0.0;
    for (const auto &[item, true_freq] : true_freqs) { total += sketch.estimate(item); }
    return total / true_freqs.size();
}

// Prints true frequency next to the uncorrected and corrected SBF estimates
void print_frequency_comparison(const std::string &title, const std::vector<std::string> &items, const std::map<std::string, uint64_t> &true_freqs,
                                const SpectralBloomFilter &sbf);

void print_cardinality_comparison(const std::string &title, const HyperLogLog &hll, uint64_t true_distinct);

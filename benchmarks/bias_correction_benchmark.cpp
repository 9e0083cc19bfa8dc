/**
 * HyperLogLog Bias Correction Benchmark
 * Measures the mean relative error of the raw and the corrected HLL estimate over a range of cardinalities.
 * The small-range regime (linear counting) should dominate the raw estimate up to about 2.5 * m distinct items.
 * Test:  ./build/bin/bias_correction_benchmark --registers 1024 --max-cardinality 1000000 --trials 20
 */

#include "cardinality_summary/hyperloglog.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <sys/stat.h>
#include <vector>

using json = nlohmann::json;

struct CardinalityErrorResult
{
    uint64_t cardinality;
    double mean_raw_error;
    double mean_corrected_error;
};

CardinalityErrorResult measure_cardinality_error(uint64_t num_registers, uint64_t cardinality, uint32_t num_trials, std::mt19937_64 &rng)
{
    std::uniform_int_distribution<uint64_t> dist;
    double total_raw = 0.0;
    double total_corrected = 0.0;

    for (uint32_t trial = 0; trial < num_trials; ++trial)
    {
        HyperLogLog hll(HyperLogLogConfig{num_registers, 0.0f, true, "REGISTERS"});
        uint64_t offset = dist(rng);
        for (uint64_t i = 0; i < cardinality; ++i) hll.update_element(offset + i);

        double truth = static_cast<double>(cardinality);
        total_raw += std::abs(hll.estimate(false) - truth) / truth;
        total_corrected += std::abs(hll.estimate(true) - truth) / truth;
    }
    return {cardinality, total_raw / num_trials, total_corrected / num_trials};
}

int main(int argc, char *argv[])
{
    std::cout << "HyperLogLog Bias Correction Benchmark\n" << std::string(80, '=') << std::endl;

    uint64_t num_registers = 1024;
    uint64_t max_cardinality = 1000000;
    uint32_t num_trials = 10;
    uint64_t seed = 42;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--registers" && i + 1 < argc) { num_registers = std::stoull(argv[++i]); }
        else if (arg == "--max-cardinality" && i + 1 < argc) { max_cardinality = std::stoull(argv[++i]); }
        else if (arg == "--trials" && i + 1 < argc) { num_trials = std::stoul(argv[++i]); }
        else if (arg == "--seed" && i + 1 < argc) { seed = std::stoull(argv[++i]); }
        else if (arg == "--help")
        {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --registers N        Number of HLL registers, power of two (default: 1024)\n"
                      << "  --max-cardinality N  Largest number of distinct items (default: 1000000)\n"
                      << "  --trials N           Number of trials per cardinality (default: 10)\n"
                      << "  --seed N             RNG seed (default: 42)\n";
            return 0;
        }
    }
    if (num_trials == 0)
    {
        std::cerr << "Error: --trials must be positive" << std::endl;
        return 1;
    }

    std::cout << "Config: registers=" << num_registers << ", max_cardinality=" << max_cardinality << ", trials=" << num_trials << ", 2.5m=" << 2.5 * num_registers << "\n"
              << std::endl;

    std::mt19937_64 rng(seed);
    std::vector<CardinalityErrorResult> results;

    try
    {
        // 1, 2, 5 steps per decade
        for (uint64_t decade = 10; decade <= max_cardinality; decade *= 10)
        {
            for (uint64_t step : {1ULL, 2ULL, 5ULL})
            {
                uint64_t cardinality = decade * step;
                if (cardinality > max_cardinality) break;
                results.push_back(measure_cardinality_error(num_registers, cardinality, num_trials, rng));
            }
        }
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << std::setw(14) << "Cardinality" << std::setw(16) << "Raw Err (%)" << std::setw(18) << "Corrected (%)" << std::endl;
    for (const auto &r : results)
    {
        std::cout << std::setw(14) << r.cardinality << std::fixed << std::setprecision(3) << std::setw(16) << r.mean_raw_error * 100.0 << std::setw(18)
                  << r.mean_corrected_error * 100.0 << std::endl;
    }

    json output;
    output["config"] = {{"num_registers", num_registers}, {"max_cardinality", max_cardinality}, {"num_trials", num_trials}, {"seed", seed}};
    output["results"] = json::array();
    for (const auto &r : results)
    {
        output["results"].push_back(json{{"cardinality", r.cardinality}, {"mean_raw_error", r.mean_raw_error}, {"mean_corrected_error", r.mean_corrected_error}});
    }

    if (mkdir("output", 0755) != 0 && errno != EEXIST) { std::cerr << "Warning: Cannot create directory: output" << std::endl; }
    std::ofstream out("output/bias_correction_results.json");
    if (!out)
    {
        std::cerr << "Error: Cannot open output file: output/bias_correction_results.json" << std::endl;
        return 1;
    }
    out << output.dump(2);
    std::cout << "\nSaved: output/bias_correction_results.json" << std::endl;

    return 0;
}

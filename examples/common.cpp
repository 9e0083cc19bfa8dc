#include "common.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>

#include "report/results_sink.hpp"

// Web-visitor style IP stream:
//  20% of the stream from frequent visitors (10-50 visits each)
//  30% from occasional visitors (3-9 visits each)
//  the rest from rare visitors (1-2 visits each)
std::vector<std::string> generate_visitor_data(uint64_t size, uint64_t seed)
{
    std::mt19937_64 rng(seed == 0 ? std::random_device{}() : seed);
    std::vector<std::string> data;
    data.reserve(size + 64);

    uint64_t num_frequent = size / 5;
    std::uniform_int_distribution<int> frequent_visits(10, 50);
    for (uint64_t i = 0; i < num_frequent / 30; ++i)
    {
        std::string ip = "192.168.1." + std::to_string(i);
        data.insert(data.end(), frequent_visits(rng), ip);
    }

    uint64_t num_occasional = size * 3 / 10;
    std::uniform_int_distribution<int> occasional_visits(3, 9);
    for (uint64_t i = 0; i < num_occasional / 6; ++i)
    {
        std::string ip = "10.0." + std::to_string(i / 256) + "." + std::to_string(i % 256);
        data.insert(data.end(), occasional_visits(rng), ip);
    }

    uint64_t num_rare = size > data.size() ? size - data.size() : 0;
    std::uniform_int_distribution<int> rare_visits(1, 2);
    for (uint64_t i = 0; i < num_rare; ++i)
    {
        std::string ip = "172.16." + std::to_string(i / 256) + "." + std::to_string(i % 256);
        data.insert(data.end(), rare_visits(rng), ip);
    }

    if (data.size() > size) data.resize(size);
    std::shuffle(data.begin(), data.end(), rng);
    return data;
}

std::vector<std::string> generate_zipf_data(uint64_t size, uint64_t diversity, double a, uint64_t seed)
{
    std::vector<double> pdf(diversity);
    double sum = 0.0;
    for (uint64_t i = 1; i <= diversity; ++i)
    {
        pdf[i - 1] = 1.0 / std::pow(static_cast<double>(i), a);
        sum += pdf[i - 1];
    }
    for (uint64_t i = 0; i < diversity; ++i) { pdf[i] /= sum; }
    std::discrete_distribution<uint64_t> dist(pdf.begin(), pdf.end());
    std::mt19937_64 rng(seed == 0 ? std::random_device{}() : seed);
    std::vector<std::string> data;
    data.reserve(size);
    for (uint64_t i = 0; i < size; ++i) { data.push_back("item_" + std::to_string(dist(rng))); }
    return data;
}

std::vector<std::string> read_dataset(const std::string &path, uint64_t max_items)
{
    std::vector<std::string> data;
    std::ifstream file(path);
    if (!file.is_open())
    {
        std::cerr << "Error: Cannot open dataset file: " << path << std::endl;
        return data;
    }

    std::string line;
    while (data.size() < max_items && std::getline(file, line))
    {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        data.push_back(line);
    }
    std::cout << "Read " << data.size() << " items from " << path << std::endl;
    return data;
}

bool write_dataset(const std::string &path, const std::vector<std::string> &data)
{
    ResultsSink::create_parent_directories(path);
    std::ofstream out(path);
    if (!out.is_open())
    {
        std::cerr << "Error: Cannot open output file: " << path << std::endl;
        return false;
    }
    for (const auto &item : data) { out << item << '\n'; }
    return static_cast<bool>(out);
}

std::map<std::string, uint64_t> get_true_freqs(const std::vector<std::string> &data)
{
    std::map<std::string, uint64_t> freqs;
    for (const auto &item : data) { freqs[item]++; }
    return freqs;
}

std::vector<std::string> get_top_k_items(const std::map<std::string, uint64_t> &freqs, int k)
{
    std::vector<std::pair<std::string, uint64_t>> sorted_freqs(freqs.begin(), freqs.end());
    std::sort(
        sorted_freqs.begin(), sorted_freqs.end(),
        [](const auto &a, const auto &b)
        {
            return a.second > b.second;
        });
    std::vector<std::string> top_items;
    top_items.reserve(std::min(static_cast<size_t>(k), sorted_freqs.size()));
    for (int i = 0; i < k && i < static_cast<int>(sorted_freqs.size()); ++i) { top_items.push_back(sorted_freqs[i].first); }
    return top_items;
}

double average_frequency(const std::map<std::string, uint64_t> &freqs)
{
    if (freqs.empty()) return 0.0;
    double total = 0.0;
    for (const auto &[item, freq] : freqs) { total += static_cast<double>(freq); }
    return total / freqs.size();
}

double throughput_mops(uint64_t items, double duration_s) { return (duration_s > 0) ? (static_cast<double>(items) / duration_s / 1e6) : 0.0; }

void print_frequency_comparison(const std::string &title, const std::vector<std::string> &items, const std::map<std::string, uint64_t> &true_freqs,
                                const SpectralBloomFilter &sbf)
{
    std::cout << "\n--- " << title << " ---\n\n";
    std::cout << "+------+--------------------+--------------+------------+------------+" << std::endl;
    std::cout << "| Rank | Item               | True Freq    | SBF        | SBF (corr) |" << std::endl;
    std::cout << "+------+--------------------+--------------+------------+------------+" << std::endl;

    for (size_t i = 0; i < items.size(); ++i)
    {
        const std::string &item = items[i];
        auto it = true_freqs.find(item);
        uint64_t true_freq = (it != true_freqs.end()) ? it->second : 0;

        double raw = sbf.estimate(item, false, std::nullopt);
        double corrected = sbf.estimate(item, true, sbf.get_inserted_count());
        std::cout << "| " << std::right << std::setw(4) << (i + 1) << " | " << std::left << std::setw(18) << item.substr(0, 18) << " | " << std::right << std::setw(12) << true_freq
                  << " | " << std::fixed << std::setprecision(0) << std::setw(10) << raw << " | " << std::setprecision(2) << std::setw(10) << corrected << " |" << std::endl;
    }
    std::cout << "+------+--------------------+--------------+------------+------------+" << std::endl;
}

void print_cardinality_comparison(const std::string &title, const HyperLogLog &hll, uint64_t true_distinct)
{
    double raw = hll.estimate(false);
    double corrected = hll.estimate(true);

    std::cout << "\n--- " << title << " ---\n\n";
    std::cout << "+----------------------+------------------+------------+" << std::endl;
    std::cout << "| Estimator            |         Estimate |  Rel. Err. |" << std::endl;
    std::cout << "+----------------------+------------------+------------+" << std::endl;
    std::cout << "| " << std::left << std::setw(20) << "Exact" << " | " << std::right << std::setw(16) << true_distinct << " | " << std::setw(10) << "-" << " |" << std::endl;
    std::cout << "| " << std::left << std::setw(20) << "HLL (raw)" << " | " << std::right << std::fixed << std::setprecision(2) << std::setw(16) << raw << " | " << std::setw(9)
              << relative_error(raw, static_cast<double>(true_distinct)) * 100.0 << "% |" << std::endl;
    std::cout << "| " << std::left << std::setw(20) << "HLL (corrected)" << " | " << std::right << std::fixed << std::setprecision(2) << std::setw(16) << corrected << " | "
              << std::setw(9) << relative_error(corrected, static_cast<double>(true_distinct)) * 100.0 << "% |" << std::endl;
    std::cout << "+----------------------+------------------+------------+" << std::endl;
}

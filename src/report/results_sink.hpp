#pragma once

#include <cerrno>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct ResultRow
{
    std::string estimator;
    std::string dataset;
    std::string config;
    uint32_t repetition = 0;
    double estimate = 0.0;
    double truth = 0.0;
    double relative_error = 0.0;
    double throughput_mops = 0.0;
    uint64_t memory_bytes = 0;
};

// |estimate - truth| / truth, 0 when the truth is 0 and the estimate agrees
inline double relative_error(double estimate, double truth)
{
    if (truth == 0.0) return estimate == 0.0 ? 0.0 : std::abs(estimate);
    return std::abs(estimate - truth) / truth;
}

// Collects (configuration, estimate, truth, error) rows and exports them as CSV and JSON
class ResultsSink
{
public:
    void add(ResultRow row) { m_rows.push_back(std::move(row)); }

    void add(const std::string &estimator, const std::string &dataset, const std::string &config, double estimate, double truth)
    {
        ResultRow row;
        row.estimator = estimator;
        row.dataset = dataset;
        row.config = config;
        row.estimate = estimate;
        row.truth = truth;
        row.relative_error = relative_error(estimate, truth);
        m_rows.push_back(std::move(row));
    }

    const std::vector<ResultRow> &rows() const { return m_rows; }
    bool empty() const { return m_rows.empty(); }

    json to_json() const
    {
        json rows = json::array();
        for (const auto &r : m_rows)
        {
            rows.push_back(json{{"estimator", r.estimator},
                            {"dataset", r.dataset},
                            {"config", r.config},
                            {"repetition", r.repetition},
                            {"estimate", r.estimate},
                            {"truth", r.truth},
                            {"relative_error", r.relative_error},
                            {"throughput_mops", r.throughput_mops},
                            {"memory_bytes", r.memory_bytes}});
        }
        return rows;
    }

    bool write_json(const std::string &filename, const json &config = json::object()) const
    {
        create_parent_directories(filename);

        json j;
        j["metadata"] = {{"timestamp", utc_timestamp()}, {"num_results", m_rows.size()}};
        j["config"] = config;
        j["results"] = to_json();

        std::ofstream out(filename);
        if (!out.is_open())
        {
            std::cerr << "Error: Cannot open output file: " << filename << std::endl;
            return false;
        }
        out << j.dump(2);
        return static_cast<bool>(out);
    }

    bool write_csv(const std::string &filename) const
    {
        create_parent_directories(filename);

        std::ofstream out(filename);
        if (!out.is_open())
        {
            std::cerr << "Error: Cannot open output file: " << filename << std::endl;
            return false;
        }
        out << "estimator,dataset,config,repetition,estimate,truth,relative_error,throughput_mops,memory_bytes\n";
        out << std::setprecision(10);
        for (const auto &r : m_rows)
        {
            out << csv_field(r.estimator) << ',' << csv_field(r.dataset) << ',' << csv_field(r.config) << ',' << r.repetition << ',' << r.estimate << ',' << r.truth << ','
                << r.relative_error << ',' << r.throughput_mops << ',' << r.memory_bytes << '\n';
        }
        return static_cast<bool>(out);
    }

    // Quotes a field when it contains a separator, a quote or a line break
    static std::string csv_field(const std::string &value)
    {
        if (value.find_first_of(",\"\n\r") == std::string::npos) return value;
        std::string quoted = "\"";
        for (char c : value)
        {
            if (c == '"') quoted += '"';
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

    static void create_parent_directories(const std::string &path)
    {
        size_t pos = path.find('/', 1);
        while (pos != std::string::npos)
        {
            std::string dir = path.substr(0, pos);
            if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) { std::cerr << "Warning: Cannot create directory: " << dir << std::endl; }
            pos = path.find('/', pos + 1);
        }
    }

    static std::string utc_timestamp()
    {
        auto now_time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm_now;
        gmtime_r(&now_time_t, &tm_now);
        std::ostringstream timestamp;
        timestamp << std::put_time(&tm_now, "%Y-%m-%dT%H:%M:%SZ");
        return timestamp.str();
    }

private:
    std::vector<ResultRow> m_rows;
};

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <random>
#include <sstream>
#include <string>
#include <vector>

// Library
#include "yaml-cpp/yaml.h"

// Sketch Headers
#include "cardinality_summary/hyperloglog.hpp"
#include "frequency_summary/spectral_bloom_filter.hpp"

#include "report/results_sink.hpp"

// Common utilities
#include "common.hpp"

using namespace std;

// Dataset configuration
struct DatasetConfig {
    string name;
    string dataset_type;
    string path;
    uint64_t stream_size;
    uint64_t stream_diversity = 0;
    double zipf_param = 0.0;
};

struct SbfShape {
    uint32_t num_hashes;
    uint32_t num_buckets;
};

struct ExperimentConfig {
    string name;
    uint32_t repetitions;
    string output_file;
    uint64_t master_seed;

    map<string, DatasetConfig> datasets;

    vector<uint64_t> hll_registers;
    vector<bool> hll_bias_correction;

    vector<SbfShape> sbf_shapes;
    vector<bool> sbf_apply_correction;
};

ExperimentConfig parse_yaml(const string &yaml_file) {
    YAML::Node root = YAML::LoadFile(yaml_file);
    ExperimentConfig config;

    // Parse metadata
    auto metadata = root["metadata"];
    config.name = metadata["name"].as<string>();
    config.repetitions = metadata["repetitions"].as<uint32_t>();
    config.output_file = metadata["output_file"].as<string>();

    // Parse datasets
    auto datasets_node = root["datasets"];
    for (auto it = datasets_node.begin(); it != datasets_node.end(); ++it) {
        string dataset_name = it->first.as<string>();
        auto ds = it->second;

        DatasetConfig dataset;
        dataset.name = dataset_name;
        dataset.dataset_type = ds["dataset_type"].as<string>();
        dataset.stream_size = ds["stream_size"].as<uint64_t>();

        if (dataset.dataset_type == "file") {
            dataset.path = ds["path"].as<string>();
        } else if (dataset.dataset_type == "zipf") {
            dataset.stream_diversity = ds["stream_diversity"].as<uint64_t>();
            dataset.zipf_param = ds["zipf_param"].as<double>();
        } else if (dataset.dataset_type != "visitor") {
            throw invalid_argument("Unknown dataset type '" + dataset.dataset_type + "' for dataset " + dataset_name);
        }

        config.datasets[dataset_name] = dataset;
    }

    // Parse estimator grids
    auto hll_node = root["hyperloglog"];
    for (const auto &m : hll_node["num_registers"]) { config.hll_registers.push_back(m.as<uint64_t>()); }
    if (hll_node["bias_correction"]) {
        for (const auto &b : hll_node["bias_correction"]) { config.hll_bias_correction.push_back(b.as<bool>()); }
    } else {
        config.hll_bias_correction = {true};
    }

    auto sbf_node = root["spectral_bloom"];
    for (const auto &shape : sbf_node["configs"]) { config.sbf_shapes.push_back({shape["num_hashes"].as<uint32_t>(), shape["num_buckets"].as<uint32_t>()}); }
    if (sbf_node["apply_correction"]) {
        for (const auto &b : sbf_node["apply_correction"]) { config.sbf_apply_correction.push_back(b.as<bool>()); }
    } else {
        config.sbf_apply_correction = {false};
    }

    // Parse other options
    config.master_seed = 0;
    if (auto other_options = root["other_options"]) {
        if (other_options["master_seed"]) config.master_seed = other_options["master_seed"].as<uint64_t>();
    }

    return config;
}

vector<string> load_or_generate_dataset(const DatasetConfig &dataset, uint64_t seed) {
    vector<string> data;

    if (dataset.dataset_type == "zipf") {
        data = generate_zipf_data(dataset.stream_size, dataset.stream_diversity, dataset.zipf_param, seed);
    } else if (dataset.dataset_type == "visitor") {
        data = generate_visitor_data(dataset.stream_size, seed);
    } else if (dataset.dataset_type == "file") {
        data = read_dataset(dataset.path, dataset.stream_size);
        if (data.size() < dataset.stream_size) { cerr << "Warning: Dataset file has fewer items than requested. Using full dataset." << endl; }
    }

    return data;
}

void run_hyperloglog(const ExperimentConfig &config, const DatasetConfig &dataset, const vector<string> &data, uint64_t true_distinct, uint32_t rep, ResultsSink &sink) {
    for (uint64_t num_registers : config.hll_registers) {
        HyperLogLogConfig hll_conf{num_registers, 0.0f, true, "REGISTERS"};
        HyperLogLog hll(hll_conf);

        Timer timer;
        timer.start();
        for (const auto &item : data) hll.update(item);
        double duration = timer.stop_s();

        for (bool bias_correction : config.hll_bias_correction) {
            ResultRow row;
            row.estimator = bias_correction ? "hll_corrected" : "hll_raw";
            row.dataset = dataset.name;
            row.config = "m=" + to_string(num_registers);
            row.repetition = rep;
            row.estimate = hll.estimate(bias_correction);
            row.truth = static_cast<double>(true_distinct);
            row.relative_error = relative_error(row.estimate, row.truth);
            row.throughput_mops = throughput_mops(data.size(), duration);
            row.memory_bytes = hll.get_max_memory_usage();

            cout << "  " << left << setw(14) << row.estimator << setw(20) << row.config << " estimate=" << fixed << setprecision(2) << row.estimate << " truth=" << true_distinct
                 << " error=" << row.relative_error * 100.0 << "%" << endl;
            sink.add(row);
        }
    }
}

void run_spectral_bloom(const ExperimentConfig &config, const DatasetConfig &dataset, const vector<string> &data, const map<string, uint64_t> &true_freqs, uint32_t rep,
                        ResultsSink &sink) {
    double real_avg = average_frequency(true_freqs);

    for (const auto &shape : config.sbf_shapes) {
        for (bool apply_correction : config.sbf_apply_correction) {
            SpectralBloomConfig sbf_conf{shape.num_hashes, shape.num_buckets, 0.0f, 0.0f, apply_correction, "WIDTH_DEPTH"};
            SpectralBloomFilter sbf(sbf_conf);

            Timer timer;
            timer.start();
            for (const auto &item : data) sbf.update(item);
            double duration = timer.stop_s();

            ResultRow row;
            row.estimator = apply_correction ? "sbf_corrected" : "sbf";
            row.dataset = dataset.name;
            row.config = "k=" + to_string(shape.num_hashes) + ";m=" + to_string(shape.num_buckets);
            row.repetition = rep;
            row.estimate = average_estimated_frequency(sbf, true_freqs);
            row.truth = real_avg;
            row.relative_error = relative_error(row.estimate, row.truth);
            row.throughput_mops = throughput_mops(data.size(), duration);
            row.memory_bytes = sbf.get_max_memory_usage();

            double are = calculate_are_all_items(sbf, true_freqs);
            cout << "  " << left << setw(14) << row.estimator << setw(20) << row.config << " avg=" << fixed << setprecision(4) << row.estimate << " real_avg=" << real_avg
                 << " error=" << setprecision(2) << row.relative_error * 100.0 << "% are=" << are * 100.0 << "%" << endl;
            sink.add(row);
        }
    }
}

json config_to_json(const ExperimentConfig &config) {
    json j;
    j["experiment"] = {{"name", config.name}, {"repetitions", config.repetitions}, {"master_seed", config.master_seed}};

    json datasets_json;
    for (const auto &[name, ds] : config.datasets) {
        datasets_json[name] = {{"dataset_type", ds.dataset_type}, {"stream_size", ds.stream_size}};
        if (ds.dataset_type == "zipf") {
            datasets_json[name]["stream_diversity"] = ds.stream_diversity;
            datasets_json[name]["zipf_param"] = ds.zipf_param;
        } else if (ds.dataset_type == "file") {
            datasets_json[name]["path"] = ds.path;
        }
    }
    j["datasets"] = datasets_json;

    j["hyperloglog"] = {{"num_registers", config.hll_registers}, {"bias_correction", config.hll_bias_correction}};

    json shapes = json::array();
    for (const auto &shape : config.sbf_shapes) { shapes.push_back(json{{"num_hashes", shape.num_hashes}, {"num_buckets", shape.num_buckets}}); }
    j["spectral_bloom"] = {{"configs", shapes}, {"apply_correction", config.sbf_apply_correction}};
    return j;
}

// Inserts a local timestamp before the file extension
string timestamped(const string &filename) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream timestamp_stream;
    timestamp_stream << std::put_time(&tm_now, "%Y%m%d_%H%M%S");
    string timestamp = timestamp_stream.str();

    size_t ext_pos = filename.find_last_of('.');
    if (ext_pos != string::npos && filename.find('/', ext_pos) == string::npos) return filename.substr(0, ext_pos) + "_" + timestamp + filename.substr(ext_pos);
    return filename + "_" + timestamp;
}

int run_experiment(const ExperimentConfig &config) {
    cout << "\n=== Experiment: " << config.name << " ===" << endl;
    cout << "Repetitions: " << config.repetitions << endl;
    cout << "Master Seed: " << config.master_seed << endl;

    ResultsSink sink;

    for (uint32_t rep = 0; rep < config.repetitions; ++rep) {
        cout << "\n========================================" << endl;
        cout << "Repetition " << (rep + 1) << "/" << config.repetitions << endl;
        cout << "========================================" << endl;

        std::mt19937_64 rng(config.master_seed + rep);
        std::uniform_int_distribution<uint64_t> dist(1);

        for (const auto &[name, ds_config] : config.datasets) {
            uint64_t dataset_seed = config.master_seed == 0 ? 0 : dist(rng);
            vector<string> data = load_or_generate_dataset(ds_config, dataset_seed);
            if (data.empty()) {
                cerr << "Warning: Dataset '" << name << "' is empty, skipping." << endl;
                continue;
            }
            auto true_freqs = get_true_freqs(data);
            cout << "\nDataset '" << name << "': " << data.size() << " items, " << true_freqs.size() << " distinct" << endl;

            run_hyperloglog(config, ds_config, data, true_freqs.size(), rep, sink);
            run_spectral_bloom(config, ds_config, data, true_freqs, rep, sink);
        }
    }

    string json_file = timestamped(config.output_file);
    string csv_file = json_file;
    size_t ext_pos = csv_file.find_last_of('.');
    csv_file = (ext_pos != string::npos ? csv_file.substr(0, ext_pos) : csv_file) + ".csv";

    if (!sink.write_json(json_file, config_to_json(config)) || !sink.write_csv(csv_file)) return 1;
    cout << "\nResults exported to: " << json_file << " and " << csv_file << endl;
    return 0;
}

int main(int argc, char **argv) {
    if (argc < 2) {
        cerr << "Usage: " << argv[0] << " <yaml_file>" << endl;
        return 1;
    }

    string yaml_file = argv[1];

    try {
        ExperimentConfig config = parse_yaml(yaml_file);
        return run_experiment(config);

    } catch (const YAML::Exception &e) {
        cerr << "YAML parsing error: " << e.what() << endl;
        return 1;
    } catch (const exception &e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }
}

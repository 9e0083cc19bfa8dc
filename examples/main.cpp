#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

// Utils
#include "utils/ConfigParser.hpp"

// Sketch Headers
#include "cardinality_summary/hyperloglog.hpp"
#include "frequency_summary/spectral_bloom_filter.hpp"

// Config Headers
#include "cardinality_summary/cardinality_summary_config.hpp"
#include "frequency_summary/frequency_summary_config.hpp"

#include "report/results_sink.hpp"

#include "common.hpp"

using namespace std;

// App Config
struct AppConfig {
    string dataset_type = "visitor";
    string dataset_path;
    uint64_t stream_size = 1000000;
    uint64_t stream_diversity = 100000;
    double zipf_param = 1.1;
    uint64_t seed = 0;
    string output_prefix = "output/comparison";

    static void add_params_to_config_parser(AppConfig &config, ConfigParser &parser) {
        parser.AddParameter(new StringParameter("app.dataset_type", "visitor", &config.dataset_type, false, "Dataset: visitor, zipf or file"));
        parser.AddParameter(new StringParameter("app.dataset_path", "", &config.dataset_path, false, "Path of a dataset file (one element per line)"));
        parser.AddParameter(new UnsignedInt64Parameter("app.stream_size", "1000000", &config.stream_size, false, "Total items in stream"));
        parser.AddParameter(new UnsignedInt64Parameter("app.stream_diversity", "100000", &config.stream_diversity, false, "Unique items in zipf stream"));
        parser.AddParameter(new DoubleParameter("app.zipf", "1.1", &config.zipf_param, false, "Zipfian param 'a'"));
        parser.AddParameter(new UnsignedInt64Parameter("app.seed", "0", &config.seed, false, "Dataset seed (0 picks a random seed)"));
        parser.AddParameter(new StringParameter("app.output_prefix", "output/comparison", &config.output_prefix, false, "Prefix of the CSV and JSON result files"));
    }
    friend std::ostream &operator<<(std::ostream &os, const AppConfig &config) {
        ConfigPrinter<AppConfig>::print(os, config);
        return os;
    }
    auto to_tuple() const {
        return std::make_tuple("dataset_type", dataset_type, "dataset_path", dataset_path, "stream_size", stream_size, "stream_diversity", stream_diversity, "zipf_param", zipf_param,
                               "seed", seed, "output_prefix", output_prefix);
    }
};

vector<string> load_dataset(const AppConfig &conf) {
    if (conf.dataset_type == "file") return read_dataset(conf.dataset_path, conf.stream_size);
    if (conf.dataset_type == "zipf") return generate_zipf_data(conf.stream_size, conf.stream_diversity, conf.zipf_param, conf.seed);
    if (conf.dataset_type == "visitor") return generate_visitor_data(conf.stream_size, conf.seed);
    cerr << "Error: Unknown dataset type: " << conf.dataset_type << endl;
    return {};
}

string describe(const HyperLogLog &hll) { return "m=" + to_string(hll.get_num_registers()); }

string describe(const SpectralBloomFilter &sbf) { return "k=" + to_string(sbf.get_num_hashes()) + ";m=" + to_string(sbf.get_num_buckets()); }

int run_comparison(const AppConfig &conf, const HyperLogLogConfig &hll_conf, const SpectralBloomConfig &sbf_conf) {
    Timer timer;

    cout << "Loading data..." << endl;
    auto data = load_dataset(conf);
    if (data.empty()) {
        cerr << "Error: Dataset is empty." << endl;
        return 1;
    }
    auto true_freqs = get_true_freqs(data);
    auto top20 = get_top_k_items(true_freqs, 20);
    cout << "Stream: " << data.size() << " items, " << true_freqs.size() << " distinct" << endl;

    HyperLogLog hll(hll_conf);
    SpectralBloomFilter sbf(sbf_conf);

    timer.start();
    for (const auto &item : data) hll.update(item);
    double hll_duration = timer.stop_s();

    timer.start();
    for (const auto &item : data) sbf.update(item);
    double sbf_duration = timer.stop_s();

    print_cardinality_comparison("CARDINALITY (HyperLogLog, " + describe(hll) + ")", hll, true_freqs.size());
    print_frequency_comparison("TOP-20 FREQUENCIES (Spectral Bloom Filter, " + describe(sbf) + ")", top20, true_freqs, sbf);

    double real_avg = average_frequency(true_freqs);
    double sbf_avg = average_estimated_frequency(sbf, true_freqs);
    double are = calculate_are_all_items(sbf, true_freqs);
    double aae = calculate_aae_all_items(sbf, true_freqs);

    cout << "\nEstimated Average Frequency: " << fixed << setprecision(4) << sbf_avg << endl;
    cout << "Real Average Frequency:      " << real_avg << endl;
    cout << "Error:                       " << relative_error(sbf_avg, real_avg) * 100.0 << "%" << endl;
    cout << "ARE (all items):             " << are * 100.0 << "%" << endl;
    cout << "AAE (all items):             " << aae << endl;
    cout << "Expected collision bias:     " << sbf.expected_bias(sbf.get_inserted_count()) << endl;
    cout << "HLL throughput:              " << setprecision(2) << throughput_mops(data.size(), hll_duration) << " Mops" << endl;
    cout << "SBF throughput:              " << throughput_mops(data.size(), sbf_duration) << " Mops" << endl;

    string dataset_name = conf.dataset_type == "file" ? conf.dataset_path : conf.dataset_type;
    ResultsSink sink;

    ResultRow hll_row;
    hll_row.estimator = "hll_corrected";
    hll_row.dataset = dataset_name;
    hll_row.config = describe(hll);
    hll_row.estimate = hll.estimate(true);
    hll_row.truth = static_cast<double>(true_freqs.size());
    hll_row.relative_error = relative_error(hll_row.estimate, hll_row.truth);
    hll_row.throughput_mops = throughput_mops(data.size(), hll_duration);
    hll_row.memory_bytes = hll.get_max_memory_usage();
    sink.add(hll_row);

    ResultRow hll_raw_row = hll_row;
    hll_raw_row.estimator = "hll_raw";
    hll_raw_row.estimate = hll.estimate(false);
    hll_raw_row.relative_error = relative_error(hll_raw_row.estimate, hll_raw_row.truth);
    sink.add(hll_raw_row);

    ResultRow sbf_row;
    sbf_row.estimator = "sbf_average_frequency";
    sbf_row.dataset = dataset_name;
    sbf_row.config = describe(sbf);
    sbf_row.estimate = sbf_avg;
    sbf_row.truth = real_avg;
    sbf_row.relative_error = relative_error(sbf_avg, real_avg);
    sbf_row.throughput_mops = throughput_mops(data.size(), sbf_duration);
    sbf_row.memory_bytes = sbf.get_max_memory_usage();
    sink.add(sbf_row);

    json config_json = {{"dataset", dataset_name},
                        {"stream_size", data.size()},
                        {"hll", {{"num_registers", hll.get_num_registers()}}},
                        {"sbf", {{"num_hashes", sbf.get_num_hashes()}, {"num_buckets", sbf.get_num_buckets()}, {"apply_correction", sbf_conf.apply_correction}}}};

    bool ok = sink.write_csv(conf.output_prefix + ".csv") && sink.write_json(conf.output_prefix + ".json", config_json);
    if (ok) cout << "\nResults exported to: " << conf.output_prefix << ".{csv,json}" << endl;
    return ok ? 0 : 1;
}

int main(int argc, char **argv) {
    ConfigParser parser;
    AppConfig app_configs;
    HyperLogLogConfig hll_configs;
    SpectralBloomConfig sbf_configs;

    AppConfig::add_params_to_config_parser(app_configs, parser);
    HyperLogLogConfig::add_params_to_config_parser(hll_configs, parser);
    SpectralBloomConfig::add_params_to_config_parser(sbf_configs, parser);

    if (argc > 1 && (string(argv[1]) == "--help" || string(argv[1]) == "-h")) {
        parser.PrintUsage();
        return 0;
    }
    if (argc > 1 && (string(argv[1]) == "--generate-doc")) {
        parser.PrintMarkdown();
        return 0;
    }

    Status s = parser.ParseCommandLine(argc, argv);
    if (!s.IsOK()) {
        fprintf(stderr, "%s\n", s.ToString().c_str());
        return -1;
    }

    cout << app_configs;
    cout << hll_configs;
    cout << sbf_configs;

    try {
        return run_comparison(app_configs, hll_configs, sbf_configs);
    } catch (const invalid_argument &e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }
}

#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

// Utils
#include "utils/ConfigParser.hpp"
#include "utils/ConfigPrinter.hpp"

#include "common.hpp"

using namespace std;

// Writes synthetic streams of 1M, 10M and 100M elements unless a single size is requested
struct GeneratorConfig {
    string dataset_type = "visitor";
    string output_dir = "data/raw";
    uint64_t stream_size = 0;
    uint64_t stream_diversity = 100000;
    double zipf_param = 1.1;
    uint64_t seed = 0;

    static void add_params_to_config_parser(GeneratorConfig &config, ConfigParser &parser) {
        parser.AddParameter(new StringParameter("gen.dataset_type", "visitor", &config.dataset_type, false, "Dataset: visitor or zipf"));
        parser.AddParameter(new StringParameter("gen.output_dir", "data/raw", &config.output_dir, false, "Directory of the generated files"));
        parser.AddParameter(new UnsignedInt64Parameter("gen.stream_size", "0", &config.stream_size, false, "Items per file (0 writes the 1m/10m/100m set)"));
        parser.AddParameter(new UnsignedInt64Parameter("gen.stream_diversity", "100000", &config.stream_diversity, false, "Unique items in zipf stream"));
        parser.AddParameter(new DoubleParameter("gen.zipf", "1.1", &config.zipf_param, false, "Zipfian param 'a'"));
        parser.AddParameter(new UnsignedInt64Parameter("gen.seed", "0", &config.seed, false, "Generator seed (0 picks a random seed)"));
    }
    auto to_tuple() const {
        return std::make_tuple("dataset_type", dataset_type, "output_dir", output_dir, "stream_size", stream_size, "stream_diversity", stream_diversity, "zipf_param", zipf_param, "seed",
                               seed);
    }
    friend std::ostream &operator<<(std::ostream &os, const GeneratorConfig &config) {
        ConfigPrinter<GeneratorConfig>::print(os, config);
        return os;
    }
};

string size_label(uint64_t size) {
    if (size % 1000000 == 0) return to_string(size / 1000000) + "m";
    if (size % 1000 == 0) return to_string(size / 1000) + "k";
    return to_string(size);
}

int main(int argc, char **argv) {
    ConfigParser parser;
    GeneratorConfig config;
    GeneratorConfig::add_params_to_config_parser(config, parser);

    if (argc > 1 && (string(argv[1]) == "--help" || string(argv[1]) == "-h")) {
        parser.PrintUsage();
        return 0;
    }

    Status s = parser.ParseCommandLine(argc, argv);
    if (!s.IsOK()) {
        fprintf(stderr, "%s\n", s.ToString().c_str());
        return -1;
    }
    if (config.dataset_type != "visitor" && config.dataset_type != "zipf") {
        cerr << "Error: Unknown dataset type: " << config.dataset_type << endl;
        return 1;
    }

    cout << config;

    vector<uint64_t> sizes = {1000000, 10000000, 100000000};
    if (config.stream_size > 0) sizes = {config.stream_size};

    for (size_t i = 0; i < sizes.size(); ++i) {
        uint64_t seed = config.seed == 0 ? 0 : config.seed + i;
        vector<string> data = config.dataset_type == "zipf" ? generate_zipf_data(sizes[i], config.stream_diversity, config.zipf_param, seed) : generate_visitor_data(sizes[i], seed);

        string path = config.output_dir + "/dataset_" + size_label(sizes[i]) + ".txt";
        if (!write_dataset(path, data)) return 1;
        cout << "Wrote " << data.size() << " items to " << path << endl;
    }
    return 0;
}

#pragma once

#include "utils/ConfigParser.hpp"
#include "utils/ConfigPrinter.hpp"

#include <string>
#include <tuple>

struct SpectralBloomConfig
{
    uint32_t num_hashes;
    uint32_t num_buckets;
    float epsilon;
    float delta;
    bool apply_correction;
    std::string calculate_from;
    static void add_params_to_config_parser(SpectralBloomConfig &c, ConfigParser &p)
    {
        p.AddParameter(new UnsignedInt32Parameter("sbf.num_hashes", "10", &c.num_hashes, false, "Number of hash functions (k)"));
        p.AddParameter(new UnsignedInt32Parameter("sbf.num_buckets", "100000", &c.num_buckets, false, "Number of counters (m)"));
        p.AddParameter(new FloatParameter("sbf.epsilon", "0.001", &c.epsilon, false, "Epsilon for SBF sizing"));
        p.AddParameter(new FloatParameter("sbf.delta", "0.01", &c.delta, false, "Delta for SBF sizing"));
        p.AddParameter(new BooleanParameter("sbf.apply_correction", "false", &c.apply_correction, false, "Subtract expected collision bias from estimates"));
        p.AddParameter(new StringParameter("sbf.calculate_from", "WIDTH_DEPTH", &c.calculate_from, false, "Calculate from WIDTH_DEPTH or EPSILON_DELTA"));
    }
    auto to_tuple() const
    {
        return std::make_tuple("num_hashes", num_hashes, "num_buckets", num_buckets, "epsilon", epsilon, "delta", delta, "apply_correction", apply_correction, "calculate_from",
                               calculate_from);
    }
    friend std::ostream &operator<<(std::ostream &os, const SpectralBloomConfig &c)
    {
        ConfigPrinter<SpectralBloomConfig>::print(os, c);
        return os;
    }
};

#pragma once

#include "utils/ConfigParser.hpp"
#include "utils/ConfigPrinter.hpp"

#include <string>
#include <tuple>

struct HyperLogLogConfig
{
    uint64_t num_registers;
    float relative_error;
    bool bias_correction;
    std::string calculate_from;
    static void add_params_to_config_parser(HyperLogLogConfig &c, ConfigParser &p)
    {
        p.AddParameter(new UnsignedInt64Parameter("hll.num_registers", "1024", &c.num_registers, false, "Number of HLL registers (power of two)"));
        p.AddParameter(new FloatParameter("hll.relative_error", "0.02", &c.relative_error, false, "Target standard error for HLL"));
        p.AddParameter(new BooleanParameter("hll.bias_correction", "true", &c.bias_correction, false, "Apply small/large range bias correction"));
        p.AddParameter(new StringParameter("hll.calculate_from", "REGISTERS", &c.calculate_from, false, "Calculate from REGISTERS or ERROR"));
    }
    auto to_tuple() const { return std::make_tuple("num_registers", num_registers, "relative_error", relative_error, "bias_correction", bias_correction, "calculate_from", calculate_from); }
    friend std::ostream &operator<<(std::ostream &os, const HyperLogLogConfig &c)
    {
        ConfigPrinter<HyperLogLogConfig>::print(os, c);
        return os;
    }
};

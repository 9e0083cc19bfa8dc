#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <vector>

class Status {
  public:
    static Status OK() { return Status(); }
    static Status InvalidArgument(const std::string &msg) { return Status("Invalid argument: " + msg); }

    bool IsOK() const { return m_ok; }
    std::string ToString() const { return m_ok ? "OK" : m_message; }

  private:
    Status() : m_ok(true) {}
    explicit Status(std::string message) : m_ok(false), m_message(std::move(message)) {}

    bool m_ok;
    std::string m_message;
};

class Parameter {
  public:
    Parameter(std::string name, std::string default_value, bool required, std::string description)
        : m_name(std::move(name)), m_default_value(std::move(default_value)), m_required(required), m_description(std::move(description)) {}
    virtual ~Parameter() = default;

    // Parses and stores the value, returns false if it is malformed
    virtual bool Set(const std::string &value) = 0;
    virtual std::string TypeName() const = 0;
    virtual bool IsFlag() const { return false; }

    const std::string &Name() const { return m_name; }
    const std::string &DefaultValue() const { return m_default_value; }
    const std::string &Description() const { return m_description; }
    bool IsRequired() const { return m_required; }

  private:
    std::string m_name;
    std::string m_default_value;
    bool m_required;
    std::string m_description;
};

class UnsignedInt32Parameter : public Parameter {
  public:
    UnsignedInt32Parameter(const std::string &name, const std::string &default_value, uint32_t *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    bool Set(const std::string &value) override {
        if (value.empty() || value[0] == '-') return false;
        char *end = nullptr;
        errno = 0;
        unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
        if (errno != 0 || *end != '\0' || parsed > std::numeric_limits<uint32_t>::max()) return false;
        *m_target = static_cast<uint32_t>(parsed);
        return true;
    }
    std::string TypeName() const override { return "uint32"; }

  private:
    uint32_t *m_target;
};

class UnsignedInt64Parameter : public Parameter {
  public:
    UnsignedInt64Parameter(const std::string &name, const std::string &default_value, uint64_t *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    bool Set(const std::string &value) override {
        if (value.empty() || value[0] == '-') return false;
        char *end = nullptr;
        errno = 0;
        unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
        if (errno != 0 || *end != '\0') return false;
        *m_target = static_cast<uint64_t>(parsed);
        return true;
    }
    std::string TypeName() const override { return "uint64"; }

  private:
    uint64_t *m_target;
};

class FloatParameter : public Parameter {
  public:
    FloatParameter(const std::string &name, const std::string &default_value, float *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    bool Set(const std::string &value) override {
        if (value.empty()) return false;
        char *end = nullptr;
        errno = 0;
        float parsed = std::strtof(value.c_str(), &end);
        if (errno != 0 || *end != '\0') return false;
        *m_target = parsed;
        return true;
    }
    std::string TypeName() const override { return "float"; }

  private:
    float *m_target;
};

class DoubleParameter : public Parameter {
  public:
    DoubleParameter(const std::string &name, const std::string &default_value, double *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    bool Set(const std::string &value) override {
        if (value.empty()) return false;
        char *end = nullptr;
        errno = 0;
        double parsed = std::strtod(value.c_str(), &end);
        if (errno != 0 || *end != '\0') return false;
        *m_target = parsed;
        return true;
    }
    std::string TypeName() const override { return "double"; }

  private:
    double *m_target;
};

class StringParameter : public Parameter {
  public:
    StringParameter(const std::string &name, const std::string &default_value, std::string *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    bool Set(const std::string &value) override {
        *m_target = value;
        return true;
    }
    std::string TypeName() const override { return "string"; }

  private:
    std::string *m_target;
};

class BooleanParameter : public Parameter {
  public:
    BooleanParameter(const std::string &name, const std::string &default_value, bool *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    bool Set(const std::string &value) override {
        if (value == "true" || value == "1" || value == "yes") {
            *m_target = true;
            return true;
        }
        if (value == "false" || value == "0" || value == "no") {
            *m_target = false;
            return true;
        }
        return false;
    }
    std::string TypeName() const override { return "bool"; }
    bool IsFlag() const override { return true; }

  private:
    bool *m_target;
};

// Command line parser for dotted parameter names, e.g. --hll.num_registers=1024
// Parameters are owned by the parser. Defaults are written to the targets on registration.
class ConfigParser {
  public:
    void AddParameter(Parameter *parameter) {
        std::unique_ptr<Parameter> owned(parameter);
        if (!owned->DefaultValue().empty() && !owned->Set(owned->DefaultValue())) {
            std::cerr << "Warning: invalid default '" << owned->DefaultValue() << "' for parameter " << owned->Name() << std::endl;
        }
        m_index[owned->Name()] = m_parameters.size();
        m_parameters.push_back(std::move(owned));
    }

    Status ParseCommandLine(int argc, char **argv) {
        std::map<std::string, bool> seen;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) != 0) return Status::InvalidArgument("unexpected argument '" + arg + "'");

            std::string name = arg.substr(2);
            std::string value;
            bool has_value = false;
            size_t eq = name.find('=');
            if (eq != std::string::npos) {
                value = name.substr(eq + 1);
                name = name.substr(0, eq);
                has_value = true;
            }

            auto it = m_index.find(name);
            if (it == m_index.end()) return Status::InvalidArgument("unknown parameter '" + name + "'");
            Parameter &parameter = *m_parameters[it->second];

            if (!has_value) {
                bool next_is_value = i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0;
                if (parameter.IsFlag() && !next_is_value) {
                    value = "true";
                } else if (next_is_value) {
                    value = argv[++i];
                } else {
                    return Status::InvalidArgument("missing value for parameter '" + name + "'");
                }
            }

            if (!parameter.Set(value)) return Status::InvalidArgument("bad " + parameter.TypeName() + " value '" + value + "' for parameter '" + name + "'");
            seen[name] = true;
        }

        for (const auto &parameter : m_parameters) {
            if (parameter->IsRequired() && !seen.count(parameter->Name())) return Status::InvalidArgument("missing required parameter '" + parameter->Name() + "'");
        }
        return Status::OK();
    }

    void PrintUsage(std::ostream &os = std::cout) const {
        os << "Parameters:" << std::endl;
        for (const auto &p : m_parameters) {
            os << "  --" << std::left << std::setw(32) << p->Name() << std::setw(8) << p->TypeName() << p->Description();
            if (p->IsRequired()) {
                os << " (required)";
            } else {
                os << " (default: " << p->DefaultValue() << ")";
            }
            os << std::endl;
        }
    }

    void PrintMarkdown(std::ostream &os = std::cout) const {
        os << "| Parameter | Type | Default | Required | Description |" << std::endl;
        os << "|---|---|---|---|---|" << std::endl;
        for (const auto &p : m_parameters) {
            os << "| `--" << p->Name() << "` | " << p->TypeName() << " | " << p->DefaultValue() << " | " << (p->IsRequired() ? "yes" : "no") << " | " << p->Description() << " |"
               << std::endl;
        }
    }

  private:
    std::vector<std::unique_ptr<Parameter>> m_parameters;
    std::map<std::string, size_t> m_index;
};

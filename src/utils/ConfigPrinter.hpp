#pragma once
#include <algorithm>
#include <cstdlib>
#include <cxxabi.h>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

// Prints a config struct as a boxed "name: value" table.
// T must provide to_tuple() returning alternating (label, value) entries.
template <typename T> class ConfigPrinter {
  private:
    static constexpr size_t LABEL_WIDTH = 32;
    static constexpr size_t PADDING = 4;

    using Row = std::pair<std::string, std::string>;

    template <typename U> static std::string value_to_string(const U &value) {
        if constexpr (std::is_same_v<U, bool>) {
            return value ? "true" : "false";
        } else if constexpr (std::is_floating_point_v<U>) {
            std::ostringstream out;
            out << std::fixed << std::setprecision(6) << value;
            return out.str();
        } else if constexpr (std::is_same_v<U, std::string>) {
            return value;
        } else {
            return std::to_string(value);
        }
    }

    template <typename Tuple, size_t... Is> static std::vector<Row> collect_rows(const Tuple &t, std::index_sequence<Is...>) {
        return {Row(std::get<Is * 2>(t), value_to_string(std::get<Is * 2 + 1>(t)))...};
    }

  public:
    static std::string demangle(const char *name) {
        int status = 0;
        std::unique_ptr<char, void (*)(void *)> res{abi::__cxa_demangle(name, NULL, NULL, &status), std::free};
        return (status == 0) ? res.get() : name;
    }

    static void print(std::ostream &os, const T &config) {
        std::string class_name = demangle(typeid(T).name());
        auto tuple = config.to_tuple();
        constexpr size_t num_fields = std::tuple_size_v<decltype(tuple)> / 2;
        std::vector<Row> rows = collect_rows(tuple, std::make_index_sequence<num_fields>{});

        size_t box_width = std::max(class_name.length(), LABEL_WIDTH) + PADDING;
        for (const auto &[label, value] : rows) box_width = std::max(box_width, LABEL_WIDTH + value.length() + PADDING);

        std::string horizontal_line("+" + std::string(box_width - 1, '-') + "+");

        os << horizontal_line << std::endl;
        os << "| " << std::left << std::setw(box_width - 2) << class_name << "|" << std::endl;
        os << horizontal_line << std::endl;
        for (const auto &[label, value] : rows) {
            os << "| " << std::left << std::setw(LABEL_WIDTH) << label << ": " << std::left << std::setw(box_width - LABEL_WIDTH - PADDING) << value << "|" << std::endl;
        }
        os << horizontal_line << std::endl;
        os << std::endl;
    }
};

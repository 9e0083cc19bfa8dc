#include <doctest/doctest.h>

#include <fstream>
#include <sstream>
#include <string>

#include "report/results_sink.hpp"

namespace {

std::string read_file(const std::string &path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}   // namespace

TEST_CASE("relative error") {
    CHECK(relative_error(110.0, 100.0) == doctest::Approx(0.1));
    CHECK(relative_error(90.0, 100.0) == doctest::Approx(0.1));
    CHECK(relative_error(0.0, 0.0) == 0.0);
    CHECK(relative_error(3.0, 0.0) == doctest::Approx(3.0));
}

TEST_CASE("csv fields are quoted only when needed") {
    CHECK(ResultsSink::csv_field("hll_raw") == "hll_raw");
    CHECK(ResultsSink::csv_field("k=3,m=64") == "\"k=3,m=64\"");
    CHECK(ResultsSink::csv_field("say \"hi\"") == "\"say \"\"hi\"\"\"");
}

TEST_CASE("rows added from parts carry their relative error") {
    ResultsSink sink;
    CHECK(sink.empty());
    sink.add("hll_corrected", "visitor", "m=1024", 980.0, 1000.0);

    REQUIRE(sink.rows().size() == 1);
    CHECK(sink.rows()[0].relative_error == doctest::Approx(0.02));
    CHECK(sink.to_json()[0]["config"] == "m=1024");
}

TEST_CASE("csv export writes a header and one line per row") {
    ResultsSink sink;
    sink.add("hll_raw", "visitor", "m=16", 40.0, 50.0);
    sink.add("sbf", "zipf", "k=3;m=64", 2.5, 2.0);

    const std::string path = "test_output/results_sink/results.csv";
    REQUIRE(sink.write_csv(path));

    std::istringstream lines(read_file(path));
    std::string header, first, second, extra;
    std::getline(lines, header);
    std::getline(lines, first);
    std::getline(lines, second);
    CHECK(header == "estimator,dataset,config,repetition,estimate,truth,relative_error,throughput_mops,memory_bytes");
    CHECK(first.rfind("hll_raw,visitor,m=16,0,40,50,0.2,", 0) == 0);
    CHECK(second.rfind("sbf,zipf,k=3;m=64,0,2.5,2,0.25,", 0) == 0);
    CHECK_FALSE(std::getline(lines, extra));
}

TEST_CASE("json export wraps the rows with metadata and config") {
    ResultsSink sink;
    ResultRow row;
    row.estimator = "sbf_corrected";
    row.dataset = "visitor";
    row.config = "k=10;m=100000";
    row.repetition = 2;
    row.estimate = 7.5;
    row.truth = 7.0;
    row.relative_error = relative_error(row.estimate, row.truth);
    row.memory_bytes = 800000;
    sink.add(row);

    const std::string path = "test_output/results_sink/results.json";
    REQUIRE(sink.write_json(path, json{{"name", "unit"}}));

    json j = json::parse(read_file(path));
    CHECK(j["metadata"]["num_results"] == 1);
    CHECK(j["config"]["name"] == "unit");
    CHECK(j["results"][0]["estimator"] == "sbf_corrected");
    CHECK(j["results"][0]["repetition"] == 2);
    CHECK(j["results"][0]["memory_bytes"] == 800000);
    CHECK(j["results"][0]["estimate"].get<double>() == doctest::Approx(7.5));
}

TEST_CASE("export fails cleanly when the file cannot be opened") {
    ResultsSink sink;
    ResultsSink::create_parent_directories("test_output/unwritable/");
    CHECK_FALSE(sink.write_csv("test_output/unwritable"));
}

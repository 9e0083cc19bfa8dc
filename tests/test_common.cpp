#include <doctest/doctest.h>

#include <fstream>
#include <map>
#include <string>
#include <vector>

#include "common.hpp"
#include "report/results_sink.hpp"

namespace {

bool starts_with(const std::string &value, const std::string &prefix) { return value.rfind(prefix, 0) == 0; }

}   // namespace

TEST_CASE("dataset reader strips carriage returns and skips blank lines") {
    const std::string path = "test_output/common/crlf.txt";
    ResultsSink::create_parent_directories(path);
    {
        std::ofstream out(path, std::ios::binary);
        REQUIRE(out.is_open());
        out << "10.0.0.1\r\n\r\n192.168.1.7\r\n\n172.16.0.3\r\n10.0.0.1";
    }

    const std::vector<std::string> expected_all = {"10.0.0.1", "192.168.1.7", "172.16.0.3", "10.0.0.1"};
    const std::vector<std::string> expected_capped = {"10.0.0.1", "192.168.1.7"};

    std::vector<std::string> all = read_dataset(path, 100);
    CHECK(all == expected_all);

    // Blank lines do not count towards the cap
    std::vector<std::string> capped = read_dataset(path, 2);
    CHECK(capped == expected_capped);

    CHECK(read_dataset(path, 0).empty());
}

TEST_CASE("missing dataset file yields an empty stream") {
    CHECK(read_dataset("test_output/common/does_not_exist.txt", 10).empty());
}

TEST_CASE("written datasets read back unchanged") {
    const std::string path = "test_output/common/written.txt";
    std::vector<std::string> data = {"item_1", "item_2", "item_1"};
    REQUIRE(write_dataset(path, data));
    CHECK(read_dataset(path, data.size()) == data);
}

TEST_CASE("visitor stream has the requested length and the three IP groups") {
    for (uint64_t size : {1ULL, 10ULL, 1000ULL, 50000ULL}) {
        std::vector<std::string> data = generate_visitor_data(size, 42);
        CHECK(data.size() == size);
        for (const auto &ip : data) CHECK((starts_with(ip, "192.168.1.") || starts_with(ip, "10.0.") || starts_with(ip, "172.16.")));
    }
}

TEST_CASE("visitor stream is reproducible from its seed") {
    CHECK(generate_visitor_data(10000, 7) == generate_visitor_data(10000, 7));
    CHECK(generate_visitor_data(10000, 7) != generate_visitor_data(10000, 8));
}

TEST_CASE("visitor stream mixes frequent, occasional and rare visitors") {
    std::vector<std::string> data = generate_visitor_data(100000, 3);
    std::map<std::string, uint64_t> freqs = get_true_freqs(data);

    uint64_t frequent = 0, occasional = 0, rare = 0;
    for (const auto &[ip, count] : freqs) {
        if (starts_with(ip, "192.168.1.")) {
            frequent += count;
            CHECK(count >= 10);
            CHECK(count <= 50);
        } else if (starts_with(ip, "10.0.")) {
            occasional += count;
            CHECK(count >= 3);
            CHECK(count <= 9);
        } else {
            rare += count;
            CHECK(count <= 2);
        }
    }

    // Group shares are approximate since per-IP visit counts are random
    CHECK(static_cast<double>(frequent) / data.size() == doctest::Approx(0.2).epsilon(0.05));
    CHECK(static_cast<double>(occasional) / data.size() == doctest::Approx(0.3).epsilon(0.05));
    CHECK(rare > 0);
}

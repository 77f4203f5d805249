#include "doctest.h"
#include "util/Schema.h"
#include "util/SchemaHelper.h"

#include <toml.hpp>

#include <cstddef>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace redist;

namespace {

enum class Mode { Fast, Safe, Unknown };

struct TestConfig {
    Mode mode;
    std::size_t elements;
    double factor;
    bool verbose;
    std::optional<std::string> output;
    std::optional<std::vector<std::size_t>> counts;
};

TableSchema<TestConfig> make_schema() {
    TableSchema<TestConfig> schema;
    schema.add_value("mode", &TestConfig::mode)
        .converter([](std::string_view value) {
            if (iEquals(value, "fast")) {
                return Mode::Fast;
            } else if (iEquals(value, "safe")) {
                return Mode::Safe;
            }
            return Mode::Unknown;
        })
        .validator([](Mode const& mode) { return mode != Mode::Unknown; })
        .default_value(Mode::Safe);
    schema.add_value("elements", &TestConfig::elements).help("Number of elements");
    schema.add_value("factor", &TestConfig::factor)
        .default_value(1.5)
        .validator([](auto&& x) { return x > 0.0; });
    schema.add_value("verbose", &TestConfig::verbose).default_value(false);
    schema.add_value("output", &TestConfig::output);
    schema.add_array("counts", &TestConfig::counts).min(1).max(4);
    return schema;
}

} // namespace

TEST_CASE("Schema") {
    auto schema = make_schema();

    SUBCASE("defaults") {
        auto cfg = schema.translate(toml::parse("elements = 10"));
        CHECK(cfg.mode == Mode::Safe);
        CHECK(cfg.elements == 10);
        CHECK(cfg.factor == 1.5);
        CHECK(!cfg.verbose);
        CHECK(!cfg.output);
        CHECK(!cfg.counts);
    }

    SUBCASE("all values") {
        auto cfg = schema.translate(toml::parse(R"(
            mode = "Fast"
            elements = 12
            factor = 0.25
            verbose = true
            output = "profile.txt"
            counts = [3, 1, 4, 2]
        )"));
        CHECK(cfg.mode == Mode::Fast);
        CHECK(cfg.elements == 12);
        CHECK(cfg.factor == 0.25);
        CHECK(cfg.verbose);
        REQUIRE(cfg.output);
        CHECK(*cfg.output == "profile.txt");
        REQUIRE(cfg.counts);
        CHECK(*cfg.counts == std::vector<std::size_t>({3, 1, 4, 2}));
    }

    SUBCASE("missing required value") {
        CHECK_THROWS_AS(schema.translate(toml::parse("factor = 2.0")), std::runtime_error);
    }

    SUBCASE("validator") {
        CHECK_THROWS_AS(schema.translate(toml::parse("elements = 1\nfactor = -1.0")),
                        std::runtime_error);
        CHECK_THROWS_AS(schema.translate(toml::parse("elements = 1\nmode = \"slow\"")),
                        std::runtime_error);
    }

    SUBCASE("wrong type") {
        CHECK_THROWS_AS(schema.translate(toml::parse("elements = \"many\"")), std::runtime_error);
        CHECK_THROWS_AS(schema.translate(toml::parse("elements = 1\ncounts = 3")),
                        std::runtime_error);
    }

    SUBCASE("array bounds") {
        CHECK_THROWS_AS(schema.translate(toml::parse("elements = 1\ncounts = []")),
                        std::runtime_error);
        CHECK_THROWS_AS(schema.translate(toml::parse("elements = 1\ncounts = [1, 2, 3, 4, 5]")),
                        std::runtime_error);
    }

    SUBCASE("error names the key") {
        try {
            schema.translate(toml::parse("elements = 1\nfactor = -1.0"));
            CHECK(false);
        } catch (std::runtime_error const& e) {
            CHECK(std::string(e.what()).find("--> factor") != std::string::npos);
        }
    }

    SUBCASE("command line overrides") {
        auto cfg = schema.translate(toml::parse("elements = 1"));
        schema.set(cfg, "elements", "42");
        schema.set(cfg, "verbose", "yes");
        schema.set(cfg, "mode", "FAST");
        schema.set(cfg, "output", "out.txt");
        CHECK(cfg.elements == 42);
        CHECK(cfg.verbose);
        CHECK(cfg.mode == Mode::Fast);
        REQUIRE(cfg.output);
        CHECK(*cfg.output == "out.txt");

        CHECK_THROWS_AS(schema.set(cfg, "elements", "42x"), std::runtime_error);
        CHECK_THROWS_AS(schema.set(cfg, "verbose", "maybe"), std::runtime_error);
        CHECK_THROWS_AS(schema.set(cfg, "unknown", "1"), std::runtime_error);
    }

    SUBCASE("command line keys") {
        std::vector<std::string> keys;
        schema.cmd_line_args(
            [&keys](std::string_view key, std::string_view) { keys.emplace_back(key); });
        CHECK(keys ==
              std::vector<std::string>({"mode", "elements", "factor", "verbose", "output"}));
    }

    SUBCASE("print") {
        std::stringstream ss;
        ss << schema;
        auto printed = ss.str();
        CHECK(printed.find("elements = <integer> # Number of elements") != std::string::npos);
        CHECK(printed.find("factor = 1.5") != std::string::npos);
        CHECK(printed.find("counts = [1--4 x <integer>]") != std::string::npos);
    }
}

TEST_CASE("SchemaHelper") {
    CHECK(iEquals("Scatter", "scatter"));
    CHECK(iEquals("", ""));
    CHECK(!iEquals("scatter", "scatte"));
    CHECK(!iEquals("gather", "gathers"));
    CHECK(ParentPathExists()("file_in_working_directory.txt"));
    CHECK(!ParentPathExists()("/this/directory/does/not/exist/file.txt"));
}

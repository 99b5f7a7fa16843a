#include <catch2/catch.hpp>
#include "formula_exporter.hpp"
#include "generator_config.hpp"
#include "test_support.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace formula_exporter;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::vector<std::string> read_rows(const fs::path& path) {
    std::string content = read_file(path);
    std::vector<std::string> rows;
    size_t start = 0;
    size_t end;
    while ((end = content.find("\r\n", start)) != std::string::npos) {
        rows.push_back(content.substr(start, end - start));
        start = end + 2;
    }
    return rows;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

TEST_CASE("CSV quoting", "[exporter]") {
    REQUIRE(csv_field("plain") == "plain");
    REQUIRE(csv_field("a, b") == "\"a, b\"");
    REQUIRE(csv_field("say \"hi\"") == "\"say \"\"hi\"\"\"");
    REQUIRE(csv_field("two\nlines") == "\"two\nlines\"");
    REQUIRE(csv_field("") == "");
    REQUIRE(csv_row({"a", "b,c", "d"}) == "a,\"b,c\",d\r\n");
}

TEST_CASE("Exporting the built-in catalog", "[exporter]") {
    std::string tmp_dir = "test_tmp_export";
    fs::remove_all(tmp_dir);
    component_catalog::ComponentCatalog catalog = component_catalog::default_catalog();

    GeneratorConfig config;
    config.output_dir = tmp_dir;
    config.max_depth = 2;

    SECTION("All four files") {
        ExportResult result = export_to_csv(catalog, config);
        REQUIRE(result.outputs.size() == 4);
        REQUIRE(result.component_rows == 279);
        REQUIRE(result.classic_rows == 10);
        REQUIRE(result.pipeline_rows == 315);
        for (const auto& [kind, path] : result.outputs) {
            REQUIRE(fs::exists(path));
        }

        auto components = read_rows(result.outputs["components"]);
        REQUIRE(components.size() == 280);
        REQUIRE(components[0] ==
                "category,name,formula_latex,formula_ascii,description,parameters,parameter_values,"
                "complexity_time,complexity_space,pipeline_stages,is_lossless,prerequisites");
        REQUIRE(starts_with(components[1], "ENTROPY_MEASURE,Shannon Entropy,"));
        std::string component_text = read_file(result.outputs["components"]);
        REQUIRE(component_text.find("\"{\"\"alpha\"\":\"\"inf\"\"}\"") != std::string::npos);
        REQUIRE(component_text.find("\"{\"\"max_order\"\":4,\"\"escape\"\":\"\"PPMA\"\"}\"") != std::string::npos);
        REQUIRE(component_text.find("\"{\"\"adaptive\"\":true}\"") != std::string::npos);

        auto pipelines = read_rows(result.outputs["pipelines"]);
        REQUIRE(pipelines.size() == 316);
        REQUIRE(pipelines[0] ==
                "pipeline_id,pipeline_name,pipeline_components,pipeline_formula,total_time_complexity,"
                "total_space_complexity,num_stages,all_lossless");
        REQUIRE(starts_with(pipelines[1],
                            "1,Shannon Entropy → Huffman Coding,\"[\"\"Shannon Entropy\"\",\"\"Huffman Coding\"\"]\","));
        REQUIRE(starts_with(pipelines.back(), "315,"));

        auto classics = read_rows(result.outputs["classics"]);
        REQUIRE(classics.size() == 11);
        REQUIRE(starts_with(classics[1], "DEFLATE,"));
        REQUIRE(starts_with(classics[10], "CTW,"));

        std::string summary = read_file(result.outputs["summary"]);
        REQUIRE(summary.find("total_components,53,") != std::string::npos);
        REQUIRE(summary.find("total_component_variations,279,") != std::string::npos);
        REQUIRE(summary.find("generated_pipelines,315,") != std::string::npos);
        REQUIRE(summary.find("\"ENTROPY_MEASURE, TRANSFORM, PREDICTOR,") != std::string::npos);
        REQUIRE(summary.find("generation_timestamp,") != std::string::npos);
    }

    SECTION("Pipelines skipped") {
        config.include_pipelines = false;
        ExportResult result = export_to_csv(catalog, config);
        REQUIRE(result.outputs.count("pipelines") == 0);
        REQUIRE_FALSE(fs::exists(fs::path(tmp_dir) / "pipeline_combinations.csv"));
        REQUIRE(read_file(result.outputs["summary"]).find("generated_pipelines,0,") != std::string::npos);
    }

    SECTION("Parameter space column") {
        config.include_parameters = true;
        ExportResult result = export_to_csv(catalog, config);
        auto pipelines = read_rows(result.outputs["pipelines"]);
        REQUIRE(pipelines[0].substr(pipelines[0].size() - 16) == ",parameter_space");
        // Shannon Entropy has 3 variations, Huffman Coding 2
        REQUIRE(pipelines[1].substr(pipelines[1].size() - 7) == ",True,6");
    }

    SECTION("Bad depth bounds fail before writing") {
        config.min_depth = 0;
        REQUIRE_THROWS_AS(export_to_csv(catalog, config), std::invalid_argument);
        REQUIRE_FALSE(fs::exists(tmp_dir));
    }

    fs::remove_all(tmp_dir);
}

TEST_CASE("Export failures", "[exporter]") {
    std::string blocker = "test_tmp_export_blocker";
    std::ofstream(blocker) << "not a directory";
    component_catalog::ComponentCatalog catalog({make_component("E", component_catalog::Category::EntropyCoder,
                                                                {component_catalog::Stage::EntropyCoding})});
    GeneratorConfig config;
    config.output_dir = blocker + "/out";
    REQUIRE_THROWS_AS(export_to_csv(catalog, config), ExportError);
    fs::remove(blocker);
}

TEST_CASE("Catalog statistics", "[exporter]") {
    auto stats = collect_stats(component_catalog::default_catalog());
    REQUIRE(stats.unique_components == 53);
    REQUIRE(stats.categories == 9);
    REQUIRE(stats.by_category.size() == 9);
    REQUIRE(stats.by_category[0].first == component_catalog::Category::EntropyMeasure);
    REQUIRE(stats.by_category[0].second == 5);
    REQUIRE(stats.by_category[8].second == 7);
}

TEST_CASE("Generator configuration files", "[config]") {
    std::string tmp_dir = "test_tmp_config";
    fs::create_directory(tmp_dir);
    CoutRedirect cout_redirect;

    SECTION("Save and load") {
        GeneratorConfig config;
        config.output_dir = "csv_out";
        config.max_depth = 3;
        config.require_entropy_coder = false;
        config.include_parameters = true;
        save_config(config, tmp_dir + "/config.json");

        GeneratorConfig loaded = load_config(tmp_dir + "/config.json");
        REQUIRE(loaded.output_dir == "csv_out");
        REQUIRE(loaded.max_depth == 3);
        REQUIRE(loaded.min_depth == 2);
        REQUIRE_FALSE(loaded.require_entropy_coder);
        REQUIRE(loaded.include_parameters);
        REQUIRE(cout_redirect.getOutput().find("Configuration saved to: " + tmp_dir + "/config.json") !=
                std::string::npos);

        auto options = loaded.generator_options();
        REQUIRE(options.max_depth == 3);
        REQUIRE_FALSE(options.require_terminal_category);
    }

    SECTION("Missing keys keep defaults") {
        GeneratorConfig config = config_from_json(json::parse(R"({"max_depth": 5})"));
        REQUIRE(config.max_depth == 5);
        REQUIRE(config.output_dir == GeneratorConfig().output_dir);
        REQUIRE(config.include_pipelines);
    }

    SECTION("Wrong types") {
        REQUIRE_THROWS_AS(config_from_json(json::parse(R"({"max_depth": "deep"})")), ConfigError);
        REQUIRE_THROWS_AS(config_from_json(json::parse(R"({"max_depth": -1})")), ConfigError);
        REQUIRE_THROWS_AS(config_from_json(json::parse(R"({"verbose": "yes"})")), ConfigError);
        REQUIRE_THROWS_AS(config_from_json(json::parse("[1, 2]")), ConfigError);
    }

    SECTION("Unreadable files") {
        REQUIRE_THROWS_AS(load_config(tmp_dir + "/absent.json"), ConfigError);
        std::ofstream(tmp_dir + "/broken.json") << "{\"max_depth\": ";
        REQUIRE_THROWS_AS(load_config(tmp_dir + "/broken.json"), ConfigError);
    }

    fs::remove_all(tmp_dir);
}

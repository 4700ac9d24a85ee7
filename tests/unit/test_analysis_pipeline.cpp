#include <gtest/gtest.h>
#include "pipeline/analysis_pipeline.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

using namespace fcg;

namespace {

AnalysisConfig quiet_config(std::vector<std::string> metrics) {
    AnalysisConfig config;
    config.metrics = std::move(metrics);
    config.verbose = false;
    return config;
}

RawEdgeRow row(const std::string& animal, const std::string& pair, const std::string& weight) {
    RawEdgeRow r;
    r.animal = animal;
    r.pair = pair;
    r.weight = weight;
    return r;
}

} // namespace

// ==========================================
// Configuration Tests
// ==========================================

TEST(AnalysisConfigTest, DefaultsValidate) {
    AnalysisConfig config;
    std::string error;
    EXPECT_TRUE(config.validate(error)) << error;
    EXPECT_EQ(config.metric_kinds().size(), 7u);
}

TEST(AnalysisConfigTest, RejectsBadValues) {
    std::string error;

    AnalysisConfig damping;
    damping.pagerank_damping = 1.0;
    EXPECT_FALSE(damping.validate(error));

    AnalysisConfig metric;
    metric.metrics = {"betweenness"};
    EXPECT_FALSE(metric.validate(error));
    EXPECT_NE(error.find("betweenness"), std::string::npos);

    AnalysisConfig format;
    format.output_format = "xlsx";
    EXPECT_FALSE(format.validate(error));

    AnalysisConfig tolerance;
    tolerance.hits_tolerance = 0.0;
    EXPECT_FALSE(tolerance.validate(error));

    AnalysisConfig none;
    none.metrics.clear();
    EXPECT_FALSE(none.validate(error));
}

TEST(AnalysisConfigTest, MetricKindsExpandAllAndDeduplicate) {
    AnalysisConfig config;
    config.metrics = {"degree", "page_rank", "degree"};
    EXPECT_EQ(config.metric_kinds(),
              (std::vector<MetricKind>{MetricKind::DEGREE, MetricKind::PAGERANK}));

    config.metrics = {"all"};
    EXPECT_EQ(config.metric_kinds().size(), 7u);
}

TEST(AnalysisConfigTest, JsonRoundTrip) {
    char path[] = "/tmp/fcg_config_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);

    AnalysisConfig config;
    config.metrics = {"efficiency"};
    config.efficiency_min_distance = 1e-4;
    config.output_format = "tsv";
    config.to_json_file(path);

    AnalysisConfig loaded = AnalysisConfig::from_json_file(path);
    EXPECT_EQ(loaded.metrics, config.metrics);
    EXPECT_DOUBLE_EQ(loaded.efficiency_min_distance, 1e-4);
    EXPECT_EQ(loaded.output_format, "tsv");
    std::remove(path);
}

TEST(AnalysisConfigTest, PartialJsonKeepsDefaults) {
    nlohmann::json j = {{"metrics", "pagerank, HITS"}, {"community_resolution", 0.5}};
    AnalysisConfig config = AnalysisConfig::from_json(j);
    EXPECT_EQ(config.metrics, (std::vector<std::string>{"pagerank", "hits"}));
    EXPECT_DOUBLE_EQ(config.community_resolution, 0.5);
    EXPECT_DOUBLE_EQ(config.pagerank_damping, 0.85);
}

TEST(AnalysisConfigTest, Environment) {
    setenv("FCG_OUTPUT_DIR", "/tmp/fcg_env_out", 1);
    setenv("FCG_METRICS", "degree,clustering", 1);
    setenv("FCG_VERBOSE", "false", 1);

    AnalysisConfig config = AnalysisConfig::from_environment();
    EXPECT_EQ(config.output_directory, "/tmp/fcg_env_out");
    EXPECT_EQ(config.metrics, (std::vector<std::string>{"degree", "clustering"}));
    EXPECT_FALSE(config.verbose);

    unsetenv("FCG_OUTPUT_DIR");
    unsetenv("FCG_METRICS");
    unsetenv("FCG_VERBOSE");
}

TEST(AnalysisConfigTest, ExplicitConfigPathMustExist) {
    EXPECT_THROW(load_config_with_fallback("/nonexistent/fcg.json"), std::runtime_error);
}

TEST(AnalysisPipelineTest, InvalidConfigIsRejected) {
    AnalysisConfig config = quiet_config({"degree"});
    config.community_max_levels = 0;
    EXPECT_THROW(AnalysisPipeline pipeline(config), std::invalid_argument);
}

// ==========================================
// Pipeline Tests
// ==========================================

TEST(AnalysisPipelineTest, ComputesEveryMetricPerAnimal) {
    AnalysisPipeline pipeline(quiet_config({"all"}));

    std::vector<RawEdgeRow> rows = {
        row("M1", "(1, 2)", "0.5"),
        row("M1", "(2, 3)", "0.8"),
        row("M1", "(3, 1)", "0.6"),
        row("M1", "(3, 4)", "0.4"),
        row("M2", "(1, 2)", "0.9"),
        row("M2", "(2, 3)", "0.7"),
        row("M2", "(1, 3)", "0.3"),
    };

    ResultSet results = pipeline.process_rows(rows, true);
    EXPECT_EQ(results.animals(), (std::vector<AnimalId>{"M1", "M2"}));
    EXPECT_EQ(results.metrics().size(), 7u);
    EXPECT_EQ(results.results().size(), 14u);

    auto stats = pipeline.get_statistics();
    EXPECT_EQ(stats.animals_processed, 2);
    EXPECT_EQ(stats.rows_read, 7);
    EXPECT_EQ(stats.records_loaded, 7);
    EXPECT_EQ(stats.metrics_computed.at("pagerank"), 2);
    EXPECT_TRUE(stats.metrics_skipped.empty());
}

TEST(AnalysisPipelineTest, ConvergenceFailureOnlySkipsThatAnimal) {
    AnalysisPipeline pipeline(quiet_config({"eigenvector", "degree"}));

    std::vector<RawEdgeRow> rows = {
        // Path: power iteration oscillates
        row("bad", "(1, 2)", "1.0"),
        row("bad", "(2, 3)", "1.0"),
        // Triangle converges
        row("good", "(1, 2)", "1.0"),
        row("good", "(2, 3)", "1.0"),
        row("good", "(3, 1)", "1.0"),
    };

    ResultSet results = pipeline.process_rows(rows, true);

    auto stats = pipeline.get_statistics();
    EXPECT_EQ(stats.metrics_skipped.at("eigenvector"), 1);
    EXPECT_EQ(stats.metrics_computed.at("eigenvector"), 1);
    EXPECT_EQ(stats.metrics_computed.at("degree"), 2);
    ASSERT_EQ(stats.warnings.size(), 1u);
    EXPECT_EQ(stats.warnings[0].rfind("eigenvector skipped for animal bad", 0), 0u);

    ResultTable table = results.table(MetricKind::EIGENVECTOR);
    ASSERT_EQ(table.num_rows(), 3u);
    for (const auto& r : table.rows()) {
        EXPECT_EQ(r[0], "good");
    }
}

TEST(AnalysisPipelineTest, MetricSkippedForEveryAnimalStillGetsTable) {
    char dir[] = "/tmp/fcg_skipped_XXXXXX";
    ASSERT_NE(mkdtemp(dir), nullptr);

    AnalysisConfig config = quiet_config({"eigenvector", "degree"});
    config.output_directory = std::string(dir) + "/out";
    AnalysisPipeline pipeline(config);

    // Path graph: power iteration oscillates
    ResultSet results = pipeline.process_rows({row("", "(1, 2)", "0.5"),
                                               row("", "(2, 3)", "0.8")}, false);
    EXPECT_EQ(results.metrics(),
              (std::vector<MetricKind>{MetricKind::EIGENVECTOR, MetricKind::DEGREE}));
    ASSERT_EQ(results.skipped().size(), 1u);

    auto written = pipeline.save_results(results);

    std::ifstream table_file(config.output_directory + "/eigenvector.csv");
    ASSERT_TRUE(table_file.is_open());
    std::string header;
    std::getline(table_file, header);
    EXPECT_EQ(header, "Neuron,Eigenvector Centrality");
    std::string extra;
    EXPECT_FALSE(std::getline(table_file, extra));

    ResultTable summary = results.summary_table();
    bool found = false;
    for (const auto& r : summary.rows()) {
        if (r[1] == "eigenvector" && r[2] == "Skipped") {
            EXPECT_EQ(r[3], "1");
            found = true;
        }
    }
    EXPECT_TRUE(found);

    for (const auto& path : written) std::remove(path.c_str());
    rmdir(config.output_directory.c_str());
    rmdir(dir);
}

TEST(AnalysisPipelineTest, EfficiencyUsesOnlyUnitIntervalEdges) {
    AnalysisPipeline pipeline(quiet_config({"efficiency", "degree"}));

    std::vector<RawEdgeRow> rows = {
        row("", "(1, 2)", "0.5"),
        row("", "(2, 3)", "1.5"),
    };

    ResultSet results = pipeline.process_rows(rows, false);
    EXPECT_FALSE(results.include_animal_column());
    EXPECT_EQ(pipeline.get_statistics().records_dropped_for_efficiency, 1);

    // Degree still sees the out-of-range edge
    EXPECT_EQ(results.table(MetricKind::DEGREE).num_rows(), 3u);
    EXPECT_EQ(results.table(MetricKind::EFFICIENCY).num_rows(), 2u);
}

TEST(AnalysisPipelineTest, ParseErrorAbortsRun) {
    AnalysisPipeline pipeline(quiet_config({"degree"}));
    std::vector<RawEdgeRow> rows = {
        row("M1", "(1, 2)", "0.5"),
        row("M1", "(1 2)", "0.5"),
    };
    EXPECT_THROW(pipeline.process_rows(rows, true), MalformedPairError);
}

TEST(AnalysisPipelineTest, ProgressCallbackSeesEveryAnimal) {
    AnalysisPipeline pipeline(quiet_config({"degree"}));
    std::vector<std::string> seen;
    pipeline.set_progress_callback(
        [&seen](const std::string& stage, int, int, const std::string& message) {
            if (stage == "Animal") seen.push_back(message);
        });

    pipeline.process_rows({row("a", "(1, 2)", "0.1"), row("b", "(1, 2)", "0.2")}, true);
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b"}));
}

TEST(AnalysisPipelineTest, PartitionsEachAnimal) {
    AnalysisPipeline pipeline(quiet_config({"community"}));
    std::vector<EdgeRecord> records = parse_edge_records({
        row("M1", "(1, 2)", "1.0"),
        row("M1", "(3, 4)", "1.0"),
        row("M2", "(1, 2)", "1.0"),
    });

    auto partitions = pipeline.partition_records(records);
    ASSERT_EQ(partitions.size(), 2u);
    EXPECT_EQ(partitions[0].first.animal, "M1");
    EXPECT_EQ(partitions[0].second.community_count, 2);
    EXPECT_EQ(partitions[1].second.community_count, 1);
}

TEST(AnalysisPipelineTest, EndToEndFromFile) {
    char dir[] = "/tmp/fcg_pipeline_XXXXXX";
    ASSERT_NE(mkdtemp(dir), nullptr);
    std::string input = std::string(dir) + "/edges.csv";
    {
        std::ofstream out(input);
        out << "Animal,Neuron Pair,Mean Edge Weight\n";
        out << "M1,\"(1, 2)\",0.5\n";
        out << "M1,\"(2, 3)\",0.8\n";
    }

    AnalysisConfig config = quiet_config({"degree", "pagerank"});
    config.output_directory = std::string(dir) + "/out";
    AnalysisPipeline pipeline(config);

    ResultSet results = pipeline.process_file(input);
    auto written = pipeline.save_results(results);

    EXPECT_TRUE(results.include_animal_column());
    EXPECT_NEAR(std::stod(results.table(MetricKind::DEGREE).rows()[1][2]), 1.3, 1e-9);

    std::ifstream stats_file(config.output_directory + "/run_stats.json");
    ASSERT_TRUE(stats_file.is_open());
    auto stats = nlohmann::json::parse(stats_file);
    EXPECT_EQ(stats["animals_processed"], 1);
    EXPECT_EQ(stats["rows_read"], 2);

    for (const auto& path : written) std::remove(path.c_str());
    rmdir(config.output_directory.c_str());
    std::remove(input.c_str());
    rmdir(dir);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

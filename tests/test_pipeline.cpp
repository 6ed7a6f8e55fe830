#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Mocks.h"
#include "../src/core/DiscoveryPipeline.h"
#include "../src/core/JSONWriter.h"
#include "../src/core/ServiceProfile.h"
#include "../src/probes/OllamaProbe.h"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <algorithm>
#include <mutex>

using ::testing::_;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace infer_scan {

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
        cfg.api_key = "k";
        cfg.page_delay_ms = 0;
        cfg.concurrency = 4;
        profile = find_service_profile("ollama");
        ASSERT_NE(profile, nullptr);
    }

    Config cfg;
    const ServiceProfile* profile = nullptr;
    NiceMock<MockSearchIndex> index;
    NiceMock<MockHttpClient> http;
};

TEST_F(PipelineTest, EndToEndDeduplicatesProbesAndEnriches) {
    cfg.queries = {"q1", "q2"};
    ON_CALL(index, search("q1", 1, _, _, _)).WillByDefault(ReturnPage(make_page({{"1.2.3.4", 11434}})));
    ON_CALL(index, search("q2", 1, _, _, _)).WillByDefault(ReturnPage(make_page({{"1.2.3.4", 11434}, {"5.6.7.8", 11434}})));
    EXPECT_CALL(index, host("1.2.3.4", _, _)).WillOnce(Invoke([](const std::string&, HostMetadata& meta, std::string&){
        meta.country_name = "France";
        meta.city_name = "Paris";
        meta.org = "Example SAS";
        return true;
    }));
    EXPECT_CALL(index, host("5.6.7.8", _, _)).Times(0);

    EXPECT_CALL(http, get(Field(&HttpRequest::url, "http://1.2.3.4:11434/api/tags"), _))
        .WillOnce(Return(make_response(200, R"({"models": [{"name": "llama3", "size": 4661224676, "digest": "abc"}]})")));
    EXPECT_CALL(http, get(Field(&HttpRequest::url, "http://5.6.7.8:11434/api/tags"), _))
        .WillOnce(FailTransport(std::string("Connection refused")));

    OllamaProbe engine(http);
    DiscoveryPipeline pipeline(cfg, *profile, index, engine);
    Report report;
    pipeline.run(report);

    EXPECT_EQ(pipeline.stats().queries_run, 2u);
    ASSERT_EQ(report.servers().size(), 1u);
    const auto& s = report.servers()[0];
    EXPECT_EQ(s.candidate, (Candidate{"1.2.3.4", 11434}));
    EXPECT_EQ(s.outcome.models, std::vector<std::string>{"llama3"});
    EXPECT_EQ(s.host.city_name, "Paris");

    auto j = nlohmann::json::parse(JSONWriter().write(report, cfg));
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j[0]["models"][0], "llama3");
    EXPECT_EQ(j[0]["location"]["country_name"], "France");
}

TEST_F(PipelineTest, NothingFoundReportsCandidateCountAndQueries) {
    cfg.queries = {"port:11434"};
    ON_CALL(index, search(_, 1, _, _, _)).WillByDefault(ReturnPage(make_page({{"9.9.9.9", 0}, {"8.8.8.8", 11434}})));
    ON_CALL(http, get(_, _)).WillByDefault(Return(make_response(200, R"({"models": []})")));
    EXPECT_CALL(index, host(_, _, _)).Times(0);

    OllamaProbe engine(http);
    DiscoveryPipeline pipeline(cfg, *profile, index, engine);
    Report report;
    pipeline.run(report);

    EXPECT_FALSE(report.has_servers());
    EXPECT_EQ(report.error(), "No accessible Ollama servers found");
    ASSERT_TRUE(report.debug_info().has_value());
    EXPECT_EQ(report.debug_info()->total_candidates, 2u);
    EXPECT_EQ(report.debug_info()->queries, std::vector<std::string>{"port:11434"});
}

TEST_F(PipelineTest, ProfileQueriesUsedWhenNoneConfigured) {
    OllamaProbe engine(http);
    DiscoveryPipeline pipeline(cfg, *profile, index, engine);
    EXPECT_EQ(pipeline.queries(), profile->queries);
    cfg.queries = {"custom"};
    EXPECT_EQ(pipeline.queries(), std::vector<std::string>{"custom"});
}

TEST_F(PipelineTest, FailingSearchStillProducesEnvelope) {
    cfg.queries = {"a", "b"};
    cfg.page_limit = 3;
    ON_CALL(index, search(_, _, _, _, _)).WillByDefault(FailSearch(std::string("Invalid API key")));
    OllamaProbe engine(http);
    EXPECT_CALL(http, get(_, _)).Times(0);
    DiscoveryPipeline pipeline(cfg, *profile, index, engine);
    Report report;
    pipeline.run(report);
    EXPECT_EQ(pipeline.stats().page_errors, 6u);
    EXPECT_FALSE(report.has_servers());
    ASSERT_TRUE(report.debug_info().has_value());
    EXPECT_EQ(report.debug_info()->total_candidates, 0u);
}

TEST_F(PipelineTest, LlamaCppProfileFansOutPortlessMatches) {
    const ServiceProfile* llama = find_service_profile("llamacpp");
    ASSERT_NE(llama, nullptr);
    cfg.queries = {"server:\"llama.cpp\""};
    ON_CALL(index, search(_, 1, _, _, _)).WillByDefault(ReturnPage(make_page({{"7.7.7.7", 0}})));
    NiceMock<MockProbeEngine> engine;
    std::vector<int> ports;
    std::mutex m;
    ON_CALL(engine, probe(_, _)).WillByDefault(Invoke([&](const Candidate& c, std::chrono::milliseconds){
        std::lock_guard<std::mutex> lock(m);
        ports.push_back(c.port);
        return ProbeOutcome::not_matched("no endpoint matched");
    }));
    DiscoveryPipeline pipeline(cfg, *llama, index, engine);
    Report report;
    pipeline.run(report);
    std::sort(ports.begin(), ports.end());
    EXPECT_EQ(ports, (std::vector<int>{3000, 5000, 7860, 8000, 8080, 8888}));
    EXPECT_EQ(report.error(), "No accessible llama.cpp servers found");
}

TEST(ServiceProfileTest, KnownProfiles) {
    const ServiceProfile* ollama = find_service_profile("ollama");
    ASSERT_NE(ollama, nullptr);
    EXPECT_EQ(ollama->queries.size(), 13u);
    EXPECT_EQ(ollama->default_port, 11434);
    EXPECT_TRUE(ollama->common_ports.empty());
    EXPECT_EQ(ollama->lookup_port(), 11434);
    EXPECT_EQ(ollama->output_prefix, "shodan_ollama");

    const ServiceProfile* llama = find_service_profile("llamacpp");
    ASSERT_NE(llama, nullptr);
    EXPECT_EQ(llama->strategy, ProbeStrategy::MultiEndpoint);
    EXPECT_EQ(llama->queries.size(), 12u);
    EXPECT_EQ(llama->queries.back(), "port:8888 title:\"llama.cpp\"");
    EXPECT_EQ(llama->lookup_port(), 8080);
    EXPECT_EQ(llama->output_prefix, "shodan_llama_cpp_servers");

    EXPECT_EQ(find_service_profile("vllm"), nullptr);
}

TEST(ServiceProfileTest, EngineMatchesStrategy) {
    NiceMock<MockHttpClient> http;
    EXPECT_EQ(make_probe_engine(*find_service_profile("ollama"), http)->name(), "ollama");
    EXPECT_EQ(make_probe_engine(*find_service_profile("llamacpp"), http)->name(), "llamacpp");
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

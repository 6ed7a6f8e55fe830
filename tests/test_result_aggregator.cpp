#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/ResultAggregator.h"
#include "../src/core/Logging.h"
#include <stdexcept>

namespace infer_scan {

namespace {

ProbeOutcome ollama_hit(std::vector<std::string> models){
    ProbeOutcome o;
    o.status = ProbeStatus::Matched;
    o.api_type = "ollama";
    o.api_version = "new";
    o.endpoint = "/api/tags";
    o.models = std::move(models);
    return o;
}

HostMetadata berlin(){
    HostMetadata m;
    m.country_name = "Germany";
    m.city_name = "Berlin";
    m.org = "Example Hosting";
    m.hostnames = {"gpu1.example.net"};
    return m;
}

}

class ResultAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::instance().set_level(LogLevel::Error); }

    HostLookup counting_lookup(){
        return [this](const std::string& addr, HostMetadata& out, std::string&){
            lookups.push_back(addr);
            out = berlin();
            return true;
        };
    }

    ResultAggregator aggregator{"No accessible Ollama servers found", {"port:11434", "ollama"}};
    std::vector<std::string> lookups;
};

TEST_F(ResultAggregatorTest, OnlyMatchedWithPayloadAreReported) {
    ProbeResults outcomes;
    outcomes[{"1.1.1.1", 11434}] = ollama_hit({"llama3"});
    outcomes[{"2.2.2.2", 11434}] = ollama_hit({});
    outcomes[{"3.3.3.3", 11434}] = ProbeOutcome::not_matched("Unknown API response format");
    outcomes[{"4.4.4.4", 11434}] = ProbeOutcome::unreachable("Connection refused");

    Report report;
    aggregator.aggregate(outcomes, counting_lookup(), 4, report);
    ASSERT_EQ(report.servers().size(), 1u);
    const auto& s = report.servers()[0];
    EXPECT_EQ(s.candidate, (Candidate{"1.1.1.1", 11434}));
    EXPECT_EQ(s.host.org, "Example Hosting");
    EXPECT_EQ(s.host.hostnames, std::vector<std::string>{"gpu1.example.net"});
    // lookups are only spent on reportable hits
    EXPECT_EQ(lookups, std::vector<std::string>{"1.1.1.1"});
    EXPECT_TRUE(report.error().empty());
}

TEST_F(ResultAggregatorTest, FailedLookupDegradesToUnknown) {
    ProbeResults outcomes;
    outcomes[{"1.1.1.1", 11434}] = ollama_hit({"llama3"});
    Report report;
    aggregator.aggregate(outcomes, [](const std::string&, HostMetadata& out, std::string& err){
        out.org = "partial garbage";
        err = "403 Forbidden";
        return false;
    }, 1, report);
    ASSERT_EQ(report.servers().size(), 1u);
    const auto& host = report.servers()[0].host;
    EXPECT_EQ(host.org, "Unknown");
    EXPECT_EQ(host.country_name, "Unknown");
    EXPECT_EQ(host.city_name, "Unknown");
    EXPECT_TRUE(host.hostnames.empty());
}

TEST_F(ResultAggregatorTest, ThrowingLookupDegradesToUnknown) {
    ProbeResults outcomes;
    outcomes[{"1.1.1.1", 11434}] = ollama_hit({"llama3"});
    Report report;
    aggregator.aggregate(outcomes, [](const std::string&, HostMetadata&, std::string&) -> bool {
        throw std::runtime_error("network down");
    }, 1, report);
    ASSERT_EQ(report.servers().size(), 1u);
    EXPECT_EQ(report.servers()[0].host.org, "Unknown");
}

TEST_F(ResultAggregatorTest, LookupCachedPerAddress) {
    ProbeResults outcomes;
    outcomes[{"1.1.1.1", 8080}] = ollama_hit({"a"});
    outcomes[{"1.1.1.1", 8000}] = ollama_hit({"b"});
    Report report;
    aggregator.aggregate(outcomes, counting_lookup(), 2, report);
    EXPECT_EQ(report.servers().size(), 2u);
    EXPECT_EQ(lookups.size(), 1u);
}

TEST_F(ResultAggregatorTest, NothingFoundProducesDiagnosticEnvelope) {
    ProbeResults outcomes;
    outcomes[{"2.2.2.2", 11434}] = ollama_hit({});
    outcomes[{"4.4.4.4", 11434}] = ProbeOutcome::unreachable("timeout");
    Report report;
    aggregator.aggregate(outcomes, counting_lookup(), 7, report);
    EXPECT_FALSE(report.has_servers());
    EXPECT_EQ(report.error(), "No accessible Ollama servers found");
    ASSERT_TRUE(report.debug_info().has_value());
    EXPECT_EQ(report.debug_info()->total_candidates, 7u);
    EXPECT_THAT(report.debug_info()->queries, ::testing::ElementsAre("port:11434", "ollama"));
    EXPECT_TRUE(lookups.empty());
}

TEST_F(ResultAggregatorTest, HeaderOnlyMatchIsReported) {
    ProbeOutcome o;
    o.status = ProbeStatus::Matched;
    o.api_type = "server_header";
    o.endpoint = "/";
    o.server = "llama.cpp";
    ProbeResults outcomes;
    outcomes[{"9.9.9.9", 8080}] = o;
    Report report;
    aggregator.aggregate(outcomes, counting_lookup(), 1, report);
    EXPECT_EQ(report.servers().size(), 1u);
}

}

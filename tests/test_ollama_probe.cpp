#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Mocks.h"
#include "../src/probes/OllamaProbe.h"
#include "../src/core/ModelListing.h"
#include "../src/core/Logging.h"

namespace infer_scan {

using ::testing::_;
using ::testing::Return;
using ::testing::Field;
using ::testing::HasSubstr;

class OllamaProbeTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::instance().set_level(LogLevel::Error); }

    ProbeOutcome probe_with(std::optional<HttpResponse> resp){
        EXPECT_CALL(http, get(_, _)).WillOnce(Return(resp));
        OllamaProbe probe(http);
        return probe.probe({"1.2.3.4", 11434}, std::chrono::seconds(5));
    }

    MockHttpClient http;
};

TEST_F(OllamaProbeTest, RequestsTagsEndpointWithTimeout) {
    EXPECT_CALL(http, get(Field(&HttpRequest::url, "http://1.2.3.4:11434/api/tags"), _))
        .WillOnce([](const HttpRequest& req, std::string&){
            EXPECT_EQ(req.timeout, std::chrono::milliseconds(3000));
            return std::optional<HttpResponse>(make_response(200, R"({"models":[]})"));
        });
    OllamaProbe probe(http);
    probe.probe({"1.2.3.4", 11434}, std::chrono::seconds(3));
}

TEST_F(OllamaProbeTest, CurrentApiModelsListMatches) {
    auto o = probe_with(make_response(200, R"({"models":[{"name":"llama3","size":4661224676,"digest":"abc"},{"name":"mistral"}]})"));
    ASSERT_EQ(o.status, ProbeStatus::Matched);
    EXPECT_EQ(o.api_type, "ollama");
    EXPECT_EQ(o.api_version, "new");
    EXPECT_EQ(o.endpoint, "/api/tags");
    EXPECT_THAT(o.models, ::testing::ElementsAre("llama3", "mistral"));
    ASSERT_EQ(o.entries.size(), 2u);
    EXPECT_EQ(o.entries[0].size.get<long long>(), 4661224676LL);
    EXPECT_EQ(o.entries[0].digest, "abc");
    EXPECT_EQ(o.entries[1].size, "Unknown");
    EXPECT_EQ(o.entries[1].digest, "Unknown");
    EXPECT_EQ(o.entries[1].details["name"], "mistral");
    EXPECT_TRUE(o.has_payload());
}

TEST_F(OllamaProbeTest, LegacyTagsListMatches) {
    auto o = probe_with(make_response(200, R"({"tags":[{"name":"llama2:7b"}]})"));
    ASSERT_TRUE(o.matched());
    EXPECT_EQ(o.api_version, "old");
    EXPECT_THAT(o.models, ::testing::ElementsAre("llama2:7b"));
}

TEST_F(OllamaProbeTest, ModelsKeyTakesPrecedenceOverTags) {
    auto o = probe_with(make_response(200, R"({"tags":[{"name":"old"}],"models":[{"name":"new"}]})"));
    ASSERT_TRUE(o.matched());
    EXPECT_THAT(o.models, ::testing::ElementsAre("new"));
}

TEST_F(OllamaProbeTest, EmptyModelListMatchesWithoutPayload) {
    auto o = probe_with(make_response(200, R"({"models":[]})"));
    EXPECT_TRUE(o.matched());
    EXPECT_FALSE(o.has_payload());
}

TEST_F(OllamaProbeTest, ConnectionFailureIsUnreachable) {
    EXPECT_CALL(http, get(_, _)).WillOnce(FailTransport(std::string("Connection refused")));
    OllamaProbe probe(http);
    auto o = probe.probe({"5.6.7.8", 11434}, std::chrono::seconds(5));
    EXPECT_EQ(o.status, ProbeStatus::Unreachable);
    EXPECT_THAT(o.detail, HasSubstr("Connection refused"));
}

TEST_F(OllamaProbeTest, ErrorStatusIsNotMatched) {
    auto o = probe_with(make_response(404, "404 page not found"));
    EXPECT_EQ(o.status, ProbeStatus::NotMatched);
    EXPECT_THAT(o.detail, HasSubstr("404"));
}

TEST_F(OllamaProbeTest, MalformedBodyIsNotMatched) {
    auto o = probe_with(make_response(200, "<html>hello</html>"));
    EXPECT_EQ(o.status, ProbeStatus::NotMatched);
    EXPECT_EQ(o.detail, "JSON parsing failed");
}

TEST_F(OllamaProbeTest, UnknownShapeKeepsRawBody) {
    auto o = probe_with(make_response(200, R"({"status":"ok"})"));
    EXPECT_EQ(o.status, ProbeStatus::NotMatched);
    EXPECT_EQ(o.detail, "Unknown API response format");
    EXPECT_EQ(o.data["status"], "ok");
}

TEST_F(OllamaProbeTest, TopLevelArrayIsNotMatched) {
    auto o = probe_with(make_response(200, R"([{"name":"x"}])"));
    EXPECT_EQ(o.status, ProbeStatus::NotMatched);
    EXPECT_TRUE(o.data.is_array());
}

TEST_F(OllamaProbeTest, EntryWithoutNameIsNotMatched) {
    auto o = probe_with(make_response(200, R"({"models":[{"name":"ok"},{"size":1}]})"));
    EXPECT_EQ(o.status, ProbeStatus::NotMatched);
    EXPECT_TRUE(o.models.empty());
}

TEST_F(OllamaProbeTest, ListingPrintsEachModel) {
    OllamaProbe probe(http);
    auto o = probe.classify(R"({"models":[{"name":"llama3","size":10,"digest":"d1"}]})");
    std::string text = format_model_listing(o);
    EXPECT_THAT(text, HasSubstr("Found 1 models:"));
    EXPECT_THAT(text, HasSubstr("Model Name: llama3"));
    EXPECT_THAT(text, HasSubstr("Model Size: 10"));
    EXPECT_THAT(text, HasSubstr("Model Digest: d1"));
}

TEST_F(OllamaProbeTest, ListingReportsError) {
    std::string text = format_model_listing(ProbeOutcome::unreachable("Request failed: timeout"));
    EXPECT_THAT(text, HasSubstr("Error: Request failed: timeout"));
}

}

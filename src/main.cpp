#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include "core/Config.h"
#include "core/CurlHttpClient.h"
#include "core/DiscoveryPipeline.h"
#include "core/JSONWriter.h"
#include "core/Logging.h"
#include "core/ModelListing.h"
#include "core/Report.h"
#include "core/ServiceProfile.h"
#include "core/Utils.h"
#include "search/ShodanClient.h"
#include "BuildInfo.h"
#include <iostream>
#include <fstream>
#include <chrono>

using namespace infer_scan;

static int run_single_host(const Config& cfg, const ServiceProfile& profile, HttpClient& http){
    auto engine = make_probe_engine(profile, http);
    Candidate c{cfg.target, cfg.target_port ? cfg.target_port : profile.lookup_port()};
    std::cout << "Connecting to " << c.to_string() << " ...\n";
    ProbeOutcome outcome;
    try {
        outcome = engine->probe(c, std::chrono::seconds(cfg.timeout_seconds));
    } catch(const std::exception& ex){
        outcome = ProbeOutcome::unreachable(std::string("An error occurred: ") + ex.what());
    }
    std::cout << format_model_listing(outcome);
    return outcome.matched() ? 0 : 1;
}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();

    ConfigValidator validator;
    validator.resolve_credentials(cfg);
    if(!validator.load_queries_file(cfg)) return 2;
    if(!validator.validate(cfg)) return 2;
    Logger::instance().set_level(log_level_for(cfg));

    const ServiceProfile& profile = *find_service_profile(cfg.service);
    CurlHttpClient http(std::string("infer-scan/") + buildinfo::APP_VERSION);

    if(!cfg.target.empty()) return run_single_host(cfg, profile, http);

    Report report;
    try {
        ShodanClient index(cfg.api_key, http, cfg.search_base_url);
        auto engine = make_probe_engine(profile, http);
        DiscoveryPipeline pipeline(cfg, profile, index, *engine);
        pipeline.run(report);
    } catch(const std::exception& ex){
        Logger::instance().error(ex.what());
        report.set_error(std::string("An error occurred: ") + ex.what());
    }

    JSONWriter writer;
    std::string json = writer.write(report, cfg);

    std::string out = cfg.output_file;
    if(out.empty()) out = profile.output_prefix + "_" + utils::timestamp_suffix(std::chrono::system_clock::now()) + ".json";
    if(out == "-"){
        std::cout << json << "\n";
        return 0;
    }
    std::ofstream ofs(out);
    if(!ofs){ std::cerr << "Failed to open output file: " << out << "\n"; return 1; }
    ofs << json << "\n";
    if(!ofs){ std::cerr << "Failed to write output file: " << out << "\n"; return 1; }
    Logger::instance().info("Results saved to: " + out);
    return 0;
}

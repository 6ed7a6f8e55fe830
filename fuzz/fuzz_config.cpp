#include "core/Config.h"
#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include "core/Logging.h"
#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    // split on spaces; argv[0] is the program name
    std::vector<std::string> args{"infer-scan"};
    size_t pos = 0;
    while (pos < input.size()) {
        size_t next = input.find(' ', pos);
        if (next == std::string::npos) {
            args.push_back(input.substr(pos));
            break;
        }
        args.push_back(input.substr(pos, next - pos));
        pos = next + 1;
    }

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }

    infer_scan::Logger::instance().set_level(infer_scan::LogLevel::Error);
    infer_scan::ArgumentParser parser;
    infer_scan::Config cfg;
    if (parser.parse(static_cast<int>(argv.size()), argv.data(), cfg)) {
        infer_scan::ConfigValidator validator;
        (void)validator.validate(cfg);
    }
    return 0;
}

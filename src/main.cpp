#include "core/config_loader.h"
#include "core/logger.h"
#include "detector/injection_detector.h"
#include "ingest/email_assessment.h"
#include "mime/email_extractor.h"
#include "mime/mime_parser.h"
#include "monitoring/metrics.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--config FILE] [--metrics] FILE.eml...\n"
              << "  Scans each RFC 5322 message for prompt-injection content and\n"
              << "  prints one JSON assessment per file.\n"
              << "  --config FILE  YAML configuration (default: $CONFIG_PATH)\n"
              << "  --metrics      print scan counters after the assessments\n";
}

bool readFile(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath;
    bool printMetrics = false;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--metrics") {
            printMetrics = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    if (configPath.empty()) {
        const char* envConfig = std::getenv("CONFIG_PATH");
        if (envConfig)
            configPath = envConfig;
    }

    std::unique_ptr<InjectionDetector> detector;
    try {
        AppConfig cfg;
        if (!configPath.empty())
            cfg = ConfigLoader::loadFromFile(configPath);

        Logger::instance().setFile(cfg.logFile);
        Logger::instance().setLevel(logLevelFromString(cfg.logLevel));

        detector = std::make_unique<InjectionDetector>(cfg.detectorConfig());
    } catch (const std::exception& e) {
        Logger::instance().log(LogLevel::Error, std::string("Startup failed: ") + e.what());
        return 1;
    }

    bool flagged = false;
    bool unreadable = false;
    for (const auto& path : files) {
        json out = {{"file", path}};

        std::string raw;
        if (!readFile(path, raw)) {
            Logger::instance().log(LogLevel::Error, "Cannot read " + path);
            out["error"] = "unreadable";
            std::cout << out.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
            unreadable = true;
            continue;
        }

        InboundEmail email = EmailExtractor::extract(MimeParser::parse(raw));
        EmailAssessment assessment = assessEmail(*detector, email);
        if (assessment.status != EmailStatus::Safe)
            flagged = true;

        out.update(toJson(assessment));
        std::cout << out.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    }

    if (printMetrics)
        std::cout << Metrics::instance().renderPrometheus();

    if (unreadable)
        return 1;
    return flagged ? 2 : 0;
}

#define ELPP_DEFAULT_LOG_FILE "var/log/chatguard.log"
#include "easylogging++.h"

#include "ChatGuardApp.hpp"
#include "LogRedactor.hpp"

#include <boost/program_options.hpp>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef __GNUC__
#include <execinfo.h>
#include <unistd.h>
#endif

INITIALIZE_EASYLOGGINGPP

ChatGuardConfig BuildConfiguration(int argc, const char* argv[]);

#ifdef __GNUC__
void SignalHandler(int sig);
#endif

int main(int argc, const char* argv[]) {
#ifdef __GNUC__
    signal(SIGSEGV, SignalHandler);
#endif

    auto config = BuildConfiguration(argc, argv);

    el::Loggers::setDefaultConfigurations(config.loggerConfig, true);
    START_EASYLOGGINGPP(argc, argv);
    InstallRedactingLogDispatcher();

    try {
        ChatGuardApp app{config, std::cout};

        std::string line;
        while (app.IsRunning() && std::getline(std::cin, line)) {
            app.HandleLine(line);
        }
    } catch (const std::exception& e) {
        LOG(ERROR) << "chatguard stopped: " << e.what();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

ChatGuardConfig BuildConfiguration(int argc, const char* argv[]) {
    namespace po = boost::program_options;
    ChatGuardConfig config;
    std::string configFile;

    auto ResolveDefaultPath = [](const std::vector<std::string>& candidatePaths) {
        for (const auto& candidatePath : candidatePaths) {
            std::ifstream candidate(candidatePath.c_str());
            if (candidate.good()) {
                return candidatePath;
            }
        }

        return candidatePaths.empty() ? std::string{} : candidatePaths.front();
    };

    // Declare a group of options that will be
    // allowed only on command line
    po::options_description generic("Generic options");
    generic.add_options()
        ("help,h", "produces help message")
        ("config,c", po::value<std::string>(&configFile)->default_value("etc/chatguard/chatguard.cfg"),
            "sets path to the configuration file")
        ("logger_config", po::value<std::string>(&config.loggerConfig)->default_value("etc/chatguard/logger.cfg"),
            "sets path to the logger configuration file")
        ;

    po::options_description options("Configuration");
    options.add_options()
        ("cache_capacity", po::value<uint32_t>(&config.cacheCapacity)->default_value(1000),
            "maximum number of cached verdicts")
        ("rate_messages_per_second", po::value<double>(&config.rateMessagesPerSecond)->default_value(10.0),
            "enforced actions per second allowed for one source")
        ("rate_burst_size", po::value<double>(&config.rateBurstSize)->default_value(20.0),
            "enforced actions a source may trigger at once before throttling")
        ("rate_max_tracked_sources", po::value<uint32_t>(&config.rateMaxTrackedSources)->default_value(10000),
            "number of sources whose rate budget is tracked")
        ("worker_threads", po::value<uint32_t>(&config.workerThreads)->default_value(4),
            "size of the scoring worker pool")
        ("text_scorer_timeout_ms", po::value<uint32_t>(&config.textScorerTimeoutMs)->default_value(2000),
            "timeout for one text scoring unit")
        ("image_scorer_timeout_ms", po::value<uint32_t>(&config.imageScorerTimeoutMs)->default_value(5000),
            "timeout for one image or video frame scoring unit")
        ("max_video_frames", po::value<uint32_t>(&config.maxVideoFrames)->default_value(8),
            "frames sampled from each video")
        ("max_text_bytes", po::value<uint32_t>(&config.maxTextBytes)->default_value(4 * 1024),
            "largest accepted text message")
        ("max_image_bytes", po::value<uint32_t>(&config.maxImageBytes)->default_value(10 * 1024 * 1024),
            "largest accepted image")
        ("max_video_bytes", po::value<uint32_t>(&config.maxVideoBytes)->default_value(50 * 1024 * 1024),
            "largest accepted video")
        ("reject_malformed_text", po::value<bool>(&config.rejectMalformedText)->default_value(false),
            "when true, text that is not valid UTF-8 is rejected instead of repaired")
        ("allowed_chat", po::value<std::vector<std::string>>(&config.allowedChats)->composing(),
            "chat allowed to use the service (repeatable; none means every chat)")
        ("media_root", po::value<std::string>(&config.mediaRoot)->default_value("var/chatguard/media"),
            "directory media paths are resolved against")
        ("scratch_directory", po::value<std::string>(&config.scratchDirectory)->default_value("var/chatguard/scratch"),
            "directory for temporary files created while decoding video")
        ("policy_file", po::value<std::string>(&config.policyFile)->default_value(""),
            "file with one policy sentence per line")
        ("policy_rule", po::value<std::vector<std::string>>(&config.policyRules)->composing(),
            "structured rule kind:threshold:action[:pattern] (repeatable)")
        ("default_rule_threshold", po::value<double>(&config.defaultRuleThreshold)->default_value(0.8),
            "threshold given to rules parsed from sentences")
        ("master_key_path", po::value<std::string>(&config.masterKeyPath)->default_value("var/chatguard/master.key"),
            "local master key used to seal secrets (created when missing)")
        ("secret_store_path", po::value<std::string>(&config.secretStorePath)->default_value("var/chatguard/secrets.db"),
            "sqlite database holding sealed secrets")
        ("platform_credential", po::value<std::string>(&config.platformCredential)->default_value(""),
            "messaging platform credential, plain or sealed (can be overridden by CHATGUARD_PLATFORM_TOKEN)")
        ("degraded_status_threshold", po::value<double>(&config.degradedStatusThreshold)->default_value(0.25),
            "share of degraded requests above which health reports degraded")
        ("threat_window_minutes", po::value<uint32_t>(&config.threatWindowMinutes)->default_value(5),
            "window for coordinated spam and link farming detection")
        ;

    po::options_description cmdline_options;
    cmdline_options.add(generic).add(options);

    po::options_description config_file_options;
    config_file_options.add(options);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(cmdline_options).allow_unregistered().run(), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << cmdline_options << "\n";
        exit(EXIT_SUCCESS);
    }

    if (vm["config"].defaulted()) {
        configFile = ResolveDefaultPath({"chatguard.cfg", configFile});
    }
    if (vm["logger_config"].defaulted()) {
        config.loggerConfig = ResolveDefaultPath({"logger.cfg", config.loggerConfig});
    }

    std::ifstream ifs(configFile.c_str());
    if (!ifs) {
        throw std::runtime_error("Cannot open configuration file: " + configFile);
    }

    po::store(po::parse_config_file(ifs, config_file_options), vm);
    po::notify(vm);

    const char* credentialFromEnv = std::getenv("CHATGUARD_PLATFORM_TOKEN");
    if (credentialFromEnv != nullptr) {
        config.platformCredential = credentialFromEnv;
    }

    return config;
}

#ifdef __GNUC__
void SignalHandler(int sig) {
    const int BACKTRACE_LIMIT = 10;
    void *arr[BACKTRACE_LIMIT];
    auto size = backtrace(arr, BACKTRACE_LIMIT);

    fprintf(stderr, "Error: signal %d:\n", sig);
    backtrace_symbols_fd(arr, size, STDERR_FILENO);
    exit(1);
}
#endif

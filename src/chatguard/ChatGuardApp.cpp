#include "ChatGuardApp.hpp"

#include "ActionDispatcher.hpp"
#include "DatabaseFactory.hpp"
#include "SecretManager.hpp"
#include "SecretStore.hpp"
#include "scoring/FrameSampler.hpp"
#include "scoring/ImageHeuristicScorer.hpp"
#include "scoring/KeywordTextScorer.hpp"

#include "easylogging++.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
const char PLATFORM_CREDENTIAL_NAME[] = "platform_credential";

std::string RestOfLine(std::istream& in) {
    std::string rest;
    std::getline(in >> std::ws, rest);
    return rest;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point timestamp) {
    const auto time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

const char* Flag(bool value) { return value ? "1" : "0"; }
} // namespace

ChatGuardApp::ChatGuardApp(ChatGuardConfig& config, std::ostream& out)
    : config_{config}
    , out_{out}
    , parser_{config.defaultRuleThreshold}
    , loader_{parser_}
    , registry_{config.workerThreads} {
    SetupSecrets();

    registry_.Register(std::make_shared<scoring::KeywordTextScorer>(
        std::chrono::milliseconds(config_.textScorerTimeoutMs)));
    registry_.Register(std::make_shared<scoring::ImageHeuristicScorer>(
        std::chrono::milliseconds(config_.imageScorerTimeoutMs)));

    // Scratch files for video decoding live under the validator's scratch
    // directory.
    frameSampler_ = std::make_unique<scoring::OpenCvFrameSampler>(
        [this](const std::string& fileName) { return service_->Validator().ScratchPath(fileName); });

    service_ = std::make_unique<ModerationService>(config_, registry_, *frameSampler_);
    service_->SetViolationListener([](const ViolationRecord& record) {
        LOG(DEBUG) << "violation feed: " << policy::ToString(record.kind) << " in " << record.chatId;
    });

    if (!ReloadPolicy()) {
        LOG(WARNING) << "Starting without an active policy; every item is reported as non-violating";
    }
}

ChatGuardApp::~ChatGuardApp() = default;

void ChatGuardApp::HandleLine(const std::string& line) {
    std::istringstream in{line};
    std::string command;
    if (!(in >> command)) {
        return;
    }

    if (command == "text") {
        HandleModeration(Modality::Text, in);
    } else if (command == "image") {
        HandleModeration(Modality::Image, in);
    } else if (command == "video") {
        HandleModeration(Modality::Video, in);
    } else if (command == "health") {
        out_ << FormatHealth(service_->Health()) << std::endl;
    } else if (command == "patterns") {
        HandlePatterns(in);
    } else if (command == "violations") {
        HandleViolations();
    } else if (command == "reload") {
        const bool reloaded = ReloadPolicy();
        const auto active = service_->ActivePolicy();
        out_ << "RELOAD " << (reloaded ? "ok" : "failed") << " rules=" << (active ? active->Size() : 0)
             << std::endl;
    } else if (command == "quit") {
        running_ = false;
    } else {
        out_ << "ERROR unknown command " << command << std::endl;
    }
}

bool ChatGuardApp::ReloadPolicy() {
    std::vector<policy::RuleRecord> records;
    std::vector<policy::ParseError> recordErrors;
    for (const auto& text : config_.policyRules) {
        try {
            records.push_back(policy::PolicyLoader::ParseRecord(text));
        } catch (const policy::ParseError& e) {
            recordErrors.push_back(e);
        }
    }

    policy::PolicyLoadResult result;
    if (!recordErrors.empty()) {
        result.errors = std::move(recordErrors);
    } else if (!config_.policyFile.empty()) {
        result = loader_.FromFile(config_.policyFile, records);
    } else if (!records.empty()) {
        result = loader_.FromRecords(records);
    } else {
        LOG(WARNING) << "No policy_file or policy_rule configured";
        return false;
    }

    if (!result.Ok()) {
        for (const auto& error : result.errors) {
            LOG(ERROR) << "Policy rejected (" << policy::ToString(error.Kind()) << "): " << error.what();
        }
        return false;
    }

    service_->InstallPolicy(result.policy);
    return true;
}

std::string ChatGuardApp::FormatResult(const ModerationResult& result) {
    std::ostringstream out;
    if (result.rejected) {
        out << "REJECTED " << result.rejectionReason << " reason=\"" << result.reason << "\"";
        return out.str();
    }

    out << "RESULT violation=" << Flag(result.isViolation) << " kind=" << policy::ToString(result.kind)
        << " confidence=" << std::fixed << std::setprecision(2) << result.confidence
        << " action=" << policy::ToString(result.action) << " cached=" << Flag(result.cached)
        << " degraded=" << Flag(result.degraded) << " throttled=" << Flag(result.throttled)
        << " latency_us=" << result.latency.count() << " hash=" << result.contentHash
        << " reason=\"" << result.reason << "\"";
    return out.str();
}

std::string ChatGuardApp::FormatHealth(const HealthReport& report) {
    std::ostringstream out;
    out << "HEALTH status=" << report.status << " cache_size=" << report.cacheSize
        << " degraded_rate=" << std::fixed << std::setprecision(3) << report.degradedRequestRate
        << " checked=" << report.messagesChecked << " violations=" << report.violationsFound
        << " actions=" << report.actionsTaken << " throttled=" << report.throttledActions
        << " rejected=" << report.rejectedRequests;
    return out.str();
}

void ChatGuardApp::SetupSecrets() {
    secretManager_ = std::make_unique<SecretManager>(SecretManager::LoadOrCreateMasterKey(config_.masterKeyPath));
    db_ = CreateDatabaseConnection(config_);
    secretStore_ = std::make_unique<SecretStore>(*db_);

    std::string sealed;
    if (!config_.platformCredential.empty()) {
        sealed = SecretManager::LooksSealed(config_.platformCredential)
            ? config_.platformCredential
            : secretManager_->Seal(config_.platformCredential);
        WipeSecret(config_.platformCredential);
        secretStore_->Store(PLATFORM_CREDENTIAL_NAME, sealed);
        LOG(INFO) << "Platform credential sealed and stored";
    } else if (auto stored = secretStore_->Load(PLATFORM_CREDENTIAL_NAME)) {
        sealed = *stored;
    }

    if (sealed.empty()) {
        LOG(WARNING) << "No platform credential configured; enforced actions are logged only";
        return;
    }

    credential_ = std::make_unique<PlatformCredential>(*secretManager_, sealed);

    // Throws IntegrityError when the stored credential was tampered with or
    // sealed under another master key.
    credential_->WithPlaintext([](const std::string&) {});

    dispatcher_ = std::make_unique<SignedActionDispatcher>(*credential_, out_);
}

void ChatGuardApp::HandleModeration(Modality modality, std::istream& args) {
    ContentItem item;
    item.modality = modality;

    if (!(args >> item.sourceId >> item.chatId)) {
        out_ << "ERROR usage: " << ToString(modality) << " <source> <chat> "
             << (modality == Modality::Text ? "<message>" : "<path> [caption]") << std::endl;
        return;
    }

    if (modality == Modality::Text) {
        item.payload = RestOfLine(args);
    } else {
        args >> item.mediaPath;
        item.caption = RestOfLine(args);
    }

    const auto result = service_->Moderate(item);
    out_ << FormatResult(result) << std::endl;

    if (!result.isViolation || !policy::IsActiveAction(result.action)) {
        return;
    }

    EnforcementAction action;
    action.chatId = item.chatId;
    action.sourceId = item.sourceId;
    action.contentHash = result.contentHash;
    action.kind = result.kind;
    action.action = result.action;
    action.confidence = result.confidence;

    if (dispatcher_) {
        dispatcher_->Dispatch(action);
    } else {
        LOG(INFO) << "Would " << policy::ToString(action.action) << " message from " << action.sourceId << " in "
                  << action.chatId;
    }
}

void ChatGuardApp::HandlePatterns(std::istream& args) {
    std::string chatId;
    if (!(args >> chatId)) {
        out_ << "ERROR usage: patterns <chat>" << std::endl;
        return;
    }

    const auto patterns = service_->CheckThreatPatterns(chatId);
    for (const auto& pattern : patterns) {
        std::string users;
        for (const auto& user : pattern.affectedUsers) {
            users += (users.empty() ? "" : ",") + user;
        }

        out_ << "PATTERN " << ToString(pattern.type) << " confidence=" << std::fixed << std::setprecision(2)
             << pattern.confidence << " action=" << pattern.recommendedAction << " users=" << users << " "
             << pattern.evidence << std::endl;
    }

    out_ << "PATTERNS " << patterns.size() << std::endl;
}

void ChatGuardApp::HandleViolations() {
    const auto violations = service_->RecentViolations();
    for (const auto& record : violations) {
        out_ << "VIOLATION " << FormatTimestamp(record.timestamp) << " chat=" << record.chatId
             << " source=" << record.sourceId << " modality=" << ToString(record.modality)
             << " kind=" << policy::ToString(record.kind) << " confidence=" << std::fixed << std::setprecision(2)
             << record.confidence << " action=" << policy::ToString(record.action) << std::endl;
    }

    out_ << "VIOLATIONS " << violations.size() << std::endl;
}

#include "catch.hpp"

#include "policy/PolicyLoader.hpp"

#include <boost/filesystem.hpp>

#include <fstream>

using namespace policy;

namespace {

std::string WriteTempFile(const std::string& contents) {
    auto path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("policy-%%%%-%%%%.txt");
    std::ofstream out{path.string().c_str()};
    out << contents;
    return path.string();
}

} // namespace

SCENARIO("structured rule records are parsed from configuration text", "[policy][loader]") {
    auto record = PolicyLoader::ParseRecord("spam:0.8:delete");
    REQUIRE(record.kind == "spam");
    REQUIRE(record.threshold == Approx(0.8));
    REQUIRE(record.action == "delete");
    REQUIRE(record.pattern.empty());

    auto withPattern = PolicyLoader::ParseRecord("custom: 1.0 : warn : https?://bad\\.example");
    REQUIRE(withPattern.kind == "custom");
    REQUIRE(withPattern.action == "warn");
    REQUIRE(withPattern.pattern == "https?://bad\\.example");

    REQUIRE_THROWS_AS(PolicyLoader::ParseRecord("spam:0.8"), ParseError);
    REQUIRE_THROWS_AS(PolicyLoader::ParseRecord("spam:high:delete"), ParseError);
}

SCENARIO("a valid record set becomes an ordered policy", "[policy][loader]") {
    RuleParser parser;
    PolicyLoader loader{parser};

    auto result = loader.FromRecords({{"spam", 0.8, "delete", ""}, {"nsfw", 0.7, "warn", ""}});

    REQUIRE(result.Ok());
    REQUIRE(result.policy->Size() == 2);
    REQUIRE(result.policy->Rules()[0].kind == RuleKind::Spam);
    REQUIRE(result.policy->Rules()[1].kind == RuleKind::Nsfw);
    REQUIRE(result.policy->Kinds().count(RuleKind::Nsfw) == 1);
}

SCENARIO("policies are built all-or-nothing", "[policy][loader]") {
    RuleParser parser;
    PolicyLoader loader{parser};

    WHEN("one record has a threshold outside [0, 1]") {
        auto result = loader.FromRecords({{"spam", 0.8, "delete", ""}, {"nsfw", 1.5, "warn", ""}});

        THEN("no policy is produced") {
            REQUIRE_FALSE(result.Ok());
            REQUIRE(result.policy == nullptr);
            REQUIRE(result.errors.size() == 1);
        }
    }

    WHEN("two rules share a kind") {
        auto result = loader.FromRecords({{"spam", 0.8, "delete", ""}, {"spam", 0.5, "log", ""}});

        THEN("the duplicate is reported") {
            REQUIRE_FALSE(result.Ok());
            REQUIRE(result.errors.size() == 1);
        }
    }

    WHEN("a record names an unknown kind or action") {
        auto result = loader.FromRecords({{"weather", 0.8, "delete", ""}, {"spam", 0.8, "explode", ""}});

        THEN("every bad record is reported") {
            REQUIRE_FALSE(result.Ok());
            REQUIRE(result.errors.size() == 2);
            REQUIRE(result.errors[0].Kind() == ParseErrorKind::Syntax);
            REQUIRE(result.errors[0].Pattern().empty());
        }
    }

    WHEN("a custom record has an unsafe pattern") {
        auto result = loader.FromRecords({{"custom", 0.5, "delete", "(a+)+"}});

        THEN("the policy is rejected") {
            REQUIRE_FALSE(result.Ok());
        }
    }

    WHEN("a custom record repeats an ambiguous alternation") {
        auto result = loader.FromRecords({{"custom", 0.5, "delete", "(a|aa)*c"}});

        THEN("the policy is rejected and the error keeps its kind and pattern") {
            REQUIRE_FALSE(result.Ok());
            REQUIRE(result.errors.size() == 1);
            REQUIRE(result.errors[0].Kind() == ParseErrorKind::UnsafePattern);
            REQUIRE(result.errors[0].Pattern() == "(a|aa)*c");
        }
    }

    WHEN("a custom record has neither a pattern nor a length limit") {
        auto result = loader.FromRecords({{"custom", 0.5, "delete", ""}});

        THEN("the policy is rejected") {
            REQUIRE_FALSE(result.Ok());
        }
    }
}

SCENARIO("records come before sentence rules", "[policy][loader]") {
    RuleParser parser;
    PolicyLoader loader{parser};

    auto result = loader.FromSources({{"nsfw", 0.6, "delete", ""}}, {"Warn about harassment"});

    REQUIRE(result.Ok());
    REQUIRE(result.policy->Rules()[0].kind == RuleKind::Nsfw);
    REQUIRE(result.policy->Rules()[1].kind == RuleKind::Harassment);
}

SCENARIO("policy files hold one sentence per line", "[policy][loader]") {
    RuleParser parser;
    PolicyLoader loader{parser};

    GIVEN("a file with comments and blank lines") {
        const auto path = WriteTempFile("# community rules\n\nNo spam\nWarn about harassment\n");

        THEN("only the sentences are loaded") {
            auto result = loader.FromFile(path);
            REQUIRE(result.Ok());
            REQUIRE(result.policy->Size() == 2);
        }

        boost::filesystem::remove(path);
    }

    GIVEN("a file with one sentence outside the vocabulary") {
        const auto path = WriteTempFile("No spam\nthe weather is nice\n");

        THEN("the whole file is rejected") {
            auto result = loader.FromFile(path);
            REQUIRE_FALSE(result.Ok());
            REQUIRE(result.errors.size() == 1);
        }

        boost::filesystem::remove(path);
    }

    GIVEN("a file that does not exist") {
        auto result = loader.FromFile("/nonexistent/chatguard/policy.txt");

        THEN("the failure is reported as an error") {
            REQUIRE_FALSE(result.Ok());
            REQUIRE(result.errors.size() == 1);
        }
    }
}

#include <catch2/catch_test_macros.hpp>
#include "IgnorePolicy.hpp"
#include "Settings.hpp"

TEST_CASE("match_glob handles wildcards") {
    REQUIRE(IgnorePolicy::match_glob("draft.tmp", "*.tmp"));
    REQUIRE(IgnorePolicy::match_glob("a.swp", "?.swp"));
    REQUIRE(IgnorePolicy::match_glob("Thumbs.db", "Thumbs.db"));
    REQUIRE(IgnorePolicy::match_glob("anything", "*"));
    REQUIRE_FALSE(IgnorePolicy::match_glob("draft.tmpx", "*.tmp"));
    REQUIRE_FALSE(IgnorePolicy::match_glob("ab.swp", "?.swp"));
}

TEST_CASE("default patterns skip temp files and VCS directories") {
    IgnorePolicy policy(Settings::default_ignore_patterns());

    REQUIRE(policy.should_ignore("/home/u/work/file.part"));
    REQUIRE(policy.should_ignore("/home/u/work/.DS_Store"));
    REQUIRE(policy.should_ignore("/home/u/repo/.git/config"));
    REQUIRE(policy.should_ignore("/home/u/app/node_modules/pkg/index.js"));
    REQUIRE_FALSE(policy.should_ignore("/home/u/Documents/report.pdf"));
    REQUIRE_FALSE(policy.should_ignore("/home/u/gitnotes/readme.md"));
}

TEST_CASE("trailing slashes and leading globstars are normalized") {
    IgnorePolicy policy({"build/", "**/cache"});

    REQUIRE(policy.should_ignore("/proj/build/out.o"));
    REQUIRE(policy.should_ignore("/proj/cache/blob"));
    REQUIRE_FALSE(policy.should_ignore("/proj/src/main.cpp"));
}

TEST_CASE("an empty policy ignores nothing") {
    IgnorePolicy policy({});
    REQUIRE_FALSE(policy.should_ignore("/tmp/x.tmp"));
}

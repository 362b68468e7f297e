#include "test_common.hpp"

using namespace ghbackup;

TEST_CASE("percent_for maps the transfer phase onto 10..100") {
    REQUIRE(percent_for(1, 3) == 40);
    REQUIRE(percent_for(2, 3) == 70);
    REQUIRE(percent_for(3, 3) == 100);
    REQUIRE(percent_for(0, 4) == 10);
    REQUIRE(percent_for(1, 7) == 22);
}

TEST_CASE("percent_for always ends at exactly 100") {
    for (size_t total = 1; total <= 250; ++total) {
        int prev = LISTING_DONE_PERCENT;
        for (size_t i = 1; i <= total; ++i) {
            int p = percent_for(i, total);
            REQUIRE(p >= prev);
            prev = p;
        }
        REQUIRE(prev == COMPLETE_PERCENT);
    }
}

TEST_CASE("percent_for with nothing to transfer is complete") {
    REQUIRE(percent_for(0, 0) == 100);
}

TEST_CASE("ProgressReporter never goes backwards") {
    std::vector<int> seen;
    ProgressReporter rep([&](int p) { seen.push_back(p); });
    rep.report(0);
    rep.report(10);
    rep.report(5);
    rep.report(40);
    rep.report(40);
    rep.report(150);
    REQUIRE(seen == std::vector<int>{0, 10, 40, 40, 100});
    REQUIRE(rep.last() == 100);
}

TEST_CASE("ProgressReporter tolerates an empty sink") {
    ProgressReporter rep(nullptr);
    rep.report(70);
    REQUIRE(rep.last() == 70);
}

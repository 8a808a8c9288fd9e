#include <doctest/doctest.h>
#include <cmdtree/errors.hpp>
#include <cmdtree/resolver.hpp>

#include "../test_helpers.hpp"

#include <algorithm>

using namespace cmdtree;
using cmdtree::test::contains;
using cmdtree::test::error_message;

namespace {

// Implementation producing a command named after its tag; counts invocations
Implementation make_impl(const std::string& tag, ReleaseTrackSet tracks, int* calls = nullptr) {
    Implementation impl;
    impl.tracks = std::move(tracks);
    impl.producer = [tag, calls]() {
        if (calls) ++*calls;
        return make_command(tag);
    };
    return impl;
}

const std::string FILE_NAME = "/tree/compute/create.yaml";

} // namespace

// ============================================================================
// Single implementation
// ============================================================================

TEST_CASE("single wildcard implementation resolves for every track") {
    std::vector<Implementation> impls = {make_impl("only", {})};
    for (auto track : all_release_tracks()) {
        auto producer = extract_release_track_implementation(FILE_NAME, track, impls);
        CHECK(producer()->name() == "only");
    }
}

TEST_CASE("single implementation resolves for a declared track") {
    std::vector<Implementation> impls = {make_impl("beta", {ReleaseTrack::BETA, ReleaseTrack::ALPHA})};
    CHECK(extract_release_track_implementation(FILE_NAME, ReleaseTrack::BETA, impls)()->name() == "beta");
    CHECK(extract_release_track_implementation(FILE_NAME, ReleaseTrack::ALPHA, impls)()->name() == "beta");
}

TEST_CASE("single implementation without the requested track is not implemented") {
    std::vector<Implementation> impls = {make_impl("beta", {ReleaseTrack::BETA})};
    auto msg = error_message<ReleaseTrackNotImplementedError>(
        [&] { extract_release_track_implementation(FILE_NAME, ReleaseTrack::GA, impls); });
    CHECK(msg == "No implementation for release track [GA] for element: [" + FILE_NAME + "]");
}

// ============================================================================
// Multiple implementations
// ============================================================================

TEST_CASE("multiple implementations pick the one declaring the track") {
    std::vector<Implementation> impls = {
        make_impl("ga", {ReleaseTrack::GA}),
        make_impl("beta", {ReleaseTrack::BETA}),
        make_impl("alpha", {ReleaseTrack::ALPHA}),
    };
    CHECK(extract_release_track_implementation(FILE_NAME, ReleaseTrack::GA, impls)()->name() == "ga");
    CHECK(extract_release_track_implementation(FILE_NAME, ReleaseTrack::BETA, impls)()->name() == "beta");
    CHECK(extract_release_track_implementation(FILE_NAME, ReleaseTrack::ALPHA, impls)()->name() == "alpha");
}

TEST_CASE("multiple implementations must all declare tracks") {
    std::vector<Implementation> impls = {
        make_impl("ga", {ReleaseTrack::GA}),
        make_impl("any", {}),
    };
    auto msg = error_message<LayoutError>(
        [&] { extract_release_track_implementation(FILE_NAME, ReleaseTrack::GA, impls); });
    CHECK(contains(msg, "Multiple implementations defined for element: [" + FILE_NAME + "]"));
    CHECK(contains(msg, "explicitly declare valid release tracks"));
}

TEST_CASE("overlapping tracks are a layout error regardless of order") {
    std::vector<Implementation> impls = {
        make_impl("a", {ReleaseTrack::GA, ReleaseTrack::BETA}),
        make_impl("b", {ReleaseTrack::BETA, ReleaseTrack::ALPHA}),
    };
    std::vector<Implementation> reversed(impls.rbegin(), impls.rend());

    for (const auto* list : {&impls, &reversed}) {
        for (auto track : all_release_tracks()) {
            auto msg = error_message<LayoutError>(
                [&] { extract_release_track_implementation(FILE_NAME, track, *list); });
            CHECK(msg == "Multiple definitions for release tracks [BETA] for element: [" + FILE_NAME + "]");
        }
    }
}

TEST_CASE("duplicate detection is global across the list") {
    // No two neighbours overlap, but the first and last do
    std::vector<Implementation> impls = {
        make_impl("a", {ReleaseTrack::GA}),
        make_impl("b", {ReleaseTrack::BETA}),
        make_impl("c", {ReleaseTrack::GA, ReleaseTrack::ALPHA}),
    };
    auto msg = error_message<LayoutError>(
        [&] { extract_release_track_implementation(FILE_NAME, ReleaseTrack::BETA, impls); });
    CHECK(contains(msg, "[GA]"));
}

TEST_CASE("all overlapping tracks are named") {
    std::vector<Implementation> impls = {
        make_impl("a", {ReleaseTrack::GA, ReleaseTrack::ALPHA}),
        make_impl("b", {ReleaseTrack::ALPHA, ReleaseTrack::GA}),
    };
    auto msg = error_message<LayoutError>(
        [&] { extract_release_track_implementation(FILE_NAME, ReleaseTrack::GA, impls); });
    CHECK(contains(msg, "[GA, ALPHA]"));
}

TEST_CASE("multiple implementations without the requested track are not implemented") {
    std::vector<Implementation> impls = {
        make_impl("beta", {ReleaseTrack::BETA}),
        make_impl("alpha", {ReleaseTrack::ALPHA}),
    };
    CHECK_THROWS_AS(extract_release_track_implementation(FILE_NAME, ReleaseTrack::GA, impls),
                    ReleaseTrackNotImplementedError);
}

TEST_CASE("an empty candidate list is not implemented") {
    std::vector<Implementation> impls;
    CHECK_THROWS_AS(extract_release_track_implementation(FILE_NAME, ReleaseTrack::GA, impls),
                    ReleaseTrackNotImplementedError);
}

TEST_CASE("only the winning producer is invoked") {
    int ga_calls = 0;
    int beta_calls = 0;
    std::vector<Implementation> impls = {
        make_impl("ga", {ReleaseTrack::GA}, &ga_calls),
        make_impl("beta", {ReleaseTrack::BETA}, &beta_calls),
    };

    auto producer = extract_release_track_implementation(FILE_NAME, ReleaseTrack::BETA, impls);
    CHECK(ga_calls == 0);
    CHECK(beta_calls == 0);

    producer();
    CHECK(ga_calls == 0);
    CHECK(beta_calls == 1);
}

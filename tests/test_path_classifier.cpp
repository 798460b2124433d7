#include <catch2/catch_test_macros.hpp>
#include "overlay/path_classifier.hpp"
#include "overlay/segment_predicate.hpp"
#include "overlay_fixture.hpp"

using namespace bpfs;
using namespace bpfs::overlay;

namespace {

struct ClassifierFixture : test::OverlayFixture {
    TreeMembershipPredicate predicate;
    PathClassifier classifier{store, *registry, predicate};

    VirtualPathClassification classify(std::string_view path) {
        auto result = classifier.classify(path);
        REQUIRE(result.ok());
        return result.value();
    }
};

/// Marks names ending in "~" as virtual, whatever the tree says.
class SuffixPredicate : public VirtualSegmentPredicate {
public:
    bool is_virtual_segment(std::string_view name, size_t, const PotentialTree*,
                            std::string_view, bool,
                            const vfs::PhysicalStore&) const override {
        return !name.empty() && name.back() == '~';
    }
};

} // namespace

TEST_CASE_METHOD(ClassifierFixture, "Classifier zones", "[classifier]") {
    CHECK(classify("/").zone == Zone::Root);
    CHECK(classify("").zone == Zone::Root);
    CHECK(classify("/projects").zone == Zone::ProjectList);

    auto project = classify("/projects/acme");
    CHECK(project.zone == Zone::ProjectRelative);
    CHECK(project.project == "acme");
    CHECK(project.is_project_root());
    CHECK(project.project_present);
    CHECK(project.leaf_state() == SegmentState::Physical);
    CHECK(project.store_path == "projects/acme");

    auto viewport = classify("/projects/acme/.blueprint/finance");
    CHECK(viewport.zone == Zone::Viewport);
    CHECK(viewport.relative_path == "finance");
    CHECK(viewport.node != nullptr);
    CHECK(std::string(zone_name(viewport.zone)) == "viewport");
}

TEST_CASE_METHOD(ClassifierFixture, "Unknown top-level names are not found",
                 "[classifier]") {
    auto result = classifier.classify("/elsewhere/acme");
    REQUIRE_FALSE(result);
    CHECK(result.error().kind == ErrorKind::NotFound);
}

TEST_CASE_METHOD(ClassifierFixture, "Template names without a physical entry are virtual",
                 "[classifier]") {
    auto finance = classify("/projects/acme/finance");
    REQUIRE(finance.segments.size() == 1);
    CHECK(finance.leaf_is_virtual());
    CHECK(finance.has_virtual_segment());
    CHECK_FALSE(finance.has_virtual_ancestor());

    auto budget = classify("/projects/acme/finance/budget.txt");
    REQUIRE(budget.segments.size() == 2);
    CHECK(budget.segments[0].state == SegmentState::Virtual);
    CHECK(budget.segments[1].state == SegmentState::Absent);
    CHECK(budget.has_virtual_ancestor());
    CHECK(budget.ancestors_present());
    CHECK(budget.first_virtual() == size_t{0});
    CHECK(budget.parent_relative_path() == "finance");
    CHECK(budget.oracle_path() == "/finance/budget.txt");

    auto stray = classify("/projects/acme/marketing/plan");
    CHECK(stray.segments[0].state == SegmentState::Absent);
    CHECK_FALSE(stray.ancestors_present());
}

TEST_CASE_METHOD(ClassifierFixture, "Physical entries are never virtual",
                 "[classifier]") {
    test::make_dirs(project_dir() / "finance");
    test::make_dirs(project_dir() / "notes");

    auto finance = classify("/projects/acme/finance");
    CHECK(finance.leaf_state() == SegmentState::Physical);
    CHECK_FALSE(finance.has_virtual_segment());
    CHECK(finance.node != nullptr); // still carries its template subtree

    auto notes = classify("/projects/acme/notes");
    CHECK(notes.leaf_state() == SegmentState::Physical);
    CHECK(notes.node == nullptr);
}

TEST_CASE_METHOD(ClassifierFixture, "Missing projects classify as absent",
                 "[classifier]") {
    auto ghost = classify("/projects/ghost/finance");
    CHECK(ghost.zone == Zone::ProjectRelative);
    CHECK_FALSE(ghost.project_present);
    CHECK(ghost.leaf_state() == SegmentState::Absent);
    CHECK(registry->cached_count() == 0); // absent projects are not cached
}

TEST_CASE_METHOD(ClassifierFixture, "A cached project is rechecked against the store",
                 "[classifier]") {
    auto before = classify("/projects/acme/admin");
    CHECK(before.project_present);
    CHECK(before.leaf_state() == SegmentState::Virtual);
    CHECK(registry->cached_count() == 1);

    fs::remove_all(project_dir());

    auto after = classify("/projects/acme/admin");
    CHECK_FALSE(after.project_present);
    CHECK(after.session == nullptr);
    CHECK(after.leaf_state() == SegmentState::Absent);
    CHECK(registry->cached_count() == 0);
}

TEST_CASE_METHOD(ClassifierFixture, "Invalid paths are rejected before any store call",
                 "[classifier]") {
    const char* bad_paths[] = {
        "/projects/acme/../../etc",
        "/projects/acme/finance/..",
        "/..",
        "/projects/acme/.bpfs/project.lua",
        "/projects/acme/finance/.hidden",
        "/projects/.acme",
        "/projects/acme/./finance",
        "/projects/acme//finance",
        "/projects/acme/C:/windows",
        "/projects/acme\\finance",
        "/projects/acme/finance/.blueprint",
    };

    for (const char* path : bad_paths) {
        store.reset();
        auto result = classifier.classify(path);
        INFO(path);
        REQUIRE_FALSE(result);
        CHECK(result.error().kind == ErrorKind::InvalidPath);
        CHECK(store.calls() == 0);
    }
}

TEST_CASE("Classifier uses the configured virtual-segment predicate",
          "[classifier]") {
    test::OverlayFixture fixture;
    SuffixPredicate predicate;
    PathClassifier classifier(fixture.store, *fixture.registry, predicate);

    auto marked = classifier.classify("/projects/acme/drafts~");
    REQUIRE(marked.ok());
    CHECK(marked.value().leaf_is_virtual());

    auto template_name = classifier.classify("/projects/acme/finance");
    REQUIRE(template_name.ok());
    CHECK(template_name.value().leaf_state() == SegmentState::Absent);
}

// xref_resolve navigation query tests

#include <catch2/catch_test_macros.hpp>
#include <xref_engine/resolve/builder.hpp>
#include <xref_engine/resolve/query.hpp>
#include "codebase.hpp"

using namespace xref_resolve;
using namespace xref_test;

namespace {

struct QueryFixture {
    Codebase code;
    DeclarationPtr tick;
    DeclarationPtr tick_import;
    DeclarationPtr tick_replace;
    DeclarationPtr tick_hook;
    DeclarationPtr helper;
    std::shared_ptr<const State> state;

    QueryFixture() {
        code.api_type("Npc", "Npc");
        code.type("RSNpc");
        code.type("RSNpcMixin", annotated(AnnotationKind::Mixin, "RSNpc"));

        tick = code.member("Npc", "tick", annotated(AnnotationKind::Export, "tick"), false, MemberKind::Method);
        tick_replace = code.member("RSNpcMixin", "rs$tick", annotated(AnnotationKind::Replace, "tick"));
        tick_import = code.member("RSNpc", "getTick", annotated(AnnotationKind::Import, "tick"));
        tick_hook = code.member("RSNpcMixin", "onTick", annotated(AnnotationKind::MethodHook, "tick"));
        helper = code.member("RSNpcMixin", "helper", {});

        state = build_state(code.index, ResolverConfig{});
    }
};

} // anonymous namespace

TEST_CASE("Relation of a declaration", "[resolve][query]") {
    QueryFixture f;

    REQUIRE(relation_of(*f.tick) == AnnotationKind::Export);
    REQUIRE(relation_of(*f.tick_import) == AnnotationKind::Import);
    REQUIRE(relation_of(*f.tick_hook) == AnnotationKind::MethodHook);
    REQUIRE_FALSE(relation_of(*f.helper).has_value());
}

TEST_CASE("Exports referencing", "[resolve][query]") {
    QueryFixture f;

    SECTION("sorted by declaration name") {
        auto targets = exports_referencing(*f.state, *f.tick);
        std::vector<std::string> expected{"getTick", "onTick", "rs$tick"};
        REQUIRE(names_of(targets) == expected);
    }

    SECTION("non-export declarations yield nothing") {
        REQUIRE(exports_referencing(*f.state, *f.tick_import).empty());
        REQUIRE(exports_referencing(*f.state, *f.helper).empty());
    }

    SECTION("export without identity yields nothing") {
        f.code.type("Loose");
        auto loose = f.code.member("Loose", "tick", annotated(AnnotationKind::Export, "tick"));
        REQUIRE(exports_referencing(*f.state, *loose).empty());
    }

    SECTION("equal names keep insertion order") {
        f.code.type("RSNpc2", annotated(AnnotationKind::Mixin, "RSNpc"));
        auto again = f.code.member("RSNpc2", "getTick", annotated(AnnotationKind::Shadow, "tick"));
        auto state = build_state(f.code.index, ResolverConfig{});

        auto targets = exports_referencing(*state, *f.tick);
        REQUIRE(targets.size() == 4);
        REQUIRE(targets[0] == f.tick_import);
        REQUIRE(targets[1] == again);
    }
}

TEST_CASE("References of", "[resolve][query]") {
    QueryFixture f;

    SECTION("import and mixin declarations reach the export") {
        REQUIRE(references_of(*f.state, *f.tick_import) == std::vector<DeclarationPtr>{f.tick});
        REQUIRE(references_of(*f.state, *f.tick_replace) == std::vector<DeclarationPtr>{f.tick});
        REQUIRE(references_of(*f.state, *f.tick_hook) == std::vector<DeclarationPtr>{f.tick});
    }

    SECTION("export declarations yield nothing") {
        REQUIRE(references_of(*f.state, *f.tick).empty());
    }

    SECTION("declarations added after the build yield nothing") {
        auto late = f.code.member("RSNpc", "lateTick", annotated(AnnotationKind::Import, "tick"));
        REQUIRE(references_of(*f.state, *late).empty());
    }

    SECTION("several targets are sorted by name") {
        f.code.api_type("Player", "Player");
        f.code.type("RSCharacterMixin", annotated_list(AnnotationKind::Mixins, {"RSPlayer", "RSNpc"}));
        auto player_tick = f.code.member("Player", "act", annotated(AnnotationKind::Export, "tick"));
        auto both = f.code.member("RSCharacterMixin", "rs$tick", annotated(AnnotationKind::Copy, "tick"));
        auto state = build_state(f.code.index, ResolverConfig{});

        auto targets = references_of(*state, *both);
        REQUIRE(targets.size() == 2);
        REQUIRE(targets[0] == player_tick);
        REQUIRE(targets[1] == f.tick);
    }
}

TEST_CASE("Navigation", "[resolve][query]") {
    QueryFixture f;

    SECTION("from an export") {
        auto nav = navigate(*f.state, *f.tick);
        REQUIRE(nav.direction == NavigationDirection::ToReferences);
        REQUIRE(nav.targets.size() == 3);
    }

    SECTION("from an import") {
        auto nav = navigate(*f.state, *f.tick_import);
        REQUIRE(nav.direction == NavigationDirection::ToExports);
        REQUIRE(nav.targets == std::vector<DeclarationPtr>{f.tick});
    }

    SECTION("from an unrelated declaration") {
        auto nav = navigate(*f.state, *f.helper);
        REQUIRE(nav.direction == NavigationDirection::None);
        REQUIRE(nav.empty());
    }

    SECTION("direction names") {
        REQUIRE(std::string(navigation_direction_name(NavigationDirection::ToExports)) == "exports");
        REQUIRE(std::string(navigation_direction_name(NavigationDirection::None)) == "none");
    }
}

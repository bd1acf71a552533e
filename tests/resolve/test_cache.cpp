// xref_resolve state cache tests

#include <catch2/catch_test_macros.hpp>
#include <xref_engine/resolve/builder.hpp>
#include <xref_engine/resolve/cache.hpp>
#include "codebase.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace xref_resolve;
using namespace xref_test;

namespace {

/// Builder that counts its invocations
StateCache::BuildFn counting_builder(std::atomic<int>& calls) {
    return [&calls](const xref_index::DeclarationIndex& index) {
        ++calls;
        return build_state(index, ResolverConfig{});
    };
}

void populate(Codebase& code) {
    code.api_type("Player", "Player");
    code.type("RSPlayer");
    code.member("Player", "health", annotated(AnnotationKind::Export, "health"));
    code.member("RSPlayer", "getHealth", annotated(AnnotationKind::Import, "health"));
}

} // anonymous namespace

TEST_CASE("StateCache memoization", "[resolve][cache]") {
    Codebase code;
    populate(code);

    std::atomic<int> calls{0};
    StateCache cache(counting_builder(calls));

    REQUIRE(cache.peek() == nullptr);

    auto first = cache.get_state(code.index);
    REQUIRE(first != nullptr);
    REQUIRE(calls.load() == 1);
    REQUIRE(cache.peek() == first);

    SECTION("unchanged index is a hit") {
        auto second = cache.get_state(code.index);
        REQUIRE(second == first);
        REQUIRE(calls.load() == 1);
        REQUIRE(cache.stats().hits == 1);
        REQUIRE(cache.stats().rebuilds == 1);
    }

    SECTION("mutation triggers a full rebuild") {
        code.member("RSPlayer", "getMana", annotated(AnnotationKind::Import, "mana"));
        auto second = cache.get_state(code.index);
        REQUIRE(second != first);
        REQUIRE(calls.load() == 2);
        REQUIRE(second->version() == code.index.modification_count());
        REQUIRE(first->version() < second->version());
    }

    SECTION("touch alone triggers a rebuild") {
        code.index.touch();
        (void)cache.get_state(code.index);
        REQUIRE(calls.load() == 2);
    }

    SECTION("another index is not served from the memo") {
        Codebase other;
        populate(other);
        auto state = cache.get_state(other.index);
        REQUIRE(state != first);
        REQUIRE(calls.load() == 2);
    }

    SECTION("invalidate drops the memo") {
        cache.invalidate();
        REQUIRE(cache.peek() == nullptr);
        auto second = cache.get_state(code.index);
        REQUIRE(second != first);
        REQUIRE(calls.load() == 2);
    }
}

TEST_CASE("StateCache after an index is destroyed and replaced", "[resolve][cache]") {
    std::atomic<int> calls{0};
    StateCache cache(counting_builder(calls));

    auto old_code = std::make_unique<Codebase>();
    old_code->type("Client");
    old_code->member("Client", "health", annotated(AnnotationKind::Export, "health"), true);
    auto old_state = cache.get_state(old_code->index);
    REQUIRE(old_state->find_export(ExportedMember::of("health", STATIC_LOCATION)) != nullptr);
    old_code.reset();

    // Same mutation sequence, so only the count identity tells the two apart
    auto new_code = std::make_unique<Codebase>();
    new_code->type("Client");
    new_code->member("Client", "mana", annotated(AnnotationKind::Export, "mana"), true);

    auto state = cache.get_state(new_code->index);
    REQUIRE(state != old_state);
    REQUIRE(calls.load() == 2);
    REQUIRE(cache.stats().hits == 0);
    REQUIRE(cache.stats().rebuilds == 2);
    REQUIRE(state->find_export(ExportedMember::of("mana", STATIC_LOCATION)) != nullptr);
    REQUIRE(state->find_export(ExportedMember::of("health", STATIC_LOCATION)) == nullptr);
}

TEST_CASE("StateCache with the default builder", "[resolve][cache]") {
    Codebase code;
    populate(code);

    ResolverConfig config;
    config.mirror_prefix = "XX";
    StateCache cache(config);

    auto state = cache.get_state(code.index);
    REQUIRE(state->config().mirror_prefix == "XX");
    REQUIRE(state->stats().exports == 1);
    REQUIRE(state->stats().imports_dangling == 1);
}

TEST_CASE("StateCache build failures", "[resolve][cache]") {
    Codebase code;
    populate(code);

    std::atomic<int> calls{0};
    StateCache cache([&calls](const xref_index::DeclarationIndex& index) -> std::shared_ptr<const State> {
        if (++calls == 1) {
            throw std::runtime_error("index unavailable");
        }
        return build_state(index, ResolverConfig{});
    });

    REQUIRE_THROWS_AS(cache.get_state(code.index), std::runtime_error);
    REQUIRE(cache.peek() == nullptr);

    auto state = cache.get_state(code.index);
    REQUIRE(state != nullptr);
    REQUIRE(calls.load() == 2);
}

TEST_CASE("StateCache invalidation during a rebuild", "[resolve][cache]") {
    Codebase code;
    populate(code);

    std::atomic<int> calls{0};
    StateCache* self = nullptr;
    StateCache cache([&](const xref_index::DeclarationIndex& index) {
        if (++calls == 1) {
            self->invalidate();
        }
        return build_state(index, ResolverConfig{});
    });
    self = &cache;

    auto first = cache.get_state(code.index);
    REQUIRE(first != nullptr);
    REQUIRE(cache.peek() == nullptr);

    auto second = cache.get_state(code.index);
    REQUIRE(second != first);
    REQUIRE(cache.peek() == second);
    REQUIRE(calls.load() == 2);
}

TEST_CASE("StateCache single-flight rebuilds", "[resolve][cache]") {
    Codebase code;
    populate(code);

    std::atomic<int> calls{0};
    StateCache cache([&calls](const xref_index::DeclarationIndex& index) {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return build_state(index, ResolverConfig{});
    });

    constexpr int thread_count = 8;
    std::vector<std::shared_ptr<const State>> results(thread_count);
    std::vector<std::thread> threads;
    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([&cache, &code, &results, i]() {
            results[i] = cache.get_state(code.index);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(calls.load() == 1);
    for (const auto& result : results) {
        REQUIRE(result != nullptr);
        REQUIRE(result == results[0]);
    }

    auto stats = cache.stats();
    REQUIRE(stats.rebuilds == 1);
    REQUIRE(stats.hits == thread_count - 1);
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <statq/stats/querier.hpp>
#include <statq/stats/stat_map.hpp>
#include <statq/scene/hierarchy.hpp>
#include <statq/scene/world.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace statq;
using namespace statq::stats;
using Catch::Matchers::WithinAbs;

namespace {

constexpr QualifierFlags Fire = 1 << 0;
constexpr QualifierFlags Water = 1 << 1;
constexpr QualifierFlags Earth = 1 << 2;
constexpr QualifierFlags Air = 1 << 3;

StatRegistry make_registry() {
    StatRegistry registry;
    registry.register_stat(StatDefinition::make("Strength", ValueKind::Int));
    registry.register_stat(StatDefinition::make("Defense", ValueKind::Int));
    registry.register_stat(StatDefinition::make("A", ValueKind::Int));
    registry.register_stat(StatDefinition::make("B", ValueKind::Int));
    registry.register_stat(StatDefinition::make("Top", ValueKind::Int));
    registry.register_stat(StatDefinition::make("Luck", ValueKind::Int, false));
    registry.register_stat(StatDefinition::make("Damage", ValueKind::Float));
    registry.register_qualifier("Fire", 0);
    registry.register_qualifier("Water", 1);
    return registry;
}

const StatDefinition& def(const StatRegistry& registry, const char* name) {
    const StatDefinition* found = registry.find(std::string(name));
    REQUIRE(found != nullptr);
    return *found;
}

// Counts how often the querier actually asks it for modifiers
class CountingSource : public IModifierSource {
public:
    void contribute(EvaluationContext&, scene::Entity, const StatDefinition& stat,
                    ModifierSink& sink) const override {
        if (stat.id == "Defense"_stat) {
            ++calls;
            sink.push(Qualifier::none(), StatOperation::add(3));
        }
    }

    mutable std::atomic<int> calls{0};
};

} // anonymous namespace

TEST_CASE("Querier end-to-end composition", "[stats][querier]") {
    scene::World world;
    StatRegistry registry = make_registry();
    const auto& strength = def(registry, "Strength");

    StatDefaults defaults;
    defaults.set_base(strength, 42);
    defaults.set_min(strength, 1);
    defaults.set_max(strength, 99);

    scene::Entity knight = world.create("Knight");
    auto& map = world.emplace<StatMap>(knight);
    map.add(strength, Qualifier::none(), StatOperation::add(4));
    map.add(strength, Qualifier::none(), StatOperation::add(7));
    map.add(strength, Qualifier::none(), StatOperation::mul(2));

    Querier querier = QuerierBuilder()
        .with_registry(registry)
        .with_defaults(defaults)
        .add_source(std::make_shared<StatMapSource>())
        .build(world);

    // clamp((42 + 4 + 7) * 2, 1, 99)
    QueryResult result = querier.evaluate(knight, "Strength"_stat);
    REQUIRE(result.ok());
    REQUIRE(result.value.as_int() == 99);
    REQUIRE(querier.cache() == nullptr);

    SECTION("Defaults alone") {
        scene::Entity peasant = world.create("Peasant");
        REQUIRE(querier.evaluate(peasant, "Strength"_stat).value.as_int() == 42);
    }

    SECTION("Stat with an inherent zero") {
        REQUIRE(querier.evaluate(knight, "Defense"_stat).value.as_int() == 0);
    }
}

TEST_CASE("Querier qualifier modes", "[stats][querier]") {
    scene::World world;
    StatRegistry registry = make_registry();
    const auto& damage = def(registry, "Damage");

    scene::Entity knight = world.create("Knight");
    auto& map = world.emplace<StatMap>(knight);
    map.add(damage, Qualifier::none(), StatOperation::add(10));
    map.add(damage, Qualifier::all(Fire), StatOperation::add(5));
    map.add(damage, Qualifier::all(Fire | Water), StatOperation::add(1));

    Querier querier = QuerierBuilder()
        .with_registry(registry)
        .add_source(std::make_shared<StatMapSource>())
        .build(world);

    auto value = [&](const QualifierQuery& q) {
        return querier.evaluate(knight, q, "Damage"_stat).value.as_float();
    };

    REQUIRE_THAT(value(QualifierQuery::none()), WithinAbs(10.0, 1e-9));
    REQUIRE_THAT(value(QualifierQuery::aggregate(Fire)), WithinAbs(15.0, 1e-9));
    REQUIRE_THAT(value(QualifierQuery::aggregate(Fire | Water)), WithinAbs(16.0, 1e-9));
    REQUIRE_THAT(value(QualifierQuery::exact(Fire)), WithinAbs(5.0, 1e-9));
    REQUIRE_THAT(value(QualifierQuery::exact(0)), WithinAbs(10.0, 1e-9));
    REQUIRE_THAT(value(QualifierQuery::exact(Water)), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Querier cache", "[stats][querier][cache]") {
    scene::World world;
    StatRegistry registry = make_registry();
    auto counting = std::make_shared<CountingSource>();
    auto cache = std::make_shared<StatCache>();

    scene::Entity knight = world.create("Knight");
    world.emplace<StatMap>(knight);

    Querier querier = QuerierBuilder()
        .with_registry(registry)
        .add_source(std::make_shared<StatMapSource>())
        .add_source(counting)
        .with_cache(cache)
        .build(world);

    SECTION("Second evaluation is a cache hit") {
        QueryResult first = querier.evaluate(knight, "Defense"_stat);
        QueryResult second = querier.evaluate(knight, "Defense"_stat);

        REQUIRE(first.ok());
        REQUIRE(first.value == second.value);
        REQUIRE(first.value.as_int() == 3);
        REQUIRE(counting->calls.load() == 1);
        REQUIRE(cache->hits() == 1);
        REQUIRE(cache->size() == 1);
        REQUIRE(querier.cache() == cache.get());
    }

    SECTION("Different queries are cached separately") {
        querier.evaluate(knight, "Defense"_stat);
        querier.evaluate(knight, QualifierQuery::aggregate(Fire), "Defense"_stat);
        REQUIRE(counting->calls.load() == 2);
        REQUIRE(cache->size() == 2);
    }

    SECTION("Stale until invalidated") {
        const auto& defense = def(registry, "Defense");
        REQUIRE(querier.evaluate(knight, "Defense"_stat).value.as_int() == 3);

        world.get<StatMap>(knight).add(defense, Qualifier::none(), StatOperation::add(10));
        REQUIRE(querier.evaluate(knight, "Defense"_stat).value.as_int() == 3);

        REQUIRE(cache->invalidate(knight) == 1);
        REQUIRE(querier.evaluate(knight, "Defense"_stat).value.as_int() == 13);
        REQUIRE(counting->calls.load() == 2);
    }

    SECTION("Invalidate all") {
        scene::Entity squire = world.create("Squire");
        querier.evaluate(knight, "Defense"_stat);
        querier.evaluate(squire, "Defense"_stat);
        REQUIRE(cache->size() == 2);

        cache->invalidate_all();
        REQUIRE(cache->empty());
        querier.evaluate(knight, "Defense"_stat);
        REQUIRE(counting->calls.load() == 3);
    }
}

TEST_CASE("Querier cycle detection", "[stats][querier][cycle]") {
    scene::World world;
    StatRegistry registry = make_registry();
    auto cache = std::make_shared<StatCache>();
    scene::Entity knight = world.create("Knight");

    // A = 1 + B, B = 1 + A
    auto mutual = [](EvaluationContext& context, scene::Entity, const StatDefinition& stat, ModifierSink& sink) {
        StatId other;
        if (stat.id == "A"_stat) other = "B"_stat;
        if (stat.id == "B"_stat) other = "A"_stat;
        if (!other.valid()) return;

        sink.push(Qualifier::none(), StatOperation::add(1));
        QueryResult dependency = context.query(sink.query(), other);
        if (dependency) {
            sink.push(Qualifier::none(), StatOperation::add(static_cast<double>(dependency.value.as_int())));
        }
    };

    SECTION("Direct cycle reports the repeated key") {
        Querier querier = QuerierBuilder()
            .with_registry(registry)
            .add_global(mutual)
            .with_cache(cache)
            .build(world);

        QueryResult result = querier.evaluate(knight, "A"_stat);
        REQUIRE(result.error == QueryError::CycleDetected);
        REQUIRE_FALSE(result);
        REQUIRE(result.cycle_path.size() == 3);
        REQUIRE(result.cycle_path[0].stat == "A"_stat);
        REQUIRE(result.cycle_path[1].stat == "B"_stat);
        REQUIRE(result.cycle_path[2].stat == "A"_stat);
        REQUIRE(result.cycle_path[0].entity == knight);
        REQUIRE(result.message.find("Knight") != std::string::npos);
        REQUIRE(cache->empty());
    }

    SECTION("Cycle below the top-level key fails the whole query") {
        // Top = A, and the source does not even look at the result
        auto top = [](EvaluationContext& context, scene::Entity, const StatDefinition& stat, ModifierSink& sink) {
            if (stat.id != "Top"_stat) return;
            static_cast<void>(context.query(sink.query(), "A"_stat));
            sink.push(Qualifier::none(), StatOperation::add(100));
        };

        Querier querier = QuerierBuilder()
            .with_registry(registry)
            .add_global(top)
            .add_global(mutual)
            .with_cache(cache)
            .build(world);

        QueryResult result = querier.evaluate(knight, "Top"_stat);
        REQUIRE(result.error == QueryError::CycleDetected);
        REQUIRE(result.cycle_path.size() == 4);
        REQUIRE(result.cycle_path[0].stat == "Top"_stat);
        REQUIRE(result.cycle_path[3].stat == "A"_stat);
        REQUIRE(cache->empty());

        // Unrelated stats on the same querier still evaluate
        REQUIRE(querier.evaluate(knight, "Strength"_stat).ok());
    }

    SECTION("Same stat on another entity is not a cycle") {
        scene::Entity parent = world.create("Parent");
        scene::Entity child = world.create("Child");
        scene::set_parent(world, child, parent);
        const auto& strength = def(registry, "Strength");
        world.emplace<StatMap>(child).add(strength, Qualifier::none(), StatOperation::add(6));

        // Strength of a parent = own + strength of its children
        auto inherit = [](EvaluationContext& context, scene::Entity entity, const StatDefinition& stat, ModifierSink& sink) {
            if (stat.id != "Strength"_stat) return;
            std::vector<scene::Entity> children;
            scene::collect_children(context.world(), entity, children);
            for (scene::Entity c : children) {
                QueryResult r = context.query(c, sink.query(), stat.id);
                if (r) sink.push(Qualifier::none(), StatOperation::add(static_cast<double>(r.value.as_int())));
            }
        };

        Querier querier = QuerierBuilder()
            .with_registry(registry)
            .add_source(std::make_shared<StatMapSource>())
            .add_global(inherit)
            .build(world);

        QueryResult result = querier.evaluate(parent, "Strength"_stat);
        REQUIRE(result.ok());
        REQUIRE(result.value.as_int() == 6);
    }
}

TEST_CASE("Querier failures", "[stats][querier]") {
    scene::World world;
    StatRegistry registry = make_registry();
    scene::Entity knight = world.create("Knight");
    world.emplace<StatMap>(knight);

    auto cache = std::make_shared<StatCache>();
    QuerierBuilder builder;
    builder.with_registry(registry)
        .add_source(std::make_shared<StatMapSource>())
        .with_cache(cache);

    SECTION("Unregistered stat") {
        Querier querier = builder.build(world);
        QueryResult result = querier.evaluate(knight, "Mana"_stat);
        REQUIRE(result.error == QueryError::StatNotFound);
        REQUIRE(result.value.is_none());
    }

    SECTION("No default, no modifier and no inherent zero") {
        Querier querier = builder.build(world);
        REQUIRE(querier.evaluate(knight, "Luck"_stat).error == QueryError::StatNotFound);

        world.get<StatMap>(knight).add(def(registry, "Luck"), Qualifier::all(Fire), StatOperation::add(2));
        // A non-matching modifier still leaves nothing to evaluate
        REQUIRE(querier.evaluate(knight, "Luck"_stat).error == QueryError::StatNotFound);
        QueryResult fire = querier.evaluate(knight, QualifierQuery::aggregate(Fire), "Luck"_stat);
        REQUIRE(fire.ok());
        REQUIRE(fire.value.as_int() == 2);
    }

    SECTION("Default makes a stat without zero evaluable") {
        StatDefaults defaults;
        defaults.set_base(def(registry, "Luck"), 7);
        Querier querier = builder.with_defaults(defaults).build(world);
        REQUIRE(querier.evaluate(knight, "Luck"_stat).value.as_int() == 7);
    }

    SECTION("Destroyed entity") {
        Querier querier = builder.build(world);
        world.destroy(knight);
        QueryResult result = querier.evaluate(knight, "Strength"_stat);
        REQUIRE(result.error == QueryError::InvalidEntity);
        REQUIRE(querier.evaluate(scene::NullEntity, "Strength"_stat).error == QueryError::InvalidEntity);
    }

    SECTION("Mismatched operation at evaluation time") {
        Querier querier = builder
            .add_global([](EvaluationContext&, scene::Entity, const StatDefinition& stat, ModifierSink& sink) {
                if (stat.id == "Strength"_stat) sink.push(Qualifier::none(), StatOperation::bit_or(true));
            })
            .build(world);

        QueryResult result = querier.evaluate(knight, "Strength"_stat);
        REQUIRE(result.error == QueryError::TypeMismatch);
        REQUIRE(result.message.find("Strength") != std::string::npos);
        REQUIRE(cache->empty());
    }

    SECTION("Missing sub-query values are left to the source") {
        scene::Entity squire = world.create("Squire");
        world.destroy(squire);

        QueryError mana_error = QueryError::None;
        QueryError luck_error = QueryError::None;
        QueryError squire_error = QueryError::None;
        bool context_failed = true;

        Querier querier = builder
            .add_global([&](EvaluationContext& context, scene::Entity, const StatDefinition& stat, ModifierSink& sink) {
                if (stat.id != "Strength"_stat) return;
                mana_error = context.query(sink.query(), "Mana"_stat).error;
                luck_error = context.query(sink.query(), "Luck"_stat).error;
                squire_error = context.query(squire, sink.query(), "Strength"_stat).error;
                context_failed = context.failed();

                // Treat every missing value as a flat bonus of one
                sink.push(Qualifier::none(), StatOperation::add(1));
            })
            .build(world);

        QueryResult result = querier.evaluate(knight, "Strength"_stat);
        REQUIRE(result.ok());
        REQUIRE(result.value.as_int() == 1);
        REQUIRE(mana_error == QueryError::StatNotFound);
        REQUIRE(luck_error == QueryError::StatNotFound);
        REQUIRE(squire_error == QueryError::InvalidEntity);
        REQUIRE_FALSE(context_failed);
        REQUIRE(cache->size() == 1);
    }

    SECTION("Ignored mismatch below is sticky") {
        Querier querier = builder
            .add_global([](EvaluationContext& context, scene::Entity, const StatDefinition& stat, ModifierSink& sink) {
                if (stat.id == "Strength"_stat) {
                    static_cast<void>(context.query(sink.query(), "Defense"_stat));
                    sink.push(Qualifier::none(), StatOperation::add(1));
                } else if (stat.id == "Defense"_stat) {
                    sink.push(Qualifier::none(), StatOperation::bit_or(true));
                }
            })
            .build(world);

        QueryResult result = querier.evaluate(knight, "Strength"_stat);
        REQUIRE(result.error == QueryError::TypeMismatch);
        REQUIRE(result.message.find("Defense") != std::string::npos);
        REQUIRE(cache->empty());
    }
}

TEST_CASE("EvaluationContext exposes the in-flight state", "[stats][querier]") {
    scene::World world;
    StatRegistry registry = make_registry();
    scene::Entity knight = world.create("Knight");

    size_t top_depth = 0;
    size_t nested_depth = 0;
    scene::Entity seen = scene::NullEntity;

    Querier querier = QuerierBuilder()
        .with_registry(registry)
        .add_global([&](EvaluationContext& context, scene::Entity entity, const StatDefinition& stat, ModifierSink& sink) {
            if (stat.id == "Damage"_stat) {
                top_depth = context.depth();
                seen = context.current_entity();
                REQUIRE(context.stack().back().stat == "Damage"_stat);
                REQUIRE(&context.world() == &world);
                REQUIRE(context.registry().is_registered("Strength"_stat));
                QueryResult strength = context.query(sink.query(), "Strength"_stat);
                sink.push(Qualifier::none(), StatOperation::add(strength.value.get_float()));
            } else if (stat.id == "Strength"_stat) {
                nested_depth = context.depth();
                REQUIRE(entity == knight);
                sink.push(Qualifier::none(), StatOperation::add(5));
            }
        })
        .build(world);

    QueryResult result = querier.evaluate(knight, "Damage"_stat);
    REQUIRE(result.ok());
    REQUIRE_THAT(result.value.as_float(), WithinAbs(5.0, 1e-9));
    REQUIRE(top_depth == 1);
    REQUIRE(nested_depth == 2);
    REQUIRE(seen == knight);
}

TEST_CASE("Querier relation scopes", "[stats][querier][relation]") {
    scene::World world;
    StatRegistry registry = make_registry();
    const auto& strength = def(registry, "Strength");

    scene::Entity knight = world.create("Knight");
    scene::Entity sword = world.create("Sword");
    scene::Entity gem = world.create("Gem");
    scene::set_parent(world, sword, knight);
    scene::set_parent(world, gem, sword);

    world.emplace<StatMap>(knight).add(strength, Qualifier::none(), StatOperation::add(10));
    world.emplace<StatMap>(sword).add(strength, Qualifier::none(), StatOperation::add(5));
    world.emplace<StatMap>(gem).add(strength, Qualifier::none(), StatOperation::add(100));

    auto evaluate = [&](SourceScope scope) {
        Querier querier = QuerierBuilder()
            .with_registry(registry)
            .add_source(std::make_shared<StatMapSource>(), scope)
            .add_relation(std::make_shared<ChildRelation>())
            .build(world);
        return querier.evaluate(knight, "Strength"_stat).value.as_int();
    };

    SECTION("Owner only") {
        REQUIRE(evaluate(SourceScope::Owner) == 10);
    }

    SECTION("Related only, direct children only") {
        REQUIRE(evaluate(SourceScope::Related) == 5);
    }

    SECTION("Owner and related") {
        REQUIRE(evaluate(SourceScope::OwnerAndRelated) == 15);
    }

    SECTION("An entity yielded twice contributes once") {
        Querier querier = QuerierBuilder()
            .with_registry(registry)
            .add_source(std::make_shared<StatMapSource>(), SourceScope::OwnerAndRelated)
            .add_relation(std::make_shared<ChildRelation>())
            .add_relation(std::make_shared<FunctionRelation>(
                [sword, knight](const scene::World&, scene::Entity, std::vector<scene::Entity>& out) {
                    out.push_back(sword);
                    out.push_back(knight);
                }))
            .build(world);
        REQUIRE(querier.evaluate(knight, "Strength"_stat).value.as_int() == 15);
    }
}

// ============================================================================
// Weapon, buffs and a global damage formula
// ============================================================================

namespace {

struct Weapon {
    double damage = 0.0;

    void contribute(EvaluationContext&, scene::Entity, const StatDefinition& stat, ModifierSink& sink) const {
        if (stat.id == "WeaponDamage"_stat) {
            sink.push(Qualifier::none(), StatOperation::add(damage));
        }
    }
};

struct StrengthBuff {
    Qualifier qualifier;
    double multiplier = 1.0;

    void contribute(EvaluationContext&, scene::Entity, const StatDefinition& stat, ModifierSink& sink) const {
        if (stat.id == "Strength"_stat) {
            sink.push(qualifier, StatOperation::mul(multiplier));
        }
    }
};

struct DamageBuff {
    Qualifier qualifier;
    double multiplier = 1.0;

    void contribute(EvaluationContext&, scene::Entity, const StatDefinition& stat, ModifierSink& sink) const {
        if (stat.id == "Damage"_stat) {
            sink.push(qualifier, StatOperation::mul(multiplier));
        }
    }
};

} // anonymous namespace

TEST_CASE("Querier combines owner, children and global relations", "[stats][querier][relation]") {
    scene::World world;

    StatRegistry registry;
    for (const char* name : {"WeaponDamage", "Damage", "Defense", "Strength", "WeaponProficiency"}) {
        registry.register_stat(StatDefinition::make(name, ValueKind::Float));
    }

    scene::Entity hero = world.create("Hero");
    auto& map = world.emplace<StatMap>(hero);
    map.add(*registry.find(std::string("Strength")), Qualifier::none(), StatOperation::add(4));
    map.add(*registry.find(std::string("WeaponProficiency")), Qualifier::none(), StatOperation::add(0.5));
    world.emplace<Weapon>(hero, Weapon{12.0});

    auto buff = [&](auto component) {
        scene::Entity e = world.create();
        world.emplace<decltype(component)>(e, component);
        scene::set_parent(world, e, hero);
    };
    buff(StrengthBuff{Qualifier::none(), 1.5});
    buff(StrengthBuff{Qualifier::all(Fire), 2.0});
    buff(StrengthBuff{Qualifier::all(Water), 0.5});
    buff(DamageBuff{Qualifier::any(Fire | Water | Earth | Air), 2.0});
    buff(DamageBuff{Qualifier::all(Fire), 1.5});

    // Damage += Strength + WeaponDamage * WeaponProficiency, under the same qualifier
    auto damage_formula = [](EvaluationContext& context, scene::Entity, const StatDefinition& stat, ModifierSink& sink) {
        if (stat.id != "Damage"_stat) return;
        const QualifierQuery& q = sink.query();
        double strength = context.query(q, "Strength"_stat).value.get_float();
        double weapon = context.query(q, "WeaponDamage"_stat).value.get_float();
        double proficiency = context.query(q, "WeaponProficiency"_stat).value.get_float();
        sink.push(Qualifier::none(), StatOperation::add(strength));
        sink.push(Qualifier::none(), StatOperation::add(weapon * proficiency));
    };

    Querier querier = QuerierBuilder()
        .with_registry(registry)
        .add_source(std::make_shared<StatMapSource>())
        .add_source(std::make_shared<ComponentSource<Weapon>>())
        .add_source(std::make_shared<ComponentSource<StrengthBuff>>(), SourceScope::Related)
        .add_source(std::make_shared<ComponentSource<DamageBuff>>(), SourceScope::Related)
        .add_relation(std::make_shared<ChildRelation>())
        .add_global(damage_formula)
        .with_cache()
        .build(world);

    auto damage = [&](const QualifierQuery& q) {
        QueryResult result = querier.evaluate(hero, q, "Damage"_stat);
        REQUIRE(result.ok());
        return result.value.as_float();
    };

    // 4 * 1.5 + 12 * 0.5
    REQUIRE_THAT(damage(QualifierQuery::none()), WithinAbs(12.0, 1e-9));
    // (4 * 1.5 * 2 + 12 * 0.5) * 2 * 1.5
    REQUIRE_THAT(damage(QualifierQuery::aggregate(Fire)), WithinAbs(54.0, 1e-9));
    // (4 * 1.5 * 0.5 + 12 * 0.5) * 2
    REQUIRE_THAT(damage(QualifierQuery::aggregate(Water)), WithinAbs(18.0, 1e-9));
    // (4 * 1.5 * 2 * 0.5 + 12 * 0.5) * 2 * 1.5
    REQUIRE_THAT(damage(QualifierQuery::aggregate(Fire | Water)), WithinAbs(36.0, 1e-9));

    REQUIRE(querier.cache()->size() > 4);
}

TEST_CASE("Querier is safe to share across threads", "[stats][querier][threading]") {
    scene::World world;
    StatRegistry registry = make_registry();
    const auto& strength = def(registry, "Strength");

    constexpr int ThreadCount = 4;
    constexpr int EntitiesPerThread = 16;

    std::vector<scene::Entity> entities;
    for (int i = 0; i < ThreadCount * EntitiesPerThread; ++i) {
        scene::Entity e = world.create();
        auto& map = world.emplace<StatMap>(e);
        map.add(strength, Qualifier::none(), StatOperation::add(i));
        map.add(strength, Qualifier::all(Fire), StatOperation::mul(2));
        entities.push_back(e);
    }

    auto cache = std::make_shared<StatCache>();
    Querier querier = QuerierBuilder()
        .with_registry(registry)
        .add_source(std::make_shared<StatMapSource>())
        .with_cache(cache)
        .build(world);

    std::vector<int64_t> results(entities.size(), -1);
    std::vector<std::thread> threads;
    for (int t = 0; t < ThreadCount; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = t * EntitiesPerThread; i < (t + 1) * EntitiesPerThread; ++i) {
                QueryResult result = querier.evaluate(entities[i], QualifierQuery::aggregate(Fire), "Strength"_stat);
                results[i] = result.ok() ? result.value.as_int() : -1;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(cache->size() == entities.size());
    for (size_t i = 0; i < entities.size(); ++i) {
        REQUIRE(results[i] == static_cast<int64_t>(i) * 2);
        REQUIRE(querier.evaluate(entities[i], QualifierQuery::aggregate(Fire), "Strength"_stat).value.as_int() == results[i]);
    }
}

// brine_pickle shared reference tests

#include <catch2/catch_test_macros.hpp>
#include <brine/pickle/pickle.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace brine_pickle;

namespace {

struct Label {
    std::string text;
    std::int32_t weight = 0;
};

struct Pair {
    std::shared_ptr<Label> first;
    std::shared_ptr<Label> second;
};

/// Graph node whose successors may point back to it
struct Node {
    std::int32_t id = 0;
    std::vector<std::shared_ptr<Node>> next;
};

void register_records(PicklerResolver& resolver) {
    resolver.register_factory<Label>([](PicklerResolver& r) {
        return RecordPickler::create<Label>(r, field("text", &Label::text), field("weight", &Label::weight));
    });
    resolver.register_factory<Pair>([](PicklerResolver& r) {
        return RecordPickler::create<Pair>(r, field("first", &Pair::first), field("second", &Pair::second));
    });
    resolver.register_factory<Node>([](PicklerResolver& r) {
        return RecordPickler::create<Node>(r, field("id", &Node::id), field("next", &Node::next));
    });
}

struct CountingVisitor : ObjectVisitor {
    std::size_t labels = 0;
    std::size_t nodes = 0;

    bool visit(const PicklerBase& pickler, const void*) override {
        if (pickler.type() == std::type_index(typeid(Label))) {
            ++labels;
        } else if (pickler.type() == std::type_index(typeid(Node))) {
            ++nodes;
        }
        return true;
    }
};

} // namespace

TEST_CASE("ReferencePickler metadata", "[pickle][reference]") {
    PicklerResolver resolver;
    register_records(resolver);

    auto pickler = resolver.resolve<std::shared_ptr<Label>>();
    REQUIRE(pickler->info() == PicklerInfo::Reference);
    REQUIRE(pickler->cache_by_ref());
}

TEST_CASE("Aliasing survives a write/read cycle", "[pickle][reference]") {
    PicklerResolver resolver;
    register_records(resolver);
    Serializer serializer(resolver);

    auto shared = std::make_shared<Label>(Label{"shared", 3});

    SECTION("same pointer twice") {
        Pair pair{shared, shared};
        Pair back = serializer.unpickle<Pair>(serializer.pickle(pair));

        REQUIRE(back.first != nullptr);
        REQUIRE(back.first == back.second);
        REQUIRE(back.first != shared);
        REQUIRE(back.first->text == "shared");
        REQUIRE(back.first->weight == 3);
    }

    SECTION("distinct equal values stay distinct") {
        Pair pair{shared, std::make_shared<Label>(*shared)};
        Pair back = serializer.unpickle<Pair>(serializer.pickle(pair));
        REQUIRE(back.first != back.second);
    }

    SECTION("null slot") {
        Pair pair{shared, nullptr};
        Pair back = serializer.unpickle<Pair>(serializer.pickle(pair));
        REQUIRE(back.first != nullptr);
        REQUIRE(back.second == nullptr);
    }

    SECTION("second occurrence is a back reference") {
        JsonFormatWriter writer;
        serializer.serialize(writer, Pair{shared, shared});

        const auto& doc = writer.document();
        REQUIRE(doc[1] == nlohmann::json::parse(R"({"first": 2})"));
        REQUIRE(doc[4] == nlohmann::json::parse(R"({"second": 1})"));
        REQUIRE(doc[5] == nlohmann::json::parse(R"({"id": 0})"));
    }
}

TEST_CASE("Reference tracking can be disabled", "[pickle][reference]") {
    PicklerResolver resolver;
    register_records(resolver);

    SerializerConfig config;
    config.track_references = false;
    Serializer serializer(resolver, config);

    auto shared = std::make_shared<Label>(Label{"dup", 1});
    Pair back = serializer.unpickle<Pair>(serializer.pickle(Pair{shared, shared}));

    REQUIRE(back.first != back.second);
    REQUIRE(back.second->text == "dup");
}

TEST_CASE("Back references are validated on read", "[pickle][reference]") {
    PicklerResolver resolver;
    register_records(resolver);
    auto pickler = resolver.resolve<std::shared_ptr<Label>>();

    SECTION("unknown id") {
        JsonFormatReader reader(nlohmann::json::parse(R"([{"label": 1}, {"id": 4}])"));
        ReadState state(reader);
        try {
            (void)pickler->read(state, "label");
            FAIL("expected an invalid reference");
        } catch (const PicklerException& e) {
            REQUIRE(e.is(brine_core::FormatError::Kind::InvalidReference));
        }
    }

    SECTION("unknown marker") {
        JsonFormatReader reader(nlohmann::json::parse(R"([{"label": 9}])"));
        ReadState state(reader);
        try {
            (void)pickler->read(state, "label");
            FAIL("expected invalid data");
        } catch (const PicklerException& e) {
            REQUIRE(e.is(brine_core::FormatError::Kind::InvalidData));
        }
    }
}

TEST_CASE("Clone preserves sharing", "[pickle][reference]") {
    PicklerResolver resolver;
    register_records(resolver);
    Serializer serializer(resolver);

    auto shared = std::make_shared<Label>(Label{"c", 5});
    Pair copy = serializer.clone(Pair{shared, shared});

    REQUIRE(copy.first == copy.second);
    REQUIRE(copy.first != shared);
    REQUIRE(copy.first->text == "c");

    copy.first->weight = 9;
    REQUIRE(shared->weight == 5);
}

TEST_CASE("Cyclic graphs", "[pickle][reference]") {
    PicklerResolver resolver;
    register_records(resolver);
    Serializer serializer(resolver);

    auto a = std::make_shared<Node>();
    auto b = std::make_shared<Node>();
    a->id = 1;
    b->id = 2;
    a->next.push_back(b);
    b->next.push_back(a);

    SECTION("visit terminates and enters each node once") {
        CountingVisitor visitor;
        serializer.visit(a, visitor);
        REQUIRE(visitor.nodes == 2);
    }

    SECTION("clone rejects the cycle") {
        try {
            (void)serializer.clone(a);
            FAIL("expected a cycle error");
        } catch (const PicklerException& e) {
            REQUIRE(e.is(brine_core::PicklerError::Kind::InvalidValue));
        }
    }

    SECTION("read rejects the cycle") {
        auto bytes = serializer.pickle(a);
        try {
            (void)serializer.unpickle<std::shared_ptr<Node>>(bytes);
            FAIL("expected an invalid reference");
        } catch (const PicklerException& e) {
            REQUIRE(e.is(brine_core::FormatError::Kind::InvalidReference));
        }
    }

    // Break the cycle so both nodes are freed
    b->next.clear();
}

TEST_CASE("Acyclic diamond", "[pickle][reference]") {
    PicklerResolver resolver;
    register_records(resolver);
    Serializer serializer(resolver);

    auto leaf = std::make_shared<Node>();
    leaf->id = 3;
    auto left = std::make_shared<Node>();
    left->next.push_back(leaf);
    auto right = std::make_shared<Node>();
    right->next.push_back(leaf);
    auto root = std::make_shared<Node>();
    root->next = {left, right};

    auto back = serializer.unpickle<std::shared_ptr<Node>>(serializer.pickle(root));
    REQUIRE(back->next.size() == 2);
    REQUIRE(back->next[0]->next[0] == back->next[1]->next[0]);
    REQUIRE(back->next[0]->next[0]->id == 3);

    CountingVisitor visitor;
    serializer.visit(root, visitor);
    REQUIRE(visitor.nodes == 4);
}

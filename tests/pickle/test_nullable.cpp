// brine_pickle optional value tests

#include <catch2/catch_test_macros.hpp>
#include <brine/pickle/pickle.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace brine_pickle;

namespace {

struct InfoCollector : ObjectVisitor {
    std::vector<PicklerInfo> seen;

    bool visit(const PicklerBase& pickler, const void*) override {
        seen.push_back(pickler.info());
        return true;
    }
};

} // namespace

TEST_CASE("NullablePickler payload", "[pickle][nullable]") {
    PicklerResolver resolver;
    auto payload = NullablePickler::create<std::int32_t>(resolver);

    REQUIRE(payload->info() == PicklerInfo::Nullable);

    SECTION("present value is written without a marker") {
        JsonFormatWriter writer;
        WriteState state(writer);
        payload->write(state, "count", std::optional<std::int32_t>(7));
        REQUIRE(writer.document() == nlohmann::json::parse(R"([{"count": 7}])"));

        JsonFormatReader reader(writer.document());
        ReadState read_state(reader);
        REQUIRE(payload->read(read_state, "count") == std::optional<std::int32_t>(7));
    }

    SECTION("absent value is rejected by the writer") {
        BinaryFormatWriter writer;
        WriteState state(writer);
        try {
            payload->write(state, "count", std::nullopt);
            FAIL("expected an invalid value error");
        } catch (const PicklerException& e) {
            REQUIRE(e.is(brine_core::PicklerError::Kind::InvalidValue));
        }
        REQUIRE(writer.size() == 0);
    }

    SECTION("clone and accept tolerate absence") {
        CloneState clone_state;
        REQUIRE_FALSE(payload->clone(clone_state, std::nullopt).has_value());
        REQUIRE(payload->clone(clone_state, std::optional<std::int32_t>(3)) == std::optional<std::int32_t>(3));

        InfoCollector collector;
        VisitState visit_state(collector);
        REQUIRE_NOTHROW(payload->accept(visit_state, std::nullopt));
        REQUIRE(collector.seen == std::vector<PicklerInfo>{PicklerInfo::Nullable});
    }
}

TEST_CASE("Resolved optional carries an absence marker", "[pickle][nullable]") {
    PicklerResolver resolver;
    auto pickler = resolver.resolve<std::optional<std::string>>();

    REQUIRE(pickler->info() == PicklerInfo::Nullable);

    SECTION("absent") {
        JsonFormatWriter writer;
        WriteState state(writer);
        pickler->write(state, "name", std::nullopt);
        REQUIRE(writer.document() == nlohmann::json::parse(R"([{"isNull": true}])"));

        JsonFormatReader reader(writer.document());
        ReadState read_state(reader);
        REQUIRE_FALSE(pickler->read(read_state, "name").has_value());
        REQUIRE(reader.at_end());
    }

    SECTION("present") {
        JsonFormatWriter writer;
        WriteState state(writer);
        pickler->write(state, "name", std::optional<std::string>("brine"));
        REQUIRE(writer.document() == nlohmann::json::parse(R"([{"isNull": false}, {"name": "brine"}])"));

        JsonFormatReader reader(writer.document());
        ReadState read_state(reader);
        REQUIRE(pickler->read(read_state, "name") == std::optional<std::string>("brine"));
    }

    SECTION("binary round trip") {
        Serializer serializer(resolver);
        std::optional<std::string> none;
        REQUIRE_FALSE(serializer.unpickle<std::optional<std::string>>(serializer.pickle(none)).has_value());
        REQUIRE(serializer.unpickle<std::optional<std::string>>(
            serializer.pickle(std::optional<std::string>("x"))) == std::optional<std::string>("x"));
    }

    SECTION("absent value is still visited") {
        InfoCollector collector;
        VisitState visit_state(collector);
        pickler->accept(visit_state, std::nullopt);
        REQUIRE(collector.seen.size() == 1);
    }
}

TEST_CASE("NullMarkerPickler with a custom predicate", "[pickle][nullable]") {
    PicklerResolver resolver;
    auto pickler = NullMarkerPickler::create<std::int32_t>(
        resolver.resolve<std::int32_t>(),
        [](const std::int32_t& value) { return value < 0; },
        -1);

    BinaryFormatWriter writer;
    WriteState state(writer);
    pickler->write(state, "v", -5);
    pickler->write(state, "v", 12);

    REQUIRE(writer.size() == 1 + 1 + 4);

    BinaryFormatReader reader(writer.bytes());
    ReadState read_state(reader);
    REQUIRE(pickler->read(read_state, "v") == -1);
    REQUIRE(pickler->read(read_state, "v") == 12);
    REQUIRE(reader.at_end());
}

TEST_CASE("Optional payload errors carry the resolution path", "[pickle][nullable]") {
    struct NoDefault {
        explicit NoDefault(int) {}
    };

    PicklerResolver resolver;
    auto result = resolver.try_resolve<std::optional<NoDefault>>();
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == brine_core::ErrorCode::GenerationFailed);
    REQUIRE(result.error().get_context("resolving") != nullptr);
    REQUIRE(resolver.cached_count() == 0);
}

// brine_pickle serializer tests

#include <catch2/catch_test_macros.hpp>
#include <brine/pickle/pickle.hpp>
#include <string>
#include <vector>

using namespace brine_pickle;
using brine_core::FormatError;

namespace {

struct Sample {
    std::string name;
    std::vector<std::int16_t> values;
    bool active = false;
};

void register_sample(PicklerResolver& resolver) {
    resolver.register_factory<Sample>([](PicklerResolver& r) {
        return RecordPickler::create<Sample>(r,
            field("name", &Sample::name),
            field("values", &Sample::values),
            field("active", &Sample::active));
    });
}

} // namespace

TEST_CASE("Serializer binary round trip", "[pickle][serializer]") {
    PicklerResolver resolver;
    register_sample(resolver);
    Serializer serializer(resolver);

    Sample sample{"probe", {1, -2, 300}, true};
    auto bytes = serializer.pickle(sample);
    Sample back = serializer.unpickle<Sample>(bytes);

    REQUIRE(back.name == "probe");
    REQUIRE(back.values == std::vector<std::int16_t>{1, -2, 300});
    REQUIRE(back.active);

    SECTION("trailing bytes are rejected") {
        bytes.push_back(0);
        try {
            (void)serializer.unpickle<Sample>(bytes);
            FAIL("expected invalid data");
        } catch (const PicklerException& e) {
            REQUIRE(e.is(FormatError::Kind::InvalidData));
        }
    }

    SECTION("truncated input is rejected") {
        bytes.pop_back();
        REQUIRE_THROWS_AS(serializer.unpickle<Sample>(bytes), PicklerException);
    }
}

TEST_CASE("Serializer frames the root type", "[pickle][serializer]") {
    PicklerResolver resolver;
    register_sample(resolver);
    REQUIRE(resolver.register_type<Sample>("test.Sample").is_ok());

    JsonFormatWriter writer;
    Serializer serializer(resolver);
    serializer.serialize(writer, Sample{"s", {}, false});

    REQUIRE(writer.document() == nlohmann::json::parse(R"([
        {"type": "test.Sample"}, {"name": "s"}, {"values": 0}, {"active": false}
    ])"));

    SECTION("type mismatch") {
        JsonFormatReader reader(writer.document());
        try {
            (void)serializer.deserialize<std::string>(reader);
            FAIL("expected a type mismatch");
        } catch (const PicklerException& e) {
            REQUIRE(e.is(FormatError::Kind::TypeMismatch));
            REQUIRE(e.message().find("test.Sample") != std::string::npos);
        }
    }
}

TEST_CASE("Serializer JSON format", "[pickle][serializer]") {
    PicklerResolver resolver;
    register_sample(resolver);

    SerializerConfig config;
    config.format = FormatKind::Json;
    Serializer serializer(resolver, config);

    auto bytes = serializer.pickle(std::int32_t{42});
    const std::string text(bytes.begin(), bytes.end());
    REQUIRE(text == R"([{"type":"i32"},{"value":42}])");
    REQUIRE(serializer.unpickle<std::int32_t>(bytes) == 42);

    Sample back = serializer.unpickle<Sample>(serializer.pickle(Sample{"j", {7}, true}));
    REQUIRE(back.name == "j");
    REQUIRE(back.values == std::vector<std::int16_t>{7});

    SECTION("malformed text") {
        const std::string broken = "[{\"type\": ";
        std::vector<std::uint8_t> raw(broken.begin(), broken.end());
        REQUIRE_THROWS_AS(serializer.unpickle<std::int32_t>(raw), PicklerException);
    }
}

TEST_CASE("Serializer clone is structural", "[pickle][serializer]") {
    PicklerResolver resolver;
    register_sample(resolver);
    Serializer serializer(resolver);

    Sample original{"orig", {1, 2}, true};
    Sample copy = serializer.clone(original);
    copy.values.push_back(3);

    REQUIRE(copy.name == "orig");
    REQUIRE(original.values.size() == 2);
}

TEST_CASE("Serializer visit", "[pickle][serializer]") {
    PicklerResolver resolver;
    register_sample(resolver);
    Serializer serializer(resolver);

    struct Collector : ObjectVisitor {
        std::vector<std::string> types;
        std::vector<std::int16_t> numbers;

        bool visit(const PicklerBase& pickler, const void* value) override {
            types.push_back(pickler.type_name());
            if (pickler.type() == std::type_index(typeid(std::int16_t))) {
                numbers.push_back(*static_cast<const std::int16_t*>(value));
            }
            return pickler.info() != PicklerInfo::Sequence;
        }
    } collector;

    serializer.visit(Sample{"v", {4, 5}, false}, collector);

    // The sequence declined to descend, so its items were skipped
    REQUIRE(collector.types.size() == 4);
    REQUIRE(collector.numbers.empty());
}

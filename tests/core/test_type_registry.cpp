// brine_core TypeRegistry tests

#include <catch2/catch_test_macros.hpp>
#include <brine/core/type_registry.hpp>
#include <string>
#include <vector>

using namespace brine_core;

namespace geo {
struct Point {
    int x = 0;
    int y = 0;
};
} // namespace geo

struct SimpleData {
    int x = 0;
    float y = 0.0f;
};

// =============================================================================
// TypeInfo Tests
// =============================================================================

TEST_CASE("TypeInfo::of", "[core][type_registry]") {
    SECTION("simple type") {
        TypeInfo info = TypeInfo::of<int>();
        REQUIRE(info.type_id == std::type_index(typeid(int)));
        REQUIRE(info.name == "int");
        REQUIRE(info.size == sizeof(int));
        REQUIRE(info.align == alignof(int));
    }

    SECTION("demangled struct name") {
        TypeInfo info = TypeInfo::of<geo::Point>();
        REQUIRE(info.name == "geo::Point");
    }

    SECTION("with readable name") {
        TypeInfo info = TypeInfo::of<geo::Point>().with_name("Point");
        REQUIRE(info.name == "Point");
    }
}

TEST_CASE("type_name_of", "[core][type_registry]") {
    REQUIRE(type_name_of<double>() == "double");
    REQUIRE(type_name_of<std::vector<int>>().find("std::vector<int") == 0);
}

// =============================================================================
// TypeRegistry Tests
// =============================================================================

TEST_CASE("TypeRegistry construction", "[core][type_registry]") {
    TypeRegistry registry;
    REQUIRE(registry.is_empty());
    REQUIRE(registry.len() == 0);
}

TEST_CASE("TypeRegistry register_type", "[core][type_registry]") {
    TypeRegistry registry;

    REQUIRE(registry.register_type<SimpleData>().is_ok());

    REQUIRE(registry.len() == 1);
    REQUIRE(registry.contains<SimpleData>());
    REQUIRE(registry.contains_name("SimpleData"));
}

TEST_CASE("TypeRegistry register_with_name", "[core][type_registry]") {
    TypeRegistry registry;

    REQUIRE(registry.register_with_name<SimpleData>("data.Simple").is_ok());

    REQUIRE(registry.contains<SimpleData>());
    REQUIRE(registry.contains_name("data.Simple"));

    const TypeInfo* info = registry.get_by_name("data.Simple");
    REQUIRE(info != nullptr);
    REQUIRE(info->name == "data.Simple");
    REQUIRE(info->size == sizeof(SimpleData));
}

TEST_CASE("TypeRegistry name conflicts", "[core][type_registry]") {
    TypeRegistry registry;
    REQUIRE(registry.register_with_name<SimpleData>("shared").is_ok());

    SECTION("name owned by another type") {
        auto result = registry.register_with_name<geo::Point>("shared");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::AlreadyExists);
        REQUIRE_FALSE(registry.contains<geo::Point>());
    }

    SECTION("same type, same name") {
        REQUIRE(registry.register_with_name<SimpleData>("shared").is_ok());
        REQUIRE(registry.len() == 1);
    }

    SECTION("renaming replaces the old name") {
        REQUIRE(registry.register_with_name<SimpleData>("renamed").is_ok());
        REQUIRE(registry.contains_name("renamed"));
        REQUIRE_FALSE(registry.contains_name("shared"));
        REQUIRE(registry.len() == 1);
    }
}

TEST_CASE("TypeRegistry get", "[core][type_registry]") {
    TypeRegistry registry;
    REQUIRE(registry.register_with_name<int>("int").is_ok());

    SECTION("by type") {
        const TypeInfo* info = registry.get<int>();
        REQUIRE(info != nullptr);
        REQUIRE(info->size == sizeof(int));
    }

    SECTION("by type_index") {
        const TypeInfo* info = registry.get(std::type_index(typeid(int)));
        REQUIRE(info != nullptr);
    }

    SECTION("by name") {
        const TypeInfo* info = registry.get_by_name("int");
        REQUIRE(info != nullptr);
    }

    SECTION("not registered") {
        const TypeInfo* info = registry.get<float>();
        REQUIRE(info == nullptr);
    }
}

TEST_CASE("TypeRegistry name_of", "[core][type_registry]") {
    TypeRegistry registry;
    REQUIRE(registry.register_with_name<geo::Point>("Point").is_ok());

    REQUIRE(registry.name_of(std::type_index(typeid(geo::Point))) == "Point");
    REQUIRE(registry.name_of(std::type_index(typeid(SimpleData))) == "SimpleData");
}

TEST_CASE("TypeRegistry clear", "[core][type_registry]") {
    TypeRegistry registry;
    REQUIRE(registry.register_type<int>().is_ok());
    REQUIRE(registry.register_type<float>().is_ok());

    REQUIRE(registry.len() == 2);

    registry.clear();

    REQUIRE(registry.is_empty());
    REQUIRE_FALSE(registry.contains<int>());
    REQUIRE_FALSE(registry.contains_name("int"));
}

TEST_CASE("TypeRegistry for_each", "[core][type_registry]") {
    TypeRegistry registry;
    REQUIRE(registry.register_with_name<int>("int").is_ok());
    REQUIRE(registry.register_with_name<float>("float").is_ok());
    REQUIRE(registry.register_with_name<double>("double").is_ok());

    std::vector<std::string> names;
    registry.for_each([&names](const TypeInfo& info) {
        names.push_back(info.name);
    });

    REQUIRE(names.size() == 3);
}

TEST_CASE("TypeRegistry get_result", "[core][type_registry]") {
    TypeRegistry registry;
    REQUIRE(registry.register_with_name<int>("int").is_ok());

    SECTION("success") {
        auto result = registry.get_result(std::type_index(typeid(int)));
        REQUIRE(result.is_ok());
        REQUIRE(result.value().get().name == "int");
    }

    SECTION("not registered") {
        auto result = registry.get_result(std::type_index(typeid(float)));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("by name not found") {
        auto result = registry.get_result_by_name("unknown");
        REQUIRE(result.is_err());
    }
}

TEST_CASE("register_builtin_types", "[core][type_registry]") {
    TypeRegistry registry;
    register_builtin_types(registry);

    REQUIRE(registry.name_of(std::type_index(typeid(std::int32_t))) == "i32");
    REQUIRE(registry.name_of(std::type_index(typeid(std::uint8_t))) == "u8");
    REQUIRE(registry.name_of(std::type_index(typeid(double))) == "f64");
    REQUIRE(registry.name_of(std::type_index(typeid(std::string))) == "string");
    REQUIRE(registry.contains_name("bool"));
}

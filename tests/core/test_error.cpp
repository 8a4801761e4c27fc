// brine_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <brine/core/error.hpp>
#include <string>
#include <vector>

using namespace brine_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("PicklerError::generation_failed") {
        Error err = PicklerError::generation_failed("Widget", "no accessible constructor");
        REQUIRE(err.code() == ErrorCode::GenerationFailed);
        REQUIRE(err.message().find("Widget") != std::string::npos);
        REQUIRE(err.message().find("no accessible constructor") != std::string::npos);
    }

    SECTION("PicklerError::delegate_binding") {
        Error err = PicklerError::delegate_binding("Handler", "signature mismatch");
        REQUIRE(err.code() == ErrorCode::BindingFailed);
        REQUIRE(err.as<PicklerError>()->kind == PicklerError::Kind::DelegateBinding);
    }

    SECTION("PicklerError::abstract_type_misuse") {
        Error err = PicklerError::abstract_type_misuse("Shape");
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.message() == "internal error: attempting to consume abstract pickler 'Shape'");
    }

    SECTION("FormatError::unexpected_end") {
        Error err = FormatError::unexpected_end("length");
        REQUIRE(err.code() == ErrorCode::IOError);
        REQUIRE(err.as<FormatError>()->tag == "length");
    }

    SECTION("FormatError::invalid_reference") {
        Error err = FormatError::invalid_reference(7, "unknown id");
        REQUIRE(err.code() == ErrorCode::ParseError);
        REQUIRE(err.message().find("#7") != std::string::npos);
    }

    SECTION("TypeRegistryError::not_registered") {
        Error err = TypeRegistryError::not_registered("Counter");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.is<TypeRegistryError>());
        REQUIRE_FALSE(err.is<PicklerError>());
    }

    SECTION("ConfigError::invalid_value") {
        Error err = ConfigError::invalid_value("format", "unknown");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.as<ConfigError>()->key == "format");
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    SECTION("kind name and type") {
        Error err = PicklerError::generation_failed("Widget", "no pickler factory registered");
        std::string chain = build_error_chain(err);
        REQUIRE(chain.find("[GenerationFailed]") != std::string::npos);
        REQUIRE(chain.find("PicklerGenerationError") != std::string::npos);
        REQUIRE(chain.find("(type: Widget)") != std::string::npos);
    }

    SECTION("context lines") {
        Error err = FormatError::tag_mismatch("value", "isNull");
        err.with_context("resolving", "Color");
        std::string chain = build_error_chain(err);
        REQUIRE(chain.find("Expected field 'value', found 'isNull'") != std::string::npos);
        REQUIRE(chain.find("\n  resolving: Color") != std::string::npos);
    }
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE_FALSE(r.is_ok());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err with Error object") {
        Error err(ErrorCode::NotFound, "Not found");
        Result<int> r = Err<int>(err);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value on Ok") {
        Result<std::string> r = Ok(std::string("hello"));
        REQUIRE(r.value() == "hello");
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS(r.unwrap());
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result map", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err") {
        Result<int> r = Err<int>(Error("error"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().message() == "error");
    }
}

TEST_CASE("Result boolean conversion", "[core][result]") {
    Result<int> ok = Ok(42);
    Result<int> err = Err<int>(Error("error"));

    REQUIRE(static_cast<bool>(ok));
    REQUIRE_FALSE(static_cast<bool>(err));

    Result<std::vector<int>> list = Ok(std::vector<int>{1, 2, 3});
    REQUIRE(list->size() == 3);
}

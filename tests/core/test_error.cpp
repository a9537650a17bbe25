// marshal_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <marshal/core/error.hpp>
#include <string>

using namespace marshal_core;

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
    SECTION("ConversionError::no_converter") {
        Error err = ConversionError::no_converter("Widget");
        REQUIRE(err.code() == ErrorCode::NotSupported);
        REQUIRE(err.message().find("Widget") != std::string::npos);
        REQUIRE_FALSE(err.is_caller_error());
    }

    SECTION("ConversionError::invalid_input") {
        Error err = ConversionError::invalid_input("Vector3", "expected a map");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE_FALSE(err.is_caller_error());
    }

    SECTION("ConversionError::unknown_name") {
        Error err = ConversionError::unknown_name("Mode", "Fourth");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.is_caller_error());
        REQUIRE(err.message().find("Fourth") != std::string::npos);
    }

    SECTION("ConversionError::unknown_constant") {
        Error err = ConversionError::unknown_constant("Color", "chartreuse");
        REQUIRE(err.is_caller_error());
    }

    SECTION("ConversionError::out_of_range") {
        Error err = ConversionError::out_of_range("byte", "300");
        REQUIRE(err.code() == ErrorCode::OutOfRange);
        REQUIRE_FALSE(err.is_caller_error());
    }

    SECTION("TypeRegistryError") {
        Error not_registered = TypeRegistryError::not_registered("Foo");
        REQUIRE(not_registered.code() == ErrorCode::NotFound);

        Error duplicate = TypeRegistryError::already_registered("Foo");
        REQUIRE(duplicate.code() == ErrorCode::AlreadyExists);

        Error mismatch = TypeRegistryError::type_mismatch("float", "string");
        REQUIRE(mismatch.code() == ErrorCode::TypeMismatch);
    }

    SECTION("AssetError") {
        Error missing = AssetError::not_found("Assets/a.mat");
        REQUIRE(missing.code() == ErrorCode::NotFound);

        Error parse = AssetError::parse_error("Assets/a.mat", "bad json");
        REQUIRE(parse.code() == ErrorCode::ParseError);

        Error mismatch = AssetError::type_mismatch("Assets/a.mat", "Texture", "Material");
        REQUIRE(mismatch.code() == ErrorCode::TypeMismatch);
    }
}

TEST_CASE("Error type queries", "[core][error]") {
    Error err = ConversionError::unknown_name("Mode", "Fourth");

    REQUIRE(err.is<ConversionError>());
    REQUIRE_FALSE(err.is<AssetError>());

    const auto* conv = err.as<ConversionError>();
    REQUIRE(conv != nullptr);
    REQUIRE(conv->kind == ConversionError::Kind::UnknownName);
    REQUIRE(conv->type_name == "Mode");
    REQUIRE(conv->input == "Fourth");
    REQUIRE(err.as<TypeRegistryError>() == nullptr);
}

TEST_CASE("build_error_chain", "[core][error]") {
    Error err = Error(ConversionError::out_of_range("byte", "300")).with_context("path", "[2]");
    auto chain = build_error_chain(err);

    REQUIRE(chain.rfind("[OutOfRange]", 0) == 0);
    REQUIRE(chain.find("byte") != std::string::npos);
    REQUIRE(chain.find("{path=[2]}") != std::string::npos);
}

TEST_CASE("ConversionException carries its error", "[core][error]") {
    try {
        throw ConversionException(ConversionError::unknown_constant("Color", "chartreuse"));
    } catch (const ConversionException& e) {
        REQUIRE(e.error().is_caller_error());
        REQUIRE(std::string(e.what()).find("chartreuse") != std::string::npos);
    }
}

// =============================================================================
// Result Tests
// =============================================================================

TEST_CASE("Result Ok", "[core][result]") {
    SECTION("with value") {
        Result<int> result = Ok(42);
        REQUIRE(result.is_ok());
        REQUIRE_FALSE(result.is_err());
        REQUIRE(result.value() == 42);
        REQUIRE(*result == 42);
        REQUIRE(static_cast<bool>(result));
    }

    SECTION("void") {
        Result<void> result = Ok();
        REQUIRE(result.is_ok());
    }
}

TEST_CASE("Result Err", "[core][result]") {
    SECTION("with error") {
        Result<int> result = Err<int>(Error(ErrorCode::NotFound, "missing"));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
        REQUIRE(result.value_or(7) == 7);
    }

    SECTION("unwrap throws") {
        Result<int> result = Err<int>("failed");
        REQUIRE_THROWS(result.unwrap());
    }

    SECTION("void") {
        Result<void> result = Err(Error("failed"));
        REQUIRE(result.is_err());
        REQUIRE(result.error().message() == "failed");
    }
}

TEST_CASE("Result map", "[core][result]") {
    Result<int> ok = Ok(21);
    auto doubled = ok.map([](int v) { return v * 2; });
    REQUIRE(doubled.value() == 42);

    Result<int> err = Err<int>("no");
    auto mapped = err.map([](int v) { return v * 2; });
    REQUIRE(mapped.is_err());
}

// xref_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <xref_engine/core/error.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace xref_core;

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
    SECTION("IndexError::malformed") {
        Error err = IndexError::malformed("unexpected token");
        REQUIRE(err.code() == ErrorCode::ParseError);
        REQUIRE(err.is<IndexError>());
        REQUIRE(err.message().find("unexpected token") != std::string::npos);
    }

    SECTION("IndexError::duplicate_type") {
        Error err = IndexError::duplicate_type("RSPlayer");
        REQUIRE(err.code() == ErrorCode::AlreadyExists);
        REQUIRE(err.as<IndexError>()->type_name == "RSPlayer");
    }

    SECTION("IndexError::unknown_type") {
        Error err = IndexError::unknown_type("RSNpc");
        REQUIRE(err.code() == ErrorCode::NotFound);
    }

    SECTION("IndexError::invalid_member") {
        Error err = IndexError::invalid_member("RSNpc", "tick", "empty name");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        const auto* index_err = err.as<IndexError>();
        REQUIRE(index_err != nullptr);
        REQUIRE(index_err->member_name == "tick");
        REQUIRE(index_err->kind == IndexError::Kind::InvalidMember);
    }

    SECTION("ConfigError::read_failed") {
        Error err = ConfigError::read_failed("/missing.json");
        REQUIRE(err.code() == ErrorCode::IOError);
        REQUIRE(err.is<ConfigError>());
        REQUIRE_FALSE(err.is<IndexError>());
    }

    SECTION("ConfigError::invalid_value") {
        Error err = ConfigError::invalid_value("mirror_prefix", "too long");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.as<ConfigError>()->key == "mirror_prefix");
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    SECTION("generic message") {
        Error err(ErrorCode::IOError, "Cannot open");
        REQUIRE(build_error_chain(err) == "[IOError] Cannot open");
    }

    SECTION("index error with type") {
        Error err = IndexError::unknown_type("RSNpc");
        auto chain = build_error_chain(err);
        REQUIRE(chain.find("[NotFound]") == 0);
        REQUIRE(chain.find("[IndexError]") != std::string::npos);
        REQUIRE(chain.find("(type: RSNpc)") != std::string::npos);
    }

    SECTION("context entries are appended in key order") {
        Error err = ConfigError::malformed("bad json");
        err.with_context("path", "a.json").with_context("line", "3");
        auto chain = build_error_chain(err);
        REQUIRE(chain.find("[ConfigError]") != std::string::npos);
        auto line = chain.find("{line=3}");
        auto path = chain.find("{path=a.json}");
        REQUIRE(line != std::string::npos);
        REQUIRE(path != std::string::npos);
        REQUIRE(line < path);
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

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err with domain error") {
        Result<int> r = Err<int>(IndexError::duplicate_type("RSPlayer"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::AlreadyExists);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("bool conversion and dereference") {
        Result<std::string> r = Ok(std::string("hello"));
        REQUIRE(static_cast<bool>(r));
        REQUIRE(*r == "hello");
        REQUIRE(r->size() == 5);
    }

    SECTION("Err converts to false") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_FALSE(static_cast<bool>(r));
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result with move-only types", "[core][result]") {
    Result<std::unique_ptr<int>> r = Ok(std::make_unique<int>(7));
    REQUIRE(r.is_ok());
    auto owned = std::move(r).value();
    REQUIRE(*owned == 7);
}

// sail_ron Parser tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sail_engine/ron/parser.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

using namespace sail_ron;
using sail_core::ErrorCode;
using sail_core::ParseError;

namespace {

Value parse_ok(std::string_view text) {
    auto result = Parser::parse_value(text);
    REQUIRE(result.is_ok());
    return std::move(*result);
}

ParseError parse_fail(std::string_view text) {
    auto result = Parser::parse(text, "test.ron");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::ParseError);
    REQUIRE(result.error().is<ParseError>());
    return *result.error().as<ParseError>();
}

} // anonymous namespace

// =============================================================================
// Scalars
// =============================================================================

TEST_CASE("Parser scalars", "[ron][parser]") {
    SECTION("unit and booleans") {
        REQUIRE(parse_ok("()").is_unit());
        REQUIRE(parse_ok("true").as_bool());
        REQUIRE_FALSE(parse_ok("false").as_bool());
    }

    SECTION("integers") {
        REQUIRE(parse_ok("42").as_integer() == 42);
        REQUIRE(parse_ok("-7").as_integer() == -7);
        REQUIRE(parse_ok("0x2A").as_integer() == 42);
        REQUIRE(parse_ok("0o17").as_integer() == 15);
        REQUIRE(parse_ok("0b101").as_integer() == 5);
        REQUIRE(parse_ok("1_000").as_integer() == 1000);
        REQUIRE(parse_ok("-9223372036854775808").as_integer()
                == std::numeric_limits<std::int64_t>::min());
        REQUIRE(parse_ok("-0x8000000000000000").as_integer()
                == std::numeric_limits<std::int64_t>::min());
        REQUIRE(parse_ok("0x7FFF_FFFF_FFFF_FFFF").as_integer()
                == std::numeric_limits<std::int64_t>::max());
    }

    SECTION("floats") {
        REQUIRE(parse_ok("20.").is_float());
        REQUIRE(parse_ok("20.").as_number() == 20.0);
        REQUIRE(parse_ok(".5").as_number() == 0.5);
        REQUIRE(parse_ok("-10.").as_number() == -10.0);
        REQUIRE(parse_ok("1e3").as_number() == 1000.0);
        REQUIRE(parse_ok("0.85").as_number() == Catch::Approx(0.85));
        REQUIRE(std::isinf(parse_ok("inf").as_number()));
        REQUIRE(parse_ok("-inf").as_number() < 0.0);
        REQUIRE(std::isnan(parse_ok("NaN").as_number()));
    }

    SECTION("strings") {
        REQUIRE(parse_ok("\"Day 1\"").as_string() == "Day 1");
        REQUIRE(parse_ok("\"\"").as_string().empty());
        REQUIRE(parse_ok(R"("a\"b\\c\n")").as_string() == "a\"b\\c\n");
        REQUIRE(parse_ok(R"("\u{24}0")").as_string() == "$0");
        REQUIRE(parse_ok(R"("\x41")").as_string() == "A");
    }

    SECTION("raw strings") {
        REQUIRE(parse_ok(R"(r"C:\ui")").as_string() == "C:\\ui");
        REQUIRE(parse_ok(R"RAW(r#"say "hi""#)RAW").as_string() == "say \"hi\"");
    }

    SECTION("chars") {
        Value c = parse_ok("'+'");
        REQUIRE(c.is_char());
        REQUIRE(c.as_string() == "+");
        REQUIRE(parse_ok(R"('\n')").as_string() == "\n");
    }

    SECTION("identifiers") {
        Value v = parse_ok("MiddleLeft");
        REQUIRE(v.is_identifier());
        REQUIRE(v.name() == "MiddleLeft");
        REQUIRE(parse_ok("None").is_named("None"));
    }
}

// =============================================================================
// Compound Values
// =============================================================================

TEST_CASE("Parser compound values", "[ron][parser]") {
    SECTION("anonymous tuple") {
        Value v = parse_ok("(1.0, 0.9, 0.6, 1.0)");
        REQUIRE(v.is_tuple());
        REQUIRE(v.name().empty());
        REQUIRE(v.size() == 4);
        REQUIRE(v.elements()[2].as_number() == Catch::Approx(0.6));
    }

    SECTION("named tuple") {
        Value v = parse_ok(R"(File("texture/panel.png", ("IMAGE", ())))");
        REQUIRE(v.is_named("File"));
        REQUIRE(v.size() == 2);
        REQUIRE(v.elements()[1].is_tuple());
        REQUIRE(v.elements()[1].elements()[0].as_string() == "IMAGE");
        REQUIRE(v.elements()[1].elements()[1].is_unit());
    }

    SECTION("empty named tuple") {
        Value v = parse_ok("NoStretch()");
        REQUIRE(v.is_tuple());
        REQUIRE(v.size() == 0);
    }

    SECTION("anonymous struct") {
        Value v = parse_ok("(id: \"time\", width: 260., height: 50.)");
        REQUIRE(v.is_struct());
        REQUIRE(v.name().empty());
        REQUIRE(v.field("id")->as_string() == "time");
        REQUIRE(v.field_names().size() == 3);
    }

    SECTION("named struct with nested list") {
        Value v = parse_ok(R"(
            Container(
                transform: (width: 1., height: 1.),
                children: [
                    Label(transform: (width: 2., height: 2.), text: (text: "a")),
                ],
            )
        )");
        REQUIRE(v.is_named("Container"));
        const Value* children = v.field("children");
        REQUIRE(children != nullptr);
        REQUIRE(children->is_list());
        REQUIRE(children->size() == 1);
        REQUIRE(children->elements()[0].is_named("Label"));
    }

    SECTION("duplicate struct fields are kept for the caller") {
        Value v = parse_ok("(x: 1, x: 2)");
        REQUIRE(v.field_names().size() == 2);
        REQUIRE(v.field("x")->as_integer() == 1);
    }

    SECTION("lists and maps") {
        REQUIRE(parse_ok("[]").size() == 0);
        REQUIRE(parse_ok("[1, 2, 3,]").size() == 3);

        Value m = parse_ok(R"({"a": 1, "b": 2})");
        REQUIRE(m.is_map());
        REQUIRE(m.keys()[1].as_string() == "b");
        REQUIRE(m.elements()[1].as_integer() == 2);
    }

    SECTION("comments are trivia") {
        Value v = parse_ok(R"(
            // line comment
            /* block /* nested */ comment */
            (a: 1, /* inline */ b: 2)
        )");
        REQUIRE(v.field("b")->as_integer() == 2);
    }

    SECTION("path-like identifiers do not start a struct") {
        Value v = parse_ok("(Middle, TopLeft)");
        REQUIRE(v.is_tuple());
        REQUIRE(v.elements()[1].name() == "TopLeft");
    }
}

TEST_CASE("Parser source locations", "[ron][parser]") {
    Value v = parse_ok("(\n  a: 1,\n  b: Foo(2),\n)");
    REQUIRE(v.location().line == 1);
    REQUIRE(v.location().column == 1);
    REQUIRE(v.field("b")->location().line == 3);
    REQUIRE(v.field("b")->location().column == 6);
}

// =============================================================================
// Documents
// =============================================================================

TEST_CASE("Parser documents", "[ron][parser]") {
    SECTION("extension header") {
        auto doc = Parser::parse("#![enable(implicit_some)]\n(x: 1)");
        REQUIRE(doc.is_ok());
        REQUIRE(doc->extensions.size() == 1);
        REQUIRE(doc->has_extension("implicit_some"));
        REQUIRE(doc->root.is_struct());
    }

    SECTION("several extensions") {
        auto doc = Parser::parse("#![enable(implicit_some, unwrap_newtypes)]\n()");
        REQUIRE(doc.is_ok());
        REQUIRE(doc->extensions.size() == 2);
        REQUIRE(doc->extensions[1] == "unwrap_newtypes");
    }

    SECTION("no header") {
        auto doc = Parser::parse("Middle");
        REQUIRE(doc.is_ok());
        REQUIRE(doc->extensions.empty());
    }

    SECTION("byte order mark is skipped") {
        auto doc = Parser::parse("\xEF\xBB\xBF" "42");
        REQUIRE(doc.is_ok());
        REQUIRE(doc->root.as_integer() == 42);
    }

    SECTION("parse_file") {
        auto path = std::filesystem::temp_directory_path() / "sail_ron_parse_file.ron";
        {
            std::ofstream out(path);
            out << "#![enable(implicit_some)]\nLabel(transform: (width: 1., height: 1.))\n";
        }
        auto doc = Parser::parse_file(path);
        REQUIRE(doc.is_ok());
        REQUIRE(doc->root.is_named("Label"));
        std::filesystem::remove(path);
    }

    SECTION("parse_file on missing file is an IO error") {
        auto doc = Parser::parse_file("definitely/not/here.ron");
        REQUIRE(doc.is_err());
        REQUIRE(doc.error().code() == ErrorCode::IOError);
    }
}

// =============================================================================
// Errors
// =============================================================================

TEST_CASE("Parser errors", "[ron][parser]") {
    SECTION("unterminated struct") {
        ParseError err = parse_fail("(a: 1,");
        REQUIRE(err.kind == ParseError::Kind::UnexpectedEnd);
        REQUIRE(err.source == "test.ron");
    }

    SECTION("missing separator reports position") {
        ParseError err = parse_fail("(a: 1 b: 2)");
        REQUIRE(err.kind == ParseError::Kind::UnexpectedCharacter);
        REQUIRE(err.line == 1);
        REQUIRE(err.column == 7);
    }

    SECTION("error line follows newlines") {
        ParseError err = parse_fail("(\n  a: 1,\n  b: ?,\n)");
        REQUIRE(err.line == 3);
        REQUIRE(err.column == 6);
    }

    SECTION("trailing characters") {
        ParseError err = parse_fail("(a: 1) (b: 2)");
        REQUIRE(err.kind == ParseError::Kind::TrailingCharacters);
    }

    SECTION("invalid numbers") {
        REQUIRE(parse_fail("1e").kind == ParseError::Kind::InvalidNumber);
        REQUIRE(parse_fail("0x").kind == ParseError::Kind::InvalidNumber);
        REQUIRE(parse_fail("99999999999999999999").kind == ParseError::Kind::InvalidNumber);
        REQUIRE(parse_fail("0x8000000000000000").kind == ParseError::Kind::InvalidNumber);
        REQUIRE(parse_fail("-0x8000000000000001").kind == ParseError::Kind::InvalidNumber);
        REQUIRE(parse_fail("-foo").kind == ParseError::Kind::InvalidNumber);
    }

    SECTION("invalid strings") {
        REQUIRE(parse_fail(R"("bad \q escape")").kind == ParseError::Kind::InvalidString);
        REQUIRE(parse_fail(R"("\u{110000}")").kind == ParseError::Kind::InvalidString);
        REQUIRE(parse_fail("\"open").kind == ParseError::Kind::UnexpectedEnd);
    }

    SECTION("strings must be valid UTF-8") {
        REQUIRE(parse_fail("\"\xff\xfe\"").kind == ParseError::Kind::InvalidString);
        REQUIRE(parse_fail("\"caf\xc3\"").kind == ParseError::Kind::InvalidString);
        REQUIRE(parse_fail("\"\xc0\xaf\"").kind == ParseError::Kind::InvalidString);
        REQUIRE(parse_fail("r\"\x80\"").kind == ParseError::Kind::InvalidString);

        ParseError err = parse_fail("(name: \"ok\xe2\x82\")");
        REQUIRE(err.kind == ParseError::Kind::InvalidString);
        REQUIRE(err.column == 11);

        REQUIRE(parse_ok("\"caf\xc3\xa9 \xe2\x82\xac\"").as_string() == "caf\xc3\xa9 \xe2\x82\xac");
    }

    SECTION("bad extension attribute") {
        REQUIRE(parse_fail("#![disable(implicit_some)]\n()").kind
                == ParseError::Kind::UnexpectedCharacter);
    }

    SECTION("empty input") {
        REQUIRE(parse_fail("").kind == ParseError::Kind::UnexpectedEnd);
        REQUIRE(parse_fail("   // only a comment\n").kind == ParseError::Kind::UnexpectedEnd);
    }

    SECTION("unterminated block comment") {
        REQUIRE(parse_fail("/* never closed").kind == ParseError::Kind::UnexpectedEnd);
        REQUIRE(parse_fail("5 /* never closed").kind == ParseError::Kind::UnexpectedEnd);
        REQUIRE(parse_fail("(a: 1) /* outer /* inner */").kind == ParseError::Kind::UnexpectedEnd);
        REQUIRE(Parser::parse_value("5 /* never closed").is_err());
    }

    SECTION("nesting limit") {
        std::string deep(300, '[');
        deep += std::string(300, ']');
        REQUIRE(parse_fail(deep).kind == ParseError::Kind::UnexpectedCharacter);
    }
}

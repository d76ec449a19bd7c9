// sail_ron Writer tests

#include <catch2/catch_test_macros.hpp>
#include <sail_engine/ron/parser.hpp>
#include <sail_engine/ron/writer.hpp>

#include <cmath>
#include <limits>
#include <string>

using namespace sail_ron;

namespace {

WriterOptions compact() {
    WriterOptions options;
    options.pretty = false;
    return options;
}

} // anonymous namespace

TEST_CASE("Writer format_float", "[ron][writer]") {
    REQUIRE(Writer::format_float(20.0) == "20.0");
    REQUIRE(Writer::format_float(-10.0) == "-10.0");
    REQUIRE(Writer::format_float(0.85) == "0.85");
    REQUIRE(Writer::format_float(1e300) == "1e+300");
    REQUIRE(Writer::format_float(std::numeric_limits<double>::infinity()) == "inf");
    REQUIRE(Writer::format_float(-std::numeric_limits<double>::infinity()) == "-inf");
    REQUIRE(Writer::format_float(std::numeric_limits<double>::quiet_NaN()) == "NaN");
}

TEST_CASE("Writer quote", "[ron][writer]") {
    REQUIRE(Writer::quote("Port") == "\"Port\"");
    REQUIRE(Writer::quote("a\"b") == "\"a\\\"b\"");
    REQUIRE(Writer::quote("line\nbreak") == "\"line\\nbreak\"");
    REQUIRE(Writer::quote("back\\slash") == "\"back\\\\slash\"");
    REQUIRE(Writer::quote("'", '\'') == "'\\''");
    REQUIRE(Writer::quote(std::string(1, '\x01')) == "\"\\u{1}\"");
}

TEST_CASE("Writer compact output", "[ron][writer]") {
    Writer writer(compact());

    SECTION("scalars") {
        REQUIRE(writer.write(Value::unit()) == "()");
        REQUIRE(writer.write(Value::boolean(true)) == "true");
        REQUIRE(writer.write(Value::integer(-3)) == "-3");
        REQUIRE(writer.write(Value::identifier("Middle")) == "Middle");
        REQUIRE(writer.write(Value::character("+")) == "'+'");
    }

    SECTION("tuples") {
        Value color = Value::tuple({}, {Value::floating(1.0), Value::floating(0.5)});
        REQUIRE(writer.write(color) == "(1.0, 0.5)");

        Value some = Value::tuple("Some", {Value::integer(4)});
        REQUIRE(writer.write(some) == "Some(4)");
    }

    SECTION("single element anonymous tuple keeps its comma") {
        REQUIRE(writer.write(Value::tuple({}, {Value::integer(1)})) == "(1,)");
    }

    SECTION("structs") {
        Value v = Value::structure("Label", {"id", "z"},
                                   {Value::string("time"), Value::floating(1.0)});
        REQUIRE(writer.write(v) == "Label(id: \"time\", z: 1.0)");
    }

    SECTION("maps") {
        Value m = Value::map({Value::string("a")}, {Value::integer(1)});
        REQUIRE(writer.write(m) == "{\"a\": 1}");
    }
}

TEST_CASE("Writer pretty output", "[ron][writer]") {
    Writer writer;

    SECTION("struct fields on separate lines") {
        Value v = Value::structure({}, {"width", "height"},
                                   {Value::floating(32.0), Value::floating(32.0)});
        REQUIRE(writer.write(v) == "(\n    width: 32.0,\n    height: 32.0,\n)");
    }

    SECTION("short tuples stay inline") {
        Value v = Value::structure({}, {"color"}, {Value::tuple({}, {
            Value::floating(1.0), Value::floating(1.0), Value::floating(1.0), Value::floating(1.0)})});
        REQUIRE(writer.write(v) == "(\n    color: (1.0, 1.0, 1.0, 1.0),\n)");
    }

    SECTION("newtype wrapper hugs a struct payload") {
        Value inner = Value::structure({}, {"x"}, {Value::integer(1)});
        Value some = Value::tuple("Some", {inner});
        REQUIRE(writer.write(some) == "Some((\n    x: 1,\n))");
    }

    SECTION("empty containers") {
        REQUIRE(writer.write(Value::list({})) == "[]");
        REQUIRE(writer.write(Value::structure("Empty", {}, {})) == "Empty()");
        REQUIRE(writer.write(Value::map({}, {})) == "{}");
    }

    SECTION("custom indent") {
        WriterOptions options;
        options.indent = "  ";
        Writer two(options);
        Value v = Value::list({Value::structure({}, {"a"}, {Value::integer(1)})});
        REQUIRE(two.write(v) == "[\n  (\n    a: 1,\n  ),\n]");
    }
}

TEST_CASE("Writer documents", "[ron][writer]") {
    Document doc;
    doc.extensions = {"implicit_some"};
    doc.root = Value::identifier("Middle");

    SECTION("extension header") {
        REQUIRE(Writer().write(doc) == "#![enable(implicit_some)]\n\nMiddle\n");
        REQUIRE(Writer(compact()).write(doc) == "#![enable(implicit_some)]\nMiddle\n");
    }

    SECTION("header can be suppressed") {
        WriterOptions options;
        options.emit_extensions = false;
        REQUIRE(Writer(options).write(doc) == "Middle\n");
    }
}

TEST_CASE("Writer output parses back", "[ron][writer]") {
    const char* source = R"(#![enable(implicit_some)]
Container(
    transform: (id: "background", anchor: Middle, width: 20., height: 20.),
    background: SolidColor(0.1, 0.2, 0.3, 1.0),
    children: [
        Label(
            transform: (id: "a\"b", width: 1., height: 1.),
            text: (text: "line\nbreak", font_size: 16, color: (1., 1., 1., 1.)),
        ),
        Image(transform: (width: 1e-3, height: -0.5), image: Texture(File("t.png", ("IMAGE", ())))),
    ],
    extra: {"k": [1, 2, 0x10], 'c': r"raw"},
)
)";
    auto parsed = Parser::parse(source);
    REQUIRE(parsed.is_ok());

    for (bool pretty : {true, false}) {
        WriterOptions options;
        options.pretty = pretty;
        std::string text = Writer(options).write(*parsed);

        auto reparsed = Parser::parse(text);
        REQUIRE(reparsed.is_ok());
        REQUIRE(reparsed->extensions == parsed->extensions);
        REQUIRE(reparsed->root == parsed->root);
    }
}

#include <doctest/doctest.h>
#include <fstreams/coding_registry.hh>
#include <fstreams/sdk/open_options.hh>
#include <fstreams/error.hh>
#include "../mock_components.hh"

using namespace fstreams;
using namespace fstreams::test;

TEST_SUITE("Codings") {
    TEST_CASE("apply wraps the raw stream") {
        coding_registry codings;
        codings.add_transform("xor", [](std::unique_ptr<io_stream> raw) -> std::unique_ptr<io_stream> {
            return std::make_unique<xor_io_stream>(std::move(raw), 0xff);
        });

        CHECK(codings.contains("xor"));
        CHECK(codings.codings() == std::vector<coding_id_t>{"xor"});

        auto decoded = codings.apply("xor", io_from_bytes({0x00, 0xf0}));
        uint8_t bytes[2] = {};
        REQUIRE(decoded->read(bytes, 2) == 2);
        CHECK(bytes[0] == 0xff);
        CHECK(bytes[1] == 0x0f);
    }

    TEST_CASE("unknown coding") {
        coding_registry codings;
        CHECK_FALSE(codings.contains("gzip"));
        CHECK_THROWS_AS((void)codings.transform_for("gzip"), unknown_coding);
        CHECK_THROWS_WITH((void)codings.apply("gzip", io_from_bytes()),
                          "no transform registered for coding gzip");
    }

    TEST_CASE("transform returning nothing") {
        coding_registry codings;
        codings.add_transform("broken", [](std::unique_ptr<io_stream>) -> std::unique_ptr<io_stream> {
            return nullptr;
        });
        CHECK_THROWS_AS((void)codings.apply("broken", io_from_bytes()), io_error);
    }

    TEST_CASE("replacing and clearing") {
        coding_registry codings;
        int used = 0;
        codings.add_transform("id", [&](std::unique_ptr<io_stream> raw) { used = 1; return raw; });
        codings.add_transform("id", [&](std::unique_ptr<io_stream> raw) { used = 2; return raw; });

        auto io = codings.apply("id", io_from_bytes());
        CHECK(io);
        CHECK(used == 2);

        codings.clear();
        CHECK(codings.codings().empty());
    }
}

TEST_SUITE("OpenOptions") {
    TEST_CASE("typed values") {
        open_options options;
        CHECK(options.empty());

        options.set("fill", uint32_t(5)).set("label", std::string("run"));
        CHECK(options.size() == 2);
        CHECK(options.contains("fill"));
        CHECK(options.get<uint32_t>("fill") == 5);
        CHECK(options.get<std::string>("label") == "run");
    }

    TEST_CASE("missing and mistyped values") {
        open_options options;
        options.set("n", 3);

        CHECK_THROWS_AS((void)options.get<int>("m"), option_error);
        CHECK_THROWS_AS((void)options.get<double>("n"), option_error);
        CHECK(options.get_or<int>("m", 7) == 7);
        CHECK(options.get_or<int>("n", 7) == 3);
        CHECK_THROWS_AS((void)options.get_or<double>("n", 1.0), option_error);
    }

    TEST_CASE("later values replace earlier ones") {
        open_options options;
        options.set("n", 1).set("n", 2);
        CHECK(options.size() == 1);
        CHECK(options.get<int>("n") == 2);
    }
}

#include <doctest/doctest.h>
#include <fstreams/registry.hh>
#include <fstreams/error.hh>
#include "../mock_components.hh"

using namespace fstreams;
using namespace fstreams::test;

TEST_SUITE("Registry::Registration") {
    TEST_CASE("duplicate registration is rejected and leaves the list unchanged") {
        registry reg;
        named_handler h1("h1");

        reg.add_streamer("x", h1);
        CHECK_THROWS_AS(reg.add_streamer("x", h1), duplicate_registration);
        CHECK(reg.handlers_for("x").size() == 1);
    }

    TEST_CASE("same handler may serve several formats") {
        registry reg;
        named_handler h1("h1");

        reg.add_streamer("x", h1);
        CHECK_NOTHROW(reg.add_streamer("y", h1));
        CHECK(reg.formats() == std::vector<format_id_t>{"x", "y"});
    }

    TEST_CASE("second handler for a format is allowed") {
        registry reg;
        named_handler h1("h1");
        named_handler h2("h2");

        reg.add_streamer("x", h1);
        CHECK_NOTHROW(reg.add_streamer("x", h2));

        const auto& handlers = reg.handlers_for("x");
        REQUIRE(handlers.size() == 2);
        CHECK(handlers[0] == &h1);
        CHECK(handlers[1] == &h2);
    }

    TEST_CASE("global favorite twice is rejected") {
        registry reg;
        named_handler h1("h1");

        reg.prefer(h1);
        CHECK(reg.is_global_favorite(h1));
        CHECK_THROWS_AS(reg.prefer(h1), already_global_favorite);
        CHECK(reg.global_favorites().size() == 1);
    }

    TEST_CASE("format favorite for unregistered handler is rejected") {
        registry reg;
        named_handler h1("h1");
        named_handler h2("h2");
        reg.add_streamer("x", h1);

        SUBCASE("handler registered for another format") {
            reg.add_streamer("y", h2);
            CHECK_THROWS_AS(reg.prefer(h2, "x"), unregistered_handler_preference);
        }

        SUBCASE("format with no handlers at all") {
            CHECK_THROWS_AS(reg.prefer(h1, "z"), unregistered_handler_preference);
            CHECK(reg.handlers_for("z").empty());
        }

        CHECK(reg.favorite_for("x") == nullptr);
        CHECK(reg.handlers_for("x").size() == 1);
    }

    TEST_CASE("format favorite can be replaced") {
        registry reg;
        named_handler h1("h1");
        named_handler h2("h2");
        reg.add_streamer("x", h1);
        reg.add_streamer("x", h2);

        reg.prefer(h1, "x");
        CHECK(reg.favorite_for("x") == &h1);
        CHECK_NOTHROW(reg.prefer(h2, "x"));
        CHECK(reg.favorite_for("x") == &h2);
        CHECK_NOTHROW(reg.prefer(h2, "x"));
    }

    TEST_CASE("errors carry their kind") {
        registry reg;
        named_handler h1("h1");
        reg.add_streamer("x", h1);

        try {
            reg.add_streamer("x", h1);
            FAIL("expected duplicate_registration");
        } catch (const fstreams_error& e) {
            CHECK(e.kind() == error_kind::duplicate_registration);
            CHECK(std::string(e.what()).find("h1") != std::string::npos);
        }
    }
}

TEST_SUITE("Registry::Resolve") {
    TEST_CASE("nothing registered") {
        registry reg;
        CHECK_THROWS_AS((void)reg.resolve("x"), no_handler_registered);

        auto result = reg.try_resolve("x");
        CHECK_FALSE(result);
        CHECK(result.status == error_kind::no_handler_registered);
        CHECK(result.chosen == nullptr);
    }

    TEST_CASE("single handler without favorites") {
        registry reg;
        named_handler h1("h1");
        reg.add_streamer("x", h1);

        CHECK(&reg.resolve("x") == &h1);
    }

    TEST_CASE("several handlers without favorites are ambiguous") {
        registry reg;
        named_handler h1("h1");
        named_handler h2("h2");
        reg.add_streamer("x", h1);
        reg.add_streamer("x", h2);

        CHECK_THROWS_AS((void)reg.resolve("x"), ambiguous_handler);

        try {
            (void)reg.resolve("x");
        } catch (const ambiguous_handler& e) {
            CHECK(e.format() == "x");
            REQUIRE(e.candidates().size() == 2);
            CHECK(e.candidates()[0] == &h1);
            CHECK(e.candidates()[1] == &h2);
            CHECK(std::string(e.what()).find("h1, h2") != std::string::npos);
        }

        auto result = reg.try_resolve("x");
        CHECK(result.status == error_kind::ambiguous_handler);
        CHECK(result.candidates.size() == 2);
    }

    TEST_CASE("exactly one global favorite among candidates wins") {
        registry reg;
        named_handler h1("h1");
        named_handler h2("h2");
        named_handler h3("h3");
        reg.add_streamer("x", h1);
        reg.add_streamer("x", h2);
        reg.add_streamer("x", h3);
        reg.prefer(h2);

        CHECK(&reg.resolve("x") == &h2);
    }

    TEST_CASE("global favorites outside the candidates do not count") {
        registry reg;
        named_handler h1("h1");
        named_handler h2("h2");
        named_handler other("other");
        reg.add_streamer("x", h1);
        reg.add_streamer("x", h2);
        reg.add_streamer("y", other);
        reg.prefer(other);

        CHECK_THROWS_AS((void)reg.resolve("x"), ambiguous_handler);
        CHECK(&reg.resolve("y") == &other);
    }

    TEST_CASE("two global favorites among candidates are ambiguous") {
        registry reg;
        named_handler h1("h1");
        named_handler h2("h2");
        reg.add_streamer("x", h1);
        reg.add_streamer("x", h2);
        reg.prefer(h1);
        reg.prefer(h2);

        CHECK_THROWS_AS((void)reg.resolve("x"), ambiguous_handler);
    }

    TEST_CASE("format favorite beats a global favorite") {
        registry reg;
        named_handler h1("h1");
        named_handler h2("h2");
        reg.add_streamer("x", h1);
        reg.add_streamer("x", h2);
        reg.prefer(h2);
        reg.prefer(h1, "x");

        CHECK(&reg.resolve("x") == &h1);
    }

    TEST_CASE("ambiguity settled by a format favorite") {
        registry reg;
        named_handler h1("H1");
        named_handler h2("H2");

        reg.add_streamer("x", h1);
        reg.add_streamer("x", h2);
        CHECK_THROWS_AS((void)reg.resolve("x"), ambiguous_handler);

        reg.prefer(h1, "x");
        CHECK(&reg.resolve("x") == &h1);

        CHECK_THROWS_AS(reg.add_streamer("x", h1), duplicate_registration);
        CHECK(&reg.resolve("x") == &h1);
    }
}

TEST_SUITE("Registry::State") {
    TEST_CASE("clear and empty") {
        registry reg;
        named_handler h1("h1");
        CHECK(reg.empty());

        reg.add_streamer("x", h1);
        reg.prefer(h1);
        CHECK_FALSE(reg.empty());

        reg.clear();
        CHECK(reg.empty());
        CHECK(reg.handlers_for("x").empty());
        CHECK_FALSE(reg.is_global_favorite(h1));
    }

    TEST_CASE("merge skips duplicates") {
        registry a;
        registry b;
        named_handler h1("h1");
        named_handler h2("h2");

        a.add_streamer("x", h1);
        a.prefer(h1);
        b.add_streamer("x", h1);
        b.add_streamer("x", h2);
        b.prefer(h2, "x");
        b.prefer(h1);

        a.merge(b);
        CHECK(a.handlers_for("x").size() == 2);
        CHECK(a.favorite_for("x") == &h2);
        CHECK(a.global_favorites().size() == 1);
    }

    TEST_CASE("scoped override empties and restores") {
        registry reg;
        named_handler h1("h1");
        named_handler tmp("tmp");
        reg.add_streamer("x", h1);
        reg.prefer(h1);

        {
            scoped_registry_override guard(reg);
            CHECK(reg.empty());
            reg.add_streamer("x", tmp);
            reg.add_streamer("tmp-only", tmp);
            CHECK(&reg.resolve("x") == &tmp);
        }

        CHECK(&reg.resolve("x") == &h1);
        CHECK(reg.handlers_for("x").size() == 1);
        CHECK(reg.handlers_for("tmp-only").empty());
        CHECK(reg.is_global_favorite(h1));
    }

    TEST_CASE("temporary registry is restored after an exception") {
        registry reg;
        named_handler h1("h1");
        named_handler tmp("tmp");
        reg.add_streamer("x", h1);

        CHECK_THROWS_AS(with_temporary_registry(reg, [&]() {
            reg.add_streamer("x", tmp);
            reg.add_streamer("x", tmp);
        }), duplicate_registration);

        CHECK(reg.handlers_for("x").size() == 1);
        CHECK(&reg.resolve("x") == &h1);
    }

    TEST_CASE("temporary registry returns the function's result") {
        registry reg;
        named_handler tmp("tmp");

        auto name = with_temporary_registry(reg, [&]() {
            reg.add_streamer("x", tmp);
            return std::string(reg.resolve("x").get_name());
        });
        CHECK(name == "tmp");
        CHECK(reg.empty());
    }
}

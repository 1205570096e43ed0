#include <doctest/doctest.h>
#include <fstreams/sdk/formatted_stream.hh>
#include <fstreams/sdk/capability.hh>
#include <fstreams/error.hh>
#include "../mock_components.hh"

#include <typeindex>

using namespace fstreams;
using namespace fstreams::test;

TEST_SUITE("SDK::Capability") {
    TEST_CASE("capability sets") {
        capability_set none;
        CHECK(none.empty());

        auto caps = capability::read | capability::seek;
        CHECK(caps.contains(capability::read));
        CHECK(caps.contains(capability::seek));
        CHECK_FALSE(caps.contains(capability::write));
        CHECK((caps & capability::seek) == capability_set(capability::seek));
        CHECK(capability_set::all().contains(capability::truncate));
    }

    TEST_CASE("capability names") {
        CHECK(std::string(to_string(capability::read_into)) == "read_into");
        CHECK(to_string(capability::read | capability::seek) == "read|seek");
        CHECK(to_string(capability_set()).empty());
    }

    TEST_CASE("declared capabilities are static per stream type") {
        CHECK(read_only_stream<int>::capabilities == capability_set(capability::read));
        CHECK(u32_record_stream::capabilities.contains(capability::length));
        CHECK_FALSE(u32_record_stream::capabilities.contains(capability::truncate));
    }
}

TEST_SUITE("SDK::FormattedStream") {
    TEST_CASE("supports reflects the declared set") {
        read_only_stream<int> stream({1, 2});
        CHECK(stream.supports(capability::read));
        CHECK_FALSE(stream.supports(capability::read_into));
        CHECK_FALSE(stream.supports(capability::seek));
        CHECK(stream.get_capabilities() == read_only_stream<int>::capabilities);
    }

    TEST_CASE("unsupported optional operations fail") {
        read_only_stream<int> stream({1, 2});
        int out = 0;

        CHECK_THROWS_AS(stream.read_into(out), unsupported_operation);
        CHECK_THROWS_AS(stream.seek(1), unsupported_operation);
        CHECK_THROWS_AS(stream.seek_end(), unsupported_operation);
        CHECK_THROWS_AS((void)stream.length(), unsupported_operation);
        CHECK_THROWS_AS(stream.write(3), unsupported_operation);
        CHECK_THROWS_AS(stream.truncate(0), unsupported_operation);
        CHECK_THROWS_WITH(stream.write(3), "read-only: operation 'write' is not supported");

        // a rejected call leaves the position alone
        CHECK(stream.position() == 0);
        CHECK(stream.read() == 1);
    }

    TEST_CASE("mandatory operations") {
        vector_stream<int> stream({10, 20, 30});

        CHECK(stream.is_open());
        CHECK(stream.value_type() == std::type_index(typeid(int)));
        CHECK(stream.position() == 0);
        CHECK_FALSE(stream.eof());

        CHECK(stream.read() == 10);
        CHECK(stream.read() == 20);
        CHECK(stream.position() == 2);

        stream.seek_start();
        CHECK(stream.position() == 0);
        CHECK(stream.read() == 10);
    }

    TEST_CASE("optional operations") {
        vector_stream<int> stream({10, 20, 30});

        SUBCASE("seek and length") {
            stream.seek(2);
            CHECK(stream.read() == 30);
            CHECK(stream.eof());
            CHECK(stream.length() == 3);
        }

        SUBCASE("read into fills the caller's buffer") {
            int out = 0;
            int& ref = stream.read_into(out);
            CHECK(&ref == &out);
            CHECK(out == 10);
        }

        SUBCASE("write at the end appends") {
            stream.seek_end();
            stream.write(40);
            CHECK(stream.length() == 4);
            CHECK(stream.values().back() == 40);
        }

        SUBCASE("truncate") {
            stream.seek_end();
            stream.truncate(1);
            CHECK(stream.length() == 1);
            CHECK(stream.position() == 1);
            CHECK(stream.eof());
        }
    }

    TEST_CASE("reading past the end") {
        vector_stream<int> stream({7});
        CHECK(stream.read() == 7);
        CHECK(stream.eof());
        CHECK_THROWS_AS(stream.read(), end_of_stream);

        int out = 0;
        CHECK_THROWS_AS(stream.read_into(out), end_of_stream);
        CHECK(out == 0);
    }

    TEST_CASE("closed streams reject every operation") {
        int closes = 0;
        vector_stream<int> stream({1, 2, 3}, &closes);
        stream.close();

        CHECK_FALSE(stream.is_open());
        CHECK(closes == 1);

        int out = 0;
        CHECK_THROWS_AS(stream.read(), state_error);
        CHECK_THROWS_AS(stream.read_into(out), state_error);
        CHECK_THROWS_AS((void)stream.eof(), state_error);
        CHECK_THROWS_AS((void)stream.position(), state_error);
        CHECK_THROWS_AS(stream.seek_start(), state_error);
        CHECK_THROWS_AS(stream.seek(0), state_error);
        CHECK_THROWS_AS(stream.write(1), state_error);

        // close is idempotent
        CHECK_NOTHROW(stream.close());
        CHECK(closes == 1);
    }

    TEST_CASE("closed and unsupported reports the closed state") {
        read_only_stream<int> stream({1});
        stream.close();
        CHECK_THROWS_AS(stream.seek(0), state_error);
    }
}

TEST_SUITE("SDK::StreamCast") {
    TEST_CASE("matching value type") {
        std::unique_ptr<any_stream> erased = std::make_unique<vector_stream<int>>(std::vector<int>{1});
        auto typed = stream_cast<int>(std::move(erased));
        REQUIRE(typed);
        CHECK(typed->read() == 1);
    }

    TEST_CASE("mismatched value type") {
        std::unique_ptr<any_stream> erased = std::make_unique<vector_stream<int>>(std::vector<int>{1});
        CHECK_THROWS_AS(stream_cast<double>(std::move(erased)), value_type_mismatch);
    }

    TEST_CASE("null stays null") {
        CHECK(stream_cast<int>(nullptr) == nullptr);
    }
}

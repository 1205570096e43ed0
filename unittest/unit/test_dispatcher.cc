#include <doctest/doctest.h>
#include <fstreams/dispatcher.hh>
#include <fstreams/registry.hh>
#include <fstreams/error.hh>
#include "../mock_components.hh"

using namespace fstreams;
using namespace fstreams::test;

namespace {

dispatcher::constructor_func_t vector_of(std::vector<int> values) {
    return [values](const handler&, const format_id_t&, std::unique_ptr<io_stream>,
                    const open_options&) -> std::unique_ptr<any_stream> {
        return std::make_unique<vector_stream<int>>(values);
    };
}

} // namespace

TEST_SUITE("Dispatcher") {
    TEST_CASE("dispatch on handler and format") {
        dispatcher disp;
        named_handler h1("h1");
        named_handler h2("h2");
        disp.add_constructor(h1, "x", vector_of({1}));
        disp.add_constructor(h2, "x", vector_of({2}));
        disp.add_constructor(h1, "y", vector_of({3}));

        CHECK(disp.size() == 3);
        CHECK(disp.has_constructor(h1, "x"));
        CHECK_FALSE(disp.has_constructor(h2, "y"));

        auto read_first = [&](const handler& h, const format_id_t& format) {
            auto stream = stream_cast<int>(disp.dispatch(h, format, io_from_bytes()));
            return stream->read();
        };
        CHECK(read_first(h1, "x") == 1);
        CHECK(read_first(h2, "x") == 2);
        CHECK(read_first(h1, "y") == 3);
    }

    TEST_CASE("constructor receives everything it needs") {
        dispatcher disp;
        named_handler h("h");
        const handler* seen_handler = nullptr;
        format_id_t seen_format;
        io_stream* seen_io = nullptr;
        int seen_option = 0;

        disp.add_constructor(h, "x", [&](const handler& hh, const format_id_t& format,
                                         std::unique_ptr<io_stream> io, const open_options& options)
                                         -> std::unique_ptr<any_stream> {
            seen_handler = &hh;
            seen_format = format;
            seen_io = io.get();
            seen_option = options.get<int>("n");
            return std::make_unique<vector_stream<int>>(std::vector<int>{});
        });

        auto io = io_from_bytes({1, 2, 3});
        auto* io_ptr = io.get();
        auto stream = disp.dispatch(h, "x", std::move(io), open_options().set("n", 42));

        CHECK(stream);
        CHECK(seen_handler == &h);
        CHECK(seen_format == "x");
        CHECK(seen_io == io_ptr);
        CHECK(seen_option == 42);
    }

    TEST_CASE("missing constructor") {
        dispatcher disp;
        named_handler h("h");
        CHECK_THROWS_AS((void)disp.dispatch(h, "x", io_from_bytes()), no_constructor_registered);
    }

    TEST_CASE("null byte stream") {
        dispatcher disp;
        named_handler h("h");
        disp.add_constructor(h, "x", vector_of({1}));
        CHECK_THROWS_AS((void)disp.dispatch(h, "x", nullptr), io_error);
    }

    TEST_CASE("constructor returning nothing") {
        dispatcher disp;
        named_handler h("h");
        disp.add_constructor(h, "x", [](const handler&, const format_id_t&, std::unique_ptr<io_stream>,
                                        const open_options&) -> std::unique_ptr<any_stream> {
            return nullptr;
        });
        CHECK_THROWS_AS((void)disp.dispatch(h, "x", io_from_bytes()), state_error);
    }

    TEST_CASE("replacing a constructor") {
        dispatcher disp;
        named_handler h("h");
        disp.add_constructor(h, "x", vector_of({1}));
        disp.add_constructor(h, "x", vector_of({9}));

        CHECK(disp.size() == 1);
        auto stream = stream_cast<int>(disp.dispatch(h, "x", io_from_bytes()));
        CHECK(stream->read() == 9);

        disp.clear();
        CHECK(disp.size() == 0);
    }

    TEST_CASE("constructor built from a stream type") {
        dispatcher disp;
        named_handler h("h");
        disp.add_constructor(h, "u32", make_constructor<u32_record_stream>());

        auto stream = stream_cast<uint32_t>(disp.dispatch(h, "u32", io_from_bytes(u32_bytes({7, 8}))));
        CHECK(stream->get_name() == std::string("u32-records"));
        CHECK(stream->length() == 2);
        CHECK(stream->read() == 7);
    }

    TEST_CASE("stream constructor failures propagate") {
        dispatcher disp;
        named_handler h("h");
        disp.add_constructor(h, "u32", make_constructor<u32_record_stream>());
        CHECK_THROWS_AS((void)disp.dispatch(h, "u32", io_from_bytes({1, 2, 3})), std::runtime_error);
    }

    TEST_CASE("register_streamer fills both tables") {
        registry reg;
        dispatcher disp;
        named_handler h("h");

        register_streamer(reg, disp, "x", h, vector_of({1}));
        CHECK(&reg.resolve("x") == &h);
        CHECK(disp.has_constructor(h, "x"));

        // a rejected registration leaves the constructor table alone
        CHECK_THROWS_AS(register_streamer(reg, disp, "x", h, vector_of({2})), duplicate_registration);
        auto stream = stream_cast<int>(disp.dispatch(h, "x", io_from_bytes()));
        CHECK(stream->read() == 1);
    }
}

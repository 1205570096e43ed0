/**
 * @example 01_stream_lines.cc
 * @brief Basic example: registering a handler and streaming a text file
 *
 * Registers a handler for "text/x-lines" (one value per line), maps the
 * ".txt" and ".lines" suffixes to it and prints every line of the file
 * given on the command line, numbered. The stream is closed when the
 * session ends, whether printing succeeded or not.
 */

#include <fstreams/fstreams.hh>
#include <failsafe/failsafe.hh>
#include <iostream>
#include <string>

namespace {

    class lines_handler : public fstreams::handler {
        public:
            const char* get_name() const override { return "lines"; }
    };

    // One std::string per line, without the terminating newline
    class line_stream : public fstreams::formatted_stream<std::string> {
        public:
            static constexpr fstreams::capability_set capabilities =
                fstreams::capability::read | fstreams::capability::read_into;

            line_stream(std::unique_ptr<fstreams::io_stream> io, const fstreams::open_options& options)
                : m_io(std::move(io)),
                  m_strip_cr(options.get_or<bool>("strip_cr", true)) {
                fill();
            }

            const char* get_name() const override { return "lines"; }
            fstreams::capability_set get_capabilities() const override { return capabilities; }

        protected:
            fstreams::stream_pos_t do_position() const override { return m_index; }
            bool do_eof() override { return !m_has_next; }

            void do_seek_start() override {
                if (m_io->seek(0, fstreams::seek_origin::set) != 0) {
                    THROW_RUNTIME("lines: cannot rewind the byte stream");
                }
                m_index = 0;
                fill();
            }

            void do_close() override { m_io->close(); }

            std::string do_read() override {
                std::string line;
                do_read_into(line);
                return line;
            }

            void do_read_into(std::string& out) override {
                out.swap(m_next);
                ++m_index;
                fill();
            }

        private:
            void fill() {
                m_next.clear();
                m_has_next = false;
                char c = 0;
                while (m_io->read(&c, 1) == 1) {
                    m_has_next = true;
                    if (c == '\n') {
                        break;
                    }
                    m_next.push_back(c);
                }
                if (m_strip_cr && !m_next.empty() && m_next.back() == '\r') {
                    m_next.pop_back();
                }
            }

            std::unique_ptr<fstreams::io_stream> m_io;
            bool m_strip_cr;
            std::string m_next;
            bool m_has_next = false;
            fstreams::stream_pos_t m_index = 0;
    };

    const lines_handler the_lines_handler{};
}

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <text_file>\n";
        std::cerr << "Recognized suffixes: .txt, .lines\n";
        return 1;
    }

    try {
        fstreams::register_streamer("text/x-lines", the_lines_handler,
                                    fstreams::make_constructor<line_stream>());
        fstreams::default_classifier().add_format(".txt", "text/x-lines");
        fstreams::default_classifier().add_format(".lines", "text/x-lines");

        LOG_INFO("example", "fstreams", fstreams::version());

        auto count = fstreams::with_stream<std::string>(
            std::filesystem::path(argv[1]),
            [](fstreams::formatted_stream<std::string>& lines) {
                long n = 0;
                for (const auto& line : fstreams::each_value(lines)) {
                    std::cout << ++n << ": " << line << '\n';
                }
                return n;
            });

        std::cout << count << " lines\n";

    } catch (const fstreams::classification_error& e) {
        std::cerr << "Classification error: " << e.what() << '\n';
        return 1;
    } catch (const fstreams::io_error& e) {
        std::cerr << "I/O error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}

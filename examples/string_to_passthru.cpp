// Converts an in-memory document and streams the PDF to stdout.
// usage: string_to_passthru <prince-exe> > out.pdf
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/cfg/env.h>

#include "prince/prince.hpp"

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <prince-exe>\n";
        return 2;
    }

    const std::string html =
        "<html><head><title>passthru</title></head>"
        "<body><h1>Hello</h1><p>Rendered from a string.</p></body></html>";

    try {
        prince::converter conv(argv[1]);
        conv.options().set_html(true);
        conv.options().set_pdf_title("passthru");

        std::vector<prince::engine_message> msgs;
        std::vector<prince::engine_data> dats;
        bool ok = conv.convert_string_to_passthru(html, std::cout, &msgs, &dats);
        std::cout.flush();

        for (const auto& m : msgs) {
            std::cerr << '[' << m.tag() << "] " << m.location << ' ' << m.text << "\n";
        }
        for (const auto& d : dats) {
            std::cerr << "[dat] " << d.key << " = " << d.value << "\n";
        }
        return ok ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "fatal error: " << ex.what() << "\n";
        return 1;
    }
}

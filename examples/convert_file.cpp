// usage: convert_file <prince-exe> <input.html> [output.pdf]
#include <cstdio>
#include <string>
#include <vector>

#include <spdlog/cfg/env.h>

#include "prince/prince.hpp"

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels(); // SPDLOG_LEVEL=debug shows the command line

    if (argc < 3) {
        std::fprintf(stderr, "usage: %s <prince-exe> <input.html> [output.pdf]\n", argv[0]);
        return 2;
    }

    prince::converter conv(argv[1]);
    conv.options().set_javascript(true);
    conv.options().add_style_sheet("print.css");

    std::vector<prince::engine_message> msgs;
    bool ok;
    try {
        if (argc > 3) ok = conv.convert_file_to_file(argv[2], argv[3], &msgs);
        else          ok = conv.convert_file(argv[2], &msgs);
    } catch (const prince::launch_error& ex) {
        std::fprintf(stderr, "start failed: %s (errno=%d)\n", ex.what(), ex.code());
        return 1;
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "fatal error: %s\n", ex.what());
        return 1;
    }

    for (size_t i = 0; i < msgs.size(); ++i) {
        std::fprintf(stderr, "%s %s %s\n", msgs[i].tag(),
                     msgs[i].location.c_str(), msgs[i].text.c_str());
    }
    std::printf("%s\n", ok ? "success" : "failure");
    return ok ? 0 : 1;
}

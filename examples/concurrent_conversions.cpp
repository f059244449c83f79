// Runs one conversion per input on its own thread; each converter has its
// own engine process and io_context.
// usage: concurrent_conversions <prince-exe> <a.html> [b.html ...]
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/cfg/env.h>

#include "prince/prince.hpp"

struct job {
    std::string input;
    std::string output;
    bool ok = false;
    std::string error;
    std::vector<prince::engine_message> msgs;
};

static void run_job(const std::string& exe, job& j) {
    try {
        prince::converter conv(exe);
        conv.options().set_no_network(true);
        j.ok = conv.convert_file_to_file(j.input, j.output, &j.msgs);
    } catch (const std::exception& ex) {
        j.error = ex.what();
    }
}

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <prince-exe> <input.html>...\n";
        return 2;
    }
    const std::string exe = argv[1];

    std::vector<std::unique_ptr<job>> jobs;
    for (int i = 2; i < argc; ++i) {
        auto j = std::make_unique<job>();
        j->input = argv[i];
        j->output = j->input + ".pdf";
        jobs.push_back(std::move(j));
    }

    std::vector<std::thread> threads;
    for (auto& j : jobs) {
        threads.emplace_back(run_job, exe, std::ref(*j));
    }
    for (auto& t : threads) t.join();

    int failed = 0;
    for (auto& j : jobs) {
        if (!j->error.empty()) {
            std::cerr << '[' << j->input << "] error: " << j->error << "\n";
            ++failed;
            continue;
        }
        std::cout << '[' << j->input << "] " << (j->ok ? "ok" : "failed")
                  << " (" << j->msgs.size() << " messages)\n";
        if (!j->ok) ++failed;
    }
    return failed ? 1 : 0;
}

// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <unistd.h>
#include <vector>

#define AFL_LOOP_ITERATIONS 1000

namespace docval_afl {

using FuzzFunction = std::function<int(const uint8_t *, size_t)>;

// Standalone mode helper, reads a single input from a file or stdin
inline int run_standalone(const char *name, const FuzzFunction &fuzz_func, int argc, char **argv)
{
    std::vector<uint8_t> data;

    if (argc > 1) {
        std::ifstream file(argv[1], std::ios::binary);
        if (!file) {
            std::cerr << "Failed to open file: " << argv[1] << std::endl;
            return 1;
        }

        file.seekg(0, std::ios::end);
        auto size = static_cast<size_t>(file.tellg());
        file.seekg(0, std::ios::beg);

        data.resize(size);
        file.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(size));
    } else {
        char buffer[4096];
        while (std::cin.read(buffer, sizeof(buffer)) || std::cin.gcount() > 0) {
            auto bytes_read = static_cast<size_t>(std::cin.gcount());
            data.insert(data.end(), buffer, buffer + bytes_read);
        }
    }

    // An empty document is a valid input for this library
    std::cout << "Running " << name << " with " << data.size() << " bytes of input" << std::endl;
    int result = fuzz_func(data.data(), data.size());
    std::cout << "Fuzzer returned: " << result << std::endl;
    return result;
}

// One iteration of the AFL++ persistent loop
inline int run_afl_iteration(const FuzzFunction &fuzz_func)
{
    static uint8_t input_buffer[64 * 1024];

    ssize_t len = read(STDIN_FILENO, input_buffer, sizeof(input_buffer));
    if (len < 0) {
        return 0;
    }

    fuzz_func(input_buffer, static_cast<size_t>(len));
    return 1;
}

} // namespace docval_afl

#define AFL_FUZZ_TARGET(name, fuzz_func)                                                           \
    int main(int argc, char **argv)                                                                \
    {                                                                                              \
        /* Handle command line arguments for standalone mode */                                    \
        if (argc > 1) {                                                                            \
            return docval_afl::run_standalone(name, fuzz_func, argc, argv);                        \
        }                                                                                          \
                                                                                                   \
        /* AFL++ persistent mode loop - must be in main function */                                \
        while (__AFL_LOOP(AFL_LOOP_ITERATIONS)) {                                                  \
            if (!docval_afl::run_afl_iteration(fuzz_func)) {                                       \
                break;                                                                             \
            }                                                                                      \
        }                                                                                          \
                                                                                                   \
        return 0;                                                                                  \
    }

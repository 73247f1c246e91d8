/*
 * SPDX-FileCopyrightText: (c) 2025 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cxxabi.h>
#include <execinfo.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace tt::reset::assert {

inline std::string demangle(const char* str) {
    size_t size = 0;
    int status = 0;
    std::string rt(256, '\0');
    // Symbol lines look like "binary(_ZN2tt5reset...+0x1c) [0x...]".
    if (1 == sscanf(str, "%*[^(]%*[^_]%255[^)+]", &rt[0])) {
        std::unique_ptr<char, decltype(&std::free)> demangled(
            abi::__cxa_demangle(rt.c_str(), nullptr, &size, &status), &std::free);
        if (demangled) {
            return std::string(demangled.get());
        }
    }
    return str;
}

/**
 * Returns the current call stack, one frame per entry.
 * @param size Maximum number of frames to collect.
 * @param skip Number of frames to drop from the top of the stack.
 */
inline std::vector<std::string> backtrace(int size = 64, int skip = 1) {
    std::vector<std::string> bt;
    std::vector<void*> frames(size);
    int count = ::backtrace(frames.data(), size);
    std::unique_ptr<char*, decltype(&std::free)> symbols(backtrace_symbols(frames.data(), count), &std::free);
    if (!symbols) {
        return bt;
    }
    for (int i = skip; i < count; ++i) {
        bt.push_back(demangle(symbols.get()[i]));
    }
    return bt;
}

inline std::string backtrace_to_string(int size = 64, int skip = 2, const std::string& prefix = "") {
    std::vector<std::string> bt = backtrace(size, skip);
    std::stringstream ss;
    for (const auto& frame : bt) {
        ss << prefix << frame << std::endl;
    }
    return ss.str();
}

}  // namespace tt::reset::assert

/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#ifndef TEST_GTEST_COMMON_H
#define TEST_GTEST_COMMON_H

#include <iostream>
#include <iomanip>
#include <cstdint>
#include <random>
#include <stack>
#include <optional>
#include <string>
#include <sys/types.h>

#include "uv47.h"

namespace gtest {

class Logger {
public:
    Logger(const std::string &title = "INFO");
    ~Logger();

    template<typename T> Logger &operator<<(const T &value)
    {
        std::cout << value;
        return *this;
    }
};

class ScopedEnv {
public:
    void addVar(const std::string &name, const std::string &value);
    void removeVar(const std::string &name);

private:
    class Variable {
    public:
        Variable(const std::string &name, const std::optional<std::string> &value);
        Variable(Variable &&other);
        ~Variable();

        Variable(const Variable &other) = delete;
        Variable &operator=(const Variable &other) = delete;

    private:
        std::optional<std::string> m_prev_value;
        std::string m_name;
    };

    std::stack<Variable> m_vars;
};

// A file under the temp directory holding the given contents, removed on
// destruction
class TempFile {
public:
    TempFile(const std::string &contents, mode_t mode = 0600);
    ~TempFile();

    TempFile(const TempFile &other) = delete;
    TempFile &operator=(const TempFile &other) = delete;

    const std::string &path() const { return m_path; }

private:
    std::string m_path;
};

// Shared pseudo random source for property tests, seeded from
// --random_seed=N so a failing run can be replayed
class TestRandom {
public:
    static constexpr uint64_t DEFAULT_SEED = 0x5eed0047;

    static TestRandom &instance();

    void setSeed(uint64_t seed);
    uint64_t seed() const { return m_seed; }

    uint64_t next();
    uv47::Key nextKey();
    uv47::Uuid nextUuid();
    // Random payload in the time-ordered shape
    uv47::Uuid nextTimeOrdered();

private:
    TestRandom();

    uint64_t m_seed;
    std::mt19937_64 m_gen;
};

// Builds a time-ordered identifier from its payload fields
uv47::Uuid makeTimeOrdered(uint64_t timestamp, uint16_t rand_a, uint64_t rand_b);

// Key 00 01 02 .. 0f, the SipHash reference key
uv47::Key referenceKey();

} // namespace gtest

#endif /* TEST_GTEST_COMMON_H */

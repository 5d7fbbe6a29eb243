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

#include "common.h"
#include <array>
#include <cassert>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace gtest {

Logger::Logger(const std::string &title)
{
    std::cout << "[ " << std::setw(8) << title << " ] ";
}

Logger::~Logger()
{
    std::cout << std::endl;
}

void ScopedEnv::addVar(const std::string &name, const std::string &value)
{
    m_vars.emplace(name, value);
}

void ScopedEnv::removeVar(const std::string &name)
{
    m_vars.emplace(name, std::nullopt);
}

ScopedEnv::Variable::Variable(const std::string &name, const std::optional<std::string> &value)
    : m_name(name)
{
    const char* backup = getenv(name.c_str());

    if (backup != nullptr) {
        m_prev_value = backup;
    }

    if (value) {
        setenv(name.c_str(), value->c_str(), 1);
    } else {
        unsetenv(name.c_str());
    }
}

ScopedEnv::Variable::Variable(Variable &&other)
    : m_prev_value(std::move(other.m_prev_value)),
      m_name(std::move(other.m_name))
{
    // The moved-from object should be invalidated
    assert(other.m_name.empty());
}

ScopedEnv::Variable::~Variable()
{
    if (m_name.empty()) {
        return;
    }

    if (m_prev_value) {
        setenv(m_name.c_str(), m_prev_value->c_str(), 1);
    } else {
        unsetenv(m_name.c_str());
    }
}

TempFile::TempFile(const std::string &contents, mode_t mode)
{
    const char *tmpdir = getenv("TMPDIR");
    std::string templ = std::string(tmpdir ? tmpdir : "/tmp") + "/uv47_test_XXXXXX";

    const int fd = mkstemp(templ.data());
    if (fd == -1) {
        throw std::runtime_error("Failed to create temp file: " + std::string(strerror(errno)));
    }
    close(fd);
    m_path = templ;

    std::ofstream out(m_path, std::ios::binary | std::ios::trunc);
    out << contents;
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write " + m_path);
    }

    if (chmod(m_path.c_str(), mode) != 0) {
        throw std::runtime_error("Failed to chmod " + m_path + ": " + strerror(errno));
    }
}

TempFile::~TempFile()
{
    if (!m_path.empty()) {
        unlink(m_path.c_str());
    }
}

TestRandom::TestRandom() : m_seed(DEFAULT_SEED), m_gen(DEFAULT_SEED) {}

TestRandom &
TestRandom::instance() {
    static TestRandom _instance;
    return _instance;
}

void
TestRandom::setSeed(uint64_t seed) {
    m_seed = seed;
    m_gen.seed(seed);
}

uint64_t
TestRandom::next() {
    return m_gen();
}

uv47::Key
TestRandom::nextKey() {
    const uint64_t k0 = next();
    return uv47::Key(k0, next());
}

uv47::Uuid
TestRandom::nextUuid() {
    const uint64_t hi = next();
    return uv47::Uuid::fromWords(hi, next());
}

uv47::Uuid
TestRandom::nextTimeOrdered() {
    const uint64_t ts = next() & uv47::TIMESTAMP_MASK;
    const uint16_t rand_a = static_cast<uint16_t>(next() & uv47::RAND_A_MASK);
    return makeTimeOrdered(ts, rand_a, next() & uv47::RAND_B_MASK);
}

uv47::Uuid
makeTimeOrdered(uint64_t timestamp, uint16_t rand_a, uint64_t rand_b) {
    uv47::Fields fields;
    fields.timestamp = timestamp;
    fields.version = uv47::ORIGINAL_VERSION;
    fields.randA = rand_a;
    fields.variant = uv47::ORIGINAL_VARIANT;
    fields.randB = rand_b;
    return uv47::join(fields);
}

uv47::Key
referenceKey() {
    std::array<uint8_t, uv47::KEY_SIZE> bytes;
    for (size_t i = 0; i < bytes.size(); i++) {
        bytes[i] = static_cast<uint8_t>(i);
    }

    uv47::Key key;
    if (uv47::Key::fromBytes(bytes.data(), bytes.size(), key) != UV47_SUCCESS) {
        throw std::logic_error("reference key must load");
    }
    return key;
}

} // namespace gtest

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
#include <gtest/gtest.h>
#include "uv47.h"
#include "common.h"
#include <atomic>
#include <thread>
#include <vector>

namespace gtest {
namespace multi_threading {

class MultiThreadingTestFixture : public testing::Test {
protected:
    static constexpr int num_threads = 8;
    static constexpr int num_ids = 2000;

    std::vector<uv47::Uuid> inputs;
    std::vector<uv47::Key> keys;

    void SetUp() override {
        auto &rnd = TestRandom::instance();
        for (int i = 0; i < num_ids; i++) {
            inputs.push_back(rnd.nextTimeOrdered());
        }
        for (int t = 0; t < num_threads; t++) {
            keys.push_back(rnd.nextKey());
        }
    }

    // Single threaded results to compare the concurrent ones against
    std::vector<uv47::Uuid> expectedFacades(const uv47::Key &key) const {
        std::vector<uv47::Uuid> out;
        out.reserve(inputs.size());
        for (const auto &id : inputs) {
            out.push_back(uv47::encode(id, key));
        }
        return out;
    }
};

TEST_F(MultiThreadingTestFixture, ConcurrentEncodeDecodeSharedKey) {
    const uv47::Key key = keys[0];
    const std::vector<uv47::Uuid> expected = expectedFacades(key);
    std::atomic<int> mismatches{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&, t]() {
            // each thread walks the inputs from a different offset
            for (int i = 0; i < num_ids; i++) {
                const int idx = (i + t * (num_ids / num_threads)) % num_ids;
                const uv47::Uuid facade = uv47::encode(inputs[idx], key);
                if (facade != expected[idx] || uv47::decode(facade, key) != inputs[idx]) {
                    mismatches++;
                }
            }
        });
    }

    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(MultiThreadingTestFixture, ConcurrentEncodeDistinctKeys) {
    std::vector<std::vector<uv47::Uuid>> results(num_threads);

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([this, &results, t]() {
            results[t].reserve(inputs.size());
            for (const auto &id : inputs) {
                results[t].push_back(uv47::encode(id, keys[t]));
            }
        });
    }

    for (auto &thread : threads) {
        thread.join();
    }

    for (int t = 0; t < num_threads; t++) {
        EXPECT_EQ(results[t], expectedFacades(keys[t])) << "thread " << t;
    }
}

TEST_F(MultiThreadingTestFixture, KeyCanChangeBetweenCalls) {
    // The caller owns the key and may overwrite it while other threads keep
    // using the copies they passed in
    uv47::Key shared = keys[0];
    const uv47::Uuid x = inputs[0];
    const uv47::Uuid facade = uv47::encode(x, shared);

    shared = keys[1];
    EXPECT_EQ(uv47::decode(facade, keys[0]), x);
    EXPECT_NE(uv47::encode(x, shared), facade);
}

} // namespace multi_threading
} // namespace gtest

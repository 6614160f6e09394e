// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * glock a distributed lock service on top of a key-value store.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include <string>
#include <unordered_set>
#include <thread>
#include <chrono>
#include <cstdint>
#include "common/Util.hpp"

TEST(UtilTest, UUIDv7CanonicalForm) {
    const std::string id = uuid_v7_to_string(generate_uuid_v7());
    ASSERT_EQ(id.size(), 36);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[18], '-');
    EXPECT_EQ(id[23], '-');
    EXPECT_EQ(id[14], '7');
    EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
    for (const char c : id) {
        EXPECT_TRUE(c == '-' || (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << id;
    }
}

TEST(UtilTest, KnownBytesFormat) {
    UUIDV7 uuid {};
    for (size_t i = 0; i < uuid.size(); ++i) {
        uuid[i] = static_cast<uint8_t>(i * 17);
    }
    EXPECT_EQ(uuid_v7_to_string(uuid), "00112233-4455-6677-8899-aabbccddeeff");
}

TEST(UtilTest, ClientIDsAreUnique) {
    std::unordered_set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(glock_generate_client_id());
    }
    EXPECT_EQ(ids.size(), 1000);
}

TEST(UtilTest, TimestampPrefixIsOrdered) {
    const auto first = uuid_v7_to_string(generate_uuid_v7());
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    const auto second = uuid_v7_to_string(generate_uuid_v7());
    EXPECT_LT(first.substr(0, 13), second.substr(0, 13));
}

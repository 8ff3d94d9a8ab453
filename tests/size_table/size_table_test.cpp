/*
 * Copyright (C) 2026 Canonical Ltd.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 3 as
 * published by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <appicons/size_table.h>

#include <gtest/gtest.h>

#include <set>

using namespace std;
using namespace appicons;

TEST(SizeTable, canonical)
{
    auto const& table = canonical_size_table();
    ASSERT_EQ(13u, table.size());

    EXPECT_EQ(20, table.front().size);
    EXPECT_FALSE(table.front().filename);

    EXPECT_EQ(1024, table.back().size);
    ASSERT_TRUE(bool(table.back().filename));
    EXPECT_EQ("writing shed 1024.png", *table.back().filename);

    EXPECT_EQ(80, table[6].size);
    EXPECT_EQ("writing shed spolight 2.png", *table[6].filename);
}

TEST(SizeTable, invariants)
{
    set<string> names;
    int with_file = 0;
    int prev_size = 0;
    for (auto const& e : canonical_size_table())
    {
        EXPECT_GT(e.size, 0);
        EXPECT_GT(e.size, prev_size);  // Ascending, no duplicate sizes
        prev_size = e.size;
        if (e.filename)
        {
            EXPECT_FALSE(e.filename->empty());
            EXPECT_EQ(string::npos, e.filename->find('/')) << *e.filename;
            names.insert(*e.filename);
            ++with_file;
        }
    }
    EXPECT_EQ(12, with_file);
    EXPECT_EQ(12u, names.size());
}

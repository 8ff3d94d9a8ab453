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

using namespace std;

namespace appicons
{

namespace
{

// File names must match the asset catalog's Contents.json,
// including the "spolight" typo.

SizeTable const icon_sizes =
{
    {   20, boost::none },  // iPad 20pt @1x, not in use
    {   29, string("writing shed iPhone Settings.png") },
    {   40, string("writing shed spotlight.png") },
    {   58, string("writing shed settings 2.png") },
    {   60, string("writing shed spotlight 3.png") },
    {   76, string("writing shed iPad.png") },
    {   80, string("writing shed spolight 2.png") },
    {   87, string("writing shed settings 3.png") },
    {  120, string("writing shed iphone 2.png") },
    {  152, string("writing shed ipad 2.png") },
    {  167, string("writing shed iPad Pro 2.png") },
    {  180, string("writing shed iphone 3.png") },
    { 1024, string("writing shed 1024.png") }   // App Store
};

}  // namespace

SizeTable const& canonical_size_table()
{
    return icon_sizes;
}

}  // namespace appicons

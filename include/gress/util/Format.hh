/* @file Format.hh
 *
 * Licensed under the MIT License <https://opensource.org/licenses/MIT>.
 * SPDX-License-Identifier: MIT
 * Copyright (c) 2022 Zachary Parker
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of
 * this software and associated documentation files (the "Software"), to deal in
 * the Software without restriction, including without limitation the rights to
 * use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is furnished to do
 * so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#ifndef __GRESS_UTIL_FORMAT_HH__
#define __GRESS_UTIL_FORMAT_HH__

#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gress::util {

constexpr auto Minute = 60ll;
constexpr auto Hour = 60 * Minute;
constexpr auto Day = 24 * Hour;

constexpr std::string_view NotAvailable = "N/A";

constexpr std::string_view TimeAbs = "%Y-%m-%d %H:%M:%S";

constexpr std::string_view TimeDhms = "{d}:{h:02}:{m:02}:{s:02}";
constexpr std::string_view TimeHms = "{h:02}:{m:02}:{s:02}";
constexpr std::string_view TimeMs = "{m:02}:{s:02}";
constexpr std::string_view TimeS = "{s}";

constexpr std::string_view TimeDhmsUnits = "{d}d {h}h {m}m {s}s";
constexpr std::string_view TimeHmsUnits = "{h}h {m}m {s}s";
constexpr std::string_view TimeMsUnits = "{m}m {s}s";
constexpr std::string_view TimeSUnits = "{s}s";

// unit prefix for each power of the scaling step.
constexpr std::array<std::string_view, 9> Prefixes = {
    "", "k", "M", "G", "T", "P", "E", "Z", "Y"
};

/**
 * Format a duration given in whole seconds.
 *
 * The format uses named fields {d}, {h}, {m} and {s} (e.g. "{m:02}:{s:02}").
 * Only the fields referenced by the format are split off, so the coarsest
 * referenced field absorbs everything above it. With an empty format the
 * coarsest non-zero unit selects one of the canned day, hour, minute or second
 * formats, compact or with unit suffixes.
 *
 * @param seconds The duration, negative values are shown as zero.
 * @param format The field format, or empty for automatic selection.
 * @param units Use unit suffixed canned formats ("1h 2m 3s").
 */
std::string formatTime(long long seconds, std::string_view format = { }, bool units = false);

/**
 * Format a value scaled by the largest power of step not exceeding it.
 *
 * With no prefixes the raw value is formatted. Otherwise values below 2e-6
 * are shown as zero with the empty prefix.
 *
 * @param value The value to format.
 * @param precision Fixed decimals, or none for the shortest representation.
 * @param prefixes Unit prefix per power, index 0 being unscaled.
 * @param step Multiplier between powers (1000 or 1024).
 */
std::string formatPower(
    double value,
    std::optional<int> precision = 2,
    std::span<const std::string_view> prefixes = { },
    double step = 1000);

std::string formatNumber(double value, std::optional<int> precision);

// number of code points, used as the display width of UTF-8 text.
size_t displayWidth(std::string_view text) noexcept;

std::vector<std::string> splitGlyphs(std::string_view text);

std::string repeat(std::string_view text, long long count);

std::string lower(std::string_view text);

}

#endif

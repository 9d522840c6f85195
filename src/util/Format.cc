/* @file Format.cc
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

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include <gress/util/Format.hh>

namespace gress::util {

namespace {

bool references(std::string_view format, std::string_view field)
{
    return format.find(field) != std::string_view::npos;
}

std::string_view cannedFormat(long long d, long long h, long long m, bool units)
{
    if (d)
        return units ? TimeDhmsUnits : TimeDhms;

    if (h)
        return units ? TimeHmsUnits : TimeHms;

    if (m)
        return units ? TimeMsUnits : TimeMs;

    return units ? TimeSUnits : TimeS;
}

constexpr bool isContinuation(char c) noexcept
{
    return (static_cast<unsigned char>(c) & 0xc0) == 0x80;
}

} // namespace

std::string formatTime(long long seconds, std::string_view format, bool units)
{
    seconds = std::max(seconds, 0ll);

    const bool automatic = format.empty();

    long long days{ }, hours{ }, minutes{ };

    if (automatic || references(format, "{d"))
    {
        days = seconds / Day;
        seconds %= Day;
    }

    if (automatic || references(format, "{h"))
    {
        hours = seconds / Hour;
        seconds %= Hour;
    }

    if (automatic || references(format, "{m"))
    {
        minutes = seconds / Minute;
        seconds %= Minute;
    }

    if (automatic)
        format = cannedFormat(days, hours, minutes, units);

    return fmt::format(fmt::runtime(format)
        , fmt::arg("d", days)
        , fmt::arg("h", hours)
        , fmt::arg("m", minutes)
        , fmt::arg("s", seconds));
}

std::string formatNumber(double value, std::optional<int> precision)
{
    if (!precision)
        return fmt::format("{}", value);

    return fmt::format("{:.{}f}", value, *precision);
}

std::string formatPower(
    double value,
    std::optional<int> precision,
    std::span<const std::string_view> prefixes,
    double step)
{
    if (prefixes.empty())
        return formatNumber(value, precision);

    if (step <= 1.0)
        throw std::invalid_argument(fmt::format("formatPower: invalid power step {}", step));

    auto scaled = 0.0;
    auto power = 0ll;

    if (value >= 2e-6)
    {
        power = static_cast<long long>(std::floor(std::log(value) / std::log(step)));

        // log rounding can land just below an exact power.
        if (std::pow(step, power + 1) <= value)
            ++power;

        power = std::clamp(power, 0ll, static_cast<long long>(prefixes.size()) - 1);
        scaled = value / std::pow(step, power);
    }

    auto text = formatNumber(scaled, precision);
    text += prefixes[static_cast<size_t>(power)];

    return text;
}

size_t displayWidth(std::string_view text) noexcept
{
    return static_cast<size_t>(std::count_if(begin(text), end(text),
        [](char c) { return !isContinuation(c); }));
}

std::vector<std::string> splitGlyphs(std::string_view text)
{
    auto glyphs = std::vector<std::string>{ };

    for (size_t i = 0; i < text.size(); )
    {
        auto len = size_t{1};
        while (i + len < text.size() && isContinuation(text[i + len]))
            ++len;

        glyphs.emplace_back(text.substr(i, len));
        i += len;
    }

    return glyphs;
}

std::string repeat(std::string_view text, long long count)
{
    auto out = std::string{ };

    if (count <= 0)
        return out;

    out.reserve(text.size() * static_cast<size_t>(count));

    for (long long i = 0; i < count; ++i)
        out += text;

    return out;
}

std::string lower(std::string_view text)
{
    auto out = std::string{text};

    std::transform(begin(out), end(out), begin(out),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return out;
}

}

/* @file Widgets.cc
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
#include <chrono>
#include <cmath>
#include <ctime>
#include <stdexcept>
#include <type_traits>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <gress/util/Widgets.hh>

namespace gress::ui {

namespace {

constexpr auto Epsilon = 2e-6;

// longest reported estimate, keeps absolute stamps within the clock range.
constexpr auto MaxEtaSeconds = static_cast<double>(100 * 365 * util::Day);

std::string wallTime(std::chrono::system_clock::time_point time, std::string_view format)
{
    const auto t = std::chrono::system_clock::to_time_t(time);

    auto pattern = std::string{"{:"};
    pattern += format.empty() ? util::TimeAbs : format;
    pattern += '}';

    return fmt::format(fmt::runtime(pattern), fmt::localtime(t));
}

long long glyphWidth(std::string_view text)
{
    return static_cast<long long>(util::displayWidth(text));
}

} // namespace

Throughput measure(const ProgressState &state, bool adaptive)
{
    auto t = Throughput{state.current().value_or(0.0), state.elapsed()};

    if (!adaptive || state.finished() || state.samples().empty())
        return t;

    const auto &oldest = state.samples().front();

    // a window holding only the newest sample carries no rate information.
    if (t.progress != oldest.value && t.elapsed != oldest.elapsed)
    {
        t.progress -= oldest.value;
        t.elapsed -= oldest.elapsed;
    }

    return t;
}

std::string Variable::render(const ProgressState &) const
{
    if (!callback)
        return { };

    return callback();
}

std::string Property::render(const ProgressState &state) const
{
    const auto value = state.value(field);

    if (!value)
        return std::string{util::NotAvailable};

    return util::formatPower(*value, precision, prefixes, step);
}

std::string Time::render(const ProgressState &) const
{
    return wallTime(std::chrono::system_clock::now(), format);
}

std::string Timer::render(const ProgressState &state) const
{
    return util::formatTime(static_cast<long long>(state.elapsed()), format, units);
}

std::string Eta::render(const ProgressState &state) const
{
    const auto maximum = state.maximum();
    const auto current = state.current();

    if (!maximum || *maximum == 0.0 || !current || *current == 0.0)
        return std::string{util::NotAvailable};

    auto seconds = 0ll;

    if (!state.finished())
    {
        const auto remains = *maximum - *current;
        const auto t = measure(state, adaptive);

        if (t.progress != 0.0)
        {
            const auto estimate = remains * (t.elapsed / t.progress);
            if (estimate > 0.0)
                seconds = static_cast<long long>(std::min(estimate, MaxEtaSeconds));
        }
    }

    if (absolute)
        return wallTime(std::chrono::system_clock::now() + std::chrono::seconds(seconds), format);

    return util::formatTime(seconds, format, units);
}

std::string Speed::render(const ProgressState &state) const
{
    const auto t = measure(state, adaptive);

    auto speed = 0.0;

    if (t.elapsed >= Epsilon && t.progress >= Epsilon)
        speed = t.progress / t.elapsed;

    return util::formatPower(speed, precision, prefixes, step);
}

std::string Gauge::render(const ProgressState &state, size_t width) const
{
    auto inner = static_cast<long long>(size ? *size : width);
    inner = std::max(inner - glyphWidth(left) - glyphWidth(right), 0ll);

    const auto markerWidth = std::max(glyphWidth(marker), 1ll);

    auto bar = std::string{ };

    if (state.finished())
    {
        bar = util::repeat(marker, inner / markerWidth);
        bar += util::repeat(fill, inner - glyphWidth(bar));
    }
    else if (const auto pct = state.percent())
    {
        const auto count = std::clamp(static_cast<long long>(*pct / 100.0 * static_cast<double>(inner)), 0ll, inner);

        bar = util::repeat(marker, count / markerWidth);

        if (!bar.empty() && !tip.empty())
        {
            auto cells = util::splitGlyphs(bar);
            cells.pop_back();

            bar.clear();
            for (const auto &cell : cells)
                bar += cell;

            bar += tip;
        }

        bar += util::repeat(fill, inner - glyphWidth(bar));
    }
    else if (inner > 0)
    {
        const auto period = static_cast<double>(inner * 2 - 1);

        auto phase = std::fmod(state.current().value_or(0.0), period);
        if (phase < 0)
            phase += period;

        auto position = static_cast<long long>(phase);
        if (position > inner)
            position = inner * 2 - position;

        const auto padLeft = util::repeat(fill, position - 1);
        const auto padRight = util::repeat(fill, inner - markerWidth - glyphWidth(padLeft));

        bar = padLeft + marker + padRight;
    }

    return left + bar + right;
}

Spin Spin::fromGlyphs(std::string_view markers, std::string fin, bool relative)
{
    auto spin = Spin{ };
    spin.markers = util::splitGlyphs(markers);
    spin.fin = std::move(fin);
    spin.relative = relative;

    if (spin.markers.empty())
        throw std::invalid_argument("Spin: marker glyphs must not be empty");

    return spin;
}

std::string Spin::render(const ProgressState &state)
{
    if (markers.empty())
        throw std::logic_error("Spin: no marker glyphs configured");

    if (state.finished())
        return fin.empty() ? markers.back() : fin;

    const auto count = static_cast<long>(markers.size());

    if (const auto pct = state.percent(); relative && pct)
    {
        // the maximum maps onto the last glyph instead of one past it.
        cursor = std::clamp(static_cast<long>(static_cast<double>(count) * *pct / 100.0), 0l, count - 1);
        return markers[static_cast<size_t>(cursor)];
    }

    cursor = (cursor + 1) % count;

    return markers[static_cast<size_t>(cursor)];
}

std::string render(Widget &widget, const ProgressState &state, size_t width)
{
    return std::visit(
        [&state, width](auto &w) -> std::string {
            using T = std::decay_t<decltype(w)>;

            if constexpr (std::is_same_v<T, Gauge>)
                return w.render(state, width);
            else
                return w.render(state);
        },
        widget);
}

bool expands(const Widget &widget) noexcept
{
    return std::holds_alternative<Gauge>(widget);
}

}

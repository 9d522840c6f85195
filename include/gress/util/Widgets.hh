/* @file Widgets.hh
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

#ifndef __GRESS_UTIL_WIDGETS_HH__
#define __GRESS_UTIL_WIDGETS_HH__

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Format.hh"
#include "ProgressState.hh"

namespace gress::ui {

namespace glyphs {

constexpr std::string_view Arrow = "→↘↓↙←↖↑↗";
constexpr std::string_view Circle = " .oO";
constexpr std::string_view Dots = " ⡀⡄⡆⡇⣇⣧⣷⣿";
constexpr std::string_view Fade = " ░▒▓█";
constexpr std::string_view Line = "⎽⎼⎻⎺⎻⎼";
constexpr std::string_view Moon = "◑◒◐◓";
constexpr std::string_view Pie = "○◔◑◕●";
constexpr std::string_view Pixel = "⣾⣷⣯⣟⡿⢿⣻⣽";
constexpr std::string_view HBar = " ▏▎▍▌▋▊▉█";
constexpr std::string_view Snake = " ▖▌▛█";
constexpr std::string_view Star = "-\\|/";
constexpr std::string_view VBar = " ▁▂▃▄▅▆▇█";

}

// user supplied text, e.g. a counter owned by the caller.
struct Variable
{
    std::function<std::string()> callback;

    std::string render(const ProgressState &state) const;
};

// a state readout, scaled by unit prefixes when a prefix table is given.
// the prefix table must outlive the widget.
struct Property
{
    ProgressState::Field field{ProgressState::Field::Current};
    std::optional<int> precision{ };
    std::span<const std::string_view> prefixes{ };
    double step{1000};

    std::string render(const ProgressState &state) const;
};

// wall clock time, strftime style format.
struct Time
{
    std::string format{util::TimeAbs};

    std::string render(const ProgressState &state) const;
};

struct Timer
{
    std::string format{util::TimeHms};
    bool units{ };

    std::string render(const ProgressState &state) const;
};

/**
 * Estimated time until the maximum is reached.
 *
 * Absolute mode shows the expected wall clock time of completion using a
 * strftime style format, otherwise the remaining duration is formatted with
 * util::formatTime().
 */
struct Eta
{
    std::string format{util::TimeHms};
    bool units{ };
    bool absolute{ };
    bool adaptive{true};

    std::string render(const ProgressState &state) const;
};

struct Speed
{
    std::optional<int> precision{2};
    std::span<const std::string_view> prefixes{ };
    double step{1000};
    bool adaptive{true};

    std::string render(const ProgressState &state) const;
};

/**
 * Proportionally filled bar, the only expanding widget.
 *
 * Without a known maximum a single marker bounces between the edges. The
 * fill is expected to be a single glyph.
 */
struct Gauge
{
    std::string marker{"|"};
    std::string left{"|"};
    std::string right{"|"};
    std::string fill{"-"};
    std::string tip{ };
    std::optional<size_t> size{ };

    std::string render(const ProgressState &state, size_t width) const;
};

/**
 * Animated glyph.
 *
 * Cyclic spins advance one glyph per render. Relative spins map the glyphs
 * over the whole progress range.
 */
struct Spin
{
    std::vector<std::string> markers;
    std::string fin{ };
    bool relative{ };
    long cursor{-1};

    static Spin fromGlyphs(std::string_view markers, std::string fin = { }, bool relative = false);

    std::string render(const ProgressState &state);
};

using Widget = std::variant<Variable, Property, Time, Timer, Eta, Speed, Gauge, Spin>;

// a resolved layout entry: literal text or a widget. empty entries are
// skipped while resolving a template and rejected while composing a line.
using Element = std::variant<std::monostate, std::string, std::shared_ptr<Widget>>;
using WidgetSequence = std::vector<Element>;

/**
 * Progress and elapsed time used for rate estimation.
 *
 * Adaptive measurement uses the delta to the oldest retained sample unless
 * the progress has finished or the delta is degenerate.
 */
struct Throughput
{
    double progress{ };
    double elapsed{ };
};

Throughput measure(const ProgressState &state, bool adaptive);

std::string render(Widget &widget, const ProgressState &state, size_t width = 0);

bool expands(const Widget &widget) noexcept;

template <typename T>
std::shared_ptr<Widget> makeWidget(T widget)
{
    return std::make_shared<Widget>(std::move(widget));
}

}

#endif

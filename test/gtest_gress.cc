/* @file gtest_gress.cc
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

#include <gtest/gtest.h>

#include <regex>
#include <sstream>
#include <string>

#include <gress/util/Format.hh>
#include <gress/util/LineComposer.hh>
#include <gress/util/ProgressState.hh>
#include <gress/util/Template.hh>
#include <gress/util/Terminal.hh>
#include <gress/util/WidgetRegistry.hh>
#include <gress/util/Widgets.hh>

#include "FakeClock.hh"

using namespace gress;
using namespace gress::ui;

using gress::test::FakeClock;

namespace {

ProgressState startedState(FakeClock &clock, std::optional<double> maximum = 100, double keep = 10)
{
    auto state = ProgressState{0, maximum, keep, 0};
    state.setClock(clock.fn());
    state.start();

    return state;
}

// (0 @ 0s), (10 @ 10s), (20 @ 12s) with a two sample window.
ProgressState windowedState(FakeClock &clock)
{
    auto state = startedState(clock, 100, 2);

    state.record(0);
    clock.advance(10);
    state.record(10);
    clock.advance(2);
    state.record(20);

    return state;
}

std::string renderOnce(Widget widget, const ProgressState &state, size_t width = 0)
{
    return render(widget, state, width);
}

std::string tagOf(const Element &e)
{
    if (const auto *text = std::get_if<std::string>(&e))
        return *text;

    return "<widget>";
}

} // namespace

////////////////////////////////////////////////////////////////////////////////
// Format

TEST(format, time_auto_hours)
{
    EXPECT_EQ(util::formatTime(3661), "01:01:01");
    EXPECT_EQ(util::formatTime(3661, { }, true), "1h 1m 1s");
}

TEST(format, time_auto_seconds)
{
    EXPECT_EQ(util::formatTime(45), "45");
    EXPECT_EQ(util::formatTime(45, { }, true), "45s");
}

TEST(format, time_auto_minutes_days)
{
    EXPECT_EQ(util::formatTime(125), "02:05");
    EXPECT_EQ(util::formatTime(125, { }, true), "2m 5s");
    EXPECT_EQ(util::formatTime(90061), "1:01:01:01");
    EXPECT_EQ(util::formatTime(90061, { }, true), "1d 1h 1m 1s");
}

TEST(format, time_template_fields)
{
    EXPECT_EQ(util::formatTime(3661, util::TimeHms), "01:01:01");

    // without {d} the hours absorb whole days.
    EXPECT_EQ(util::formatTime(90061, util::TimeHms), "25:01:01");

    EXPECT_EQ(util::formatTime(125, "{s}"), "125");
    EXPECT_EQ(util::formatTime(125, "{m}m{s:02}"), "2m05");
}

TEST(format, time_negative)
{
    EXPECT_EQ(util::formatTime(-5), "0");
}

TEST(format, power_prefixes)
{
    EXPECT_EQ(util::formatPower(1536, 2, util::Prefixes, 1024), "1.50k");
    EXPECT_EQ(util::formatPower(999, 2, util::Prefixes, 1000), "999.00");
    EXPECT_EQ(util::formatPower(1000, 2, util::Prefixes, 1000), "1.00k");
    EXPECT_EQ(util::formatPower(1e6, 2, util::Prefixes, 1000), "1.00M");
    EXPECT_EQ(util::formatPower(0.5, 2, util::Prefixes, 1000), "0.50");
}

TEST(format, power_below_threshold)
{
    EXPECT_EQ(util::formatPower(1e-9, 2, util::Prefixes, 1000), "0.00");
    EXPECT_EQ(util::formatPower(0, 2, util::Prefixes, 1024), "0.00");
}

TEST(format, power_raw)
{
    EXPECT_EQ(util::formatPower(12.5, 2), "12.50");
    EXPECT_EQ(util::formatPower(12.5, 0), "12");
    EXPECT_EQ(util::formatPower(3, std::nullopt), "3");
}

TEST(format, power_invalid_step)
{
    EXPECT_THROW(util::formatPower(10, 2, util::Prefixes, 1), std::invalid_argument);
}

TEST(format, glyphs)
{
    EXPECT_EQ(util::displayWidth("█--"), 3u);
    EXPECT_EQ(util::displayWidth(""), 0u);

    const auto glyphs = util::splitGlyphs("○◔a");
    ASSERT_EQ(glyphs.size(), 3u);
    EXPECT_EQ(glyphs[0], "○");
    EXPECT_EQ(glyphs[2], "a");

    EXPECT_EQ(util::repeat("ab", 3), "ababab");
    EXPECT_EQ(util::repeat("ab", -1), "");
    EXPECT_EQ(util::lower("CoUnT"), "count");
}

////////////////////////////////////////////////////////////////////////////////
// ProgressState

TEST(progress_state, percent)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);

    EXPECT_FALSE(state.percent());

    state.record(25);
    ASSERT_TRUE(state.percent());
    EXPECT_DOUBLE_EQ(*state.percent(), 25.0);

    auto unbounded = startedState(clock, std::nullopt);
    unbounded.record(25);
    EXPECT_FALSE(unbounded.percent());

    auto zero = startedState(clock, 0);
    zero.record(25);
    EXPECT_FALSE(zero.percent());
}

TEST(progress_state, sample_window_fifo)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock, 100, 3);

    for (int i = 0; i < 4; ++i)
    {
        state.record(i);
        EXPECT_LE(state.samples().size(), state.capacity());
    }

    ASSERT_EQ(state.samples().size(), 3u);
    EXPECT_DOUBLE_EQ(state.samples().front().value, 1);
    EXPECT_DOUBLE_EQ(state.samples().back().value, 3);
}

TEST(progress_state, relative_capacity)
{
    auto clock = FakeClock{ };

    EXPECT_EQ(startedState(clock, 1000, .05).capacity(), 50u);
    EXPECT_EQ(startedState(clock, 20, .05).capacity(), 5u);
    EXPECT_EQ(startedState(clock, std::nullopt, .05).capacity(), 5u);
    EXPECT_EQ(startedState(clock, 20, 7.9).capacity(), 7u);
}

TEST(progress_state, elapsed)
{
    auto clock = FakeClock{ };
    auto state = ProgressState{ };
    state.setClock(clock.fn());

    EXPECT_DOUBLE_EQ(state.elapsed(), 0.0);

    state.start();
    clock.advance(2);
    EXPECT_DOUBLE_EQ(state.elapsed(), 2.0);

    state.finish();
    clock.advance(5);
    EXPECT_DOUBLE_EQ(state.elapsed(), 2.0);
}

TEST(progress_state, throttle)
{
    auto clock = FakeClock{ };
    auto state = ProgressState{0, 100, 10, .5};
    state.setClock(clock.fn());
    state.start();

    EXPECT_TRUE(state.shouldRender());
    state.markRendered();

    clock.advance(.25);
    EXPECT_FALSE(state.shouldRender());

    clock.advance(.25);
    EXPECT_TRUE(state.shouldRender());

    state.markRendered();
    state.finish();
    EXPECT_TRUE(state.shouldRender());
    EXPECT_EQ(state.updates(), 2u);
}

TEST(progress_state, invalid_config)
{
    EXPECT_THROW(ProgressState(0, 100, 0), std::invalid_argument);
    EXPECT_THROW(ProgressState(0, 100, 1, -1), std::invalid_argument);
}

////////////////////////////////////////////////////////////////////////////////
// Widgets

TEST(widgets, property)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);

    EXPECT_EQ(renderOnce(Property{.field = ProgressState::Field::Current}, state), "N/A");

    state.record(50);

    EXPECT_EQ(renderOnce(Property{.field = ProgressState::Field::Current, .precision = 0}, state), "50");
    EXPECT_EQ(renderOnce(Property{.field = ProgressState::Field::Percent, .precision = 0}, state), "50");
    EXPECT_EQ(renderOnce(Property{.field = ProgressState::Field::Maximum, .precision = 0}, state), "100");

    state.record(1536);
    EXPECT_EQ(renderOnce(Property{
        .field = ProgressState::Field::Current,
        .precision = 2,
        .prefixes = util::Prefixes,
        .step = 1024}, state), "1.50k");
}

TEST(widgets, variable)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);

    auto calls = 0;
    auto var = Variable{[&calls] { return std::to_string(++calls); }};

    EXPECT_EQ(renderOnce(var, state), "1");
    EXPECT_EQ(renderOnce(var, state), "2");
    EXPECT_EQ(renderOnce(Variable{ }, state), "");
}

TEST(widgets, time)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);

    const auto stamp = renderOnce(Time{ }, state);
    EXPECT_TRUE(std::regex_match(stamp, std::regex{R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})"})) << stamp;

    EXPECT_TRUE(std::regex_match(renderOnce(Time{"%Y"}, state), std::regex{R"(\d{4})"}));
}

TEST(widgets, timer)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);

    clock.advance(3661.7);

    EXPECT_EQ(renderOnce(Timer{ }, state), "01:01:01");
    EXPECT_EQ(renderOnce(Timer{.format = { }, .units = true}, state), "1h 1m 1s");
}

TEST(widgets, measure_adaptive)
{
    auto clock = FakeClock{ };
    auto state = windowedState(clock);

    const auto adaptive = measure(state, true);
    EXPECT_DOUBLE_EQ(adaptive.progress, 10);
    EXPECT_DOUBLE_EQ(adaptive.elapsed, 2);

    const auto full = measure(state, false);
    EXPECT_DOUBLE_EQ(full.progress, 20);
    EXPECT_DOUBLE_EQ(full.elapsed, 12);
}

TEST(widgets, measure_single_sample)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock, 100, 1);

    clock.advance(5);
    state.record(10);

    const auto t = measure(state, true);
    EXPECT_DOUBLE_EQ(t.progress, 10);
    EXPECT_DOUBLE_EQ(t.elapsed, 5);
}

TEST(widgets, eta)
{
    auto clock = FakeClock{ };
    auto state = windowedState(clock);

    // 80 remaining at 5/s over the window, 20/12 overall.
    EXPECT_EQ(renderOnce(Eta{ }, state), "00:00:16");
    EXPECT_EQ(renderOnce(Eta{.format = std::string{util::TimeHms}, .adaptive = false}, state), "00:00:48");
    EXPECT_EQ(renderOnce(Eta{.format = { }, .units = true}, state), "16s");
}

TEST(widgets, eta_not_available)
{
    auto clock = FakeClock{ };

    auto unbounded = startedState(clock, std::nullopt);
    unbounded.record(10);
    EXPECT_EQ(renderOnce(Eta{ }, unbounded), "N/A");

    auto zero = startedState(clock);
    zero.record(0);
    EXPECT_EQ(renderOnce(Eta{ }, zero), "N/A");
}

TEST(widgets, eta_finished)
{
    auto clock = FakeClock{ };
    auto state = windowedState(clock);

    state.finish();

    EXPECT_EQ(renderOnce(Eta{ }, state), "00:00:00");
}

TEST(widgets, eta_absolute)
{
    auto clock = FakeClock{ };
    auto state = windowedState(clock);

    const auto stamp = renderOnce(Eta{.format = std::string{util::TimeAbs}, .absolute = true}, state);
    EXPECT_TRUE(std::regex_match(stamp, std::regex{R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})"})) << stamp;
}

TEST(widgets, eta_ceiling)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock, 1e18);

    clock.advance(100);
    state.record(1);

    // one unit per 100s over 1e18 units is capped at 100 years.
    EXPECT_EQ(renderOnce(Eta{ }, state), "876000:00:00");
    EXPECT_EQ(renderOnce(Eta{.format = { }, .units = true}, state), "36500d 0h 0m 0s");

    const auto stamp = renderOnce(Eta{.format = std::string{util::TimeAbs}, .absolute = true}, state);
    EXPECT_TRUE(std::regex_match(stamp, std::regex{R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})"})) << stamp;
}

TEST(widgets, speed)
{
    auto clock = FakeClock{ };
    auto state = windowedState(clock);

    EXPECT_EQ(renderOnce(Speed{ }, state), "5.00");
    EXPECT_EQ(renderOnce(Speed{.adaptive = false}, state), "1.67");

    // finished speed covers the whole run.
    state.finish();
    EXPECT_EQ(renderOnce(Speed{ }, state), "1.67");
}

TEST(widgets, speed_zero)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);

    EXPECT_EQ(renderOnce(Speed{ }, state), "0.00");

    state.record(10);
    EXPECT_EQ(renderOnce(Speed{ }, state), "0.00");
}

TEST(widgets, speed_prefixes)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock, std::nullopt);

    clock.advance(1);
    state.record(2048);

    EXPECT_EQ(renderOnce(Speed{.prefixes = util::Prefixes, .step = 1024, .adaptive = false}, state), "2.00k");
}

namespace {

Gauge boxed()
{
    return Gauge{.marker = "#", .left = "[", .right = "]", .fill = "."};
}

}

TEST(widgets, gauge_bounded)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);

    state.record(0);
    EXPECT_EQ(renderOnce(boxed(), state, 12), "[..........]");

    state.record(50);
    EXPECT_EQ(renderOnce(boxed(), state, 12), "[#####.....]");

    state.record(59);
    EXPECT_EQ(renderOnce(boxed(), state, 12), "[#####.....]");

    state.record(150);
    EXPECT_EQ(renderOnce(boxed(), state, 12), "[##########]");
}

TEST(widgets, gauge_tip)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);

    state.record(50);

    const auto gauge = Gauge{.marker = "=", .left = "[", .right = "]", .fill = " ", .tip = ">"};
    EXPECT_EQ(renderOnce(gauge, state, 12), "[====>     ]");
}

TEST(widgets, gauge_finished)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);

    state.record(30);
    state.finish();

    EXPECT_EQ(renderOnce(boxed(), state, 12), "[##########]");
}

TEST(widgets, gauge_fixed_size)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);

    state.record(50);

    auto gauge = boxed();
    gauge.size = 6;

    EXPECT_EQ(renderOnce(gauge, state, 40), "[##..]");
}

TEST(widgets, gauge_too_narrow)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);

    state.record(50);
    EXPECT_EQ(renderOnce(boxed(), state, 1), "[]");

    auto unbounded = startedState(clock, std::nullopt);
    unbounded.record(3);
    EXPECT_EQ(renderOnce(boxed(), unbounded, 2), "[]");
}

TEST(widgets, gauge_bounce)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock, std::nullopt);

    const auto at = [&](double value) {
            state.record(value);
            return renderOnce(boxed(), state, 12);
        };

    EXPECT_EQ(at(0), "[#.........]");
    EXPECT_EQ(at(1), "[#.........]");
    EXPECT_EQ(at(2), "[.#........]");
    EXPECT_EQ(at(9), "[........#.]");

    // position equal to the inner width lands on the last cell.
    EXPECT_EQ(at(10), "[.........#]");
    EXPECT_EQ(at(11), "[........#.]");
    EXPECT_EQ(at(18), "[.#........]");
    EXPECT_EQ(at(19), "[#.........]");
}

TEST(widgets, spin_cyclic)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);

    Widget spin = Spin::fromGlyphs("ab◔");

    EXPECT_EQ(render(spin, state), "a");
    EXPECT_EQ(render(spin, state), "b");
    EXPECT_EQ(render(spin, state), "◔");
    EXPECT_EQ(render(spin, state), "a");

    state.finish();
    EXPECT_EQ(render(spin, state), "◔");

    Widget star = Spin::fromGlyphs(glyphs::Star, "|");
    EXPECT_EQ(render(star, state), "|");
}

TEST(widgets, spin_relative)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);

    Widget spin = Spin::fromGlyphs("abcd", { }, true);

    const auto at = [&](double value) {
            state.record(value);
            return render(spin, state);
        };

    EXPECT_EQ(at(0), "a");
    EXPECT_EQ(at(24), "a");
    EXPECT_EQ(at(25), "b");
    EXPECT_EQ(at(50), "c");
    EXPECT_EQ(at(99), "d");

    // the maximum maps onto the last glyph.
    EXPECT_EQ(at(100), "d");
}

TEST(widgets, spin_relative_unbounded)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock, std::nullopt);

    Widget spin = Spin::fromGlyphs("abcd", { }, true);

    state.record(50);
    EXPECT_EQ(render(spin, state), "a");
    EXPECT_EQ(render(spin, state), "b");
}

TEST(widgets, spin_invalid)
{
    EXPECT_THROW(Spin::fromGlyphs(""), std::invalid_argument);

    auto clock = FakeClock{ };
    auto state = startedState(clock);

    Widget empty = Spin{ };
    EXPECT_THROW(render(empty, state), std::logic_error);
}

TEST(widgets, expands)
{
    EXPECT_TRUE(expands(Gauge{ }));
    EXPECT_FALSE(expands(Spin::fromGlyphs("ab")));
    EXPECT_FALSE(expands(Speed{ }));
}

////////////////////////////////////////////////////////////////////////////////
// WidgetRegistry

TEST(widget_registry, builtins)
{
    const auto &reg = builtinRegistry();

    for (const auto *tag : {"current", "minimum", "maximum", "min", "max", "count", "percent",
            "data", "datamax", "sci", "scimin", "time", "timer", "autotimer", "eta", "autoeta",
            "abseta", "speed", "bps", "dataspeed", "scispeed", "gauge", "bar", "arrow", "circle",
            "dots", "fade", "hbar", "line", "moon", "pie", "pixel", "snake", "spin", "star",
            "vbar", "reldots", "relfade", "relhbar", "relpie", "relsnake", "relvbar"})
    {
        EXPECT_TRUE(reg.contains(tag)) << tag;
    }

    EXPECT_TRUE(reg.contains("CoUnT"));
    EXPECT_FALSE(reg.contains("nope"));
    EXPECT_EQ(reg.tags().size(), reg.size());
}

TEST(widget_registry, create_copies_prototype)
{
    const auto &reg = builtinRegistry();

    auto a = reg.create("spin");
    auto b = reg.create("SPIN");

    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_NE(a, b);
    EXPECT_TRUE(std::holds_alternative<Spin>(*a));
    EXPECT_TRUE(std::holds_alternative<Gauge>(*reg.create("bar")));

    EXPECT_EQ(reg.create("nope"), nullptr);
}

TEST(widget_registry, duplicate_tag)
{
    auto reg = WidgetRegistry{ };

    reg.add("Count", Property{ });

    EXPECT_THROW(reg.add("count", Speed{ }), std::invalid_argument);
    EXPECT_THROW(reg.add("COUNT", Speed{ }), std::invalid_argument);
    EXPECT_THROW(reg.add("", Speed{ }), std::invalid_argument);
    EXPECT_EQ(reg.size(), 1u);
}

////////////////////////////////////////////////////////////////////////////////
// Template

TEST(template_parser, split)
{
    using Fragments = std::vector<std::string>;

    EXPECT_EQ(splitTemplate("a{b}{c}d"), (Fragments{"a", "{b}", "{c}", "d"}));
    EXPECT_EQ(splitTemplate("{not a tag} {ok_1}"), (Fragments{"{not a tag} ", "{ok_1}"}));
    EXPECT_EQ(splitTemplate("plain"), (Fragments{"plain"}));
    EXPECT_TRUE(splitTemplate("").empty());
}

TEST(template_parser, placeholder_tag)
{
    EXPECT_EQ(placeholderTag("{CoUnT}"), "count");
    EXPECT_EQ(placeholderTag("count"), "");
    EXPECT_EQ(placeholderTag("{a b}"), "");
    EXPECT_EQ(placeholderTag("{count} "), "");
}

TEST(template_parser, resolve)
{
    const auto seq = resolveTemplate("{count} of {MAX} {typo}", builtinRegistry());

    ASSERT_EQ(seq.size(), 5u);
    EXPECT_EQ(tagOf(seq[0]), "<widget>");
    EXPECT_EQ(tagOf(seq[1]), " of ");
    EXPECT_EQ(tagOf(seq[2]), "<widget>");
    EXPECT_EQ(tagOf(seq[3]), " ");
    EXPECT_EQ(tagOf(seq[4]), "{typo}");
}

TEST(template_parser, resolve_variables_first)
{
    auto user = makeWidget(Variable{[] { return std::string{"bob"}; }});
    const auto vars = VariableMap{{"user", user}};

    const auto seq = resolveTemplate("hi {User}", builtinRegistry(), vars);

    ASSERT_EQ(seq.size(), 2u);
    EXPECT_EQ(std::get<std::shared_ptr<Widget>>(seq[1]), user);
}

TEST(template_parser, resolve_sequence)
{
    auto ready = makeWidget(Speed{ });

    const auto items = WidgetSequence{
        std::monostate{ },
        std::shared_ptr<Widget>{ },
        std::string{"x{count}"},
        ready
    };

    const auto seq = resolveTemplate(items, builtinRegistry());

    ASSERT_EQ(seq.size(), 3u);
    EXPECT_EQ(tagOf(seq[0]), "x");
    EXPECT_TRUE(std::holds_alternative<Property>(*std::get<std::shared_ptr<Widget>>(seq[1])));
    EXPECT_EQ(std::get<std::shared_ptr<Widget>>(seq[2]), ready);
}

////////////////////////////////////////////////////////////////////////////////
// LineComposer

TEST(line_composer, builtin_template)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);
    state.record(50);

    const auto seq = resolveTemplate("{count} of {max} ({percent}%)", builtinRegistry());

    EXPECT_EQ(composeLine(seq, state, 80), "50 of 100 (50%)");
}

TEST(line_composer, expanding_fills_width)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);
    state.record(50);

    const auto seq = WidgetSequence{
        std::string{"ab"},
        makeWidget(Property{.field = ProgressState::Field::Current, .precision = 0}),
        makeWidget(Gauge{.marker = "#", .left = "", .right = "", .fill = "."})
    };

    const auto line = composeLine(seq, state, 20);

    EXPECT_EQ(line, "ab50########........");
    EXPECT_EQ(util::displayWidth(line), 20u);
}

TEST(line_composer, utf8_width)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);
    state.record(50);

    const auto line = composeLine(resolveTemplate("{count} {bar}", builtinRegistry()), state, 13);

    EXPECT_EQ(line, "50 █████-----");
    EXPECT_EQ(util::displayWidth(line), 13u);
}

TEST(line_composer, expanding_share_last_first)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);
    state.record(0);

    const auto seq = WidgetSequence{
        makeWidget(Gauge{.marker = "A", .left = "", .right = "", .fill = "a"}),
        std::string{"x"},
        makeWidget(Gauge{.marker = "B", .left = "", .right = "", .fill = "b"})
    };

    // the last gauge takes ceil(11 / 2), the first the remainder.
    EXPECT_EQ(composeLine(seq, state, 12), "aaaaaxbbbbbb");
}

TEST(line_composer, overflow)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);
    state.record(50);

    const auto seq = WidgetSequence{
        std::string{"0123456789"},
        makeWidget(Gauge{ })
    };

    EXPECT_EQ(composeLine(seq, state, 5), "0123456789||");
}

TEST(line_composer, malformed_entry)
{
    auto clock = FakeClock{ };
    auto state = startedState(clock);

    EXPECT_THROW(composeLine(WidgetSequence{std::monostate{ }}, state, 10), std::logic_error);
    EXPECT_THROW(composeLine(WidgetSequence{std::shared_ptr<Widget>{ }}, state, 10), std::logic_error);
}

TEST(line_composer, write_line)
{
    auto out = std::ostringstream{ };
    auto sink = StreamSink{out};

    writeLine(sink, "hello");
    EXPECT_EQ(out.str(), "\x1b[2K\rhello");

    out.str({ });
    writeLine(sink, "bye", LineEnd::Permanent);
    EXPECT_EQ(out.str(), "\x1b[2K\rbye\n");
}

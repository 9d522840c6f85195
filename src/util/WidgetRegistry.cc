/* @file WidgetRegistry.cc
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

#include <stdexcept>

#include <fmt/format.h>

#include <gress/util/WidgetRegistry.hh>

namespace gress::ui {

namespace {

using Field = ProgressState::Field;

void addProperties(WidgetRegistry &reg)
{
    reg.add("current", Property{.field = Field::Current});
    reg.add("minimum", Property{.field = Field::Minimum});
    reg.add("maximum", Property{.field = Field::Maximum});
    reg.add("min", Property{.field = Field::Minimum});
    reg.add("max", Property{.field = Field::Maximum});
    reg.add("count", Property{.field = Field::Current, .precision = 0});
    reg.add("percent", Property{.field = Field::Percent, .precision = 0});

    struct Scale
    {
        std::string_view name;
        double step;
    };

    struct Readout
    {
        std::string_view suffix;
        Field field;
    };

    constexpr Scale scales[] = {{"data", 1024}, {"sci", 1000}};
    constexpr Readout readouts[] = {
        {"", Field::Current},
        {"minimum", Field::Minimum},
        {"maximum", Field::Maximum},
        {"min", Field::Minimum},
        {"max", Field::Maximum},
    };

    for (const auto &scale : scales)
    {
        for (const auto &readout : readouts)
        {
            reg.add(fmt::format("{}{}", scale.name, readout.suffix), Property{
                .field = readout.field,
                .precision = 2,
                .prefixes = util::Prefixes,
                .step = scale.step});
        }
    }
}

void addTimers(WidgetRegistry &reg)
{
    reg.add("time", Time{ });

    reg.add("timer", Timer{.format = std::string{util::TimeHms}});
    reg.add("autotimer", Timer{.format = { }, .units = true});

    reg.add("eta", Eta{.format = std::string{util::TimeHms}});
    reg.add("autoeta", Eta{.format = { }, .units = true});
    reg.add("abseta", Eta{.format = std::string{util::TimeAbs}, .absolute = true});
}

void addSpeeds(WidgetRegistry &reg)
{
    reg.add("speed", Speed{ });
    reg.add("bps", Speed{.prefixes = util::Prefixes, .step = 1024});
    reg.add("dataspeed", Speed{.prefixes = util::Prefixes, .step = 1024});
    reg.add("scispeed", Speed{.prefixes = util::Prefixes, .step = 1000});
}

void addGauges(WidgetRegistry &reg)
{
    reg.add("gauge", Gauge{ });
    reg.add("bar", Gauge{.marker = "█", .left = "", .right = "", .fill = "-"});
}

void addSpins(WidgetRegistry &reg)
{
    reg.add("arrow", Spin::fromGlyphs(glyphs::Arrow, "↑"));
    reg.add("circle", Spin::fromGlyphs(glyphs::Circle));
    reg.add("dots", Spin::fromGlyphs(glyphs::Dots));
    reg.add("fade", Spin::fromGlyphs(glyphs::Fade));
    reg.add("hbar", Spin::fromGlyphs(glyphs::HBar));
    reg.add("line", Spin::fromGlyphs(glyphs::Line));
    reg.add("moon", Spin::fromGlyphs(glyphs::Moon));
    reg.add("pie", Spin::fromGlyphs(glyphs::Pie));
    reg.add("pixel", Spin::fromGlyphs(glyphs::Pixel, "⣿"));
    reg.add("snake", Spin::fromGlyphs(glyphs::Snake));
    reg.add("spin", Spin::fromGlyphs(glyphs::Star, "|"));
    reg.add("star", Spin::fromGlyphs(glyphs::Star, "|"));
    reg.add("vbar", Spin::fromGlyphs(glyphs::VBar));

    reg.add("reldots", Spin::fromGlyphs(glyphs::Dots, { }, true));
    reg.add("relfade", Spin::fromGlyphs(glyphs::Fade, { }, true));
    reg.add("relhbar", Spin::fromGlyphs(glyphs::HBar, { }, true));
    reg.add("relpie", Spin::fromGlyphs(glyphs::Pie, { }, true));
    reg.add("relsnake", Spin::fromGlyphs(glyphs::Snake, { }, true));
    reg.add("relvbar", Spin::fromGlyphs(glyphs::VBar, { }, true));
}

} // namespace

void WidgetRegistry::add(std::string_view tag, Widget prototype)
{
    auto key = util::lower(tag);

    if (key.empty())
        throw std::invalid_argument("WidgetRegistry: empty widget tag");

    if (entries_.contains(key))
    {
        throw std::invalid_argument(fmt::format(
            "WidgetRegistry: widget with tag '{}' already exists", key));
    }

    entries_.emplace(std::move(key), std::move(prototype));
}

bool WidgetRegistry::contains(std::string_view tag) const
{
    return entries_.contains(util::lower(tag));
}

std::shared_ptr<Widget> WidgetRegistry::create(std::string_view tag) const
{
    auto iter = entries_.find(util::lower(tag));

    if (iter == end(entries_))
        return { };

    return std::make_shared<Widget>(iter->second);
}

std::vector<std::string> WidgetRegistry::tags() const
{
    auto out = std::vector<std::string>{ };
    out.reserve(entries_.size());

    for (const auto &[tag, _] : entries_)
        out.push_back(tag);

    return out;
}

WidgetRegistry makeBuiltinRegistry()
{
    auto reg = WidgetRegistry{ };

    addProperties(reg);
    addTimers(reg);
    addSpeeds(reg);
    addGauges(reg);
    addSpins(reg);

    return reg;
}

const WidgetRegistry &builtinRegistry()
{
    static const auto reg = makeBuiltinRegistry();
    return reg;
}

}

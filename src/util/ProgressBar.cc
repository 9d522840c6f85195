/* @file ProgressBar.cc
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
#include <spdlog/spdlog.h>

#include <gress/util/ProgressBar.hh>

namespace gress::ui {

namespace {

WidgetSequence initialWidgets(const BarConfig &conf)
{
    if (conf.layout.empty())
        return { };

    return {conf.layout};
}

WidgetSequence asSequence(std::string_view layout)
{
    if (layout.empty())
        return { };

    return {std::string{layout}};
}

} // namespace

ProgressBar::ProgressBar(BarConfig conf, std::shared_ptr<OutputSink> sink, const WidgetRegistry &registry):
    conf_(std::move(conf)),
    state_(conf_.minimum, conf_.maximum, conf_.keep, conf_.refresh),
    sink_(std::move(sink)),
    registry_(&registry),
    widgets_(initialWidgets(conf_))
{
    if (!sink_)
        throw std::invalid_argument("ProgressBar: output sink is null");

    if (!conf_.width)
        throw std::invalid_argument("ProgressBar: display width must be positive");
}

ProgressBar &ProgressBar::start(double value, std::optional<double> minimum, std::optional<double> maximum)
{
    prepare(minimum, maximum);
    advance(value, { });

    return *this;
}

void ProgressBar::update(double value, std::optional<bool> forceRefresh)
{
    if (!state_.started())
    {
        prepare({ }, { });
    }
    else if (state_.finished())
    {
        // the value stays at the finish value, only the line is shown again.
        if (forceRefresh.value_or(state_.shouldRender()))
            render();

        return;
    }

    advance(value, forceRefresh);
}

void ProgressBar::increase(double delta)
{
    const auto current = state_.current();

    update(current ? *current + delta : delta);
}

void ProgressBar::finish(std::string_view closing, LineEnd end)
{
    finish(asSequence(closing), end);
}

void ProgressBar::finish(const WidgetSequence &closing, LineEnd end)
{
    if (state_.finished())
    {
        if (!closing.empty())
            write(closing, end);

        return;
    }

    if (!state_.started())
        prepare({ }, { });

    state_.finish();

    advance(state_.maximum() ? state_.maximum() : state_.current(), true);

    spdlog::debug("ProgressBar: finished at {} after {:.3f}s, {} lines rendered"
        , state_.current().value_or(state_.minimum())
        , state_.elapsed()
        , state_.updates());

    auto report = resolveTemplate(closing, *registry_, variables_);

    if (!report.empty())
        write(report, end);
    else
        writeLine(*sink_, "", end);
}

void ProgressBar::write(std::string_view layout, LineEnd end)
{
    write(asSequence(layout), end);
}

void ProgressBar::write(const WidgetSequence &widgets, LineEnd end)
{
    const auto resolved = resolveTemplate(widgets, *registry_, variables_);

    writeLine(*sink_, composeLine(resolved, state_, conf_.width), end);

    // keep the progress line visible beneath permanent output.
    if (end == LineEnd::Permanent && state_.updates() && !state_.finished())
        writeLine(*sink_, composeLine(widgets_, state_, conf_.width));
}

void ProgressBar::registerWidget(std::string_view tag, std::shared_ptr<Widget> widget)
{
    auto key = util::lower(tag);

    if (!widget)
        throw std::invalid_argument(fmt::format("ProgressBar: widget for tag '{}' is null", key));

    if (placeholderTag(fmt::format("{{{}}}", key)).empty())
        throw std::invalid_argument(fmt::format("ProgressBar: invalid widget tag '{}'", key));

    if (registry_->contains(key) || variables_.contains(key))
        throw std::invalid_argument(fmt::format("ProgressBar: widget with tag '{}' already exists", key));

    spdlog::debug("ProgressBar: registered widget '{}'", key);

    variables_.emplace(std::move(key), std::move(widget));

    // pick up placeholders left as text before this registration.
    widgets_ = resolveTemplate(widgets_, *registry_, variables_);
}

void ProgressBar::reset()
{
    state_.reset();
    widgets_ = initialWidgets(conf_);
}

void ProgressBar::prepare(std::optional<double> minimum, std::optional<double> maximum)
{
    state_.start(minimum, maximum);

    if (widgets_.empty())
    {
        const auto bounded = state_.maximum() && *state_.maximum() != 0.0;
        widgets_ = asSequence(bounded ? DefaultLayout : DefaultUnboundedLayout);
    }

    widgets_ = resolveTemplate(widgets_, *registry_, variables_);

    spdlog::debug("ProgressBar: start, range [{}, {}], {} layout entries"
        , state_.minimum()
        , state_.maximum() ? fmt::format("{}", *state_.maximum()) : std::string{"none"}
        , widgets_.size());
}

void ProgressBar::advance(std::optional<double> value, std::optional<bool> forceRefresh)
{
    state_.record(value);

    if (forceRefresh.value_or(state_.shouldRender()))
        render();
}

void ProgressBar::render()
{
    writeLine(*sink_, composeLine(widgets_, state_, conf_.width));
    state_.markRendered();
}

}

/* @file ProgressBar.hh
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

#ifndef __GRESS_UTIL_PROGRESS_BAR_HH__
#define __GRESS_UTIL_PROGRESS_BAR_HH__

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "LineComposer.hh"
#include "ProgressState.hh"
#include "Template.hh"
#include "Terminal.hh"
#include "WidgetRegistry.hh"
#include "Widgets.hh"

namespace gress::ui {

constexpr std::string_view DefaultLayout =
    "{count} of {max} ({percent}%) {bar} {timer} | {speed}/s | ETA {autoeta}";
constexpr std::string_view DefaultUnboundedLayout =
    "{count} {bar} {timer} | {speed}/s";

struct BarConfig
{
    // empty selects the default layout matching the bounds at start.
    std::string layout{ };
    double minimum{ };
    std::optional<double> maximum{ };
    size_t width{80};
    double refresh{.5};
    double keep{.05};
};

/**
 * Single line progress display.
 *
 * All operations run synchronously on the caller's thread. Refresh is
 * throttled lazily on update; nothing renders in the background.
 */
class ProgressBar
{
public:
    explicit ProgressBar(
        BarConfig conf = { },
        std::shared_ptr<OutputSink> sink = std::make_shared<StreamSink>(),
        const WidgetRegistry &registry = builtinRegistry());

    // the registry is referenced, not copied, and must outlive the bar.
    ProgressBar(BarConfig conf, std::shared_ptr<OutputSink> sink, WidgetRegistry &&registry) = delete;

    ProgressBar(const ProgressBar &) = delete;
    ProgressBar &operator=(const ProgressBar &) = delete;
    ProgressBar(ProgressBar &&) = default;
    ProgressBar &operator=(ProgressBar &&) = default;

    /**
     * Start timing and show the first line.
     *
     * The layout is resolved here, falling back to the bounded or unbounded
     * default depending on whether a maximum is known.
     *
     * @param value The initial progress value.
     * @param minimum Lower bound override, none keeps the configured one.
     * @param maximum Upper bound override, none keeps the configured one.
     */
    ProgressBar &start(double value = 0, std::optional<double> minimum = { }, std::optional<double> maximum = { });

    /**
     * Set the current value and render if the refresh policy allows it.
     *
     * Starts the bar if needed. After finish() the value is ignored and the
     * final line is shown again unless forceRefresh is false.
     *
     * @param value The new progress value.
     * @param forceRefresh true always renders, false never renders, none
     *                     renders once the refresh interval has passed.
     */
    void update(double value, std::optional<bool> forceRefresh = { });

    void increase(double delta = 1);

    ProgressBar &operator+=(double delta)
    {
        increase(delta);
        return *this;
    }

    /**
     * Finish progress, render the final line and optionally a closing report.
     *
     * Without a closing report the line is cleared, and for a permanent end
     * the cursor moves to the next line. Repeated calls only write
     * the closing report.
     */
    void finish(std::string_view closing = { }, LineEnd end = LineEnd::Permanent);
    void finish(const WidgetSequence &closing, LineEnd end = LineEnd::Permanent);

    /**
     * Write a one-off line. A permanent line stays above the progress line,
     * which is rendered again beneath it while in progress.
     */
    void write(std::string_view layout, LineEnd end = LineEnd::Permanent);
    void write(const WidgetSequence &widgets, LineEnd end = LineEnd::Permanent);

    /**
     * Register a widget instance under a tag usable in this bar's templates.
     *
     * Unrecognized placeholders of the current layout are resolved again.
     *
     * @throws std::invalid_argument for a null widget or a tag already used
     *         by this bar or the registry.
     */
    void registerWidget(std::string_view tag, std::shared_ptr<Widget> widget);

    // back to the pre-start state, keeping configuration and custom widgets.
    void reset();

    void setClock(ProgressState::NowFn now)
    {
        state_.setClock(std::move(now));
    }

    const ProgressState &state() const noexcept { return state_; }

    bool started() const noexcept { return state_.started(); }
    bool finished() const noexcept { return state_.finished(); }
    double minimum() const noexcept { return state_.minimum(); }
    std::optional<double> maximum() const noexcept { return state_.maximum(); }
    std::optional<double> current() const noexcept { return state_.current(); }
    std::optional<double> percent() const noexcept { return state_.percent(); }
    double elapsed() const { return state_.elapsed(); }
    size_t updates() const noexcept { return state_.updates(); }

    const WidgetSequence &widgets() const noexcept { return widgets_; }
    const BarConfig &config() const noexcept { return conf_; }

private:
    void prepare(std::optional<double> minimum, std::optional<double> maximum);
    void advance(std::optional<double> value, std::optional<bool> forceRefresh);
    void render();

    BarConfig conf_;
    ProgressState state_;
    std::shared_ptr<OutputSink> sink_;
    const WidgetRegistry *registry_;

    VariableMap variables_;
    WidgetSequence widgets_;
};

}

#endif

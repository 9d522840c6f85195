/* @file ProgressState.hh
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

#ifndef __GRESS_UTIL_PROGRESS_STATE_HH__
#define __GRESS_UTIL_PROGRESS_STATE_HH__

#include <chrono>
#include <deque>
#include <functional>
#include <optional>

namespace gress::ui {

/**
 * Value, timing and sample history of one unit of work.
 *
 * The state is read by widgets during rendering and mutated only by the
 * owning progress bar.
 */
class ProgressState
{
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<double>;
    using NowFn = std::function<Clock::time_point()>;

    // readouts available to property widgets.
    enum class Field
    {
        Current,
        Minimum,
        Maximum,
        Percent,
        Elapsed
    };

    struct Sample
    {
        double value{ };
        double elapsed{ };
    };

    /**
     * @param minimum Lower progress bound.
     * @param maximum Upper progress bound, none for unbounded progress.
     * @param keep Sample window capacity. Values >= 1 are absolute counts,
     *             smaller values are a fraction of the maximum (at least 5).
     * @param refresh Minimum seconds between two rendered lines.
     */
    explicit ProgressState(
        double minimum = 0,
        std::optional<double> maximum = { },
        double keep = .05,
        double refresh = .5);

    void setClock(NowFn now);
    Clock::time_point now() const;

    /**
     * Reset timing and apply bound overrides. The current value and samples
     * are kept until the next record.
     */
    void start(std::optional<double> minimum = { }, std::optional<double> maximum = { });

    void record(std::optional<double> value);
    void finish();
    void reset();

    bool shouldRender() const;
    void markRendered();

    bool started() const noexcept { return startTime_.has_value(); }
    bool finished() const noexcept { return finished_; }

    double minimum() const noexcept { return minimum_; }
    std::optional<double> maximum() const noexcept { return maximum_; }
    std::optional<double> current() const noexcept { return current_; }

    std::optional<double> percent() const noexcept;
    double elapsed() const;

    std::optional<double> value(Field field) const;

    const std::deque<Sample> &samples() const noexcept { return samples_; }
    size_t capacity() const noexcept { return capacity_; }

    // number of lines rendered, not number of value updates.
    size_t updates() const noexcept { return updates_; }

    double refresh() const noexcept { return refresh_; }

private:
    size_t sampleCapacity() const;

    NowFn now_;

    double initialMinimum_;
    std::optional<double> initialMaximum_;

    double minimum_;
    std::optional<double> maximum_;
    std::optional<double> current_{ };

    std::optional<Clock::time_point> startTime_{ };
    std::optional<Clock::time_point> endTime_{ };
    std::optional<Clock::time_point> renderTime_{ };
    bool finished_{ };

    double keep_;
    size_t capacity_{ };
    std::deque<Sample> samples_;

    double refresh_;
    size_t updates_{ };
};

}

#endif

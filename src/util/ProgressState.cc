/* @file ProgressState.cc
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
#include <stdexcept>

#include <fmt/format.h>

#include <gress/util/ProgressState.hh>

namespace gress::ui {

namespace {

constexpr size_t MinRelativeCapacity = 5;

}

ProgressState::ProgressState(double minimum, std::optional<double> maximum, double keep, double refresh):
    now_(Clock::now),
    initialMinimum_(minimum),
    initialMaximum_(maximum),
    minimum_(minimum),
    maximum_(maximum),
    keep_(keep),
    refresh_(refresh)
{
    if (keep <= 0)
        throw std::invalid_argument(fmt::format("ProgressState: invalid sample capacity {}", keep));

    if (refresh < 0)
        throw std::invalid_argument(fmt::format("ProgressState: invalid refresh interval {}", refresh));

    capacity_ = sampleCapacity();
}

void ProgressState::setClock(NowFn now)
{
    now_ = now ? std::move(now) : NowFn{Clock::now};
}

ProgressState::Clock::time_point ProgressState::now() const
{
    return now_();
}

void ProgressState::start(std::optional<double> minimum, std::optional<double> maximum)
{
    startTime_ = now();
    endTime_.reset();
    renderTime_.reset();
    finished_ = false;

    if (minimum)
        minimum_ = *minimum;

    if (maximum)
        maximum_ = *maximum;

    capacity_ = sampleCapacity();
}

void ProgressState::record(std::optional<double> value)
{
    if (value)
        current_ = *value;

    if (!current_)
        return;

    samples_.push_back({*current_, elapsed()});

    while (samples_.size() > capacity_)
        samples_.pop_front();
}

void ProgressState::finish()
{
    endTime_ = now();
    finished_ = true;
}

void ProgressState::reset()
{
    minimum_ = initialMinimum_;
    maximum_ = initialMaximum_;
    current_.reset();

    startTime_.reset();
    endTime_.reset();
    renderTime_.reset();
    finished_ = false;

    samples_.clear();
    capacity_ = sampleCapacity();
    updates_ = 0;
}

bool ProgressState::shouldRender() const
{
    if (finished_)
        return true;

    if (!renderTime_)
        return true;

    return Duration(now() - *renderTime_).count() >= refresh_;
}

void ProgressState::markRendered()
{
    renderTime_ = now();
    ++updates_;
}

std::optional<double> ProgressState::percent() const noexcept
{
    if (!maximum_ || *maximum_ == 0.0 || !current_)
        return { };

    return 100.0 * (*current_ / *maximum_);
}

double ProgressState::elapsed() const
{
    if (!startTime_)
        return 0.0;

    const auto end = endTime_ ? *endTime_ : now();

    return Duration(end - *startTime_).count();
}

std::optional<double> ProgressState::value(Field field) const
{
    switch (field)
    {
        case Field::Current:
            return current_;
        case Field::Minimum:
            return minimum_;
        case Field::Maximum:
            return maximum_;
        case Field::Percent:
            return percent();
        case Field::Elapsed:
            return elapsed();
    }

    return { };
}

size_t ProgressState::sampleCapacity() const
{
    if (keep_ >= 1.0)
        return static_cast<size_t>(keep_);

    if (!maximum_ || *maximum_ <= 0.0)
        return MinRelativeCapacity;

    return std::max(static_cast<size_t>(*maximum_ * keep_), MinRelativeCapacity);
}

}

/* @file ScopedProgress.hh
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

#ifndef __GRESS_UTIL_SCOPED_PROGRESS_HH__
#define __GRESS_UTIL_SCOPED_PROGRESS_HH__

#include <exception>
#include <iterator>
#include <optional>
#include <ranges>
#include <utility>

#include <spdlog/spdlog.h>

#include "ProgressBar.hh"

namespace gress::ui {

namespace detail {

inline void finishQuietly(ProgressBar *bar) noexcept
{
    if (!bar || !bar->started() || bar->finished())
        return;

    try {
        bar->finish();
    } catch (const std::exception &ex) {
        spdlog::error("progress finish failed: {}", ex.what());
    }
}

}

/**
 * Starts a bar and guarantees it is finished when the scope is left, on
 * early return and exception alike.
 */
class ScopedProgress
{
public:
    explicit ScopedProgress(ProgressBar &bar, double value = 0, std::optional<double> maximum = { }):
        bar_(&bar)
    {
        bar_->start(value, { }, maximum);
    }

    ScopedProgress(const ScopedProgress &) = delete;
    ScopedProgress &operator=(const ScopedProgress &) = delete;

    ScopedProgress(ScopedProgress &&o) noexcept:
        bar_(std::exchange(o.bar_, nullptr))
    {
    }

    ScopedProgress &operator=(ScopedProgress &&o) noexcept
    {
        if (this != &o)
        {
            detail::finishQuietly(bar_);
            bar_ = std::exchange(o.bar_, nullptr);
        }

        return *this;
    }

    ~ScopedProgress() noexcept
    {
        detail::finishQuietly(bar_);
    }

    ProgressBar &bar() noexcept
    {
        return *bar_;
    }

    ProgressBar *operator->() noexcept
    {
        return bar_;
    }

private:
    ProgressBar *bar_;
};

/**
 * Range adaptor increasing a bar by one per consumed element.
 *
 * Sized ranges set the maximum when iteration begins. The bar is finished
 * when the adaptor is destroyed, including when the loop is left early:
 *
 *     for (const auto &item : track(bar, items))
 *         process(item);
 */
template <std::ranges::input_range Range>
class Tracked
{
public:
    using View = std::views::all_t<Range>;

    class Iterator
    {
    public:
        using Base = std::ranges::iterator_t<View>;

        using iterator_category = std::input_iterator_tag;
        using difference_type = std::ranges::range_difference_t<View>;
        using value_type = std::ranges::range_value_t<View>;

        Iterator() = default;

        Iterator(Base iter, ProgressBar *bar):
            iter_(std::move(iter)),
            bar_(bar)
        {
        }

        decltype(auto) operator*() const
        {
            return *iter_;
        }

        Iterator &operator++()
        {
            ++iter_;
            bar_->increase();
            return *this;
        }

        void operator++(int)
        {
            ++*this;
        }

        friend bool operator==(const Iterator &it, const std::ranges::sentinel_t<View> &end)
        {
            return it.iter_ == end;
        }

    private:
        Base iter_{ };
        ProgressBar *bar_{ };
    };

    Tracked(ProgressBar &bar, Range &&range):
        bar_(&bar),
        view_(std::views::all(std::forward<Range>(range)))
    {
    }

    Tracked(const Tracked &) = delete;
    Tracked &operator=(const Tracked &) = delete;

    ~Tracked() noexcept
    {
        detail::finishQuietly(bar_);
    }

    Iterator begin()
    {
        if constexpr (std::ranges::sized_range<View>)
            bar_->start(0, { }, static_cast<double>(std::ranges::size(view_)));
        else
            bar_->start(0);

        return {std::ranges::begin(view_), bar_};
    }

    auto end()
    {
        return std::ranges::end(view_);
    }

private:
    ProgressBar *bar_;
    View view_;
};

template <std::ranges::input_range Range>
Tracked<Range> track(ProgressBar &bar, Range &&range)
{
    return Tracked<Range>(bar, std::forward<Range>(range));
}

}

#endif

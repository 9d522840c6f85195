/* @file LineComposer.cc
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
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <gress/util/LineComposer.hh>

namespace gress::ui {

std::string composeLine(const WidgetSequence &widgets, const ProgressState &state, size_t width)
{
    auto space = static_cast<long long>(width);
    auto results = std::vector<std::string>(widgets.size());
    auto expanding = std::vector<size_t>{ };

    for (size_t idx = 0; idx < widgets.size(); ++idx)
    {
        const auto &item = widgets[idx];

        if (const auto *text = std::get_if<std::string>(&item))
        {
            results[idx] = *text;
            space -= static_cast<long long>(util::displayWidth(*text));
            continue;
        }

        const auto *widget = std::get_if<std::shared_ptr<Widget>>(&item);

        if (!widget || !*widget)
        {
            throw std::logic_error(fmt::format(
                "composeLine: unrecognized layout entry at position {}", idx));
        }

        if (expands(**widget))
        {
            expanding.push_back(idx);
            continue;
        }

        results[idx] = render(**widget, state);
        space -= static_cast<long long>(util::displayWidth(results[idx]));
    }

    for (auto count = static_cast<long long>(expanding.size()); count > 0; --count)
    {
        const auto idx = expanding.back();
        expanding.pop_back();

        const auto share = std::max(static_cast<long long>(
            std::ceil(static_cast<double>(space) / static_cast<double>(count))), 0ll);

        auto &widget = *std::get<std::shared_ptr<Widget>>(widgets[idx]);

        results[idx] = render(widget, state, static_cast<size_t>(share));
        space -= static_cast<long long>(util::displayWidth(results[idx]));
    }

    if (space < 0)
        spdlog::debug("composeLine: line exceeds width {} by {}", width, -space);

    auto line = std::string{ };

    for (const auto &text : results)
        line += text;

    return line;
}

void writeLine(OutputSink &sink, std::string_view line, LineEnd end)
{
    auto out = std::ostringstream{ };

    out << term::EraseLine{ };
    out << term::CarriageReturn{ } << line;

    if (end == LineEnd::Permanent)
        out << '\n';

    sink.write(out.str());
    sink.flush();
}

}

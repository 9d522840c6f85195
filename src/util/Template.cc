/* @file Template.cc
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

#include <regex>

#include <gress/util/Template.hh>

namespace gress::ui {

namespace {

const std::regex &placeholderPattern()
{
    static const auto pattern = std::regex{R"(\{[a-zA-Z0-9_]+\})"};
    return pattern;
}

void appendResolved(
    WidgetSequence &out,
    std::string_view layout,
    const WidgetRegistry &registry,
    const VariableMap &variables)
{
    for (auto &fragment : splitTemplate(layout))
    {
        const auto tag = placeholderTag(fragment);

        if (tag.empty())
        {
            out.emplace_back(std::move(fragment));
            continue;
        }

        if (auto iter = variables.find(tag); iter != end(variables) && iter->second)
        {
            out.emplace_back(iter->second);
            continue;
        }

        if (auto widget = registry.create(tag))
        {
            out.emplace_back(std::move(widget));
            continue;
        }

        out.emplace_back(std::move(fragment));
    }
}

} // namespace

std::vector<std::string> splitTemplate(std::string_view layout)
{
    auto fragments = std::vector<std::string>{ };

    using Iter = std::regex_iterator<std::string_view::const_iterator>;

    auto pos = layout.begin();

    for (auto iter = Iter{layout.begin(), layout.end(), placeholderPattern()}; iter != Iter{ }; ++iter)
    {
        const auto &match = *iter;

        if (match.prefix().length())
            fragments.emplace_back(match.prefix().str());

        fragments.emplace_back(match.str());
        pos = match[0].second;
    }

    if (pos != layout.end())
        fragments.emplace_back(pos, layout.end());

    return fragments;
}

std::string placeholderTag(std::string_view fragment)
{
    using Match = std::match_results<std::string_view::const_iterator>;

    auto match = Match{ };
    if (!std::regex_match(fragment.begin(), fragment.end(), match, placeholderPattern()))
        return { };

    return util::lower(fragment.substr(1, fragment.size() - 2));
}

WidgetSequence resolveTemplate(
    std::string_view layout,
    const WidgetRegistry &registry,
    const VariableMap &variables)
{
    auto out = WidgetSequence{ };

    appendResolved(out, layout, registry, variables);

    return out;
}

WidgetSequence resolveTemplate(
    const WidgetSequence &items,
    const WidgetRegistry &registry,
    const VariableMap &variables)
{
    auto out = WidgetSequence{ };

    for (const auto &item : items)
    {
        if (const auto *text = std::get_if<std::string>(&item))
            appendResolved(out, *text, registry, variables);
        else if (const auto *widget = std::get_if<std::shared_ptr<Widget>>(&item); widget && *widget)
            out.push_back(*widget);
    }

    return out;
}

}

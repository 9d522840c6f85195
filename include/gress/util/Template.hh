/* @file Template.hh
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

#ifndef __GRESS_UTIL_TEMPLATE_HH__
#define __GRESS_UTIL_TEMPLATE_HH__

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "WidgetRegistry.hh"
#include "Widgets.hh"

namespace gress::ui {

// per bar widget instances keyed by lowercase tag.
using VariableMap = std::unordered_map<std::string, std::shared_ptr<Widget>>;

/**
 * Split a template into literal fragments and {tag} placeholders.
 *
 * Tags consist of letters, digits and underscores. Empty fragments are
 * dropped, e.g. "a{b}{c}" splits into "a", "{b}", "{c}".
 */
std::vector<std::string> splitTemplate(std::string_view layout);

// the lowercase tag of a placeholder fragment, empty for literal text.
std::string placeholderTag(std::string_view fragment);

/**
 * Resolve a template into a widget sequence.
 *
 * Placeholders are looked up in the custom variables first, then in the
 * registry. Unknown placeholders are kept as literal text.
 */
WidgetSequence resolveTemplate(
    std::string_view layout,
    const WidgetRegistry &registry,
    const VariableMap &variables = { });

/**
 * Resolve a partially resolved sequence.
 *
 * Widgets are kept unchanged, text entries are resolved as templates and
 * empty entries are dropped.
 */
WidgetSequence resolveTemplate(
    const WidgetSequence &items,
    const WidgetRegistry &registry,
    const VariableMap &variables = { });

}

#endif

/* @file WidgetRegistry.hh
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

#ifndef __GRESS_UTIL_WIDGET_REGISTRY_HH__
#define __GRESS_UTIL_WIDGET_REGISTRY_HH__

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "Widgets.hh"

namespace gress::ui {

/**
 * Maps lowercase tags to configured widget prototypes.
 *
 * Every create() returns a fresh copy of the prototype, so widgets with
 * render state (spins) are never shared between layouts.
 */
class WidgetRegistry
{
public:
    /**
     * Register a widget prototype.
     *
     * @param tag The tag, matched case-insensitively.
     * @param prototype The configured widget copied on each create().
     * @throws std::invalid_argument if the tag is empty or already used.
     */
    void add(std::string_view tag, Widget prototype);

    bool contains(std::string_view tag) const;

    // nullptr for unknown tags.
    std::shared_ptr<Widget> create(std::string_view tag) const;

    std::vector<std::string> tags() const;

    size_t size() const noexcept
    {
        return entries_.size();
    }

private:
    std::map<std::string, Widget, std::less<>> entries_;
};

WidgetRegistry makeBuiltinRegistry();

// built once on first use, shared read-only.
const WidgetRegistry &builtinRegistry();

}

#endif

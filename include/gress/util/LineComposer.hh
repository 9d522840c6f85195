/* @file LineComposer.hh
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

#ifndef __GRESS_UTIL_LINE_COMPOSER_HH__
#define __GRESS_UTIL_LINE_COMPOSER_HH__

#include <string>
#include <string_view>

#include "ProgressState.hh"
#include "Terminal.hh"
#include "Widgets.hh"

namespace gress::ui {

enum class LineEnd
{
    Transient,
    Permanent
};

/**
 * Render a widget sequence into a line of the given display width.
 *
 * Text and fixed widgets are rendered first, in order. Expanding widgets are
 * rendered afterwards, last one first, each taking an equal share (rounded
 * up) of the width still available.
 *
 * @throws std::logic_error for an entry that is neither text nor a widget.
 */
std::string composeLine(const WidgetSequence &widgets, const ProgressState &state, size_t width);

// erase the current terminal line and write line, ending it for permanent
// output.
void writeLine(OutputSink &sink, std::string_view line, LineEnd end = LineEnd::Transient);

}

#endif

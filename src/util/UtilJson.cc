/* @file UtilJson.cc
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

#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <gress/util/UtilJson.hh>

namespace gress::ui {

void to_json(nlohmann::json &j, const BarConfig &conf)
{
    j = {
        {"template", conf.layout},
        {"minimum", conf.minimum},
        {"width", conf.width},
        {"refresh", conf.refresh},
        {"keep", conf.keep}
    };

    if (conf.maximum)
        j["maximum"] = *conf.maximum;
}

void from_json(const nlohmann::json &j, BarConfig &conf)
{
    if (j.contains("template"))
        j["template"].get_to(conf.layout);
    if (j.contains("minimum"))
        j["minimum"].get_to(conf.minimum);
    if (j.contains("maximum") && !j["maximum"].is_null())
        conf.maximum = j["maximum"].get<double>();
    if (j.contains("width"))
    {
        if (j["width"].get<long long>() <= 0)
            throw std::invalid_argument(fmt::format("bar config: invalid width {}", j["width"].dump()));

        j["width"].get_to(conf.width);
    }
    if (j.contains("refresh"))
        j["refresh"].get_to(conf.refresh);
    if (j.contains("keep"))
        j["keep"].get_to(conf.keep);

    if (conf.refresh < 0)
        throw std::invalid_argument(fmt::format("bar config: invalid refresh {}", conf.refresh));

    if (conf.keep <= 0)
        throw std::invalid_argument(fmt::format("bar config: invalid keep {}", conf.keep));
}

}

namespace gress::util {

ui::BarConfig loadBarConfig(const std::string &path)
{
    auto in = std::ifstream{path};

    if (!in)
        throw std::system_error(errno, std::system_category(), fmt::format("loadBarConfig: open '{}'", path));

    const auto j = nlohmann::json::parse(in);
    spdlog::debug("bar config: {}", j.dump());

    return j.get<ui::BarConfig>();
}

}

/* @file gress.cc
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

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include <getopt.h>
#include <libgen.h>
#include <signal.h>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include <gress/util/ProgressBar.hh>
#include <gress/util/ScopedProgress.hh>
#include <gress/util/UtilJson.hh>

namespace {

constexpr std::string_view DefaultReport =
    "{time} processed {count} items in {autotimer} at {speed}/s.";

sig_atomic_t done_;

void handleSigint(int)
{
    if (done_)
    {
        fprintf(stderr, "gress: interrupted twice - exiting NOW\n");
        std::exit(2);
    }

    done_ = 1;
}

void installSigHandler()
{
    struct sigaction action{ };

    action.sa_handler = handleSigint;
    sigaction(SIGINT, &action, nullptr);
}

struct Options
{
    gress::ui::BarConfig bar;
    std::string report{DefaultReport};
    double count{100};
    double step{1};
    unsigned delayMs{50};
    bool unbounded{ };
};

double parseNumber(const char *arg, const char *name)
{
    size_t pos{ };
    const auto str = std::string{arg};
    const auto value = std::stod(str, &pos);

    if (pos != str.size())
        throw std::invalid_argument(fmt::format("{} option: {}", name, str));

    return value;
}

Options parseOptions(int argc, char **argv)
{
    static constexpr const char *shortOpts = "c:d:f:hk:m:n:r:s:t:uw:";
    static constexpr struct option longOpts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"delay", required_argument, nullptr, 'd'},
        {"finish", required_argument, nullptr, 'f'},
        {"help", no_argument, nullptr, 'h'},
        {"keep", required_argument, nullptr, 'k'},
        {"max", required_argument, nullptr, 'm'},
        {"count", required_argument, nullptr, 'n'},
        {"refresh", required_argument, nullptr, 'r'},
        {"step", required_argument, nullptr, 's'},
        {"template", required_argument, nullptr, 't'},
        {"unbounded", no_argument, nullptr, 'u'},
        {"width", required_argument, nullptr, 'w'},
        {nullptr, 0, nullptr, 0}
    };

    const auto usage = [argv] {
            std::cout << fmt::format(
                "usage: {} [-h][-c <config.json>][-t <template>][-f <template>][-m <max>][-n <count>][-s <step>][-d <ms>][-w <width>][-r <sec>][-k <keep>][-u]\n"
                , ::basename(argv[0]));
        };

    const auto help = [argv] {
            std::cout << fmt::format(
                "help: {} OPTIONS\n"
                "  simulate a unit of work and display its progress.\n"
                "  OPTIONS:\n"
                "   -h | --help\n"
                "       show this help message.\n"
                "   -c | --config <path>\n"
                "       read bar settings from a JSON file (template, minimum, maximum,\n"
                "       width, refresh, keep). command line options override it.\n"
                "   -t | --template <template>\n"
                "       progress line template, e.g. '{{count}} {{bar}} {{eta}}'.\n"
                "   -f | --finish <template>\n"
                "       closing report template, empty to clear the line.\n"
                "   -m | --max <value>\n"
                "       maximum progress value (defaults to the count).\n"
                "   -n | --count <value>\n"
                "       amount of work to simulate.\n"
                "   -s | --step <value>\n"
                "       progress increase per work item.\n"
                "   -d | --delay <ms>\n"
                "       time spent per work item.\n"
                "   -w | --width <columns>\n"
                "       display width of the progress line.\n"
                "   -r | --refresh <seconds>\n"
                "       minimum interval between rendered lines.\n"
                "   -k | --keep <samples>\n"
                "       samples kept for speed & ETA estimation, fraction of max if < 1.\n"
                "   -u | --unbounded\n"
                "       hide the maximum, showing a bouncing bar.\n"
                "  tags:\n"
                "   {}\n"
                , ::basename(argv[0])
                , fmt::join(gress::ui::builtinRegistry().tags(), " "));
        };

    auto opts = Options{ };

    // config file first so command line options take precedence.
    for (int i = 1; i + 1 < argc; ++i)
    {
        const auto arg = std::string_view{argv[i]};

        if (arg == "-c" || arg == "--config")
            opts.bar = gress::util::loadBarConfig(argv[i + 1]);
    }

    for (int c = 0; (c = getopt_long(argc, argv, shortOpts, longOpts, 0)) >= 0; )
    {
        switch (c)
        {
            case 'c':
                break;
            case 'd':
                opts.delayMs = static_cast<unsigned>(parseNumber(optarg, "delay"));
                break;
            case 'f':
                opts.report = optarg;
                break;
            case 'h':
                help();
                std::exit(0);
            case 'k':
                opts.bar.keep = parseNumber(optarg, "keep");
                break;
            case 'm':
                opts.bar.maximum = parseNumber(optarg, "max");
                break;
            case 'n':
                opts.count = parseNumber(optarg, "count");
                break;
            case 'r':
                opts.bar.refresh = parseNumber(optarg, "refresh");
                break;
            case 's':
                opts.step = parseNumber(optarg, "step");
                break;
            case 't':
                opts.bar.layout = optarg;
                break;
            case 'u':
                opts.unbounded = true;
                break;
            case 'w':
            {
                const auto width = parseNumber(optarg, "width");
                if (width <= 0)
                    throw std::invalid_argument(fmt::format("width option must be positive: {}", width));

                opts.bar.width = static_cast<size_t>(width);
                break;
            }
            case '?':
                usage();
                std::exit(1);
            default:
                break;
        }
    }

    if (optind < argc)
    {
        spdlog::error("trailing args..");
        std::exit(1);
    }

    if (opts.step <= 0)
        throw std::invalid_argument(fmt::format("step option must be positive: {}", opts.step));

    if (opts.unbounded)
        opts.bar.maximum.reset();
    else if (!opts.bar.maximum)
        opts.bar.maximum = opts.count;

    return opts;
}

int run(const Options &opts)
{
    using namespace std::chrono;

    auto bar = gress::ui::ProgressBar{opts.bar};

    {
        auto guard = gress::ui::ScopedProgress{bar, 0, opts.bar.maximum};

        auto halfway = false;

        for (double done = 0; done < opts.count && !done_; done += opts.step)
        {
            std::this_thread::sleep_for(milliseconds(opts.delayMs));

            bar += opts.step;

            if (!halfway && done + opts.step >= opts.count / 2)
            {
                bar.write("{time} halfway there.");
                halfway = true;
            }
        }

        if (done_)
        {
            bar.finish("{time} interrupted at {count} after {autotimer}.");
            return 130;
        }

        bar.finish(opts.report);
    }

    return 0;
}

}

int main(int argc, char **argv)
{
    spdlog::cfg::load_env_levels();

    installSigHandler();

    try {
        const auto opts = parseOptions(argc, argv);

        // keep log output off the progress line.
        if (spdlog::get_level() == spdlog::level::info)
            spdlog::set_level(spdlog::level::warn);

        return run(opts);
    } catch (const std::exception &ex) {
        spdlog::error("exception: {}", ex.what());
        return 1;
    }
}

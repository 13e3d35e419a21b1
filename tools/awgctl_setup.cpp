/*************************************************************************
 *   Copyright (c) 2026 - 2026 Yichao Yu <yyc1992@gmail.com>             *
 *                                                                       *
 *   This library is free software; you can redistribute it and/or       *
 *   modify it under the terms of the GNU Lesser General Public          *
 *   License as published by the Free Software Foundation; either        *
 *   version 3.0 of the License, or (at your option) any later version.  *
 *                                                                       *
 *   This library is distributed in the hope that it will be useful,     *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of      *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU    *
 *   Lesser General Public License for more details.                     *
 *                                                                       *
 *   You should have received a copy of the GNU Lesser General Public    *
 *   License along with this library. If not,                            *
 *   see <http://www.gnu.org/licenses/>.                                 *
 *************************************************************************/

#include "../lib/awgctl-seq/driver.h"
#include "../lib/awgctl-seq/error.h"
#include "../lib/awgctl-seq/physical_setup.h"
#include "../lib/awgctl-utils/log.h"

#include <iostream>

#include <string.h>

using namespace AwgCtl;

static int list(int argc, char**)
{
    if (argc != 0) {
        Log::error("Wrong number of arguments.\n");
        return 1;
    }
    for (auto &name: Seq::SetupRegistry::builtin().names())
        std::cout << name << std::endl;
    return 0;
}

static int show(int argc, char **argv)
{
    if (argc < 1) {
        Log::error("No setup name specified.\n");
        return 1;
    }
    Seq::SetupRegistry registry = Seq::SetupRegistry::builtin();
    if (argc == 2) {
        registry.load_file(argv[1]);
    }
    else if (argc > 2) {
        Log::error("Wrong number of arguments.\n");
        return 1;
    }
    registry.get(argv[0])->print(std::cout);
    return 0;
}

static int check(int argc, char **argv)
{
    if (argc != 1) {
        Log::error("Usage: check <setups.yaml>\n");
        return 1;
    }
    Seq::SetupRegistry registry;
    registry.load_file(argv[0]);
    for (auto &name: registry.names())
        registry.get(name)->print(std::cout);
    printf("%zu physical setup(s) OK.\n", registry.size());
    return 0;
}

// Validate a driver configuration file against the built-in setups
// and an optional registry file.
static int config(int argc, char **argv)
{
    if (argc < 1 || argc > 2) {
        Log::error("Usage: config <driver.yaml> [<setups.yaml>]\n");
        return 1;
    }
    Seq::SetupRegistry registry = Seq::SetupRegistry::builtin();
    if (argc == 2)
        registry.load_file(argv[1]);
    auto conf = Seq::Driver::Config::load_file(argv[0]);
    auto setup = registry.get(conf.physical_setup);
    if (conf.simulation) {
        printf("Simulation mode\n");
    }
    else {
        printf("Card %lld\n", (long long)conf.serial_number);
    }
    printf("Sample rate: %lld Hz, full scale: %d mV, segment quantum: %g us\n",
           (long long)conf.sample_rate_hz, conf.card_max_mv, conf.segment_quantum_s * 1e6);
    setup->print(std::cout);
    return 0;
}

static int run(int argc, char **argv)
{
    if (strcmp(argv[1], "list") == 0) {
        return list(argc - 2, argv + 2);
    }
    else if (strcmp(argv[1], "show") == 0) {
        return show(argc - 2, argv + 2);
    }
    else if (strcmp(argv[1], "check") == 0) {
        return check(argc - 2, argv + 2);
    }
    else if (strcmp(argv[1], "config") == 0) {
        return config(argc - 2, argv + 2);
    }
    else {
        Log::error("Unknown action: %s.\n", argv[1]);
        return 1;
    }
}

int main(int argc, char **argv)
{
    if (argc < 2) {
        Log::error("No action specified.\n");
        return 1;
    }
    try {
        return run(argc, argv);
    }
    catch (const Seq::Error &err) {
        Log::error("%s error: %s\n", Seq::type_name(err.type), err.what());
        return 1;
    }
    catch (const std::exception &err) {
        Log::error("Error: %s\n", err.what());
        return 1;
    }
}

#pragma once

namespace warden::cli
{

    /**
     * Operator command line. Exit codes: 0 success, 1 usage/config/storage
     * errors, 2 integrity violation or denied check.
     */
    int run(int argc, char *argv[]);

} // namespace warden::cli

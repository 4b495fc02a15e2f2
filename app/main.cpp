#include "AppException.hpp"
#include "Application.hpp"
#include "Logger.hpp"

#include <cstdio>
#include <iostream>


namespace {

bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const ErrorCodes::AppException &e) {
        std::fprintf(stderr, "%s\n", e.get_full_details().c_str());
        return false;
    }
}

} // namespace


int main(int argc, char **argv) {
    if (!initialize_loggers()) {
        return kExitUsageError;
    }

    return guarded_run_application(argc, argv, std::cout);
}

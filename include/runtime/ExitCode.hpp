#pragma once

namespace gitsync::runtime {

enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_FATAL = 1,
    EXIT_USAGE = 2,
    EXIT_ALREADY_RUNNING = 3,
    EXIT_ENTRY_FAILED = 4,
    EXIT_NOT_RUNNING = 3,      // LSB status convention, only used by `status`
};

}

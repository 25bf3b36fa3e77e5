#pragma once

#include <string>

namespace leetshell {
namespace term {

struct TerminfoProbe {
    bool ok = false;
    std::string termName;
    std::string missing;
};

// Kept in its own translation unit: term.h defines macros such as
// `lines` and `columns` that collide with ordinary identifiers.
TerminfoProbe probeTerminfo(int fd);

}
}
